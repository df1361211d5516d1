// This is copyrighted software. More information is at the end of this file.
#include <audioconv/codecs/codec_wav.hh>
#include <audioconv/error.hh>
#include <audioconv/sdk/endian.hh>
#include <failsafe/failsafe.hh>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <string>

namespace {
    constexpr audioconv::uint16 wave_format_pcm = 1;
    constexpr audioconv::uint16 wave_format_ieee_float = 3;

    bool tag_is(const char tag[4], const char* expected) {
        return std::memcmp(tag, expected, 4) == 0;
    }

    std::string sample_encoding_name(audioconv::bit_depth_t bits, bool is_float) {
        if (is_float) {
            return "pcm_f32le";
        }
        if (bits == 8) {
            return "pcm_u8";
        }
        return "pcm_s" + std::to_string(bits) + "le";
    }

    std::int64_t full_scale(audioconv::bit_depth_t bits) {
        return (std::int64_t{1} << (bits - 1)) - 1;
    }

    std::int64_t round_half_up(double v) {
        return static_cast<std::int64_t>(std::floor(v + 0.5));
    }

    void write_sample(audioconv::uint8* dst, float sample, audioconv::bit_depth_t bits) {
        if (bits == 8) {
            const auto u = round_half_up(static_cast<double>(sample) * 128.0) + 128;
            *dst = static_cast<audioconv::uint8>(std::clamp<std::int64_t>(u, 0, 255));
            return;
        }
        const auto max = full_scale(bits);
        const auto v = std::clamp(round_half_up(static_cast<double>(sample) * static_cast<double>(max)),
                                  -max - 1, max);
        const auto bits_le = static_cast<audioconv::uint32>(static_cast<std::int32_t>(v));
        switch (bits) {
            case 16:
                audioconv::store_u16le(dst, static_cast<audioconv::uint16>(bits_le));
                break;
            case 24:
                audioconv::store_u24le(dst, bits_le);
                break;
            default:
                audioconv::store_u32le(dst, bits_le);
                break;
        }
    }

    float read_sample(const audioconv::uint8* src, audioconv::bit_depth_t bits, bool is_float) {
        switch (bits) {
            case 8:
                return static_cast<float>((static_cast<int>(*src) - 128) / 128.0);
            case 16: {
                const auto v = static_cast<std::int16_t>(audioconv::load_u16le(src));
                return static_cast<float>(v / static_cast<double>(full_scale(16)));
            }
            case 24: {
                auto raw = audioconv::load_u24le(src);
                if (raw & 0x800000u) {
                    raw |= 0xFF000000u;
                }
                const auto v = static_cast<std::int32_t>(raw);
                return static_cast<float>(v / static_cast<double>(full_scale(24)));
            }
            default: {
                const auto raw = audioconv::load_u32le(src);
                if (is_float) {
                    float f;
                    std::memcpy(&f, &raw, sizeof(f));
                    return f;
                }
                const auto v = static_cast<std::int32_t>(raw);
                return static_cast<float>(v / static_cast<double>(full_scale(32)));
            }
        }
    }
}

namespace audioconv {
    const char* codec_wav::get_name() const {
        return "wav";
    }

    container_id codec_wav::get_container() const {
        return container_id::wav;
    }

    std::vector<std::string> codec_wav::get_extensions() const {
        return {".wav", ".wave"};
    }

    codec_capabilities codec_wav::get_capabilities() const {
        codec_capabilities caps;
        caps.max_sample_rate = 192000;
        caps.max_channels = 8;
        caps.supported_bit_depths = {8, 16, 24, 32};
        return caps;
    }

    bool codec_wav::is_lossless() const {
        return true;
    }

    bool codec_wav::accept(io_stream* stream) {
        if (!stream) {
            return false;
        }
        const auto original_pos = stream->tell();
        if (original_pos < 0) {
            return false;
        }
        char riff[4];
        char wave[4];
        uint32_t riff_size = 0;
        const bool result = read_fourcc(stream, riff) && read_u32le(stream, &riff_size) &&
                            read_fourcc(stream, wave) &&
                            tag_is(riff, "RIFF") && tag_is(wave, "WAVE");
        stream->seek(original_pos, seek_origin::set);
        return result;
    }

    decoded_audio codec_wav::decode(io_stream* stream) const {
        if (!stream) {
            throw decode_error("No input stream");
        }

        char riff[4], wave[4], fmt[4], data[4];
        uint32_t riff_size = 0, fmt_size = 0, rate = 0, byte_rate = 0, data_size = 0;
        uint16_t format_code = 0, channels = 0, block_align = 0, bits = 0;

        if (!read_fourcc(stream, riff) || !read_u32le(stream, &riff_size) || !read_fourcc(stream, wave)) {
            throw decode_error("Input too short for a RIFF header");
        }
        if (!tag_is(riff, "RIFF")) {
            throw decode_error("Missing RIFF tag");
        }
        if (!tag_is(wave, "WAVE")) {
            throw decode_error("Missing WAVE tag");
        }
        if (!read_fourcc(stream, fmt) || !read_u32le(stream, &fmt_size) ||
            !read_u16le(stream, &format_code) || !read_u16le(stream, &channels) ||
            !read_u32le(stream, &rate) || !read_u32le(stream, &byte_rate) ||
            !read_u16le(stream, &block_align) || !read_u16le(stream, &bits)) {
            throw decode_error("Input too short for a fmt chunk");
        }
        if (!tag_is(fmt, "fmt ")) {
            throw decode_error("Missing fmt chunk at offset 12");
        }
        if (!read_fourcc(stream, data) || !read_u32le(stream, &data_size)) {
            throw decode_error("Input too short for a data chunk header");
        }
        if (!tag_is(data, "data")) {
            throw decode_error("Missing data chunk at offset 36");
        }

        const bool is_float = format_code == wave_format_ieee_float;
        if (format_code != wave_format_pcm && !(is_float && bits == 32)) {
            throw decode_error("Unsupported WAVE format code " + std::to_string(format_code) +
                               " with " + std::to_string(bits) + " bits");
        }
        if (channels == 0 || channels > std::numeric_limits<channels_t>::max()) {
            throw decode_error("Invalid channel count " + std::to_string(channels));
        }
        if (rate == 0) {
            throw decode_error("Sample rate is zero");
        }
        if (!is_valid_bit_depth(bits)) {
            throw decode_error("Unsupported bit depth " + std::to_string(bits));
        }

        const auto payload_available = stream->get_size() - stream->tell();
        if (payload_available < 0 || static_cast<uint64_t>(payload_available) < data_size) {
            throw decode_error("Data chunk declares " + std::to_string(data_size) +
                               " bytes but only " + std::to_string(std::max<int64_t>(payload_available, 0)) +
                               " are present");
        }

        buffer<uint8> payload(data_size);
        if (data_size > 0 && stream->read(payload.data(), data_size) != data_size) {
            throw decode_error("Short read in data chunk");
        }

        const auto sample_bytes = bytes_per_sample(static_cast<bit_depth_t>(bits));
        const std::size_t frame_bytes = sample_bytes * channels;
        const std::size_t frames = data_size / frame_bytes;

        pcm_data samples(static_cast<channels_t>(channels), frames);
        const uint8* src = payload.data();
        for (std::size_t i = 0; i < frames; ++i) {
            for (std::size_t ch = 0; ch < channels; ++ch) {
                samples.channel(ch)[i] = read_sample(src, static_cast<bit_depth_t>(bits), is_float);
                src += sample_bytes;
            }
        }

        LOG_DEBUG("codec_wav", "Decoded", frames, "frames,", channels, "channels,", rate, "Hz,",
                  bits, is_float ? "bit float" : "bit PCM");

        decoded_audio out{std::move(samples), audio_format{}};
        out.format.container = container_id::wav;
        out.format.codec = sample_encoding_name(static_cast<bit_depth_t>(bits), is_float);
        out.format.sample_rate = rate;
        out.format.bit_depth = static_cast<bit_depth_t>(bits);
        out.format.channels = static_cast<channels_t>(channels);
        out.format.quality = quality_tier::lossless;
        return out;
    }

    buffer<uint8> codec_wav::encode(const pcm_data& samples, const audio_format& format) const {
        validate_target(format);
        if (samples.channel_count() != format.channels) {
            throw encode_error("Sample set has " + std::to_string(samples.channel_count()) +
                               " channels but the target format declares " +
                               std::to_string(format.channels));
        }

        const auto sample_bytes = bytes_per_sample(format.bit_depth);
        const std::size_t frames = samples.frames();
        const uint64_t data_size = static_cast<uint64_t>(frames) * format.channels * sample_bytes;
        if (data_size > std::numeric_limits<uint32_t>::max() - header_size) {
            throw encode_error("Data too large for a RIFF container: " + std::to_string(data_size) + " bytes");
        }

        buffer<uint8> out(header_size + static_cast<std::size_t>(data_size));
        uint8* p = out.data();
        std::memcpy(p + 0, "RIFF", 4);
        store_u32le(p + 4, static_cast<uint32>(header_size - 8 + data_size));
        std::memcpy(p + 8, "WAVE", 4);
        std::memcpy(p + 12, "fmt ", 4);
        store_u32le(p + 16, 16);
        store_u16le(p + 20, wave_format_pcm);
        store_u16le(p + 22, format.channels);
        store_u32le(p + 24, format.sample_rate);
        store_u32le(p + 28, format.sample_rate * format.channels * sample_bytes);
        store_u16le(p + 32, static_cast<uint16>(format.channels * sample_bytes));
        store_u16le(p + 34, format.bit_depth);
        std::memcpy(p + 36, "data", 4);
        store_u32le(p + 40, static_cast<uint32>(data_size));

        uint8* dst = p + header_size;
        for (std::size_t i = 0; i < frames; ++i) {
            for (std::size_t ch = 0; ch < format.channels; ++ch) {
                write_sample(dst, samples.channel(ch)[i], format.bit_depth);
                dst += sample_bytes;
            }
        }

        LOG_DEBUG("codec_wav", "Encoded", frames, "frames into", out.size(), "bytes");
        return out;
    }
}

/*
 * Copyright (C) 2025
 *
 * This file is part of audioconv.
 *
 * audioconv is free software: you can redistribute it and/or modify it under
 * the terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * audioconv is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with audioconv.  If not, see <http://www.gnu.org/licenses/>.
 */
