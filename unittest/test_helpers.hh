#ifndef AUDIOCONV_TEST_HELPERS_HH
#define AUDIOCONV_TEST_HELPERS_HH

#include <audioconv/sdk/audio_format.hh>
#include <audioconv/sdk/buffer.hh>
#include <audioconv/sdk/endian.hh>
#include <audioconv/sdk/pcm_data.hh>
#include <audioconv/sdk/types.hh>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <vector>

namespace audioconv::test {

constexpr double pi = 3.14159265358979323846;

// Generate a sine wave
inline buffer<float> generate_sine(std::size_t samples, double frequency,
                                   sample_rate_t rate, float amplitude = 0.5f) {
    buffer<float> out(samples);
    for (std::size_t i = 0; i < samples; ++i) {
        out[i] = static_cast<float>(amplitude * std::sin(2.0 * pi * frequency * static_cast<double>(i) / rate));
    }
    return out;
}

// Same sine on every channel
inline pcm_data make_sine_pcm(channels_t channels, std::size_t frames, double frequency,
                              sample_rate_t rate, float amplitude = 0.5f) {
    std::vector<buffer<float>> chans;
    for (channels_t ch = 0; ch < channels; ++ch) {
        chans.push_back(generate_sine(frames, frequency, rate, amplitude));
    }
    return pcm_data(std::move(chans));
}

inline pcm_data make_pcm(std::initializer_list<std::initializer_list<float>> channels) {
    std::vector<buffer<float>> chans;
    for (const auto& ch : channels) {
        chans.emplace_back(ch);
    }
    return pcm_data(std::move(chans));
}

inline pcm_data make_constant_pcm(channels_t channels, std::size_t frames, float value) {
    pcm_data out(channels, frames);
    for (channels_t ch = 0; ch < channels; ++ch) {
        for (auto& s : out.channel(ch)) {
            s = value;
        }
    }
    return out;
}

inline audio_format make_format(container_id container, sample_rate_t rate,
                                bit_depth_t bits, channels_t channels) {
    audio_format fmt;
    fmt.container = container;
    fmt.sample_rate = rate;
    fmt.bit_depth = bits;
    fmt.channels = channels;
    return fmt;
}

// Fields of a canonical 44 byte WAV header, editable to build broken files
struct wav_header_fields {
    char riff[4] = {'R', 'I', 'F', 'F'};
    char wave[4] = {'W', 'A', 'V', 'E'};
    char fmt[4] = {'f', 'm', 't', ' '};
    char data[4] = {'d', 'a', 't', 'a'};
    uint16 format_code = 1;
    uint16 channels = 2;
    uint32 sample_rate = 44100;
    uint16 bits = 16;
    uint32 data_size = 0;
};

// Build a WAV file with the given header and raw payload
inline buffer<uint8> build_wav(const wav_header_fields& h, const std::vector<uint8>& payload) {
    buffer<uint8> out(44 + payload.size());
    uint8* p = out.data();
    const uint16 block_align = static_cast<uint16>(h.channels * (h.bits / 8));
    std::memcpy(p, h.riff, 4);
    store_u32le(p + 4, static_cast<uint32>(36 + payload.size()));
    std::memcpy(p + 8, h.wave, 4);
    std::memcpy(p + 12, h.fmt, 4);
    store_u32le(p + 16, 16);
    store_u16le(p + 20, h.format_code);
    store_u16le(p + 22, h.channels);
    store_u32le(p + 24, h.sample_rate);
    store_u32le(p + 28, h.sample_rate * block_align);
    store_u16le(p + 32, block_align);
    store_u16le(p + 34, h.bits);
    std::memcpy(p + 36, h.data, 4);
    store_u32le(p + 40, h.data_size);
    if (!payload.empty()) {
        std::memcpy(p + 44, payload.data(), payload.size());
    }
    return out;
}

// 16-bit interleaved payload from signed samples
inline std::vector<uint8> s16_payload(const std::vector<int16_t>& samples) {
    std::vector<uint8> out(samples.size() * 2);
    for (std::size_t i = 0; i < samples.size(); ++i) {
        store_u16le(out.data() + 2 * i, static_cast<uint16>(samples[i]));
    }
    return out;
}

inline double max_abs_difference(const buffer<float>& a, const buffer<float>& b) {
    double diff = 0.0;
    const auto n = std::min(a.size(), b.size());
    for (std::size_t i = 0; i < n; ++i) {
        diff = std::max(diff, static_cast<double>(std::fabs(a[i] - b[i])));
    }
    return diff;
}

} // namespace audioconv::test

#endif // AUDIOCONV_TEST_HELPERS_HH
