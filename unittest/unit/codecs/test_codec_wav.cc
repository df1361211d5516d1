#include <doctest/doctest.h>
#include <audioconv/codecs/codec_wav.hh>
#include <audioconv/codecs/codec_placeholder.hh>
#include <audioconv/error.hh>
#include <audioconv/sdk/io_stream.hh>
#include <cstring>
#include "test_helpers.hh"

using namespace audioconv;

namespace {
    decoded_audio round_trip(const codec& c, const pcm_data& pcm, const audio_format& fmt) {
        auto bytes = c.encode(pcm, fmt);
        return c.decode(bytes);
    }
}

TEST_SUITE("Codecs::WAV") {
    TEST_CASE("Identity and capabilities") {
        codec_wav wav;
        CHECK(std::string(wav.get_name()) == "wav");
        CHECK(wav.get_container() == container_id::wav);
        CHECK(wav.is_lossless());
        CHECK_FALSE(wav.is_placeholder());

        auto caps = wav.get_capabilities();
        CHECK(caps.max_sample_rate == 192000);
        CHECK(caps.max_channels == 8);
        CHECK(caps.supports_bit_depth(8));
        CHECK(caps.supports_bit_depth(32));
        CHECK_FALSE(caps.supports_bit_depth(12));
    }

    TEST_CASE("Header layout") {
        codec_wav wav;
        auto pcm = test::make_pcm({{0.0f, 0.0f, 0.0f}});
        auto bytes = wav.encode(pcm, test::make_format(container_id::wav, 8000, 16, 1));

        REQUIRE(bytes.size() == codec_wav::header_size + 6);
        const uint8* p = bytes.data();
        CHECK(std::memcmp(p, "RIFF", 4) == 0);
        CHECK(load_u32le(p + 4) == 36 + 6);
        CHECK(std::memcmp(p + 8, "WAVE", 4) == 0);
        CHECK(std::memcmp(p + 12, "fmt ", 4) == 0);
        CHECK(load_u32le(p + 16) == 16);
        CHECK(load_u16le(p + 20) == 1);
        CHECK(load_u16le(p + 22) == 1);
        CHECK(load_u32le(p + 24) == 8000);
        CHECK(load_u32le(p + 28) == 16000);
        CHECK(load_u16le(p + 32) == 2);
        CHECK(load_u16le(p + 34) == 16);
        CHECK(std::memcmp(p + 36, "data", 4) == 0);
        CHECK(load_u32le(p + 40) == 6);
    }

    TEST_CASE("Sample encoding") {
        codec_wav wav;

        SUBCASE("16-bit full scale and clipping") {
            auto pcm = test::make_pcm({{1.0f, -1.0f, 1.5f, -1.5f, 0.0f}});
            auto bytes = wav.encode(pcm, test::make_format(container_id::wav, 44100, 16, 1));
            const uint8* s = bytes.data() + codec_wav::header_size;
            CHECK(static_cast<int16_t>(load_u16le(s + 0)) == 32767);
            CHECK(static_cast<int16_t>(load_u16le(s + 2)) == -32767);
            CHECK(static_cast<int16_t>(load_u16le(s + 4)) == 32767);
            CHECK(static_cast<int16_t>(load_u16le(s + 6)) == -32768);
            CHECK(static_cast<int16_t>(load_u16le(s + 8)) == 0);
        }

        SUBCASE("8-bit is unsigned") {
            auto pcm = test::make_pcm({{-1.0f, 0.0f, 1.0f}});
            auto bytes = wav.encode(pcm, test::make_format(container_id::wav, 44100, 8, 1));
            const uint8* s = bytes.data() + codec_wav::header_size;
            CHECK(s[0] == 0);
            CHECK(s[1] == 128);
            CHECK(s[2] == 255);
        }

        SUBCASE("Channels are interleaved") {
            auto pcm = test::make_pcm({{0.5f, 0.5f}, {-0.5f, -0.5f}});
            auto bytes = wav.encode(pcm, test::make_format(container_id::wav, 44100, 16, 2));
            const uint8* s = bytes.data() + codec_wav::header_size;
            CHECK(static_cast<int16_t>(load_u16le(s + 0)) > 0);
            CHECK(static_cast<int16_t>(load_u16le(s + 2)) < 0);
            CHECK(static_cast<int16_t>(load_u16le(s + 4)) > 0);
            CHECK(static_cast<int16_t>(load_u16le(s + 6)) < 0);
        }
    }

    TEST_CASE("Round trip precision") {
        codec_wav wav;
        auto pcm = test::make_pcm({{0.5f, -0.25f, 0.125f}, {-0.5f, 0.75f, 0.0f}});

        SUBCASE("16-bit") {
            auto out = round_trip(wav, pcm, test::make_format(container_id::wav, 44100, 16, 2));
            REQUIRE(out.samples.channel_count() == 2);
            REQUIRE(out.samples.frames() == 3);
            for (std::size_t ch = 0; ch < 2; ++ch) {
                CHECK(test::max_abs_difference(out.samples.channel(ch), pcm.channel(ch)) <= 1.0 / 32768);
            }
            CHECK(out.format.bit_depth == 16);
            CHECK(out.format.codec == std::string("pcm_s16le"));
            CHECK(out.format.quality == quality_tier::lossless);
        }

        SUBCASE("24-bit") {
            auto out = round_trip(wav, pcm, test::make_format(container_id::wav, 96000, 24, 2));
            for (std::size_t ch = 0; ch < 2; ++ch) {
                CHECK(test::max_abs_difference(out.samples.channel(ch), pcm.channel(ch)) <= 1.0 / 8388608);
            }
            CHECK(out.format.sample_rate == 96000);
            CHECK(out.format.codec == std::string("pcm_s24le"));
        }

        SUBCASE("32-bit") {
            auto out = round_trip(wav, pcm, test::make_format(container_id::wav, 48000, 32, 2));
            for (std::size_t ch = 0; ch < 2; ++ch) {
                CHECK(test::max_abs_difference(out.samples.channel(ch), pcm.channel(ch)) <= 1e-6);
            }
        }

        SUBCASE("8-bit") {
            auto out = round_trip(wav, pcm, test::make_format(container_id::wav, 22050, 8, 2));
            for (std::size_t ch = 0; ch < 2; ++ch) {
                CHECK(test::max_abs_difference(out.samples.channel(ch), pcm.channel(ch)) <= 1.0 / 256);
            }
            CHECK(out.format.codec == std::string("pcm_u8"));
        }
    }

    TEST_CASE("8-bit samples survive decode and re-encode unchanged") {
        test::wav_header_fields h;
        h.channels = 1;
        h.sample_rate = 22050;
        h.bits = 8;
        const std::vector<uint8> payload{0, 1, 60, 127, 128, 129, 191, 200, 254, 255};
        h.data_size = static_cast<uint32>(payload.size());

        codec_wav wav;
        auto decoded = wav.decode(test::build_wav(h, payload));
        auto bytes = wav.encode(decoded.samples, decoded.format);
        REQUIRE(bytes.size() == codec_wav::header_size + payload.size());
        const uint8* s = bytes.data() + codec_wav::header_size;
        for (std::size_t i = 0; i < payload.size(); ++i) {
            CAPTURE(i);
            CHECK(s[i] == payload[i]);
        }
    }

    TEST_CASE("IEEE float input") {
        test::wav_header_fields h;
        h.format_code = 3;
        h.channels = 1;
        h.bits = 32;
        const float values[] = {0.25f, -0.75f};
        std::vector<uint8> payload(sizeof(values));
        for (std::size_t i = 0; i < 2; ++i) {
            uint32 raw;
            std::memcpy(&raw, &values[i], sizeof(raw));
            store_u32le(payload.data() + 4 * i, raw);
        }
        h.data_size = static_cast<uint32>(payload.size());

        codec_wav wav;
        auto out = wav.decode(test::build_wav(h, payload));
        REQUIRE(out.samples.frames() == 2);
        CHECK(out.samples.channel(0)[0] == 0.25f);
        CHECK(out.samples.channel(0)[1] == -0.75f);
        CHECK(out.format.codec == std::string("pcm_f32le"));
    }

    TEST_CASE("Trailing partial frame is dropped") {
        test::wav_header_fields h;
        h.channels = 2;
        auto payload = test::s16_payload({100, -100, 200});
        h.data_size = static_cast<uint32>(payload.size());

        codec_wav wav;
        auto out = wav.decode(test::build_wav(h, payload));
        CHECK(out.samples.frames() == 1);
    }

    TEST_CASE("Malformed input") {
        codec_wav wav;
        test::wav_header_fields h;
        auto payload = test::s16_payload({1, 2, 3, 4});
        h.data_size = static_cast<uint32>(payload.size());

        SUBCASE("Wrong RIFF tag") {
            std::memcpy(h.riff, "RIFX", 4);
            CHECK_THROWS_AS(wav.decode(test::build_wav(h, payload)), decode_error);
        }

        SUBCASE("Wrong WAVE tag") {
            std::memcpy(h.wave, "AVI ", 4);
            CHECK_THROWS_AS(wav.decode(test::build_wav(h, payload)), decode_error);
        }

        SUBCASE("Missing fmt chunk") {
            std::memcpy(h.fmt, "LIST", 4);
            CHECK_THROWS_AS(wav.decode(test::build_wav(h, payload)), decode_error);
        }

        SUBCASE("Missing data chunk") {
            std::memcpy(h.data, "fact", 4);
            CHECK_THROWS_AS(wav.decode(test::build_wav(h, payload)), decode_error);
        }

        SUBCASE("Truncated data") {
            h.data_size = 1000;
            CHECK_THROWS_AS(wav.decode(test::build_wav(h, payload)), decode_error);
        }

        SUBCASE("Compressed format code") {
            h.format_code = 2;
            CHECK_THROWS_AS(wav.decode(test::build_wav(h, payload)), decode_error);
        }

        SUBCASE("Float with 16 bits") {
            h.format_code = 3;
            CHECK_THROWS_AS(wav.decode(test::build_wav(h, payload)), decode_error);
        }

        SUBCASE("Zero channels") {
            h.channels = 0;
            CHECK_THROWS_AS(wav.decode(test::build_wav(h, payload)), decode_error);
        }

        SUBCASE("Zero sample rate") {
            h.sample_rate = 0;
            CHECK_THROWS_AS(wav.decode(test::build_wav(h, payload)), decode_error);
        }

        SUBCASE("Short header") {
            buffer<uint8> tiny{'R', 'I', 'F', 'F', 0, 0};
            CHECK_THROWS_AS(wav.decode(tiny), decode_error);
        }
    }

    TEST_CASE("Encoder rejects targets outside its capabilities") {
        codec_wav wav;
        auto mono = test::make_pcm({{0.0f}});

        CHECK_THROWS_AS(wav.encode(mono, test::make_format(container_id::wav, 384000, 16, 1)),
                        validation_error);
        CHECK_THROWS_AS(wav.encode(mono, test::make_format(container_id::wav, 44100, 12, 1)),
                        validation_error);
        CHECK_THROWS_AS(wav.encode(mono, test::make_format(container_id::wav, 44100, 16, 2)),
                        encode_error);
    }

    TEST_CASE("Signature check restores position") {
        codec_wav wav;
        auto bytes = wav.encode(test::make_pcm({{0.1f}}), test::make_format(container_id::wav, 44100, 16, 1));
        auto stream = io_from_memory(bytes.data(), bytes.size());
        CHECK(codec_wav::accept(stream.get()));
        CHECK(stream->tell() == 0);

        const uint8 junk[] = {'O', 'g', 'g', 'S', 0, 0, 0, 0, 0, 0, 0, 0};
        auto other = io_from_memory(junk, sizeof(junk));
        CHECK_FALSE(codec_wav::accept(other.get()));
        CHECK_FALSE(codec_wav::accept(nullptr));
    }
}

TEST_SUITE("Codecs::Placeholder") {
    TEST_CASE("FLAC entry") {
        auto flac = codec_placeholder::create_flac();
        CHECK(flac->is_placeholder());
        CHECK(flac->is_lossless());
        CHECK(flac->get_container() == container_id::flac);
        CHECK(flac->get_capabilities().supports_bit_depth(24));
        CHECK_FALSE(flac->get_capabilities().supports_bit_depth(8));
    }

    TEST_CASE("MP3 entry limits") {
        auto mp3 = codec_placeholder::create_mp3();
        CHECK_FALSE(mp3->is_lossless());
        auto stereo = test::make_pcm({{0.0f}, {0.0f}});

        CHECK_NOTHROW((void)mp3->encode(stereo, test::make_format(container_id::mp3, 48000, 16, 2)));
        CHECK_THROWS_AS((void)mp3->encode(stereo, test::make_format(container_id::mp3, 96000, 16, 2)),
                        validation_error);
        CHECK_THROWS_AS((void)mp3->encode(stereo, test::make_format(container_id::mp3, 44100, 24, 2)),
                        validation_error);
    }

    TEST_CASE("Output is canonical WAV tagged with the placeholder container") {
        auto flac = codec_placeholder::create_flac();
        auto pcm = test::make_pcm({{0.25f, -0.25f}});
        auto bytes = flac->encode(pcm, test::make_format(container_id::flac, 44100, 16, 1));
        CHECK(std::memcmp(bytes.data(), "RIFF", 4) == 0);

        auto decoded = flac->decode(bytes);
        CHECK(decoded.format.container == container_id::flac);
        CHECK(decoded.format.codec == std::string("flac"));
        CHECK(decoded.samples.frames() == 2);
    }
}
