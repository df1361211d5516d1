#include <doctest/doctest.h>
#include <audioconv/sdk/channel_remapper.hh>
#include <audioconv/error.hh>
#include "test_helpers.hh"

using namespace audioconv;

TEST_SUITE("SDK::ChannelRemapper") {
    TEST_CASE("Matching channel count is a no-op") {
        auto pcm = test::make_pcm({{0.1f, 0.2f}, {0.3f, 0.4f}});
        auto out = channel_remapper::convert_channels(std::move(pcm), 2);
        REQUIRE(out.channel_count() == 2);
        CHECK(out.channel(0)[1] == 0.2f);
        CHECK(out.channel(1)[0] == 0.3f);
    }

    TEST_CASE("Stereo to mono averages") {
        auto pcm = test::make_pcm({{1.0f, 0.5f, -1.0f}, {0.0f, 0.5f, 1.0f}});
        auto out = channel_remapper::convert_channels(std::move(pcm), 1);
        REQUIRE(out.channel_count() == 1);
        CHECK(out.channel(0)[0] == doctest::Approx(0.5f));
        CHECK(out.channel(0)[1] == doctest::Approx(0.5f));
        CHECK(out.channel(0)[2] == doctest::Approx(0.0f));
    }

    TEST_CASE("Mono to stereo duplicates") {
        auto pcm = test::make_pcm({{0.25f, -0.75f}});
        auto out = channel_remapper::convert_channels(std::move(pcm), 2);
        REQUIRE(out.channel_count() == 2);
        for (std::size_t ch = 0; ch < 2; ++ch) {
            CHECK(out.channel(ch)[0] == 0.25f);
            CHECK(out.channel(ch)[1] == -0.75f);
        }
    }

    TEST_CASE("Stereo to mono to stereo to mono is stable") {
        auto stereo = test::make_pcm({{0.9f, -0.3f, 0.1f, 0.7f}, {-0.2f, 0.4f, 0.6f, -0.8f}});
        auto mono1 = channel_remapper::convert_channels(std::move(stereo), 1);
        auto copy = mono1.clone();
        auto restereo = channel_remapper::convert_channels(std::move(copy), 2);
        auto mono2 = channel_remapper::convert_channels(std::move(restereo), 1);
        REQUIRE(mono2.frames() == mono1.frames());
        for (std::size_t i = 0; i < mono1.frames(); ++i) {
            CHECK(mono2.channel(0)[i] == mono1.channel(0)[i]);
        }
    }

    TEST_CASE("Other counts cycle source channels") {
        auto pcm = test::make_pcm({{0.1f}, {0.2f}});

        SUBCASE("stereo to quad") {
            auto out = channel_remapper::convert_channels(std::move(pcm), 4);
            REQUIRE(out.channel_count() == 4);
            CHECK(out.channel(0)[0] == 0.1f);
            CHECK(out.channel(1)[0] == 0.2f);
            CHECK(out.channel(2)[0] == 0.1f);
            CHECK(out.channel(3)[0] == 0.2f);
        }

        SUBCASE("six to stereo truncates") {
            auto six = test::make_pcm({{0.1f}, {0.2f}, {0.3f}, {0.4f}, {0.5f}, {0.6f}});
            auto out = channel_remapper::convert_channels(std::move(six), 2);
            REQUIRE(out.channel_count() == 2);
            CHECK(out.channel(0)[0] == 0.1f);
            CHECK(out.channel(1)[0] == 0.2f);
        }
    }

    TEST_CASE("Zero target channels is rejected") {
        auto pcm = test::make_pcm({{0.1f}});
        CHECK_THROWS_AS((void)channel_remapper::convert_channels(std::move(pcm), 0), validation_error);
    }

    TEST_CASE("Mix to mono averages any number of channels") {
        auto pcm = test::make_pcm({{0.3f}, {0.6f}, {0.9f}});
        auto mono = channel_remapper::mix_to_mono(pcm);
        REQUIRE(mono.size() == 1);
        CHECK(mono[0] == doctest::Approx(0.6f));
    }
}
