#include <doctest/doctest.h>
#include <audioconv/sdk/resampler.hh>
#include <audioconv/error.hh>
#include "test_helpers.hh"

#include <cmath>

using namespace audioconv;

TEST_SUITE("SDK::Resampler") {
    TEST_CASE("Identical rates return an independent copy") {
        buffer<float> in{0.1f, -0.2f, 0.3f, -0.4f};
        for (auto q : {resample_quality::linear, resample_quality::cubic, resample_quality::sinc}) {
            CAPTURE(resample_quality_name(q));
            auto out = resample(in, 44100, 44100, q);
            REQUIRE(out.size() == in.size());
            for (std::size_t i = 0; i < in.size(); ++i) {
                CHECK(out[i] == in[i]);
            }
            CHECK(out.data() != in.data());
        }
    }

    TEST_CASE("Output length is floor(len * out / in) for every kernel") {
        auto in = test::generate_sine(1000, 440.0, 44100);
        for (auto q : {resample_quality::linear, resample_quality::cubic, resample_quality::sinc}) {
            CAPTURE(resample_quality_name(q));
            CHECK(resample(in, 44100, 48000, q).size() == 1088);
            CHECK(resample(in, 48000, 44100, q).size() == 918);
            CHECK(resample(in, 44100, 22050, q).size() == 500);
            CHECK(resample(in, 3, 7, q).size() == 2333);
        }
    }

    TEST_CASE("Linear upsampling by two") {
        buffer<float> in{0.0f, 1.0f, 0.0f, -1.0f};
        auto out = resample(in, 4, 8, resample_quality::linear);

        const float expected[] = {0.0f, 0.5f, 1.0f, 0.5f, 0.0f, -0.5f, -1.0f, -1.0f};
        REQUIRE(out.size() == 8);
        for (std::size_t i = 0; i < 8; ++i) {
            CAPTURE(i);
            CHECK(out[i] == doctest::Approx(expected[i]));
        }
    }

    TEST_CASE("Cubic passes through source samples at integer positions") {
        buffer<float> in{0.0f, 0.25f, 1.0f, -0.5f, 0.75f};
        auto out = resample(in, 1, 2, resample_quality::cubic);
        REQUIRE(out.size() == 10);
        for (std::size_t i = 0; i < in.size(); ++i) {
            CHECK(out[2 * i] == doctest::Approx(in[i]));
        }
    }

    TEST_CASE("Cubic clamps neighbours at the edges") {
        buffer<float> in{0.5f, 0.5f, 0.5f};
        auto out = resample(in, 2, 5, resample_quality::cubic);
        for (float s : out) {
            CHECK(s == doctest::Approx(0.5f));
        }
    }

    TEST_CASE("Sinc kernel") {
        SUBCASE("unity at zero") {
            CHECK(sinc_resampler::kernel(0.0) == 1.0);
        }
        SUBCASE("zero at non-zero integers") {
            for (int x = 1; x <= 8; ++x) {
                CHECK(sinc_resampler::kernel(x) == doctest::Approx(0.0).epsilon(1e-12));
                CHECK(sinc_resampler::kernel(-x) == doctest::Approx(0.0).epsilon(1e-12));
            }
        }
        SUBCASE("symmetric") {
            CHECK(sinc_resampler::kernel(0.3) == doctest::Approx(sinc_resampler::kernel(-0.3)));
        }
    }

    TEST_CASE("Sinc preserves a DC signal") {
        auto in = test::make_constant_pcm(1, 64, 0.25f);
        auto out = resample(in.channel(0), 32000, 48000, resample_quality::sinc);
        REQUIRE(out.size() == 96);
        for (float s : out) {
            CHECK(s == doctest::Approx(0.25f).epsilon(1e-5));
        }
    }

    TEST_CASE("Low frequency sine survives resampling") {
        const sample_rate_t in_rate = 44100;
        const sample_rate_t out_rate = 48000;
        auto in = test::generate_sine(4410, 100.0, in_rate);
        auto expected = test::generate_sine(4800, 100.0, out_rate);
        for (auto q : {resample_quality::linear, resample_quality::cubic, resample_quality::sinc}) {
            CAPTURE(resample_quality_name(q));
            auto out = resample(in, in_rate, out_rate, q);
            REQUIRE(out.size() == expected.size());
            // Skip the edges where sinc taps fall off the buffer
            auto inner_out = out.slice(16, out.size() - 16);
            auto inner_expected = expected.slice(16, expected.size() - 16);
            CHECK(test::max_abs_difference(inner_out, inner_expected) < 2e-3);
        }
    }

    TEST_CASE("Resampling is deterministic") {
        auto in = test::generate_sine(500, 1000.0, 44100);
        auto a = resample(in, 44100, 32000, resample_quality::sinc);
        auto b = resample(in, 44100, 32000, resample_quality::sinc);
        REQUIRE(a.size() == b.size());
        CHECK(test::max_abs_difference(a, b) == 0.0);
    }

    TEST_CASE("Empty input gives empty output") {
        buffer<float> in(0);
        CHECK(resample(in, 44100, 48000, resample_quality::sinc).empty());
    }

    TEST_CASE("Zero rates are rejected") {
        buffer<float> in{0.0f, 1.0f};
        CHECK_THROWS_AS(resample(in, 0, 48000, resample_quality::linear), validation_error);
        CHECK_THROWS_AS(resample(in, 48000, 0, resample_quality::linear), validation_error);
    }

    TEST_CASE("Every channel of a sample set is resampled") {
        auto pcm = test::make_pcm({{0.0f, 1.0f, 0.0f, -1.0f}, {1.0f, 1.0f, 1.0f, 1.0f}});
        auto out = resample(std::move(pcm), 4, 8, resample_quality::linear);
        REQUIRE(out.channel_count() == 2);
        CHECK(out.frames() == 8);
        CHECK(out.channel(0)[1] == doctest::Approx(0.5f));
        CHECK(out.channel(1)[5] == doctest::Approx(1.0f));
    }

    TEST_CASE("create_resampler names its kernel") {
        CHECK(std::string(create_resampler(resample_quality::linear)->get_name()) == "linear");
        CHECK(std::string(create_resampler(resample_quality::cubic)->get_name()) == "cubic");
        CHECK(std::string(create_resampler(resample_quality::sinc)->get_name()) == "sinc");
    }
}
