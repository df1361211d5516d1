#include <doctest/doctest.h>
#include <audioconv/sdk/quality_metrics.hh>
#include "test_helpers.hh"

#include <cmath>

using namespace audioconv;

TEST_SUITE("SDK::QualityMetrics") {
    TEST_CASE("Full scale square wave") {
        auto original = test::make_pcm({{1.0f, -1.0f, 1.0f, -1.0f}});
        auto processed = original.clone();
        auto m = quality_metrics_calculator::calculate(original, processed);
        CHECK(m.peak_level == doctest::Approx(0.0));
        CHECK(m.rms_level == doctest::Approx(0.0));
        CHECK(m.dynamic_range == doctest::Approx(0.0));
        CHECK(m.loudness == doctest::Approx(-23.0));
        CHECK(m.crest_factor == doctest::Approx(1.0));
        CHECK(m.snr == doctest::Approx(0.0));
        CHECK(m.thd == 0.0);
        CHECK_FALSE(m.thd_measured);
    }

    TEST_CASE("Sine wave has a crest factor of sqrt(2)") {
        auto pcm = test::make_sine_pcm(1, 44100, 441.0, 44100, 0.5f);
        auto m = quality_metrics_calculator::calculate(pcm, pcm);
        CHECK(m.crest_factor == doctest::Approx(std::sqrt(2.0)).epsilon(1e-3));
        CHECK(m.dynamic_range == doctest::Approx(3.0103).epsilon(1e-3));
        CHECK(m.peak_level == doctest::Approx(-6.0206).epsilon(1e-3));
    }

    TEST_CASE("SNR compares original power to processed power") {
        auto original = test::make_constant_pcm(1, 100, 0.5f);
        auto processed = test::make_constant_pcm(1, 100, 0.05f);
        auto m = quality_metrics_calculator::calculate(original, processed);
        CHECK(m.snr == doctest::Approx(20.0));
    }

    TEST_CASE("Silent output gives infinite SNR") {
        auto original = test::make_constant_pcm(2, 10, 0.5f);
        auto processed = test::make_constant_pcm(2, 10, 0.0f);
        auto m = quality_metrics_calculator::calculate(original, processed);
        CHECK(std::isinf(m.snr));
        CHECK(m.snr > 0);
        CHECK(m.peak_level == doctest::Approx(-200.0));
    }

    TEST_CASE("Channels are mixed to mono before measuring") {
        auto pcm = test::make_pcm({{1.0f, 1.0f}, {-1.0f, -1.0f}});
        auto m = quality_metrics_calculator::calculate(pcm, pcm);
        CHECK(m.peak_level == doctest::Approx(-200.0));
    }
}
