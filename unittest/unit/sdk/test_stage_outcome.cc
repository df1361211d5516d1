#include <doctest/doctest.h>
#include <audioconv/sdk/stage_outcome.hh>
#include <failsafe/failsafe.hh>

#include <stdexcept>
#include <string>

using namespace audioconv;

TEST_SUITE("SDK::StageOutcome") {
    TEST_CASE("A stage that returns carries its value") {
        auto outcome = run_stage("double", [] { return 21 * 2; });
        REQUIRE(outcome.has_value());
        CHECK(outcome.value() == 42);
    }

    TEST_CASE("Exceptions are classified by type") {
        SUBCASE("unsupported format") {
            auto o = run_stage("lookup", []() -> int { throw unsupported_format_error("no codec"); });
            REQUIRE_FALSE(o);
            CHECK(o.error().kind == error_kind::unsupported_format);
            CHECK(o.error().stage == "lookup");
            CHECK(o.error().message == "no codec");
        }
        SUBCASE("decode") {
            auto o = run_stage("decode", []() -> int { throw decode_error("bad"); });
            CHECK(o.error().kind == error_kind::decode_failure);
        }
        SUBCASE("encode") {
            auto o = run_stage("encode", []() -> int { throw encode_error("bad"); });
            CHECK(o.error().kind == error_kind::encode_failure);
        }
        SUBCASE("validation") {
            auto o = run_stage("validate", []() -> int { throw validation_error("bad"); });
            CHECK(o.error().kind == error_kind::validation_failure);
        }
        SUBCASE("processing") {
            auto o = run_stage("resample", []() -> int { throw processing_error("bad"); });
            CHECK(o.error().kind == error_kind::generic_processing_failure);
        }
        SUBCASE("failsafe runtime error") {
            auto o = run_stage("internal", []() -> int { THROW_RUNTIME("internal fault"); });
            CHECK(o.error().kind == error_kind::generic_processing_failure);
            CHECK(o.error().message.find("internal fault") != std::string::npos);
        }
        SUBCASE("non-standard exception") {
            auto o = run_stage("odd", []() -> int { throw 7; });
            CHECK(o.error().kind == error_kind::generic_processing_failure);
            CHECK_FALSE(o.error().message.empty());
        }
    }

    TEST_CASE("and_then stops at the first error") {
        int calls = 0;
        auto first = run_stage("first", []() -> int { throw decode_error("truncated"); });
        auto second = std::move(first).and_then([&](int v) {
            ++calls;
            return run_stage("second", [v] { return v + 1; });
        });
        CHECK(calls == 0);
        REQUIRE_FALSE(second);
        CHECK(second.error().stage == "first");
    }

    TEST_CASE("and_then feeds the value forward") {
        auto result = run_stage("a", [] { return std::string("x"); })
                          .and_then([](std::string s) {
                              return run_stage("b", [&] { return s + "y"; });
                          });
        REQUIRE(result);
        CHECK(result.value() == "xy");
    }

    TEST_CASE("Error kind names") {
        CHECK(std::string(error_kind_name(error_kind::decode_failure)) == "decode_failure");
        CHECK(std::string(error_kind_name(error_kind::none)) == "none");
    }
}
