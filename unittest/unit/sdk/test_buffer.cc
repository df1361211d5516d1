#include <doctest/doctest.h>
#include <audioconv/sdk/buffer.hh>
#include <audioconv/sdk/types.hh>
#include <stdexcept>
#include <type_traits>

using namespace audioconv;

TEST_SUITE("SDK::Buffer") {
    TEST_CASE("Construction zero-initializes") {
        buffer<float> b(16);
        CHECK(b.size() == 16);
        CHECK_FALSE(b.empty());
        for (float v : b) {
            CHECK(v == 0.0f);
        }

        buffer<uint8> none;
        CHECK(none.empty());
    }

    TEST_CASE("Initializer list") {
        buffer<int> b{1, 2, 3};
        REQUIRE(b.size() == 3);
        CHECK(b[0] == 1);
        CHECK(b[2] == 3);
    }

    TEST_CASE("Buffer is move-only") {
        static_assert(!std::is_copy_constructible_v<buffer<float>>);
        static_assert(std::is_nothrow_move_constructible_v<buffer<float>>);

        buffer<float> a{0.5f, -0.5f};
        buffer<float> b(std::move(a));
        CHECK(b.size() == 2);
        CHECK(a.size() == 0);  // NOLINT(bugprone-use-after-move)
    }

    TEST_CASE("Clone is independent") {
        buffer<float> a{1.0f, 2.0f, 3.0f};
        auto b = a.clone();
        b[0] = 9.0f;
        CHECK(a[0] == 1.0f);
        CHECK(b.size() == a.size());
    }

    TEST_CASE("Slice") {
        buffer<int> a{0, 1, 2, 3, 4, 5};

        SUBCASE("Interior range") {
            auto s = a.slice(2, 5);
            REQUIRE(s.size() == 3);
            CHECK(s[0] == 2);
            CHECK(s[2] == 4);
        }

        SUBCASE("Range past the end is clamped") {
            auto s = a.slice(4, 100);
            REQUIRE(s.size() == 2);
            CHECK(s[1] == 5);
        }

        SUBCASE("Inverted range is empty") {
            CHECK(a.slice(4, 2).empty());
            CHECK(a.slice(6, 6).empty());
        }
    }

    TEST_CASE("Resize preserves prefix") {
        buffer<int> a{7, 8, 9};
        a.resize(5);
        REQUIRE(a.size() == 5);
        CHECK(a[2] == 9);
        CHECK(a[4] == 0);

        a.resize(1);
        REQUIRE(a.size() == 1);
        CHECK(a[0] == 7);

        a.resize(0);
        CHECK(a.empty());
    }

    TEST_CASE("Bounds-checked access") {
        buffer<int> a{1, 2};
        CHECK(a.at(1) == 2);
        CHECK_THROWS_AS(a.at(2), std::out_of_range);
    }
}
