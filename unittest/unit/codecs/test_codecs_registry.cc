#include <doctest/doctest.h>
#include <audioconv/sdk/codecs_registry.hh>
#include <audioconv/codecs/codec_wav.hh>
#include <audioconv/codecs/codec_placeholder.hh>
#include <audioconv/codecs/register_codecs.hh>
#include <algorithm>

using namespace audioconv;

TEST_SUITE("Codecs::Registry") {
    TEST_CASE("Empty registry") {
        codecs_registry registry;
        CHECK(registry.size() == 0);
        CHECK(registry.find(container_id::wav) == nullptr);
        CHECK(registry.find_by_extension(".wav") == nullptr);
        CHECK(registry.supported_formats().empty());
    }

    TEST_CASE("Null codec is rejected") {
        codecs_registry registry;
        CHECK_THROWS(registry.register_codec(nullptr));
    }

    TEST_CASE("All codecs") {
        auto registry = create_registry_with_all_codecs();
        REQUIRE(registry != nullptr);
        CHECK(registry->size() == 3);

        auto formats = registry->supported_formats();
        CHECK(std::find(formats.begin(), formats.end(), container_id::wav) != formats.end());
        CHECK(std::find(formats.begin(), formats.end(), container_id::flac) != formats.end());
        CHECK(std::find(formats.begin(), formats.end(), container_id::mp3) != formats.end());

        auto wav = registry->find(container_id::wav);
        REQUIRE(wav != nullptr);
        CHECK_FALSE(wav->is_placeholder());

        auto mp3 = registry->find(container_id::mp3);
        REQUIRE(mp3 != nullptr);
        CHECK(mp3->is_placeholder());

        CHECK(registry->find(container_id::unknown) == nullptr);
    }

    TEST_CASE("Lookup by extension") {
        auto registry = create_registry_with_all_codecs();

        SUBCASE("Case and leading dot are ignored") {
            auto a = registry->find_by_extension(".WAV");
            auto b = registry->find_by_extension("wave");
            REQUIRE(a != nullptr);
            CHECK(a == b);
            CHECK(a->get_container() == container_id::wav);
        }

        SUBCASE("Placeholder extensions") {
            auto flac = registry->find_by_extension("flac");
            REQUIRE(flac != nullptr);
            CHECK(flac->get_container() == container_id::flac);
        }

        SUBCASE("Unknown extension") {
            CHECK(registry->find_by_extension(".ogg") == nullptr);
        }
    }

    TEST_CASE("Registering the same container replaces the entry") {
        codecs_registry registry;
        registry.register_codec(codec_placeholder::create_flac());
        auto first = registry.find(container_id::flac);

        registry.register_codec(std::make_shared<codec_placeholder>(
            container_id::flac, "flac-alt", std::vector<std::string>{".fla"}, codec_capabilities{}, true));

        CHECK(registry.size() == 1);
        auto second = registry.find(container_id::flac);
        REQUIRE(second != nullptr);
        CHECK(second != first);
        CHECK(std::string(second->get_name()) == "flac-alt");
        CHECK(registry.find_by_extension(".flac") == nullptr);
    }

    TEST_CASE("Clear") {
        codecs_registry registry;
        register_all_codecs(registry);
        CHECK(registry.size() == 3);
        registry.clear();
        CHECK(registry.size() == 0);
    }
}
