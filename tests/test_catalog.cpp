#include <catch2/catch.hpp>
#include "catalog.hpp"

using namespace karltui;

TEST_CASE("provider_options: wizard order", "[catalog]") {
    const auto& options = provider_options();
    REQUIRE(options.size() == 3);
    REQUIRE(std::string(options[0].key) == "claude-pro-max");
    REQUIRE(options[0].uses_oauth());
    REQUIRE(std::string(options[1].key) == "anthropic");
    REQUIRE_FALSE(options[1].uses_oauth());
    REQUIRE(std::string(options[2].base_url) == "https://openrouter.ai/api/v1");
}

TEST_CASE("find_provider_option: unknown key gives nullptr", "[catalog]") {
    REQUIRE(find_provider_option("openrouter") != nullptr);
    REQUIRE(find_provider_option("ollama") == nullptr);
}

TEST_CASE("models_for_provider: catalogue model ids", "[catalog]") {
    auto ids = models_for_provider("anthropic");
    REQUIRE(ids.size() == 3);
    REQUIRE(ids[0] == "claude-sonnet-4-20250514");
    REQUIRE(models_for_provider("nope").empty());
}

TEST_CASE("models_for_configured_provider: falls back on provider type", "[catalog]") {
    std::map<std::string, ProviderEntry> providers;
    providers["work"] = ProviderEntry{"openai"};
    providers["local"] = ProviderEntry{"ollama"};

    REQUIRE(models_for_configured_provider(providers, "work") ==
            models_for_provider("openrouter"));
    REQUIRE(models_for_configured_provider(providers, "local").empty());
    REQUIRE(models_for_configured_provider(providers, "missing").empty());
    REQUIRE(models_for_configured_provider(providers, "anthropic") ==
            models_for_provider("anthropic"));
}
