#include <catch2/catch.hpp>
#include "config_store.hpp"
#include "temp_dir.hpp"
#include <algorithm>

using namespace karltui;

static ConfigStore make_store(const std::string& path = "") {
    Config cfg;
    cfg.models["fast"] = ModelEntry{"anthropic", "claude-haiku-4-5"};
    cfg.providers["anthropic"] = ProviderEntry{"anthropic"};
    return ConfigStore(cfg, path);
}

TEST_CASE("ConfigStore: starts clean", "[config_store]") {
    auto store = make_store();
    REQUIRE_FALSE(store.dirty());
}

TEST_CASE("ConfigStore: upsert_model marks dirty", "[config_store]") {
    auto store = make_store();
    store.upsert_model("smart", ModelEntry{"anthropic", "claude-opus-4-5"});
    REQUIRE(store.dirty());
    REQUIRE(store.config().models.size() == 2);
}

TEST_CASE("ConfigStore: upsert_model with original key renames", "[config_store]") {
    auto store = make_store();
    store.upsert_model("quick", ModelEntry{"anthropic", "claude-haiku-4-5"}, "fast");
    REQUIRE(store.config().models.count("fast") == 0);
    REQUIRE(store.config().models.count("quick") == 1);
}

TEST_CASE("ConfigStore: upsert_model with same key replaces", "[config_store]") {
    auto store = make_store();
    store.upsert_model("fast", ModelEntry{"anthropic", "claude-sonnet-4-5"}, "fast");
    REQUIRE(store.config().models.size() == 1);
    REQUIRE(store.config().models.at("fast").model == "claude-sonnet-4-5");
}

TEST_CASE("ConfigStore: remove_model of unknown alias is a no-op", "[config_store]") {
    auto store = make_store();
    REQUIRE_FALSE(store.remove_model("missing"));
    REQUIRE_FALSE(store.dirty());
    REQUIRE(store.remove_model("fast"));
    REQUIRE(store.dirty());
    REQUIRE(store.config().models.empty());
}

TEST_CASE("ConfigStore: stacks rename and remove", "[config_store]") {
    auto store = make_store();
    StackEntry s;
    s.model = "fast";
    store.upsert_stack("review", s);
    store.upsert_stack("audit", s, "review");
    REQUIRE(store.config().stacks.count("review") == 0);
    REQUIRE(store.config().stacks.at("audit").model.value() == "fast");
    REQUIRE(store.remove_stack("audit"));
    REQUIRE_FALSE(store.remove_stack("audit"));
}

TEST_CASE("ConfigStore: set_tool_enabled only dirties on change", "[config_store]") {
    auto store = make_store();
    store.set_tool_enabled("bash", true);
    REQUIRE_FALSE(store.dirty());

    store.set_tool_enabled("bash", false);
    REQUIRE(store.dirty());
    const auto& enabled = store.config().tools.enabled;
    REQUIRE(std::find(enabled.begin(), enabled.end(), "bash") == enabled.end());

    store.set_tool_enabled("bash", true);
    REQUIRE(store.config().tools.enabled.back() == "bash");
}

TEST_CASE("ConfigStore: custom tools reject duplicates", "[config_store]") {
    auto store = make_store();
    REQUIRE(store.add_custom_tool("/opt/lint"));
    REQUIRE_FALSE(store.add_custom_tool("/opt/lint"));
    REQUIRE(store.config().tools.custom.size() == 1);
    REQUIRE(store.remove_custom_tool("/opt/lint"));
    REQUIRE_FALSE(store.remove_custom_tool("/opt/lint"));
}

TEST_CASE("ConfigStore: save writes and clears dirty", "[config_store]") {
    TempDir tmp;
    auto path = tmp.file("karl/karl.json");
    auto store = make_store(path);
    store.set_default_model("fast");
    REQUIRE(store.dirty());

    store.save();
    REQUIRE_FALSE(store.dirty());
    auto reloaded = ConfigStore::load({path, tmp.file("none.json")});
    REQUIRE(reloaded.config() == store.config());
    REQUIRE(reloaded.source_path() == path);
}

TEST_CASE("ConfigStore: failed save keeps dirty", "[config_store]") {
    TempDir tmp;
    auto blocker = tmp.write("blocker", "x");
    auto store = make_store(blocker + "/karl.json");
    store.remove_model("fast");

    REQUIRE_THROWS_AS(store.save(), std::runtime_error);
    REQUIRE(store.dirty());
}
