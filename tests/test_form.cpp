#include <catch2/catch.hpp>
#include "form.hpp"
#include "catalog.hpp"
#include "temp_dir.hpp"

using namespace karltui;

static void type(TextInput& input, const std::string& text) {
    for (char c : text) input.handle_key(Key::character(c));
}

static ConfigStore store_with_anthropic() {
    Config cfg;
    cfg.providers["anthropic"] = ProviderEntry{"anthropic"};
    return ConfigStore(cfg, "");
}

// ── ModelForm ────────────────────────────────────────────────────

TEST_CASE("ModelForm: create commits model and default", "[form]") {
    auto store = store_with_anthropic();
    auto form = ModelForm::create(store.config());
    type(form.alias, "x");
    REQUIRE(form.provider.selected_value().value() == "anthropic");
    form.model.select_or_insert("claude-x");
    form.set_default.toggle();

    auto errors = form.commit(store);
    REQUIRE(errors.empty());
    const auto& cfg = store.config();
    REQUIRE(cfg.models.at("x").provider == "anthropic");
    REQUIRE(cfg.models.at("x").model == "claude-x");
    REQUIRE(cfg.default_model == "x");
    REQUIRE(store.dirty());
    REQUIRE(form.success_message() == "Created model 'x'");
}

TEST_CASE("ModelForm: model options follow the provider catalogue", "[form]") {
    auto store = store_with_anthropic();
    auto form = ModelForm::create(store.config());
    REQUIRE(form.model.options() == models_for_provider("anthropic"));
}

TEST_CASE("ModelForm: changing provider rebuilds model options", "[form]") {
    Config cfg;
    cfg.providers["anthropic"] = ProviderEntry{"anthropic"};
    cfg.providers["openrouter"] = ProviderEntry{"openai"};
    auto form = ModelForm::create(cfg);
    form.next_field();
    REQUIRE(form.focused_field() == ModelForm::kProvider);

    form.handle_field_key(Key::special(KeyCode::Right));
    REQUIRE(form.provider.selected_value().value() == "openrouter");
    REQUIRE(form.model.options() == models_for_provider("openrouter"));
    REQUIRE(form.model.selected() == 0);
}

TEST_CASE("ModelForm: validation reports every error without touching the store", "[form]") {
    ConfigStore store(Config{}, "");
    auto form = ModelForm::create(store.config());

    auto errors = form.commit(store);
    REQUIRE(errors.size() == 3);
    REQUIRE(errors[0] == "Alias is required");
    REQUIRE(errors[1] == "No providers configured");
    REQUIRE(errors[2] == "Model is required");
    REQUIRE(store.config().models.empty());
    REQUIRE_FALSE(store.dirty());
}

TEST_CASE("ModelForm: whitespace alias is rejected", "[form]") {
    auto store = store_with_anthropic();
    auto form = ModelForm::create(store.config());
    type(form.alias, "   ");
    auto errors = form.validate();
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0] == "Alias is required");
}

TEST_CASE("ModelForm: edit prefills and keeps custom values", "[form]") {
    Config cfg;
    cfg.providers["anthropic"] = ProviderEntry{"anthropic"};
    cfg.default_model = "fast";
    ModelEntry entry{"anthropic", "claude-custom"};
    entry.extra["maxTokens"] = 1024;
    cfg.models["fast"] = entry;

    auto form = ModelForm::edit(cfg, "fast", entry);
    REQUIRE(form.mode() == FormMode::Edit);
    REQUIRE(form.original_key() == "fast");
    REQUIRE(form.alias.value() == "fast");
    REQUIRE(form.model.selected_value().value() == "claude-custom");
    REQUIRE(form.set_default.value());
    REQUIRE(std::string(form.title()) == "Edit Model");
}

TEST_CASE("ModelForm: rename replaces the old key", "[form]") {
    Config cfg;
    cfg.providers["anthropic"] = ProviderEntry{"anthropic"};
    ModelEntry entry{"anthropic", "claude-custom"};
    entry.extra["maxTokens"] = 1024;
    cfg.models["fast"] = entry;
    ConfigStore store(cfg, "");

    auto form = ModelForm::edit(store.config(), "fast", entry);
    form.alias.clear();
    type(form.alias, "quick");

    REQUIRE(form.commit(store).empty());
    REQUIRE(store.config().models.count("fast") == 0);
    REQUIRE(store.config().models.at("quick").model == "claude-custom");
    REQUIRE(store.config().models.at("quick").extra["maxTokens"] == 1024);
    REQUIRE(form.success_message() == "Updated model 'quick'");
}

// ── StackForm ────────────────────────────────────────────────────

TEST_CASE("StackForm: empty optional fields become absent", "[form]") {
    ConfigStore store(Config{}, "");
    auto form = StackForm::create();
    type(form.name, "review");
    REQUIRE(form.commit(store).empty());

    const auto& entry = store.config().stacks.at("review");
    REQUIRE(entry.name.value() == "review");
    REQUIRE_FALSE(entry.extends.has_value());
    REQUIRE_FALSE(entry.temperature.has_value());
    REQUIRE_FALSE(entry.timeout.has_value());
    REQUIRE_FALSE(entry.max_tokens.has_value());
    REQUIRE_FALSE(entry.context.has_value());
    REQUIRE_FALSE(entry.unrestricted.has_value());
}

TEST_CASE("StackForm: numeric fields are parsed", "[form]") {
    auto form = StackForm::create();
    type(form.name, "review");
    type(form.temperature, "0.7");
    type(form.timeout, "60000");
    type(form.max_tokens, "4096");
    form.unrestricted.toggle();
    REQUIRE(form.validate().empty());

    auto entry = form.to_entry();
    REQUIRE(entry.temperature.value() == 0.7);
    REQUIRE(entry.timeout.value() == 60000);
    REQUIRE(entry.max_tokens.value() == 4096);
    REQUIRE(entry.unrestricted.value());
}

TEST_CASE("StackForm: every numeric rule is reported", "[form]") {
    auto form = StackForm::create();
    type(form.temperature, "warm");
    type(form.timeout, "-5");
    type(form.max_tokens, "1e3");

    auto errors = form.validate();
    REQUIRE(errors.size() == 4);
    REQUIRE(errors[0] == "Name is required");
    REQUIRE(errors[1] == "Temperature must be a number");
    REQUIRE(errors[2] == "Timeout must be a positive number");
    REQUIRE(errors[3] == "Max tokens must be a positive number");
}

TEST_CASE("StackForm: temperature range", "[form]") {
    auto form = StackForm::create();
    type(form.name, "s");
    type(form.temperature, "2.5");
    auto errors = form.validate();
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0] == "Temperature must be between 0.0 and 2.0");

    form.temperature.clear();
    type(form.temperature, "2.0");
    REQUIRE(form.validate().empty());
}

TEST_CASE("StackForm: invalid commit leaves the store untouched", "[form]") {
    ConfigStore store(Config{}, "");
    auto form = StackForm::create();
    type(form.name, "review");
    type(form.max_tokens, "99999999999");
    REQUIRE(form.commit(store).size() == 1);
    REQUIRE(store.config().stacks.empty());
    REQUIRE_FALSE(store.dirty());
}

TEST_CASE("StackForm: erasing a multibyte character still saves", "[form]") {
    TempDir tmp;
    ConfigStore store(Config{}, tmp.file("karl.json"));
    auto form = StackForm::create();
    type(form.name, "a\xC3\xA9");
    form.name.handle_key(Key::special(KeyCode::Backspace));
    REQUIRE(form.name.value() == "a");
    type(form.context_file, "caf\xC3\xA9");
    form.context_file.handle_key(Key::special(KeyCode::Left));
    type(form.context_file, "s");
    REQUIRE(form.commit(store).empty());

    REQUIRE_NOTHROW(store.save());
    REQUIRE_FALSE(store.dirty());
    auto saved = read_config_file(tmp.file("karl.json"));
    REQUIRE(saved.has_value());
    REQUIRE(saved->at("stacks").at("a").at("contextFile").get<std::string>() == "cafs\xC3\xA9");
}

TEST_CASE("StackForm: multi-line context survives edit", "[form]") {
    StackEntry entry;
    entry.context = "line one\nline two";
    entry.temperature = 0.3;
    auto form = StackForm::edit("review", entry);
    REQUIRE(form.temperature.value() == "0.3");
    REQUIRE(form.context.lines().size() == 2);
    REQUIRE(form.to_entry().context.value() == "line one\nline two");
}

TEST_CASE("StackForm: rename through edit", "[form]") {
    Config cfg;
    cfg.stacks["old"] = StackEntry{};
    ConfigStore store(cfg, "");
    auto form = StackForm::edit("old", store.config().stacks.at("old"));
    form.name.clear();
    type(form.name, "new");
    REQUIRE(form.commit(store).empty());
    REQUIRE(store.config().stacks.count("old") == 0);
    REQUIRE(store.config().stacks.count("new") == 1);
}

TEST_CASE("StackForm: focus wraps and keys reach the focused field", "[form]") {
    auto form = StackForm::create();
    form.prev_field();
    REQUIRE(form.focused_field() == StackForm::kUnrestricted);
    form.handle_field_key(Key::character(' '));
    REQUIRE(form.unrestricted.value());
    form.next_field();
    REQUIRE(form.focused_field() == StackForm::kName);
    form.handle_field_key(Key::character('a'));
    REQUIRE(form.name.value() == "a");
}

// ── ToolForm ─────────────────────────────────────────────────────

TEST_CASE("ToolForm: adds a custom tool", "[form]") {
    ConfigStore store(Config{}, "");
    ToolForm form;
    type(form.path, "/opt/tools/lint");
    REQUIRE(form.commit(store).empty());
    REQUIRE(store.config().tools.custom == std::vector<std::string>{"/opt/tools/lint"});
    REQUIRE(form.success_message() == "Added tool '/opt/tools/lint'");
}

TEST_CASE("ToolForm: duplicate and empty paths are rejected", "[form]") {
    Config cfg;
    cfg.tools.custom.push_back("/opt/tools/lint");
    ConfigStore store(cfg, "");

    ToolForm empty;
    REQUIRE(empty.commit(store) == std::vector<std::string>{"Path is required"});

    ToolForm dup;
    type(dup.path, "/opt/tools/lint");
    REQUIRE(dup.commit(store) == std::vector<std::string>{"Tool already exists"});
    REQUIRE(store.config().tools.custom.size() == 1);
    REQUIRE_FALSE(store.dirty());
}
