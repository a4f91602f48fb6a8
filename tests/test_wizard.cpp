#include <catch2/catch.hpp>
#include "wizard.hpp"

using namespace karltui;

static const Key kEnter = Key::special(KeyCode::Enter);
static const Key kBackspace = Key::special(KeyCode::Backspace);

static void type(InitWizard& wizard, const std::string& text) {
    for (char c : text) wizard.handle_key(Key::character(c));
}

TEST_CASE("InitWizard: starts on welcome with the default alias", "[wizard]") {
    InitWizard wizard;
    REQUIRE(wizard.step() == InitStep::Welcome);
    REQUIRE(wizard.model_alias() == "fast");
    REQUIRE(wizard.provider_index() == 0);
    REQUIRE(wizard.oauth_status() == OAuthStatus::NotStarted);
}

TEST_CASE("InitWizard: escape quits from any step", "[wizard]") {
    InitWizard wizard;
    REQUIRE(wizard.handle_key(Key::special(KeyCode::Esc)) == WizardOutcome::Quit);
    wizard.handle_key(kEnter);
    REQUIRE(wizard.handle_key(Key::special(KeyCode::Esc)) == WizardOutcome::Quit);
}

TEST_CASE("InitWizard: provider selection wraps", "[wizard]") {
    InitWizard wizard;
    wizard.handle_key(kEnter);
    REQUIRE(wizard.step() == InitStep::SelectProvider);
    wizard.handle_key(Key::character('k'));
    REQUIRE(wizard.provider_index() == provider_options().size() - 1);
    REQUIRE(wizard.model_selector().options() == models_for_provider("openrouter"));
    wizard.handle_key(Key::special(KeyCode::Down));
    REQUIRE(wizard.provider_index() == 0);
    wizard.handle_key(kBackspace);
    REQUIRE(wizard.step() == InitStep::Welcome);
}

TEST_CASE("InitWizard: OAuth flow requests login", "[wizard]") {
    InitWizard wizard;
    wizard.handle_key(kEnter);
    wizard.handle_key(kEnter);
    REQUIRE(wizard.step() == InitStep::AuthenticateOAuth);

    REQUIRE(wizard.handle_key(kEnter) == WizardOutcome::RunLogin);
    REQUIRE(wizard.oauth_status() == OAuthStatus::InProgress);

    wizard.oauth_complete(false);
    REQUIRE(wizard.oauth_status() == OAuthStatus::Failed);
    REQUIRE(wizard.error_message() == "OAuth authentication failed");
    REQUIRE(wizard.step() == InitStep::AuthenticateOAuth);

    wizard.handle_key(kEnter);
    wizard.oauth_complete(true);
    REQUIRE(wizard.oauth_status() == OAuthStatus::Success);
    REQUIRE(wizard.error_message().empty());
    REQUIRE(wizard.step() == InitStep::CreateModel);
}

TEST_CASE("InitWizard: OAuth can be skipped", "[wizard]") {
    InitWizard wizard;
    wizard.handle_key(kEnter);
    wizard.handle_key(kEnter);
    wizard.handle_key(Key::character('s'));
    REQUIRE(wizard.step() == InitStep::CreateModel);
}

TEST_CASE("InitWizard: API key is required", "[wizard]") {
    InitWizard wizard;
    wizard.handle_key(kEnter);
    wizard.handle_key(Key::special(KeyCode::Down)); // anthropic
    wizard.handle_key(kEnter);
    REQUIRE(wizard.step() == InitStep::AuthenticateApiKey);

    wizard.handle_key(kEnter);
    REQUIRE(wizard.error_message() == "API key is required");
    REQUIRE(wizard.step() == InitStep::AuthenticateApiKey);

    type(wizard, "sk-test");
    REQUIRE(wizard.error_message().empty());
    REQUIRE(wizard.api_key_input().value() == "sk-test");
    wizard.handle_key(kEnter);
    REQUIRE(wizard.step() == InitStep::CreateModel);
}

TEST_CASE("InitWizard: backspace on empty API key goes back", "[wizard]") {
    InitWizard wizard;
    wizard.handle_key(kEnter);
    wizard.handle_key(Key::special(KeyCode::Down));
    wizard.handle_key(kEnter);
    type(wizard, "a");
    wizard.handle_key(kBackspace);
    REQUIRE(wizard.step() == InitStep::AuthenticateApiKey);
    wizard.handle_key(kBackspace);
    REQUIRE(wizard.step() == InitStep::SelectProvider);
}

TEST_CASE("InitWizard: model step needs an alias", "[wizard]") {
    InitWizard wizard;
    wizard.handle_key(kEnter);
    wizard.handle_key(kEnter);
    wizard.handle_key(Key::character('s'));
    REQUIRE(wizard.step() == InitStep::CreateModel);

    for (int i = 0; i < 4; ++i) wizard.handle_key(kBackspace);
    REQUIRE(wizard.alias_input().empty());
    wizard.handle_key(kEnter);
    REQUIRE(wizard.error_message() == "Model alias is required");

    type(wizard, "main");
    wizard.handle_key(Key::special(KeyCode::Tab));
    REQUIRE(wizard.model_focus() == 1);
    wizard.handle_key(Key::character('j'));
    REQUIRE(wizard.model_selector().selected() == 1);
    wizard.handle_key(kEnter);
    REQUIRE(wizard.step() == InitStep::Confirm);

    wizard.handle_key(Key::character('n'));
    REQUIRE(wizard.step() == InitStep::CreateModel);
    wizard.handle_key(kEnter);
    REQUIRE(wizard.handle_key(Key::character('y')) == WizardOutcome::Finish);
}

TEST_CASE("InitWizard: apply writes an API key provider", "[wizard]") {
    InitWizard wizard;
    wizard.handle_key(kEnter);
    wizard.handle_key(Key::special(KeyCode::Up)); // openrouter
    wizard.handle_key(kEnter);
    type(wizard, "sk-or");
    wizard.handle_key(kEnter);
    wizard.handle_key(kEnter);

    ConfigStore store(Config{}, "");
    wizard.apply(store);
    const auto& cfg = store.config();
    const auto& provider = cfg.providers.at("openrouter");
    REQUIRE(provider.type == "openai");
    REQUIRE(provider.api_key.value() == "sk-or");
    REQUIRE(provider.base_url.value() == "https://openrouter.ai/api/v1");
    REQUIRE_FALSE(provider.auth_type.has_value());
    REQUIRE(cfg.models.at("fast").provider == "openrouter");
    REQUIRE(cfg.models.at("fast").model == models_for_provider("openrouter").front());
    REQUIRE(cfg.default_model == "fast");
    REQUIRE(store.dirty());
}

TEST_CASE("InitWizard: apply writes an OAuth provider", "[wizard]") {
    InitWizard wizard;
    ConfigStore store(Config{}, "");
    wizard.apply(store);
    const auto& provider = store.config().providers.at("claude-pro-max");
    REQUIRE(provider.type == "anthropic");
    REQUIRE(provider.auth_type.value() == "oauth");
    REQUIRE_FALSE(provider.api_key.has_value());
    REQUIRE_FALSE(provider.base_url.has_value());
}
