#pragma once
#include "catalog.hpp"
#include "config_store.hpp"
#include "key.hpp"
#include "widgets.hpp"
#include <optional>
#include <string>

namespace karltui {

enum class InitStep {
    Welcome,
    SelectProvider,
    AuthenticateOAuth,
    AuthenticateApiKey,
    CreateModel,
    Confirm,
};

enum class OAuthStatus { NotStarted, InProgress, Success, Failed };

// What the caller must do after the wizard consumed a key.
enum class WizardOutcome {
    Continue,
    RunLogin,   // hand the terminal to `karl --login`, then oauth_complete()
    Finish,     // apply() and persist
    Quit,
};

// First-run setup: one provider, one model, set as default.
class InitWizard {
public:
    InitWizard();

    WizardOutcome handle_key(const Key& key);
    void oauth_complete(bool success);

    // Write the collected provider, model and default alias into the store.
    void apply(ConfigStore& store) const;

    InitStep step() const { return step_; }
    OAuthStatus oauth_status() const { return oauth_status_; }
    const std::string& error_message() const { return error_; }

    size_t provider_index() const { return provider_index_; }
    const ProviderOption& selected_provider() const;
    std::optional<std::string> selected_model() const { return model_selector_.selected_value(); }
    std::string model_alias() const;

    const TextInput& api_key_input() const { return api_key_; }
    const TextInput& alias_input() const { return model_alias_; }
    const Selector& model_selector() const { return model_selector_; }
    // 0 = alias field, 1 = model selector
    size_t model_focus() const { return model_focus_; }

private:
    void next_provider();
    void prev_provider();
    void update_model_options();
    InitStep auth_step() const;

    WizardOutcome handle_create_model(const Key& key);

    InitStep step_ = InitStep::Welcome;
    size_t provider_index_ = 0;
    TextInput api_key_{"Enter your API key"};
    TextInput model_alias_;
    Selector model_selector_;
    OAuthStatus oauth_status_ = OAuthStatus::NotStarted;
    std::string error_;
    size_t model_focus_ = 0;
};

} // namespace karltui
