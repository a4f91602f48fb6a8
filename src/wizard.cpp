#include "wizard.hpp"
#include "util.hpp"

namespace karltui {

InitWizard::InitWizard() {
    model_alias_.set_value(kDefaultModelAlias);
    update_model_options();
}

const ProviderOption& InitWizard::selected_provider() const {
    return provider_options()[provider_index_];
}

std::string InitWizard::model_alias() const {
    return trim(model_alias_.value());
}

void InitWizard::next_provider() {
    provider_index_ = (provider_index_ + 1) % provider_options().size();
    update_model_options();
}

void InitWizard::prev_provider() {
    size_t count = provider_options().size();
    provider_index_ = provider_index_ == 0 ? count - 1 : provider_index_ - 1;
    update_model_options();
}

void InitWizard::update_model_options() {
    model_selector_ = Selector(models_for_provider(selected_provider().key));
}

InitStep InitWizard::auth_step() const {
    return selected_provider().uses_oauth() ? InitStep::AuthenticateOAuth
                                            : InitStep::AuthenticateApiKey;
}

WizardOutcome InitWizard::handle_key(const Key& key) {
    if (key.code == KeyCode::Esc) return WizardOutcome::Quit;

    switch (step_) {
        case InitStep::Welcome:
            if (key.code == KeyCode::Enter) step_ = InitStep::SelectProvider;
            break;

        case InitStep::SelectProvider:
            if (key.code == KeyCode::Up || key.is_char('k')) {
                prev_provider();
            } else if (key.code == KeyCode::Down || key.is_char('j')) {
                next_provider();
            } else if (key.code == KeyCode::Enter) {
                step_ = auth_step();
            } else if (key.code == KeyCode::Backspace) {
                step_ = InitStep::Welcome;
            }
            break;

        case InitStep::AuthenticateOAuth:
            if (key.code == KeyCode::Enter) {
                oauth_status_ = OAuthStatus::InProgress;
                error_.clear();
                return WizardOutcome::RunLogin;
            }
            if (key.is_char('s') || key.is_char('S')) {
                step_ = InitStep::CreateModel;
            } else if (key.code == KeyCode::Backspace) {
                step_ = InitStep::SelectProvider;
                oauth_status_ = OAuthStatus::NotStarted;
                error_.clear();
            }
            break;

        case InitStep::AuthenticateApiKey:
            if (key.code == KeyCode::Enter) {
                if (trim(api_key_.value()).empty()) {
                    error_ = "API key is required";
                } else {
                    error_.clear();
                    step_ = InitStep::CreateModel;
                }
            } else if (key.code == KeyCode::Backspace && api_key_.empty()) {
                error_.clear();
                step_ = InitStep::SelectProvider;
            } else {
                api_key_.handle_key(key);
                error_.clear();
            }
            break;

        case InitStep::CreateModel:
            return handle_create_model(key);

        case InitStep::Confirm:
            if (key.code == KeyCode::Enter || key.is_char('y') || key.is_char('Y')) {
                return WizardOutcome::Finish;
            }
            if (key.code == KeyCode::Backspace || key.is_char('n') || key.is_char('N')) {
                step_ = InitStep::CreateModel;
            }
            break;
    }
    return WizardOutcome::Continue;
}

WizardOutcome InitWizard::handle_create_model(const Key& key) {
    if (key.code == KeyCode::Tab || key.code == KeyCode::BackTab) {
        model_focus_ = 1 - model_focus_;
        return WizardOutcome::Continue;
    }
    if (key.code == KeyCode::Enter) {
        if (model_alias().empty()) {
            error_ = "Model alias is required";
        } else {
            error_.clear();
            step_ = InitStep::Confirm;
        }
        return WizardOutcome::Continue;
    }
    if (key.code == KeyCode::Backspace && (model_focus_ == 1 || model_alias_.empty())) {
        error_.clear();
        step_ = auth_step();
        return WizardOutcome::Continue;
    }

    if (model_focus_ == 0) {
        model_alias_.handle_key(key);
        error_.clear();
    } else if (key.code == KeyCode::Up || key.is_char('k')) {
        model_selector_.previous();
    } else if (key.code == KeyCode::Down || key.is_char('j')) {
        model_selector_.next();
    }
    return WizardOutcome::Continue;
}

void InitWizard::oauth_complete(bool success) {
    if (success) {
        oauth_status_ = OAuthStatus::Success;
        error_.clear();
        step_ = InitStep::CreateModel;
    } else {
        oauth_status_ = OAuthStatus::Failed;
        error_ = "OAuth authentication failed";
    }
}

void InitWizard::apply(ConfigStore& store) const {
    const auto& option = selected_provider();

    ProviderEntry provider;
    provider.type = option.type;
    if (option.uses_oauth()) {
        provider.auth_type = "oauth";
    } else {
        provider.api_key = trim(api_key_.value());
        if (option.base_url) provider.base_url = option.base_url;
    }
    store.upsert_provider(option.key, std::move(provider));

    ModelEntry model;
    model.provider = option.key;
    model.model = selected_model().value_or(option.default_models.front().second);
    std::string alias = model_alias();
    store.upsert_model(alias, std::move(model));
    store.set_default_model(alias);
}

} // namespace karltui
