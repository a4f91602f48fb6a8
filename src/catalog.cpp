#include "catalog.hpp"
#include <cstring>

namespace karltui {

bool ProviderOption::uses_oauth() const {
    return std::strcmp(auth_type, "oauth") == 0;
}

const std::vector<ProviderOption>& provider_options() {
    static const std::vector<ProviderOption> options = {
        {"claude-pro-max", "Claude Pro/Max", "oauth", "anthropic", nullptr,
         {{"haiku", "claude-haiku-4-5-20251001"},
          {"sonnet", "claude-sonnet-4-5-20250929"},
          {"opus", "claude-opus-4-5-20251101"}}},
        {"anthropic", "Anthropic API", "api_key", "anthropic", nullptr,
         {{"fast", "claude-sonnet-4-20250514"},
          {"smart", "claude-opus-4-20250514"},
          {"haiku", "claude-haiku-3-5-20241022"}}},
        {"openrouter", "OpenRouter", "api_key", "openai", "https://openrouter.ai/api/v1",
         {{"mistral-small", "mistralai/mistral-small-creative"},
          {"devstral", "mistralai/devstral-2512:free"},
          {"mimo", "xiaomi/mimo-v2-flash:free"},
          {"grok", "x-ai/grok-4.1-fast"}}},
    };
    return options;
}

const ProviderOption* find_provider_option(const std::string& key) {
    for (const auto& option : provider_options()) {
        if (key == option.key) return &option;
    }
    return nullptr;
}

namespace {

std::vector<std::string> model_ids(const ProviderOption& option) {
    std::vector<std::string> ids;
    ids.reserve(option.default_models.size());
    for (const auto& [alias, id] : option.default_models) {
        (void)alias;
        ids.emplace_back(id);
    }
    return ids;
}

} // namespace

std::vector<std::string> models_for_provider(const std::string& key) {
    const auto* option = find_provider_option(key);
    return option ? model_ids(*option) : std::vector<std::string>{};
}

std::vector<std::string> models_for_configured_provider(
    const std::map<std::string, ProviderEntry>& providers, const std::string& name) {
    if (const auto* option = find_provider_option(name)) return model_ids(*option);

    auto it = providers.find(name);
    if (it == providers.end() || it->second.type.empty()) return {};
    for (const auto& option : provider_options()) {
        if (it->second.type == option.type) return model_ids(option);
    }
    return {};
}

} // namespace karltui
