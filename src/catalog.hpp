#pragma once
#include "config.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace karltui {

// A provider the setup wizard can configure, with its suggested models.
struct ProviderOption {
    const char* key;        // config key, e.g. "anthropic"
    const char* label;      // human-readable name
    const char* auth_type;  // "oauth" or "api_key"
    const char* type;       // ProviderEntry::type
    const char* base_url;   // nullptr when the provider has a fixed endpoint
    std::vector<std::pair<const char*, const char*>> default_models; // (alias, model id)

    bool uses_oauth() const;
};

// Built-in providers, in wizard order.
const std::vector<ProviderOption>& provider_options();

// Catalogue entry by key, nullptr if unknown.
const ProviderOption* find_provider_option(const std::string& key);

// Model ids suggested for a catalogue key; empty for unknown keys.
std::vector<std::string> models_for_provider(const std::string& key);

// Model ids for a configured provider: its own catalogue entry if the name
// is known, else the first entry with the same provider type.
std::vector<std::string> models_for_configured_provider(
    const std::map<std::string, ProviderEntry>& providers, const std::string& name);

} // namespace karltui
