#pragma once
#include <string>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <vector>
#include <nlohmann/json.hpp>

namespace karltui {

struct ModelEntry {
    std::string provider;
    std::string model;
    nlohmann::json extra = nlohmann::json::object(); // unknown keys, kept for round-trip

    bool operator==(const ModelEntry& o) const;
    bool operator!=(const ModelEntry& o) const { return !(*this == o); }
};

struct ProviderEntry {
    std::string type;                    // "anthropic", "openai", ...
    std::optional<std::string> base_url;
    std::optional<std::string> api_key;
    std::optional<std::string> auth_type; // "oauth" or "api_key"
    nlohmann::json extra = nlohmann::json::object();

    bool operator==(const ProviderEntry& o) const;
    bool operator!=(const ProviderEntry& o) const { return !(*this == o); }
};

struct ToolsConfig {
    std::vector<std::string> enabled = {"bash", "read", "write", "edit"};
    std::vector<std::string> custom;     // paths to custom tool executables

    bool operator==(const ToolsConfig& o) const;
};

struct VolleyConfig {
    uint32_t max_concurrent = 3;
    uint32_t retry_attempts = 3;
    std::string retry_backoff = "exponential";

    bool operator==(const VolleyConfig& o) const;
};

struct StackEntry {
    std::optional<std::string> name;     // display name
    std::optional<std::string> extends;  // parent stack
    std::optional<std::string> model;    // model alias override
    std::optional<double> temperature;
    std::optional<uint64_t> timeout;     // milliseconds
    std::optional<uint32_t> max_tokens;
    std::optional<std::string> skill;
    std::optional<std::string> context;
    std::optional<std::string> context_file;
    std::optional<bool> unrestricted;

    static StackEntry from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    bool operator==(const StackEntry& o) const;
    bool operator!=(const StackEntry& o) const { return !(*this == o); }
};

constexpr const char* kDefaultModelAlias = "fast";

struct Config {
    std::string default_model = kDefaultModelAlias;
    std::map<std::string, ModelEntry> models;
    std::map<std::string, ProviderEntry> providers;
    ToolsConfig tools;
    VolleyConfig volley;
    std::map<std::string, StackEntry> stacks;
    nlohmann::json extra = nlohmann::json::object();

    // Parse a config document. Missing keys take their defaults; a value of
    // the wrong type throws ConfigError.
    static Config from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    // Entry for default_model, or nullptr when the alias is not configured
    // (tolerated: the alias may come from a project overlay).
    const ModelEntry* default_model_entry() const;

    bool operator==(const Config& o) const;
    bool operator!=(const Config& o) const { return !(*this == o); }
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Locations of the two configuration layers.
struct ConfigPaths {
    std::string global;   // ~/.config/karl/karl.json
    std::string project;  // ./.karl.json

    static ConfigPaths defaults();
};

struct MergedConfig {
    Config config;
    std::string source_path; // layer that edits are saved back to
};

// Read and parse one layer. Returns nullopt if the file is missing,
// unreadable or malformed.
std::optional<nlohmann::json> read_config_file(const std::string& path);

// Global layer replaces the defaults, the project layer is merged on top.
MergedConfig load_merged(const ConfigPaths& paths);

// Write pretty-printed JSON, creating parent directories.
// Throws std::runtime_error on I/O failure.
void save_config(const Config& config, const std::string& path);

} // namespace karltui
