#pragma once
#include "config.hpp"
#include <string>

namespace karltui {

// Owns the effective configuration for the process lifetime. Every mutation
// goes through here so the dirty flag stays truthful.
class ConfigStore {
public:
    ConfigStore() = default;
    ConfigStore(Config config, std::string source_path);

    static ConfigStore load(const ConfigPaths& paths);

    const Config& config() const { return config_; }
    const std::string& source_path() const { return source_path_; }
    bool dirty() const { return dirty_; }

    // Insert or replace. When original_key names a different existing entry
    // it is removed first (rename).
    void upsert_model(const std::string& alias, ModelEntry entry,
                      const std::string& original_key = "");
    bool remove_model(const std::string& alias);
    void set_default_model(const std::string& alias);

    void upsert_provider(const std::string& name, ProviderEntry entry);

    void upsert_stack(const std::string& name, StackEntry entry,
                      const std::string& original_key = "");
    bool remove_stack(const std::string& name);

    void set_tool_enabled(const std::string& name, bool enabled);
    bool add_custom_tool(const std::string& path);
    bool remove_custom_tool(const std::string& path);

    // Throws std::runtime_error; the dirty flag is cleared only on success.
    void save();

private:
    Config config_;
    std::string source_path_;
    bool dirty_ = false;
};

} // namespace karltui
