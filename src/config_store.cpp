#include "config_store.hpp"

#include <algorithm>

namespace karltui {

ConfigStore::ConfigStore(Config config, std::string source_path)
    : config_(std::move(config)), source_path_(std::move(source_path)) {}

ConfigStore ConfigStore::load(const ConfigPaths& paths) {
    auto merged = load_merged(paths);
    return ConfigStore(std::move(merged.config), std::move(merged.source_path));
}

void ConfigStore::upsert_model(const std::string& alias, ModelEntry entry,
                               const std::string& original_key) {
    if (!original_key.empty() && original_key != alias) {
        config_.models.erase(original_key);
    }
    config_.models[alias] = std::move(entry);
    dirty_ = true;
}

bool ConfigStore::remove_model(const std::string& alias) {
    if (config_.models.erase(alias) == 0) return false;
    dirty_ = true;
    return true;
}

void ConfigStore::set_default_model(const std::string& alias) {
    config_.default_model = alias;
    dirty_ = true;
}

void ConfigStore::upsert_provider(const std::string& name, ProviderEntry entry) {
    config_.providers[name] = std::move(entry);
    dirty_ = true;
}

void ConfigStore::upsert_stack(const std::string& name, StackEntry entry,
                               const std::string& original_key) {
    if (!original_key.empty() && original_key != name) {
        config_.stacks.erase(original_key);
    }
    config_.stacks[name] = std::move(entry);
    dirty_ = true;
}

bool ConfigStore::remove_stack(const std::string& name) {
    if (config_.stacks.erase(name) == 0) return false;
    dirty_ = true;
    return true;
}

void ConfigStore::set_tool_enabled(const std::string& name, bool enabled) {
    auto& list = config_.tools.enabled;
    auto it = std::find(list.begin(), list.end(), name);
    if (enabled && it == list.end()) {
        list.push_back(name);
    } else if (!enabled && it != list.end()) {
        list.erase(std::remove(list.begin(), list.end(), name), list.end());
    } else {
        return;
    }
    dirty_ = true;
}

bool ConfigStore::add_custom_tool(const std::string& path) {
    auto& list = config_.tools.custom;
    if (std::find(list.begin(), list.end(), path) != list.end()) return false;
    list.push_back(path);
    dirty_ = true;
    return true;
}

bool ConfigStore::remove_custom_tool(const std::string& path) {
    auto& list = config_.tools.custom;
    auto it = std::remove(list.begin(), list.end(), path);
    if (it == list.end()) return false;
    list.erase(it, list.end());
    dirty_ = true;
    return true;
}

void ConfigStore::save() {
    save_config(config_, source_path_);
    dirty_ = false;
}

} // namespace karltui
