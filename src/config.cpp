#include "config.hpp"
#include "util.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>

namespace karltui {

namespace {

// Value for key, or nullptr when absent or null.
const nlohmann::json* find_value(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return nullptr;
    return &*it;
}

[[noreturn]] void type_error(const std::string& where, const char* key,
                             const char* expected) {
    throw ConfigError(where + "." + key + ": expected " + expected);
}

std::optional<std::string> opt_string(const nlohmann::json& obj, const char* key,
                                      const std::string& where) {
    const auto* v = find_value(obj, key);
    if (!v) return std::nullopt;
    if (!v->is_string()) type_error(where, key, "string");
    return v->get<std::string>();
}

std::string req_string(const nlohmann::json& obj, const char* key,
                       const std::string& where) {
    auto v = opt_string(obj, key, where);
    if (!v) throw ConfigError(where + "." + key + ": missing");
    return *v;
}

std::optional<uint64_t> opt_unsigned(const nlohmann::json& obj, const char* key,
                                     const std::string& where, uint64_t max) {
    const auto* v = find_value(obj, key);
    if (!v) return std::nullopt;
    if (!v->is_number_unsigned() && !(v->is_number_integer() && v->get<int64_t>() >= 0))
        type_error(where, key, "non-negative integer");
    auto n = v->get<uint64_t>();
    if (n > max) type_error(where, key, "smaller integer");
    return n;
}

std::optional<double> opt_real(const nlohmann::json& obj, const char* key,
                               const std::string& where) {
    const auto* v = find_value(obj, key);
    if (!v) return std::nullopt;
    if (!v->is_number()) type_error(where, key, "number");
    return v->get<double>();
}

std::optional<bool> opt_bool(const nlohmann::json& obj, const char* key,
                             const std::string& where) {
    const auto* v = find_value(obj, key);
    if (!v) return std::nullopt;
    if (!v->is_boolean()) type_error(where, key, "boolean");
    return v->get<bool>();
}

std::vector<std::string> string_list(const nlohmann::json& arr, const std::string& where) {
    if (!arr.is_array()) throw ConfigError(where + ": expected array");
    std::vector<std::string> out;
    for (const auto& v : arr) {
        if (!v.is_string()) throw ConfigError(where + ": expected array of strings");
        out.push_back(v.get<std::string>());
    }
    return out;
}

const nlohmann::json& require_object(const nlohmann::json& j, const std::string& where) {
    if (!j.is_object()) throw ConfigError(where + ": expected object");
    return j;
}

nlohmann::json collect_extra(const nlohmann::json& obj, const std::set<std::string>& known) {
    nlohmann::json extra = nlohmann::json::object();
    for (auto& [key, value] : obj.items()) {
        if (known.count(key) == 0) extra[key] = value;
    }
    return extra;
}

ModelEntry model_from_json(const nlohmann::json& j, const std::string& where) {
    require_object(j, where);
    ModelEntry m;
    m.provider = req_string(j, "provider", where);
    m.model = req_string(j, "model", where);
    m.extra = collect_extra(j, {"provider", "model"});
    return m;
}

nlohmann::json model_to_json(const ModelEntry& m) {
    nlohmann::json j = m.extra.is_object() ? m.extra : nlohmann::json::object();
    j["provider"] = m.provider;
    j["model"] = m.model;
    return j;
}

ProviderEntry provider_from_json(const nlohmann::json& j, const std::string& where) {
    require_object(j, where);
    ProviderEntry p;
    p.type = opt_string(j, "type", where).value_or("");
    p.base_url = opt_string(j, "baseUrl", where);
    p.api_key = opt_string(j, "apiKey", where);
    p.auth_type = opt_string(j, "authType", where);
    p.extra = collect_extra(j, {"type", "baseUrl", "apiKey", "authType"});
    return p;
}

nlohmann::json provider_to_json(const ProviderEntry& p) {
    nlohmann::json j = p.extra.is_object() ? p.extra : nlohmann::json::object();
    j["type"] = p.type;
    if (p.base_url) j["baseUrl"] = *p.base_url;
    if (p.api_key) j["apiKey"] = *p.api_key;
    if (p.auth_type) j["authType"] = *p.auth_type;
    return j;
}

template<typename Entry, typename Parse>
std::map<std::string, Entry> entry_map(const nlohmann::json& obj, const char* key,
                                       Parse parse) {
    std::map<std::string, Entry> out;
    const auto* v = find_value(obj, key);
    if (!v) return out;
    require_object(*v, key);
    for (auto& [name, value] : v->items()) {
        out.emplace(name, parse(value, std::string(key) + "." + name));
    }
    return out;
}

} // namespace

// ── StackEntry ───────────────────────────────────────────────────

StackEntry StackEntry::from_json(const nlohmann::json& j) {
    const std::string where = "stack";
    require_object(j, where);
    StackEntry s;
    s.name = opt_string(j, "name", where);
    s.extends = opt_string(j, "extends", where);
    s.model = opt_string(j, "model", where);
    s.temperature = opt_real(j, "temperature", where);
    s.timeout = opt_unsigned(j, "timeout", where, UINT64_MAX);
    if (auto mt = opt_unsigned(j, "maxTokens", where, UINT32_MAX))
        s.max_tokens = static_cast<uint32_t>(*mt);
    s.skill = opt_string(j, "skill", where);
    s.context = opt_string(j, "context", where);
    s.context_file = opt_string(j, "contextFile", where);
    s.unrestricted = opt_bool(j, "unrestricted", where);
    return s;
}

nlohmann::json StackEntry::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    if (name) j["name"] = *name;
    if (extends) j["extends"] = *extends;
    if (model) j["model"] = *model;
    if (temperature) j["temperature"] = *temperature;
    if (timeout) j["timeout"] = *timeout;
    if (max_tokens) j["maxTokens"] = *max_tokens;
    if (skill) j["skill"] = *skill;
    if (context) j["context"] = *context;
    if (context_file) j["contextFile"] = *context_file;
    if (unrestricted) j["unrestricted"] = *unrestricted;
    return j;
}

bool StackEntry::operator==(const StackEntry& o) const {
    return name == o.name && extends == o.extends && model == o.model &&
           temperature == o.temperature && timeout == o.timeout &&
           max_tokens == o.max_tokens && skill == o.skill && context == o.context &&
           context_file == o.context_file && unrestricted == o.unrestricted;
}

bool ModelEntry::operator==(const ModelEntry& o) const {
    return provider == o.provider && model == o.model && extra == o.extra;
}

bool ProviderEntry::operator==(const ProviderEntry& o) const {
    return type == o.type && base_url == o.base_url && api_key == o.api_key &&
           auth_type == o.auth_type && extra == o.extra;
}

bool ToolsConfig::operator==(const ToolsConfig& o) const {
    return enabled == o.enabled && custom == o.custom;
}

bool VolleyConfig::operator==(const VolleyConfig& o) const {
    return max_concurrent == o.max_concurrent && retry_attempts == o.retry_attempts &&
           retry_backoff == o.retry_backoff;
}

// ── Config ───────────────────────────────────────────────────────

Config Config::from_json(const nlohmann::json& j) {
    require_object(j, "config");
    Config cfg;

    if (auto v = opt_string(j, "defaultModel", "config"))
        cfg.default_model = *v;

    cfg.models = entry_map<ModelEntry>(j, "models", model_from_json);
    cfg.providers = entry_map<ProviderEntry>(j, "providers", provider_from_json);
    cfg.stacks = entry_map<StackEntry>(j, "stacks",
        [](const nlohmann::json& v, const std::string&) { return StackEntry::from_json(v); });

    if (const auto* t = find_value(j, "tools")) {
        require_object(*t, "tools");
        if (const auto* en = find_value(*t, "enabled"))
            cfg.tools.enabled = string_list(*en, "tools.enabled");
        if (const auto* cu = find_value(*t, "custom"))
            cfg.tools.custom = string_list(*cu, "tools.custom");
    }

    if (const auto* v = find_value(j, "volley")) {
        require_object(*v, "volley");
        if (auto n = opt_unsigned(*v, "maxConcurrent", "volley", UINT32_MAX))
            cfg.volley.max_concurrent = static_cast<uint32_t>(*n);
        if (auto n = opt_unsigned(*v, "retryAttempts", "volley", UINT32_MAX))
            cfg.volley.retry_attempts = static_cast<uint32_t>(*n);
        if (auto s = opt_string(*v, "retryBackoff", "volley"))
            cfg.volley.retry_backoff = *s;
    }

    cfg.extra = collect_extra(j, {"defaultModel", "models", "providers",
                                  "tools", "volley", "stacks"});
    return cfg;
}

nlohmann::json Config::to_json() const {
    nlohmann::json j = extra.is_object() ? extra : nlohmann::json::object();
    j["defaultModel"] = default_model;

    nlohmann::json m = nlohmann::json::object();
    for (const auto& [alias, entry] : models) m[alias] = model_to_json(entry);
    j["models"] = std::move(m);

    nlohmann::json p = nlohmann::json::object();
    for (const auto& [name, entry] : providers) p[name] = provider_to_json(entry);
    j["providers"] = std::move(p);

    j["tools"] = {{"enabled", tools.enabled}, {"custom", tools.custom}};
    j["volley"] = {
        {"maxConcurrent", volley.max_concurrent},
        {"retryAttempts", volley.retry_attempts},
        {"retryBackoff", volley.retry_backoff}
    };

    nlohmann::json s = nlohmann::json::object();
    for (const auto& [name, entry] : stacks) s[name] = entry.to_json();
    j["stacks"] = std::move(s);
    return j;
}

const ModelEntry* Config::default_model_entry() const {
    auto it = models.find(default_model);
    return it != models.end() ? &it->second : nullptr;
}

bool Config::operator==(const Config& o) const {
    return default_model == o.default_model && models == o.models &&
           providers == o.providers && tools == o.tools && volley == o.volley &&
           stacks == o.stacks && extra == o.extra;
}

// ── Layers ───────────────────────────────────────────────────────

ConfigPaths ConfigPaths::defaults() {
    return {expand_home("~/.config/karl/karl.json"), ".karl.json"};
}

std::optional<nlohmann::json> read_config_file(const std::string& path) {
    if (path.empty()) return std::nullopt;
    std::ifstream file(path);
    if (!file.is_open()) return std::nullopt;
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[config] Ignoring malformed config " << path << ": "
                  << e.what() << "\n";
        return std::nullopt;
    }
}

namespace {

std::optional<Config> parse_layer(const std::string& path, const nlohmann::json& j) {
    try {
        return Config::from_json(j);
    } catch (const ConfigError& e) {
        std::cerr << "[config] Ignoring invalid config " << path << ": "
                  << e.what() << "\n";
        return std::nullopt;
    }
}

} // namespace

MergedConfig load_merged(const ConfigPaths& paths) {
    MergedConfig merged;
    // Save target defaults to the global file even before it exists
    merged.source_path = paths.global.empty() ? paths.project : paths.global;

    if (auto raw = read_config_file(paths.global)) {
        if (auto global = parse_layer(paths.global, *raw)) {
            merged.config = std::move(*global);
            merged.source_path = paths.global;
        }
    }

    if (auto raw = read_config_file(paths.project)) {
        if (auto project = parse_layer(paths.project, *raw)) {
            for (auto& [k, v] : project->models) merged.config.models[k] = v;
            for (auto& [k, v] : project->providers) merged.config.providers[k] = v;
            for (auto& [k, v] : project->stacks) merged.config.stacks[k] = v;
            // Only an explicit, non-empty defaultModel overrides the global one
            auto it = raw->find("defaultModel");
            if (it != raw->end() && it->is_string() && !project->default_model.empty())
                merged.config.default_model = project->default_model;
            merged.source_path = paths.project;
        }
    }

    return merged;
}

void save_config(const Config& config, const std::string& path) {
    if (path.empty()) throw std::runtime_error("No config path to save to");

    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Failed to create config directory " +
                                     p.parent_path().string() + ": " + ec.message());
        }
    }

    std::string content;
    try {
        content = config.to_json().dump(2) + "\n";
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Failed to serialize config: ") + e.what());
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to write config to " + path + ": " +
                                 std::strerror(errno));
    }
    out << content;
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write config to " + path);
    }
}

} // namespace karltui
