#pragma once
#include "mailbox.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace karltui {

constexpr const char* kCliProgram = "karl";

struct CliAuthStatus {
    bool authenticated = false;
    std::string method;
    std::optional<std::string> expires_at;
};

struct CliProviderStatus {
    std::string type;
    bool has_key = false;
};

// Document printed by `karl info --json`.
struct CliInfo {
    std::string version;

    struct {
        std::string global_path;
        std::string project_path;
        bool global_exists = false;
        bool project_exists = false;
    } config;

    std::map<std::string, CliAuthStatus> auth;

    struct {
        std::string default_model;
        std::vector<std::string> configured;
    } models;

    std::map<std::string, CliProviderStatus> providers;

    struct {
        uint32_t skills = 0;
        uint32_t stacks = 0;
        uint32_t hooks = 0;
        uint32_t models = 0;
    } counts;

    // Throws nlohmann::json::exception on missing keys or wrong types.
    static CliInfo from_json(const nlohmann::json& j);
};

class CliStatus {
public:
    enum class State { Loading, Loaded, Error, NotAvailable };

    static CliStatus loading() { return CliStatus(State::Loading); }
    static CliStatus loaded(CliInfo info);
    static CliStatus error(std::string message);
    static CliStatus not_available() { return CliStatus(State::NotAvailable); }

    State state() const { return state_; }
    // Non-null only when Loaded.
    const CliInfo* info() const { return info_ ? &*info_ : nullptr; }
    const std::string& message() const { return message_; }

private:
    explicit CliStatus(State state) : state_(state) {}

    State state_;
    std::optional<CliInfo> info_;
    std::string message_;
};

using CliFetcher = std::function<CliStatus()>;

// `karl --version` exits 0.
bool check_cli_available(const std::string& program = kCliProgram);

// Blocking: availability check, then `karl info --json`.
CliStatus fetch_cli_status(const std::string& program = kCliProgram);

// Run fetcher on a detached thread; the result arrives in the mailbox.
std::shared_ptr<Mailbox<CliStatus>> fetch_cli_status_async(CliFetcher fetcher);

// `karl --login` with the terminal handed over. Returns true on success.
bool run_cli_login(const std::string& program = kCliProgram);

} // namespace karltui
