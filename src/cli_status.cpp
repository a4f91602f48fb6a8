#include "cli_status.hpp"
#include "subprocess.hpp"
#include "util.hpp"
#include <thread>

namespace karltui {

CliInfo CliInfo::from_json(const nlohmann::json& j) {
    CliInfo info;
    info.version = j.at("version").get<std::string>();

    const auto& cfg = j.at("config");
    info.config.global_path = cfg.at("global_path").get<std::string>();
    info.config.project_path = cfg.at("project_path").get<std::string>();
    info.config.global_exists = cfg.at("global_exists").get<bool>();
    info.config.project_exists = cfg.at("project_exists").get<bool>();

    for (const auto& [name, a] : j.at("auth").items()) {
        CliAuthStatus status;
        status.authenticated = a.at("authenticated").get<bool>();
        status.method = a.at("method").get<std::string>();
        if (a.contains("expires_at") && !a["expires_at"].is_null()) {
            status.expires_at = a["expires_at"].get<std::string>();
        }
        info.auth[name] = std::move(status);
    }

    const auto& models = j.at("models");
    info.models.default_model = models.at("default").get<std::string>();
    info.models.configured = models.at("configured").get<std::vector<std::string>>();

    for (const auto& [name, p] : j.at("providers").items()) {
        CliProviderStatus status;
        status.type = p.at("type").get<std::string>();
        status.has_key = p.at("has_key").get<bool>();
        info.providers[name] = std::move(status);
    }

    const auto& counts = j.at("counts");
    info.counts.skills = counts.at("skills").get<uint32_t>();
    info.counts.stacks = counts.at("stacks").get<uint32_t>();
    info.counts.hooks = counts.at("hooks").get<uint32_t>();
    info.counts.models = counts.at("models").get<uint32_t>();
    return info;
}

CliStatus CliStatus::loaded(CliInfo info) {
    CliStatus status(State::Loaded);
    status.info_ = std::move(info);
    return status;
}

CliStatus CliStatus::error(std::string message) {
    CliStatus status(State::Error);
    status.message_ = std::move(message);
    return status;
}

bool check_cli_available(const std::string& program) {
    return run_capture({program, "--version"}).success();
}

CliStatus fetch_cli_status(const std::string& program) {
    if (!check_cli_available(program)) return CliStatus::not_available();

    auto result = run_capture({program, "info", "--json"});
    if (!result.spawned) {
        return CliStatus::error("Failed to run " + program + " info");
    }
    if (!result.success()) {
        return CliStatus::error(program + " info failed: " + trim(result.err));
    }
    try {
        return CliStatus::loaded(CliInfo::from_json(nlohmann::json::parse(result.out)));
    } catch (const std::exception& e) {
        return CliStatus::error(std::string("Failed to parse ") + program +
                                " info output: " + e.what());
    }
}

std::shared_ptr<Mailbox<CliStatus>> fetch_cli_status_async(CliFetcher fetcher) {
    auto mailbox = std::make_shared<Mailbox<CliStatus>>();
    std::thread([mailbox, fetcher = std::move(fetcher)]() {
        try {
            mailbox->post(fetcher());
        } catch (const std::exception& e) {
            mailbox->post(CliStatus::error(e.what()));
        }
    }).detach();
    return mailbox;
}

bool run_cli_login(const std::string& program) {
    return run_interactive({program, "--login"});
}

} // namespace karltui
