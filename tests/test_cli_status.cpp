#include <catch2/catch.hpp>
#include "cli_status.hpp"
#include "temp_dir.hpp"
#include <chrono>
#include <sys/stat.h>
#include <thread>

using namespace karltui;

static const char* kInfoJson = R"({
  "version": "1.4.0",
  "config": {
    "global_path": "/home/u/.config/karl/karl.json",
    "project_path": "/work/.karl.json",
    "global_exists": true,
    "project_exists": false
  },
  "auth": {
    "anthropic": {"authenticated": true, "method": "oauth", "expires_at": "2026-01-01T00:00:00Z"},
    "openrouter": {"authenticated": false, "method": "api_key", "expires_at": null}
  },
  "models": {"default": "fast", "configured": ["fast", "smart"]},
  "providers": {
    "anthropic": {"type": "anthropic", "has_key": false},
    "openrouter": {"type": "openai", "has_key": true}
  },
  "counts": {"skills": 2, "stacks": 3, "hooks": 1, "models": 2}
})";

// Shell script standing in for the karl binary.
static std::string write_fake_cli(const TempDir& tmp, const std::string& info_branch) {
    auto path = tmp.write("karl", "#!/bin/sh\n"
                                  "case \"$1\" in\n"
                                  "  --version) echo \"karl 1.4.0\"; exit 0 ;;\n"
                                  "  info) " + info_branch + " ;;\n"
                                  "esac\n"
                                  "exit 1\n");
    chmod(path.c_str(), 0755);
    return path;
}

// ── CliInfo ──────────────────────────────────────────────────────

TEST_CASE("CliInfo: parses the info document", "[cli_status]") {
    auto info = CliInfo::from_json(nlohmann::json::parse(kInfoJson));
    REQUIRE(info.version == "1.4.0");
    REQUIRE(info.config.global_exists);
    REQUIRE_FALSE(info.config.project_exists);
    REQUIRE(info.auth.at("anthropic").authenticated);
    REQUIRE(info.auth.at("anthropic").expires_at.value() == "2026-01-01T00:00:00Z");
    REQUIRE_FALSE(info.auth.at("openrouter").expires_at.has_value());
    REQUIRE(info.models.default_model == "fast");
    REQUIRE(info.models.configured.size() == 2);
    REQUIRE(info.providers.at("openrouter").has_key);
    REQUIRE(info.counts.stacks == 3);
}

TEST_CASE("CliInfo: missing key throws", "[cli_status]") {
    auto j = nlohmann::json::parse(kInfoJson);
    j.erase("counts");
    REQUIRE_THROWS(CliInfo::from_json(j));
}

// ── CliStatus ────────────────────────────────────────────────────

TEST_CASE("CliStatus: factories set state", "[cli_status]") {
    REQUIRE(CliStatus::loading().state() == CliStatus::State::Loading);
    REQUIRE(CliStatus::not_available().info() == nullptr);

    auto err = CliStatus::error("boom");
    REQUIRE(err.state() == CliStatus::State::Error);
    REQUIRE(err.message() == "boom");

    auto loaded = CliStatus::loaded(CliInfo::from_json(nlohmann::json::parse(kInfoJson)));
    REQUIRE(loaded.state() == CliStatus::State::Loaded);
    REQUIRE(loaded.info()->version == "1.4.0");
}

// ── fetch_cli_status ─────────────────────────────────────────────

TEST_CASE("fetch_cli_status: missing program is not available", "[cli_status]") {
    auto status = fetch_cli_status("karl-tui-test-no-such-program");
    REQUIRE(status.state() == CliStatus::State::NotAvailable);
}

TEST_CASE("fetch_cli_status: loads info from the program", "[cli_status]") {
    TempDir tmp;
    tmp.write("info.json", kInfoJson);
    auto program = write_fake_cli(tmp, "cat '" + tmp.file("info.json") + "'; exit 0");

    auto status = fetch_cli_status(program);
    REQUIRE(status.state() == CliStatus::State::Loaded);
    REQUIRE(status.info()->counts.skills == 2);
}

TEST_CASE("fetch_cli_status: failing info reports stderr", "[cli_status]") {
    TempDir tmp;
    auto program = write_fake_cli(tmp, "echo 'not logged in' >&2; exit 2");

    auto status = fetch_cli_status(program);
    REQUIRE(status.state() == CliStatus::State::Error);
    REQUIRE(status.message() == program + " info failed: not logged in");
}

TEST_CASE("fetch_cli_status: unparsable output is an error", "[cli_status]") {
    TempDir tmp;
    auto program = write_fake_cli(tmp, "echo 'not json'; exit 0");

    auto status = fetch_cli_status(program);
    REQUIRE(status.state() == CliStatus::State::Error);
    REQUIRE(status.message().find("Failed to parse") == 0);
}

// ── fetch_cli_status_async ───────────────────────────────────────

static std::optional<CliStatus> wait_for(Mailbox<CliStatus>& mailbox) {
    for (int i = 0; i < 200; ++i) {
        if (auto status = mailbox.take()) return status;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return std::nullopt;
}

TEST_CASE("fetch_cli_status_async: result arrives in the mailbox", "[cli_status]") {
    auto mailbox = fetch_cli_status_async([] { return CliStatus::error("offline"); });
    auto status = wait_for(*mailbox);
    REQUIRE(status.has_value());
    REQUIRE(status->message() == "offline");
    REQUIRE_FALSE(mailbox->take().has_value());
}

TEST_CASE("fetch_cli_status_async: throwing fetcher posts an error", "[cli_status]") {
    auto mailbox = fetch_cli_status_async([]() -> CliStatus {
        throw std::runtime_error("fetch exploded");
    });
    auto status = wait_for(*mailbox);
    REQUIRE(status.has_value());
    REQUIRE(status->state() == CliStatus::State::Error);
    REQUIRE(status->message() == "fetch exploded");
}
