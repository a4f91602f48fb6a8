#include <catch2/catch.hpp>
#include "subprocess.hpp"

using namespace karltui;

TEST_CASE("run_capture: captures stdout and exit code", "[subprocess]") {
    auto r = run_capture({"sh", "-c", "echo hello; exit 3"});
    REQUIRE(r.spawned);
    REQUIRE(r.exit_code == 3);
    REQUIRE(r.out == "hello\n");
    REQUIRE_FALSE(r.success());
}

TEST_CASE("run_capture: stderr is kept separate", "[subprocess]") {
    auto r = run_capture({"sh", "-c", "echo out; echo err >&2"});
    REQUIRE(r.success());
    REQUIRE(r.out == "out\n");
    REQUIRE(r.err == "err\n");
}

TEST_CASE("run_capture: stdin is closed", "[subprocess]") {
    auto r = run_capture({"sh", "-c", "cat; echo done"});
    REQUIRE(r.success());
    REQUIRE(r.out == "done\n");
}

TEST_CASE("run_capture: missing program fails", "[subprocess]") {
    auto r = run_capture({"karl-tui-test-no-such-program"});
    REQUIRE_FALSE(r.success());
}

TEST_CASE("run_capture: empty argv is not spawned", "[subprocess]") {
    auto r = run_capture({});
    REQUIRE_FALSE(r.spawned);
}

TEST_CASE("run_interactive: reports exit status", "[subprocess]") {
    REQUIRE(run_interactive({"true"}));
    REQUIRE_FALSE(run_interactive({"false"}));
}
