#include <catch2/catch.hpp>
#include "mailbox.hpp"
#include <string>
#include <thread>

using namespace karltui;

TEST_CASE("Mailbox: empty until posted", "[mailbox]") {
    Mailbox<std::string> box;
    REQUIRE_FALSE(box.take().has_value());
}

TEST_CASE("Mailbox: value is taken once", "[mailbox]") {
    Mailbox<std::string> box;
    box.post("ready");
    auto v = box.take();
    REQUIRE(v.has_value());
    REQUIRE(*v == "ready");
    REQUIRE_FALSE(box.take().has_value());
}

TEST_CASE("Mailbox: later post replaces an untaken value", "[mailbox]") {
    Mailbox<int> box;
    box.post(1);
    box.post(2);
    REQUIRE(box.take().value() == 2);
}

TEST_CASE("Mailbox: hand-off across threads", "[mailbox]") {
    Mailbox<int> box;
    std::thread worker([&box] { box.post(42); });
    worker.join();
    REQUIRE(box.take().value() == 42);
}
