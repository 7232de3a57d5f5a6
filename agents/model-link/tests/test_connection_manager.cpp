#include "../include/connection_manager.hpp"
#include "test_helpers.hpp"
#include <doctest/doctest.h>

using namespace std::chrono_literals;

namespace {
const char* kKey = "lk_0123456789abcdefABCDEF_-01234567";

struct LinkHarness {
    ChannelSlot slot;
    FakeConnector connector;
    std::mutex mtx;
    LinkCredentials creds{"https://example.test/api/link", kKey, ""};
    std::vector<std::string> received;
    int opens{0};
    ConnectionManager manager{slot, connector, [this] {
                                  std::lock_guard<std::mutex> lock(mtx);
                                  return creds;
                              }};
    CancellationSignal stop;
    std::thread loop;

    LinkHarness() {
        manager.set_message_handler([this](const std::string& text) {
            std::lock_guard<std::mutex> lock(mtx);
            received.push_back(text);
        });
        manager.set_open_handler([this] {
            slot.send("hello");
            std::lock_guard<std::mutex> lock(mtx);
            ++opens;
        });
    }

    void start() {
        loop = std::thread([this] { manager.run(stop); });
    }

    ~LinkHarness() {
        stop.cancel();
        manager.close(100ms);
        if (loop.joinable()) loop.join();
    }

    int open_count() {
        std::lock_guard<std::mutex> lock(mtx);
        return opens;
    }

    std::size_t received_count() {
        std::lock_guard<std::mutex> lock(mtx);
        return received.size();
    }
};
}

TEST_SUITE("connection_manager") {
TEST_CASE("opens the link, runs the open hook and delivers messages") {
    LinkHarness h;
    auto ch = std::make_shared<FakeChannel>();
    h.connector.script(ch);
    h.start();

    REQUIRE(eventually([&] { return h.open_count() == 1; }));
    CHECK(h.manager.state().phase == LinkPhase::Open);
    CHECK(h.slot.current() == ch);
    CHECK(ch->sent() == std::vector<std::string>{"hello"});

    ch->push_inbound(R"({"type":"control","command":"noop"})");
    REQUIRE(eventually([&] { return h.received_count() == 1; }));

    auto req = h.connector.requests().at(0);
    CHECK(req.url == "wss://example.test/api/link/ws?mode=worker");
    CHECK(req.headers == HttpHeaders{{"x-link-key", kKey}});
    CHECK(req.subprotocols == std::vector<std::string>{build_subprotocol("link-key", kKey)});
}

TEST_CASE("no credentials means no connect attempts") {
    LinkHarness h;
    h.creds.link_key.clear();
    h.start();
    std::this_thread::sleep_for(300ms);
    CHECK(h.connector.attempts() == 0);
}

TEST_CASE("unauthorized close suspends reconnects") {
    LinkHarness h;
    auto ch = std::make_shared<FakeChannel>();
    h.connector.script(ch);
    h.start();
    REQUIRE(eventually([&] { return h.open_count() == 1; }));

    ch->remote_close(CloseInfo{kUnauthorizedCloseCode, "invalid key"});
    REQUIRE(eventually([&] { return h.manager.state().phase == LinkPhase::Suspended; }));
    CHECK(h.slot.current() == nullptr);

    std::this_thread::sleep_for(1500ms);
    CHECK(h.connector.attempts() == 1);
    CHECK(h.manager.state().suspend_until - LinkClock::now() > 590s);
}

TEST_CASE("ordinary close reconnects after one second") {
    LinkHarness h;
    auto first = std::make_shared<FakeChannel>();
    auto second = std::make_shared<FakeChannel>();
    h.connector.script(first);
    h.connector.script(second);
    h.start();
    REQUIRE(eventually([&] { return h.open_count() == 1; }));

    first->remote_close(CloseInfo{std::nullopt, ""});
    REQUIRE(eventually([&] { return h.open_count() == 2; }));
    CHECK(h.connector.attempts() == 2);
    CHECK(h.slot.current() == second);
}

TEST_CASE("failed connects back off") {
    LinkHarness h;
    h.start();
    REQUIRE(eventually([&] { return h.connector.attempts() >= 1; }));
    std::this_thread::sleep_for(500ms);
    CHECK(h.connector.attempts() == 1);
    REQUIRE(eventually([&] { return h.connector.attempts() >= 2; }));
    CHECK(eventually([&] { return h.manager.state().phase == LinkPhase::Disconnected; }));
    CHECK(h.manager.state().reconnect_attempts >= 1);
}

TEST_CASE("credential rotation closes the current channel") {
    LinkHarness h;
    auto first = std::make_shared<FakeChannel>();
    auto second = std::make_shared<FakeChannel>();
    h.connector.script(first);
    h.connector.script(second);
    h.start();
    REQUIRE(eventually([&] { return h.open_count() == 1; }));

    {
        std::lock_guard<std::mutex> lock(h.mtx);
        h.creds.link_key.clear();
        h.creds.api_key = "legacy";
    }
    h.manager.request_reconnect();
    CHECK_FALSE(first->is_open());

    REQUIRE(eventually([&] { return h.open_count() == 2; }));
    CHECK_FALSE(h.manager.state().credentials_dirty);
    CHECK(h.connector.requests().at(1).headers == HttpHeaders{{"x-api-key", "legacy"}});
}
}
