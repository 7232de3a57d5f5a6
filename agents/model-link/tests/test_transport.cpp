#include "../include/inventory_reporter.hpp"
#include "../include/job_dispatcher.hpp"
#include "../include/job_queue.hpp"
#include "../include/transport.hpp"
#include "test_helpers.hpp"
#include <doctest/doctest.h>

using namespace std::chrono_literals;

TEST_SUITE("transport") {
TEST_CASE("falls back to requests while no channel is open") {
    ChannelSlot slot;
    RecordingFallback fallback;
    Transport transport(slot, fallback);

    CHECK(transport.send(make_progress(ProgressUpdate{1, 0, JobState::Downloading, ""})));
    CHECK_FALSE(transport.send(make_poll()));
    CHECK(fallback.attempted().size() == 2);
    CHECK(fallback.delivered().size() == 1);

    auto ch = std::make_shared<FakeChannel>();
    slot.replace(ch);
    CHECK(transport.send(make_poll()));
    CHECK(transport.send(make_progress(ProgressUpdate{1, 50, std::nullopt, ""})));
    CHECK(ch->sent().size() == 2);
    CHECK(fallback.attempted().size() == 2);

    ch->remote_close(CloseInfo{1006, ""});
    CHECK(transport.send(make_inventory({"a"})));
    CHECK(fallback.delivered().size() == 2);
    CHECK(ch->sent().size() == 2);
}

TEST_CASE("slot clears only the channel it still holds") {
    ChannelSlot slot;
    auto first = std::make_shared<FakeChannel>();
    auto second = std::make_shared<FakeChannel>();
    slot.replace(first);
    slot.replace(second);
    slot.clear_if(first);
    CHECK(slot.current() == second);
    CHECK(slot.take() == second);
    CHECK(slot.current() == nullptr);
    CHECK_FALSE(slot.send("x"));
}
}

TEST_SUITE("inventory_reporter") {
TEST_CASE("same hash set is pushed once") {
    ChannelSlot slot;
    RecordingFallback fallback;
    Transport transport(slot, fallback);
    InventoryReporter reporter(transport);

    CHECK(reporter.push({"aa", "bb"}));
    CHECK_FALSE(reporter.push({"aa", "bb"}));
    CHECK_FALSE(reporter.push({"BB", "aa", "aa"}));
    CHECK(fallback.delivered().size() == 1);

    CHECK(reporter.push({"aa"}));
    CHECK(fallback.delivered().size() == 2);
    json last = json::parse(fallback.delivered().back());
    CHECK(last["hashes"] == json::array({"aa"}));
}

TEST_CASE("failed delivery is retried on the next push") {
    ChannelSlot slot;
    RecordingFallback fallback;
    fallback.accept = false;
    Transport transport(slot, fallback);
    InventoryReporter reporter(transport);

    CHECK_FALSE(reporter.push({"aa"}));
    fallback.accept = true;
    CHECK(reporter.push({"aa"}));
    CHECK_FALSE(reporter.push({"aa"}));
    CHECK(fallback.delivered().size() == 1);
}
}

TEST_SUITE("job_queue") {
TEST_CASE("jobs come out in arrival order") {
    JobQueue q;
    q.push(Job{1, "models/lora", "u", "", std::nullopt});
    q.push(Job{2, "models/lora", "u", "", std::nullopt});
    CHECK(q.size() == 2);
    CHECK(q.pop_for(10ms)->id == 1);
    CHECK(q.pop_for(10ms)->id == 2);
    CHECK_FALSE(q.pop_for(10ms));
}

TEST_CASE("released waiters return promptly") {
    JobQueue q;
    auto start = std::chrono::steady_clock::now();
    std::thread t([&] {
        std::this_thread::sleep_for(50ms);
        q.release_waiters();
    });
    CHECK_FALSE(q.pop_for(5s));
    t.join();
    CHECK(std::chrono::steady_clock::now() - start < 2s);
}

TEST_CASE("gate wait ends on open or cancellation") {
    RunGate gate;
    CancellationSignal stop;
    CHECK_FALSE(gate.is_open());
    std::thread t([&] {
        std::this_thread::sleep_for(50ms);
        gate.open();
    });
    gate.wait(stop);
    t.join();
    CHECK(gate.is_open());

    gate.close();
    std::thread c([&] {
        std::this_thread::sleep_for(50ms);
        stop.cancel();
    });
    gate.wait(stop);
    c.join();
    CHECK_FALSE(gate.is_open());
    CHECK(stop.wait_for(1s));
}
}

TEST_SUITE("job_dispatcher") {
TEST_CASE("idle window produces a poll, a queued job is handled") {
    JobQueue queue;
    RunGate gate;
    gate.open();
    CancellationSignal stop;
    std::vector<int> handled;
    int polls = 0;
    JobDispatcher d(queue, gate, [&](const Job& j) { handled.push_back(j.id); }, [&] { ++polls; }, 50ms);

    CHECK_FALSE(d.run_once(stop));
    CHECK(polls == 1);

    queue.push(Job{9, "models/lora", "u", "", std::nullopt});
    queue.push(Job{10, "models/lora", "u", "", std::nullopt});
    CHECK(d.run_once(stop));
    CHECK(handled == std::vector<int>{9});
    CHECK(d.run_once(stop));
    CHECK(handled == std::vector<int>{9, 10});
    CHECK(polls == 1);
}

TEST_CASE("a closed gate holds jobs until opened") {
    JobQueue queue;
    RunGate gate;
    CancellationSignal stop;
    std::atomic<int> handled{0};
    JobDispatcher d(queue, gate, [&](const Job&) { ++handled; }, [] {}, 50ms);
    queue.push(Job{1, "models/lora", "u", "", std::nullopt});

    std::thread loop([&] { d.run(stop); });
    std::this_thread::sleep_for(300ms);
    CHECK(handled.load() == 0);
    CHECK(queue.size() == 1);

    gate.open();
    CHECK(eventually([&] { return handled == 1; }));

    stop.cancel();
    queue.release_waiters();
    loop.join();
}
}
