#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

#include "fsmkit/core/event_queue.hpp"
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace fsmkit;
using namespace std::chrono_literals;

TEST_CASE("EventQueue: Items come out in push order") {
    core::EventQueue<int> queue;
    for (int i = 0; i < 5; ++i) {
        CHECK(queue.push(i));
    }
    CHECK(queue.size() == 5);

    for (int i = 0; i < 5; ++i) {
        auto item = queue.pop();
        REQUIRE(item.has_value());
        CHECK(*item == i);
    }
    CHECK(queue.size() == 0);
}

TEST_CASE("EventQueue: Timed pop gives up when idle") {
    core::EventQueue<int> queue;
    auto begin = std::chrono::steady_clock::now();
    CHECK_FALSE(queue.popFor(10ms).has_value());
    CHECK(std::chrono::steady_clock::now() - begin >= 10ms);

    queue.push(3);
    CHECK(queue.popFor(10ms) == 3);
}

TEST_CASE("EventQueue: Blocking pop wakes on push") {
    core::EventQueue<std::string> queue;
    std::thread producer([&] {
        std::this_thread::sleep_for(10ms);
        queue.push("wake");
    });

    auto item = queue.pop();
    producer.join();
    REQUIRE(item.has_value());
    CHECK(*item == "wake");
}

TEST_CASE("EventQueue: Sealing") {
    core::EventQueue<int> queue;
    queue.push(1);
    queue.push(2);

    SUBCASE("Keeps pending items ahead of the last one") {
        CHECK(queue.seal(99, false) == 0);
        CHECK(queue.sealed());
        CHECK_FALSE(queue.push(3));
        CHECK(queue.pop() == 1);
        CHECK(queue.pop() == 2);
        CHECK(queue.pop() == 99);
        CHECK_FALSE(queue.pop().has_value());
    }

    SUBCASE("Discards pending items") {
        CHECK(queue.seal(99, true) == 2);
        CHECK(queue.pop() == 99);
        CHECK_FALSE(queue.pop().has_value());
        CHECK_FALSE(queue.popFor(1ms).has_value());
    }

    SUBCASE("Discards only the selected items") {
        queue.push(3);
        queue.push(4);
        CHECK(queue.seal(99, [](int item) { return item % 2 == 0; }) == 2);
        CHECK(queue.pop() == 1);
        CHECK(queue.pop() == 3);
        CHECK(queue.pop() == 99);
        CHECK_FALSE(queue.pop().has_value());
    }

    SUBCASE("Sealing twice is a no-op") {
        queue.seal(99, false);
        CHECK(queue.seal(100, true) == 0);
        CHECK(queue.size() == 3);
    }
}

TEST_CASE("EventQueue: Multiple producers, one consumer") {
    constexpr int kProducers = 4;
    constexpr int kItems = 250;
    core::EventQueue<int> queue;

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&queue] {
            for (int i = 0; i < kItems; ++i) {
                queue.push(1);
            }
        });
    }

    int total = 0;
    for (int received = 0; received < kProducers * kItems; ++received) {
        auto item = queue.pop();
        REQUIRE(item.has_value());
        total += *item;
    }
    for (auto &t : producers) {
        t.join();
    }
    CHECK(total == kProducers * kItems);
}
