// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "util/blocking_queue.hpp"

#include <chrono>
#include <thread>

using namespace lanpeer::util;

TEST_CASE("BlockingQueue: bounded push", "[util][blocking_queue]") {
    BlockingQueue<int> queue(2);
    REQUIRE(queue.TryPush(1));
    REQUIRE(queue.TryPush(2));
    REQUIRE_FALSE(queue.TryPush(3));
    REQUIRE(queue.size() == 2);

    REQUIRE(queue.Pop() == 1);
    REQUIRE(queue.TryPush(3));
    REQUIRE(queue.TryPop() == 2);
    REQUIRE(queue.TryPop() == 3);
    REQUIRE_FALSE(queue.TryPop().has_value());
}

TEST_CASE("BlockingQueue: close drains then ends", "[util][blocking_queue]") {
    BlockingQueue<int> queue(4);
    REQUIRE(queue.TryPush(7));
    queue.Close();

    REQUIRE(queue.closed());
    REQUIRE_FALSE(queue.TryPush(8));
    REQUIRE(queue.Pop() == 7);
    REQUIRE_FALSE(queue.Pop().has_value());
}

TEST_CASE("BlockingQueue: close wakes a blocked consumer", "[util][blocking_queue]") {
    BlockingQueue<int> queue(4);
    std::optional<int> result{42};

    std::thread consumer([&]() { result = queue.Pop(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.Close();
    consumer.join();

    REQUIRE_FALSE(result.has_value());
}

TEST_CASE("BlockingQueue: producer hands off to consumer", "[util][blocking_queue]") {
    BlockingQueue<int> queue(1);
    int sum = 0;

    std::thread consumer([&]() {
        while (auto v = queue.Pop()) {
            sum += *v;
        }
    });

    for (int i = 1; i <= 10; ++i) {
        while (!queue.TryPush(i)) {
            std::this_thread::yield();
        }
    }
    queue.Close();
    consumer.join();

    REQUIRE(sum == 55);
}
