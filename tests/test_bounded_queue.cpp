#include <catch2/catch_test_macros.hpp>

#include "voice_gateway/pipeline/bounded_queue.hpp"
#include "voice_gateway/pipeline/cancellation.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace voice_gateway::pipeline;

TEST_CASE("try_push evicts the oldest item when full") {
    BoundedQueue<int> queue(2);
    REQUIRE(queue.try_push(1) == PushResult::Accepted);
    REQUIRE(queue.try_push(2) == PushResult::Accepted);
    REQUIRE(queue.try_push(3) == PushResult::DroppedOldest);
    REQUIRE(queue.dropped() == 1);
    REQUIRE(queue.size() == 2);
    REQUIRE(*queue.try_pop() == 2);
    REQUIRE(*queue.try_pop() == 3);
    REQUIRE_FALSE(queue.try_pop().has_value());
}

TEST_CASE("consumers drain remaining items after close") {
    BoundedQueue<int> queue(4);
    queue.try_push(7);
    queue.close();
    REQUIRE(queue.try_push(8) == PushResult::Closed);
    REQUIRE_FALSE(queue.push(9));
    REQUIRE(*queue.pop() == 7);
    REQUIRE_FALSE(queue.pop().has_value());
}

TEST_CASE("push blocks until a consumer makes room") {
    BoundedQueue<int> queue(1);
    queue.push(1);
    std::thread producer([&queue]() { queue.push(2); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(queue.size() == 1);
    REQUIRE(*queue.pop() == 1);
    producer.join();
    REQUIRE(*queue.pop() == 2);
}

TEST_CASE("pop_for times out on an empty queue") {
    BoundedQueue<int> queue(1);
    const auto started = std::chrono::steady_clock::now();
    REQUIRE_FALSE(queue.pop_for(std::chrono::milliseconds(30)).has_value());
    REQUIRE(std::chrono::steady_clock::now() - started >= std::chrono::milliseconds(25));
}

TEST_CASE("clear empties the queue and wakes blocked producers") {
    BoundedQueue<int> queue(1);
    queue.push(1);
    std::thread producer([&queue]() { queue.push(2); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    REQUIRE(queue.clear() >= 1);
    producer.join();
    REQUIRE(queue.size() <= 1);
}

TEST_CASE("run_with_deadline returns the task result") {
    CancelToken token;
    const auto value = run_with_deadline<int>([](const CancelToken&) { return 42; },
                                              std::chrono::milliseconds(500), token, "answer");
    REQUIRE(value == 42);
}

TEST_CASE("run_with_deadline gives up on slow tasks") {
    CancelToken token;
    REQUIRE_THROWS_AS(run_with_deadline<int>(
                          [](const CancelToken&) {
                              std::this_thread::sleep_for(std::chrono::milliseconds(300));
                              return 1;
                          },
                          std::chrono::milliseconds(50), token, "slow"),
                      DeadlineExceeded);
}

TEST_CASE("run_with_deadline stops waiting when cancelled") {
    CancelToken token;
    token.cancel();
    REQUIRE_THROWS_AS(run_with_deadline<int>(
                          [](const CancelToken&) {
                              std::this_thread::sleep_for(std::chrono::milliseconds(300));
                              return 1;
                          },
                          std::chrono::seconds(5), token, "cancelled"),
                      OperationCancelled);
}

TEST_CASE("run_with_deadline propagates task exceptions") {
    CancelToken token;
    REQUIRE_THROWS_AS(run_with_deadline<int>(
                          [](const CancelToken&) -> int { throw std::runtime_error("boom"); },
                          std::chrono::seconds(1), token, "failing"),
                      std::runtime_error);
}

TEST_CASE("run_with_deadline cancels the abandoned task") {
    CancelToken token;
    auto done = std::make_shared<std::atomic<bool>>(false);
    REQUIRE_THROWS_AS(run_with_deadline<int>(
                          [done](const CancelToken& attempt) {
                              while (!attempt.cancelled()) {
                                  std::this_thread::sleep_for(std::chrono::milliseconds(5));
                              }
                              done->store(true);
                              return 1;
                          },
                          std::chrono::milliseconds(50), token, "abandoned"),
                      DeadlineExceeded);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!done->load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    REQUIRE(done->load());
}

TEST_CASE("throw_if_cancelled reports the operation") {
    CancelToken token;
    REQUIRE_NOTHROW(token.throw_if_cancelled("booking"));
    token.cancel();
    REQUIRE_THROWS_WITH(token.throw_if_cancelled("booking"), "booking cancelled");
}
