#include <catch2/catch.hpp>

#include "../include/thread_pool.hpp"
#include <atomic>
#include <chrono>

TEST_CASE("Thread pool runs tasks and returns results") {
    ThreadPool pool(3);
    REQUIRE(pool.size() == 3);

    std::vector<std::future<int>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(pool.enqueue([i](const std::stop_token&) { return i * i; }));
    }
    int sum = 0;
    for (auto& f : futures) sum += f.get();
    REQUIRE(sum == 2470);
}

TEST_CASE("Stopped pool refuses new work") {
    ThreadPool pool(1);
    std::atomic<bool> release{false};
    auto running = pool.enqueue([&release](const std::stop_token&) {
        while (!release.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        return 1;
    });
    auto queued = pool.enqueue([](const std::stop_token&) { return 2; });

    // wait until the first task occupies the only worker
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    pool.request_stop();
    release.store(true);

    REQUIRE(running.get() == 1);
    REQUIRE_THROWS_AS(queued.get(), std::future_error);
    REQUIRE_THROWS_AS(pool.enqueue([](const std::stop_token&) { return 3; }), std::runtime_error);
}
