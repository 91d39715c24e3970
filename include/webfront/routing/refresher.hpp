#pragma once
/**
 * @file refresher.hpp
 * @brief Background poll loop with a stop signal.
 * @details Sleeps for the interval, runs the poll function, repeats. stop()
 *          interrupts a sleep immediately and joins the thread. The poll
 *          function runs without any lock held by the refresher.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>

namespace webfront::routing {

class Refresher final {
public:
    using PollFn = std::function<void()>;

    /// Start polling. `poll` must not throw.
    Refresher(std::chrono::milliseconds interval, PollFn poll);
    ~Refresher();

    Refresher(const Refresher&) = delete;
    Refresher& operator=(const Refresher&) = delete;

    /// Request stop and join. Idempotent.
    void stop();

    [[nodiscard]] bool running() const noexcept { return thread_.joinable(); }
    [[nodiscard]] std::chrono::milliseconds interval() const noexcept { return interval_; }

    /// Number of completed poll calls.
    [[nodiscard]] std::uint64_t ticks() const noexcept { return ticks_.load(std::memory_order_relaxed); }

private:
    void run(std::stop_token st);

    std::chrono::milliseconds   interval_;
    PollFn                      poll_;
    std::mutex                  mu_;
    std::condition_variable_any cv_;
    std::atomic<std::uint64_t>  ticks_{0};
    std::jthread                thread_;   // last: started after the state above exists
};

} // namespace webfront::routing
