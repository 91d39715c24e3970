/**
 * @file refresher.cpp
 * @brief Poll thread body and shutdown.
 */
#include "webfront/routing/refresher.hpp"

#if defined(__linux__)
#include <pthread.h>
#endif

namespace webfront::routing {

Refresher::Refresher(std::chrono::milliseconds interval, PollFn poll)
    : interval_(interval), poll_(std::move(poll)),
      thread_([this](std::stop_token st) { run(std::move(st)); }) {}

Refresher::~Refresher() { stop(); }

void Refresher::stop() {
    if (!thread_.joinable()) return;
    // request_stop() fires the stop callback registered by wait_for(), which
    // wakes the sleeping thread.
    thread_.request_stop();
    thread_.join();
}

void Refresher::run(std::stop_token st) {
#if defined(__linux__)
    pthread_setname_np(pthread_self(), "wf-refresh");
#endif
    std::unique_lock<std::mutex> lk(mu_);
    while (!st.stop_requested()) {
        cv_.wait_for(lk, st, interval_, [] { return false; });
        if (st.stop_requested()) break;
        lk.unlock();
        poll_();
        ticks_.fetch_add(1, std::memory_order_relaxed);
        lk.lock();
    }
}

} // namespace webfront::routing
