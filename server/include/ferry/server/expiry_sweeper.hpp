#pragma once

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>

#include "ferry/server/upload_registry.hpp"

namespace ferry::server
{

    // Periodically removes upload sessions idle for longer than the timeout.
    class ExpirySweeper
    {
    public:
        ExpirySweeper(asio::io_context &io_context, UploadRegistry &registry,
                      std::chrono::steady_clock::duration interval, std::chrono::seconds timeout);
        ~ExpirySweeper();

        ExpirySweeper(const ExpirySweeper &) = delete;
        ExpirySweeper &operator=(const ExpirySweeper &) = delete;

        void start();

        // Waits for a sweep already in progress. No sweep starts after stop() returns.
        void stop();

        bool running() const noexcept { return running_.load(); }

        // Sweeps on the calling thread, independent of the timer.
        std::size_t run_once();

    private:
        // Caller holds timer_mutex_.
        void arm_timer_locked();
        void on_timer(const std::error_code &ec);

        UploadRegistry &registry_;
        std::chrono::steady_clock::duration interval_;
        std::chrono::seconds timeout_;

        // Guards the timer and running_ transitions, and is held for a whole sweep.
        std::mutex timer_mutex_;
        asio::steady_timer timer_;
        std::atomic<bool> running_{false};
    };

} // namespace ferry::server
