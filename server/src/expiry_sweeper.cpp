#include "ferry/server/expiry_sweeper.hpp"

#include <asio/error.hpp>

#include <spdlog/spdlog.h>

namespace ferry::server
{

    ExpirySweeper::ExpirySweeper(asio::io_context &io_context, UploadRegistry &registry,
                                 std::chrono::steady_clock::duration interval, std::chrono::seconds timeout)
        : registry_(registry), interval_(interval), timeout_(timeout), timer_(io_context) {}

    ExpirySweeper::~ExpirySweeper()
    {
        stop();
    }

    void ExpirySweeper::start()
    {
        std::lock_guard lock(timer_mutex_);
        if (running_.exchange(true))
        {
            return;
        }
        spdlog::info("Expiry sweep every {} ms, session timeout {} s",
                     std::chrono::duration_cast<std::chrono::milliseconds>(interval_).count(), timeout_.count());
        arm_timer_locked();
    }

    void ExpirySweeper::stop()
    {
        std::lock_guard lock(timer_mutex_);
        if (!running_.exchange(false))
        {
            return;
        }
        timer_.cancel();
        spdlog::debug("Expiry sweep stopped");
    }

    std::size_t ExpirySweeper::run_once()
    {
        const auto removed = registry_.sweep_expired(UploadRegistry::Clock::now(), timeout_);
        if (removed > 0)
        {
            spdlog::info("Expired {} idle upload sessions", removed);
        }
        return removed;
    }

    void ExpirySweeper::arm_timer_locked()
    {
        timer_.expires_after(interval_);
        timer_.async_wait([this](const std::error_code &ec)
                          {
                              if (ec == asio::error::operation_aborted)
                              {
                                  return;
                              }
                              on_timer(ec); });
    }

    void ExpirySweeper::on_timer(const std::error_code &ec)
    {
        std::lock_guard lock(timer_mutex_);
        // A handler already queued when stop() ran must not sweep.
        if (!running_.load())
        {
            return;
        }
        if (ec)
        {
            spdlog::error("Expiry sweep timer failed: {}", ec.message());
            return;
        }
        try
        {
            run_once();
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Expiry sweep failed: {}", ex.what());
        }
        arm_timer_locked();
    }

} // namespace ferry::server
