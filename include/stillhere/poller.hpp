#pragma once

/**
 * @file poller.hpp
 * @brief Background expiry poller for stillhere
 *
 * On every tick the poller claims the devices whose fire_at fell inside
 * (last_poll, now], marks them consumed and hands each one to the last-will
 * handler exactly once.
 */

#include "stillhere/device.hpp"
#include "stillhere/stillhere.hpp"
#include "stillhere/unit_of_work.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace stillhere {

/// Receives each fired device and the time it was fired
using LastWillHandler = std::function<void(const Device& device, UnixSeconds triggered_at)>;

/**
 * @brief Configuration for ExpiryPoller
 */
struct PollerOptions {
    /// Seconds between ticks
    int interval_seconds = 10;

    /// Recorded on fired devices (derived from identity::generate_consumer_id() if empty)
    std::string consumer_id;

    /// Source of "now" (system clock if empty)
    Clock clock;

    /// Called once per fired device (logs the last will if empty)
    LastWillHandler on_last_will;
};

/// Log a fired device at info level
void log_last_will(const Device& device, UnixSeconds triggered_at);

/**
 * @brief Interval-driven poller that fires expired devices
 */
class ExpiryPoller {
  public:
    /**
     * @brief Create a poller; last_poll starts at clock()
     *
     * @throws Error(InvalidArgument) if interval_seconds is not positive
     */
    ExpiryPoller(std::unique_ptr<UnitOfWork> uow, PollerOptions options = {});
    ~ExpiryPoller();

    ExpiryPoller(const ExpiryPoller&) = delete;
    ExpiryPoller& operator=(const ExpiryPoller&) = delete;

    /**
     * @brief Run one tick over [last_poll + 1, now]
     *
     * Does nothing when the window is empty. A failing last-will handler is
     * logged and does not stop the remaining devices from firing.
     *
     * @return Copies of the devices fired by this tick, ordered by fire_at
     */
    std::vector<Device> check_and_fire();

    /// Start ticking on a background thread (no-op if already running)
    void start();

    /// Stop the background thread and wait for it to exit
    void stop();

    /// Check if the background thread is running
    [[nodiscard]] bool is_running() const noexcept { return running_; }

    /// End of the last polled window
    [[nodiscard]] UnixSeconds last_poll() const;

    [[nodiscard]] int interval_seconds() const noexcept { return options_.interval_seconds; }
    [[nodiscard]] const std::string& consumer_id() const noexcept { return options_.consumer_id; }

  private:
    void run();

    std::unique_ptr<UnitOfWork> uow_;
    PollerOptions options_;
    UnixSeconds last_poll_;

    // Serializes ticks and guards last_poll_
    mutable std::mutex tick_mutex_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
};

}  // namespace stillhere
