#include "stillhere/poller.hpp"
#include "stillhere/identity.hpp"
#include "stillhere/json.hpp"
#include "stillhere/logger.hpp"

#include <chrono>

namespace stillhere {

void log_last_will(const Device& device, UnixSeconds triggered_at) {
    STILLHERE_LOG_INFO(
        "[LWT Triggered] Device UUID: {} | Scheduled fire_at: {} | Triggered at: {} | Last will: {}",
        device.uuid(), json::format_unix_timestamp(device.fire_at()),
        json::format_unix_timestamp(triggered_at), device.last_will());
}

ExpiryPoller::ExpiryPoller(std::unique_ptr<UnitOfWork> uow, PollerOptions options)
    : uow_(std::move(uow)), options_(std::move(options)) {
    if (!uow_) {
        throw Error(ErrorCode::InitializationError, "poller requires a unit of work");
    }
    if (options_.interval_seconds <= 0) {
        throw Error(ErrorCode::InvalidArgument, "poll interval must be positive");
    }
    if (!options_.clock) {
        options_.clock = system_clock();
    }
    if (options_.consumer_id.empty()) {
        options_.consumer_id = identity::generate_consumer_id();
    }
    if (!options_.on_last_will) {
        options_.on_last_will = log_last_will;
    }
    last_poll_ = options_.clock();
}

ExpiryPoller::~ExpiryPoller() { stop(); }

UnixSeconds ExpiryPoller::last_poll() const {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    return last_poll_;
}

std::vector<Device> ExpiryPoller::check_and_fire() {
    std::lock_guard<std::mutex> lock(tick_mutex_);

    const UnixSeconds start = last_poll_ + 1;
    const UnixSeconds end = options_.clock();
    std::vector<Device> fired;

    if (end < start) {
        return fired;
    }

    STILLHERE_LOG_DEBUG("Polling for devices scheduled between {} and {} (UTC seconds)", start,
                        end);

    auto scope = uow_->start();
    for (const auto& device : uow_->devices().claim_fire_at_between(start, end)) {
        device->consume(options_.consumer_id);
        try {
            options_.on_last_will(*device, end);
        } catch (const std::exception& e) {
            STILLHERE_LOG_ERROR("last will handler failed for device {}: {}", device->uuid(),
                                e.what());
        } catch (...) {
            STILLHERE_LOG_ERROR("last will handler failed for device {}: unknown exception",
                                device->uuid());
        }
        fired.push_back(*device);
    }
    scope.commit();

    last_poll_ = end;
    return fired;
}

void ExpiryPoller::start() {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread([this]() { run(); });
    STILLHERE_LOG_INFO("expiry poller started (interval {}s, consumer {})",
                       options_.interval_seconds, options_.consumer_id);
}

void ExpiryPoller::stop() {
    if (running_) {
        {
            std::lock_guard<std::mutex> lock(wake_mutex_);
            running_ = false;
        }
        wake_cv_.notify_all();

        if (thread_.joinable()) {
            thread_.join();
        }
        STILLHERE_LOG_INFO("expiry poller stopped");
    }
}

void ExpiryPoller::run() {
    const auto interval = std::chrono::seconds(options_.interval_seconds);
    auto next_tick = std::chrono::steady_clock::now() + interval;

    while (running_) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait_until(lock, next_tick, [this]() { return !running_; });
        }

        if (!running_) {
            break;
        }

        try {
            check_and_fire();
        } catch (const std::exception& e) {
            STILLHERE_LOG_ERROR("expiry poller tick failed: {}", e.what());
        } catch (...) {
            STILLHERE_LOG_ERROR("expiry poller tick failed: unknown exception");
        }

        next_tick += interval;
        auto now = std::chrono::steady_clock::now();
        if (next_tick <= now) {
            int missed = 0;
            while (next_tick <= now) {
                next_tick += interval;
                ++missed;
            }
            STILLHERE_LOG_WARN("expiry poller tick overran its interval, skipping {} slot(s)",
                               missed);
        }
    }
}

}  // namespace stillhere
