#pragma once

/**
 * @file device.hpp
 * @brief Device aggregate for stillhere
 *
 * A Device is one monitored entity: it carries a last-will payload that must
 * be surfaced once if no keep-alive arrives before fire_at. State transitions
 * append domain events to the device's own pending queue; the unit of work
 * drains that queue after the transaction.
 */

#include "stillhere/messages.hpp"
#include "stillhere/stillhere.hpp"

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stillhere {

/**
 * @brief Core business aggregate
 *
 * Equality and hashing are defined by uuid only.
 */
class Device {
  public:
    /// Create a device; fire_at is derived as created_at + ttl
    Device(std::string uuid, std::string name, std::string last_will, int64_t ttl,
           UnixSeconds created_at, std::optional<std::string> consumer_id = std::nullopt,
           bool consumed = false, int64_t version_number = 0);

    /// Get the device identifier
    [[nodiscard]] const std::string& uuid() const noexcept { return uuid_; }

    /// Get the display label
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /// Get the payload delivered on expiry
    [[nodiscard]] const std::string& last_will() const noexcept { return last_will_; }

    /// Get the time-to-live in seconds
    [[nodiscard]] int64_t ttl() const noexcept { return ttl_; }

    /// Get the registration time (UNIX seconds)
    [[nodiscard]] UnixSeconds created_at() const noexcept { return created_at_; }

    /// Get the expiry time (UNIX seconds)
    [[nodiscard]] UnixSeconds fire_at() const noexcept { return fire_at_; }

    /// Get the consumer that fired this device, if any
    [[nodiscard]] const std::optional<std::string>& consumer_id() const noexcept {
        return consumer_id_;
    }

    /// Check if the last will has been consumed
    [[nodiscard]] bool consumed() const noexcept { return consumed_; }

    /// Get the optimistic concurrency marker
    [[nodiscard]] int64_t version_number() const noexcept { return version_number_; }

    // ========== Domain Events ==========

    /// Queue a DeviceRegistered event
    void record_registered();

    /// Queue a DeviceRemoved event
    void record_removed();

    /// Queue a DeviceKeptAlive event carrying the current fire_at
    void record_kept_alive();

    /// Number of events waiting to be collected
    [[nodiscard]] std::size_t pending_event_count() const noexcept { return pending_events_.size(); }

    /// Pop the oldest pending event (nullptr when the queue is empty)
    std::shared_ptr<const Event> pop_event();

    /// Drain every pending event in FIFO order
    std::vector<std::shared_ptr<const Event>> pop_events();

    // ========== Consumption ==========

    /**
     * @brief Mark the last will as consumed by the given consumer
     *
     * Always bumps version_number. Consuming twice logs a warning but does
     * not throw; callers should guard against double firing.
     */
    void consume(const std::string& consumer_id);

    // ========== Store Updates ==========

    void set_fire_at(UnixSeconds fire_at) noexcept { fire_at_ = fire_at; }
    void set_last_will(std::string last_will) { last_will_ = std::move(last_will); }
    void set_consumed(bool consumed) noexcept { consumed_ = consumed; }
    void set_consumer_id(std::optional<std::string> consumer_id) {
        consumer_id_ = std::move(consumer_id);
    }
    void set_version_number(int64_t version_number) noexcept { version_number_ = version_number; }

    bool operator==(const Device& other) const noexcept { return uuid_ == other.uuid_; }
    bool operator!=(const Device& other) const noexcept { return uuid_ != other.uuid_; }

  private:
    std::string uuid_;
    std::string name_;
    std::string last_will_;
    int64_t ttl_ = 0;
    UnixSeconds created_at_ = 0;
    UnixSeconds fire_at_ = 0;
    std::optional<std::string> consumer_id_;
    bool consumed_ = false;
    int64_t version_number_ = 0;
    std::deque<std::shared_ptr<const Event>> pending_events_;
};

}  // namespace stillhere

namespace std {

template <> struct hash<stillhere::Device> {
    std::size_t operator()(const stillhere::Device& device) const noexcept {
        return std::hash<std::string>{}(device.uuid());
    }
};

}  // namespace std
