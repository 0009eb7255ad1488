#pragma once

/**
 * @file messages.hpp
 * @brief Commands and domain events routed by the message bus
 *
 * Commands are imperative requests with exactly one handler; events are facts
 * about what happened with zero or more handlers. Both are immutable once
 * built and are shared between the aggregate queue and the bus queue.
 */

#include "stillhere/stillhere.hpp"

#include <memory>
#include <string>

namespace stillhere {

/// Anything the message bus can dispatch
struct Message {
    virtual ~Message() = default;

    /// Stable message name used in logs
    [[nodiscard]] virtual const char* type_name() const noexcept = 0;

    /// Copy this message behind a shared pointer
    [[nodiscard]] virtual std::shared_ptr<const Message> clone() const = 0;
};

/// Imperative request; exactly one handler, failures propagate
struct Command : Message {};

/// Descriptive fact; zero or more handlers, failures are isolated
struct Event : Message {};

namespace detail {

template <typename Derived, typename Base> struct MessageImpl : Base {
    [[nodiscard]] std::shared_ptr<const Message> clone() const override {
        return std::make_shared<Derived>(static_cast<const Derived&>(*this));
    }
};

}  // namespace detail

// ==================== Commands ====================

struct RegisterDevice : detail::MessageImpl<RegisterDevice, Command> {
    RegisterDevice(std::string uuid_, std::string name_, std::string last_will_, int64_t ttl_)
        : uuid(std::move(uuid_)),
          name(std::move(name_)),
          last_will(std::move(last_will_)),
          ttl(ttl_) {}

    [[nodiscard]] const char* type_name() const noexcept override { return "RegisterDevice"; }

    std::string uuid;
    std::string name;
    std::string last_will;
    int64_t ttl = 0;
};

struct RemoveDevice : detail::MessageImpl<RemoveDevice, Command> {
    explicit RemoveDevice(std::string uuid_) : uuid(std::move(uuid_)) {}

    [[nodiscard]] const char* type_name() const noexcept override { return "RemoveDevice"; }

    std::string uuid;
};

struct KeepAliveDevice : detail::MessageImpl<KeepAliveDevice, Command> {
    explicit KeepAliveDevice(std::string uuid_) : uuid(std::move(uuid_)) {}

    [[nodiscard]] const char* type_name() const noexcept override { return "KeepAliveDevice"; }

    std::string uuid;
};

// ==================== Events ====================

struct DeviceRegistered : detail::MessageImpl<DeviceRegistered, Event> {
    DeviceRegistered(std::string uuid_, std::string name_, std::string last_will_, int64_t ttl_,
                     UnixSeconds fire_at_)
        : uuid(std::move(uuid_)),
          name(std::move(name_)),
          last_will(std::move(last_will_)),
          ttl(ttl_),
          fire_at(fire_at_) {}

    [[nodiscard]] const char* type_name() const noexcept override { return "DeviceRegistered"; }

    std::string uuid;
    std::string name;
    std::string last_will;
    int64_t ttl = 0;
    UnixSeconds fire_at = 0;
};

struct DeviceRemoved : detail::MessageImpl<DeviceRemoved, Event> {
    explicit DeviceRemoved(std::string uuid_) : uuid(std::move(uuid_)) {}

    [[nodiscard]] const char* type_name() const noexcept override { return "DeviceRemoved"; }

    std::string uuid;
};

struct DeviceKeptAlive : detail::MessageImpl<DeviceKeptAlive, Event> {
    DeviceKeptAlive(std::string uuid_, UnixSeconds fire_at_)
        : uuid(std::move(uuid_)), fire_at(fire_at_) {}

    [[nodiscard]] const char* type_name() const noexcept override { return "DeviceKeptAlive"; }

    std::string uuid;
    UnixSeconds fire_at = 0;
};

}  // namespace stillhere
