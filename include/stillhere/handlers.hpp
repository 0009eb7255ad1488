#pragma once

/**
 * @file handlers.hpp
 * @brief Command and event handlers for stillhere
 *
 * Command handlers hold the business rules and run inside a unit of work
 * scope. Event handlers are side-effect-only observers.
 */

#include "stillhere/messages.hpp"
#include "stillhere/stillhere.hpp"
#include "stillhere/unit_of_work.hpp"

namespace stillhere {
namespace handlers {

// ==================== Commands ====================

/**
 * @brief Create a device expiring at clock() + ttl
 *
 * Registering a known uuid replaces the stored device.
 */
void register_device(const RegisterDevice& command, UnitOfWork& uow, const Clock& clock);

/**
 * @brief Delete a device
 *
 * @throws Error(NotFound) if the uuid is unknown
 */
void remove_device(const RemoveDevice& command, UnitOfWork& uow);

/**
 * @brief Push a device's expiry to clock() + ttl
 *
 * @throws Error(NotFound) if the uuid is unknown
 */
void keep_alive_device(const KeepAliveDevice& command, UnitOfWork& uow, const Clock& clock);

// ==================== Events ====================

void log_device_registered(const DeviceRegistered& event);
void log_device_removed(const DeviceRemoved& event);
void log_device_kept_alive(const DeviceKeptAlive& event);

}  // namespace handlers
}  // namespace stillhere
