#include "stillhere/handlers.hpp"
#include "stillhere/json.hpp"
#include "stillhere/logger.hpp"

namespace stillhere {
namespace handlers {

// ==================== Commands ====================

void register_device(const RegisterDevice& command, UnitOfWork& uow, const Clock& clock) {
    auto scope = uow.start();
    auto& devices = uow.devices();

    auto device = std::make_shared<Device>(command.uuid, command.name, command.last_will,
                                           command.ttl, clock());
    // An existing uuid is replaced, re-arming it with the new will and ttl
    devices.add(device);
    device->record_registered();

    scope.commit();
}

void remove_device(const RemoveDevice& command, UnitOfWork& uow) {
    auto scope = uow.start();
    auto& devices = uow.devices();

    auto device = devices.get(command.uuid);
    if (!device) {
        throw Error(ErrorCode::NotFound, "device " + command.uuid + " not found");
    }

    devices.remove(command.uuid);
    device->record_removed();

    scope.commit();
}

void keep_alive_device(const KeepAliveDevice& command, UnitOfWork& uow, const Clock& clock) {
    auto scope = uow.start();
    auto& devices = uow.devices();

    auto device = devices.get(command.uuid);
    if (!device) {
        throw Error(ErrorCode::NotFound, "device " + command.uuid + " not found");
    }

    DeviceUpdate changes;
    changes.fire_at = clock() + device->ttl();
    devices.update(command.uuid, changes);
    device->record_kept_alive();

    scope.commit();
}

// ==================== Events ====================

void log_device_registered(const DeviceRegistered& event) {
    STILLHERE_LOG_INFO("{}", json::message_to_json(event).dump());
}

void log_device_removed(const DeviceRemoved& event) {
    STILLHERE_LOG_INFO("{}", json::message_to_json(event).dump());
}

void log_device_kept_alive(const DeviceKeptAlive& event) {
    STILLHERE_LOG_INFO("{}", json::message_to_json(event).dump());
}

}  // namespace handlers
}  // namespace stillhere
