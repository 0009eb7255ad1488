#include "stillhere/bootstrap.hpp"
#include "stillhere/handlers.hpp"

namespace stillhere {

Bootstrap::Bootstrap(std::shared_ptr<DeviceStoreInterface> store, Clock clock)
    : store_(store ? std::move(store) : std::make_shared<MemoryDeviceStore>()),
      clock_(clock ? std::move(clock) : system_clock()) {}

std::unique_ptr<MessageBus> Bootstrap::make_bus() const {
    auto uow = std::make_unique<MemoryUnitOfWork>(*store_);
    UnitOfWork& uow_ref = *uow;
    Clock clock = clock_;

    HandlerRegistry registry;

    // Commands
    registry.on_command<RegisterDevice>([&uow_ref, clock](const RegisterDevice& command) {
        handlers::register_device(command, uow_ref, clock);
    });
    registry.on_command<RemoveDevice>(
        [&uow_ref](const RemoveDevice& command) { handlers::remove_device(command, uow_ref); });
    registry.on_command<KeepAliveDevice>([&uow_ref, clock](const KeepAliveDevice& command) {
        handlers::keep_alive_device(command, uow_ref, clock);
    });

    // Events
    registry.on_event<DeviceRegistered>(handlers::log_device_registered);
    registry.on_event<DeviceRemoved>(handlers::log_device_removed);
    registry.on_event<DeviceKeptAlive>(handlers::log_device_kept_alive);

    {
        std::lock_guard<std::mutex> lock(hooks_mutex_);
        for (const auto& hook : hooks_) {
            hook(registry);
        }
    }

    // The bus owns the unit of work the handlers captured by reference
    return std::make_unique<MessageBus>(std::move(uow), std::move(registry));
}

std::unique_ptr<ExpiryPoller> Bootstrap::make_poller(PollerOptions options) const {
    if (!options.clock) {
        options.clock = clock_;
    }
    return std::make_unique<ExpiryPoller>(std::make_unique<MemoryUnitOfWork>(*store_),
                                          std::move(options));
}

void Bootstrap::add_observers(RegistryHook hook) {
    std::lock_guard<std::mutex> lock(hooks_mutex_);
    hooks_.push_back(std::move(hook));
}

}  // namespace stillhere
