/**
 * @file basic_usage.cpp
 * @brief Basic usage example for the stillhere library
 *
 * This example demonstrates how to:
 * - Wire a bus over a shared in-memory store
 * - Register a device and keep it alive
 * - Observe domain events
 * - Fire expired devices with the poller
 * - Handle errors raised by commands
 */

#include <stillhere/bootstrap.hpp>
#include <stillhere/identity.hpp>
#include <stillhere/logger.hpp>

#include <iostream>
#include <string>

int main() {
    stillhere::Logger::instance().set_level(stillhere::Logger::Level::Warning);

    // A manual clock so the example runs instantly
    stillhere::UnixSeconds now = 1000;
    stillhere::Bootstrap bootstrap(nullptr, [&now]() { return now; });

    // Example 0: Observe events
    bootstrap.add_observers([](stillhere::HandlerRegistry& registry) {
        registry.on_event<stillhere::DeviceRegistered>([](const stillhere::DeviceRegistered& e) {
            std::cout << "[Event] registered " << e.uuid << ", fires at " << e.fire_at << "\n";
        });
        registry.on_event<stillhere::DeviceKeptAlive>([](const stillhere::DeviceKeptAlive& e) {
            std::cout << "[Event] kept alive " << e.uuid << ", fires at " << e.fire_at << "\n";
        });
    });

    const std::string uuid = stillhere::identity::generate_uuid();

    // Example 1: Register a device with a 30 second TTL
    std::cout << "\n=== Register ===\n";
    bootstrap.make_bus()->dispatch(
        stillhere::RegisterDevice(uuid, "backup-job", "backup did not check in", 30));

    // Example 2: Keep it alive
    std::cout << "\n=== Keep-Alive ===\n";
    now += 20;
    bootstrap.make_bus()->dispatch(stillhere::KeepAliveDevice(uuid));

    // Example 3: Errors from commands propagate as stillhere::Error
    std::cout << "\n=== Error Handling ===\n";
    try {
        bootstrap.make_bus()->dispatch(stillhere::KeepAliveDevice("unknown-device"));
    } catch (const stillhere::Error& e) {
        std::cout << "Error: " << stillhere::error_code_to_string(e.code()) << " - " << e.what()
                  << "\n";
    }

    // Example 4: Let it expire and fire
    std::cout << "\n=== Expiry ===\n";
    stillhere::PollerOptions options;
    options.consumer_id = "example";
    options.on_last_will = [](const stillhere::Device& device, stillhere::UnixSeconds at) {
        std::cout << "Last will of " << device.name() << " at " << at << ": "
                  << device.last_will() << "\n";
    };
    auto poller = bootstrap.make_poller(options);

    now += 60;
    auto fired = poller->check_and_fire();
    std::cout << "Fired " << fired.size() << " device(s)\n";

    // A second tick over the same instant fires nothing
    std::cout << "Fired again: " << poller->check_and_fire().size() << "\n";

    return 0;
}
