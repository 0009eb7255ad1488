#pragma once

/**
 * @file bootstrap.hpp
 * @brief Wiring of handlers and their dependencies
 */

#include "stillhere/message_bus.hpp"
#include "stillhere/poller.hpp"
#include "stillhere/store.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace stillhere {

/**
 * @brief Owns the shared store and builds buses and pollers over it
 *
 * Thread-safe: make_bus() may be called concurrently, one bus per request.
 */
class Bootstrap {
  public:
    /// Hook adding observers to every registry built by make_bus()
    using RegistryHook = std::function<void(HandlerRegistry&)>;

    explicit Bootstrap(std::shared_ptr<DeviceStoreInterface> store = nullptr,
                       Clock clock = nullptr);

    /// Build a bus with a fresh unit of work and every handler bound
    [[nodiscard]] std::unique_ptr<MessageBus> make_bus() const;

    /// Build a poller over the shared store (options.clock defaults to this bootstrap's clock)
    [[nodiscard]] std::unique_ptr<ExpiryPoller> make_poller(PollerOptions options = {}) const;

    /// Register extra observers applied to subsequently built buses
    void add_observers(RegistryHook hook);

    [[nodiscard]] DeviceStoreInterface& store() noexcept { return *store_; }
    [[nodiscard]] const Clock& clock() const noexcept { return clock_; }

  private:
    std::shared_ptr<DeviceStoreInterface> store_;
    Clock clock_;
    std::vector<RegistryHook> hooks_;
    mutable std::mutex hooks_mutex_;
};

}  // namespace stillhere
