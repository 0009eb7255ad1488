#pragma once

/**
 * @file message_bus.hpp
 * @brief Command and event dispatch for stillhere
 *
 * Commands have exactly one handler and their failures propagate to the
 * caller. Events have zero or more handlers whose failures are logged and
 * isolated. Events raised while handling a message are collected from the
 * unit of work and dispatched before dispatch() returns.
 */

#include "stillhere/messages.hpp"
#include "stillhere/unit_of_work.hpp"

#include <functional>
#include <memory>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>

namespace stillhere {

/// Type-erased command handler
using CommandHandler = std::function<void(const Command&)>;

/// Type-erased event handler
using EventHandler = std::function<void(const Event&)>;

/**
 * @brief Typed bindings from message types to handlers
 */
class HandlerRegistry {
  public:
    /**
     * @brief Bind the handler for command type C
     *
     * @throws Error(ConfigurationError) if C already has a handler
     */
    template <typename C> void on_command(std::function<void(const C&)> handler) {
        static_assert(std::is_base_of<Command, C>::value, "on_command requires a Command type");
        add_command_handler(std::type_index(typeid(C)), typeid(C).name(),
                            [handler = std::move(handler)](const Command& command) {
                                handler(static_cast<const C&>(command));
                            });
    }

    /// Append a handler for event type E
    template <typename E> void on_event(std::function<void(const E&)> handler) {
        static_assert(std::is_base_of<Event, E>::value, "on_event requires an Event type");
        event_handlers_[std::type_index(typeid(E))].push_back(
            [handler = std::move(handler)](const Event& event) {
                handler(static_cast<const E&>(event));
            });
    }

    /// Handler for a command's concrete type (nullptr if none)
    [[nodiscard]] const CommandHandler* find_command_handler(const Command& command) const;

    /// Handlers for an event's concrete type (empty if none)
    [[nodiscard]] const std::vector<EventHandler>& find_event_handlers(const Event& event) const;

  private:
    void add_command_handler(std::type_index type, const char* type_name, CommandHandler handler);

    std::unordered_map<std::type_index, CommandHandler> command_handlers_;
    std::unordered_map<std::type_index, std::vector<EventHandler>> event_handlers_;
};

/**
 * @brief Synchronous dispatcher
 *
 * Not thread-safe: each thread (or request) uses its own bus over the shared
 * store.
 */
class MessageBus {
  public:
    MessageBus(std::unique_ptr<UnitOfWork> uow, HandlerRegistry handlers);

    MessageBus(const MessageBus&) = delete;
    MessageBus& operator=(const MessageBus&) = delete;

    /**
     * @brief Dispatch a message and every event it cascades into
     *
     * @throws Error(InvalidMessageType) for a message that is neither a command nor an event
     * @throws Error(ConfigurationError) for a command without a handler
     * @throws whatever the command handler throws
     */
    void dispatch(const Message& message);

    /// Convenience overload for owned messages
    void dispatch(std::unique_ptr<Message> message);

    /// The unit of work handlers run against
    [[nodiscard]] UnitOfWork& uow() noexcept { return *uow_; }

  private:
    void handle_event(const Event& event, std::vector<std::shared_ptr<const Message>>& queue);
    void handle_command(const Command& command, std::vector<std::shared_ptr<const Message>>& queue);
    void enqueue_new_events(std::vector<std::shared_ptr<const Message>>& queue);

    std::unique_ptr<UnitOfWork> uow_;
    HandlerRegistry handlers_;
};

}  // namespace stillhere
