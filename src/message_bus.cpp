#include "stillhere/message_bus.hpp"
#include "stillhere/logger.hpp"

namespace stillhere {

// ==================== HandlerRegistry ====================

void HandlerRegistry::add_command_handler(std::type_index type, const char* type_name,
                                          CommandHandler handler) {
    if (!command_handlers_.emplace(type, std::move(handler)).second) {
        throw Error(ErrorCode::ConfigurationError,
                    std::string("duplicate command handler for ") + type_name);
    }
}

const CommandHandler* HandlerRegistry::find_command_handler(const Command& command) const {
    auto it = command_handlers_.find(std::type_index(typeid(command)));
    if (it == command_handlers_.end()) {
        return nullptr;
    }
    return &it->second;
}

const std::vector<EventHandler>& HandlerRegistry::find_event_handlers(const Event& event) const {
    static const std::vector<EventHandler> none;
    auto it = event_handlers_.find(std::type_index(typeid(event)));
    if (it == event_handlers_.end()) {
        return none;
    }
    return it->second;
}

// ==================== MessageBus ====================

MessageBus::MessageBus(std::unique_ptr<UnitOfWork> uow, HandlerRegistry handlers)
    : uow_(std::move(uow)), handlers_(std::move(handlers)) {
    if (!uow_) {
        throw Error(ErrorCode::InitializationError, "message bus requires a unit of work");
    }
}

void MessageBus::dispatch(std::unique_ptr<Message> message) {
    if (!message) {
        throw Error(ErrorCode::InvalidMessageType, "cannot dispatch a null message");
    }
    dispatch(*message);
}

void MessageBus::dispatch(const Message& message) {
    std::vector<std::shared_ptr<const Message>> queue;
    queue.push_back(message.clone());

    // Index walk: handlers append to the tail while we consume the head
    for (std::size_t head = 0; head < queue.size(); ++head) {
        auto current = queue[head];

        if (auto event = dynamic_cast<const Event*>(current.get())) {
            handle_event(*event, queue);
        } else if (auto command = dynamic_cast<const Command*>(current.get())) {
            handle_command(*command, queue);
        } else {
            throw Error(ErrorCode::InvalidMessageType,
                        std::string(current->type_name()) + " is neither a command nor an event");
        }
    }
}

void MessageBus::handle_event(const Event& event,
                              std::vector<std::shared_ptr<const Message>>& queue) {
    for (const auto& handler : handlers_.find_event_handlers(event)) {
        try {
            STILLHERE_LOG_DEBUG("handling event {}", event.type_name());
            handler(event);
            enqueue_new_events(queue);
        } catch (const std::exception& e) {
            STILLHERE_LOG_ERROR("exception handling event {}: {}", event.type_name(), e.what());
        } catch (...) {
            STILLHERE_LOG_ERROR("unknown exception handling event {}", event.type_name());
        }
    }
}

void MessageBus::handle_command(const Command& command,
                                std::vector<std::shared_ptr<const Message>>& queue) {
    const CommandHandler* handler = handlers_.find_command_handler(command);
    if (handler == nullptr) {
        throw Error(ErrorCode::ConfigurationError,
                    std::string("no handler registered for command ") + command.type_name());
    }

    try {
        STILLHERE_LOG_DEBUG("handling command {}", command.type_name());
        (*handler)(command);
    } catch (const std::exception& e) {
        STILLHERE_LOG_ERROR("exception handling command {}: {}", command.type_name(), e.what());
        throw;
    }
    enqueue_new_events(queue);
}

void MessageBus::enqueue_new_events(std::vector<std::shared_ptr<const Message>>& queue) {
    for (auto& event : uow_->collect_new_events()) {
        queue.push_back(std::move(event));
    }
}

}  // namespace stillhere
