#include "stillhere/device.hpp"
#include "stillhere/logger.hpp"

namespace stillhere {

Device::Device(std::string uuid, std::string name, std::string last_will, int64_t ttl,
               UnixSeconds created_at, std::optional<std::string> consumer_id, bool consumed,
               int64_t version_number)
    : uuid_(std::move(uuid)),
      name_(std::move(name)),
      last_will_(std::move(last_will)),
      ttl_(ttl),
      created_at_(created_at),
      fire_at_(created_at + ttl),
      consumer_id_(std::move(consumer_id)),
      consumed_(consumed),
      version_number_(version_number) {}

void Device::record_registered() {
    pending_events_.push_back(
        std::make_shared<DeviceRegistered>(uuid_, name_, last_will_, ttl_, fire_at_));
}

void Device::record_removed() { pending_events_.push_back(std::make_shared<DeviceRemoved>(uuid_)); }

void Device::record_kept_alive() {
    pending_events_.push_back(std::make_shared<DeviceKeptAlive>(uuid_, fire_at_));
}

std::shared_ptr<const Event> Device::pop_event() {
    if (pending_events_.empty()) {
        return nullptr;
    }
    auto event = std::move(pending_events_.front());
    pending_events_.pop_front();
    return event;
}

std::vector<std::shared_ptr<const Event>> Device::pop_events() {
    std::vector<std::shared_ptr<const Event>> events;
    events.reserve(pending_events_.size());
    while (auto event = pop_event()) {
        events.push_back(std::move(event));
    }
    return events;
}

void Device::consume(const std::string& consumer_id) {
    if (consumed_) {
        STILLHERE_LOG_WARN("consuming already consumed device {} (consumer {})", uuid_,
                           consumer_id);
    }
    ++version_number_;
    consumed_ = true;
    consumer_id_ = consumer_id;
}

}  // namespace stillhere
