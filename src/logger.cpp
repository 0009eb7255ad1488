#include "stillhere/logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <mutex>

namespace stillhere {

struct Logger::Impl {
    mutable std::mutex mutex;
    Destination destination = Destination::Console;
    std::ofstream file;
    Callback callback;
    std::atomic<int> level{static_cast<int>(Level::Info)};
};

namespace {

std::string format_now() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
                  1000;

    std::tm tm = {};
    gmtime_r(&time, &tm);

    char buffer[32] = {0};
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm);
    return fmt::format("{}.{:03d}", buffer, static_cast<int>(millis.count()));
}

}  // namespace

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() : impl_(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

bool Logger::init_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    std::ofstream file(path, std::ios::app);
    if (!file.is_open()) {
        return false;
    }
    impl_->file = std::move(file);
    impl_->destination = Destination::File;
    return true;
}

void Logger::init_callback(Callback callback) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->callback = std::move(callback);
    impl_->destination = Destination::Callback;
}

void Logger::init_console() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->file.is_open()) {
        impl_->file.close();
    }
    impl_->callback = nullptr;
    impl_->destination = Destination::Console;
}

Logger::Destination Logger::destination() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->destination;
}

void Logger::set_level(Level level) { impl_->level.store(static_cast<int>(level)); }

Logger::Level Logger::level() const { return static_cast<Level>(impl_->level.load()); }

bool Logger::should_log(Level level) const noexcept {
    return level != Level::Off && static_cast<int>(level) >= impl_->level.load();
}

void Logger::write_formatted(Level lvl, std::string&& body) noexcept {
    Callback callback;

    try {
        std::unique_lock<std::mutex> lock(impl_->mutex);

        if (impl_->destination == Destination::Callback) {
            callback = impl_->callback;
        } else {
            std::string line =
                fmt::format("[{}] [{}] {}\n", format_now(), level_to_string(lvl), body);
            if (impl_->destination == Destination::File && impl_->file.is_open()) {
                impl_->file << line;
                impl_->file.flush();
            } else {
                std::fwrite(line.data(), 1, line.size(), stderr);
            }
            return;
        }
    } catch (const std::exception&) {
        return;
    }

    // Invoke the callback outside the lock so it may log itself
    if (callback) {
        try {
            callback(lvl, body);
        } catch (const std::exception&) {
        }
    }
}

const char* level_to_string(Logger::Level level) noexcept {
    switch (level) {
        case Logger::Level::Trace:
            return "TRACE";
        case Logger::Level::Debug:
            return "DEBUG";
        case Logger::Level::Info:
            return "INFO";
        case Logger::Level::Warning:
            return "WARNING";
        case Logger::Level::Error:
            return "ERROR";
        case Logger::Level::Off:
            return "OFF";
    }
    return "UNKNOWN";
}

std::optional<Logger::Level> level_from_string(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace")
        return Logger::Level::Trace;
    if (lower == "debug")
        return Logger::Level::Debug;
    if (lower == "info")
        return Logger::Level::Info;
    if (lower == "warning" || lower == "warn")
        return Logger::Level::Warning;
    if (lower == "error")
        return Logger::Level::Error;
    if (lower == "off")
        return Logger::Level::Off;
    return std::nullopt;
}

}  // namespace stillhere
