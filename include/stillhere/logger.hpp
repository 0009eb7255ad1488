#pragma once

/**
 * @file logger.hpp
 * @brief Process-wide leveled logger for stillhere
 *
 * Formatting uses fmt-style format strings in the header templates; the sink
 * (console, file or callback) lives in logger.cpp behind a pimpl.
 */

#include <fmt/format.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace stillhere {

class Logger {
  public:
    enum class Level : int {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warning = 3,
        Error = 4,
        Off = 5,
    };

    enum class Destination {
        Console,
        File,
        Callback,
    };

    /// Callback sink receiving the level and the formatted body (no header, no newline)
    using Callback = std::function<void(Level, const std::string&)>;

    /// Singleton accessor
    static Logger& instance();

    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    // ========== Sinks ==========

    /// Open the given path for append and route output there. Returns false on failure.
    bool init_file(const std::string& path);

    /// Route output to a callback (used by tests and embedding applications)
    void init_callback(Callback callback);

    /// Route output back to stderr and close any open file
    void init_console();

    [[nodiscard]] Destination destination() const;

    // ========== Configuration ==========

    void set_level(Level level);
    [[nodiscard]] Level level() const;
    [[nodiscard]] bool should_log(Level level) const noexcept;

    // ========== Formatting API ==========

    template <typename... Args>
    void log_fmt(Level lvl, std::string_view fmt_str, const Args&... args) noexcept;

    template <typename... Args> void trace_fmt(std::string_view fmt_str, const Args&... args) noexcept {
        log_fmt(Level::Trace, fmt_str, args...);
    }
    template <typename... Args> void debug_fmt(std::string_view fmt_str, const Args&... args) noexcept {
        log_fmt(Level::Debug, fmt_str, args...);
    }
    template <typename... Args> void info_fmt(std::string_view fmt_str, const Args&... args) noexcept {
        log_fmt(Level::Info, fmt_str, args...);
    }
    template <typename... Args> void warn_fmt(std::string_view fmt_str, const Args&... args) noexcept {
        log_fmt(Level::Warning, fmt_str, args...);
    }
    template <typename... Args> void error_fmt(std::string_view fmt_str, const Args&... args) noexcept {
        log_fmt(Level::Error, fmt_str, args...);
    }

  private:
    // Non-template sink: accepts an already-formatted body
    void write_formatted(Level lvl, std::string&& body) noexcept;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Convert level to its upper-case tag ("INFO", "WARNING", ...)
[[nodiscard]] const char* level_to_string(Logger::Level level) noexcept;

/// Parse a level name (case-insensitive, "warn" accepted); nullopt if unknown
[[nodiscard]] std::optional<Logger::Level> level_from_string(const std::string& name);

template <typename... Args>
void Logger::log_fmt(Level lvl, std::string_view fmt_str, const Args&... args) noexcept {
    if (!should_log(lvl)) {
        return;
    }

    try {
        write_formatted(lvl, fmt::format(fmt::runtime(fmt_str), args...));
    } catch (const std::exception& ex) {
        // never throw from logging
        write_formatted(lvl, std::string("[FORMAT ERROR] ") + ex.what());
    }
}

}  // namespace stillhere

#define STILLHERE_LOG_TRACE(fmt_str, ...) \
    ::stillhere::Logger::instance().trace_fmt(fmt_str, ##__VA_ARGS__)
#define STILLHERE_LOG_DEBUG(fmt_str, ...) \
    ::stillhere::Logger::instance().debug_fmt(fmt_str, ##__VA_ARGS__)
#define STILLHERE_LOG_INFO(fmt_str, ...) \
    ::stillhere::Logger::instance().info_fmt(fmt_str, ##__VA_ARGS__)
#define STILLHERE_LOG_WARN(fmt_str, ...) \
    ::stillhere::Logger::instance().warn_fmt(fmt_str, ##__VA_ARGS__)
#define STILLHERE_LOG_ERROR(fmt_str, ...) \
    ::stillhere::Logger::instance().error_fmt(fmt_str, ##__VA_ARGS__)
