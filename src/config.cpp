#include "stillhere/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace stillhere {

namespace {

Result<Config> config_error(const std::string& message) {
    return Result<Config>::error(ErrorCode::ConfigurationError, message);
}

std::optional<int> parse_int(const std::string& value) {
    try {
        std::size_t pos = 0;
        int parsed = std::stoi(value, &pos);
        if (pos != value.size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool parse_bool(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return nullptr;
    }
    return value;
}

}  // namespace

Result<Config> config_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return config_error("configuration must be a JSON object");
    }

    Config config;

    if (j.contains("host")) {
        if (!j["host"].is_string()) {
            return config_error("'host' must be a string");
        }
        config.host = j["host"].get<std::string>();
    }

    if (j.contains("port")) {
        if (!j["port"].is_number_integer()) {
            return config_error("'port' must be an integer");
        }
        config.port = j["port"].get<int>();
        if (config.port <= 0 || config.port > 65535) {
            return config_error("'port' must be between 1 and 65535");
        }
    }

    if (j.contains("poll_interval_seconds")) {
        if (!j["poll_interval_seconds"].is_number_integer()) {
            return config_error("'poll_interval_seconds' must be an integer");
        }
        config.poll_interval_seconds = j["poll_interval_seconds"].get<int>();
        if (config.poll_interval_seconds <= 0) {
            return config_error("'poll_interval_seconds' must be positive");
        }
    }

    if (j.contains("log_level")) {
        if (!j["log_level"].is_string()) {
            return config_error("'log_level' must be a string");
        }
        config.log_level = j["log_level"].get<std::string>();
        if (!level_from_string(config.log_level)) {
            return config_error("unknown log level '" + config.log_level + "'");
        }
    }

    if (j.contains("log_file")) {
        if (!j["log_file"].is_string()) {
            return config_error("'log_file' must be a string");
        }
        config.log_file = j["log_file"].get<std::string>();
    }

    if (j.contains("consumer_id")) {
        if (!j["consumer_id"].is_string()) {
            return config_error("'consumer_id' must be a string");
        }
        config.consumer_id = j["consumer_id"].get<std::string>();
    }

    if (j.contains("debug")) {
        if (!j["debug"].is_boolean()) {
            return config_error("'debug' must be a boolean");
        }
        config.debug = j["debug"].get<bool>();
    }

    return Result<Config>::ok(std::move(config));
}

Result<Config> load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return config_error("cannot open configuration file " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        return config_from_json(nlohmann::json::parse(buffer.str()));
    } catch (const nlohmann::json::parse_error& e) {
        return config_error("invalid JSON in " + path + ": " + e.what());
    }
}

void apply_env_overrides(Config& config) {
    if (const char* host = env("STILLHERE_HOST")) {
        config.host = host;
    }

    if (const char* port = env("STILLHERE_PORT")) {
        auto parsed = parse_int(port);
        if (parsed && *parsed > 0 && *parsed <= 65535) {
            config.port = *parsed;
        } else {
            STILLHERE_LOG_WARN("ignoring invalid STILLHERE_PORT '{}'", port);
        }
    }

    if (const char* interval = env("STILLHERE_POLL_INTERVAL")) {
        auto parsed = parse_int(interval);
        if (parsed && *parsed > 0) {
            config.poll_interval_seconds = *parsed;
        } else {
            STILLHERE_LOG_WARN("ignoring invalid STILLHERE_POLL_INTERVAL '{}'", interval);
        }
    }

    if (const char* level = env("LOG_LEVEL")) {
        if (level_from_string(level)) {
            config.log_level = level;
        } else {
            STILLHERE_LOG_WARN("ignoring unknown LOG_LEVEL '{}'", level);
        }
    }

    if (const char* debug = env("DEBUG")) {
        config.debug = parse_bool(debug);
    }
}

Logger::Level effective_log_level(const Config& config) {
    auto level = level_from_string(config.log_level).value_or(Logger::Level::Info);
    if (config.debug && level > Logger::Level::Debug) {
        return Logger::Level::Debug;
    }
    return level;
}

}  // namespace stillhere
