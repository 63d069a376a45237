/**
 * @file beacon_config.hpp
 * @brief Configuration management for MailBeacon
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Configuration with:
 * - Structured configuration object grouped by INI section
 * - Loading from INI files
 * - Configuration validation
 * - Default value management
 */
#ifndef MAILBEACON_BEACON_CONFIG_HPP
#define MAILBEACON_BEACON_CONFIG_HPP

#include "beacon_ini.hpp"
#include "beacon_logger.hpp"
#include "beacon_string_utils.hpp"
#include "result.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace mailbeacon {

//=============================================================================
// Structured Configuration
//=============================================================================

struct ServerConfig {
    int port = 8000;
    std::string bind_address = "0.0.0.0";
    int backlog = 64;
};

/**
 * @struct TrackingConfig
 * @brief Storage locations and tracking rules used by TrackingService
 */
struct TrackingConfig {
    std::filesystem::path event_log = "tracking_logs.jsonl";
    std::filesystem::path image_read_log = "img_reads.jsonl";
    std::filesystem::path upload_dir = "./uploads";
    int dedup_window_minutes = 10;
    int remote_timeout_seconds = 8;
    int latest_default = 200;
};

struct LoggingConfig {
    std::string level = "INFO";
    std::string directory;
    bool console = true;
};

/**
 * @struct BeaconConfig
 * @brief Complete service configuration
 */
struct BeaconConfig {
    ServerConfig server;
    TrackingConfig tracking;
    LoggingConfig logging;

    /**
     * @brief Set configuration value from string
     * @param section INI section name
     * @param key Key inside the section
     * @param value Raw value text
     * @return CONFIG_PARSE_ERROR when the value does not fit the key's type;
     *         unknown keys are ignored
     */
    Result<void> setFromString(const std::string& section, const std::string& key,
                               const std::string& value) {
        if (section == "server") {
            if (key == "port") return parseInt(key, value, server.port);
            if (key == "bind_address") server.bind_address = value;
            else if (key == "backlog") return parseInt(key, value, server.backlog);
        } else if (section == "storage") {
            if (key == "event_log") tracking.event_log = value;
            else if (key == "image_read_log") tracking.image_read_log = value;
            else if (key == "upload_dir") tracking.upload_dir = value;
        } else if (section == "tracking") {
            if (key == "dedup_window_minutes") return parseInt(key, value, tracking.dedup_window_minutes);
            if (key == "remote_timeout_seconds") return parseInt(key, value, tracking.remote_timeout_seconds);
            if (key == "latest_default") return parseInt(key, value, tracking.latest_default);
        } else if (section == "logging") {
            if (key == "level") logging.level = string_utils::toUpper(value);
            else if (key == "directory") logging.directory = value;
            else if (key == "console") return parseBool(key, value, logging.console);
        }
        return Ok();
    }

    [[nodiscard]] std::string toString() const {
        std::ostringstream oss;
        oss << "=== MailBeacon Configuration ===\n"
            << "Listen: " << server.bind_address << ":" << server.port << "\n"
            << "Event Log: " << tracking.event_log.string() << "\n"
            << "Image Read Log: " << tracking.image_read_log.string() << "\n"
            << "Upload Dir: " << tracking.upload_dir.string() << "\n"
            << "Dedup Window: " << tracking.dedup_window_minutes << " min\n"
            << "Remote Timeout: " << tracking.remote_timeout_seconds << " s\n"
            << "Log Level: " << logging.level << "\n";
        return oss.str();
    }

    /**
     * @brief Build a configuration from a parsed INI file
     */
    [[nodiscard]] static Result<BeaconConfig> loadFromIni(const ini::IniFile& file);

    /**
     * @brief Load and validate a configuration file
     * @return CONFIG_MISSING when the path does not exist, IO_ERROR when it
     *         cannot be read, parse and validation errors otherwise
     */
    [[nodiscard]] static Result<BeaconConfig> loadFromFile(const std::filesystem::path& path);

private:
    static Result<void> parseInt(const std::string& key, const std::string& value, int& out) {
        auto parsed = string_utils::toInt<int>(string_utils::trim(value));
        if (!parsed) {
            return Err(ErrorCode::CONFIG_PARSE_ERROR, "Expected integer for " + key + ": " + value);
        }
        out = *parsed;
        return Ok();
    }

    static Result<void> parseBool(const std::string& key, const std::string& value, bool& out) {
        std::string lower = string_utils::toLower(value);
        if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
            out = true;
        } else if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
            out = false;
        } else {
            return Err(ErrorCode::CONFIG_PARSE_ERROR, "Expected boolean for " + key + ": " + value);
        }
        return Ok();
    }
};

//=============================================================================
// Configuration Validator
//=============================================================================

/**
 * @class ConfigValidator
 * @brief Validates MailBeacon configuration
 */
class ConfigValidator {
public:
    struct ValidationError {
        std::string field;
        std::string message;
    };

    [[nodiscard]] static Result<void> validate(const BeaconConfig& config) {
        std::vector<ValidationError> errors;

        if (config.server.port < 0 || config.server.port > 65535) {
            errors.push_back({"server.port", "Must be between 0 and 65535"});
        }
        if (config.server.bind_address.empty()) {
            errors.push_back({"server.bind_address", "Must not be empty"});
        }
        if (config.server.backlog <= 0) {
            errors.push_back({"server.backlog", "Must be positive"});
        }

        if (config.tracking.event_log.empty()) {
            errors.push_back({"storage.event_log", "Must not be empty"});
        }
        if (config.tracking.image_read_log.empty()) {
            errors.push_back({"storage.image_read_log", "Must not be empty"});
        }
        if (config.tracking.upload_dir.empty()) {
            errors.push_back({"storage.upload_dir", "Must not be empty"});
        }

        if (config.tracking.dedup_window_minutes < 0) {
            errors.push_back({"tracking.dedup_window_minutes", "Must not be negative"});
        }
        if (config.tracking.remote_timeout_seconds <= 0) {
            errors.push_back({"tracking.remote_timeout_seconds", "Must be positive"});
        }
        if (config.tracking.latest_default < 0) {
            errors.push_back({"tracking.latest_default", "Must not be negative"});
        }

        if (!parseLogLevel(config.logging.level)) {
            errors.push_back({"logging.level", "Invalid log level: " + config.logging.level});
        }

        if (!errors.empty()) {
            std::ostringstream oss;
            oss << "Configuration validation failed:\n";
            for (const auto& err : errors) {
                oss << "  - " << err.field << ": " << err.message << "\n";
            }
            return Err(ErrorCode::CONFIG_INVALID, oss.str());
        }

        return Ok();
    }
};

//=============================================================================
// Loading
//=============================================================================

inline Result<BeaconConfig> BeaconConfig::loadFromIni(const ini::IniFile& file) {
    for (std::size_t line : file.invalidLines()) {
        LOG_WARNING("Config", "Ignoring malformed line " + std::to_string(line));
    }
    BeaconConfig config;
    for (const auto& [sectionName, entries] : file.sections()) {
        for (const auto& [key, value] : entries) {
            auto set = config.setFromString(sectionName, key, value);
            if (!set) {
                return Err<BeaconConfig>(set.error());
            }
        }
    }
    auto valid = ConfigValidator::validate(config);
    if (!valid) {
        return Err<BeaconConfig>(valid.error());
    }
    return Ok(std::move(config));
}

inline Result<BeaconConfig> BeaconConfig::loadFromFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Err<BeaconConfig>(ErrorCode::CONFIG_MISSING, "Config file not found: " + path.string());
    }
    auto file = ini::IniFile::load(path);
    if (!file) {
        return Err<BeaconConfig>(ErrorCode::IO_ERROR, "Cannot read config file: " + path.string());
    }
    return loadFromIni(*file).withContext(path.string());
}

} // namespace mailbeacon
#endif
