#include "config.h"
#include "render_options.h"
#include "../utils/logging.h"
#include "../utils/string_utils.h"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace {

bool parseIntValue(const std::string& name, const std::string& value, int& out, std::string& errorMsg) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            errorMsg = name + " is not an integer: " + value;
            return false;
        }
        out = parsed;
        return true;
    } catch (const std::exception&) {
        errorMsg = name + " is not an integer: " + value;
        return false;
    }
}

bool parseSecondsValue(const std::string& name, const std::string& value,
                       std::chrono::milliseconds& out, std::string& errorMsg) {
    int seconds = 0;
    if (!parseIntValue(name, value, seconds, errorMsg)) {
        return false;
    }
    out = std::chrono::seconds(seconds);
    return true;
}

std::vector<std::string> parseNameList(const std::string& value) {
    std::vector<std::string> names;
    for (const auto& part : splitString(value, ',')) {
        std::string name = trimString(part);
        if (!name.empty()) {
            names.push_back(name);
        }
    }
    return names;
}

const char* envValue(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

template <typename T>
void readJsonField(const nlohmann::json& section, const char* key, T& out) {
    if (section.contains(key)) {
        out = section.at(key).get<T>();
    }
}

void readJsonSeconds(const nlohmann::json& section, const char* key, std::chrono::milliseconds& out) {
    if (section.contains(key)) {
        out = std::chrono::seconds(section.at(key).get<int>());
    }
}

} // namespace

bool loadConfigFile(const std::string& path, ShoutConfig& cfg, std::string& errorMsg) {
    std::ifstream file(path);
    if (!file.is_open()) {
        errorMsg = "Could not open config file: " + path;
        return false;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);

        if (j.contains("server")) {
            const auto& s = j.at("server");
            readJsonField(s, "host", cfg.server.host);
            readJsonField(s, "publicPort", cfg.server.publicPort);
            readJsonField(s, "adminPort", cfg.server.adminPort);
            readJsonSeconds(s, "shutdownGrace", cfg.server.shutdownGrace);
        }
        if (j.contains("rateLimit")) {
            const auto& r = j.at("rateLimit");
            readJsonField(r, "requestsPerMinute", cfg.rateLimit.requestsPerMinute);
            readJsonField(r, "burst", cfg.rateLimit.burst);
        }
        if (j.contains("fonts")) {
            const auto& f = j.at("fonts");
            readJsonField(f, "directory", cfg.fonts.directory);
            readJsonField(f, "defaultFont", cfg.fonts.defaultFont);
            readJsonField(f, "allowed", cfg.fonts.allowed);
        }
        if (j.contains("streaming")) {
            const auto& st = j.at("streaming");
            readJsonField(st, "maxConcurrentStreams", cfg.streaming.maxConcurrentStreams);
            readJsonSeconds(st, "defaultTimeout", cfg.streaming.defaultTimeout);
            readJsonSeconds(st, "maxTimeout", cfg.streaming.maxTimeout);
            readJsonField(st, "defaultSpeed", cfg.streaming.defaultSpeed);
            readJsonField(st, "minSpeed", cfg.streaming.minSpeed);
            readJsonField(st, "maxSpeed", cfg.streaming.maxSpeed);
        }
        if (j.contains("text")) {
            const auto& t = j.at("text");
            readJsonField(t, "maxLength", cfg.text.maxLength);
            readJsonField(t, "defaultAlign", cfg.text.defaultAlign);
            readJsonField(t, "defaultBorder", cfg.text.defaultBorder);
        }
    } catch (const nlohmann::json::exception& e) {
        errorMsg = "Invalid config file " + path + ": " + e.what();
        return false;
    }

    LOG_DEBUG("Loaded config file: " << path);
    return true;
}

bool applyEnvironment(ShoutConfig& cfg, std::string& errorMsg) {
    struct IntVar {
        const char* name;
        int* target;
    };
    const IntVar intVars[] = {
        {"SHOUT_SERVER_PUBLIC_PORT", &cfg.server.publicPort},
        {"SHOUT_SERVER_ADMIN_PORT", &cfg.server.adminPort},
        {"SHOUT_RATELIMIT_REQUESTS_PER_MINUTE", &cfg.rateLimit.requestsPerMinute},
        {"SHOUT_RATELIMIT_BURST", &cfg.rateLimit.burst},
        {"SHOUT_STREAMING_MAX_CONCURRENT", &cfg.streaming.maxConcurrentStreams},
        {"SHOUT_STREAMING_DEFAULT_SPEED", &cfg.streaming.defaultSpeed},
        {"SHOUT_TEXT_MAX_LENGTH", &cfg.text.maxLength},
    };
    for (const auto& var : intVars) {
        if (const char* value = envValue(var.name)) {
            if (!parseIntValue(var.name, value, *var.target, errorMsg)) {
                return false;
            }
        }
    }

    struct SecondsVar {
        const char* name;
        std::chrono::milliseconds* target;
    };
    const SecondsVar secondsVars[] = {
        {"SHOUT_SERVER_SHUTDOWN_GRACE", &cfg.server.shutdownGrace},
        {"SHOUT_STREAMING_DEFAULT_TIMEOUT", &cfg.streaming.defaultTimeout},
        {"SHOUT_STREAMING_MAX_TIMEOUT", &cfg.streaming.maxTimeout},
    };
    for (const auto& var : secondsVars) {
        if (const char* value = envValue(var.name)) {
            if (!parseSecondsValue(var.name, value, *var.target, errorMsg)) {
                return false;
            }
        }
    }

    if (const char* value = envValue("SHOUT_SERVER_HOST")) cfg.server.host = value;
    if (const char* value = envValue("SHOUT_FONTS_PATH")) cfg.fonts.directory = value;
    if (const char* value = envValue("SHOUT_FONTS_DEFAULT")) cfg.fonts.defaultFont = value;
    if (const char* value = envValue("SHOUT_FONTS_ALLOWED")) cfg.fonts.allowed = parseNameList(value);
    if (const char* value = envValue("SHOUT_TEXT_DEFAULT_ALIGN")) cfg.text.defaultAlign = value;
    if (const char* value = envValue("SHOUT_TEXT_DEFAULT_BORDER")) cfg.text.defaultBorder = value;

    return true;
}

bool validateConfig(const ShoutConfig& cfg, std::string& errorMsg) {
    if (cfg.server.publicPort < 1 || cfg.server.publicPort > 65535) {
        errorMsg = "invalid port: public port must be between 1 and 65535, got " + std::to_string(cfg.server.publicPort);
        return false;
    }
    if (cfg.server.adminPort < 1 || cfg.server.adminPort > 65535) {
        errorMsg = "invalid port: admin port must be between 1 and 65535, got " + std::to_string(cfg.server.adminPort);
        return false;
    }
    if (cfg.server.shutdownGrace.count() < 0) {
        errorMsg = "shutdown grace cannot be negative";
        return false;
    }
    if (cfg.rateLimit.requestsPerMinute < 1) {
        errorMsg = "rate limit must be positive, got " + std::to_string(cfg.rateLimit.requestsPerMinute);
        return false;
    }
    if (cfg.rateLimit.burst < 1) {
        errorMsg = "rate limit burst must be positive, got " + std::to_string(cfg.rateLimit.burst);
        return false;
    }
    if (cfg.text.maxLength < 1) {
        errorMsg = "max text length must be positive, got " + std::to_string(cfg.text.maxLength);
        return false;
    }
    if (!isValidAlignment(cfg.text.defaultAlign)) {
        errorMsg = "invalid alignment: must be left, center, or right, got " + cfg.text.defaultAlign;
        return false;
    }
    if (!isValidBorder(cfg.text.defaultBorder)) {
        errorMsg = "invalid border: " + cfg.text.defaultBorder;
        return false;
    }
    if (cfg.fonts.defaultFont.empty()) {
        errorMsg = "default font name cannot be empty";
        return false;
    }
    if (cfg.streaming.defaultTimeout.count() <= 0) {
        errorMsg = "streaming timeout must be positive";
        return false;
    }
    if (cfg.streaming.maxTimeout < cfg.streaming.defaultTimeout) {
        errorMsg = "max timeout must be >= default timeout";
        return false;
    }
    if (cfg.streaming.minSpeed < 1 || cfg.streaming.minSpeed > cfg.streaming.maxSpeed) {
        errorMsg = "speed range invalid: min=" + std::to_string(cfg.streaming.minSpeed) +
                   ", max=" + std::to_string(cfg.streaming.maxSpeed);
        return false;
    }
    if (cfg.streaming.defaultSpeed < cfg.streaming.minSpeed || cfg.streaming.defaultSpeed > cfg.streaming.maxSpeed) {
        errorMsg = "streaming speed must be between " + std::to_string(cfg.streaming.minSpeed) + " and " +
                   std::to_string(cfg.streaming.maxSpeed) + ", got " + std::to_string(cfg.streaming.defaultSpeed);
        return false;
    }
    if (cfg.streaming.baseFrameInterval.count() <= 0) {
        errorMsg = "frame interval must be positive";
        return false;
    }
    if (cfg.streaming.maxConcurrentStreams < 1) {
        errorMsg = "max concurrent streams must be positive, got " + std::to_string(cfg.streaming.maxConcurrentStreams);
        return false;
    }
    return true;
}
