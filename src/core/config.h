#ifndef CONFIG_H
#define CONFIG_H

#include <chrono>
#include <string>
#include <vector>

// HTTP listener settings
struct ServerConfig {
    std::string host = "0.0.0.0";
    int publicPort = 8080;
    int adminPort = 9090;
    std::chrono::milliseconds shutdownGrace{10000};
};

// Per-client request rate
struct RateLimitConfig {
    int requestsPerMinute = 100;
    int burst = 10;
};

struct FontConfig {
    std::string directory = "./fonts";
    std::string defaultFont = "standard";
    std::vector<std::string> allowed = {
        "standard", "doom", "banner", "slant", "3d", "speed", "starwars"
    };
};

// Animated stream limits. Durations are kept in milliseconds so that tests can run
// sub-second streams; the config surfaces take whole seconds.
struct StreamingConfig {
    int maxConcurrentStreams = 100;
    std::chrono::milliseconds defaultTimeout{30000};
    std::chrono::milliseconds maxTimeout{300000};
    int defaultSpeed = 5;
    int minSpeed = 1;
    int maxSpeed = 10;
    // Delay between frames at speed 1; speed N waits baseFrameInterval / N
    std::chrono::milliseconds baseFrameInterval{500};
};

struct TextConfig {
    int maxLength = 100;
    std::string defaultAlign = "center";
    std::string defaultBorder = "none";
};

struct ShoutConfig {
    ServerConfig server;
    RateLimitConfig rateLimit;
    FontConfig fonts;
    StreamingConfig streaming;
    TextConfig text;
};

// Apply a JSON config file on top of cfg.
// Returns false (and sets errorMsg) if the file cannot be read or has a bad value.
bool loadConfigFile(const std::string& path, ShoutConfig& cfg, std::string& errorMsg);

// Apply SHOUT_* environment variables on top of cfg
bool applyEnvironment(ShoutConfig& cfg, std::string& errorMsg);

// Check ranges and cross-field constraints
bool validateConfig(const ShoutConfig& cfg, std::string& errorMsg);

#endif // CONFIG_H
