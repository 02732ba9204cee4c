#ifndef RENDER_OPTIONS_H
#define RENDER_OPTIONS_H

#include "config.h"
#include <chrono>
#include <string>

// One render request. Built by the CLI or HTTP layer, validated, then passed by const reference.
struct RenderOptions {
    std::string font;        // empty = configured default font
    std::string color;       // unknown names select the default scheme
    int maxWidth = 0;        // 0 = unlimited
    int timeout = 0;         // seconds, 0 = server default
    int speed = 0;           // clamped into [minSpeed, maxSpeed]
    std::string align = "left";
    std::string border = "none";
};

// Options filled with the configured defaults
RenderOptions makeDefaultRenderOptions(const ShoutConfig& cfg);

bool isValidAlignment(const std::string& align);
bool isValidBorder(const std::string& border);
bool isValidFontName(const std::string& name);

// Reject options that can never be served. Speed is not checked here: it is clamped.
bool validateRenderOptions(const RenderOptions& opts, std::string& errorMsg);

int clampSpeed(int speed, const StreamingConfig& cfg);

// Delay between frames; higher speed means a shorter delay
std::chrono::milliseconds frameInterval(int speed, const StreamingConfig& cfg);

// min(requested or default timeout, server maximum)
std::chrono::milliseconds effectiveTimeout(int requestedSeconds, const StreamingConfig& cfg);

#endif // RENDER_OPTIONS_H
