#include "render_options.h"
#include <algorithm>
#include <cctype>

namespace {
const size_t kMaxFontNameLength = 64;
}

RenderOptions makeDefaultRenderOptions(const ShoutConfig& cfg) {
    RenderOptions opts;
    opts.font = cfg.fonts.defaultFont;
    opts.speed = cfg.streaming.defaultSpeed;
    opts.align = cfg.text.defaultAlign;
    opts.border = cfg.text.defaultBorder;
    return opts;
}

bool isValidAlignment(const std::string& align) {
    return align == "left" || align == "center" || align == "right";
}

bool isValidBorder(const std::string& border) {
    return border == "none" || border == "single" || border == "double" ||
           border == "rounded" || border == "ascii";
}

bool isValidFontName(const std::string& name) {
    if (name.empty() || name.size() > kMaxFontNameLength) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_';
    });
}

bool validateRenderOptions(const RenderOptions& opts, std::string& errorMsg) {
    if (!opts.font.empty() && !isValidFontName(opts.font)) {
        errorMsg = "invalid font name: " + opts.font;
        return false;
    }
    if (!isValidAlignment(opts.align)) {
        errorMsg = "invalid alignment: must be left, center, or right";
        return false;
    }
    if (!isValidBorder(opts.border)) {
        errorMsg = "invalid border: must be none, single, double, rounded, or ascii";
        return false;
    }
    if (opts.maxWidth < 0) {
        errorMsg = "max width cannot be negative";
        return false;
    }
    if (opts.timeout < 0) {
        errorMsg = "timeout cannot be negative";
        return false;
    }
    return true;
}

int clampSpeed(int speed, const StreamingConfig& cfg) {
    return std::clamp(speed, cfg.minSpeed, cfg.maxSpeed);
}

std::chrono::milliseconds frameInterval(int speed, const StreamingConfig& cfg) {
    return cfg.baseFrameInterval / clampSpeed(speed, cfg);
}

std::chrono::milliseconds effectiveTimeout(int requestedSeconds, const StreamingConfig& cfg) {
    std::chrono::milliseconds requested = requestedSeconds > 0
        ? std::chrono::milliseconds(std::chrono::seconds(requestedSeconds))
        : cfg.defaultTimeout;
    return std::min(requested, cfg.maxTimeout);
}
