#include "color_schemes.h"
#include "../utils/string_utils.h"
#include <cstdio>

const char* const kDefaultColorScheme = "rainbow";

const char* const kAnsiClearScreen = "\033[2J\033[H";
const char* const kAnsiCursorHome = "\033[H";
const char* const kAnsiReset = "\033[0m";
const char* const kAnsiHideCursor = "\033[?25l";
const char* const kAnsiShowCursor = "\033[?25h";

namespace {

// Diagonal bands sliding right
size_t rainbowIndex(uint64_t frame, size_t line, size_t column) {
    return static_cast<size_t>(frame + line + column / 2);
}

// Flames rising: color depends on row, moving upwards with time
size_t fireIndex(uint64_t frame, size_t line, size_t column) {
    return static_cast<size_t>(frame + (column % 3) + 64 - (line % 64));
}

// Slow horizontal swell
size_t oceanIndex(uint64_t frame, size_t line, size_t column) {
    return static_cast<size_t>(frame / 2 + column / 4 + line / 2);
}

// Columns falling at different rates
size_t matrixIndex(uint64_t frame, size_t line, size_t column) {
    return static_cast<size_t>(frame * (1 + column % 3) + 64 - (line % 64));
}

// Whole block pulses in one color
size_t neonIndex(uint64_t frame, size_t, size_t) {
    return static_cast<size_t>(frame);
}

// Grayscale sweep
size_t monoIndex(uint64_t frame, size_t line, size_t column) {
    return static_cast<size_t>(frame + column + line);
}

const std::vector<ColorScheme>& schemes() {
    static const std::vector<ColorScheme> kSchemes = {
        {"rainbow", {196, 208, 226, 46, 51, 21, 93, 201}, rainbowIndex},
        {"fire", {52, 88, 124, 160, 196, 202, 208, 214, 220, 226}, fireIndex},
        {"ocean", {17, 18, 19, 20, 21, 27, 33, 39, 45, 51, 45, 39, 33, 27, 21, 20, 19, 18}, oceanIndex},
        {"matrix", {22, 28, 34, 40, 46, 82, 118, 46, 34}, matrixIndex},
        {"neon", {201, 165, 129, 93, 57, 51, 57, 93, 129, 165}, neonIndex},
        {"mono", {232, 236, 240, 244, 248, 252, 255, 252, 248, 244, 240, 236}, monoIndex},
    };
    return kSchemes;
}

} // namespace

const ColorScheme& findColorScheme(const std::string& name) {
    const std::string wanted = toLowerAscii(name);
    const ColorScheme* fallback = nullptr;
    for (const auto& scheme : schemes()) {
        if (wanted == scheme.name) {
            return scheme;
        }
        if (std::string(kDefaultColorScheme) == scheme.name) {
            fallback = &scheme;
        }
    }
    return *fallback;
}

bool isKnownColorScheme(const std::string& name) {
    const std::string wanted = toLowerAscii(name);
    for (const auto& scheme : schemes()) {
        if (wanted == scheme.name) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> listColorSchemes() {
    std::vector<std::string> names;
    for (const auto& scheme : schemes()) {
        names.push_back(scheme.name);
    }
    return names;
}

std::string colorizeFrame(const std::vector<std::string>& lines, const ColorScheme& scheme, uint64_t frame) {
    std::string out;
    char code[16];
    for (size_t line = 0; line < lines.size(); line++) {
        const std::string& text = lines[line];
        size_t column = 0;
        size_t i = 0;
        while (i < text.size()) {
            // Keep multi-byte UTF-8 sequences (border glyphs) together as one cell
            size_t len = 1;
            while (i + len < text.size() && (static_cast<unsigned char>(text[i + len]) & 0xC0) == 0x80) {
                len++;
            }
            const char ch = text[i];
            if (ch == ' ' || ch == '\t') {
                out += ch;
            } else {
                std::snprintf(code, sizeof(code), "\033[38;5;%dm", scheme.colorAt(frame, line, column));
                out += code;
                out.append(text, i, len);
            }
            i += len;
            column++;
        }
        out += kAnsiReset;
        out += '\n';
    }
    return out;
}
