#ifndef COLOR_SCHEMES_H
#define COLOR_SCHEMES_H

#include <cstdint>
#include <string>
#include <vector>

// Name of the scheme used for empty or unknown names
extern const char* const kDefaultColorScheme;

// A palette of xterm-256 color codes plus a pure index function of
// (frame, line, column). Same inputs always give the same color.
struct ColorScheme {
    const char* name;
    std::vector<int> palette;
    size_t (*index)(uint64_t frame, size_t line, size_t column);

    int colorAt(uint64_t frame, size_t line, size_t column) const {
        return palette[index(frame, line, column) % palette.size()];
    }
};

// Look up a scheme by name (case-insensitive); unknown names return the default scheme
const ColorScheme& findColorScheme(const std::string& name);

bool isKnownColorScheme(const std::string& name);

std::vector<std::string> listColorSchemes();

// ANSI control sequences used while streaming
extern const char* const kAnsiClearScreen;
extern const char* const kAnsiCursorHome;
extern const char* const kAnsiReset;
extern const char* const kAnsiHideCursor;
extern const char* const kAnsiShowCursor;

// Recolor every non-whitespace code point of the art for one frame.
// Whitespace is copied through uncolored; each line ends with a color reset.
std::string colorizeFrame(const std::vector<std::string>& lines, const ColorScheme& scheme, uint64_t frame);

#endif // COLOR_SCHEMES_H
