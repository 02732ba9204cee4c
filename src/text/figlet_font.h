#ifndef FIGLET_FONT_H
#define FIGLET_FONT_H

#include <istream>
#include <map>
#include <string>
#include <vector>

// A parsed FIGlet (flf2a) font
struct FigletFont {
    char hardblank = '$';
    int height = 0;
    int baseline = 0;
    int maxLength = 0;
    int oldLayout = 0;
    int commentLines = 0;
    int printDirection = 0;
    int fullLayout = 0;
    int codetagCount = 0;
    std::map<char32_t, std::vector<std::string>> glyphs;  // each glyph has `height` rows

    bool hasGlyph(char32_t cp) const { return glyphs.find(cp) != glyphs.end(); }
};

// Parse a FIGlet font from a stream. Returns false and sets errorMsg on malformed input.
bool parseFigletFont(std::istream& in, FigletFont& font, std::string& errorMsg);

// Open and parse a .flf file
bool loadFigletFont(const std::string& path, FigletFont& font, std::string& errorMsg);

// Render UTF-8 text at full width (glyphs side by side, no smushing).
// Each input line becomes `height` output rows, right-trimmed and newline-terminated.
// Fails with "unsupported glyph U+XXXX" when the font lacks a character.
bool renderFigletText(const FigletFont& font, const std::string& text, std::string& out, std::string& errorMsg);

#endif // FIGLET_FONT_H
