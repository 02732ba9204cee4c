#include "figlet_font.h"
#include "../utils/string_utils.h"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace {

const char* const kSignature = "flf2a";

// Deutsch characters that follow the 95 ASCII glyphs, in file order
const char32_t kDeutschCodes[] = {196, 214, 220, 228, 246, 252, 223};

bool readLine(std::istream& in, std::string& line) {
    if (!std::getline(in, line)) {
        return false;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

// Strip trailing whitespace, then every trailing copy of the endmark character
std::string stripEndmarks(const std::string& row) {
    std::string out = trimRight(row);
    if (out.empty()) {
        return out;
    }
    const char endmark = out.back();
    while (!out.empty() && out.back() == endmark) {
        out.pop_back();
    }
    return out;
}

bool readGlyph(std::istream& in, int height, std::vector<std::string>& rows) {
    rows.clear();
    std::string line;
    for (int i = 0; i < height; i++) {
        if (!readLine(in, line)) {
            return false;
        }
        rows.push_back(stripEndmarks(line));
    }
    return true;
}

// Code tags are decimal, 0x-prefixed hex or 0-prefixed octal; negative codes are
// reserved for translation tables and are skipped by the caller
bool parseCodeTag(const std::string& line, long& code) {
    std::string token;
    std::istringstream iss(line);
    if (!(iss >> token)) {
        return false;
    }
    char* end = nullptr;
    code = std::strtol(token.c_str(), &end, 0);
    return end != token.c_str() && *end == '\0';
}

std::string formatCodePoint(char32_t cp) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(cp));
    return buf;
}

} // namespace

bool parseFigletFont(std::istream& in, FigletFont& font, std::string& errorMsg) {
    std::string header;
    if (!readLine(in, header)) {
        errorMsg = "empty font file";
        return false;
    }
    if (header.size() < 6 || header.compare(0, 5, kSignature) != 0) {
        errorMsg = "missing flf2a signature";
        return false;
    }
    font.hardblank = header[5];

    std::istringstream fields(header.substr(6));
    if (!(fields >> font.height >> font.baseline >> font.maxLength >> font.oldLayout >> font.commentLines)) {
        errorMsg = "malformed font header";
        return false;
    }
    // Optional trailing fields
    if (fields >> font.printDirection) {
        if (fields >> font.fullLayout) {
            fields >> font.codetagCount;
        }
    }
    if (font.height < 1) {
        errorMsg = "font height must be positive";
        return false;
    }

    std::string line;
    for (int i = 0; i < font.commentLines; i++) {
        if (!readLine(in, line)) {
            errorMsg = "font ends inside the comment block";
            return false;
        }
    }

    std::vector<std::string> rows;
    for (char32_t cp = 32; cp <= 126; cp++) {
        if (!readGlyph(in, font.height, rows)) {
            errorMsg = "font is missing required glyph " + formatCodePoint(cp);
            return false;
        }
        font.glyphs[cp] = rows;
    }

    // The Deutsch block is optional in practice; stop quietly at end of file
    for (char32_t cp : kDeutschCodes) {
        if (!readGlyph(in, font.height, rows)) {
            return true;
        }
        font.glyphs[cp] = rows;
    }

    while (readLine(in, line)) {
        if (trimString(line).empty()) {
            continue;
        }
        long code = 0;
        if (!parseCodeTag(line, code)) {
            errorMsg = "malformed code tag: " + line;
            return false;
        }
        if (!readGlyph(in, font.height, rows)) {
            errorMsg = "font ends inside code-tagged glyph " + std::to_string(code);
            return false;
        }
        if (code >= 0) {
            font.glyphs[static_cast<char32_t>(code)] = rows;
        }
    }

    return true;
}

bool loadFigletFont(const std::string& path, FigletFont& font, std::string& errorMsg) {
    std::ifstream file(path);
    if (!file.is_open()) {
        errorMsg = "failed to open font file: " + path;
        return false;
    }
    if (!parseFigletFont(file, font, errorMsg)) {
        errorMsg = path + ": " + errorMsg;
        return false;
    }
    return true;
}

bool renderFigletText(const FigletFont& font, const std::string& text, std::string& out, std::string& errorMsg) {
    out.clear();
    for (const auto& textLine : splitLines(text)) {
        std::vector<char32_t> codePoints;
        if (!decodeUtf8(textLine, codePoints)) {
            errorMsg = "text is not valid UTF-8";
            return false;
        }
        if (codePoints.empty()) {
            out += '\n';
            continue;
        }

        std::vector<std::string> rows(font.height);
        for (char32_t cp : codePoints) {
            if (cp == '\t') {
                cp = ' ';
            }
            auto it = font.glyphs.find(cp);
            if (it == font.glyphs.end()) {
                errorMsg = "unsupported glyph " + formatCodePoint(cp);
                return false;
            }
            for (int r = 0; r < font.height; r++) {
                rows[r] += it->second[r];
            }
        }

        for (auto& row : rows) {
            replaceCharInPlace(row, font.hardblank, ' ');
            out += trimRight(row);
            out += '\n';
        }
    }
    return true;
}
