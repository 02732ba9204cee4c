#include "text_layout.h"
#include "../utils/logging.h"
#include "../utils/string_utils.h"
#include <algorithm>

namespace {

struct BorderGlyphs {
    const char* topLeft;
    const char* horizontal;
    const char* topRight;
    const char* vertical;
    const char* bottomLeft;
    const char* bottomRight;
};

bool borderGlyphs(const std::string& border, BorderGlyphs& glyphs) {
    if (border == "single") {
        glyphs = {"┌", "─", "┐", "│", "└", "┘"};
    } else if (border == "double") {
        glyphs = {"╔", "═", "╗", "║", "╚", "╝"};
    } else if (border == "rounded") {
        glyphs = {"╭", "─", "╮", "│", "╰", "╯"};
    } else if (border == "ascii") {
        glyphs = {"+", "-", "+", "|", "+", "+"};
    } else {
        return false;
    }
    return true;
}

std::string repeat(const char* s, int count) {
    std::string out;
    for (int i = 0; i < count; i++) {
        out += s;
    }
    return out;
}

int artWidth(const std::string& art) {
    return blockWidth(splitLines(art));
}

} // namespace

int blockWidth(const std::vector<std::string>& lines) {
    int width = 0;
    for (const auto& line : lines) {
        width = std::max(width, static_cast<int>(utf8Length(line)));
    }
    return width;
}

std::vector<std::string> alignLines(const std::vector<std::string>& lines, const std::string& align, int width) {
    std::vector<std::string> out;
    out.reserve(lines.size());
    for (const auto& line : lines) {
        int pad = std::max(0, width - static_cast<int>(utf8Length(line)));
        int left = 0;
        if (align == "center") {
            left = pad / 2;
        } else if (align == "right") {
            left = pad;
        }
        out.push_back(std::string(left, ' ') + line + std::string(pad - left, ' '));
    }
    return out;
}

std::vector<std::string> drawBorder(const std::vector<std::string>& lines, const std::string& border) {
    BorderGlyphs g;
    if (!borderGlyphs(border, g)) {
        return lines;
    }
    const int width = blockWidth(lines);
    std::vector<std::string> out;
    out.reserve(lines.size() + 2);
    out.push_back(std::string(g.topLeft) + repeat(g.horizontal, width + 2) + g.topRight);
    for (const auto& line : alignLines(lines, "left", width)) {
        out.push_back(std::string(g.vertical) + " " + line + " " + g.vertical);
    }
    out.push_back(std::string(g.bottomLeft) + repeat(g.horizontal, width + 2) + g.bottomRight);
    return out;
}

RenderStatus wrapTextToWidth(
    const std::string& text,
    const RenderOptions& opts,
    const FontCache* cache,
    const std::string& defaultFont,
    std::string& wrapped,
    std::string& errorMsg
) {
    wrapped.clear();
    std::vector<std::string> outLines;
    std::string art;

    for (const auto& inputLine : splitLines(text)) {
        std::string current;
        for (const auto& word : splitString(inputLine, ' ')) {
            if (word.empty()) {
                continue;
            }
            if (current.empty()) {
                current = word;
                continue;
            }
            std::string candidate = current + " " + word;
            RenderStatus status = generateAscii(candidate, opts, cache, art, errorMsg, defaultFont);
            if (status != RenderStatus::Ok) {
                return status;
            }
            if (artWidth(art) <= opts.maxWidth) {
                current = candidate;
            } else {
                outLines.push_back(current);
                current = word;
            }
        }
        outLines.push_back(current);
    }

    for (size_t i = 0; i < outLines.size(); i++) {
        if (i > 0) {
            wrapped += '\n';
        }
        wrapped += outLines[i];
    }
    return RenderStatus::Ok;
}

RenderStatus renderLayout(
    const std::string& text,
    const RenderOptions& opts,
    const FontCache* cache,
    const std::string& defaultFont,
    std::string& art,
    std::string& errorMsg
) {
    std::string source = text;
    if (opts.maxWidth > 0 && !text.empty()) {
        RenderStatus status = wrapTextToWidth(text, opts, cache, defaultFont, source, errorMsg);
        if (status != RenderStatus::Ok) {
            art.clear();
            return status;
        }
        LOG_DEBUG("Wrapped text to width " << opts.maxWidth << ": \"" << source << "\"");
    }

    RenderStatus status = generateAscii(source, opts, cache, art, errorMsg, defaultFont);
    if (status != RenderStatus::Ok || art.empty()) {
        return status;
    }

    std::vector<std::string> lines = splitLines(art);
    int width = blockWidth(lines);
    if (opts.maxWidth > 0) {
        width = std::max(width, opts.maxWidth);
    }
    if (opts.align != "left" || opts.border != "none") {
        lines = alignLines(lines, opts.align, width);
    }
    lines = drawBorder(lines, opts.border);

    art = joinLines(lines);
    return RenderStatus::Ok;
}
