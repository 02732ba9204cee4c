#ifndef TEXT_LAYOUT_H
#define TEXT_LAYOUT_H

#include "ascii_render.h"
#include <string>
#include <vector>

// Widest line, counted in code points
int blockWidth(const std::vector<std::string>& lines);

// Pad every line to `width` columns using left/center/right alignment
std::vector<std::string> alignLines(const std::vector<std::string>& lines, const std::string& align, int width);

// Surround the block with a frame (none/single/double/rounded/ascii) and one column of padding
std::vector<std::string> drawBorder(const std::vector<std::string>& lines, const std::string& border);

// Greedy word wrap: pack words into text lines whose rendered art fits maxWidth.
// A single word wider than maxWidth gets its own line.
RenderStatus wrapTextToWidth(
    const std::string& text,
    const RenderOptions& opts,
    const FontCache* cache,
    const std::string& defaultFont,
    std::string& wrapped,
    std::string& errorMsg
);

// Full pipeline used by both delivery modes: wrap, render, align, border
RenderStatus renderLayout(
    const std::string& text,
    const RenderOptions& opts,
    const FontCache* cache,
    const std::string& defaultFont,
    std::string& art,
    std::string& errorMsg
);

#endif // TEXT_LAYOUT_H
