#ifndef ASCII_RENDER_H
#define ASCII_RENDER_H

#include "font_cache.h"
#include "../core/render_options.h"
#include <string>

// Font used when the requested one is not loaded
extern const char* const kDefaultFontName;

enum class RenderStatus {
    Ok,
    NoCache,          // cache handle missing (wiring bug)
    NoFontsLoaded,    // neither requested nor default font present
    RenderFailure     // glyph generation failed (errorMsg has the cause)
};

const char* renderStatusName(RenderStatus status);

// Render text as glyph art with opts.font, falling back to defaultFont.
// Empty text yields empty art and RenderStatus::Ok. Read-only on the cache,
// safe to call from any number of threads.
RenderStatus generateAscii(
    const std::string& text,
    const RenderOptions& opts,
    const FontCache* cache,
    std::string& art,
    std::string& errorMsg,
    const std::string& defaultFont = kDefaultFontName
);

#endif // ASCII_RENDER_H
