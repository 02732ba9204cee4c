#include "ascii_render.h"
#include "../utils/logging.h"

const char* const kDefaultFontName = "standard";

const char* renderStatusName(RenderStatus status) {
    switch (status) {
        case RenderStatus::Ok: return "ok";
        case RenderStatus::NoCache: return "font cache is nil";
        case RenderStatus::NoFontsLoaded: return "no fonts loaded";
        case RenderStatus::RenderFailure: return "failed to render text";
    }
    return "unknown";
}

RenderStatus generateAscii(
    const std::string& text,
    const RenderOptions& opts,
    const FontCache* cache,
    std::string& art,
    std::string& errorMsg,
    const std::string& defaultFont
) {
    art.clear();
    if (cache == nullptr) {
        errorMsg = renderStatusName(RenderStatus::NoCache);
        return RenderStatus::NoCache;
    }

    if (text.empty()) {
        return RenderStatus::Ok;
    }

    std::shared_ptr<const Font> font = cache->lookupOrDefault(opts.font, defaultFont);
    if (!font) {
        errorMsg = renderStatusName(RenderStatus::NoFontsLoaded);
        return RenderStatus::NoFontsLoaded;
    }
    if (font->name() != opts.font) {
        LOG_DEBUG("Font '" << opts.font << "' not loaded, using " << font->name());
    }

    std::string cause;
    if (!font->render(text, art, cause)) {
        art.clear();
        errorMsg = std::string(renderStatusName(RenderStatus::RenderFailure)) + ": " + cause;
        return RenderStatus::RenderFailure;
    }
    return RenderStatus::Ok;
}
