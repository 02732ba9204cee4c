#ifndef FONT_CACHE_H
#define FONT_CACHE_H

#include "figlet_font.h"
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

// File extension of FIGlet font files
extern const char* const kFontExtension;

// One loadable glyph set. The file is parsed on first render, exactly once;
// after that the font is read-only and can be shared between threads.
class Font {
public:
    Font(std::string name, std::string path);

    const std::string& name() const { return name_; }
    const std::string& path() const { return path_; }

    // Render text with this font. Returns false and sets errorMsg on failure
    // (unparseable file, unsupported glyph).
    bool render(const std::string& text, std::string& out, std::string& errorMsg) const;

private:
    const FigletFont* glyphs(std::string& errorMsg) const;

    std::string name_;
    std::string path_;
    mutable std::once_flag load_once_;
    mutable FigletFont figlet_;
    mutable std::string load_error_;
};

// Process-wide name -> Font map. Population takes the write lock; lookups
// share the read lock, so concurrent renders never block each other.
class FontCache {
public:
    FontCache() = default;
    FontCache(const FontCache&) = delete;
    FontCache& operator=(const FontCache&) = delete;

    // Register directory/<name>.flf for every allowed name that validates.
    // Invalid files are skipped with a warning. Never fails; returns how many
    // fonts were added. Names already present keep their existing Font.
    size_t populate(const std::string& directory, const std::vector<std::string>& allowedNames);

    // nullptr if the name is not loaded
    std::shared_ptr<const Font> lookup(const std::string& name) const;

    // Named font, else the default, else nullptr (no fonts loaded at all)
    std::shared_ptr<const Font> lookupOrDefault(const std::string& name, const std::string& defaultName) const;

    // Sorted snapshot of the loaded names
    std::vector<std::string> list() const;

    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<const Font>> fonts_;
};

// Check that a font file exists, is a regular file and can be opened for reading
bool validateFontFile(const std::string& path, std::string& errorMsg);

#endif // FONT_CACHE_H
