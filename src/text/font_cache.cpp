#include "font_cache.h"
#include "../utils/logging.h"
#include <filesystem>
#include <fstream>
#include <utility>

const char* const kFontExtension = ".flf";

Font::Font(std::string name, std::string path)
    : name_(std::move(name)), path_(std::move(path)) {}

const FigletFont* Font::glyphs(std::string& errorMsg) const {
    std::call_once(load_once_, [this] {
        std::string error;
        if (!loadFigletFont(path_, figlet_, error)) {
            load_error_ = error;
            LOG_CERR("[ERROR] Could not parse font " << name_ << ": " << error) << std::endl;
        } else {
            LOG_DEBUG("Parsed font " << name_ << " (" << figlet_.glyphs.size() << " glyphs, height "
                      << figlet_.height << ")");
        }
    });
    if (!load_error_.empty()) {
        errorMsg = load_error_;
        return nullptr;
    }
    return &figlet_;
}

bool Font::render(const std::string& text, std::string& out, std::string& errorMsg) const {
    const FigletFont* figlet = glyphs(errorMsg);
    if (!figlet) {
        return false;
    }
    return renderFigletText(*figlet, text, out, errorMsg);
}

bool validateFontFile(const std::string& path, std::string& errorMsg) {
    std::error_code ec;
    std::filesystem::file_status status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        errorMsg = "font file does not exist: " + path;
        return false;
    }
    if (std::filesystem::is_directory(status)) {
        errorMsg = "font path is a directory, not a file: " + path;
        return false;
    }
    if (!std::filesystem::is_regular_file(status)) {
        errorMsg = "font path is not a regular file: " + path;
        return false;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        errorMsg = "cannot read font file: " + path;
        return false;
    }
    return true;
}

size_t FontCache::populate(const std::string& directory, const std::vector<std::string>& allowedNames) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    size_t loadedCount = 0;
    for (const auto& fontName : allowedNames) {
        std::string fontPath = (std::filesystem::path(directory) / (fontName + kFontExtension)).string();

        std::string error;
        if (!validateFontFile(fontPath, error)) {
            LOG_CERR("[WARNING] Could not load font " << fontName << ": " << error) << std::endl;
            continue;
        }
        if (fonts_.count(fontName) != 0) {
            LOG_DEBUG("Font already loaded, keeping existing entry: " << fontName);
            continue;
        }

        fonts_.emplace(fontName, std::make_shared<const Font>(fontName, fontPath));
        loadedCount++;
        LOG_DEBUG("Loaded font: " << fontName);
    }

    LOG_COUT("[INFO] Loaded " << loadedCount << " fonts successfully") << std::endl;
    return loadedCount;
}

std::shared_ptr<const Font> FontCache::lookup(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = fonts_.find(name);
    return it != fonts_.end() ? it->second : nullptr;
}

std::shared_ptr<const Font> FontCache::lookupOrDefault(const std::string& name, const std::string& defaultName) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = fonts_.find(name);
    if (it != fonts_.end()) {
        return it->second;
    }
    it = fonts_.find(defaultName);
    if (it != fonts_.end()) {
        return it->second;
    }
    return nullptr;
}

std::vector<std::string> FontCache::list() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(fonts_.size());
    // std::map iterates in sorted key order
    for (const auto& entry : fonts_) {
        names.push_back(entry.first);
    }
    return names;
}

size_t FontCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return fonts_.size();
}
