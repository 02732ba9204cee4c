#ifndef TEST_FONTS_H
#define TEST_FONTS_H

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

// Build a small but complete flf2a font: every glyph is `width` copies of its own
// character on each of `height` rows ('$' draws as 'S' since '$' is the hardblank).
// Space is all hardblanks. Optionally appends a code-tagged glyph for U+2603.
inline std::string makeFigletFont(int height, int width, bool withCodeTag = false) {
    std::string font = "flf2a$ " + std::to_string(height) + " " + std::to_string(height - 1) + " " +
                       std::to_string(width + 2) + " 0 2 0 0 " + (withCodeTag ? "1" : "0") + "\n";
    font += "test font\n";
    font += "generated for unit tests\n";

    auto glyph = [&](const std::string& row) {
        std::string out;
        for (int r = 0; r < height; r++) {
            // '@' glyph rows use '#' as endmark so the glyph itself survives stripping
            char endmark = row[0] == '@' ? '#' : '@';
            out += row + endmark;
            if (r == height - 1) {
                out += endmark;
            }
            out += "\n";
        }
        return out;
    };

    for (int c = 32; c <= 126; c++) {
        char fill = static_cast<char>(c);
        if (c == ' ') {
            fill = '$';
        } else if (c == '$') {
            fill = 'S';
        }
        font += glyph(std::string(width, fill));
    }
    if (withCodeTag) {
        font += "0x2603  SNOWMAN\n";
        font += glyph(std::string(width, '*'));
    }
    return font;
}

// Temporary directory holding generated font files, removed after each test
class FontDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        dir_ = std::filesystem::temp_directory_path() /
               ("shout_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string writeFont(const std::string& name, const std::string& contents) {
        std::filesystem::path path = dir_ / (name + ".flf");
        std::ofstream out(path);
        out << contents;
        return path.string();
    }

    // "standard" is 3 rows x 2 columns per glyph, "doom" 4 rows x 3 columns
    void writeDefaultFonts() {
        writeFont("standard", makeFigletFont(3, 2));
        writeFont("doom", makeFigletFont(4, 3));
    }

    std::string dir() const { return dir_.string(); }

    std::filesystem::path dir_;
};

#endif // TEST_FONTS_H
