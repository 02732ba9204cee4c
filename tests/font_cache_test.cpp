#include "text/font_cache.h"
#include "test_fonts.h"
#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <thread>
#include <vector>

class FontCacheTest : public FontDirTest {};

TEST_F(FontCacheTest, SkipsMissingFilesAndReportsCount) {
    writeDefaultFonts();
    FontCache cache;
    size_t loaded = cache.populate(dir(), {"standard", "doom", "missing-file"});

    EXPECT_EQ(loaded, 2u);
    EXPECT_EQ(cache.list(), (std::vector<std::string>{"doom", "standard"}));
    EXPECT_EQ(cache.lookup("missing-file"), nullptr);
}

TEST_F(FontCacheTest, ZeroFontsIsNotAnError) {
    FontCache cache;
    EXPECT_EQ(cache.populate(dir(), {"nothing", "here"}), 0u);
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_TRUE(cache.list().empty());
}

TEST_F(FontCacheTest, SkipsDirectoriesNamedLikeFonts) {
    writeDefaultFonts();
    std::filesystem::create_directories(dir_ / "folder.flf");
    FontCache cache;
    EXPECT_EQ(cache.populate(dir(), {"folder", "standard"}), 1u);
    EXPECT_EQ(cache.lookup("folder"), nullptr);
}

TEST_F(FontCacheTest, LookupReturnsFontWithNameAndPath) {
    writeDefaultFonts();
    FontCache cache;
    cache.populate(dir(), {"doom"});

    auto font = cache.lookup("doom");
    ASSERT_NE(font, nullptr);
    EXPECT_EQ(font->name(), "doom");
    EXPECT_EQ(std::filesystem::path(font->path()).filename().string(), "doom.flf");
}

TEST_F(FontCacheTest, LookupOrDefaultFallsBack) {
    writeDefaultFonts();
    FontCache cache;
    cache.populate(dir(), {"standard", "doom"});

    EXPECT_EQ(cache.lookupOrDefault("doom", "standard")->name(), "doom");
    EXPECT_EQ(cache.lookupOrDefault("nope", "standard")->name(), "standard");
    EXPECT_EQ(cache.lookupOrDefault("nope", "also-nope"), nullptr);
}

TEST_F(FontCacheTest, RepopulateKeepsExistingEntries) {
    writeDefaultFonts();
    FontCache cache;
    cache.populate(dir(), {"standard"});
    auto before = cache.lookup("standard");

    EXPECT_EQ(cache.populate(dir(), {"standard", "doom"}), 1u);
    EXPECT_EQ(cache.lookup("standard"), before);
    EXPECT_EQ(cache.size(), 2u);
}

TEST_F(FontCacheTest, ListIsASnapshot) {
    writeDefaultFonts();
    FontCache cache;
    cache.populate(dir(), {"standard"});
    std::vector<std::string> snapshot = cache.list();
    cache.populate(dir(), {"doom"});
    EXPECT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(cache.list().size(), 2u);
}

TEST_F(FontCacheTest, FontRenderParsesLazily) {
    writeFont("broken", "not a font\n");
    FontCache cache;
    ASSERT_EQ(cache.populate(dir(), {"broken"}), 1u);

    std::string art;
    std::string error;
    EXPECT_FALSE(cache.lookup("broken")->render("HI", art, error));
    EXPECT_NE(error.find("signature"), std::string::npos);
}

TEST_F(FontCacheTest, ConcurrentRendersAgree) {
    writeDefaultFonts();
    FontCache cache;
    cache.populate(dir(), {"standard", "doom"});

    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&] {
            for (int i = 0; i < 50; i++) {
                std::string art;
                std::string error;
                auto font = cache.lookupOrDefault("doom", "standard");
                if (!font || !font->render("HI", art, error) || art != "HHHIII\nHHHIII\nHHHIII\nHHHIII\n") {
                    mismatches++;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(mismatches.load(), 0);
}

TEST(ValidateFontFileTest, ReportsMissingFile) {
    std::string error;
    EXPECT_FALSE(validateFontFile("/nonexistent/dir/font.flf", error));
    EXPECT_NE(error.find("does not exist"), std::string::npos);
}
