#include <sstv/colors.h>

#include "gtest/gtest.h"

namespace {

class ColorManagerTest : public ::testing::Test {
protected:
    void TearDown() override {
        ColorManager& cm = ColorManager::instance();
        cm.set_theme_color("prompt", "BOLDBLUE");
        cm.set_theme_color("event", "GREEN");
        cm.set_theme_color("reply", "CYAN");
    }
};

}  // namespace

TEST_F(ColorManagerTest, ThemesStartWithShellDefaults) {
    ColorManager& cm = ColorManager::instance();
    EXPECT_EQ(BOLDBLUE, cm.theme("prompt"));
    EXPECT_EQ(GREEN, cm.theme("event"));
    EXPECT_EQ(CYAN, cm.theme("reply"));
    EXPECT_EQ(RESET, cm.theme("status"));
}

TEST_F(ColorManagerTest, SetsThemeFromPalette) {
    ColorManager& cm = ColorManager::instance();
    ASSERT_TRUE(cm.set_theme_color("reply", "MAGENTA"));
    EXPECT_EQ(MAGENTA, cm.theme("reply"));
    EXPECT_NE(std::string::npos, cm.list_theme().find(std::string("reply=") + MAGENTA));
}

TEST_F(ColorManagerTest, RejectsUnknownThemeOrColor) {
    ColorManager& cm = ColorManager::instance();
    EXPECT_FALSE(cm.set_theme_color("reply", "PURPLE"));
    EXPECT_FALSE(cm.set_theme_color("status", "RED"));
    EXPECT_EQ(CYAN, cm.theme("reply"));
}

TEST_F(ColorManagerTest, ListsPaletteNames) {
    std::string colors = ColorManager::instance().list_colors();
    EXPECT_NE(std::string::npos, colors.find("YELLOW"));
    EXPECT_EQ(std::string::npos, colors.find("WHITE"));
}
