#include <gtest/gtest.h>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "TestHelpers.hpp"
#include "core/Config.hpp"
#include "utils/ColorUtils.hpp"
#include "view/Theme.hpp"
#include "view/Viewer.hpp"

using test_helpers::SameColor;

namespace
{
class ConfigFileTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
        m_path = (std::filesystem::temp_directory_path() / (std::string("kiviewer_") + info->name() + ".ini")).string();
        std::remove(m_path.c_str());
    }

    void TearDown() override { std::remove(m_path.c_str()); }

    void WriteFile(const std::string& contents) const
    {
        std::ofstream out(m_path);
        out << contents;
    }

    std::string m_path;
};
}  // namespace

TEST(ConfigTest, DefaultsAreAvailableWithoutAFile)
{
    Config const config;
    EXPECT_EQ(config.GetString("application.name"), "KiCad Layer Viewer");
    EXPECT_EQ(config.GetInt("window.width"), 1280);
    EXPECT_EQ(config.GetString("renderer.backend"), "opengl");
    EXPECT_FLOAT_EQ(config.GetFloat("viewer.dim_alpha"), 0.25f);
    EXPECT_FALSE(config.HasKey("theme.background"));
}

TEST(ConfigTest, TypedGettersConvert)
{
    Config config;
    config.SetInt("a", 3);
    config.SetString("b", "2.5");
    config.SetString("c", "yes please");
    config.SetBool("d", true);

    EXPECT_FLOAT_EQ(config.GetFloat("a"), 3.0f);
    EXPECT_FLOAT_EQ(config.GetFloat("b"), 2.5f);
    EXPECT_EQ(config.GetString("a"), "3");
    EXPECT_EQ(config.GetString("d"), "true");
    EXPECT_TRUE(config.GetBool("a"));
    EXPECT_EQ(config.GetInt("missing", 7), 7);
}

TEST(ConfigTest, UnparsableNumbersFallBackToTheDefault)
{
    Config config;
    config.SetString("c", "yes please");

    testing::internal::CaptureStderr();
    EXPECT_EQ(config.GetInt("c", 4), 4);
    EXPECT_FLOAT_EQ(config.GetFloat("c", 1.5f), 1.5f);
    EXPECT_NE(testing::internal::GetCapturedStderr().find("'c'"), std::string::npos);
}

TEST(ConfigTest, KeysWithPrefix)
{
    Config config;
    config.SetString("theme.wire", "#00ff00");
    config.SetString("theme.bus", "#0000ff");

    auto keys = config.KeysWithPrefix("theme.");
    std::sort(keys.begin(), keys.end());
    EXPECT_EQ(keys, (std::vector<std::string> {"theme.bus", "theme.wire"}));
}

TEST_F(ConfigFileTest, MissingFileKeepsDefaults)
{
    Config config;
    EXPECT_FALSE(config.LoadFromFile(m_path));
    EXPECT_EQ(config.GetInt("window.height"), 720);
}

TEST_F(ConfigFileTest, FileValuesAreTyped)
{
    WriteFile(
        "# comment\n"
        "; also a comment\n"
        "window.width = 1920\n"
        "viewer.dim_alpha=0.5\n"
        "viewer.document = schematic\n"
        "debug = TRUE\n"
        "not a setting\n");

    Config config;
    ASSERT_TRUE(config.LoadFromFile(m_path));

    EXPECT_EQ(config.GetInt("window.width"), 1920);
    EXPECT_FLOAT_EQ(config.GetFloat("viewer.dim_alpha"), 0.5f);
    EXPECT_EQ(config.GetString("viewer.document"), "schematic");
    EXPECT_TRUE(config.GetBool("debug"));
    EXPECT_FALSE(config.HasKey("# comment"));
    // Untouched keys keep their defaults.
    EXPECT_EQ(config.GetInt("window.height"), 720);
}

TEST_F(ConfigFileTest, SavedSettingsLoadBack)
{
    Config saved;
    saved.SetString("renderer.backend", "blend2d");
    saved.SetBool("viewer.flip", false);
    ASSERT_TRUE(saved.SaveToFile(m_path));

    Config loaded;
    ASSERT_TRUE(loaded.LoadFromFile(m_path));
    EXPECT_EQ(loaded.GetString("renderer.backend"), "blend2d");
    EXPECT_FALSE(loaded.GetBool("viewer.flip", true));
    EXPECT_EQ(loaded.GetInt("window.width"), 1280);
}

TEST(ViewerSettingsTest, ReadFromConfig)
{
    Config config;
    config.SetFloat("viewer.dim_alpha", 0.4f);
    config.SetInt("stroke.dash_ratio", 6);

    ViewerSettings const settings = ViewerSettings::FromConfig(config);
    EXPECT_NEAR(settings.dim_alpha, 0.4, 1e-6);
    EXPECT_DOUBLE_EQ(settings.dash_ratios.dash, 6.0);
    EXPECT_DOUBLE_EQ(settings.dash_ratios.gap, 3.0);
    EXPECT_DOUBLE_EQ(settings.max_zoom, 190.0);
}

TEST(ColorUtilsTest, ParsesCssColors)
{
    using color_utils::ParseCssColor;

    EXPECT_TRUE(SameColor(ParseCssColor("#ff8000"), BLRgba32(255, 128, 0, 255)));
    EXPECT_TRUE(SameColor(ParseCssColor("#f80"), BLRgba32(255, 136, 0, 255)));
    EXPECT_TRUE(SameColor(ParseCssColor("#10203040"), BLRgba32(16, 32, 48, 64)));
    EXPECT_TRUE(SameColor(ParseCssColor(" rgb(1, 2, 3) "), BLRgba32(1, 2, 3, 255)));
    EXPECT_TRUE(SameColor(ParseCssColor("rgba(10, 20, 30, 0)"), BLRgba32(10, 20, 30, 0)));

    EXPECT_THROW(ParseCssColor("#12"), std::invalid_argument);
    EXPECT_THROW(ParseCssColor("rgb(1, 2)"), std::invalid_argument);
    EXPECT_THROW(ParseCssColor("teal"), std::invalid_argument);
}

TEST(ColorUtilsTest, AlphaAndMixing)
{
    BLRgba32 const red(255, 0, 0, 255);
    EXPECT_EQ(color_utils::WithAlpha(red, 0.0).a(), 0U);
    EXPECT_EQ(color_utils::WithAlpha(red, 1.0).a(), 255U);

    BLRgba32 const mixed = color_utils::Mix(red, BLRgba32(0, 0, 255, 0), 1.0);
    EXPECT_TRUE(SameColor(mixed, red));

    EXPECT_TRUE(color_utils::IsTransparentBlack(color_utils::kTransparentBlack));
    EXPECT_FALSE(color_utils::IsTransparentBlack(color_utils::kBlack));

    auto floats = color_utils::ToFloat4(color_utils::kWhite);
    EXPECT_FLOAT_EQ(floats[0], 1.0f);
    EXPECT_FLOAT_EQ(floats[3], 1.0f);
}

TEST(ThemeTest, UnknownNamesAreWhite)
{
    Theme const theme = Theme::DefaultBoard();
    EXPECT_TRUE(theme.Has("copper.f"));
    EXPECT_TRUE(SameColor(theme.ColorFor("no such role"), color_utils::kWhite));
    EXPECT_GT(Theme::DefaultSchematic().Size(), 0U);
}

TEST(ThemeTest, ConfigOverridesReplaceColors)
{
    Config config;
    config.SetString("theme.wire", "#00ff00");
    config.SetString("theme.bus", "not a color");

    Theme theme = Theme::DefaultSchematic();
    BLRgba32 const bus = theme.ColorFor("bus");

    testing::internal::CaptureStderr();
    EXPECT_EQ(theme.LoadOverrides(config), 1);
    EXPECT_NE(testing::internal::GetCapturedStderr().find("theme.bus"), std::string::npos);

    EXPECT_TRUE(SameColor(theme.ColorFor("wire"), BLRgba32(0, 255, 0, 255)));
    EXPECT_TRUE(SameColor(theme.ColorFor("bus"), bus));
}
