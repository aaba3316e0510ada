#include "sheetlens/core/Color.hpp"
#include "sheetlens/theme/Theme.hpp"
#include "sheetlens/utils/Logger.hpp"
#include <gtest/gtest.h>

namespace sheetlens {
namespace core {

class ColorTest : public ::testing::Test {
protected:
    void SetUp() override {
        sheetlens::Logger::getInstance().initialize("logs/Color_test.log",
                                                    sheetlens::Logger::Level::DEBUG,
                                                    false);
        theme_ = defaultThemeColors();
    }

    ThemeColors theme_;
};

// 测试1: 十六进制解析，alpha 被丢弃
TEST_F(ColorTest, ParseHex) {
    auto argb = Color::fromHex("FFFF0000");
    ASSERT_TRUE(argb.has_value());
    EXPECT_EQ(argb->getType(), Color::Type::RGB);
    EXPECT_EQ(argb->getValue(), 0xFF0000u);

    auto rgb = Color::fromHex("#00ff80");
    ASSERT_TRUE(rgb.has_value());
    EXPECT_EQ(rgb->getValue(), 0x00FF80u);

    EXPECT_FALSE(Color::fromHex("12345").has_value());
    EXPECT_FALSE(Color::fromHex("GG0000").has_value());
    EXPECT_FALSE(Color::fromHex("").has_value());
}

// 测试2: 主题色按索引取值
TEST_F(ColorTest, ResolveThemeColor) {
    EXPECT_EQ(Color::fromTheme(0).resolve(theme_), 0xFFFFFFu);
    EXPECT_EQ(Color::fromTheme(1).resolve(theme_), 0x000000u);
    EXPECT_EQ(Color::fromTheme(4).resolve(theme_), 0x4472C4u);
    EXPECT_EQ(Color::fromTheme(11).resolve(theme_), 0x954F72u);

    // 越界的主题索引无法解析
    EXPECT_FALSE(Color::fromTheme(12).resolve(theme_).has_value());
}

// 测试3: tint 在 HSL 空间调整亮度
TEST_F(ColorTest, TintAdjustsLightness) {
    EXPECT_EQ(applyTint(0x000000, 0.5), 0x808080u);
    EXPECT_EQ(applyTint(0xFFFFFF, -0.5), 0x808080u);
    EXPECT_EQ(applyTint(0x123456, 0.0), 0x123456u);
    EXPECT_EQ(applyTint(0x4472C4, 1.0), 0xFFFFFFu);
    EXPECT_EQ(applyTint(0x4472C4, -1.0), 0x000000u);

    // 主题黑色提亮 50%
    EXPECT_EQ(Color::fromTheme(1, 0.5).resolve(theme_), 0x808080u);
}

// 测试4: 索引色、系统色和自定义调色板
TEST_F(ColorTest, ResolveIndexedColor) {
    EXPECT_EQ(Color::fromIndex(2).resolve(theme_), 0xFF0000u);
    EXPECT_EQ(Color::fromIndex(22).resolve(theme_), 0xC0C0C0u);
    EXPECT_EQ(Color::fromIndex(64).resolve(theme_), 0x000000u);
    EXPECT_EQ(Color::fromIndex(65).resolve(theme_), 0xFFFFFFu);
    EXPECT_FALSE(Color::fromIndex(200).resolve(theme_).has_value());

    std::vector<uint32_t> custom = {0x123456, 0xABCDEF};
    EXPECT_EQ(Color::fromIndex(1).resolve(theme_, &custom), 0xABCDEFu);
    // 自定义调色板之外回落到默认调色板
    EXPECT_EQ(Color::fromIndex(2).resolve(theme_, &custom), 0xFF0000u);
}

// 测试5: 自动颜色没有具体值
TEST_F(ColorTest, AutomaticHasNoValue) {
    EXPECT_FALSE(Color::automatic().resolve(theme_).has_value());
    EXPECT_EQ(Color(), Color::automatic());
    EXPECT_NE(Color(0x112233), Color::fromTheme(0x112233));
}

// 测试6: 十六进制输出与主题槽位映射
TEST_F(ColorTest, HexStringAndThemeSlots) {
    EXPECT_EQ(toHexString(0xabcdef), "#ABCDEF");
    EXPECT_EQ(toHexString(0x000001), "#000001");

    EXPECT_EQ(theme::Theme::slotForElement("lt1"), 0);
    EXPECT_EQ(theme::Theme::slotForElement("dk1"), 1);
    EXPECT_EQ(theme::Theme::slotForElement("accent6"), 9);
    EXPECT_EQ(theme::Theme::slotForElement("folHlink"), 11);
    EXPECT_EQ(theme::Theme::slotForElement("accent7"), -1);
}

}} // namespace sheetlens::core
