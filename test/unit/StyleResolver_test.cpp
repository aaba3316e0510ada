#include "sheetlens/style/StyleResolver.hpp"
#include "sheetlens/utils/Logger.hpp"
#include <gtest/gtest.h>

namespace sheetlens {
namespace style {

class StyleResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        sheetlens::Logger::getInstance().initialize("logs/StyleResolver_test.log",
                                                    sheetlens::Logger::Level::DEBUG,
                                                    false);

        theme_.colors[4] = 0x112233;
        theme_.minor_font = "Aptos";
        theme_.major_font = "Aptos Display";

        // 字体
        RawFont normal;
        normal.name = "Calibri";
        normal.size = 11.0;
        sheet_.fonts.push_back(normal);

        RawFont arial;
        arial.name = "Arial";
        arial.bold = true;
        arial.color = core::Color::fromTheme(4);
        sheet_.fonts.push_back(arial);

        RawFont minor;
        minor.size = 9.0;
        minor.scheme = "minor";
        sheet_.fonts.push_back(minor);

        RawFont major;
        major.name = "Cambria";
        major.scheme = "major";
        sheet_.fonts.push_back(major);

        // 填充
        RawFill none;
        none.pattern = core::PatternType::None;
        sheet_.fills.push_back(none);

        RawFill gray;
        gray.pattern = core::PatternType::Gray125;
        sheet_.fills.push_back(gray);

        RawFill solid;
        solid.pattern = core::PatternType::Solid;
        solid.fg_color = core::Color(0xFFFF00);
        solid.bg_color = core::Color::fromIndex(64);
        sheet_.fills.push_back(solid);

        RawFill grid;
        grid.pattern = core::PatternType::DarkGrid;
        grid.fg_color = core::Color::fromIndex(2);
        grid.bg_color = core::Color(0x0000FF);
        sheet_.fills.push_back(grid);

        RawFill gradient;
        gradient.is_gradient = true;
        gradient.degree = 90.0;
        gradient.stops.push_back(RawGradientStop{0.0, core::Color::fromTheme(4)});
        gradient.stops.push_back(RawGradientStop{1.0, core::Color(0xFFFFFF)});
        sheet_.fills.push_back(gradient);

        // 边框
        sheet_.borders.push_back(RawBorder());
        RawBorder thin;
        thin.left = RawBorderSide{core::BorderStyle::Thin, core::Color(0xFF0000)};
        thin.bottom = RawBorderSide{core::BorderStyle::Double, std::nullopt};
        thin.top = RawBorderSide{core::BorderStyle::None, std::nullopt};
        sheet_.borders.push_back(thin);

        sheet_.num_fmts[164] = "0.000";

        // 命名样式
        RawXf normal_style;
        normal_style.font_id = 0;
        normal_style.fill_id = 0;
        normal_style.border_id = 0;
        normal_style.num_fmt_id = 0;
        sheet_.cell_style_xfs.push_back(normal_style);

        RawXf bordered_style;
        bordered_style.font_id = 0;
        bordered_style.border_id = 1;
        sheet_.cell_style_xfs.push_back(bordered_style);

        // 单元格样式
        addXf(RawXf());                                   // 0 默认
        RawXf xf;

        xf = RawXf(); xf.font_id = 1;                     // 1 非零字体，未写 applyFont
        addXf(xf);
        xf = RawXf(); xf.font_id = 1; xf.apply_font = false;   // 2 显式不应用
        addXf(xf);
        xf = RawXf(); xf.xf_id = 1; xf.border_id = 0;     // 3 继承命名样式的边框
        addXf(xf);
        xf = RawXf(); xf.xf_id = 1; xf.border_id = 0; xf.apply_border = true;  // 4 显式清除边框
        addXf(xf);
        xf = RawXf(); xf.fill_id = 2;                     // 5 实心填充
        addXf(xf);
        xf = RawXf(); xf.fill_id = 3;                     // 6 图案填充
        addXf(xf);
        xf = RawXf(); xf.fill_id = 4;                     // 7 渐变填充
        addXf(xf);
        xf = RawXf(); xf.num_fmt_id = 164;                // 8 自定义数字格式
        addXf(xf);
        xf = RawXf(); xf.num_fmt_id = 14;                 // 9 内置数字格式
        addXf(xf);
        xf = RawXf(); xf.num_fmt_id = 300;                // 10 未知数字格式
        addXf(xf);

        xf = RawXf();                                     // 11 对齐与保护
        RawAlignment alignment;
        alignment.horizontal = core::HorizontalAlign::Center;
        alignment.wrap_text = true;
        alignment.shrink_to_fit = true;
        alignment.text_rotation = 45;
        xf.alignment = alignment;
        RawProtection protection;
        protection.locked = false;
        xf.protection = protection;
        addXf(xf);

        xf = RawXf(); xf.font_id = 2;                     // 12 正文主题字体
        addXf(xf);
        xf = RawXf(); xf.font_id = 3;                     // 13 标题主题字体
        addXf(xf);
        xf = RawXf(); xf.font_id = 99;                    // 14 越界字体
        addXf(xf);

        // 差异格式
        RawDxf red;
        red.font.emplace();
        red.font->bold = true;
        red.font->color = core::Color(0x9C0006);
        red.fill.emplace();
        red.fill->bg_color = core::Color(0xFFC7CE);
        sheet_.dxfs.push_back(red);

        RawDxf fg_only;
        fg_only.fill.emplace();
        fg_only.fill->fg_color = core::Color(0x00FF00);
        sheet_.dxfs.push_back(fg_only);

        RawDxf gradient_dxf;
        gradient_dxf.fill = gradient;
        sheet_.dxfs.push_back(gradient_dxf);

        RawDxf border_dxf;
        border_dxf.border.emplace();
        border_dxf.border->left = RawBorderSide{core::BorderStyle::Thin, core::Color(0x0000FF)};
        border_dxf.num_fmt_code = "0.0%";
        sheet_.dxfs.push_back(border_dxf);

        RawDxf builtin_fmt;
        builtin_fmt.num_fmt_id = 10;
        sheet_.dxfs.push_back(builtin_fmt);
    }

    void addXf(const RawXf& xf) { sheet_.cell_xfs.push_back(xf); }

    StyleSheet sheet_;
    theme::Theme theme_;
};

// 测试1: 默认样式与缓存
TEST_F(StyleResolverTest, DefaultStyleAndCache) {
    StyleResolver resolver(sheet_, theme_);

    core::StylePtr def = resolver.defaultStyle();
    ASSERT_NE(def, nullptr);
    EXPECT_EQ(def->font_family, "Calibri");
    EXPECT_EQ(def->font_size, 11.0);
    EXPECT_EQ(def->number_format, "General");
    EXPECT_EQ(def->number_format_id, 0u);
    EXPECT_FALSE(def->bg_color.has_value());
    EXPECT_FALSE(def->hasBorder());

    // 同一索引返回同一实例
    EXPECT_EQ(resolver.resolve(0).get(), def.get());
    EXPECT_EQ(resolver.resolve(5).get(), resolver.resolve(5).get());

    // 越界索引返回默认样式
    EXPECT_EQ(resolver.resolve(999).get(), def.get());
}

// 测试2: apply 标志
TEST_F(StyleResolverTest, ApplyFlags) {
    StyleResolver resolver(sheet_, theme_);

    core::StylePtr implicit = resolver.resolve(1);
    EXPECT_EQ(implicit->font_family, "Arial");
    EXPECT_EQ(implicit->bold, true);
    // 未写字号时取 Normal 字体
    EXPECT_EQ(implicit->font_size, 11.0);
    EXPECT_EQ(implicit->font_color, 0x112233u);

    core::StylePtr suppressed = resolver.resolve(2);
    EXPECT_EQ(suppressed->font_family, "Calibri");
    EXPECT_FALSE(suppressed->bold.has_value());
}

// 测试3: 命名样式的边框继承
TEST_F(StyleResolverTest, BorderInheritance) {
    StyleResolver resolver(sheet_, theme_);

    core::StylePtr inherited = resolver.resolve(3);
    ASSERT_TRUE(inherited->border_left.has_value());
    EXPECT_EQ(inherited->border_left->style, core::BorderStyle::Thin);
    EXPECT_EQ(inherited->border_left->color, 0xFF0000u);
    ASSERT_TRUE(inherited->border_bottom.has_value());
    EXPECT_EQ(inherited->border_bottom->style, core::BorderStyle::Double);
    EXPECT_EQ(inherited->border_bottom->color, 0x000000u);
    // style="none" 的边不输出
    EXPECT_FALSE(inherited->border_top.has_value());

    core::StylePtr cleared = resolver.resolve(4);
    EXPECT_FALSE(cleared->hasBorder());
}

// 测试4: 填充
TEST_F(StyleResolverTest, Fills) {
    StyleResolver resolver(sheet_, theme_);

    core::StylePtr solid = resolver.resolve(5);
    EXPECT_EQ(solid->bg_color, 0xFFFF00u);
    EXPECT_FALSE(solid->pattern_type.has_value());
    EXPECT_FALSE(solid->fg_color.has_value());

    core::StylePtr grid = resolver.resolve(6);
    EXPECT_EQ(grid->pattern_type, core::PatternType::DarkGrid);
    EXPECT_EQ(grid->fg_color, 0xFF0000u);
    EXPECT_EQ(grid->bg_color, 0x0000FFu);

    core::StylePtr gradient = resolver.resolve(7);
    ASSERT_TRUE(gradient->gradient.has_value());
    EXPECT_EQ(gradient->gradient->type, "linear");
    EXPECT_DOUBLE_EQ(gradient->gradient->degree, 90.0);
    ASSERT_EQ(gradient->gradient->stops.size(), 2u);
    EXPECT_EQ(gradient->gradient->stops[0].color, 0x112233u);
    EXPECT_EQ(gradient->gradient->stops[1].color, 0xFFFFFFu);
    EXPECT_FALSE(gradient->bg_color.has_value());
}

// 测试5: 数字格式
TEST_F(StyleResolverTest, NumberFormats) {
    StyleResolver resolver(sheet_, theme_);

    EXPECT_EQ(resolver.resolve(8)->number_format, "0.000");
    EXPECT_EQ(resolver.resolve(8)->number_format_id, 164u);
    EXPECT_EQ(resolver.resolve(9)->number_format, "mm-dd-yy");
    EXPECT_EQ(resolver.resolve(9)->number_format_id, 14u);
    EXPECT_EQ(resolver.resolve(10)->number_format, "General");
    EXPECT_EQ(resolver.resolve(10)->number_format_id, 0u);

    EXPECT_EQ(resolver.numberFormatCode(164), "0.000");
    EXPECT_EQ(resolver.numberFormatCode(4), "#,##0.00");
    EXPECT_EQ(resolver.numberFormatCode(999), "General");
}

// 测试6: 对齐与保护
TEST_F(StyleResolverTest, AlignmentAndProtection) {
    StyleResolver resolver(sheet_, theme_);

    core::StylePtr style = resolver.resolve(11);
    EXPECT_EQ(style->align_h, core::HorizontalAlign::Center);
    EXPECT_FALSE(style->align_v.has_value());
    EXPECT_EQ(style->wrap, true);
    // 自动换行时不输出缩小字体
    EXPECT_FALSE(style->shrink_to_fit.has_value());
    EXPECT_EQ(style->rotation, 45);
    EXPECT_EQ(style->locked, false);
    EXPECT_FALSE(style->hidden.has_value());
}

// 测试7: 主题字体与越界字体
TEST_F(StyleResolverTest, ThemeFonts) {
    StyleResolver resolver(sheet_, theme_);

    core::StylePtr minor = resolver.resolve(12);
    EXPECT_EQ(minor->font_family, "Aptos");
    EXPECT_EQ(minor->font_size, 9.0);

    EXPECT_EQ(resolver.resolve(13)->font_family, "Aptos Display");

    core::StylePtr fallback = resolver.resolve(14);
    EXPECT_EQ(fallback->font_family, "Calibri");
    EXPECT_EQ(fallback->font_size, 11.0);
}

// 测试8: 差异格式
TEST_F(StyleResolverTest, DifferentialFormats) {
    StyleResolver resolver(sheet_, theme_);

    core::DxfStyle red = resolver.resolveDxf(0);
    EXPECT_EQ(red.bold, true);
    EXPECT_EQ(red.font_color, 0x9C0006u);
    EXPECT_EQ(red.fill_color, 0xFFC7CEu);
    EXPECT_FALSE(red.border_color.has_value());

    EXPECT_EQ(resolver.resolveDxf(1).fill_color, 0x00FF00u);
    EXPECT_EQ(resolver.resolveDxf(2).fill_color, 0x112233u);

    core::DxfStyle border = resolver.resolveDxf(3);
    EXPECT_EQ(border.border_color, 0x0000FFu);
    EXPECT_EQ(border.number_format, "0.0%");

    EXPECT_EQ(resolver.resolveDxf(4).number_format, "0.00%");

    core::DxfStyle missing = resolver.resolveDxf(42);
    EXPECT_FALSE(missing.fill_color.has_value());
    EXPECT_FALSE(missing.font_color.has_value());

    EXPECT_EQ(resolver.resolveAllDxfs().size(), 5u);
}

// 测试9: 空样式表
TEST_F(StyleResolverTest, EmptyStyleSheet) {
    StyleSheet empty;
    StyleResolver resolver(empty, theme::Theme::defaultOffice());

    core::StylePtr def = resolver.defaultStyle();
    ASSERT_NE(def, nullptr);
    EXPECT_EQ(def->number_format, "General");
    EXPECT_FALSE(def->font_family.has_value());
    EXPECT_EQ(resolver.resolve(3).get(), def.get());
    EXPECT_EQ(resolver.cellXfCount(), 0u);
}

}} // namespace sheetlens::style
