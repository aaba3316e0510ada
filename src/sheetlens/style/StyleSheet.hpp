#pragma once

#include "sheetlens/core/Color.hpp"
#include "sheetlens/core/StyleTypes.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sheetlens {
namespace style {

/**
 * @file StyleSheet.hpp
 * @brief styles.xml 的原始结构
 *
 * 字段与 XML 一一对应，未出现的属性保持为空。默认值只在 StyleResolver 中补齐。
 */

struct RawFont {
    std::optional<std::string> name;
    std::optional<double> size;
    std::optional<core::Color> color;
    std::optional<bool> bold;
    std::optional<bool> italic;
    std::optional<core::UnderlineType> underline;
    std::optional<bool> strike;
    std::optional<core::VertAlign> vert_align;
    std::optional<int> family;
    std::optional<std::string> scheme;
};

struct RawGradientStop {
    double position = 0.0;
    core::Color color;
};

struct RawFill {
    std::optional<core::PatternType> pattern;
    std::optional<core::Color> fg_color;
    std::optional<core::Color> bg_color;

    // <gradientFill>
    bool is_gradient = false;
    std::string gradient_type = "linear";
    double degree = 0.0;
    double left = 0.0;
    double right = 0.0;
    double top = 0.0;
    double bottom = 0.0;
    std::vector<RawGradientStop> stops;
};

struct RawBorderSide {
    core::BorderStyle style = core::BorderStyle::None;
    std::optional<core::Color> color;
};

struct RawBorder {
    std::optional<RawBorderSide> left;
    std::optional<RawBorderSide> right;
    std::optional<RawBorderSide> top;
    std::optional<RawBorderSide> bottom;
    std::optional<RawBorderSide> diagonal;
    std::optional<bool> diagonal_up;
    std::optional<bool> diagonal_down;
};

struct RawAlignment {
    std::optional<core::HorizontalAlign> horizontal;
    std::optional<core::VerticalAlign> vertical;
    std::optional<bool> wrap_text;
    std::optional<bool> shrink_to_fit;
    std::optional<uint32_t> indent;
    std::optional<int32_t> text_rotation;
    std::optional<uint8_t> reading_order;
};

struct RawProtection {
    std::optional<bool> locked;
    std::optional<bool> hidden;
};

/**
 * @brief cellXfs / cellStyleXfs 中的一条 <xf>
 *
 * apply* 为三态：未出现、显式 1、显式 0。
 */
struct RawXf {
    std::optional<uint32_t> num_fmt_id;
    std::optional<uint32_t> font_id;
    std::optional<uint32_t> fill_id;
    std::optional<uint32_t> border_id;
    std::optional<uint32_t> xf_id;

    std::optional<bool> apply_number_format;
    std::optional<bool> apply_font;
    std::optional<bool> apply_fill;
    std::optional<bool> apply_border;
    std::optional<bool> apply_alignment;
    std::optional<bool> apply_protection;

    std::optional<RawAlignment> alignment;
    std::optional<RawProtection> protection;
    bool quote_prefix = false;
};

/**
 * @brief <dxfs> 中的差异格式
 */
struct RawDxf {
    std::optional<RawFont> font;
    std::optional<RawFill> fill;
    std::optional<RawBorder> border;
    std::optional<std::string> num_fmt_code;
    std::optional<uint32_t> num_fmt_id;
};

/**
 * @brief <cellStyles> 中的命名样式
 */
struct RawCellStyle {
    std::string name;
    uint32_t xf_id = 0;
    std::optional<uint32_t> builtin_id;
};

struct StyleSheet {
    std::map<uint32_t, std::string> num_fmts;   // 自定义数字格式 id -> code
    std::vector<RawFont> fonts;
    std::vector<RawFill> fills;
    std::vector<RawBorder> borders;
    std::vector<RawXf> cell_style_xfs;
    std::vector<RawXf> cell_xfs;
    std::vector<RawCellStyle> cell_styles;
    std::vector<RawDxf> dxfs;
    std::vector<uint32_t> indexed_colors;       // 空表示使用默认调色板
};

}} // namespace sheetlens::style
