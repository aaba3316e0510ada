#pragma once

#include "sheetlens/core/StyleTypes.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sheetlens {
namespace core {

/**
 * @brief 已解析的单条边框
 */
struct BorderSide {
    BorderStyle style = BorderStyle::None;
    uint32_t color = 0x000000;

    bool operator==(const BorderSide& other) const {
        return style == other.style && color == other.color;
    }
};

struct GradientStop {
    double position = 0.0;
    uint32_t color = 0x000000;
};

/**
 * @brief 渐变填充，type 为 "linear" 或 "path"
 */
struct GradientFill {
    std::string type = "linear";
    double degree = 0.0;
    double left = 0.0;
    double right = 0.0;
    double top = 0.0;
    double bottom = 0.0;
    std::vector<GradientStop> stops;
};

/**
 * @brief 完全解析后的单元格样式
 *
 * 由 StyleResolver 按 cellXfs 索引生成并缓存，之后只读共享。
 * 未设置的可选字段表示采用格式默认值。颜色均为 0xRRGGBB。
 */
struct Style {
    // 字体
    std::optional<std::string> font_family;
    std::optional<double> font_size;
    std::optional<uint32_t> font_color;
    std::optional<bool> bold;
    std::optional<bool> italic;
    std::optional<UnderlineType> underline;
    std::optional<bool> strikethrough;
    std::optional<VertAlign> vert_align;

    // 填充
    std::optional<uint32_t> bg_color;
    std::optional<uint32_t> fg_color;
    std::optional<PatternType> pattern_type;
    std::optional<GradientFill> gradient;

    // 边框
    std::optional<BorderSide> border_top;
    std::optional<BorderSide> border_right;
    std::optional<BorderSide> border_bottom;
    std::optional<BorderSide> border_left;
    std::optional<BorderSide> border_diagonal;
    std::optional<bool> diagonal_up;
    std::optional<bool> diagonal_down;

    // 对齐
    std::optional<HorizontalAlign> align_h;
    std::optional<VerticalAlign> align_v;
    std::optional<bool> wrap;
    std::optional<bool> shrink_to_fit;
    std::optional<uint32_t> indent;
    std::optional<int32_t> rotation;
    std::optional<uint8_t> reading_order;  // 0=上下文 1=LTR 2=RTL

    // 保护
    std::optional<bool> locked;
    std::optional<bool> hidden;

    // 数字格式，始终可直接交给格式化引擎
    std::string number_format = "General";
    uint32_t number_format_id = 0;

    bool hasBorder() const {
        return border_top || border_right || border_bottom || border_left || border_diagonal;
    }
};

using StylePtr = std::shared_ptr<const Style>;

/**
 * @brief 差异格式 (dxf)，条件格式命中时叠加到单元格样式上
 */
struct DxfStyle {
    std::optional<uint32_t> font_color;
    std::optional<bool> bold;
    std::optional<bool> italic;
    std::optional<UnderlineType> underline;
    std::optional<bool> strikethrough;
    std::optional<uint32_t> fill_color;
    std::optional<uint32_t> border_color;
    std::optional<std::string> number_format;
};

}} // namespace sheetlens::core
