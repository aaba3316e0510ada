#pragma once

#include <cstdint>
#include <string_view>

namespace sheetlens {
namespace core {

/**
 * @file StyleTypes.hpp
 * @brief 字体、填充、边框、对齐相关的枚举
 *
 * 每个枚举提供与 OOXML 属性值之间的双向转换。无法识别的属性值
 * 映射为该枚举的默认值，与 Excel 的宽松处理一致。
 */

/**
 * @brief 边框线型
 */
enum class BorderStyle : uint8_t {
    None = 0,
    Thin,
    Medium,
    Thick,
    Double,
    Hair,
    Dotted,
    Dashed,
    DashDot,
    DashDotDot,
    MediumDashed,
    MediumDashDot,
    MediumDashDotDot,
    SlantDashDot
};

/**
 * @brief 图案填充类型
 */
enum class PatternType : uint8_t {
    None = 0,
    Solid,
    MediumGray,
    DarkGray,
    LightGray,
    DarkHorizontal,
    DarkVertical,
    DarkDown,
    DarkUp,
    DarkGrid,
    DarkTrellis,
    LightHorizontal,
    LightVertical,
    LightDown,
    LightUp,
    LightGrid,
    LightTrellis,
    Gray125,
    Gray0625
};

enum class UnderlineType : uint8_t {
    None = 0,
    Single,
    Double,
    SingleAccounting,
    DoubleAccounting
};

enum class VertAlign : uint8_t {
    Baseline = 0,
    Superscript,
    Subscript
};

enum class HorizontalAlign : uint8_t {
    General = 0,
    Left,
    Center,
    Right,
    Fill,
    Justify,
    CenterContinuous,
    Distributed
};

enum class VerticalAlign : uint8_t {
    Bottom = 0,
    Top,
    Center,
    Justify,
    Distributed
};

BorderStyle parseBorderStyle(std::string_view value);
PatternType parsePatternType(std::string_view value);
UnderlineType parseUnderline(std::string_view value);
VertAlign parseVertAlign(std::string_view value);
HorizontalAlign parseHorizontalAlign(std::string_view value);
VerticalAlign parseVerticalAlign(std::string_view value);

const char* toString(BorderStyle style);
const char* toString(PatternType pattern);
const char* toString(UnderlineType underline);
const char* toString(VertAlign align);
const char* toString(HorizontalAlign align);
const char* toString(VerticalAlign align);

}} // namespace sheetlens::core
