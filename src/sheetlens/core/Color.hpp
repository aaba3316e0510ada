#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sheetlens {
namespace core {

/// 主题调色板，按 Excel 的主题索引顺序存放 (0=lt1, 1=dk1, 2=lt2, 3=dk2, 4-9=accent1-6, 10=hlink, 11=folHlink)
using ThemeColors = std::array<uint32_t, 12>;

/**
 * @brief Color类 - 未解析的颜色描述
 *
 * 对应 XML 中的 <color rgb/theme/indexed/auto tint="..."/>。
 * 颜色只在样式解析阶段结合主题和调色板求值为最终 RGB。
 */
class Color {
public:
    enum class Type : uint8_t {
        RGB = 0,
        Theme = 1,
        Indexed = 2,
        Auto = 3
    };

    /**
     * @brief 默认构造为自动颜色
     */
    Color() : type_(Type::Auto), value_(0), tint_(0.0) {}

    explicit Color(uint32_t rgb) : type_(Type::RGB), value_(rgb & 0xFFFFFF), tint_(0.0) {}

    static Color fromTheme(uint32_t theme_index, double tint = 0.0) {
        Color color;
        color.type_ = Type::Theme;
        color.value_ = theme_index;
        color.tint_ = tint;
        return color;
    }

    static Color fromIndex(uint32_t color_index, double tint = 0.0) {
        Color color;
        color.type_ = Type::Indexed;
        color.value_ = color_index;
        color.tint_ = tint;
        return color;
    }

    static Color automatic() { return Color(); }

    /**
     * @brief 解析 "RRGGBB"、"AARRGGBB" 或带 '#' 前缀的十六进制串，alpha 被丢弃
     */
    static std::optional<Color> fromHex(std::string_view hex);

    Type getType() const { return type_; }
    uint32_t getValue() const { return value_; }
    double getTint() const { return tint_; }
    void setTint(double tint) { tint_ = tint; }

    /**
     * @brief 求值为 0xRRGGBB
     * @param theme 主题调色板
     * @param custom_indexed 工作簿自定义的索引调色板，可为空
     * @return 自动颜色或无法解析的索引返回 nullopt
     */
    std::optional<uint32_t> resolve(const ThemeColors& theme,
                                    const std::vector<uint32_t>* custom_indexed = nullptr) const;

    bool operator==(const Color& other) const {
        return type_ == other.type_ && value_ == other.value_ && tint_ == other.tint_;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }

private:
    Type type_;
    uint32_t value_;    // RGB值、主题索引或颜色索引
    double tint_;       // -1.0 ~ 1.0
};

/**
 * @brief 在 HSL 空间中按 tint 调整亮度
 *
 * tint < 0 时 L' = L * (1 + tint)，tint > 0 时 L' = L * (1 - tint) + tint。
 */
uint32_t applyTint(uint32_t rgb, double tint);

/**
 * @brief 0xRRGGBB -> "#RRGGBB"（大写）
 */
std::string toHexString(uint32_t rgb);

/**
 * @brief 旧式 64 色索引调色板
 */
const std::array<uint32_t, 64>& defaultIndexedPalette();

/**
 * @brief Office 默认主题配色
 */
const ThemeColors& defaultThemeColors();

}} // namespace sheetlens::core
