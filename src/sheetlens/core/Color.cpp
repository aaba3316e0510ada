#include "sheetlens/core/Color.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace sheetlens {
namespace core {

namespace {

const std::array<uint32_t, 64> kIndexedPalette = {
    0x000000, 0xFFFFFF, 0xFF0000, 0x00FF00, 0x0000FF, 0xFFFF00, 0xFF00FF, 0x00FFFF,
    0x000000, 0xFFFFFF, 0xFF0000, 0x00FF00, 0x0000FF, 0xFFFF00, 0xFF00FF, 0x00FFFF,
    0x800000, 0x008000, 0x000080, 0x808000, 0x800080, 0x008080, 0xC0C0C0, 0x808080,
    0x9999FF, 0x993366, 0xFFFFCC, 0xCCFFFF, 0x660066, 0xFF8080, 0x0066CC, 0xCCCCFF,
    0x000080, 0xFF00FF, 0xFFFF00, 0x00FFFF, 0x800080, 0x800000, 0x008080, 0x0000FF,
    0x00CCFF, 0xCCFFFF, 0xCCFFCC, 0xFFFF99, 0x99CCFF, 0xFF99CC, 0xCC99FF, 0xFFCC99,
    0x3366FF, 0x33CCCC, 0x99CC00, 0xFFCC00, 0xFF9900, 0xFF6600, 0x666699, 0x969696,
    0x003366, 0x339966, 0x003300, 0x333300, 0x993300, 0x993366, 0x333399, 0x333333,
};

const ThemeColors kDefaultTheme = {
    0xFFFFFF,  // lt1
    0x000000,  // dk1
    0xE7E6E6,  // lt2
    0x44546A,  // dk2
    0x4472C4,  // accent1
    0xED7D31,  // accent2
    0xA5A5A5,  // accent3
    0xFFC000,  // accent4
    0x5B9BD5,  // accent5
    0x70AD47,  // accent6
    0x0563C1,  // hlink
    0x954F72,  // folHlink
};

// 系统前景色/背景色
constexpr uint32_t kSystemForeground = 64;
constexpr uint32_t kSystemBackground = 65;

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

struct Hsl {
    double h;
    double s;
    double l;
};

Hsl rgbToHsl(uint32_t rgb) {
    const double r = ((rgb >> 16) & 0xFF) / 255.0;
    const double g = ((rgb >> 8) & 0xFF) / 255.0;
    const double b = (rgb & 0xFF) / 255.0;

    const double max = std::max({r, g, b});
    const double min = std::min({r, g, b});
    const double l = (max + min) / 2.0;
    const double d = max - min;
    if (d < 1e-12) {
        return {0.0, 0.0, l};
    }

    const double s = l > 0.5 ? d / (2.0 - max - min) : d / (max + min);
    double h;
    if (max == r) {
        h = (g - b) / d + (g < b ? 6.0 : 0.0);
    } else if (max == g) {
        h = (b - r) / d + 2.0;
    } else {
        h = (r - g) / d + 4.0;
    }
    return {h / 6.0, s, l};
}

double hueToChannel(double p, double q, double t) {
    if (t < 0.0) t += 1.0;
    if (t > 1.0) t -= 1.0;
    if (t < 1.0 / 6.0) return p + (q - p) * 6.0 * t;
    if (t < 0.5) return q;
    if (t < 2.0 / 3.0) return p + (q - p) * (2.0 / 3.0 - t) * 6.0;
    return p;
}

uint32_t toByte(double v) {
    return static_cast<uint32_t>(std::lround(std::clamp(v, 0.0, 1.0) * 255.0));
}

uint32_t hslToRgb(const Hsl& hsl) {
    if (hsl.s < 1e-12) {
        const uint32_t v = toByte(hsl.l);
        return (v << 16) | (v << 8) | v;
    }
    const double q = hsl.l < 0.5 ? hsl.l * (1.0 + hsl.s) : hsl.l + hsl.s - hsl.l * hsl.s;
    const double p = 2.0 * hsl.l - q;
    const uint32_t r = toByte(hueToChannel(p, q, hsl.h + 1.0 / 3.0));
    const uint32_t g = toByte(hueToChannel(p, q, hsl.h));
    const uint32_t b = toByte(hueToChannel(p, q, hsl.h - 1.0 / 3.0));
    return (r << 16) | (g << 8) | b;
}

} // namespace

std::optional<Color> Color::fromHex(std::string_view hex) {
    if (!hex.empty() && hex.front() == '#') {
        hex.remove_prefix(1);
    }
    if (hex.size() != 6 && hex.size() != 8) {
        return std::nullopt;
    }
    uint32_t value = 0;
    for (char c : hex) {
        int d = hexDigit(c);
        if (d < 0) {
            return std::nullopt;
        }
        value = (value << 4) | static_cast<uint32_t>(d);
    }
    return Color(value & 0xFFFFFF);
}

std::optional<uint32_t> Color::resolve(const ThemeColors& theme,
                                       const std::vector<uint32_t>* custom_indexed) const {
    std::optional<uint32_t> base;
    switch (type_) {
        case Type::RGB:
            base = value_;
            break;
        case Type::Theme:
            if (value_ < theme.size()) {
                base = theme[value_];
            }
            break;
        case Type::Indexed:
            if (custom_indexed && value_ < custom_indexed->size()) {
                base = (*custom_indexed)[value_];
            } else if (value_ < kIndexedPalette.size()) {
                base = kIndexedPalette[value_];
            } else if (value_ == kSystemForeground) {
                base = 0x000000;
            } else if (value_ == kSystemBackground) {
                base = 0xFFFFFF;
            }
            break;
        case Type::Auto:
            break;
    }
    if (base && tint_ != 0.0) {
        base = applyTint(*base, tint_);
    }
    return base;
}

uint32_t applyTint(uint32_t rgb, double tint) {
    if (tint == 0.0) {
        return rgb & 0xFFFFFF;
    }
    Hsl hsl = rgbToHsl(rgb);
    if (tint < 0.0) {
        hsl.l = hsl.l * (1.0 + tint);
    } else {
        hsl.l = hsl.l * (1.0 - tint) + tint;
    }
    hsl.l = std::clamp(hsl.l, 0.0, 1.0);
    return hslToRgb(hsl);
}

std::string toHexString(uint32_t rgb) {
    return fmt::format("#{:06X}", rgb & 0xFFFFFF);
}

const std::array<uint32_t, 64>& defaultIndexedPalette() {
    return kIndexedPalette;
}

const ThemeColors& defaultThemeColors() {
    return kDefaultTheme;
}

}} // namespace sheetlens::core
