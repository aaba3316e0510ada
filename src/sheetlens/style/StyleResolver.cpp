#include "sheetlens/style/StyleResolver.hpp"
#include "sheetlens/format/NumberFormat.hpp"
#include "sheetlens/utils/ModuleLoggers.hpp"

namespace sheetlens {
namespace style {

namespace {

// apply 标志为三态：显式值优先，未出现时看本条目是否携带该类属性
bool shouldApply(const std::optional<bool>& flag, bool carried) {
    if (flag.has_value()) {
        return *flag;
    }
    return carried;
}

bool nonZero(const std::optional<uint32_t>& id) {
    return id.has_value() && *id != 0;
}

void clearFont(core::Style& style) {
    style.font_family.reset();
    style.font_size.reset();
    style.font_color.reset();
    style.bold.reset();
    style.italic.reset();
    style.underline.reset();
    style.strikethrough.reset();
    style.vert_align.reset();
}

void clearFill(core::Style& style) {
    style.bg_color.reset();
    style.fg_color.reset();
    style.pattern_type.reset();
    style.gradient.reset();
}

void clearBorder(core::Style& style) {
    style.border_top.reset();
    style.border_right.reset();
    style.border_bottom.reset();
    style.border_left.reset();
    style.border_diagonal.reset();
    style.diagonal_up.reset();
    style.diagonal_down.reset();
}

} // namespace

StyleResolver::StyleResolver(const StyleSheet& stylesheet, const theme::Theme& theme)
    : stylesheet_(stylesheet), theme_(theme) {
    cache_.resize(stylesheet_.cell_xfs.size());
    fallback_ = std::make_shared<const core::Style>(build(RawXf()));
    STYLE_DEBUG("StyleResolver ready: {} cellXfs, {} cellStyleXfs, {} fonts, {} fills, {} borders, {} dxfs",
                stylesheet_.cell_xfs.size(), stylesheet_.cell_style_xfs.size(), stylesheet_.fonts.size(),
                stylesheet_.fills.size(), stylesheet_.borders.size(), stylesheet_.dxfs.size());
}

core::StylePtr StyleResolver::resolve(uint32_t xf_index) {
    if (xf_index >= stylesheet_.cell_xfs.size()) {
        STYLE_WARN("Style index {} out of range ({} cellXfs), using default style",
                   xf_index, stylesheet_.cell_xfs.size());
        return defaultStyle();
    }

    auto& slot = cache_[xf_index];
    if (!slot) {
        slot = std::make_shared<const core::Style>(build(stylesheet_.cell_xfs[xf_index]));
    }
    return slot;
}

core::StylePtr StyleResolver::defaultStyle() {
    if (stylesheet_.cell_xfs.empty()) {
        return fallback_;
    }
    return resolve(0);
}

core::Style StyleResolver::build(const RawXf& xf) const {
    core::Style style;

    // 基线字体
    if (const RawFont* normal = normalFont()) {
        setFont(style, *normal);
    }

    // 命名样式没有更上一级的父样式
    if (xf.xf_id) {
        if (*xf.xf_id < stylesheet_.cell_style_xfs.size()) {
            applyCategories(style, stylesheet_.cell_style_xfs[*xf.xf_id]);
        } else {
            STYLE_WARN("xfId {} out of range ({} cellStyleXfs), ignoring parent",
                       *xf.xf_id, stylesheet_.cell_style_xfs.size());
        }
    }

    applyCategories(style, xf);
    return style;
}

void StyleResolver::applyCategories(core::Style& style, const RawXf& xf) const {
    if (shouldApply(xf.apply_font, nonZero(xf.font_id))) {
        applyFont(style, xf.font_id);
    }
    if (shouldApply(xf.apply_fill, nonZero(xf.fill_id))) {
        applyFill(style, xf.fill_id);
    }
    if (shouldApply(xf.apply_border, nonZero(xf.border_id))) {
        applyBorder(style, xf.border_id);
    }
    if (shouldApply(xf.apply_number_format, nonZero(xf.num_fmt_id))) {
        applyNumberFormat(style, xf.num_fmt_id);
    }
    if (shouldApply(xf.apply_alignment, xf.alignment.has_value())) {
        applyAlignment(style, xf.alignment);
    }
    if (shouldApply(xf.apply_protection, xf.protection.has_value())) {
        applyProtection(style, xf.protection);
    }
}

// ========== 字体 ==========

const RawFont* StyleResolver::normalFont() const {
    if (!stylesheet_.cell_style_xfs.empty()) {
        const auto& normal = stylesheet_.cell_style_xfs.front();
        const uint32_t font_id = normal.font_id.value_or(0);
        if (font_id < stylesheet_.fonts.size()) {
            return &stylesheet_.fonts[font_id];
        }
    }
    if (!stylesheet_.fonts.empty()) {
        return &stylesheet_.fonts.front();
    }
    return nullptr;
}

void StyleResolver::applyFont(core::Style& style, std::optional<uint32_t> font_id) const {
    const uint32_t id = font_id.value_or(0);
    if (id >= stylesheet_.fonts.size()) {
        STYLE_WARN("fontId {} out of range ({} fonts), using Normal font", id, stylesheet_.fonts.size());
        clearFont(style);
        if (const RawFont* normal = normalFont()) {
            setFont(style, *normal);
        }
        return;
    }
    setFont(style, stylesheet_.fonts[id]);
}

void StyleResolver::setFont(core::Style& style, const RawFont& font) const {
    const RawFont* normal = normalFont();

    clearFont(style);

    if (font.name) {
        style.font_family = font.name;
    } else if (normal && normal->name) {
        style.font_family = normal->name;
    }
    if (font.scheme) {
        if (*font.scheme == "minor") {
            style.font_family = theme_.minor_font;
        } else if (*font.scheme == "major") {
            style.font_family = theme_.major_font;
        }
    }

    if (font.size) {
        style.font_size = font.size;
    } else if (normal && normal->size) {
        style.font_size = normal->size;
    }

    if (font.color) {
        style.font_color = resolveColor(*font.color);
    }
    style.bold = font.bold;
    style.italic = font.italic;
    style.underline = font.underline;
    style.strikethrough = font.strike;
    style.vert_align = font.vert_align;
}

// ========== 填充 ==========

void StyleResolver::applyFill(core::Style& style, std::optional<uint32_t> fill_id) const {
    clearFill(style);

    const uint32_t id = fill_id.value_or(0);
    if (id >= stylesheet_.fills.size()) {
        STYLE_WARN("fillId {} out of range ({} fills), using no fill", id, stylesheet_.fills.size());
        return;
    }

    const RawFill& fill = stylesheet_.fills[id];
    if (fill.is_gradient) {
        core::GradientFill gradient;
        gradient.type = fill.gradient_type;
        gradient.degree = fill.degree;
        gradient.left = fill.left;
        gradient.right = fill.right;
        gradient.top = fill.top;
        gradient.bottom = fill.bottom;
        gradient.stops.reserve(fill.stops.size());
        for (const auto& stop : fill.stops) {
            core::GradientStop resolved;
            resolved.position = stop.position;
            resolved.color = resolveColor(stop.color).value_or(0x000000);
            gradient.stops.push_back(resolved);
        }
        style.gradient = std::move(gradient);
        return;
    }

    const core::PatternType pattern = fill.pattern.value_or(core::PatternType::None);
    if (pattern == core::PatternType::None) {
        return;
    }

    if (pattern == core::PatternType::Solid) {
        // 实心填充的可见颜色是 fgColor
        if (fill.fg_color) {
            style.bg_color = resolveColor(*fill.fg_color);
        } else if (fill.bg_color) {
            style.bg_color = resolveColor(*fill.bg_color);
        }
        return;
    }

    style.pattern_type = pattern;
    if (fill.fg_color) {
        style.fg_color = resolveColor(*fill.fg_color);
    }
    if (fill.bg_color) {
        style.bg_color = resolveColor(*fill.bg_color);
    }
}

// ========== 边框 ==========

std::optional<core::BorderSide> StyleResolver::resolveSide(const std::optional<RawBorderSide>& side) const {
    if (!side || side->style == core::BorderStyle::None) {
        return std::nullopt;
    }
    core::BorderSide resolved;
    resolved.style = side->style;
    if (side->color) {
        resolved.color = resolveColor(*side->color).value_or(0x000000);
    }
    return resolved;
}

void StyleResolver::applyBorder(core::Style& style, std::optional<uint32_t> border_id) const {
    clearBorder(style);

    const uint32_t id = border_id.value_or(0);
    if (id >= stylesheet_.borders.size()) {
        STYLE_WARN("borderId {} out of range ({} borders), using no border", id, stylesheet_.borders.size());
        return;
    }

    const RawBorder& border = stylesheet_.borders[id];
    style.border_left = resolveSide(border.left);
    style.border_right = resolveSide(border.right);
    style.border_top = resolveSide(border.top);
    style.border_bottom = resolveSide(border.bottom);
    style.border_diagonal = resolveSide(border.diagonal);
    style.diagonal_up = border.diagonal_up;
    style.diagonal_down = border.diagonal_down;
}

// ========== 数字格式、对齐、保护 ==========

std::string StyleResolver::numberFormatCode(uint32_t num_fmt_id) const {
    auto it = stylesheet_.num_fmts.find(num_fmt_id);
    if (it != stylesheet_.num_fmts.end()) {
        return it->second;
    }
    if (auto builtin = format::builtinFormatCode(num_fmt_id)) {
        return *builtin;
    }
    return "General";
}

void StyleResolver::applyNumberFormat(core::Style& style, std::optional<uint32_t> num_fmt_id) const {
    const uint32_t id = num_fmt_id.value_or(0);
    if (stylesheet_.num_fmts.count(id) == 0 && !format::builtinFormatCode(id)) {
        STYLE_WARN("numFmtId {} is neither custom nor built-in, using General", id);
        style.number_format = "General";
        style.number_format_id = 0;
        return;
    }
    style.number_format = numberFormatCode(id);
    style.number_format_id = id;
}

void StyleResolver::applyAlignment(core::Style& style, const std::optional<RawAlignment>& alignment) {
    style.align_h.reset();
    style.align_v.reset();
    style.wrap.reset();
    style.shrink_to_fit.reset();
    style.indent.reset();
    style.rotation.reset();
    style.reading_order.reset();
    if (!alignment) {
        return;
    }

    style.align_h = alignment->horizontal;
    style.align_v = alignment->vertical;
    style.wrap = alignment->wrap_text;
    style.indent = alignment->indent;
    style.rotation = alignment->text_rotation;
    style.reading_order = alignment->reading_order;
    // 自动换行时缩小字体不生效
    if (!style.wrap.value_or(false)) {
        style.shrink_to_fit = alignment->shrink_to_fit;
    }
}

void StyleResolver::applyProtection(core::Style& style, const std::optional<RawProtection>& protection) {
    style.locked.reset();
    style.hidden.reset();
    if (protection) {
        style.locked = protection->locked;
        style.hidden = protection->hidden;
    }
}

// ========== dxf ==========

core::DxfStyle StyleResolver::resolveDxf(uint32_t dxf_index) const {
    core::DxfStyle dxf;
    if (dxf_index >= stylesheet_.dxfs.size()) {
        STYLE_WARN("dxfId {} out of range ({} dxfs)", dxf_index, stylesheet_.dxfs.size());
        return dxf;
    }

    const RawDxf& raw = stylesheet_.dxfs[dxf_index];
    if (raw.font) {
        if (raw.font->color) {
            dxf.font_color = resolveColor(*raw.font->color);
        }
        dxf.bold = raw.font->bold;
        dxf.italic = raw.font->italic;
        dxf.underline = raw.font->underline;
        dxf.strikethrough = raw.font->strike;
    }

    if (raw.fill) {
        // dxf 的实心填充写在 bgColor 中，部分生成器写在 fgColor 中
        if (raw.fill->bg_color) {
            dxf.fill_color = resolveColor(*raw.fill->bg_color);
        } else if (raw.fill->fg_color) {
            dxf.fill_color = resolveColor(*raw.fill->fg_color);
        } else if (raw.fill->is_gradient && !raw.fill->stops.empty()) {
            dxf.fill_color = resolveColor(raw.fill->stops.front().color);
        }
    }

    if (raw.border) {
        for (const auto* side : {&raw.border->left, &raw.border->right, &raw.border->top, &raw.border->bottom}) {
            if (*side && (*side)->color) {
                dxf.border_color = resolveColor(*(*side)->color);
                break;
            }
        }
    }

    if (raw.num_fmt_code) {
        dxf.number_format = raw.num_fmt_code;
    } else if (raw.num_fmt_id) {
        dxf.number_format = numberFormatCode(*raw.num_fmt_id);
    }
    return dxf;
}

std::vector<core::DxfStyle> StyleResolver::resolveAllDxfs() const {
    std::vector<core::DxfStyle> result;
    result.reserve(stylesheet_.dxfs.size());
    for (size_t i = 0; i < stylesheet_.dxfs.size(); ++i) {
        result.push_back(resolveDxf(static_cast<uint32_t>(i)));
    }
    return result;
}

// ========== 颜色 ==========

const std::vector<uint32_t>* StyleResolver::indexedPalette() const {
    return stylesheet_.indexed_colors.empty() ? nullptr : &stylesheet_.indexed_colors;
}

std::optional<uint32_t> StyleResolver::resolveColor(const core::Color& color) const {
    return color.resolve(theme_.colors, indexedPalette());
}

}} // namespace sheetlens::style
