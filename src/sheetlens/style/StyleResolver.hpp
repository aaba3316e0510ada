#pragma once

#include "sheetlens/core/Style.hpp"
#include "sheetlens/style/StyleSheet.hpp"
#include "sheetlens/theme/Theme.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sheetlens {
namespace style {

/**
 * @brief 样式解析器 - 把 cellXfs 索引展开为完整的 core::Style
 *
 * 解析顺序：
 * 1. 以 "Normal" 字体为基线（cellStyleXfs[0] 的字体，没有时取 fonts[0]）
 * 2. xfId 指向的命名样式 (cellStyleXfs) 覆盖基线
 * 3. cellXfs 自身的各类属性按 apply 标志覆盖：
 *    - 显式 1：总是采用本条目的属性
 *    - 显式 0：保留父样式的属性
 *    - 未出现：字体/填充/边框/数字格式在 id 非 0 时采用，对齐/保护在子元素存在时采用
 *
 * 结果按索引缓存，同一索引返回同一个实例。
 * 解析器持有 stylesheet 的引用，调用方保证其生命周期。
 */
class StyleResolver {
public:
    StyleResolver(const StyleSheet& stylesheet, const theme::Theme& theme);

    // 禁用拷贝
    StyleResolver(const StyleResolver&) = delete;
    StyleResolver& operator=(const StyleResolver&) = delete;

    /**
     * @brief 解析 cellXfs[xf_index]
     * @return 越界索引返回默认样式
     */
    core::StylePtr resolve(uint32_t xf_index);

    /**
     * @brief 默认样式，即 cellXfs[0] 的解析结果
     */
    core::StylePtr defaultStyle();

    /**
     * @brief 解析差异格式，越界返回空的 DxfStyle
     */
    core::DxfStyle resolveDxf(uint32_t dxf_index) const;

    std::vector<core::DxfStyle> resolveAllDxfs() const;

    /**
     * @brief 数字格式 id 对应的格式代码
     *
     * 自定义格式优先于内置格式，未知 id 返回 "General"。
     */
    std::string numberFormatCode(uint32_t num_fmt_id) const;

    std::optional<uint32_t> resolveColor(const core::Color& color) const;

    size_t cellXfCount() const { return stylesheet_.cell_xfs.size(); }
    const theme::Theme& theme() const { return theme_; }

private:
    core::Style build(const RawXf& xf) const;
    void applyCategories(core::Style& style, const RawXf& xf) const;

    void applyFont(core::Style& style, std::optional<uint32_t> font_id) const;
    void applyFill(core::Style& style, std::optional<uint32_t> fill_id) const;
    void applyBorder(core::Style& style, std::optional<uint32_t> border_id) const;
    void applyNumberFormat(core::Style& style, std::optional<uint32_t> num_fmt_id) const;
    static void applyAlignment(core::Style& style, const std::optional<RawAlignment>& alignment);
    static void applyProtection(core::Style& style, const std::optional<RawProtection>& protection);

    void setFont(core::Style& style, const RawFont& font) const;
    std::optional<core::BorderSide> resolveSide(const std::optional<RawBorderSide>& side) const;

    const RawFont* normalFont() const;
    const std::vector<uint32_t>* indexedPalette() const;

    const StyleSheet& stylesheet_;
    theme::Theme theme_;

    std::vector<core::StylePtr> cache_;
    core::StylePtr fallback_;
};

}} // namespace sheetlens::style
