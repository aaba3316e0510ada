#pragma once

#include "sheetlens/reader/BaseSAXParser.hpp"
#include "sheetlens/style/StyleSheet.hpp"

namespace sheetlens {
namespace reader {

/**
 * @brief 样式部件解析器 (styles.xml)
 *
 * 只把 XML 忠实地搬进 style::StyleSheet，不补默认值，不解析颜色。
 * 按区域（numFmts、fonts、fills、borders、cellStyleXfs、cellXfs、cellStyles、dxfs、colors）
 * 切换上下文，dxf 内部的 font/fill/border/numFmt 写入当前 dxf。
 */
class StylesParser : public BaseSAXParser {
public:
    StylesParser() = default;

    core::VoidResult parse(std::string_view xml_content, const std::string& part_path = "xl/styles.xml") {
        sheet_ = style::StyleSheet();
        return parseXML(xml_content, part_path);
    }

    const style::StyleSheet& getStyleSheet() const { return sheet_; }
    style::StyleSheet takeStyleSheet() { return std::move(sheet_); }

protected:
    void onStartElement(std::string_view name, const xml::XMLAttributes& attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;
    core::VoidResult finishDocument(const std::string& part_path) override;

private:
    enum class Region {
        None,
        NumFmts,
        Fonts,
        Fills,
        Borders,
        CellStyleXfs,
        CellXfs,
        CellStyles,
        Dxfs,
        IndexedColors
    };

    void handleFontChild(std::string_view name, const xml::XMLAttributes& attributes);
    void handleFillChild(std::string_view name, const xml::XMLAttributes& attributes);
    void handleBorderChild(std::string_view name, const xml::XMLAttributes& attributes);
    void handleXf(const xml::XMLAttributes& attributes);
    void handleXfChild(std::string_view name, const xml::XMLAttributes& attributes);
    style::RawBorderSide* borderSide(std::string_view name);

    style::StyleSheet sheet_;
    Region region_ = Region::None;
    bool saw_root_ = false;

    // 当前正在填充的对象，指向 sheet_ 中的元素或当前 dxf 的成员
    style::RawFont* font_ = nullptr;
    style::RawFill* fill_ = nullptr;
    style::RawBorder* border_ = nullptr;
    style::RawBorderSide* side_ = nullptr;
    style::RawXf* xf_ = nullptr;
    style::RawDxf* dxf_ = nullptr;
    bool in_gradient_stop_ = false;
};

}} // namespace sheetlens::reader
