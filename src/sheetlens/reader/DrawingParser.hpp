#pragma once

#include "sheetlens/core/Workbook.hpp"
#include "sheetlens/opc/Relationships.hpp"
#include "sheetlens/reader/BaseSAXParser.hpp"
#include <string>
#include <vector>

namespace sheetlens {
namespace reader {

/**
 * @brief 绘图部件解析器 (drawingN.xml)
 *
 * 支持 twoCellAnchor 与 oneCellAnchor；图片的 r:embed 与图表的 r:id
 * 通过绘图部件自身的关系解析为包内路径。
 */
class DrawingParser : public BaseSAXParser {
public:
    explicit DrawingParser(const opc::Relationships& relationships) : relationships_(relationships) {}

    core::VoidResult parse(std::string_view xml_content, const std::string& part_path) {
        drawings_.clear();
        return parseXML(xml_content, part_path);
    }

    const std::vector<core::Drawing>& getDrawings() const { return drawings_; }

protected:
    void onStartElement(std::string_view name, const xml::XMLAttributes& attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;

private:
    void resolveTarget(std::string_view rel_id);

    const opc::Relationships& relationships_;
    std::vector<core::Drawing> drawings_;
    bool in_anchor_ = false;
    core::AnchorPoint* point_ = nullptr;   // 当前 from / to
    bool named_ = false;                   // 只取第一个 cNvPr
};

}} // namespace sheetlens::reader
