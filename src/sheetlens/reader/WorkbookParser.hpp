#pragma once

#include "sheetlens/core/Workbook.hpp"
#include "sheetlens/reader/BaseSAXParser.hpp"
#include <string>
#include <vector>

namespace sheetlens {
namespace reader {

/**
 * @brief 工作簿部件解析器 (workbook.xml)
 *
 * 提取工作表列表（名称、sheetId、r:id、可见性）、日期系统和定义名称。
 */
class WorkbookParser : public BaseSAXParser {
public:
    struct SheetEntry {
        std::string name;
        uint32_t sheet_id = 0;
        std::string rel_id;
        core::SheetVisibility visibility = core::SheetVisibility::Visible;
    };

    WorkbookParser() = default;

    core::VoidResult parse(std::string_view xml_content, const std::string& part_path = "xl/workbook.xml") {
        sheets_.clear();
        defined_names_.clear();
        date1904_ = false;
        saw_root_ = false;
        return parseXML(xml_content, part_path);
    }

    const std::vector<SheetEntry>& getSheets() const { return sheets_; }
    const std::vector<core::DefinedName>& getDefinedNames() const { return defined_names_; }
    bool isDate1904() const { return date1904_; }

protected:
    void onStartElement(std::string_view name, const xml::XMLAttributes& attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;
    core::VoidResult finishDocument(const std::string& part_path) override;

private:
    std::vector<SheetEntry> sheets_;
    std::vector<core::DefinedName> defined_names_;
    bool date1904_ = false;
    bool saw_root_ = false;
};

}} // namespace sheetlens::reader
