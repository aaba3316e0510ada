#include "sheetlens/reader/WorkbookParser.hpp"

namespace sheetlens {
namespace reader {

void WorkbookParser::onStartElement(std::string_view name, const xml::XMLAttributes& attributes, int /*depth*/) {
    if (name == "workbook") {
        saw_root_ = true;
    } else if (name == "workbookPr") {
        date1904_ = getBoolAttributeOr(attributes, "date1904", false);
    } else if (name == "sheet" && isInElement("sheets")) {
        SheetEntry entry;
        entry.name = getAttributeOr(attributes, "name", "");
        entry.sheet_id = findUIntAttribute(attributes, "sheetId").value_or(0);
        if (auto rid = findAttributeLocal(attributes, "id")) {
            entry.rel_id = std::string(*rid);
        }
        std::string state = getAttributeOr(attributes, "state", "visible");
        if (state == "hidden") {
            entry.visibility = core::SheetVisibility::Hidden;
        } else if (state == "veryHidden") {
            entry.visibility = core::SheetVisibility::VeryHidden;
        }
        sheets_.push_back(std::move(entry));
    } else if (name == "definedName") {
        core::DefinedName defined_name;
        defined_name.name = getAttributeOr(attributes, "name", "");
        defined_name.local_sheet_id = findUIntAttribute(attributes, "localSheetId");
        defined_name.hidden = getBoolAttributeOr(attributes, "hidden", false);
        defined_names_.push_back(std::move(defined_name));
        startCollectingText();
    }
}

void WorkbookParser::onEndElement(std::string_view name, int /*depth*/) {
    if (name == "definedName" && !defined_names_.empty()) {
        defined_names_.back().value = getCurrentText();
        stopCollectingText();
    }
}

core::VoidResult WorkbookParser::finishDocument(const std::string& part_path) {
    if (!saw_root_) {
        return core::makeError(core::ErrorCode::XmlParseError, "Missing <workbook> root element", part_path);
    }
    READER_DEBUG("Workbook: {} sheets, {} defined names, date1904={}", sheets_.size(), defined_names_.size(), date1904_);
    return {};
}

}} // namespace sheetlens::reader
