#include "sheetlens/reader/XLSXReader.hpp"
#include "sheetlens/reader/CommentsParser.hpp"
#include "sheetlens/reader/DrawingParser.hpp"
#include "sheetlens/reader/StylesParser.hpp"
#include "sheetlens/reader/WorksheetParser.hpp"
#include "sheetlens/theme/ThemeParser.hpp"
#include "sheetlens/utils/CommonUtils.hpp"
#include "sheetlens/utils/FileWrapper.hpp"
#include "sheetlens/utils/ModuleLoggers.hpp"

#include <fmt/format.h>

namespace sheetlens {
namespace reader {

namespace {

constexpr std::string_view kChartsheet = "/chartsheet";

bool endsWith(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}

} // namespace

core::Result<core::Workbook> XLSXReader::parse(std::vector<uint8_t> bytes, const core::ReaderOptions& options) {
    XLSXReader reader(options);
    return reader.run(std::move(bytes));
}

core::Result<core::Workbook> XLSXReader::parseFile(const std::string& path, const core::ReaderOptions& options) {
    auto bytes = utils::readFileBytes(path);
    if (!bytes) {
        return bytes.error();
    }
    READER_INFO("Opening {} ({} bytes)", path, bytes.value().size());
    return parse(std::move(bytes).value(), options);
}

core::Result<core::Workbook> XLSXReader::run(std::vector<uint8_t> bytes) {
    auto package = opc::Package::open(std::move(bytes));
    if (!package) {
        return package.error();
    }
    package_ = std::move(package).value();

    if (auto result = locateWorkbook(); !result) {
        return result.error();
    }
    if (auto result = loadWorkbookPart(); !result) {
        return result.error();
    }

    auto rels = package_->relationshipsOf(workbook_path_);
    if (!rels) {
        return rels.error();
    }
    workbook_rels_ = std::move(rels).value();

    loadTheme();
    if (auto result = loadStyles(); !result) {
        return result.error();
    }
    if (auto result = loadSharedStrings(); !result) {
        return result.error();
    }

    resolver_ = std::make_unique<style::StyleResolver>(stylesheet_, workbook_.theme);
    workbook_.dxf_styles = resolver_->resolveAllDxfs();
    workbook_.indexed_palette = stylesheet_.indexed_colors;
    if (resolver_->cellXfCount() > 0) {
        workbook_.default_style = resolver_->defaultStyle();
    }

    workbook_.sheets.reserve(sheet_entries_.size());
    for (const auto& entry : sheet_entries_) {
        core::Sheet sheet;
        sheet.name = entry.name;
        sheet.sheet_id = entry.sheet_id;
        sheet.rel_id = entry.rel_id;
        sheet.visibility = entry.visibility;

        if (auto result = loadSheet(entry, sheet); !result) {
            return result.error();
        }
        workbook_.sheets.push_back(std::move(sheet));
    }

    if (options_.resolve_styles) {
        workbook_.styles.reserve(resolver_->cellXfCount());
        for (size_t i = 0; i < resolver_->cellXfCount(); ++i) {
            workbook_.styles.push_back(resolver_->resolve(static_cast<uint32_t>(i)));
        }
    }
    workbook_.shared_strings = std::move(shared_strings_.strings);

    READER_INFO("Loaded workbook: {} sheets, {} shared strings, {} cellXfs, {} number formats compiled",
                workbook_.sheets.size(), workbook_.shared_strings.size(), resolver_->cellXfCount(),
                format_cache_.size());
    return std::move(workbook_);
}

// ==================== 工作簿 ====================

core::VoidResult XLSXReader::locateWorkbook() {
    auto root_rels = package_->relationshipsOf("");
    if (!root_rels) {
        return root_rels.error();
    }

    if (const auto* rel = root_rels.value().findByType(opc::RelType::kOfficeDocument)) {
        if (!rel->isExternal() && package_->hasPart(rel->resolved_path)) {
            workbook_path_ = rel->resolved_path;
            READER_DEBUG("Workbook part located via root relationships: {}", workbook_path_);
            return {};
        }
        READER_WARN("officeDocument relationship points to missing part '{}'", rel->target);
    }

    workbook_path_ = "xl/workbook.xml";
    if (!package_->hasPart(workbook_path_)) {
        READER_ERROR("No workbook part in package");
        return core::makeError(core::ErrorCode::MissingPart, "Workbook part not found", workbook_path_);
    }
    return {};
}

core::VoidResult XLSXReader::loadWorkbookPart() {
    auto content = package_->part(workbook_path_);
    if (!content) {
        return content.error();
    }

    WorkbookParser parser;
    if (auto result = parser.parse(content.value(), workbook_path_); !result) {
        return result.error();
    }

    sheet_entries_ = parser.getSheets();
    workbook_.date1904 = parser.isDate1904();
    workbook_.defined_names = parser.getDefinedNames();
    READER_DEBUG("Workbook: {} sheets, date1904={}, {} defined names",
                 sheet_entries_.size(), workbook_.date1904, workbook_.defined_names.size());
    return {};
}

std::string XLSXReader::findWorkbookPart(std::string_view type_suffix, const std::string& fallback) const {
    if (const auto* rel = workbook_rels_.findByType(type_suffix)) {
        if (!rel->isExternal() && package_->hasPart(rel->resolved_path)) {
            return rel->resolved_path;
        }
    }
    if (package_->hasPart(fallback)) {
        return fallback;
    }
    return std::string();
}

void XLSXReader::loadTheme() {
    const std::string path = findWorkbookPart(opc::RelType::kTheme, "xl/theme/theme1.xml");
    if (path.empty()) {
        READER_DEBUG("No theme part, using default Office theme");
        return;
    }

    auto content = package_->part(path);
    if (!content) {
        READER_WARN("Cannot read theme {}: {}", path, content.error().message);
        return;
    }
    auto theme = theme::ThemeParser::parse(content.value(), path);
    if (!theme) {
        READER_WARN("Skipping malformed theme {}: {}", path, theme.error().fullMessage());
        return;
    }
    workbook_.theme = std::move(theme).value();
}

core::VoidResult XLSXReader::loadStyles() {
    const std::string path = findWorkbookPart(opc::RelType::kStyles, "xl/styles.xml");
    if (path.empty()) {
        READER_WARN("No styles part, all cells use default formatting");
        return {};
    }

    auto content = package_->part(path);
    if (!content) {
        return content.error();
    }
    StylesParser parser;
    if (auto result = parser.parse(content.value(), path); !result) {
        return result.error();
    }
    stylesheet_ = parser.takeStyleSheet();
    return {};
}

core::VoidResult XLSXReader::loadSharedStrings() {
    const std::string path = findWorkbookPart(opc::RelType::kSharedStrings, "xl/sharedStrings.xml");
    if (path.empty()) {
        return {};
    }

    auto content = package_->part(path);
    if (!content) {
        return content.error();
    }
    const std::vector<uint32_t>* palette = stylesheet_.indexed_colors.empty() ? nullptr : &stylesheet_.indexed_colors;
    SharedStringsParser parser(workbook_.theme.colors, palette);
    if (auto result = parser.parse(content.value(), path); !result) {
        return result.error();
    }
    shared_strings_ = parser.takeTable();
    return {};
}

// ==================== 工作表 ====================

core::VoidResult XLSXReader::loadSheet(const WorkbookParser::SheetEntry& entry, core::Sheet& sheet) {
    const auto* rel = workbook_rels_.findById(entry.rel_id);
    if (!rel || rel->isExternal()) {
        READER_ERROR("Sheet '{}' refers to unknown relationship '{}'", entry.name, entry.rel_id);
        return core::makeError(core::ErrorCode::MissingPart,
                               fmt::format("Sheet '{}' has no part (relationship '{}')", entry.name, entry.rel_id),
                               workbook_path_);
    }

    sheet.part_path = rel->resolved_path;
    if (!package_->hasPart(sheet.part_path)) {
        READER_ERROR("Worksheet part {} for sheet '{}' is missing", sheet.part_path, entry.name);
        return core::makeError(core::ErrorCode::MissingPart,
                               fmt::format("Worksheet part for sheet '{}' not found", entry.name), sheet.part_path);
    }

    // 图表工作表没有单元格
    if (endsWith(rel->type, kChartsheet)) {
        READER_DEBUG("Sheet '{}' is a chartsheet, no cells", entry.name);
        return {};
    }

    auto content = package_->part(sheet.part_path);
    if (!content) {
        return content.error();
    }

    opc::Relationships sheet_rels;
    auto rels = package_->relationshipsOf(sheet.part_path);
    if (rels) {
        sheet_rels = std::move(rels).value();
    } else {
        READER_WARN("Ignoring malformed relationships of {}: {}", sheet.part_path, rels.error().message);
    }

    WorksheetParser::Context context;
    context.shared_strings = &shared_strings_;
    context.relationships = &sheet_rels;
    context.theme_colors = &workbook_.theme.colors;
    context.indexed_palette = stylesheet_.indexed_colors.empty() ? nullptr : &stylesheet_.indexed_colors;
    context.date1904 = workbook_.date1904;
    context.options = options_;

    WorksheetParser parser(sheet, context);
    if (auto result = parser.parse(content.value(), sheet.part_path); !result) {
        return result.error();
    }

    if (options_.parse_comments) {
        loadComments(sheet_rels, sheet);
    }
    if (options_.parse_drawings) {
        loadDrawings(parser.getDrawingRelIds(), sheet_rels, sheet);
    }
    finalizeCells(sheet);
    return {};
}

void XLSXReader::loadComments(const opc::Relationships& sheet_rels, core::Sheet& sheet) {
    for (const auto* rel : sheet_rels.findAllByType(opc::RelType::kComments)) {
        if (rel->isExternal() || !package_->hasPart(rel->resolved_path)) {
            READER_WARN("Comments part {} of sheet '{}' is missing", rel->target, sheet.name);
            continue;
        }
        auto content = package_->part(rel->resolved_path);
        if (!content) {
            READER_WARN("Cannot read comments {}: {}", rel->resolved_path, content.error().message);
            continue;
        }

        CommentsParser parser;
        if (auto result = parser.parse(content.value(), rel->resolved_path); !result) {
            READER_WARN("Skipping malformed comments {}: {}", rel->resolved_path, result.error().fullMessage());
            continue;
        }
        for (const auto& comment : parser.getComments()) {
            sheet.comments[comment.ref] = comment;
        }
    }
}

void XLSXReader::loadDrawings(const std::vector<std::string>& rel_ids, const opc::Relationships& sheet_rels,
                              core::Sheet& sheet) {
    for (const auto& rel_id : rel_ids) {
        const auto* rel = sheet_rels.findById(rel_id);
        if (!rel || rel->isExternal() || !package_->hasPart(rel->resolved_path)) {
            READER_WARN("Drawing relationship '{}' of sheet '{}' does not resolve to a part", rel_id, sheet.name);
            continue;
        }
        auto content = package_->part(rel->resolved_path);
        if (!content) {
            READER_WARN("Cannot read drawing {}: {}", rel->resolved_path, content.error().message);
            continue;
        }

        opc::Relationships drawing_rels;
        auto rels = package_->relationshipsOf(rel->resolved_path);
        if (rels) {
            drawing_rels = std::move(rels).value();
        } else {
            READER_WARN("Ignoring malformed relationships of {}", rel->resolved_path);
        }

        DrawingParser parser(drawing_rels);
        if (auto result = parser.parse(content.value(), rel->resolved_path); !result) {
            READER_WARN("Skipping malformed drawing {}: {}", rel->resolved_path, result.error().fullMessage());
            continue;
        }
        const auto& drawings = parser.getDrawings();
        sheet.drawings.insert(sheet.drawings.end(), drawings.begin(), drawings.end());
    }
}

/**
 * @brief 附加样式、显示文本以及批注/超链接标记
 */
void XLSXReader::finalizeCells(core::Sheet& sheet) {
    const format::DateSystem system =
        workbook_.date1904 ? format::DateSystem::Excel1904 : format::DateSystem::Excel1900;
    const core::StylePtr fallback = resolver_->defaultStyle();

    sheet.forEachCell([&](uint32_t row, uint32_t col, core::Cell& cell) {
        core::StylePtr style;
        if (cell.style_index) {
            style = resolver_->resolve(*cell.style_index);
            if (options_.resolve_styles) {
                cell.style = style;
            }
        }

        if (options_.format_values && cell.number) {
            const core::StylePtr& effective = style ? style : fallback;
            cell.display = format_cache_.format(*cell.number, effective->number_format, system);
        }

        if (!sheet.comments.empty()) {
            cell.has_comment = sheet.comments.count(utils::CommonUtils::cellReference(row, col)) > 0;
        }
        for (const auto& link : sheet.hyperlinks) {
            if (link.range.contains(row, col)) {
                cell.has_hyperlink = true;
                break;
            }
        }
    });
}

}} // namespace sheetlens::reader
