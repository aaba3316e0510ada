#include "sheetlens/editor/Editor.hpp"
#include "sheetlens/editor/SheetWriter.hpp"
#include "sheetlens/opc/ZipRepackWriter.hpp"
#include "sheetlens/reader/XLSXReader.hpp"
#include "sheetlens/utils/CommonUtils.hpp"
#include "sheetlens/utils/FileWrapper.hpp"
#include "sheetlens/utils/ModuleLoggers.hpp"

#include <fmt/format.h>
#include <optional>
#include <string_view>
#include <unordered_map>

namespace sheetlens {
namespace editor {

namespace {

std::optional<std::string_view> sourceAttribute(const core::CellSource& source, std::string_view name) {
    for (const auto& attr : source.f_attrs) {
        if (attr.first == name) {
            return std::string_view(attr.second);
        }
    }
    return std::nullopt;
}

// 去掉公式后按缓存值的原始类型还原单元格类型
core::CellType cachedValueType(const core::Cell& cell, const core::CellSource& source) {
    if (!source.v) return core::CellType::Empty;
    if (source.t == "str") return core::CellType::String;
    if (source.t == "b") return core::CellType::Boolean;
    if (source.t == "e") return core::CellType::Error;
    return cell.number ? core::CellType::Number : core::CellType::String;
}

} // namespace

Editor::Editor(core::EditorOptions options) : options_(std::move(options)) {}

Editor::~Editor() = default;

void Editor::reset() {
    package_.reset();
    workbook_ = core::Workbook();
    dirty_.clear();
    edits_.clear();
    format_cache_.clear();
}

core::VoidResult Editor::load(std::vector<uint8_t> bytes) {
    reset();

    // 读取器持有自己的包，编辑器另开一份用于保存时复制原始条目
    auto workbook = reader::XLSXReader::parse(bytes, options_.reader);
    if (!workbook) {
        EDIT_ERROR("Failed to load workbook: {}", workbook.error().fullMessage());
        return workbook.error();
    }
    auto package = opc::Package::open(std::move(bytes));
    if (!package) {
        return package.error();
    }

    workbook_ = std::move(workbook).value();
    package_ = std::move(package).value();
    EDIT_INFO("Loaded workbook for editing: {} sheets, {} parts",
              workbook_.sheets.size(), package_->partNames().size());
    return {};
}

core::VoidResult Editor::loadFile(const std::string& path) {
    auto bytes = utils::readFileBytes(path);
    if (!bytes) {
        reset();
        return bytes.error();
    }
    return load(std::move(bytes).value());
}

core::VoidResult Editor::commitEdit(size_t sheet_index, uint32_t row, uint32_t col, std::string_view input) {
    if (!isLoaded()) {
        return core::makeError(core::ErrorCode::NotLoaded, "No workbook loaded");
    }
    if (sheet_index >= workbook_.sheets.size()) {
        return core::makeError(core::ErrorCode::InvalidSheetIndex,
                               fmt::format("Sheet index {} out of range ({} sheets)",
                                           sheet_index, workbook_.sheets.size()));
    }
    if (!utils::CommonUtils::isValidCellPosition(row, col)) {
        return core::makeError(core::ErrorCode::InvalidArgument,
                               fmt::format("Cell position ({}, {}) out of range", row, col));
    }

    CellInput parsed = inferCellInput(input);
    core::Sheet& sheet = workbook_.sheets[sheet_index];
    if (!applyEdit(sheet, row, col, parsed)) {
        EDIT_DEBUG("Edit {}!{} changes nothing, sheet stays clean", sheet.name,
                   utils::CommonUtils::cellReference(row, col));
        return {};
    }

    EDIT_DEBUG("Edit {}!{} -> {}", sheet.name, utils::CommonUtils::cellReference(row, col), toString(parsed.kind));
    edits_[sheet_index][CellKey(row, col)] = std::move(parsed);
    dirty_.insert(sheet_index);
    return {};
}

bool Editor::applyEdit(core::Sheet& sheet, uint32_t row, uint32_t col, const CellInput& input) {
    detachSharedFormula(sheet, row, col);

    if (input.kind == CellInput::Kind::Remove) {
        // 删除不存在的单元格不是错误，也不算修改
        return sheet.removeCell(row, col);
    }

    core::Cell cell;
    if (const core::Cell* existing = sheet.findCell(row, col)) {
        // 保留样式与批注、超链接标记；公式和原始写法一律丢弃
        cell.style_index = existing->style_index;
        cell.style = existing->style;
        cell.has_comment = existing->has_comment;
        cell.has_hyperlink = existing->has_hyperlink;
    }

    switch (input.kind) {
        case CellInput::Kind::Boolean:
            cell.type = core::CellType::Boolean;
            cell.value = input.boolean ? "TRUE" : "FALSE";
            break;
        case CellInput::Kind::Number: {
            cell.type = core::CellType::Number;
            cell.number = input.number;
            cell.value = fmt::format("{}", input.number);
            const core::StylePtr& style = cell.style ? cell.style : workbook_.default_style;
            if (options_.reader.format_values) {
                const format::DateSystem system =
                    workbook_.date1904 ? format::DateSystem::Excel1904 : format::DateSystem::Excel1900;
                cell.display = format_cache_.format(input.number, style ? style->number_format : "General", system);
            }
            break;
        }
        case CellInput::Kind::String:
            cell.type = core::CellType::String;
            cell.value = input.text;
            break;
        case CellInput::Kind::Remove:
            break;
    }
    sheet.upsertCell(row, col, std::move(cell));
    return true;
}

void Editor::detachSharedFormula(core::Sheet& sheet, uint32_t row, uint32_t col) {
    const core::Cell* master = sheet.findCell(row, col);
    if (!master || !master->source) {
        return;
    }
    const core::CellSource& source = *master->source;
    auto type = sourceAttribute(source, "t");
    auto ref = sourceAttribute(source, "ref");
    auto si = sourceAttribute(source, "si");
    if (!type || *type != "shared" || !ref || !si) {
        return;
    }
    auto range = utils::CommonUtils::parseRange(*ref);
    if (!range) {
        EDIT_WARN("Shared formula on {} has invalid ref '{}'", utils::CommonUtils::cellReference(row, col), *ref);
        return;
    }
    const std::string group(*si);

    // 从属单元格只有 <f t="shared" si="N"/>，主单元格被覆盖后它们无从展开，
    // 去掉 <f> 并保留缓存值
    size_t detached = 0;
    sheet.forEachCell([&](uint32_t r, uint32_t c, core::Cell& cell) {
        if ((r == row && c == col) || !range->contains(r, c) || !cell.source) {
            return;
        }
        core::CellSource& dependent = *cell.source;
        auto dep_type = sourceAttribute(dependent, "t");
        auto dep_si = sourceAttribute(dependent, "si");
        if (!dep_type || *dep_type != "shared" || !dep_si || *dep_si != group ||
            sourceAttribute(dependent, "ref")) {
            return;
        }
        dependent.f_attrs.clear();
        cell.formula.reset();
        cell.type = cachedValueType(cell, dependent);
        ++detached;
    });

    if (detached > 0) {
        EDIT_WARN("Overwriting shared formula master {} (si={}): {} dependent cells keep only cached values",
                  utils::CommonUtils::cellReference(row, col), group, detached);
    }
}

size_t Editor::editCount(size_t sheet_index) const {
    auto it = edits_.find(sheet_index);
    return it == edits_.end() ? 0 : it->second.size();
}

core::Result<std::vector<uint8_t>> Editor::save() {
    if (!isLoaded()) {
        return core::makeError(core::ErrorCode::NotLoaded, "No workbook loaded");
    }
    if (dirty_.empty()) {
        EDIT_DEBUG("No edits, returning original bytes");
        return package_->bytes();
    }

    std::unordered_map<std::string, size_t> dirty_parts;
    for (size_t index : dirty_) {
        dirty_parts.emplace(workbook_.sheets[index].part_path, index);
    }

    opc::ZipRepackWriter writer(options_.compression_level);
    for (const auto& name : package_->partNames()) {
        auto dirty = dirty_parts.find(name);
        if (dirty == dirty_parts.end()) {
            if (auto result = writer.copyFrom(package_->zipReader(), name); !result) {
                EDIT_ERROR("Failed to copy {}: {}", name, result.error().fullMessage());
                return result.error();
            }
            continue;
        }

        auto original = package_->part(name);
        if (!original) {
            return original.error();
        }
        auto rewritten = SheetWriter::rewrite(original.value(), workbook_.sheets[dirty->second]);
        if (!rewritten) {
            return rewritten.error();
        }
        if (auto result = writer.add(name, rewritten.value()); !result) {
            return result.error();
        }
    }

    auto archive = writer.finish();
    if (!archive) {
        return archive.error();
    }
    const auto stats = writer.getStats();
    EDIT_INFO("Saved workbook: {} parts copied, {} regenerated, {} bytes",
              stats.entries_copied, stats.entries_added, archive.value().size());
    return archive;
}

core::VoidResult Editor::saveFile(const std::string& path) {
    auto bytes = save();
    if (!bytes) {
        return bytes.error();
    }
    return utils::writeFileBytes(path, bytes.value().data(), bytes.value().size());
}

}} // namespace sheetlens::editor
