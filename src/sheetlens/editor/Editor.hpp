#pragma once

#include "sheetlens/core/Expected.hpp"
#include "sheetlens/core/Options.hpp"
#include "sheetlens/core/Workbook.hpp"
#include "sheetlens/editor/CellInput.hpp"
#include "sheetlens/format/NumberFormat.hpp"
#include "sheetlens/opc/Package.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sheetlens {
namespace editor {

/**
 * @brief 工作簿编辑器
 *
 * 持有原始字节、解析后的 Workbook 和每个工作表的编辑记录。
 *
 * 保存策略：
 * - 没有任何编辑时原样返回原始字节
 * - 否则按原归档顺序复制每个条目（压缩数据不动），
 *   只有被编辑的工作表部件重新生成 <sheetData> 后重新压缩
 *
 * 使用方式：
 * ```cpp
 * editor::Editor editor;
 * if (auto r = editor.load(bytes); !r) { ... }
 * editor.commitEdit(0, 1, 2, "42");
 * auto saved = editor.save();
 * ```
 */
class Editor {
public:
    explicit Editor(core::EditorOptions options = core::EditorOptions());
    ~Editor();

    Editor(const Editor&) = delete;
    Editor& operator=(const Editor&) = delete;

    /**
     * @brief 加载并解析工作簿，清空所有编辑状态
     *
     * 失败时编辑器回到未加载状态。
     */
    core::VoidResult load(std::vector<uint8_t> bytes);
    core::VoidResult loadFile(const std::string& path);

    /**
     * @brief 提交一次单元格编辑
     * @param sheet_index 工作表下标（0开始）
     * @param row 行（0开始）
     * @param col 列（0开始）
     * @param input 用户输入，类型由 inferCellInput 推断
     */
    core::VoidResult commitEdit(size_t sheet_index, uint32_t row, uint32_t col, std::string_view input);

    bool isLoaded() const { return package_ != nullptr; }
    bool isDirty() const { return !dirty_.empty(); }
    const std::set<size_t>& dirtySheets() const { return dirty_; }

    /**
     * @brief 某个工作表上累计的不同单元格编辑数
     */
    size_t editCount(size_t sheet_index) const;

    const core::Workbook& workbook() const { return workbook_; }

    /**
     * @brief 生成保存后的完整归档
     */
    core::Result<std::vector<uint8_t>> save();
    core::VoidResult saveFile(const std::string& path);

private:
    using CellKey = std::pair<uint32_t, uint32_t>;

    void reset();
    // 返回单元格是否真的发生变化
    bool applyEdit(core::Sheet& sheet, uint32_t row, uint32_t col, const CellInput& input);
    void detachSharedFormula(core::Sheet& sheet, uint32_t row, uint32_t col);

    core::EditorOptions options_;
    std::unique_ptr<opc::Package> package_;
    core::Workbook workbook_;
    std::set<size_t> dirty_;
    std::map<size_t, std::map<CellKey, CellInput>> edits_;
    format::NumberFormatCache format_cache_;
};

}} // namespace sheetlens::editor
