#pragma once

#include "sheetlens/core/Options.hpp"
#include "sheetlens/core/Workbook.hpp"
#include "sheetlens/opc/Relationships.hpp"
#include "sheetlens/reader/BaseSAXParser.hpp"
#include "sheetlens/reader/SharedStringsParser.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sheetlens {
namespace reader {

/**
 * @brief 工作表解析器 (worksheets/sheetN.xml)
 *
 * 一次遍历填充 Sheet 的布局、单元格、合并区域、条件格式、超链接、
 * 数据验证、自动筛选和迷你图。
 *
 * - 单元格引用必须是 [A-Z]+[0-9]+，否则以 InvalidReference 中止
 * - 缺少 r 的单元格取同一行的下一列
 * - 每个单元格保留原始 t / v / f 写法，供编辑器原样写回
 * - x14 扩展中的条件格式按 x14:id 合并到基础规则上
 */
class WorksheetParser : public BaseSAXParser {
public:
    struct Context {
        const SharedStringTable* shared_strings = nullptr;
        const opc::Relationships* relationships = nullptr;
        const core::ThemeColors* theme_colors = nullptr;
        const std::vector<uint32_t>* indexed_palette = nullptr;
        bool date1904 = false;
        core::ReaderOptions options;
    };

    WorksheetParser(core::Sheet& sheet, Context context);

    core::VoidResult parse(std::string_view xml_content, const std::string& part_path) {
        return parseXML(xml_content, part_path);
    }

    // <drawing r:id> 与 <legacyDrawing r:id>
    const std::vector<std::string>& getDrawingRelIds() const { return drawing_rel_ids_; }
    const std::optional<std::string>& getLegacyDrawingRelId() const { return legacy_drawing_rel_id_; }

    size_t getCellCount() const { return cell_count_; }

protected:
    void onStartElement(std::string_view name, const xml::XMLAttributes& attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;
    core::VoidResult finishDocument(const std::string& part_path) override;

private:
    // 单元格解析中间状态
    struct PendingCell {
        uint32_t row = 0;
        uint32_t col = 0;
        std::string t;
        std::optional<uint32_t> s;
        std::optional<std::string> v;
        bool has_formula = false;
        std::optional<std::string> formula;
        std::vector<std::pair<std::string, std::string>> f_attrs;
        std::vector<std::pair<std::string, std::string>> extra_attrs;
        std::optional<std::string> inline_text;
        // <is> 原文，未编辑的单元格按原样写回
        size_t inline_begin = 0;
        size_t inline_open_end = 0;
        std::optional<std::string> inline_xml;
    };

    // x14 扩展中的条件格式
    struct ExtConditionalFormat {
        std::string sqref;
        std::vector<core::CfRule> rules;
    };

    void handleRow(const xml::XMLAttributes& attributes);
    void handleCell(const xml::XMLAttributes& attributes);
    void finishCell();
    void handleCols(const xml::XMLAttributes& attributes);
    void handlePane(const xml::XMLAttributes& attributes);
    std::optional<uint8_t> parseOutlineLevel(const xml::XMLAttributes& attributes) const;
    void handleMerge(const xml::XMLAttributes& attributes);
    void handleHyperlink(const xml::XMLAttributes& attributes);
    void handleCfRule(const xml::XMLAttributes& attributes);
    void handleCfChild(std::string_view name, const xml::XMLAttributes& attributes);
    void handleSparklineGroup(const xml::XMLAttributes& attributes);
    void handleSparklineColor(std::string_view name, const xml::XMLAttributes& attributes);

    void mergeExtensionRules();
    void growBounds(const core::CellRange& range);

    std::optional<uint32_t> resolveColor(const xml::XMLAttributes& attributes) const;
    std::optional<double> parseIsoDate(std::string_view text) const;

    core::Sheet& sheet_;
    Context context_;

    // 行列游标
    uint32_t current_row_ = 0;
    bool row_seen_ = false;
    std::optional<uint32_t> last_col_;
    std::optional<PendingCell> cell_;
    size_t cell_count_ = 0;

    bool in_sheet_view_ = false;
    bool pane_seen_ = false;

    // 条件格式
    core::ConditionalFormat* cf_ = nullptr;
    core::CfRule* rule_ = nullptr;
    core::Cfvo* cfvo_ = nullptr;
    std::vector<ExtConditionalFormat> ext_formats_;
    ExtConditionalFormat* ext_cf_ = nullptr;

    // 迷你图
    core::SparklineGroup* sparkline_group_ = nullptr;
    core::Sparkline* sparkline_ = nullptr;

    core::DataValidation* validation_ = nullptr;

    std::vector<std::string> drawing_rel_ids_;
    std::optional<std::string> legacy_drawing_rel_id_;
    bool saw_root_ = false;
};

}} // namespace sheetlens::reader
