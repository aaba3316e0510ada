#pragma once

#include "sheetlens/core/CellRange.hpp"
#include "sheetlens/core/ConditionalFormat.hpp"
#include "sheetlens/core/Style.hpp"
#include "sheetlens/theme/Theme.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sheetlens {
namespace core {

enum class CellType : uint8_t {
    Empty = 0,
    Number,
    String,
    Boolean,
    Error,
    Formula     // 带缓存结果的公式
};

const char* toString(CellType type);

/**
 * @brief 富文本片段
 */
struct RichTextRun {
    std::string text;
    std::optional<bool> bold;
    std::optional<bool> italic;
    std::optional<uint32_t> color;
    std::optional<double> size;
    std::optional<std::string> font;
};

/**
 * @brief 单元格在原始 XML 中的写法
 *
 * 未经编辑的单元格在重新生成 sheetData 时按原样写回，
 * 保证共享字符串索引、共享公式等信息不丢失。
 */
struct CellSource {
    std::string t;                                              // 原 t 属性
    std::optional<std::string> v;                               // 原 <v> 文本
    std::vector<std::pair<std::string, std::string>> f_attrs;   // <f> 的属性
    std::vector<std::pair<std::string, std::string>> extra_attrs; // cm / vm / ph 等
    std::optional<std::string> inline_xml;                      // 原 <is>...</is>，含富文本 run
};

struct Cell {
    CellType type = CellType::Empty;
    std::optional<std::string> value;      // 字符串、"TRUE"/"FALSE"、数字文本、错误字面量或公式缓存值
    std::optional<std::string> formula;
    std::optional<double> number;          // 数值单元格（或数值型公式结果）的解析值
    std::optional<uint32_t> style_index;   // 原始 cellXfs 索引
    StylePtr style;                        // 无 s 属性时为空
    std::optional<std::string> display;    // 经数字格式格式化后的文本
    std::vector<RichTextRun> rich_text;
    bool has_hyperlink = false;
    bool has_comment = false;
    std::optional<CellSource> source;      // 编辑过的单元格没有原始写法
};

struct CellData {
    uint32_t r = 0;
    uint32_t c = 0;
    Cell cell;
};

enum class SheetVisibility : uint8_t {
    Visible = 0,
    Hidden,
    VeryHidden
};

const char* toString(SheetVisibility visibility);

struct Hyperlink {
    std::string ref;
    CellRange range;
    std::optional<std::string> target;     // 外部链接
    std::optional<std::string> location;   // 工作簿内位置
    std::optional<std::string> display;
    std::optional<std::string> tooltip;
};

struct Comment {
    std::string ref;
    std::string author;
    std::string text;
};

/**
 * @brief 绘图锚点，行列0开始，偏移单位为 EMU
 */
struct AnchorPoint {
    uint32_t col = 0;
    int64_t col_offset = 0;
    uint32_t row = 0;
    int64_t row_offset = 0;
};

struct Drawing {
    enum class Kind : uint8_t { Picture, Chart, Shape };

    Kind kind = Kind::Shape;
    std::string anchor_type = "twoCellAnchor";
    AnchorPoint from;
    std::optional<AnchorPoint> to;
    std::optional<int64_t> ext_cx;         // oneCellAnchor 的尺寸
    std::optional<int64_t> ext_cy;
    std::string name;
    std::string description;
    std::optional<std::string> target;     // 图片或图表部件的包内路径
};

const char* toString(Drawing::Kind kind);

struct Sparkline {
    std::string location;
    std::string data_range;
};

struct SparklineGroup {
    std::string type = "line";             // line / column / stacked
    std::optional<uint32_t> series_color;
    std::optional<uint32_t> negative_color;
    std::optional<uint32_t> markers_color;
    bool markers = false;
    bool high_point = false;
    bool low_point = false;
    bool negative = false;
    std::optional<double> line_weight;
    std::vector<Sparkline> sparklines;
};

struct DataValidation {
    std::string sqref;
    std::string type;
    std::string op;
    std::optional<std::string> formula1;
    std::optional<std::string> formula2;
    bool allow_blank = false;
};

// 分组（大纲）中的一行或一列，level 为 1-7
struct OutlineLevel {
    uint32_t index = 0;
    uint8_t level = 0;
    bool collapsed = false;
    bool hidden = false;
};

/**
 * @brief 单个工作表
 *
 * 单元格以稀疏方式存储，(row, col) 唯一。max_row/max_col 为外接矩形的行数和列数。
 */
class Sheet {
public:
    std::string name;
    std::string part_path;                 // 包内部件路径，如 xl/worksheets/sheet1.xml
    std::string rel_id;
    uint32_t sheet_id = 0;
    SheetVisibility visibility = SheetVisibility::Visible;
    std::optional<uint32_t> tab_color;
    uint32_t frozen_rows = 0;
    uint32_t frozen_cols = 0;
    uint32_t max_row = 0;
    uint32_t max_col = 0;
    std::optional<CellRange> dimension;    // <dimension ref> 声明的区域

    double default_col_width = 8.43;
    double default_row_height = 15.0;
    std::map<uint32_t, double> column_widths;
    std::map<uint32_t, double> row_heights;
    std::vector<uint32_t> hidden_cols;
    std::vector<uint32_t> hidden_rows;

    std::vector<CellRange> merges;
    std::vector<ConditionalFormat> conditional_formats;
    std::vector<Hyperlink> hyperlinks;
    std::map<std::string, Comment> comments;
    std::vector<Drawing> drawings;
    std::vector<SparklineGroup> sparkline_groups;
    std::vector<DataValidation> data_validations;
    std::optional<std::string> auto_filter_ref;

    bool is_protected = false;             // <sheetProtection sheet="1">
    std::vector<OutlineLevel> outline_level_row;
    std::vector<OutlineLevel> outline_level_col;
    bool outline_summary_below = true;     // <outlinePr summaryBelow>
    bool outline_summary_right = true;

    // 行属性（ht / customHeight / hidden 等），重写 sheetData 时保留
    std::map<uint32_t, std::vector<std::pair<std::string, std::string>>> row_attributes;

    const std::vector<CellData>& cells() const { return cells_; }

    /**
     * @brief 原地访问每个单元格，回调参数为 (row, col, Cell&)，不能借此改变位置
     */
    template<typename Fn>
    void forEachCell(Fn&& fn) {
        for (auto& data : cells_) {
            fn(data.r, data.c, data.cell);
        }
    }

    const Cell* findCell(uint32_t row, uint32_t col) const;
    Cell* findCell(uint32_t row, uint32_t col);

    /**
     * @brief 插入或替换单元格，并扩展外接矩形
     */
    Cell& upsertCell(uint32_t row, uint32_t col, Cell cell);

    /**
     * @brief 删除单元格，不存在时返回 false
     */
    bool removeCell(uint32_t row, uint32_t col);

    /**
     * @brief 添加合并区域，与已有区域重叠时拒绝
     */
    bool addMerge(const CellRange& range);

    /**
     * @brief 按 (row, col) 排序后的单元格下标，用于顺序写出
     */
    std::vector<size_t> sortedCellOrder() const;

    void reserveCells(size_t count) { cells_.reserve(count); }

private:
    static uint64_t key(uint32_t row, uint32_t col) {
        return (static_cast<uint64_t>(row) << 32) | col;
    }

    std::vector<CellData> cells_;
    std::unordered_map<uint64_t, size_t> index_;
};

struct DefinedName {
    std::string name;
    std::string value;
    std::optional<uint32_t> local_sheet_id;
    bool hidden = false;
};

/**
 * @brief 解析后的工作簿
 */
struct Workbook {
    std::vector<Sheet> sheets;
    bool date1904 = false;
    theme::Theme theme;
    std::vector<std::string> shared_strings;
    std::vector<StylePtr> styles;          // 按 cellXfs 索引
    std::vector<DxfStyle> dxf_styles;
    StylePtr default_style;
    std::vector<DefinedName> defined_names;
    std::vector<uint32_t> indexed_palette; // 空表示使用默认调色板

    const Sheet* findSheet(const std::string& name) const;
};

}} // namespace sheetlens::core
