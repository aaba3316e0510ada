#pragma once

#include "sheetlens/core/StyleTypes.hpp"
#include "sheetlens/core/Workbook.hpp"
#include "sheetlens/format/DateTime.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sheetlens {
namespace conditional {

/**
 * @brief 数据条的求值结果
 */
struct DataBarResult {
    double fill_ratio = 0.0;            // 条长占单元格宽度的比例 0-1
    bool negative = false;
    uint32_t color = 0x638EC6;
    std::optional<double> axis_ratio;   // 有坐标轴时轴线的位置 0-1
};

struct IconResult {
    std::string set;
    size_t index = 0;                   // 0 为最低档
};

/**
 * @brief 单元格的条件格式叠加结果
 *
 * dxf 属性按优先级取第一个命中的规则；色阶、数据条、图标集各自占用独立槽位。
 */
struct CfResult {
    std::optional<uint32_t> fill_color;
    std::optional<uint32_t> font_color;
    std::optional<bool> bold;
    std::optional<bool> italic;
    std::optional<core::UnderlineType> underline;
    std::optional<bool> strikethrough;
    std::optional<uint32_t> border_color;
    std::optional<std::string> number_format;

    std::optional<uint32_t> scale_color;
    std::optional<DataBarResult> data_bar;
    std::optional<IconResult> icon;

    std::vector<int32_t> matched_priorities;

    bool empty() const { return matched_priorities.empty(); }
};

/**
 * @brief 条件格式求值器
 *
 * 对某个单元格，收集覆盖它的所有规则组中的规则，按 priority 升序求值。
 * 命中且设置了 stopIfTrue 的规则终止后续规则。
 *
 * 色阶、数据条、图标集、top10、平均值和重复值规则需要整组区域的统计量，
 * 这些统计量按规则组第一次用到时计算并缓存。
 *
 * expression 规则不求值，视为永不命中。timePeriod 相对构造时传入的 today 序列号判断。
 *
 * 求值器持有 workbook 与 sheet 的引用，调用方保证其生命周期。
 */
class ConditionalFormatEvaluator {
public:
    /**
     * @param workbook 提供 dxf、主题色、索引调色板和日期系统
     * @param sheet 被求值的工作表
     * @param today_serial 今天的日期序列号（与 workbook 的日期系统一致）
     */
    ConditionalFormatEvaluator(const core::Workbook& workbook, const core::Sheet& sheet, double today_serial);

    CfResult evaluate(uint32_t row, uint32_t col) const;

private:
    struct RangeStats {
        std::vector<double> sorted;                        // 区域内数值，升序
        double sum = 0.0;
        double mean = 0.0;
        double std_dev = 0.0;                              // 总体标准差
        std::unordered_map<std::string, size_t> counts;    // 重复值统计，键为规范化后的值
    };

    const RangeStats& statsFor(size_t group_index) const;
    RangeStats computeStats(const core::ConditionalFormat& group) const;

    bool matchRule(const core::CfRule& rule, const RangeStats& stats, const core::Cell* cell) const;
    bool matchCellIs(const core::CfRule& rule, const core::Cell* cell) const;
    bool matchTop10(const core::CfRule& rule, const RangeStats& stats, double value) const;
    bool matchAboveAverage(const core::CfRule& rule, const RangeStats& stats, double value) const;
    bool matchTimePeriod(const std::string& period, double value) const;

    std::optional<uint32_t> colorScale(const core::ColorScale& scale, const RangeStats& stats, double value) const;
    std::optional<DataBarResult> dataBar(const core::DataBar& bar, const RangeStats& stats, double value) const;
    std::optional<IconResult> iconSet(const core::IconSet& icons, const RangeStats& stats, double value) const;

    std::optional<double> cfvoValue(const core::Cfvo& cfvo, const RangeStats& stats) const;
    void applyDxf(const core::CfRule& rule, CfResult& result) const;
    std::optional<uint32_t> resolveColor(const core::Color& color) const;

    static std::string duplicateKey(const core::Cell& cell);

    const core::Workbook& workbook_;
    const core::Sheet& sheet_;
    double today_;
    format::DateSystem date_system_;

    mutable std::vector<std::optional<RangeStats>> stats_cache_;
};

}} // namespace sheetlens::conditional
