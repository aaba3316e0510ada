#include "sheetlens/conditional/ConditionalFormatEvaluator.hpp"
#include "sheetlens/utils/ModuleLoggers.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fast_float/fast_float.h>
#include <fmt/format.h>

namespace sheetlens {
namespace conditional {

namespace {

constexpr uint32_t kDefaultBarColor = 0x638EC6;

std::string toLower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
    return text;
}

std::optional<double> parseNumber(std::string_view text) {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    double value = 0.0;
    auto result = fast_float::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc() || result.ptr != text.data() + text.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

/**
 * @brief cellIs 的操作数：数字字面量或带引号的字符串，其余公式不求值
 */
struct Operand {
    std::optional<double> number;
    std::optional<std::string> text;
};

std::optional<Operand> parseOperand(std::string_view formula) {
    formula = trim(formula);
    if (formula.size() >= 2 && formula.front() == '"' && formula.back() == '"') {
        std::string text;
        auto body = formula.substr(1, formula.size() - 2);
        for (size_t i = 0; i < body.size(); ++i) {
            text += body[i];
            if (body[i] == '"' && i + 1 < body.size() && body[i + 1] == '"') {
                ++i;
            }
        }
        Operand operand;
        operand.text = std::move(text);
        return operand;
    }
    if (auto number = parseNumber(formula)) {
        Operand operand;
        operand.number = number;
        return operand;
    }
    return std::nullopt;
}

bool isBlank(const core::Cell* cell) {
    if (!cell || cell->type == core::CellType::Empty) {
        return true;
    }
    if (cell->type == core::CellType::String) {
        return !cell->value || trim(*cell->value).empty();
    }
    return false;
}

bool isError(const core::Cell* cell) {
    if (!cell) {
        return false;
    }
    if (cell->type == core::CellType::Error) {
        return true;
    }
    return cell->type == core::CellType::Formula && cell->source && cell->source->t == "e";
}

std::string cellText(const core::Cell* cell) {
    if (!cell || !cell->value) {
        return std::string();
    }
    return *cell->value;
}

// PERCENTILE.INC
double percentile(const std::vector<double>& sorted, double fraction) {
    if (sorted.empty()) {
        return 0.0;
    }
    fraction = std::clamp(fraction, 0.0, 1.0);
    const double rank = fraction * static_cast<double>(sorted.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(rank));
    const size_t hi = std::min(lo + 1, sorted.size() - 1);
    return sorted[lo] + (sorted[hi] - sorted[lo]) * (rank - static_cast<double>(lo));
}

uint32_t lerpColor(uint32_t a, uint32_t b, double t) {
    auto channel = [t](uint32_t ca, uint32_t cb) {
        const double v = static_cast<double>(ca) + (static_cast<double>(cb) - static_cast<double>(ca)) * t;
        return static_cast<uint32_t>(std::clamp(std::round(v), 0.0, 255.0));
    };
    return (channel((a >> 16) & 0xFF, (b >> 16) & 0xFF) << 16) |
           (channel((a >> 8) & 0xFF, (b >> 8) & 0xFF) << 8) |
           channel(a & 0xFF, b & 0xFF);
}

bool needsStats(core::CfRuleType type) {
    switch (type) {
        case core::CfRuleType::ColorScale:
        case core::CfRuleType::DataBar:
        case core::CfRuleType::IconSet:
        case core::CfRuleType::Top10:
        case core::CfRuleType::AboveAverage:
        case core::CfRuleType::DuplicateValues:
        case core::CfRuleType::UniqueValues:
            return true;
        default:
            return false;
    }
}

} // namespace

ConditionalFormatEvaluator::ConditionalFormatEvaluator(const core::Workbook& workbook, const core::Sheet& sheet,
                                                       double today_serial)
    : workbook_(workbook),
      sheet_(sheet),
      today_(today_serial),
      date_system_(workbook.date1904 ? format::DateSystem::Excel1904 : format::DateSystem::Excel1900),
      stats_cache_(sheet.conditional_formats.size()) {}

CfResult ConditionalFormatEvaluator::evaluate(uint32_t row, uint32_t col) const {
    CfResult result;

    struct Candidate {
        int32_t priority;
        size_t group;
        size_t rule;
    };
    std::vector<Candidate> candidates;

    const auto& groups = sheet_.conditional_formats;
    for (size_t g = 0; g < groups.size(); ++g) {
        const bool covers = std::any_of(groups[g].ranges.begin(), groups[g].ranges.end(),
                                        [row, col](const core::CellRange& range) { return range.contains(row, col); });
        if (!covers) {
            continue;
        }
        for (size_t r = 0; r < groups[g].rules.size(); ++r) {
            candidates.push_back({groups[g].rules[r].priority, g, r});
        }
    }
    if (candidates.empty()) {
        return result;
    }

    // priority 越小越先求值，相同时保持文档顺序
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) { return a.priority < b.priority; });

    const core::Cell* cell = sheet_.findCell(row, col);
    const std::optional<double> number = cell ? cell->number : std::nullopt;
    static const RangeStats kNoStats;

    for (const auto& candidate : candidates) {
        const core::CfRule& rule = groups[candidate.group].rules[candidate.rule];
        const RangeStats& stats = needsStats(rule.type) ? statsFor(candidate.group) : kNoStats;

        bool matched = false;
        switch (rule.type) {
            case core::CfRuleType::ColorScale:
                if (rule.color_scale && number && !result.scale_color) {
                    result.scale_color = colorScale(*rule.color_scale, stats, *number);
                    matched = result.scale_color.has_value();
                }
                break;
            case core::CfRuleType::DataBar:
                if (rule.data_bar && number && !result.data_bar) {
                    result.data_bar = dataBar(*rule.data_bar, stats, *number);
                    matched = result.data_bar.has_value();
                }
                break;
            case core::CfRuleType::IconSet:
                if (rule.icon_set && number && !result.icon) {
                    result.icon = iconSet(*rule.icon_set, stats, *number);
                    matched = result.icon.has_value();
                }
                break;
            default:
                matched = matchRule(rule, stats, cell);
                if (matched) {
                    applyDxf(rule, result);
                }
                break;
        }

        if (!matched) {
            continue;
        }
        SHEETLENS_LOG_CF_DEBUG("Rule {} (priority {}) matched at row {} col {}",
                               core::toString(rule.type), rule.priority, row, col);
        result.matched_priorities.push_back(rule.priority);
        if (rule.stop_if_true) {
            break;
        }
    }
    return result;
}

// ==================== 区域统计 ====================

const ConditionalFormatEvaluator::RangeStats& ConditionalFormatEvaluator::statsFor(size_t group_index) const {
    auto& slot = stats_cache_[group_index];
    if (!slot) {
        slot = computeStats(sheet_.conditional_formats[group_index]);
    }
    return *slot;
}

ConditionalFormatEvaluator::RangeStats
ConditionalFormatEvaluator::computeStats(const core::ConditionalFormat& group) const {
    RangeStats stats;
    for (const auto& data : sheet_.cells()) {
        const bool covered = std::any_of(group.ranges.begin(), group.ranges.end(),
                                         [&data](const core::CellRange& range) { return range.contains(data.r, data.c); });
        if (!covered) {
            continue;
        }
        if (data.cell.number) {
            stats.sorted.push_back(*data.cell.number);
            stats.sum += *data.cell.number;
        }
        std::string key = duplicateKey(data.cell);
        if (!key.empty()) {
            ++stats.counts[key];
        }
    }

    std::sort(stats.sorted.begin(), stats.sorted.end());
    if (!stats.sorted.empty()) {
        const double n = static_cast<double>(stats.sorted.size());
        stats.mean = stats.sum / n;
        double squares = 0.0;
        for (double v : stats.sorted) {
            squares += (v - stats.mean) * (v - stats.mean);
        }
        stats.std_dev = std::sqrt(squares / n);
    }
    CF_DEBUG("Range stats for '{}': {} numeric values, {} distinct keys",
             group.sqref, stats.sorted.size(), stats.counts.size());
    return stats;
}

std::string ConditionalFormatEvaluator::duplicateKey(const core::Cell& cell) {
    if (cell.number && cell.type != core::CellType::String) {
        return fmt::format("n:{}", *cell.number);
    }
    if (cell.value && !trim(*cell.value).empty()) {
        return "s:" + toLower(*cell.value);
    }
    return std::string();
}

// ==================== 规则匹配 ====================

bool ConditionalFormatEvaluator::matchRule(const core::CfRule& rule, const RangeStats& stats,
                                           const core::Cell* cell) const {
    const std::optional<double> number = cell ? cell->number : std::nullopt;

    switch (rule.type) {
        case core::CfRuleType::CellIs:
            return matchCellIs(rule, cell);
        case core::CfRuleType::Top10:
            return number && matchTop10(rule, stats, *number);
        case core::CfRuleType::AboveAverage:
            return number && matchAboveAverage(rule, stats, *number);
        case core::CfRuleType::DuplicateValues:
        case core::CfRuleType::UniqueValues: {
            if (!cell) {
                return false;
            }
            const std::string key = duplicateKey(*cell);
            if (key.empty()) {
                return false;
            }
            auto it = stats.counts.find(key);
            const size_t count = it == stats.counts.end() ? 0 : it->second;
            return rule.type == core::CfRuleType::DuplicateValues ? count > 1 : count == 1;
        }
        case core::CfRuleType::ContainsText:
            return toLower(cellText(cell)).find(toLower(rule.text)) != std::string::npos && !isBlank(cell);
        case core::CfRuleType::NotContainsText:
            return toLower(cellText(cell)).find(toLower(rule.text)) == std::string::npos;
        case core::CfRuleType::BeginsWith: {
            const std::string text = toLower(cellText(cell));
            const std::string prefix = toLower(rule.text);
            return !isBlank(cell) && text.compare(0, prefix.size(), prefix) == 0;
        }
        case core::CfRuleType::EndsWith: {
            const std::string text = toLower(cellText(cell));
            const std::string suffix = toLower(rule.text);
            return !isBlank(cell) && text.size() >= suffix.size() &&
                   text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
        }
        case core::CfRuleType::ContainsBlanks:
            return isBlank(cell);
        case core::CfRuleType::NotContainsBlanks:
            return !isBlank(cell);
        case core::CfRuleType::ContainsErrors:
            return isError(cell);
        case core::CfRuleType::NotContainsErrors:
            return !isError(cell);
        case core::CfRuleType::TimePeriod:
            return number && matchTimePeriod(rule.time_period, *number);
        case core::CfRuleType::Expression:
        case core::CfRuleType::Unknown:
        default:
            return false;
    }
}

bool ConditionalFormatEvaluator::matchCellIs(const core::CfRule& rule, const core::Cell* cell) const {
    if (rule.formulas.empty()) {
        return false;
    }
    auto first = parseOperand(rule.formulas[0]);
    if (!first) {
        return false;
    }

    // 空单元格按 0 参与数值比较
    std::optional<double> number;
    std::optional<std::string> text;
    if (isBlank(cell)) {
        number = 0.0;
        text = std::string();
    } else if (cell->number && cell->type != core::CellType::String) {
        number = cell->number;
    } else {
        text = toLower(cellText(cell));
    }

    const std::string& op = rule.op.empty() ? std::string("equal") : rule.op;

    if (op == "between" || op == "notBetween") {
        if (rule.formulas.size() < 2) {
            return false;
        }
        auto second = parseOperand(rule.formulas[1]);
        if (!second || !first->number || !second->number || !number) {
            return false;
        }
        const double lo = std::min(*first->number, *second->number);
        const double hi = std::max(*first->number, *second->number);
        const bool inside = *number >= lo && *number <= hi;
        return op == "between" ? inside : !inside;
    }

    int cmp = 0;
    if (first->number && number) {
        cmp = *number < *first->number ? -1 : (*number > *first->number ? 1 : 0);
    } else if (first->text && text) {
        const int c = text->compare(toLower(*first->text));
        cmp = c < 0 ? -1 : (c > 0 ? 1 : 0);
    } else {
        // 数字与文本不可比较
        return op == "notEqual";
    }

    if (op == "equal") return cmp == 0;
    if (op == "notEqual") return cmp != 0;
    if (op == "greaterThan") return cmp > 0;
    if (op == "greaterThanOrEqual") return cmp >= 0;
    if (op == "lessThan") return cmp < 0;
    if (op == "lessThanOrEqual") return cmp <= 0;
    CF_WARN("Unknown cellIs operator '{}'", op);
    return false;
}

bool ConditionalFormatEvaluator::matchTop10(const core::CfRule& rule, const RangeStats& stats, double value) const {
    const size_t count = stats.sorted.size();
    if (count == 0 || rule.rank == 0) {
        return false;
    }
    size_t n = rule.rank;
    if (rule.percent) {
        n = static_cast<size_t>(std::floor(static_cast<double>(count) * rule.rank / 100.0));
        n = std::max<size_t>(n, 1);
    }
    n = std::min(n, count);

    if (rule.bottom) {
        return value <= stats.sorted[n - 1];
    }
    return value >= stats.sorted[count - n];
}

bool ConditionalFormatEvaluator::matchAboveAverage(const core::CfRule& rule, const RangeStats& stats,
                                                   double value) const {
    if (stats.sorted.empty()) {
        return false;
    }
    const double offset = rule.std_dev ? static_cast<double>(*rule.std_dev) * stats.std_dev : 0.0;
    if (rule.above_average) {
        const double threshold = stats.mean + offset;
        return rule.equal_average ? value >= threshold : value > threshold;
    }
    const double threshold = stats.mean - offset;
    return rule.equal_average ? value <= threshold : value < threshold;
}

bool ConditionalFormatEvaluator::matchTimePeriod(const std::string& period, double value) const {
    if (value < 0 || today_ < 0) {
        return false;
    }
    const int64_t day = static_cast<int64_t>(std::floor(value));
    const int64_t today = static_cast<int64_t>(std::floor(today_));

    if (period == "today") return day == today;
    if (period == "yesterday") return day == today - 1;
    if (period == "tomorrow") return day == today + 1;
    if (period == "last7Days") return day >= today - 6 && day <= today;

    auto today_dt = format::serialToDateTime(static_cast<double>(today), date_system_);
    auto cell_dt = format::serialToDateTime(static_cast<double>(day), date_system_);
    if (!today_dt || !cell_dt) {
        return false;
    }

    // 一周从星期日开始
    const int64_t week_start = today - today_dt->weekday;
    if (period == "thisWeek") return day >= week_start && day <= week_start + 6;
    if (period == "lastWeek") return day >= week_start - 7 && day <= week_start - 1;
    if (period == "nextWeek") return day >= week_start + 7 && day <= week_start + 13;

    const int64_t today_month = static_cast<int64_t>(today_dt->year) * 12 + (today_dt->month - 1);
    const int64_t cell_month = static_cast<int64_t>(cell_dt->year) * 12 + (cell_dt->month - 1);
    if (period == "thisMonth") return cell_month == today_month;
    if (period == "lastMonth") return cell_month == today_month - 1;
    if (period == "nextMonth") return cell_month == today_month + 1;

    CF_WARN("Unknown timePeriod '{}'", period);
    return false;
}

// ==================== 色阶 / 数据条 / 图标集 ====================

std::optional<double> ConditionalFormatEvaluator::cfvoValue(const core::Cfvo& cfvo, const RangeStats& stats) const {
    if (stats.sorted.empty()) {
        return std::nullopt;
    }
    const double min = stats.sorted.front();
    const double max = stats.sorted.back();

    switch (cfvo.type) {
        case core::Cfvo::Type::Min:
            return min;
        case core::Cfvo::Type::Max:
            return max;
        case core::Cfvo::Type::AutoMin:
            return std::min(0.0, min);
        case core::Cfvo::Type::AutoMax:
            return std::max(0.0, max);
        case core::Cfvo::Type::Num:
        case core::Cfvo::Type::Formula:
            return parseNumber(cfvo.value);
        case core::Cfvo::Type::Percent: {
            auto p = parseNumber(cfvo.value);
            if (!p) return std::nullopt;
            return min + (max - min) * (*p / 100.0);
        }
        case core::Cfvo::Type::Percentile: {
            auto p = parseNumber(cfvo.value);
            if (!p) return std::nullopt;
            return percentile(stats.sorted, *p / 100.0);
        }
    }
    return std::nullopt;
}

std::optional<uint32_t> ConditionalFormatEvaluator::colorScale(const core::ColorScale& scale, const RangeStats& stats,
                                                               double value) const {
    const size_t stops = std::min(scale.cfvos.size(), scale.colors.size());
    if (stops < 2 || stats.sorted.empty()) {
        return std::nullopt;
    }

    std::vector<double> points(stops);
    std::vector<uint32_t> colors(stops);
    for (size_t i = 0; i < stops; ++i) {
        auto point = cfvoValue(scale.cfvos[i], stats);
        if (!point) {
            // 无法求值的阈值：首尾取极值，中间取中位数
            point = i == 0 ? stats.sorted.front()
                           : (i + 1 == stops ? stats.sorted.back() : percentile(stats.sorted, 0.5));
        }
        points[i] = *point;
        colors[i] = resolveColor(scale.colors[i]).value_or(0xFFFFFF);
    }

    if (value <= points.front()) {
        return colors.front();
    }
    if (value >= points.back()) {
        return colors.back();
    }
    for (size_t i = 0; i + 1 < stops; ++i) {
        if (value <= points[i + 1]) {
            const double span = points[i + 1] - points[i];
            const double t = span > 0.0 ? (value - points[i]) / span : 1.0;
            return lerpColor(colors[i], colors[i + 1], t);
        }
    }
    return colors.back();
}

std::optional<DataBarResult> ConditionalFormatEvaluator::dataBar(const core::DataBar& bar, const RangeStats& stats,
                                                                 double value) const {
    if (stats.sorted.empty()) {
        return std::nullopt;
    }

    double low = stats.sorted.front();
    double high = stats.sorted.back();
    if (!bar.cfvos.empty()) {
        if (auto v = cfvoValue(bar.cfvos.front(), stats)) low = *v;
    }
    if (bar.cfvos.size() > 1) {
        if (auto v = cfvoValue(bar.cfvos[1], stats)) high = *v;
    }
    if (high < low) {
        std::swap(low, high);
    }

    DataBarResult result;
    result.negative = value < 0;
    result.color = resolveColor(bar.color).value_or(kDefaultBarColor);
    if (result.negative && bar.negative_fill_color) {
        if (auto negative = resolveColor(*bar.negative_fill_color)) {
            result.color = *negative;
        }
    }

    const double min_len = bar.min_length / 100.0;
    const double max_len = bar.max_length / 100.0;
    const bool has_axis = bar.axis_position == "middle" || (bar.axis_position != "none" && low < 0.0);

    if (has_axis) {
        // 负值从轴线向左画，正值向右
        if (bar.axis_position == "middle") {
            const double scale = std::max(std::fabs(low), std::fabs(high));
            result.axis_ratio = 0.5;
            result.fill_ratio = scale > 0.0 ? std::fabs(value) / scale * 0.5 : 0.0;
        } else {
            const double span = std::max(high, 0.0) - low;
            result.axis_ratio = span > 0.0 ? -low / span : 0.0;
            result.fill_ratio = span > 0.0 ? std::fabs(value) / span : 0.0;
        }
        result.fill_ratio = std::clamp(result.fill_ratio, 0.0, 1.0);
        return result;
    }

    const double span = high - low;
    const double position = span > 0.0 ? std::clamp((value - low) / span, 0.0, 1.0) : 1.0;
    result.fill_ratio = min_len + position * (max_len - min_len);
    return result;
}

std::optional<IconResult> ConditionalFormatEvaluator::iconSet(const core::IconSet& icons, const RangeStats& stats,
                                                              double value) const {
    if (stats.sorted.empty()) {
        return std::nullopt;
    }
    const size_t count = std::max<size_t>(icons.iconCount(), 2);
    const double min = stats.sorted.front();
    const double max = stats.sorted.back();

    size_t index = 0;
    for (size_t i = 1; i < count; ++i) {
        std::optional<double> threshold;
        bool gte = true;
        if (i < icons.cfvos.size()) {
            threshold = cfvoValue(icons.cfvos[i], stats);
            gte = icons.cfvos[i].gte;
        }
        if (!threshold) {
            // 缺少阈值时按百分比均分
            threshold = min + (max - min) * static_cast<double>(i) / static_cast<double>(count);
        }
        if (gte ? value >= *threshold : value > *threshold) {
            index = i;
        }
    }
    if (icons.reverse) {
        index = count - 1 - index;
    }

    IconResult result;
    result.set = icons.icon_set;
    result.index = index;
    return result;
}

// ==================== dxf 与颜色 ====================

void ConditionalFormatEvaluator::applyDxf(const core::CfRule& rule, CfResult& result) const {
    if (!rule.dxf_id) {
        return;
    }
    if (*rule.dxf_id >= workbook_.dxf_styles.size()) {
        CF_WARN("Rule priority {} refers to missing dxf {}", rule.priority, *rule.dxf_id);
        return;
    }

    // 每个属性由第一个命中的规则决定
    const core::DxfStyle& dxf = workbook_.dxf_styles[*rule.dxf_id];
    if (!result.fill_color) result.fill_color = dxf.fill_color;
    if (!result.font_color) result.font_color = dxf.font_color;
    if (!result.bold) result.bold = dxf.bold;
    if (!result.italic) result.italic = dxf.italic;
    if (!result.underline) result.underline = dxf.underline;
    if (!result.strikethrough) result.strikethrough = dxf.strikethrough;
    if (!result.border_color) result.border_color = dxf.border_color;
    if (!result.number_format) result.number_format = dxf.number_format;
}

std::optional<uint32_t> ConditionalFormatEvaluator::resolveColor(const core::Color& color) const {
    const std::vector<uint32_t>* palette = workbook_.indexed_palette.empty() ? nullptr : &workbook_.indexed_palette;
    return color.resolve(workbook_.theme.colors, palette);
}

}} // namespace sheetlens::conditional
