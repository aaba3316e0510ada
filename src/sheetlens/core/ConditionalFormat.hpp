#pragma once

#include "sheetlens/core/CellRange.hpp"
#include "sheetlens/core/Color.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sheetlens {
namespace core {

/**
 * @brief 条件格式规则类型
 */
enum class CfRuleType : uint8_t {
    ColorScale,
    DataBar,
    IconSet,
    CellIs,
    Expression,
    Top10,
    AboveAverage,
    TimePeriod,
    DuplicateValues,
    UniqueValues,
    ContainsBlanks,
    NotContainsBlanks,
    ContainsText,
    NotContainsText,
    BeginsWith,
    EndsWith,
    ContainsErrors,
    NotContainsErrors,
    Unknown
};

CfRuleType parseCfRuleType(const std::string& value);
const char* toString(CfRuleType type);

/**
 * @brief 阈值对象 <cfvo>
 */
struct Cfvo {
    enum class Type : uint8_t {
        Num,
        Percent,
        Percentile,
        Min,
        Max,
        Formula,
        AutoMin,
        AutoMax
    };

    Type type = Type::Min;
    std::string value;
    bool gte = true;  // 图标集阈值是否包含等号

    static Type parseType(const std::string& value);
};

struct ColorScale {
    std::vector<Cfvo> cfvos;
    std::vector<Color> colors;
};

struct DataBar {
    std::vector<Cfvo> cfvos;
    Color color;
    uint32_t min_length = 10;
    uint32_t max_length = 90;
    bool show_value = true;

    // x14 扩展
    std::optional<Color> negative_fill_color;
    std::optional<Color> negative_border_color;
    std::optional<Color> border_color;
    std::optional<Color> axis_color;
    std::string axis_position = "automatic";  // automatic / middle / none
    std::string direction = "context";
    bool gradient = true;
};

struct IconSet {
    std::string icon_set = "3TrafficLights1";
    std::vector<Cfvo> cfvos;
    bool reverse = false;
    bool show_value = true;
    bool percent = true;

    /// 图标集包含的图标个数，由名称前缀数字决定
    size_t iconCount() const;
};

struct CfRule {
    CfRuleType type = CfRuleType::Unknown;
    std::string type_name;       // 原始 type 属性
    int32_t priority = 0;
    bool stop_if_true = false;
    std::optional<uint32_t> dxf_id;
    std::string op;              // cellIs 的 operator
    std::vector<std::string> formulas;
    std::string text;            // containsText 等的 text 属性
    std::string time_period;

    // top10
    uint32_t rank = 10;
    bool percent = false;
    bool bottom = false;

    // aboveAverage
    bool above_average = true;
    bool equal_average = false;
    std::optional<uint32_t> std_dev;

    std::optional<ColorScale> color_scale;
    std::optional<DataBar> data_bar;
    std::optional<IconSet> icon_set;

    std::string x14_id;          // 与 x14 扩展规则对应的 GUID
};

/**
 * @brief 一组共享 sqref 的规则
 */
struct ConditionalFormat {
    std::string sqref;
    std::vector<CellRange> ranges;
    std::vector<CfRule> rules;
};

}} // namespace sheetlens::core
