#include "sheetlens/core/ConditionalFormat.hpp"

#include <cctype>

namespace sheetlens {
namespace core {

namespace {

struct RuleTypeName {
    const char* name;
    CfRuleType type;
};

const RuleTypeName kRuleTypes[] = {
    {"colorScale", CfRuleType::ColorScale},
    {"dataBar", CfRuleType::DataBar},
    {"iconSet", CfRuleType::IconSet},
    {"cellIs", CfRuleType::CellIs},
    {"expression", CfRuleType::Expression},
    {"top10", CfRuleType::Top10},
    {"aboveAverage", CfRuleType::AboveAverage},
    {"timePeriod", CfRuleType::TimePeriod},
    {"duplicateValues", CfRuleType::DuplicateValues},
    {"uniqueValues", CfRuleType::UniqueValues},
    {"containsBlanks", CfRuleType::ContainsBlanks},
    {"notContainsBlanks", CfRuleType::NotContainsBlanks},
    {"containsText", CfRuleType::ContainsText},
    {"notContainsText", CfRuleType::NotContainsText},
    {"beginsWith", CfRuleType::BeginsWith},
    {"endsWith", CfRuleType::EndsWith},
    {"containsErrors", CfRuleType::ContainsErrors},
    {"notContainsErrors", CfRuleType::NotContainsErrors},
};

} // namespace

CfRuleType parseCfRuleType(const std::string& value) {
    for (const auto& entry : kRuleTypes) {
        if (value == entry.name) {
            return entry.type;
        }
    }
    return CfRuleType::Unknown;
}

const char* toString(CfRuleType type) {
    for (const auto& entry : kRuleTypes) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "unknown";
}

Cfvo::Type Cfvo::parseType(const std::string& value) {
    if (value == "num") return Type::Num;
    if (value == "percent") return Type::Percent;
    if (value == "percentile") return Type::Percentile;
    if (value == "max") return Type::Max;
    if (value == "formula") return Type::Formula;
    if (value == "autoMin") return Type::AutoMin;
    if (value == "autoMax") return Type::AutoMax;
    return Type::Min;
}

size_t IconSet::iconCount() const {
    if (!icon_set.empty() && std::isdigit(static_cast<unsigned char>(icon_set[0]))) {
        return static_cast<size_t>(icon_set[0] - '0');
    }
    return 3;
}

}} // namespace sheetlens::core
