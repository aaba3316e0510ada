#include "sheetlens/core/StyleTypes.hpp"

namespace sheetlens {
namespace core {

namespace {

template<typename Enum, size_t N>
struct NameTable {
    struct Entry {
        std::string_view name;
        Enum value;
    };
    Entry entries[N];

    Enum parse(std::string_view text, Enum fallback) const {
        for (const auto& e : entries) {
            if (e.name == text) return e.value;
        }
        return fallback;
    }

    const char* name(Enum value) const {
        for (const auto& e : entries) {
            if (e.value == value) return e.name.data();
        }
        return entries[0].name.data();
    }
};

const NameTable<BorderStyle, 14> kBorderStyles = {{
    {"none", BorderStyle::None},
    {"thin", BorderStyle::Thin},
    {"medium", BorderStyle::Medium},
    {"thick", BorderStyle::Thick},
    {"double", BorderStyle::Double},
    {"hair", BorderStyle::Hair},
    {"dotted", BorderStyle::Dotted},
    {"dashed", BorderStyle::Dashed},
    {"dashDot", BorderStyle::DashDot},
    {"dashDotDot", BorderStyle::DashDotDot},
    {"mediumDashed", BorderStyle::MediumDashed},
    {"mediumDashDot", BorderStyle::MediumDashDot},
    {"mediumDashDotDot", BorderStyle::MediumDashDotDot},
    {"slantDashDot", BorderStyle::SlantDashDot},
}};

const NameTable<PatternType, 19> kPatterns = {{
    {"none", PatternType::None},
    {"solid", PatternType::Solid},
    {"mediumGray", PatternType::MediumGray},
    {"darkGray", PatternType::DarkGray},
    {"lightGray", PatternType::LightGray},
    {"darkHorizontal", PatternType::DarkHorizontal},
    {"darkVertical", PatternType::DarkVertical},
    {"darkDown", PatternType::DarkDown},
    {"darkUp", PatternType::DarkUp},
    {"darkGrid", PatternType::DarkGrid},
    {"darkTrellis", PatternType::DarkTrellis},
    {"lightHorizontal", PatternType::LightHorizontal},
    {"lightVertical", PatternType::LightVertical},
    {"lightDown", PatternType::LightDown},
    {"lightUp", PatternType::LightUp},
    {"lightGrid", PatternType::LightGrid},
    {"lightTrellis", PatternType::LightTrellis},
    {"gray125", PatternType::Gray125},
    {"gray0625", PatternType::Gray0625},
}};

const NameTable<UnderlineType, 5> kUnderlines = {{
    {"none", UnderlineType::None},
    {"single", UnderlineType::Single},
    {"double", UnderlineType::Double},
    {"singleAccounting", UnderlineType::SingleAccounting},
    {"doubleAccounting", UnderlineType::DoubleAccounting},
}};

const NameTable<VertAlign, 3> kVertAligns = {{
    {"baseline", VertAlign::Baseline},
    {"superscript", VertAlign::Superscript},
    {"subscript", VertAlign::Subscript},
}};

const NameTable<HorizontalAlign, 8> kHorizontal = {{
    {"general", HorizontalAlign::General},
    {"left", HorizontalAlign::Left},
    {"center", HorizontalAlign::Center},
    {"right", HorizontalAlign::Right},
    {"fill", HorizontalAlign::Fill},
    {"justify", HorizontalAlign::Justify},
    {"centerContinuous", HorizontalAlign::CenterContinuous},
    {"distributed", HorizontalAlign::Distributed},
}};

const NameTable<VerticalAlign, 5> kVertical = {{
    {"bottom", VerticalAlign::Bottom},
    {"top", VerticalAlign::Top},
    {"center", VerticalAlign::Center},
    {"justify", VerticalAlign::Justify},
    {"distributed", VerticalAlign::Distributed},
}};

} // namespace

BorderStyle parseBorderStyle(std::string_view value) {
    return kBorderStyles.parse(value, BorderStyle::None);
}

PatternType parsePatternType(std::string_view value) {
    return kPatterns.parse(value, PatternType::None);
}

UnderlineType parseUnderline(std::string_view value) {
    // <u/> 不带 val 表示单下划线
    if (value.empty()) return UnderlineType::Single;
    return kUnderlines.parse(value, UnderlineType::Single);
}

VertAlign parseVertAlign(std::string_view value) {
    return kVertAligns.parse(value, VertAlign::Baseline);
}

HorizontalAlign parseHorizontalAlign(std::string_view value) {
    return kHorizontal.parse(value, HorizontalAlign::General);
}

VerticalAlign parseVerticalAlign(std::string_view value) {
    return kVertical.parse(value, VerticalAlign::Bottom);
}

const char* toString(BorderStyle style) { return kBorderStyles.name(style); }
const char* toString(PatternType pattern) { return kPatterns.name(pattern); }
const char* toString(UnderlineType underline) { return kUnderlines.name(underline); }
const char* toString(VertAlign align) { return kVertAligns.name(align); }
const char* toString(HorizontalAlign align) { return kHorizontal.name(align); }
const char* toString(VerticalAlign align) { return kVertical.name(align); }

}} // namespace sheetlens::core
