#pragma once

#include "sheetlens/format/DateTime.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sheetlens {
namespace format {

/**
 * @brief ECMA-376 内置数字格式 0-49
 * @return 未定义的 id（包括地区相关的 23-36）返回 nullopt
 */
std::optional<std::string> builtinFormatCode(uint32_t id);

/**
 * @brief 判断格式代码是否为日期/时间格式
 *
 * 忽略引号内文本、反斜杠转义和 [...] 段（[h] [m] [s] 除外）。
 * m 只有在没有 # 0 ? 占位符时才算作日期，s 需要 ':'。
 */
bool isDateFormat(std::string_view code);

/**
 * @brief General 格式
 */
std::string formatGeneral(double value);

/**
 * @brief 按格式代码格式化数值（一次性编译，不缓存）
 */
std::string formatNumber(double value, std::string_view code, DateSystem system = DateSystem::Excel1900);

/**
 * @brief 编译后的数字格式
 *
 * 格式代码按 ';' 拆成最多四段：正数;负数;零;文本。
 * 每段在构造时切分为标记序列，格式化时只遍历标记。
 */
class NumberFormat {
public:
    explicit NumberFormat(std::string_view code);

    std::string format(double value, DateSystem system = DateSystem::Excel1900) const;

    const std::string& code() const { return code_; }
    bool isDate() const { return is_date_; }
    bool isGeneral() const { return is_general_; }

private:
    enum class TokenKind : uint8_t {
        Literal,
        Digit,       // 0 # ?
        Point,
        Comma,       // 千分位
        Scale,       // 末尾逗号，除以 1000
        Percent,
        Exponent,    // E+ / E-
        Slash,
        Text,        // @
        General,
        Date,        // y M d h n(分钟) s f(小数秒)
        Elapsed,     // [h] [m] [s]
        AmPm
    };

    struct Token {
        TokenKind kind = TokenKind::Literal;
        std::string text;
        char ch = 0;     // Digit 的占位符或 Date/Elapsed 的单位
        int width = 0;   // Date/Elapsed 的字母个数
    };

    struct Condition {
        std::string op;
        double value = 0.0;

        bool matches(double v) const;
    };

    enum class SectionKind : uint8_t {
        General,
        Number,
        Scientific,
        Fraction,
        DateTime,
        Text
    };

    struct Section {
        SectionKind kind = SectionKind::Number;
        std::vector<Token> tokens;
        std::optional<Condition> condition;
        bool thousands = false;
        int percent = 0;
        int scale = 0;
        int subsecond_digits = 0;
        bool has_ampm = false;
    };

    static Section compileSection(std::string_view text);
    static std::vector<Token> tokenize(std::string_view text, std::optional<Condition>& condition);
    static void classifyCommas(Section& section);
    static void resolveDateUnits(Section& section);

    const Section* selectSection(double value, bool& show_minus) const;

    std::string formatNumeric(const Section& section, double value, bool show_minus) const;
    std::string formatScientific(const Section& section, double value, bool show_minus) const;
    std::string formatFraction(const Section& section, double value, bool show_minus) const;
    std::string formatDateTime(const Section& section, double value, DateSystem system) const;
    std::string formatWithGeneral(const Section& section, double value, bool show_minus) const;

    std::string code_;
    std::vector<Section> sections_;
    bool is_date_ = false;
    bool is_general_ = false;
};

/**
 * @brief 格式缓存，每个不同的格式代码只编译一次
 */
class NumberFormatCache {
public:
    const NumberFormat& get(const std::string& code);

    std::string format(double value, const std::string& code, DateSystem system = DateSystem::Excel1900) {
        return get(code).format(value, system);
    }

    size_t size() const { return cache_.size(); }
    void clear() { cache_.clear(); }

private:
    std::unordered_map<std::string, std::unique_ptr<NumberFormat>> cache_;
};

}} // namespace sheetlens::format
