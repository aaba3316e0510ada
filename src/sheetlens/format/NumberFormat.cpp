#include "sheetlens/format/NumberFormat.hpp"
#include "sheetlens/utils/ModuleLoggers.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fast_float/fast_float.h>
#include <fmt/format.h>

namespace sheetlens {
namespace format {

namespace {

struct BuiltinFormat {
    uint32_t id;
    const char* code;
};

const BuiltinFormat kBuiltinFormats[] = {
    {0, "General"},
    {1, "0"},
    {2, "0.00"},
    {3, "#,##0"},
    {4, "#,##0.00"},
    {5, "$#,##0_);($#,##0)"},
    {6, "$#,##0_);[Red]($#,##0)"},
    {7, "$#,##0.00_);($#,##0.00)"},
    {8, "$#,##0.00_);[Red]($#,##0.00)"},
    {9, "0%"},
    {10, "0.00%"},
    {11, "0.00E+00"},
    {12, "# ?/?"},
    {13, "# ??/??"},
    {14, "mm-dd-yy"},
    {15, "d-mmm-yy"},
    {16, "d-mmm"},
    {17, "mmm-yy"},
    {18, "h:mm AM/PM"},
    {19, "h:mm:ss AM/PM"},
    {20, "h:mm"},
    {21, "h:mm:ss"},
    {22, "m/d/yy h:mm"},
    {37, "#,##0 ;(#,##0)"},
    {38, "#,##0 ;[Red](#,##0)"},
    {39, "#,##0.00;(#,##0.00)"},
    {40, "#,##0.00;[Red](#,##0.00)"},
    {41, "_(* #,##0_);_(* \\(#,##0\\);_(* \"-\"_);_(@_)"},
    {42, "_(\"$\"* #,##0_);_(\"$\"* \\(#,##0\\);_(\"$\"* \"-\"_);_(@_)"},
    {43, "_(* #,##0.00_);_(* \\(#,##0.00\\);_(* \"-\"??_);_(@_)"},
    {44, "_(\"$\"* #,##0.00_);_(\"$\"* \\(#,##0.00\\);_(\"$\"* \"-\"??_);_(@_)"},
    {45, "mm:ss"},
    {46, "[h]:mm:ss"},
    {47, "mmss.0"},
    {48, "##0.0E+0"},
    {49, "@"},
};

const char* const kMonthAbbrev[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
const char* const kMonthFull[] = {"January", "February", "March", "April", "May", "June",
                                  "July", "August", "September", "October", "November", "December"};
const char* const kDayAbbrev[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
const char* const kDayFull[] = {"Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"};

char lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool startsWithNoCase(std::string_view text, size_t pos, std::string_view prefix) {
    if (text.size() - pos < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (lower(text[pos + i]) != prefix[i]) return false;
    }
    return true;
}

// [h] [mm] [ss] 等经过时间标记
bool isElapsedToken(std::string_view content) {
    if (content.empty()) return false;
    const char unit = lower(content[0]);
    if (unit != 'h' && unit != 'm' && unit != 's') return false;
    for (char c : content) {
        if (lower(c) != unit) return false;
    }
    return true;
}

// 在 ';' 处拆分格式段，引号、转义和方括号内的分号不算
std::vector<std::string_view> splitSections(std::string_view code) {
    std::vector<std::string_view> sections;
    size_t start = 0;
    bool in_quote = false;
    bool in_bracket = false;
    for (size_t i = 0; i < code.size(); ++i) {
        const char c = code[i];
        if (in_quote) {
            if (c == '"') in_quote = false;
        } else if (in_bracket) {
            if (c == ']') in_bracket = false;
        } else if (c == '"') {
            in_quote = true;
        } else if (c == '[') {
            in_bracket = true;
        } else if (c == '\\' || c == '_' || c == '*') {
            ++i;
        } else if (c == ';') {
            sections.push_back(code.substr(start, i - start));
            start = i + 1;
        }
    }
    sections.push_back(code.substr(start));
    return sections;
}

std::string padLeft(const std::string& text, size_t width) {
    return text.size() >= width ? text : std::string(width - text.size(), ' ') + text;
}

std::string padRight(const std::string& text, size_t width) {
    return text.size() >= width ? text : text + std::string(width - text.size(), ' ');
}

std::string zeroPad(int64_t value, int width) {
    return fmt::format("{:0{}}", value, std::max(width, 1));
}

} // namespace

// ==================== 公共函数 ====================

std::optional<std::string> builtinFormatCode(uint32_t id) {
    for (const auto& entry : kBuiltinFormats) {
        if (entry.id == id) {
            return std::string(entry.code);
        }
    }
    return std::nullopt;
}

bool isDateFormat(std::string_view code) {
    bool has_placeholder = false;
    bool has_colon = false;
    bool has_month_or_minute = false;
    bool has_seconds = false;

    size_t i = 0;
    while (i < code.size()) {
        const char c = code[i];
        if (c == '"') {
            const size_t close = code.find('"', i + 1);
            i = close == std::string_view::npos ? code.size() : close + 1;
            continue;
        }
        if (c == '\\' || c == '_' || c == '*') {
            i += 2;
            continue;
        }
        if (c == '[') {
            const size_t close = code.find(']', i + 1);
            if (close == std::string_view::npos) break;
            if (isElapsedToken(code.substr(i + 1, close - i - 1))) {
                return true;
            }
            i = close + 1;
            continue;
        }
        if (startsWithNoCase(code, i, "general")) {
            i += 7;
            continue;
        }
        if (startsWithNoCase(code, i, "am/pm")) {
            return true;
        }
        if (startsWithNoCase(code, i, "a/p")) {
            return true;
        }

        switch (lower(c)) {
            case 'y':
            case 'd':
            case 'h':
                return true;
            case 'm':
                has_month_or_minute = true;
                break;
            case 's':
                has_seconds = true;
                // ss.000 中的 0 是小数秒，不是数字占位符
                while (i + 1 < code.size() && lower(code[i + 1]) == 's') ++i;
                if (i + 1 < code.size() && code[i + 1] == '.') {
                    ++i;
                    while (i + 1 < code.size() && code[i + 1] == '0') ++i;
                }
                break;
            case 'e':
                if (i + 1 < code.size() && (code[i + 1] == '+' || code[i + 1] == '-')) ++i;
                break;
            case ':':
                has_colon = true;
                break;
            case '0':
            case '#':
            case '?':
                has_placeholder = true;
                break;
            default:
                break;
        }
        ++i;
    }

    return (has_month_or_minute && !has_placeholder) || (has_seconds && has_colon);
}

std::string formatGeneral(double value) {
    if (std::isnan(value)) return "#NUM!";
    if (std::isinf(value)) return value > 0 ? "#NUM!" : "-#NUM!";
    if (value == 0.0) return "0";

    const double abs_value = std::fabs(value);
    if (abs_value >= 1e11 || abs_value < 1e-4) {
        // 尾数去掉多余的 0
        std::string text = fmt::format("{:.5E}", value);
        const size_t e = text.find('E');
        std::string mantissa = text.substr(0, e);
        if (mantissa.find('.') != std::string::npos) {
            while (!mantissa.empty() && mantissa.back() == '0') mantissa.pop_back();
            if (!mantissa.empty() && mantissa.back() == '.') mantissa.pop_back();
        }
        return mantissa + text.substr(e);
    }
    if (value == std::floor(value)) {
        return fmt::format("{}", static_cast<int64_t>(value));
    }

    std::string text = fmt::format("{:.10f}", value);
    while (!text.empty() && text.back() == '0') text.pop_back();
    if (!text.empty() && text.back() == '.') text.pop_back();
    return text;
}

std::string formatNumber(double value, std::string_view code, DateSystem system) {
    return NumberFormat(code).format(value, system);
}

// ==================== 编译 ====================

bool NumberFormat::Condition::matches(double v) const {
    if (op == "<") return v < value;
    if (op == "<=") return v <= value;
    if (op == ">") return v > value;
    if (op == ">=") return v >= value;
    if (op == "<>") return v != value;
    return v == value;
}

NumberFormat::NumberFormat(std::string_view code) : code_(code) {
    std::string_view trimmed = code;
    while (!trimmed.empty() && trimmed.front() == ' ') trimmed.remove_prefix(1);
    while (!trimmed.empty() && trimmed.back() == ' ') trimmed.remove_suffix(1);

    if (trimmed.empty() || (trimmed.size() == 7 && startsWithNoCase(trimmed, 0, "general"))) {
        is_general_ = true;
        Section section;
        section.kind = SectionKind::General;
        Token token;
        token.kind = TokenKind::General;
        section.tokens.push_back(token);
        sections_.push_back(std::move(section));
        return;
    }

    is_date_ = isDateFormat(trimmed);
    for (auto text : splitSections(code)) {
        sections_.push_back(compileSection(text));
    }
    FORMAT_DEBUG("Compiled number format '{}' into {} sections", code_, sections_.size());
}

std::vector<NumberFormat::Token> NumberFormat::tokenize(std::string_view text, std::optional<Condition>& condition) {
    std::vector<Token> tokens;

    auto appendLiteral = [&tokens](std::string_view literal) {
        if (!tokens.empty() && tokens.back().kind == TokenKind::Literal) {
            tokens.back().text.append(literal.data(), literal.size());
        } else {
            Token token;
            token.kind = TokenKind::Literal;
            token.text = std::string(literal);
            tokens.push_back(std::move(token));
        }
    };
    auto push = [&tokens](TokenKind kind, char ch = 0, std::string token_text = {}, int width = 0) {
        Token token;
        token.kind = kind;
        token.ch = ch;
        token.text = std::move(token_text);
        token.width = width;
        tokens.push_back(std::move(token));
    };

    size_t i = 0;
    while (i < text.size()) {
        const char c = text[i];

        if (c == '"') {
            const size_t close = text.find('"', i + 1);
            const size_t end = close == std::string_view::npos ? text.size() : close;
            appendLiteral(text.substr(i + 1, end - i - 1));
            i = end + 1;
            continue;
        }
        if (c == '\\') {
            if (i + 1 < text.size()) appendLiteral(text.substr(i + 1, 1));
            i += 2;
            continue;
        }
        if (c == '_') {
            appendLiteral(" ");
            i += 2;
            continue;
        }
        if (c == '*') {
            i += 2;
            continue;
        }
        if (c == '[') {
            const size_t close = text.find(']', i + 1);
            if (close == std::string_view::npos) {
                i = text.size();
                continue;
            }
            std::string_view content = text.substr(i + 1, close - i - 1);
            i = close + 1;

            if (isElapsedToken(content)) {
                push(TokenKind::Elapsed, lower(content[0]), {}, static_cast<int>(content.size()));
            } else if (!content.empty() && content[0] == '$') {
                // [$€-407]：'$' 与 '-' 之间是货币符号
                const size_t dash = content.find('-');
                auto symbol = content.substr(1, dash == std::string_view::npos ? std::string_view::npos : dash - 1);
                if (!symbol.empty()) appendLiteral(symbol);
            } else if (!content.empty() && (content[0] == '<' || content[0] == '>' || content[0] == '=')) {
                size_t op_len = 1;
                if (content.size() > 1 && (content[1] == '=' || content[1] == '>')) op_len = 2;
                Condition cond;
                cond.op = std::string(content.substr(0, op_len));
                auto number = content.substr(op_len);
                auto result = fast_float::from_chars(number.data(), number.data() + number.size(), cond.value);
                if (result.ec == std::errc()) {
                    condition = cond;
                }
            }
            // 颜色与地区标记直接丢弃
            continue;
        }

        if (c == '0' || c == '#' || c == '?') {
            push(TokenKind::Digit, c);
            ++i;
            continue;
        }
        if (c == '.') { push(TokenKind::Point); ++i; continue; }
        if (c == ',') { push(TokenKind::Comma); ++i; continue; }
        if (c == '%') { push(TokenKind::Percent); ++i; continue; }
        if (c == '@') { push(TokenKind::Text); ++i; continue; }
        if (c == '/') { push(TokenKind::Slash); ++i; continue; }

        if ((c == 'E' || c == 'e') && i + 1 < text.size() && (text[i + 1] == '+' || text[i + 1] == '-')) {
            push(TokenKind::Exponent, text[i + 1]);
            i += 2;
            continue;
        }
        if (startsWithNoCase(text, i, "general")) {
            push(TokenKind::General);
            i += 7;
            continue;
        }
        if (startsWithNoCase(text, i, "am/pm")) {
            push(TokenKind::AmPm, 0, "AM/PM");
            i += 5;
            continue;
        }
        if (startsWithNoCase(text, i, "a/p")) {
            push(TokenKind::AmPm, 0, std::string(text.substr(i, 3)));
            i += 3;
            continue;
        }

        const char l = lower(c);
        if (l == 'y' || l == 'm' || l == 'd' || l == 'h' || l == 's') {
            size_t run = 1;
            while (i + run < text.size() && lower(text[i + run]) == l) ++run;
            push(TokenKind::Date, l, std::string(text.substr(i, run)), static_cast<int>(run));
            i += run;
            continue;
        }

        appendLiteral(text.substr(i, 1));
        ++i;
    }
    return tokens;
}

NumberFormat::Section NumberFormat::compileSection(std::string_view text) {
    Section section;
    section.tokens = tokenize(text, section.condition);

    auto has = [&section](TokenKind kind) {
        return std::any_of(section.tokens.begin(), section.tokens.end(),
                           [kind](const Token& t) { return t.kind == kind; });
    };
    const bool has_digits = has(TokenKind::Digit);

    if (has(TokenKind::General)) {
        section.kind = SectionKind::General;
    } else if (isDateFormat(text)) {
        section.kind = SectionKind::DateTime;
        resolveDateUnits(section);
    } else if (has(TokenKind::Exponent) && has_digits) {
        section.kind = SectionKind::Scientific;
    } else if (has(TokenKind::Slash) && has_digits) {
        section.kind = SectionKind::Fraction;
    } else if (has(TokenKind::Text)) {
        section.kind = SectionKind::Text;
    } else {
        section.kind = SectionKind::Number;
    }

    if (section.kind == SectionKind::Number || section.kind == SectionKind::Scientific) {
        classifyCommas(section);
    }
    if (section.kind == SectionKind::Number) {
        section.percent = static_cast<int>(std::count_if(section.tokens.begin(), section.tokens.end(),
                                                         [](const Token& t) { return t.kind == TokenKind::Percent; }));
    }
    return section;
}

void NumberFormat::classifyCommas(Section& section) {
    auto& tokens = section.tokens;

    // 整数部分的结束位置：小数点、指数或末尾
    size_t int_end = tokens.size();
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i].kind == TokenKind::Point || tokens[i].kind == TokenKind::Exponent) {
            int_end = i;
            break;
        }
    }

    for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i].kind != TokenKind::Comma) continue;

        bool digit_before = false;
        for (size_t j = 0; j < i; ++j) {
            if (tokens[j].kind == TokenKind::Digit) {
                digit_before = true;
                break;
            }
        }
        bool digit_after_in_int = false;
        for (size_t j = i + 1; j < int_end; ++j) {
            if (tokens[j].kind == TokenKind::Digit) {
                digit_after_in_int = true;
                break;
            }
        }

        if (i < int_end && digit_before && digit_after_in_int) {
            section.thousands = true;
            continue;
        }

        // 紧跟在占位符后的逗号为缩放
        size_t prev = i;
        while (prev > 0 && tokens[prev - 1].kind == TokenKind::Comma) --prev;
        if (prev > 0 && tokens[prev - 1].kind == TokenKind::Digit) {
            tokens[i].kind = TokenKind::Scale;
            ++section.scale;
        } else {
            tokens[i].kind = TokenKind::Literal;
            tokens[i].text = ",";
        }
    }
}

void NumberFormat::resolveDateUnits(Section& section) {
    auto& tokens = section.tokens;

    auto unitOf = [](const Token& t) -> char {
        if (t.kind == TokenKind::Date || t.kind == TokenKind::Elapsed) return t.ch;
        return 0;
    };

    for (size_t i = 0; i < tokens.size(); ++i) {
        Token& token = tokens[i];
        if (token.kind != TokenKind::Date || token.ch != 'm') continue;
        if (token.width > 2) {
            token.ch = 'M';
            continue;
        }

        // m 紧跟 h 之后或位于 s 之前时表示分钟
        bool minute = false;
        for (size_t j = i; j > 0; --j) {
            const char unit = unitOf(tokens[j - 1]);
            if (unit) {
                minute = unit == 'h';
                break;
            }
        }
        if (!minute) {
            for (size_t j = i + 1; j < tokens.size(); ++j) {
                const char unit = unitOf(tokens[j]);
                if (unit) {
                    minute = unit == 's';
                    break;
                }
            }
        }
        token.ch = minute ? 'n' : 'M';
    }

    // 秒之后的 .0 / .00 / .000 为小数秒
    std::vector<Token> merged;
    merged.reserve(tokens.size());
    char last_unit = 0;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const Token& token = tokens[i];
        if (token.kind == TokenKind::Point && last_unit == 's' &&
            i + 1 < tokens.size() && tokens[i + 1].kind == TokenKind::Digit && tokens[i + 1].ch == '0') {
            int zeros = 0;
            while (i + 1 < tokens.size() && tokens[i + 1].kind == TokenKind::Digit && tokens[i + 1].ch == '0') {
                ++zeros;
                ++i;
            }
            Token fraction;
            fraction.kind = TokenKind::Date;
            fraction.ch = 'f';
            fraction.width = std::min(zeros, 3);
            section.subsecond_digits = std::max(section.subsecond_digits, fraction.width);
            merged.push_back(std::move(fraction));
            continue;
        }
        if (const char unit = unitOf(token)) last_unit = unit;
        if (token.kind == TokenKind::AmPm) section.has_ampm = true;
        merged.push_back(token);
    }
    tokens = std::move(merged);
}

// ==================== 格式化 ====================

const NumberFormat::Section* NumberFormat::selectSection(double value, bool& show_minus) const {
    const size_t numeric = std::min<size_t>(sections_.size(), 3);
    show_minus = value < 0;

    bool has_condition = false;
    for (size_t i = 0; i < numeric; ++i) {
        if (sections_[i].condition) has_condition = true;
    }

    if (has_condition) {
        for (size_t i = 0; i < numeric; ++i) {
            const Section& section = sections_[i];
            if (!section.condition) {
                return &section;
            }
            if (section.condition->matches(value)) {
                // 专门匹配负数的段自行决定符号
                const auto& op = section.condition->op;
                if ((op == "<" || op == "<=") && section.condition->value <= 0) {
                    show_minus = false;
                }
                return &section;
            }
        }
        return nullptr;
    }

    if (numeric == 1 || (value > 0 && numeric >= 2) || (value == 0 && numeric == 2)) {
        return &sections_[0];
    }
    if (value < 0) {
        show_minus = false;
        return &sections_[1];
    }
    return &sections_[2];
}

std::string NumberFormat::format(double value, DateSystem system) const {
    if (!std::isfinite(value)) {
        return formatGeneral(value);
    }

    bool show_minus = false;
    const Section* section = selectSection(value, show_minus);
    if (!section) {
        return formatGeneral(value);
    }

    switch (section->kind) {
        case SectionKind::General:
        case SectionKind::Text:
            return formatWithGeneral(*section, value, show_minus);
        case SectionKind::DateTime:
            return formatDateTime(*section, value, system);
        case SectionKind::Scientific:
            return formatScientific(*section, value, show_minus);
        case SectionKind::Fraction:
            return formatFraction(*section, value, show_minus);
        case SectionKind::Number:
        default:
            return formatNumeric(*section, value, show_minus);
    }
}

namespace {

struct DigitLayout {
    std::string integer;   // 整数部分数字，0 时为空
    std::string fraction;  // 已按小数位数四舍五入
    bool nonzero = false;
};

DigitLayout layoutDigits(double abs_value, size_t decimals) {
    DigitLayout layout;
    std::string text = fmt::format("{:.{}f}", abs_value, decimals);
    const size_t point = text.find('.');
    layout.integer = text.substr(0, point);
    if (point != std::string::npos) {
        layout.fraction = text.substr(point + 1);
    }
    layout.nonzero = text.find_first_of("123456789") != std::string::npos;
    if (layout.integer == "0") {
        layout.integer.clear();
    }
    return layout;
}

} // namespace

/**
 * @brief 数字格式主体：按占位符右对齐填入整数位，左对齐填入小数位
 */
std::string NumberFormat::formatNumeric(const Section& section, double value, bool show_minus) const {
    const auto& tokens = section.tokens;

    double scaled = std::fabs(value);
    for (int i = 0; i < section.percent; ++i) scaled *= 100.0;
    for (int i = 0; i < section.scale; ++i) scaled /= 1000.0;

    size_t point = tokens.size();
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i].kind == TokenKind::Point) {
            point = i;
            break;
        }
    }
    std::vector<char> int_ph;
    std::vector<char> dec_ph;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i].kind != TokenKind::Digit) continue;
        (i < point ? int_ph : dec_ph).push_back(tokens[i].ch);
    }

    const DigitLayout layout = layoutDigits(scaled, dec_ph.size());

    // 从右往左去掉可省略的小数 0
    std::vector<std::string> dec_out(dec_ph.size());
    bool trimming = true;
    for (size_t j = dec_ph.size(); j > 0; --j) {
        const size_t k = j - 1;
        const char digit = layout.fraction[k];
        if (trimming && digit == '0' && dec_ph[k] != '0') {
            dec_out[k] = dec_ph[k] == '?' ? " " : "";
        } else {
            trimming = false;
            dec_out[k] = std::string(1, digit);
        }
    }

    const size_t n = int_ph.size();
    const size_t len = layout.integer.size();
    std::string out;

    auto emitIntegerDigit = [&](size_t position, char digit) {
        out += digit;
        if (section.thousands && position > 0 && position % 3 == 0) {
            out += ',';
        }
    };
    auto emitAllIntegerDigits = [&]() {
        for (size_t q = len; q > 0; --q) {
            emitIntegerDigit(q - 1, layout.integer[len - q]);
        }
    };

    size_t int_index = 0;
    size_t dec_index = 0;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const Token& token = tokens[i];
        switch (token.kind) {
            case TokenKind::Digit:
                if (i < point) {
                    const size_t position = n - 1 - int_index;
                    if (int_index == 0) {
                        // 第一个占位符吸收多余的高位
                        for (size_t q = len; q > n; --q) {
                            emitIntegerDigit(q - 1, layout.integer[len - q]);
                        }
                    }
                    if (position < len) {
                        emitIntegerDigit(position, layout.integer[len - 1 - position]);
                    } else if (token.ch == '0') {
                        emitIntegerDigit(position, '0');
                    } else if (token.ch == '?') {
                        out += ' ';
                    }
                    ++int_index;
                } else {
                    out += dec_out[dec_index++];
                }
                break;
            case TokenKind::Point:
                if (n == 0) emitAllIntegerDigits();
                out += '.';
                break;
            case TokenKind::Percent:
                out += '%';
                break;
            case TokenKind::Slash:
                out += '/';
                break;
            case TokenKind::Comma:
            case TokenKind::Scale:
            case TokenKind::Text:
            case TokenKind::General:
                break;
            default:
                out += token.text;
                break;
        }
    }

    if (show_minus && value < 0 && layout.nonzero) {
        out.insert(out.begin(), '-');
    }
    return out;
}

std::string NumberFormat::formatScientific(const Section& section, double value, bool show_minus) const {
    const auto& tokens = section.tokens;

    size_t exp_index = tokens.size();
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i].kind == TokenKind::Exponent) {
            exp_index = i;
            break;
        }
    }

    // 尾数部分的占位符
    size_t int_count = 0;
    bool int_has_hash = false;
    size_t decimals = 0;
    bool after_point = false;
    for (size_t i = 0; i < exp_index; ++i) {
        if (tokens[i].kind == TokenKind::Point) {
            after_point = true;
        } else if (tokens[i].kind == TokenKind::Digit) {
            if (after_point) {
                ++decimals;
            } else {
                ++int_count;
                if (tokens[i].ch == '#') int_has_hash = true;
            }
        }
    }
    const int width = static_cast<int>(std::max<size_t>(int_count, 1));
    const bool engineering = int_count > 1 && int_has_hash;

    const double abs_value = std::fabs(value);
    int exponent = 0;
    double mantissa = 0.0;
    if (abs_value > 0.0) {
        const int e10 = static_cast<int>(std::floor(std::log10(abs_value)));
        if (engineering) {
            exponent = static_cast<int>(std::floor(static_cast<double>(e10) / width)) * width;
        } else {
            exponent = e10 - (width - 1);
        }
        mantissa = abs_value / std::pow(10.0, exponent);

        const double factor = std::pow(10.0, static_cast<double>(decimals));
        const double rounded = std::round(mantissa * factor) / factor;
        const double limit = std::pow(10.0, width);
        if (rounded >= limit) {
            exponent += engineering ? width : 1;
            mantissa = abs_value / std::pow(10.0, exponent);
        }
    }

    // 尾数复用普通数字的排版，指数部分单独处理
    Section mantissa_section;
    mantissa_section.kind = SectionKind::Number;
    mantissa_section.tokens.assign(tokens.begin(), tokens.begin() + static_cast<std::ptrdiff_t>(exp_index));
    std::string out = formatNumeric(mantissa_section, mantissa, false);

    if (exp_index < tokens.size()) {
        out += 'E';
        if (exponent < 0) {
            out += '-';
        } else if (tokens[exp_index].ch == '+') {
            out += '+';
        }
        int exp_digits = 0;
        size_t i = exp_index + 1;
        for (; i < tokens.size() && tokens[i].kind == TokenKind::Digit; ++i) {
            if (tokens[i].ch == '0') ++exp_digits;
        }
        out += zeroPad(std::abs(exponent), exp_digits);
        for (; i < tokens.size(); ++i) {
            if (tokens[i].kind == TokenKind::Literal || tokens[i].kind == TokenKind::Date) {
                out += tokens[i].text;
            } else if (tokens[i].kind == TokenKind::Percent) {
                out += '%';
            }
        }
    }

    if (show_minus && value < 0 && mantissa != 0.0) {
        out.insert(out.begin(), '-');
    }
    return out;
}

std::string NumberFormat::formatFraction(const Section& section, double value, bool show_minus) const {
    const auto& tokens = section.tokens;

    size_t slash = 0;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i].kind == TokenKind::Slash) {
            slash = i;
            break;
        }
    }

    // 分子：紧挨斜杠之前的连续占位符
    size_t num_begin = slash;
    while (num_begin > 0 && tokens[num_begin - 1].kind == TokenKind::Digit) --num_begin;
    size_t num_width = slash - num_begin;

    // 整数部分：分子之前还有占位符
    bool mixed = false;
    size_t first_digit = tokens.size();
    for (size_t i = 0; i < num_begin; ++i) {
        if (tokens[i].kind == TokenKind::Digit) {
            mixed = true;
            first_digit = std::min(first_digit, i);
        }
    }
    if (!mixed) first_digit = num_begin;

    // 分母：占位符个数或固定数字
    size_t den_end = slash + 1;
    size_t den_width = 0;
    std::optional<int64_t> fixed_den;
    std::string suffix;
    if (den_end < tokens.size() && tokens[den_end].kind == TokenKind::Literal) {
        // 固定分母可能被拆成多个记号："/100" 是字面量 "1" 加两个 '0' 占位符
        std::string den_text;
        while (den_end < tokens.size()) {
            const Token& token = tokens[den_end];
            if (token.kind == TokenKind::Digit && token.ch == '0' && !den_text.empty()) {
                den_text += '0';
                ++den_end;
                continue;
            }
            if (token.kind != TokenKind::Literal) break;
            size_t digits = 0;
            while (digits < token.text.size() && std::isdigit(static_cast<unsigned char>(token.text[digits]))) ++digits;
            den_text += token.text.substr(0, digits);
            ++den_end;
            if (digits < token.text.size()) {
                suffix = token.text.substr(digits);
                break;
            }
        }
        if (!den_text.empty()) {
            fixed_den = std::strtoll(den_text.c_str(), nullptr, 10);
            den_width = den_text.size();
        }
    } else {
        while (den_end < tokens.size() && tokens[den_end].kind == TokenKind::Digit) {
            ++den_width;
            ++den_end;
        }
    }
    if (fixed_den && *fixed_den <= 0) fixed_den.reset();
    den_width = std::max<size_t>(den_width, 1);
    num_width = std::max<size_t>(num_width, 1);

    const double abs_value = std::fabs(value);
    int64_t whole = 0;
    double frac = abs_value;
    if (mixed) {
        whole = static_cast<int64_t>(std::floor(abs_value));
        frac = abs_value - static_cast<double>(whole);
    }

    int64_t numerator = 0;
    int64_t denominator = 1;
    if (fixed_den) {
        denominator = *fixed_den;
        numerator = std::llround(frac * static_cast<double>(denominator));
    } else {
        int64_t max_den = 1;
        for (size_t i = 0; i < std::min<size_t>(den_width, 4); ++i) max_den *= 10;
        max_den -= 1;
        double best_error = 2.0;
        for (int64_t d = 1; d <= std::max<int64_t>(max_den, 1); ++d) {
            const int64_t num = std::llround(frac * static_cast<double>(d));
            const double error = std::fabs(frac - static_cast<double>(num) / static_cast<double>(d));
            if (error < best_error - 1e-12) {
                best_error = error;
                numerator = num;
                denominator = d;
                if (error == 0.0) break;
            }
        }
    }
    if (mixed && numerator == denominator) {
        ++whole;
        numerator = 0;
    }

    std::string out;
    for (size_t i = 0; i < first_digit; ++i) {
        if (tokens[i].kind == TokenKind::Literal) out += tokens[i].text;
    }

    const std::string sign = show_minus && value < 0 && (whole != 0 || numerator != 0) ? "-" : "";
    if (mixed && numerator == 0) {
        out += sign + fmt::format("{}", whole);
    } else {
        const std::string fraction = padLeft(fmt::format("{}", numerator), num_width) + "/" +
                                     padRight(fmt::format("{}", denominator), den_width);
        if (mixed && whole != 0) {
            out += sign + fmt::format("{} ", whole) + fraction;
        } else {
            out += sign + fraction;
        }
    }

    out += suffix;
    for (size_t i = den_end; i < tokens.size(); ++i) {
        if (tokens[i].kind == TokenKind::Literal) out += tokens[i].text;
    }
    return out;
}

std::string NumberFormat::formatDateTime(const Section& section, double value, DateSystem system) const {
    if (value < 0) {
        return formatGeneral(value);
    }

    const int k = section.subsecond_digits;
    const double half_unit = (k > 0 ? 0.5 * std::pow(10.0, -k) : 0.5) / 86400.0;
    const double adjusted = value + half_unit;
    auto dt = serialToDateTime(adjusted, system);
    if (!dt) {
        return formatGeneral(value);
    }

    int subsecond = dt->millisecond;
    for (int i = k; i < 3; ++i) subsecond /= 10;

    const int hour12 = dt->hour % 12 == 0 ? 12 : dt->hour % 12;
    const int hour = section.has_ampm ? hour12 : dt->hour;

    std::string out;
    for (const auto& token : section.tokens) {
        switch (token.kind) {
            case TokenKind::Date:
                switch (token.ch) {
                    case 'y':
                        out += token.width <= 2 ? zeroPad(dt->year % 100, 2) : zeroPad(dt->year, 4);
                        break;
                    case 'M':
                        if (token.width == 1) out += fmt::format("{}", dt->month);
                        else if (token.width == 2) out += zeroPad(dt->month, 2);
                        else if (token.width == 3) out += kMonthAbbrev[dt->month - 1];
                        else if (token.width == 4) out += kMonthFull[dt->month - 1];
                        else out += kMonthFull[dt->month - 1][0];
                        break;
                    case 'd':
                        if (token.width == 1) out += fmt::format("{}", dt->day);
                        else if (token.width == 2) out += zeroPad(dt->day, 2);
                        else if (token.width == 3) out += kDayAbbrev[dt->weekday];
                        else out += kDayFull[dt->weekday];
                        break;
                    case 'h':
                        out += token.width >= 2 ? zeroPad(hour, 2) : fmt::format("{}", hour);
                        break;
                    case 'n':
                        out += token.width >= 2 ? zeroPad(dt->minute, 2) : fmt::format("{}", dt->minute);
                        break;
                    case 's':
                        out += token.width >= 2 ? zeroPad(dt->second, 2) : fmt::format("{}", dt->second);
                        break;
                    case 'f':
                        out += '.';
                        out += zeroPad(subsecond, k).substr(0, static_cast<size_t>(token.width));
                        break;
                    default:
                        out += token.text;
                        break;
                }
                break;
            case TokenKind::Elapsed: {
                double total = 0.0;
                if (token.ch == 'h') total = std::floor(adjusted * 24.0);
                else if (token.ch == 'm') total = std::floor(adjusted * 1440.0);
                else total = std::floor(adjusted * 86400.0);
                out += zeroPad(static_cast<int64_t>(total), token.width);
                break;
            }
            case TokenKind::AmPm:
                if (token.text == "AM/PM") {
                    out += dt->hour < 12 ? "AM" : "PM";
                } else {
                    out += dt->hour < 12 ? token.text[0] : token.text[2];
                }
                break;
            case TokenKind::Digit:
                out += token.ch;
                break;
            case TokenKind::Point:
                out += '.';
                break;
            case TokenKind::Comma:
                out += ',';
                break;
            case TokenKind::Percent:
                out += '%';
                break;
            case TokenKind::Slash:
                out += '/';
                break;
            case TokenKind::Literal:
                out += token.text;
                break;
            default:
                break;
        }
    }
    return out;
}

std::string NumberFormat::formatWithGeneral(const Section& section, double value, bool show_minus) const {
    const double shown = show_minus ? value : std::fabs(value);
    std::string out;
    for (const auto& token : section.tokens) {
        switch (token.kind) {
            case TokenKind::General:
            case TokenKind::Text:
                out += formatGeneral(shown);
                break;
            case TokenKind::Digit:
                out += token.ch;
                break;
            case TokenKind::Point:
                out += '.';
                break;
            case TokenKind::Percent:
                out += '%';
                break;
            case TokenKind::Slash:
                out += '/';
                break;
            case TokenKind::Comma:
                out += ',';
                break;
            default:
                out += token.text;
                break;
        }
    }
    return out;
}

// ==================== 缓存 ====================

const NumberFormat& NumberFormatCache::get(const std::string& code) {
    auto it = cache_.find(code);
    if (it != cache_.end()) {
        return *it->second;
    }
    auto inserted = cache_.emplace(code, std::make_unique<NumberFormat>(code));
    return *inserted.first->second;
}

}} // namespace sheetlens::format
