#include "sheetlens/reader/SharedStringsParser.hpp"
#include "sheetlens/utils/ModuleLoggers.hpp"

#include <iterator>
#include <optional>
#include <utf8.h>

namespace sheetlens {
namespace reader {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool isLeadSurrogate(uint32_t unit) {
    return unit >= 0xD800 && unit <= 0xDBFF;
}

bool isTrailSurrogate(uint32_t unit) {
    return unit >= 0xDC00 && unit <= 0xDFFF;
}

// 读取 pos 处的 _xHHHH_，成功返回 UTF-16 码元
std::optional<uint16_t> readEscape(std::string_view text, size_t pos) {
    if (pos + 6 >= text.size() || text[pos] != '_' || text[pos + 1] != 'x' || text[pos + 6] != '_') {
        return std::nullopt;
    }
    uint16_t unit = 0;
    for (size_t k = 2; k < 6; ++k) {
        int digit = hexValue(text[pos + k]);
        if (digit < 0) {
            return std::nullopt;
        }
        unit = static_cast<uint16_t>((unit << 4) | digit);
    }
    return unit;
}

} // namespace

std::string SharedStringsParser::decodeEscapes(std::string_view text) {
    if (text.find("_x") == std::string_view::npos) {
        return std::string(text);
    }

    std::string result;
    result.reserve(text.size());
    auto out = std::back_inserter(result);
    size_t i = 0;
    while (i < text.size()) {
        // _xHHHH_ 共 7 个字符，转义的是 UTF-16 码元，代理对需要两个转义拼成一个码点
        auto unit = readEscape(text, i);
        if (!unit) {
            result += text[i];
            ++i;
            continue;
        }
        i += 7;

        uint32_t cp = *unit;
        if (isLeadSurrogate(*unit)) {
            auto trail = readEscape(text, i);
            if (trail && isTrailSurrogate(*trail)) {
                cp = 0x10000 + ((static_cast<uint32_t>(*unit) - 0xD800) << 10) + (*trail - 0xDC00);
                i += 7;
            }
        }
        if (isLeadSurrogate(cp) || isTrailSurrogate(cp)) {
            READER_DEBUG("Unpaired surrogate escape _x{:04X}_ replaced with U+FFFD", *unit);
            cp = 0xFFFD;
        }
        utf8::append(cp, out);
    }
    return result;
}

void SharedStringsParser::onStartElement(std::string_view name, const xml::XMLAttributes& attributes, int /*depth*/) {
    if (name == "si") {
        in_si_ = true;
        current_string_.clear();
        current_runs_.clear();
    } else if (!in_si_) {
        if (name == "sst") {
            if (auto count = findUIntAttribute(attributes, "uniqueCount")) {
                table_.strings.reserve(*count);
                table_.runs.reserve(*count);
            }
        }
    } else if (name == "rPh") {
        in_phonetic_ = true;
    } else if (name == "r") {
        in_run_ = true;
        current_runs_.emplace_back();
    } else if (name == "t") {
        if (!in_phonetic_) {
            startCollectingText();
        }
    } else if (in_run_ && !current_runs_.empty()) {
        // <rPr> 子元素
        auto& run = current_runs_.back();
        if (name == "b") {
            run.bold = getBoolAttributeOr(attributes, "val", true);
        } else if (name == "i") {
            run.italic = getBoolAttributeOr(attributes, "val", true);
        } else if (name == "sz") {
            run.size = findDoubleAttribute(attributes, "val");
        } else if (name == "rFont") {
            if (auto val = findAttribute(attributes, "val")) {
                run.font = std::string(*val);
            }
        } else if (name == "color") {
            if (auto color = parseColorAttributes(attributes)) {
                run.color = color->resolve(theme_colors_, indexed_palette_);
            }
        }
    }
}

void SharedStringsParser::onEndElement(std::string_view name, int /*depth*/) {
    if (name == "t") {
        if (in_si_ && !in_phonetic_ && state_.collecting_text) {
            std::string text = decodeEscapes(getCurrentText());
            if (in_run_ && !current_runs_.empty()) {
                current_runs_.back().text += text;
            }
            current_string_ += text;
        }
        stopCollectingText();
    } else if (name == "rPh") {
        in_phonetic_ = false;
    } else if (name == "r") {
        in_run_ = false;
    } else if (name == "si") {
        table_.strings.push_back(std::move(current_string_));
        table_.runs.push_back(std::move(current_runs_));
        current_string_.clear();
        current_runs_.clear();
        in_si_ = false;
    } else if (name == "sst") {
        READER_DEBUG("Shared strings: {} entries", table_.strings.size());
    }
}

}} // namespace sheetlens::reader
