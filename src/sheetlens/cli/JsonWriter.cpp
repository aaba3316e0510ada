#include "sheetlens/cli/JsonWriter.hpp"
#include "sheetlens/core/Exception.hpp"

#include <cmath>
#include <fmt/format.h>
#include <iterator>
#include <utf8.h>

namespace sheetlens {
namespace cli {

JsonWriter::JsonWriter(bool pretty, int indent) : pretty_(pretty), indent_(indent < 0 ? 0 : indent) {}

std::string JsonWriter::escape(std::string_view text) {
    // JSON 必须是合法 UTF-8，损坏的字节序列替换为 U+FFFD
    std::string repaired;
    if (!utf8::is_valid(text.begin(), text.end())) {
        utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(repaired));
        text = repaired;
    }

    std::string out;
    out.reserve(text.size() + 2);
    for (char ch : text) {
        const unsigned char c = static_cast<unsigned char>(ch);
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (c < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    out += ch;
                }
                break;
        }
    }
    return out;
}

void JsonWriter::misuse(const std::string& message) const {
    SHEETLENS_THROW("JsonWriter: " + message, core::ErrorCode::InvalidArgument);
}

void JsonWriter::newline() {
    if (!pretty_) {
        return;
    }
    buffer_ += '\n';
    buffer_.append(stack_.size() * static_cast<size_t>(indent_), ' ');
}

void JsonWriter::beforeValue() {
    if (stack_.empty()) {
        if (root_written_) {
            misuse("multiple root values");
        }
        root_written_ = true;
        return;
    }

    Frame& frame = stack_.back();
    if (frame.is_object) {
        if (!frame.has_key) {
            misuse("value in object without key");
        }
        frame.has_key = false;
        return;
    }
    if (frame.count++ > 0) {
        buffer_ += ',';
    }
    newline();
}

void JsonWriter::key(std::string_view name) {
    if (stack_.empty() || !stack_.back().is_object) {
        misuse(fmt::format("key '{}' outside of object", name));
    }
    Frame& frame = stack_.back();
    if (frame.has_key) {
        misuse(fmt::format("key '{}' follows another key", name));
    }
    if (frame.count++ > 0) {
        buffer_ += ',';
    }
    newline();
    buffer_ += '"';
    buffer_ += escape(name);
    buffer_ += pretty_ ? "\": " : "\":";
    frame.has_key = true;
}

void JsonWriter::beginContainer(bool is_object, char open) {
    beforeValue();
    buffer_ += open;
    stack_.push_back(Frame{is_object, 0, false});
}

void JsonWriter::endContainer(bool is_object, char close) {
    if (stack_.empty() || stack_.back().is_object != is_object) {
        misuse(fmt::format("unbalanced '{}'", close));
    }
    if (stack_.back().has_key) {
        misuse("object closed after key without value");
    }
    const bool had_items = stack_.back().count > 0;
    stack_.pop_back();
    if (had_items) {
        newline();
    }
    buffer_ += close;
}

void JsonWriter::beginObject() { beginContainer(true, '{'); }
void JsonWriter::endObject() { endContainer(true, '}'); }
void JsonWriter::beginArray() { beginContainer(false, '['); }
void JsonWriter::endArray() { endContainer(false, ']'); }

void JsonWriter::value(std::string_view text) {
    beforeValue();
    buffer_ += '"';
    buffer_ += escape(text);
    buffer_ += '"';
}

void JsonWriter::value(bool flag) {
    beforeValue();
    buffer_ += flag ? "true" : "false";
}

void JsonWriter::value(double number) {
    beforeValue();
    if (!std::isfinite(number)) {
        buffer_ += "null";
        return;
    }
    buffer_ += fmt::format("{}", number);
}

void JsonWriter::value(int64_t number) {
    beforeValue();
    buffer_ += fmt::format("{}", number);
}

void JsonWriter::value(uint64_t number) {
    beforeValue();
    buffer_ += fmt::format("{}", number);
}

void JsonWriter::null() {
    beforeValue();
    buffer_ += "null";
}

std::string JsonWriter::takeResult() {
    if (!complete()) {
        misuse("document is incomplete");
    }
    if (pretty_) {
        buffer_ += '\n';
    }
    std::string result = std::move(buffer_);
    buffer_.clear();
    root_written_ = false;
    return result;
}

}} // namespace sheetlens::cli
