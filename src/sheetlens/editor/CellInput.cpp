#include "sheetlens/editor/CellInput.hpp"

#include <cctype>
#include <cmath>
#include <fast_float/fast_float.h>

namespace sheetlens {
namespace editor {

namespace {

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

const char* toString(CellInput::Kind kind) {
    switch (kind) {
        case CellInput::Kind::Remove:  return "remove";
        case CellInput::Kind::Boolean: return "boolean";
        case CellInput::Kind::Number:  return "number";
        case CellInput::Kind::String:  return "string";
    }
    return "unknown";
}

CellInput inferCellInput(std::string_view input) {
    CellInput result;
    if (input.empty()) {
        result.kind = CellInput::Kind::Remove;
        return result;
    }

    if (equalsIgnoreCase(input, "true") || equalsIgnoreCase(input, "false")) {
        result.kind = CellInput::Kind::Boolean;
        result.boolean = equalsIgnoreCase(input, "true");
        return result;
    }

    // 必须整串匹配，"12abc"、" 12" 都按字符串处理
    double value = 0.0;
    auto parsed = fast_float::from_chars(input.data(), input.data() + input.size(), value);
    if (parsed.ec == std::errc() && parsed.ptr == input.data() + input.size() && std::isfinite(value)) {
        result.kind = CellInput::Kind::Number;
        result.number = value;
        return result;
    }

    result.kind = CellInput::Kind::String;
    result.text = std::string(input);
    return result;
}

}} // namespace sheetlens::editor
