#include "sheetlens/editor/SheetWriter.hpp"
#include "sheetlens/utils/CommonUtils.hpp"
#include "sheetlens/utils/ModuleLoggers.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <map>

namespace sheetlens {
namespace editor {

namespace {

bool isNameChar(char c) {
    return !std::isspace(static_cast<unsigned char>(c)) && c != '/' && c != '>';
}

bool isHex(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

/**
 * @brief 把文本编码为 OOXML 字符串内容
 *
 * XML 1.0 不允许的控制字符写成 _xHHHH_，本身形如 _xHHHH_ 的文本用 _x005F_ 转义下划线。
 */
std::string encodeOoxmlText(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (c < 0x20 && c != '\t' && c != '\n' && c != '\r') {
            out += fmt::format("_x{:04X}_", static_cast<unsigned>(c));
            continue;
        }
        if (c == '_' && i + 6 < text.size() && text[i + 1] == 'x' &&
            isHex(text[i + 2]) && isHex(text[i + 3]) && isHex(text[i + 4]) && isHex(text[i + 5]) &&
            text[i + 6] == '_') {
            out += "_x005F_";
            continue;
        }
        out += static_cast<char>(c);
    }
    return out;
}

} // namespace

std::optional<SheetWriter::ElementSpan> SheetWriter::findElement(std::string_view xml, std::string_view local_name,
                                                                 size_t from) {
    size_t pos = from;
    while ((pos = xml.find('<', pos)) != std::string_view::npos) {
        const std::string_view rest = xml.substr(pos);

        // 注释、CDATA、处理指令、结束标签
        if (rest.compare(0, 4, "<!--") == 0) {
            const size_t close = xml.find("-->", pos + 4);
            if (close == std::string_view::npos) return std::nullopt;
            pos = close + 3;
            continue;
        }
        if (rest.compare(0, 9, "<![CDATA[") == 0) {
            const size_t close = xml.find("]]>", pos + 9);
            if (close == std::string_view::npos) return std::nullopt;
            pos = close + 3;
            continue;
        }
        if (rest.size() > 1 && (rest[1] == '?' || rest[1] == '!' || rest[1] == '/')) {
            pos += 2;
            continue;
        }

        size_t name_end = pos + 1;
        while (name_end < xml.size() && isNameChar(xml[name_end])) {
            ++name_end;
        }
        const std::string_view qname = xml.substr(pos + 1, name_end - pos - 1);
        const size_t colon = qname.find(':');
        const std::string_view local = colon == std::string_view::npos ? qname : qname.substr(colon + 1);
        if (local != local_name) {
            pos = name_end;
            continue;
        }

        // 开始标签的结尾，跳过引号内的 '>'
        size_t tag_end = name_end;
        char quote = 0;
        for (; tag_end < xml.size(); ++tag_end) {
            const char c = xml[tag_end];
            if (quote) {
                if (c == quote) quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '>') {
                break;
            }
        }
        if (tag_end >= xml.size()) {
            return std::nullopt;
        }

        ElementSpan span;
        span.begin = pos;
        span.prefix = colon == std::string_view::npos ? std::string() : std::string(qname.substr(0, colon + 1));

        if (xml[tag_end - 1] == '/') {
            span.end = tag_end + 1;
            return span;
        }

        const std::string closing = "</" + std::string(qname);
        size_t close = tag_end + 1;
        while ((close = xml.find(closing, close)) != std::string_view::npos) {
            size_t after = close + closing.size();
            while (after < xml.size() && std::isspace(static_cast<unsigned char>(xml[after]))) {
                ++after;
            }
            if (after < xml.size() && xml[after] == '>') {
                span.end = after + 1;
                return span;
            }
            close = after;
        }
        return std::nullopt;
    }
    return std::nullopt;
}

core::Result<std::string> SheetWriter::rewrite(std::string_view original_xml, const core::Sheet& sheet) {
    auto data = findElement(original_xml, "sheetData");
    if (!data) {
        return core::makeError(core::ErrorCode::XmlParseError, "Worksheet has no <sheetData> element",
                               sheet.part_path);
    }

    const std::string& prefix = data->prefix;
    const std::string dimension = fmt::format("<{}dimension ref=\"{}\"/>", prefix, dimensionRef(sheet));
    const std::string sheet_data = buildSheetData(sheet, prefix);

    std::string result;
    result.reserve(original_xml.size() + sheet_data.size());

    auto dim = findElement(original_xml, "dimension");
    if (dim && dim->end <= data->begin) {
        result.append(original_xml.substr(0, dim->begin));
        result += dimension;
        result.append(original_xml.substr(dim->end, data->begin - dim->end));
    } else {
        // dimension 位于 sheetPr 之后、sheetViews 等元素之前
        size_t insert_at = data->begin;
        for (const char* name : {"sheetViews", "sheetFormatPr", "cols"}) {
            auto span = findElement(original_xml, name);
            if (span && span->begin < insert_at) {
                insert_at = span->begin;
            }
        }
        result.append(original_xml.substr(0, insert_at));
        result += dimension;
        result.append(original_xml.substr(insert_at, data->begin - insert_at));
    }

    result += sheet_data;
    result.append(original_xml.substr(data->end));

    EDIT_DEBUG("Rewrote {}: {} cells, dimension {}", sheet.part_path, sheet.cells().size(), dimensionRef(sheet));
    return result;
}

std::string SheetWriter::buildSheetData(const core::Sheet& sheet, const std::string& prefix) {
    const auto& cells = sheet.cells();

    // 行号 -> 该行单元格下标（已按列排序）
    std::map<uint32_t, std::vector<size_t>> rows;
    for (size_t index : sheet.sortedCellOrder()) {
        rows[cells[index].r].push_back(index);
    }
    // 只有行属性没有单元格的行（隐藏行、自定义行高）同样保留
    for (const auto& entry : sheet.row_attributes) {
        rows[entry.first];
    }

    xml::XMLStreamWriter writer;
    writer.startElement(prefix + "sheetData");
    for (const auto& row : rows) {
        writer.startElement(prefix + "row");
        writer.writeAttribute("r", row.first + 1);
        auto attrs = sheet.row_attributes.find(row.first);
        if (attrs != sheet.row_attributes.end()) {
            for (const auto& attr : attrs->second) {
                writer.writeAttribute(attr.first, attr.second);
            }
        }
        for (size_t index : row.second) {
            writeCell(writer, prefix, cells[index].r, cells[index].c, cells[index].cell);
        }
        writer.endElement();
    }
    writer.endElement();
    return writer.takeResult();
}

std::string SheetWriter::dimensionRef(const core::Sheet& sheet) {
    const auto& cells = sheet.cells();
    if (cells.empty()) {
        return "A1";
    }
    core::CellRange bounds(cells.front().r, cells.front().c, cells.front().r, cells.front().c);
    for (const auto& data : cells) {
        bounds.first_row = std::min(bounds.first_row, data.r);
        bounds.first_col = std::min(bounds.first_col, data.c);
        bounds.last_row = std::max(bounds.last_row, data.r);
        bounds.last_col = std::max(bounds.last_col, data.c);
    }
    return utils::CommonUtils::rangeReference(bounds);
}

void SheetWriter::writeCell(xml::XMLStreamWriter& writer, const std::string& prefix,
                            uint32_t row, uint32_t col, const core::Cell& cell) {
    writer.startElement(prefix + "c");
    writer.writeAttribute("r", utils::CommonUtils::cellReference(row, col));
    if (cell.style_index) {
        writer.writeAttribute("s", *cell.style_index);
    }
    if (cell.source) {
        writeSourceCell(writer, prefix, cell);
    } else {
        writeEditedCell(writer, prefix, cell);
    }
    writer.endElement();
}

void SheetWriter::writeSourceCell(xml::XMLStreamWriter& writer, const std::string& prefix, const core::Cell& cell) {
    const core::CellSource& source = *cell.source;
    if (!source.t.empty()) {
        writer.writeAttribute("t", source.t);
    }
    for (const auto& attr : source.extra_attrs) {
        writer.writeAttribute(attr.first, attr.second);
    }

    if (cell.formula || !source.f_attrs.empty()) {
        writer.startElement(prefix + "f");
        for (const auto& attr : source.f_attrs) {
            writer.writeAttribute(attr.first, attr.second);
        }
        if (cell.formula && !cell.formula->empty()) {
            writer.writeText(*cell.formula);
        }
        writer.endElement();
    }

    if (source.inline_xml) {
        // 富文本 run 和语音标注原样保留
        writer.writeRaw(*source.inline_xml);
    } else if (source.t == "inlineStr") {
        writeInlineString(writer, prefix, cell.value.value_or(std::string()));
    } else if (source.v) {
        writer.startElement(prefix + "v");
        writer.writeText(*source.v);
        writer.endElement();
    }
}

void SheetWriter::writeEditedCell(xml::XMLStreamWriter& writer, const std::string& prefix, const core::Cell& cell) {
    switch (cell.type) {
        case core::CellType::Boolean:
            writer.writeAttribute("t", "b");
            writer.startElement(prefix + "v");
            writer.writeText(cell.value && *cell.value == "TRUE" ? "1" : "0");
            writer.endElement();
            break;
        case core::CellType::Number:
            if (cell.number) {
                writer.startElement(prefix + "v");
                writer.writeText(*cell.number);
                writer.endElement();
            }
            break;
        case core::CellType::String:
            writer.writeAttribute("t", "inlineStr");
            writeInlineString(writer, prefix, cell.value.value_or(std::string()));
            break;
        default:
            EDIT_WARN("Edited cell of type {} has no representation, writing empty cell", core::toString(cell.type));
            break;
    }
}

void SheetWriter::writeInlineString(xml::XMLStreamWriter& writer, const std::string& prefix, const std::string& text) {
    writer.startElement(prefix + "is");
    writer.startElement(prefix + "t");
    writer.writeAttribute("xml:space", "preserve");
    writer.writeText(encodeOoxmlText(text));
    writer.endElement();
    writer.endElement();
}

}} // namespace sheetlens::editor
