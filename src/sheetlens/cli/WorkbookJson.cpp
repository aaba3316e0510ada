#include "sheetlens/cli/WorkbookJson.hpp"
#include "sheetlens/utils/CommonUtils.hpp"

#include <fmt/format.h>

namespace sheetlens {
namespace cli {

namespace {

template<typename T>
void optionalField(JsonWriter& writer, std::string_view name, const std::optional<T>& value) {
    if (value) {
        writer.field(name, *value);
    }
}

void optionalColor(JsonWriter& writer, std::string_view name, const std::optional<uint32_t>& color) {
    if (color) {
        writer.field(name, colorToHex(*color));
    }
}

void writeColorSpec(JsonWriter& writer, std::string_view name, const core::Color& color,
                    const core::Workbook& workbook) {
    const std::vector<uint32_t>* palette = workbook.indexed_palette.empty() ? nullptr : &workbook.indexed_palette;
    if (auto rgb = color.resolve(workbook.theme.colors, palette)) {
        writer.field(name, colorToHex(*rgb));
    }
}

void writeBorderSide(JsonWriter& writer, std::string_view name, const std::optional<core::BorderSide>& side) {
    if (!side) {
        return;
    }
    writer.key(name);
    writer.beginObject();
    writer.field("style", core::toString(side->style));
    writer.field("color", colorToHex(side->color));
    writer.endObject();
}

void writeRange(JsonWriter& writer, const core::CellRange& range) {
    writer.beginObject();
    writer.field("startRow", range.first_row);
    writer.field("startCol", range.first_col);
    writer.field("endRow", range.last_row);
    writer.field("endCol", range.last_col);
    writer.endObject();
}

void writeCfvos(JsonWriter& writer, const std::vector<core::Cfvo>& cfvos) {
    static const char* const kTypeNames[] = {
        "num", "percent", "percentile", "min", "max", "formula", "autoMin", "autoMax"
    };
    writer.key("cfvos");
    writer.beginArray();
    for (const auto& cfvo : cfvos) {
        writer.beginObject();
        writer.field("type", kTypeNames[static_cast<size_t>(cfvo.type)]);
        if (!cfvo.value.empty()) {
            writer.field("value", cfvo.value);
        }
        if (!cfvo.gte) {
            writer.field("gte", false);
        }
        writer.endObject();
    }
    writer.endArray();
}

void writeRule(JsonWriter& writer, const core::CfRule& rule, const core::Workbook& workbook) {
    writer.beginObject();
    writer.field("type", rule.type_name.empty() ? std::string(core::toString(rule.type)) : rule.type_name);
    writer.field("priority", static_cast<int64_t>(rule.priority));
    if (rule.stop_if_true) {
        writer.field("stopIfTrue", true);
    }
    optionalField(writer, "dxfId", rule.dxf_id);
    if (!rule.op.empty()) {
        writer.field("operator", rule.op);
    }
    if (!rule.formulas.empty()) {
        writer.key("formulas");
        writer.beginArray();
        for (const auto& formula : rule.formulas) {
            writer.value(formula);
        }
        writer.endArray();
    }
    if (!rule.text.empty()) {
        writer.field("text", rule.text);
    }
    if (!rule.time_period.empty()) {
        writer.field("timePeriod", rule.time_period);
    }

    switch (rule.type) {
        case core::CfRuleType::Top10:
            writer.field("rank", rule.rank);
            writer.field("percent", rule.percent);
            writer.field("bottom", rule.bottom);
            break;
        case core::CfRuleType::AboveAverage:
            writer.field("aboveAverage", rule.above_average);
            writer.field("equalAverage", rule.equal_average);
            optionalField(writer, "stdDev", rule.std_dev);
            break;
        default:
            break;
    }

    if (rule.color_scale) {
        writer.key("colorScale");
        writer.beginObject();
        writeCfvos(writer, rule.color_scale->cfvos);
        writer.key("colors");
        writer.beginArray();
        const std::vector<uint32_t>* palette =
            workbook.indexed_palette.empty() ? nullptr : &workbook.indexed_palette;
        for (const auto& color : rule.color_scale->colors) {
            auto rgb = color.resolve(workbook.theme.colors, palette);
            if (rgb) {
                writer.value(colorToHex(*rgb));
            } else {
                writer.null();
            }
        }
        writer.endArray();
        writer.endObject();
    }
    if (rule.data_bar) {
        const auto& bar = *rule.data_bar;
        writer.key("dataBar");
        writer.beginObject();
        writeCfvos(writer, bar.cfvos);
        writeColorSpec(writer, "color", bar.color, workbook);
        writer.field("minLength", bar.min_length);
        writer.field("maxLength", bar.max_length);
        writer.field("showValue", bar.show_value);
        writer.field("gradient", bar.gradient);
        writer.field("axisPosition", bar.axis_position);
        writer.field("direction", bar.direction);
        if (bar.negative_fill_color) writeColorSpec(writer, "negativeFillColor", *bar.negative_fill_color, workbook);
        if (bar.negative_border_color) writeColorSpec(writer, "negativeBorderColor", *bar.negative_border_color, workbook);
        if (bar.border_color) writeColorSpec(writer, "borderColor", *bar.border_color, workbook);
        if (bar.axis_color) writeColorSpec(writer, "axisColor", *bar.axis_color, workbook);
        writer.endObject();
    }
    if (rule.icon_set) {
        const auto& icons = *rule.icon_set;
        writer.key("iconSet");
        writer.beginObject();
        writer.field("iconSet", icons.icon_set);
        writeCfvos(writer, icons.cfvos);
        writer.field("reverse", icons.reverse);
        writer.field("showValue", icons.show_value);
        writer.endObject();
    }
    writer.endObject();
}

void writeOutline(JsonWriter& writer, std::string_view name, std::string_view index_name,
                  const std::vector<core::OutlineLevel>& levels) {
    if (levels.empty()) return;
    writer.key(name);
    writer.beginArray();
    for (const auto& entry : levels) {
        writer.beginObject();
        writer.field(index_name, entry.index);
        writer.field("level", static_cast<uint32_t>(entry.level));
        if (entry.collapsed) writer.field("collapsed", true);
        if (entry.hidden) writer.field("hidden", true);
        writer.endObject();
    }
    writer.endArray();
}

void writeCell(JsonWriter& writer, const core::CellData& data) {
    const core::Cell& cell = data.cell;
    writer.beginObject();
    writer.field("r", data.r);
    writer.field("c", data.c);
    writer.field("ref", utils::CommonUtils::cellReference(data.r, data.c));
    writer.field("type", core::toString(cell.type));
    optionalField(writer, "value", cell.value);
    optionalField(writer, "number", cell.number);
    optionalField(writer, "formula", cell.formula);
    optionalField(writer, "display", cell.display);
    optionalField(writer, "styleIndex", cell.style_index);
    if (cell.style) {
        writer.key("style");
        writeStyle(writer, *cell.style);
    }
    if (!cell.rich_text.empty()) {
        writer.key("richText");
        writer.beginArray();
        for (const auto& run : cell.rich_text) {
            writer.beginObject();
            writer.field("text", run.text);
            optionalField(writer, "bold", run.bold);
            optionalField(writer, "italic", run.italic);
            optionalColor(writer, "color", run.color);
            optionalField(writer, "size", run.size);
            optionalField(writer, "font", run.font);
            writer.endObject();
        }
        writer.endArray();
    }
    if (cell.has_hyperlink) {
        writer.field("hasHyperlink", true);
    }
    if (cell.has_comment) {
        writer.field("hasComment", true);
    }
    writer.endObject();
}

void writeAnchor(JsonWriter& writer, std::string_view name, const core::AnchorPoint& point) {
    writer.key(name);
    writer.beginObject();
    writer.field("col", point.col);
    writer.field("colOffset", point.col_offset);
    writer.field("row", point.row);
    writer.field("rowOffset", point.row_offset);
    writer.endObject();
}

} // namespace

std::string colorToHex(uint32_t rgb) {
    return fmt::format("#{:06X}", rgb & 0xFFFFFF);
}

void writeStyle(JsonWriter& writer, const core::Style& style) {
    writer.beginObject();
    optionalField(writer, "fontFamily", style.font_family);
    optionalField(writer, "fontSize", style.font_size);
    optionalColor(writer, "fontColor", style.font_color);
    optionalField(writer, "bold", style.bold);
    optionalField(writer, "italic", style.italic);
    if (style.underline) writer.field("underline", core::toString(*style.underline));
    optionalField(writer, "strikethrough", style.strikethrough);
    if (style.vert_align) writer.field("vertAlign", core::toString(*style.vert_align));

    optionalColor(writer, "bgColor", style.bg_color);
    optionalColor(writer, "fgColor", style.fg_color);
    if (style.pattern_type) writer.field("patternType", core::toString(*style.pattern_type));
    if (style.gradient) {
        writer.key("gradient");
        writer.beginObject();
        writer.field("type", style.gradient->type);
        writer.field("degree", style.gradient->degree);
        writer.key("stops");
        writer.beginArray();
        for (const auto& stop : style.gradient->stops) {
            writer.beginObject();
            writer.field("position", stop.position);
            writer.field("color", colorToHex(stop.color));
            writer.endObject();
        }
        writer.endArray();
        writer.endObject();
    }

    writeBorderSide(writer, "borderTop", style.border_top);
    writeBorderSide(writer, "borderRight", style.border_right);
    writeBorderSide(writer, "borderBottom", style.border_bottom);
    writeBorderSide(writer, "borderLeft", style.border_left);
    writeBorderSide(writer, "borderDiagonal", style.border_diagonal);
    optionalField(writer, "diagonalUp", style.diagonal_up);
    optionalField(writer, "diagonalDown", style.diagonal_down);

    if (style.align_h) writer.field("alignH", core::toString(*style.align_h));
    if (style.align_v) writer.field("alignV", core::toString(*style.align_v));
    optionalField(writer, "wrap", style.wrap);
    optionalField(writer, "shrinkToFit", style.shrink_to_fit);
    optionalField(writer, "indent", style.indent);
    if (style.rotation) writer.field("rotation", static_cast<int64_t>(*style.rotation));
    if (style.reading_order) writer.field("readingOrder", static_cast<int>(*style.reading_order));
    optionalField(writer, "locked", style.locked);
    optionalField(writer, "hidden", style.hidden);

    writer.field("numberFormat", style.number_format);
    writer.field("numberFormatId", style.number_format_id);
    writer.endObject();
}

void writeSheet(JsonWriter& writer, const core::Sheet& sheet, const core::Workbook& workbook) {
    writer.beginObject();
    writer.field("name", sheet.name);
    writer.field("state", core::toString(sheet.visibility));
    optionalColor(writer, "tabColor", sheet.tab_color);
    writer.field("maxRow", sheet.max_row);
    writer.field("maxCol", sheet.max_col);
    if (sheet.frozen_rows > 0) writer.field("frozenRows", sheet.frozen_rows);
    if (sheet.frozen_cols > 0) writer.field("frozenCols", sheet.frozen_cols);
    writer.field("defaultColWidth", sheet.default_col_width);
    writer.field("defaultRowHeight", sheet.default_row_height);
    writer.field("isProtected", sheet.is_protected);

    if (!sheet.column_widths.empty()) {
        writer.key("colWidths");
        writer.beginArray();
        for (const auto& entry : sheet.column_widths) {
            writer.beginObject();
            writer.field("col", entry.first);
            writer.field("width", entry.second);
            writer.endObject();
        }
        writer.endArray();
    }
    if (!sheet.row_heights.empty()) {
        writer.key("rowHeights");
        writer.beginArray();
        for (const auto& entry : sheet.row_heights) {
            writer.beginObject();
            writer.field("row", entry.first);
            writer.field("height", entry.second);
            writer.endObject();
        }
        writer.endArray();
    }
    writeOutline(writer, "outlineLevelRow", "row", sheet.outline_level_row);
    writeOutline(writer, "outlineLevelCol", "col", sheet.outline_level_col);
    if (!sheet.outline_level_row.empty() || !sheet.outline_level_col.empty()) {
        writer.field("outlineSummaryBelow", sheet.outline_summary_below);
        writer.field("outlineSummaryRight", sheet.outline_summary_right);
    }

    writer.key("cells");
    writer.beginArray();
    for (size_t index : sheet.sortedCellOrder()) {
        writeCell(writer, sheet.cells()[index]);
    }
    writer.endArray();

    writer.key("merges");
    writer.beginArray();
    for (const auto& merge : sheet.merges) {
        writeRange(writer, merge);
    }
    writer.endArray();

    writer.key("conditionalFormats");
    writer.beginArray();
    for (const auto& group : sheet.conditional_formats) {
        writer.beginObject();
        writer.field("sqref", group.sqref);
        writer.key("rules");
        writer.beginArray();
        for (const auto& rule : group.rules) {
            writeRule(writer, rule, workbook);
        }
        writer.endArray();
        writer.endObject();
    }
    writer.endArray();

    writer.key("hyperlinks");
    writer.beginArray();
    for (const auto& link : sheet.hyperlinks) {
        writer.beginObject();
        writer.field("ref", link.ref);
        optionalField(writer, "target", link.target);
        optionalField(writer, "location", link.location);
        optionalField(writer, "display", link.display);
        optionalField(writer, "tooltip", link.tooltip);
        writer.endObject();
    }
    writer.endArray();

    writer.key("comments");
    writer.beginArray();
    for (const auto& entry : sheet.comments) {
        writer.beginObject();
        writer.field("ref", entry.second.ref);
        writer.field("author", entry.second.author);
        writer.field("text", entry.second.text);
        writer.endObject();
    }
    writer.endArray();

    writer.key("drawings");
    writer.beginArray();
    for (const auto& drawing : sheet.drawings) {
        writer.beginObject();
        writer.field("kind", core::toString(drawing.kind));
        writer.field("anchorType", drawing.anchor_type);
        writeAnchor(writer, "from", drawing.from);
        if (drawing.to) writeAnchor(writer, "to", *drawing.to);
        optionalField(writer, "extCx", drawing.ext_cx);
        optionalField(writer, "extCy", drawing.ext_cy);
        if (!drawing.name.empty()) writer.field("name", drawing.name);
        if (!drawing.description.empty()) writer.field("description", drawing.description);
        optionalField(writer, "target", drawing.target);
        writer.endObject();
    }
    writer.endArray();

    if (!sheet.data_validations.empty()) {
        writer.key("dataValidations");
        writer.beginArray();
        for (const auto& validation : sheet.data_validations) {
            writer.beginObject();
            writer.field("sqref", validation.sqref);
            writer.field("type", validation.type);
            if (!validation.op.empty()) writer.field("operator", validation.op);
            optionalField(writer, "formula1", validation.formula1);
            optionalField(writer, "formula2", validation.formula2);
            writer.field("allowBlank", validation.allow_blank);
            writer.endObject();
        }
        writer.endArray();
    }
    optionalField(writer, "autoFilter", sheet.auto_filter_ref);
    writer.endObject();
}

void writeWorkbook(JsonWriter& writer, const core::Workbook& workbook) {
    writer.beginObject();
    writer.field("date1904", workbook.date1904);

    writer.key("theme");
    writer.beginObject();
    writer.field("name", workbook.theme.name);
    writer.field("majorFont", workbook.theme.major_font);
    writer.field("minorFont", workbook.theme.minor_font);
    writer.key("colors");
    writer.beginArray();
    for (uint32_t color : workbook.theme.colors) {
        writer.value(colorToHex(color));
    }
    writer.endArray();
    writer.endObject();

    if (!workbook.defined_names.empty()) {
        writer.key("definedNames");
        writer.beginArray();
        for (const auto& name : workbook.defined_names) {
            writer.beginObject();
            writer.field("name", name.name);
            writer.field("value", name.value);
            optionalField(writer, "localSheetId", name.local_sheet_id);
            if (name.hidden) writer.field("hidden", true);
            writer.endObject();
        }
        writer.endArray();
    }

    writer.key("dxfStyles");
    writer.beginArray();
    for (const auto& dxf : workbook.dxf_styles) {
        writer.beginObject();
        optionalColor(writer, "fontColor", dxf.font_color);
        optionalField(writer, "bold", dxf.bold);
        optionalField(writer, "italic", dxf.italic);
        if (dxf.underline) writer.field("underline", core::toString(*dxf.underline));
        optionalField(writer, "strikethrough", dxf.strikethrough);
        optionalColor(writer, "fillColor", dxf.fill_color);
        optionalColor(writer, "borderColor", dxf.border_color);
        optionalField(writer, "numberFormat", dxf.number_format);
        writer.endObject();
    }
    writer.endArray();

    writer.key("sheets");
    writer.beginArray();
    for (const auto& sheet : workbook.sheets) {
        writeSheet(writer, sheet, workbook);
    }
    writer.endArray();
    writer.endObject();
}

std::string workbookToJson(const core::Workbook& workbook, bool pretty) {
    JsonWriter writer(pretty);
    writeWorkbook(writer, workbook);
    return writer.takeResult();
}

}} // namespace sheetlens::cli
