#include "sheetlens/reader/WorksheetParser.hpp"
#include "sheetlens/format/DateTime.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace sheetlens {
namespace reader {

namespace {

std::string_view trim(std::string_view text) {
    const size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return {};
    }
    const size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

uint32_t clampCount(double value) {
    if (!(value > 0.0)) return 0;
    if (value > 1048576.0) return 1048576;
    return static_cast<uint32_t>(value);
}

} // namespace

WorksheetParser::WorksheetParser(core::Sheet& sheet, Context context)
    : sheet_(sheet), context_(std::move(context)) {
}

void WorksheetParser::onStartElement(std::string_view name, const xml::XMLAttributes& attributes, int /*depth*/) {
    // 单元格内部元素最频繁，优先处理
    if (cell_) {
        if (name == "v" || name == "t") {
            startCollectingText();
        } else if (name == "f" && getParentElement() == "c") {
            cell_->has_formula = true;
            for (const auto& attr : attributes) {
                cell_->f_attrs.emplace_back(std::string(attr.name), std::string(attr.value));
            }
            startCollectingText();
        } else if (name == "is") {
            cell_->inline_text.emplace();
            cell_->inline_begin = currentTagBegin();
            cell_->inline_open_end = currentTagEnd();
        }
        return;
    }

    if (name == "c") {
        handleCell(attributes);
        return;
    }
    if (name == "row") {
        handleRow(attributes);
        return;
    }

    // 条件格式规则内部
    if (rule_) {
        handleCfChild(name, attributes);
        return;
    }

    // 迷你图
    if (sparkline_group_) {
        if (name == "sparkline") {
            sparkline_group_->sparklines.emplace_back();
            sparkline_ = &sparkline_group_->sparklines.back();
        } else if (sparkline_ && (name == "f" || name == "sqref")) {
            startCollectingText();
        } else {
            handleSparklineColor(name, attributes);
        }
        return;
    }

    if (name == "worksheet") {
        saw_root_ = true;
    } else if (name == "tabColor") {
        sheet_.tab_color = resolveColor(attributes);
    } else if (name == "outlinePr") {
        sheet_.outline_summary_below = getBoolAttributeOr(attributes, "summaryBelow", true);
        sheet_.outline_summary_right = getBoolAttributeOr(attributes, "summaryRight", true);
    } else if (name == "sheetProtection") {
        // 没有 sheet 属性的 <sheetProtection> 也视为已保护
        sheet_.is_protected = getBoolAttributeOr(attributes, "sheet", true);
    } else if (name == "dimension") {
        if (auto ref = findAttribute(attributes, "ref")) {
            if (auto range = parseRangeReference(*ref)) {
                sheet_.dimension = *range;
                growBounds(*range);
            } else {
                READER_WARN("Ignoring invalid dimension '{}'", *ref);
            }
        }
    } else if (name == "sheetView") {
        in_sheet_view_ = true;
    } else if (name == "pane" && in_sheet_view_) {
        handlePane(attributes);
    } else if (name == "sheetFormatPr") {
        if (auto width = findDoubleAttribute(attributes, "defaultColWidth")) {
            sheet_.default_col_width = *width;
        }
        if (auto height = findDoubleAttribute(attributes, "defaultRowHeight")) {
            sheet_.default_row_height = *height;
        }
    } else if (name == "col") {
        handleCols(attributes);
    } else if (name == "mergeCell") {
        handleMerge(attributes);
    } else if (name == "hyperlink") {
        handleHyperlink(attributes);
    } else if (name == "dataValidation") {
        core::DataValidation validation;
        validation.sqref = getAttributeOr(attributes, "sqref", "");
        validation.type = getAttributeOr(attributes, "type", "none");
        validation.op = getAttributeOr(attributes, "operator", "between");
        validation.allow_blank = getBoolAttributeOr(attributes, "allowBlank", false);
        sheet_.data_validations.push_back(std::move(validation));
        validation_ = &sheet_.data_validations.back();
    } else if (validation_ && (name == "formula1" || name == "formula2")) {
        startCollectingText();
    } else if (name == "autoFilter") {
        if (auto ref = findAttribute(attributes, "ref")) {
            sheet_.auto_filter_ref = std::string(*ref);
        }
    } else if (name == "drawing") {
        if (auto id = findAttributeLocal(attributes, "id")) {
            drawing_rel_ids_.emplace_back(*id);
        }
    } else if (name == "legacyDrawing") {
        if (auto id = findAttributeLocal(attributes, "id")) {
            legacy_drawing_rel_id_ = std::string(*id);
        }
    } else if (name == "conditionalFormatting") {
        if (!context_.options.parse_conditional_formats) {
            return;
        }
        if (isInElement("conditionalFormattings")) {
            ext_formats_.emplace_back();
            ext_cf_ = &ext_formats_.back();
        } else {
            core::ConditionalFormat cf;
            cf.sqref = getAttributeOr(attributes, "sqref", "");
            cf.ranges = utils::CommonUtils::parseSqref(cf.sqref);
            if (cf.ranges.empty()) {
                READER_WARN("Conditional format without usable sqref '{}'", cf.sqref);
            }
            sheet_.conditional_formats.push_back(std::move(cf));
            cf_ = &sheet_.conditional_formats.back();
        }
    } else if (name == "cfRule" && (cf_ || ext_cf_)) {
        handleCfRule(attributes);
    } else if (name == "sqref" && ext_cf_) {
        startCollectingText();
    } else if (name == "sparklineGroup") {
        handleSparklineGroup(attributes);
    }
}

void WorksheetParser::onEndElement(std::string_view name, int /*depth*/) {
    if (cell_) {
        if (name == "v") {
            cell_->v = getCurrentText();
            stopCollectingText();
        } else if (name == "f" && getParentElement() == "c") {
            if (!getCurrentText().empty()) {
                cell_->formula = getCurrentText();
            }
            stopCollectingText();
        } else if (name == "t") {
            if (cell_->inline_text && !isInElement("rPh")) {
                cell_->inline_text->append(getCurrentText());
            }
            stopCollectingText();
        } else if (name == "is" && getParentElement() == "c") {
            // <is/> 的结束事件长度为 0，取开始标签的结尾
            const size_t end = std::max(currentTagEnd(), cell_->inline_open_end);
            cell_->inline_xml = documentSlice(cell_->inline_begin, end);
        } else if (name == "c") {
            finishCell();
        }
        return;
    }

    if (rule_) {
        if (name == "formula") {
            rule_->formulas.push_back(getCurrentText());
            stopCollectingText();
        } else if (name == "f") {
            // x14 规则中 <xm:f> 既可能是阈值也可能是规则公式
            if (cfvo_) {
                cfvo_->value = std::string(trim(getCurrentText()));
            } else {
                rule_->formulas.push_back(getCurrentText());
            }
            stopCollectingText();
        } else if (name == "id") {
            rule_->x14_id = std::string(trim(getCurrentText()));
            stopCollectingText();
        } else if (name == "cfvo") {
            cfvo_ = nullptr;
        } else if (name == "cfRule") {
            rule_ = nullptr;
            cfvo_ = nullptr;
        }
        return;
    }

    if (sparkline_group_) {
        if (sparkline_ && name == "f") {
            sparkline_->data_range = std::string(trim(getCurrentText()));
            stopCollectingText();
        } else if (sparkline_ && name == "sqref") {
            sparkline_->location = std::string(trim(getCurrentText()));
            stopCollectingText();
        } else if (name == "sparkline") {
            sparkline_ = nullptr;
        } else if (name == "sparklineGroup") {
            sparkline_group_ = nullptr;
            sparkline_ = nullptr;
        }
        return;
    }

    if (name == "sheetView") {
        in_sheet_view_ = false;
    } else if (validation_ && name == "formula1") {
        validation_->formula1 = getCurrentText();
        stopCollectingText();
    } else if (validation_ && name == "formula2") {
        validation_->formula2 = getCurrentText();
        stopCollectingText();
    } else if (name == "dataValidation") {
        validation_ = nullptr;
    } else if (name == "sqref" && ext_cf_) {
        ext_cf_->sqref = std::string(trim(getCurrentText()));
        stopCollectingText();
    } else if (name == "conditionalFormatting") {
        cf_ = nullptr;
        ext_cf_ = nullptr;
    }
}

core::VoidResult WorksheetParser::finishDocument(const std::string& part_path) {
    if (!saw_root_) {
        return core::makeError(core::ErrorCode::XmlParseError, "Missing <worksheet> root element", part_path);
    }
    mergeExtensionRules();
    READER_DEBUG("Parsed {}: {} cells, {}x{} bounds, {} merges, {} conditional formats",
                 part_path, cell_count_, sheet_.max_row, sheet_.max_col,
                 sheet_.merges.size(), sheet_.conditional_formats.size());
    return {};
}

// ==================== 行与单元格 ====================

void WorksheetParser::handleRow(const xml::XMLAttributes& attributes) {
    auto r = findUIntAttribute(attributes, "r");
    if (r && *r >= 1 && *r - 1 <= utils::CommonUtils::kMaxRow) {
        current_row_ = *r - 1;
    } else {
        if (r) {
            READER_WARN("Row number {} out of range, using next row", *r);
        }
        current_row_ = row_seen_ ? current_row_ + 1 : 0;
    }
    row_seen_ = true;
    last_col_.reset();

    if (auto ht = findDoubleAttribute(attributes, "ht")) {
        sheet_.row_heights[current_row_] = *ht;
    }
    const bool hidden = getBoolAttributeOr(attributes, "hidden", false);
    if (hidden) {
        sheet_.hidden_rows.push_back(current_row_);
    }
    if (auto level = parseOutlineLevel(attributes)) {
        sheet_.outline_level_row.push_back(core::OutlineLevel{
            current_row_, *level, getBoolAttributeOr(attributes, "collapsed", false), hidden});
    }

    std::vector<std::pair<std::string, std::string>> kept;
    for (const auto& attr : attributes) {
        if (attr.name == "r" || attr.name == "spans") continue;
        kept.emplace_back(std::string(attr.name), std::string(attr.value));
    }
    if (!kept.empty()) {
        sheet_.row_attributes[current_row_] = std::move(kept);
    }
}

void WorksheetParser::handleCell(const xml::XMLAttributes& attributes) {
    PendingCell pending;

    if (auto ref = findAttribute(attributes, "r")) {
        auto pos = parseCellReference(*ref);
        if (!pos) {
            fail(core::ErrorCode::InvalidReference, fmt::format("Invalid cell reference '{}'", *ref));
        }
        pending.row = pos->first;
        pending.col = pos->second;
    } else {
        pending.row = current_row_;
        pending.col = last_col_ ? *last_col_ + 1 : 0;
        if (pending.col > utils::CommonUtils::kMaxCol) {
            fail(core::ErrorCode::InvalidReference,
                 fmt::format("Cell position out of range in row {}", current_row_ + 1));
        }
    }
    last_col_ = pending.col;

    for (const auto& attr : attributes) {
        if (attr.name == "r") {
            continue;
        } else if (attr.name == "t") {
            pending.t = std::string(attr.value);
        } else if (attr.name == "s") {
            pending.s = findUIntAttribute(attributes, "s");
            if (!pending.s) {
                READER_WARN("Ignoring invalid style index '{}'", attr.value);
            }
        } else {
            pending.extra_attrs.emplace_back(std::string(attr.name), std::string(attr.value));
        }
    }

    cell_ = std::move(pending);
}

void WorksheetParser::finishCell() {
    PendingCell pending = std::move(*cell_);
    cell_.reset();

    core::Cell cell;
    cell.style_index = pending.s;
    const std::string& t = pending.t;

    if (t == "s") {
        const auto index = pending.v ? parseInt(trim(*pending.v)) : std::nullopt;
        const auto* table = context_.shared_strings;
        if (index && table && *index >= 0 && static_cast<size_t>(*index) < table->strings.size()) {
            const auto idx = static_cast<size_t>(*index);
            cell.type = core::CellType::String;
            cell.value = table->strings[idx];
            if (idx < table->runs.size()) {
                cell.rich_text = table->runs[idx];
            }
        } else if (pending.v) {
            READER_WARN("Shared string index '{}' out of range at {}", *pending.v,
                        utils::CommonUtils::cellReference(pending.row, pending.col));
        }
    } else if (t == "inlineStr") {
        if (pending.inline_text) {
            cell.type = core::CellType::String;
            cell.value = SharedStringsParser::decodeEscapes(*pending.inline_text);
        }
    } else if (t == "str") {
        cell.type = core::CellType::String;
        cell.value = pending.v.value_or(std::string());
    } else if (t == "b") {
        if (pending.v) {
            cell.type = core::CellType::Boolean;
            cell.value = parseBool(trim(*pending.v)) ? "TRUE" : "FALSE";
        }
    } else if (t == "e") {
        if (pending.v) {
            cell.type = core::CellType::Error;
            cell.value = *pending.v;
        }
    } else if (t == "d") {
        if (pending.v) {
            cell.value = *pending.v;
            if (auto serial = parseIsoDate(trim(*pending.v))) {
                cell.type = core::CellType::Number;
                cell.number = *serial;
            } else {
                READER_WARN("Unparseable ISO date '{}', keeping text", *pending.v);
                cell.type = core::CellType::String;
            }
        }
    } else {
        if (!t.empty() && t != "n") {
            READER_WARN("Unknown cell type '{}', treating as number", t);
        }
        if (pending.v) {
            cell.value = *pending.v;
            if (auto number = parseDouble(trim(*pending.v))) {
                cell.type = core::CellType::Number;
                cell.number = *number;
            } else {
                READER_WARN("Non-numeric value '{}' in numeric cell, keeping text", *pending.v);
                cell.type = core::CellType::String;
            }
        }
    }

    if (pending.has_formula) {
        cell.type = core::CellType::Formula;
        cell.formula = std::move(pending.formula);
    }

    core::CellSource source;
    source.t = std::move(pending.t);
    source.v = std::move(pending.v);
    source.f_attrs = std::move(pending.f_attrs);
    source.extra_attrs = std::move(pending.extra_attrs);
    if (pending.inline_xml && !pending.inline_xml->empty()) {
        source.inline_xml = std::move(pending.inline_xml);
    }
    cell.source = std::move(source);

    if (sheet_.findCell(pending.row, pending.col)) {
        READER_WARN("Duplicate cell {}, later definition wins",
                    utils::CommonUtils::cellReference(pending.row, pending.col));
    } else {
        ++cell_count_;
    }
    SHEETLENS_LOG_CELL_DEBUG("Cell {} type {}", utils::CommonUtils::cellReference(pending.row, pending.col),
                             core::toString(cell.type));
    sheet_.upsertCell(pending.row, pending.col, std::move(cell));
}

// ==================== 布局 ====================

void WorksheetParser::handleCols(const xml::XMLAttributes& attributes) {
    auto min = findUIntAttribute(attributes, "min");
    auto max = findUIntAttribute(attributes, "max");
    if (!min || !max || *min == 0 || *max < *min) {
        READER_WARN("Ignoring <col> with invalid min/max");
        return;
    }
    const uint32_t first = *min - 1;
    const uint32_t last = std::min(*max - 1, utils::CommonUtils::kMaxCol);
    auto width = findDoubleAttribute(attributes, "width");
    const bool hidden = getBoolAttributeOr(attributes, "hidden", false);
    const auto level = parseOutlineLevel(attributes);
    const bool collapsed = getBoolAttributeOr(attributes, "collapsed", false);

    for (uint32_t col = first; col <= last; ++col) {
        if (width) {
            sheet_.column_widths[col] = *width;
        }
        if (hidden) {
            sheet_.hidden_cols.push_back(col);
        }
        if (level) {
            sheet_.outline_level_col.push_back(core::OutlineLevel{col, *level, collapsed, hidden});
        }
    }
}

std::optional<uint8_t> WorksheetParser::parseOutlineLevel(const xml::XMLAttributes& attributes) const {
    auto level = findIntAttribute(attributes, "outlineLevel");
    if (!level || *level == 0) {
        return std::nullopt;
    }
    if (*level < 0 || *level > 7) {
        READER_WARN("Ignoring outline level {} outside 1-7", *level);
        return std::nullopt;
    }
    return static_cast<uint8_t>(*level);
}

void WorksheetParser::handlePane(const xml::XMLAttributes& attributes) {
    // 只取第一个视图
    if (pane_seen_) return;
    pane_seen_ = true;

    const std::string state = getAttributeOr(attributes, "state", "");
    if (state != "frozen" && state != "frozenSplit") {
        // 普通拆分窗格的 xSplit/ySplit 是 twips 位置，不是行列数
        return;
    }
    if (auto x = findDoubleAttribute(attributes, "xSplit")) {
        sheet_.frozen_cols = clampCount(*x);
    }
    if (auto y = findDoubleAttribute(attributes, "ySplit")) {
        sheet_.frozen_rows = clampCount(*y);
    }
}

void WorksheetParser::handleMerge(const xml::XMLAttributes& attributes) {
    auto ref = findAttribute(attributes, "ref");
    if (!ref) return;

    auto range = parseRangeReference(*ref);
    if (!range) {
        READER_WARN("Dropping merge with invalid range '{}'", *ref);
        return;
    }
    if (sheet_.dimension && !sheet_.dimension->contains(range->first_row, range->first_col)) {
        READER_WARN("Merge {} starts outside the declared dimension", *ref);
    } else if (sheet_.dimension && !sheet_.dimension->contains(range->last_row, range->last_col)) {
        READER_WARN("Merge {} extends beyond the declared dimension", *ref);
    }
    if (!sheet_.addMerge(*range)) {
        READER_WARN("Dropping merge {} overlapping an earlier merge", *ref);
    }
}

void WorksheetParser::handleHyperlink(const xml::XMLAttributes& attributes) {
    auto ref = findAttribute(attributes, "ref");
    if (!ref) return;

    auto range = parseRangeReference(*ref);
    if (!range) {
        READER_WARN("Dropping hyperlink with invalid ref '{}'", *ref);
        return;
    }

    core::Hyperlink link;
    link.ref = std::string(*ref);
    link.range = *range;
    if (auto id = findAttributeLocal(attributes, "id")) {
        const opc::Relationship* rel =
            context_.relationships ? context_.relationships->findById(std::string(*id)) : nullptr;
        if (rel) {
            link.target = rel->isExternal() ? rel->target : rel->resolved_path;
        } else {
            READER_WARN("Hyperlink {} refers to unknown relationship {}", *ref, *id);
        }
    }
    if (auto location = findAttribute(attributes, "location")) link.location = std::string(*location);
    if (auto display = findAttribute(attributes, "display")) link.display = std::string(*display);
    if (auto tooltip = findAttribute(attributes, "tooltip")) link.tooltip = std::string(*tooltip);

    sheet_.hyperlinks.push_back(std::move(link));
}

// ==================== 条件格式 ====================

void WorksheetParser::handleCfRule(const xml::XMLAttributes& attributes) {
    core::CfRule rule;
    rule.type_name = getAttributeOr(attributes, "type", "");
    rule.type = core::parseCfRuleType(rule.type_name);
    if (rule.type == core::CfRuleType::Unknown) {
        READER_WARN("Unknown conditional format rule type '{}'", rule.type_name);
    }
    if (auto priority = findIntAttribute(attributes, "priority")) {
        rule.priority = static_cast<int32_t>(*priority);
    }
    rule.stop_if_true = getBoolAttributeOr(attributes, "stopIfTrue", false);
    rule.dxf_id = findUIntAttribute(attributes, "dxfId");
    rule.op = getAttributeOr(attributes, "operator", "");
    rule.text = getAttributeOr(attributes, "text", "");
    rule.time_period = getAttributeOr(attributes, "timePeriod", "");
    if (auto rank = findUIntAttribute(attributes, "rank")) rule.rank = *rank;
    rule.percent = getBoolAttributeOr(attributes, "percent", false);
    rule.bottom = getBoolAttributeOr(attributes, "bottom", false);
    rule.above_average = getBoolAttributeOr(attributes, "aboveAverage", true);
    rule.equal_average = getBoolAttributeOr(attributes, "equalAverage", false);
    rule.std_dev = findUIntAttribute(attributes, "stdDev");
    if (ext_cf_) {
        rule.x14_id = getAttributeOr(attributes, "id", "");
    }

    auto& rules = cf_ ? cf_->rules : ext_cf_->rules;
    rules.push_back(std::move(rule));
    rule_ = &rules.back();
    cfvo_ = nullptr;
}

void WorksheetParser::handleCfChild(std::string_view name, const xml::XMLAttributes& attributes) {
    if (name == "formula" || name == "f" || name == "id") {
        startCollectingText();
        return;
    }

    if (name == "colorScale") {
        rule_->color_scale.emplace();
    } else if (name == "dataBar") {
        core::DataBar bar;
        if (auto min_length = findUIntAttribute(attributes, "minLength")) bar.min_length = *min_length;
        if (auto max_length = findUIntAttribute(attributes, "maxLength")) bar.max_length = *max_length;
        bar.show_value = getBoolAttributeOr(attributes, "showValue", true);
        bar.gradient = getBoolAttributeOr(attributes, "gradient", true);
        bar.axis_position = getAttributeOr(attributes, "axisPosition", "automatic");
        bar.direction = getAttributeOr(attributes, "direction", "context");
        rule_->data_bar = std::move(bar);
    } else if (name == "iconSet") {
        core::IconSet icons;
        icons.icon_set = getAttributeOr(attributes, "iconSet", "3TrafficLights1");
        icons.reverse = getBoolAttributeOr(attributes, "reverse", false);
        icons.show_value = getBoolAttributeOr(attributes, "showValue", true);
        icons.percent = getBoolAttributeOr(attributes, "percent", true);
        rule_->icon_set = std::move(icons);
    } else if (name == "cfvo") {
        core::Cfvo cfvo;
        cfvo.type = core::Cfvo::parseType(getAttributeOr(attributes, "type", "min"));
        cfvo.value = getAttributeOr(attributes, "val", "");
        cfvo.gte = getBoolAttributeOr(attributes, "gte", true);

        const auto parent = getParentElement();
        std::vector<core::Cfvo>* target = nullptr;
        if (parent == "colorScale" && rule_->color_scale) {
            target = &rule_->color_scale->cfvos;
        } else if (parent == "dataBar" && rule_->data_bar) {
            target = &rule_->data_bar->cfvos;
        } else if (parent == "iconSet" && rule_->icon_set) {
            target = &rule_->icon_set->cfvos;
        }
        if (target) {
            target->push_back(std::move(cfvo));
            cfvo_ = &target->back();
        }
    } else if (name == "color" || name == "fillColor") {
        core::Color color = parseColorAttributes(attributes).value_or(core::Color());
        const auto parent = getParentElement();
        if (parent == "colorScale" && rule_->color_scale) {
            rule_->color_scale->colors.push_back(color);
        } else if (parent == "dataBar" && rule_->data_bar) {
            rule_->data_bar->color = color;
        }
    } else if (rule_->data_bar) {
        // x14:dataBar 扩展颜色
        auto color = parseColorAttributes(attributes);
        if (name == "borderColor") {
            rule_->data_bar->border_color = color;
        } else if (name == "negativeFillColor") {
            rule_->data_bar->negative_fill_color = color;
        } else if (name == "negativeBorderColor") {
            rule_->data_bar->negative_border_color = color;
        } else if (name == "axisColor") {
            rule_->data_bar->axis_color = color;
        }
    }
}

void WorksheetParser::mergeExtensionRules() {
    for (auto& ext : ext_formats_) {
        std::vector<core::CfRule> unmatched;
        for (auto& ext_rule : ext.rules) {
            core::CfRule* base = nullptr;
            if (!ext_rule.x14_id.empty()) {
                for (auto& cf : sheet_.conditional_formats) {
                    for (auto& rule : cf.rules) {
                        if (rule.x14_id == ext_rule.x14_id) {
                            base = &rule;
                            break;
                        }
                    }
                    if (base) break;
                }
            }
            if (!base) {
                unmatched.push_back(std::move(ext_rule));
                continue;
            }

            if (ext_rule.data_bar) {
                if (!base->data_bar) {
                    base->data_bar = std::move(ext_rule.data_bar);
                } else {
                    auto& bar = *base->data_bar;
                    const auto& ext_bar = *ext_rule.data_bar;
                    bar.min_length = ext_bar.min_length;
                    bar.max_length = ext_bar.max_length;
                    bar.gradient = ext_bar.gradient;
                    bar.axis_position = ext_bar.axis_position;
                    bar.direction = ext_bar.direction;
                    if (ext_bar.negative_fill_color) bar.negative_fill_color = ext_bar.negative_fill_color;
                    if (ext_bar.negative_border_color) bar.negative_border_color = ext_bar.negative_border_color;
                    if (ext_bar.border_color) bar.border_color = ext_bar.border_color;
                    if (ext_bar.axis_color) bar.axis_color = ext_bar.axis_color;
                    if (!ext_bar.cfvos.empty()) bar.cfvos = ext_bar.cfvos;
                }
            }
            if (ext_rule.icon_set && !base->icon_set) {
                base->icon_set = std::move(ext_rule.icon_set);
            }
            SHEETLENS_LOG_CF_DEBUG("Merged x14 rule {} into base rule", base->x14_id);
        }

        if (!unmatched.empty()) {
            core::ConditionalFormat cf;
            cf.sqref = ext.sqref;
            cf.ranges = utils::CommonUtils::parseSqref(ext.sqref);
            cf.rules = std::move(unmatched);
            sheet_.conditional_formats.push_back(std::move(cf));
        }
    }
    ext_formats_.clear();
}

// ==================== 迷你图 ====================

void WorksheetParser::handleSparklineGroup(const xml::XMLAttributes& attributes) {
    core::SparklineGroup group;
    group.type = getAttributeOr(attributes, "type", "line");
    group.markers = getBoolAttributeOr(attributes, "markers", false);
    group.high_point = getBoolAttributeOr(attributes, "high", false);
    group.low_point = getBoolAttributeOr(attributes, "low", false);
    group.negative = getBoolAttributeOr(attributes, "negative", false);
    group.line_weight = findDoubleAttribute(attributes, "lineWeight");
    sheet_.sparkline_groups.push_back(std::move(group));
    sparkline_group_ = &sheet_.sparkline_groups.back();
}

void WorksheetParser::handleSparklineColor(std::string_view name, const xml::XMLAttributes& attributes) {
    if (name == "colorSeries") {
        sparkline_group_->series_color = resolveColor(attributes);
    } else if (name == "colorNegative") {
        sparkline_group_->negative_color = resolveColor(attributes);
    } else if (name == "colorMarkers") {
        sparkline_group_->markers_color = resolveColor(attributes);
    }
}

// ==================== 工具 ====================

void WorksheetParser::growBounds(const core::CellRange& range) {
    sheet_.max_row = std::max(sheet_.max_row, range.last_row + 1);
    sheet_.max_col = std::max(sheet_.max_col, range.last_col + 1);
}

std::optional<uint32_t> WorksheetParser::resolveColor(const xml::XMLAttributes& attributes) const {
    auto color = parseColorAttributes(attributes);
    if (!color) return std::nullopt;
    const auto& theme = context_.theme_colors ? *context_.theme_colors : core::defaultThemeColors();
    return color->resolve(theme, context_.indexed_palette);
}

std::optional<double> WorksheetParser::parseIsoDate(std::string_view text) const {
    // YYYY-MM-DD[THH:MM[:SS[.fff]]][Z]
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    auto year = parseInt(text.substr(0, 4));
    auto month = parseInt(text.substr(5, 2));
    auto day = parseInt(text.substr(8, 2));
    if (!year || !month || !day || *month < 1 || *month > 12 || *day < 1 || *day > 31) {
        return std::nullopt;
    }

    const auto system = context_.date1904 ? format::DateSystem::Excel1904 : format::DateSystem::Excel1900;
    double serial = format::dateToSerial(static_cast<int>(*year), static_cast<int>(*month),
                                         static_cast<int>(*day), system);

    std::string_view rest = text.substr(10);
    if (!rest.empty() && rest.back() == 'Z') {
        rest.remove_suffix(1);
    }
    if (!rest.empty()) {
        if (rest.size() < 6 || rest[0] != 'T' || rest[3] != ':') {
            return std::nullopt;
        }
        auto hour = parseInt(rest.substr(1, 2));
        auto minute = parseInt(rest.substr(4, 2));
        std::optional<double> second = 0.0;
        if (rest.size() > 6) {
            if (rest[6] != ':') return std::nullopt;
            second = parseDouble(rest.substr(7));
        }
        if (!hour || !minute || !second) {
            return std::nullopt;
        }
        serial += format::timeToFraction(static_cast<int>(*hour), static_cast<int>(*minute), *second);
    }
    return serial;
}

}} // namespace sheetlens::reader
