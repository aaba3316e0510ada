#include "sheetlens/reader/StylesParser.hpp"

namespace sheetlens {
namespace reader {

void StylesParser::onStartElement(std::string_view name, const xml::XMLAttributes& attributes, int /*depth*/) {
    if (name == "styleSheet") {
        saw_root_ = true;
        return;
    }

    // 区域切换
    if (name == "numFmts")           { region_ = Region::NumFmts; return; }
    if (name == "fonts")             { region_ = Region::Fonts; return; }
    if (name == "fills")             { region_ = Region::Fills; return; }
    if (name == "borders")           { region_ = Region::Borders; return; }
    if (name == "cellStyleXfs")      { region_ = Region::CellStyleXfs; return; }
    if (name == "cellXfs")           { region_ = Region::CellXfs; return; }
    if (name == "cellStyles")        { region_ = Region::CellStyles; return; }
    if (name == "dxfs")              { region_ = Region::Dxfs; return; }
    if (name == "indexedColors")     { region_ = Region::IndexedColors; return; }

    if (name == "numFmt") {
        auto id = findUIntAttribute(attributes, "numFmtId");
        auto code = findAttribute(attributes, "formatCode");
        if (dxf_) {
            dxf_->num_fmt_id = id;
            if (code) dxf_->num_fmt_code = std::string(*code);
        } else if (region_ == Region::NumFmts && id && code) {
            sheet_.num_fmts[*id] = std::string(*code);
        }
        return;
    }

    if (name == "font") {
        if (dxf_) {
            dxf_->font.emplace();
            font_ = &*dxf_->font;
        } else if (region_ == Region::Fonts) {
            sheet_.fonts.emplace_back();
            font_ = &sheet_.fonts.back();
        }
        return;
    }
    if (name == "fill") {
        if (dxf_) {
            dxf_->fill.emplace();
            fill_ = &*dxf_->fill;
        } else if (region_ == Region::Fills) {
            sheet_.fills.emplace_back();
            fill_ = &sheet_.fills.back();
        }
        return;
    }
    if (name == "border") {
        if (dxf_) {
            dxf_->border.emplace();
            border_ = &*dxf_->border;
        } else if (region_ == Region::Borders) {
            sheet_.borders.emplace_back();
            border_ = &sheet_.borders.back();
        }
        if (border_) {
            border_->diagonal_up = findBoolAttribute(attributes, "diagonalUp");
            border_->diagonal_down = findBoolAttribute(attributes, "diagonalDown");
        }
        return;
    }
    if (name == "dxf" && region_ == Region::Dxfs) {
        sheet_.dxfs.emplace_back();
        dxf_ = &sheet_.dxfs.back();
        return;
    }
    if (name == "xf" && (region_ == Region::CellXfs || region_ == Region::CellStyleXfs)) {
        handleXf(attributes);
        return;
    }
    if (name == "cellStyle" && region_ == Region::CellStyles) {
        style::RawCellStyle cell_style;
        cell_style.name = getAttributeOr(attributes, "name", "");
        cell_style.xf_id = findUIntAttribute(attributes, "xfId").value_or(0);
        cell_style.builtin_id = findUIntAttribute(attributes, "builtinId");
        sheet_.cell_styles.push_back(std::move(cell_style));
        return;
    }
    if (name == "rgbColor" && region_ == Region::IndexedColors) {
        auto rgb = findAttribute(attributes, "rgb");
        auto color = rgb ? core::Color::fromHex(*rgb) : std::nullopt;
        sheet_.indexed_colors.push_back(color ? color->getValue() : 0x000000);
        return;
    }

    if (xf_) {
        handleXfChild(name, attributes);
    } else if (border_) {
        handleBorderChild(name, attributes);
    } else if (fill_) {
        handleFillChild(name, attributes);
    } else if (font_) {
        handleFontChild(name, attributes);
    }
}

void StylesParser::onEndElement(std::string_view name, int /*depth*/) {
    if (name == "font") {
        font_ = nullptr;
    } else if (name == "fill") {
        fill_ = nullptr;
    } else if (name == "border") {
        border_ = nullptr;
        side_ = nullptr;
    } else if (name == "xf") {
        xf_ = nullptr;
    } else if (name == "dxf") {
        dxf_ = nullptr;
    } else if (name == "stop") {
        in_gradient_stop_ = false;
    } else if (side_ && (name == "left" || name == "right" || name == "top" || name == "bottom" ||
                         name == "diagonal" || name == "start" || name == "end")) {
        side_ = nullptr;
    } else if (name == "numFmts" || name == "fonts" || name == "fills" || name == "borders" ||
               name == "cellStyleXfs" || name == "cellXfs" || name == "cellStyles" || name == "dxfs" ||
               name == "indexedColors") {
        region_ = Region::None;
    }
}

core::VoidResult StylesParser::finishDocument(const std::string& part_path) {
    if (!saw_root_) {
        return core::makeError(core::ErrorCode::XmlParseError, "Missing <styleSheet> root element", part_path);
    }
    READER_DEBUG("Styles: {} numFmts, {} fonts, {} fills, {} borders, {} cellStyleXfs, {} cellXfs, {} dxfs",
                 sheet_.num_fmts.size(), sheet_.fonts.size(), sheet_.fills.size(), sheet_.borders.size(),
                 sheet_.cell_style_xfs.size(), sheet_.cell_xfs.size(), sheet_.dxfs.size());
    return {};
}

void StylesParser::handleFontChild(std::string_view name, const xml::XMLAttributes& attributes) {
    if (name == "b") {
        font_->bold = getBoolAttributeOr(attributes, "val", true);
    } else if (name == "i") {
        font_->italic = getBoolAttributeOr(attributes, "val", true);
    } else if (name == "strike") {
        font_->strike = getBoolAttributeOr(attributes, "val", true);
    } else if (name == "u") {
        font_->underline = core::parseUnderline(findAttribute(attributes, "val").value_or(""));
    } else if (name == "vertAlign") {
        if (auto val = findAttribute(attributes, "val")) {
            font_->vert_align = core::parseVertAlign(*val);
        }
    } else if (name == "sz") {
        font_->size = findDoubleAttribute(attributes, "val");
    } else if (name == "name" || name == "rFont") {
        if (auto val = findAttribute(attributes, "val")) {
            font_->name = std::string(*val);
        }
    } else if (name == "family") {
        if (auto val = findIntAttribute(attributes, "val")) {
            font_->family = static_cast<int>(*val);
        }
    } else if (name == "scheme") {
        if (auto val = findAttribute(attributes, "val")) {
            font_->scheme = std::string(*val);
        }
    } else if (name == "color") {
        font_->color = parseColorAttributes(attributes);
    }
}

void StylesParser::handleFillChild(std::string_view name, const xml::XMLAttributes& attributes) {
    if (name == "patternFill") {
        if (auto type = findAttribute(attributes, "patternType")) {
            fill_->pattern = core::parsePatternType(*type);
        }
    } else if (name == "fgColor") {
        fill_->fg_color = parseColorAttributes(attributes);
    } else if (name == "bgColor") {
        fill_->bg_color = parseColorAttributes(attributes);
    } else if (name == "gradientFill") {
        fill_->is_gradient = true;
        fill_->gradient_type = getAttributeOr(attributes, "type", "linear");
        fill_->degree = findDoubleAttribute(attributes, "degree").value_or(0.0);
        fill_->left = findDoubleAttribute(attributes, "left").value_or(0.0);
        fill_->right = findDoubleAttribute(attributes, "right").value_or(0.0);
        fill_->top = findDoubleAttribute(attributes, "top").value_or(0.0);
        fill_->bottom = findDoubleAttribute(attributes, "bottom").value_or(0.0);
    } else if (name == "stop") {
        style::RawGradientStop stop;
        stop.position = findDoubleAttribute(attributes, "position").value_or(0.0);
        fill_->stops.push_back(stop);
        in_gradient_stop_ = true;
    } else if (name == "color" && in_gradient_stop_ && !fill_->stops.empty()) {
        if (auto color = parseColorAttributes(attributes)) {
            fill_->stops.back().color = *color;
        }
    }
}

style::RawBorderSide* StylesParser::borderSide(std::string_view name) {
    std::optional<style::RawBorderSide>* slot = nullptr;
    if (name == "left" || name == "start") {
        slot = &border_->left;
    } else if (name == "right" || name == "end") {
        slot = &border_->right;
    } else if (name == "top") {
        slot = &border_->top;
    } else if (name == "bottom") {
        slot = &border_->bottom;
    } else if (name == "diagonal") {
        slot = &border_->diagonal;
    }
    if (!slot) {
        return nullptr;
    }
    slot->emplace();
    return &**slot;
}

void StylesParser::handleBorderChild(std::string_view name, const xml::XMLAttributes& attributes) {
    if (name == "color") {
        if (side_) {
            side_->color = parseColorAttributes(attributes);
        }
        return;
    }
    side_ = borderSide(name);
    if (side_) {
        if (auto style = findAttribute(attributes, "style")) {
            side_->style = core::parseBorderStyle(*style);
        }
    }
}

void StylesParser::handleXf(const xml::XMLAttributes& attributes) {
    auto& list = region_ == Region::CellXfs ? sheet_.cell_xfs : sheet_.cell_style_xfs;
    list.emplace_back();
    xf_ = &list.back();

    xf_->num_fmt_id = findUIntAttribute(attributes, "numFmtId");
    xf_->font_id = findUIntAttribute(attributes, "fontId");
    xf_->fill_id = findUIntAttribute(attributes, "fillId");
    xf_->border_id = findUIntAttribute(attributes, "borderId");
    xf_->xf_id = findUIntAttribute(attributes, "xfId");
    xf_->apply_number_format = findBoolAttribute(attributes, "applyNumberFormat");
    xf_->apply_font = findBoolAttribute(attributes, "applyFont");
    xf_->apply_fill = findBoolAttribute(attributes, "applyFill");
    xf_->apply_border = findBoolAttribute(attributes, "applyBorder");
    xf_->apply_alignment = findBoolAttribute(attributes, "applyAlignment");
    xf_->apply_protection = findBoolAttribute(attributes, "applyProtection");
    xf_->quote_prefix = getBoolAttributeOr(attributes, "quotePrefix", false);
}

void StylesParser::handleXfChild(std::string_view name, const xml::XMLAttributes& attributes) {
    if (name == "alignment") {
        style::RawAlignment alignment;
        if (auto h = findAttribute(attributes, "horizontal")) {
            alignment.horizontal = core::parseHorizontalAlign(*h);
        }
        if (auto v = findAttribute(attributes, "vertical")) {
            alignment.vertical = core::parseVerticalAlign(*v);
        }
        alignment.wrap_text = findBoolAttribute(attributes, "wrapText");
        alignment.shrink_to_fit = findBoolAttribute(attributes, "shrinkToFit");
        alignment.indent = findUIntAttribute(attributes, "indent");
        if (auto rotation = findIntAttribute(attributes, "textRotation")) {
            alignment.text_rotation = static_cast<int32_t>(*rotation);
        }
        if (auto order = findUIntAttribute(attributes, "readingOrder")) {
            alignment.reading_order = static_cast<uint8_t>(*order > 2 ? 0 : *order);
        }
        xf_->alignment = alignment;
    } else if (name == "protection") {
        style::RawProtection protection;
        protection.locked = findBoolAttribute(attributes, "locked");
        protection.hidden = findBoolAttribute(attributes, "hidden");
        xf_->protection = protection;
    }
}

}} // namespace sheetlens::reader
