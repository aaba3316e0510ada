#include "sheetlens/reader/DrawingParser.hpp"

namespace sheetlens {
namespace reader {

void DrawingParser::onStartElement(std::string_view name, const xml::XMLAttributes& attributes, int /*depth*/) {
    if (name == "twoCellAnchor" || name == "oneCellAnchor") {
        core::Drawing drawing;
        drawing.anchor_type = std::string(name);
        drawings_.push_back(std::move(drawing));
        in_anchor_ = true;
        named_ = false;
        return;
    }
    if (!in_anchor_) {
        return;
    }

    auto& drawing = drawings_.back();
    if (name == "from") {
        point_ = &drawing.from;
    } else if (name == "to") {
        drawing.to.emplace();
        point_ = &*drawing.to;
    } else if (point_ && (name == "col" || name == "colOff" || name == "row" || name == "rowOff")) {
        startCollectingText();
    } else if (name == "ext" && getParentElement() == "oneCellAnchor") {
        if (auto cx = findIntAttribute(attributes, "cx")) drawing.ext_cx = *cx;
        if (auto cy = findIntAttribute(attributes, "cy")) drawing.ext_cy = *cy;
    } else if (name == "pic") {
        drawing.kind = core::Drawing::Kind::Picture;
    } else if (name == "graphicFrame") {
        drawing.kind = core::Drawing::Kind::Chart;
    } else if (name == "sp" || name == "cxnSp") {
        drawing.kind = core::Drawing::Kind::Shape;
    } else if (name == "cNvPr" && !named_) {
        drawing.name = getAttributeOr(attributes, "name", "");
        drawing.description = getAttributeOr(attributes, "descr", "");
        named_ = true;
    } else if (name == "blip") {
        if (auto embed = findAttributeLocal(attributes, "embed")) {
            resolveTarget(*embed);
        }
    } else if (name == "chart") {
        if (auto rid = findAttributeLocal(attributes, "id")) {
            resolveTarget(*rid);
        }
    }
}

void DrawingParser::onEndElement(std::string_view name, int /*depth*/) {
    if (name == "twoCellAnchor" || name == "oneCellAnchor") {
        in_anchor_ = false;
        point_ = nullptr;
        return;
    }
    if (name == "from" || name == "to") {
        point_ = nullptr;
        return;
    }
    if (!point_ || !state_.collecting_text) {
        return;
    }

    auto value = parseInt(getCurrentText());
    stopCollectingText();
    if (!value) {
        return;
    }
    if (name == "col") {
        point_->col = static_cast<uint32_t>(*value < 0 ? 0 : *value);
    } else if (name == "colOff") {
        point_->col_offset = *value;
    } else if (name == "row") {
        point_->row = static_cast<uint32_t>(*value < 0 ? 0 : *value);
    } else if (name == "rowOff") {
        point_->row_offset = *value;
    }
}

void DrawingParser::resolveTarget(std::string_view rel_id) {
    const auto* rel = relationships_.findById(rel_id);
    if (!rel) {
        READER_WARN("Drawing references unknown relationship {}", rel_id);
        return;
    }
    drawings_.back().target = rel->isExternal() ? rel->target : rel->resolved_path;
}

}} // namespace sheetlens::reader
