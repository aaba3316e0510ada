#include "sheetlens/reader/RelationshipsParser.hpp"

namespace sheetlens {
namespace reader {

void RelationshipsParser::onStartElement(std::string_view name, const xml::XMLAttributes& attributes, int /*depth*/) {
    if (name != "Relationship") {
        return;
    }

    auto id = findAttribute(attributes, "Id");
    auto target = findAttribute(attributes, "Target");
    if (!id || !target) {
        READER_WARN("Relationship without Id or Target in {}", source_part_);
        return;
    }

    opc::Relationship rel;
    rel.id = std::string(*id);
    rel.type = getAttributeOr(attributes, "Type", "");
    rel.target = std::string(*target);
    rel.target_mode = getAttributeOr(attributes, "TargetMode", "Internal");
    if (!rel.isExternal()) {
        rel.resolved_path = opc::resolveTarget(source_part_, rel.target);
    }
    relationships_.push_back(std::move(rel));
}

}} // namespace sheetlens::reader
