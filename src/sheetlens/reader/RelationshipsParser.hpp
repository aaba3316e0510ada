#pragma once

#include "sheetlens/opc/Relationships.hpp"
#include "sheetlens/reader/BaseSAXParser.hpp"
#include <string>
#include <vector>

namespace sheetlens {
namespace reader {

/**
 * @brief 关系文件解析器 (.rels)
 *
 * 每个 <Relationship> 的 Target 以 source_part 为基准解析为包内路径。
 */
class RelationshipsParser : public BaseSAXParser {
public:
    /**
     * @param source_part 拥有这些关系的部件路径，包根为空串
     */
    explicit RelationshipsParser(std::string source_part = "") : source_part_(std::move(source_part)) {}

    core::VoidResult parse(std::string_view xml_content, const std::string& rels_path = "") {
        relationships_.clear();
        return parseXML(xml_content, rels_path);
    }

    const std::vector<opc::Relationship>& getRelationships() const { return relationships_; }
    std::vector<opc::Relationship> takeRelationships() { return std::move(relationships_); }

protected:
    void onStartElement(std::string_view name, const xml::XMLAttributes& attributes, int depth) override;
    void onEndElement(std::string_view /*name*/, int /*depth*/) override {}

private:
    std::string source_part_;
    std::vector<opc::Relationship> relationships_;
};

}} // namespace sheetlens::reader
