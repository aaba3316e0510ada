#pragma once

#include "sheetlens/core/Workbook.hpp"
#include "sheetlens/reader/BaseSAXParser.hpp"
#include <string>
#include <vector>

namespace sheetlens {
namespace reader {

/**
 * @brief 批注部件解析器 (commentsN.xml)
 */
class CommentsParser : public BaseSAXParser {
public:
    core::VoidResult parse(std::string_view xml_content, const std::string& part_path) {
        authors_.clear();
        comments_.clear();
        return parseXML(xml_content, part_path);
    }

    const std::vector<core::Comment>& getComments() const { return comments_; }

protected:
    void onStartElement(std::string_view name, const xml::XMLAttributes& attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;

private:
    std::vector<std::string> authors_;
    std::vector<core::Comment> comments_;
    std::string text_;
    bool in_comment_ = false;
    bool in_phonetic_ = false;
};

}} // namespace sheetlens::reader
