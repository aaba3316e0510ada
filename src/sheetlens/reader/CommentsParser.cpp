#include "sheetlens/reader/CommentsParser.hpp"

namespace sheetlens {
namespace reader {

void CommentsParser::onStartElement(std::string_view name, const xml::XMLAttributes& attributes, int /*depth*/) {
    if (name == "author") {
        startCollectingText();
    } else if (name == "comment") {
        core::Comment comment;
        comment.ref = getAttributeOr(attributes, "ref", "");
        auto author_id = findUIntAttribute(attributes, "authorId");
        if (author_id && *author_id < authors_.size()) {
            comment.author = authors_[*author_id];
        }
        comments_.push_back(std::move(comment));
        text_.clear();
        in_comment_ = true;
    } else if (name == "rPh") {
        in_phonetic_ = true;
    } else if (name == "t" && in_comment_ && !in_phonetic_) {
        startCollectingText();
    }
}

void CommentsParser::onEndElement(std::string_view name, int /*depth*/) {
    if (name == "author") {
        authors_.push_back(getCurrentText());
        stopCollectingText();
    } else if (name == "t" && in_comment_ && !in_phonetic_) {
        text_ += getCurrentText();
        stopCollectingText();
    } else if (name == "rPh") {
        in_phonetic_ = false;
    } else if (name == "comment" && in_comment_) {
        comments_.back().text = text_;
        in_comment_ = false;
    }
}

}} // namespace sheetlens::reader
