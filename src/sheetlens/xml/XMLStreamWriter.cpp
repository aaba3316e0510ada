#include "sheetlens/xml/XMLStreamWriter.hpp"
#include "sheetlens/core/Exception.hpp"
#include "sheetlens/utils/ModuleLoggers.hpp"

#include <fmt/format.h>

namespace sheetlens {
namespace xml {

void XMLEscapes::appendText(std::string& target, std::string_view text) {
    target.reserve(target.size() + text.size());
    for (char c : text) {
        switch (c) {
            case '&': target += "&amp;"; break;
            case '<': target += "&lt;"; break;
            case '>': target += "&gt;"; break;
            default:  target += c; break;
        }
    }
}

void XMLEscapes::appendAttribute(std::string& target, std::string_view value) {
    target.reserve(target.size() + value.size());
    for (char c : value) {
        switch (c) {
            case '&':  target += "&amp;"; break;
            case '<':  target += "&lt;"; break;
            case '>':  target += "&gt;"; break;
            case '"':  target += "&quot;"; break;
            case '\n': target += "&#xA;"; break;
            case '\r': target += "&#xD;"; break;
            case '\t': target += "&#x9;"; break;
            default:   target += c; break;
        }
    }
}

void XMLStreamWriter::startDocument() {
    buffer_ += "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n";
}

void XMLStreamWriter::endDocument() {
    while (!element_stack_.empty()) {
        endElement();
    }
}

void XMLStreamWriter::startElement(std::string_view name) {
    ensureElementClosed();
    buffer_ += '<';
    buffer_.append(name.data(), name.size());
    element_stack_.emplace_back(name);
    in_element_ = true;
}

void XMLStreamWriter::endElement() {
    if (element_stack_.empty()) {
        SHEETLENS_THROW("endElement without matching startElement", core::ErrorCode::InvalidArgument);
    }
    if (in_element_) {
        buffer_ += "/>";
        in_element_ = false;
    } else {
        buffer_ += "</";
        buffer_ += element_stack_.back();
        buffer_ += '>';
    }
    element_stack_.pop_back();
}

void XMLStreamWriter::writeEmptyElement(std::string_view name) {
    startElement(name);
    endElement();
}

void XMLStreamWriter::writeAttribute(std::string_view name, std::string_view value) {
    if (!in_element_) {
        SHEETLENS_THROW(fmt::format("Cannot write attribute {} outside of a start tag", name),
                        core::ErrorCode::InvalidArgument);
    }
    buffer_ += ' ';
    buffer_.append(name.data(), name.size());
    buffer_ += "=\"";
    XMLEscapes::appendAttribute(buffer_, value);
    buffer_ += '"';
}

void XMLStreamWriter::writeAttribute(std::string_view name, int64_t value) {
    writeAttribute(name, std::string_view(fmt::format("{}", value)));
}

void XMLStreamWriter::writeAttribute(std::string_view name, double value) {
    writeAttribute(name, std::string_view(fmt::format("{}", value)));
}

void XMLStreamWriter::writeText(std::string_view text) {
    ensureElementClosed();
    XMLEscapes::appendText(buffer_, text);
}

void XMLStreamWriter::writeText(double value) {
    ensureElementClosed();
    // 最短往返表示，整数不带小数点
    buffer_ += fmt::format("{}", value);
}

void XMLStreamWriter::writeRaw(std::string_view data) {
    ensureElementClosed();
    buffer_.append(data.data(), data.size());
}

std::string XMLStreamWriter::takeResult() {
    if (!element_stack_.empty()) {
        XML_WARN("XMLStreamWriter result taken with {} unclosed elements", element_stack_.size());
    }
    std::string result;
    result.swap(buffer_);
    element_stack_.clear();
    in_element_ = false;
    return result;
}

void XMLStreamWriter::ensureElementClosed() {
    if (in_element_) {
        buffer_ += '>';
        in_element_ = false;
    }
}

}} // namespace sheetlens::xml
