#include "sheetlens/xml/XMLStreamReader.hpp"
#include "sheetlens/utils/ModuleLoggers.hpp"

#include <climits>
#include <cstring>
#include <stack>
#include <fmt/format.h>

namespace sheetlens {
namespace xml {

XMLStreamReader::XMLStreamReader() {
    attribute_pool_.reserve(32);
    current_text_.reserve(256);
}

XMLStreamReader::~XMLStreamReader() {
    cleanupParser();
}

void XMLStreamReader::setStartElementCallback(StartElementCallback callback) {
    start_element_callback_ = std::move(callback);
}

void XMLStreamReader::setEndElementCallback(EndElementCallback callback) {
    end_element_callback_ = std::move(callback);
}

void XMLStreamReader::setTextCallback(TextCallback callback) {
    text_callback_ = std::move(callback);
}

bool XMLStreamReader::initializeParser() {
    cleanupParser();

    parser_ = XML_ParserCreate("UTF-8");
    if (!parser_) {
        handleError(XMLParseError::ParserCreateFailed, "Failed to create XML parser");
        return false;
    }

    XML_SetUserData(parser_, this);
    XML_SetElementHandler(parser_, startElementHandler, endElementHandler);
    XML_SetCharacterDataHandler(parser_, characterDataHandler);
    return true;
}

void XMLStreamReader::cleanupParser() {
    if (parser_) {
        XML_ParserFree(parser_);
        parser_ = nullptr;
    }
}

void XMLStreamReader::resetState() {
    current_depth_ = 0;
    last_error_ = XMLParseError::Ok;
    last_error_message_.clear();
    error_line_ = 0;
    error_column_ = 0;
    callback_failed_ = false;
    attribute_pool_.clear();
    current_text_.clear();
    elements_parsed_ = 0;
}

XMLParseError XMLStreamReader::parseFromString(std::string_view xml_content) {
    return parseFromBuffer(xml_content.data(), xml_content.size());
}

XMLParseError XMLStreamReader::parseFromBuffer(const char* buffer, size_t size) {
    resetState();

    if (!buffer || size == 0) {
        handleError(XMLParseError::InvalidInput, "Empty XML document");
        return last_error_;
    }
    if (size > static_cast<size_t>(INT_MAX)) {
        handleError(XMLParseError::InvalidInput, fmt::format("XML document too large: {} bytes", size));
        return last_error_;
    }
    if (!initializeParser()) {
        return last_error_;
    }

    void* expat_buffer = XML_GetBuffer(parser_, static_cast<int>(size));
    if (!expat_buffer) {
        handleError(XMLParseError::MemoryError, "Failed to get Expat buffer");
        cleanupParser();
        return last_error_;
    }
    std::memcpy(expat_buffer, buffer, size);

    if (XML_ParseBuffer(parser_, static_cast<int>(size), 1) == XML_STATUS_ERROR) {
        if (!callback_failed_) {
            error_line_ = static_cast<int>(XML_GetCurrentLineNumber(parser_));
            error_column_ = static_cast<int>(XML_GetCurrentColumnNumber(parser_));
            handleError(XMLParseError::ParseFailed,
                        fmt::format("Parse error at line {}, column {}: {}", error_line_, error_column_,
                                    XML_ErrorString(XML_GetErrorCode(parser_))));
        }
        cleanupParser();
        return last_error_;
    }

    cleanupParser();
    XML_DEBUG("Parsed {} bytes, {} elements", size, elements_parsed_);
    return XMLParseError::Ok;
}

int64_t XMLStreamReader::getCurrentByteIndex() const {
    return parser_ ? static_cast<int64_t>(XML_GetCurrentByteIndex(parser_)) : -1;
}

int XMLStreamReader::getCurrentByteCount() const {
    return parser_ ? XML_GetCurrentByteCount(parser_) : 0;
}

std::string XMLStreamReader::getParserVersion() const {
    return XML_ExpatVersion();
}

void XMLCALL XMLStreamReader::startElementHandler(void* user_data, const XML_Char* name, const XML_Char** attrs) {
    auto* reader = static_cast<XMLStreamReader*>(user_data);
    if (reader->callback_failed_) {
        return;
    }

    std::string_view element_name{name, std::strlen(name)};
    reader->elements_parsed_++;
    reader->collectAttributes(attrs);

    if (reader->start_element_callback_) {
        try {
            reader->start_element_callback_(element_name, reader->attribute_pool_, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->abortWithCallbackError("start element", e);
            return;
        }
    }

    reader->current_depth_++;
    reader->current_text_.clear();
}

void XMLCALL XMLStreamReader::endElementHandler(void* user_data, const XML_Char* name) {
    auto* reader = static_cast<XMLStreamReader*>(user_data);
    if (reader->callback_failed_) {
        return;
    }

    reader->current_depth_--;
    std::string_view element_name{name, std::strlen(name)};

    if (!reader->current_text_.empty() && reader->text_callback_) {
        std::string_view text_content{reader->current_text_};
        if (reader->trim_whitespace_) {
            size_t start = text_content.find_first_not_of(" \t\n\r");
            if (start == std::string_view::npos) {
                text_content = std::string_view{};
            } else {
                size_t end = text_content.find_last_not_of(" \t\n\r");
                text_content = text_content.substr(start, end - start + 1);
            }
        }
        if (!text_content.empty()) {
            try {
                reader->text_callback_(text_content, reader->current_depth_);
            } catch (const std::exception& e) {
                reader->abortWithCallbackError("text", e);
                return;
            }
        }
    }

    if (reader->end_element_callback_) {
        try {
            reader->end_element_callback_(element_name, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->abortWithCallbackError("end element", e);
            return;
        }
    }

    reader->current_text_.clear();
}

void XMLCALL XMLStreamReader::characterDataHandler(void* user_data, const XML_Char* data, int len) {
    auto* reader = static_cast<XMLStreamReader*>(user_data);
    if (len > 0 && !reader->callback_failed_) {
        reader->current_text_.append(data, static_cast<size_t>(len));
    }
}

void XMLStreamReader::collectAttributes(const XML_Char** attrs) {
    attribute_pool_.clear();
    if (!attrs) {
        return;
    }
    for (int i = 0; attrs[i]; i += 2) {
        if (attrs[i + 1]) {
            attribute_pool_.emplace_back(std::string_view{attrs[i], std::strlen(attrs[i])},
                                         std::string_view{attrs[i + 1], std::strlen(attrs[i + 1])});
        }
    }
}

void XMLStreamReader::abortWithCallbackError(const char* where, const std::exception& e) {
    callback_failed_ = true;
    error_line_ = static_cast<int>(XML_GetCurrentLineNumber(parser_));
    error_column_ = static_cast<int>(XML_GetCurrentColumnNumber(parser_));
    handleError(XMLParseError::CallbackError,
                fmt::format("Error in {} callback at line {}, column {}: {}", where, error_line_, error_column_,
                            e.what()));
    XML_StopParser(parser_, XML_FALSE);
}

void XMLStreamReader::handleError(XMLParseError error, const std::string& message) {
    last_error_ = error;
    last_error_message_ = message;
    XML_DEBUG("XML parse error: {}", message);
}

// SimpleElement 实现
XMLStreamReader::SimpleElement* XMLStreamReader::SimpleElement::findChild(std::string_view local_name) const {
    for (const auto& child : children) {
        if (child->localName() == local_name) {
            return child.get();
        }
    }
    return nullptr;
}

std::vector<XMLStreamReader::SimpleElement*> XMLStreamReader::SimpleElement::findChildren(std::string_view local_name) const {
    std::vector<SimpleElement*> result;
    for (const auto& child : children) {
        if (child->localName() == local_name) {
            result.push_back(child.get());
        }
    }
    return result;
}

XMLStreamReader::SimpleElement* XMLStreamReader::SimpleElement::findChildByPath(std::string_view path) const {
    if (path.empty()) return nullptr;

    size_t pos = path.find('/');
    if (pos == std::string_view::npos) {
        return findChild(path);
    }

    SimpleElement* child = findChild(path.substr(0, pos));
    return child ? child->findChildByPath(path.substr(pos + 1)) : nullptr;
}

std::string XMLStreamReader::SimpleElement::getAttribute(const std::string& attr_name, const std::string& default_value) const {
    auto it = attributes.find(attr_name);
    return it != attributes.end() ? it->second : default_value;
}

bool XMLStreamReader::SimpleElement::hasAttribute(const std::string& attr_name) const {
    return attributes.find(attr_name) != attributes.end();
}

std::unique_ptr<XMLStreamReader::SimpleElement> XMLStreamReader::parseToDOM(std::string_view xml_content) {
    std::unique_ptr<SimpleElement> root;
    std::stack<SimpleElement*> element_stack;

    setStartElementCallback([&](std::string_view element_name, const XMLAttributes& attributes, int /*depth*/) {
        auto element = std::make_unique<SimpleElement>(std::string(element_name));
        for (const auto& attr : attributes) {
            element->attributes[std::string(attr.name)] = std::string(attr.value);
        }

        SimpleElement* element_ptr = element.get();
        if (element_stack.empty()) {
            root = std::move(element);
        } else {
            element_ptr->parent = element_stack.top();
            element_stack.top()->children.push_back(std::move(element));
        }
        element_stack.push(element_ptr);
    });

    setEndElementCallback([&](std::string_view /*element_name*/, int /*depth*/) {
        if (!element_stack.empty()) {
            element_stack.pop();
        }
    });

    setTextCallback([&](std::string_view text, int /*depth*/) {
        if (!element_stack.empty()) {
            element_stack.top()->text.append(text.data(), text.size());
        }
    });

    XMLParseError result = parseFromString(xml_content);

    start_element_callback_ = nullptr;
    end_element_callback_ = nullptr;
    text_callback_ = nullptr;

    if (result != XMLParseError::Ok) {
        XML_WARN("Failed to parse XML to DOM: {}", last_error_message_);
        return nullptr;
    }
    return root;
}

}} // namespace sheetlens::xml
