#pragma once

#include <expat.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sheetlens {
namespace xml {

/**
 * @brief 流式XML解析器，基于libexpat
 *
 * - SAX 事件回调，整段内存缓冲区一次送入解析器
 * - 元素名保留命名空间前缀（解析器不做命名空间展开），用 localName() 去掉前缀
 * - 回调抛出的异常会中止解析并作为 CallbackError 返回
 */

// 解析错误枚举
enum class XMLParseError {
    Ok,                    // 解析成功
    InvalidInput,          // 无效输入
    ParserCreateFailed,    // 解析器创建失败
    ParseFailed,           // 文档格式错误
    MemoryError,           // 内存错误
    CallbackError          // 回调函数错误
};

constexpr bool operator!(XMLParseError error) noexcept {
    return error != XMLParseError::Ok;
}

constexpr bool isSuccess(XMLParseError error) noexcept {
    return error == XMLParseError::Ok;
}

// XML属性（指向 expat 内部缓冲区，仅在回调期间有效）
struct XMLAttribute {
    std::string_view name;
    std::string_view value;

    XMLAttribute(std::string_view n, std::string_view v) : name(n), value(v) {}
};

using XMLAttributes = std::vector<XMLAttribute>;

/**
 * @brief 去掉命名空间前缀，"x14:cfRule" -> "cfRule"
 */
inline std::string_view localName(std::string_view name) {
    size_t pos = name.find(':');
    return pos == std::string_view::npos ? name : name.substr(pos + 1);
}

/**
 * @brief 按名称查找属性，名称需与文档中的写法完全一致（含前缀）
 */
inline std::optional<std::string_view> findAttribute(const XMLAttributes& attributes, std::string_view name) {
    for (const auto& attr : attributes) {
        if (attr.name == name) {
            return attr.value;
        }
    }
    return std::nullopt;
}

class XMLStreamReader {
public:
    // 事件回调函数类型定义
    using StartElementCallback = std::function<void(std::string_view name, const XMLAttributes& attributes, int depth)>;
    using EndElementCallback = std::function<void(std::string_view name, int depth)>;
    using TextCallback = std::function<void(std::string_view text, int depth)>;

    XMLStreamReader();
    ~XMLStreamReader();

    XMLStreamReader(const XMLStreamReader&) = delete;
    XMLStreamReader& operator=(const XMLStreamReader&) = delete;

    void setStartElementCallback(StartElementCallback callback);
    void setEndElementCallback(EndElementCallback callback);
    void setTextCallback(TextCallback callback);

    /**
     * @brief 是否去掉文本首尾空白，默认 false
     *
     * 共享字符串中 xml:space="preserve" 的文本必须原样保留。
     */
    void setTrimWhitespace(bool trim) { trim_whitespace_ = trim; }

    XMLParseError parseFromString(std::string_view xml_content);
    XMLParseError parseFromBuffer(const char* buffer, size_t size);

    XMLParseError getLastError() const { return last_error_; }
    const std::string& getLastErrorMessage() const { return last_error_message_; }
    int getErrorLine() const { return error_line_; }
    int getErrorColumn() const { return error_column_; }
    size_t getElementsParsed() const { return elements_parsed_; }

    /**
     * @brief 当前事件在文档中的字节位置与长度
     *
     * 只在元素回调内有效，用于截取元素的原始文本。
     * 空元素 <a/> 的结束事件长度为 0。
     */
    int64_t getCurrentByteIndex() const;
    int getCurrentByteCount() const;

    std::string getParserVersion() const;

    /**
     * @brief 简单DOM节点，适合主题等小文档
     */
    struct SimpleElement {
        std::string name;
        std::unordered_map<std::string, std::string> attributes;
        std::string text;
        std::vector<std::unique_ptr<SimpleElement>> children;
        SimpleElement* parent = nullptr;

        explicit SimpleElement(const std::string& n) : name(n) {}

        // 按本地名查找，忽略命名空间前缀
        SimpleElement* findChild(std::string_view local_name) const;
        std::vector<SimpleElement*> findChildren(std::string_view local_name) const;
        SimpleElement* findChildByPath(std::string_view path) const;  // "child/grandchild"

        std::string getAttribute(const std::string& attr_name, const std::string& default_value = "") const;
        bool hasAttribute(const std::string& attr_name) const;

        std::string_view localName() const { return xml::localName(name); }
    };

    /**
     * @brief 将整个文档解析为树结构，失败返回 nullptr
     */
    std::unique_ptr<SimpleElement> parseToDOM(std::string_view xml_content);

private:
    // libexpat回调函数（静态）
    static void XMLCALL startElementHandler(void* user_data, const XML_Char* name, const XML_Char** attrs);
    static void XMLCALL endElementHandler(void* user_data, const XML_Char* name);
    static void XMLCALL characterDataHandler(void* user_data, const XML_Char* data, int len);

    bool initializeParser();
    void cleanupParser();
    void resetState();
    void collectAttributes(const XML_Char** attrs);
    void abortWithCallbackError(const char* where, const std::exception& e);
    void handleError(XMLParseError error, const std::string& message);

    XML_Parser parser_ = nullptr;

    int current_depth_ = 0;
    XMLParseError last_error_ = XMLParseError::Ok;
    std::string last_error_message_;
    int error_line_ = 0;
    int error_column_ = 0;
    bool callback_failed_ = false;

    // 属性缓存（每个开始标签重新填充）
    XMLAttributes attribute_pool_;

    // 当前元素的文本累积
    std::string current_text_;

    StartElementCallback start_element_callback_;
    EndElementCallback end_element_callback_;
    TextCallback text_callback_;

    bool trim_whitespace_ = false;
    size_t elements_parsed_ = 0;
};

}} // namespace sheetlens::xml
