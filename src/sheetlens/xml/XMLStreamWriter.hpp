#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sheetlens {
namespace xml {

/**
 * @brief XML转义工具
 */
struct XMLEscapes {
    /// 文本节点：转义 & < >
    static void appendText(std::string& target, std::string_view text);
    /// 属性值：额外转义引号和换行
    static void appendAttribute(std::string& target, std::string_view value);

    static std::string escapeText(std::string_view text) {
        std::string result;
        appendText(result, text);
        return result;
    }

    static std::string escapeAttribute(std::string_view value) {
        std::string result;
        appendAttribute(result, value);
        return result;
    }
};

/**
 * @brief 内存XML流写入器
 *
 * 属性在 startElement 之后、写入内容之前追加；标签在首次写入内容时闭合，
 * 没有内容的元素以 "/>" 结尾。
 */
class XMLStreamWriter {
public:
    XMLStreamWriter() = default;

    XMLStreamWriter(const XMLStreamWriter&) = delete;
    XMLStreamWriter& operator=(const XMLStreamWriter&) = delete;

    /**
     * @brief 文档操作
     */
    void startDocument();
    void endDocument();

    /**
     * @brief 元素操作
     */
    void startElement(std::string_view name);
    void endElement();
    void writeEmptyElement(std::string_view name);

    /**
     * @brief 属性操作，必须紧跟在 startElement 之后
     */
    void writeAttribute(std::string_view name, std::string_view value);
    void writeAttribute(std::string_view name, const char* value) { writeAttribute(name, std::string_view(value)); }
    void writeAttribute(std::string_view name, const std::string& value) { writeAttribute(name, std::string_view(value)); }
    void writeAttribute(std::string_view name, int64_t value);
    void writeAttribute(std::string_view name, int value) { writeAttribute(name, static_cast<int64_t>(value)); }
    void writeAttribute(std::string_view name, uint32_t value) { writeAttribute(name, static_cast<int64_t>(value)); }
    void writeAttribute(std::string_view name, double value);

    /**
     * @brief 文本内容操作
     */
    void writeText(std::string_view text);
    void writeText(double value);
    void writeRaw(std::string_view data);

    size_t depth() const { return element_stack_.size(); }

    const std::string& str() const { return buffer_; }
    std::string takeResult();

private:
    void ensureElementClosed();

    std::string buffer_;
    std::vector<std::string> element_stack_;
    bool in_element_ = false;  // 开始标签尚未闭合
};

}} // namespace sheetlens::xml
