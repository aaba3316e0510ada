#pragma once

#include "sheetlens/core/Color.hpp"
#include "sheetlens/core/ErrorCode.hpp"
#include "sheetlens/core/Expected.hpp"
#include "sheetlens/utils/CommonUtils.hpp"
#include "sheetlens/utils/ModuleLoggers.hpp"
#include "sheetlens/xml/XMLStreamReader.hpp"
#include <charconv>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <fast_float/fast_float.h>

namespace sheetlens {
namespace reader {

/**
 * @brief 通用SAX解析器基类
 *
 * - 基于 XMLStreamReader 的事件回调，子类只处理关心的元素
 * - 传给子类的元素名已去掉命名空间前缀
 * - 元素栈跟踪嵌套结构，用于判断当前上下文
 * - 子类通过 fail() 中止解析并带出具体错误码
 */
class BaseSAXParser {
protected:
    // 通用解析状态
    struct ParseState {
        std::vector<std::string> element_stack;   // 本地名
        int current_depth = 0;
        std::string current_text;
        bool collecting_text = false;
        core::Error error;

        void reset() {
            element_stack.clear();
            current_depth = 0;
            current_text.clear();
            collecting_text = false;
            error = core::Error();
        }

        std::string_view getCurrentElement() const {
            return element_stack.empty() ? std::string_view{} : std::string_view{element_stack.back()};
        }

        bool isInElement(std::string_view element_name) const {
            for (auto it = element_stack.rbegin(); it != element_stack.rend(); ++it) {
                if (*it == element_name) return true;
            }
            return false;
        }

        // 当前元素的父元素
        std::string_view getParentElement() const {
            return element_stack.size() < 2 ? std::string_view{}
                                            : std::string_view{element_stack[element_stack.size() - 2]};
        }
    };

    ParseState state_;

private:
    // 只在 parseXML 期间有效
    const xml::XMLStreamReader* reader_ = nullptr;
    std::string_view document_;

public:
    BaseSAXParser() = default;
    virtual ~BaseSAXParser() = default;

    BaseSAXParser(const BaseSAXParser&) = delete;
    BaseSAXParser& operator=(const BaseSAXParser&) = delete;

    /**
     * @brief 解析XML内容的统一入口
     * @param xml_content XML字符串内容
     * @param part_path 部件路径，写入错误上下文
     * @return 文档格式错误返回 XmlParseError，子类中止时返回其错误码
     */
    core::VoidResult parseXML(std::string_view xml_content, const std::string& part_path = "") {
        state_.reset();

        if (xml_content.empty()) {
            return core::makeError(core::ErrorCode::XmlParseError, "Empty XML content", part_path);
        }

        xml::XMLStreamReader reader;
        reader.setStartElementCallback([this](std::string_view name, const xml::XMLAttributes& attributes, int depth) {
            handleStartElement(xml::localName(name), attributes, depth);
        });
        reader.setEndElementCallback([this](std::string_view name, int depth) {
            handleEndElement(xml::localName(name), depth);
        });
        reader.setTextCallback([this](std::string_view text, int depth) {
            handleText(text, depth);
        });

        reader_ = &reader;
        document_ = xml_content;
        auto result = reader.parseFromString(xml_content);
        reader_ = nullptr;
        document_ = std::string_view{};
        if (state_.error.isError()) {
            if (state_.error.context.empty()) {
                state_.error.context = part_path;
            }
            return state_.error;
        }
        if (result != xml::XMLParseError::Ok) {
            READER_ERROR("Failed to parse {}: {}", part_path, reader.getLastErrorMessage());
            return core::makeError(core::ErrorCode::XmlParseError, reader.getLastErrorMessage(), part_path);
        }

        return finishDocument(part_path);
    }

    bool hasError() const { return state_.error.isError(); }
    const core::Error& getError() const { return state_.error; }

protected:
    // 子类中止解析用的内部异常，由 parseXML 转换为错误码
    struct ParseAbort : std::runtime_error {
        ParseAbort() : std::runtime_error("parse aborted") {}
    };

    void handleStartElement(std::string_view name, const xml::XMLAttributes& attributes, int depth) {
        state_.element_stack.emplace_back(name);
        state_.current_depth = depth;
        onStartElement(name, attributes, depth);
    }

    void handleEndElement(std::string_view name, int depth) {
        state_.current_depth = depth;
        onEndElement(name, depth);
        if (!state_.element_stack.empty()) {
            state_.element_stack.pop_back();
        }
    }

    void handleText(std::string_view text, int depth) {
        if (state_.collecting_text) {
            state_.current_text.append(text.data(), text.size());
        }
        onText(text, depth);
    }

    // 子类重写的虚函数
    virtual void onStartElement(std::string_view name, const xml::XMLAttributes& attributes, int depth) = 0;
    virtual void onEndElement(std::string_view name, int depth) = 0;
    virtual void onText(std::string_view /*text*/, int /*depth*/) {}

    /**
     * @brief 文档解析完成后的检查，例如根元素是否出现
     */
    virtual core::VoidResult finishDocument(const std::string& /*part_path*/) { return {}; }

    /**
     * @brief 记录错误并中止解析
     */
    [[noreturn]] void fail(core::ErrorCode code, const std::string& message) {
        state_.error = core::makeError(code, message);
        READER_ERROR("Parser error: {}", message);
        throw ParseAbort();
    }

    // ==================== 属性工具方法 ====================

    std::optional<std::string_view> findAttribute(const xml::XMLAttributes& attributes, std::string_view name) const {
        return xml::findAttribute(attributes, name);
    }

    /**
     * @brief 按本地名查找属性，忽略前缀（r:id / relationships:id）
     */
    std::optional<std::string_view> findAttributeLocal(const xml::XMLAttributes& attributes, std::string_view local) const {
        for (const auto& attr : attributes) {
            if (xml::localName(attr.name) == local) {
                return attr.value;
            }
        }
        return std::nullopt;
    }

    std::optional<int64_t> findIntAttribute(const xml::XMLAttributes& attributes, std::string_view name) const {
        auto val = findAttribute(attributes, name);
        if (!val) return std::nullopt;
        return parseInt(*val);
    }

    std::optional<uint32_t> findUIntAttribute(const xml::XMLAttributes& attributes, std::string_view name) const {
        auto val = findIntAttribute(attributes, name);
        if (!val || *val < 0 || *val > static_cast<int64_t>(UINT32_MAX)) return std::nullopt;
        return static_cast<uint32_t>(*val);
    }

    std::optional<double> findDoubleAttribute(const xml::XMLAttributes& attributes, std::string_view name) const {
        auto val = findAttribute(attributes, name);
        if (!val) return std::nullopt;
        return parseDouble(*val);
    }

    std::optional<bool> findBoolAttribute(const xml::XMLAttributes& attributes, std::string_view name) const {
        auto val = findAttribute(attributes, name);
        if (!val) return std::nullopt;
        return parseBool(*val);
    }

    std::string getAttributeOr(const xml::XMLAttributes& attributes, std::string_view name, std::string_view default_value) const {
        auto val = findAttribute(attributes, name);
        return std::string(val ? *val : default_value);
    }

    bool getBoolAttributeOr(const xml::XMLAttributes& attributes, std::string_view name, bool default_value) const {
        auto val = findBoolAttribute(attributes, name);
        return val ? *val : default_value;
    }

    /**
     * @brief 解析 <color>/<fgColor>/<tabColor> 等颜色元素的属性
     *
     * 优先级 rgb > theme > indexed > auto，tint 作用于所有种类。
     * 四个属性都不存在时返回 nullopt。
     */
    std::optional<core::Color> parseColorAttributes(const xml::XMLAttributes& attributes) const {
        std::optional<core::Color> color;
        if (auto rgb = findAttribute(attributes, "rgb")) {
            color = core::Color::fromHex(*rgb);
        }
        if (!color) {
            if (auto theme = findUIntAttribute(attributes, "theme")) {
                color = core::Color::fromTheme(*theme);
            } else if (auto indexed = findUIntAttribute(attributes, "indexed")) {
                color = core::Color::fromIndex(*indexed);
            } else if (getBoolAttributeOr(attributes, "auto", false)) {
                color = core::Color::automatic();
            }
        }
        if (color) {
            if (auto tint = findDoubleAttribute(attributes, "tint")) {
                color->setTint(*tint);
            }
        }
        return color;
    }

    // ==================== 数值工具方法 ====================

    static std::optional<int64_t> parseInt(std::string_view text) {
        int64_t value = 0;
        auto result = std::from_chars(text.data(), text.data() + text.size(), value);
        if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
            return std::nullopt;
        }
        return value;
    }

    static std::optional<double> parseDouble(std::string_view text) {
        double value = 0.0;
        auto result = fast_float::from_chars(text.data(), text.data() + text.size(), value);
        if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
            return std::nullopt;
        }
        return value;
    }

    // xsd:boolean
    static bool parseBool(std::string_view value) {
        return value == "1" || value == "true" || value == "True" || value == "TRUE";
    }

    // ==================== 引用工具方法 ====================

    static std::optional<std::pair<uint32_t, uint32_t>> parseCellReference(std::string_view ref) {
        return utils::CommonUtils::parseReference(ref);
    }

    static std::optional<core::CellRange> parseRangeReference(std::string_view ref) {
        return utils::CommonUtils::parseRange(ref);
    }

    // ==================== 文本收集 ====================

    void startCollectingText() {
        state_.collecting_text = true;
        state_.current_text.clear();
    }

    void stopCollectingText() {
        state_.collecting_text = false;
    }

    const std::string& getCurrentText() const { return state_.current_text; }

    // ==================== 原始文本 ====================

    // 当前开始/结束标签的起止字节位置，只在元素回调内有效
    size_t currentTagBegin() const {
        const int64_t index = reader_ ? reader_->getCurrentByteIndex() : -1;
        return index < 0 ? 0 : static_cast<size_t>(index);
    }

    size_t currentTagEnd() const {
        const int count = reader_ ? reader_->getCurrentByteCount() : 0;
        return currentTagBegin() + static_cast<size_t>(count > 0 ? count : 0);
    }

    /**
     * @brief 截取文档中 [begin, end) 的原始字节
     */
    std::string documentSlice(size_t begin, size_t end) const {
        if (begin >= end || end > document_.size()) {
            return std::string();
        }
        return std::string(document_.substr(begin, end - begin));
    }

    // ==================== 状态查询方法 ====================

    std::string_view getCurrentElement() const { return state_.getCurrentElement(); }
    std::string_view getParentElement() const { return state_.getParentElement(); }
    bool isInElement(std::string_view element_name) const { return state_.isInElement(element_name); }
    int getCurrentDepth() const { return state_.current_depth; }
};

}} // namespace sheetlens::reader
