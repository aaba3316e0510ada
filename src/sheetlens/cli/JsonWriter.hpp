#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sheetlens {
namespace cli {

/**
 * @brief 流式 JSON 写入器
 *
 * 逐个写出键和值，自动插入逗号与缩进。嵌套不匹配、对象中缺少键、
 * 根上写入多个值等误用抛出 SheetLensException。
 *
 * 字符串按 UTF-8 原样输出，只转义引号、反斜杠和控制字符。
 * NaN 与无穷大写为 null。
 */
class JsonWriter {
public:
    explicit JsonWriter(bool pretty = false, int indent = 2);

    JsonWriter(const JsonWriter&) = delete;
    JsonWriter& operator=(const JsonWriter&) = delete;

    void beginObject();
    void endObject();
    void beginArray();
    void endArray();

    void key(std::string_view name);

    void value(std::string_view text);
    void value(const char* text) { value(std::string_view(text)); }
    void value(const std::string& text) { value(std::string_view(text)); }
    void value(bool flag);
    void value(double number);
    void value(int64_t number);
    void value(int number) { value(static_cast<int64_t>(number)); }
    void value(uint32_t number) { value(static_cast<int64_t>(number)); }
    void value(uint64_t number);
    void null();

    template<typename T>
    void field(std::string_view name, const T& v) {
        key(name);
        value(v);
    }

    /// 当前嵌套深度
    size_t depth() const { return stack_.size(); }

    /// 根值已写完且所有容器都已关闭
    bool complete() const { return stack_.empty() && root_written_; }

    const std::string& str() const { return buffer_; }

    /**
     * @brief 取出结果，未完成时抛出异常
     */
    std::string takeResult();

    static std::string escape(std::string_view text);

private:
    struct Frame {
        bool is_object = false;
        size_t count = 0;
        bool has_key = false;
    };

    void beforeValue();
    void beginContainer(bool is_object, char open);
    void endContainer(bool is_object, char close);
    void newline();
    [[noreturn]] void misuse(const std::string& message) const;

    std::string buffer_;
    std::vector<Frame> stack_;
    bool pretty_;
    int indent_;
    bool root_written_ = false;
};

}} // namespace sheetlens::cli
