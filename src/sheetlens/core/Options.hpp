#pragma once

namespace sheetlens {
namespace core {

/**
 * @brief 读取选项
 *
 * 关闭的子功能对应的部件不会被解压和解析。
 */
struct ReaderOptions {
    bool resolve_styles = true;             // 为单元格附加解析后的样式
    bool parse_comments = true;
    bool parse_drawings = true;
    bool parse_conditional_formats = true;
    bool format_values = true;              // 生成 display 文本
};

/**
 * @brief 编辑器选项
 */
struct EditorOptions {
    int compression_level = 6;              // 重新生成的部件使用的 deflate 级别
    ReaderOptions reader;
};

}} // namespace sheetlens::core
