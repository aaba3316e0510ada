#pragma once

#include "sheetlens/core/Workbook.hpp"
#include "sheetlens/reader/BaseSAXParser.hpp"
#include <string>
#include <vector>

namespace sheetlens {
namespace reader {

/**
 * @brief 共享字符串表，runs 与 strings 等长，纯文本条目的 runs 为空
 */
struct SharedStringTable {
    std::vector<std::string> strings;
    std::vector<std::vector<core::RichTextRun>> runs;
};

/**
 * @brief 共享字符串解析器 (sharedStrings.xml)
 *
 * - 纯文本 <si><t> 与富文本 <si><r><rPr/><t/></r> 都拼接成完整字符串
 * - 注音 <rPh> 中的文本被跳过
 * - _xHHHH_ 转义被还原为对应字符
 * - 富文本颜色在解析时按主题和调色板求值
 */
class SharedStringsParser : public BaseSAXParser {
public:
    SharedStringsParser(const core::ThemeColors& theme_colors, const std::vector<uint32_t>* indexed_palette)
        : theme_colors_(theme_colors), indexed_palette_(indexed_palette) {}

    core::VoidResult parse(std::string_view xml_content, const std::string& part_path = "xl/sharedStrings.xml") {
        table_ = SharedStringTable();
        return parseXML(xml_content, part_path);
    }

    const SharedStringTable& getTable() const { return table_; }
    SharedStringTable takeTable() { return std::move(table_); }

    /**
     * @brief 还原 OOXML 的 _xHHHH_ 字符转义
     */
    static std::string decodeEscapes(std::string_view text);

protected:
    void onStartElement(std::string_view name, const xml::XMLAttributes& attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;

private:
    const core::ThemeColors& theme_colors_;
    const std::vector<uint32_t>* indexed_palette_;

    SharedStringTable table_;
    std::string current_string_;
    std::vector<core::RichTextRun> current_runs_;
    bool in_si_ = false;
    bool in_run_ = false;
    bool in_phonetic_ = false;
};

}} // namespace sheetlens::reader
