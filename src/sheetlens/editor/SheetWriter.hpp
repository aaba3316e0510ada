#pragma once

#include "sheetlens/core/Expected.hpp"
#include "sheetlens/core/Workbook.hpp"
#include "sheetlens/xml/XMLStreamWriter.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace sheetlens {
namespace editor {

/**
 * @brief 工作表部件重写器
 *
 * 只替换原 XML 中的 <sheetData> 与 <dimension>，其余字节保持不变：
 * 视图、列宽、合并区域、条件格式、扩展等都原样保留。
 *
 * 未编辑的单元格按 CellSource 记录的原始 t / v / f 写回，
 * 编辑过的单元格（没有 CellSource）写为内联字符串、布尔或数字。
 */
class SheetWriter {
public:
    /**
     * @brief 在原始 XML 中定位到的元素
     */
    struct ElementSpan {
        size_t begin = 0;       // '<' 的位置
        size_t end = 0;         // 元素结束后的位置
        std::string prefix;     // 命名空间前缀，含 ':'
    };

    /**
     * @brief 用 sheet 的当前单元格重新生成工作表 XML
     * @param original_xml 原始部件内容
     * @param sheet 已应用编辑的工作表
     * @return 缺少 <sheetData> 时返回 XmlParseError
     */
    static core::Result<std::string> rewrite(std::string_view original_xml, const core::Sheet& sheet);

    /**
     * @brief 生成 <sheetData> 元素
     */
    static std::string buildSheetData(const core::Sheet& sheet, const std::string& prefix = std::string());

    /**
     * @brief 计算 dimension 引用，没有单元格时为 A1
     */
    static std::string dimensionRef(const core::Sheet& sheet);

    /**
     * @brief 查找局部名为 local_name 的第一个元素（跳过注释、CDATA 与处理指令）
     */
    static std::optional<ElementSpan> findElement(std::string_view xml, std::string_view local_name,
                                                  size_t from = 0);

private:
    static void writeCell(xml::XMLStreamWriter& writer, const std::string& prefix,
                          uint32_t row, uint32_t col, const core::Cell& cell);
    static void writeSourceCell(xml::XMLStreamWriter& writer, const std::string& prefix, const core::Cell& cell);
    static void writeEditedCell(xml::XMLStreamWriter& writer, const std::string& prefix, const core::Cell& cell);
    static void writeInlineString(xml::XMLStreamWriter& writer, const std::string& prefix, const std::string& text);
};

}} // namespace sheetlens::editor
