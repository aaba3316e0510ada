#pragma once

#include "sheetlens/cli/JsonWriter.hpp"
#include "sheetlens/core/Workbook.hpp"
#include <cstdint>
#include <string>

namespace sheetlens {
namespace cli {

/**
 * @brief 把解析后的工作簿序列化为 JSON
 *
 * 键名使用 camelCase，颜色写为 "#RRGGBB"，行列为 0 开始的下标。
 * 样式只写出已设置的字段。
 */
std::string workbookToJson(const core::Workbook& workbook, bool pretty = false);

void writeWorkbook(JsonWriter& writer, const core::Workbook& workbook);
void writeSheet(JsonWriter& writer, const core::Sheet& sheet, const core::Workbook& workbook);
void writeStyle(JsonWriter& writer, const core::Style& style);

std::string colorToHex(uint32_t rgb);

}} // namespace sheetlens::cli
