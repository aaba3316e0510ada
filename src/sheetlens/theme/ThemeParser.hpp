#pragma once

#include "sheetlens/core/Expected.hpp"
#include "sheetlens/theme/Theme.hpp"
#include <string>
#include <string_view>

namespace sheetlens {
namespace theme {

/**
 * @brief 主题部件解析器 (theme1.xml)
 *
 * 读取 clrScheme（srgbClr 或 sysClr 的 lastClr）与 fontScheme 的 latin 字体。
 * 缺失的槽位保留 Office 默认值。
 */
class ThemeParser {
public:
    static core::Result<Theme> parse(std::string_view xml_content, const std::string& part_path = "xl/theme/theme1.xml");
};

}} // namespace sheetlens::theme
