#pragma once

#include "sheetlens/core/Color.hpp"
#include <string>

namespace sheetlens {
namespace theme {

/**
 * @brief 工作簿主题：12 色调色板与标题/正文字体
 *
 * colors 按 Excel 主题索引顺序存放（lt1, dk1, lt2, dk2, accent1-6, hlink, folHlink），
 * 与 XML 中 clrScheme 的 dk1/lt1 书写顺序相反。
 */
struct Theme {
    std::string name = "Office Theme";
    core::ThemeColors colors = core::defaultThemeColors();
    std::string major_font = "Calibri Light";
    std::string minor_font = "Calibri";

    static Theme defaultOffice() { return Theme(); }

    /**
     * @brief 按 clrScheme 中的元素名获取调色板槽位，未知名称返回 -1
     */
    static int slotForElement(const std::string& local_name);
};

}} // namespace sheetlens::theme
