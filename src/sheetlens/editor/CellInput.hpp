#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace sheetlens {
namespace editor {

/**
 * @brief 一次编辑输入推断出的单元格内容
 */
struct CellInput {
    enum class Kind : uint8_t {
        Remove,     // 空输入，删除单元格
        Boolean,
        Number,
        String      // 以内联字符串写出
    };

    Kind kind = Kind::Remove;
    bool boolean = false;
    double number = 0.0;
    std::string text;
};

const char* toString(CellInput::Kind kind);

/**
 * @brief 推断用户输入的类型
 *
 * - "" 删除单元格
 * - "true" / "false"（不区分大小写）为布尔
 * - 整个字符串是一个有限数字时为数字
 * - 其余按原文作为字符串
 */
CellInput inferCellInput(std::string_view input);

}} // namespace sheetlens::editor
