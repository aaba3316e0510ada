#pragma once

#include "sheetlens/core/CellRange.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sheetlens {
namespace utils {

/**
 * @brief 通用工具类 - 单元格引用的格式化与解析
 */
class CommonUtils {
public:
    static constexpr uint32_t kMaxRow = 1048575;
    static constexpr uint32_t kMaxCol = 16383;

    /**
     * @brief 列号转换为字母表示（A, B, ..., Z, AA, AB, ...）
     * @param col 列号（0开始）
     */
    static std::string columnToLetter(uint32_t col) {
        std::string result;
        uint64_t n = static_cast<uint64_t>(col) + 1;
        while (n > 0) {
            --n;
            result.insert(result.begin(), static_cast<char>('A' + (n % 26)));
            n /= 26;
        }
        return result;
    }

    /**
     * @brief 生成单元格引用（如A1, B2等），行列0开始
     */
    static std::string cellReference(uint32_t row, uint32_t col) {
        return columnToLetter(col) + std::to_string(static_cast<uint64_t>(row) + 1);
    }

    static std::string rangeReference(const core::CellRange& range) {
        if (range.isSingleCell()) {
            return cellReference(range.first_row, range.first_col);
        }
        return cellReference(range.first_row, range.first_col) + ":" +
               cellReference(range.last_row, range.last_col);
    }

    /**
     * @brief 解析单元格引用（A1 -> (0, 0)）
     *
     * 只接受 [A-Z]+[0-9]+，可选的 '$' 绝对引用标记在 allow_absolute 时跳过。
     * @return 格式不符或超出工作表范围时返回 nullopt
     */
    static std::optional<std::pair<uint32_t, uint32_t>> parseReference(std::string_view ref,
                                                                       bool allow_absolute = false) {
        size_t i = 0;
        if (allow_absolute && i < ref.size() && ref[i] == '$') ++i;

        uint64_t col = 0;
        size_t letters = 0;
        while (i < ref.size() && ref[i] >= 'A' && ref[i] <= 'Z') {
            col = col * 26 + static_cast<uint64_t>(ref[i] - 'A' + 1);
            if (col > kMaxCol + 1) return std::nullopt;
            ++i;
            ++letters;
        }
        if (letters == 0) return std::nullopt;

        if (allow_absolute && i < ref.size() && ref[i] == '$') ++i;

        uint64_t row = 0;
        size_t digits = 0;
        while (i < ref.size() && ref[i] >= '0' && ref[i] <= '9') {
            row = row * 10 + static_cast<uint64_t>(ref[i] - '0');
            if (row > kMaxRow + 1) return std::nullopt;
            ++i;
            ++digits;
        }
        if (digits == 0 || row == 0 || i != ref.size()) return std::nullopt;

        return std::make_pair(static_cast<uint32_t>(row - 1), static_cast<uint32_t>(col - 1));
    }

    /**
     * @brief 解析 "A1:B2" 或单个 "A1" 形式的区域
     */
    static std::optional<core::CellRange> parseRange(std::string_view ref) {
        const size_t colon = ref.find(':');
        if (colon == std::string_view::npos) {
            auto cell = parseReference(ref, true);
            if (!cell) return std::nullopt;
            return core::CellRange(cell->first, cell->second, cell->first, cell->second);
        }
        auto first = parseReference(ref.substr(0, colon), true);
        auto last = parseReference(ref.substr(colon + 1), true);
        if (!first || !last) return std::nullopt;
        return core::CellRange(first->first, first->second, last->first, last->second);
    }

    /**
     * @brief 解析以空格分隔的多个区域（sqref），无法识别的片段被跳过
     */
    static std::vector<core::CellRange> parseSqref(std::string_view sqref) {
        std::vector<core::CellRange> ranges;
        size_t pos = 0;
        while (pos < sqref.size()) {
            size_t end = sqref.find(' ', pos);
            if (end == std::string_view::npos) end = sqref.size();
            if (end > pos) {
                if (auto range = parseRange(sqref.substr(pos, end - pos))) {
                    ranges.push_back(*range);
                }
            }
            pos = end + 1;
        }
        return ranges;
    }

    static bool isValidCellPosition(uint32_t row, uint32_t col) {
        return row <= kMaxRow && col <= kMaxCol;
    }
};

}} // namespace sheetlens::utils
