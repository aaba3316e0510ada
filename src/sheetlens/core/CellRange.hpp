#pragma once

#include <algorithm>
#include <cstdint>

namespace sheetlens {
namespace core {

/**
 * @brief 矩形单元格区域，行列均为0开始且包含两端
 */
struct CellRange {
    uint32_t first_row = 0;
    uint32_t first_col = 0;
    uint32_t last_row = 0;
    uint32_t last_col = 0;

    CellRange() = default;
    CellRange(uint32_t r1, uint32_t c1, uint32_t r2, uint32_t c2)
        : first_row(std::min(r1, r2)), first_col(std::min(c1, c2)),
          last_row(std::max(r1, r2)), last_col(std::max(c1, c2)) {}

    bool contains(uint32_t row, uint32_t col) const {
        return row >= first_row && row <= last_row && col >= first_col && col <= last_col;
    }

    bool overlaps(const CellRange& other) const {
        return first_row <= other.last_row && other.first_row <= last_row &&
               first_col <= other.last_col && other.first_col <= last_col;
    }

    bool isSingleCell() const { return first_row == last_row && first_col == last_col; }
    uint32_t rowCount() const { return last_row - first_row + 1; }
    uint32_t colCount() const { return last_col - first_col + 1; }

    bool operator==(const CellRange& other) const {
        return first_row == other.first_row && first_col == other.first_col &&
               last_row == other.last_row && last_col == other.last_col;
    }
};

}} // namespace sheetlens::core
