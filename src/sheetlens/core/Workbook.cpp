#include "sheetlens/core/Workbook.hpp"

#include <algorithm>
#include <numeric>

namespace sheetlens {
namespace core {

const char* toString(CellType type) {
    switch (type) {
        case CellType::Number:  return "number";
        case CellType::String:  return "string";
        case CellType::Boolean: return "boolean";
        case CellType::Error:   return "error";
        case CellType::Formula: return "formula";
        default:                return "empty";
    }
}

const char* toString(SheetVisibility visibility) {
    switch (visibility) {
        case SheetVisibility::Hidden:     return "hidden";
        case SheetVisibility::VeryHidden: return "veryHidden";
        default:                          return "visible";
    }
}

const char* toString(Drawing::Kind kind) {
    switch (kind) {
        case Drawing::Kind::Picture: return "picture";
        case Drawing::Kind::Chart:   return "chart";
        default:                     return "shape";
    }
}

const Cell* Sheet::findCell(uint32_t row, uint32_t col) const {
    auto it = index_.find(key(row, col));
    return it == index_.end() ? nullptr : &cells_[it->second].cell;
}

Cell* Sheet::findCell(uint32_t row, uint32_t col) {
    auto it = index_.find(key(row, col));
    return it == index_.end() ? nullptr : &cells_[it->second].cell;
}

Cell& Sheet::upsertCell(uint32_t row, uint32_t col, Cell cell) {
    max_row = std::max(max_row, row + 1);
    max_col = std::max(max_col, col + 1);

    auto it = index_.find(key(row, col));
    if (it != index_.end()) {
        cells_[it->second].cell = std::move(cell);
        return cells_[it->second].cell;
    }
    index_.emplace(key(row, col), cells_.size());
    cells_.push_back(CellData{row, col, std::move(cell)});
    return cells_.back().cell;
}

bool Sheet::removeCell(uint32_t row, uint32_t col) {
    auto it = index_.find(key(row, col));
    if (it == index_.end()) {
        return false;
    }
    const size_t pos = it->second;
    index_.erase(it);

    const size_t last = cells_.size() - 1;
    if (pos != last) {
        cells_[pos] = std::move(cells_[last]);
        index_[key(cells_[pos].r, cells_[pos].c)] = pos;
    }
    cells_.pop_back();
    return true;
}

bool Sheet::addMerge(const CellRange& range) {
    for (const auto& existing : merges) {
        if (existing.overlaps(range)) {
            return false;
        }
    }
    merges.push_back(range);
    return true;
}

std::vector<size_t> Sheet::sortedCellOrder() const {
    std::vector<size_t> order(cells_.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [this](size_t a, size_t b) {
        const auto& ca = cells_[a];
        const auto& cb = cells_[b];
        return ca.r != cb.r ? ca.r < cb.r : ca.c < cb.c;
    });
    return order;
}

const Sheet* Workbook::findSheet(const std::string& name) const {
    for (const auto& sheet : sheets) {
        if (sheet.name == name) {
            return &sheet;
        }
    }
    return nullptr;
}

}} // namespace sheetlens::core
