#include "propagation.hpp"

#include <algorithm>
#include <array>
#include <sstream>

#include <opencv2/core/utils/logger.hpp>

#include "constraint_engine.hpp"

namespace {

constexpr int N = SudokuGrid::N;
constexpr int UNIT_COUNT = 3 * N;

// Units 0..8 are rows, 9..17 columns, 18..26 boxes.
Cell unit_cell(int unit, int k) {
    if (unit < N) return {unit, k};
    if (unit < 2 * N) return {k, unit - N};
    const int b = unit - 2 * N;
    return {(b / 3) * 3 + k / 3, (b % 3) * 3 + k % 3};
}

Rule unit_rule(int unit) {
    if (unit < N) return Rule::HiddenSingleRow;
    if (unit < 2 * N) return Rule::HiddenSingleColumn;
    return Rule::HiddenSingleBox;
}

}

const char* to_string(Rule rule) {
    switch (rule) {
        case Rule::NakedSingle:        return "naked single";
        case Rule::HiddenSingleRow:    return "hidden single (row)";
        case Rule::HiddenSingleColumn: return "hidden single (column)";
        case Rule::HiddenSingleBox:    return "hidden single (box)";
    }
    return "unknown";
}

std::string describe(const Deduction& d) {
    std::ostringstream os;
    const int r = d.row + 1;
    const int c = d.col + 1;
    switch (d.rule) {
        case Rule::NakedSingle:
            os << "Naked single: cell (" << r << ", " << c << ") must be " << d.value
               << " (only possibility)";
            break;
        case Rule::HiddenSingleRow:
            os << "Hidden single in row " << r << ": " << d.value << " can only go at ("
               << r << ", " << c << ")";
            break;
        case Rule::HiddenSingleColumn:
            os << "Hidden single in column " << c << ": " << d.value << " can only go at ("
               << r << ", " << c << ")";
            break;
        case Rule::HiddenSingleBox:
            os << "Hidden single in box " << SudokuGrid::box_index(d.row, d.col) + 1 << ": "
               << d.value << " can only go at (" << r << ", " << c << ")";
            break;
    }
    return os.str();
}

std::vector<Deduction> find_naked_singles(const SudokuGrid& grid) {
    std::vector<Deduction> out;
    for (int r = 0; r < N; ++r) {
        for (int c = 0; c < N; ++c) {
            DigitSet cand = candidates(grid, r, c);
            if (cand.size() == 1) out.push_back({r, c, cand.smallest(), Rule::NakedSingle});
        }
    }
    return out;
}

std::vector<Deduction> find_hidden_singles(const SudokuGrid& grid) {
    std::array<DigitSet, SudokuGrid::CELL_COUNT> cands;
    for (int r = 0; r < N; ++r)
        for (int c = 0; c < N; ++c)
            cands[SudokuGrid::index_of(r, c)] = candidates(grid, r, c);

    std::vector<Deduction> out;
    for (int unit = 0; unit < UNIT_COUNT; ++unit) {
        for (int v = 1; v <= 9; ++v) {
            int count = 0;
            Cell where{-1, -1};
            for (int k = 0; k < N && count < 2; ++k) {
                Cell cell = unit_cell(unit, k);
                if (cands[SudokuGrid::index_of(cell.first, cell.second)].contains(v)) {
                    ++count;
                    where = cell;
                }
            }
            if (count != 1) continue;

            Deduction d{where.first, where.second, v, unit_rule(unit)};
            bool seen = std::any_of(out.begin(), out.end(), [&](const Deduction& e) {
                return e.row == d.row && e.col == d.col && e.value == d.value;
            });
            if (!seen) out.push_back(d);
        }
    }
    return out;
}

bool propagate(SudokuGrid& grid, std::vector<int>& trail) {
    for (;;) {
        for (int r = 0; r < N; ++r) {
            for (int c = 0; c < N; ++c) {
                if (grid.is_empty(r, c) && candidates(grid, r, c).empty()) return false;
            }
        }

        std::vector<Deduction> forced = find_naked_singles(grid);
        std::vector<Deduction> hidden = find_hidden_singles(grid);
        forced.insert(forced.end(), hidden.begin(), hidden.end());
        if (forced.empty()) return true;

        std::array<int, SudokuGrid::CELL_COUNT> pending{};
        for (const Deduction& d : forced) {
            int& slot = pending[SudokuGrid::index_of(d.row, d.col)];
            if (slot != 0 && slot != d.value) {
                CV_LOG_DEBUG(NULL, "propagation: cell (" << d.row << "," << d.col
                             << ") forced to both " << slot << " and " << d.value);
                return false;
            }
            slot = d.value;
        }

        for (int idx = 0; idx < SudokuGrid::CELL_COUNT; ++idx) {
            if (pending[idx] == 0) continue;
            const int r = idx / N;
            const int c = idx % N;
            // Two forced cells of one unit may claim the same value
            if (grid.violates_constraints(r, c, pending[idx])) return false;
            grid.set(r, c, pending[idx]);
            trail.push_back(idx);
        }
    }
}

void undo_propagation(SudokuGrid& grid, std::vector<int>& trail, std::size_t mark) {
    while (trail.size() > mark) {
        const int idx = trail.back();
        trail.pop_back();
        grid.clear(idx / N, idx % N);
    }
}
