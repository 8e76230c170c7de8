#include "constraint_engine.hpp"

#include <string>

#include "sudoku_error.hpp"

DigitSet candidates(const SudokuGrid& grid, int row, int col) {
    if (!grid.is_empty(row, col)) return DigitSet();

    DigitSet used = grid.row_values(row) | grid.col_values(col) | grid.box_values(row, col);
    return ~used;
}

bool is_valid_placement(const SudokuGrid& grid, int row, int col, int value) {
    if (value < 1 || value > 9) {
        throw SudokuError(ErrorKind::InvalidValue,
                          "placement value " + std::to_string(value) + " is outside 1..9");
    }
    if (!grid.is_empty(row, col)) return false;
    return !grid.violates_constraints(row, col, value);
}

CandidateMap all_candidates(const SudokuGrid& grid) {
    CandidateMap out;
    for (int r = 0; r < SudokuGrid::N; ++r) {
        for (int c = 0; c < SudokuGrid::N; ++c) {
            if (grid.is_empty(r, c)) out.emplace(Cell{r, c}, candidates(grid, r, c));
        }
    }
    return out;
}

std::optional<CellChoice> most_constrained_cell(const SudokuGrid& grid, bool skip_dead) {
    std::optional<CellChoice> best;
    int min_candidates = 10;

    for (int r = 0; r < SudokuGrid::N; ++r) {
        for (int c = 0; c < SudokuGrid::N; ++c) {
            if (!grid.is_empty(r, c)) continue;

            DigitSet cand = candidates(grid, r, c);
            const int count = cand.size();
            if (count == 0 && skip_dead) continue;
            if (count < min_candidates) {
                min_candidates = count;
                best = CellChoice{r, c, cand};
                if (count == 0) return best;  // Dead end
            }
        }
    }
    return best;
}
