#pragma once

#include <map>
#include <optional>
#include <utility>

#include "digit_set.hpp"
#include "sudoku_grid.hpp"

using Cell = std::pair<int, int>;  // (row, col)
using CandidateMap = std::map<Cell, DigitSet>;

// Legal values for (row, col): empty for a filled cell, otherwise {1..9} minus the
// values present in the cell's row, column and box. Always computed from the current grid.
DigitSet candidates(const SudokuGrid& grid, int row, int col);

// Same answer as candidates(grid, row, col).contains(value) without enumerating the set.
// Throws SudokuError(InvalidValue) when value is outside 1..9.
bool is_valid_placement(const SudokuGrid& grid, int row, int col, int value);

// Candidate set of every empty cell, keyed by (row, col).
CandidateMap all_candidates(const SudokuGrid& grid);

struct CellChoice {
    int row = -1;
    int col = -1;
    DigitSet candidates;
};

// Minimum-remaining-values selection: the empty cell with the fewest candidates, ties broken in
// row-major order. A choice with an empty candidate set is a dead cell (stops the scan early).
// With skip_dead, dead cells are passed over and the fewest non-zero count wins instead.
// Returns std::nullopt when no empty cell qualifies.
std::optional<CellChoice> most_constrained_cell(const SudokuGrid& grid, bool skip_dead = false);
