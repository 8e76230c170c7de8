#pragma once

#include <optional>
#include <string>
#include <vector>

#include "constraint_engine.hpp"
#include "digit_set.hpp"
#include "propagation.hpp"
#include "sudoku_grid.hpp"

struct Hint {
    int row = 0;
    int col = 0;
    int value = 0;             // 0 when the cell has no candidate left
    bool forced = false;       // value follows from a deduction rule
    std::optional<Rule> rule;  // set when forced
    DigitSet candidates;
    std::string reasoning;
};

// Which units rule a value out of a cell.
struct Exclusion {
    int value = 0;
    bool by_row = false;
    bool by_col = false;
    bool by_box = false;
};

struct Explanation {
    int row = 0;
    int col = 0;
    int current = 0;           // cell content, 0 when empty
    DigitSet row_values;
    DigitSet col_values;
    DigitSet box_values;
    DigitSet candidates;
    std::vector<Exclusion> exclusions;  // increasing value order, empty for a filled cell
};

// Forced value if (row, col) is a naked or hidden single, otherwise the smallest candidate.
// Throws SudokuError(CellOccupied) when the cell is filled.
Hint hint(const SudokuGrid& grid, int row, int col);

// Read-only account of the values excluded from (row, col) and the units excluding them.
Explanation explain(const SudokuGrid& grid, int row, int col);

// Multi-line text rendering of an explanation.
std::string describe(const Explanation& e);

// Empty cell with the fewest non-zero candidates, row-major tie-break.
std::optional<Cell> best_cell(const SudokuGrid& grid);

// First naked single, otherwise the first hidden single (rows, columns, boxes).
std::optional<Deduction> next_forced_move(const SudokuGrid& grid);
