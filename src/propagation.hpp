#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "sudoku_grid.hpp"

enum class Rule {
    NakedSingle,
    HiddenSingleRow,
    HiddenSingleColumn,
    HiddenSingleBox
};

const char* to_string(Rule rule);

// A value forced into a cell by one of the deduction rules.
struct Deduction {
    int row = 0;
    int col = 0;
    int value = 0;
    Rule rule = Rule::NakedSingle;

    bool operator==(const Deduction&) const = default;
};

// Human-readable form, 1-based coordinates, e.g. "Hidden single in row 3: 7 can only go at (3, 5)".
std::string describe(const Deduction& d);

// Every empty cell whose candidate set has exactly one member, row-major order.
std::vector<Deduction> find_naked_singles(const SudokuGrid& grid);

// For each unit (rows, then columns, then boxes) and each value 1..9, the cell that is the only
// place in the unit where the value is a candidate. A (row, col, value) triple found in several
// units is reported once, tagged with the first unit that produced it.
std::vector<Deduction> find_hidden_singles(const SudokuGrid& grid);

// Commits naked and hidden singles until none is left. Each committed cell index is appended to
// trail so the caller can revert with undo_propagation. Returns false on contradiction: a cell
// with no candidates, two different forced values for one cell, or two forced placements that
// clash with each other. The grid may hold partial commitments on false; the trail covers them.
bool propagate(SudokuGrid& grid, std::vector<int>& trail);

// Empties every cell committed after trail position mark and truncates the trail to mark.
void undo_propagation(SudokuGrid& grid, std::vector<int>& trail, std::size_t mark);
