#pragma once

#include <array>
#include <iosfwd>
#include <vector>

#include "digit_set.hpp"

// 9x9 sudoku grid, row-major, 0 marks an empty cell.
class SudokuGrid {
public:
    static constexpr int N = 9;
    static constexpr int BOX = 3;
    static constexpr int CELL_COUNT = 81;
    static constexpr int EMPTY = 0;
    using Cells = std::array<int, CELL_COUNT>;

    SudokuGrid();
    explicit SudokuGrid(const Cells& values);

    // Boundary conversion from/to the nested-vector form used by callers.
    // Throws SudokuError(MalformedGrid) on wrong dimensions, InvalidValue on values outside 0..9.
    static SudokuGrid from_rows(const std::vector<std::vector<int>>& rows);
    std::vector<std::vector<int>> to_rows() const;

    int get(int row, int col) const;
    void set(int row, int col, int value);
    void clear(int row, int col) { set(row, col, EMPTY); }
    bool is_empty(int row, int col) const { return get(row, col) == EMPTY; }

    const Cells& cells() const { return grid; }

    DigitSet row_values(int row) const;
    DigitSet col_values(int col) const;
    DigitSet box_values(int row, int col) const;

    bool is_complete() const;
    int empty_count() const;

    // True iff value already sits in a peer of (row, col); the cell's own content is ignored.
    bool violates_constraints(int row, int col, int value) const;

    // True iff some filled cell currently violates row/column/box uniqueness.
    bool has_conflicts() const;

    static int index_of(int row, int col) { return row * N + col; }
    static int box_index(int row, int col) { return (row / BOX) * BOX + (col / BOX); }

    bool operator==(const SudokuGrid&) const = default;

private:
    Cells grid;
};

// Terminal rendering with 3x3 box separators, '.' for empty cells.
void print_grid(std::ostream& os, const SudokuGrid& g);
std::ostream& operator<<(std::ostream& os, const SudokuGrid& g);
