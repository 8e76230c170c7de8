#include "sudoku_grid.hpp"

#include <ostream>
#include <string>

#include <opencv2/core.hpp>

#include "sudoku_error.hpp"

namespace {

void check_coordinates(int row, int col) {
    CV_Assert(row >= 0 && row < SudokuGrid::N && col >= 0 && col < SudokuGrid::N);
}

void check_value(int value) {
    if (value < 0 || value > 9) {
        throw SudokuError(ErrorKind::InvalidValue,
                          "cell value " + std::to_string(value) + " is outside 0..9");
    }
}

}

SudokuGrid::SudokuGrid() {
    grid.fill(EMPTY);
}

SudokuGrid::SudokuGrid(const Cells& values) : grid(values) {
    for (int v : grid) check_value(v);
}

SudokuGrid SudokuGrid::from_rows(const std::vector<std::vector<int>>& rows) {
    if (rows.size() != N) {
        throw SudokuError(ErrorKind::MalformedGrid,
                          "expected 9 rows, got " + std::to_string(rows.size()));
    }
    SudokuGrid g;
    for (int r = 0; r < N; ++r) {
        if (rows[r].size() != N) {
            throw SudokuError(ErrorKind::MalformedGrid,
                              "row " + std::to_string(r) + " has " + std::to_string(rows[r].size()) +
                              " cells, expected 9");
        }
        for (int c = 0; c < N; ++c) g.set(r, c, rows[r][c]);
    }
    return g;
}

std::vector<std::vector<int>> SudokuGrid::to_rows() const {
    std::vector<std::vector<int>> rows(N, std::vector<int>(N));
    for (int r = 0; r < N; ++r)
        for (int c = 0; c < N; ++c)
            rows[r][c] = grid[index_of(r, c)];
    return rows;
}

int SudokuGrid::get(int row, int col) const {
    check_coordinates(row, col);
    return grid[index_of(row, col)];
}

void SudokuGrid::set(int row, int col, int value) {
    check_coordinates(row, col);
    check_value(value);
    grid[index_of(row, col)] = value;
}

DigitSet SudokuGrid::row_values(int row) const {
    check_coordinates(row, 0);
    DigitSet s;
    for (int c = 0; c < N; ++c) {
        int v = grid[index_of(row, c)];
        if (v != EMPTY) s.insert(v);
    }
    return s;
}

DigitSet SudokuGrid::col_values(int col) const {
    check_coordinates(0, col);
    DigitSet s;
    for (int r = 0; r < N; ++r) {
        int v = grid[index_of(r, col)];
        if (v != EMPTY) s.insert(v);
    }
    return s;
}

DigitSet SudokuGrid::box_values(int row, int col) const {
    check_coordinates(row, col);
    const int r0 = (row / BOX) * BOX;
    const int c0 = (col / BOX) * BOX;
    DigitSet s;
    for (int r = r0; r < r0 + BOX; ++r) {
        for (int c = c0; c < c0 + BOX; ++c) {
            int v = grid[index_of(r, c)];
            if (v != EMPTY) s.insert(v);
        }
    }
    return s;
}

bool SudokuGrid::is_complete() const {
    for (int v : grid)
        if (v == EMPTY) return false;
    return true;
}

int SudokuGrid::empty_count() const {
    int n = 0;
    for (int v : grid)
        if (v == EMPTY) ++n;
    return n;
}

bool SudokuGrid::violates_constraints(int row, int col, int value) const {
    check_coordinates(row, col);
    check_value(value);
    if (value == EMPTY) return false;

    for (int i = 0; i < N; ++i) {
        if (i != col && grid[index_of(row, i)] == value) return true;
        if (i != row && grid[index_of(i, col)] == value) return true;
    }

    const int r0 = (row / BOX) * BOX;
    const int c0 = (col / BOX) * BOX;
    for (int r = r0; r < r0 + BOX; ++r) {
        for (int c = c0; c < c0 + BOX; ++c) {
            if ((r != row || c != col) && grid[index_of(r, c)] == value) return true;
        }
    }
    return false;
}

bool SudokuGrid::has_conflicts() const {
    for (int r = 0; r < N; ++r) {
        for (int c = 0; c < N; ++c) {
            int v = grid[index_of(r, c)];
            if (v != EMPTY && violates_constraints(r, c, v)) return true;
        }
    }
    return false;
}

void print_grid(std::ostream& os, const SudokuGrid& g) {
    for (int r = 0; r < SudokuGrid::N; ++r) {
        if (r > 0 && r % 3 == 0) os << "------+-------+------\n";
        for (int c = 0; c < SudokuGrid::N; ++c) {
            if (c > 0 && c % 3 == 0) os << "| ";
            int v = g.get(r, c);
            os << (v == SudokuGrid::EMPTY ? '.' : static_cast<char>('0' + v)) << " ";
        }
        os << "\n";
    }
}

std::ostream& operator<<(std::ostream& os, const SudokuGrid& g) {
    print_grid(os, g);
    return os;
}
