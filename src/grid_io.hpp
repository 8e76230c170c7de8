#pragma once

#include <optional>
#include <string>

#include "puzzle_generator.hpp"
#include "sudoku_grid.hpp"

// 81 cells row-major; '1'..'9' are values, '0' or '.' empty. Whitespace and the
// '|', '-', '+' separators of the printed form are skipped.
// Throws SudokuError(MalformedGrid) on any other character or a wrong cell count.
SudokuGrid parse_grid(const std::string& text);

// Single-line text form, '.' for empty cells.
std::string format_grid(const SudokuGrid& grid);

struct GridDocument {
    SudokuGrid grid;
    std::optional<SudokuGrid> solution;
};

// .yml/.yaml/.json/.xml files go through cv::FileStorage ("grid", optional "solution", each
// either 81 integers or 9 rows of 9); anything else is read as the text form.
GridDocument read_grid_file(const std::string& path);

// Writes difficulty, cleared count, grid and solution through cv::FileStorage.
// The path must carry a storage extension; failures surface as SudokuError(MalformedGrid).
void write_puzzle_file(const std::string& path, const Puzzle& puzzle);
