#include "hint_service.hpp"

#include <sstream>

#include "sudoku_error.hpp"

namespace {

void print_values(std::ostream& os, DigitSet s) {
    if (s.empty()) {
        os << "none";
        return;
    }
    os << "[";
    const char* sep = "";
    for (int v : s.values()) {
        os << sep << v;
        sep = ", ";
    }
    os << "]";
}

}

Hint hint(const SudokuGrid& grid, int row, int col) {
    if (!grid.is_empty(row, col)) {
        throw SudokuError(ErrorKind::CellOccupied,
                          "cell (" + std::to_string(row) + ", " + std::to_string(col) +
                          ") already holds " + std::to_string(grid.get(row, col)));
    }

    Hint h;
    h.row = row;
    h.col = col;
    h.candidates = candidates(grid, row, col);

    if (h.candidates.size() == 1) {
        Deduction d{row, col, h.candidates.smallest(), Rule::NakedSingle};
        h.value = d.value;
        h.forced = true;
        h.rule = d.rule;
        h.reasoning = describe(d);
        return h;
    }

    for (const Deduction& d : find_hidden_singles(grid)) {
        if (d.row == row && d.col == col) {
            h.value = d.value;
            h.forced = true;
            h.rule = d.rule;
            h.reasoning = describe(d);
            return h;
        }
    }

    std::ostringstream os;
    if (h.candidates.empty()) {
        os << "Cell (" << row + 1 << ", " << col + 1
           << ") has no valid possibilities - puzzle may be unsolvable";
    } else {
        h.value = h.candidates.smallest();
        os << "No forced value at (" << row + 1 << ", " << col + 1 << "); candidates ";
        print_values(os, h.candidates);
        os << ", suggesting the smallest: " << h.value;
    }
    h.reasoning = os.str();
    return h;
}

Explanation explain(const SudokuGrid& grid, int row, int col) {
    Explanation e;
    e.row = row;
    e.col = col;
    e.current = grid.get(row, col);
    e.row_values = grid.row_values(row);
    e.col_values = grid.col_values(col);
    e.box_values = grid.box_values(row, col);
    e.candidates = candidates(grid, row, col);

    if (e.current != SudokuGrid::EMPTY) return e;

    for (int v = 1; v <= 9; ++v) {
        Exclusion x{v, e.row_values.contains(v), e.col_values.contains(v), e.box_values.contains(v)};
        if (x.by_row || x.by_col || x.by_box) e.exclusions.push_back(x);
    }
    return e;
}

std::string describe(const Explanation& e) {
    std::ostringstream os;
    const int r = e.row + 1;
    const int c = e.col + 1;

    if (e.current != SudokuGrid::EMPTY) {
        os << "Cell (" << r << ", " << c << ") is already filled with " << e.current << "\n";
        return os.str();
    }
    if (e.candidates.empty()) {
        os << "Cell (" << r << ", " << c << ") has no valid possibilities - puzzle may be unsolvable!\n";
        return os.str();
    }

    os << "Analysis for cell (" << r << ", " << c << ")\n";
    os << "Valid candidates: ";
    print_values(os, e.candidates);
    os << "\nRow " << r << " contains: ";
    print_values(os, e.row_values);
    os << "\nColumn " << c << " contains: ";
    print_values(os, e.col_values);
    os << "\nBox " << SudokuGrid::box_index(e.row, e.col) + 1 << " contains: ";
    print_values(os, e.box_values);
    os << "\nBlocked numbers:";
    for (const Exclusion& x : e.exclusions) {
        os << "\n  " << x.value << " by";
        if (x.by_row) os << " row";
        if (x.by_col) os << " column";
        if (x.by_box) os << " box";
    }
    os << "\n";
    return os.str();
}

std::optional<Cell> best_cell(const SudokuGrid& grid) {
    std::optional<CellChoice> choice = most_constrained_cell(grid, true);
    if (!choice) return std::nullopt;
    return Cell{choice->row, choice->col};
}

std::optional<Deduction> next_forced_move(const SudokuGrid& grid) {
    std::vector<Deduction> naked = find_naked_singles(grid);
    if (!naked.empty()) return naked.front();

    std::vector<Deduction> hidden = find_hidden_singles(grid);
    if (!hidden.empty()) return hidden.front();
    return std::nullopt;
}
