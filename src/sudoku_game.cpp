#include "sudoku_game.hpp"

#include <string>

#include "sudoku_error.hpp"
#include "sudoku_solver.hpp"

SudokuGame::SudokuGame(const Puzzle& puzzle)
    : clues(puzzle.puzzle), current(puzzle.puzzle), answer(puzzle.solution) {}

SudokuGame::SudokuGame(const SudokuGrid& givens)
    : clues(givens), current(givens) {
    SudokuSolver solver;
    answer = solver.solved(givens);
}

void SudokuGame::check_not_clue(int row, int col) const {
    if (is_clue(row, col)) {
        throw SudokuError(ErrorKind::ClueProtected,
                          "cell (" + std::to_string(row) + ", " + std::to_string(col) + ") is a clue");
    }
}

bool SudokuGame::place(int row, int col, int value) {
    check_not_clue(row, col);
    if (value < 1 || value > 9) {
        throw SudokuError(ErrorKind::InvalidValue,
                          "placement value " + std::to_string(value) + " is outside 1..9");
    }
    if (current.violates_constraints(row, col, value)) return false;

    current.set(row, col, value);
    return true;
}

void SudokuGame::clear(int row, int col) {
    check_not_clue(row, col);
    current.clear(row, col);
}

void SudokuGame::reset() {
    current = clues;
}

bool SudokuGame::is_correct(int row, int col) const {
    return answer && !current.is_empty(row, col) && answer->get(row, col) == current.get(row, col);
}
