#pragma once

#include <optional>

#include "hint_service.hpp"
#include "puzzle_generator.hpp"
#include "sudoku_engine.hpp"
#include "sudoku_grid.hpp"

// Play state of one puzzle: clues stay fixed, the player fills and clears the other cells.
class SudokuGame {
public:
    explicit SudokuGame(const Puzzle& puzzle);
    // Loaded puzzle; the solution is searched once and stays empty for unsatisfiable clues.
    explicit SudokuGame(const SudokuGrid& clues);

    // False (and no change) when value clashes with a peer. Throws SudokuError with
    // ClueProtected on a clue, InvalidValue outside 1..9.
    bool place(int row, int col, int value);
    void clear(int row, int col);
    void reset();

    bool is_clue(int row, int col) const { return !clues.is_empty(row, col); }
    bool is_correct(int row, int col) const;
    GameState state() const { return validate(current); }
    Hint hint(int row, int col) const { return ::hint(current, row, col); }

    const SudokuGrid& board() const { return current; }
    const SudokuGrid& initial() const { return clues; }
    const std::optional<SudokuGrid>& solution() const { return answer; }

private:
    void check_not_clue(int row, int col) const;

    SudokuGrid clues;
    SudokuGrid current;
    std::optional<SudokuGrid> answer;
};
