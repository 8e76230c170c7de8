#pragma once

#include <random>

#include "engine_config.hpp"
#include "sudoku_grid.hpp"
#include "sudoku_solver.hpp"

// A generated puzzle together with the full grid it was carved from.
struct Puzzle {
    SudokuGrid puzzle;
    SudokuGrid solution;
    Difficulty difficulty = Difficulty::Medium;
    int cleared = 0;
};

class PuzzleGenerator {
public:
    explicit PuzzleGenerator(const EngineConfig& config = {});

    // Random complete grid from fill-mode search, then clue removal down to the tier's count.
    // With require_unique, a removal that admits a second solution is reverted and the
    // returned puzzle may have fewer cleared cells than requested.
    Puzzle generate(Difficulty difficulty);

    uint32_t seed() const { return seedValue; }

private:
    SudokuGrid random_solution();

    EngineConfig config;
    uint32_t seedValue;
    std::mt19937 rng;
    SudokuSolver solver;
};
