#include "sudoku_engine.hpp"

#include <opencv2/core/utils/logger.hpp>

const char* to_string(GameState state) {
    switch (state) {
        case GameState::Win:        return "Win";
        case GameState::Incomplete: return "Incomplete";
        case GameState::Invalid:    return "Invalid";
    }
    return "Unknown";
}

GameState validate(const SudokuGrid& grid) {
    if (grid.has_conflicts()) return GameState::Invalid;
    return grid.is_complete() ? GameState::Win : GameState::Incomplete;
}

SudokuEngine::SudokuEngine(const EngineConfig& config)
    : cfg(config),
      generator(config),
      solver(SolverOptions{config.use_propagation}) {}

Puzzle SudokuEngine::generate(Difficulty difficulty) {
    return generator.generate(difficulty);
}

SolveResult SudokuEngine::solve(const SudokuGrid& puzzle) {
    SolveResult result;
    result.solution = solver.solved(puzzle);
    if (result.solution) {
        result.status = SolveStatus::Solved;
    } else {
        CV_LOG_INFO(NULL, "engine: puzzle with " << puzzle.empty_count() << " empty cells is unsatisfiable");
    }
    return result;
}

SolveResult SudokuEngine::solve(const std::vector<std::vector<int>>& puzzle) {
    return solve(SudokuGrid::from_rows(puzzle));
}

Hint SudokuEngine::hint(const SudokuGrid& grid, int row, int col) const {
    return ::hint(grid, row, col);
}

GameState SudokuEngine::validate(const SudokuGrid& grid) const {
    return ::validate(grid);
}
