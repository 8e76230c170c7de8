#pragma once

#include <optional>
#include <vector>

#include "engine_config.hpp"
#include "hint_service.hpp"
#include "puzzle_generator.hpp"
#include "sudoku_grid.hpp"
#include "sudoku_solver.hpp"

enum class GameState { Win, Incomplete, Invalid };

const char* to_string(GameState state);

// Win: complete and consistent. Invalid: some filled cell clashes with a peer. Incomplete otherwise.
GameState validate(const SudokuGrid& grid);

enum class SolveStatus { Solved, Unsatisfiable };

struct SolveResult {
    SolveStatus status = SolveStatus::Unsatisfiable;
    std::optional<SudokuGrid> solution;

    bool solved() const { return status == SolveStatus::Solved; }
};

// The four caller-facing operations. Single-threaded: give each concurrent caller its own engine.
class SudokuEngine {
public:
    explicit SudokuEngine(const EngineConfig& config = {});

    Puzzle generate(Difficulty difficulty);

    SolveResult solve(const SudokuGrid& puzzle);
    // Nested rows, row-major; malformed input throws SudokuError before any search runs
    SolveResult solve(const std::vector<std::vector<int>>& puzzle);

    Hint hint(const SudokuGrid& grid, int row, int col) const;

    GameState validate(const SudokuGrid& grid) const;

    const EngineConfig& config() const { return cfg; }
    const SolverStats& last_solve_stats() const { return solver.stats(); }
    uint32_t seed() const { return generator.seed(); }

private:
    EngineConfig cfg;
    PuzzleGenerator generator;
    SudokuSolver solver;
};
