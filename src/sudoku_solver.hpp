#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <vector>

#include "sudoku_grid.hpp"

struct SolverOptions {
    bool use_propagation = true;  // naked/hidden single pre-pass at every search node
};

struct SolverStats {
    uint64_t nodes = 0;        // search nodes entered
    uint64_t guesses = 0;      // tentative placements
    uint64_t backtracks = 0;   // nodes that failed and reverted
    uint64_t propagated = 0;   // cells committed by propagation
};

class SudokuSolver {
public:
    explicit SudokuSolver(SolverOptions options = {});

    // Solve-mode: completes grid in place, candidates tried in increasing order.
    // On false (unsatisfiable) the grid is left exactly as it was on entry.
    bool solve(SudokuGrid& grid);

    // Fill-mode: same search, candidate order shuffled with rng at every node.
    bool fill(SudokuGrid& grid, std::mt19937& rng);

    // Copying convenience over solve(); std::nullopt when no solution exists.
    std::optional<SudokuGrid> solved(const SudokuGrid& puzzle);

    // Number of completions of grid, counting stops at limit. The grid is restored.
    int count_solutions(SudokuGrid& grid, int limit);

    const SolverStats& stats() const { return counters; }
    const SolverOptions& settings() const { return options; }

private:
    bool run(SudokuGrid& grid);
    bool solve_recursive(SudokuGrid& grid);
    int count_recursive(SudokuGrid& grid, int limit);

    SolverOptions options;
    SolverStats counters;
    std::mt19937* rng = nullptr;
    std::vector<int> trail;  // cells committed by propagation, reverted on backtrack
};
