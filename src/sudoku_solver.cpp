#include "sudoku_solver.hpp"

#include <algorithm>
#include <bit>

#include <opencv2/core/utils/logger.hpp>

#include "constraint_engine.hpp"
#include "propagation.hpp"

/**
 * Backtracking search over the candidate domains of the current grid.
 * 1. Propagation: naked and hidden singles are committed before each guess and
 *    reverted through the trail when the node fails.
 * 2. MRV heuristic: always branch on the empty cell with the fewest candidates.
 * Consistent clues are a precondition of the search, so solve() rejects grids with
 * duplicate values up front.
 */

SudokuSolver::SudokuSolver(SolverOptions options) : options(options) {}

bool SudokuSolver::solve(SudokuGrid& grid) {
    rng = nullptr;
    return run(grid);
}

bool SudokuSolver::fill(SudokuGrid& grid, std::mt19937& generator) {
    rng = &generator;
    bool ok = run(grid);
    rng = nullptr;
    return ok;
}

std::optional<SudokuGrid> SudokuSolver::solved(const SudokuGrid& puzzle) {
    SudokuGrid work = puzzle;
    if (!solve(work)) return std::nullopt;
    return work;
}

bool SudokuSolver::run(SudokuGrid& grid) {
    counters = SolverStats{};
    trail.clear();

    if (grid.has_conflicts()) {
        CV_LOG_DEBUG(NULL, "solver: input grid violates uniqueness, unsatisfiable");
        return false;
    }

    bool ok = solve_recursive(grid);
    CV_LOG_DEBUG(NULL, "solver: " << (ok ? "solved" : "unsatisfiable")
                 << " nodes=" << counters.nodes << " guesses=" << counters.guesses
                 << " backtracks=" << counters.backtracks
                 << " propagated=" << counters.propagated);
    return ok;
}

bool SudokuSolver::solve_recursive(SudokuGrid& grid) {
    ++counters.nodes;
    const size_t mark = trail.size();

    if (options.use_propagation) {
        bool consistent = propagate(grid, trail);
        counters.propagated += trail.size() - mark;
        if (!consistent) {
            undo_propagation(grid, trail, mark);
            ++counters.backtracks;
            return false;
        }
    }

    std::optional<CellChoice> choice = most_constrained_cell(grid);
    if (!choice) {
        return true; // All cells filled
    }

    std::vector<int> order = choice->candidates.values();
    if (rng) std::shuffle(order.begin(), order.end(), *rng);

    for (int val : order) {
        grid.set(choice->row, choice->col, val);
        ++counters.guesses;

        if (solve_recursive(grid)) {
            return true;
        }

        grid.clear(choice->row, choice->col);
    }

    // Dead cell or every candidate failed
    undo_propagation(grid, trail, mark);
    ++counters.backtracks;
    return false;
}

int SudokuSolver::count_solutions(SudokuGrid& grid, int limit) {
    counters = SolverStats{};
    trail.clear();
    rng = nullptr;
    if (limit <= 0 || grid.has_conflicts()) return 0;
    return count_recursive(grid, limit);
}

int SudokuSolver::count_recursive(SudokuGrid& grid, int limit) {
    ++counters.nodes;
    const size_t mark = trail.size();

    if (options.use_propagation && !propagate(grid, trail)) {
        undo_propagation(grid, trail, mark);
        return 0;
    }

    std::optional<CellChoice> choice = most_constrained_cell(grid);
    int found = 0;
    if (!choice) {
        found = 1;
    } else {
        uint16_t mask = choice->candidates.mask();
        while (mask && found < limit) {
            int val = std::countr_zero(mask) + 1;
            grid.set(choice->row, choice->col, val);
            found += count_recursive(grid, limit - found);
            grid.clear(choice->row, choice->col);
            mask &= (mask - 1);
        }
    }

    undo_propagation(grid, trail, mark);
    return found;
}
