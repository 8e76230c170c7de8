#include "puzzle_generator.hpp"

#include <algorithm>
#include <limits>
#include <numeric>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/core/utils/logger.hpp>

namespace {

// Drawn seeds stay within 1..INT_MAX so they can be written back as a plain config integer
uint32_t resolve_seed(uint32_t configured) {
    if (configured != 0) return configured;
    std::random_device rd;
    std::uniform_int_distribution<uint32_t> dist(1, std::numeric_limits<int32_t>::max());
    return dist(rd);
}

}

PuzzleGenerator::PuzzleGenerator(const EngineConfig& config)
    : config(config),
      seedValue(resolve_seed(config.seed)),
      rng(seedValue),
      solver(SolverOptions{config.use_propagation}) {
    validate_config(config);
}

SudokuGrid PuzzleGenerator::random_solution() {
    SudokuGrid grid;
    const bool filled = solver.fill(grid, rng);
    // An empty grid always has a completion
    CV_Assert(filled);
    return grid;
}

Puzzle PuzzleGenerator::generate(Difficulty difficulty) {
    Puzzle out;
    out.difficulty = difficulty;
    out.solution = random_solution();
    out.puzzle = out.solution;

    const int target = config.clear_count(difficulty);

    std::vector<int> order(SudokuGrid::CELL_COUNT);
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), rng);

    for (int idx : order) {
        if (out.cleared >= target) break;

        const int r = idx / SudokuGrid::N;
        const int c = idx % SudokuGrid::N;
        out.puzzle.clear(r, c);

        if (config.require_unique && solver.count_solutions(out.puzzle, 2) != 1) {
            out.puzzle.set(r, c, out.solution.get(r, c));
            continue;
        }
        ++out.cleared;
    }

    if (out.cleared < target) {
        CV_LOG_WARNING(NULL, "generator: unique-solution constraint stopped at " << out.cleared
                       << " cleared cells, " << target << " requested");
    }
    CV_LOG_INFO(NULL, "generator: " << to_string(difficulty) << " puzzle, " << out.cleared
                << " cells cleared (seed " << seedValue << ")");
    return out;
}
