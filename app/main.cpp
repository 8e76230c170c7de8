#include <chrono>
#include <iostream>
#include <optional>
#include <string>

#include <opencv2/core.hpp>

#include "engine_config.hpp"
#include "grid_io.hpp"
#include "hint_service.hpp"
#include "sudoku_engine.hpp"
#include "sudoku_error.hpp"

namespace {

const char* const keys =
    "{help h usage ? |       | print this message }"
    "{@command       |       | generate, solve, hint, explain or validate }"
    "{input i        |       | puzzle file: 81-character text, .yml or .json }"
    "{output o       |       | write the generated puzzle and solution to this .yml/.json file }"
    "{difficulty d   |medium | beginner, easy, medium, hard or expert }"
    "{seed s         |       | generator seed, 0 draws a random one }"
    "{config c       |       | engine configuration file (.yml/.json) }"
    "{row r          |       | 1-based row for hint and explain }"
    "{col            |       | 1-based column for hint and explain }"
    "{unique u       |       | keep only clue removals that preserve a unique solution }"
    "{verbose v      |       | log solver and generator details }";

using Clock = std::chrono::high_resolution_clock;

long long elapsed_us(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start).count();
}

SudokuGrid load_input(const cv::CommandLineParser& parser) {
    if (!parser.has("input")) {
        throw SudokuError(ErrorKind::MalformedGrid, "--input is required for this command");
    }
    return read_grid_file(parser.get<std::string>("input")).grid;
}

std::optional<Cell> requested_cell(const cv::CommandLineParser& parser) {
    if (!parser.has("row") && !parser.has("col")) return std::nullopt;
    if (!parser.has("row") || !parser.has("col")) {
        throw SudokuError(ErrorKind::InvalidValue, "--row and --col must be given together");
    }
    const int row = parser.get<int>("row");
    const int col = parser.get<int>("col");
    if (row < 1 || row > 9 || col < 1 || col > 9) {
        throw SudokuError(ErrorKind::InvalidValue, "--row and --col must be within 1..9");
    }
    return Cell{row - 1, col - 1};
}

int run_generate(SudokuEngine& engine, const cv::CommandLineParser& parser) {
    const std::string name = parser.get<std::string>("difficulty");
    std::optional<Difficulty> difficulty = parse_difficulty(name);
    if (!difficulty) {
        throw SudokuError(ErrorKind::InvalidValue, "unknown difficulty: " + name);
    }

    auto start = Clock::now();
    Puzzle puzzle = engine.generate(*difficulty);
    std::cout << "Generation took: " << elapsed_us(start) << " microseconds (seed "
              << engine.seed() << ")\n\n";

    std::cout << "Puzzle (" << to_string(puzzle.difficulty) << ", " << puzzle.cleared
              << " cells cleared):\n" << puzzle.puzzle << "\n";
    std::cout << "Solution:\n" << puzzle.solution;

    if (parser.has("output")) {
        const std::string path = parser.get<std::string>("output");
        write_puzzle_file(path, puzzle);
        std::cout << "\nSaved: " << path << std::endl;
    }
    return 0;
}

int run_solve(SudokuEngine& engine, const cv::CommandLineParser& parser) {
    SudokuGrid puzzle = load_input(parser);
    std::cout << "Solving puzzle:\n" << puzzle;

    auto start = Clock::now();
    SolveResult result = engine.solve(puzzle);
    const long long us = elapsed_us(start);

    std::cout << "\nStatus: " << (result.solved() ? "Solved" : "Unsatisfiable") << "\n";
    std::cout << "Time: " << us << " microseconds\n";
    const SolverStats& stats = engine.last_solve_stats();
    std::cout << "Nodes: " << stats.nodes << ", guesses: " << stats.guesses
              << ", propagated: " << stats.propagated << "\n\n";

    if (!result.solved()) {
        std::cout << "Could not solve the sudoku (invalid configuration)." << std::endl;
        return 1;
    }
    std::cout << *result.solution;
    return 0;
}

int run_hint(SudokuEngine& engine, const cv::CommandLineParser& parser) {
    SudokuGrid grid = load_input(parser);
    std::optional<Cell> cell = requested_cell(parser);

    if (!cell) {
        if (std::optional<Deduction> move = next_forced_move(grid)) {
            std::cout << describe(*move) << std::endl;
            return 0;
        }
        if (std::optional<Cell> best = best_cell(grid)) {
            Hint h = engine.hint(grid, best->first, best->second);
            std::cout << "No forced move. Most constrained cell: (" << best->first + 1 << ", "
                      << best->second + 1 << ")\n" << h.reasoning << std::endl;
            return 0;
        }
        std::cout << "No empty cell with candidates left." << std::endl;
        return validate(grid) == GameState::Win ? 0 : 1;
    }

    Hint h = engine.hint(grid, cell->first, cell->second);
    std::cout << h.reasoning << std::endl;
    if (h.value == 0) return 1;
    std::cout << "Hint: " << h.value << (h.forced ? " (forced)" : " (best guess)") << std::endl;
    return 0;
}

int run_explain(const cv::CommandLineParser& parser) {
    SudokuGrid grid = load_input(parser);
    std::optional<Cell> cell = requested_cell(parser);
    if (!cell) {
        throw SudokuError(ErrorKind::InvalidValue, "explain needs --row and --col");
    }
    std::cout << describe(explain(grid, cell->first, cell->second));
    return 0;
}

int run_validate(SudokuEngine& engine, const cv::CommandLineParser& parser) {
    SudokuGrid grid = load_input(parser);
    GameState state = engine.validate(grid);
    std::cout << to_string(state) << std::endl;
    return state == GameState::Invalid ? 1 : 0;
}

}

int main(int argc, char* argv[]) {
    cv::CommandLineParser parser(argc, argv, keys);
    parser.about("Sudoku engine: generate, solve, hint, explain and validate 9x9 puzzles");

    if (parser.has("help") || !parser.has("@command")) {
        parser.printMessage();
        return parser.has("help") ? 0 : 2;
    }

    try {
        const std::string command = parser.get<std::string>("@command");

        EngineConfig config;
        if (parser.has("config")) config = load_config(parser.get<std::string>("config"));
        if (parser.has("seed")) config.seed = parse_seed(parser.get<std::string>("seed"));
        if (parser.has("unique")) config.require_unique = true;

        if (!parser.check()) {
            parser.printErrors();
            return 2;
        }

        apply_log_level(parser.has("verbose") ? "debug" : config.log_level);
        SudokuEngine engine(config);

        if (command == "generate") return run_generate(engine, parser);
        if (command == "solve") return run_solve(engine, parser);
        if (command == "hint") return run_hint(engine, parser);
        if (command == "explain") return run_explain(parser);
        if (command == "validate") return run_validate(engine, parser);

        std::cerr << "Unknown command: " << command << std::endl;
        parser.printMessage();
        return 2;
    } catch (const SudokuError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    } catch (const cv::Exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }
}
