#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <functional>

#include "engine_config.hpp"
#include "grid_io.hpp"
#include "puzzle_generator.hpp"
#include "sudoku_error.hpp"
#include "test_grids.hpp"

namespace {

const std::string DATA_DIR = std::string(SUDOKU_SOURCE_DIR) + "/tests/data/";

ErrorKind kind_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const SudokuError& e) {
        return e.kind();
    }
    FAIL("expected SudokuError");
    return ErrorKind::ConfigError;
}

}

TEST_CASE("difficulty names", "[config]") {
    REQUIRE(parse_difficulty("medium") == Difficulty::Medium);
    REQUIRE(parse_difficulty("Expert") == Difficulty::Expert);
    REQUIRE_FALSE(parse_difficulty("impossible"));
    REQUIRE(std::string(to_string(Difficulty::Beginner)) == "beginner");
}

TEST_CASE("default configuration", "[config]") {
    EngineConfig config;
    REQUIRE(config.seed == 0);
    REQUIRE(config.use_propagation);
    REQUIRE_FALSE(config.require_unique);
    REQUIRE(config.clear_count(Difficulty::Beginner) == 15);
    REQUIRE(config.clear_count(Difficulty::Expert) == 65);
    REQUIRE_NOTHROW(validate_config(config));
}

TEST_CASE("configuration from YAML", "[config]") {
    EngineConfig config = parse_config(
        "%YAML:1.0\n"
        "seed: 17\n"
        "require_unique: 1\n"
        "use_propagation: \"false\"\n"
        "clear_counts:\n"
        "   hard: 55\n"
        "log_level: INFO\n");

    REQUIRE(config.seed == 17);
    REQUIRE(config.require_unique);
    REQUIRE_FALSE(config.use_propagation);
    REQUIRE(config.clear_count(Difficulty::Hard) == 55);
    REQUIRE(config.clear_count(Difficulty::Medium) == 40);
    REQUIRE(config.log_level == "info");
}

TEST_CASE("configuration from JSON", "[config]") {
    EngineConfig config = parse_config(R"({ "seed": 5, "clear_counts": { "expert": 70 } })");
    REQUIRE(config.seed == 5);
    REQUIRE(config.clear_count(Difficulty::Expert) == 70);
}

TEST_CASE("seeds across the full 32-bit range", "[config]") {
    REQUIRE(parse_seed("0") == 0u);
    REQUIRE(parse_seed("3000000000") == 3000000000u);
    REQUIRE(parse_seed("4294967295") == 4294967295u);
    REQUIRE(kind_of([] { parse_seed("4294967296"); }) == ErrorKind::ConfigError);
    REQUIRE(kind_of([] { parse_seed("-1"); }) == ErrorKind::ConfigError);
    REQUIRE(kind_of([] { parse_seed("12abc"); }) == ErrorKind::ConfigError);
    REQUIRE(kind_of([] { parse_seed(""); }) == ErrorKind::ConfigError);

    REQUIRE(parse_config("%YAML:1.0\nseed: \"3000000000\"\n").seed == 3000000000u);
    REQUIRE(parse_config(R"({ "seed": "4000000000" })").seed == 4000000000u);
    REQUIRE(kind_of([] { parse_config("%YAML:1.0\nseed: \"-7\"\n"); }) == ErrorKind::ConfigError);
}

TEST_CASE("shipped configuration file loads", "[config]") {
    EngineConfig config = load_config(std::string(SUDOKU_SOURCE_DIR) + "/config/engine.yml");
    REQUIRE(config.clear_counts == EngineConfig().clear_counts);
    REQUIRE(config.log_level == "warning");
}

TEST_CASE("invalid configurations", "[config]") {
    REQUIRE(kind_of([] { parse_config("%YAML:1.0\nclear_counts:\n   easy: 90\n"); }) == ErrorKind::ConfigError);
    REQUIRE(kind_of([] { parse_config("%YAML:1.0\nclear_counts:\n   easy: 10\n"); }) == ErrorKind::ConfigError);
    REQUIRE(kind_of([] { parse_config("%YAML:1.0\nseed: -4\n"); }) == ErrorKind::ConfigError);
    REQUIRE(kind_of([] { parse_config("%YAML:1.0\nrequire_unique: maybe\n"); }) == ErrorKind::ConfigError);
    REQUIRE(kind_of([] { load_config(DATA_DIR + "missing.yml"); }) == ErrorKind::ConfigError);
    REQUIRE(kind_of([] { apply_log_level("chatty"); }) == ErrorKind::ConfigError);
    REQUIRE_NOTHROW(apply_log_level("warning"));
}

TEST_CASE("text grid form", "[io]") {
    SudokuGrid g = parse_grid(
        "5 3 . | . 7 . | . . .\n"
        "6 . . | 1 9 5 | . . .\n"
        ". 9 8 | . . . | . 6 .\n"
        "------+-------+------\n"
        "8 . . | . 6 . | . . 3\n"
        "4 . . | 8 . 3 | . . 1\n"
        "7 . . | . 2 . | . . 6\n"
        "------+-------+------\n"
        ". 6 . | . . . | 2 8 .\n"
        ". . . | 4 1 9 | . . 5\n"
        ". . . | . 8 . | . 7 9\n");
    REQUIRE(g == classic_puzzle());
    REQUIRE(format_grid(g) == "53..7....6..195....98....6.8...6...34..8.3..17...2...6.6....28....419..5....8..79");
    REQUIRE(parse_grid(std::string(81, '0')) == SudokuGrid());

    REQUIRE(kind_of([] { parse_grid(std::string(80, '.')); }) == ErrorKind::MalformedGrid);
    REQUIRE(kind_of([] { parse_grid(std::string(82, '.')); }) == ErrorKind::MalformedGrid);
    REQUIRE(kind_of([] { parse_grid("x" + std::string(80, '.')); }) == ErrorKind::MalformedGrid);
}

TEST_CASE("grid files", "[io]") {
    GridDocument text = read_grid_file(DATA_DIR + "classic.txt");
    REQUIRE(text.grid == classic_puzzle());
    REQUIRE_FALSE(text.solution);

    GridDocument json = read_grid_file(DATA_DIR + "classic.json");
    REQUIRE(json.grid == classic_puzzle());

    REQUIRE(kind_of([] { read_grid_file(DATA_DIR + "missing.txt"); }) == ErrorKind::MalformedGrid);
}

TEST_CASE("generated puzzle file", "[io]") {
    EngineConfig config;
    config.seed = 9;
    Puzzle p = PuzzleGenerator(config).generate(Difficulty::Hard);

    const std::filesystem::path path = std::filesystem::temp_directory_path() / "sudoku_engine_puzzle.yml";
    write_puzzle_file(path.string(), p);

    GridDocument doc = read_grid_file(path.string());
    REQUIRE(doc.grid == p.puzzle);
    REQUIRE(doc.solution == p.solution);
    std::filesystem::remove(path);
}

TEST_CASE("puzzle file targets are checked", "[io]") {
    EngineConfig config;
    config.seed = 9;
    Puzzle p = PuzzleGenerator(config).generate(Difficulty::Easy);

    const std::filesystem::path text = std::filesystem::temp_directory_path() / "sudoku_engine_puzzle.txt";
    REQUIRE(kind_of([&] { write_puzzle_file(text.string(), p); }) == ErrorKind::MalformedGrid);
    REQUIRE_FALSE(std::filesystem::exists(text));

    const std::filesystem::path unreachable =
        std::filesystem::temp_directory_path() / "sudoku_engine_no_such_dir" / "puzzle.yml";
    REQUIRE(kind_of([&] { write_puzzle_file(unreachable.string(), p); }) == ErrorKind::MalformedGrid);
}

TEST_CASE("malformed grid document", "[io]") {
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "sudoku_engine_bad.json";
    {
        std::ofstream out(path);
        out << R"({ "grid": [1, 2, 3] })";
    }
    REQUIRE(kind_of([&] { read_grid_file(path.string()); }) == ErrorKind::MalformedGrid);
    std::filesystem::remove(path);
}
