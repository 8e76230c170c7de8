#include <catch2/catch.hpp>

#include "hint_service.hpp"
#include "sudoku_error.hpp"
#include "test_grids.hpp"

TEST_CASE("hint on the last empty cell completes the grid", "[hint]") {
    const SudokuGrid solution = classic_solution();
    for (Cell cell : {Cell{0, 0}, Cell{4, 4}, Cell{8, 8}, Cell{3, 6}}) {
        SudokuGrid g = solution;
        g.clear(cell.first, cell.second);

        Hint h = hint(g, cell.first, cell.second);
        REQUIRE(h.value == solution.get(cell.first, cell.second));
        REQUIRE(h.forced);
        REQUIRE(h.rule == Rule::NakedSingle);
    }
}

TEST_CASE("hint on a filled cell", "[hint]") {
    try {
        hint(classic_puzzle(), 0, 0);
        FAIL("expected SudokuError");
    } catch (const SudokuError& e) {
        REQUIRE(e.kind() == ErrorKind::CellOccupied);
    }
}

TEST_CASE("hint reports forced values", "[hint]") {
    SudokuGrid g = classic_puzzle();

    SECTION("naked single") {
        Hint h = hint(g, 4, 4);
        REQUIRE(h.value == 5);
        REQUIRE(h.rule == Rule::NakedSingle);
        REQUIRE(h.reasoning == "Naked single: cell (5, 5) must be 5 (only possibility)");
    }

    SECTION("hidden single among several candidates") {
        Hint h = hint(g, 2, 6);
        REQUIRE(h.candidates.values() == std::vector<int>{1, 3, 4, 5, 7});
        REQUIRE(h.value == 5);
        REQUIRE(h.forced);
        REQUIRE(h.rule == Rule::HiddenSingleRow);
    }

    SECTION("hidden single on a sparse grid") {
        SudokuGrid sparse = grid_with({{1, 4, 1}, {2, 7, 1}, {4, 1, 1}, {7, 2, 1}});
        REQUIRE_FALSE(sparse.has_conflicts());
        Hint h = hint(sparse, 0, 0);
        REQUIRE(h.value == 1);
        REQUIRE(h.candidates.size() == 9);
        REQUIRE(h.rule == Rule::HiddenSingleRow);
    }
}

TEST_CASE("hint falls back to the smallest candidate", "[hint]") {
    SECTION("empty grid") {
        Hint h = hint(SudokuGrid(), 3, 3);
        REQUIRE(h.value == 1);
        REQUIRE_FALSE(h.forced);
        REQUIRE_FALSE(h.rule);
    }

    SECTION("classic puzzle cell without a forced value") {
        SudokuGrid g = classic_puzzle();
        Hint h = hint(g, 0, 2);
        REQUIRE_FALSE(h.forced);
        REQUIRE(h.value == 1);
        REQUIRE(h.reasoning.find("[1, 2, 4]") != std::string::npos);
    }

    SECTION("dead cell") {
        SudokuGrid g = grid_with({{0, 0, 1}, {0, 1, 2}, {0, 2, 3}, {0, 3, 4}, {0, 4, 5},
                                  {0, 5, 6}, {0, 6, 7}, {0, 7, 8}, {1, 8, 9}});
        Hint h = hint(g, 0, 8);
        REQUIRE(h.value == 0);
        REQUIRE(h.candidates.empty());
        REQUIRE(h.reasoning.find("no valid possibilities") != std::string::npos);
    }
}

TEST_CASE("hint is deterministic", "[hint]") {
    SudokuGrid g = classic_puzzle();
    REQUIRE(hint(g, 0, 2).value == hint(g, 0, 2).value);
    REQUIRE(g == classic_puzzle());
}

TEST_CASE("explain lists exclusions by unit", "[hint]") {
    SudokuGrid g = classic_puzzle();
    Explanation e = explain(g, 0, 2);

    REQUIRE(e.current == 0);
    REQUIRE(e.candidates.values() == std::vector<int>{1, 2, 4});
    REQUIRE(e.row_values.values() == std::vector<int>{3, 5, 7});
    REQUIRE(e.col_values.values() == std::vector<int>{8});
    REQUIRE(e.box_values.values() == std::vector<int>{3, 5, 6, 8, 9});

    REQUIRE(e.exclusions.size() == 6);
    const Exclusion& three = e.exclusions[0];
    REQUIRE(three.value == 3);
    REQUIRE(three.by_row);
    REQUIRE_FALSE(three.by_col);
    REQUIRE(three.by_box);

    const Exclusion& eight = e.exclusions[4];
    REQUIRE(eight.value == 8);
    REQUIRE_FALSE(eight.by_row);
    REQUIRE(eight.by_col);
    REQUIRE(eight.by_box);

    REQUIRE(g == classic_puzzle());

    const std::string text = describe(e);
    REQUIRE(text.find("Valid candidates: [1, 2, 4]") != std::string::npos);
    REQUIRE(text.find("Column 3 contains: [8]") != std::string::npos);
    REQUIRE(text.find("7 by row") != std::string::npos);
}

TEST_CASE("explain on filled and empty neighbourhoods", "[hint]") {
    Explanation filled = explain(classic_puzzle(), 0, 0);
    REQUIRE(filled.current == 5);
    REQUIRE(filled.exclusions.empty());
    REQUIRE(describe(filled) == "Cell (1, 1) is already filled with 5\n");

    Explanation open = explain(SudokuGrid(), 4, 4);
    REQUIRE(open.candidates == DigitSet::all());
    REQUIRE(open.exclusions.empty());
    REQUIRE(describe(open).find("Row 5 contains: none") != std::string::npos);
}

TEST_CASE("best cell and next forced move", "[hint]") {
    SudokuGrid g = classic_puzzle();

    REQUIRE(best_cell(g) == Cell{4, 4});
    REQUIRE(best_cell(SudokuGrid()) == Cell{0, 0});
    REQUIRE_FALSE(best_cell(classic_solution()));

    // Dead cell (0,8) is passed over; the solver's selection would stop on it
    SudokuGrid dead = grid_with({{0, 0, 1}, {0, 1, 2}, {0, 2, 3}, {0, 3, 4}, {0, 4, 5},
                                 {0, 5, 6}, {0, 6, 7}, {0, 7, 8}, {1, 8, 9}});
    REQUIRE(best_cell(dead) == Cell{1, 0});

    std::optional<Deduction> move = next_forced_move(g);
    REQUIRE(move);
    REQUIRE(*move == Deduction{4, 4, 5, Rule::NakedSingle});

    SudokuGrid sparse = grid_with({{1, 4, 1}, {2, 7, 1}, {4, 1, 1}, {7, 2, 1}});
    REQUIRE_FALSE(sparse.has_conflicts());
    REQUIRE(next_forced_move(sparse) == Deduction{0, 0, 1, Rule::HiddenSingleRow});

    REQUIRE_FALSE(next_forced_move(SudokuGrid()));
}
