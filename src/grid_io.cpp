#include "grid_io.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "sudoku_error.hpp"

namespace {

bool has_storage_extension(const std::string& path) {
    for (const char* ext : {".yml", ".yaml", ".json", ".xml", ".yml.gz", ".yaml.gz", ".json.gz"}) {
        const std::string e(ext);
        if (path.size() >= e.size() && path.compare(path.size() - e.size(), e.size(), e) == 0) return true;
    }
    return false;
}

SudokuGrid read_grid_node(const cv::FileNode& node, const std::string& key) {
    if (node.empty() || !node.isSeq()) {
        throw SudokuError(ErrorKind::MalformedGrid, "'" + key + "' must be a sequence");
    }

    if (node.size() == SudokuGrid::CELL_COUNT) {
        std::vector<int> flat;
        node >> flat;
        SudokuGrid::Cells cells;
        std::copy(flat.begin(), flat.end(), cells.begin());
        return SudokuGrid(cells);
    }

    if (node.size() == SudokuGrid::N) {
        std::vector<std::vector<int>> rows;
        for (const cv::FileNode& row : node) {
            std::vector<int> values;
            row >> values;
            rows.push_back(std::move(values));
        }
        return SudokuGrid::from_rows(rows);
    }

    throw SudokuError(ErrorKind::MalformedGrid,
                      "'" + key + "' has " + std::to_string(node.size()) + " entries, expected 81 or 9 rows");
}

std::vector<int> flatten(const SudokuGrid& grid) {
    return std::vector<int>(grid.cells().begin(), grid.cells().end());
}

}

SudokuGrid parse_grid(const std::string& text) {
    SudokuGrid::Cells cells;
    size_t count = 0;

    for (char ch : text) {
        if (ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n' || ch == '|' || ch == '-' || ch == '+')
            continue;

        int value;
        if (ch == '.' || ch == '0') value = SudokuGrid::EMPTY;
        else if (ch >= '1' && ch <= '9') value = ch - '0';
        else throw SudokuError(ErrorKind::MalformedGrid, std::string("unexpected character '") + ch + "'");

        if (count == cells.size()) {
            throw SudokuError(ErrorKind::MalformedGrid, "more than 81 cells");
        }
        cells[count++] = value;
    }

    if (count != cells.size()) {
        throw SudokuError(ErrorKind::MalformedGrid, "expected 81 cells, got " + std::to_string(count));
    }
    return SudokuGrid(cells);
}

std::string format_grid(const SudokuGrid& grid) {
    std::string out;
    out.reserve(SudokuGrid::CELL_COUNT);
    for (int v : grid.cells()) out.push_back(v == SudokuGrid::EMPTY ? '.' : static_cast<char>('0' + v));
    return out;
}

GridDocument read_grid_file(const std::string& path) {
    if (!has_storage_extension(path)) {
        std::ifstream in(path);
        if (!in) throw SudokuError(ErrorKind::MalformedGrid, "cannot open " + path);
        std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        return GridDocument{parse_grid(text), std::nullopt};
    }

    try {
        cv::FileStorage fs(path, cv::FileStorage::READ);
        if (!fs.isOpened()) throw SudokuError(ErrorKind::MalformedGrid, "cannot open " + path);

        GridDocument doc{read_grid_node(fs["grid"], "grid"), std::nullopt};
        cv::FileNode solution = fs["solution"];
        if (!solution.empty()) doc.solution = read_grid_node(solution, "solution");
        return doc;
    } catch (const cv::Exception& e) {
        throw SudokuError(ErrorKind::MalformedGrid, "cannot parse " + path + ": " + e.msg);
    }
}

void write_puzzle_file(const std::string& path, const Puzzle& puzzle) {
    if (!has_storage_extension(path)) {
        throw SudokuError(ErrorKind::MalformedGrid, "puzzle files must be .yml, .yaml, .json or .xml: " + path);
    }

    try {
        cv::FileStorage fs(path, cv::FileStorage::WRITE);
        if (!fs.isOpened()) throw SudokuError(ErrorKind::MalformedGrid, "cannot write " + path);

        fs << "difficulty" << std::string(to_string(puzzle.difficulty));
        fs << "cleared" << puzzle.cleared;
        fs << "grid" << flatten(puzzle.puzzle);
        fs << "solution" << flatten(puzzle.solution);
        fs.release();
    } catch (const cv::Exception& e) {
        throw SudokuError(ErrorKind::MalformedGrid, "cannot write " + path + ": " + e.msg);
    }
}
