#include "sudoku_error.hpp"

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidValue:  return "InvalidValue";
        case ErrorKind::CellOccupied:  return "CellOccupied";
        case ErrorKind::MalformedGrid: return "MalformedGrid";
        case ErrorKind::ClueProtected: return "ClueProtected";
        case ErrorKind::ConfigError:   return "ConfigError";
    }
    return "Unknown";
}

SudokuError::SudokuError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(to_string(kind)) + ": " + message),
      errorKind(kind) {}
