#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
    InvalidValue,   // value outside the accepted range for the operation
    CellOccupied,   // hint or placement requested on a non-empty cell
    MalformedGrid,  // wrong dimensions or unparsable input
    ClueProtected,  // attempt to overwrite a clue of a game session
    ConfigError     // unreadable or inconsistent configuration
};

const char* to_string(ErrorKind kind);

class SudokuError : public std::runtime_error {
public:
    SudokuError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return errorKind; }

private:
    ErrorKind errorKind;
};
