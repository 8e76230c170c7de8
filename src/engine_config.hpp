#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

enum class Difficulty { Beginner, Easy, Medium, Hard, Expert };

constexpr int DIFFICULTY_COUNT = 5;

const char* to_string(Difficulty d);
std::optional<Difficulty> parse_difficulty(const std::string& name);

struct EngineConfig {
    uint32_t seed = 0;               // 0 draws a seed from std::random_device
    bool use_propagation = true;
    bool require_unique = false;     // generator keeps only removals that preserve a unique solution
    // Cells cleared per tier, indexed by Difficulty
    std::array<int, DIFFICULTY_COUNT> clear_counts{15, 30, 40, 50, 65};
    std::string log_level = "warning";

    int clear_count(Difficulty d) const { return clear_counts[static_cast<int>(d)]; }
};

// YAML/JSON/XML through cv::FileStorage. Keys missing from the document keep their defaults.
// FileStorage integers are 32-bit signed: seeds above 2147483647 must be given as strings.
// Throws SudokuError(ConfigError) on unreadable documents and invalid values.
EngineConfig load_config(const std::string& path);
EngineConfig parse_config(const std::string& document);

// Decimal seed in 0..4294967295. Throws SudokuError(ConfigError) on anything else.
uint32_t parse_seed(const std::string& text);

// Clear counts within 0..81 and non-decreasing from Beginner to Expert.
void validate_config(const EngineConfig& config);

// Maps "silent|fatal|error|warning|info|debug|verbose" onto the OpenCV log level.
void apply_log_level(const std::string& level);
