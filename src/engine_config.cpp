#include "engine_config.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/core/utils/logger.hpp>

#include "sudoku_error.hpp"

namespace {

const std::array<const char*, DIFFICULTY_COUNT> DIFFICULTY_NAMES = {
    "beginner", "easy", "medium", "hard", "expert"
};

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return s;
}

bool read_flag(const cv::FileNode& node, bool fallback) {
    if (node.empty()) return fallback;
    if (node.isString()) {
        std::string s = lowercase(static_cast<std::string>(node));
        if (s == "true" || s == "yes" || s == "on" || s == "1") return true;
        if (s == "false" || s == "no" || s == "off" || s == "0") return false;
        throw SudokuError(ErrorKind::ConfigError, "'" + node.name() + "' is not a boolean: " + s);
    }
    return static_cast<int>(node) != 0;
}

EngineConfig read_config(const cv::FileStorage& fs) {
    EngineConfig config;

    cv::FileNode seed = fs["seed"];
    if (seed.isString()) {
        config.seed = parse_seed(static_cast<std::string>(seed));
    } else if (seed.isInt()) {
        int value = static_cast<int>(seed);
        if (value < 0) throw SudokuError(ErrorKind::ConfigError, "seed must be non-negative");
        config.seed = static_cast<uint32_t>(value);
    } else if (!seed.empty()) {
        throw SudokuError(ErrorKind::ConfigError, "seed must be an integer or a decimal string");
    }

    config.use_propagation = read_flag(fs["use_propagation"], config.use_propagation);
    config.require_unique = read_flag(fs["require_unique"], config.require_unique);

    cv::FileNode counts = fs["clear_counts"];
    if (!counts.empty()) {
        if (!counts.isMap()) {
            throw SudokuError(ErrorKind::ConfigError, "'clear_counts' must map tier names to counts");
        }
        for (int i = 0; i < DIFFICULTY_COUNT; ++i) {
            cv::FileNode n = counts[DIFFICULTY_NAMES[i]];
            if (!n.empty()) config.clear_counts[i] = static_cast<int>(n);
        }
    }

    cv::FileNode level = fs["log_level"];
    if (!level.empty()) config.log_level = lowercase(static_cast<std::string>(level));

    validate_config(config);
    return config;
}

EngineConfig open_and_read(const std::string& source, int flags, const std::string& what) {
    try {
        cv::FileStorage fs(source, flags);
        if (!fs.isOpened()) {
            throw SudokuError(ErrorKind::ConfigError, "cannot open " + what);
        }
        return read_config(fs);
    } catch (const cv::Exception& e) {
        throw SudokuError(ErrorKind::ConfigError, "cannot parse " + what + ": " + e.msg);
    }
}

}

const char* to_string(Difficulty d) {
    return DIFFICULTY_NAMES[static_cast<int>(d)];
}

std::optional<Difficulty> parse_difficulty(const std::string& name) {
    const std::string key = lowercase(name);
    for (int i = 0; i < DIFFICULTY_COUNT; ++i) {
        if (key == DIFFICULTY_NAMES[i]) return static_cast<Difficulty>(i);
    }
    return std::nullopt;
}

EngineConfig load_config(const std::string& path) {
    return open_and_read(path, cv::FileStorage::READ, "config file " + path);
}

EngineConfig parse_config(const std::string& document) {
    return open_and_read(document, cv::FileStorage::READ | cv::FileStorage::MEMORY, "config document");
}

uint32_t parse_seed(const std::string& text) {
    const bool digits = !text.empty() && text.size() <= 10 &&
                        std::all_of(text.begin(), text.end(),
                                    [](unsigned char ch) { return std::isdigit(ch) != 0; });
    if (!digits) throw SudokuError(ErrorKind::ConfigError, "seed is not a decimal number: " + text);

    const unsigned long long value = std::stoull(text);
    if (value > std::numeric_limits<uint32_t>::max()) {
        throw SudokuError(ErrorKind::ConfigError, "seed " + text + " does not fit in 32 bits");
    }
    return static_cast<uint32_t>(value);
}

void validate_config(const EngineConfig& config) {
    for (int i = 0; i < DIFFICULTY_COUNT; ++i) {
        const int n = config.clear_counts[i];
        if (n < 0 || n > 81) {
            throw SudokuError(ErrorKind::ConfigError,
                              std::string("clear count for ") + DIFFICULTY_NAMES[i] + " is outside 0..81");
        }
        if (i > 0 && n < config.clear_counts[i - 1]) {
            throw SudokuError(ErrorKind::ConfigError,
                              std::string("clear count for ") + DIFFICULTY_NAMES[i] +
                              " is lower than the previous tier");
        }
    }
}

void apply_log_level(const std::string& level) {
    using namespace cv::utils::logging;
    const std::string key = lowercase(level);
    LogLevel l;
    if (key == "silent") l = LOG_LEVEL_SILENT;
    else if (key == "fatal") l = LOG_LEVEL_FATAL;
    else if (key == "error") l = LOG_LEVEL_ERROR;
    else if (key == "warning") l = LOG_LEVEL_WARNING;
    else if (key == "info") l = LOG_LEVEL_INFO;
    else if (key == "debug") l = LOG_LEVEL_DEBUG;
    else if (key == "verbose") l = LOG_LEVEL_VERBOSE;
    else throw SudokuError(ErrorKind::ConfigError, "unknown log level: " + level);
    setLogLevel(l);
}
