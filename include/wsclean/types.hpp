#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace wsclean {

// Lines of one file in order, each with its '\n' still attached if it had one
using LineSequence = std::vector<std::string>;

struct NormalizationResult {
    LineSequence lines;
    bool changed = false;
};

// Whole-file form of NormalizationResult
struct NormalizedContent {
    std::string content;
    bool changed = false;
};

// Per-file outcomes. Closed set, matched with std::visit.
struct Cleaned {
    std::string path;
};

struct Skipped {
    std::string path;  // Already clean, nothing written
};

struct ReadError {
    std::string path;
    std::string detail;
};

struct WriteError {
    std::string path;
    std::string detail;
};

using FileOutcome = std::variant<Cleaned, Skipped, ReadError, WriteError>;

// Entries produced by the tree walker
struct DirEntry {
    std::string path;
    bool is_regular_file = false;
    std::optional<std::string> extension;  // Without the leading dot
};

struct TraversalError {
    std::string path;
    std::string detail;
};

using WalkEntry = std::variant<DirEntry, TraversalError>;

struct Config {
    std::string root;
    bool normalize_eof_newlines = true;
    std::optional<std::vector<std::string>> extensions;  // nullopt = every file
    bool dry_run = false;
    bool verbose = false;
    bool color = true;
};

// A file that could not be cleaned, as shown in the report
struct FileFailure {
    std::string path;
    std::string detail;
};

struct RunStats {
    size_t files_checked{};
    size_t files_cleaned{};
    size_t files_unchanged{};
    size_t files_failed{};
    size_t traversal_errors{};
    std::chrono::milliseconds duration{0};
};

struct RunReport {
    std::vector<std::string> cleaned;
    std::vector<FileFailure> not_cleaned;
    std::vector<TraversalError> traversal_errors;
    RunStats stats;
    bool dry_run = false;

    auto has_failures() const -> bool { return !not_cleaned.empty() || !traversal_errors.empty(); }
};

// Fatal configuration problem, raised before any file is touched
class ApplicationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace wsclean
