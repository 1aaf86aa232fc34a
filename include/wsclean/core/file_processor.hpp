#pragma once

#include "wsclean/interfaces.hpp"
#include "wsclean/types.hpp"
#include <optional>
#include <string>

namespace wsclean {

enum class FileErrorKind {
    READ,
    WRITE
};

struct FileError {
    FileErrorKind kind;
    std::string detail;
};

struct ProcessResult {
    bool changed = false;
    std::optional<FileError> error;

    auto ok() const -> bool { return !error.has_value(); }
};

// Reads one file, normalizes it, and writes it back only when the content changed.
// The file system is borrowed; it must outlive the processor.
class FileProcessor {
public:
    FileProcessor(IFileSystem& filesystem, bool normalize_eof, bool dry_run = false);

    auto process(const std::string& path) -> ProcessResult;

    // process() folded into the per-file outcome consumed by the report
    auto clean(const std::string& path) -> FileOutcome;

private:
    IFileSystem& filesystem_;
    bool normalize_eof_;
    bool dry_run_;
};

} // namespace wsclean
