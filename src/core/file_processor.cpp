#include "wsclean/core/file_processor.hpp"
#include "wsclean/core/line_normalizer.hpp"

namespace wsclean {

FileProcessor::FileProcessor(IFileSystem& filesystem, bool normalize_eof, bool dry_run)
    : filesystem_(filesystem), normalize_eof_(normalize_eof), dry_run_(dry_run) {}

auto FileProcessor::process(const std::string& path) -> ProcessResult {
    auto read = filesystem_.read_file(path);
    if (!read.content) {
        return ProcessResult{.changed = false,
                             .error = FileError{.kind = FileErrorKind::READ, .detail = read.error}};
    }

    if (!core::is_valid_utf8(*read.content)) {
        return ProcessResult{
            .changed = false,
            .error = FileError{.kind = FileErrorKind::READ,
                               .detail = "stream did not contain valid UTF-8"}};
    }

    auto result = core::normalize_content(*read.content, normalize_eof_);

    // Untouched files keep their timestamps
    if (!result.changed || dry_run_) {
        return ProcessResult{.changed = result.changed, .error = std::nullopt};
    }

    if (auto write_error = filesystem_.write_file(path, result.content)) {
        return ProcessResult{
            .changed = false,
            .error = FileError{.kind = FileErrorKind::WRITE, .detail = *write_error}};
    }

    return ProcessResult{.changed = true, .error = std::nullopt};
}

auto FileProcessor::clean(const std::string& path) -> FileOutcome {
    auto result = process(path);

    if (result.error) {
        if (result.error->kind == FileErrorKind::READ) {
            return ReadError{.path = path, .detail = result.error->detail};
        }
        return WriteError{.path = path, .detail = result.error->detail};
    }

    if (result.changed) {
        return Cleaned{.path = path};
    }
    return Skipped{.path = path};
}

} // namespace wsclean
