#pragma once

#include "wsclean/types.hpp"
#include <span>
#include <string>
#include <string_view>

namespace wsclean::core {

// Text transformation functions (pure)

// Split on '\n', keeping each terminator attached to its line.
// Empty content yields no lines.
auto split_lines_inclusive(std::string_view content) -> LineSequence;

auto render_lines(std::span<const std::string> lines) -> std::string;

// Strips trailing Unicode whitespace (ASCII and the UTF-8 encoded White_Space set)
auto trim_trailing_whitespace(std::string_view text) -> std::string_view;

auto is_blank(std::string_view text) -> bool;

// Trim one line and re-terminate it when it had a newline or normalize_eof is set
auto normalize_line(std::string_view raw_line, bool normalize_eof) -> std::string;

// Normalize a whole file. With normalize_eof, trailing blank lines are dropped
// so the file ends on its last non-blank line.
auto normalize_lines(std::span<const std::string> lines, bool normalize_eof)
    -> NormalizationResult;

// split_lines_inclusive + normalize_lines + render_lines
auto normalize_content(std::string_view content, bool normalize_eof) -> NormalizedContent;

auto is_valid_utf8(std::string_view bytes) -> bool;

} // namespace wsclean::core
