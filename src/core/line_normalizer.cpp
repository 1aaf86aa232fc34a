#include "wsclean/core/line_normalizer.hpp"
#include <array>

namespace wsclean::core {

namespace {

constexpr std::string_view kAsciiWhitespace = " \t\n\v\f\r";

// UTF-8 encodings of the non-ASCII White_Space code points
constexpr std::array<std::string_view, 19> kUnicodeWhitespace = {
    "\xC2\x85",      // U+0085 NEXT LINE
    "\xC2\xA0",      // U+00A0 NO-BREAK SPACE
    "\xE1\x9A\x80",  // U+1680 OGHAM SPACE MARK
    "\xE2\x80\x80", "\xE2\x80\x81", "\xE2\x80\x82", "\xE2\x80\x83",
    "\xE2\x80\x84", "\xE2\x80\x85", "\xE2\x80\x86", "\xE2\x80\x87",
    "\xE2\x80\x88", "\xE2\x80\x89", "\xE2\x80\x8A",  // U+2000..U+200A
    "\xE2\x80\xA8",  // U+2028 LINE SEPARATOR
    "\xE2\x80\xA9",  // U+2029 PARAGRAPH SEPARATOR
    "\xE2\x80\xAF",  // U+202F NARROW NO-BREAK SPACE
    "\xE2\x81\x9F",  // U+205F MEDIUM MATHEMATICAL SPACE
    "\xE3\x80\x80",  // U+3000 IDEOGRAPHIC SPACE
};

auto trailing_whitespace_width(std::string_view text) -> size_t {
    if (text.empty()) {
        return 0;
    }
    if (kAsciiWhitespace.find(text.back()) != std::string_view::npos) {
        return 1;
    }
    for (auto whitespace : kUnicodeWhitespace) {
        if (text.ends_with(whitespace)) {
            return whitespace.size();
        }
    }
    return 0;
}

auto is_continuation(unsigned char byte) -> bool {
    return (byte & 0xC0) == 0x80;
}

} // namespace

auto split_lines_inclusive(std::string_view content) -> LineSequence {
    LineSequence lines;
    size_t start = 0;

    while (start < content.size()) {
        auto newline = content.find('\n', start);
        if (newline == std::string_view::npos) {
            lines.emplace_back(content.substr(start));
            break;
        }
        lines.emplace_back(content.substr(start, newline - start + 1));
        start = newline + 1;
    }

    return lines;
}

auto render_lines(std::span<const std::string> lines) -> std::string {
    size_t total = 0;
    for (const auto& line : lines) {
        total += line.size();
    }

    std::string output;
    output.reserve(total);
    for (const auto& line : lines) {
        output += line;
    }
    return output;
}

auto trim_trailing_whitespace(std::string_view text) -> std::string_view {
    while (auto width = trailing_whitespace_width(text)) {
        text.remove_suffix(width);
    }
    return text;
}

auto is_blank(std::string_view text) -> bool {
    return trim_trailing_whitespace(text).empty();
}

auto normalize_line(std::string_view raw_line, bool normalize_eof) -> std::string {
    const bool line_has_newline = raw_line.ends_with('\n');

    std::string cleaned(trim_trailing_whitespace(raw_line));
    if (normalize_eof || line_has_newline) {
        cleaned += '\n';
    }
    return cleaned;
}

auto normalize_lines(std::span<const std::string> lines, bool normalize_eof)
    -> NormalizationResult {
    NormalizationResult result;
    result.lines.reserve(lines.size());

    for (const auto& line : lines) {
        result.lines.push_back(normalize_line(line, normalize_eof));
    }

    if (normalize_eof) {
        while (!result.lines.empty() && is_blank(result.lines.back())) {
            result.lines.pop_back();
        }
    }

    result.changed = render_lines(result.lines) != render_lines(lines);
    return result;
}

auto normalize_content(std::string_view content, bool normalize_eof) -> NormalizedContent {
    auto lines = split_lines_inclusive(content);
    auto result = normalize_lines(lines, normalize_eof);
    return NormalizedContent{.content = render_lines(result.lines), .changed = result.changed};
}

auto is_valid_utf8(std::string_view bytes) -> bool {
    size_t i = 0;
    while (i < bytes.size()) {
        auto lead = static_cast<unsigned char>(bytes[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }

        size_t length = 0;
        char32_t code_point = 0;
        char32_t minimum = 0;
        if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code_point = lead & 0x1F;
            minimum = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code_point = lead & 0x0F;
            minimum = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code_point = lead & 0x07;
            minimum = 0x10000;
        } else {
            return false;
        }

        if (i + length > bytes.size()) {
            return false;
        }
        for (size_t k = 1; k < length; ++k) {
            auto byte = static_cast<unsigned char>(bytes[i + k]);
            if (!is_continuation(byte)) {
                return false;
            }
            code_point = (code_point << 6) | (byte & 0x3F);
        }

        // Overlong forms, UTF-16 surrogates and out-of-range values
        if (code_point < minimum || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }
        i += length;
    }
    return true;
}

} // namespace wsclean::core
