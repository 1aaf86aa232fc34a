#pragma once

#include "wsclean/types.hpp"
#include <string>
#include <variant>
#include <vector>

namespace wsclean::cli {

struct HelpRequested {};

struct UsageError {
    std::string message;
};

using ParseResult = std::variant<Config, HelpRequested, UsageError>;

// args excludes the program name
auto parse_args(const std::vector<std::string>& args) -> ParseResult;

auto usage_text() -> std::string;

} // namespace wsclean::cli
