#pragma once

#include "wsclean/types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wsclean::core {

// "rs", ".rs" and " rs " all name the same extension
auto normalize_extension(std::string_view extension) -> std::string;

// Regular files only; without a filter every regular file qualifies.
// Matching is exact and case-sensitive.
auto should_process(const DirEntry& entry,
                    const std::optional<std::vector<std::string>>& extensions) -> bool;

} // namespace wsclean::core
