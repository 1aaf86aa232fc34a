#include "wsclean/core/file_filter.hpp"
#include <algorithm>

namespace wsclean::core {

auto normalize_extension(std::string_view extension) -> std::string {
    auto first = extension.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return "";
    }
    auto last = extension.find_last_not_of(" \t");
    extension = extension.substr(first, last - first + 1);

    if (extension.starts_with('.')) {
        extension.remove_prefix(1);
    }
    return std::string(extension);
}

auto should_process(const DirEntry& entry,
                    const std::optional<std::vector<std::string>>& extensions) -> bool {
    if (!entry.is_regular_file) {
        return false;
    }
    if (!extensions) {
        return true;
    }
    if (!entry.extension) {
        return false;
    }
    return std::ranges::any_of(*extensions, [&entry](const std::string& wanted) {
        return normalize_extension(wanted) == *entry.extension;
    });
}

} // namespace wsclean::core
