#pragma once

#include "wsclean/types.hpp"
#include <functional>
#include <optional>
#include <string>

namespace wsclean {

struct ReadResult {
    std::optional<std::string> content;  // Raw bytes, nullopt on failure
    std::string error;                   // Failure detail when content is empty
};

// Abstract interfaces for dependency injection
class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    virtual auto read_file(const std::string& path) -> ReadResult = 0;
    // Returns the failure detail, or nullopt when the write succeeded
    virtual auto write_file(const std::string& path, const std::string& content)
        -> std::optional<std::string> = 0;
    virtual auto is_directory(const std::string& path) -> bool = 0;
    // Visits every entry below root, one at a time, as the walk discovers them
    virtual auto for_each_entry(const std::string& root,
                                const std::function<void(const WalkEntry&)>& visit) -> void = 0;
};

} // namespace wsclean
