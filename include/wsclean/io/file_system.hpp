#pragma once

#include "wsclean/interfaces.hpp"
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace wsclean {

class FileSystem : public IFileSystem {
public:
    auto read_file(const std::string& path) -> ReadResult override;
    auto write_file(const std::string& path, const std::string& content)
        -> std::optional<std::string> override;
    auto is_directory(const std::string& path) -> bool override;
    auto for_each_entry(const std::string& root,
                        const std::function<void(const WalkEntry&)>& visit) -> void override;

    static constexpr const char* TEMP_SUFFIX = ".wsclean.tmp";

    static auto is_temp_file(const std::filesystem::path& path) -> bool;

private:
    auto make_temp_path(const std::filesystem::path& target)
        -> std::optional<std::filesystem::path>;
    auto walk_directory(const std::filesystem::path& directory,
                        const std::function<void(const WalkEntry&)>& visit) -> void;
    auto make_dir_entry(const std::filesystem::path& path, bool is_regular_file) -> DirEntry;

    size_t temp_counter_ = 0;
};

} // namespace wsclean
