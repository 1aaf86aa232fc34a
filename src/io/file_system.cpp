#include "wsclean/io/file_system.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <unistd.h>
#include <vector>

namespace wsclean {

auto FileSystem::read_file(const std::string& path) -> ReadResult {
    std::ifstream file(path, std::ios::binary);

    if (!file.is_open()) {
        return ReadResult{.content = std::nullopt,
                          .error = std::string("cannot open file: ") + std::strerror(errno)};
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return ReadResult{.content = std::nullopt, .error = "I/O error while reading file"};
    }

    return ReadResult{.content = std::move(content), .error = ""};
}

auto FileSystem::write_file(const std::string& path, const std::string& content)
    -> std::optional<std::string> {
    std::error_code ec;

    // Symlinks are written through: the link stays, its target is replaced
    auto target = std::filesystem::canonical(path, ec);
    if (ec) {
        return "cannot resolve path: " + ec.message();
    }

    // Replacing by rename only needs a writable directory
    if (::access(target.c_str(), W_OK) != 0) {
        return std::string("file is not writable: ") + std::strerror(errno);
    }

    // Write to temporary file first, then atomically replace the original
    auto temp_path = make_temp_path(target);
    if (!temp_path) {
        return std::string("cannot choose a temporary file name");
    }

    {
        std::ofstream file(*temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return std::string("cannot create temporary file: ") + std::strerror(errno);
        }

        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.flush();
        if (file.fail()) {
            file.close();
            std::filesystem::remove(*temp_path, ec);
            return std::string("cannot write temporary file");
        }
    } // File automatically closed here

    // The replacement keeps the original's permission bits
    auto original = std::filesystem::status(target, ec);
    if (!ec) {
        std::filesystem::permissions(*temp_path, original.permissions(),
                                     std::filesystem::perm_options::replace, ec);
    }
    if (ec) {
        auto detail = "cannot copy permissions: " + ec.message();
        std::filesystem::remove(*temp_path, ec);
        return detail;
    }

    std::filesystem::rename(*temp_path, target, ec);
    if (ec) {
        auto detail = "cannot replace file: " + ec.message();
        std::filesystem::remove(*temp_path, ec);
        return detail;
    }

    return std::nullopt;
}

auto FileSystem::is_temp_file(const std::filesystem::path& path) -> bool {
    return path.filename().string().ends_with(TEMP_SUFFIX);
}

auto FileSystem::make_temp_path(const std::filesystem::path& target)
    -> std::optional<std::filesystem::path> {
    // <file>.<pid>-<n>.wsclean.tmp, never an existing file
    for (int attempt = 0; attempt < 100; ++attempt) {
        std::filesystem::path candidate = target.string() + "." + std::to_string(::getpid()) +
                                          "-" + std::to_string(temp_counter_++) + TEMP_SUFFIX;
        std::error_code ec;
        if (!std::filesystem::exists(std::filesystem::symlink_status(candidate, ec))) {
            return candidate;
        }
    }
    return std::nullopt;
}

auto FileSystem::is_directory(const std::string& path) -> bool {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec) && !ec;
}

auto FileSystem::for_each_entry(const std::string& root,
                                const std::function<void(const WalkEntry&)>& visit) -> void {
    walk_directory(root, visit);
}

auto FileSystem::walk_directory(const std::filesystem::path& directory,
                                const std::function<void(const WalkEntry&)>& visit) -> void {
    std::error_code ec;
    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        visit(TraversalError{.path = directory.string(), .detail = ec.message()});
        return;
    }

    std::vector<std::filesystem::directory_entry> entries;
    while (it != std::filesystem::directory_iterator()) {
        entries.push_back(*it);
        it.increment(ec);
        if (ec) {
            visit(TraversalError{.path = directory.string(), .detail = ec.message()});
            break;
        }
    }

    std::ranges::sort(entries, [](const auto& lhs, const auto& rhs) {
        return lhs.path().filename() < rhs.path().filename();
    });

    for (const auto& entry : entries) {
        const auto& path = entry.path();

        auto link_status = entry.symlink_status(ec);
        if (ec) {
            visit(TraversalError{.path = path.string(), .detail = ec.message()});
            continue;
        }

        // Symlinked directories are not descended
        if (std::filesystem::is_directory(link_status)) {
            visit(make_dir_entry(path, false));
            walk_directory(path, visit);
            continue;
        }

        // Follows symlinks, so a dangling link surfaces here
        auto target_status = entry.status(ec);
        if (ec) {
            visit(TraversalError{.path = path.string(), .detail = ec.message()});
            continue;
        }

        if (is_temp_file(path)) {
            visit(TraversalError{.path = path.string(),
                                 .detail = "leftover temporary file from an interrupted run"});
            continue;
        }

        visit(make_dir_entry(path, std::filesystem::is_regular_file(target_status)));
    }
}

auto FileSystem::make_dir_entry(const std::filesystem::path& path, bool is_regular_file)
    -> DirEntry {
    std::optional<std::string> extension;
    auto raw_extension = path.extension().string();
    if (raw_extension.size() > 1) {
        extension = raw_extension.substr(1);
    }

    return DirEntry{.path = path.string(), .is_regular_file = is_regular_file,
                    .extension = extension};
}

} // namespace wsclean
