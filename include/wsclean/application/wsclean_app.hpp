#pragma once

#include "wsclean/interfaces.hpp"
#include "wsclean/types.hpp"
#include <memory>

namespace wsclean {

enum ExitCode : int {
    EXIT_CLEAN = 0,          // Every visited file is clean now
    EXIT_FILE_ERRORS = 1,    // Some files or directories could not be handled
    EXIT_FATAL = 2           // Usage error or invalid root; nothing was touched
};

class WsCleanApp {
private:
    std::unique_ptr<IFileSystem> filesystem_;

public:
    explicit WsCleanApp(std::unique_ptr<IFileSystem> filesystem);

    // Cleans the tree, prints the report and returns the process exit code
    auto run(const Config& config) -> int;

    // Throws ApplicationError when the root is not a directory
    auto clean_tree(const Config& config) -> RunReport;
};

} // namespace wsclean
