#include "wsclean/application/wsclean_app.hpp"
#include "wsclean/cli/arguments.hpp"
#include "wsclean/io/file_system.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

auto main(int argc, char* argv[]) -> int {
    std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = wsclean::cli::parse_args(args);

    if (std::holds_alternative<wsclean::cli::HelpRequested>(parsed)) {
        std::cout << wsclean::cli::usage_text();
        return wsclean::EXIT_CLEAN;
    }
    if (const auto* error = std::get_if<wsclean::cli::UsageError>(&parsed)) {
        std::cerr << "Error: " << error->message << "\n\n" << wsclean::cli::usage_text();
        return wsclean::EXIT_FATAL;
    }

    wsclean::WsCleanApp app(std::make_unique<wsclean::FileSystem>());
    return app.run(std::get<wsclean::Config>(parsed));
}
