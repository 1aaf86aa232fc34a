#include "wsclean/cli/arguments.hpp"
#include "wsclean/core/file_filter.hpp"
#include <optional>
#include <sstream>
#include <utility>

namespace wsclean::cli {

namespace {

auto is_option(const std::string& arg) -> bool {
    return arg.size() > 1 && arg[0] == '-';
}

// "rs,toml" -> {"rs", "toml"}
auto add_extensions(std::vector<std::string>& extensions, const std::string& value) -> void {
    std::istringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        auto extension = core::normalize_extension(item);
        if (!extension.empty()) {
            extensions.push_back(extension);
        }
    }
}

// Splits "--name=value" into its parts; value is empty without '='
auto split_inline_value(const std::string& arg) -> std::pair<std::string, std::optional<std::string>> {
    if (!arg.starts_with("--")) {
        return {arg, std::nullopt};
    }
    auto equals = arg.find('=');
    if (equals == std::string::npos) {
        return {arg, std::nullopt};
    }
    return {arg.substr(0, equals), arg.substr(equals + 1)};
}

} // namespace

auto parse_args(const std::vector<std::string>& args) -> ParseResult {
    Config config;
    bool have_path = false;

    for (size_t i = 0; i < args.size(); ++i) {
        auto [name, inline_value] = split_inline_value(args[i]);

        if (name == "-h" || name == "--help") {
            return HelpRequested{};
        } else if (name == "-p" || name == "--path") {
            if (inline_value) {
                config.root = *inline_value;
            } else if (i + 1 < args.size()) {
                config.root = args[++i];
            } else {
                return UsageError{.message = "missing value for " + name};
            }
            have_path = true;
        } else if (name == "-e" || name == "--extensions") {
            std::vector<std::string> extensions = config.extensions.value_or(std::vector<std::string>{});
            size_t before = extensions.size();

            if (inline_value) {
                add_extensions(extensions, *inline_value);
            } else {
                // Consume values up to the next option
                while (i + 1 < args.size() && !is_option(args[i + 1])) {
                    add_extensions(extensions, args[++i]);
                }
            }

            if (extensions.size() == before) {
                return UsageError{.message = "missing value for " + name};
            }
            config.extensions = std::move(extensions);
        } else if (name == "--no-eof-normalize") {
            config.normalize_eof_newlines = false;
        } else if (name == "-n" || name == "--dry-run") {
            config.dry_run = true;
        } else if (name == "-v" || name == "--verbose") {
            config.verbose = true;
        } else if (name == "--no-color") {
            config.color = false;
        } else {
            return UsageError{.message = "unknown argument: " + args[i]};
        }
    }

    if (!have_path || config.root.empty()) {
        return UsageError{.message = "missing required option --path"};
    }

    return config;
}

auto usage_text() -> std::string {
    std::ostringstream usage;
    usage << "Usage: wsclean --path <dir> [options]\n";
    usage << "Strip trailing whitespace and normalize end-of-file newlines below <dir>.\n\n";
    usage << "  -p, --path <dir>           Root directory to clean\n";
    usage << "  -e, --extensions <ext>...  Only clean files with these extensions (rs, .cpp, \"h,hpp\")\n";
    usage << "      --no-eof-normalize     Keep trailing blank lines and missing final newlines\n";
    usage << "  -n, --dry-run              Report files that would change without writing\n";
    usage << "  -v, --verbose              Log every file checked to stderr\n";
    usage << "      --no-color             Print the report without colors\n";
    usage << "  -h, --help                 Show this help\n";
    usage << "\nExamples:\n";
    usage << "  wsclean -p src -e cpp hpp          # Clean C++ sources under src/\n";
    usage << "  wsclean -p . --dry-run             # Preview every file below .\n";
    return usage.str();
}

} // namespace wsclean::cli
