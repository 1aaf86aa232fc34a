#include "wsclean/application/wsclean_app.hpp"
#include "wsclean/core/file_filter.hpp"
#include "wsclean/core/file_processor.hpp"
#include "wsclean/core/run_report.hpp"
#include "wsclean/ui/report_view.hpp"
#include <chrono>
#include <iostream>

namespace wsclean {

WsCleanApp::WsCleanApp(std::unique_ptr<IFileSystem> filesystem)
    : filesystem_(std::move(filesystem)) {}

auto WsCleanApp::run(const Config& config) -> int {
    RunReport report;
    try {
        report = clean_tree(config);
    } catch (const ApplicationError& error) {
        std::cerr << "Error: " << error.what() << "\n";
        return EXIT_FATAL;
    }

    std::cout << ui::render_report(report, config.color) << "\n";
    return report.has_failures() ? EXIT_FILE_ERRORS : EXIT_CLEAN;
}

auto WsCleanApp::clean_tree(const Config& config) -> RunReport {
    if (!filesystem_->is_directory(config.root)) {
        throw ApplicationError("invalid root path: " + config.root);
    }

    auto started = std::chrono::steady_clock::now();

    FileProcessor processor(*filesystem_, config.normalize_eof_newlines, config.dry_run);
    RunReport report;
    report.dry_run = config.dry_run;

    filesystem_->for_each_entry(config.root, [&](const WalkEntry& entry) {
        if (const auto* error = std::get_if<TraversalError>(&entry)) {
            report = core::accumulate_traversal_error(std::move(report), *error);
            return;
        }

        const auto& dir_entry = std::get<DirEntry>(entry);
        if (!core::should_process(dir_entry, config.extensions)) {
            return;
        }

        if (config.verbose) {
            std::cerr << "Checking " << dir_entry.path << "\n";
        }
        report = core::accumulate_outcome(std::move(report), processor.clean(dir_entry.path));
    });

    report.stats.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return report;
}

} // namespace wsclean
