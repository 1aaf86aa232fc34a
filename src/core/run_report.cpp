#include "wsclean/core/run_report.hpp"
#include <type_traits>

namespace wsclean::core {

auto accumulate_outcome(RunReport report, const FileOutcome& outcome) -> RunReport {
    ++report.stats.files_checked;

    std::visit(
        [&report](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, Cleaned>) {
                report.cleaned.push_back(value.path);
                ++report.stats.files_cleaned;
            } else if constexpr (std::is_same_v<T, Skipped>) {
                ++report.stats.files_unchanged;
            } else if constexpr (std::is_same_v<T, ReadError>) {
                report.not_cleaned.push_back(
                    FileFailure{.path = value.path, .detail = "read failed: " + value.detail});
                ++report.stats.files_failed;
            } else {
                static_assert(std::is_same_v<T, WriteError>, "unhandled FileOutcome alternative");
                report.not_cleaned.push_back(
                    FileFailure{.path = value.path, .detail = "write failed: " + value.detail});
                ++report.stats.files_failed;
            }
        },
        outcome);

    return report;
}

auto accumulate_traversal_error(RunReport report, const TraversalError& error) -> RunReport {
    report.traversal_errors.push_back(error);
    ++report.stats.traversal_errors;
    return report;
}

} // namespace wsclean::core
