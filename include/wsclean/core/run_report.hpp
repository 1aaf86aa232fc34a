#pragma once

#include "wsclean/types.hpp"

namespace wsclean::core {

// Report folding (pure). Unchanged files only count toward the statistics.
auto accumulate_outcome(RunReport report, const FileOutcome& outcome) -> RunReport;
auto accumulate_traversal_error(RunReport report, const TraversalError& error) -> RunReport;

} // namespace wsclean::core
