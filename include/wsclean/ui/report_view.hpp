#pragma once

#include "wsclean/types.hpp"
#include <ftxui/dom/elements.hpp>
#include <string>

namespace wsclean::ui {

// Report composition (pure). Each non-empty category is a header followed by
// indented entries, then a one-line summary.
auto build_report_element(const RunReport& report, bool use_color) -> ftxui::Element;

auto format_summary(const RunReport& report) -> std::string;

// Renders the report through an ftxui::Screen sized to its content
auto render_report(const RunReport& report, bool use_color) -> std::string;

} // namespace wsclean::ui
