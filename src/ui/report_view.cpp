#include "wsclean/ui/report_view.hpp"
#include "wsclean/core/line_normalizer.hpp"

#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/color.hpp>
#include <ftxui/screen/screen.hpp>

#include <algorithm>
#include <sstream>
#include <vector>

namespace wsclean::ui {

namespace {

constexpr const char* INDENT = "    ";

struct Section {
    std::string title;
    ftxui::Color color;
    std::vector<std::string> entries;
};

auto collect_sections(const RunReport& report) -> std::vector<Section> {
    std::vector<Section> sections;

    if (!report.cleaned.empty()) {
        sections.push_back(Section{.title = report.dry_run ? "Would clean:" : "Cleaned:",
                                   .color = ftxui::Color::Green,
                                   .entries = report.cleaned});
    }

    if (!report.not_cleaned.empty()) {
        Section section{.title = "Not cleaned:", .color = ftxui::Color::Yellow, .entries = {}};
        for (const auto& failure : report.not_cleaned) {
            section.entries.push_back(failure.path + " (" + failure.detail + ")");
        }
        sections.push_back(std::move(section));
    }

    if (!report.traversal_errors.empty()) {
        Section section{.title = "Traversal errors:", .color = ftxui::Color::Red, .entries = {}};
        for (const auto& error : report.traversal_errors) {
            section.entries.push_back(error.path + ": " + error.detail);
        }
        sections.push_back(std::move(section));
    }

    return sections;
}

auto content_width(const std::vector<Section>& sections, const std::string& summary) -> int {
    size_t width = summary.size();
    for (const auto& section : sections) {
        width = std::max(width, section.title.size());
        for (const auto& entry : section.entries) {
            width = std::max(width, entry.size() + std::string(INDENT).size());
        }
    }
    return static_cast<int>(std::max<size_t>(width, 1));
}

} // namespace

auto build_report_element(const RunReport& report, bool use_color) -> ftxui::Element {
    using namespace ftxui;

    Elements lines;
    for (const auto& section : collect_sections(report)) {
        auto header = text(section.title);
        if (use_color) {
            header = header | bold | color(section.color);
        }
        lines.push_back(header);

        for (const auto& entry : section.entries) {
            lines.push_back(text(INDENT + entry));
        }
    }

    lines.push_back(text(format_summary(report)));
    return vbox(std::move(lines));
}

auto format_summary(const RunReport& report) -> std::string {
    const auto& stats = report.stats;
    std::ostringstream summary;

    summary << "Checked " << stats.files_checked << " files: " << stats.files_cleaned
            << (report.dry_run ? " would be cleaned, " : " cleaned, ") << stats.files_unchanged
            << " already clean, " << stats.files_failed << " not cleaned, "
            << stats.traversal_errors << " traversal errors (" << stats.duration.count()
            << " ms)";

    return summary.str();
}

auto render_report(const RunReport& report, bool use_color) -> std::string {
    auto document = build_report_element(report, use_color);
    auto width = content_width(collect_sections(report), format_summary(report));

    auto screen =
        ftxui::Screen::Create(ftxui::Dimension::Fixed(width), ftxui::Dimension::Fit(document));
    ftxui::Render(screen, document);

    // Screen rows are padded to the full width
    std::istringstream rows(screen.ToString());
    std::string output;
    std::string row;
    bool first = true;
    while (std::getline(rows, row)) {
        if (!first) {
            output += '\n';
        }
        output += core::trim_trailing_whitespace(row);
        first = false;
    }
    return output;
}

} // namespace wsclean::ui
