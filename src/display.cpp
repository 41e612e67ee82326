#include "riftcrawl/display.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

namespace riftcrawl {

namespace {

using namespace ftxui;

constexpr size_t kMaxFailedRows = 20;

std::string f1(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << v;
    return oss.str();
}

std::string duration_str(std::chrono::milliseconds ms) {
    auto secs = ms.count() / 1000;
    if (secs < 60) return f1(ms.count() / 1000.0) + "s";
    std::ostringstream oss;
    oss << secs / 3600 << "h " << std::setw(2) << std::setfill('0') << (secs / 60) % 60
        << "m " << std::setw(2) << secs % 60 << "s";
    return oss.str();
}

Color stop_color(StopReason reason) {
    switch (reason) {
        case StopReason::Exhausted:
        case StopReason::Ceiling:
            return Color::Green;
        case StopReason::Deadline:
        case StopReason::Signal:
            return Color::Yellow;
        case StopReason::StorageFailure:
        case StopReason::ClientRejected:
            return Color::Red;
    }
    return Color::White;
}

Element stat_box(const std::string& label, const std::string& value, Color c) {
    return vbox({
        text(value) | bold | color(c) | center,
        text(label) | dim | center,
    }) | size(WIDTH, EQUAL, 16) | borderLight;
}

Element failed_table(const std::vector<std::vector<std::string>>& body, size_t total) {
    if (body.empty()) return text("No failed entries.") | dim;

    std::vector<std::vector<std::string>> rows;
    rows.push_back({"Kind", "Region", "Id", "Attempts", "Reason"});
    rows.insert(rows.end(), body.begin(), body.end());

    auto table = Table(rows);
    table.SelectRow(0).Decorate(bold);
    table.SelectRow(0).SeparatorVertical(LIGHT);
    table.SelectAll().Border(LIGHT);
    table.SelectColumn(4).Decorate(color(Color::Red));
    table.SelectCell(4, 0).Decorate(color(Color::White));

    Elements out{table.Render()};
    if (total > body.size()) {
        out.push_back(text("  ... and " + std::to_string(total - body.size()) + " more") | dim);
    }
    return vbox(out);
}

} // namespace

Element render_summary(const CrawlSummary& summary) {
    std::vector<std::vector<std::string>> failed;
    for (auto& f : summary.failures) {
        if (failed.size() >= kMaxFailedRows) break;
        failed.push_back({to_string(f.kind), f.ref.region, f.ref.id,
                          std::to_string(f.attempts), f.reason});
    }

    return vbox({
        hbox({
            text(" Crawl finished") | bold,
            text("  |  "),
            text("stop: " + to_string(summary.stop_reason)) | bold |
                color(stop_color(summary.stop_reason)),
            text("  |  "),
            text("elapsed " + duration_str(summary.elapsed)),
        }) | borderLight | color(Color::Cyan),
        hbox({
            stat_box("Stored (run)", std::to_string(summary.matches_stored), Color::Green),
            stat_box("Stored (total)", std::to_string(summary.total_matches), Color::Cyan),
            stat_box("Players", std::to_string(summary.players_crawled), Color::White),
            stat_box("Filtered", std::to_string(summary.matches_filtered), Color::Yellow),
        }),
        hbox({
            stat_box("Retries", std::to_string(summary.retries), Color::Yellow),
            stat_box("Rate limited", std::to_string(summary.rate_limited), Color::Yellow),
            stat_box("Storage errors", std::to_string(summary.storage_errors),
                     summary.storage_errors ? Color::Red : Color::White),
            stat_box("Failed", std::to_string(summary.failures.size()),
                     summary.failures.empty() ? Color::White : Color::Red),
        }),
        text(""),
        failed_table(failed, summary.failures.size()),
    });
}

Element render_status(const FrontierStats& stats, int64_t match_count,
                      const std::vector<FrontierEntry>& failed) {
    std::vector<std::vector<std::string>> rows;
    rows.push_back({"Kind", "Pending", "In flight", "Done", "Failed"});
    for (auto kind : {EntityKind::Player, EntityKind::Match}) {
        auto& c = stats.of(kind);
        rows.push_back({to_string(kind), std::to_string(c.pending), std::to_string(c.in_flight),
                        std::to_string(c.done), std::to_string(c.failed)});
    }

    auto table = Table(rows);
    table.SelectRow(0).Decorate(bold);
    table.SelectRow(0).SeparatorVertical(LIGHT);
    table.SelectAll().Border(LIGHT);
    table.SelectColumn(3).Decorate(color(Color::Green));
    table.SelectColumn(4).Decorate(color(Color::Red));
    table.SelectRow(0).Decorate(color(Color::White));

    std::vector<std::vector<std::string>> failed_rows;
    for (auto& e : failed) {
        if (failed_rows.size() >= kMaxFailedRows) break;
        failed_rows.push_back({to_string(e.kind), e.ref.region, e.ref.id,
                               std::to_string(e.attempts), e.last_error});
    }

    return vbox({
        hbox({
            text(" Repository") | bold,
            text("  |  "),
            text("Matches stored: " + std::to_string(match_count)),
        }) | borderLight | color(Color::Cyan),
        text("Frontier") | bold | color(Color::Cyan),
        separator(),
        table.Render(),
        text(""),
        text("Failed entries") | bold | color(Color::Cyan),
        separator(),
        failed_table(failed_rows, failed.size()),
    });
}

Element render_build_report(const BuildReport& report) {
    return vbox({
        hbox({
            text(" Dataset") | bold,
            text("  |  "),
            text(report.path.string()),
            text("  |  "),
            text(duration_str(report.elapsed)) | dim,
        }) | borderLight | color(Color::Cyan),
        hbox({
            stat_box("Matches read", std::to_string(report.matches_read), Color::White),
            stat_box("Rows written", std::to_string(report.rows_written), Color::Green),
            stat_box("Skipped", std::to_string(report.skipped),
                     report.skipped ? Color::Yellow : Color::White),
        }),
    });
}

void print_element(Element doc, std::ostream& out) {
    auto screen = Screen::Create(Dimension::Fit(doc));
    Render(screen, doc);
    out << screen.ToString() << '\n';
}

void display_progress(int64_t stored, int64_t ceiling) {
    std::cerr << "\r  Stored " << stored;
    if (ceiling > 0) {
        std::cerr << "/" << ceiling << " (" << f1(100.0 * stored / ceiling) << "%)";
    }
    std::cerr << " matches" << std::flush;
}

} // namespace riftcrawl
