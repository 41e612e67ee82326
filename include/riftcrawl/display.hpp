#pragma once

#include "riftcrawl/collector.hpp"
#include "riftcrawl/feature_builder.hpp"
#include "riftcrawl/repository.hpp"
#include <iosfwd>
#include <vector>
#include <ftxui/dom/elements.hpp>

namespace riftcrawl {

ftxui::Element render_summary(const CrawlSummary& summary);

ftxui::Element render_status(const FrontierStats& stats, int64_t match_count,
                             const std::vector<FrontierEntry>& failed);

ftxui::Element render_build_report(const BuildReport& report);

// Renders at the element's natural size, for non-interactive output.
void print_element(ftxui::Element doc, std::ostream& out);

// Progress line on stderr, overwritten in place.
void display_progress(int64_t stored, int64_t ceiling);

} // namespace riftcrawl
