#pragma once

#include "stats.hpp"

#include <array>
#include <cstddef>
#include <filesystem>
#include <ostream>
#include <span>
#include <string>

namespace adsim {

struct CampaignSummary;
struct SimulationResult;

using HourlySeries = std::array<double, kHoursPerDay>;

[[nodiscard]] HourlySeries hourly_spend(const FullStat::HourlyStats& hours) noexcept;
[[nodiscard]] HourlySeries hourly_cpm(const FullStat::HourlyStats& hours) noexcept;
[[nodiscard]] HourlySeries hourly_cpc(const FullStat::HourlyStats& hours) noexcept;

// "CID: 3, Type: FixedCPC, Tags: [a, b], impressions: ..., cpm: ..."
[[nodiscard]] std::string format_campaign_line(const CampaignSummary& campaign);

// Column chart, one column per value, `height` rows plus an hour axis.
[[nodiscard]] std::string render_hourly_chart(std::span<const double> series, std::size_t height = 10);

void write_text_report(std::ostream& out, const SimulationResult& result);

// campaigns.csv and hourly.csv under `directory`.
void write_csv_reports(const std::filesystem::path& directory, const SimulationResult& result);

} // namespace adsim
