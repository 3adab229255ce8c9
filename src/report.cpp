#include "report.hpp"

#include "simulation.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace adsim {

namespace {

constexpr int kLabelWidth = 10;

std::string join_tags(const std::vector<std::string>& tags) {
    std::string joined = "[";
    for (std::size_t i = 0; i < tags.size(); ++i) {
        if (i > 0) {
            joined += ", ";
        }
        joined += tags[i];
    }
    joined += ']';
    return joined;
}

std::ofstream open_csv(const std::filesystem::path& path) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("failed to open " + path.string() + " for writing");
    }
    out.setf(std::ios::fixed);
    out << std::setprecision(6);
    return out;
}

void write_hour_rows(std::ofstream& out, const std::string& scope, const FullStat::HourlyStats& hours) {
    for (std::size_t hour = 0; hour < hours.size(); ++hour) {
        const Stat& stat = hours[hour];
        out << scope << ','
            << hour << ','
            << stat.impressions << ','
            << stat.clicks << ','
            << stat.spend << ','
            << stat.cpc() << ','
            << stat.cpm() << '\n';
    }
}

} // namespace

HourlySeries hourly_spend(const FullStat::HourlyStats& hours) noexcept {
    HourlySeries series{};
    for (std::size_t i = 0; i < hours.size(); ++i) {
        series[i] = hours[i].spend;
    }
    return series;
}

HourlySeries hourly_cpm(const FullStat::HourlyStats& hours) noexcept {
    HourlySeries series{};
    for (std::size_t i = 0; i < hours.size(); ++i) {
        series[i] = hours[i].cpm();
    }
    return series;
}

HourlySeries hourly_cpc(const FullStat::HourlyStats& hours) noexcept {
    HourlySeries series{};
    for (std::size_t i = 0; i < hours.size(); ++i) {
        series[i] = hours[i].cpc();
    }
    return series;
}

std::string format_campaign_line(const CampaignSummary& campaign) {
    std::ostringstream oss;
    oss << "CID: " << campaign.id
        << ", Type: " << campaign.type
        << ", Tags: " << join_tags(campaign.tags)
        << ", impressions: " << campaign.totals.impressions
        << ", clicks: " << campaign.totals.clicks
        << std::fixed
        << ", spend: " << std::setprecision(2) << campaign.totals.spend
        << ", cpc: " << std::setprecision(3) << campaign.totals.cpc
        << ", cpm: " << std::setprecision(3) << campaign.totals.cpm;
    return oss.str();
}

std::string render_hourly_chart(std::span<const double> series, std::size_t height) {
    std::ostringstream oss;
    if (series.empty() || height == 0) {
        return oss.str();
    }

    const double peak = *std::max_element(series.begin(), series.end());
    oss << std::fixed << std::setprecision(3);
    for (std::size_t row = height; row > 0; --row) {
        const double level = peak * static_cast<double>(row) / static_cast<double>(height);
        oss << std::setw(kLabelWidth) << level << " |";
        for (double value : series) {
            // Half-row rounding so a value exactly at the level fills the cell.
            const bool filled = peak > 0.0 && value >= level - 0.5 * peak / static_cast<double>(height);
            oss << (filled ? " #" : "  ");
        }
        oss << '\n';
    }
    oss << std::string(kLabelWidth, ' ') << " +" << std::string(series.size() * 2, '-') << '\n';
    oss << std::string(kLabelWidth, ' ') << "  ";
    for (std::size_t i = 0; i < series.size(); ++i) {
        oss << std::setw(2) << (i % 100);
    }
    oss << '\n';
    return oss.str();
}

void write_text_report(std::ostream& out, const SimulationResult& result) {
    for (const auto& campaign : result.campaigns) {
        out << format_campaign_line(campaign) << '\n';
    }

    const Summary total = summarize(result.global);
    out << std::fixed
        << "TOTAL -- Impressions: " << total.impressions
        << ", Clicks: " << total.clicks
        << ", Spend: " << std::setprecision(2) << total.spend
        << ", Auctions without bidder: " << result.failed_auctions << '\n';
    out << "Price mean: " << std::setprecision(5) << total.mean_price
        << ", std-dev: " << total.price_stddev << '\n';

    for (const auto& [type, stat] : result.per_type) {
        const Summary summary = summarize(stat);
        out << "TYPE " << type
            << " -- impressions: " << summary.impressions
            << ", clicks: " << summary.clicks
            << ", spend: " << std::setprecision(2) << summary.spend
            << ", cpc: " << std::setprecision(3) << summary.cpc
            << ", cpm: " << summary.cpm << '\n';
    }
}

void write_csv_reports(const std::filesystem::path& directory, const SimulationResult& result) {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        throw std::runtime_error("failed to create directory " + directory.string() + ": " + ec.message());
    }

    std::ofstream campaigns = open_csv(directory / "campaigns.csv");
    campaigns << "id,type,tags,daily_budget,hurdle,impressions,clicks,spend,cpc,cpm,mean_price,price_stddev\n";
    for (const auto& campaign : result.campaigns) {
        std::string tags;
        for (const auto& tag : campaign.tags) {
            if (!tags.empty()) {
                tags += ';';
            }
            tags += tag;
        }
        campaigns << campaign.id << ','
                  << campaign.type << ','
                  << tags << ','
                  << campaign.daily_budget << ','
                  << campaign.hurdle << ','
                  << campaign.totals.impressions << ','
                  << campaign.totals.clicks << ','
                  << campaign.totals.spend << ','
                  << campaign.totals.cpc << ','
                  << campaign.totals.cpm << ','
                  << campaign.totals.mean_price << ','
                  << campaign.totals.price_stddev << '\n';
    }

    std::ofstream hourly = open_csv(directory / "hourly.csv");
    hourly << "scope,hour,impressions,clicks,spend,cpc,cpm\n";
    write_hour_rows(hourly, "global", result.global.hours());
    for (const auto& campaign : result.campaigns) {
        write_hour_rows(hourly, "campaign_" + std::to_string(campaign.id), campaign.hours);
    }
}

} // namespace adsim
