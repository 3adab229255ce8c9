#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "report.hpp"
#include "simulation.hpp"

using adsim::CampaignSummary;
using adsim::HourlySeries;
using adsim::SimulationResult;

namespace {
CampaignSummary sample_campaign() {
    CampaignSummary campaign;
    campaign.id = 3;
    campaign.type = "FixedCPC";
    campaign.tags = {"a", "b"};
    campaign.daily_budget = 100.0;
    campaign.totals.impressions = 10;
    campaign.totals.clicks = 2;
    campaign.totals.spend = 1.5;
    campaign.totals.cpc = 0.75;
    campaign.totals.cpm = 150.0;
    return campaign;
}

SimulationResult sample_result() {
    SimulationResult result;
    result.auctions = 4;
    result.failed_auctions = 1;

    adsim::Impression impression;
    impression.time = 7200.0;
    impression.clicked = true;
    result.global.register_impression(impression, 0.5);
    result.global.register_click(impression);
    result.per_type["FixedCPC"].register_impression(impression, 0.5);

    CampaignSummary campaign = sample_campaign();
    campaign.hours[2].impressions = 1;
    campaign.hours[2].spend = 0.5;
    result.campaigns.push_back(campaign);
    return result;
}

std::size_t count_lines(const std::string& text) {
    return static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}
}

TEST_CASE("Campaign lines carry identity and totals") {
    CHECK(adsim::format_campaign_line(sample_campaign()) ==
          "CID: 3, Type: FixedCPC, Tags: [a, b], impressions: 10, clicks: 2, "
          "spend: 1.50, cpc: 0.750, cpm: 150.000");
}

TEST_CASE("Campaign lines show empty tag lists") {
    CampaignSummary campaign = sample_campaign();
    campaign.tags.clear();
    CHECK(adsim::format_campaign_line(campaign).find("Tags: [],") != std::string::npos);
}

TEST_CASE("Hourly series read per-hour stats") {
    adsim::FullStat::HourlyStats hours{};
    hours[5].impressions = 4;
    hours[5].clicks = 1;
    hours[5].spend = 2.0;

    CHECK(adsim::hourly_spend(hours)[5] == Catch::Approx(2.0));
    CHECK(adsim::hourly_cpm(hours)[5] == Catch::Approx(500.0));
    CHECK(adsim::hourly_cpc(hours)[5] == Catch::Approx(2.0));
    CHECK(adsim::hourly_cpm(hours)[6] == 0.0);
    CHECK(adsim::hourly_cpc(hours)[0] == 0.0);
}

TEST_CASE("Charts fill one column per value up to its height") {
    HourlySeries series{};
    series[2] = 4.0;
    series[7] = 2.0;

    const std::string chart = adsim::render_hourly_chart(series, 4);
    CHECK(count_lines(chart) == 4 + 2);
    // Peak column fills every row, the half-height one fills two.
    CHECK(std::count(chart.begin(), chart.end(), '#') == 4 + 2);

    const std::string top_row = chart.substr(0, chart.find('\n'));
    CHECK(top_row.find("4.000") != std::string::npos);
    CHECK(top_row.find('#') != std::string::npos);
}

TEST_CASE("Flat or empty series draw no bars") {
    const HourlySeries zeros{};
    const std::string chart = adsim::render_hourly_chart(zeros, 3);
    CHECK(count_lines(chart) == 3 + 2);
    CHECK(chart.find('#') == std::string::npos);

    CHECK(adsim::render_hourly_chart(std::span<const double>{}).empty());
    CHECK(adsim::render_hourly_chart(zeros, 0).empty());
}

TEST_CASE("Text report lists campaigns, totals and types") {
    std::ostringstream out;
    adsim::write_text_report(out, sample_result());
    const std::string text = out.str();

    CHECK(text.find("CID: 3, Type: FixedCPC") != std::string::npos);
    CHECK(text.find("TOTAL -- Impressions: 1, Clicks: 1, Spend: 0.50, Auctions without bidder: 1") !=
          std::string::npos);
    CHECK(text.find("Price mean: 0.50000") != std::string::npos);
    CHECK(text.find("TYPE FixedCPC -- impressions: 1") != std::string::npos);
}

TEST_CASE("CSV reports land in the output directory") {
    const auto directory = std::filesystem::temp_directory_path() / "adsim_report_test";
    std::filesystem::remove_all(directory);

    adsim::write_csv_reports(directory, sample_result());

    const std::string campaigns = read_file(directory / "campaigns.csv");
    CHECK(campaigns.rfind("id,type,tags,daily_budget,hurdle,impressions,clicks,spend,cpc,cpm,mean_price,price_stddev\n", 0) ==
          0);
    CHECK(campaigns.find("3,FixedCPC,a;b,100.000000,1.000000,10,2,1.500000") != std::string::npos);
    CHECK(count_lines(campaigns) == 2);

    const std::string hourly = read_file(directory / "hourly.csv");
    CHECK(hourly.rfind("scope,hour,impressions,clicks,spend,cpc,cpm\n", 0) == 0);
    CHECK(count_lines(hourly) == 1 + 2 * 24);
    CHECK(hourly.find("global,2,1,1,0.500000") != std::string::npos);
    CHECK(hourly.find("campaign_3,2,1,0,0.500000") != std::string::npos);

    std::filesystem::remove_all(directory);
}
