#pragma once

#include "auction_engine.hpp"
#include "campaign.hpp"
#include "impression.hpp"
#include "pacing_controller.hpp"
#include "stats.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <random>
#include <span>
#include <string>
#include <vector>

namespace adsim {

struct SimulationConfig {
    std::size_t impressions{100'000};
    double day_length_s{kSecondsPerDay};
    PricingRule pricing{PricingRule::FirstPrice};
    std::uint64_t seed{10};
    ImpressionSourceConfig impression_source{};
    PacingConfig pacing{};
    double target_jitter{0.1};
    std::filesystem::path output_dir{};

    void validate() const;
};

struct CampaignSummary {
    std::size_t id{0};
    std::string type;
    std::vector<std::string> tags;
    double daily_budget{0.0};
    double hurdle{1.0};
    Summary totals;
    FullStat::HourlyStats hours{};
};

struct SimulationResult {
    std::size_t auctions{0};
    std::size_t failed_auctions{0};
    FullStat global;
    StatsAggregator::TypeStats per_type;
    std::vector<CampaignSummary> campaigns;
};

class Simulation {
public:
    explicit Simulation(SimulationConfig config, std::unique_ptr<ImpressionSource> source = nullptr);

    // Returns the new campaign's id, which is its index in the roster.
    std::size_t add_campaign(CampaignConfig campaign, std::unique_ptr<BiddingStrategy> strategy);

    // Plays the whole day once.
    SimulationResult run();

    [[nodiscard]] const SimulationConfig& config() const noexcept { return config_; }
    [[nodiscard]] std::span<const Campaign> campaigns() const noexcept { return campaigns_; }
    [[nodiscard]] const Campaign& campaign(std::size_t id) const;
    [[nodiscard]] const StatsAggregator& stats() const noexcept { return stats_; }

private:
    [[nodiscard]] double time_of(std::size_t index) const noexcept;
    SimulationResult collect(std::size_t failed_auctions) const;

    SimulationConfig config_;
    std::mt19937_64 rng_;
    std::unique_ptr<ImpressionSource> source_;
    std::vector<Campaign> campaigns_;
    StatsAggregator stats_;
    bool finished_{false};
};

SimulationConfig default_day_config();

// The reference roster: an unlimited back-stop bidder, three small fixed-cpc
// campaigns, a miscalibrated target-cpc campaign, a linearly throttled one and
// an adaptive pacer, all with a budget of 100 except the back-stop.
void add_default_roster(Simulation& simulation);

} // namespace adsim
