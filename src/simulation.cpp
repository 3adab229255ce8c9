#include "simulation.hpp"

#include "error.hpp"
#include "report.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace adsim {

namespace {

constexpr double kBackstopBudget = 100'000.0;
constexpr double kRosterBudget = 100.0;

} // namespace

void SimulationConfig::validate() const {
    ADSIM_REQUIRE(impressions > 0, "simulation requires at least one impression");
    ADSIM_REQUIRE(day_length_s > 0.0 && day_length_s <= kSecondsPerDay,
                  "day length must lie in (0, 86400]");
    ADSIM_REQUIRE(target_jitter >= 0.0, "target jitter must be non-negative");
    pacing.validate();
}

SimulationConfig default_day_config() {
    return SimulationConfig{};
}

Simulation::Simulation(SimulationConfig config, std::unique_ptr<ImpressionSource> source)
    : config_(std::move(config)),
      rng_(config_.seed),
      source_(std::move(source)) {
    config_.validate();
    if (!source_) {
        source_ = std::make_unique<SyntheticImpressionSource>(config_.impression_source);
    }
}

std::size_t Simulation::add_campaign(CampaignConfig campaign, std::unique_ptr<BiddingStrategy> strategy) {
    ADSIM_REQUIRE(campaign.window.end <= config_.day_length_s, "campaign window extends past the simulated day");
    const std::size_t id = campaigns_.size();
    campaigns_.emplace_back(id, std::move(campaign), std::move(strategy));
    const Campaign& added = campaigns_.back();
    spdlog::debug("campaign {} registered: type={} budget={:.2f} hurdle={:.3f} window=[{:.0f}, {:.0f})",
                  id, added.type(), added.daily_budget(), added.hurdle(),
                  added.window().start, added.window().end);
    return id;
}

const Campaign& Simulation::campaign(std::size_t id) const {
    if (id >= campaigns_.size()) {
        throw std::out_of_range("no campaign with id " + std::to_string(id));
    }
    return campaigns_[id];
}

double Simulation::time_of(std::size_t index) const noexcept {
    return config_.day_length_s * static_cast<double>(index) / static_cast<double>(config_.impressions);
}

SimulationResult Simulation::run() {
    if (finished_) {
        throw std::logic_error("simulation already ran; build a new one for another day");
    }
    if (campaigns_.empty()) {
        spdlog::warn("simulation has no campaigns; every auction will fail");
    }

    spdlog::info("simulation start: impressions={} campaigns={} pricing={} seed={}",
                 config_.impressions, campaigns_.size(), to_string(config_.pricing), config_.seed);

    stats_.reset();
    AuctionEngine engine(config_.pricing, rng_);

    std::size_t failed = 0;
    for (std::size_t i = 0; i < config_.impressions; ++i) {
        const Impression impression = source_->next(static_cast<std::uint64_t>(i), time_of(i), rng_);
        const AuctionOutcome outcome = engine.run_one_auction(impression, campaigns_, stats_);
        if (!outcome.has_winner()) {
            ++failed;
        }
    }
    finished_ = true;

    if (failed > 0) {
        spdlog::warn("{} of {} auctions ended without a bidder", failed, config_.impressions);
    }

    SimulationResult result = collect(failed);
    const Summary total = summarize(result.global);
    spdlog::info("simulation complete: impressions={} clicks={} spend={:.2f} cpm={:.3f}",
                 total.impressions, total.clicks, total.spend, total.cpm);

    if (!config_.output_dir.empty()) {
        write_csv_reports(config_.output_dir, result);
        spdlog::info("csv reports written to {}", config_.output_dir.string());
    }
    return result;
}

SimulationResult Simulation::collect(std::size_t failed_auctions) const {
    SimulationResult result;
    result.auctions = config_.impressions;
    result.failed_auctions = failed_auctions;
    result.global = stats_.global();
    result.per_type = stats_.per_type();
    result.campaigns.reserve(campaigns_.size());
    for (const Campaign& campaign : campaigns_) {
        CampaignSummary summary;
        summary.id = campaign.id();
        summary.type = std::string(campaign.type());
        summary.tags = campaign.tags();
        summary.daily_budget = campaign.daily_budget();
        summary.hurdle = campaign.hurdle();
        summary.totals = summarize(campaign.stat());
        summary.hours = campaign.stat().hours();
        result.campaigns.push_back(std::move(summary));
    }
    return result;
}

void add_default_roster(Simulation& simulation) {
    const double jitter = simulation.config().target_jitter;
    const PacingConfig pacing = simulation.config().pacing;
    const double day = simulation.config().day_length_s;

    auto budget = [day](double amount, std::vector<std::string> tags) {
        CampaignConfig config;
        config.tags = std::move(tags);
        config.daily_budget = amount;
        config.window = TimeWindow{0.0, day};
        return config;
    };

    simulation.add_campaign(budget(kBackstopBudget, {"backstop"}), std::make_unique<FixedPriceStrategy>(0.05));
    for (int i = 0; i < 3; ++i) {
        simulation.add_campaign(budget(kRosterBudget, {}), std::make_unique<FixedPriceStrategy>(0.1));
    }
    simulation.add_campaign(budget(kRosterBudget, {"miscalibrated"}),
                            std::make_unique<TargetPriceStrategy>(0.1, 1.5, jitter));
    simulation.add_campaign(budget(kRosterBudget, {}), std::make_unique<LinearPaceStrategy>(0.3));
    simulation.add_campaign(budget(kRosterBudget, {}), std::make_unique<AdaptivePaceStrategy>(pacing));
}

} // namespace adsim
