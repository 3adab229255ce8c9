#include "campaign.hpp"

#include "error.hpp"

#include <utility>

namespace adsim {

Campaign::Campaign(std::size_t id, CampaignConfig config, std::unique_ptr<BiddingStrategy> strategy)
    : id_(id),
      tags_(std::move(config.tags)),
      hurdle_(config.hurdle),
      strategy_(std::move(strategy)) {
    ADSIM_REQUIRE(strategy_ != nullptr, "campaign requires a bidding strategy");
    ADSIM_REQUIRE(config.daily_budget > 0.0, "campaign daily budget must be positive");
    ADSIM_REQUIRE(hurdle_ > 0.0, "campaign hurdle must be positive");
    ADSIM_REQUIRE(config.window.start >= 0.0 && config.window.start < config.window.end,
                  "campaign time window must be non-empty");
    account_.daily_budget = config.daily_budget;
    account_.window = config.window;
}

std::optional<double> Campaign::get_bid(const Impression& impression, std::mt19937_64& rng) {
    if (account_.exhausted() || !account_.window.contains(impression.time)) {
        return std::nullopt;
    }
    return strategy_->get_bid(impression, account_, rng);
}

void Campaign::register_impression(const Impression& impression, double price) {
    account_.stat.register_impression(impression, price);
    strategy_->register_impression(impression, price, account_);
}

void Campaign::register_click(const Impression& impression) {
    if (!impression.clicked) {
        return;
    }
    account_.stat.register_click(impression);
    strategy_->register_click(impression, account_);
}

} // namespace adsim
