#pragma once

#include "bidding_strategy.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace adsim {

struct CampaignConfig {
    std::vector<std::string> tags;
    double daily_budget{0.0};
    double hurdle{1.0};
    TimeWindow window{};
};

// Budget-constrained bidding agent: identity, account and the policy that prices
// its bids. Created once at setup and mutated by every auction it joins.
class Campaign {
public:
    Campaign(std::size_t id, CampaignConfig config, std::unique_ptr<BiddingStrategy> strategy);

    Campaign(Campaign&&) noexcept = default;
    Campaign& operator=(Campaign&&) noexcept = default;
    Campaign(const Campaign&) = delete;
    Campaign& operator=(const Campaign&) = delete;

    std::optional<double> get_bid(const Impression& impression, std::mt19937_64& rng);
    void register_impression(const Impression& impression, double price);
    void register_click(const Impression& impression);

    [[nodiscard]] std::size_t id() const noexcept { return id_; }
    [[nodiscard]] std::string_view type() const noexcept { return strategy_->type(); }
    [[nodiscard]] const std::vector<std::string>& tags() const noexcept { return tags_; }
    [[nodiscard]] double hurdle() const noexcept { return hurdle_; }
    [[nodiscard]] double daily_budget() const noexcept { return account_.daily_budget; }
    [[nodiscard]] const TimeWindow& window() const noexcept { return account_.window; }
    [[nodiscard]] const FullStat& stat() const noexcept { return account_.stat; }
    [[nodiscard]] double spend() const noexcept { return account_.spend(); }
    [[nodiscard]] const BiddingStrategy& strategy() const noexcept { return *strategy_; }

private:
    std::size_t id_;
    std::vector<std::string> tags_;
    double hurdle_;
    CampaignAccount account_;
    std::unique_ptr<BiddingStrategy> strategy_;
};

} // namespace adsim
