#pragma once

#include "impression.hpp"
#include "pacing_controller.hpp"
#include "stats.hpp"
#include "time_window.hpp"

#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace adsim {

// Budget and bookkeeping shared by every bidding policy; owned by the Campaign.
struct CampaignAccount {
    double daily_budget{0.0};
    TimeWindow window{};
    FullStat stat;

    [[nodiscard]] double spend() const noexcept { return stat.total().spend; }
    [[nodiscard]] bool exhausted() const noexcept { return spend() >= daily_budget; }
};

// Bidding policy. The owning Campaign declines on exhausted budgets and outside
// the active window before asking the strategy, and books wins and clicks into
// the account before forwarding them.
class BiddingStrategy {
public:
    virtual ~BiddingStrategy() = default;

    [[nodiscard]] virtual std::string_view type() const noexcept = 0;

    // std::nullopt declines the impression.
    virtual std::optional<double> get_bid(const Impression& impression,
                                          const CampaignAccount& account,
                                          std::mt19937_64& rng) = 0;

    virtual void register_impression(const Impression&, double /*price*/, const CampaignAccount&) {}
    virtual void register_click(const Impression&, const CampaignAccount&) {}
};

// Bids cpc * pCTR until the budget is gone.
class FixedPriceStrategy final : public BiddingStrategy {
public:
    explicit FixedPriceStrategy(double cpc);

    [[nodiscard]] std::string_view type() const noexcept override { return "FixedCPC"; }
    std::optional<double> get_bid(const Impression& impression,
                                  const CampaignAccount& account,
                                  std::mt19937_64& rng) override;

private:
    double cpc_;
};

// Bids target_cpc * pCTR * (miscalibration + U[0, jitter)): a campaign whose own
// click model is biased and noisy.
class TargetPriceStrategy final : public BiddingStrategy {
public:
    TargetPriceStrategy(double target_cpc, double miscalibration, double jitter);

    [[nodiscard]] std::string_view type() const noexcept override { return "TargetCPC"; }
    std::optional<double> get_bid(const Impression& impression,
                                  const CampaignAccount& account,
                                  std::mt19937_64& rng) override;

private:
    double target_cpc_;
    double miscalibration_;
    double jitter_;
};

// Fixed cpc * pCTR, throttled so spend never runs ahead of a straight line from
// zero at window start to the full budget at window end.
class LinearPaceStrategy final : public BiddingStrategy {
public:
    explicit LinearPaceStrategy(double cpc);

    [[nodiscard]] std::string_view type() const noexcept override { return "PacedCPC"; }
    std::optional<double> get_bid(const Impression& impression,
                                  const CampaignAccount& account,
                                  std::mt19937_64& rng) override;

private:
    double cpc_;
};

// Offers the pacing controller's raw price, independent of pCTR.
class AdaptivePaceStrategy final : public BiddingStrategy {
public:
    explicit AdaptivePaceStrategy(PacingConfig config = {});

    [[nodiscard]] std::string_view type() const noexcept override { return "PacedSpend"; }
    std::optional<double> get_bid(const Impression& impression,
                                  const CampaignAccount& account,
                                  std::mt19937_64& rng) override;
    void register_impression(const Impression& impression, double price, const CampaignAccount& account) override;

    [[nodiscard]] const PacingController& controller() const noexcept { return controller_; }

private:
    PacingController controller_;
};

} // namespace adsim
