#include "bidding_strategy.hpp"

#include "error.hpp"

namespace adsim {

FixedPriceStrategy::FixedPriceStrategy(double cpc)
    : cpc_(cpc) {
    ADSIM_REQUIRE(cpc_ > 0.0, "FixedCPC requires a positive cpc");
}

std::optional<double> FixedPriceStrategy::get_bid(const Impression& impression,
                                                  const CampaignAccount&,
                                                  std::mt19937_64&) {
    return cpc_ * impression.predicted_ctr;
}

TargetPriceStrategy::TargetPriceStrategy(double target_cpc, double miscalibration, double jitter)
    : target_cpc_(target_cpc),
      miscalibration_(miscalibration),
      jitter_(jitter) {
    ADSIM_REQUIRE(target_cpc_ > 0.0, "TargetCPC requires a positive target cpc");
    ADSIM_REQUIRE(miscalibration_ > 0.0, "pCTR miscalibration must be positive");
    ADSIM_REQUIRE(jitter_ >= 0.0, "pCTR jitter must be non-negative");
}

std::optional<double> TargetPriceStrategy::get_bid(const Impression& impression,
                                                   const CampaignAccount&,
                                                   std::mt19937_64& rng) {
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    const double campaign_pctr = impression.predicted_ctr * (miscalibration_ + jitter_ * unit(rng));
    return target_cpc_ * campaign_pctr;
}

LinearPaceStrategy::LinearPaceStrategy(double cpc)
    : cpc_(cpc) {
    ADSIM_REQUIRE(cpc_ > 0.0, "PacedCPC requires a positive cpc");
}

std::optional<double> LinearPaceStrategy::get_bid(const Impression& impression,
                                                  const CampaignAccount& account,
                                                  std::mt19937_64&) {
    const double expected_spend = account.daily_budget * account.window.elapsed_fraction(impression.time);
    if (account.spend() >= expected_spend) {
        return std::nullopt;
    }
    return cpc_ * impression.predicted_ctr;
}

AdaptivePaceStrategy::AdaptivePaceStrategy(PacingConfig config)
    : controller_(config) {}

std::optional<double> AdaptivePaceStrategy::get_bid(const Impression& impression,
                                                    const CampaignAccount& account,
                                                    std::mt19937_64&) {
    return controller_.on_bid(impression.time, account.daily_budget, account.spend(), account.window);
}

void AdaptivePaceStrategy::register_impression(const Impression& impression,
                                               double price,
                                               const CampaignAccount& account) {
    controller_.on_win(impression.time, price, account.daily_budget, account.spend(), account.window);
}

} // namespace adsim
