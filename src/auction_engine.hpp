#pragma once

#include "campaign.hpp"
#include "impression.hpp"
#include "stats.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <span>
#include <string_view>
#include <vector>

namespace adsim {

enum class PricingRule : std::uint8_t { FirstPrice = 0, SecondPrice = 1 };

[[nodiscard]] std::string_view to_string(PricingRule rule) noexcept;
[[nodiscard]] PricingRule parse_pricing_rule(std::string_view name);

struct Bid {
    Campaign* campaign{nullptr};
    double price{0.0};           // raw price offered
    double hurdle{1.0};
    double adjusted_price{0.0};  // price * hurdle, used for ranking only
};

struct Resolution {
    std::size_t winner{0};  // index into the bid list
    double clearing_price{0.0};
};

struct AuctionOutcome {
    std::uint64_t impression_id{0};
    std::size_t bids{0};
    std::optional<std::size_t> winner;  // campaign id
    double winning_bid{0.0};
    double clearing_price{0.0};

    [[nodiscard]] bool has_winner() const noexcept { return winner.has_value(); }
};

// Runs one sealed-bid auction per impression. Keeps no state between calls
// apart from a reusable bid buffer; all bidding state lives in the campaigns.
class AuctionEngine {
public:
    AuctionEngine(PricingRule rule, std::mt19937_64& rng);

    AuctionOutcome run_one_auction(const Impression& impression,
                                   std::span<Campaign> campaigns,
                                   StatsAggregator& stats);

    // Ranks by adjusted price, breaking exact ties uniformly at random, and
    // prices the winner. Empty input yields std::nullopt.
    [[nodiscard]] std::optional<Resolution> resolve(std::span<const Bid> bids);

    [[nodiscard]] PricingRule rule() const noexcept { return rule_; }

private:
    PricingRule rule_;
    std::mt19937_64& rng_;
    std::vector<Bid> bids_;
};

} // namespace adsim
