#include "auction_engine.hpp"

#include "error.hpp"

#include <cmath>
#include <string>

namespace adsim {

std::string_view to_string(PricingRule rule) noexcept {
    switch (rule) {
        case PricingRule::FirstPrice:
            return "first";
        case PricingRule::SecondPrice:
            return "second";
    }
    return "unknown";
}

PricingRule parse_pricing_rule(std::string_view name) {
    if (name == "first" || name == "first-price") {
        return PricingRule::FirstPrice;
    }
    if (name == "second" || name == "second-price") {
        return PricingRule::SecondPrice;
    }
    ADSIM_THROW(ConfigError("unknown pricing rule '" + std::string(name) + "'"));
}

AuctionEngine::AuctionEngine(PricingRule rule, std::mt19937_64& rng)
    : rule_(rule),
      rng_(rng) {
    bids_.reserve(16);
}

std::optional<Resolution> AuctionEngine::resolve(std::span<const Bid> bids) {
    if (bids.empty()) {
        return std::nullopt;
    }

    std::size_t best = 0;
    std::size_t ties = 1;
    for (std::size_t i = 1; i < bids.size(); ++i) {
        if (bids[i].adjusted_price > bids[best].adjusted_price) {
            best = i;
            ties = 1;
        } else if (bids[i].adjusted_price == bids[best].adjusted_price) {
            // Reservoir draw keeps every tied bid equally likely.
            ++ties;
            std::uniform_int_distribution<std::size_t> pick(0, ties - 1);
            if (pick(rng_) == 0) {
                best = i;
            }
        }
    }

    Resolution resolution;
    resolution.winner = best;
    resolution.clearing_price = bids[best].price;

    if (rule_ == PricingRule::SecondPrice && bids.size() >= 2) {
        double runner_up = 0.0;
        bool found = false;
        for (std::size_t i = 0; i < bids.size(); ++i) {
            if (i == best) {
                continue;
            }
            if (!found || bids[i].adjusted_price > runner_up) {
                runner_up = bids[i].adjusted_price;
                found = true;
            }
        }
        resolution.clearing_price = runner_up / bids[best].hurdle;
    }
    return resolution;
}

AuctionOutcome AuctionEngine::run_one_auction(const Impression& impression,
                                              std::span<Campaign> campaigns,
                                              StatsAggregator& stats) {
    AuctionOutcome outcome;
    outcome.impression_id = impression.id;

    bids_.clear();
    for (Campaign& campaign : campaigns) {
        const std::optional<double> price = campaign.get_bid(impression, rng_);
        if (!price || !std::isfinite(*price) || *price <= 0.0) {
            continue;
        }
        bids_.push_back(Bid{&campaign, *price, campaign.hurdle(), *price * campaign.hurdle()});
    }
    outcome.bids = bids_.size();

    const std::optional<Resolution> resolution = resolve(bids_);
    if (!resolution) {
        return outcome;
    }

    const Bid& winning = bids_[resolution->winner];
    Campaign& winner = *winning.campaign;
    const std::string type(winner.type());

    winner.register_impression(impression, resolution->clearing_price);
    stats.register_impression(type, impression, resolution->clearing_price);
    if (impression.clicked) {
        winner.register_click(impression);
        stats.register_click(type, impression);
    }

    outcome.winner = winner.id();
    outcome.winning_bid = winning.price;
    outcome.clearing_price = resolution->clearing_price;
    return outcome;
}

} // namespace adsim
