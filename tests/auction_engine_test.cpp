#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <array>
#include <memory>
#include <random>
#include <vector>

#include "auction_engine.hpp"
#include "error.hpp"

using adsim::AuctionEngine;
using adsim::Bid;
using adsim::Campaign;
using adsim::CampaignConfig;
using adsim::FixedPriceStrategy;
using adsim::Impression;
using adsim::PricingRule;
using adsim::StatsAggregator;

namespace {
Bid make_bid(double price, double hurdle = 1.0) {
    return Bid{nullptr, price, hurdle, price * hurdle};
}

Impression make_impression(std::uint64_t id, bool clicked = false) {
    Impression impression;
    impression.id = id;
    impression.time = 600.0;
    impression.predicted_ctr = 0.1;
    impression.clicked = clicked;
    return impression;
}

// Fixed-cpc campaigns bidding cpc * 0.1 on the impressions above.
std::vector<Campaign> make_campaigns(const std::vector<double>& cpcs, double budget = 1000.0, double hurdle = 1.0) {
    std::vector<Campaign> campaigns;
    campaigns.reserve(cpcs.size());
    for (std::size_t i = 0; i < cpcs.size(); ++i) {
        CampaignConfig config;
        config.daily_budget = budget;
        config.hurdle = hurdle;
        campaigns.emplace_back(i, config, std::make_unique<FixedPriceStrategy>(cpcs[i]));
    }
    return campaigns;
}
}

TEST_CASE("Second price charges the runner-up bid") {
    std::mt19937_64 rng(1);
    AuctionEngine engine(PricingRule::SecondPrice, rng);
    const std::array<Bid, 3> bids{make_bid(5.0), make_bid(3.0), make_bid(1.0)};

    const auto resolution = engine.resolve(bids);
    REQUIRE(resolution);
    CHECK(resolution->winner == 0);
    CHECK(resolution->clearing_price == Catch::Approx(3.0));
}

TEST_CASE("First price charges the winning bid") {
    std::mt19937_64 rng(1);
    AuctionEngine engine(PricingRule::FirstPrice, rng);
    const std::array<Bid, 3> bids{make_bid(1.0), make_bid(5.0), make_bid(3.0)};

    const auto resolution = engine.resolve(bids);
    REQUIRE(resolution);
    CHECK(resolution->winner == 1);
    CHECK(resolution->clearing_price == Catch::Approx(5.0));
}

TEST_CASE("A lone second-price bidder pays its own bid") {
    std::mt19937_64 rng(1);
    AuctionEngine engine(PricingRule::SecondPrice, rng);
    const std::array<Bid, 1> bids{make_bid(2.5)};

    const auto resolution = engine.resolve(bids);
    REQUIRE(resolution);
    CHECK(resolution->clearing_price == Catch::Approx(2.5));
}

TEST_CASE("Empty auctions resolve to no winner") {
    std::mt19937_64 rng(1);
    AuctionEngine engine(PricingRule::SecondPrice, rng);
    CHECK_FALSE(engine.resolve(std::span<const Bid>{}));
}

TEST_CASE("Hurdles rank by adjusted price and scale the second price") {
    std::mt19937_64 rng(1);
    AuctionEngine engine(PricingRule::SecondPrice, rng);
    // Adjusted prices are 4.0 and 6.0.
    const std::array<Bid, 2> bids{make_bid(4.0, 1.0), make_bid(3.0, 2.0)};

    const auto resolution = engine.resolve(bids);
    REQUIRE(resolution);
    CHECK(resolution->winner == 1);
    CHECK(resolution->clearing_price == Catch::Approx(2.0));
    CHECK(resolution->clearing_price <= bids[1].price);
}

TEST_CASE("Exact ties are broken uniformly at random") {
    std::mt19937_64 rng(7);
    AuctionEngine engine(PricingRule::FirstPrice, rng);

    SECTION("two bidders") {
        const std::array<Bid, 2> bids{make_bid(1.0), make_bid(1.0)};
        std::array<int, 2> wins{};
        for (int i = 0; i < 10000; ++i) {
            ++wins[engine.resolve(bids)->winner];
        }
        CHECK(wins[0] > 4700);
        CHECK(wins[0] < 5300);
    }

    SECTION("three bidders behind a lower one") {
        const std::array<Bid, 4> bids{make_bid(0.5), make_bid(1.0), make_bid(1.0), make_bid(1.0)};
        std::array<int, 4> wins{};
        for (int i = 0; i < 9000; ++i) {
            ++wins[engine.resolve(bids)->winner];
        }
        CHECK(wins[0] == 0);
        for (std::size_t i = 1; i < wins.size(); ++i) {
            CHECK(wins[i] > 2750);
            CHECK(wins[i] < 3250);
        }
    }
}

TEST_CASE("Tied second-price winners pay their own bid") {
    std::mt19937_64 rng(3);
    AuctionEngine engine(PricingRule::SecondPrice, rng);
    const std::array<Bid, 2> bids{make_bid(1.5), make_bid(1.5)};

    const auto resolution = engine.resolve(bids);
    REQUIRE(resolution);
    CHECK(resolution->clearing_price == Catch::Approx(1.5));
}

TEST_CASE("run_one_auction books the win into campaign and aggregate stats") {
    std::mt19937_64 rng(11);
    AuctionEngine engine(PricingRule::SecondPrice, rng);
    StatsAggregator stats;
    auto campaigns = make_campaigns({50.0, 30.0, 10.0});

    const auto outcome = engine.run_one_auction(make_impression(1, true), campaigns, stats);

    REQUIRE(outcome.has_winner());
    CHECK(*outcome.winner == 0);
    CHECK(outcome.bids == 3);
    CHECK(outcome.winning_bid == Catch::Approx(5.0));
    CHECK(outcome.clearing_price == Catch::Approx(3.0));

    CHECK(campaigns[0].spend() == Catch::Approx(3.0));
    CHECK(campaigns[0].stat().total().clicks == 1);
    CHECK(campaigns[1].spend() == 0.0);
    CHECK(stats.global().total().spend == Catch::Approx(3.0));
    CHECK(stats.global().total().clicks == 1);
    CHECK(stats.per_type().at("FixedCPC").total().impressions == 1);
}

TEST_CASE("run_one_auction skips clicks that did not happen") {
    std::mt19937_64 rng(11);
    AuctionEngine engine(PricingRule::FirstPrice, rng);
    StatsAggregator stats;
    auto campaigns = make_campaigns({10.0});

    const auto outcome = engine.run_one_auction(make_impression(2, false), campaigns, stats);

    REQUIRE(outcome.has_winner());
    CHECK(campaigns[0].stat().total().impressions == 1);
    CHECK(campaigns[0].stat().total().clicks == 0);
    CHECK(stats.global().total().clicks == 0);
}

TEST_CASE("Exhausted campaigns drop out of later auctions") {
    std::mt19937_64 rng(5);
    AuctionEngine engine(PricingRule::FirstPrice, rng);
    StatsAggregator stats;
    // The first campaign bids 5.0 on a budget of 5.0; the second bids 1.0.
    std::vector<Campaign> campaigns;
    CampaignConfig rich;
    rich.daily_budget = 5.0;
    campaigns.emplace_back(0, rich, std::make_unique<FixedPriceStrategy>(50.0));
    CampaignConfig poor;
    poor.daily_budget = 1000.0;
    campaigns.emplace_back(1, poor, std::make_unique<FixedPriceStrategy>(10.0));

    const auto first = engine.run_one_auction(make_impression(1), campaigns, stats);
    REQUIRE(first.has_winner());
    CHECK(*first.winner == 0);

    for (std::uint64_t id = 2; id < 20; ++id) {
        const auto next = engine.run_one_auction(make_impression(id), campaigns, stats);
        REQUIRE(next.has_winner());
        CHECK(*next.winner == 1);
        CHECK(next.bids == 1);
    }
    CHECK(campaigns[0].spend() == Catch::Approx(5.0));
}

TEST_CASE("Auctions without bidders leave stats untouched") {
    std::mt19937_64 rng(5);
    AuctionEngine engine(PricingRule::SecondPrice, rng);
    StatsAggregator stats;
    std::vector<Campaign> campaigns;

    const auto outcome = engine.run_one_auction(make_impression(9), campaigns, stats);
    CHECK_FALSE(outcome.has_winner());
    CHECK(outcome.bids == 0);
    CHECK(stats.global().total().impressions == 0);
}

TEST_CASE("Pricing rule names parse and print") {
    CHECK(adsim::parse_pricing_rule("first") == PricingRule::FirstPrice);
    CHECK(adsim::parse_pricing_rule("second-price") == PricingRule::SecondPrice);
    CHECK(adsim::to_string(PricingRule::SecondPrice) == "second");
    CHECK_THROWS_AS(adsim::parse_pricing_rule("vickrey"), adsim::ConfigError);
}
