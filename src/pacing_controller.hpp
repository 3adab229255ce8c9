#pragma once

#include "time_window.hpp"

namespace adsim {

struct PacingConfig {
    double tau_fast_s{100.0};
    double tau_slow_s{1000.0};
    double seed_price{0.1};
    double min_step{0.1};   // lower clamp on a single multiplicative price change
    double max_step{2.0};   // upper clamp on a single multiplicative price change
    double step_gain{1.0};  // factor = (ratio - 1) * step_gain + 1

    void validate() const;
};

struct PacingState {
    double output_price{0.0};
    double ema_slow{0.0};
    double ema_fast{0.0};
    double last_win_time{0.0};
    double last_bid_time{0.0};
    bool has_bid{false};
    bool has_win{false};
};

// Dual-rate EMA spend-rate controller. The slow tracker gates upward moves when
// no spend is observed; the fast tracker trims the price after bursts of wins.
// Trackers hold the rate estimate as of the last win; bids read a decayed view.
class PacingController {
public:
    explicit PacingController(PacingConfig config = {});

    // Price to offer at `now`. Caller has already ruled out exhausted budgets
    // and times outside the window.
    double on_bid(double now, double budget, double spend, const TimeWindow& window);

    // `spend` already includes `price`.
    void on_win(double now, double price, double budget, double spend, const TimeWindow& window);

    [[nodiscard]] const PacingState& state() const noexcept { return state_; }
    [[nodiscard]] const PacingConfig& config() const noexcept { return config_; }

    // Spend per second still needed to exhaust the budget exactly at window end.
    [[nodiscard]] static double remaining_desired_pace(double budget, double spend, double window_end, double now);

private:
    void adjust(double ratio, double now, const char* reason);

    PacingConfig config_;
    PacingState state_;
};

} // namespace adsim
