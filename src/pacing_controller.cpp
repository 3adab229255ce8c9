#include "pacing_controller.hpp"

#include "error.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace adsim {

namespace {

// Floor that keeps seeded trackers strictly positive.
constexpr double kMinRate = 1e-12;

// s <- s + (1 - e^(-dt/tau)) * (target - s)
double blend(double ema, double target, double dt, double tau) {
    const double alpha = 1.0 - std::exp(-dt / tau);
    return ema + alpha * (target - ema);
}

double decayed(double ema, double dt, double tau) {
    return std::max(kMinRate, blend(ema, 0.0, std::max(0.0, dt), tau));
}

// Blend toward the observed rate price/dt. Two wins at the same instant take the
// dt -> 0 limit of the blend, which adds price/tau.
double observed(double ema, double price, double dt, double tau) {
    const double next = dt > 0.0 ? blend(ema, price / dt, dt, tau) : ema + price / tau;
    return std::max(kMinRate, next);
}

} // namespace

void PacingConfig::validate() const {
    ADSIM_REQUIRE(tau_fast_s > 0.0 && tau_slow_s > 0.0, "pacing time constants must be positive");
    ADSIM_REQUIRE(tau_fast_s < tau_slow_s, "tau_fast_s must be smaller than tau_slow_s");
    ADSIM_REQUIRE(seed_price > 0.0, "pacing seed price must be positive");
    ADSIM_REQUIRE(min_step > 0.0 && min_step <= 1.0, "min_step must lie in (0, 1]");
    ADSIM_REQUIRE(max_step >= 1.0, "max_step must be at least 1");
    ADSIM_REQUIRE(step_gain > 0.0, "step_gain must be positive");
}

PacingController::PacingController(PacingConfig config)
    : config_(config) {
    config_.validate();
    state_.output_price = config_.seed_price;
}

double PacingController::remaining_desired_pace(double budget, double spend, double window_end, double now) {
    const double remaining_time = window_end - now;
    if (!(remaining_time > 0.0)) {
        ADSIM_THROW(ConfigError("pacing evaluated at or after window end"));
    }
    return (budget - spend) / remaining_time;
}

double PacingController::on_bid(double now, double budget, double spend, const TimeWindow& window) {
    if (!state_.has_bid) {
        state_.has_bid = true;
        state_.last_bid_time = now;
        state_.output_price = config_.seed_price;
        return state_.output_price;
    }

    const double desired = remaining_desired_pace(budget, spend, window.end, now);

    if (state_.has_win) {
        const double since_win = now - state_.last_win_time;
        const double slow = decayed(state_.ema_slow, since_win, config_.tau_slow_s);
        const double fast = decayed(state_.ema_fast, since_win, config_.tau_fast_s);
        if (slow < desired && fast < desired) {
            adjust(desired / slow, now, "underspend");
        }
    } else if (desired > 0.0) {
        // Nothing won yet: the observed rate is zero, so the ratio is unbounded.
        adjust(std::numeric_limits<double>::infinity(), now, "no wins yet");
    }

    state_.last_bid_time = now;
    return state_.output_price;
}

void PacingController::on_win(double now, double price, double budget, double spend, const TimeWindow& window) {
    const double desired = remaining_desired_pace(budget, spend, window.end, now);

    if (!state_.has_win) {
        state_.ema_slow = std::max(kMinRate, desired);
        state_.ema_fast = std::max(kMinRate, desired);
        state_.last_win_time = window.start;
        state_.has_win = true;
    }

    const double since_win = now - state_.last_win_time;
    state_.ema_slow = observed(state_.ema_slow, price, since_win, config_.tau_slow_s);
    state_.ema_fast = observed(state_.ema_fast, price, since_win, config_.tau_fast_s);

    if (state_.ema_fast > desired) {
        adjust(desired / state_.ema_fast, now, "overspend");
    }
    state_.last_win_time = now;
}

void PacingController::adjust(double ratio, double now, const char* reason) {
    const double proportional = (ratio - 1.0) * config_.step_gain + 1.0;
    const double factor = std::clamp(proportional, config_.min_step, config_.max_step);
    const double previous = state_.output_price;
    state_.output_price = previous * factor;
    spdlog::debug("pacing {} at t={:.1f}: price {:.6f} -> {:.6f}", reason, now, previous, state_.output_price);
}

} // namespace adsim
