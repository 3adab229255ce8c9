#include "impression.hpp"

#include "error.hpp"

#include <algorithm>
#include <cmath>

namespace adsim {

std::size_t hour_of(double time) noexcept {
    if (!(time > 0.0)) {
        return 0;
    }
    const auto hour = static_cast<std::size_t>(std::floor(time / kSecondsPerHour));
    return std::min(hour, kHoursPerDay - 1);
}

SyntheticImpressionSource::SyntheticImpressionSource(ImpressionSourceConfig config)
    : config_(config) {
    ADSIM_REQUIRE(config_.base_ctr > 0.0 && config_.base_ctr < 1.0,
                  "base_ctr must lie in (0, 1)");
    ADSIM_REQUIRE(config_.pctr_jitter >= 0.0 && config_.ctr_jitter >= 0.0,
                  "CTR jitter must be non-negative");
    ADSIM_REQUIRE(config_.base_ctr * (1.0 + config_.pctr_jitter) < 1.0,
                  "jittered pCTR must stay below 1");
}

Impression SyntheticImpressionSource::next(std::uint64_t id, double time, std::mt19937_64& rng) {
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    Impression impression;
    impression.id = id;
    impression.time = time;
    impression.predicted_ctr = config_.base_ctr * (1.0 + config_.pctr_jitter * unit(rng));

    // Draw order matters for reproducibility: threshold jitter first, then the outcome.
    const double click_probability = config_.base_ctr * (1.0 + config_.ctr_jitter * unit(rng));
    impression.clicked = unit(rng) < click_probability;
    return impression;
}

ConstantImpressionSource::ConstantImpressionSource(double predicted_ctr, std::uint64_t click_period)
    : predicted_ctr_(predicted_ctr),
      click_period_(click_period) {
    ADSIM_REQUIRE(predicted_ctr_ > 0.0 && predicted_ctr_ < 1.0,
                  "predicted_ctr must lie in (0, 1)");
}

Impression ConstantImpressionSource::next(std::uint64_t id, double time, std::mt19937_64&) {
    Impression impression;
    impression.id = id;
    impression.time = time;
    impression.predicted_ctr = predicted_ctr_;
    impression.clicked = click_period_ > 0 && (id + 1) % click_period_ == 0;
    return impression;
}

} // namespace adsim
