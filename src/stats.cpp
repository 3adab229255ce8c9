#include "stats.hpp"

#include <cmath>

namespace adsim {

void RunningMoments::add(double value) noexcept {
    ++count_;
    const double delta = value - mean_;
    mean_ += delta / static_cast<double>(count_);
    const double delta2 = value - mean_;
    m2_ += delta * delta2;
}

double RunningMoments::variance() const noexcept {
    if (count_ < 2) {
        return 0.0;
    }
    return m2_ / static_cast<double>(count_ - 1);
}

double RunningMoments::stddev() const noexcept {
    return std::sqrt(variance());
}

void FullStat::register_impression(const Impression& impression, double price) noexcept {
    total_.register_impression(price);
    hours_[hour_of(impression.time)].register_impression(price);
    price_.add(price);
}

void FullStat::register_click(const Impression& impression) noexcept {
    if (!impression.clicked) {
        return;
    }
    total_.register_click();
    hours_[hour_of(impression.time)].register_click();
}

Summary summarize(const FullStat& stat) noexcept {
    const Stat& total = stat.total();
    Summary summary;
    summary.impressions = total.impressions;
    summary.clicks = total.clicks;
    summary.spend = total.spend;
    summary.cpc = total.cpc();
    summary.cpm = total.cpm();
    summary.mean_price = stat.price().mean();
    summary.price_stddev = stat.price().stddev();
    return summary;
}

void StatsAggregator::register_impression(const std::string& campaign_type,
                                          const Impression& impression,
                                          double price) {
    global_.register_impression(impression, price);
    per_type_[campaign_type].register_impression(impression, price);
}

void StatsAggregator::register_click(const std::string& campaign_type, const Impression& impression) {
    global_.register_click(impression);
    per_type_[campaign_type].register_click(impression);
}

void StatsAggregator::reset() {
    global_ = FullStat{};
    per_type_.clear();
}

} // namespace adsim
