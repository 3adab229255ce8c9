#pragma once

#include "impression.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>

namespace adsim {

struct Stat {
    std::uint64_t impressions{0};
    std::uint64_t clicks{0};
    double spend{0.0};

    void register_impression(double price) noexcept {
        ++impressions;
        spend += price;
    }

    void register_click() noexcept { ++clicks; }

    [[nodiscard]] double cpc() const noexcept {
        return clicks > 0 ? spend / static_cast<double>(clicks) : 0.0;
    }

    [[nodiscard]] double cpm() const noexcept {
        return impressions > 0 ? 1000.0 * spend / static_cast<double>(impressions) : 0.0;
    }
};

// Welford's single-pass mean/variance; never stores samples.
class RunningMoments {
public:
    void add(double value) noexcept;

    [[nodiscard]] std::uint64_t count() const noexcept { return count_; }
    [[nodiscard]] double mean() const noexcept { return mean_; }
    [[nodiscard]] double variance() const noexcept;
    [[nodiscard]] double stddev() const noexcept;

private:
    std::uint64_t count_{0};
    double mean_{0.0};
    double m2_{0.0};
};

// Aggregate counters plus one bucket per hour of the day.
class FullStat {
public:
    using HourlyStats = std::array<Stat, kHoursPerDay>;

    void register_impression(const Impression& impression, double price) noexcept;
    void register_click(const Impression& impression) noexcept;

    [[nodiscard]] const Stat& total() const noexcept { return total_; }
    [[nodiscard]] const HourlyStats& hours() const noexcept { return hours_; }
    [[nodiscard]] const RunningMoments& price() const noexcept { return price_; }

private:
    Stat total_;
    HourlyStats hours_{};
    RunningMoments price_;
};

struct Summary {
    std::uint64_t impressions{0};
    std::uint64_t clicks{0};
    double spend{0.0};
    double cpc{0.0};
    double cpm{0.0};
    double mean_price{0.0};
    double price_stddev{0.0};
};

[[nodiscard]] Summary summarize(const FullStat& stat) noexcept;

class StatsAggregator {
public:
    using TypeStats = std::map<std::string, FullStat, std::less<>>;

    void register_impression(const std::string& campaign_type, const Impression& impression, double price);
    void register_click(const std::string& campaign_type, const Impression& impression);
    void reset();

    [[nodiscard]] const FullStat& global() const noexcept { return global_; }
    [[nodiscard]] const TypeStats& per_type() const noexcept { return per_type_; }

private:
    FullStat global_;
    TypeStats per_type_;
};

} // namespace adsim
