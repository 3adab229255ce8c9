#pragma once

#include <cstddef>
#include <cstdint>
#include <random>

namespace adsim {

constexpr double kSecondsPerHour = 3600.0;
constexpr double kSecondsPerDay = 86400.0;
constexpr std::size_t kHoursPerDay = 24;

// One auctionable opportunity. The click outcome is sampled when the impression
// is created, before any campaign sees it.
struct Impression {
    std::uint64_t id{0};
    double time{0.0};
    double predicted_ctr{0.0};
    bool clicked{false};
};

[[nodiscard]] std::size_t hour_of(double time) noexcept;

struct ImpressionSourceConfig {
    double base_ctr{0.1};
    double pctr_jitter{0.1};  // pCTR = base_ctr * (1 + U[0, pctr_jitter))
    double ctr_jitter{0.01};  // P(click) = base_ctr * (1 + U[0, ctr_jitter))
};

class ImpressionSource {
public:
    virtual ~ImpressionSource() = default;
    virtual Impression next(std::uint64_t id, double time, std::mt19937_64& rng) = 0;
};

class SyntheticImpressionSource final : public ImpressionSource {
public:
    explicit SyntheticImpressionSource(ImpressionSourceConfig config = {});

    Impression next(std::uint64_t id, double time, std::mt19937_64& rng) override;

    [[nodiscard]] const ImpressionSourceConfig& config() const noexcept { return config_; }

private:
    ImpressionSourceConfig config_;
};

// Fixed pCTR; every click_period-th impression is clicked (0 disables clicks).
// Draws nothing from the generator.
class ConstantImpressionSource final : public ImpressionSource {
public:
    ConstantImpressionSource(double predicted_ctr, std::uint64_t click_period);

    Impression next(std::uint64_t id, double time, std::mt19937_64& rng) override;

private:
    double predicted_ctr_;
    std::uint64_t click_period_;
};

} // namespace adsim
