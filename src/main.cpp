#include "error.hpp"
#include "report.hpp"
#include "simulation.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>

namespace {

using adsim::ConfigError;

struct Options {
    adsim::SimulationConfig config{adsim::default_day_config()};
    std::filesystem::path log_path{};
    std::string log_level{"info"};
    std::optional<std::size_t> chart_campaign{};
};

double to_double(const std::string& key, const std::string& value) {
    std::size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::exception&) {
        ADSIM_THROW(ConfigError("invalid number '" + value + "' for " + key));
    }
    if (consumed != value.size()) {
        ADSIM_THROW(ConfigError("invalid number '" + value + "' for " + key));
    }
    return parsed;
}

std::uint64_t to_unsigned(const std::string& key, const std::string& value) {
    std::size_t consumed = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &consumed);
    } catch (const std::exception&) {
        ADSIM_THROW(ConfigError("invalid integer '" + value + "' for " + key));
    }
    if (consumed != value.size() || value.front() == '-') {
        ADSIM_THROW(ConfigError("invalid integer '" + value + "' for " + key));
    }
    return static_cast<std::uint64_t>(parsed);
}

Options parse_arguments(int argc, char** argv) {
    if ((argc - 1) % 2 != 0) {
        ADSIM_THROW(ConfigError("arguments must be --key value pairs"));
    }
    std::unordered_map<std::string, std::string> args;
    for (int i = 1; i + 1 < argc; i += 2) {
        args[argv[i]] = argv[i + 1];
    }

    Options opts;
    auto& cfg = opts.config;
    for (const auto& [key, value] : args) {
        if (key == "--impressions") {
            cfg.impressions = static_cast<std::size_t>(to_unsigned(key, value));
        } else if (key == "--seed") {
            cfg.seed = to_unsigned(key, value);
        } else if (key == "--pricing") {
            cfg.pricing = adsim::parse_pricing_rule(value);
        } else if (key == "--tau-fast") {
            cfg.pacing.tau_fast_s = to_double(key, value);
        } else if (key == "--tau-slow") {
            cfg.pacing.tau_slow_s = to_double(key, value);
        } else if (key == "--output") {
            cfg.output_dir = value;
        } else if (key == "--log") {
            opts.log_path = value;
        } else if (key == "--log-level") {
            opts.log_level = value;
        } else if (key == "--chart") {
            opts.chart_campaign = static_cast<std::size_t>(to_unsigned(key, value));
        } else {
            ADSIM_THROW(ConfigError("unknown option " + key));
        }
    }
    return opts;
}

void install_logger(const Options& opts) {
    if (!opts.log_path.empty()) {
        if (opts.log_path.has_parent_path()) {
            std::filesystem::create_directories(opts.log_path.parent_path());
        }
        spdlog::set_default_logger(spdlog::basic_logger_mt("adsim", opts.log_path.string()));
    }
    const auto level = spdlog::level::from_str(opts.log_level);
    if (level == spdlog::level::off && opts.log_level != "off") {
        ADSIM_THROW(ConfigError("unknown log level '" + opts.log_level + "'"));
    }
    spdlog::set_level(level);
}

} // namespace

int main(int argc, char** argv) {
    try {
        const Options opts = parse_arguments(argc, argv);
        install_logger(opts);

        adsim::Simulation simulation(opts.config);
        adsim::add_default_roster(simulation);
        const adsim::SimulationResult result = simulation.run();

        adsim::write_text_report(std::cout, result);

        std::cout << "Total spend by hour:\n"
                  << adsim::render_hourly_chart(adsim::hourly_spend(result.global.hours()));
        std::cout << "Total CPM by hour:\n"
                  << adsim::render_hourly_chart(adsim::hourly_cpm(result.global.hours()));

        const std::size_t chart_id = opts.chart_campaign.value_or(result.campaigns.size() - 1);
        const auto& hours = simulation.campaign(chart_id).stat().hours();
        std::cout << "Spend of id " << chart_id << ":\n"
                  << adsim::render_hourly_chart(adsim::hourly_spend(hours));
        std::cout << "CPM of id " << chart_id << ":\n"
                  << adsim::render_hourly_chart(adsim::hourly_cpm(hours));
    } catch (const std::exception& ex) {
        spdlog::critical("{}", ex.what());
        spdlog::shutdown();
        return 1;
    }
    spdlog::shutdown();
    return 0;
}
