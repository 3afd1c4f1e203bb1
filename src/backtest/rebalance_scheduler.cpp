#include "rankfolio/backtest/rebalance_scheduler.hpp"

#include <algorithm>
#include <cctype>

namespace rankfolio {
namespace backtest {

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

RebalanceConfig RebalanceConfig::from_json(const nlohmann::json& j) {
    RebalanceConfig cfg;
    if (j.contains("rebalance_frequency")) {
        const auto& f = j.at("rebalance_frequency");
        if (f.is_number_integer()) {
            cfg.frequency_days = f.get<int>();
        } else if (f.is_string()) {
            cfg.frequency_days = parse_frequency(f.get<std::string>());
        } else {
            throw std::invalid_argument("rebalance_frequency must be an integer or a period name");
        }
    }
    if (j.contains("portfolio_count")) {
        cfg.portfolio_count = j.at("portfolio_count").get<int>();
    }
    cfg.validate();
    return cfg;
}

RebalanceConfig RebalanceConfig::from_string(const std::string& freq_str, int portfolio_count) {
    RebalanceConfig cfg;
    cfg.frequency_days = parse_frequency(freq_str);
    cfg.portfolio_count = portfolio_count;
    cfg.validate();
    return cfg;
}

int RebalanceConfig::parse_frequency(const std::string& freq_str) {
    auto s = to_lower(freq_str);
    if (s == "daily" || s == "d") return 1;
    if (s == "weekly" || s == "w") return 5;
    if (s == "monthly" || s == "m") return 21;
    if (s == "quarterly" || s == "q") return 63;
    if (s == "annually" || s == "annual" || s == "y" || s == "yearly" || s == "12m")
        return kTradingDaysPerYear;

    if (!s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c); })) {
        int days = 0;
        try {
            days = std::stoi(s);
        } catch (const std::out_of_range&) {
            throw std::invalid_argument("Invalid rebalance frequency: " + freq_str);
        }
        if (days > 0) return days;
    }
    throw std::invalid_argument("Invalid rebalance frequency: " + freq_str);
}

void RebalanceConfig::validate() const {
    if (frequency_days <= 0) {
        throw std::invalid_argument("rebalance_frequency must be > 0, got: " + std::to_string(frequency_days));
    }
    if (portfolio_count <= 0) {
        throw std::invalid_argument("portfolio_count must be > 0, got: " + std::to_string(portfolio_count));
    }
    if (portfolio_count > frequency_days) {
        throw std::invalid_argument("portfolio_count (" + std::to_string(portfolio_count) +
                                    ") exceeds rebalance_frequency (" + std::to_string(frequency_days) +
                                    "); sleeves would share rebalance days");
    }
}

int entry_offset(int sleeve, int rebalance_frequency, int portfolio_count) {
    if (rebalance_frequency <= 0 || portfolio_count <= 0)
        throw std::invalid_argument("rebalance_frequency and portfolio_count must be > 0");
    if (sleeve < 0 || sleeve >= portfolio_count)
        throw std::out_of_range("sleeve index out of range: " + std::to_string(sleeve));
    long long offset = static_cast<long long>(sleeve) * rebalance_frequency / portfolio_count;
    return static_cast<int>(offset);
}

int next_rebalance_index(int sleeve, int day_index, int rebalance_frequency, int portfolio_count) {
    int offset = entry_offset(sleeve, rebalance_frequency, portfolio_count);
    if (day_index <= offset) return offset;
    int elapsed = day_index - offset;
    int cycles = (elapsed + rebalance_frequency - 1) / rebalance_frequency;
    return offset + cycles * rebalance_frequency;
}

RebalanceScheduler::RebalanceScheduler(const RebalanceConfig& config)
    : config_(config) {
    config_.validate();
}

void RebalanceScheduler::check_sleeve(int sleeve) const {
    if (sleeve < 0 || sleeve >= config_.portfolio_count)
        throw std::out_of_range("sleeve index out of range: " + std::to_string(sleeve));
}

bool RebalanceScheduler::is_rebalance_day(int sleeve, int day_index) const {
    check_sleeve(sleeve);
    if (day_index < 0) return false;
    return next_rebalance_index(sleeve, day_index) == day_index;
}

int RebalanceScheduler::next_rebalance_index(int sleeve, int day_index) const {
    check_sleeve(sleeve);
    return backtest::next_rebalance_index(sleeve, day_index, config_.frequency_days, config_.portfolio_count);
}

std::vector<int> RebalanceScheduler::sleeves_rebalancing_on(int day_index) const {
    std::vector<int> out;
    for (int i = 0; i < config_.portfolio_count; ++i) {
        if (is_rebalance_day(i, day_index)) out.push_back(i);
    }
    return out;
}

} // namespace backtest
} // namespace rankfolio
