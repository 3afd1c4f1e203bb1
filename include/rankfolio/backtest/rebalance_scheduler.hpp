#ifndef RANKFOLIO_BACKTEST_REBALANCE_SCHEDULER_HPP
#define RANKFOLIO_BACKTEST_REBALANCE_SCHEDULER_HPP

#include <string>
#include <vector>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace rankfolio {
namespace backtest {

/// Trading days in the fixed twelve-month holding variant.
constexpr int kTradingDaysPerYear = 252;

struct RebalanceConfig {
    int frequency_days = 5;  ///< holding period in trading days
    int portfolio_count = 5; ///< number of staggered sleeves

    static RebalanceConfig from_json(const nlohmann::json& j);
    static RebalanceConfig from_string(const std::string& freq_str, int portfolio_count = 5);

    /**
     * @brief Parse a holding period.
     *
     * Accepts a positive integer ("5") or a named period:
     * daily=1, weekly=5, monthly=21, quarterly=63, annually/yearly/12m=252.
     * @throws std::invalid_argument for anything else.
     */
    static int parse_frequency(const std::string& freq_str);

    /// @throws std::invalid_argument on non-positive values or more sleeves than days per cycle.
    void validate() const;
};

/**
 * @brief Trading-day offset of a sleeve's first entry.
 *
 * Offsets spread the sleeves evenly over one cycle: floor(i * freq / count).
 */
int entry_offset(int sleeve, int rebalance_frequency, int portfolio_count);

/**
 * @brief Smallest day index >= day_index on which the sleeve rebalances.
 *
 * Pure function of its arguments; sleeve i rebalances on
 * entry_offset(i) + k * rebalance_frequency for k >= 0.
 */
int next_rebalance_index(int sleeve, int day_index, int rebalance_frequency, int portfolio_count);

class RebalanceScheduler {
public:
    explicit RebalanceScheduler(const RebalanceConfig& config);
    ~RebalanceScheduler() = default;

    bool is_rebalance_day(int sleeve, int day_index) const;

    int next_rebalance_index(int sleeve, int day_index) const;

    /// Exclusive end of the holding window opened on day_index.
    int expire_index(int day_index) const { return day_index + config_.frequency_days; }

    /// Sleeves rebalancing on day_index, ascending.
    std::vector<int> sleeves_rebalancing_on(int day_index) const;

    const RebalanceConfig& config() const { return config_; }

private:
    RebalanceConfig config_;
    void check_sleeve(int sleeve) const;
};

} // namespace backtest
} // namespace rankfolio

#endif // RANKFOLIO_BACKTEST_REBALANCE_SCHEDULER_HPP
