#ifndef RANKFOLIO_BACKTEST_TURNOVER_CALCULATOR_HPP
#define RANKFOLIO_BACKTEST_TURNOVER_CALCULATOR_HPP

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace rankfolio {
namespace backtest {

class PortfolioState;

/**
 * @brief Fraction of the previous holding set that was replaced.
 *
 * (|prev| - |prev & cur|) / |prev|. Position sizes are ignored.
 * @return std::nullopt when prev is empty (no prior holding set).
 */
std::optional<double> set_turnover(const std::set<std::string>& previous_stocks,
                                   const std::set<std::string>& current_stocks);

/**
 * @struct TurnoverTable
 * @brief Rebalance date x sleeve turnover matrix.
 *
 * A cell is std::nullopt both when the sleeve did not rebalance on that date
 * and when its turnover was undefined; is_rebalance distinguishes the two.
 */
struct TurnoverTable {
    std::vector<std::string> dates;
    int portfolio_count = 0;
    std::vector<std::vector<std::optional<double>>> values;  ///< [date][sleeve]
    std::vector<std::vector<bool>> is_rebalance;             ///< [date][sleeve]

    size_t num_rows() const { return dates.size(); }

    /// Mean of the defined turnover values of one sleeve; nullopt if none.
    std::optional<double> mean_turnover(int sleeve) const;

    /// Mean over every defined cell of the table; nullopt if none.
    std::optional<double> mean_turnover() const;

    /// Count of defined cells of one sleeve.
    int defined_count(int sleeve) const;

    /**
     * @brief Write date,portfolio_0..portfolio_{n-1}; undefined cells are empty.
     * @throws std::runtime_error if the file cannot be written.
     */
    void export_to_csv(const std::string& filepath) const;
};

/**
 * @brief Collect every sleeve's turnover records into one table.
 * @throws std::invalid_argument if portfolio_count doesn't match states.size().
 */
TurnoverTable calc_turnover_rate(const std::vector<PortfolioState>& portfolio_states,
                                 int portfolio_count);

} // namespace backtest
} // namespace rankfolio

#endif // RANKFOLIO_BACKTEST_TURNOVER_CALCULATOR_HPP
