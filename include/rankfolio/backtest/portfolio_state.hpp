// SPDX-License-Identifier: MIT
#ifndef RANKFOLIO_BACKTEST_PORTFOLIO_STATE_HPP
#define RANKFOLIO_BACKTEST_PORTFOLIO_STATE_HPP

#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>

namespace rankfolio {
namespace backtest {

/// Instrument -> share count (non-negative multiple of the lot size).
using Holdings = std::map<std::string, long long>;

/// Rebalance date -> turnover ratio; std::nullopt marks an undefined turnover.
using TurnoverRecords = std::map<std::string, std::optional<double>>;

/**
 * @class InvariantViolation
 * @brief Raised when a mutation would leave a sleeve with negative cash or
 *        negative / lot-misaligned shares. The sleeve is left untouched.
 */
class InvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * @class PortfolioState
 * @brief One staggered sleeve: holdings, cash, holding window and turnover history.
 *
 * Created inactive with its allocated capital in cash. Each rebalance
 * replaces the holdings wholesale; the identifiers held just before the
 * replacement are kept in previous_stocks() and the resulting turnover is
 * appended to turnover_records().
 */
class PortfolioState {
public:
    PortfolioState(int index, double allocated_capital, long long lot_size);

    // -- State queries
    int index() const { return index_; }
    double allocated_capital() const { return allocated_capital_; }
    long long lot_size() const { return lot_size_; }
    const Holdings& holdings() const { return holdings_; }
    double cash() const { return cash_; }
    const std::optional<std::string>& start_date() const { return start_date_; }
    const std::optional<std::string>& expire_date() const { return expire_date_; }
    bool is_active() const { return is_active_; }
    const std::set<std::string>& previous_stocks() const { return previous_stocks_; }
    const TurnoverRecords& turnover_records() const { return turnover_records_; }
    int rebalance_count() const { return rebalance_count_; }

    std::set<std::string> current_stocks() const;
    long long shares(const std::string& instrument) const;

    /**
     * @brief Cash plus holdings valued at the given prices.
     *
     * Instruments absent from prices contribute zero.
     */
    double market_value(const std::map<std::string, double>& prices) const;

    // -- Mutation

    /**
     * @brief Commit a rebalance: liquidated-and-rebuilt holdings plus resulting cash.
     *
     * Captures previous_stocks from the current holdings, records the
     * set-difference turnover for date (undefined when there was no prior
     * holding set), installs the new holdings (zero entries dropped) and
     * opens the holding window [date, expire_date).
     *
     * @throws InvariantViolation if new_cash < 0 or any share count is
     *         negative or not a multiple of lot_size(); no state changes.
     */
    void rebalance(const std::string& date,
                   const std::optional<std::string>& expire_date,
                   const Holdings& new_holdings,
                   double new_cash);

    /**
     * @brief Sell everything for proceeds and close the holding window.
     *
     * The sleeve becomes inactive and keeps only cash. The next rebalance
     * has no prior holding set, so its turnover is undefined.
     * @throws InvariantViolation if the resulting cash would be negative.
     */
    void liquidate(double proceeds);

private:
    int index_;
    double allocated_capital_;
    long long lot_size_;

    Holdings holdings_;
    double cash_;
    std::optional<std::string> start_date_;
    std::optional<std::string> expire_date_;
    bool is_active_ = false;
    std::set<std::string> previous_stocks_;
    TurnoverRecords turnover_records_;
    int rebalance_count_ = 0;

    void validate_holdings(const Holdings& holdings) const;
};

} // namespace backtest
} // namespace rankfolio

#endif // RANKFOLIO_BACKTEST_PORTFOLIO_STATE_HPP
