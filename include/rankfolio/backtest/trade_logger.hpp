#ifndef RANKFOLIO_BACKTEST_TRADE_LOGGER_HPP
#define RANKFOLIO_BACKTEST_TRADE_LOGGER_HPP

#include <string>
#include <vector>
#include "rankfolio/backtest/transaction_cost_model.hpp"

namespace rankfolio {
namespace backtest {

enum class TradeReason {
    Rebalance,          ///< liquidation or rebuild of a tradable name
    ForcedLiquidation,  ///< held name untradable on the rebalance date
    GapLiquidation      ///< held name with no price today, sold at its last observation
};

std::string to_string(TradeReason reason);

struct TradeRecord {
    int trade_id = 0;
    std::string date;
    int sleeve = 0;
    std::string ticker;
    long long shares = 0;   ///< signed: positive buy, negative sell
    double price = 0.0;
    double notional = 0.0;  ///< signed shares * price
    double commission = 0.0;
    double stamp_duty = 0.0;
    double slippage = 0.0;
    double total_cost = 0.0;
    TradeReason reason = TradeReason::Rebalance;
};

struct TradeSummary {
    int total_trades = 0;
    int buy_trades = 0;
    int sell_trades = 0;
    int forced_liquidations = 0;
    double total_notional = 0.0;
    double total_costs = 0.0;
    double avg_cost_per_trade = 0.0;
    int rebalance_count = 0;
};

class TradeLogger {
public:
    TradeLogger() = default;
    ~TradeLogger() = default;

    /// Append a trade; the logger assigns trade_id.
    void log_trade(const TradeRecord& record);

    /**
     * @brief Record one sleeve rebalance: every non-zero order with its cost.
     * @throws std::invalid_argument if orders and costs differ in size.
     */
    void log_rebalance(const std::string& date,
                       int sleeve,
                       const std::vector<TradeOrder>& orders,
                       const std::vector<TradeCost>& costs,
                       const std::vector<TradeReason>& reasons);

    const std::vector<TradeRecord>& trades() const { return trades_; }
    std::vector<TradeRecord> trades_for_date(const std::string& date) const;
    std::vector<TradeRecord> trades_for_ticker(const std::string& ticker) const;
    std::vector<TradeRecord> trades_for_sleeve(int sleeve) const;
    TradeSummary get_summary() const;
    int num_trades() const { return static_cast<int>(trades_.size()); }

    void export_to_csv(const std::string& filepath) const;
    void print_summary() const;

    void clear() { trades_.clear(); next_trade_id_ = 0; rebalance_count_ = 0; }

private:
    std::vector<TradeRecord> trades_;
    int next_trade_id_ = 0;
    int rebalance_count_ = 0;
};

} // namespace backtest
} // namespace rankfolio

#endif // RANKFOLIO_BACKTEST_TRADE_LOGGER_HPP
