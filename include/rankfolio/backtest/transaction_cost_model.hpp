// transaction_cost_model.hpp
#ifndef RANKFOLIO_BACKTEST_TRANSACTION_COST_MODEL_HPP
#define RANKFOLIO_BACKTEST_TRANSACTION_COST_MODEL_HPP

#include <cstdlib>
#include <string>
#include <vector>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace rankfolio {
namespace backtest {

/// Signed share order: positive buys, negative sells.
struct TradeOrder {
    std::string ticker;
    long long shares{0};
    double price{0.0};

    bool is_sell() const { return shares < 0; }
    double notional() const { return static_cast<double>(std::llabs(shares)) * price; }
};

struct TradeCost {
    double commission{0.0};
    double stamp_duty{0.0};
    double slippage{0.0};
    double total() const { return commission + stamp_duty + slippage; }
};

struct TransactionCostConfig {
    double commission_rate{0.0};
    double min_commission{0.0};   ///< floor per trade, applied when commission_rate > 0
    double stamp_duty_rate{0.0};  ///< sells only
    double slippage_bps{0.0};

    static TransactionCostConfig from_json(const nlohmann::json& j);
    static TransactionCostConfig default_config();

    /// @throws std::invalid_argument when any rate is negative or not finite.
    void validate() const;
};

class TransactionCostModel {
public:
    explicit TransactionCostModel(const TransactionCostConfig& config);
    TransactionCostModel();
    ~TransactionCostModel() = default;

    /// @throws std::invalid_argument on a non-positive price.
    TradeCost calculate_cost(const TradeOrder& order) const;
    double calculate_total_cost(const std::vector<TradeOrder>& orders) const;

    /// True when every rate is zero; trades then cost nothing.
    bool is_free() const;

    const TransactionCostConfig& config() const { return config_; }
    std::string get_name() const { return "TransactionCostModel"; }

    double commission_cost(double notional) const;
    double stamp_duty_cost(double notional, bool is_sell) const;
    double slippage_cost(double notional) const;

private:
    TransactionCostConfig config_;
};

} // namespace backtest
} // namespace rankfolio

#endif // RANKFOLIO_BACKTEST_TRANSACTION_COST_MODEL_HPP
