#include "rankfolio/backtest/transaction_cost_model.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace rankfolio {
namespace backtest {

namespace {
void require_non_negative(double value, const char* name) {
    if (!(value >= 0.0) || !std::isfinite(value)) {
        std::ostringstream ss; ss << value;
        throw std::invalid_argument(std::string("Expected non-negative value for parameter '") + name +
                                    "', got: " + ss.str());
    }
}
} // namespace

TransactionCostConfig TransactionCostConfig::default_config() {
    return TransactionCostConfig{};
}

TransactionCostConfig TransactionCostConfig::from_json(const nlohmann::json& j) {
    TransactionCostConfig cfg = default_config();
    if (j.is_object()) {
        cfg.commission_rate = j.value("commission_rate", cfg.commission_rate);
        cfg.min_commission = j.value("min_commission", cfg.min_commission);
        cfg.stamp_duty_rate = j.value("stamp_duty_rate", cfg.stamp_duty_rate);
        cfg.slippage_bps = j.value("slippage_bps", cfg.slippage_bps);
    }
    return cfg;
}

TransactionCostModel::TransactionCostModel(const TransactionCostConfig& config)
    : config_(config) {
    config_.validate();
}

TransactionCostModel::TransactionCostModel()
    : config_(TransactionCostConfig::default_config()) {
}

void TransactionCostConfig::validate() const {
    require_non_negative(commission_rate, "commission_rate");
    require_non_negative(min_commission, "min_commission");
    require_non_negative(stamp_duty_rate, "stamp_duty_rate");
    require_non_negative(slippage_bps, "slippage_bps");
}

bool TransactionCostModel::is_free() const {
    return config_.commission_rate == 0.0 && config_.stamp_duty_rate == 0.0 && config_.slippage_bps == 0.0;
}

TradeCost TransactionCostModel::calculate_cost(const TradeOrder& order) const {
    if (!(order.price > 0.0)) {
        std::ostringstream ss; ss << order.price;
        throw std::invalid_argument("Expected positive value for parameter 'price', got: " + ss.str());
    }
    if (order.shares == 0) return TradeCost{};

    double notional = order.notional();
    return TradeCost{commission_cost(notional),
                     stamp_duty_cost(notional, order.is_sell()),
                     slippage_cost(notional)};
}

double TransactionCostModel::calculate_total_cost(const std::vector<TradeOrder>& orders) const {
    double sum = 0.0;
    for (const auto& o : orders) {
        sum += calculate_cost(o).total();
    }
    return sum;
}

double TransactionCostModel::commission_cost(double notional) const {
    if (config_.commission_rate <= 0.0 || notional == 0.0) return 0.0;
    return std::max(std::abs(notional) * config_.commission_rate, config_.min_commission);
}

double TransactionCostModel::stamp_duty_cost(double notional, bool is_sell) const {
    if (!is_sell) return 0.0;
    return std::abs(notional) * config_.stamp_duty_rate;
}

double TransactionCostModel::slippage_cost(double notional) const {
    return std::abs(notional) * (config_.slippage_bps / 10000.0);
}

} // namespace backtest
} // namespace rankfolio
