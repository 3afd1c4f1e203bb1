// ============================================================================
// Implementation of PortfolioState
// ============================================================================

#include "rankfolio/backtest/portfolio_state.hpp"
#include "rankfolio/backtest/turnover_calculator.hpp"

#include <cmath>
#include <sstream>

namespace rankfolio {
namespace backtest {

// ============================================================================
// PortfolioState - lifecycle
// ============================================================================

PortfolioState::PortfolioState(int index, double allocated_capital, long long lot_size)
    : index_(index), allocated_capital_(allocated_capital), lot_size_(lot_size), cash_(allocated_capital) {
    if (index < 0) {
        throw std::invalid_argument("sleeve index must be >= 0");
    }
    if (!(allocated_capital > 0.0)) {
        throw std::invalid_argument("allocated_capital must be > 0");
    }
    if (lot_size <= 0) {
        throw std::invalid_argument("lot_size must be > 0");
    }
}

// ============================================================================
// PortfolioState - queries
// ============================================================================

std::set<std::string> PortfolioState::current_stocks() const {
    std::set<std::string> out;
    for (const auto& h : holdings_) out.insert(h.first);
    return out;
}

long long PortfolioState::shares(const std::string& instrument) const {
    auto it = holdings_.find(instrument);
    return it == holdings_.end() ? 0 : it->second;
}

double PortfolioState::market_value(const std::map<std::string, double>& prices) const {
    double value = cash_;
    for (const auto& h : holdings_) {
        auto it = prices.find(h.first);
        if (it != prices.end() && std::isfinite(it->second)) {
            value += static_cast<double>(h.second) * it->second;
        }
    }
    return value;
}

// ============================================================================
// PortfolioState - mutation
// ============================================================================

void PortfolioState::validate_holdings(const Holdings& holdings) const {
    for (const auto& h : holdings) {
        if (h.second < 0) {
            std::ostringstream msg;
            msg << "sleeve " << index_ << ": negative shares for " << h.first << ": " << h.second;
            throw InvariantViolation(msg.str());
        }
        if (h.second % lot_size_ != 0) {
            std::ostringstream msg;
            msg << "sleeve " << index_ << ": " << h.second << " shares of " << h.first
                << " is not a multiple of lot size " << lot_size_;
            throw InvariantViolation(msg.str());
        }
    }
}

void PortfolioState::rebalance(const std::string& date,
                               const std::optional<std::string>& expire_date,
                               const Holdings& new_holdings,
                               double new_cash) {
    if (!(new_cash >= 0.0)) {
        std::ostringstream msg;
        msg << "sleeve " << index_ << ": rebalance on " << date << " would leave cash at " << new_cash;
        throw InvariantViolation(msg.str());
    }
    validate_holdings(new_holdings);

    Holdings cleaned;
    for (const auto& h : new_holdings) {
        if (h.second > 0) cleaned.emplace(h.first, h.second);
    }

    previous_stocks_ = current_stocks();
    std::set<std::string> next_stocks;
    for (const auto& h : cleaned) next_stocks.insert(h.first);
    turnover_records_[date] = set_turnover(previous_stocks_, next_stocks);

    holdings_ = std::move(cleaned);
    cash_ = new_cash;
    start_date_ = date;
    expire_date_ = expire_date;
    is_active_ = true;
    ++rebalance_count_;
}

void PortfolioState::liquidate(double proceeds) {
    double next_cash = cash_ + proceeds;
    if (!(next_cash >= 0.0)) {
        std::ostringstream msg;
        msg << "sleeve " << index_ << ": liquidation would leave cash at " << next_cash;
        throw InvariantViolation(msg.str());
    }
    previous_stocks_ = current_stocks();
    holdings_.clear();
    cash_ = next_cash;
    is_active_ = false;
    expire_date_.reset();
}

} // namespace backtest
} // namespace rankfolio
