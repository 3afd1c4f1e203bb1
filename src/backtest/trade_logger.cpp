/**
 * @file trade_logger.cpp
 * @brief Implementation of TradeLogger
 */

#include "rankfolio/backtest/trade_logger.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>

namespace rankfolio {
namespace backtest {

std::string to_string(TradeReason reason)
{
    switch (reason)
    {
    case TradeReason::Rebalance:
        return "rebalance";
    case TradeReason::ForcedLiquidation:
        return "forced_liquidation";
    case TradeReason::GapLiquidation:
        return "gap_liquidation";
    }
    return "unknown";
}

void TradeLogger::log_trade(const TradeRecord &record)
{
    TradeRecord r = record;
    r.trade_id = next_trade_id_++;
    trades_.push_back(r);
}

void TradeLogger::log_rebalance(const std::string &date,
                                int sleeve,
                                const std::vector<TradeOrder> &orders,
                                const std::vector<TradeCost> &costs,
                                const std::vector<TradeReason> &reasons)
{
    if (orders.size() != costs.size() || orders.size() != reasons.size())
    {
        throw std::invalid_argument("Mismatched rebalance vector sizes");
    }

    rebalance_count_ += 1;

    for (size_t i = 0; i < orders.size(); ++i)
    {
        const TradeOrder &o = orders[i];
        if (o.shares == 0)
            continue;

        TradeRecord r;
        r.trade_id = next_trade_id_++;
        r.date = date;
        r.sleeve = sleeve;
        r.ticker = o.ticker;
        r.shares = o.shares;
        r.price = o.price;
        r.notional = static_cast<double>(o.shares) * o.price;
        r.commission = costs[i].commission;
        r.stamp_duty = costs[i].stamp_duty;
        r.slippage = costs[i].slippage;
        r.total_cost = costs[i].total();
        r.reason = reasons[i];

        trades_.push_back(r);
    }
}

std::vector<TradeRecord> TradeLogger::trades_for_date(const std::string &date) const
{
    std::vector<TradeRecord> out;
    for (const auto &t : trades_)
    {
        if (t.date == date)
            out.push_back(t);
    }
    return out;
}

std::vector<TradeRecord> TradeLogger::trades_for_ticker(const std::string &ticker) const
{
    std::vector<TradeRecord> out;
    for (const auto &t : trades_)
    {
        if (t.ticker == ticker)
            out.push_back(t);
    }
    return out;
}

std::vector<TradeRecord> TradeLogger::trades_for_sleeve(int sleeve) const
{
    std::vector<TradeRecord> out;
    for (const auto &t : trades_)
    {
        if (t.sleeve == sleeve)
            out.push_back(t);
    }
    return out;
}

TradeSummary TradeLogger::get_summary() const
{
    TradeSummary s;
    s.total_trades = static_cast<int>(trades_.size());
    s.rebalance_count = rebalance_count_;

    for (const auto &t : trades_)
    {
        if (t.shares > 0)
            ++s.buy_trades;
        else if (t.shares < 0)
            ++s.sell_trades;
        if (t.reason != TradeReason::Rebalance)
            ++s.forced_liquidations;

        s.total_notional += std::abs(t.notional);
        s.total_costs += t.total_cost;
    }

    if (s.total_trades > 0)
        s.avg_cost_per_trade = s.total_costs / s.total_trades;

    return s;
}

void TradeLogger::export_to_csv(const std::string &filepath) const
{
    std::filesystem::path path(filepath);
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(filepath);
    if (!file.is_open())
    {
        throw std::runtime_error("Could not open file for writing: " + filepath);
    }

    file << "trade_id,date,sleeve,ticker,shares,price,notional,commission,stamp_duty,slippage,total_cost,reason\n";
    file << std::fixed << std::setprecision(4);

    for (const auto &t : trades_)
    {
        file << t.trade_id << ","
             << t.date << ","
             << t.sleeve << ","
             << t.ticker << ","
             << t.shares << ","
             << t.price << ","
             << t.notional << ","
             << t.commission << ","
             << t.stamp_duty << ","
             << t.slippage << ","
             << t.total_cost << ","
             << to_string(t.reason) << "\n";
    }
}

void TradeLogger::print_summary() const
{
    auto s = get_summary();
    std::cout << "\n=== Trade Log Summary ===\n";
    std::cout << "Total trades: " << s.total_trades << "\n";
    std::cout << "Buys: " << s.buy_trades << "  Sells: " << s.sell_trades << "\n";
    std::cout << "Forced liquidations: " << s.forced_liquidations << "\n";
    std::cout << "Total notional: " << s.total_notional << "\n";
    std::cout << "Total costs: " << s.total_costs << "\n";
    std::cout << "Average cost/trade: " << s.avg_cost_per_trade << "\n";
    std::cout << "Rebalance events: " << s.rebalance_count << "\n";
    std::cout << "==========================\n";
}

} // namespace backtest
} // namespace rankfolio
