// SPDX-License-Identifier: MIT

#include "rankfolio/backtest/backtest_engine.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <numeric>
#include <sstream>

namespace rankfolio
{
    namespace backtest
    {

        namespace
        {
            constexpr double kCashTolerance = 1e-6;
            constexpr double kLotEpsilon = 1e-9;

            std::ofstream open_for_writing(const std::string &filepath)
            {
                std::filesystem::path path(filepath);
                if (path.has_parent_path())
                    std::filesystem::create_directories(path.parent_path());
                std::ofstream out(filepath);
                if (!out)
                    throw std::runtime_error("unable to open file for writing: " + filepath);
                return out;
            }

            struct LiquidationLine
            {
                TradeOrder order;
                TradeCost cost;
                TradeReason reason = TradeReason::Rebalance;
            };

            struct BuyLine
            {
                std::string ticker;
                double weight = 0.0;
                double price = 0.0;
                long long shares = 0;
                TradeCost cost;

                double outlay() const { return static_cast<double>(shares) * price + cost.total(); }
            };
        } // namespace

        std::string to_string(DiagnosticKind kind)
        {
            switch (kind)
            {
            case DiagnosticKind::PriceGap:
                return "price_gap";
            case DiagnosticKind::Shortfall:
                return "shortfall";
            case DiagnosticKind::ForcedLiquidation:
                return "forced_liquidation";
            case DiagnosticKind::InvariantViolation:
                return "invariant_violation";
            case DiagnosticKind::NoSignal:
                return "no_signal";
            case DiagnosticKind::SkippedTarget:
                return "skipped_target";
            }
            return "unknown";
        }

        // ------------------------- BacktestParams -------------------------------
        BacktestParams BacktestParams::from_config(const RankfolioConfig &config)
        {
            BacktestParams p;
            p.initial_capital = config.backtest.initial_capital;
            p.rebalance.frequency_days = config.strategy.rebalance_frequency;
            p.rebalance.portfolio_count = config.strategy.portfolio_count;
            p.lot_size = config.backtest.lot_size;
            p.cash_reserve_ratio = config.backtest.cash_reserve_ratio;
            p.transaction_costs = TransactionCostConfig::from_json(nlohmann::json{
                {"commission_rate", config.backtest.commission_rate},
                {"min_commission", config.backtest.min_commission},
                {"stamp_duty_rate", config.backtest.stamp_duty_rate},
                {"slippage_bps", config.backtest.slippage_bps}});
            p.verbose = config.display.verbose;
            p.validate();
            return p;
        }

        void BacktestParams::validate() const
        {
            if (!(initial_capital > 0.0) || !std::isfinite(initial_capital))
                throw std::invalid_argument("initial_capital must be > 0");
            if (lot_size <= 0)
                throw std::invalid_argument("lot_size must be > 0, got: " + std::to_string(lot_size));
            if (!(cash_reserve_ratio >= 0.0 && cash_reserve_ratio < 1.0))
            {
                std::ostringstream ss;
                ss << cash_reserve_ratio;
                throw std::invalid_argument("cash_reserve_ratio must be in [0, 1), got: " + ss.str());
            }
            rebalance.validate();
            transaction_costs.validate();
        }

        // ------------------------- BacktestResult helpers -----------------------
        std::vector<std::string> BacktestResult::dates() const
        {
            std::vector<std::string> out;
            out.reserve(account_history.size());
            for (const auto &row : account_history)
                out.push_back(row.date);
            return out;
        }

        Eigen::VectorXd BacktestResult::nav_series() const
        {
            Eigen::VectorXd nav(static_cast<Eigen::Index>(account_history.size()));
            for (size_t i = 0; i < account_history.size(); ++i)
                nav(static_cast<Eigen::Index>(i)) = account_history[i].total_account_asset;
            return nav;
        }

        Eigen::VectorXd BacktestResult::return_series() const
        {
            Eigen::VectorXd nav = nav_series();
            if (nav.size() < 2)
                return Eigen::VectorXd();
            Eigen::Index n = nav.size() - 1;
            Eigen::VectorXd ret(n);
            for (Eigen::Index i = 0; i < n; ++i)
                ret(i) = nav(i) > 0.0 ? nav(i + 1) / nav(i) - 1.0 : 0.0;
            return ret;
        }

        std::vector<int> BacktestResult::rebalance_counts() const
        {
            std::vector<int> out;
            out.reserve(account_history.size());
            for (const auto &row : account_history)
                out.push_back(row.rebalancing_sleeves);
            return out;
        }

        TurnoverTable BacktestResult::turnover() const
        {
            return calc_turnover_rate(portfolios, portfolio_count);
        }

        size_t BacktestResult::count_diagnostics(DiagnosticKind kind) const
        {
            return static_cast<size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
                                                     [kind](const Diagnostic &d)
                                                     { return d.kind == kind; }));
        }

        double BacktestResult::total_return() const
        {
            if (account_history.empty())
                return 0.0;
            double init = account_history.front().total_account_asset;
            double last = account_history.back().total_account_asset;
            if (init == 0.0)
                return 0.0;
            return last / init - 1.0;
        }

        double BacktestResult::annualized_return(int trading_days_per_year) const
        {
            if (account_history.size() < 2)
                return 0.0;
            double tot = total_return();
            double n_days = static_cast<double>(account_history.size());
            return std::pow(1.0 + tot, static_cast<double>(trading_days_per_year) / n_days) - 1.0;
        }

        double BacktestResult::annualized_volatility(int trading_days_per_year) const
        {
            Eigen::VectorXd ret = return_series();
            if (ret.size() == 0)
                return 0.0;
            double mean = ret.mean();
            double variance = (ret.array() - mean).square().sum() / static_cast<double>(ret.size());
            return std::sqrt(variance) * std::sqrt(static_cast<double>(trading_days_per_year));
        }

        double BacktestResult::sharpe_ratio(double risk_free_rate, int trading_days_per_year) const
        {
            double ar = annualized_return(trading_days_per_year);
            double av = annualized_volatility(trading_days_per_year);
            if (av <= 0.0)
                return 0.0;
            return (ar - risk_free_rate) / av;
        }

        double BacktestResult::max_drawdown() const
        {
            if (account_history.empty())
                return 0.0;
            double peak = account_history.front().total_account_asset;
            double max_dd = 0.0;
            for (const auto &row : account_history)
            {
                double v = row.total_account_asset;
                if (v > peak)
                    peak = v;
                if (peak <= 0.0)
                    continue;
                double dd = (peak - v) / peak;
                if (dd > max_dd)
                    max_dd = dd;
            }
            return max_dd;
        }

        double BacktestResult::benchmark_return() const
        {
            double first = std::numeric_limits<double>::quiet_NaN();
            double last = std::numeric_limits<double>::quiet_NaN();
            for (const auto &row : account_history)
            {
                if (!std::isfinite(row.benchmark))
                    continue;
                if (std::isnan(first))
                    first = row.benchmark;
                last = row.benchmark;
            }
            if (std::isnan(first) || first == 0.0)
                return 0.0;
            return last / first - 1.0;
        }

        void BacktestResult::print_summary() const
        {
            std::cout << "\n=== Rolling Backtest Summary ===\n";
            std::cout << "Status: " << (success ? "completed" : "failed") << " (" << message << ")\n";
            if (!account_history.empty())
            {
                std::cout << "Period: " << account_history.front().date << " to "
                          << account_history.back().date << " (" << account_history.size() << " days)\n";
                std::cout << std::fixed << std::setprecision(2)
                          << "Final account value: " << account_history.back().total_account_asset << "\n";
            }
            std::cout << std::fixed << std::setprecision(4);
            std::cout << "Total return: " << total_return() << " Annualized: " << annualized_return() << "\n";
            std::cout << "Ann vol: " << annualized_volatility() << " Sharpe: " << sharpe_ratio() << "\n";
            std::cout << "Max drawdown: " << max_drawdown() << "\n";
            std::cout << "Benchmark return: " << benchmark_return() << " Excess: " << excess_return() << "\n";

            if (portfolio_count > 0 && static_cast<size_t>(portfolio_count) == portfolios.size())
            {
                TurnoverTable table = turnover();
                std::cout << "Mean turnover by sleeve:\n";
                for (int i = 0; i < portfolio_count; ++i)
                {
                    auto mean = table.mean_turnover(i);
                    std::cout << "  portfolio_" << i << ": ";
                    if (mean)
                        std::cout << *mean;
                    else
                        std::cout << "undefined";
                    std::cout << " (" << portfolios[static_cast<size_t>(i)].rebalance_count() << " rebalances)\n";
                }
            }

            std::cout << "Diagnostics:";
            for (auto kind : {DiagnosticKind::PriceGap, DiagnosticKind::Shortfall,
                              DiagnosticKind::ForcedLiquidation, DiagnosticKind::InvariantViolation,
                              DiagnosticKind::NoSignal, DiagnosticKind::SkippedTarget})
            {
                std::cout << " " << to_string(kind) << "=" << count_diagnostics(kind);
            }
            std::cout << "\n";
            std::cout.unsetf(std::ios_base::floatfield);
        }

        void BacktestResult::export_account_history_csv(const std::string &filepath) const
        {
            std::ofstream out = open_for_writing(filepath);
            out << "date,total_account_asset,cash,holdings_value,benchmark,rebalancing_sleeves\n";
            out << std::fixed << std::setprecision(4);
            for (const auto &row : account_history)
            {
                out << row.date << "," << row.total_account_asset << "," << row.cash << ","
                    << row.holdings_value << ",";
                if (std::isfinite(row.benchmark))
                    out << row.benchmark;
                out << "," << row.rebalancing_sleeves << "\n";
            }
        }

        void BacktestResult::export_holdings_csv(const std::string &filepath) const
        {
            std::ofstream out = open_for_writing(filepath);
            out << "date,sleeve,instrument,shares,price,weight\n";
            out << std::fixed << std::setprecision(6);
            for (const auto &h : holdings_history)
            {
                out << h.date << "," << h.sleeve << "," << h.instrument << "," << h.shares << ","
                    << h.price << "," << h.weight << "\n";
            }
        }

        void BacktestResult::export_turnover_csv(const std::string &filepath) const
        {
            turnover().export_to_csv(filepath);
        }

        void BacktestResult::export_trades_csv(const std::string &filepath) const
        {
            TradeLogger ledger;
            for (const auto &t : trades)
                ledger.log_trade(t);
            ledger.export_to_csv(filepath);
        }

        // ------------------------- RollingBacktestEngine ------------------------
        RollingBacktestEngine::RollingBacktestEngine(const BacktestParams &params) : params_(params)
        {
            params_.validate();
        }

        void RollingBacktestEngine::record(BacktestResult &result, Diagnostic diagnostic) const
        {
            if (params_.verbose)
            {
                std::cerr << "[" << to_string(diagnostic.kind) << "] " << diagnostic.date;
                if (diagnostic.sleeve >= 0)
                    std::cerr << " sleeve " << diagnostic.sleeve;
                if (!diagnostic.instrument.empty())
                    std::cerr << " " << diagnostic.instrument;
                std::cerr << ": " << diagnostic.message << "\n";
            }
            result.diagnostics.push_back(std::move(diagnostic));
        }

        void RollingBacktestEngine::rebalance_sleeve(PortfolioState &state,
                                                     const DayContext &day,
                                                     const strategy::WeightVector *target,
                                                     const MarketData &market_data,
                                                     const RebalanceScheduler &scheduler,
                                                     const TransactionCostModel &cost_model,
                                                     TradeLogger &logger,
                                                     BacktestResult &result) const
        {
            const std::string &date = *day.date;
            const int sleeve = state.index();
            std::vector<Diagnostic> pending;

            // Liquidate every current holding at today's execution price.
            std::vector<LiquidationLine> sells;
            double proceeds = 0.0;
            for (const auto &h : state.holdings())
            {
                const std::string &ticker = h.first;
                bool tradable = market_data.is_tradable(ticker, day.price_index);
                double price = market_data.find_price(ticker, day.price_index);
                TradeReason reason = tradable ? TradeReason::Rebalance : TradeReason::ForcedLiquidation;

                if (!tradable)
                {
                    pending.push_back({DiagnosticKind::ForcedLiquidation, date, sleeve, ticker,
                                       "untradable on rebalance date, liquidated and excluded from target"});
                }
                if (!market_data.has_price(ticker, day.price_index))
                {
                    price = market_data.last_observed_price(ticker, day.history_index);
                    if (!(std::isfinite(price) && price > 0.0))
                    {
                        pending.push_back({DiagnosticKind::PriceGap, date, sleeve, ticker,
                                           "no observed price, position written off at zero"});
                        continue;
                    }
                    if (tradable)
                        reason = TradeReason::GapLiquidation;
                    pending.push_back({DiagnosticKind::PriceGap, date, sleeve, ticker,
                                       "no price today, liquidated at last observed price"});
                }

                LiquidationLine line;
                line.order = TradeOrder{ticker, -h.second, price};
                line.cost = cost_model.calculate_cost(line.order);
                line.reason = reason;
                proceeds += line.order.notional() - line.cost.total();
                sells.push_back(line);
            }

            const double available = state.cash() + proceeds;

            std::vector<TradeOrder> orders;
            std::vector<TradeCost> costs;
            std::vector<TradeReason> reasons;
            for (const auto &s : sells)
            {
                orders.push_back(s.order);
                costs.push_back(s.cost);
                reasons.push_back(s.reason);
            }

            try
            {
                if (target == nullptr)
                {
                    pending.push_back({DiagnosticKind::NoSignal, date, sleeve, "",
                                       "no weight vector for rebalance date, sleeve moved to cash"});
                    state.liquidate(proceeds);
                }
                else
                {
                    // Size buys in whole lots against the sleeve's post-liquidation capital.
                    const double budget = available * (1.0 - params_.cash_reserve_ratio);
                    const double lot = static_cast<double>(params_.lot_size);
                    std::vector<BuyLine> buys;
                    for (const auto &w : *target)
                    {
                        const std::string &ticker = w.first;
                        if (!(w.second > 0.0))
                            continue;
                        if (!market_data.is_tradable(ticker, day.price_index) ||
                            !market_data.has_price(ticker, day.price_index))
                        {
                            pending.push_back({DiagnosticKind::SkippedTarget, date, sleeve, ticker,
                                               market_data.has_price(ticker, day.price_index)
                                                   ? "target untradable at execution, skipped"
                                                   : "target has no price at execution, skipped"});
                            continue;
                        }
                        BuyLine line;
                        line.ticker = ticker;
                        line.weight = w.second;
                        line.price = market_data.find_price(ticker, day.price_index);
                        if (budget > 0.0)
                        {
                            double lots = std::floor(w.second * budget / (line.price * lot) + kLotEpsilon);
                            line.shares = static_cast<long long>(lots) * params_.lot_size;
                        }
                        line.cost = cost_model.calculate_cost(TradeOrder{ticker, line.shares, line.price});
                        buys.push_back(line);
                    }

                    // Drop lots from the back of the order until costs fit in cash.
                    double spend = 0.0;
                    for (const auto &b : buys)
                        spend += b.outlay();
                    size_t last = buys.size();
                    while (spend > available + kCashTolerance && last > 0)
                    {
                        BuyLine &line = buys[last - 1];
                        if (line.shares <= 0)
                        {
                            --last;
                            continue;
                        }
                        spend -= line.outlay();
                        line.shares -= params_.lot_size;
                        line.cost = cost_model.calculate_cost(TradeOrder{line.ticker, line.shares, line.price});
                        spend += line.outlay();
                    }

                    double new_cash = available - spend;
                    if (new_cash < 0.0 && new_cash > -kCashTolerance)
                        new_cash = 0.0;

                    Holdings next;
                    for (const auto &b : buys)
                    {
                        if (b.shares > 0)
                            next[b.ticker] = b.shares;
                    }

                    int expire_idx = scheduler.expire_index(day.day_index);
                    std::optional<std::string> expire;
                    if (expire_idx < static_cast<int>(day.calendar->size()))
                        expire = (*day.calendar)[static_cast<size_t>(expire_idx)];

                    state.rebalance(date, expire, next, new_cash);

                    for (const auto &b : buys)
                    {
                        if (b.shares <= 0)
                            continue;
                        result.holdings_history.push_back({date, sleeve, b.ticker, b.shares, b.price, b.weight});
                        orders.push_back(TradeOrder{b.ticker, b.shares, b.price});
                        costs.push_back(b.cost);
                        reasons.push_back(TradeReason::Rebalance);
                    }
                }
            }
            catch (const InvariantViolation &)
            {
                // Conditions seen before the abort are still reported.
                for (auto &d : pending)
                    record(result, std::move(d));
                throw;
            }

            // Only a committed rebalance reaches the ledger.
            logger.log_rebalance(date, sleeve, orders, costs, reasons);
            for (auto &d : pending)
                record(result, std::move(d));
        }

        AccountSnapshot RollingBacktestEngine::mark_to_market(const std::vector<PortfolioState> &states,
                                                              const DayContext &day,
                                                              const MarketData &market_data,
                                                              BacktestResult &result) const
        {
            AccountSnapshot row;
            row.date = *day.date;
            row.benchmark = market_data.benchmark_at(day.price_index);

            for (const auto &state : states)
            {
                row.cash += state.cash();
                for (const auto &h : state.holdings())
                {
                    if (!market_data.has_price(h.first, day.price_index))
                    {
                        record(result, {DiagnosticKind::PriceGap, row.date, state.index(), h.first,
                                        "no price, valued at zero for the day"});
                        continue;
                    }
                    row.holdings_value += static_cast<double>(h.second) *
                                          market_data.find_price(h.first, day.price_index);
                }
            }
            row.total_account_asset = row.cash + row.holdings_value;
            return row;
        }

        // ------------------------- Run methods ---------------------------------
        BacktestResult RollingBacktestEngine::run(const strategy::WeightSchedule &weights,
                                                  const MarketData &market_data)
        {
            return run(weights, market_data, market_data.get_dates());
        }

        BacktestResult RollingBacktestEngine::run(const strategy::WeightSchedule &weights,
                                                  const MarketData &market_data,
                                                  const std::vector<std::string> &trading_calendar)
        {
            if (trading_calendar.empty())
                throw std::invalid_argument("trading calendar must not be empty");
            for (size_t i = 1; i < trading_calendar.size(); ++i)
            {
                if (!(trading_calendar[i - 1] < trading_calendar[i]))
                    throw std::invalid_argument("trading calendar must be strictly ascending near " +
                                                trading_calendar[i]);
            }

            const int count = params_.rebalance.portfolio_count;
            RebalanceScheduler scheduler(params_.rebalance);
            TransactionCostModel cost_model(params_.transaction_costs);
            TradeLogger logger;

            BacktestResult result;
            result.portfolio_count = count;

            const double sleeve_capital = params_.initial_capital / count;
            std::vector<PortfolioState> states;
            states.reserve(static_cast<size_t>(count));
            for (int i = 0; i < count; ++i)
                states.emplace_back(i, sleeve_capital, params_.lot_size);

            for (const auto &s : weights.shortfalls)
            {
                std::ostringstream msg;
                msg << "signal " << s.signal_date << ": " << s.selected << " of " << s.requested
                    << " names available";
                record(result, {DiagnosticKind::Shortfall, s.trade_date, -1, "", msg.str()});
            }

            const std::vector<std::string> &md_dates = market_data.get_dates();
            result.account_history.reserve(trading_calendar.size());
            for (int d = 0; d < static_cast<int>(trading_calendar.size()); ++d)
            {
                DayContext day;
                day.day_index = d;
                day.date = &trading_calendar[static_cast<size_t>(d)];
                day.price_index = market_data.date_index(*day.date);
                day.history_index = static_cast<int>(std::upper_bound(md_dates.begin(), md_dates.end(), *day.date) -
                                                     md_dates.begin()) - 1;
                day.calendar = &trading_calendar;

                std::vector<int> rebalancing = scheduler.sleeves_rebalancing_on(d);
                const strategy::WeightVector *target = weights.find(*day.date);

                for (int sleeve : rebalancing)
                {
                    PortfolioState &state = states[static_cast<size_t>(sleeve)];
                    try
                    {
                        rebalance_sleeve(state, day, target, market_data, scheduler, cost_model, logger, result);
                    }
                    catch (const InvariantViolation &e)
                    {
                        record(result, {DiagnosticKind::InvariantViolation, *day.date, sleeve, "", e.what()});
                    }
                }

                AccountSnapshot row = mark_to_market(states, day, market_data, result);
                row.rebalancing_sleeves = static_cast<int>(rebalancing.size());
                result.account_history.push_back(row);
            }

            result.portfolios = std::move(states);
            result.trades = logger.trades();
            result.trade_summary = logger.get_summary();
            result.success = true;
            result.message = "completed";
            return result;
        }

    } // namespace backtest
} // namespace rankfolio
