// SPDX-License-Identifier: MIT
#ifndef RANKFOLIO_BACKTEST_BACKTEST_ENGINE_HPP
#define RANKFOLIO_BACKTEST_BACKTEST_ENGINE_HPP

#include <string>
#include <vector>
#include <stdexcept>
#include <Eigen/Dense>
#include "rankfolio/data/market_data.hpp"
#include "rankfolio/data/data_loader.hpp"
#include "rankfolio/strategy/weight_generator.hpp"
#include "rankfolio/backtest/portfolio_state.hpp"
#include "rankfolio/backtest/rebalance_scheduler.hpp"
#include "rankfolio/backtest/trade_logger.hpp"
#include "rankfolio/backtest/transaction_cost_model.hpp"
#include "rankfolio/backtest/turnover_calculator.hpp"

namespace rankfolio
{
    namespace backtest
    {

        enum class DiagnosticKind
        {
            PriceGap,           ///< held instrument without a price on a required date
            Shortfall,          ///< fewer than rank_n tradable candidates
            ForcedLiquidation,  ///< held instrument untradable on its sleeve's rebalance date
            InvariantViolation, ///< rebalance aborted, sleeve left unchanged
            NoSignal,           ///< no weight vector on a rebalance date, sleeve moved to cash
            SkippedTarget       ///< target name untradable or unpriced at execution, not bought
        };

        std::string to_string(DiagnosticKind kind);

        /**
         * @struct Diagnostic
         * @brief A recoverable condition absorbed during the run.
         */
        struct Diagnostic
        {
            DiagnosticKind kind = DiagnosticKind::PriceGap;
            std::string date;
            int sleeve = -1; ///< -1 when not sleeve specific
            std::string instrument;
            std::string message;
        };

        /**
         * @struct AccountSnapshot
         * @brief Aggregate account row for one trading day.
         *
         * Inactive sleeves contribute their cash. benchmark is NaN when no
         * benchmark series is attached or the value is missing.
         */
        struct AccountSnapshot
        {
            std::string date;
            double total_account_asset = 0.0;
            double cash = 0.0;
            double holdings_value = 0.0;
            double benchmark = 0.0;
            int rebalancing_sleeves = 0;
        };

        /// One holding of one sleeve, as committed at a rebalance.
        struct HoldingRecord
        {
            std::string date;
            int sleeve = 0;
            std::string instrument;
            long long shares = 0;
            double price = 0.0;
            double weight = 0.0; ///< target weight the position was sized from
        };

        /**
         * @struct BacktestResult
         * @brief Container for rolling backtest output.
         *
         * Holds the account history, the final sleeve states, every committed
         * holding, the trade ledger and the diagnostics absorbed during the
         * run. Provides lightweight inline performance metrics on the total
         * account NAV.
         */
        struct BacktestResult
        {
            bool success = false;
            std::string message;

            std::vector<AccountSnapshot> account_history;
            std::vector<PortfolioState> portfolios;
            int portfolio_count = 0;

            std::vector<HoldingRecord> holdings_history;
            std::vector<TradeRecord> trades;
            TradeSummary trade_summary;
            std::vector<Diagnostic> diagnostics;

            // -------------------------------------------------------------------
            // Series
            // -------------------------------------------------------------------

            std::vector<std::string> dates() const;
            Eigen::VectorXd nav_series() const;
            /// Simple daily returns of the NAV; size num_days - 1.
            Eigen::VectorXd return_series() const;
            /// Number of sleeves scheduled to rebalance on each day.
            std::vector<int> rebalance_counts() const;

            /// Date x sleeve turnover derived from the final sleeve states.
            TurnoverTable turnover() const;

            size_t count_diagnostics(DiagnosticKind kind) const;

            // -------------------------------------------------------------------
            // Inline metrics
            // -------------------------------------------------------------------

            double total_return() const;
            double annualized_return(int trading_days_per_year = 252) const;
            double annualized_volatility(int trading_days_per_year = 252) const;
            double sharpe_ratio(double risk_free_rate = 0.03,
                                int trading_days_per_year = 252) const;
            double max_drawdown() const;
            /// Benchmark change between its first and last finite values; 0 when absent.
            double benchmark_return() const;
            double excess_return() const { return total_return() - benchmark_return(); }

            // -------------------------------------------------------------------
            // Export
            // -------------------------------------------------------------------

            void print_summary() const;

            /**
             * @brief Write date,total_account_asset,cash,holdings_value,benchmark,rebalancing_sleeves.
             * @throws std::runtime_error If the file cannot be opened.
             */
            void export_account_history_csv(const std::string &filepath) const;

            /// @throws std::runtime_error If the file cannot be opened.
            void export_holdings_csv(const std::string &filepath) const;

            /// @throws std::runtime_error If the file cannot be opened.
            void export_turnover_csv(const std::string &filepath) const;

            /// @throws std::runtime_error If the file cannot be opened.
            void export_trades_csv(const std::string &filepath) const;
        };

        struct BacktestParams
        {
            double initial_capital = 10000000.0;
            RebalanceConfig rebalance;
            long long lot_size = 100;
            double cash_reserve_ratio = 0.0;
            TransactionCostConfig transaction_costs;
            bool verbose = false;

            static BacktestParams from_config(const RankfolioConfig &config);

            /// @throws std::invalid_argument on any out-of-range value.
            void validate() const;
        };

        /**
         * @class RollingBacktestEngine
         * @brief Drives portfolio_count staggered sleeves through the trading calendar.
         *
         * Days are processed strictly in order. On a sleeve's rebalance day the
         * sleeve is liquidated at the day's execution price and rebuilt from
         * the weight vector keyed by that day, in whole lots, keeping
         * cash_reserve_ratio of its capital unallocated. On other days the
         * sleeve is only marked to market.
         */
        class RollingBacktestEngine
        {
        public:
            /// @throws std::invalid_argument if params fail validation.
            explicit RollingBacktestEngine(const BacktestParams &params);
            ~RollingBacktestEngine() = default;

            /**
             * @brief Run over an explicit trading calendar.
             * @throws std::invalid_argument if the calendar is empty or not
             *         strictly ascending.
             */
            BacktestResult run(const strategy::WeightSchedule &weights,
                               const MarketData &market_data,
                               const std::vector<std::string> &trading_calendar);

            /// Run over the dates of market_data.
            BacktestResult run(const strategy::WeightSchedule &weights,
                               const MarketData &market_data);

            const BacktestParams &params() const { return params_; }

        private:
            BacktestParams params_;

            struct DayContext
            {
                int day_index = 0;
                int price_index = -1;   ///< row in market_data, -1 when the date has no prices
                int history_index = -1; ///< last market_data row on or before the date
                const std::string *date = nullptr;
                const std::vector<std::string> *calendar = nullptr;
            };

            void rebalance_sleeve(PortfolioState &state,
                                  const DayContext &day,
                                  const strategy::WeightVector *target,
                                  const MarketData &market_data,
                                  const RebalanceScheduler &scheduler,
                                  const TransactionCostModel &cost_model,
                                  TradeLogger &logger,
                                  BacktestResult &result) const;

            AccountSnapshot mark_to_market(const std::vector<PortfolioState> &states,
                                           const DayContext &day,
                                           const MarketData &market_data,
                                           BacktestResult &result) const;

            void record(BacktestResult &result, Diagnostic diagnostic) const;
        };

    } // namespace backtest
} // namespace rankfolio

#endif // RANKFOLIO_BACKTEST_BACKTEST_ENGINE_HPP
