/**
 * @file weight_generator.hpp
 * @brief Per-date target weights and the weight schedule consumed by the engine
 */

#ifndef RANKFOLIO_STRATEGY_WEIGHT_GENERATOR_HPP
#define RANKFOLIO_STRATEGY_WEIGHT_GENERATOR_HPP

#include "rankfolio/data/market_data.hpp"
#include "rankfolio/strategy/weighting_scheme.hpp"

#include <map>
#include <string>
#include <vector>

namespace rankfolio
{
    namespace strategy
    {

        /**
         * @struct WeightResult
         * @brief Weights for one date plus the selection bookkeeping.
         */
        struct WeightResult
        {
            WeightVector weights;
            int requested = 0; ///< rank_n
            int available = 0; ///< valid candidates offered
            int selected = 0;  ///< names actually weighted

            bool shortfall() const { return selected < requested; }
        };

        /**
         * @brief Turn a ranked cross-section into a weight vector.
         *
         * Selects exactly rank_n names when at least rank_n valid candidates
         * exist, otherwise all of them (the shortfall is reported, not fatal).
         * Pure function of its inputs.
         *
         * @throws std::invalid_argument if rank_n <= 0.
         */
        WeightResult generate_weights(const std::vector<RankedCandidate> &ranked_signals_for_date,
                                      int rank_n,
                                      const WeightingScheme &scheme);

        /// Equal-weight overload.
        WeightResult generate_weights(const std::vector<RankedCandidate> &ranked_signals_for_date,
                                      int rank_n);

        struct ShortfallRecord
        {
            std::string signal_date;
            std::string trade_date;
            int requested = 0;
            int selected = 0;
        };

        /**
         * @struct WeightSchedule
         * @brief Trade date -> target weight vector.
         */
        struct WeightSchedule
        {
            std::map<std::string, WeightVector> by_date;
            std::vector<ShortfallRecord> shortfalls;
            std::vector<std::string> unmatched_signal_dates; ///< no later trading day exists

            /**
             * @brief Weight vector for a trade date, nullptr when none was scheduled.
             */
            const WeightVector *find(const std::string &date) const;

            size_t size() const { return by_date.size(); }
            bool empty() const { return by_date.empty(); }

            /**
             * @brief Keep trade dates within [start_date, end_date]; empty bounds are open.
             */
            WeightSchedule filter_by_date(const std::string &start_date,
                                          const std::string &end_date) const;

            /**
             * @brief Write date,instrument,weight rows.
             * @throws std::runtime_error If the file cannot be opened.
             */
            void export_to_csv(const std::string &filepath) const;
        };

        /**
         * @brief Build the weight schedule from raw signals.
         *
         * Signals published on trading day t are traded on the next trading
         * day t+1. Candidates are filtered to the universe tradable on the
         * trade date (mask set and price available) before selection. Trade
         * dates where nothing survives the filter are omitted and recorded as
         * shortfalls.
         *
         * @param signals Signal date -> ranked candidates.
         * @param market_data Prices and tradable mask.
         * @param trading_calendar Ascending trading dates.
         * @param rank_n Names per date.
         * @param scheme Allocation policy.
         * @throws std::invalid_argument if the calendar is empty or rank_n <= 0.
         */
        WeightSchedule build_weight_schedule(const SignalBook &signals,
                                             const MarketData &market_data,
                                             const std::vector<std::string> &trading_calendar,
                                             int rank_n,
                                             const WeightingScheme &scheme);

    } // namespace strategy
} // namespace rankfolio

#endif // RANKFOLIO_STRATEGY_WEIGHT_GENERATOR_HPP
