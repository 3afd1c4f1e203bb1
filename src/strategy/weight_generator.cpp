/**
 * @file weight_generator.cpp
 * @brief Implementation of weight generation and schedule building
 */

#include "rankfolio/strategy/weight_generator.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <set>
#include <stdexcept>

namespace rankfolio
{
    namespace strategy
    {

        namespace
        {
            int count_valid(const std::vector<RankedCandidate> &candidates)
            {
                std::set<std::string> ids;
                for (const auto &c : candidates)
                {
                    if (!c.instrument.empty() && !std::isnan(c.rank))
                        ids.insert(c.instrument);
                }
                return static_cast<int>(ids.size());
            }
        } // namespace

        WeightResult generate_weights(const std::vector<RankedCandidate> &ranked_signals_for_date,
                                      int rank_n,
                                      const WeightingScheme &scheme)
        {
            if (rank_n <= 0)
            {
                throw std::invalid_argument("rank_n must be > 0, got: " + std::to_string(rank_n));
            }

            WeightResult result;
            result.requested = rank_n;
            result.available = count_valid(ranked_signals_for_date);
            result.weights = scheme.compute(ranked_signals_for_date, rank_n);
            result.selected = static_cast<int>(result.weights.size());
            return result;
        }

        WeightResult generate_weights(const std::vector<RankedCandidate> &ranked_signals_for_date,
                                      int rank_n)
        {
            EqualWeightScheme scheme;
            return generate_weights(ranked_signals_for_date, rank_n, scheme);
        }

        // ------------------------- WeightSchedule -------------------------------
        const WeightVector *WeightSchedule::find(const std::string &date) const
        {
            auto it = by_date.find(date);
            if (it == by_date.end())
                return nullptr;
            return &it->second;
        }

        WeightSchedule WeightSchedule::filter_by_date(const std::string &start_date,
                                                      const std::string &end_date) const
        {
            auto in_window = [&](const std::string &date)
            {
                return (start_date.empty() || date >= start_date) && (end_date.empty() || date <= end_date);
            };

            WeightSchedule out;
            for (const auto &entry : by_date)
            {
                if (in_window(entry.first))
                    out.by_date.insert(entry);
            }
            for (const auto &s : shortfalls)
            {
                if (in_window(s.trade_date))
                    out.shortfalls.push_back(s);
            }
            out.unmatched_signal_dates = unmatched_signal_dates;
            return out;
        }

        void WeightSchedule::export_to_csv(const std::string &filepath) const
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

            file << "date,instrument,weight\n";
            file << std::fixed << std::setprecision(8);
            for (const auto &entry : by_date)
            {
                for (const auto &w : entry.second)
                {
                    file << entry.first << "," << w.first << "," << w.second << "\n";
                }
            }
        }

        // ------------------------- Schedule builder -----------------------------
        WeightSchedule build_weight_schedule(const SignalBook &signals,
                                             const MarketData &market_data,
                                             const std::vector<std::string> &trading_calendar,
                                             int rank_n,
                                             const WeightingScheme &scheme)
        {
            if (trading_calendar.empty())
            {
                throw std::invalid_argument("trading calendar must not be empty");
            }
            if (rank_n <= 0)
            {
                throw std::invalid_argument("rank_n must be > 0, got: " + std::to_string(rank_n));
            }

            WeightSchedule schedule;

            for (const auto &entry : signals)
            {
                const std::string &signal_date = entry.first;

                // first trading day strictly after the signal date
                auto next = std::upper_bound(trading_calendar.begin(), trading_calendar.end(), signal_date);
                if (next == trading_calendar.end())
                {
                    schedule.unmatched_signal_dates.push_back(signal_date);
                    continue;
                }
                const std::string &trade_date = *next;
                int date_idx = market_data.date_index(trade_date);

                std::vector<RankedCandidate> tradable;
                tradable.reserve(entry.second.size());
                for (const auto &c : entry.second)
                {
                    if (market_data.is_tradable(c.instrument, date_idx) &&
                        market_data.has_price(c.instrument, date_idx))
                    {
                        tradable.push_back(c);
                    }
                }

                WeightResult result = generate_weights(tradable, rank_n, scheme);
                if (result.shortfall())
                {
                    schedule.shortfalls.push_back(ShortfallRecord{signal_date, trade_date, result.requested, result.selected});
                }
                if (result.weights.empty())
                    continue;

                // two signal dates can map to one trade date when signals fall on
                // non-trading days; the latest signal wins
                schedule.by_date[trade_date] = std::move(result.weights);
            }

            return schedule;
        }

    } // namespace strategy
} // namespace rankfolio
