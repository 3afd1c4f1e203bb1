/**
 * @file weighting_scheme.cpp
 * @brief Implementation of weighting schemes and their factory
 */

#include "rankfolio/strategy/weighting_scheme.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <stdexcept>

namespace rankfolio
{
    namespace strategy
    {

        std::vector<RankedCandidate> select_top_n(const std::vector<RankedCandidate> &candidates,
                                                  int rank_n)
        {
            std::vector<RankedCandidate> valid;
            valid.reserve(candidates.size());
            std::set<std::string> seen;
            for (const auto &c : candidates)
            {
                if (c.instrument.empty() || std::isnan(c.rank))
                    continue;
                if (!seen.insert(c.instrument).second)
                    continue;
                valid.push_back(c);
            }

            std::sort(valid.begin(), valid.end(), [](const RankedCandidate &a, const RankedCandidate &b)
                      {
                          if (a.rank != b.rank)
                              return a.rank < b.rank;
                          return a.instrument < b.instrument; });

            if (rank_n >= 0 && valid.size() > static_cast<size_t>(rank_n))
            {
                valid.resize(static_cast<size_t>(rank_n));
            }
            return valid;
        }

        // ------------------------- WeightingScheme ------------------------------
        void WeightingScheme::validate_rank_n(int rank_n)
        {
            if (rank_n <= 0)
            {
                throw std::invalid_argument("rank_n must be > 0, got: " + std::to_string(rank_n));
            }
        }

        WeightVector WeightingScheme::normalize(const std::vector<RankedCandidate> &selected,
                                                const std::vector<double> &raw)
        {
            WeightVector weights;
            double total = 0.0;
            for (double v : raw)
                total += v;
            if (!(total > 0.0))
                return weights;

            for (size_t i = 0; i < selected.size(); ++i)
            {
                if (raw[i] > 0.0)
                    weights[selected[i].instrument] = raw[i] / total;
            }
            return weights;
        }

        // ------------------------- Equal weight --------------------------------
        WeightVector EqualWeightScheme::compute(const std::vector<RankedCandidate> &ranked_candidates,
                                                int rank_n) const
        {
            validate_rank_n(rank_n);
            auto selected = select_top_n(ranked_candidates, rank_n);
            return normalize(selected, std::vector<double>(selected.size(), 1.0));
        }

        // ------------------------- Score proportional --------------------------
        WeightVector ScoreProportionalScheme::compute(const std::vector<RankedCandidate> &ranked_candidates,
                                                      int rank_n) const
        {
            validate_rank_n(rank_n);

            // Names without a positive score are not eligible, so the cut to
            // rank_n happens after they are removed.
            std::vector<RankedCandidate> scored;
            for (const auto &c : select_top_n(ranked_candidates, -1))
            {
                if (std::isfinite(c.score) && c.score > 0.0)
                    scored.push_back(c);
            }

            if (scored.empty())
            {
                auto selected = select_top_n(ranked_candidates, rank_n);
                return normalize(selected, std::vector<double>(selected.size(), 1.0));
            }

            auto selected = select_top_n(scored, rank_n);
            std::vector<double> raw;
            raw.reserve(selected.size());
            for (const auto &c : selected)
                raw.push_back(c.score);
            return normalize(selected, raw);
        }

        // ------------------------- Inverse rank --------------------------------
        WeightVector InverseRankScheme::compute(const std::vector<RankedCandidate> &ranked_candidates,
                                                int rank_n) const
        {
            validate_rank_n(rank_n);
            auto selected = select_top_n(ranked_candidates, rank_n);

            std::vector<double> raw;
            raw.reserve(selected.size());
            for (const auto &c : selected)
            {
                // ranks below zero are clamped so the weight stays finite
                double r = std::max(0.0, c.rank);
                raw.push_back(1.0 / (1.0 + r));
            }
            return normalize(selected, raw);
        }

        // ------------------------- Factory -------------------------------------
        std::string WeightingSchemeFactory::normalize_name(const std::string &name)
        {
            std::string normalized = name;
            std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c)
                           { return std::tolower(c); });
            return normalized;
        }

        std::unique_ptr<WeightingScheme> WeightingSchemeFactory::create(const std::string &name)
        {
            std::string normalized = normalize_name(name);

            if (normalized.empty() || normalized == "equal" || normalized == "equal_weight")
            {
                return std::make_unique<EqualWeightScheme>();
            }
            if (normalized == "score" || normalized == "score_proportional")
            {
                return std::make_unique<ScoreProportionalScheme>();
            }
            if (normalized == "inverse_rank" || normalized == "rank")
            {
                return std::make_unique<InverseRankScheme>();
            }

            throw std::invalid_argument("Unknown weighting scheme: '" + name +
                                        "'. Supported: equal, score, inverse_rank");
        }

        std::vector<std::string> WeightingSchemeFactory::available_schemes()
        {
            return {"equal", "score", "inverse_rank"};
        }

    } // namespace strategy
} // namespace rankfolio
