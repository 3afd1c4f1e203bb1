/**
 * @file weighting_scheme.hpp
 * @brief Abstract interface for turning a ranked selection into target weights
 *
 * A weighting scheme receives the ranked candidates of one rebalance date
 * (already restricted to the tradable universe) and the number of names to
 * hold, and returns a weight vector. All schemes guarantee non-negative
 * weights summing to at most one.
 */

#ifndef RANKFOLIO_STRATEGY_WEIGHTING_SCHEME_HPP
#define RANKFOLIO_STRATEGY_WEIGHTING_SCHEME_HPP

#include <limits>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace rankfolio
{
    namespace strategy
    {

        /**
         * @struct RankedCandidate
         * @brief One instrument's cross-sectional rank (lower is better) and optional score.
         */
        struct RankedCandidate
        {
            std::string instrument;
            double rank = 0.0;
            double score = std::numeric_limits<double>::quiet_NaN();
        };

        /// Instrument -> target fraction of capital.
        using WeightVector = std::map<std::string, double>;

        /// Signal date -> ranked candidates published on that date.
        using SignalBook = std::map<std::string, std::vector<RankedCandidate>>;

        /**
         * @brief Pick the best rank_n candidates by ascending rank.
         *
         * Candidates with NaN rank or empty identifiers are skipped, ties are
         * broken by instrument id and duplicates keep their first occurrence.
         * Returns fewer than rank_n entries when fewer valid candidates exist,
         * and every valid candidate when rank_n is negative.
         */
        std::vector<RankedCandidate> select_top_n(const std::vector<RankedCandidate> &candidates,
                                                  int rank_n);

        /**
         * @class WeightingScheme
         * @brief Abstract base class for allocation policies
         *
         * Usage Example:
         * @code
         * auto scheme = WeightingSchemeFactory::create("equal");
         * WeightVector w = scheme->compute(candidates, 30);
         * @endcode
         */
        class WeightingScheme
        {
        public:
            virtual ~WeightingScheme() = default;

            /**
             * @brief Select at most rank_n names and allocate weights among them.
             * @param ranked_candidates Candidates for one date.
             * @param rank_n Target number of names (> 0).
             * @return Weight vector over the selected names.
             * @throws std::invalid_argument if rank_n <= 0.
             */
            virtual WeightVector compute(const std::vector<RankedCandidate> &ranked_candidates,
                                         int rank_n) const = 0;

            virtual std::string get_name() const = 0;

        protected:
            static void validate_rank_n(int rank_n);

            /// Normalize raw non-negative values to weights summing to one.
            static WeightVector normalize(const std::vector<RankedCandidate> &selected,
                                          const std::vector<double> &raw);
        };

        /**
         * @class EqualWeightScheme
         * @brief 1/k for each of the k selected names.
         */
        class EqualWeightScheme : public WeightingScheme
        {
        public:
            WeightVector compute(const std::vector<RankedCandidate> &ranked_candidates,
                                 int rank_n) const override;
            std::string get_name() const override { return "equal"; }
        };

        /**
         * @class ScoreProportionalScheme
         * @brief Weight proportional to the candidate's positive score.
         *
         * Only names with a positive score are eligible; the best rank_n of
         * those are selected. Falls back to equal weight over the top rank_n
         * names when no candidate has a positive score.
         */
        class ScoreProportionalScheme : public WeightingScheme
        {
        public:
            WeightVector compute(const std::vector<RankedCandidate> &ranked_candidates,
                                 int rank_n) const override;
            std::string get_name() const override { return "score"; }
        };

        /**
         * @class InverseRankScheme
         * @brief Weight proportional to 1 / (1 + rank).
         */
        class InverseRankScheme : public WeightingScheme
        {
        public:
            WeightVector compute(const std::vector<RankedCandidate> &ranked_candidates,
                                 int rank_n) const override;
            std::string get_name() const override { return "inverse_rank"; }
        };

        /**
         * @class WeightingSchemeFactory
         * @brief Creates weighting schemes from their configuration name.
         *
         * Supported values (case-insensitive):
         * - "equal", "equal_weight"
         * - "score", "score_proportional"
         * - "inverse_rank", "rank"
         */
        class WeightingSchemeFactory
        {
        public:
            /**
             * @throws std::invalid_argument for an unknown scheme name.
             */
            static std::unique_ptr<WeightingScheme> create(const std::string &name);

            static std::vector<std::string> available_schemes();

        private:
            static std::string normalize_name(const std::string &name);
        };

    } // namespace strategy
} // namespace rankfolio

#endif // RANKFOLIO_STRATEGY_WEIGHTING_SCHEME_HPP
