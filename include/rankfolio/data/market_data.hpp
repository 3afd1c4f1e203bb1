/*
 * @file market_data.hpp
 * @brief Daily execution-price panel with tradable-universe mask.
 *
 * Stores VWAP execution prices as an Eigen matrix (dates x instruments)
 * together with the per-day tradable mask supplied by the data filter
 * (ST / suspension / limit-up) and an optional benchmark series.
 */

#ifndef RANKFOLIO_DATA_MARKET_DATA_HPP
#define RANKFOLIO_DATA_MARKET_DATA_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>
#include <map>
#include <stdexcept>

namespace rankfolio
{
    /// Boolean matrix (dates x instruments), true when the instrument may be traded.
    using TradableMask = Eigen::Matrix<bool, Eigen::Dynamic, Eigen::Dynamic>;

    /**
     * @class MarketData
     * @brief Container for multi-instrument execution prices and tradability.
     *
     * @note Missing prices are represented as NaN values.
     * @note Dates are ISO strings (YYYY-MM-DD) in ascending order.
     */
    class MarketData
    {
    public:
        /**
         * @brief Constructor with data.
         * @param prices Price matrix (dates x instruments).
         * @param dates Vector of date strings, ascending.
         * @param tickers Vector of instrument identifiers.
         * @throws std::invalid_argument if dimensions disagree or dates are unsorted.
         *
         * Every instrument starts out tradable on every date.
         */
        MarketData(const Eigen::MatrixXd &prices,
                   const std::vector<std::string> &dates,
                   const std::vector<std::string> &tickers);

        ~MarketData() = default;

        /** ===========================================
         *  Data Access Methods
         *  ===========================================
         */

        const Eigen::MatrixXd &get_prices() const
        {
            return prices_;
        }

        const TradableMask &get_tradable_mask() const
        {
            return tradable_;
        }

        const std::vector<std::string> &get_dates() const
        {
            return dates_;
        }

        const std::vector<std::string> &get_tickers() const
        {
            return tickers_;
        }

        size_t num_dates() const
        {
            return static_cast<size_t>(prices_.rows());
        }

        size_t num_assets() const
        {
            return static_cast<size_t>(prices_.cols());
        }

        /**
         * @brief Get price for specific instrument and date.
         * @throws std::invalid_argument if the ticker or date is unknown.
         */
        double get_price(const std::string &ticker, const std::string &date) const;

        /**
         * @brief Price lookup that never throws.
         * @return Price, or NaN when the ticker is unknown, the index is out of
         *         range or the observation is missing.
         */
        double find_price(const std::string &ticker, int date_idx) const;

        /**
         * @brief True when a finite, positive price exists for ticker at date_idx.
         */
        bool has_price(const std::string &ticker, int date_idx) const;

        /**
         * @brief Most recent finite price at or before date_idx.
         * @return Price, or NaN if the instrument was never observed.
         */
        double last_observed_price(const std::string &ticker, int date_idx) const;

        /**
         * @brief Tradability of ticker on date_idx. Unknown tickers are not tradable.
         */
        bool is_tradable(const std::string &ticker, int date_idx) const;

        /**
         * @brief Index of a date, or -1 if absent.
         */
        int date_index(const std::string &date) const;

        /**
         * @brief Index of a ticker, or -1 if absent.
         */
        int ticker_index(const std::string &ticker) const;

        /** ===========================================
         *  Data Modification Methods
         *  ===========================================
         */

        /**
         * @brief Replace the tradable mask.
         * @throws std::invalid_argument if dimensions don't match the price matrix.
         */
        void set_tradable_mask(const TradableMask &mask);

        /**
         * @brief Mark a single (ticker, date) cell tradable or not.
         * @throws std::invalid_argument if the ticker or date is unknown.
         */
        void set_tradable(const std::string &ticker, const std::string &date, bool tradable);

        /**
         * @brief Attach a benchmark series aligned with dates.
         * @throws std::invalid_argument if the length doesn't match num_dates().
         */
        void set_benchmark(const std::string &benchmark_id, const Eigen::VectorXd &values);

        bool has_benchmark() const
        {
            return benchmark_.size() > 0;
        }

        const std::string &benchmark_id() const
        {
            return benchmark_id_;
        }

        /**
         * @brief Benchmark value at date_idx, NaN when absent.
         */
        double benchmark_at(int date_idx) const;

        /** ===========================================
         *  Filtering
         *  ===========================================
         */

        /**
         * @brief Restrict to dates within [start_date, end_date].
         *
         * Bounds need not be present in the data. Mask and benchmark are
         * carried along.
         * @throws std::invalid_argument if no date falls in the window.
         */
        MarketData filter_by_date(const std::string &start_date,
                                  const std::string &end_date) const;

        /** ===========================================
         *  Validation Methods
         *  ===========================================
         */

        bool is_valid() const;

        /**
         * @brief Number of NaN entries in the price matrix.
         */
        size_t count_missing() const;

        /**
         * @brief Number of (date, instrument) cells flagged untradable.
         */
        size_t count_untradable() const;

        void print_summary() const;

    private:
        void build_index_maps();

        Eigen::MatrixXd prices_;                     ///< Price matrix (dates x instruments)
        TradableMask tradable_;                      ///< Tradable flags (dates x instruments)
        Eigen::VectorXd benchmark_;                  ///< Optional benchmark aligned with dates_
        std::string benchmark_id_;
        std::vector<std::string> dates_;
        std::vector<std::string> tickers_;
        std::map<std::string, size_t> date_index_;
        std::map<std::string, size_t> ticker_index_;
    };

} // namespace rankfolio

#endif // RANKFOLIO_DATA_MARKET_DATA_HPP
