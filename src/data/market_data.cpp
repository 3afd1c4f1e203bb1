/**
 * @file market_data.cpp
 * @brief Implementation of MarketData class
 */

#include "rankfolio/data/market_data.hpp"
#include <iostream>
#include <algorithm>
#include <cmath>
#include <limits>

namespace rankfolio
{

    // ============================================================================
    // Constructors
    // ============================================================================

    MarketData::MarketData(const Eigen::MatrixXd &prices,
                           const std::vector<std::string> &dates,
                           const std::vector<std::string> &tickers)
        : prices_(prices), dates_(dates), tickers_(tickers)
    {
        if (prices_.rows() != static_cast<Eigen::Index>(dates_.size()))
        {
            throw std::invalid_argument("Price matrix rows must match dates vector size");
        }
        if (prices_.cols() != static_cast<Eigen::Index>(tickers_.size()))
        {
            throw std::invalid_argument("Price matrix columns must match tickers vector size");
        }
        if (!std::is_sorted(dates_.begin(), dates_.end()))
        {
            throw std::invalid_argument("Dates must be in ascending order");
        }

        tradable_ = TradableMask::Constant(prices_.rows(), prices_.cols(), true);
        build_index_maps();

        if (date_index_.size() != dates_.size())
        {
            throw std::invalid_argument("Duplicate dates in market data");
        }
        if (ticker_index_.size() != tickers_.size())
        {
            throw std::invalid_argument("Duplicate tickers in market data");
        }
    }

    // ============================================================================
    // Data Access Methods
    // ============================================================================

    double MarketData::get_price(const std::string &ticker, const std::string &date) const
    {
        int ticker_idx = ticker_index(ticker);
        int date_idx = date_index(date);

        if (ticker_idx < 0)
        {
            throw std::invalid_argument("Ticker not found: " + ticker);
        }
        if (date_idx < 0)
        {
            throw std::invalid_argument("Date not found: " + date);
        }

        return prices_(date_idx, ticker_idx);
    }

    double MarketData::find_price(const std::string &ticker, int date_idx) const
    {
        int ticker_idx = ticker_index(ticker);
        if (ticker_idx < 0 || date_idx < 0 || date_idx >= prices_.rows())
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        return prices_(date_idx, ticker_idx);
    }

    bool MarketData::has_price(const std::string &ticker, int date_idx) const
    {
        double p = find_price(ticker, date_idx);
        return std::isfinite(p) && p > 0.0;
    }

    double MarketData::last_observed_price(const std::string &ticker, int date_idx) const
    {
        int ticker_idx = ticker_index(ticker);
        if (ticker_idx < 0 || prices_.rows() == 0)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }

        int last = std::min(date_idx, static_cast<int>(prices_.rows()) - 1);
        for (int i = last; i >= 0; --i)
        {
            double p = prices_(i, ticker_idx);
            if (std::isfinite(p) && p > 0.0)
            {
                return p;
            }
        }
        return std::numeric_limits<double>::quiet_NaN();
    }

    bool MarketData::is_tradable(const std::string &ticker, int date_idx) const
    {
        int ticker_idx = ticker_index(ticker);
        if (ticker_idx < 0 || date_idx < 0 || date_idx >= tradable_.rows())
        {
            return false;
        }
        return tradable_(date_idx, ticker_idx);
    }

    int MarketData::date_index(const std::string &date) const
    {
        auto it = date_index_.find(date);
        if (it == date_index_.end())
        {
            return -1;
        }
        return static_cast<int>(it->second);
    }

    int MarketData::ticker_index(const std::string &ticker) const
    {
        auto it = ticker_index_.find(ticker);
        if (it == ticker_index_.end())
        {
            return -1;
        }
        return static_cast<int>(it->second);
    }

    // ==========================
    // Data Modification Methods
    // ==========================

    void MarketData::set_tradable_mask(const TradableMask &mask)
    {
        if (mask.rows() != prices_.rows() || mask.cols() != prices_.cols())
        {
            throw std::invalid_argument("Tradable mask must have same dimensions as price matrix");
        }
        tradable_ = mask;
    }

    void MarketData::set_tradable(const std::string &ticker, const std::string &date, bool tradable)
    {
        int ticker_idx = ticker_index(ticker);
        int date_idx = date_index(date);

        if (ticker_idx < 0)
        {
            throw std::invalid_argument("Ticker not found: " + ticker);
        }
        if (date_idx < 0)
        {
            throw std::invalid_argument("Date not found: " + date);
        }

        tradable_(date_idx, ticker_idx) = tradable;
    }

    void MarketData::set_benchmark(const std::string &benchmark_id, const Eigen::VectorXd &values)
    {
        if (values.size() != prices_.rows())
        {
            throw std::invalid_argument("Benchmark series length must match number of dates");
        }
        benchmark_id_ = benchmark_id;
        benchmark_ = values;
    }

    double MarketData::benchmark_at(int date_idx) const
    {
        if (date_idx < 0 || date_idx >= benchmark_.size())
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        return benchmark_(date_idx);
    }

    // ================================
    // Filtering
    // ================================

    MarketData MarketData::filter_by_date(const std::string &start_date,
                                          const std::string &end_date) const
    {
        if (start_date > end_date)
        {
            throw std::invalid_argument("Start date must be before end date");
        }

        auto first = std::lower_bound(dates_.begin(), dates_.end(), start_date);
        auto last = std::upper_bound(dates_.begin(), dates_.end(), end_date);
        if (first >= last)
        {
            throw std::invalid_argument("No dates between " + start_date + " and " + end_date);
        }

        Eigen::Index start_idx = std::distance(dates_.begin(), first);
        Eigen::Index num_periods = std::distance(first, last);

        std::vector<std::string> filtered_dates(first, last);
        MarketData filtered(prices_.middleRows(start_idx, num_periods), filtered_dates, tickers_);
        filtered.set_tradable_mask(tradable_.middleRows(start_idx, num_periods));
        if (has_benchmark())
        {
            filtered.set_benchmark(benchmark_id_, benchmark_.segment(start_idx, num_periods));
        }
        return filtered;
    }

    // ===================
    // Validation Methods
    // ===================

    bool MarketData::is_valid() const
    {
        if (prices_.rows() == 0 || prices_.cols() == 0)
        {
            return false;
        }
        if (tradable_.rows() != prices_.rows() || tradable_.cols() != prices_.cols())
        {
            return false;
        }
        return true;
    }

    size_t MarketData::count_missing() const
    {
        size_t count = 0;
        for (Eigen::Index i = 0; i < prices_.rows(); ++i)
        {
            for (Eigen::Index j = 0; j < prices_.cols(); ++j)
            {
                if (std::isnan(prices_(i, j)))
                {
                    ++count;
                }
            }
        }
        return count;
    }

    size_t MarketData::count_untradable() const
    {
        return static_cast<size_t>(tradable_.size() - tradable_.count());
    }

    void MarketData::print_summary() const
    {
        std::cout << "\n=== Market Data Summary ===\n";
        std::cout << "Dimensions: " << prices_.rows() << " dates x "
                  << prices_.cols() << " instruments\n";
        if (!dates_.empty())
        {
            std::cout << "Date range: " << dates_.front() << " to " << dates_.back() << "\n";
        }
        std::cout << "Missing prices: " << count_missing() << "\n";
        std::cout << "Untradable cells: " << count_untradable() << "\n";
        if (has_benchmark())
        {
            std::cout << "Benchmark: " << benchmark_id_ << "\n";
        }
        std::cout << "==========================\n"
                  << std::endl;
    }

    // =========================
    // Private Helper Methods
    // =========================

    void MarketData::build_index_maps()
    {
        date_index_.clear();
        ticker_index_.clear();

        for (size_t i = 0; i < dates_.size(); ++i)
        {
            date_index_[dates_[i]] = i;
        }

        for (size_t i = 0; i < tickers_.size(); ++i)
        {
            ticker_index_[tickers_[i]] = i;
        }
    }

} // namespace rankfolio
