/**
 * @file signal_reader.hpp
 * @brief Ranked signal file parsing and input coverage checks
 *
 * Two line formats are recognized, detected from the first non-empty line:
 * - "date code rank [score]" (whitespace separated)
 * - "date_code" (rank is the order of appearance within the date, from 0)
 *
 * Dates may be YYYY-MM-DD or YYYYMMDD. Bare six-digit A-share codes get an
 * exchange suffix.
 */

#ifndef RANKFOLIO_DATA_SIGNAL_READER_HPP
#define RANKFOLIO_DATA_SIGNAL_READER_HPP

#include "rankfolio/data/market_data.hpp"
#include "rankfolio/strategy/weighting_scheme.hpp"
#include <iosfwd>
#include <set>
#include <string>
#include <vector>

namespace rankfolio {

enum class SignalFormat {
    WithRank,    ///< date code rank [score]
    WithoutRank  ///< date_code
};

std::string to_string(SignalFormat format);

class SignalReader {
public:
    /**
     * @brief Format of a signal line
     */
    static SignalFormat detect_format(const std::string& first_line);

    /**
     * @brief Format of a signal file, from its first non-empty line
     * @throws std::runtime_error if the file cannot be opened or is empty
     */
    static SignalFormat detect_file_format(const std::string& filepath);

    /**
     * @brief Append the exchange suffix of a bare A-share code
     *
     * 60/68 -> .XSHG, 00/30 -> .XSHE, 43/83/87/92 -> .BJSE. Codes that
     * already carry a suffix are returned unchanged; unmatched codes are
     * returned unchanged and matched is set to false.
     */
    static std::string add_exchange_suffix(const std::string& code, bool* matched = nullptr);

    /**
     * @brief Read and parse a signal file
     * @throws std::runtime_error if the file cannot be opened
     */
    static strategy::SignalBook read_signal_file(const std::string& filepath, bool verbose = false);

    /**
     * @brief Parse signal lines of a known format
     *
     * Malformed lines are skipped. A repeated (date, instrument) keeps its
     * first entry.
     */
    static strategy::SignalBook parse(std::istream& in, SignalFormat format, bool verbose = false);

    /**
     * @brief Restrict to signal dates within [start_date, end_date]; empty bounds are open
     */
    static strategy::SignalBook filter_by_date(const strategy::SignalBook& signals,
                                               const std::string& start_date,
                                               const std::string& end_date);

    /**
     * @brief Every instrument referenced by any signal date
     */
    static std::set<std::string> instruments(const strategy::SignalBook& signals);

    static size_t num_records(const strategy::SignalBook& signals);
};

/**
 * @struct CoverageReport
 * @brief Signal coverage against the calendar and the price panel
 */
struct CoverageReport {
    size_t signal_dates = 0;
    size_t instruments = 0;
    std::vector<std::string> unmapped_signal_dates;       ///< no later trading day in the calendar
    std::vector<std::string> instruments_without_prices;  ///< never priced in the panel

    bool ok() const { return unmapped_signal_dates.empty() && instruments_without_prices.empty(); }
    void print_summary() const;
};

/**
 * @brief Check that every signal date trades on the calendar and every instrument has prices
 */
CoverageReport check_coverage(const strategy::SignalBook& signals,
                              const MarketData& market_data,
                              const std::vector<std::string>& trading_calendar);

} // namespace rankfolio

#endif // RANKFOLIO_DATA_SIGNAL_READER_HPP
