/**
 * @file data_loader.hpp
 * @brief Data loading and parsing utilities
 *
 * Loads execution prices, the trading calendar, the tradable-universe mask
 * and the benchmark series from CSV files, and the run configuration from
 * JSON.
 */

#ifndef RANKFOLIO_DATA_DATA_LOADER_HPP
#define RANKFOLIO_DATA_DATA_LOADER_HPP

#include "rankfolio/data/market_data.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace rankfolio {

/**
 * @struct DataConfig
 * @brief Input files and the backtest window
 */
struct DataConfig {
    std::string signal_file;                   ///< Ranked signal file
    std::string vwap_file;                     ///< Long-format execution prices
    std::string price_column = "vwap";         ///< Price column in vwap_file
    std::string trading_days_file;             ///< Trading calendar
    std::string tradable_mask_file;            ///< Optional wide tradable mask
    std::string benchmark_file;                ///< Optional benchmark series
    std::string benchmark = "000852.XSHG";     ///< Benchmark instrument id
    std::string start_date;                    ///< Inclusive, empty for no bound
    std::string end_date;                      ///< Inclusive, empty for no bound

    static DataConfig from_json(const nlohmann::json& j);
};

/**
 * @struct StrategyConfig
 * @brief Selection and sleeve schedule
 */
struct StrategyConfig {
    int rank_n = 30;                           ///< Names per sleeve
    std::string weighting = "equal";           ///< Weighting scheme name
    int portfolio_count = 5;                   ///< Staggered sleeves
    int rebalance_frequency = 5;               ///< Holding period in trading days

    /**
     * @brief Load from JSON object
     *
     * rebalance_frequency may be an integer or a period name
     * ("weekly", "monthly", "12m", ...).
     */
    static StrategyConfig from_json(const nlohmann::json& j);
};

/**
 * @struct BacktestConfig
 * @brief Capital, lot and cost parameters
 */
struct BacktestConfig {
    double initial_capital = 10000000.0;       ///< Starting capital, split evenly across sleeves
    long long lot_size = 100;                  ///< Minimum trading unit
    double cash_reserve_ratio = 0.0;           ///< Unallocated fraction at each rebalance
    double commission_rate = 0.0;              ///< Commission per unit notional
    double min_commission = 0.0;               ///< Commission floor per trade
    double stamp_duty_rate = 0.0;              ///< Sell-side duty per unit notional
    double slippage_bps = 0.0;                 ///< Slippage in basis points

    static BacktestConfig from_json(const nlohmann::json& j);
};

struct OutputConfig {
    std::string output_dir = "results";
    bool save_results = true;

    static OutputConfig from_json(const nlohmann::json& j);
};

struct DisplayConfig {
    bool verbose = false;

    static DisplayConfig from_json(const nlohmann::json& j);
};

/**
 * @struct RankfolioConfig
 * @brief Complete run configuration
 */
struct RankfolioConfig {
    DataConfig data;
    StrategyConfig strategy;
    BacktestConfig backtest;
    OutputConfig output;
    DisplayConfig display;

    /**
     * @brief Load complete configuration from JSON file
     */
    static RankfolioConfig load_from_file(const std::string& config_path);

    /**
     * @brief Check numeric ranges before any simulation starts
     * @throws std::invalid_argument naming the offending key
     */
    void validate() const;
};

/**
 * @class DataLoader
 * @brief Loads and parses the backtest inputs
 */
class DataLoader {
public:
    DataLoader() = default;
    ~DataLoader() = default;

    // ========================================================================
    // CSV Loading Methods
    // ========================================================================

    /**
     * @brief Load execution prices from a long-format CSV
     *
     * Expected format:
     * order_book_id,datetime,vwap
     * 000001.XSHE,2020-01-02 00:00:00,16.87
     *
     * The instrument column may also be named code/ticker/symbol and the
     * date column date/trade_date. Timestamps are normalized to YYYY-MM-DD.
     *
     * @param filepath Path to CSV file
     * @param price_column Name of the price column
     * @param tickers Optional list of instruments to load (loads all if empty)
     * @return MarketData object
     * @throws std::runtime_error if the file cannot be loaded or lacks a column
     */
    static MarketData load_vwap_csv(const std::string& filepath,
                                    const std::string& price_column = "vwap",
                                    const std::vector<std::string>& tickers = {});

    /**
     * @brief Load the trading calendar
     *
     * Reads the "datetime" column, or the last column when absent.
     * @return Sorted, de-duplicated YYYY-MM-DD dates
     * @throws std::runtime_error if the file cannot be loaded or holds no dates
     */
    static std::vector<std::string> load_trading_days(const std::string& filepath);

    /**
     * @brief Replace the tradable mask of data from a wide CSV
     *
     * Expected format:
     * date,000001.XSHE,600000.XSHG,...
     * 2020-01-02,True,False,...
     *
     * Cells absent from the file are not tradable.
     * @return Number of (date, instrument) cells read from the file
     * @throws std::runtime_error if the file cannot be loaded
     */
    static size_t apply_tradable_mask(MarketData& data, const std::string& filepath);

    /**
     * @brief Attach a benchmark series from a CSV with a date column
     *
     * Uses the column named benchmark_id, or the second column when absent.
     * Dates without a value are NaN.
     * @throws std::runtime_error if the file cannot be loaded
     */
    static void load_benchmark(MarketData& data,
                               const std::string& filepath,
                               const std::string& benchmark_id);

    // ========================================================================
    // Configuration Loading
    // ========================================================================

    /**
     * @brief Load JSON configuration file
     * @throws std::runtime_error if file cannot be loaded
     */
    static nlohmann::json load_json(const std::string& filepath);

    /**
     * @brief Load complete configuration
     * @param config_path Path to config JSON file
     */
    static RankfolioConfig load_config(const std::string& config_path);

    // ========================================================================
    // Data Generation (for testing)
    // ========================================================================

    /**
     * @brief Generate synthetic execution prices on weekdays
     * @param seed Fixed seed for reproducible data
     */
    static MarketData generate_synthetic_data(
        const std::vector<std::string>& tickers,
        size_t num_days,
        const std::string& start_date = "2020-01-02",
        double volatility = 0.02,
        double drift = 0.0003,
        unsigned int seed = 42
    );

    // ========================================================================
    // Export Methods
    // ========================================================================

    /**
     * @brief Save prices in the long format read by load_vwap_csv
     */
    static void save_vwap_csv(const MarketData& data,
                              const std::string& filepath,
                              const std::string& price_column = "vwap");

    /**
     * @brief Save the tradable mask in the wide format read by apply_tradable_mask
     */
    static void save_tradable_mask_csv(const MarketData& data, const std::string& filepath);

    // ========================================================================
    // Parsing helpers
    // ========================================================================

    static std::vector<std::string> parse_csv_line(const std::string& line);

    /**
     * @brief Normalize YYYY-MM-DD, YYYYMMDD, YYYY/MM/DD and timestamps
     * @return YYYY-MM-DD, or an empty string when the input isn't a date
     */
    static std::string normalize_date(const std::string& date);

    /**
     * @brief Validate date format (YYYY-MM-DD)
     */
    static bool is_valid_date_format(const std::string& date);

    static std::string trim(const std::string& str);

    /**
     * @brief Convert string to double safely
     * @return Double value, or NaN if conversion fails
     */
    static double safe_stod(const std::string& str);

private:
    /**
     * @brief Next weekday after date
     */
    static std::string next_weekday(const std::string& date);
};

} // namespace rankfolio

#endif // RANKFOLIO_DATA_DATA_LOADER_HPP
