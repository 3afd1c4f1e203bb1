/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader class and configuration structures
 */

#include "rankfolio/data/data_loader.hpp"
#include "rankfolio/backtest/rebalance_scheduler.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <random>
#include <ctime>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>
#include <set>
#include <map>
#include <stdexcept>

namespace rankfolio
{

    namespace
    {
        int find_column(const std::vector<std::string> &header, const std::vector<std::string> &names)
        {
            for (const auto &name : names)
            {
                for (size_t i = 0; i < header.size(); ++i)
                {
                    if (DataLoader::trim(header[i]) == name)
                        return static_cast<int>(i);
                }
            }
            return -1;
        }

        bool parse_flag(const std::string &raw)
        {
            std::string s = DataLoader::trim(raw);
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return s == "true" || s == "1" || s == "t" || s == "1.0" || s == "yes";
        }

        void require(bool ok, const std::string &message)
        {
            if (!ok)
                throw std::invalid_argument(message);
        }
    } // namespace

    // =============================================
    // Configuration Structures - from_json Methods
    // =============================================

    DataConfig DataConfig::from_json(const nlohmann::json &j)
    {
        DataConfig config;
        config.signal_file = j.value("signal_file", config.signal_file);
        config.vwap_file = j.value("vwap_file", config.vwap_file);
        config.price_column = j.value("price_column", config.price_column);
        config.trading_days_file = j.value("trading_days_file", config.trading_days_file);
        config.tradable_mask_file = j.value("tradable_mask_file", config.tradable_mask_file);
        config.benchmark_file = j.value("benchmark_file", config.benchmark_file);
        config.benchmark = j.value("benchmark", config.benchmark);
        config.start_date = j.value("start_date", config.start_date);
        config.end_date = j.value("end_date", config.end_date);
        return config;
    }

    StrategyConfig StrategyConfig::from_json(const nlohmann::json &j)
    {
        StrategyConfig config;
        config.rank_n = j.value("rank_n", config.rank_n);
        config.weighting = j.value("weighting", config.weighting);
        config.portfolio_count = j.value("portfolio_count", config.portfolio_count);

        if (j.contains("rebalance_frequency"))
        {
            const auto &f = j["rebalance_frequency"];
            if (f.is_number_integer())
                config.rebalance_frequency = f.get<int>();
            else if (f.is_string())
                config.rebalance_frequency = backtest::RebalanceConfig::parse_frequency(f.get<std::string>());
            else
                throw std::invalid_argument("rebalance_frequency must be an integer or a period name");
        }

        return config;
    }

    BacktestConfig BacktestConfig::from_json(const nlohmann::json &j)
    {
        BacktestConfig config;
        config.initial_capital = j.value("initial_capital", config.initial_capital);
        config.lot_size = j.value("lot_size", config.lot_size);
        config.cash_reserve_ratio = j.value("cash_reserve_ratio", config.cash_reserve_ratio);

        if (j.contains("transaction_costs"))
        {
            const auto &tc = j["transaction_costs"];
            config.commission_rate = tc.value("commission_rate", config.commission_rate);
            config.min_commission = tc.value("min_commission", config.min_commission);
            config.stamp_duty_rate = tc.value("stamp_duty_rate", config.stamp_duty_rate);
            config.slippage_bps = tc.value("slippage_bps", config.slippage_bps);
        }

        return config;
    }

    OutputConfig OutputConfig::from_json(const nlohmann::json &j)
    {
        OutputConfig config;
        config.output_dir = j.value("output_dir", config.output_dir);
        config.save_results = j.value("save_results", config.save_results);
        return config;
    }

    DisplayConfig DisplayConfig::from_json(const nlohmann::json &j)
    {
        DisplayConfig config;
        config.verbose = j.value("verbose", config.verbose);
        return config;
    }

    RankfolioConfig RankfolioConfig::load_from_file(const std::string &config_path)
    {
        return DataLoader::load_config(config_path);
    }

    void RankfolioConfig::validate() const
    {
        require(strategy.rank_n > 0, "rank_n must be > 0, got: " + std::to_string(strategy.rank_n));
        require(strategy.portfolio_count > 0,
                "portfolio_count must be > 0, got: " + std::to_string(strategy.portfolio_count));
        require(strategy.rebalance_frequency > 0,
                "rebalance_frequency must be > 0, got: " + std::to_string(strategy.rebalance_frequency));
        require(strategy.portfolio_count <= strategy.rebalance_frequency,
                "portfolio_count must not exceed rebalance_frequency");
        require(backtest.initial_capital > 0.0, "initial_capital must be > 0");
        require(backtest.lot_size > 0, "lot_size must be > 0, got: " + std::to_string(backtest.lot_size));
        require(backtest.cash_reserve_ratio >= 0.0 && backtest.cash_reserve_ratio < 1.0,
                "cash_reserve_ratio must be in [0, 1)");
        require(backtest.commission_rate >= 0.0, "commission_rate must be >= 0");
        require(backtest.min_commission >= 0.0, "min_commission must be >= 0");
        require(backtest.stamp_duty_rate >= 0.0, "stamp_duty_rate must be >= 0");
        require(backtest.slippage_bps >= 0.0, "slippage_bps must be >= 0");
        if (!data.start_date.empty())
            require(!DataLoader::normalize_date(data.start_date).empty(), "invalid start_date: " + data.start_date);
        if (!data.end_date.empty())
            require(!DataLoader::normalize_date(data.end_date).empty(), "invalid end_date: " + data.end_date);
    }

    // ===========================
    // CSV Loading - Prices
    // ===========================

    MarketData DataLoader::load_vwap_csv(const std::string &filepath,
                                         const std::string &price_column,
                                         const std::vector<std::string> &tickers)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        auto header = parse_csv_line(line);
        int id_col = find_column(header, {"order_book_id", "code", "ticker", "symbol"});
        int date_col = find_column(header, {"datetime", "date", "trade_date"});
        int price_col = find_column(header, {price_column});
        if (id_col < 0 || date_col < 0 || price_col < 0)
        {
            throw std::runtime_error("CSV " + filepath + " must have instrument, date and '" +
                                     price_column + "' columns");
        }
        std::set<std::string> wanted(tickers.begin(), tickers.end());

        std::map<std::string, std::map<std::string, double>> data_map; // date -> ticker -> price
        std::set<std::string> all_tickers;
        size_t width = static_cast<size_t>(std::max({id_col, date_col, price_col})) + 1;

        while (std::getline(file, line))
        {
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            if (fields.size() < width)
                continue;

            std::string date = normalize_date(fields[static_cast<size_t>(date_col)]);
            std::string ticker = trim(fields[static_cast<size_t>(id_col)]);
            if (date.empty() || ticker.empty())
                continue;
            if (!wanted.empty() && !wanted.count(ticker))
                continue;

            data_map[date][ticker] = safe_stod(fields[static_cast<size_t>(price_col)]);
            all_tickers.insert(ticker);
        }

        if (data_map.empty() || all_tickers.empty())
        {
            throw std::runtime_error("No valid data found in CSV file: " + filepath);
        }

        std::vector<std::string> dates;
        dates.reserve(data_map.size());
        for (const auto &entry : data_map)
            dates.push_back(entry.first);
        std::vector<std::string> ticker_vec(all_tickers.begin(), all_tickers.end());

        Eigen::MatrixXd prices(dates.size(), ticker_vec.size());
        prices.setConstant(std::numeric_limits<double>::quiet_NaN());

        for (size_t i = 0; i < dates.size(); ++i)
        {
            const auto &row = data_map[dates[i]];
            for (size_t j = 0; j < ticker_vec.size(); ++j)
            {
                auto it = row.find(ticker_vec[j]);
                if (it != row.end())
                    prices(i, j) = it->second;
            }
        }

        return MarketData(prices, dates, ticker_vec);
    }

    // ===========================
    // CSV Loading - Calendar
    // ===========================

    std::vector<std::string> DataLoader::load_trading_days(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        auto header = parse_csv_line(line);
        int col = find_column(header, {"datetime", "date", "trade_date"});
        std::set<std::string> days;

        // A headerless single-column file starts with a date.
        if (col < 0 && header.size() == 1 && !normalize_date(header[0]).empty())
        {
            days.insert(normalize_date(header[0]));
        }
        size_t use_col = col >= 0 ? static_cast<size_t>(col) : header.size() - 1;

        while (std::getline(file, line))
        {
            if (trim(line).empty())
                continue;
            auto fields = parse_csv_line(line);
            if (fields.size() <= use_col)
                continue;
            std::string date = normalize_date(fields[use_col]);
            if (!date.empty())
                days.insert(date);
        }

        if (days.empty())
        {
            throw std::runtime_error("No trading days found in: " + filepath);
        }
        return std::vector<std::string>(days.begin(), days.end());
    }

    // ===========================
    // CSV Loading - Tradable mask
    // ===========================

    size_t DataLoader::apply_tradable_mask(MarketData &data, const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        auto header = parse_csv_line(line);
        std::vector<int> columns; // header position -> ticker index in data
        columns.reserve(header.size());
        for (size_t i = 0; i < header.size(); ++i)
        {
            columns.push_back(i == 0 ? -1 : data.ticker_index(trim(header[i])));
        }

        TradableMask mask = TradableMask::Constant(static_cast<Eigen::Index>(data.num_dates()),
                                                   static_cast<Eigen::Index>(data.num_assets()), false);
        size_t cells = 0;

        while (std::getline(file, line))
        {
            if (trim(line).empty())
                continue;
            auto fields = parse_csv_line(line);
            if (fields.empty())
                continue;
            int row = data.date_index(normalize_date(fields[0]));
            if (row < 0)
                continue;
            for (size_t i = 1; i < fields.size() && i < columns.size(); ++i)
            {
                if (columns[i] < 0)
                    continue;
                mask(row, columns[i]) = parse_flag(fields[i]);
                ++cells;
            }
        }

        data.set_tradable_mask(mask);
        return cells;
    }

    // ===========================
    // CSV Loading - Benchmark
    // ===========================

    void DataLoader::load_benchmark(MarketData &data,
                                    const std::string &filepath,
                                    const std::string &benchmark_id)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        auto header = parse_csv_line(line);
        int date_col = find_column(header, {"datetime", "date", "trade_date"});
        if (date_col < 0)
            date_col = 0;
        int value_col = find_column(header, {benchmark_id});
        if (value_col < 0)
        {
            if (header.size() < 2)
                throw std::runtime_error("Benchmark file needs a value column: " + filepath);
            value_col = date_col == 0 ? 1 : 0;
        }

        Eigen::VectorXd values = Eigen::VectorXd::Constant(static_cast<Eigen::Index>(data.num_dates()),
                                                           std::numeric_limits<double>::quiet_NaN());
        while (std::getline(file, line))
        {
            if (trim(line).empty())
                continue;
            auto fields = parse_csv_line(line);
            if (fields.size() <= static_cast<size_t>(std::max(date_col, value_col)))
                continue;
            int row = data.date_index(normalize_date(fields[static_cast<size_t>(date_col)]));
            if (row < 0)
                continue;
            values(row) = safe_stod(fields[static_cast<size_t>(value_col)]);
        }

        data.set_benchmark(benchmark_id, values);
    }

    // ================
    // JSON Loading
    // ================

    nlohmann::json DataLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
        }

        return j;
    }

    RankfolioConfig DataLoader::load_config(const std::string &config_path)
    {
        auto j = load_json(config_path);

        RankfolioConfig config;

        try
        {
            if (j.contains("data"))
                config.data = DataConfig::from_json(j["data"]);
            if (j.contains("strategy"))
                config.strategy = StrategyConfig::from_json(j["strategy"]);
            if (j.contains("backtest"))
                config.backtest = BacktestConfig::from_json(j["backtest"]);
            if (j.contains("output"))
                config.output = OutputConfig::from_json(j["output"]);
            if (j.contains("display"))
                config.display = DisplayConfig::from_json(j["display"]);
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::invalid_argument("Invalid configuration in " + config_path + ": " + e.what());
        }

        config.validate();
        return config;
    }

    // ===========================
    // Synthetic Data Generation
    // ===========================

    MarketData DataLoader::generate_synthetic_data(
        const std::vector<std::string> &tickers,
        size_t num_days,
        const std::string &start_date,
        double volatility,
        double drift,
        unsigned int seed)
    {
        if (tickers.empty() || num_days == 0)
        {
            throw std::invalid_argument("generate_synthetic_data needs tickers and at least one day");
        }

        std::mt19937 gen(seed);
        std::normal_distribution<double> dist(drift, volatility);
        std::uniform_real_distribution<double> start_price(5.0, 80.0);

        Eigen::MatrixXd prices(num_days, tickers.size());
        std::vector<std::string> dates;
        dates.reserve(num_days);

        std::string day = normalize_date(start_date);
        if (day.empty())
            throw std::invalid_argument("invalid start_date: " + start_date);
        for (size_t i = 0; i < num_days; ++i)
        {
            dates.push_back(day);
            day = next_weekday(day);
        }

        // Geometric random walk per instrument
        for (size_t j = 0; j < tickers.size(); ++j)
        {
            prices(0, j) = std::round(start_price(gen) * 100.0) / 100.0;

            for (size_t i = 1; i < num_days; ++i)
            {
                double return_val = dist(gen);
                prices(i, j) = prices(i - 1, j) * (1.0 + return_val);
            }
        }

        return MarketData(prices, dates, tickers);
    }

    // ==================
    // Export Methods
    // ==================

    void DataLoader::save_vwap_csv(const MarketData &data,
                                   const std::string &filepath,
                                   const std::string &price_column)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "order_book_id,datetime," << price_column << "\n";

        const auto &prices = data.get_prices();
        const auto &dates = data.get_dates();
        const auto &tickers = data.get_tickers();

        file << std::fixed << std::setprecision(4);
        for (size_t j = 0; j < tickers.size(); ++j)
        {
            for (size_t i = 0; i < dates.size(); ++i)
            {
                double p = prices(i, j);
                if (!std::isfinite(p))
                    continue;
                file << tickers[j] << "," << dates[i] << " 00:00:00," << p << "\n";
            }
        }
    }

    void DataLoader::save_tradable_mask_csv(const MarketData &data, const std::string &filepath)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "date";
        for (const auto &ticker : data.get_tickers())
        {
            file << "," << ticker;
        }
        file << "\n";

        const auto &mask = data.get_tradable_mask();
        const auto &dates = data.get_dates();
        for (size_t i = 0; i < dates.size(); ++i)
        {
            file << dates[i];
            for (Eigen::Index j = 0; j < mask.cols(); ++j)
            {
                file << "," << (mask(static_cast<Eigen::Index>(i), j) ? "True" : "False");
            }
            file << "\n";
        }
    }

    // =======================
    // Parsing helpers
    // =======================

    std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::string token;
        bool in_quotes = false;

        for (char c : line)
        {
            if (c == '"')
            {
                in_quotes = !in_quotes;
            }
            else if (c == ',' && !in_quotes)
            {
                tokens.push_back(token);
                token.clear();
            }
            else if (c != '\r')
            {
                token += c;
            }
        }

        tokens.push_back(token);
        return tokens;
    }

    std::string DataLoader::normalize_date(const std::string &date)
    {
        std::string s = trim(date);
        // drop a time component
        size_t space = s.find_first_of(" T");
        if (space != std::string::npos)
            s = s.substr(0, space);

        std::string out;
        if (s.size() == 8 && std::all_of(s.begin(), s.end(), [](unsigned char c)
                                         { return std::isdigit(c); }))
        {
            out = s.substr(0, 4) + "-" + s.substr(4, 2) + "-" + s.substr(6, 2);
        }
        else if (s.size() == 10 && (s[4] == '-' || s[4] == '/') && s[7] == s[4])
        {
            out = s.substr(0, 4) + "-" + s.substr(5, 2) + "-" + s.substr(8, 2);
        }
        else
        {
            return "";
        }

        if (!is_valid_date_format(out))
            return "";
        int month = std::stoi(out.substr(5, 2));
        int day = std::stoi(out.substr(8, 2));
        if (month < 1 || month > 12 || day < 1 || day > 31)
            return "";
        return out;
    }

    bool DataLoader::is_valid_date_format(const std::string &date)
    {
        // Simple check for YYYY-MM-DD format
        if (date.length() != 10)
            return false;
        if (date[4] != '-' || date[7] != '-')
            return false;

        for (size_t i = 0; i < date.length(); ++i)
        {
            if (i == 4 || i == 7)
                continue;
            if (!std::isdigit(static_cast<unsigned char>(date[i])))
                return false;
        }

        return true;
    }

    std::string DataLoader::trim(const std::string &str)
    {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";

        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    double DataLoader::safe_stod(const std::string &str)
    {
        std::string trimmed = trim(str);
        if (trimmed.empty() || trimmed == "nan" || trimmed == "NaN")
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        try
        {
            return std::stod(trimmed);
        }
        catch (const std::invalid_argument &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        catch (const std::out_of_range &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
    }

    std::string DataLoader::next_weekday(const std::string &date)
    {
        std::tm tm = {};
        tm.tm_year = std::stoi(date.substr(0, 4)) - 1900;
        tm.tm_mon = std::stoi(date.substr(5, 2)) - 1;
        tm.tm_mday = std::stoi(date.substr(8, 2));
        tm.tm_hour = 12;
        tm.tm_isdst = -1;
        do
        {
            tm.tm_mday += 1;
            std::mktime(&tm);
        } while (tm.tm_wday == 0 || tm.tm_wday == 6);

        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d");
        return oss.str();
    }

} // namespace rankfolio
