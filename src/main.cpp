/**
 * @file main.cpp
 * @brief Main entry point for the rankfolio rolling backtester
 *
 * Command-line application that loads configuration, prices and ranked
 * signals, builds the per-date weight schedule, runs the staggered
 * multi-sleeve backtest and writes the result tables.
 */

#include "rankfolio/data/data_loader.hpp"
#include "rankfolio/data/market_data.hpp"
#include "rankfolio/data/signal_reader.hpp"
#include "rankfolio/strategy/weighting_scheme.hpp"
#include "rankfolio/strategy/weight_generator.hpp"
#include "rankfolio/backtest/backtest_engine.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <string>

using namespace rankfolio;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "rankfolio v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (required)\n"
              << "  --output PATH         Output directory (overrides output.output_dir)\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config config/backtest_config.json --verbose\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       rankfolio v1.0.0                                        \n"
              << "       Rolling multi-sleeve backtest of ranked selections      \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string output_dir;
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_dir = argv[++i];
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && !config_path.empty();
    }
};

/**
 * @brief Calendar dates within [start, end]; empty bounds are open
 */
std::vector<std::string> clip_calendar(const std::vector<std::string> &calendar,
                                       const std::string &start,
                                       const std::string &end)
{
    std::vector<std::string> out;
    std::copy_if(calendar.begin(), calendar.end(), std::back_inserter(out),
                 [&](const std::string &d)
                 { return (start.empty() || d >= start) && (end.empty() || d <= end); });
    return out;
}

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/6] Loading configuration..." << std::endl;

        auto config = DataLoader::load_config(args.config_path);
        if (args.verbose)
            config.display.verbose = true;
        if (!args.output_dir.empty())
            config.output.output_dir = args.output_dir;
        const bool verbose = config.display.verbose;

        const std::string start = DataLoader::normalize_date(config.data.start_date);
        const std::string end = DataLoader::normalize_date(config.data.end_date);

        if (verbose)
        {
            std::cout << "  - Signal file: " << config.data.signal_file << "\n";
            std::cout << "  - Date range: " << (start.empty() ? "start" : start)
                      << " to " << (end.empty() ? "end" : end) << "\n";
            std::cout << "  - rank_n: " << config.strategy.rank_n
                      << ", weighting: " << config.strategy.weighting << "\n";
            std::cout << "  - Sleeves: " << config.strategy.portfolio_count
                      << ", holding period: " << config.strategy.rebalance_frequency << " days\n";
        }

        // ====================================================================
        // 2. Load Market Data
        // ====================================================================
        std::cout << "[2/6] Loading market data..." << std::endl;

        auto data = DataLoader::load_vwap_csv(config.data.vwap_file, config.data.price_column);
        auto full_calendar = DataLoader::load_trading_days(config.data.trading_days_file);

        if (!config.data.tradable_mask_file.empty())
        {
            size_t cells = DataLoader::apply_tradable_mask(data, config.data.tradable_mask_file);
            if (verbose)
                std::cout << "  - Tradable mask: " << cells << " cells, "
                          << data.count_untradable() << " untradable\n";
        }
        if (!config.data.benchmark_file.empty())
        {
            DataLoader::load_benchmark(data, config.data.benchmark_file, config.data.benchmark);
        }

        auto calendar = clip_calendar(full_calendar, start, end);
        if (calendar.empty())
        {
            throw std::invalid_argument("No trading days within the configured date range");
        }

        std::cout << "  - Loaded " << data.num_dates() << " dates, "
                  << data.num_assets() << " instruments, "
                  << calendar.size() << " trading days in range" << std::endl;

        if (verbose)
        {
            data.print_summary();
        }

        // ====================================================================
        // 3. Read Signals
        // ====================================================================
        std::cout << "[3/6] Reading signals..." << std::endl;

        auto signals = SignalReader::read_signal_file(config.data.signal_file, verbose);
        std::cout << "  - " << SignalReader::num_records(signals) << " records over "
                  << signals.size() << " dates" << std::endl;

        auto coverage = check_coverage(signals, data, full_calendar);
        coverage.print_summary();

        // ====================================================================
        // 4. Build Weight Schedule
        // ====================================================================
        std::cout << "[4/6] Building weight schedule..." << std::endl;

        auto scheme = strategy::WeightingSchemeFactory::create(config.strategy.weighting);
        auto schedule = strategy::build_weight_schedule(signals, data, full_calendar,
                                                        config.strategy.rank_n, *scheme)
                            .filter_by_date(calendar.front(), calendar.back());

        std::cout << "  - " << schedule.size() << " trade dates (" << scheme->get_name()
                  << " weighting), " << schedule.shortfalls.size() << " shortfalls" << std::endl;

        // ====================================================================
        // 5. Rolling Backtest
        // ====================================================================
        std::cout << "[5/6] Running rolling backtest..." << std::endl;

        auto params = backtest::BacktestParams::from_config(config);
        backtest::RollingBacktestEngine engine(params);
        auto result = engine.run(schedule, data, calendar);

        result.print_summary();
        if (verbose)
        {
            std::cout << "\n  Trades: " << result.trade_summary.total_trades
                      << " (" << result.trade_summary.buy_trades << " buys, "
                      << result.trade_summary.sell_trades << " sells), costs "
                      << std::fixed << std::setprecision(2) << result.trade_summary.total_costs << "\n";
        }

        // ====================================================================
        // 6. Export Results
        // ====================================================================
        if (config.output.save_results)
        {
            std::cout << "\n[6/6] Writing results..." << std::endl;

            const std::filesystem::path out_dir(config.output.output_dir);
            std::filesystem::create_directories(out_dir);

            result.export_account_history_csv((out_dir / "account_history.csv").string());
            result.export_turnover_csv((out_dir / "turnover.csv").string());
            result.export_holdings_csv((out_dir / "holdings.csv").string());
            result.export_trades_csv((out_dir / "trades.csv").string());
            schedule.export_to_csv((out_dir / "weights.csv").string());

            std::cout << "  - Results written to: " << out_dir.string() << "\n";
        }
        else
        {
            std::cout << "\n[6/6] Skipping export (output.save_results is false)\n";
        }

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Backtest completed successfully in "
                  << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    auto args = CommandLineArgs::parse(argc, argv);

    if (args.show_help)
    {
        print_usage(argv[0]);
        return 0;
    }

    if (!args.is_valid())
    {
        std::cerr << "Error: --config is required\n\n";
        print_usage(argv[0]);
        return 1;
    }

    print_banner();
    return run(args);
}
