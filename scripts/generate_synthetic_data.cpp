/**
 * @file generate_synthetic_data.cpp
 * @brief Generate a synthetic input set for the rankfolio backtester
 *
 * Writes execution prices, trading days, a tradable mask, a benchmark
 * series, a ranked signal file and a matching configuration.
 */

#include "rankfolio/data/data_loader.hpp"
#include "rankfolio/data/market_data.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <numeric>
#include <random>
#include <sstream>

using namespace rankfolio;

int main(int argc, char* argv[]) {
    std::cout << "\n=== Synthetic Data Generator ===\n" << std::endl;

    std::string output_dir = "data";
    size_t num_days = 260;
    size_t num_stocks = 60;
    double base_volatility = 0.02;
    double base_drift = 0.0003;
    unsigned int seed = 42;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--output" && i + 1 < argc) {
            output_dir = argv[++i];
        } else if (arg == "--days" && i + 1 < argc) {
            num_days = static_cast<size_t>(std::stoul(argv[++i]));
        } else if (arg == "--stocks" && i + 1 < argc) {
            num_stocks = static_cast<size_t>(std::stoul(argv[++i]));
        } else if (arg == "--volatility" && i + 1 < argc) {
            base_volatility = std::stod(argv[++i]);
        } else if (arg == "--drift" && i + 1 < argc) {
            base_drift = std::stod(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            seed = static_cast<unsigned int>(std::stoul(argv[++i]));
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                      << "Options:\n"
                      << "  --output DIR       Output directory (default: data)\n"
                      << "  --days N           Trading days (default: 260)\n"
                      << "  --stocks N         Instruments (default: 60)\n"
                      << "  --volatility VAL   Daily volatility (default: 0.02)\n"
                      << "  --drift VAL        Daily drift (default: 0.0003)\n"
                      << "  --seed N           Random seed (default: 42)\n"
                      << "  --help             Show this help\n";
            return 0;
        }
    }

    try {
        // Codes spread across the Shanghai, Shenzhen and ChiNext boards.
        const char* boards[] = {"600", "000", "300", "688"};
        const char* suffixes[] = {".XSHG", ".XSHE", ".XSHE", ".XSHG"};
        std::vector<std::string> codes;
        std::vector<std::string> tickers;
        for (size_t i = 0; i < num_stocks; ++i) {
            std::ostringstream code;
            code << boards[i % 4] << std::setw(3) << std::setfill('0') << (i / 4 + 1);
            codes.push_back(code.str());
            tickers.push_back(code.str() + suffixes[i % 4]);
        }

        std::cout << "Generating " << num_days << " days for " << tickers.size() << " instruments..." << std::endl;
        auto data = DataLoader::generate_synthetic_data(tickers, num_days, "2022-01-04",
                                                        base_volatility, base_drift, seed);

        std::mt19937 gen(seed + 1);
        std::uniform_real_distribution<double> unit(0.0, 1.0);

        // Suspensions: an untradable day carries no price.
        Eigen::MatrixXd prices = data.get_prices();
        TradableMask mask = TradableMask::Constant(prices.rows(), prices.cols(), true);
        for (Eigen::Index i = 0; i < prices.rows(); ++i) {
            for (Eigen::Index j = 0; j < prices.cols(); ++j) {
                double u = unit(gen);
                if (u < 0.01) {
                    prices(i, j) = std::numeric_limits<double>::quiet_NaN();
                    mask(i, j) = false;
                } else if (u < 0.03) {
                    mask(i, j) = false;  // limit-up or ST
                }
            }
        }
        MarketData market(prices, data.get_dates(), tickers);
        market.set_tradable_mask(mask);

        std::filesystem::create_directories(output_dir);
        const std::filesystem::path dir(output_dir);

        DataLoader::save_vwap_csv(market, (dir / "vwap.csv").string());
        DataLoader::save_tradable_mask_csv(market, (dir / "tradable_mask.csv").string());

        {
            std::ofstream days((dir / "trading_days.csv").string());
            if (!days) throw std::runtime_error("Could not write trading_days.csv");
            days << "datetime\n";
            for (const auto& d : market.get_dates()) days << d << " 00:00:00\n";
        }

        {
            std::ofstream bench((dir / "benchmark.csv").string());
            if (!bench) throw std::runtime_error("Could not write benchmark.csv");
            std::normal_distribution<double> ret(0.0002, 0.012);
            bench << "datetime,000852.XSHG\n" << std::fixed << std::setprecision(4);
            double level = 6000.0;
            for (const auto& d : market.get_dates()) {
                bench << d << "," << level << "\n";
                level *= 1.0 + ret(gen);
            }
        }

        {
            // "date code rank" lines; codes are bare and ranks a daily permutation.
            std::ofstream sig((dir / "signals.txt").string());
            if (!sig) throw std::runtime_error("Could not write signals.txt");
            std::vector<size_t> order(codes.size());
            for (const auto& d : market.get_dates()) {
                std::iota(order.begin(), order.end(), 0);
                std::shuffle(order.begin(), order.end(), gen);
                std::string compact = d.substr(0, 4) + d.substr(5, 2) + d.substr(8, 2);
                for (size_t r = 0; r < order.size(); ++r) {
                    sig << compact << " " << codes[order[r]] << " " << r << "\n";
                }
            }
        }

        nlohmann::json config = {
            {"data", {
                {"signal_file", (dir / "signals.txt").string()},
                {"vwap_file", (dir / "vwap.csv").string()},
                {"price_column", "vwap"},
                {"trading_days_file", (dir / "trading_days.csv").string()},
                {"tradable_mask_file", (dir / "tradable_mask.csv").string()},
                {"benchmark_file", (dir / "benchmark.csv").string()},
                {"benchmark", "000852.XSHG"}
            }},
            {"strategy", {
                {"rank_n", 10},
                {"weighting", "equal"},
                {"portfolio_count", 5},
                {"rebalance_frequency", "weekly"}
            }},
            {"backtest", {
                {"initial_capital", 10000000.0},
                {"lot_size", 100},
                {"cash_reserve_ratio", 0.01},
                {"transaction_costs", {
                    {"commission_rate", 0.0003},
                    {"min_commission", 5.0},
                    {"stamp_duty_rate", 0.001},
                    {"slippage_bps", 5.0}
                }}
            }},
            {"output", {{"output_dir", "results"}, {"save_results", true}}},
            {"display", {{"verbose", false}}}
        };
        std::ofstream cfg((dir / "backtest_config.json").string());
        if (!cfg) throw std::runtime_error("Could not write backtest_config.json");
        cfg << config.dump(2) << "\n";

        std::cout << "Wrote vwap.csv, trading_days.csv, tradable_mask.csv, benchmark.csv, "
                  << "signals.txt and backtest_config.json to " << dir.string() << std::endl;
        market.print_summary();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\n=== Data generation complete ===\n" << std::endl;
    return 0;
}
