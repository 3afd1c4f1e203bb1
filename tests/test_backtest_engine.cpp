#include <catch2/catch.hpp>
#include "rankfolio/backtest/backtest_engine.hpp"
#include "rankfolio/data/data_loader.hpp"
#include "rankfolio/strategy/weight_generator.hpp"
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <limits>

using namespace rankfolio;
using namespace rankfolio::backtest;
using Catch::Detail::Approx;

namespace {

const double kNaN = std::numeric_limits<double>::quiet_NaN();

std::vector<std::string> make_dates(int n) {
    std::vector<std::string> out;
    for (int i = 0; i < n; ++i) {
        char buf[11];
        std::snprintf(buf, sizeof(buf), "2024-01-%02d", i + 1);
        out.emplace_back(buf);
    }
    return out;
}

MarketData flat_market(const std::vector<std::string>& tickers,
                       const std::vector<double>& prices,
                       int days) {
    Eigen::MatrixXd m(days, static_cast<Eigen::Index>(tickers.size()));
    for (Eigen::Index j = 0; j < m.cols(); ++j) {
        m.col(j).setConstant(prices[static_cast<size_t>(j)]);
    }
    return MarketData(m, make_dates(days), tickers);
}

BacktestParams simple_params(double capital, int count, int freq, long long lot) {
    BacktestParams p;
    p.initial_capital = capital;
    p.rebalance.portfolio_count = count;
    p.rebalance.frequency_days = freq;
    p.lot_size = lot;
    return p;
}

} // namespace

TEST_CASE("Whole-lot sizing against sleeve capital", "[BacktestEngine]") {
    auto md = flat_market({"A", "B", "C"}, {100.0, 50.0, 25.0}, 1);
    strategy::WeightSchedule schedule;
    schedule.by_date["2024-01-01"] = {{"A", 1.0 / 3.0}, {"B", 1.0 / 3.0}, {"C", 1.0 / 3.0}};

    RollingBacktestEngine engine(simple_params(10000.0, 1, 1, 1));
    auto result = engine.run(schedule, md);

    REQUIRE(result.success);
    const auto& sleeve = result.portfolios.at(0);
    REQUIRE(sleeve.shares("A") == 33);
    REQUIRE(sleeve.shares("B") == 66);
    REQUIRE(sleeve.shares("C") == 133);
    REQUIRE(sleeve.cash() == Approx(75.0));
    REQUIRE(sleeve.is_active());

    REQUIRE(result.account_history.size() == 1);
    const auto& row = result.account_history.front();
    REQUIRE(row.total_account_asset == Approx(10000.0));
    REQUIRE(row.cash == Approx(75.0));
    REQUIRE(row.holdings_value == Approx(9925.0));
    REQUIRE(row.rebalancing_sleeves == 1);
    REQUIRE(std::isnan(row.benchmark));

    REQUIRE(result.holdings_history.size() == 3);
    REQUIRE(result.trades.size() == 3);
    REQUIRE(result.trade_summary.buy_trades == 3);
}

TEST_CASE("Held notional stays within one lot of the target", "[BacktestEngine]") {
    auto md = flat_market({"A", "B", "C", "D"}, {13.7, 88.1, 4.25, 251.0}, 1);
    strategy::WeightSchedule schedule;
    schedule.by_date["2024-01-01"] = {{"A", 0.4}, {"B", 0.3}, {"C", 0.2}, {"D", 0.1}};

    const double capital = 1234567.0;
    const double reserve = 0.02;
    BacktestParams params = simple_params(capital, 1, 1, 100);
    params.cash_reserve_ratio = reserve;

    RollingBacktestEngine engine(params);
    auto result = engine.run(schedule, md);

    REQUIRE(result.holdings_history.size() == 4);
    for (const auto& h : result.holdings_history) {
        double held = static_cast<double>(h.shares) * h.price;
        double target = h.weight * capital;
        REQUIRE(held <= target);
        REQUIRE(target - held < h.price * 100.0 + reserve * h.weight * capital);
        REQUIRE(h.shares % 100 == 0);
    }
    REQUIRE(result.portfolios[0].cash() >= reserve * capital - 1e-6);
}

TEST_CASE("Shortfall selects the available names and is reported", "[BacktestEngine]") {
    auto md = flat_market({"A", "B"}, {10.0, 20.0}, 2);
    strategy::SignalBook signals;
    signals["2024-01-01"] = std::vector<strategy::RankedCandidate>{{"A", 0.0, kNaN}, {"B", 1.0, kNaN}};

    strategy::EqualWeightScheme scheme;
    auto schedule = strategy::build_weight_schedule(signals, md, md.get_dates(), 30, scheme);
    const auto* w = schedule.find("2024-01-02");
    REQUIRE(w != nullptr);
    REQUIRE(w->at("A") == Approx(0.5));
    REQUIRE(w->at("B") == Approx(0.5));

    RollingBacktestEngine engine(simple_params(10000.0, 1, 1, 1));
    auto result = engine.run(schedule, md);

    REQUIRE(result.count_diagnostics(DiagnosticKind::Shortfall) == 1);
    // first day has no weights, second day buys both names
    REQUIRE(result.count_diagnostics(DiagnosticKind::NoSignal) == 1);
    REQUIRE(result.portfolios[0].shares("A") == 500);
    REQUIRE(result.portfolios[0].shares("B") == 250);
}

TEST_CASE("Staggered sleeves rebalance one per day", "[BacktestEngine]") {
    const int days = 20;
    auto md = flat_market({"A", "B"}, {10.0, 40.0}, days);
    strategy::WeightSchedule schedule;
    for (const auto& d : md.get_dates()) {
        schedule.by_date[d] = {{"A", 0.5}, {"B", 0.5}};
    }

    RollingBacktestEngine engine(simple_params(1e7, 5, 5, 100));
    auto result = engine.run(schedule, md);

    auto counts = result.rebalance_counts();
    REQUIRE(counts.size() == static_cast<size_t>(days));
    for (int c : counts) REQUIRE(c == 1);

    REQUIRE(result.portfolios.size() == 5);
    for (int i = 0; i < 5; ++i) {
        const auto& s = result.portfolios[static_cast<size_t>(i)];
        REQUIRE(s.allocated_capital() == Approx(2e6));
        REQUIRE(s.rebalance_count() == 4);
        REQUIRE(*s.start_date() == md.get_dates()[static_cast<size_t>(15 + i)]);
    }

    SECTION("holding windows past the calendar end have no expiry") {
        // sleeve 0 last rebalanced on day 15; day 20 is past the calendar
        REQUIRE_FALSE(result.portfolios[0].expire_date().has_value());
    }

    SECTION("unchanged selections do not turn over") {
        auto table = result.turnover();
        REQUIRE(table.num_rows() == static_cast<size_t>(days));
        for (int i = 0; i < 5; ++i) {
            REQUIRE(table.defined_count(i) == 3);
            REQUIRE(*table.mean_turnover(i) == Approx(0.0));
        }
    }

    SECTION("flat prices and no costs keep the account whole") {
        for (const auto& row : result.account_history) {
            REQUIRE(row.total_account_asset == Approx(1e7));
        }
        REQUIRE(result.total_return() == Approx(0.0).margin(1e-12));
        REQUIRE(result.max_drawdown() == Approx(0.0).margin(1e-12));
    }
}

TEST_CASE("Identical inputs give identical results", "[BacktestEngine]") {
    auto md = DataLoader::generate_synthetic_data({"A", "B", "C", "D"}, 30, "2024-01-02", 0.02, 0.0005, 11);
    strategy::SignalBook signals;
    for (size_t i = 0; i < md.get_dates().size(); ++i) {
        std::vector<strategy::RankedCandidate> c;
        for (size_t j = 0; j < 4; ++j) {
            c.push_back({md.get_tickers()[j], static_cast<double>((i + j) % 4), kNaN});
        }
        signals[md.get_dates()[i]] = c;
    }
    strategy::EqualWeightScheme scheme;
    auto schedule = strategy::build_weight_schedule(signals, md, md.get_dates(), 2, scheme);

    BacktestParams params = simple_params(1e6, 3, 5, 100);
    params.transaction_costs.commission_rate = 0.0003;
    params.transaction_costs.min_commission = 5.0;
    params.transaction_costs.stamp_duty_rate = 0.001;

    RollingBacktestEngine engine(params);
    auto first = engine.run(schedule, md);
    auto second = engine.run(schedule, md);

    REQUIRE(first.account_history.size() == second.account_history.size());
    for (size_t i = 0; i < first.account_history.size(); ++i) {
        REQUIRE(first.account_history[i].total_account_asset == second.account_history[i].total_account_asset);
        REQUIRE(first.account_history[i].cash == second.account_history[i].cash);
    }
    REQUIRE(first.trades.size() == second.trades.size());

    for (const auto& s : first.portfolios) {
        REQUIRE(s.cash() >= 0.0);
        for (const auto& h : s.holdings()) {
            REQUIRE(h.second > 0);
            REQUIRE(h.second % 100 == 0);
        }
    }

    // Every committed position and every day's cash, not just the final state.
    REQUIRE_FALSE(first.holdings_history.empty());
    for (const auto& h : first.holdings_history) {
        REQUIRE(h.sleeve >= 0);
        REQUIRE(h.sleeve < 3);
        REQUIRE(h.shares > 0);
        REQUIRE(h.shares % 100 == 0);
    }
    for (const auto& row : first.account_history) {
        REQUIRE(row.cash >= 0.0);
        REQUIRE(row.holdings_value >= 0.0);
    }
}

TEST_CASE("Round trips at flat prices lose exactly the costs paid", "[BacktestEngine]") {
    auto md = flat_market({"A", "B"}, {12.34, 56.78}, 6);
    strategy::WeightSchedule schedule;
    const auto& dates = md.get_dates();
    for (size_t i = 0; i < dates.size(); ++i) {
        if (i % 2 == 0)
            schedule.by_date[dates[i]] = {{"A", 1.0}};
        else
            schedule.by_date[dates[i]] = {{"B", 1.0}};
    }

    BacktestParams params = simple_params(1e6, 1, 1, 100);
    params.cash_reserve_ratio = 0.01;
    params.transaction_costs.commission_rate = 0.0003;
    params.transaction_costs.min_commission = 5.0;
    params.transaction_costs.stamp_duty_rate = 0.001;
    params.transaction_costs.slippage_bps = 5.0;

    RollingBacktestEngine engine(params);
    auto result = engine.run(schedule, md);

    REQUIRE(result.trade_summary.total_costs > 0.0);
    REQUIRE(result.account_history.back().total_account_asset ==
            Approx(1e6 - result.trade_summary.total_costs));
    REQUIRE(result.portfolios[0].cash() >= 0.0);

    // full turnover every day after the first
    auto table = result.turnover();
    REQUIRE(*table.mean_turnover(0) == Approx(1.0));
    REQUIRE(table.defined_count(0) == 5);
}

TEST_CASE("Costs that exceed cash shrink the last buy", "[BacktestEngine]") {
    auto md = flat_market({"A"}, {10.0}, 1);
    strategy::WeightSchedule schedule;
    schedule.by_date["2024-01-01"] = {{"A", 1.0}};

    BacktestParams params = simple_params(10000.0, 1, 1, 100);
    params.transaction_costs.commission_rate = 0.001;
    params.transaction_costs.min_commission = 5.0;

    RollingBacktestEngine engine(params);
    auto result = engine.run(schedule, md);

    // 1000 shares would need 10010; one lot is dropped
    REQUIRE(result.portfolios[0].shares("A") == 900);
    REQUIRE(result.portfolios[0].cash() == Approx(10000.0 - 9000.0 - 9.0));
}

TEST_CASE("Untradable holdings are force liquidated", "[BacktestEngine]") {
    Eigen::MatrixXd prices(2, 2);
    prices << 10.0, 20.0,
              kNaN, 20.0;
    MarketData md(prices, make_dates(2), {"A", "B"});
    md.set_tradable("A", "2024-01-02", false);

    strategy::WeightSchedule schedule;
    schedule.by_date["2024-01-01"] = {{"A", 0.5}, {"B", 0.5}};
    schedule.by_date["2024-01-02"] = {{"B", 1.0}};

    RollingBacktestEngine engine(simple_params(1000.0, 1, 1, 1));
    auto result = engine.run(schedule, md);

    REQUIRE(result.count_diagnostics(DiagnosticKind::ForcedLiquidation) == 1);
    REQUIRE(result.count_diagnostics(DiagnosticKind::PriceGap) == 1);

    const auto& sleeve = result.portfolios[0];
    REQUIRE(sleeve.shares("A") == 0);
    REQUIRE(sleeve.shares("B") == 50);
    REQUIRE(sleeve.cash() == Approx(0.0).margin(1e-9));
    REQUIRE(result.account_history[1].total_account_asset == Approx(1000.0));

    bool sold_at_last_price = false;
    for (const auto& t : result.trades) {
        if (t.ticker == "A" && t.shares < 0) {
            sold_at_last_price = true;
            REQUIRE(t.date == "2024-01-02");
            REQUIRE(t.price == Approx(10.0));
            REQUIRE(t.reason == TradeReason::ForcedLiquidation);
        }
    }
    REQUIRE(sold_at_last_price);
    REQUIRE(result.trade_summary.forced_liquidations == 1);
}

TEST_CASE("Untradable targets are skipped without renormalising", "[BacktestEngine]") {
    auto md = flat_market({"A", "B"}, {10.0, 10.0}, 1);
    md.set_tradable("A", "2024-01-01", false);

    strategy::WeightSchedule schedule;
    schedule.by_date["2024-01-01"] = {{"A", 0.5}, {"B", 0.5}};

    RollingBacktestEngine engine(simple_params(1000.0, 1, 1, 1));
    auto result = engine.run(schedule, md);

    REQUIRE(result.count_diagnostics(DiagnosticKind::SkippedTarget) == 1);
    REQUIRE(result.count_diagnostics(DiagnosticKind::PriceGap) == 0);
    REQUIRE(result.diagnostics.front().instrument == "A");
    REQUIRE(to_string(DiagnosticKind::SkippedTarget) == "skipped_target");

    const auto& sleeve = result.portfolios[0];
    REQUIRE(sleeve.shares("A") == 0);
    REQUIRE(sleeve.shares("B") == 50);
    REQUIRE(sleeve.cash() == Approx(500.0));
}

TEST_CASE("Missing price between rebalances values the position at zero", "[BacktestEngine]") {
    Eigen::MatrixXd prices(3, 1);
    prices << 10.0, kNaN, 10.0;
    MarketData md(prices, make_dates(3), {"A"});

    strategy::WeightSchedule schedule;
    schedule.by_date["2024-01-01"] = {{"A", 1.0}};
    schedule.by_date["2024-01-03"] = {{"A", 1.0}};

    RollingBacktestEngine engine(simple_params(1000.0, 1, 2, 1));
    auto result = engine.run(schedule, md);

    REQUIRE(result.rebalance_counts() == std::vector<int>{1, 0, 1});
    REQUIRE(result.account_history[0].total_account_asset == Approx(1000.0));
    REQUIRE(result.account_history[1].holdings_value == Approx(0.0));
    REQUIRE(result.account_history[1].total_account_asset == Approx(0.0));
    REQUIRE(result.account_history[2].total_account_asset == Approx(1000.0));

    REQUIRE(result.count_diagnostics(DiagnosticKind::PriceGap) == 1);
    REQUIRE(result.diagnostics.back().date == "2024-01-02");
    REQUIRE(result.diagnostics.back().instrument == "A");
}

TEST_CASE("No weights on a rebalance day moves the sleeve to cash", "[BacktestEngine]") {
    auto md = flat_market({"A"}, {10.0}, 2);
    strategy::WeightSchedule schedule;
    schedule.by_date["2024-01-01"] = {{"A", 1.0}};

    RollingBacktestEngine engine(simple_params(1000.0, 1, 1, 1));
    auto result = engine.run(schedule, md);

    REQUIRE(result.count_diagnostics(DiagnosticKind::NoSignal) == 1);
    // a move to cash is not a rebalance
    REQUIRE(result.portfolios[0].turnover_records().size() == 1);
    REQUIRE(result.portfolios[0].rebalance_count() == 1);
    const auto& sleeve = result.portfolios[0];
    REQUIRE_FALSE(sleeve.is_active());
    REQUIRE(sleeve.holdings().empty());
    REQUIRE(sleeve.cash() == Approx(1000.0));
    REQUIRE(result.account_history[1].cash == Approx(1000.0));
    REQUIRE(result.trade_summary.sell_trades == 1);
}

TEST_CASE("A rebalance that would overdraw cash is aborted", "[BacktestEngine]") {
    auto md = flat_market({"A"}, {100.0}, 2);
    strategy::WeightSchedule schedule;
    schedule.by_date["2024-01-01"] = {{"A", 1.0}};
    schedule.by_date["2024-01-02"] = {{"A", 1.0}};

    // selling costs twice its notional
    BacktestParams params = simple_params(10000.0, 1, 1, 100);
    params.transaction_costs.stamp_duty_rate = 2.0;

    RollingBacktestEngine engine(params);
    auto result = engine.run(schedule, md);

    REQUIRE(result.success);
    REQUIRE(result.count_diagnostics(DiagnosticKind::InvariantViolation) == 1);

    const auto& sleeve = result.portfolios[0];
    REQUIRE(sleeve.shares("A") == 100);
    REQUIRE(sleeve.cash() == Approx(0.0).margin(1e-9));
    REQUIRE(sleeve.rebalance_count() == 1);
    REQUIRE(*sleeve.start_date() == "2024-01-01");

    REQUIRE(result.trades.size() == 1);
    REQUIRE(result.account_history[1].total_account_asset == Approx(10000.0));
}

TEST_CASE("An aborted rebalance still reports what it saw", "[BacktestEngine]") {
    auto md = flat_market({"A"}, {100.0}, 2);
    md.set_tradable("A", "2024-01-02", false);

    strategy::WeightSchedule schedule;
    schedule.by_date["2024-01-01"] = {{"A", 1.0}};
    schedule.by_date["2024-01-02"] = {{"A", 1.0}};

    BacktestParams params = simple_params(10000.0, 1, 1, 100);
    params.transaction_costs.stamp_duty_rate = 2.0;

    RollingBacktestEngine engine(params);
    auto result = engine.run(schedule, md);

    REQUIRE(result.count_diagnostics(DiagnosticKind::ForcedLiquidation) == 1);
    REQUIRE(result.count_diagnostics(DiagnosticKind::SkippedTarget) == 1);
    REQUIRE(result.count_diagnostics(DiagnosticKind::InvariantViolation) == 1);
    REQUIRE(result.diagnostics.back().kind == DiagnosticKind::InvariantViolation);

    // the sleeve keeps its holding and nothing reaches the ledger
    REQUIRE(result.portfolios[0].shares("A") == 100);
    REQUIRE(result.trades.size() == 1);
}

TEST_CASE("Engine argument checks", "[BacktestEngine]") {
    auto md = flat_market({"A"}, {10.0}, 3);
    strategy::WeightSchedule schedule;

    RollingBacktestEngine engine(simple_params(1000.0, 1, 1, 1));
    REQUIRE_THROWS_AS(engine.run(schedule, md, {}), std::invalid_argument);
    REQUIRE_THROWS_AS(engine.run(schedule, md, {"2024-01-02", "2024-01-01"}), std::invalid_argument);

    REQUIRE_THROWS_AS(RollingBacktestEngine(simple_params(1000.0, 6, 5, 100)), std::invalid_argument);
    REQUIRE_THROWS_AS(RollingBacktestEngine(simple_params(0.0, 1, 1, 100)), std::invalid_argument);
    REQUIRE_THROWS_AS(RollingBacktestEngine(simple_params(1000.0, 1, 1, 0)), std::invalid_argument);

    BacktestParams reserve = simple_params(1000.0, 1, 1, 1);
    reserve.cash_reserve_ratio = 1.0;
    REQUIRE_THROWS_AS(RollingBacktestEngine(reserve), std::invalid_argument);

    BacktestParams costs = simple_params(1000.0, 1, 1, 1);
    costs.transaction_costs.commission_rate = -0.001;
    REQUIRE_THROWS_AS(RollingBacktestEngine(costs), std::invalid_argument);
}

TEST_CASE("Parameters from configuration", "[BacktestEngine]") {
    RankfolioConfig cfg;
    cfg.backtest.initial_capital = 5e6;
    cfg.backtest.lot_size = 200;
    cfg.backtest.cash_reserve_ratio = 0.05;
    cfg.backtest.stamp_duty_rate = 0.0005;
    cfg.strategy.portfolio_count = 4;
    cfg.strategy.rebalance_frequency = 21;
    cfg.display.verbose = true;

    auto p = BacktestParams::from_config(cfg);
    REQUIRE(p.initial_capital == Approx(5e6));
    REQUIRE(p.lot_size == 200);
    REQUIRE(p.cash_reserve_ratio == Approx(0.05));
    REQUIRE(p.transaction_costs.stamp_duty_rate == Approx(0.0005));
    REQUIRE(p.rebalance.portfolio_count == 4);
    REQUIRE(p.rebalance.frequency_days == 21);
    REQUIRE(p.verbose);
}

TEST_CASE("Benchmark and result exports", "[BacktestEngine]") {
    auto md = flat_market({"A"}, {10.0}, 3);
    Eigen::VectorXd bench(3);
    bench << 100.0, kNaN, 110.0;
    md.set_benchmark("000852.XSHG", bench);

    strategy::WeightSchedule schedule;
    for (const auto& d : md.get_dates()) schedule.by_date[d] = {{"A", 1.0}};

    RollingBacktestEngine engine(simple_params(1000.0, 1, 1, 1));
    auto result = engine.run(schedule, md);

    REQUIRE(result.account_history[0].benchmark == Approx(100.0));
    REQUIRE(std::isnan(result.account_history[1].benchmark));
    REQUIRE(result.benchmark_return() == Approx(0.1));
    REQUIRE(result.excess_return() == Approx(-0.1));

    auto dir = std::filesystem::temp_directory_path() / "rankfolio_export_test";
    result.export_account_history_csv((dir / "account_history.csv").string());
    result.export_turnover_csv((dir / "turnover.csv").string());
    result.export_holdings_csv((dir / "holdings.csv").string());
    result.export_trades_csv((dir / "trades.csv").string());

    std::ifstream account(dir / "account_history.csv");
    std::string header, r0, r1;
    std::getline(account, header);
    std::getline(account, r0);
    std::getline(account, r1);
    REQUIRE(header == "date,total_account_asset,cash,holdings_value,benchmark,rebalancing_sleeves");
    REQUIRE(r0 == "2024-01-01,1000.0000,0.0000,1000.0000,100.0000,1");
    REQUIRE(r1 == "2024-01-02,1000.0000,0.0000,1000.0000,,1");
    account.close();

    std::ifstream turnover(dir / "turnover.csv");
    std::getline(turnover, header);
    REQUIRE(header == "date,portfolio_0");
    turnover.close();

    REQUIRE(std::filesystem::exists(dir / "holdings.csv"));
    REQUIRE(std::filesystem::exists(dir / "trades.csv"));
    std::filesystem::remove_all(dir);
}
