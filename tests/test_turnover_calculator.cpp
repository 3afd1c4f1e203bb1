#include <catch2/catch.hpp>
#include "rankfolio/backtest/turnover_calculator.hpp"
#include "rankfolio/backtest/portfolio_state.hpp"
#include <filesystem>
#include <fstream>

using namespace rankfolio::backtest;
using Catch::Detail::Approx;

TEST_CASE("Set turnover counts replaced names", "[Turnover]") {
    std::set<std::string> prev = {"A", "B", "C", "D", "E"};
    std::set<std::string> cur = {"A", "B", "F", "G", "H"};
    auto t = set_turnover(prev, cur);
    REQUIRE(t.has_value());
    REQUIRE(*t == Approx(0.6));

    SECTION("identical sets do not turn over") {
        REQUIRE(*set_turnover(prev, prev) == Approx(0.0));
    }
    SECTION("disjoint sets turn over fully") {
        REQUIRE(*set_turnover({"A"}, {"B", "C"}) == Approx(1.0));
    }
    SECTION("moving to cash turns over fully") {
        REQUIRE(*set_turnover({"A", "B"}, {}) == Approx(1.0));
    }
    SECTION("no prior holding set is undefined") {
        REQUIRE_FALSE(set_turnover({}, {"A", "B"}).has_value());
        REQUIRE_FALSE(set_turnover({}, {}).has_value());
    }
}

TEST_CASE("calc_turnover_rate assembles a date by sleeve table", "[Turnover]") {
    std::vector<PortfolioState> states;
    states.emplace_back(0, 1000.0, 1);
    states.emplace_back(1, 1000.0, 1);

    states[0].rebalance("2024-01-02", std::nullopt, {{"A", 1}, {"B", 1}}, 0.0);
    states[0].rebalance("2024-01-04", std::nullopt, {{"A", 1}, {"C", 1}}, 0.0);
    states[1].rebalance("2024-01-03", std::nullopt, {{"A", 1}}, 0.0);

    auto table = calc_turnover_rate(states, 2);
    REQUIRE(table.num_rows() == 3);
    REQUIRE(table.dates == std::vector<std::string>{"2024-01-02", "2024-01-03", "2024-01-04"});

    // first rebalance of each sleeve is undefined
    REQUIRE(table.is_rebalance[0][0]);
    REQUIRE_FALSE(table.values[0][0].has_value());
    REQUIRE_FALSE(table.is_rebalance[0][1]);
    REQUIRE(table.is_rebalance[1][1]);
    REQUIRE_FALSE(table.values[1][1].has_value());
    REQUIRE(*table.values[2][0] == Approx(0.5));

    REQUIRE(table.defined_count(0) == 1);
    REQUIRE(table.defined_count(1) == 0);
    REQUIRE(*table.mean_turnover(0) == Approx(0.5));
    REQUIRE_FALSE(table.mean_turnover(1).has_value());
    REQUIRE(*table.mean_turnover() == Approx(0.5));

    SECTION("export leaves undefined cells empty") {
        auto path = std::filesystem::temp_directory_path() / "rankfolio_turnover_test.csv";
        table.export_to_csv(path.string());
        std::ifstream in(path);
        std::string header, r0, r1, r2;
        std::getline(in, header);
        std::getline(in, r0);
        std::getline(in, r1);
        std::getline(in, r2);
        REQUIRE(header == "date,portfolio_0,portfolio_1");
        REQUIRE(r0 == "2024-01-02,,");
        REQUIRE(r1 == "2024-01-03,,");
        REQUIRE(r2 == "2024-01-04,0.500000,");
        in.close();
        std::filesystem::remove(path);
    }

    SECTION("count mismatch is rejected") {
        REQUIRE_THROWS_AS(calc_turnover_rate(states, 3), std::invalid_argument);
    }
}
