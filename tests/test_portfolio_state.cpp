#include <catch2/catch.hpp>
#include "rankfolio/backtest/portfolio_state.hpp"

using namespace rankfolio::backtest;
using Catch::Detail::Approx;

TEST_CASE("PortfolioState starts inactive with its capital in cash", "[PortfolioState]") {
    PortfolioState state(2, 200000.0, 100);
    REQUIRE(state.index() == 2);
    REQUIRE(state.cash() == Approx(200000.0));
    REQUIRE(state.holdings().empty());
    REQUIRE_FALSE(state.is_active());
    REQUIRE_FALSE(state.start_date().has_value());
    REQUIRE_FALSE(state.expire_date().has_value());
    REQUIRE(state.rebalance_count() == 0);
    REQUIRE(state.turnover_records().empty());

    REQUIRE_THROWS_AS(PortfolioState(-1, 1.0, 100), std::invalid_argument);
    REQUIRE_THROWS_AS(PortfolioState(0, 0.0, 100), std::invalid_argument);
    REQUIRE_THROWS_AS(PortfolioState(0, 1.0, 0), std::invalid_argument);
}

TEST_CASE("Rebalance replaces holdings and records turnover", "[PortfolioState]") {
    PortfolioState state(0, 10000.0, 100);

    state.rebalance("2024-01-02", std::string("2024-01-09"), {{"A", 300}, {"B", 200}, {"C", 0}}, 1500.0);
    REQUIRE(state.is_active());
    REQUIRE(state.holdings().size() == 2);  // zero entry dropped
    REQUIRE(state.shares("A") == 300);
    REQUIRE(state.shares("C") == 0);
    REQUIRE(state.cash() == Approx(1500.0));
    REQUIRE(*state.start_date() == "2024-01-02");
    REQUIRE(*state.expire_date() == "2024-01-09");
    REQUIRE(state.previous_stocks().empty());
    REQUIRE(state.turnover_records().count("2024-01-02") == 1);
    REQUIRE_FALSE(state.turnover_records().at("2024-01-02").has_value());

    state.rebalance("2024-01-09", std::nullopt, {{"A", 100}, {"D", 400}}, 200.0);
    REQUIRE(state.previous_stocks() == std::set<std::string>{"A", "B"});
    REQUIRE(state.current_stocks() == std::set<std::string>{"A", "D"});
    REQUIRE(*state.turnover_records().at("2024-01-09") == Approx(0.5));
    REQUIRE_FALSE(state.expire_date().has_value());
    REQUIRE(state.rebalance_count() == 2);

    std::map<std::string, double> prices = {{"A", 10.0}, {"D", 2.5}};
    REQUIRE(state.market_value(prices) == Approx(200.0 + 1000.0 + 1000.0));
    // unpriced names count as zero
    REQUIRE(state.market_value({{"A", 10.0}}) == Approx(1200.0));
}

TEST_CASE("Rejected mutations leave the sleeve unchanged", "[PortfolioState]") {
    PortfolioState state(1, 5000.0, 100);
    state.rebalance("2024-01-02", std::nullopt, {{"A", 100}}, 100.0);

    SECTION("negative cash") {
        REQUIRE_THROWS_AS(state.rebalance("2024-01-03", std::nullopt, {{"B", 100}}, -0.01),
                          InvariantViolation);
    }
    SECTION("negative shares") {
        REQUIRE_THROWS_AS(state.rebalance("2024-01-03", std::nullopt, {{"B", -100}}, 10.0),
                          InvariantViolation);
    }
    SECTION("lot misaligned shares") {
        REQUIRE_THROWS_AS(state.rebalance("2024-01-03", std::nullopt, {{"B", 150}}, 10.0),
                          InvariantViolation);
    }
    SECTION("liquidation into negative cash") {
        REQUIRE_THROWS_AS(state.liquidate(-500.0), InvariantViolation);
    }

    REQUIRE(state.shares("A") == 100);
    REQUIRE(state.cash() == Approx(100.0));
    REQUIRE(state.rebalance_count() == 1);
    REQUIRE(state.turnover_records().size() == 1);
    REQUIRE(state.is_active());
}

TEST_CASE("Liquidation moves the sleeve to cash", "[PortfolioState]") {
    PortfolioState state(0, 5000.0, 1);
    state.rebalance("2024-01-02", std::string("2024-01-03"), {{"A", 40}}, 1000.0);
    state.liquidate(4200.0);

    REQUIRE(state.holdings().empty());
    REQUIRE(state.cash() == Approx(5200.0));
    REQUIRE_FALSE(state.is_active());
    REQUIRE_FALSE(state.expire_date().has_value());
    REQUIRE(state.previous_stocks() == std::set<std::string>{"A"});

    // the next rebalance starts from an empty holding set
    state.rebalance("2024-01-04", std::nullopt, {{"B", 10}}, 100.0);
    REQUIRE(state.previous_stocks().empty());
    REQUIRE_FALSE(state.turnover_records().at("2024-01-04").has_value());
}
