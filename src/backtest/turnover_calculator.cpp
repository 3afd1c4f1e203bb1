#include "rankfolio/backtest/turnover_calculator.hpp"
#include "rankfolio/backtest/portfolio_state.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace rankfolio {
namespace backtest {

std::optional<double> set_turnover(const std::set<std::string>& previous_stocks,
                                   const std::set<std::string>& current_stocks) {
    if (previous_stocks.empty()) return std::nullopt;

    size_t kept = 0;
    for (const auto& id : previous_stocks) {
        if (current_stocks.count(id)) ++kept;
    }
    double prev = static_cast<double>(previous_stocks.size());
    return (prev - static_cast<double>(kept)) / prev;
}

std::optional<double> TurnoverTable::mean_turnover(int sleeve) const {
    if (sleeve < 0 || sleeve >= portfolio_count)
        throw std::out_of_range("sleeve index out of range: " + std::to_string(sleeve));
    double sum = 0.0;
    int n = 0;
    for (const auto& row : values) {
        const auto& cell = row[static_cast<size_t>(sleeve)];
        if (cell) {
            sum += *cell;
            ++n;
        }
    }
    if (n == 0) return std::nullopt;
    return sum / n;
}

std::optional<double> TurnoverTable::mean_turnover() const {
    double sum = 0.0;
    int n = 0;
    for (const auto& row : values) {
        for (const auto& cell : row) {
            if (cell) {
                sum += *cell;
                ++n;
            }
        }
    }
    if (n == 0) return std::nullopt;
    return sum / n;
}

int TurnoverTable::defined_count(int sleeve) const {
    if (sleeve < 0 || sleeve >= portfolio_count)
        throw std::out_of_range("sleeve index out of range: " + std::to_string(sleeve));
    int n = 0;
    for (const auto& row : values) {
        if (row[static_cast<size_t>(sleeve)]) ++n;
    }
    return n;
}

void TurnoverTable::export_to_csv(const std::string& filepath) const {
    std::filesystem::path path(filepath);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + filepath);
    }

    file << "date";
    for (int i = 0; i < portfolio_count; ++i) file << ",portfolio_" << i;
    file << "\n";

    file << std::fixed << std::setprecision(6);
    for (size_t r = 0; r < dates.size(); ++r) {
        file << dates[r];
        for (const auto& cell : values[r]) {
            file << ",";
            if (cell) file << *cell;
        }
        file << "\n";
    }
}

TurnoverTable calc_turnover_rate(const std::vector<PortfolioState>& portfolio_states,
                                 int portfolio_count) {
    if (portfolio_count <= 0) {
        throw std::invalid_argument("portfolio_count must be > 0");
    }
    if (static_cast<size_t>(portfolio_count) != portfolio_states.size()) {
        throw std::invalid_argument("portfolio_count (" + std::to_string(portfolio_count) +
                                    ") does not match number of portfolio states (" +
                                    std::to_string(portfolio_states.size()) + ")");
    }

    std::set<std::string> all_dates;
    for (const auto& state : portfolio_states) {
        for (const auto& rec : state.turnover_records()) all_dates.insert(rec.first);
    }

    TurnoverTable table;
    table.portfolio_count = portfolio_count;
    table.dates.assign(all_dates.begin(), all_dates.end());
    table.values.assign(table.dates.size(),
                        std::vector<std::optional<double>>(static_cast<size_t>(portfolio_count)));
    table.is_rebalance.assign(table.dates.size(), std::vector<bool>(static_cast<size_t>(portfolio_count), false));

    for (size_t s = 0; s < portfolio_states.size(); ++s) {
        for (const auto& rec : portfolio_states[s].turnover_records()) {
            auto it = std::lower_bound(table.dates.begin(), table.dates.end(), rec.first);
            size_t row = static_cast<size_t>(it - table.dates.begin());
            table.values[row][s] = rec.second;
            table.is_rebalance[row][s] = true;
        }
    }
    return table;
}

} // namespace backtest
} // namespace rankfolio
