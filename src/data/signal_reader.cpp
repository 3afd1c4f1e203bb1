#include "rankfolio/data/signal_reader.hpp"
#include "rankfolio/data/data_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>

namespace rankfolio {

namespace {

bool is_underscore_pair(const std::string& line) {
    return std::count(line.begin(), line.end(), '_') == 1 &&
           line.find_first_of(" \t") == std::string::npos;
}

bool starts_with_any(const std::string& s, std::initializer_list<const char*> prefixes) {
    for (const char* p : prefixes) {
        if (s.compare(0, 2, p) == 0) return true;
    }
    return false;
}

} // namespace

std::string to_string(SignalFormat format) {
    return format == SignalFormat::WithRank ? "with_rank" : "without_rank";
}

SignalFormat SignalReader::detect_format(const std::string& first_line) {
    std::string line = DataLoader::trim(first_line);
    return is_underscore_pair(line) ? SignalFormat::WithoutRank : SignalFormat::WithRank;
}

SignalFormat SignalReader::detect_file_format(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open signal file: " + filepath);
    }
    std::string line;
    while (std::getline(file, line)) {
        if (!DataLoader::trim(line).empty()) return detect_format(line);
    }
    throw std::runtime_error("Signal file is empty: " + filepath);
}

std::string SignalReader::add_exchange_suffix(const std::string& code, bool* matched) {
    if (matched) *matched = true;
    if (code.find('.') != std::string::npos) return code;

    bool six_digits = code.size() == 6 &&
                      std::all_of(code.begin(), code.end(), [](unsigned char c) { return std::isdigit(c); });
    if (six_digits) {
        if (starts_with_any(code, {"60", "68"})) return code + ".XSHG";
        if (starts_with_any(code, {"00", "30"})) return code + ".XSHE";
        if (starts_with_any(code, {"43", "83", "87", "92"})) return code + ".BJSE";
    }
    if (matched) *matched = false;
    return code;
}

strategy::SignalBook SignalReader::parse(std::istream& in, SignalFormat format, bool verbose) {
    strategy::SignalBook book;
    std::map<std::string, std::set<std::string>> seen;
    std::map<std::string, int> daily_rank;
    std::set<std::string> warned;
    size_t skipped = 0;

    std::string raw;
    while (std::getline(in, raw)) {
        std::string line = DataLoader::trim(raw);
        if (line.empty()) continue;

        std::string date_str, code;
        double rank = 0.0;
        double score = std::numeric_limits<double>::quiet_NaN();

        if (format == SignalFormat::WithoutRank) {
            if (!is_underscore_pair(line)) { ++skipped; continue; }
            size_t pos = line.find('_');
            date_str = line.substr(0, pos);
            code = line.substr(pos + 1);
            rank = static_cast<double>(daily_rank[date_str]++);
        } else {
            std::istringstream fields(line);
            std::string rank_str, score_str;
            if (!(fields >> date_str >> code >> rank_str)) { ++skipped; continue; }
            rank = DataLoader::safe_stod(rank_str);
            if (std::isnan(rank)) { ++skipped; continue; }
            if (fields >> score_str) score = DataLoader::safe_stod(score_str);
        }

        std::string date = DataLoader::normalize_date(date_str);
        if (date.empty() || code.empty()) { ++skipped; continue; }

        bool matched = true;
        std::string instrument = add_exchange_suffix(code, &matched);
        if (!matched && warned.insert(code).second) {
            std::cerr << "Warning: code " << code << " matches no exchange rule, kept as is\n";
        }

        if (!seen[date].insert(instrument).second) continue;
        book[date].push_back(strategy::RankedCandidate{instrument, rank, score});
    }

    if (verbose && skipped > 0) {
        std::cerr << "Skipped " << skipped << " malformed signal lines\n";
    }
    return book;
}

strategy::SignalBook SignalReader::read_signal_file(const std::string& filepath, bool verbose) {
    SignalFormat format = detect_file_format(filepath);
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open signal file: " + filepath);
    }
    strategy::SignalBook book = parse(file, format, verbose);
    if (verbose) {
        std::cout << "Signal file " << filepath << " (" << to_string(format) << "): "
                  << num_records(book) << " records over " << book.size() << " dates\n";
    }
    return book;
}

strategy::SignalBook SignalReader::filter_by_date(const strategy::SignalBook& signals,
                                                  const std::string& start_date,
                                                  const std::string& end_date) {
    strategy::SignalBook out;
    for (const auto& entry : signals) {
        if (!start_date.empty() && entry.first < start_date) continue;
        if (!end_date.empty() && entry.first > end_date) continue;
        out.insert(entry);
    }
    return out;
}

std::set<std::string> SignalReader::instruments(const strategy::SignalBook& signals) {
    std::set<std::string> out;
    for (const auto& entry : signals) {
        for (const auto& c : entry.second) out.insert(c.instrument);
    }
    return out;
}

size_t SignalReader::num_records(const strategy::SignalBook& signals) {
    size_t n = 0;
    for (const auto& entry : signals) n += entry.second.size();
    return n;
}

void CoverageReport::print_summary() const {
    std::cout << "Coverage: " << signal_dates << " signal dates, " << instruments << " instruments\n";
    if (ok()) {
        std::cout << "  all signal dates map to the calendar and all instruments are priced\n";
        return;
    }
    auto preview = [](const std::vector<std::string>& items) {
        std::ostringstream oss;
        for (size_t i = 0; i < items.size() && i < 10; ++i) oss << (i ? ", " : "") << items[i];
        if (items.size() > 10) oss << ", ...";
        return oss.str();
    };
    if (!unmapped_signal_dates.empty()) {
        std::cout << "  Warning: " << unmapped_signal_dates.size()
                  << " signal dates have no following trading day: " << preview(unmapped_signal_dates) << "\n";
    }
    if (!instruments_without_prices.empty()) {
        std::cout << "  Warning: " << instruments_without_prices.size()
                  << " instruments never priced: " << preview(instruments_without_prices) << "\n";
    }
}

CoverageReport check_coverage(const strategy::SignalBook& signals,
                              const MarketData& market_data,
                              const std::vector<std::string>& trading_calendar) {
    CoverageReport report;
    report.signal_dates = signals.size();

    for (const auto& entry : signals) {
        if (std::upper_bound(trading_calendar.begin(), trading_calendar.end(), entry.first) ==
            trading_calendar.end()) {
            report.unmapped_signal_dates.push_back(entry.first);
        }
    }

    std::set<std::string> ids = SignalReader::instruments(signals);
    report.instruments = ids.size();
    const auto& prices = market_data.get_prices();
    for (const auto& id : ids) {
        int col = market_data.ticker_index(id);
        bool priced = false;
        if (col >= 0) {
            for (Eigen::Index r = 0; r < prices.rows() && !priced; ++r) {
                double p = prices(r, col);
                priced = std::isfinite(p) && p > 0.0;
            }
        }
        if (!priced) report.instruments_without_prices.push_back(id);
    }
    return report;
}

} // namespace rankfolio
