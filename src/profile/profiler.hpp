#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tabprof {

// Readable values of one numeric column. finish() sorts them and settles the
// aggregates; min/max/quantile read the sorted values and need count() > 0.
class numeric_accumulator {
public:
    void add(double x) { values_.push_back(x); }
    void add_missing() { ++missing_; }

    void finish() {
        std::sort(values_.begin(), values_.end());
        if (values_.empty()) return;
        const double n = static_cast<double>(values_.size());
        mean_ = std::accumulate(values_.begin(), values_.end(), 0.0) / n;
        if (values_.size() < 2) return;
        double ss = 0.0;
        for (double x : values_) ss += (x - mean_) * (x - mean_);
        variance_ = ss / (n - 1.0);
    }

    std::size_t count() const { return values_.size(); }
    std::size_t missing_count() const { return missing_; }
    double min() const { return values_.front(); }
    double max() const { return values_.back(); }
    double mean() const { return mean_; }
    double stddev() const { return std::sqrt(variance_); }   // sample (n - 1)

    // Linear interpolation between the order statistics around q * (n - 1).
    double quantile(double q) const {
        const double pos = q * static_cast<double>(values_.size() - 1);
        const std::size_t lo = static_cast<std::size_t>(pos);
        const std::size_t hi = std::min(lo + 1, values_.size() - 1);
        const double frac = pos - static_cast<double>(lo);
        return values_[lo] + (values_[hi] - values_[lo]) * frac;
    }

private:
    std::vector<double> values_;
    std::size_t missing_ = 0;
    double mean_ = 0.0;
    double variance_ = 0.0;
};

struct frequency_table {
    std::size_t missing_count{0};
    std::size_t count{0};
    std::unordered_map<std::string, std::size_t> freq;
    void add_missing() { ++missing_count; }
    void add(const std::string& s) { ++count; ++freq[s]; }

    // The k most frequent values; equal counts ordered by value ascending.
    std::vector<std::pair<std::string, std::size_t>> top(std::size_t k) const {
        std::vector<std::pair<std::string, std::size_t>> v(freq.begin(), freq.end());
        std::sort(v.begin(), v.end(), [](const auto& a, const auto& b) {
            if (a.second != b.second) return a.second > b.second;
            return a.first < b.first;
        });
        if (v.size() > k) v.resize(k);
        return v;
    }
};

}
