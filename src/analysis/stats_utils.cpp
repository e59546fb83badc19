/// @file stats_utils.cpp
/// @brief Descriptive statistics and correlation primitives

#include "analysis/stats_utils.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace rootscope::analysis {

namespace {

/// Lentz evaluation of the continued fraction for I_x(a, b)
double BetaContinuedFraction(double a, double b, double x) {
    constexpr int kMaxIterations = 500;
    constexpr double kEpsilon = 3e-14;
    constexpr double kFpMin = 1e-300;

    const double qab = a + b;
    const double qap = a + 1.0;
    const double qam = a - 1.0;

    double c = 1.0;
    double d = 1.0 - qab * x / qap;
    if (std::abs(d) < kFpMin) d = kFpMin;
    d = 1.0 / d;
    double h = d;

    for (int m = 1; m <= kMaxIterations; ++m) {
        const int m2 = 2 * m;

        double aa = m * (b - m) * x / ((qam + m2) * (a + m2));
        d = 1.0 + aa * d;
        if (std::abs(d) < kFpMin) d = kFpMin;
        c = 1.0 + aa / c;
        if (std::abs(c) < kFpMin) c = kFpMin;
        d = 1.0 / d;
        h *= d * c;

        aa = -(a + m) * (qab + m) * x / ((a + m2) * (qap + m2));
        d = 1.0 + aa * d;
        if (std::abs(d) < kFpMin) d = kFpMin;
        c = 1.0 + aa / c;
        if (std::abs(c) < kFpMin) c = kFpMin;
        d = 1.0 / d;
        const double del = d * c;
        h *= del;

        if (std::abs(del - 1.0) <= kEpsilon) {
            break;
        }
    }
    return h;
}

double Clamp01(double value) {
    if (std::isnan(value)) return 1.0;
    return std::clamp(value, 0.0, 1.0);
}

}  // namespace

double Mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) /
           static_cast<double>(values.size());
}

double PopulationStdDev(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    const double mean = Mean(values);
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - mean) * (v - mean);
    }
    return std::sqrt(sum_sq / static_cast<double>(values.size()));
}

double SampleSkewness(const std::vector<double>& values) {
    const size_t n = values.size();
    if (n < 3 || IsConstant(values)) return 0.0;

    const double mean = Mean(values);
    double m2 = 0.0;
    double m3 = 0.0;
    for (double v : values) {
        const double d = v - mean;
        m2 += d * d;
        m3 += d * d * d;
    }
    const double nd = static_cast<double>(n);
    m2 /= nd;
    m3 /= nd;
    if (m2 <= 0.0) return 0.0;

    const double g1 = m3 / std::pow(m2, 1.5);
    return g1 * std::sqrt(nd * (nd - 1.0)) / (nd - 2.0);
}

double Quantile(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) return 0.0;
    if (sorted.size() == 1) return sorted.front();

    const double h = (static_cast<double>(sorted.size()) - 1.0) * std::clamp(q, 0.0, 1.0);
    const size_t lo = static_cast<size_t>(std::floor(h));
    if (lo + 1 >= sorted.size()) return sorted.back();
    return sorted[lo] + (h - static_cast<double>(lo)) * (sorted[lo + 1] - sorted[lo]);
}

std::vector<double> AverageRanks(const std::vector<double>& values) {
    std::vector<size_t> idx(values.size());
    std::iota(idx.begin(), idx.end(), 0);
    std::stable_sort(idx.begin(), idx.end(),
                     [&](size_t a, size_t b) { return values[a] < values[b]; });

    std::vector<double> ranks(values.size(), 0.0);
    size_t i = 0;
    while (i < idx.size()) {
        size_t j = i + 1;
        while (j < idx.size() && values[idx[j]] == values[idx[i]]) ++j;
        const double rank = (static_cast<double>(i + 1) + static_cast<double>(j)) * 0.5;
        for (size_t k = i; k < j; ++k) ranks[idx[k]] = rank;
        i = j;
    }
    return ranks;
}

bool IsConstant(const std::vector<double>& values) {
    return std::all_of(values.begin(), values.end(),
                       [&](double v) { return v == values.front(); });
}

double PearsonCorrelation(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size() || x.size() < 2) {
        return 0.0;
    }
    if (IsConstant(x) || IsConstant(y)) {
        return 0.0;
    }

    const double mean_x = Mean(x);
    const double mean_y = Mean(y);

    double cov = 0.0, var_x = 0.0, var_y = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        const double dx = x[i] - mean_x;
        const double dy = y[i] - mean_y;
        cov += dx * dy;
        var_x += dx * dx;
        var_y += dy * dy;
    }

    const double denom = std::sqrt(var_x * var_y);
    if (denom == 0.0 || !std::isfinite(denom)) return 0.0;

    return std::clamp(cov / denom, -1.0, 1.0);
}

double SpearmanCorrelation(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size() || x.size() < 2) {
        return 0.0;
    }
    return PearsonCorrelation(AverageRanks(x), AverageRanks(y));
}

double RegularizedIncompleteBeta(double a, double b, double x) {
    if (x <= 0.0) return 0.0;
    if (x >= 1.0) return 1.0;

    const double ln_beta = std::lgamma(a) + std::lgamma(b) - std::lgamma(a + b);
    const double front = std::exp(a * std::log(x) + b * std::log(1.0 - x) - ln_beta);

    // The fraction converges fastest on this side of the mean
    if (x < (a + 1.0) / (a + b + 2.0)) {
        return Clamp01(front * BetaContinuedFraction(a, b, x) / a);
    }
    return Clamp01(1.0 - front * BetaContinuedFraction(b, a, 1.0 - x) / b);
}

double PValueFromT(double t, size_t df) {
    if (df == 0) return 1.0;
    const double t_abs = std::abs(t);
    if (std::isnan(t_abs)) return 1.0;
    if (std::isinf(t_abs)) return 0.0;

    const double nu = static_cast<double>(df);
    return RegularizedIncompleteBeta(nu / 2.0, 0.5, nu / (nu + t_abs * t_abs));
}

double CorrelationPValue(double r, size_t n) {
    if (n < 3 || std::isnan(r)) return 1.0;

    const double r2 = r * r;
    if (r2 >= 1.0) return 0.0;

    const double df = static_cast<double>(n - 2);
    const double t = r * std::sqrt(df / (1.0 - r2));
    return PValueFromT(t, n - 2);
}

}  // namespace rootscope::analysis
