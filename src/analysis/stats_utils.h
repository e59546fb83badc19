#pragma once

/// @file stats_utils.h
/// @brief Descriptive statistics and correlation primitives
///
/// All functions take already-filtered samples (no NaN) unless noted.

#include <cstddef>
#include <vector>

namespace rootscope::analysis {

/// @brief Arithmetic mean, 0 for an empty sample
double Mean(const std::vector<double>& values);

/// @brief Population standard deviation (divides by n)
double PopulationStdDev(const std::vector<double>& values);

/// @brief Adjusted Fisher-Pearson sample skewness (G1)
///
/// Returns 0 for fewer than 3 values or a constant sample.
double SampleSkewness(const std::vector<double>& values);

/// @brief Quantile with linear interpolation between order statistics
/// @param sorted Ascending, non-empty sample
/// @param q Probability in [0, 1]
double Quantile(const std::vector<double>& sorted, double q);

/// @brief 1-based ranks, ties receive the average of their positions
std::vector<double> AverageRanks(const std::vector<double>& values);

/// @brief True when every value equals the first one
bool IsConstant(const std::vector<double>& values);

/// @brief Pearson product-moment correlation
///
/// Returns 0 for mismatched or too short inputs and for a constant side.
double PearsonCorrelation(const std::vector<double>& x, const std::vector<double>& y);

/// @brief Spearman rank correlation (Pearson on average ranks)
double SpearmanCorrelation(const std::vector<double>& x, const std::vector<double>& y);

/// @brief Regularized incomplete beta function I_x(a, b)
double RegularizedIncompleteBeta(double a, double b, double x);

/// @brief Two-tailed p-value of a Student t statistic
double PValueFromT(double t, size_t df);

/// @brief Two-tailed p-value for H0: rho = 0 given r over n pairs
///
/// Uses t = r * sqrt((n - 2) / (1 - r^2)) with n - 2 degrees of freedom.
/// Returns 1 for n < 3 and 0 for |r| = 1.
double CorrelationPValue(double r, size_t n);

}  // namespace rootscope::analysis
