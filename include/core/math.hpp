#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace heat_agent::core {

inline constexpr double clamp01(const double value) noexcept {
  return std::clamp(value, 0.0, 1.0);
}

inline double mean(const std::vector<double>& values) noexcept {
  if (values.empty()) {
    return 0.0;
  }
  double sum = 0.0;
  for (const double value : values) {
    sum += value;
  }
  return sum / static_cast<double>(values.size());
}

// Population variance.
inline double variance(const std::vector<double>& values) noexcept {
  if (values.size() < 2) {
    return 0.0;
  }
  const double avg = mean(values);
  double sum = 0.0;
  for (const double value : values) {
    sum += (value - avg) * (value - avg);
  }
  return sum / static_cast<double>(values.size());
}

// Least-squares slope of values against their index.
inline double index_slope(const std::vector<double>& values) noexcept {
  const std::size_t n = values.size();
  if (n < 2) {
    return 0.0;
  }
  const double x_mean = static_cast<double>(n - 1) / 2.0;
  const double y_mean = mean(values);
  double numerator = 0.0;
  double denominator = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const double dx = static_cast<double>(i) - x_mean;
    numerator += dx * (values[i] - y_mean);
    denominator += dx * dx;
  }
  return denominator > 0.0 ? numerator / denominator : 0.0;
}

}  // namespace heat_agent::core
