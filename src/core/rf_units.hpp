#pragma once

#include <cmath>

namespace emf_mapper
{
namespace rf_units
{
constexpr double PI = 3.14159265358979323846;

// P(W) = 10^((P(dBm) - 30) / 10)
inline auto dbm_to_watts(double power_dbm) -> double
{
  return std::pow(10.0, (power_dbm - 30.0) / 10.0);
}

// P(dBm) = 10log10(P(W)) + 30
inline auto watts_to_dbm(double power_w) -> double
{
  return 10.0 * std::log10(power_w) + 30.0;
}

inline auto linear_to_db(double ratio) -> double
{
  return 10.0 * std::log10(ratio);
}

inline auto db_to_linear(double ratio_db) -> double
{
  return std::pow(10.0, ratio_db / 10.0);
}

// kappa = (4 * pi * f / c)^2
inline auto path_loss_constant(double frequency_hz, double speed_of_light_mps) -> double
{
  double k = 4.0 * PI * frequency_hz / speed_of_light_mps;
  return k * k;
}

} // namespace rf_units
} // namespace emf_mapper
