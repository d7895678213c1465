#pragma once

#include "simulation_config.hpp"
#include <vector>

namespace emf_mapper
{

// Single-slope path loss with a fixed antenna height offset:
//   l(r) = kappa^-1 * (r^2 + h^2)^(-alpha/2)
// r is the horizontal distance in meters and must be finite and >= 0.
class path_loss_model_t
{
public:
  path_loss_model_t(double path_loss_constant, double path_loss_exponent, double base_station_height_m);
  explicit path_loss_model_t(const physical_constants_t &constants);

  auto attenuation_factor(double distance_2d_m) const -> double;
  auto attenuation_factors(const std::vector<double> &distances_2d_m) const -> std::vector<double>;

  // l(0) = kappa^-1 * h^-alpha, the upper bound of attenuation_factor()
  auto max_attenuation_factor() const -> double;

  auto get_path_loss_constant() const -> double
  {
    return m_kappa;
  }
  auto get_path_loss_exponent() const -> double
  {
    return m_alpha;
  }
  auto get_base_station_height() const -> double
  {
    return m_height_m;
  }

private:
  double m_kappa;
  double m_alpha;
  double m_height_m;
};

} // namespace emf_mapper
