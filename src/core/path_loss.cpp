#include "path_loss.hpp"
#include <algorithm>
#include <cmath>

namespace emf_mapper
{

path_loss_model_t::path_loss_model_t(double path_loss_constant, double path_loss_exponent, double base_station_height_m)
    : m_kappa(path_loss_constant), m_alpha(path_loss_exponent), m_height_m(base_station_height_m)
{
}

path_loss_model_t::path_loss_model_t(const physical_constants_t &constants)
    : path_loss_model_t(constants.path_loss_constant, constants.path_loss_exponent, constants.base_station_height_m)
{
}

auto path_loss_model_t::attenuation_factor(double distance_2d_m) const -> double
{
  double distance_3d_squared = distance_2d_m * distance_2d_m + m_height_m * m_height_m;
  return (1.0 / m_kappa) * std::pow(distance_3d_squared, -m_alpha / 2.0);
}

auto path_loss_model_t::attenuation_factors(const std::vector<double> &distances_2d_m) const -> std::vector<double>
{
  std::vector<double> factors(distances_2d_m.size());
  std::transform(distances_2d_m.begin(), distances_2d_m.end(), factors.begin(), [this](double r) { return attenuation_factor(r); });
  return factors;
}

auto path_loss_model_t::max_attenuation_factor() const -> double
{
  return (1.0 / m_kappa) * std::pow(m_height_m, -m_alpha);
}

} // namespace emf_mapper
