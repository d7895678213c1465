#include "link_metrics.hpp"
#include "rf_units.hpp"
#include <cmath>

namespace emf_mapper
{
namespace link_metrics
{

auto calculate_sinr(const received_power_t &power, double noise_floor_w) -> double
{
  double interference_w = power.total_w - power.strongest_w;
  return power.strongest_w / (interference_w + noise_floor_w);
}

auto is_covered(double sinr, double threshold) -> bool
{
  return sinr > threshold;
}

auto calculate_flux_density(double total_power_w, double path_loss_constant) -> double
{
  return (path_loss_constant / (4.0 * rf_units::PI)) * total_power_w;
}

auto classify_exposure(double flux_density_w_m2) -> ExposureLevel
{
  if (flux_density_w_m2 > EXPOSURE_HIGH_W_M2)
    return ExposureLevel::High;
  if (flux_density_w_m2 > EXPOSURE_ELEVATED_W_M2)
    return ExposureLevel::Elevated;
  return ExposureLevel::Low;
}

auto exposure_level_name(ExposureLevel level) -> std::string
{
  switch (level)
  {
  case ExposureLevel::Low:
    return "low";
  case ExposureLevel::Elevated:
    return "elevated";
  case ExposureLevel::High:
    return "high";
  default:
    return "unknown";
  }
}

auto evaluate_trial(const received_power_t &power, const physical_constants_t &constants) -> trial_result_t
{
  trial_result_t trial;
  trial.total_power_w = power.total_w;
  trial.strongest_power_w = power.strongest_w;
  trial.sinr = calculate_sinr(power, constants.noise_floor_w);
  trial.flux_density_w_m2 = calculate_flux_density(power.total_w, constants.path_loss_constant);
  trial.finite = std::isfinite(trial.sinr) && std::isfinite(trial.flux_density_w_m2);
  trial.covered = trial.finite && is_covered(trial.sinr, constants.coverage_threshold);
  return trial;
}

} // namespace link_metrics
} // namespace emf_mapper
