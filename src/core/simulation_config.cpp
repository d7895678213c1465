#include "simulation_config.hpp"
#include "rf_units.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace emf_mapper
{

auto derive_physical_constants(const physical_config_t &config) -> physical_constants_t
{
  physical_constants_t constants;
  constants.path_loss_constant = rf_units::path_loss_constant(config.carrier_frequency_hz, config.speed_of_light_mps);
  constants.transmit_power_w = rf_units::dbm_to_watts(config.transmit_power_dbm);
  constants.noise_floor_w = rf_units::dbm_to_watts(config.noise_floor_dbm);
  constants.path_loss_exponent = config.path_loss_exponent;
  constants.base_station_height_m = config.base_station_height_m;
  constants.coverage_threshold = config.coverage_threshold;
  return constants;
}

static auto require_finite(double value, const char *name) -> void
{
  if (!std::isfinite(value))
  {
    throw configuration_error_t(std::string(name) + " must be finite");
  }
}

auto validate_config(const simulation_config_t &config) -> void
{
  const auto &phy = config.physical;
  const auto &topo = config.topology;
  const auto &sweep = config.sweep;

  require_finite(phy.carrier_frequency_hz, "carrier_frequency_hz");
  require_finite(phy.speed_of_light_mps, "speed_of_light_mps");
  require_finite(phy.transmit_power_dbm, "transmit_power_dbm");
  require_finite(phy.path_loss_exponent, "path_loss_exponent");
  require_finite(phy.base_station_height_m, "base_station_height_m");
  require_finite(phy.noise_floor_dbm, "noise_floor_dbm");
  require_finite(phy.coverage_threshold, "coverage_threshold");
  require_finite(topo.simulation_radius_m, "simulation_radius_m");
  require_finite(topo.cluster_spread_m, "cluster_spread_m");
  require_finite(sweep.distance_min_m, "distance_min_m");
  require_finite(sweep.distance_max_m, "distance_max_m");

  if (phy.carrier_frequency_hz <= 0.0)
    throw configuration_error_t("carrier_frequency_hz must be positive");
  if (phy.speed_of_light_mps <= 0.0)
    throw configuration_error_t("speed_of_light_mps must be positive");
  if (phy.path_loss_exponent <= 0.0)
    throw configuration_error_t("path_loss_exponent must be positive");
  if (phy.base_station_height_m < 0.0)
    throw configuration_error_t("base_station_height_m must not be negative");
  if (topo.cluster_spread_m < 0.0)
    throw configuration_error_t("cluster_spread_m must not be negative");

  if (topo.num_base_stations <= 0)
    throw configuration_error_t("num_base_stations must be positive");
  if (sweep.num_mc_iterations <= 0)
    throw configuration_error_t("num_mc_iterations must be positive");
  if (sweep.distance_count <= 0)
    throw configuration_error_t("distance_count must be positive");
  if (sweep.distance_max_m < sweep.distance_min_m)
    throw configuration_error_t("distance_max_m must not be less than distance_min_m");
  if (sweep.worker_threads < 0)
    throw configuration_error_t("worker_threads must not be negative");
}

auto describe_config(const simulation_config_t &config) -> std::string
{
  auto constants = derive_physical_constants(config.physical);

  std::ostringstream ss;
  ss << "Physics Config: F=" << config.physical.carrier_frequency_hz / 1e9 << "GHz"
     << ", Pt=" << std::fixed << std::setprecision(0) << constants.transmit_power_w << "W"
     << ", Noise=" << std::setprecision(2) << config.physical.noise_floor_dbm << "dBm"
     << ", alpha=" << config.physical.path_loss_exponent
     << ", h=" << config.physical.base_station_height_m << "m"
     << " | Topology: N=" << config.topology.num_base_stations
     << ", spread=" << std::setprecision(0) << config.topology.cluster_spread_m << "m"
     << " | Sweep: K=" << config.sweep.num_mc_iterations
     << ", " << config.sweep.distance_min_m << "-" << config.sweep.distance_max_m << "m x" << config.sweep.distance_count;
  return ss.str();
}

} // namespace emf_mapper
