#include "core/persistence.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>

using json = nlohmann::json;

namespace emf_mapper
{
namespace persistence
{

auto config_to_json(const simulation_config_t &config) -> json
{
  const auto &phy = config.physical;
  const auto &topo = config.topology;
  const auto &sweep = config.sweep;

  json j;
  j["physical"] = {{"carrier_frequency_hz", phy.carrier_frequency_hz},
                   {"speed_of_light_mps", phy.speed_of_light_mps},
                   {"transmit_power_dbm", phy.transmit_power_dbm},
                   {"path_loss_exponent", phy.path_loss_exponent},
                   {"base_station_height_m", phy.base_station_height_m},
                   {"noise_floor_dbm", phy.noise_floor_dbm},
                   {"coverage_threshold", phy.coverage_threshold}};

  j["topology"] = {{"num_base_stations", topo.num_base_stations}, {"simulation_radius_m", topo.simulation_radius_m}, {"cluster_spread_m", topo.cluster_spread_m}};

  j["sweep"] = {{"num_mc_iterations", sweep.num_mc_iterations},
                {"distance_min_m", sweep.distance_min_m},
                {"distance_max_m", sweep.distance_max_m},
                {"distance_count", sweep.distance_count},
                {"seed", sweep.seed},
                {"worker_threads", sweep.worker_threads}};
  return j;
}

auto config_from_json(const json &j, simulation_config_t &config) -> void
{
  if (j.contains("physical"))
  {
    const auto &p = j["physical"];
    auto &phy = config.physical;
    phy.carrier_frequency_hz = p.value("carrier_frequency_hz", phy.carrier_frequency_hz);
    phy.speed_of_light_mps = p.value("speed_of_light_mps", phy.speed_of_light_mps);
    phy.transmit_power_dbm = p.value("transmit_power_dbm", phy.transmit_power_dbm);
    phy.path_loss_exponent = p.value("path_loss_exponent", phy.path_loss_exponent);
    phy.base_station_height_m = p.value("base_station_height_m", phy.base_station_height_m);
    phy.noise_floor_dbm = p.value("noise_floor_dbm", phy.noise_floor_dbm);
    phy.coverage_threshold = p.value("coverage_threshold", phy.coverage_threshold);
  }

  if (j.contains("topology"))
  {
    const auto &t = j["topology"];
    auto &topo = config.topology;
    topo.num_base_stations = t.value("num_base_stations", topo.num_base_stations);
    topo.simulation_radius_m = t.value("simulation_radius_m", topo.simulation_radius_m);
    topo.cluster_spread_m = t.value("cluster_spread_m", topo.cluster_spread_m);
  }

  if (j.contains("sweep"))
  {
    const auto &s = j["sweep"];
    auto &sweep = config.sweep;
    sweep.num_mc_iterations = s.value("num_mc_iterations", sweep.num_mc_iterations);
    sweep.distance_min_m = s.value("distance_min_m", sweep.distance_min_m);
    sweep.distance_max_m = s.value("distance_max_m", sweep.distance_max_m);
    sweep.distance_count = s.value("distance_count", sweep.distance_count);
    sweep.seed = s.value("seed", sweep.seed);
    sweep.worker_threads = s.value("worker_threads", sweep.worker_threads);
  }
}

auto save_config(const std::string &filename, const simulation_config_t &config) -> bool
{
  std::ofstream file(filename);
  if (!file.is_open())
  {
    std::cerr << "Failed to open config file for writing: " << filename << std::endl;
    return false;
  }

  file << config_to_json(config).dump(4);
  return true;
}

auto load_config(const std::string &filename, simulation_config_t &config) -> bool
{
  std::ifstream file(filename);
  if (!file.is_open())
  {
    std::cerr << "Failed to open config file: " << filename << std::endl;
    return false;
  }

  json j;
  try
  {
    file >> j;
  }
  catch (const json::parse_error &e)
  {
    std::cerr << "JSON Parse Error: " << e.what() << std::endl;
    return false;
  }

  // Parse into a copy so a malformed field leaves the caller's config untouched
  simulation_config_t loaded = config;
  try
  {
    config_from_json(j, loaded);
  }
  catch (const json::exception &e)
  {
    std::cerr << "Invalid config field in " << filename << ": " << e.what() << std::endl;
    return false;
  }

  config = loaded;
  return true;
}

auto save_results_json(const std::string &filename, const simulation_config_t &config, const sweep_result_t &result) -> bool
{
  json j;
  j["config"] = config_to_json(config);
  j["config"]["sweep"]["seed"] = result.seed;
  j["cancelled"] = result.cancelled;
  j["distances_m"] = result.distances_m;
  j["mean_flux_w_m2"] = result.mean_flux_w_m2;
  j["flux_std_error"] = result.flux_std_error;
  j["coverage_probability"] = result.coverage_probability;
  j["valid_trials"] = result.valid_trials;
  j["anomalous_trials"] = result.anomalous_trials;

  std::ofstream file(filename);
  if (!file.is_open())
  {
    std::cerr << "Failed to open results file for writing: " << filename << std::endl;
    return false;
  }

  file << j.dump(4);
  return true;
}

auto save_results_csv(const std::string &filename, const sweep_result_t &result) -> bool
{
  std::ofstream file(filename);
  if (!file.is_open())
  {
    std::cerr << "Failed to open results file for writing: " << filename << std::endl;
    return false;
  }

  file << "distance_m,mean_flux_w_m2,flux_std_error,coverage_probability,valid_trials,anomalous_trials\n";
  file << std::setprecision(std::numeric_limits<double>::max_digits10);
  for (size_t i = 0; i < result.size(); ++i)
  {
    file << result.distances_m[i] << ',' << result.mean_flux_w_m2[i] << ',' << result.flux_std_error[i] << ',' << result.coverage_probability[i] << ',' << result.valid_trials[i] << ',' << result.anomalous_trials[i] << '\n';
  }
  return static_cast<bool>(file);
}

} // namespace persistence
} // namespace emf_mapper
