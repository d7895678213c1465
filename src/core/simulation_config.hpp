#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace emf_mapper
{

// Raised before any simulation work when the configuration cannot produce a valid sweep
class configuration_error_t : public std::runtime_error
{
public:
  explicit configuration_error_t(const std::string &what) : std::runtime_error(what)
  {
  }
};

// Defaults reproduce the Brussels reference scenario (Table III)
struct physical_config_t
{
  double carrier_frequency_hz = 1837.5e6;
  double speed_of_light_mps = 3e8;
  double transmit_power_dbm = 62.75; // Pt * Gmax
  double path_loss_exponent = 3.2;   // alpha
  double base_station_height_m = 33.0;
  double noise_floor_dbm = -96.21;
  double coverage_threshold = 0.5; // Linear SINR, approx 0 dB
};

struct topology_config_t
{
  int num_base_stations = 80;
  double simulation_radius_m = 7000.0; // Advisory only, stations are never clipped
  double cluster_spread_m = 1200.0;    // Std deviation of the Gaussian cluster
};

struct sweep_config_t
{
  int num_mc_iterations = 200;
  double distance_min_m = 0.0;
  double distance_max_m = 4000.0;
  int distance_count = 50;
  uint64_t seed = 0;       // 0 = draw from std::random_device
  int worker_threads = 0;  // 0 = hardware concurrency
};

struct simulation_config_t
{
  physical_config_t physical;
  topology_config_t topology;
  sweep_config_t sweep;
};

// Quantities derived from physical_config_t. Only derive_physical_constants() produces them.
struct physical_constants_t
{
  double path_loss_constant = 0.0; // kappa = (4 pi f / c)^2
  double transmit_power_w = 0.0;
  double noise_floor_w = 0.0;
  double path_loss_exponent = 0.0;
  double base_station_height_m = 0.0;
  double coverage_threshold = 0.0;
};

auto derive_physical_constants(const physical_config_t &config) -> physical_constants_t;

// Throws configuration_error_t describing the first violated constraint
auto validate_config(const simulation_config_t &config) -> void;

// Human readable one-line summary, e.g. for the startup log
auto describe_config(const simulation_config_t &config) -> std::string;

} // namespace emf_mapper
