#pragma once

#include "link_metrics.hpp"
#include "path_loss.hpp"
#include "received_power.hpp"
#include "simulation_config.hpp"
#include "topology_sampler.hpp"
#include <atomic>
#include <cstdint>
#include <vector>

namespace emf_mapper
{

// Monte Carlo statistics at one user distance
struct distance_sample_t
{
  double distance_m = 0.0;
  double mean_flux_w_m2 = 0.0;
  double flux_std_error = 0.0; // Standard error of mean_flux_w_m2
  double coverage_probability = 0.0;
  int valid_trials = 0;
  int anomalous_trials = 0; // Excluded for non-finite SINR or flux
};

// Index-aligned, ascending in distance
struct sweep_result_t
{
  std::vector<double> distances_m;
  std::vector<double> mean_flux_w_m2;
  std::vector<double> flux_std_error;
  std::vector<double> coverage_probability;
  std::vector<int> valid_trials;
  std::vector<int> anomalous_trials;

  uint64_t seed = 0; // Seed actually used, re-run with it to reproduce
  bool cancelled = false;

  auto size() const -> size_t
  {
    return distances_m.size();
  }
};

struct probe_result_t
{
  std::vector<double> station_power_w;
  std::vector<double> station_power_dbm;
  int serving_index = -1;
  double total_power_w = 0.0;
  double strongest_power_w = 0.0;
  double sinr = 0.0;
  double sinr_db = 0.0;
  double flux_density_w_m2 = 0.0;
  ExposureLevel exposure = ExposureLevel::Low;
  bool covered = false;
};

// count evenly spaced samples over [min, max]; a single sample yields min
auto make_distance_samples(double min_m, double max_m, int count) -> std::vector<double>;

class simulation_engine_t
{
public:
  simulation_engine_t() = default;
  ~simulation_engine_t() = default;

  simulation_engine_t(const simulation_engine_t &) = delete;
  simulation_engine_t &operator=(const simulation_engine_t &) = delete;

  // Outer sweep over user distances, inner Monte Carlo loop over random topologies.
  // Throws configuration_error_t before any work if the config is invalid.
  // A cancelled sweep returns cancelled = true and no samples.
  auto run_distance_sweep(const simulation_config_t &config) -> sweep_result_t;

  // Runs the Monte Carlo trials for the user at (distance_m, 0) with the given generator seed
  static auto simulate_distance(const simulation_config_t &config, double distance_m, std::seed_seq &seed_sequence, const std::atomic<bool> *cancel_flag = nullptr) -> distance_sample_t;

  // Evaluates one fixed topology at an arbitrary user position
  static auto probe_point(const base_station_topology_t &topology, double user_x_m, double user_y_m, const physical_constants_t &constants) -> probe_result_t;

  // Safe to call from another thread while a sweep is running
  void cancel();

  bool is_running() const
  {
    return m_running;
  }

  // Completed distances / total distances of the current or last sweep
  float get_progress() const
  {
    return m_progress;
  }

private:
  std::atomic<bool> m_running{false};
  std::atomic<bool> m_cancel{false};
  std::atomic<float> m_progress{0.0f};
};

} // namespace emf_mapper
