#include "simulation_engine.hpp"
#include "rf_units.hpp"
#include <algorithm>
#include <cmath>
#include <future>
#include <iostream>
#include <mutex>
#include <random>
#include <thread>

namespace emf_mapper
{

static std::mutex s_log_mutex;

auto make_distance_samples(double min_m, double max_m, int count) -> std::vector<double>
{
  std::vector<double> samples;
  if (count <= 0)
    return samples;

  samples.reserve(static_cast<size_t>(count));
  if (count == 1)
  {
    samples.push_back(min_m);
    return samples;
  }

  double step = (max_m - min_m) / static_cast<double>(count - 1);
  for (int i = 0; i < count - 1; ++i)
  {
    samples.push_back(min_m + step * i);
  }
  // Hit the end point exactly
  samples.push_back(max_m);
  return samples;
}

auto simulation_engine_t::simulate_distance(const simulation_config_t &config, double distance_m, std::seed_seq &seed_sequence, const std::atomic<bool> *cancel_flag) -> distance_sample_t
{
  auto constants = derive_physical_constants(config.physical);
  path_loss_model_t path_loss(constants);
  topology_sampler_t sampler(config.topology.cluster_spread_m, seed_sequence);

  distance_sample_t sample;
  sample.distance_m = distance_m;

  base_station_topology_t topology;
  double flux_sum = 0.0;
  // Welford accumulators for the flux variance
  double flux_mean = 0.0;
  double flux_m2 = 0.0;
  int covered = 0;

  for (int k = 0; k < config.sweep.num_mc_iterations; ++k)
  {
    if (cancel_flag && *cancel_flag)
      break;

    sampler.sample_into(config.topology.num_base_stations, topology);

    // User sits on the X axis
    auto power = aggregate_received_power(topology, distance_m, 0.0, constants.transmit_power_w, path_loss);
    auto trial = link_metrics::evaluate_trial(power, constants);

    if (!trial.finite)
    {
      sample.anomalous_trials++;
      continue;
    }

    sample.valid_trials++;
    if (trial.covered)
      covered++;

    flux_sum += trial.flux_density_w_m2;
    double delta = trial.flux_density_w_m2 - flux_mean;
    flux_mean += delta / sample.valid_trials;
    flux_m2 += delta * (trial.flux_density_w_m2 - flux_mean);
  }

  if (sample.valid_trials > 0)
  {
    sample.mean_flux_w_m2 = flux_sum / sample.valid_trials;
    sample.coverage_probability = static_cast<double>(covered) / sample.valid_trials;
  }
  if (sample.valid_trials > 1)
  {
    double variance = flux_m2 / (sample.valid_trials - 1);
    sample.flux_std_error = std::sqrt(variance / sample.valid_trials);
  }

  if (sample.anomalous_trials > 0)
  {
    std::lock_guard<std::mutex> lock(s_log_mutex);
    std::cerr << "Numeric anomaly at " << distance_m << " m: excluded " << sample.anomalous_trials << " of " << (sample.valid_trials + sample.anomalous_trials) << " trials (non-finite SINR or flux)" << std::endl;
  }

  return sample;
}

auto simulation_engine_t::run_distance_sweep(const simulation_config_t &config) -> sweep_result_t
{
  validate_config(config);

  m_cancel = false;
  m_progress = 0.0f;
  m_running = true;

  sweep_result_t result;
  result.seed = config.sweep.seed;
  if (result.seed == 0)
  {
    std::random_device rd;
    result.seed = (static_cast<uint64_t>(rd()) << 32) | rd();
  }

  auto distances = make_distance_samples(config.sweep.distance_min_m, config.sweep.distance_max_m, config.sweep.distance_count);
  std::vector<distance_sample_t> samples(distances.size());

  int worker_count = config.sweep.worker_threads;
  if (worker_count == 0)
    worker_count = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
  worker_count = std::min(worker_count, static_cast<int>(distances.size()));

  std::atomic<size_t> next_index{0};
  std::atomic<size_t> completed{0};
  uint32_t seed_lo = static_cast<uint32_t>(result.seed & 0xffffffffu);
  uint32_t seed_hi = static_cast<uint32_t>(result.seed >> 32);

  // Each distance owns a generator derived from (seed, index), so results do not depend on the worker count
  auto worker = [&]()
  {
    while (!m_cancel)
    {
      size_t i = next_index.fetch_add(1);
      if (i >= distances.size())
        break;

      std::seed_seq seed_sequence{seed_lo, seed_hi, static_cast<uint32_t>(i)};
      samples[i] = simulate_distance(config, distances[i], seed_sequence, &m_cancel);

      size_t done = completed.fetch_add(1) + 1;
      m_progress = static_cast<float>(done) / static_cast<float>(distances.size());
    }
  };

  std::vector<std::future<void>> futures;
  futures.reserve(static_cast<size_t>(worker_count));
  for (int t = 0; t < worker_count; ++t)
  {
    futures.push_back(std::async(std::launch::async, worker));
  }

  try
  {
    for (auto &f : futures)
    {
      f.get();
    }
  }
  catch (...)
  {
    // Stop the remaining workers before the shared state goes out of scope
    m_cancel = true;
    for (auto &f : futures)
    {
      if (f.valid())
        f.wait();
    }
    m_running = false;
    throw;
  }

  m_running = false;

  if (m_cancel)
  {
    result.cancelled = true;
    return result;
  }

  result.distances_m = std::move(distances);
  for (const auto &s : samples)
  {
    result.mean_flux_w_m2.push_back(s.mean_flux_w_m2);
    result.flux_std_error.push_back(s.flux_std_error);
    result.coverage_probability.push_back(s.coverage_probability);
    result.valid_trials.push_back(s.valid_trials);
    result.anomalous_trials.push_back(s.anomalous_trials);
  }
  return result;
}

auto simulation_engine_t::probe_point(const base_station_topology_t &topology, double user_x_m, double user_y_m, const physical_constants_t &constants) -> probe_result_t
{
  path_loss_model_t path_loss(constants);

  probe_result_t probe;
  auto power = aggregate_received_power(topology, user_x_m, user_y_m, constants.transmit_power_w, path_loss, probe.station_power_w);
  auto trial = link_metrics::evaluate_trial(power, constants);

  probe.station_power_dbm.reserve(probe.station_power_w.size());
  for (double pr : probe.station_power_w)
  {
    probe.station_power_dbm.push_back(rf_units::watts_to_dbm(pr));
  }

  probe.serving_index = power.serving_index;
  probe.total_power_w = trial.total_power_w;
  probe.strongest_power_w = trial.strongest_power_w;
  probe.sinr = trial.sinr;
  probe.sinr_db = rf_units::linear_to_db(trial.sinr);
  probe.flux_density_w_m2 = trial.flux_density_w_m2;
  probe.exposure = link_metrics::classify_exposure(trial.flux_density_w_m2);
  probe.covered = trial.covered;
  return probe;
}

void simulation_engine_t::cancel()
{
  m_cancel = true;
}

} // namespace emf_mapper
