#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>

#include "core/link_metrics.hpp"
#include "core/persistence.hpp"
#include "core/rf_units.hpp"
#include "core/simulation_config.hpp"
#include "core/simulation_engine.hpp"
#include "core/topology_sampler.hpp"

namespace
{

struct cli_options_t
{
  std::string config_file;
  std::string save_config_file;
  std::string output_file;
  bool has_seed = false;
  uint64_t seed = 0;
  int iterations = 0;
  int threads = -1;
  bool probe = false;
  double probe_x_m = 0.0;
  double probe_y_m = 0.0;
};

void print_usage(const char *argv0)
{
  std::cerr << "Usage: " << argv0 << " [--config FILE] [--save-config FILE] [--output FILE.json|FILE.csv]\n"
            << "       [--seed N] [--iterations K] [--threads T] [--probe X Y]" << std::endl;
}

bool ends_with(const std::string &s, const std::string &suffix)
{
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool parse_args(int argc, char **argv, cli_options_t &opts)
{
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    auto need = [&](int n) { return i + n < argc; };

    try
    {
      if (arg == "--config" && need(1))
        opts.config_file = argv[++i];
      else if (arg == "--save-config" && need(1))
        opts.save_config_file = argv[++i];
      else if (arg == "--output" && need(1))
        opts.output_file = argv[++i];
      else if (arg == "--seed" && need(1))
      {
        opts.seed = std::stoull(argv[++i]);
        opts.has_seed = true;
      }
      else if (arg == "--iterations" && need(1))
        opts.iterations = std::stoi(argv[++i]);
      else if (arg == "--threads" && need(1))
        opts.threads = std::stoi(argv[++i]);
      else if (arg == "--probe" && need(2))
      {
        opts.probe_x_m = std::stod(argv[++i]);
        opts.probe_y_m = std::stod(argv[++i]);
        opts.probe = true;
      }
      else
        return false;
    }
    catch (const std::exception &e)
    {
      std::cerr << "Invalid value for " << arg << ": " << e.what() << std::endl;
      return false;
    }
  }
  return true;
}

void print_sweep(const emf_mapper::sweep_result_t &result)
{
  std::cout << std::setw(12) << "distance_m" << std::setw(16) << "mean_flux_W/m2" << std::setw(14) << "std_error" << std::setw(12) << "coverage" << std::setw(10) << "excluded" << "\n";
  for (size_t i = 0; i < result.size(); ++i)
  {
    std::cout << std::fixed << std::setprecision(1) << std::setw(12) << result.distances_m[i] << std::scientific << std::setprecision(4) << std::setw(16) << result.mean_flux_w_m2[i] << std::setw(14) << result.flux_std_error[i]
              << std::fixed << std::setprecision(3) << std::setw(12) << result.coverage_probability[i] << std::setw(10) << result.anomalous_trials[i] << "\n";
  }
  std::cout.unsetf(std::ios_base::floatfield);
  std::cout << std::flush;
}

void run_probe(const emf_mapper::simulation_config_t &config, uint64_t seed, double x_m, double y_m)
{
  using namespace emf_mapper;

  auto constants = derive_physical_constants(config.physical);
  topology_sampler_t sampler(config.topology.cluster_spread_m, seed);
  auto topology = sampler.sample(config.topology.num_base_stations);
  auto probe = simulation_engine_t::probe_point(topology, x_m, y_m, constants);

  const auto &serving = topology.stations[static_cast<size_t>(probe.serving_index)];
  std::cout << "Probe at (" << x_m << ", " << y_m << ") m, topology seed " << seed << "\n"
            << "  Serving station: #" << probe.serving_index << " at (" << serving.x_m << ", " << serving.y_m << ") m, " << std::setprecision(4) << probe.station_power_dbm[static_cast<size_t>(probe.serving_index)] << " dBm\n"
            << "  Total received: " << rf_units::watts_to_dbm(probe.total_power_w) << " dBm\n"
            << "  SINR: " << probe.sinr_db << " dB (" << (probe.covered ? "covered" : "not covered") << ")\n"
            << "  EMF flux density: " << std::scientific << probe.flux_density_w_m2 << " W/m^2 (" << link_metrics::exposure_level_name(probe.exposure) << ")" << std::endl;
  std::cout.unsetf(std::ios_base::floatfield);
}

} // namespace

int main(int argc, char **argv)
{
  using namespace emf_mapper;

  cli_options_t opts;
  if (!parse_args(argc, argv, opts))
  {
    print_usage(argv[0]);
    return 2;
  }

  simulation_config_t config;
  if (!opts.config_file.empty() && !persistence::load_config(opts.config_file, config))
  {
    return 1;
  }

  if (opts.has_seed)
    config.sweep.seed = opts.seed;
  if (opts.iterations != 0)
    config.sweep.num_mc_iterations = opts.iterations;
  if (opts.threads >= 0)
    config.sweep.worker_threads = opts.threads;

  if (!opts.save_config_file.empty() && !persistence::save_config(opts.save_config_file, config))
  {
    return 1;
  }

  std::cout << describe_config(config) << std::endl;

  simulation_engine_t engine;
  sweep_result_t result;
  try
  {
    result = engine.run_distance_sweep(config);
  }
  catch (const configuration_error_t &e)
  {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    return 1;
  }

  std::cout << "Seed: " << result.seed << std::endl;
  print_sweep(result);

  if (opts.probe)
  {
    run_probe(config, result.seed, opts.probe_x_m, opts.probe_y_m);
  }

  if (!opts.output_file.empty())
  {
    bool ok = ends_with(opts.output_file, ".csv") ? persistence::save_results_csv(opts.output_file, result) : persistence::save_results_json(opts.output_file, config, result);
    if (!ok)
      return 1;
    std::cout << "Results written to " << opts.output_file << std::endl;
  }

  return 0;
}
