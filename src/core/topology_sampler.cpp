#include "topology_sampler.hpp"
#include "simulation_config.hpp"

namespace emf_mapper
{

topology_sampler_t::topology_sampler_t(double cluster_spread_m) : m_cluster_spread_m(cluster_spread_m)
{
  std::random_device rd;
  m_gen.seed((static_cast<uint64_t>(rd()) << 32) | rd());
}

topology_sampler_t::topology_sampler_t(double cluster_spread_m, uint64_t seed) : m_cluster_spread_m(cluster_spread_m), m_gen(seed)
{
}

topology_sampler_t::topology_sampler_t(double cluster_spread_m, std::seed_seq &seed_sequence) : m_cluster_spread_m(cluster_spread_m), m_gen(seed_sequence)
{
}

auto topology_sampler_t::sample(int num_base_stations) -> base_station_topology_t
{
  base_station_topology_t topology;
  sample_into(num_base_stations, topology);
  return topology;
}

auto topology_sampler_t::sample_into(int num_base_stations, base_station_topology_t &topology) -> void
{
  if (num_base_stations <= 0)
  {
    throw configuration_error_t("num_base_stations must be positive");
  }

  topology.stations.assign(static_cast<size_t>(num_base_stations), station_position_t{});

  // A zero spread collapses every station onto the origin
  if (m_cluster_spread_m <= 0.0)
    return;

  std::normal_distribution<double> dist(0.0, m_cluster_spread_m);

  // All X coordinates first, then all Y coordinates
  for (auto &station : topology.stations)
  {
    station.x_m = dist(m_gen);
  }
  for (auto &station : topology.stations)
  {
    station.y_m = dist(m_gen);
  }
}

} // namespace emf_mapper
