#pragma once

#include <cstdint>
#include <random>
#include <vector>

namespace emf_mapper
{

struct station_position_t
{
  double x_m = 0.0;
  double y_m = 0.0;
};

struct base_station_topology_t
{
  std::vector<station_position_t> stations;
};

// Draws base station positions from an isotropic zero-mean Gaussian cluster.
// X and Y are sampled independently. Positions are never clipped to a radius.
class topology_sampler_t
{
public:
  // Seeded from std::random_device
  explicit topology_sampler_t(double cluster_spread_m);
  topology_sampler_t(double cluster_spread_m, uint64_t seed);
  topology_sampler_t(double cluster_spread_m, std::seed_seq &seed_sequence);

  auto sample(int num_base_stations) -> base_station_topology_t;

  // Refills an existing topology, reusing its storage
  auto sample_into(int num_base_stations, base_station_topology_t &topology) -> void;

  auto get_cluster_spread() const -> double
  {
    return m_cluster_spread_m;
  }

private:
  double m_cluster_spread_m;
  std::mt19937_64 m_gen;
};

} // namespace emf_mapper
