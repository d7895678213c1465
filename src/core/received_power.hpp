#pragma once

#include "path_loss.hpp"
#include "topology_sampler.hpp"
#include <vector>

namespace emf_mapper
{

struct received_power_t
{
  double total_w = 0.0;     // Sum over all stations
  double strongest_w = 0.0; // Serving signal
  int serving_index = -1;   // Station providing strongest_w
};

// Pr_i = Pt * l(|user - station_i|), unit antenna gains.
// Throws configuration_error_t on an empty topology.
auto aggregate_received_power(const base_station_topology_t &topology, double user_x_m, double user_y_m, double transmit_power_w, const path_loss_model_t &path_loss) -> received_power_t;

// Same as above, also filling per_station_w with each station's contribution
auto aggregate_received_power(const base_station_topology_t &topology, double user_x_m, double user_y_m, double transmit_power_w, const path_loss_model_t &path_loss, std::vector<double> &per_station_w) -> received_power_t;

} // namespace emf_mapper
