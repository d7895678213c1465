#include "received_power.hpp"
#include "simulation_config.hpp"
#include <cmath>

namespace emf_mapper
{

static auto station_power(const station_position_t &station, double user_x_m, double user_y_m, double transmit_power_w, const path_loss_model_t &path_loss) -> double
{
  double dx = station.x_m - user_x_m;
  double dy = station.y_m - user_y_m;
  double distance_2d = std::sqrt(dx * dx + dy * dy);
  return transmit_power_w * path_loss.attenuation_factor(distance_2d);
}

auto aggregate_received_power(const base_station_topology_t &topology, double user_x_m, double user_y_m, double transmit_power_w, const path_loss_model_t &path_loss) -> received_power_t
{
  if (topology.stations.empty())
  {
    throw configuration_error_t("cannot aggregate received power over an empty topology");
  }

  received_power_t res;
  for (size_t i = 0; i < topology.stations.size(); ++i)
  {
    double pr = station_power(topology.stations[i], user_x_m, user_y_m, transmit_power_w, path_loss);
    res.total_w += pr;

    if (res.serving_index < 0 || pr > res.strongest_w)
    {
      res.strongest_w = pr;
      res.serving_index = static_cast<int>(i);
    }
  }
  return res;
}

auto aggregate_received_power(const base_station_topology_t &topology, double user_x_m, double user_y_m, double transmit_power_w, const path_loss_model_t &path_loss, std::vector<double> &per_station_w) -> received_power_t
{
  if (topology.stations.empty())
  {
    throw configuration_error_t("cannot aggregate received power over an empty topology");
  }

  per_station_w.resize(topology.stations.size());

  received_power_t res;
  for (size_t i = 0; i < topology.stations.size(); ++i)
  {
    double pr = station_power(topology.stations[i], user_x_m, user_y_m, transmit_power_w, path_loss);
    per_station_w[i] = pr;
    res.total_w += pr;

    if (res.serving_index < 0 || pr > res.strongest_w)
    {
      res.strongest_w = pr;
      res.serving_index = static_cast<int>(i);
    }
  }
  return res;
}

} // namespace emf_mapper
