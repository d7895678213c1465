#include "../core/link_metrics.hpp"
#include "../core/path_loss.hpp"
#include "../core/received_power.hpp"
#include "../core/rf_units.hpp"
#include "../core/simulation_engine.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using namespace emf_mapper;

static bool near(double a, double b, double rel_tol)
{
  return std::abs(a - b) <= rel_tol * std::max(std::abs(a), std::abs(b));
}

static base_station_topology_t make_topology(std::initializer_list<station_position_t> stations)
{
  base_station_topology_t topology;
  topology.stations.assign(stations.begin(), stations.end());
  return topology;
}

void test_single_station()
{
  std::cout << "Testing single station aggregation..." << std::endl;
  auto constants = derive_physical_constants(physical_config_t{});
  path_loss_model_t path_loss(constants);

  auto topology = make_topology({{0.0, 0.0}});
  auto power = aggregate_received_power(topology, 0.0, 0.0, constants.transmit_power_w, path_loss);

  double expected = constants.transmit_power_w * path_loss.max_attenuation_factor();
  assert(near(power.total_w, expected, 1e-12));
  assert(power.strongest_w == power.total_w);
  assert(power.serving_index == 0);

  // No interference: SINR = P / N
  auto trial = link_metrics::evaluate_trial(power, constants);
  assert(near(trial.sinr, expected / constants.noise_floor_w, 1e-12));
  assert(trial.covered);
  assert(trial.finite);
}

void test_two_stations()
{
  std::cout << "Testing aggregation over distinct stations..." << std::endl;
  auto constants = derive_physical_constants(physical_config_t{});
  path_loss_model_t path_loss(constants);

  // User at (100, 0): station 0 is 1000 m away, station 1 is 100 m away
  auto topology = make_topology({{1100.0, 0.0}, {100.0, 100.0}});
  std::vector<double> per_station;
  auto power = aggregate_received_power(topology, 100.0, 0.0, constants.transmit_power_w, path_loss, per_station);

  double p0 = constants.transmit_power_w * path_loss.attenuation_factor(1000.0);
  double p1 = constants.transmit_power_w * path_loss.attenuation_factor(100.0);
  assert(per_station.size() == 2);
  assert(near(per_station[0], p0, 1e-12));
  assert(near(per_station[1], p1, 1e-12));
  assert(near(power.total_w, p0 + p1, 1e-12));
  assert(near(power.strongest_w, p1, 1e-12));
  assert(power.serving_index == 1);

  double sinr = link_metrics::calculate_sinr(power, constants.noise_floor_w);
  assert(near(sinr, p1 / (p0 + constants.noise_floor_w), 1e-12));
  std::cout << "  SINR = " << rf_units::linear_to_db(sinr) << " dB" << std::endl;
  assert(link_metrics::is_covered(sinr, constants.coverage_threshold));

  // Overload without the per-station vector agrees
  auto plain = aggregate_received_power(topology, 100.0, 0.0, constants.transmit_power_w, path_loss);
  assert(plain.total_w == power.total_w);
  assert(plain.strongest_w == power.strongest_w);
  assert(plain.serving_index == power.serving_index);
}

void test_equidistant_threshold()
{
  std::cout << "Testing coverage threshold with equidistant stations..." << std::endl;
  auto constants = derive_physical_constants(physical_config_t{});
  path_loss_model_t path_loss(constants);

  // Two equal signals: SINR just below 1, above 0.5
  auto two = make_topology({{500.0, 0.0}, {-500.0, 0.0}});
  auto p2 = aggregate_received_power(two, 0.0, 0.0, constants.transmit_power_w, path_loss);
  auto t2 = link_metrics::evaluate_trial(p2, constants);
  assert(p2.serving_index == 0);
  assert(t2.sinr < 1.0 && t2.sinr > 0.5);
  assert(t2.covered);

  // Three equal signals: SINR just below 0.5, threshold is strict
  auto three = make_topology({{500.0, 0.0}, {-500.0, 0.0}, {0.0, 500.0}});
  auto p3 = aggregate_received_power(three, 0.0, 0.0, constants.transmit_power_w, path_loss);
  auto t3 = link_metrics::evaluate_trial(p3, constants);
  assert(t3.sinr < 0.5);
  assert(!t3.covered);

  assert(!link_metrics::is_covered(0.5, 0.5));
  assert(link_metrics::is_covered(0.5000001, 0.5));
}

void test_flux_density()
{
  std::cout << "Testing EMF flux density..." << std::endl;
  double kappa = rf_units::path_loss_constant(1837.5e6, 3e8);

  double s = link_metrics::calculate_flux_density(1e-6, kappa);
  std::cout << "  S(1 uW) = " << s << " W/m^2 (Expected ~4.714e-4)" << std::endl;
  assert(near(s, 471.4352475793183e-6, 1e-12));
  assert(link_metrics::calculate_flux_density(0.0, kappa) == 0.0);
  assert(near(link_metrics::calculate_flux_density(2e-6, kappa), 2.0 * s, 1e-15));
}

void test_exposure_levels()
{
  std::cout << "Testing exposure classification..." << std::endl;
  assert(link_metrics::classify_exposure(0.0) == ExposureLevel::Low);
  assert(link_metrics::classify_exposure(5e-5) == ExposureLevel::Low);
  assert(link_metrics::classify_exposure(1e-4) == ExposureLevel::Low);
  assert(link_metrics::classify_exposure(5e-4) == ExposureLevel::Elevated);
  assert(link_metrics::classify_exposure(1e-3) == ExposureLevel::Elevated);
  assert(link_metrics::classify_exposure(2e-3) == ExposureLevel::High);
  assert(link_metrics::exposure_level_name(ExposureLevel::Elevated) == "elevated");
}

void test_non_finite_trials()
{
  std::cout << "Testing non-finite trial detection..." << std::endl;
  auto constants = derive_physical_constants(physical_config_t{});
  const double inf = std::numeric_limits<double>::infinity();
  const double nan = std::numeric_limits<double>::quiet_NaN();

  received_power_t saturated{inf, inf, 0};
  auto t1 = link_metrics::evaluate_trial(saturated, constants);
  assert(!t1.finite);
  assert(!t1.covered);

  received_power_t broken{nan, 1e-9, 0};
  auto t2 = link_metrics::evaluate_trial(broken, constants);
  assert(!t2.finite);
  assert(!t2.covered);

  received_power_t normal{2e-9, 1e-9, 0};
  auto t3 = link_metrics::evaluate_trial(normal, constants);
  assert(t3.finite);
  assert(t3.flux_density_w_m2 > 0.0);
}

void test_empty_topology()
{
  std::cout << "Testing empty topology guard..." << std::endl;
  auto constants = derive_physical_constants(physical_config_t{});
  path_loss_model_t path_loss(constants);

  bool thrown = false;
  try
  {
    aggregate_received_power(base_station_topology_t{}, 0.0, 0.0, constants.transmit_power_w, path_loss);
  }
  catch (const configuration_error_t &)
  {
    thrown = true;
  }
  assert(thrown);
}

void test_probe_point()
{
  std::cout << "Testing point probe..." << std::endl;
  auto constants = derive_physical_constants(physical_config_t{});

  auto topology = make_topology({{3000.0, 0.0}, {0.0, 40.0}, {-2000.0, -2000.0}});
  auto probe = simulation_engine_t::probe_point(topology, 0.0, 0.0, constants);

  assert(probe.station_power_w.size() == 3);
  assert(probe.station_power_dbm.size() == 3);
  assert(probe.serving_index == 1);
  for (size_t i = 0; i < 3; ++i)
  {
    assert(near(probe.station_power_dbm[i], rf_units::watts_to_dbm(probe.station_power_w[i]), 1e-12));
  }
  assert(near(probe.strongest_power_w, probe.station_power_w[1], 1e-15));
  assert(near(probe.sinr_db, 10.0 * std::log10(probe.sinr), 1e-12));
  assert(probe.covered);
  assert(probe.exposure == link_metrics::classify_exposure(probe.flux_density_w_m2));

  std::cout << "  Serving #" << probe.serving_index << " at " << probe.station_power_dbm[1] << " dBm, SINR " << probe.sinr_db << " dB, S=" << probe.flux_density_w_m2 << " W/m^2 ("
            << link_metrics::exposure_level_name(probe.exposure) << ")" << std::endl;
}

int main()
{
  test_single_station();
  test_two_stations();
  test_equidistant_threshold();
  test_flux_density();
  test_exposure_levels();
  test_non_finite_trials();
  test_empty_topology();
  test_probe_point();
  std::cout << "Link Metrics Verification Passed" << std::endl;
  return 0;
}
