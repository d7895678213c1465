#pragma once

#include "received_power.hpp"
#include "simulation_config.hpp"
#include <string>

namespace emf_mapper
{

enum class ExposureLevel
{
  Low = 0,      // S <= 1e-4 W/m^2
  Elevated = 1, // 1e-4 < S <= 1e-3 W/m^2
  High = 2      // S > 1e-3 W/m^2
};

constexpr double EXPOSURE_ELEVATED_W_M2 = 1e-4;
constexpr double EXPOSURE_HIGH_W_M2 = 1e-3;

struct trial_result_t
{
  double total_power_w = 0.0;
  double strongest_power_w = 0.0;
  double sinr = 0.0;
  double flux_density_w_m2 = 0.0;
  bool covered = false;
  bool finite = true; // false if sinr or flux is NaN/Inf
};

namespace link_metrics
{

// SINR = Pr_strongest / (Pr_total - Pr_strongest + N)
// Every non-serving station counts as interference.
auto calculate_sinr(const received_power_t &power, double noise_floor_w) -> double;

auto is_covered(double sinr, double threshold) -> bool;

// S = (kappa / 4pi) * Pr_total
auto calculate_flux_density(double total_power_w, double path_loss_constant) -> double;

auto classify_exposure(double flux_density_w_m2) -> ExposureLevel;
auto exposure_level_name(ExposureLevel level) -> std::string;

auto evaluate_trial(const received_power_t &power, const physical_constants_t &constants) -> trial_result_t;

} // namespace link_metrics
} // namespace emf_mapper
