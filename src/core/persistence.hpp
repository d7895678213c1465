#pragma once

#include "core/simulation_config.hpp"
#include "core/simulation_engine.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace emf_mapper
{
namespace persistence
{

auto config_to_json(const simulation_config_t &config) -> nlohmann::json;

// Missing keys keep the values already present in config
auto config_from_json(const nlohmann::json &j, simulation_config_t &config) -> void;

auto save_config(const std::string &filename, const simulation_config_t &config) -> bool;
auto load_config(const std::string &filename, simulation_config_t &config) -> bool;

auto save_results_json(const std::string &filename, const simulation_config_t &config, const sweep_result_t &result) -> bool;
auto save_results_csv(const std::string &filename, const sweep_result_t &result) -> bool;

} // namespace persistence
} // namespace emf_mapper
