#pragma once

#include <string>
#include <vector>
#include <blaze/Math.h>
#include <yaml-cpp/yaml.h>

#include "KalmanFilter.hpp"
#include "Simulation.hpp"

/* Everything the demo driver needs to build a filter and run it: the model matrices, the
   falling-body simulation and the list of noise levels swept between filter resets. */
struct FilterConfig
{
  KalmanModel model;
  double dt = 1.0 / 60.0;
  FallingBodyParameters simulation;
  std::vector<double> noiseLevels = {50.0};
  unsigned int seed = 42U;
  bool matchMeasurementNoise = false; // R <- noise^2 * I before each run of the sweep
  std::string measurementsCSV; // replays a recording instead of simulating when not empty
  std::string outputDirectory = "Output/";
};

/** @brief Loads the filter and simulation parameters from a YAML file.
 * @details Matrix entries are numbers or the token "dt" ("-dt"), replaced by filter.dt.
 *          Absent optional matrices are left empty so that the filter applies its defaults.
 *          The simulation samples at filter.dt unless simulation.sample_period is given.
 * @return 0 on success, -1 if the file cannot be read or is malformed */
int Read_FilterConfig_from_YAML(const std::string &yamlFilePath, FilterConfig *config);

/* Parses a YAML list of rows into a matrix; throws std::runtime_error on ragged or empty input */
blaze::DynamicMatrix<double> YAML_To_Matrix(const YAML::Node &node, const double dt, const std::string &name);

/* Parses a flat YAML list into a vector; throws std::runtime_error on empty input */
blaze::DynamicVector<double> YAML_To_Vector(const YAML::Node &node, const double dt, const std::string &name);
