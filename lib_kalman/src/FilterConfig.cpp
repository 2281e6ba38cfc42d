#include "FilterConfig.hpp"
#include <iostream>
#include <stdexcept>

namespace
{
  // a matrix entry is either a number or the sampling period token
  double YAML_To_Entry(const YAML::Node &entry, const double dt)
  {
    const std::string token = entry.Scalar();
    if (token == "dt")
      return dt;
    if (token == "-dt")
      return -dt;

    return entry.as<double>();
  }
}

blaze::DynamicMatrix<double> YAML_To_Matrix(const YAML::Node &node, const double dt, const std::string &name)
{
  if (!node.IsSequence() || node.size() == 0UL)
  {
    throw std::runtime_error(name + " must be a non-empty list of rows");
  }

  const size_t rows = node.size();
  const size_t cols = node[0].size();
  blaze::DynamicMatrix<double> M(rows, cols, 0.0);

  for (size_t i = 0UL; i < rows; ++i)
  {
    const YAML::Node row = node[i];
    if (!row.IsSequence() || row.size() != cols || cols == 0UL)
    {
      throw std::runtime_error(name + ": row " + std::to_string(i) + " must hold " + std::to_string(cols) + " entries");
    }

    for (size_t j = 0UL; j < cols; ++j)
    {
      M(i, j) = YAML_To_Entry(row[j], dt);
    }
  }

  return M;
}

blaze::DynamicVector<double> YAML_To_Vector(const YAML::Node &node, const double dt, const std::string &name)
{
  if (!node.IsSequence() || node.size() == 0UL)
  {
    throw std::runtime_error(name + " must be a non-empty list");
  }

  blaze::DynamicVector<double> v(node.size(), 0.0);
  for (size_t i = 0UL; i < node.size(); ++i)
  {
    v[i] = YAML_To_Entry(node[i], dt);
  }

  return v;
}

int Read_FilterConfig_from_YAML(const std::string &yamlFilePath, FilterConfig *config)
{
  // Load the YAML file
  try
  {
    YAML::Node root = YAML::LoadFile(yamlFilePath);

    const YAML::Node filter = root["filter"];
    if (!filter)
    {
      std::cerr << "No \"filter\" section in " << yamlFilePath << std::endl;
      return -1;
    }

    if (filter["dt"])
    {
      config->dt = filter["dt"].as<double>();
    }
    const double dt = config->dt;

    KalmanModel &model = config->model;
    if (filter["F"])
      model.F = YAML_To_Matrix(filter["F"], dt, "F");
    if (filter["H"])
      model.H = YAML_To_Matrix(filter["H"], dt, "H");
    if (filter["Q"])
      model.Q = YAML_To_Matrix(filter["Q"], dt, "Q");
    if (filter["R"])
      model.R = YAML_To_Matrix(filter["R"], dt, "R");
    if (filter["P0"])
      model.P0 = YAML_To_Matrix(filter["P0"], dt, "P0");
    if (filter["B"])
      model.B = YAML_To_Matrix(filter["B"], dt, "B");
    if (filter["x0"])
      model.x0 = YAML_To_Vector(filter["x0"], dt, "x0");
    if (filter["condition_limit"])
      model.conditionLimit = filter["condition_limit"].as<double>();

    // the simulated sensor reads at the filter rate unless told otherwise
    FallingBodyParameters &sim = config->simulation;
    sim.samplePeriod = dt;

    const YAML::Node simulation = root["simulation"];
    if (simulation)
    {
      if (simulation["samples"])
        sim.samples = simulation["samples"].as<size_t>();
      if (simulation["sample_period"])
        sim.samplePeriod = simulation["sample_period"].as<double>();
      if (simulation["initial_height"])
        sim.initialHeight = simulation["initial_height"].as<double>();
      if (simulation["gravity"])
        sim.gravity = simulation["gravity"].as<double>();
      if (simulation["noise_bound"])
        sim.noiseBound = simulation["noise_bound"].as<double>();
      if (simulation["noise_levels"])
        config->noiseLevels = simulation["noise_levels"].as<std::vector<double>>();
      if (simulation["match_measurement_noise"])
        config->matchMeasurementNoise = simulation["match_measurement_noise"].as<bool>();
      if (simulation["seed"])
        config->seed = simulation["seed"].as<unsigned int>();
      if (simulation["measurements_csv"])
        config->measurementsCSV = simulation["measurements_csv"].as<std::string>();
    }

    const YAML::Node output = root["output"];
    if (output && output["directory"])
    {
      config->outputDirectory = output["directory"].as<std::string>();
    }

    return 0;
  }
  catch (const YAML::Exception &e)
  {
    std::cerr << "Could not load " << yamlFilePath << ": " << e.what() << std::endl;
    return -1;
  }
  catch (const std::runtime_error &e)
  {
    std::cerr << "Malformed configuration " << yamlFilePath << ": " << e.what() << std::endl;
    return -1;
  }
}
