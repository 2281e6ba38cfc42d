#include "Simulation.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

FallingBodySeries Simulate_FallingBody(const FallingBodyParameters &params, std::mt19937 &gen)
{
  if (params.noiseStdDev < 0.0 || params.noiseBound < 0.0 || params.samplePeriod < 0.0)
  {
    throw std::invalid_argument("Simulate_FallingBody: noise and sample period must be non-negative");
  }

  FallingBodySeries series;
  series.time.reserve(params.samples);
  series.truth.reserve(params.samples);
  series.measurements.reserve(params.samples);

  // std::normal_distribution requires a strictly positive standard deviation
  std::normal_distribution<double> dist(0.0, params.noiseStdDev > 0.0 ? params.noiseStdDev : 1.0);

  for (size_t k = 0UL; k < params.samples; ++k)
  {
    const double t = static_cast<double>(k) * params.samplePeriod;
    const double height = params.initialHeight - params.gravity * t * t;

    double noise = params.noiseStdDev > 0.0 ? dist(gen) : 0.0;
    if (params.noiseBound > 0.0)
    {
      noise = std::clamp(noise, -params.noiseBound, params.noiseBound);
    }

    series.time.push_back(t);
    series.truth.push_back(height);
    series.measurements.push_back(height + noise);
  }

  return series;
}

double Mean_Absolute_Error(const std::vector<double> &estimate, const std::vector<double> &truth)
{
  if (estimate.size() != truth.size())
  {
    throw std::invalid_argument("Mean_Absolute_Error: series lengths differ (" + std::to_string(estimate.size()) + " vs " + std::to_string(truth.size()) + ")");
  }
  if (estimate.empty())
  {
    return 0.0;
  }

  double sum = 0.0;
  for (size_t i = 0UL; i < estimate.size(); ++i)
  {
    sum += std::abs(estimate[i] - truth[i]);
  }

  return sum / static_cast<double>(estimate.size());
}
