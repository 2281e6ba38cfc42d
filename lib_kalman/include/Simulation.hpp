#pragma once

#include <cstddef>
#include <random>
#include <vector>

/* Falling-body measurement source: a body released from initialHeight follows
   h(t) = initialHeight - gravity * t^2 and is observed by a height sensor with Gaussian noise */
struct FallingBodyParameters
{
  size_t samples = 100UL;
  double samplePeriod = 1.0 / 60.0; // seconds between two consecutive readings
  double initialHeight = 2000.0;
  double gravity = 9.81;
  double noiseStdDev = 50.0;
  double noiseBound = 0.0; // 0 -> unbounded, otherwise the noise is clipped to [-noiseBound, noiseBound]
};

struct FallingBodySeries
{
  std::vector<double> time;
  std::vector<double> truth;
  std::vector<double> measurements;
};

/* Generates the noiseless trajectory and the noisy readings. Throws std::invalid_argument on
   a negative noise standard deviation, noise bound or sample period */
FallingBodySeries Simulate_FallingBody(const FallingBodyParameters &params, std::mt19937 &gen);

/* Mean absolute error between two equally long series; throws std::invalid_argument otherwise */
double Mean_Absolute_Error(const std::vector<double> &estimate, const std::vector<double> &truth);
