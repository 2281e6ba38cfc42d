#include <gtest/gtest.h>

#include <cmath>
#include <random>
#include <stdexcept>

#include "Simulation.hpp"

TEST(Simulation, NoiselessFallingBodyFollowsParabola)
{
  FallingBodyParameters params;
  params.samples = 5UL;
  params.samplePeriod = 0.5;
  params.noiseStdDev = 0.0;

  std::mt19937 gen(1U);
  const FallingBodySeries series = Simulate_FallingBody(params, gen);

  ASSERT_EQ(series.time.size(), 5UL);
  ASSERT_EQ(series.truth.size(), 5UL);
  ASSERT_EQ(series.measurements.size(), 5UL);

  for (size_t k = 0UL; k < 5UL; ++k)
  {
    const double t = 0.5 * static_cast<double>(k);
    EXPECT_DOUBLE_EQ(series.time[k], t);
    EXPECT_DOUBLE_EQ(series.truth[k], 2000.0 - 9.81 * t * t);
    EXPECT_DOUBLE_EQ(series.measurements[k], series.truth[k]);
  }
}

TEST(Simulation, NoiseIsBoundedWhenRequested)
{
  FallingBodyParameters params;
  params.samples = 1000UL;
  params.noiseStdDev = 50.0;
  params.noiseBound = 20.0;

  std::mt19937 gen(5U);
  const FallingBodySeries series = Simulate_FallingBody(params, gen);

  bool anyNoise = false;
  for (size_t k = 0UL; k < series.measurements.size(); ++k)
  {
    const double noise = series.measurements[k] - series.truth[k];
    EXPECT_LE(std::abs(noise), 20.0 + 1.0e-9);
    anyNoise = anyNoise || std::abs(noise) > 0.0;
  }
  EXPECT_TRUE(anyNoise);
}

TEST(Simulation, SameSeedSameSeries)
{
  FallingBodyParameters params;
  std::mt19937 gen1(9U), gen2(9U);

  EXPECT_EQ(Simulate_FallingBody(params, gen1).measurements, Simulate_FallingBody(params, gen2).measurements);
}

TEST(Simulation, RejectsNegativeParameters)
{
  FallingBodyParameters params;
  params.noiseStdDev = -1.0;
  std::mt19937 gen(1U);
  EXPECT_THROW(Simulate_FallingBody(params, gen), std::invalid_argument);
}

TEST(Simulation, MeanAbsoluteError)
{
  EXPECT_DOUBLE_EQ(Mean_Absolute_Error({1.0, 2.0, 3.0}, {2.0, 2.0, 1.0}), 1.0);
  EXPECT_DOUBLE_EQ(Mean_Absolute_Error({}, {}), 0.0);
  EXPECT_THROW(Mean_Absolute_Error({1.0}, {1.0, 2.0}), std::invalid_argument);
}
