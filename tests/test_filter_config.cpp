#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "FilterConfig.hpp"
#include "KalmanFilter.hpp"

namespace
{

std::string Write_Temp_File(const std::string &name, const std::string &contents)
{
  const std::filesystem::path path = std::filesystem::temp_directory_path() / name;
  std::ofstream file(path);
  file << contents;
  return path.string();
}

}  // namespace

TEST(FilterConfig, LoadsShippedFallingBodyConfiguration)
{
  FilterConfig config;
  ASSERT_EQ(Read_FilterConfig_from_YAML(std::string(KALMAN_SOURCE_DIR) + "/conf/config.yaml", &config), 0);

  const double dt = 1.0 / 60.0;
  EXPECT_NEAR(config.dt, dt, 1.0e-15);
  ASSERT_EQ(config.model.F.rows(), 3UL);
  EXPECT_NEAR(config.model.F(0UL, 1UL), dt, 1.0e-15);
  EXPECT_NEAR(config.model.F(1UL, 2UL), dt, 1.0e-15);
  ASSERT_EQ(config.model.H.rows(), 1UL);
  ASSERT_TRUE(config.model.Q.has_value());
  EXPECT_DOUBLE_EQ((*config.model.Q)(0UL, 1UL), 0.05);
  ASSERT_TRUE(config.model.R.has_value());
  EXPECT_DOUBLE_EQ((*config.model.R)(0UL, 0UL), 0.5);
  ASSERT_TRUE(config.model.x0.has_value());
  EXPECT_DOUBLE_EQ((*config.model.x0)[2UL], 9.81);
  EXPECT_FALSE(config.model.B.has_value());
  EXPECT_FALSE(config.model.P0.has_value());

  EXPECT_EQ(config.simulation.samples, 100UL);
  EXPECT_NEAR(config.simulation.samplePeriod, dt, 1.0e-15);
  EXPECT_EQ(config.noiseLevels.size(), 3UL);
  EXPECT_TRUE(config.measurementsCSV.empty());

  // the shipped model must build a filter
  EXPECT_NO_THROW(KalmanFilter filter(config.model));
}

TEST(FilterConfig, OptionalSectionsKeepDefaults)
{
  const std::string path = Write_Temp_File("kalman_minimal_config.yaml",
                                            "filter:\n"
                                            "  F: [[1]]\n"
                                            "  H: [[1]]\n");
  FilterConfig config;
  ASSERT_EQ(Read_FilterConfig_from_YAML(path, &config), 0);

  EXPECT_FALSE(config.model.Q.has_value());
  EXPECT_FALSE(config.model.R.has_value());
  EXPECT_DOUBLE_EQ(config.model.conditionLimit, 1.0e12);
  EXPECT_EQ(config.outputDirectory, "Output/");
  EXPECT_FALSE(config.matchMeasurementNoise);

  KalmanFilter filter(config.model);
  EXPECT_EQ(filter.StateSize(), 1UL);
}

TEST(FilterConfig, ControlModelAndSamplePeriod)
{
  const std::string path = Write_Temp_File("kalman_control_config.yaml",
                                            "filter:\n"
                                            "  dt: 0.1\n"
                                            "  F: [[1, dt], [0, 1]]\n"
                                            "  H: [[1, 0]]\n"
                                            "  B: [[0], [-dt]]\n"
                                            "simulation:\n"
                                            "  sample_period: 0.25\n"
                                            "  match_measurement_noise: true\n");
  FilterConfig config;
  ASSERT_EQ(Read_FilterConfig_from_YAML(path, &config), 0);

  ASSERT_TRUE(config.model.B.has_value());
  EXPECT_DOUBLE_EQ((*config.model.B)(1UL, 0UL), -0.1);
  EXPECT_DOUBLE_EQ(config.simulation.samplePeriod, 0.25);
  EXPECT_TRUE(config.matchMeasurementNoise);
}

TEST(FilterConfig, MalformedFilesAreReported)
{
  FilterConfig config;
  EXPECT_EQ(Read_FilterConfig_from_YAML("/nonexistent/kalman.yaml", &config), -1);

  const std::string ragged = Write_Temp_File("kalman_ragged_config.yaml",
                                              "filter:\n"
                                              "  F: [[1, 0], [0]]\n"
                                              "  H: [[1, 0]]\n");
  EXPECT_EQ(Read_FilterConfig_from_YAML(ragged, &config), -1);

  const std::string noFilter = Write_Temp_File("kalman_nofilter_config.yaml", "simulation:\n  samples: 3\n");
  EXPECT_EQ(Read_FilterConfig_from_YAML(noFilter, &config), -1);

  const std::string badEntry = Write_Temp_File("kalman_badentry_config.yaml",
                                                "filter:\n"
                                                "  F: [[one]]\n"
                                                "  H: [[1]]\n");
  EXPECT_EQ(Read_FilterConfig_from_YAML(badEntry, &config), -1);
}
