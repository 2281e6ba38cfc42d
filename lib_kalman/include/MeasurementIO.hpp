#pragma once

#include <chrono>
#include <fstream>
#include <string>
#include <vector>
#include <blaze/Math.h>

/* Writes one CSV row per filter cycle: the measurement, the predicted state returned by
   KalmanFilter::Predict and the corrected state after KalmanFilter::Update */
class EstimateRecorder
{
public:
  EstimateRecorder(const std::string &filename, const size_t measurementSize, const size_t stateSize);

  void Record(const size_t step,
              const blaze::DynamicVector<double> &measurement,
              const blaze::DynamicVector<double> &prediction,
              const blaze::DynamicVector<double> &estimate);

  bool IsOpen() const { return file.is_open(); }

  void Close();

private:
  std::string filename_;
  std::ofstream file;
  size_t measurementSize_;
  size_t stateSize_;
  std::chrono::high_resolution_clock::time_point start_time_;
};

/** @brief Reads a recorded measurement series: one row per cycle, one column per component.
 * @details A first row that does not parse as numbers is taken as a header and skipped.
 * @return false (with a message on std::cerr) if the file cannot be read, a value does not
 *         parse, or the rows differ in length */
bool Load_Measurements_From_CSV(const std::string &filepath, std::vector<blaze::DynamicVector<double>> *measurements);
