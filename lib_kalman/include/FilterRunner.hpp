#pragma once

#include <cstddef>
#include <vector>
#include <blaze/Math.h>

#include "KalmanFilter.hpp"
#include "MeasurementIO.hpp"

/** @brief Runs one predict/update cycle per measurement and records every cycle.
 * @details When Update throws SingularInnovationCovarianceError the step is counted in
 *          skippedUpdates and the prediction is kept as the step's estimate. Any other
 *          error propagates to the caller.
 * @return the predicted measurements H * x[k|k-1], one per cycle */
std::vector<blaze::DynamicVector<double>> Run_Filter(KalmanFilter &filter,
                                                     const std::vector<blaze::DynamicVector<double>> &measurements,
                                                     EstimateRecorder &recorder,
                                                     size_t *skippedUpdates);
