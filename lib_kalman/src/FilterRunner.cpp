#include "FilterRunner.hpp"
#include <iostream>

std::vector<blaze::DynamicVector<double>> Run_Filter(KalmanFilter &filter,
                                                     const std::vector<blaze::DynamicVector<double>> &measurements,
                                                     EstimateRecorder &recorder,
                                                     size_t *skippedUpdates)
{
    std::vector<blaze::DynamicVector<double>> predicted;
    predicted.reserve(measurements.size());
    *skippedUpdates = 0UL;

    const blaze::DynamicMatrix<double> H = filter.GetObservation();

    for (size_t k = 0UL; k < measurements.size(); ++k)
    {
        // next state prediction x[k|k-1]
        const blaze::DynamicVector<double> prior = filter.Predict();
        predicted.push_back(blaze::DynamicVector<double>(H * prior));

        // hold the prediction when the innovation covariance cannot be inverted
        try
        {
            filter.Update(measurements[k]);
        }
        catch (const SingularInnovationCovarianceError &e)
        {
            std::cerr << "Step " << k << ": " << e.what() << ", keeping the prediction" << std::endl;
            ++(*skippedUpdates);
        }

        recorder.Record(k, measurements[k], prior, filter.GetState());
    }

    return predicted;
}
