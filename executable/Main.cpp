#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "FilterConfig.hpp"
#include "FilterRunner.hpp"
#include "KalmanFilter.hpp"
#include "MeasurementIO.hpp"
#include "Simulation.hpp"

int main(int argc, char *argv[])
{
    // configuration file with the model matrices and the noise sweep
    const std::string configFile = (argc > 1) ? argv[1] : "../conf/config.yaml";

    FilterConfig config;
    if (Read_FilterConfig_from_YAML(configFile, &config) != 0)
    {
        std::cerr << "Failed reading the configuration file: " << configFile << std::endl;
        return 1;
    }

    // Instantiating the Kalman Filter
    std::shared_ptr<KalmanFilter> KLF;
    try
    {
        KLF = std::make_shared<KalmanFilter>(config.model);
    }
    catch (const KalmanError &e)
    {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    std::cout << "Kalman filter with " << KLF->StateSize() << " states, " << KLF->MeasurementSize() << " measurements and "
              << KLF->ControlSize() << " control inputs" << std::endl;

    // initial conditions restored before every run
    const blaze::DynamicVector<double> x0 = KLF->GetState();
    const blaze::DynamicMatrix<double> P0 = KLF->GetCovariance();

    try
    {
        // replaying a recording
        if (!config.measurementsCSV.empty())
        {
            std::vector<blaze::DynamicVector<double>> measurements;
            if (!Load_Measurements_From_CSV(config.measurementsCSV, &measurements))
                return 1;

            EstimateRecorder recorder(config.outputDirectory + "Filtered_Recording.csv", KLF->MeasurementSize(), KLF->StateSize());
            size_t skipped = 0UL;
            Run_Filter(*KLF, measurements, recorder, &skipped);
            recorder.Close();

            std::cout << "Filtered " << measurements.size() << " samples (" << skipped << " updates skipped)" << std::endl
                      << "Final state: " << blaze::trans(KLF->GetState());
            return 0;
        }

        // falling-body simulation, one run per noise level
        if (KLF->MeasurementSize() != 1UL)
        {
            std::cerr << "The falling-body simulation needs a scalar height measurement (H with one row)" << std::endl;
            return 1;
        }

        std::mt19937 gen(config.seed);
        FallingBodyParameters params = config.simulation;

        for (size_t run = 0UL; run < config.noiseLevels.size(); ++run)
        {
            params.noiseStdDev = config.noiseLevels[run];

            // reset initial conditions
            KLF->Reset(x0, P0);
            if (config.matchMeasurementNoise)
            {
                KLF->SetMeasurementNoise(blaze::DynamicMatrix<double>(1UL, 1UL, params.noiseStdDev * params.noiseStdDev));
            }

            const FallingBodySeries series = Simulate_FallingBody(params, gen);

            std::vector<blaze::DynamicVector<double>> measurements;
            measurements.reserve(series.measurements.size());
            for (const double z : series.measurements)
            {
                measurements.push_back(blaze::DynamicVector<double>(1UL, z));
            }

            EstimateRecorder recorder(config.outputDirectory + "Filtered_Noise_" + std::to_string(run) + ".csv", 1UL, KLF->StateSize());
            size_t skipped = 0UL;
            const std::vector<blaze::DynamicVector<double>> predicted = Run_Filter(*KLF, measurements, recorder, &skipped);
            recorder.Close();

            std::vector<double> predictedHeight;
            predictedHeight.reserve(predicted.size());
            for (const auto &zhat : predicted)
            {
                predictedHeight.push_back(zhat[0UL]);
            }

            std::cout << "Noise: " << params.noiseStdDev
                      << "    MAE measurements: " << Mean_Absolute_Error(series.measurements, series.truth)
                      << "    MAE predictions: " << Mean_Absolute_Error(predictedHeight, series.truth)
                      << "    skipped updates: " << skipped << std::endl;
        }
    }
    catch (const KalmanError &e)
    {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    return 0;
}
