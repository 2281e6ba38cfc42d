#pragma once

#include <stdexcept>
#include <string>

// base class of every error raised by the filter
class KalmanError : public std::runtime_error
{
public:
    explicit KalmanError(const std::string &what) : std::runtime_error(what) {}
};

// mandatory matrices missing or dimensionally inconsistent (construction and noise mutators)
class InvalidModelError : public KalmanError
{
public:
    explicit InvalidModelError(const std::string &what) : KalmanError("Invalid model: " + what) {}
};

// a per-call input (u, z, x0, P0) does not match the model's dimensions
class DimensionMismatchError : public KalmanError
{
public:
    explicit DimensionMismatchError(const std::string &what) : KalmanError("Dimension mismatch: " + what) {}
};

// innovation covariance S is not invertible or too ill-conditioned to be trusted
class SingularInnovationCovarianceError : public KalmanError
{
public:
    explicit SingularInnovationCovarianceError(const std::string &what) : KalmanError("Singular innovation covariance: " + what) {}
};
