#pragma once

#include <optional>
#include <blaze/Math.h>

#include "KalmanErrors.hpp"

/* Parameters of a linear-Gaussian model. F and H are mandatory, the optional members fall back to
   Q = I(n), R = I(m), P0 = I(n), x0 = 0(n) and "no control input" when left empty. */
struct KalmanModel
{
    blaze::DynamicMatrix<double> F;                  // state transition (n x n)
    blaze::DynamicMatrix<double> H;                  // observation model (m x n)
    std::optional<blaze::DynamicMatrix<double>> Q;   // process noise covariance (n x n)
    std::optional<blaze::DynamicMatrix<double>> R;   // measurement noise covariance (m x m)
    std::optional<blaze::DynamicMatrix<double>> P0;  // initial estimate covariance (n x n)
    std::optional<blaze::DynamicVector<double>> x0;  // initial state (n)
    std::optional<blaze::DynamicMatrix<double>> B;   // control input model (n x p)
    double conditionLimit = 1.0e12;                  // largest accepted 1-norm condition number of S
};

// last completed operation of the predict/update cycle
enum class FilterPhase
{
    Initialized,
    Predicted,
    Corrected
};

class KalmanFilter
{
public:
    // default constructor
    KalmanFilter() = delete;

    // KalmanFilter constructor -- throws InvalidModelError
    explicit KalmanFilter(const KalmanModel &model);

    // KalmanFilter desctructor
    ~KalmanFilter() = default;

    // copy constructor
    KalmanFilter(const KalmanFilter &rhs);

    // move constructor
    KalmanFilter(KalmanFilter &&rhs) noexcept;

    // Copy assignment operator
    KalmanFilter &operator=(const KalmanFilter &rhs);

    // move assignment operator
    KalmanFilter &operator=(KalmanFilter &&rhs) noexcept;

    /** @brief Propagates the state and its covariance one step through the dynamic model.
     * @details x <- F*x + B*u and P <- F*P*F^T + Q. An empty u means "no control".
     *          Throws DimensionMismatchError if u is given without B, with the wrong length or with
     *          non-finite entries.
     * @return a copy of the predicted state */
    blaze::DynamicVector<double> Predict(const blaze::DynamicVector<double> &u = blaze::DynamicVector<double>());

    /** @brief Corrects the state with measurement z; the covariance is updated in Joseph form.
     * @details Throws DimensionMismatchError if z does not have m finite entries, and
     *          SingularInnovationCovarianceError if S = R + H*P*H^T cannot be inverted reliably.
     *          x and P are left untouched when an exception is thrown. */
    void Update(const blaze::DynamicVector<double> &z);

    /* Reinitializes the state and covariance */
    void Reset(const blaze::DynamicVector<double> &x0, const blaze::DynamicMatrix<double> &P0);

    /* Replaces R, used from the next Update on */
    void SetMeasurementNoise(const blaze::DynamicMatrix<double> &R_);

    /* Replaces Q, used from the next Predict on */
    void SetProcessNoise(const blaze::DynamicMatrix<double> &Q_);

    blaze::DynamicVector<double> GetState() const { return x; }
    blaze::DynamicMatrix<double> GetCovariance() const { return Pxx; }
    blaze::DynamicMatrix<double> GetStateTransition() const { return F; }
    blaze::DynamicMatrix<double> GetObservation() const { return H; }
    blaze::DynamicMatrix<double> GetProcessNoise() const { return Q; }
    blaze::DynamicMatrix<double> GetMeasurementNoise() const { return R; }

    // innovation and Kalman gain of the last successful Update (empty before the first one)
    blaze::DynamicVector<double> GetInnovation() const { return y; }
    blaze::DynamicMatrix<double> GetGain() const { return W; }

    FilterPhase GetPhase() const { return phase; }
    bool HasControl() const { return p != 0UL; }
    size_t StateSize() const { return n; }
    size_t MeasurementSize() const { return m; }
    size_t ControlSize() const { return p; }

private:
    size_t n, m, p;
    double conditionLimit;
    blaze::DynamicMatrix<double> F;
    blaze::DynamicMatrix<double> H;
    blaze::DynamicMatrix<double> B;
    blaze::DynamicMatrix<double> Q;
    blaze::DynamicMatrix<double> R;
    blaze::DynamicVector<double> x;
    blaze::DynamicMatrix<double> Pxx;
    blaze::IdentityMatrix<double> I;
    blaze::DynamicVector<double> y;
    blaze::DynamicMatrix<double> W;
    FilterPhase phase;
};
