#include "KalmanFilter.hpp"
#include "LinearAlgebra.hpp"
#include <string>
#include <utility>

namespace
{
    // a noise or estimate covariance must be dim x dim, finite and symmetric
    void Validate_Covariance(const std::string &name, const blaze::DynamicMatrix<double> &M, const size_t dim)
    {
        if (M.rows() != dim || M.columns() != dim)
            throw InvalidModelError(name + " must be " + std::to_string(dim) + "x" + std::to_string(dim) + ", got " + Shape_To_String(M));

        if (!Is_Finite(M))
            throw InvalidModelError(name + " contains non-finite entries");

        if (!Is_Symmetric(M))
            throw InvalidModelError(name + " is not symmetric");
    }
}

// overloaded constructor
KalmanFilter::KalmanFilter(const KalmanModel &model) : n(0UL), m(0UL), p(0UL), conditionLimit(model.conditionLimit), phase(FilterPhase::Initialized)
{
    // dynamics of the filter
    if (model.F.rows() == 0UL || model.F.columns() == 0UL)
        throw InvalidModelError("state transition matrix F is required");
    if (model.F.rows() != model.F.columns())
        throw InvalidModelError("F must be square, got " + Shape_To_String(model.F));
    if (!Is_Finite(model.F))
        throw InvalidModelError("F contains non-finite entries");

    n = model.F.rows();
    F = model.F;

    // output matrix
    if (model.H.rows() == 0UL || model.H.columns() == 0UL)
        throw InvalidModelError("observation matrix H is required");
    if (model.H.columns() != n)
        throw InvalidModelError("H must have " + std::to_string(n) + " columns to match F, got " + Shape_To_String(model.H));
    if (!Is_Finite(model.H))
        throw InvalidModelError("H contains non-finite entries");

    m = model.H.rows();
    H = model.H;

    // control input model -- absent means no control contribution
    if (model.B)
    {
        if (model.B->rows() != n || model.B->columns() == 0UL)
            throw InvalidModelError("B must have " + std::to_string(n) + " rows and at least one column, got " + Shape_To_String(*model.B));
        if (!Is_Finite(*model.B))
            throw InvalidModelError("B contains non-finite entries");

        B = *model.B;
        p = B.columns();
    }

    if (!(conditionLimit > 1.00))
        throw InvalidModelError("condition limit must be greater than 1");

    // covariance of the process noise
    if (model.Q)
    {
        Validate_Covariance("Q", *model.Q, n);
        Q = *model.Q;
    }
    else
        Q = blaze::IdentityMatrix<double>(n);

    // covariance of the measurements -- sized by the measurement dimension
    if (model.R)
    {
        Validate_Covariance("R", *model.R, m);
        R = *model.R;
    }
    else
        R = blaze::IdentityMatrix<double>(m);

    // initial covariance
    if (model.P0)
    {
        Validate_Covariance("P0", *model.P0, n);
        Pxx = *model.P0;
    }
    else
        Pxx = blaze::IdentityMatrix<double>(n);

    // initial state
    if (model.x0)
    {
        if (model.x0->size() != n)
            throw InvalidModelError("x0 must have " + std::to_string(n) + " entries, got " + std::to_string(model.x0->size()));
        if (!Is_Finite(*model.x0))
            throw InvalidModelError("x0 contains non-finite entries");

        x = *model.x0;
    }
    else
        x = blaze::DynamicVector<double>(n, 0.00);

    I = blaze::IdentityMatrix<double>(n);
}

// copy constructor
KalmanFilter::KalmanFilter(const KalmanFilter &rhs) : n(rhs.n), m(rhs.m), p(rhs.p), conditionLimit(rhs.conditionLimit), F(rhs.F), H(rhs.H), B(rhs.B), Q(rhs.Q), R(rhs.R), x(rhs.x), Pxx(rhs.Pxx), I(rhs.I), y(rhs.y), W(rhs.W), phase(rhs.phase){};

// move constructor
KalmanFilter::KalmanFilter(KalmanFilter &&rhs) noexcept : n(rhs.n), m(rhs.m), p(rhs.p), conditionLimit(rhs.conditionLimit), F(std::move(rhs.F)), H(std::move(rhs.H)), B(std::move(rhs.B)), Q(std::move(rhs.Q)), R(std::move(rhs.R)), x(std::move(rhs.x)), Pxx(std::move(rhs.Pxx)), I(std::move(rhs.I)), y(std::move(rhs.y)), W(std::move(rhs.W)), phase(rhs.phase){};

// Copy assignment operator
KalmanFilter &KalmanFilter::operator=(const KalmanFilter &rhs)
{
    // handling self assignment
    if (this != &rhs)
    {
        this->n = rhs.n;
        this->m = rhs.m;
        this->p = rhs.p;
        this->conditionLimit = rhs.conditionLimit;
        this->F = rhs.F;
        this->H = rhs.H;
        this->B = rhs.B;
        this->Q = rhs.Q;
        this->R = rhs.R;
        this->x = rhs.x;
        this->Pxx = rhs.Pxx;
        this->I = rhs.I;
        this->y = rhs.y;
        this->W = rhs.W;
        this->phase = rhs.phase;
    }

    return *this;
}

// move assignment operator
KalmanFilter &KalmanFilter::operator=(KalmanFilter &&rhs) noexcept
{
    // handling self assignment
    if (this != &rhs)
    {
        this->n = rhs.n;
        this->m = rhs.m;
        this->p = rhs.p;
        this->conditionLimit = rhs.conditionLimit;
        this->F = std::move(rhs.F);
        this->H = std::move(rhs.H);
        this->B = std::move(rhs.B);
        this->Q = std::move(rhs.Q);
        this->R = std::move(rhs.R);
        this->x = std::move(rhs.x);
        this->Pxx = std::move(rhs.Pxx);
        this->I = std::move(rhs.I);
        this->y = std::move(rhs.y);
        this->W = std::move(rhs.W);
        this->phase = rhs.phase;
    }

    return *this;
}

// time update: state prediction x[k+1|k] and covariance Pxx[k+1|k]
blaze::DynamicVector<double> KalmanFilter::Predict(const blaze::DynamicVector<double> &u)
{
    blaze::DynamicVector<double> x_prior = F * x;

    if (u.size() != 0UL)
    {
        if (p == 0UL)
            throw DimensionMismatchError("control vector of length " + std::to_string(u.size()) + " given but the model has no control matrix B");
        if (u.size() != p)
            throw DimensionMismatchError("control vector must have " + std::to_string(p) + " entries, got " + std::to_string(u.size()));
        if (!Is_Finite(u))
            throw DimensionMismatchError("control vector contains non-finite entries");

        x_prior += B * u;
    }

    blaze::DynamicMatrix<double> P_prior = Symmetrize(F * Pxx * blaze::trans(F) + Q);

    // commit
    x = std::move(x_prior);
    Pxx = std::move(P_prior);
    phase = FilterPhase::Predicted;

    return x;
}

// measurement update: filtered state x[k|k] and covariance Pxx[k|k]
void KalmanFilter::Update(const blaze::DynamicVector<double> &z)
{
    if (z.size() != m)
        throw DimensionMismatchError("measurement must have " + std::to_string(m) + " entries, got " + std::to_string(z.size()));
    if (!Is_Finite(z))
        throw DimensionMismatchError("measurement contains non-finite entries");

    // innovation
    blaze::DynamicVector<double> innovation = z - H * x;

    // innovation covariance
    const blaze::DynamicMatrix<double> PHt = Pxx * blaze::trans(H);
    const blaze::DynamicMatrix<double> S = R + H * PHt;
    const blaze::DynamicMatrix<double> S_inv = Invert_Checked(S, conditionLimit);

    // Kalman Gain
    blaze::DynamicMatrix<double> gain = PHt * S_inv;

    // updating the state estimates ==> filtered state through innovation process
    blaze::DynamicVector<double> x_post = x + gain * innovation;

    // updating the state estimate covariance (Joseph form)
    const blaze::DynamicMatrix<double> IKH = I - gain * H;
    blaze::DynamicMatrix<double> P_post = Symmetrize(IKH * Pxx * blaze::trans(IKH) + gain * R * blaze::trans(gain));

    // commit
    x = std::move(x_post);
    Pxx = std::move(P_post);
    y = std::move(innovation);
    W = std::move(gain);
    phase = FilterPhase::Corrected;
}

void KalmanFilter::Reset(const blaze::DynamicVector<double> &x0, const blaze::DynamicMatrix<double> &P0)
{
    if (x0.size() != n)
        throw DimensionMismatchError("x0 must have " + std::to_string(n) + " entries, got " + std::to_string(x0.size()));
    if (P0.rows() != n || P0.columns() != n)
        throw DimensionMismatchError("P0 must be " + std::to_string(n) + "x" + std::to_string(n) + ", got " + Shape_To_String(P0));
    if (!Is_Finite(x0))
        throw InvalidModelError("x0 contains non-finite entries");
    Validate_Covariance("P0", P0, n);

    x = x0;
    Pxx = P0;
    y.clear();
    W.clear();
    phase = FilterPhase::Initialized;
}

void KalmanFilter::SetMeasurementNoise(const blaze::DynamicMatrix<double> &R_)
{
    Validate_Covariance("R", R_, m);
    R = R_;
}

void KalmanFilter::SetProcessNoise(const blaze::DynamicMatrix<double> &Q_)
{
    Validate_Covariance("Q", Q_, n);
    Q = Q_;
}
