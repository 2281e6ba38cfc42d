#include "LinearAlgebra.hpp"
#include "KalmanErrors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

/* Returns "rows x columns" of a matrix, used in error messages */
std::string Shape_To_String(const blaze::DynamicMatrix<double> &M)
{
    return std::to_string(M.rows()) + "x" + std::to_string(M.columns());
}

bool Is_Symmetric(const blaze::DynamicMatrix<double> &M, const double tol)
{
    if (M.rows() != M.columns())
        return false;

    double scale = 1.00;
    for (size_t i = 0UL; i < M.rows(); ++i)
        for (size_t j = 0UL; j < M.columns(); ++j)
            scale = std::max(scale, std::abs(M(i, j)));

    for (size_t i = 0UL; i < M.rows(); ++i)
    {
        for (size_t j = i + 1UL; j < M.columns(); ++j)
        {
            if (std::abs(M(i, j) - M(j, i)) > tol * scale)
                return false;
        }
    }

    return true;
}

blaze::DynamicMatrix<double> Symmetrize(const blaze::DynamicMatrix<double> &M)
{
    blaze::DynamicMatrix<double> sym = 0.50 * (M + blaze::trans(M));
    return sym;
}

bool Is_Finite(const blaze::DynamicMatrix<double> &M)
{
    for (size_t i = 0UL; i < M.rows(); ++i)
        for (size_t j = 0UL; j < M.columns(); ++j)
            if (!std::isfinite(M(i, j)))
                return false;

    return true;
}

bool Is_Finite(const blaze::DynamicVector<double> &v)
{
    for (size_t i = 0UL; i < v.size(); ++i)
        if (!std::isfinite(v[i]))
            return false;

    return true;
}

double Norm1(const blaze::DynamicMatrix<double> &M)
{
    double norm = 0.00;
    for (size_t j = 0UL; j < M.columns(); ++j)
    {
        double colSum = 0.00;
        for (size_t i = 0UL; i < M.rows(); ++i)
            colSum += std::abs(M(i, j));

        norm = std::max(norm, colSum);
    }

    return norm;
}

blaze::DynamicMatrix<double> Invert_Checked(const blaze::DynamicMatrix<double> &S, const double conditionLimit)
{
    if (S.rows() != S.columns() || S.rows() == 0UL)
        throw SingularInnovationCovarianceError("matrix of shape " + Shape_To_String(S) + " is not invertible");

    if (!Is_Finite(S))
        throw SingularInnovationCovarianceError("matrix contains non-finite entries");

    blaze::DynamicMatrix<double> S_inv;
    try
    {
        S_inv = blaze::inv(S);
    }
    catch (const std::exception &e)
    {
        // blaze reports singular matrices through std::invalid_argument / std::runtime_error
        throw SingularInnovationCovarianceError(e.what());
    }

    if (!Is_Finite(S_inv))
        throw SingularInnovationCovarianceError("inverse contains non-finite entries");

    const double cond = Norm1(S) * Norm1(S_inv);
    if (!std::isfinite(cond) || cond > conditionLimit)
    {
        std::ostringstream msg;
        msg << "condition number " << cond << " exceeds the limit " << conditionLimit;
        throw SingularInnovationCovarianceError(msg.str());
    }

    return S_inv;
}
