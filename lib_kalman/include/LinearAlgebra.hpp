#pragma once

#include <string>
#include <blaze/Math.h>

// Helpers around the Blaze matrix types used by the filter.

/* Returns "rows x columns" of a matrix, used in error messages */
std::string Shape_To_String(const blaze::DynamicMatrix<double> &M);

/* true if M is square and |M(i,j) - M(j,i)| <= tol * max(1, max|M|) for all i, j */
bool Is_Symmetric(const blaze::DynamicMatrix<double> &M, const double tol = 1.0e-9);

/* Returns 0.5 * (M + M^T); the result is exactly symmetric */
blaze::DynamicMatrix<double> Symmetrize(const blaze::DynamicMatrix<double> &M);

/* true if no entry is NaN or infinite */
bool Is_Finite(const blaze::DynamicMatrix<double> &M);
bool Is_Finite(const blaze::DynamicVector<double> &v);

/* Induced 1-norm: maximum absolute column sum */
double Norm1(const blaze::DynamicMatrix<double> &M);

/** @brief Inverts a square matrix and checks its 1-norm condition number.
 * @details Throws SingularInnovationCovarianceError if S is not square, has non-finite entries,
 *          cannot be inverted, or if ||S||_1 * ||S^-1||_1 is not finite or exceeds conditionLimit. */
blaze::DynamicMatrix<double> Invert_Checked(const blaze::DynamicMatrix<double> &S, const double conditionLimit);
