#ifndef GPSMOOTH_CPU_ADAPTER_CBLAS_FP64_HPP
#define GPSMOOTH_CPU_ADAPTER_CBLAS_FP64_HPP

#pragma once

#include "gpsmooth/detail/config.hpp"

#include <span>
#include <vector>

GPSMOOTH_NS_BEGIN

// Constants that are compatible with CBLAS
typedef enum BLAS_TRANSPOSE { Blas_no_trans = 111, Blas_trans = 112 } BLAS_TRANSPOSE;

typedef enum BLAS_SIDE { Blas_left = 141, Blas_right = 142 } BLAS_SIDE;

typedef enum BLAS_UPLO { Blas_upper = 121, Blas_lower = 122 } BLAS_UPLO;

// All matrices are dense and row-major.

// BLAS level 3 operations

/**
 * @brief FP64 Cholesky decomposition A = L * L^T
 * @param A symmetric positive definite matrix, only the lower triangle is read
 * @param N matrix dimension
 * @return lower triangular factor L, upper triangle set to zero
 * @throws FitConvergenceError if A is not positive definite
 */
std::vector<double> potrf(std::vector<double> A, int N);

/**
 * @brief FP64 solve T(^T) * X = A or X * T(^T) = A where T triangular
 * @param T triangular matrix, N x N for the left side and M x M for the right side
 * @param A right hand side matrix N x M
 * @param N first dimension of A
 * @param M second dimension of A
 * @param uplo_T whether T is lower or upper triangular
 * @param transpose_T transpose triangular matrix
 * @param side_T side of the triangular matrix
 * @return solution matrix X
 */
std::vector<double>
trsm(std::span<const double> T,
     std::vector<double> A,
     int N,
     int M,
     BLAS_UPLO uplo_T,
     BLAS_TRANSPOSE transpose_T,
     BLAS_SIDE side_T);

/**
 * @brief FP64 Gram matrix C = A^T * A
 * @param A matrix N x M
 * @param N first dimension
 * @param M second dimension
 * @return full symmetric matrix C of size M x M
 */
std::vector<double> gram(std::span<const double> A, int N, int M);

/**
 * @brief FP64 General matrix-matrix multiplication: C = A(^T) * B(^T)
 * @param A left matrix, N x K after optional transposition
 * @param B right matrix, K x M after optional transposition
 * @param N rows of the result
 * @param M columns of the result
 * @param K inner dimension
 * @param transpose_A transpose left matrix
 * @param transpose_B transpose right matrix
 * @return product matrix of size N x M
 */
std::vector<double>
gemm(std::span<const double> A,
     std::span<const double> B,
     int N,
     int M,
     int K,
     BLAS_TRANSPOSE transpose_A,
     BLAS_TRANSPOSE transpose_B);

// BLAS level 2 operations

/**
 * @brief FP64 solve T(^T) * x = a where T triangular
 * @param T triangular matrix N x N
 * @param a right hand side vector
 * @param N matrix dimension
 * @param uplo_T whether T is lower or upper triangular
 * @param transpose_T transpose triangular matrix
 * @return solution vector x
 */
std::vector<double>
trsv(std::span<const double> T, std::vector<double> a, int N, BLAS_UPLO uplo_T, BLAS_TRANSPOSE transpose_T);

/**
 * @brief FP64 General matrix-vector multiplication: b = A(^T) * a
 * @param A matrix N x M
 * @param a vector of size M (N if transposed)
 * @param N first matrix dimension
 * @param M second matrix dimension
 * @param transpose_A transpose matrix
 * @return product vector
 */
std::vector<double>
gemv(std::span<const double> A, std::span<const double> a, int N, int M, BLAS_TRANSPOSE transpose_A);

// BLAS level 1 operations

/**
 * @brief FP64 Dot product: a * b
 * @param a left vector
 * @param b right vector
 * @param N vector length
 * @return a * b
 */
double dot(std::span<const double> a, std::span<const double> b, int N);

// LAPACK eigen and orthogonal factorizations

/**
 * @brief FP64 eigen-decomposition of a symmetric matrix, largest eigenvalues first
 * @param A symmetric matrix N x N
 * @param N matrix dimension
 * @param K number of leading eigenpairs to compute, 0 < K <= N
 * @param values resulting eigenvalues, descending
 * @param vectors resulting eigenvectors as columns of an N x K matrix
 * @throws FitConvergenceError if the LAPACK driver does not converge
 */
void syevr(std::vector<double> A, int N, int K, std::vector<double> &values, std::vector<double> &vectors);

/**
 * @brief FP64 orthonormal basis of the orthogonal complement of the column space of A
 * @param A matrix N x M with N > M and full column rank
 * @param N first dimension
 * @param M second dimension
 * @return matrix N x (N - M) with orthonormal columns, each orthogonal to the columns of A
 */
std::vector<double> null_space_complement(std::vector<double> A, int N, int M);

GPSMOOTH_NS_END

#endif
