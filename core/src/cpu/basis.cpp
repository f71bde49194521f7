#include "gpsmooth/cpu/basis.hpp"

#include "gpsmooth/cpu/adapter_cblas_fp64.hpp"
#include "gpsmooth/errors.hpp"
#include "gpsmooth/performance_counters.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

GPSMOOTH_NS_BEGIN

std::vector<double> select_knots(const std::vector<double> &distinct, std::size_t max_knots)
{
    if (max_knots < 2 || distinct.size() <= max_knots)
    {
        return distinct;
    }
    std::vector<double> knots;
    knots.reserve(max_knots);
    const double step = static_cast<double>(distinct.size() - 1) / static_cast<double>(max_knots - 1);
    for (std::size_t i = 0; i < max_knots; i++)
    {
        const auto idx = static_cast<std::size_t>(std::lround(step * static_cast<double>(i)));
        knots.push_back(distinct[idx]);
    }
    return knots;
}

GPSmoothBasis
build_basis(const std::vector<double> &distinct, const SmoothSpec &smooth, double range, const FitParams &params)
{
    GPSMOOTH_TIME_FUNCTION(&build_basis);
    validate_family(smooth.family);
    if (!(range > 0.0) || !std::isfinite(range))
    {
        throw std::invalid_argument("Range must be positive and finite, got " + std::to_string(range));
    }

    GPSmoothBasis basis;
    basis.family = smooth.family;
    basis.range = range;
    basis.knots = select_knots(distinct, params.max_knots);
    basis.basis_size = smooth.basis_size;

    const std::size_t m = basis.knots.size();
    const std::size_t k = smooth.basis_size;
    if (k <= 2 || k > m)
    {
        std::ostringstream oss;
        oss << "Basis size " << k << " of " << smooth.name() << " must be in (2, " << m << "]";
        throw std::invalid_argument(oss.str());
    }
    const std::size_t n_smooth = k - 2;

    // knot correlation matrix
    std::vector<double> E(m * m);
    for (std::size_t i = 0; i < m; i++)
    {
        E[i * m + i] = 1.0;
        for (std::size_t j = 0; j < i; j++)
        {
            const double c = correlation(smooth.family, basis.knots[i] - basis.knots[j], range);
            E[i * m + j] = c;
            E[j * m + i] = c;
        }
    }

    std::vector<double> D;
    std::vector<double> U;
    syevr(std::move(E), static_cast<int>(m), static_cast<int>(k), D, U);
    if (!(D.back() > params.eigen_tolerance * D.front()))
    {
        std::ostringstream oss;
        oss << "Singular " << smooth.name() << " basis at range " << range << ": eigenvalue ratio "
            << D.back() / D.front();
        throw FitConvergenceError(oss.str());
    }

    // linear null space evaluated at the knots
    double mean = 0.0;
    for (const double v : basis.knots)
    {
        mean += v;
    }
    mean /= static_cast<double>(m);
    double spread = 0.0;
    for (const double v : basis.knots)
    {
        spread += (v - mean) * (v - mean);
    }
    basis.shift = mean;
    basis.scale = std::sqrt(spread / static_cast<double>(m));

    std::vector<double> T(m * 2);
    for (std::size_t i = 0; i < m; i++)
    {
        T[i * 2] = 1.0;
        T[i * 2 + 1] = (basis.knots[i] - basis.shift) / basis.scale;
    }

    // absorb T^T U_k delta = 0
    std::vector<double> C = gemm(U, T, static_cast<int>(k), 2, static_cast<int>(m), Blas_trans, Blas_no_trans);
    std::vector<double> Z = null_space_complement(std::move(C), static_cast<int>(k), 2);
    basis.projection =
        gemm(U, Z, static_cast<int>(m), static_cast<int>(n_smooth), static_cast<int>(k), Blas_no_trans, Blas_no_trans);

    // penalty block Z^T D_k Z
    std::vector<double> DZ(Z);
    for (std::size_t i = 0; i < k; i++)
    {
        for (std::size_t j = 0; j < n_smooth; j++)
        {
            DZ[i * n_smooth + j] *= D[i];
        }
    }
    std::vector<double> B = gemm(
        Z, DZ, static_cast<int>(n_smooth), static_cast<int>(n_smooth), static_cast<int>(k), Blas_trans, Blas_no_trans);

    basis.penalty.assign(k * k, 0.0);
    for (std::size_t i = 0; i < n_smooth; i++)
    {
        for (std::size_t j = 0; j < n_smooth; j++)
        {
            basis.penalty[i * k + j] = B[i * n_smooth + j];
        }
    }
    basis.penalty_rank = n_smooth;

    const std::vector<double> L = potrf(std::move(B), static_cast<int>(n_smooth));
    basis.log_det_penalty = 0.0;
    for (std::size_t i = 0; i < n_smooth; i++)
    {
        basis.log_det_penalty += 2.0 * std::log(L[i * n_smooth + i]);
    }
    return basis;
}

std::vector<double> design_matrix(const GPSmoothBasis &basis, const std::vector<double> &x)
{
    GPSMOOTH_TIME_FUNCTION(&design_matrix);
    const std::size_t n = x.size();
    const std::size_t m = basis.knots.size();
    const std::size_t k = basis.basis_size;
    const std::size_t n_smooth = basis.penalty_rank;
    if (n == 0)
    {
        return {};
    }

    std::vector<double> Ex(n * m);
    for (std::size_t i = 0; i < n; i++)
    {
        for (std::size_t j = 0; j < m; j++)
        {
            Ex[i * m + j] = correlation(basis.family, x[i] - basis.knots[j], basis.range);
        }
    }
    const std::vector<double> smooth_part = gemm(
        Ex, basis.projection, static_cast<int>(n), static_cast<int>(n_smooth), static_cast<int>(m), Blas_no_trans,
        Blas_no_trans);

    std::vector<double> X(n * k);
    for (std::size_t i = 0; i < n; i++)
    {
        for (std::size_t j = 0; j < n_smooth; j++)
        {
            X[i * k + j] = smooth_part[i * n_smooth + j];
        }
        X[i * k + n_smooth] = 1.0;
        X[i * k + n_smooth + 1] = (x[i] - basis.shift) / basis.scale;
    }
    return X;
}

GPSMOOTH_NS_END
