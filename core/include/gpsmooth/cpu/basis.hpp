#ifndef GPSMOOTH_CPU_BASIS_HPP
#define GPSMOOTH_CPU_BASIS_HPP

#pragma once

#include "gpsmooth/covariance.hpp"
#include "gpsmooth/detail/config.hpp"
#include "gpsmooth/hyperparameters.hpp"

#include <cstddef>
#include <vector>

GPSMOOTH_NS_BEGIN

/**
 * @brief Reduced rank Gaussian process basis of one covariate and its penalty.
 *
 * Columns are ordered [smooth part (k - 2), intercept, linear trend]. The
 * smooth part is the knot correlation eigenbasis projected onto the
 * complement of the null space, so the model is identifiable.
 */
struct GPSmoothBasis
{
    /** @brief Correlation family */
    CovarianceFamily family;

    /** @brief Range used to evaluate the correlation */
    double range;

    /** @brief Sorted knots */
    std::vector<double> knots;

    /** @brief Basis dimension k */
    std::size_t basis_size;

    /** @brief Knot count x (k - 2) projection U_k Z */
    std::vector<double> projection;

    /** @brief Centre of the linear null space function */
    double shift;

    /** @brief Scale of the linear null space function */
    double scale;

    /** @brief Full k x k penalty matrix */
    std::vector<double> penalty;

    /** @brief Rank of the penalty, k - 2 */
    std::size_t penalty_rank;

    /** @brief Log pseudo-determinant of the penalty */
    double log_det_penalty;

    /**
     * @brief Number of unpenalized columns
     */
    std::size_t null_space_dim() const { return basis_size - penalty_rank; }
};

/**
 * @brief Choose knots from sorted distinct covariate values.
 *
 * Returns the values unchanged if there are at most max_knots of them,
 * otherwise an evenly spaced subset that keeps both ends.
 */
std::vector<double> select_knots(const std::vector<double> &distinct, std::size_t max_knots);

/**
 * @brief Build the basis and penalty of a smooth for one range.
 *
 * @param distinct Sorted distinct covariate values
 * @param smooth Family and basis size
 * @param range Positive range
 * @param params Knot and eigenvalue settings
 *
 * @throws std::invalid_argument for an unsupported basis size
 * @throws FitConvergenceError if the retained eigenbasis is numerically
 *         singular
 */
GPSmoothBasis
build_basis(const std::vector<double> &distinct, const SmoothSpec &smooth, double range, const FitParams &params);

/**
 * @brief Evaluate the basis at covariate values.
 *
 * @return Row-major n x k design matrix
 */
std::vector<double> design_matrix(const GPSmoothBasis &basis, const std::vector<double> &x);

GPSMOOTH_NS_END

#endif
