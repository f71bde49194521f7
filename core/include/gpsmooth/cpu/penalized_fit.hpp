#ifndef GPSMOOTH_CPU_PENALIZED_FIT_HPP
#define GPSMOOTH_CPU_PENALIZED_FIT_HPP

#pragma once

#include "gpsmooth/detail/config.hpp"
#include "gpsmooth/model.hpp"
#include "gpsmooth/observations.hpp"

#include <span>
#include <vector>

GPSMOOTH_NS_BEGIN

namespace cpu
{

/**
 * @brief Penalized weighted least squares system diagonalized for a single
 * smoothing parameter.
 *
 * With X^T W X = L L^T and L^-1 S L^-T = U diag(s) U^T, all quantities of the
 * fit become scalar functions of lambda. The same object evaluates both
 * criteria and the coefficients at any lambda.
 */
struct DiagonalizedSystem
{
    /** @brief Number of observations */
    std::size_t n;

    /** @brief Basis dimension */
    std::size_t k;

    /** @brief Norms of the weighted design columns, the system is solved in unit scaled columns */
    std::vector<double> column_scale;

    /** @brief Cholesky factor L of the column scaled X^T W X */
    std::vector<double> chol;

    /** @brief Eigenvalues s of L^-1 S L^-T, descending and non-negative */
    std::vector<double> eigenvalues;

    /** @brief Eigenvectors U, row-major k x k */
    std::vector<double> eigenvectors;

    /** @brief Rotated response z = U^T L^-1 X^T W y */
    std::vector<double> z;

    /** @brief Part of the weighted response outside the column space of X */
    double residual_base;

    /** @brief log |X^T W X| */
    double log_det_gram;

    /** @brief Sum of the log prior weights */
    double log_weight_sum;

    /** @brief Rank of the penalty */
    std::size_t penalty_rank;

    /** @brief Log pseudo-determinant of the penalty */
    double log_det_penalty;

    /**
     * @brief Weighted residual sum of squares
     */
    double rss(double log_lambda) const;

    /**
     * @brief Penalized deviance, RSS plus the penalty term
     */
    double penalized_deviance(double log_lambda) const;

    /**
     * @brief Effective degrees of freedom
     */
    double edf(double log_lambda) const;

    /**
     * @brief Laplace approximate REML with profiled scale, lower is better
     */
    double reml(double log_lambda) const;

    /**
     * @brief Generalized cross validation score
     */
    double gcv(double log_lambda, double gamma) const;

    /**
     * @brief Penalized least squares coefficients
     */
    std::vector<double> coefficients(double log_lambda) const;

    /**
     * @brief Unscaled factor F with (X^T W X + lambda S)^-1 = F F^T
     */
    std::vector<double> inverse_factor(double log_lambda) const;
};

/**
 * @brief Diagonalize the penalized system of a design and penalty.
 *
 * @param X Row-major n x k design matrix
 * @param basis Penalty with its rank and log pseudo-determinant
 * @param observations Response and prior weights
 * @param params Rank tolerance
 *
 * @throws FitConvergenceError if X^T W X is not numerically positive
 *         definite
 */
DiagonalizedSystem diagonalize(std::span<const double> X,
                               const GPSmoothBasis &basis,
                               const Observations &observations,
                               const FitParams &params);

/**
 * @brief Minimize the criterion over the log smoothing parameter.
 *
 * Coarse scan over [log_lambda_min, log_lambda_max] followed by a
 * golden-section search in the bracket around the best scan point.
 *
 * @return Minimizing log smoothing parameter
 *
 * @throws FitConvergenceError if the iteration or time cap is exceeded or no
 *         finite criterion value exists
 */
double select_log_lambda(const DiagonalizedSystem &system, const FitParams &params);

/**
 * @brief Fit a Gaussian process smooth at a fixed range.
 *
 * @throws FitConvergenceError if the fit does not converge
 * @throws std::invalid_argument for invalid observations or smooth
 */
FittedModel
fit_gp_smooth(const Observations &observations, const SmoothSpec &smooth, double range, const FitParams &params);

}  // namespace cpu

GPSMOOTH_NS_END

#endif
