#ifndef GPSMOOTH_MODEL_HPP
#define GPSMOOTH_MODEL_HPP

#pragma once

#include "gpsmooth/cpu/basis.hpp"
#include "gpsmooth/detail/config.hpp"
#include "gpsmooth/hyperparameters.hpp"

#include <cstddef>
#include <string>
#include <vector>

GPSMOOTH_NS_BEGIN

/**
 * @brief Result of one penalized fit of a Gaussian process smooth.
 *
 * Owns its basis, so it can be evaluated at new covariate values without the
 * training data.
 */
struct FittedModel
{
    /** @brief Basis and penalty, including family and range */
    GPSmoothBasis basis;

    /** @brief Criterion used to select the smoothing parameter */
    Criterion criterion;

    /** @brief Selected log smoothing parameter */
    double log_lambda;

    /** @brief Coefficients, ordered like the basis columns */
    std::vector<double> coefficients;

    /** @brief Fitted values at the training covariates */
    std::vector<double> fitted_values;

    /** @brief Effective degrees of freedom */
    double edf;

    /** @brief Residual scale estimate */
    double scale;

    /** @brief Criterion value at the optimum, lower is better */
    double criterion_score;

    /**
     * @brief Factor F of the posterior coefficient covariance, Vp = F F^T,
     * row-major k x k
     */
    std::vector<double> cov_factor;

    /** @brief Number of observations used in the fit */
    std::size_t n_observations;

    /**
     * @brief Selected smoothing parameter
     */
    double lambda() const;

    /**
     * @brief Range of the smooth
     */
    double range() const { return basis.range; }

    /**
     * @brief Returns a string representation of the fitted model
     */
    std::string repr() const;
};

/**
 * @brief Evaluate the fitted smooth at new covariate values
 *
 * @param model Fitted model
 * @param x New covariate values
 *
 * @return Fitted mean per point
 */
std::vector<double> predict(const FittedModel &model, const std::vector<double> &x);

/**
 * @brief Evaluate the fitted smooth and its standard error at new covariate
 * values.
 *
 * @return Vector of two vectors: mean and standard error per point
 */
std::vector<std::vector<double>> predict_with_uncertainty(const FittedModel &model, const std::vector<double> &x);

/**
 * @brief Draw the fitted smooth from the posterior of its coefficients.
 *
 * Coefficients are drawn from N(beta, Vp). The same seed gives the same
 * draws.
 *
 * @param model Fitted model
 * @param n_draws Number of draws
 * @param x New covariate values
 * @param seed Seed of the random generator
 *
 * @return n_draws rows of len(x) values
 */
std::vector<std::vector<double>>
simulate(const FittedModel &model, std::size_t n_draws, const std::vector<double> &x, unsigned int seed = 42);

/**
 * @brief Simultaneous confidence band of the fitted smooth.
 *
 * The critical value is the level quantile of max |draw - mean| / se over
 * n_sims posterior draws, so the band covers the whole curve with the given
 * probability rather than each point separately.
 *
 * @param level Coverage in (0, 1)
 *
 * @return Vector of three vectors: mean, lower and upper bound per point
 */
std::vector<std::vector<double>> confidence_band(const FittedModel &model,
                                                 const std::vector<double> &x,
                                                 double level = 0.95,
                                                 std::size_t n_sims = 10000,
                                                 unsigned int seed = 42);

GPSMOOTH_NS_END

#endif
