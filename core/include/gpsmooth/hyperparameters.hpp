#ifndef GPSMOOTH_HYPERPARAMETERS_HPP
#define GPSMOOTH_HYPERPARAMETERS_HPP

#pragma once

#include "gpsmooth/detail/config.hpp"

#include <cstddef>
#include <functional>
#include <string>

GPSMOOTH_NS_BEGIN

/**
 * @brief Smoothness selection criterion, both lower-is-better
 */
enum class Criterion { REML, GCV };

/**
 * @brief Returns "REML" or "GCV"
 */
std::string criterion_name(Criterion criterion);

/**
 * @brief Settings of the penalized fit and its smoothing parameter search
 */
struct FitParams
{
    /**
     * @brief Criterion minimized over the log smoothing parameter
     */
    Criterion criterion;

    /**
     * @brief Lower bound of the log smoothing parameter search
     */
    double log_lambda_min;

    /**
     * @brief Upper bound of the log smoothing parameter search
     */
    double log_lambda_max;

    /**
     * @brief Number of points of the coarse scan preceding the refinement
     */
    std::size_t n_scan;

    /**
     * @brief Width of the log smoothing parameter bracket at convergence
     */
    double tolerance;

    /**
     * @brief Iteration cap of the golden-section refinement.
     *
     * Exceeding it is a convergence failure.
     */
    int max_iter;

    /**
     * @brief Wall-clock cap of a single fit in seconds, 0 disables it
     */
    double max_seconds;

    /**
     * @brief Relative threshold below which a Cholesky pivot of X^T W X
     * counts as singular
     */
    double rank_tolerance;

    /**
     * @brief Relative threshold below which a retained eigenvalue of the
     * knot correlation matrix counts as singular
     */
    double eigen_tolerance;

    /**
     * @brief Maximum number of knots, larger covariates are thinned
     */
    std::size_t max_knots;

    /**
     * @brief GCV degrees of freedom inflation factor
     */
    double gamma;

    /**
     * @brief Initialize fit settings
     *
     * @param crit smoothness selection criterion
     * @param max_i iteration cap
     * @param tol bracket width at convergence
     */
    FitParams(Criterion crit = Criterion::REML, int max_i = 200, double tol = 1e-8);

    /**
     * @brief Returns a string representation of the settings
     */
    std::string repr() const;
};

/**
 * @brief Argmin policy when several ranges share the minimum score
 */
enum class TieBreak {
    /** @brief Earliest grid position, i.e. the smallest range */
    first_in_grid,
    /** @brief Latest grid position, i.e. the largest range */
    last_in_grid
};

struct ScoreTable;

/**
 * @brief Settings of the range profiler
 */
struct ProfileParams
{
    /** @brief Argmin tie-break policy */
    TieBreak tie_break = TieBreak::first_in_grid;

    /**
     * @brief Number of grid ranges evaluated per batch, 0 evaluates the whole
     * grid in one batch.
     *
     * Early stopping is only checked between batches.
     */
    std::size_t batch_size = 0;

    /** @brief Write failed cells to std::cerr */
    bool log_failures = true;

    /** @brief Write batch progress and selections to std::cerr */
    bool verbose = false;

    /**
     * @brief Optional early stopping predicate, called with the rectangular
     * table of all batches completed so far. Returning true ends the scan.
     */
    std::function<bool(const ScoreTable &)> stop_early;

    /**
     * @brief Returns a string representation of the settings
     */
    std::string repr() const;
};

GPSMOOTH_NS_END

#endif
