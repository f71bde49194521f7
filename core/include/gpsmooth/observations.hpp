#ifndef GPSMOOTH_OBSERVATIONS_HPP
#define GPSMOOTH_OBSERVATIONS_HPP

#pragma once

#include "gpsmooth/detail/config.hpp"

#include <cstddef>
#include <string>
#include <vector>

GPSMOOTH_NS_BEGIN

/**
 * @brief Ordered set of (covariate, response, weight) triples.
 *
 * Covariate values need not be sorted or uniformly spaced. Weights must be
 * strictly positive, see validate_observations().
 */
struct Observations
{
    /** @brief Covariate, e.g. sample age */
    std::vector<double> covariate;

    /** @brief Response, e.g. a proxy measurement */
    std::vector<double> response;

    /** @brief Prior weights */
    std::vector<double> weights;

    /**
     * @brief Number of observations
     */
    std::size_t size() const { return covariate.size(); }

    /**
     * @brief Returns a string representation of the observation set
     */
    std::string repr() const;
};

/**
 * @brief Build an observation set with unit weights
 */
Observations make_observations(std::vector<double> covariate, std::vector<double> response);

/**
 * @brief Build an observation set with the given weights
 */
Observations
make_observations(std::vector<double> covariate, std::vector<double> response, std::vector<double> weights);

/**
 * @brief Check an observation set before fitting.
 *
 * @throws DegenerateWeightError for a non-positive or non-finite weight
 * @throws std::invalid_argument for an empty set, mismatched lengths or
 *         non-finite covariate or response values
 */
void validate_observations(const Observations &observations);

/**
 * @brief Sorted distinct covariate values
 */
std::vector<double> distinct_covariates(const Observations &observations);

/**
 * @brief Load observations from a delimited text file.
 *
 * Columns are covariate, response and an optional weight, separated by
 * whitespace or commas. Lines starting with '#' are skipped, as is a
 * non-numeric first line (header).
 *
 * @param file_path Path to the file
 *
 * @throws std::runtime_error if the file cannot be opened or a row is
 *         malformed
 */
Observations load_observations(const std::string &file_path);

GPSMOOTH_NS_END

#endif
