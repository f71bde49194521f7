#ifndef GPSMOOTH_COVARIANCE_HPP
#define GPSMOOTH_COVARIANCE_HPP

#pragma once

#include "gpsmooth/detail/config.hpp"

#include <cstddef>
#include <string>
#include <variant>

GPSMOOTH_NS_BEGIN

/**
 * @brief Spherical correlation, compactly supported on [0, range]
 */
struct Spherical
{ };

/**
 * @brief Power exponential correlation exp(-(d/range)^power)
 */
struct PowerExponential
{
    /**
     * @brief Exponent of the scaled distance, 0 < power <= 2.
     *
     * A power of 2 gives the squared exponential family.
     */
    double power = 1.0;
};

/**
 * @brief Matérn correlation with half-integer smoothness
 */
struct Matern
{
    /**
     * @brief Smoothness order, one of 1.5, 2.5 or 3.5
     */
    double order = 1.5;
};

/**
 * @brief Parametric correlation family of a Gaussian process smooth.
 *
 * Every family takes a single positive range (effective correlation length)
 * which is supplied separately, so one descriptor can be profiled over a grid.
 */
using CovarianceFamily = std::variant<Spherical, PowerExponential, Matern>;

/**
 * @brief Power exponential family with power 2
 */
CovarianceFamily squared_exponential();

/**
 * @brief Matérn family of the given order
 */
CovarianceFamily matern(double order = 1.5);

/**
 * @brief Check the structural parameters of a family.
 *
 * @throws std::invalid_argument for a power outside (0, 2] or an unsupported
 *         Matérn order
 */
void validate_family(const CovarianceFamily &family);

/**
 * @brief Evaluate the correlation function.
 *
 * @param family The covariance family
 * @param distance Absolute distance between two covariate values
 * @param range The range parameter, must be positive
 *
 * @return Correlation in [0, 1]
 */
double correlation(const CovarianceFamily &family, double distance, double range);

/**
 * @brief Short name of the family, e.g. "matern(1.5)" or "power_exp(2)"
 */
std::string family_name(const CovarianceFamily &family);

/**
 * @brief A Gaussian process smooth of one covariate: family plus basis size.
 */
struct SmoothSpec
{
    /** @brief Correlation family */
    CovarianceFamily family;

    /** @brief Basis dimension k, including the two null space functions */
    std::size_t basis_size;

    /** @brief Label used in logs and output; defaults to the family name */
    std::string label;

    SmoothSpec(CovarianceFamily in_family, std::size_t in_basis_size, std::string in_label = {});

    /**
     * @brief Returns the label
     */
    const std::string &name() const { return label; }

    /**
     * @brief Returns a string representation of the smooth
     */
    std::string repr() const;
};

GPSMOOTH_NS_END

#endif
