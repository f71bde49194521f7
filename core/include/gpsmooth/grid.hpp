#ifndef GPSMOOTH_GRID_HPP
#define GPSMOOTH_GRID_HPP

#pragma once

#include "gpsmooth/detail/config.hpp"

#include <cstddef>
#include <vector>

GPSMOOTH_NS_BEGIN

/**
 * @brief Evenly spaced range candidates over [lower, upper].
 *
 * Both ends are included. A single point grid contains only lower.
 *
 * @param lower Smallest range, must be positive
 * @param upper Largest range, must not be smaller than lower
 * @param n Number of candidates, must be positive
 */
std::vector<double> make_range_grid(double lower, double upper, std::size_t n);

/**
 * @brief Range candidates lower, lower + step, ... not exceeding upper.
 *
 * @param lower Smallest range, must be positive
 * @param upper Upper limit
 * @param step Positive increment
 */
std::vector<double> make_range_grid_by_step(double lower, double upper, double step);

/**
 * @brief Check that a grid is non-empty, positive, finite and strictly
 * ascending.
 *
 * @throws std::invalid_argument otherwise
 */
void validate_grid(const std::vector<double> &grid);

GPSMOOTH_NS_END

#endif
