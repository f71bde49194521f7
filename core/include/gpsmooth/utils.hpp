#ifndef GPSMOOTH_UTILS_HPP
#define GPSMOOTH_UTILS_HPP

#pragma once

#include "gpsmooth/detail/config.hpp"

#include <hpx/future.hpp>
#include <hpx/hpx_start.hpp>
#include <string>
#include <vector>

GPSMOOTH_NS_BEGIN

/**
 * @brief Print a vector
 *
 * @param vec Vector to print
 * @param start Start index
 * @param end End index
 * @param separator Separator between elements
 */
void print_vector(const std::vector<double> &vec, int start, int end, const std::string &separator);

/**
 * @brief Start HPX runtime
 *
 * @param argc Number of arguments
 * @param argv Arguments as array of strings
 */
void start_hpx_runtime(int argc, char **argv);

/**
 * @brief Stop HPX runtime
 */
void stop_hpx_runtime();

GPSMOOTH_NS_END

#endif
