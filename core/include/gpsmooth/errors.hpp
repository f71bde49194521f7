#ifndef GPSMOOTH_ERRORS_HPP
#define GPSMOOTH_ERRORS_HPP

#pragma once

#include "gpsmooth/detail/config.hpp"

#include <stdexcept>
#include <string>

GPSMOOTH_NS_BEGIN

/**
 * @brief Base class of all failures of a single penalized fit.
 *
 * The profiler recovers from these locally and records the cell as
 * +infinity.
 */
class FitError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief The fitter did not reach a stable solution for a given family and
 * range: iteration or time cap exceeded, singular basis or normal equations,
 * or a non-finite criterion at the optimum.
 */
class FitConvergenceError : public FitError
{
  public:
    using FitError::FitError;
};

/**
 * @brief An observation carries a non-positive or non-finite weight.
 *
 * Raised during validation, before any fit is attempted.
 */
class DegenerateWeightError : public std::invalid_argument
{
  public:
    DegenerateWeightError(std::size_t index, double weight) :
        std::invalid_argument("Observation " + std::to_string(index) + " has non-positive weight "
                              + std::to_string(weight)),
        index_(index),
        weight_(weight)
    { }

    /** @brief Position of the offending observation */
    std::size_t index() const noexcept { return index_; }

    /** @brief The offending weight */
    double weight() const noexcept { return weight_; }

  private:
    std::size_t index_;
    double weight_;
};

/**
 * @brief Every grid point of a family failed, so no best range exists.
 */
class AllCandidatesFailedError : public std::runtime_error
{
  public:
    explicit AllCandidatesFailedError(const std::string &family) :
        std::runtime_error("All range candidates failed for family " + family),
        family_(family)
    { }

    const std::string &family() const noexcept { return family_; }

  private:
    std::string family_;
};

GPSMOOTH_NS_END

#endif
