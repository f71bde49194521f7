#ifndef GPSMOOTH_FITTER_HPP
#define GPSMOOTH_FITTER_HPP

#pragma once

#include "gpsmooth/covariance.hpp"
#include "gpsmooth/detail/config.hpp"
#include "gpsmooth/hyperparameters.hpp"
#include "gpsmooth/model.hpp"
#include "gpsmooth/observations.hpp"

#include <string>

GPSMOOTH_NS_BEGIN

/**
 * @brief Penalized regression fitter driven by the range profiler.
 *
 * Implementations must be safe to call concurrently from several tasks and
 * must not keep state between calls.
 */
struct Fitter
{
    /**
     * @brief Fit one smooth at a fixed range.
     *
     * Implemented by subclasses.
     *
     * @throws FitError (or a subclass) if the fit fails
     */
    virtual FittedModel fit(const Observations &observations, const SmoothSpec &smooth, double range) const = 0;

    /**
     * @brief Returns true if a smaller criterion score is a better fit.
     *
     * Implemented by subclasses.
     */
    virtual bool lower_is_better() const = 0;

    /**
     * @brief Returns string representation of the fitter.
     *
     * Implemented by subclasses.
     */
    virtual std::string repr() const = 0;

    /**
     * @brief Check a smooth against the fitter's own limits before any fit.
     *
     * Called once per smooth by the profiler during setup. The default
     * accepts everything.
     *
     * @throws std::invalid_argument if the smooth can never be fitted
     */
    virtual void validate(const Observations &observations, const SmoothSpec &smooth) const;

    virtual ~Fitter() { }

  protected:
    Fitter() = default;
};

/**
 * @brief Gaussian process smooth fitted by penalized weighted least squares
 * with REML or GCV smoothness selection.
 */
struct GPSmoothFitter : public Fitter
{
  public:
    /** @brief Fit settings */
    FitParams params;

    explicit GPSmoothFitter(FitParams fit_params = FitParams());

    FittedModel fit(const Observations &observations, const SmoothSpec &smooth, double range) const override;

    /**
     * @brief Returns true because both REML and GCV are minimized.
     */
    bool lower_is_better() const override;

    std::string repr() const override;

    /**
     * @brief Rejects a basis size above the number of knots left after
     * thinning to FitParams::max_knots.
     */
    void validate(const Observations &observations, const SmoothSpec &smooth) const override;
};

GPSMOOTH_NS_END

#endif
