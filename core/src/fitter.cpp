#include "gpsmooth/fitter.hpp"

#include "gpsmooth/cpu/basis.hpp"
#include "gpsmooth/cpu/penalized_fit.hpp"

#include <stdexcept>

GPSMOOTH_NS_BEGIN

void Fitter::validate(const Observations &, const SmoothSpec &) const { }

GPSmoothFitter::GPSmoothFitter(FitParams fit_params) :
    params(fit_params)
{ }

FittedModel GPSmoothFitter::fit(const Observations &observations, const SmoothSpec &smooth, double range) const
{
    return cpu::fit_gp_smooth(observations, smooth, range, params);
}

bool GPSmoothFitter::lower_is_better() const { return true; }

void GPSmoothFitter::validate(const Observations &observations, const SmoothSpec &smooth) const
{
    const std::size_t n_knots = select_knots(distinct_covariates(observations), params.max_knots).size();
    if (smooth.basis_size > n_knots)
    {
        throw std::invalid_argument("Error: Basis size " + std::to_string(smooth.basis_size) + " of " + smooth.name()
                                    + " exceeds the " + std::to_string(n_knots) + " knots left after thinning.");
    }
}

std::string GPSmoothFitter::repr() const { return "GPSmoothFitter: [" + params.repr() + "]"; }

GPSMOOTH_NS_END
