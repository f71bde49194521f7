#include "gpsmooth/covariance.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

GPSMOOTH_NS_BEGIN

CovarianceFamily squared_exponential() { return PowerExponential{ 2.0 }; }

CovarianceFamily matern(double order) { return Matern{ order }; }

void validate_family(const CovarianceFamily &family)
{
    if (const auto *pe = std::get_if<PowerExponential>(&family))
    {
        if (!(pe->power > 0.0 && pe->power <= 2.0))
        {
            throw std::invalid_argument("Power exponential power must be in (0, 2], got "
                                        + std::to_string(pe->power));
        }
    }
    else if (const auto *m = std::get_if<Matern>(&family))
    {
        if (m->order != 1.5 && m->order != 2.5 && m->order != 3.5)
        {
            throw std::invalid_argument("Matern order must be 1.5, 2.5 or 3.5, got " + std::to_string(m->order));
        }
    }
}

double correlation(const CovarianceFamily &family, double distance, double range)
{
    const double d = std::abs(distance) / range;

    if (std::holds_alternative<Spherical>(family))
    {
        if (d > 1.0)
        {
            return 0.0;
        }
        return 1.0 - 1.5 * d + 0.5 * d * d * d;
    }
    if (const auto *pe = std::get_if<PowerExponential>(&family))
    {
        return std::exp(-std::pow(d, pe->power));
    }

    const auto &m = std::get<Matern>(family);
    const double decay = std::exp(-d);
    if (m.order == 1.5)
    {
        return (1.0 + d) * decay;
    }
    if (m.order == 2.5)
    {
        return (1.0 + d + d * d / 3.0) * decay;
    }
    if (m.order == 3.5)
    {
        return (1.0 + d + 2.0 * d * d / 5.0 + d * d * d / 15.0) * decay;
    }
    throw std::invalid_argument("Unsupported Matern order " + std::to_string(m.order));
}

std::string family_name(const CovarianceFamily &family)
{
    std::ostringstream oss;
    if (std::holds_alternative<Spherical>(family))
    {
        oss << "spherical";
    }
    else if (const auto *pe = std::get_if<PowerExponential>(&family))
    {
        oss << "power_exp(" << pe->power << ")";
    }
    else
    {
        oss << "matern(" << std::get<Matern>(family).order << ")";
    }
    return oss.str();
}

SmoothSpec::SmoothSpec(CovarianceFamily in_family, std::size_t in_basis_size, std::string in_label) :
    family(in_family),
    basis_size(in_basis_size),
    label(std::move(in_label))
{
    if (label.empty())
    {
        label = family_name(family);
    }
}

std::string SmoothSpec::repr() const
{
    std::ostringstream oss;
    oss << "SmoothSpec: [label=" << label << ", family=" << family_name(family) << ", basis_size=" << basis_size
        << "]";
    return oss.str();
}

GPSMOOTH_NS_END
