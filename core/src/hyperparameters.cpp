#include "gpsmooth/hyperparameters.hpp"

#include <iomanip>
#include <sstream>

GPSMOOTH_NS_BEGIN

std::string criterion_name(Criterion criterion) { return criterion == Criterion::REML ? "REML" : "GCV"; }

FitParams::FitParams(Criterion crit, int max_i, double tol) :
    criterion(crit),
    log_lambda_min(-20.0),
    log_lambda_max(25.0),
    n_scan(46),
    tolerance(tol),
    max_iter(max_i),
    max_seconds(0.0),
    rank_tolerance(1e-12),
    eigen_tolerance(1e-10),
    max_knots(2000),
    gamma(1.0)
{ }

std::string FitParams::repr() const
{
    std::ostringstream oss;
    oss << std::setprecision(8);

    // clang-format off
    oss << "FitParams: [criterion=" << criterion_name(criterion)
                   << ", log_lambda=[" << log_lambda_min << ", " << log_lambda_max << "]"
                   << ", n_scan=" << n_scan
                   << ", tolerance=" << tolerance
                   << ", max_iter=" << max_iter
                   << ", max_seconds=" << max_seconds
                   << ", rank_tolerance=" << rank_tolerance
                   << ", eigen_tolerance=" << eigen_tolerance
                   << ", max_knots=" << max_knots
                   << ", gamma=" << gamma << "]";
    // clang-format on

    return oss.str();
}

std::string ProfileParams::repr() const
{
    std::ostringstream oss;

    // clang-format off
    oss << "ProfileParams: [tie_break=" << (tie_break == TieBreak::first_in_grid ? "first_in_grid" : "last_in_grid")
                       << ", batch_size=" << batch_size
                       << ", log_failures=" << log_failures
                       << ", verbose=" << verbose
                       << ", stop_early=" << (stop_early ? "set" : "unset") << "]";
    // clang-format on

    return oss.str();
}

GPSMOOTH_NS_END
