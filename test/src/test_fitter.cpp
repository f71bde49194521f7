#include "gpsmooth/cpu/basis.hpp"
#include "gpsmooth/errors.hpp"
#include "gpsmooth/fitter.hpp"
#include "gpsmooth/model.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cmath>
#include <random>
#include <stdexcept>

using Catch::Matchers::WithinAbs;

namespace
{

// Straight line plus small noise, 60 points at unit spacing of 10
gpsmooth::Observations make_linear_series()
{
    std::mt19937 generator(7);
    std::normal_distribution<double> noise(0.0, 0.05);
    std::vector<double> x(60);
    std::vector<double> y(60);
    for (std::size_t i = 0; i < x.size(); i++)
    {
        x[i] = 10.0 * static_cast<double>(i);
        y[i] = 2.0 + 0.01 * x[i] + noise(generator);
    }
    return gpsmooth::make_observations(std::move(x), std::move(y));
}

std::vector<double> evaluation_points()
{
    std::vector<double> x;
    for (std::size_t i = 0; i < 25; i++)
    {
        x.push_back(24.0 * static_cast<double>(i));
    }
    return x;
}

}  // namespace

TEST_CASE("Near-linear data is recovered", "[fitter]")
{
    const auto observations = make_linear_series();
    const gpsmooth::GPSmoothFitter fitter;
    const auto model = fitter.fit(observations, gpsmooth::SmoothSpec(gpsmooth::matern(1.5), 12), 100.0);

    REQUIRE(model.n_observations == 60);
    REQUIRE(model.range() == 100.0);
    REQUIRE(model.criterion == gpsmooth::Criterion::REML);
    REQUIRE(std::isfinite(model.criterion_score));
    REQUIRE(model.scale > 0.0);
    REQUIRE(model.edf >= 2.0 - 1e-6);
    REQUIRE(model.edf <= 12.0 + 1e-6);
    REQUIRE(model.coefficients.size() == 12);
    REQUIRE(model.lambda() == std::exp(model.log_lambda));

    const auto x = evaluation_points();
    const auto mean = gpsmooth::predict(model, x);
    REQUIRE(mean.size() == x.size());
    for (std::size_t i = 0; i < x.size(); i++)
    {
        INFO("x = " << x[i]);
        REQUIRE_THAT(mean[i], WithinAbs(2.0 + 0.01 * x[i], 0.1));
    }

    const auto at_data = gpsmooth::predict(model, observations.covariate);
    for (std::size_t i = 0; i < at_data.size(); i++)
    {
        REQUIRE_THAT(at_data[i], WithinAbs(model.fitted_values[i], 1e-10));
    }
}

TEST_CASE("Standard errors are non-negative and predictions align", "[fitter]")
{
    const auto observations = make_linear_series();
    const gpsmooth::GPSmoothFitter fitter;
    const auto model = fitter.fit(observations, gpsmooth::SmoothSpec(gpsmooth::squared_exponential(), 10), 80.0);

    const auto x = evaluation_points();
    const auto mean_se = gpsmooth::predict_with_uncertainty(model, x);
    REQUIRE(mean_se.size() == 2);
    const auto mean = gpsmooth::predict(model, x);
    for (std::size_t i = 0; i < x.size(); i++)
    {
        REQUIRE(mean_se[1][i] >= 0.0);
        REQUIRE(std::isfinite(mean_se[1][i]));
        REQUIRE_THAT(mean_se[0][i], WithinAbs(mean[i], 1e-12));
    }

    const auto empty = gpsmooth::predict_with_uncertainty(model, {});
    REQUIRE(empty[0].empty());
    REQUIRE(empty[1].empty());
}

TEST_CASE("Scaling every weight leaves the fit unchanged", "[fitter]")
{
    const auto observations = make_linear_series();
    auto heavier = observations;
    for (double &w : heavier.weights)
    {
        w = 4.0;
    }
    const gpsmooth::GPSmoothFitter fitter;
    const gpsmooth::SmoothSpec smooth(gpsmooth::matern(2.5), 10);
    const auto a = fitter.fit(observations, smooth, 150.0);
    const auto b = fitter.fit(heavier, smooth, 150.0);
    for (std::size_t i = 0; i < a.fitted_values.size(); i++)
    {
        REQUIRE_THAT(a.fitted_values[i], WithinAbs(b.fitted_values[i], 1e-5));
    }
}

TEST_CASE("GCV selects a finite smoothing parameter", "[fitter]")
{
    const gpsmooth::GPSmoothFitter fitter(gpsmooth::FitParams(gpsmooth::Criterion::GCV));
    REQUIRE(fitter.lower_is_better());
    const auto model =
        fitter.fit(make_linear_series(), gpsmooth::SmoothSpec(gpsmooth::matern(1.5), 12), 100.0);
    REQUIRE(model.criterion == gpsmooth::Criterion::GCV);
    REQUIRE(std::isfinite(model.criterion_score));
    REQUIRE(model.criterion_score > 0.0);
    REQUIRE(std::isfinite(model.log_lambda));
}

TEST_CASE("Posterior simulation is reproducible", "[fitter][simulate]")
{
    const gpsmooth::GPSmoothFitter fitter;
    const auto model = fitter.fit(make_linear_series(), gpsmooth::SmoothSpec(gpsmooth::matern(1.5), 12), 100.0);
    const auto x = evaluation_points();

    const auto draws = gpsmooth::simulate(model, 5, x, 3);
    REQUIRE(draws.size() == 5);
    for (const auto &draw : draws)
    {
        REQUIRE(draw.size() == x.size());
    }
    REQUIRE(gpsmooth::simulate(model, 5, x, 3) == draws);
    REQUIRE(gpsmooth::simulate(model, 5, x, 4) != draws);
    REQUIRE(gpsmooth::simulate(model, 0, x).empty());
}

TEST_CASE("Simultaneous band encloses the fitted curve", "[fitter][simulate]")
{
    const gpsmooth::GPSmoothFitter fitter;
    const auto model = fitter.fit(make_linear_series(), gpsmooth::SmoothSpec(gpsmooth::matern(1.5), 12), 100.0);
    const auto x = evaluation_points();

    const auto band = gpsmooth::confidence_band(model, x, 0.95, 2000, 11);
    REQUIRE(band.size() == 3);
    const auto se = gpsmooth::predict_with_uncertainty(model, x)[1];
    for (std::size_t i = 0; i < x.size(); i++)
    {
        REQUIRE(band[1][i] <= band[0][i]);
        REQUIRE(band[0][i] <= band[2][i]);
        if (se[i] > 1e-8)
        {
            // simultaneous critical value exceeds the pointwise one
            REQUIRE((band[2][i] - band[0][i]) / se[i] >= 1.5);
        }
    }

    REQUIRE_THROWS_AS(gpsmooth::confidence_band(model, x, 1.0), std::invalid_argument);
    REQUIRE_THROWS_AS(gpsmooth::confidence_band(model, x, 0.95, 0), std::invalid_argument);
}

TEST_CASE("Fit failures are reported as fit errors", "[fitter][errors]")
{
    const auto observations = make_linear_series();
    const gpsmooth::SmoothSpec smooth(gpsmooth::matern(1.5), 12);

    SECTION("iteration cap")
    {
        gpsmooth::FitParams params;
        params.max_iter = 0;
        const gpsmooth::GPSmoothFitter fitter(params);
        REQUIRE_THROWS_AS(fitter.fit(observations, smooth, 100.0), gpsmooth::FitConvergenceError);
    }

    SECTION("singular basis")
    {
        gpsmooth::FitParams params;
        params.eigen_tolerance = 1.0;
        const gpsmooth::GPSmoothFitter fitter(params);
        REQUIRE_THROWS_AS(fitter.fit(observations, smooth, 100.0), gpsmooth::FitConvergenceError);
    }

    SECTION("invalid setups are not fit errors")
    {
        const gpsmooth::GPSmoothFitter fitter;
        REQUIRE_THROWS_AS(fitter.fit(observations, gpsmooth::SmoothSpec(gpsmooth::matern(1.5), 61), 100.0),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(fitter.fit(observations, gpsmooth::SmoothSpec(gpsmooth::matern(1.5), 2), 100.0),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(fitter.fit(observations, smooth, -1.0), std::invalid_argument);

        auto zero_weight = observations;
        zero_weight.weights[3] = 0.0;
        REQUIRE_THROWS_AS(fitter.fit(zero_weight, smooth, 100.0), gpsmooth::DegenerateWeightError);
    }
}

TEST_CASE("Basis absorbs the linear null space", "[basis]")
{
    std::vector<double> distinct;
    for (std::size_t i = 0; i < 40; i++)
    {
        distinct.push_back(5.0 * static_cast<double>(i));
    }
    const gpsmooth::FitParams params;
    const auto basis = gpsmooth::build_basis(distinct, gpsmooth::SmoothSpec(gpsmooth::matern(2.5), 10), 50.0, params);

    const std::size_t m = basis.knots.size();
    const std::size_t n_smooth = basis.penalty_rank;
    REQUIRE(m == 40);
    REQUIRE(n_smooth == 8);
    REQUIRE(basis.null_space_dim() == 2);
    REQUIRE(std::isfinite(basis.log_det_penalty));

    for (std::size_t j = 0; j < n_smooth; j++)
    {
        double constant = 0.0;
        double linear = 0.0;
        for (std::size_t i = 0; i < m; i++)
        {
            constant += basis.projection[i * n_smooth + j];
            linear += (basis.knots[i] - basis.shift) / basis.scale * basis.projection[i * n_smooth + j];
        }
        REQUIRE_THAT(constant, WithinAbs(0.0, 1e-10));
        REQUIRE_THAT(linear, WithinAbs(0.0, 1e-10));
    }

    const auto X = gpsmooth::design_matrix(basis, { 0.0, 100.0 });
    REQUIRE(X.size() == 2 * 10);
    REQUIRE(X[8] == 1.0);
    REQUIRE(X[10 + 8] == 1.0);
    REQUIRE(gpsmooth::design_matrix(basis, {}).empty());
}

TEST_CASE("Knots are thinned evenly over the distinct covariates", "[basis]")
{
    std::vector<double> distinct;
    for (std::size_t i = 0; i < 101; i++)
    {
        distinct.push_back(static_cast<double>(i));
    }
    const auto knots = gpsmooth::select_knots(distinct, 11);
    REQUIRE(knots.size() == 11);
    REQUIRE(knots.front() == 0.0);
    REQUIRE(knots.back() == 100.0);
    REQUIRE(knots[5] == 50.0);
    REQUIRE(gpsmooth::select_knots(distinct, 200) == distinct);
}
