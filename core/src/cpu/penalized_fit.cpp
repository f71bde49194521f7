#include "gpsmooth/cpu/penalized_fit.hpp"

#include "gpsmooth/cpu/adapter_cblas_fp64.hpp"
#include "gpsmooth/errors.hpp"
#include "gpsmooth/performance_counters.hpp"

#include <algorithm>
#include <cmath>
#include <hpx/timing/high_resolution_timer.hpp>
#include <limits>
#include <numbers>
#include <sstream>
#include <string>

GPSMOOTH_NS_BEGIN

namespace cpu
{

namespace
{

double evaluate_criterion(const DiagonalizedSystem &system, const FitParams &params, double log_lambda)
{
    return params.criterion == Criterion::REML ? system.reml(log_lambda) : system.gcv(log_lambda, params.gamma);
}

void check_time_cap(const hpx::chrono::high_resolution_timer &timer, const FitParams &params)
{
    if (params.max_seconds > 0.0 && timer.elapsed() > params.max_seconds)
    {
        std::ostringstream oss;
        oss << "Smoothing parameter search exceeded " << params.max_seconds << " s";
        throw FitConvergenceError(oss.str());
    }
}

}  // namespace

///////////////////////////////////////////////////////////
// Criteria as functions of the log smoothing parameter

double DiagonalizedSystem::rss(double log_lambda) const
{
    const double lambda = std::exp(log_lambda);
    double result = residual_base;
    for (std::size_t i = 0; i < k; i++)
    {
        const double t = lambda * eigenvalues[i];
        const double shrink = t / (1.0 + t);
        result += z[i] * z[i] * shrink * shrink;
    }
    return result;
}

double DiagonalizedSystem::penalized_deviance(double log_lambda) const
{
    const double lambda = std::exp(log_lambda);
    double result = residual_base;
    for (std::size_t i = 0; i < k; i++)
    {
        const double t = lambda * eigenvalues[i];
        result += z[i] * z[i] * t / (1.0 + t);
    }
    return result;
}

double DiagonalizedSystem::edf(double log_lambda) const
{
    const double lambda = std::exp(log_lambda);
    double result = 0.0;
    for (std::size_t i = 0; i < k; i++)
    {
        result += 1.0 / (1.0 + lambda * eigenvalues[i]);
    }
    return result;
}

double DiagonalizedSystem::reml(double log_lambda) const
{
    const double lambda = std::exp(log_lambda);
    const double residual_df = static_cast<double>(n - (k - penalty_rank));
    const double phi = penalized_deviance(log_lambda) / residual_df;
    if (!(phi > 0.0))
    {
        return std::numeric_limits<double>::infinity();
    }

    double log_det_penalized = log_det_gram;
    for (std::size_t i = 0; i < k; i++)
    {
        log_det_penalized += std::log1p(lambda * eigenvalues[i]);
    }

    // 0.5 * [(n - Mp) (log(2 pi phi) + 1) + log|X'WX + lambda S| - log|lambda S|_+ - sum log w]
    return 0.5
           * (residual_df * (std::log(2.0 * std::numbers::pi * phi) + 1.0) + log_det_penalized
              - static_cast<double>(penalty_rank) * log_lambda - log_det_penalty - log_weight_sum);
}

double DiagonalizedSystem::gcv(double log_lambda, double gamma) const
{
    const double nd = static_cast<double>(n);
    const double denominator = nd - gamma * edf(log_lambda);
    if (!(denominator > 0.0))
    {
        return std::numeric_limits<double>::infinity();
    }
    return nd * rss(log_lambda) / (denominator * denominator);
}

std::vector<double> DiagonalizedSystem::coefficients(double log_lambda) const
{
    const double lambda = std::exp(log_lambda);
    std::vector<double> a(k);
    for (std::size_t i = 0; i < k; i++)
    {
        a[i] = z[i] / (1.0 + lambda * eigenvalues[i]);
    }
    // beta = L^-T U a
    std::vector<double> v = gemv(eigenvectors, a, static_cast<int>(k), static_cast<int>(k), Blas_no_trans);
    std::vector<double> beta = trsv(chol, std::move(v), static_cast<int>(k), Blas_lower, Blas_trans);
    for (std::size_t j = 0; j < k; j++)
    {
        beta[j] /= column_scale[j];
    }
    return beta;
}

std::vector<double> DiagonalizedSystem::inverse_factor(double log_lambda) const
{
    const double lambda = std::exp(log_lambda);
    // G = U diag(1 / sqrt(1 + lambda s))
    std::vector<double> G(eigenvectors);
    for (std::size_t i = 0; i < k; i++)
    {
        for (std::size_t j = 0; j < k; j++)
        {
            G[i * k + j] /= std::sqrt(1.0 + lambda * eigenvalues[j]);
        }
    }
    // F = L^-T G
    std::vector<double> F =
        trsm(chol, std::move(G), static_cast<int>(k), static_cast<int>(k), Blas_lower, Blas_trans, Blas_left);
    for (std::size_t i = 0; i < k; i++)
    {
        for (std::size_t j = 0; j < k; j++)
        {
            F[i * k + j] /= column_scale[i];
        }
    }
    return F;
}

///////////////////////////////////////////////////////////
// Fit

DiagonalizedSystem diagonalize(std::span<const double> X,
                               const GPSmoothBasis &basis,
                               const Observations &observations,
                               const FitParams &params)
{
    GPSMOOTH_TIME_FUNCTION(&diagonalize);
    DiagonalizedSystem system;
    system.n = observations.size();
    system.k = basis.basis_size;
    system.penalty_rank = basis.penalty_rank;
    system.log_det_penalty = basis.log_det_penalty;

    const std::size_t n = system.n;
    const std::size_t k = system.k;
    const int N = static_cast<int>(n);
    const int K = static_cast<int>(k);

    // square root weighted design and response
    std::vector<double> Xw(X.begin(), X.end());
    std::vector<double> yw(n);
    system.log_weight_sum = 0.0;
    for (std::size_t i = 0; i < n; i++)
    {
        const double sw = std::sqrt(observations.weights[i]);
        for (std::size_t j = 0; j < k; j++)
        {
            Xw[i * k + j] *= sw;
        }
        yw[i] = observations.response[i] * sw;
        system.log_weight_sum += std::log(observations.weights[i]);
    }

    // unit column norms; criteria and eigenvalues do not depend on the column scaling
    system.column_scale.assign(k, 0.0);
    for (std::size_t i = 0; i < n; i++)
    {
        for (std::size_t j = 0; j < k; j++)
        {
            system.column_scale[j] += Xw[i * k + j] * Xw[i * k + j];
        }
    }
    system.log_det_gram = 0.0;
    for (std::size_t j = 0; j < k; j++)
    {
        if (!(system.column_scale[j] > 0.0))
        {
            throw FitConvergenceError("Design column " + std::to_string(j) + " is zero at all observations");
        }
        system.column_scale[j] = std::sqrt(system.column_scale[j]);
        system.log_det_gram += 2.0 * std::log(system.column_scale[j]);
    }
    for (std::size_t i = 0; i < n; i++)
    {
        for (std::size_t j = 0; j < k; j++)
        {
            Xw[i * k + j] /= system.column_scale[j];
        }
    }
    std::vector<double> penalty(basis.penalty);
    for (std::size_t i = 0; i < k; i++)
    {
        for (std::size_t j = 0; j < k; j++)
        {
            penalty[i * k + j] /= system.column_scale[i] * system.column_scale[j];
        }
    }

    // X'WX = L L^T
    system.chol = potrf(gram(Xw, N, K), K);
    double min_pivot = std::numeric_limits<double>::infinity();
    double max_pivot = 0.0;
    for (std::size_t i = 0; i < k; i++)
    {
        const double pivot = system.chol[i * k + i];
        min_pivot = std::min(min_pivot, pivot * pivot);
        max_pivot = std::max(max_pivot, pivot * pivot);
        system.log_det_gram += 2.0 * std::log(pivot);
    }
    if (!(min_pivot > params.rank_tolerance * max_pivot))
    {
        std::ostringstream oss;
        oss << "Weighted design is rank deficient: pivot ratio " << min_pivot / max_pivot;
        throw FitConvergenceError(oss.str());
    }

    // L^-1 S L^-T
    std::vector<double> M = trsm(system.chol, std::move(penalty), K, K, Blas_lower, Blas_no_trans, Blas_left);
    M = trsm(system.chol, std::move(M), K, K, Blas_lower, Blas_trans, Blas_right);
    for (std::size_t i = 0; i < k; i++)
    {
        for (std::size_t j = 0; j < i; j++)
        {
            const double sym = 0.5 * (M[i * k + j] + M[j * k + i]);
            M[i * k + j] = sym;
            M[j * k + i] = sym;
        }
    }
    syevr(std::move(M), K, K, system.eigenvalues, system.eigenvectors);
    for (double &s : system.eigenvalues)
    {
        // null space directions come out as round-off around zero
        s = std::max(s, 0.0);
    }

    // z = U^T L^-1 X^T W y
    std::vector<double> c = gemv(Xw, yw, N, K, Blas_trans);
    c = trsv(system.chol, std::move(c), K, Blas_lower, Blas_no_trans);
    system.z = gemv(system.eigenvectors, c, K, K, Blas_trans);

    system.residual_base = dot(yw, yw, N) - dot(system.z, system.z, K);
    system.residual_base = std::max(system.residual_base, 0.0);
    return system;
}

double select_log_lambda(const DiagonalizedSystem &system, const FitParams &params)
{
    GPSMOOTH_TIME_FUNCTION(&select_log_lambda);
    if (!(params.log_lambda_max > params.log_lambda_min) || params.n_scan < 3)
    {
        throw std::invalid_argument("Invalid smoothing parameter search: " + params.repr());
    }
    hpx::chrono::high_resolution_timer timer;

    // coarse scan
    const double step = (params.log_lambda_max - params.log_lambda_min) / static_cast<double>(params.n_scan - 1);
    std::size_t best = params.n_scan;
    double best_score = std::numeric_limits<double>::infinity();
    for (std::size_t j = 0; j < params.n_scan; j++)
    {
        const double score = evaluate_criterion(system, params, params.log_lambda_min + step * static_cast<double>(j));
        if (std::isfinite(score) && score < best_score)
        {
            best = j;
            best_score = score;
        }
    }
    if (best == params.n_scan)
    {
        throw FitConvergenceError("Criterion is not finite anywhere on the smoothing parameter scan");
    }
    check_time_cap(timer, params);

    // golden-section refinement in the bracket around the best scan point
    const double inv_phi = (std::sqrt(5.0) - 1.0) / 2.0;
    double a = params.log_lambda_min + step * static_cast<double>(best == 0 ? 0 : best - 1);
    double b = params.log_lambda_min + step * static_cast<double>(std::min(best + 1, params.n_scan - 1));
    double c = b - inv_phi * (b - a);
    double d = a + inv_phi * (b - a);
    double fc = evaluate_criterion(system, params, c);
    double fd = evaluate_criterion(system, params, d);
    int iter = 0;
    while (b - a > params.tolerance)
    {
        if (iter++ >= params.max_iter)
        {
            std::ostringstream oss;
            oss << "Smoothing parameter search did not converge in " << params.max_iter << " iterations";
            throw FitConvergenceError(oss.str());
        }
        check_time_cap(timer, params);
        if (fc < fd)
        {
            b = d;
            d = c;
            fd = fc;
            c = b - inv_phi * (b - a);
            fc = evaluate_criterion(system, params, c);
        }
        else
        {
            a = c;
            c = d;
            fc = fd;
            d = a + inv_phi * (b - a);
            fd = evaluate_criterion(system, params, d);
        }
    }

    const double refined = 0.5 * (a + b);
    const double refined_score = evaluate_criterion(system, params, refined);
    if (std::isfinite(refined_score) && refined_score <= best_score)
    {
        return refined;
    }
    return params.log_lambda_min + step * static_cast<double>(best);
}

FittedModel
fit_gp_smooth(const Observations &observations, const SmoothSpec &smooth, double range, const FitParams &params)
{
    GPSMOOTH_TIME_FUNCTION(&fit_gp_smooth);
    validate_observations(observations);

    FittedModel model;
    model.basis = build_basis(distinct_covariates(observations), smooth, range, params);
    model.criterion = params.criterion;
    model.n_observations = observations.size();

    const std::size_t n = observations.size();
    const std::size_t k = model.basis.basis_size;
    const std::vector<double> X = design_matrix(model.basis, observations.covariate);
    const DiagonalizedSystem system = diagonalize(X, model.basis, observations, params);

    model.log_lambda = select_log_lambda(system, params);
    model.criterion_score = evaluate_criterion(system, params, model.log_lambda);
    if (!std::isfinite(model.criterion_score))
    {
        throw FitConvergenceError("Non-finite " + criterion_name(params.criterion) + " at the optimum");
    }

    model.coefficients = system.coefficients(model.log_lambda);
    model.fitted_values = gemv(X, model.coefficients, static_cast<int>(n), static_cast<int>(k), Blas_no_trans);
    model.edf = system.edf(model.log_lambda);

    const double residual_df = static_cast<double>(n) - model.edf;
    if (!(residual_df > 0.0))
    {
        throw FitConvergenceError("No residual degrees of freedom left after the fit");
    }
    model.scale = system.rss(model.log_lambda) / residual_df;

    // Vp = scale * F F^T
    model.cov_factor = system.inverse_factor(model.log_lambda);
    const double root_scale = std::sqrt(model.scale);
    for (double &v : model.cov_factor)
    {
        v *= root_scale;
    }
    return model;
}

}  // namespace cpu

GPSMOOTH_NS_END
