#include "gpsmooth/model.hpp"

#include "gpsmooth/cpu/adapter_cblas_fp64.hpp"
#include "gpsmooth/performance_counters.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

GPSMOOTH_NS_BEGIN

double FittedModel::lambda() const { return std::exp(log_lambda); }

std::string FittedModel::repr() const
{
    std::ostringstream oss;
    oss << std::setprecision(8);

    // clang-format off
    oss << "FittedModel: [family=" << family_name(basis.family)
                     << ", range=" << basis.range
                     << ", k=" << basis.basis_size
                     << ", criterion=" << criterion_name(criterion)
                     << ", score=" << criterion_score
                     << ", log_lambda=" << log_lambda
                     << ", edf=" << edf
                     << ", scale=" << scale
                     << ", n=" << n_observations << "]";
    // clang-format on

    return oss.str();
}

std::vector<double> predict(const FittedModel &model, const std::vector<double> &x)
{
    if (x.empty())
    {
        return {};
    }
    const std::size_t k = model.basis.basis_size;
    const std::vector<double> X = design_matrix(model.basis, x);
    return gemv(X, model.coefficients, static_cast<int>(x.size()), static_cast<int>(k), Blas_no_trans);
}

std::vector<std::vector<double>> predict_with_uncertainty(const FittedModel &model, const std::vector<double> &x)
{
    if (x.empty())
    {
        return { {}, {} };
    }
    const std::size_t n = x.size();
    const std::size_t k = model.basis.basis_size;
    const std::vector<double> X = design_matrix(model.basis, x);
    std::vector<double> mean = gemv(X, model.coefficients, static_cast<int>(n), static_cast<int>(k), Blas_no_trans);

    // diag(X Vp X^T) = row sums of (X F)^2
    const std::vector<double> XF = gemm(
        X, model.cov_factor, static_cast<int>(n), static_cast<int>(k), static_cast<int>(k), Blas_no_trans, Blas_no_trans);
    std::vector<double> se(n, 0.0);
    for (std::size_t i = 0; i < n; i++)
    {
        double variance = 0.0;
        for (std::size_t j = 0; j < k; j++)
        {
            variance += XF[i * k + j] * XF[i * k + j];
        }
        se[i] = std::sqrt(variance);
    }
    return { std::move(mean), std::move(se) };
}

std::vector<std::vector<double>>
simulate(const FittedModel &model, std::size_t n_draws, const std::vector<double> &x, unsigned int seed)
{
    GPSMOOTH_TIME_FUNCTION(&simulate);
    std::vector<std::vector<double>> draws(n_draws);
    if (n_draws == 0 || x.empty())
    {
        return draws;
    }
    const std::size_t n = x.size();
    const std::size_t k = model.basis.basis_size;

    // standard normal innovations, n_draws x k
    std::mt19937 generator(seed);
    std::normal_distribution<double> normal(0.0, 1.0);
    std::vector<double> E(n_draws * k);
    for (double &e : E)
    {
        e = normal(generator);
    }

    // coefficient draws beta + F e, stored as rows
    std::vector<double> B = gemm(
        E, model.cov_factor, static_cast<int>(n_draws), static_cast<int>(k), static_cast<int>(k), Blas_no_trans,
        Blas_trans);
    for (std::size_t d = 0; d < n_draws; d++)
    {
        for (std::size_t j = 0; j < k; j++)
        {
            B[d * k + j] += model.coefficients[j];
        }
    }

    const std::vector<double> X = design_matrix(model.basis, x);
    const std::vector<double> curves = gemm(
        B, X, static_cast<int>(n_draws), static_cast<int>(n), static_cast<int>(k), Blas_no_trans, Blas_trans);
    for (std::size_t d = 0; d < n_draws; d++)
    {
        draws[d].assign(curves.begin() + static_cast<std::ptrdiff_t>(d * n),
                        curves.begin() + static_cast<std::ptrdiff_t>((d + 1) * n));
    }
    return draws;
}

std::vector<std::vector<double>> confidence_band(
    const FittedModel &model, const std::vector<double> &x, double level, std::size_t n_sims, unsigned int seed)
{
    if (!(level > 0.0 && level < 1.0))
    {
        throw std::invalid_argument("Confidence level must be in (0, 1), got " + std::to_string(level));
    }
    if (n_sims == 0)
    {
        throw std::invalid_argument("Confidence band needs at least one simulation");
    }
    auto mean_se = predict_with_uncertainty(model, x);
    std::vector<double> &mean = mean_se[0];
    const std::vector<double> &se = mean_se[1];
    if (x.empty())
    {
        return { {}, {}, {} };
    }

    // largest standardized deviation of each draw from the fitted curve
    const auto draws = simulate(model, n_sims, x, seed);
    std::vector<double> max_deviation(n_sims, 0.0);
    for (std::size_t d = 0; d < n_sims; d++)
    {
        for (std::size_t i = 0; i < x.size(); i++)
        {
            if (se[i] > 0.0)
            {
                max_deviation[d] = std::max(max_deviation[d], std::abs(draws[d][i] - mean[i]) / se[i]);
            }
        }
    }
    std::sort(max_deviation.begin(), max_deviation.end());
    const auto q = static_cast<std::size_t>(std::ceil(level * static_cast<double>(n_sims)));
    const double critical = max_deviation[std::min(std::max<std::size_t>(q, 1), n_sims) - 1];

    std::vector<double> lower(x.size());
    std::vector<double> upper(x.size());
    for (std::size_t i = 0; i < x.size(); i++)
    {
        lower[i] = mean[i] - critical * se[i];
        upper[i] = mean[i] + critical * se[i];
    }
    return { std::move(mean), std::move(lower), std::move(upper) };
}

GPSMOOTH_NS_END
