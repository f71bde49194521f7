#include "gpsmooth/cpu/adapter_cblas_fp64.hpp"
#include "gpsmooth/errors.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cmath>
#include <stdexcept>
#include <vector>

using Catch::Matchers::WithinAbs;

TEST_CASE("Cholesky factor of a small matrix", "[adapter]")
{
    // A = L L^T with L = [[2, 0], [1, 3]]
    const std::vector<double> A{ 4.0, 2.0, 2.0, 10.0 };
    const auto L = gpsmooth::potrf(A, 2);
    REQUIRE_THAT(L[0], WithinAbs(2.0, 1e-14));
    REQUIRE(L[1] == 0.0);
    REQUIRE_THAT(L[2], WithinAbs(1.0, 1e-14));
    REQUIRE_THAT(L[3], WithinAbs(3.0, 1e-14));

    // solve L L^T x = A e_1
    auto x = gpsmooth::trsv(L, { 4.0, 2.0 }, 2, gpsmooth::Blas_lower, gpsmooth::Blas_no_trans);
    x = gpsmooth::trsv(L, std::move(x), 2, gpsmooth::Blas_lower, gpsmooth::Blas_trans);
    REQUIRE_THAT(x[0], WithinAbs(1.0, 1e-14));
    REQUIRE_THAT(x[1], WithinAbs(0.0, 1e-14));
}

TEST_CASE("Indefinite matrices fail to factor", "[adapter]")
{
    const std::vector<double> A{ 1.0, 2.0, 2.0, 1.0 };
    REQUIRE_THROWS_AS(gpsmooth::potrf(A, 2), gpsmooth::FitConvergenceError);
}

TEST_CASE("Leading eigenpairs come out in descending order", "[adapter]")
{
    const std::vector<double> A{ 2.0, 0.0, 0.0, 0.0, 5.0, 0.0, 0.0, 0.0, 3.0 };
    std::vector<double> values;
    std::vector<double> vectors;
    gpsmooth::syevr(A, 3, 2, values, vectors);
    REQUIRE(values.size() == 2);
    REQUIRE(vectors.size() == 3 * 2);
    REQUIRE_THAT(values[0], WithinAbs(5.0, 1e-12));
    REQUIRE_THAT(values[1], WithinAbs(3.0, 1e-12));
    REQUIRE_THAT(std::abs(vectors[1 * 2 + 0]), WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(std::abs(vectors[2 * 2 + 1]), WithinAbs(1.0, 1e-12));

    REQUIRE_THROWS_AS(gpsmooth::syevr(A, 3, 4, values, vectors), std::invalid_argument);
}

TEST_CASE("Null space complement is orthonormal and orthogonal to the input", "[adapter]")
{
    // 4 x 2 matrix of a constant and a linear column
    const std::vector<double> A{ 1.0, -1.5, 1.0, -0.5, 1.0, 0.5, 1.0, 1.5 };
    const auto Z = gpsmooth::null_space_complement(A, 4, 2);
    REQUIRE(Z.size() == 4 * 2);

    const auto AtZ = gpsmooth::gemm(A, Z, 2, 2, 4, gpsmooth::Blas_trans, gpsmooth::Blas_no_trans);
    for (const double v : AtZ)
    {
        REQUIRE_THAT(v, WithinAbs(0.0, 1e-12));
    }
    const auto ZtZ = gpsmooth::gram(Z, 4, 2);
    REQUIRE_THAT(ZtZ[0], WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(ZtZ[1], WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(ZtZ[3], WithinAbs(1.0, 1e-12));

    REQUIRE_THROWS_AS(gpsmooth::null_space_complement(A, 2, 4), std::invalid_argument);
}

TEST_CASE("Level 1 and 2 helpers", "[adapter]")
{
    const std::vector<double> a{ 1.0, 2.0, 3.0 };
    REQUIRE(gpsmooth::dot(a, a, 3) == 14.0);

    // 2 x 3 matrix
    const std::vector<double> A{ 1.0, 0.0, 2.0, 0.0, 1.0, 1.0 };
    const auto b = gpsmooth::gemv(A, a, 2, 3, gpsmooth::Blas_no_trans);
    REQUIRE(b == std::vector<double>{ 7.0, 5.0 });
    const std::vector<double> ones{ 1.0, 1.0 };
    const auto c = gpsmooth::gemv(A, ones, 2, 3, gpsmooth::Blas_trans);
    REQUIRE(c == std::vector<double>{ 1.0, 1.0, 3.0 });
}
