#include "gpsmooth/cpu/adapter_cblas_fp64.hpp"

#include "gpsmooth/errors.hpp"
#include "gpsmooth/performance_counters.hpp"

#ifdef HPX_HAVE_MODULE_PERFORMANCE_COUNTERS
#include <hpx/performance_counters/manage_counter_type.hpp>
#endif

#ifdef GPSMOOTH_ENABLE_MKL
// MKL CBLAS and LAPACKE
#include "mkl_cblas.h"
#include "mkl_lapacke.h"
#else
#include "cblas.h"
#include "lapacke.h"
#endif

#include <stdexcept>
#include <string>

GPSMOOTH_NS_BEGIN

namespace
{

void check_lapack_info(lapack_int info, const char *routine)
{
    if (info < 0)
    {
        throw std::invalid_argument(std::string(routine) + ": illegal value in argument " + std::to_string(-info));
    }
    if (info > 0)
    {
        throw FitConvergenceError(std::string(routine) + ": numerical failure (info=" + std::to_string(info) + ")");
    }
}

}  // namespace

// BLAS level 3 operations

std::vector<double> potrf(std::vector<double> A, const int N)
{
    GPSMOOTH_TIME_FUNCTION(&potrf);
    // POTRF: in-place Cholesky decomposition of A
    // use dpotrf2 recursive version for better stability
    check_lapack_info(LAPACKE_dpotrf2(LAPACK_ROW_MAJOR, 'L', N, A.data(), N), "potrf");
    // clear the untouched upper triangle
    for (std::size_t i = 0; i < static_cast<std::size_t>(N); i++)
    {
        for (std::size_t j = i + 1; j < static_cast<std::size_t>(N); j++)
        {
            A[i * static_cast<std::size_t>(N) + j] = 0.0;
        }
    }
    // return factorized matrix L
    return A;
}

std::vector<double>
trsm(std::span<const double> T,
     std::vector<double> A,
     const int N,
     const int M,
     const BLAS_UPLO uplo_T,
     const BLAS_TRANSPOSE transpose_T,
     const BLAS_SIDE side_T)
{
    GPSMOOTH_TIME_FUNCTION(&trsm);
    // TRSM constants
    const double alpha = 1.0;
    const int ld_T = side_T == Blas_left ? N : M;
    // TRSM: in-place solve T(^T) * X = A or X * T(^T) = A where T triangular
    cblas_dtrsm(
        CblasRowMajor,
        static_cast<CBLAS_SIDE>(side_T),
        static_cast<CBLAS_UPLO>(uplo_T),
        static_cast<CBLAS_TRANSPOSE>(transpose_T),
        CblasNonUnit,
        N,
        M,
        alpha,
        T.data(),
        ld_T,
        A.data(),
        M);
    // return solution
    return A;
}

std::vector<double> gram(std::span<const double> A, const int N, const int M)
{
    GPSMOOTH_TIME_FUNCTION(&gram);
    std::vector<double> C(static_cast<std::size_t>(M) * static_cast<std::size_t>(M), 0.0);
    // SYRK: C = A^T * A (lower triangle)
    cblas_dsyrk(CblasRowMajor, CblasLower, CblasTrans, M, N, 1.0, A.data(), M, 0.0, C.data(), M);
    // mirror to the upper triangle
    for (std::size_t i = 0; i < static_cast<std::size_t>(M); i++)
    {
        for (std::size_t j = i + 1; j < static_cast<std::size_t>(M); j++)
        {
            C[i * static_cast<std::size_t>(M) + j] = C[j * static_cast<std::size_t>(M) + i];
        }
    }
    return C;
}

std::vector<double>
gemm(std::span<const double> A,
     std::span<const double> B,
     const int N,
     const int M,
     const int K,
     const BLAS_TRANSPOSE transpose_A,
     const BLAS_TRANSPOSE transpose_B)
{
    GPSMOOTH_TIME_FUNCTION(&gemm);
    // GEMM constants
    const double alpha = 1.0;
    const double beta = 0.0;
    const int ld_A = transpose_A == Blas_no_trans ? K : N;
    const int ld_B = transpose_B == Blas_no_trans ? M : K;
    std::vector<double> C(static_cast<std::size_t>(N) * static_cast<std::size_t>(M), 0.0);
    // GEMM: C = A(^T) * B(^T)
    cblas_dgemm(
        CblasRowMajor,
        static_cast<CBLAS_TRANSPOSE>(transpose_A),
        static_cast<CBLAS_TRANSPOSE>(transpose_B),
        N,
        M,
        K,
        alpha,
        A.data(),
        ld_A,
        B.data(),
        ld_B,
        beta,
        C.data(),
        M);
    return C;
}

// BLAS level 2 operations

std::vector<double> trsv(std::span<const double> T,
                         std::vector<double> a,
                         const int N,
                         const BLAS_UPLO uplo_T,
                         const BLAS_TRANSPOSE transpose_T)
{
    GPSMOOTH_TIME_FUNCTION(&trsv);
    // TRSV: In-place solve T(^T) * x = a where T triangular
    cblas_dtrsv(CblasRowMajor,
                static_cast<CBLAS_UPLO>(uplo_T),
                static_cast<CBLAS_TRANSPOSE>(transpose_T),
                CblasNonUnit,
                N,
                T.data(),
                N,
                a.data(),
                1);
    // return solution vector x
    return a;
}

std::vector<double> gemv(
    std::span<const double> A, std::span<const double> a, const int N, const int M, const BLAS_TRANSPOSE transpose_A)
{
    GPSMOOTH_TIME_FUNCTION(&gemv);
    // GEMV constants
    const double alpha = 1.0;
    const double beta = 0.0;
    std::vector<double> b(static_cast<std::size_t>(transpose_A == Blas_no_trans ? N : M), 0.0);
    // GEMV: b = A(^T){NxM} * a
    cblas_dgemv(
        CblasRowMajor,
        static_cast<CBLAS_TRANSPOSE>(transpose_A),
        N,
        M,
        alpha,
        A.data(),
        M,
        a.data(),
        1,
        beta,
        b.data(),
        1);
    // return product vector b
    return b;
}

// BLAS level 1 operations

double dot(std::span<const double> a, std::span<const double> b, const int N)
{
    GPSMOOTH_TIME_FUNCTION(&dot);
    // DOT: a * b
    return cblas_ddot(N, a.data(), 1, b.data(), 1);
}

// LAPACK eigen and orthogonal factorizations

void syevr(std::vector<double> A, const int N, const int K, std::vector<double> &values, std::vector<double> &vectors)
{
    GPSMOOTH_TIME_FUNCTION(&syevr);
    if (K <= 0 || K > N)
    {
        throw std::invalid_argument("syevr: requested " + std::to_string(K) + " eigenpairs of a " + std::to_string(N)
                                    + " x " + std::to_string(N) + " matrix");
    }
    const auto n = static_cast<std::size_t>(N);
    const auto k = static_cast<std::size_t>(K);

    lapack_int found = 0;
    std::vector<double> w(n, 0.0);
    std::vector<double> z(n * k, 0.0);
    std::vector<lapack_int> isuppz(2 * k);
    // SYEVR: eigenpairs il..iu in ascending order, i.e. the K largest
    check_lapack_info(LAPACKE_dsyevr(LAPACK_ROW_MAJOR,
                                     'V',
                                     'I',
                                     'U',
                                     N,
                                     A.data(),
                                     N,
                                     0.0,
                                     0.0,
                                     N - K + 1,
                                     N,
                                     0.0,
                                     &found,
                                     w.data(),
                                     z.data(),
                                     K,
                                     isuppz.data()),
                      "syevr");
    if (found != K)
    {
        throw FitConvergenceError("syevr: found " + std::to_string(found) + " of " + std::to_string(K)
                                  + " eigenpairs");
    }

    // reorder to descending
    values.assign(k, 0.0);
    vectors.assign(n * k, 0.0);
    for (std::size_t j = 0; j < k; j++)
    {
        const std::size_t src = k - 1 - j;
        values[j] = w[src];
        for (std::size_t i = 0; i < n; i++)
        {
            vectors[i * k + j] = z[i * k + src];
        }
    }
}

std::vector<double> null_space_complement(std::vector<double> A, const int N, const int M)
{
    GPSMOOTH_TIME_FUNCTION(&null_space_complement);
    if (M >= N)
    {
        throw std::invalid_argument("null_space_complement: matrix must have more rows than columns");
    }
    const auto n = static_cast<std::size_t>(N);
    const auto m = static_cast<std::size_t>(M);

    std::vector<double> tau(m, 0.0);
    // GEQRF: A = Q * R with Householder reflectors below the diagonal
    check_lapack_info(LAPACKE_dgeqrf(LAPACK_ROW_MAJOR, N, M, A.data(), M, tau.data()), "geqrf");

    // expand the reflectors into the full N x N orthogonal matrix Q
    std::vector<double> Q(n * n, 0.0);
    for (std::size_t i = 0; i < n; i++)
    {
        for (std::size_t j = 0; j < m; j++)
        {
            Q[i * n + j] = A[i * m + j];
        }
    }
    check_lapack_info(LAPACKE_dorgqr(LAPACK_ROW_MAJOR, N, N, M, Q.data(), N, tau.data()), "orgqr");

    // trailing N - M columns span the orthogonal complement of range(A)
    std::vector<double> Z(n * (n - m), 0.0);
    for (std::size_t i = 0; i < n; i++)
    {
        for (std::size_t j = m; j < n; j++)
        {
            Z[i * (n - m) + (j - m)] = Q[i * n + j];
        }
    }
    return Z;
}

#ifdef HPX_HAVE_MODULE_PERFORMANCE_COUNTERS
namespace detail
{
void register_fp64_performance_counters()
{
#define GPSMOOTH_MAKE_TIMER_ACCESSOR(name, fn_expr)                                                           \
    hpx::performance_counters::install_counter_type(                                                                   \
        name,                                                                                                          \
        get_and_reset_function_elapsed<fn_expr>,                                                                       \
        #fn_expr,                                                                                                      \
        "",                                                                                                            \
        hpx::performance_counters::counter_type::monotonically_increasing)

    GPSMOOTH_MAKE_TIMER_ACCESSOR("/gpsmooth/potrf64/time", &potrf);
    GPSMOOTH_MAKE_TIMER_ACCESSOR("/gpsmooth/trsm64/time", &trsm);
    GPSMOOTH_MAKE_TIMER_ACCESSOR("/gpsmooth/gram64/time", &gram);
    GPSMOOTH_MAKE_TIMER_ACCESSOR("/gpsmooth/gemm64/time", &gemm);
    GPSMOOTH_MAKE_TIMER_ACCESSOR("/gpsmooth/trsv64/time", &trsv);
    GPSMOOTH_MAKE_TIMER_ACCESSOR("/gpsmooth/gemv64/time", &gemv);
    GPSMOOTH_MAKE_TIMER_ACCESSOR("/gpsmooth/dot64/time", &dot);
    GPSMOOTH_MAKE_TIMER_ACCESSOR("/gpsmooth/syevr64/time", &syevr);
    GPSMOOTH_MAKE_TIMER_ACCESSOR("/gpsmooth/null_space64/time", &null_space_complement);

#undef GPSMOOTH_MAKE_TIMER_ACCESSOR
}
}  // namespace detail
#endif

GPSMOOTH_NS_END
