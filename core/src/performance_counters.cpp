#include "gpsmooth/performance_counters.hpp"

#include "gpsmooth/cpu/basis.hpp"
#include "gpsmooth/cpu/penalized_fit.hpp"
#include "gpsmooth/profiler.hpp"

#include <atomic>
#include <hpx/util/get_and_reset_value.hpp>
#ifdef HPX_HAVE_MODULE_PERFORMANCE_COUNTERS
#include <hpx/performance_counters/manage_counter_type.hpp>
#endif

GPSMOOTH_NS_BEGIN

#define GPSMOOTH_MAKE_SIMPLE_COUNTER_ACCESSOR(name)                                                                    \
    static std::atomic<std::uint64_t> name(0);                                                                         \
    std::uint64_t get_##name(bool reset) { return hpx::util::get_and_reset_value(name, reset); }

GPSMOOTH_MAKE_SIMPLE_COUNTER_ACCESSOR(cell_fits)
GPSMOOTH_MAKE_SIMPLE_COUNTER_ACCESSOR(cell_failures)

#undef GPSMOOTH_MAKE_SIMPLE_COUNTER_ACCESSOR

void track_cell_fit() { cell_fits += 1; }

void track_cell_failure() { cell_failures += 1; }

#ifdef HPX_HAVE_MODULE_PERFORMANCE_COUNTERS
// Non-public function of the fp64 adapter CU.
namespace detail
{
void register_fp64_performance_counters();
}  // namespace detail

void register_performance_counters()
{
#define GPSMOOTH_MAKE_SIMPLE_COUNTER_ACCESSOR(name, stats_expr)                                                        \
    hpx::performance_counters::install_counter_type(                                                                   \
        name,                                                                                                          \
        [](bool reset) { return hpx::util::get_and_reset_value(stats_expr, reset); },                                  \
        #stats_expr,                                                                                                   \
        "",                                                                                                            \
        hpx::performance_counters::counter_type::monotonically_increasing)

    GPSMOOTH_MAKE_SIMPLE_COUNTER_ACCESSOR("/gpsmooth/profile/num_fits", cell_fits);
    GPSMOOTH_MAKE_SIMPLE_COUNTER_ACCESSOR("/gpsmooth/profile/num_failed_fits", cell_failures);

#undef GPSMOOTH_MAKE_SIMPLE_COUNTER_ACCESSOR

#define GPSMOOTH_MAKE_TIMER_ACCESSOR(name, fn_expr)                                                                    \
    hpx::performance_counters::install_counter_type(                                                                   \
        name,                                                                                                          \
        get_and_reset_function_elapsed<fn_expr>,                                                                       \
        #fn_expr,                                                                                                      \
        "",                                                                                                            \
        hpx::performance_counters::counter_type::monotonically_increasing)

    GPSMOOTH_MAKE_TIMER_ACCESSOR("/gpsmooth/profile/time", &profile_ranges);
    GPSMOOTH_MAKE_TIMER_ACCESSOR("/gpsmooth/fit/time", &cpu::fit_gp_smooth);
    GPSMOOTH_MAKE_TIMER_ACCESSOR("/gpsmooth/fit/diagonalize_time", &cpu::diagonalize);
    GPSMOOTH_MAKE_TIMER_ACCESSOR("/gpsmooth/fit/smoothing_search_time", &cpu::select_log_lambda);
    GPSMOOTH_MAKE_TIMER_ACCESSOR("/gpsmooth/basis/time", &build_basis);
    GPSMOOTH_MAKE_TIMER_ACCESSOR("/gpsmooth/basis/design_time", &design_matrix);
    GPSMOOTH_MAKE_TIMER_ACCESSOR("/gpsmooth/model/simulate_time", &simulate);

#undef GPSMOOTH_MAKE_TIMER_ACCESSOR

#define GPSMOOTH_MAKE_CALLS_ACCESSOR(name, fn_expr)                                                                    \
    hpx::performance_counters::install_counter_type(                                                                   \
        name,                                                                                                          \
        get_and_reset_function_calls<fn_expr>,                                                                         \
        #fn_expr,                                                                                                      \
        "",                                                                                                            \
        hpx::performance_counters::counter_type::monotonically_increasing)

    GPSMOOTH_MAKE_CALLS_ACCESSOR("/gpsmooth/fit/count", &cpu::fit_gp_smooth);
    GPSMOOTH_MAKE_CALLS_ACCESSOR("/gpsmooth/model/simulate_count", &simulate);

#undef GPSMOOTH_MAKE_CALLS_ACCESSOR

    detail::register_fp64_performance_counters();
}
#else
void register_performance_counters()
{
    // no-op for binary compatibility
}
#endif

GPSMOOTH_NS_END
