#ifndef GPSMOOTH_PERFORMANCE_COUNTERS_HPP
#define GPSMOOTH_PERFORMANCE_COUNTERS_HPP

#pragma once

#include "gpsmooth/detail/config.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <hpx/modules/assertion.hpp>
#include <hpx/timing/high_resolution_timer.hpp>
#include <hpx/util/get_and_reset_value.hpp>

GPSMOOTH_NS_BEGIN

/// Per-function metrics keyed by the function itself, so each function gets exactly one instantiation.
template <auto F>
struct function_performance_metrics
{
    /// Number of times the function was called
    static std::atomic<std::uint64_t> num_calls;

    /// Total wall-clock time elapsed inside the function
    static std::atomic<std::uint64_t> elapsed_ns;
};

template <auto F>
/*static*/ std::atomic<std::uint64_t> function_performance_metrics<F>::num_calls(0);
template <auto F>
/*static*/ std::atomic<std::uint64_t> function_performance_metrics<F>::elapsed_ns(0);

/// @brief RAII helper accumulating a function's wall-clock execution time.
struct scoped_function_timer
{
    explicit scoped_function_timer(std::atomic<std::uint64_t> &num_calls, std::atomic<std::uint64_t> &in_total) :
        total(in_total)
    {
        ++num_calls;
    }

    ~scoped_function_timer()
    {
        const auto elapsed = timer.elapsed_nanoseconds();
        HPX_ASSERT(elapsed >= 0);
        if (elapsed > 0)
        {
            total += static_cast<std::uint64_t>(elapsed);
        }
    }

    std::atomic<std::uint64_t> &total;
    hpx::chrono::high_resolution_timer timer;
};

/// @brief Time the execution of the enclosing function from the current point to its end.
/// @param local_function The function key, usually the enclosing function.
#define GPSMOOTH_TIME_FUNCTION(local_function)                                                                         \
    scoped_function_timer _gpsmooth_fn_timer(function_performance_metrics<local_function>::num_calls,                  \
                                             function_performance_metrics<local_function>::elapsed_ns)

template <auto F>
std::uint64_t get_and_reset_function_elapsed(bool reset)
{
    return hpx::util::get_and_reset_value(function_performance_metrics<F>::elapsed_ns, reset);
}

template <auto F>
std::uint64_t get_and_reset_function_calls(bool reset)
{
    return hpx::util::get_and_reset_value(function_performance_metrics<F>::num_calls, reset);
}

void track_cell_fit();
void track_cell_failure();

/// @brief Number of profile cells fitted so far
std::uint64_t get_cell_fits(bool reset);

/// @brief Number of profile cells recorded as +infinity so far
std::uint64_t get_cell_failures(bool reset);

void register_performance_counters();

GPSMOOTH_NS_END

#endif
