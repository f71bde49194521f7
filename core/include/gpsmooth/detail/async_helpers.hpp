#ifndef GPSMOOTH_DETAIL_ASYNC_HELPERS_HPP
#define GPSMOOTH_DETAIL_ASYNC_HELPERS_HPP

#pragma once

#include "gpsmooth/detail/config.hpp"

#include <hpx/async_base/async.hpp>
#include <hpx/threading_base/annotated_function.hpp>

#include <utility>

GPSMOOTH_NS_BEGIN

namespace detail
{

// Functions prefixed with named_* allow the user to specify a custom name for this entry in the
// execution graph. Much like wrapping your function with hpx::annotated_function would.
// F may be any callable object, including a lambda.

template <typename F, typename... Args>
decltype(auto) named_async(const char *name, F &&f, Args &&...args)
{
    return hpx::async(hpx::annotated_function(std::forward<F>(f), name), std::forward<Args>(args)...);
}

}  // namespace detail

GPSMOOTH_NS_END

#endif
