#ifndef GPSMOOTH_DETAIL_CONFIG_HPP
#define GPSMOOTH_DETAIL_CONFIG_HPP

#pragma once

// clang-format off
#define GPSMOOTH_NS gpsmooth::v1
#define GPSMOOTH_NS_BEGIN namespace gpsmooth { inline namespace v1 {
#define GPSMOOTH_NS_END } }
// clang-format on

#endif
