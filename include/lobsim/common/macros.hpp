#pragma once
/**
 * @file macros.hpp
 * @brief Branch hint, debug check and counter alignment macros
 */

#include <cassert>
#include <cstddef>

namespace lobsim {

/// Counters written by the engine and read by stats readers sit on their own line
inline constexpr std::size_t CACHE_LINE_SIZE = 64;

#define LOBSIM_CACHE_ALIGNED alignas(lobsim::CACHE_LINE_SIZE)

/// Rejections, full stores and unknown ids are the cold path.
/// Usage: if LOBSIM_UNLIKELY(cond) { ... }
#define LOBSIM_UNLIKELY(x) (x) [[unlikely]]

/// Book invariants checked in debug builds only; failures are never reported this way
#ifdef NDEBUG
    #define LOBSIM_ASSERT(cond) ((void)0)
#else
    #define LOBSIM_ASSERT(cond) assert(cond)
#endif

} // namespace lobsim
