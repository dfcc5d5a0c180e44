/*
 * memview_tools.hpp
 *
 * Portability helpers shared by the memview headers.
 * - Force/no-inline attributes and branch hints.
 * - Exception-mode aware try/catch tokens.
 * - The explicit "unsafe" tag for trusted raw constructors.
 */

#ifndef MEMVIEW_TOOLS_HPP_
#define MEMVIEW_TOOLS_HPP_

#include "memview_config.hpp"

// ============================================================================
// ASSERT Macro
// ============================================================================
#ifndef MEMVIEW_ASSERT
#  define MEMVIEW_ASSERT(x)
#endif /* MEMVIEW_ASSERT */

/* ---------------------------------------------------------------------------
 * MV_FORCEINLINE: "strong" inlining hint for headers
 * ------------------------------------------------------------------------- */
#ifndef MV_FORCEINLINE
#  if defined(_MSC_VER)
#    define MV_FORCEINLINE __forceinline
#  elif defined(__clang__) || defined(__GNUC__)
#    define MV_FORCEINLINE inline __attribute__((always_inline))
#  else
#    define MV_FORCEINLINE inline
#  endif
#endif /* MV_FORCEINLINE */

/* ---------------------------------------------------------------------------
 * MV_NOINLINE: keep cold paths (throw helpers) out of the callers.
 * ------------------------------------------------------------------------- */
#ifndef MV_NOINLINE
#  if defined(_MSC_VER)
#    define MV_NOINLINE __declspec(noinline)
#  elif defined(__clang__) || defined(__GNUC__)
#    define MV_NOINLINE __attribute__((noinline))
#  else
#    define MV_NOINLINE
#  endif
#endif /* MV_NOINLINE */

#ifndef MV_LIKELY
#  if defined(__clang__) || defined(__GNUC__)
#    define MV_LIKELY(x)   __builtin_expect(!!(x), 1)
#  else
#    define MV_LIKELY(x)   (x)
#  endif
#endif /* MV_LIKELY */

#ifndef MV_UNLIKELY
#  if defined(__clang__) || defined(__GNUC__)
#    define MV_UNLIKELY(x) __builtin_expect(!!(x), 0)
#  else
#    define MV_UNLIKELY(x) (x)
#  endif
#endif /* MV_UNLIKELY */

// ============================================================================
// Exceptions helpers
// ============================================================================

#if MEMVIEW_ENABLE_EXCEPTIONS
#  if !defined(__cpp_exceptions) && !defined(__EXCEPTIONS) && \
        !(defined(_MSC_VER) && defined(_CPPUNWIND))
#    error "MEMVIEW_ENABLE_EXCEPTIONS=1 but compiler appears to have exceptions disabled"
#  endif
#endif /* MEMVIEW_ENABLE_EXCEPTIONS */

#if !defined(MEMVIEW_TRY)
#  if MEMVIEW_ENABLE_EXCEPTIONS
#    define MEMVIEW_TRY       try
#    define MEMVIEW_CATCH_ALL catch (...)
#    define MEMVIEW_RETHROW   throw
#  else
#    define MEMVIEW_TRY
#    define MEMVIEW_CATCH_ALL if constexpr (false)
#    define MEMVIEW_RETHROW
#  endif
#endif /* MEMVIEW_TRY */

// ============================================================================
// C++20 SPAN (the bounded pointer view produced by materialization)
// ============================================================================
#if defined(__has_include)
#  if !__has_include(<span>) || (__cplusplus < 202002L)
#    error "memview requires C++20 <span>"
#  endif
#endif /* __has_include */

#include <span>

namespace memview {

// Tag type for trusted constructors that skip validation.
// Use: memview::memory<T>(memview::unsafe, rep);
struct unsafe_t { explicit constexpr unsafe_t() = default; };
inline constexpr unsafe_t unsafe{};

} // namespace memview

#endif /* MEMVIEW_TOOLS_HPP_ */
