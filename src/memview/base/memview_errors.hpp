/*
 * memview_errors.hpp
 *
 * Error taxonomy of the memview views.
 *
 * - out_of_range          : start/length outside the current bound (caller bug).
 * - type_mismatch         : erased array element type is not usable as T (caller bug).
 * - destination_too_short : copy_to() target cannot hold the source.
 *
 * All three are precondition violations: they are raised at the call that
 * detected them and never retried. An owner of unknown kind is not an error
 * but a broken invariant, and terminates the process (fail_fast).
 *
 * With MEMVIEW_ENABLE_EXCEPTIONS == 0 every raise becomes MEMVIEW_ASSERT + abort.
 */

#ifndef MEMVIEW_ERRORS_HPP_
#define MEMVIEW_ERRORS_HPP_

#include <cstdio>      // std::fputs
#include <cstdlib>     // std::abort
#include <new>         // std::bad_alloc
#include <stdexcept>   // std::logic_error
#include <string>

#include "basic_types.h"
#include "memview_tools.hpp"

namespace memview {

enum class errc : u8 {
    out_of_range = 1,
    type_mismatch,
    destination_too_short
};

// Which argument of the failing call was rejected.
enum class argument : u8 {
    none = 0,
    start,
    length,
    array,
    text,
    manager,
    destination,
    element_index
};

[[nodiscard]] constexpr const char* to_string(const errc e) noexcept
{
    switch (e) {
    case errc::out_of_range:          return "out_of_range";
    case errc::type_mismatch:         return "type_mismatch";
    case errc::destination_too_short: return "destination_too_short";
    }
    return "unknown";
}

[[nodiscard]] constexpr const char* to_string(const argument a) noexcept
{
    switch (a) {
    case argument::none:          return "";
    case argument::start:         return "start";
    case argument::length:        return "length";
    case argument::array:         return "array";
    case argument::text:          return "text";
    case argument::manager:       return "manager";
    case argument::destination:   return "destination";
    case argument::element_index: return "element_index";
    }
    return "";
}

class memory_error : public std::logic_error
{
public:
    memory_error(const errc code, const argument arg, const char* message)
        : std::logic_error(compose(code, arg, message))
        , code_(code)
        , arg_(arg)
    {}

    [[nodiscard]] errc code() const noexcept { return code_; }
    [[nodiscard]] argument arg() const noexcept { return arg_; }

private:
    static std::string compose(const errc code, const argument arg, const char* message)
    {
        std::string s = "memview::";
        s += to_string(code);
        if (arg != argument::none) {
            s += " [";
            s += to_string(arg);
            s += ']';
        }
        s += ": ";
        s += message;
        return s;
    }

    errc     code_;
    argument arg_;
};

class out_of_range_error final : public memory_error
{
public:
    explicit out_of_range_error(const argument arg = argument::none)
        : memory_error(errc::out_of_range, arg,
                       "specified argument was out of the range of valid values")
    {}
};

class type_mismatch_error final : public memory_error
{
public:
    explicit type_mismatch_error(const argument arg = argument::array)
        : memory_error(errc::type_mismatch, arg,
                       "array element type is not compatible with the view element type")
    {}
};

class destination_too_short_error final : public memory_error
{
public:
    destination_too_short_error()
        : memory_error(errc::destination_too_short, argument::destination,
                       "destination is too short")
    {}
};

namespace detail::throw_helper {

// Broken invariant: no legal construction path produces this state.
[[noreturn]] MV_NOINLINE inline void fail_fast(const char* what) noexcept
{
    std::fputs("memview: fatal: ", stderr);
    std::fputs(what, stderr);
    std::fputs("\n", stderr);
    std::abort();
}

[[noreturn]] MV_NOINLINE inline void out_of_range(const argument arg = argument::none)
{
#if MEMVIEW_ENABLE_EXCEPTIONS
    throw out_of_range_error(arg);
#else
    (void)arg;
    MEMVIEW_ASSERT(false && "memview: out_of_range");
    std::abort();
#endif
}

[[noreturn]] MV_NOINLINE inline void type_mismatch(const argument arg = argument::array)
{
#if MEMVIEW_ENABLE_EXCEPTIONS
    throw type_mismatch_error(arg);
#else
    (void)arg;
    MEMVIEW_ASSERT(false && "memview: type_mismatch");
    std::abort();
#endif
}

[[noreturn]] MV_NOINLINE inline void destination_too_short()
{
#if MEMVIEW_ENABLE_EXCEPTIONS
    throw destination_too_short_error();
#else
    MEMVIEW_ASSERT(false && "memview: destination_too_short");
    std::abort();
#endif
}

// Owner storage could not be allocated (allocators in returns_null mode).
[[noreturn]] MV_NOINLINE inline void out_of_memory()
{
#if MEMVIEW_ENABLE_EXCEPTIONS
    throw std::bad_alloc{};
#else
    fail_fast("owner storage allocation failed");
#endif
}

} // namespace detail::throw_helper
} // namespace memview

#endif /* MEMVIEW_ERRORS_HPP_ */
