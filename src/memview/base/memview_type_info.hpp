/*
 * memview_type_info.hpp
 *
 * RTTI-free element identity for erased array owners.
 *
 * An array_base only knows its element type at run time. A view of T accepts
 * such an array when:
 *   - the element type is exactly T, or
 *   - both are integer types that differ only in signedness (int[] <-> unsigned[]),
 *     which are allowed to alias each other.
 * Pointer element types (the "reference type" case) require the exact type:
 * viewing Derived*[] as Base*[] would let a writer store a foreign Base*.
 */

#ifndef MEMVIEW_TYPE_INFO_HPP_
#define MEMVIEW_TYPE_INFO_HPP_

#include <string>
#include <string_view>
#include <type_traits>

#include "basic_types.h"
#include "memview_tools.hpp"

namespace memview::detail {

using type_id = const void*;

template<class T>
struct type_tag {
    static constexpr char id = 0;
};

// Distinct address per (cv-stripped) type, stable across translation units.
template<class T>
[[nodiscard]] constexpr type_id type_id_of() noexcept
{
    return &type_tag<std::remove_cv_t<T>>::id;
}

template<class T, typename = void>
struct storage_identity {
    using type = std::remove_cv_t<T>;
};

template<class T>
struct storage_identity<T, std::enable_if_t<
    std::is_integral_v<T> && !std::is_same_v<std::remove_cv_t<T>, bool>>> {
    using type = std::make_unsigned_t<std::remove_cv_t<T>>;
};

template<class T>
using storage_identity_t = typename storage_identity<T>::type;

struct element_info {
    type_id id;
    type_id storage_id;
    reg     size;
    bool    is_pointer;
};

template<class E>
inline constexpr element_info element_info_of{
    type_id_of<E>(),
    type_id_of<storage_identity_t<E>>(),
    sizeof(E),
    std::is_pointer_v<E>
};

template<class T>
[[nodiscard]] constexpr bool is_array_compatible(const element_info& e) noexcept
{
    if (e.id == type_id_of<T>()) {
        return true;
    }
    if (std::is_pointer_v<T> || e.is_pointer) {
        return false;
    }
    return (e.size == sizeof(T)) && (e.storage_id == type_id_of<storage_identity_t<T>>());
}

// Human readable type name for diagnostics (to_string of non-text views).
template<class T>
[[nodiscard]] std::string_view type_name() noexcept
{
#if defined(__clang__)
    const std::string_view sig  = __PRETTY_FUNCTION__;
    const std::string_view head = "T = ";
    const std::string_view stop = "]";
#elif defined(__GNUC__)
    const std::string_view sig  = __PRETTY_FUNCTION__;
    const std::string_view head = "T = ";
    const std::string_view stop = ";]";
#elif defined(_MSC_VER)
    const std::string_view sig  = __FUNCSIG__;
    const std::string_view head = "type_name<";
    const std::string_view stop = ">(";
#else
    return "?";
#endif

#if defined(__clang__) || defined(__GNUC__) || defined(_MSC_VER)
    const auto begin = sig.find(head);
    if (begin == std::string_view::npos) {
        return "?";
    }
    const auto from = begin + head.size();
#  if defined(_MSC_VER) && !defined(__clang__)
    const auto end = sig.rfind(stop);
#  else
    const auto end = sig.find_first_of(stop, from);
#  endif
    if (end == std::string_view::npos || end <= from) {
        return "?";
    }
    return sig.substr(from, end - from);
#endif
}

} // namespace memview::detail

#endif /* MEMVIEW_TYPE_INFO_HPP_ */
