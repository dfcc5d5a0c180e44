/*
 * memory_rep.hpp
 *
 * Representation shared by memory<T> and read_only_memory<T>, and every
 * operation that has to look at the owner.
 *
 *   owner       : erased, non-owning pointer to the backing owner (nullptr = empty)
 *   index       : first visible element of the owner
 *   length      : visible element count (>= 0)
 *   kind        : which owner type `owner` points to (closed set)
 *   pre_pinned  : array owner that is never relocated, pinning is free
 *
 * Construction validates against the owner once. Slicing validates against
 * the view only. Materialization and pinning re-validate against the owner
 * every time: a manager may report a shorter block than it did before.
 *
 * Hazard: a memory_rep variable written by one thread while another thread
 * reads it can be observed torn (fields from two different views). Callers
 * must synchronize before publishing a view to another thread. Every
 * operation here works on one local copy of the fields, so a torn view is
 * still re-validated against the owner it names.
 */

#ifndef MEMVIEW_MEMORY_REP_HPP_
#define MEMVIEW_MEMORY_REP_HPP_

#include <algorithm>    // std::copy, std::copy_backward
#include <cstring>      // std::memmove
#include <functional>   // std::hash, std::less
#include <limits>
#include <type_traits>

#include "basic_types.h"
#include "managed_array.hpp"
#include "memory_handle.hpp"
#include "memory_manager.hpp"
#include "text_buffer.hpp"
#include "base/memview_errors.hpp"
#include "base/memview_tools.hpp"
#include "base/memview_type_info.hpp"

namespace memview::detail {

enum class owner_kind : u8 {
    empty = 0,
    array,
    text,
    utf8,
    manager
};

struct memory_rep {
    const void* owner{nullptr};
    i32         index{0};
    i32         length{0};
    owner_kind  kind{owner_kind::empty};
    bool        pre_pinned{false};

    friend constexpr bool operator==(const memory_rep&, const memory_rep&) noexcept = default;
};

static_assert(std::is_trivially_copyable_v<memory_rep>,
              "[memview::memory_rep]: views must stay flat copyable values.");

// ------------------------------------------------------------------------------------------
// Bounds
// ------------------------------------------------------------------------------------------

// start outside [0, total]. Negative start wraps to a huge unsigned value.
[[nodiscard]] MV_FORCEINLINE constexpr bool out_of_window(const i32 start, const i32 total) noexcept
{
    return static_cast<u32>(start) > static_cast<u32>(total);
}

// [start, start + length) not inside [0, total).
[[nodiscard]] MV_FORCEINLINE constexpr bool out_of_window(const i32 start, const i32 length, const i32 total) noexcept
{
    return static_cast<u32>(start) > static_cast<u32>(total) ||
           static_cast<u32>(length) > static_cast<u32>(total - start);
}

// ------------------------------------------------------------------------------------------
// Construction
// ------------------------------------------------------------------------------------------

template<class T, bool CheckElement>
MV_FORCEINLINE void check_array_element(const array_base& a)
{
    if constexpr (CheckElement) {
        if (MV_UNLIKELY(!is_array_compatible<T>(a.element()))) {
            throw_helper::type_mismatch(argument::array);
        }
    }
}

[[nodiscard]] MV_FORCEINLINE memory_rep make_array_rep(const array_base* a, const i32 start, const i32 length) noexcept
{
    return memory_rep{ a, start, length, owner_kind::array, a->is_pre_pinned() };
}

template<class T, bool CheckElement>
[[nodiscard]] memory_rep array_rep(const array_base* a)
{
    if (a == nullptr) {
        return memory_rep{};
    }
    check_array_element<T, CheckElement>(*a);
    return make_array_rep(a, 0, a->length());
}

template<class T, bool CheckElement>
[[nodiscard]] memory_rep array_rep(const array_base* a, const i32 start)
{
    if (a == nullptr) {
        if (start != 0) {
            throw_helper::out_of_range(argument::start);
        }
        return memory_rep{};
    }
    check_array_element<T, CheckElement>(*a);
    if (MV_UNLIKELY(out_of_window(start, a->length()))) {
        throw_helper::out_of_range(argument::start);
    }
    return make_array_rep(a, start, a->length() - start);
}

template<class T, bool CheckElement>
[[nodiscard]] memory_rep array_rep(const array_base* a, const i32 start, const i32 length)
{
    if (a == nullptr) {
        if (start != 0 || length != 0) {
            throw_helper::out_of_range();
        }
        return memory_rep{};
    }
    check_array_element<T, CheckElement>(*a);
    if (MV_UNLIKELY(out_of_window(start, length, a->length()))) {
        throw_helper::out_of_range();
    }
    return make_array_rep(a, start, length);
}

template<class C>
[[nodiscard]] constexpr owner_kind text_kind() noexcept
{
    return std::is_same_v<C, char8_t> ? owner_kind::utf8 : owner_kind::text;
}

template<class C>
[[nodiscard]] memory_rep text_rep(const basic_text_buffer<C>* t)
{
    if (t == nullptr) {
        return memory_rep{};
    }
    return memory_rep{ t, 0, t->length(), text_kind<C>(), false };
}

template<class C>
[[nodiscard]] memory_rep text_rep(const basic_text_buffer<C>* t, const i32 start)
{
    if (t == nullptr) {
        if (start != 0) {
            throw_helper::out_of_range(argument::start);
        }
        return memory_rep{};
    }
    if (MV_UNLIKELY(out_of_window(start, t->length()))) {
        throw_helper::out_of_range(argument::start);
    }
    return memory_rep{ t, start, t->length() - start, text_kind<C>(), false };
}

template<class C>
[[nodiscard]] memory_rep text_rep(const basic_text_buffer<C>* t, const i32 start, const i32 length)
{
    if (t == nullptr) {
        if (start != 0 || length != 0) {
            throw_helper::out_of_range();
        }
        return memory_rep{};
    }
    if (MV_UNLIKELY(out_of_window(start, length, t->length()))) {
        throw_helper::out_of_range();
    }
    return memory_rep{ t, start, length, text_kind<C>(), false };
}

// No upper bound against the manager here: it is checked on every access.
template<class T>
[[nodiscard]] memory_rep manager_rep(memory_manager<T>* m, const i32 start, const i32 length)
{
    if (MV_UNLIKELY(m == nullptr)) {
        if (start != 0 || length != 0) {
            throw_helper::out_of_range(argument::manager);
        }
        return memory_rep{};
    }
    if (MV_UNLIKELY(length < 0)) {
        throw_helper::out_of_range(argument::length);
    }
    if (MV_UNLIKELY(start < 0)) {
        throw_helper::out_of_range(argument::start);
    }
    if (MV_UNLIKELY(static_cast<i64>(start) + length > std::numeric_limits<i32>::max())) {
        throw_helper::out_of_range(argument::length);
    }
    return memory_rep{ static_cast<const void*>(m), start, length, owner_kind::manager, false };
}

// ------------------------------------------------------------------------------------------
// Slicing (pure arithmetic, the owner is not touched)
// ------------------------------------------------------------------------------------------

[[nodiscard]] MV_FORCEINLINE memory_rep slice_rep(const memory_rep& r, const i32 start)
{
    if (MV_UNLIKELY(out_of_window(start, r.length))) {
        throw_helper::out_of_range(argument::start);
    }
    memory_rep s = r;
    s.index  = r.index + start;
    s.length = r.length - start;
    return s;
}

[[nodiscard]] MV_FORCEINLINE memory_rep slice_rep(const memory_rep& r, const i32 start, const i32 length)
{
    if (MV_UNLIKELY(out_of_window(start, length, r.length))) {
        throw_helper::out_of_range();
    }
    memory_rep s = r;
    s.index  = r.index + start;
    s.length = length;
    return s;
}

// ------------------------------------------------------------------------------------------
// Owner access
// ------------------------------------------------------------------------------------------

template<class E>
[[nodiscard]] MV_FORCEINLINE memory_manager<E>* manager_of(const memory_rep& r) noexcept
{
    return static_cast<memory_manager<E>*>(const_cast<void*>(r.owner));
}

template<class E>
[[nodiscard]] MV_FORCEINLINE E* text_address(const text_buffer* t, const i32 index) noexcept
{
    return const_cast<E*>(t->borrow_raw(index));
}

template<class E>
[[nodiscard]] MV_FORCEINLINE E* utf8_address(const utf8_buffer* u, const i32 index) noexcept
{
    return reinterpret_cast<E*>(const_cast<char8_t*>(u->borrow_raw(index)));
}

/*
 * Resolve a view into (address, length).
 * Order: text -> utf8 -> array -> manager. A kind that is not legal for E
 * can only come from an unchecked raw construction and is fatal.
 */
template<class E>
[[nodiscard]] std::span<E> materialize(const memory_rep& rep)
{
    const memory_rep r = rep;
    if (r.owner == nullptr) {
        return {};
    }

    E*  base  = nullptr;
    i32 total = 0;

    switch (r.kind) {
    case owner_kind::text:
        if constexpr (is_text_element_v<E>) {
            const auto* t = static_cast<const text_buffer*>(r.owner);
            base  = text_address<E>(t, 0);
            total = t->length();
            break;
        } else {
            throw_helper::fail_fast("text owner behind a non-char view");
        }
    case owner_kind::utf8:
        if constexpr (may_represent_utf8_v<E>) {
            const auto* u = static_cast<const utf8_buffer*>(r.owner);
            base  = utf8_address<E>(u, 0);
            total = u->length();
            break;
        } else {
            throw_helper::fail_fast("utf8 owner behind a non-textual view");
        }
    case owner_kind::array: {
        const auto* a = static_cast<const array_base*>(r.owner);
        base  = static_cast<E*>(a->borrow_raw(0));
        total = a->length();
        break;
    }
    case owner_kind::manager: {
        const std::span<E> s = manager_of<E>(r)->get_span();
        base  = s.data();
        total = static_cast<i32>(s.size());
        break;
    }
    case owner_kind::empty:
    default:
        throw_helper::fail_fast("view owner of unknown kind");
    }

    if (MV_UNLIKELY(out_of_window(r.index, r.length, total))) {
        throw_helper::out_of_range();
    }
    return std::span<E>(base + r.index, static_cast<reg>(r.length));
}

/*
 * Pin the owner and return the address of the first visible element.
 * Bounds are checked before anything is registered, so a throwing pin never
 * leaves a registration behind.
 */
template<class E>
[[nodiscard]] memory_handle pin_rep(const memory_rep& rep)
{
    const memory_rep r = rep;
    if (r.owner == nullptr) {
        return memory_handle{};
    }

    switch (r.kind) {
    case owner_kind::text:
        if constexpr (is_text_element_v<E>) {
            const auto* t = static_cast<const text_buffer*>(r.owner);
            if (MV_UNLIKELY(out_of_window(r.index, r.length, t->length()))) {
                throw_helper::out_of_range();
            }
            const pin_cookie cookie = t->registry().pin(*t);
            return memory_handle(text_address<E>(t, r.index), cookie);
        } else {
            throw_helper::fail_fast("text owner behind a non-char view");
        }
    case owner_kind::utf8:
        if constexpr (may_represent_utf8_v<E>) {
            const auto* u = static_cast<const utf8_buffer*>(r.owner);
            if (MV_UNLIKELY(out_of_window(r.index, r.length, u->length()))) {
                throw_helper::out_of_range();
            }
            const pin_cookie cookie = u->registry().pin(*u);
            return memory_handle(utf8_address<E>(u, r.index), cookie);
        } else {
            throw_helper::fail_fast("utf8 owner behind a non-textual view");
        }
    case owner_kind::array: {
        const auto* a = static_cast<const array_base*>(r.owner);
        if (MV_UNLIKELY(out_of_window(r.index, r.length, a->length()))) {
            throw_helper::out_of_range();
        }
        if (r.pre_pinned) {
            return memory_handle(a->borrow_raw(r.index));
        }
        const pin_cookie cookie = a->registry().pin(*a);
        return memory_handle(a->borrow_raw(r.index), cookie);
    }
    case owner_kind::manager:
        return manager_of<E>(r)->pin(r.index);
    case owner_kind::empty:
    default:
        throw_helper::fail_fast("view owner of unknown kind");
    }
}

// ------------------------------------------------------------------------------------------
// Copy / hash
// ------------------------------------------------------------------------------------------

// Behaves as if src were copied to a temporary first.
template<class E>
void copy_elements(const std::span<const E> src, const std::span<E> dst)
{
    MEMVIEW_ASSERT(dst.size() >= src.size());
    const reg n = src.size();
    if (n == 0u) {
        return;
    }
    if constexpr (std::is_trivially_copyable_v<E>) {
        std::memmove(dst.data(), src.data(), n * sizeof(E));
    } else {
        const std::less<const E*> before{};
        const E* s = src.data();
        E*       d = dst.data();
        if (before(s, d) && before(d, s + n)) {
            std::copy_backward(s, s + n, d + n);
        } else {
            std::copy(s, s + n, d);
        }
    }
}

[[nodiscard]] MV_FORCEINLINE constexpr std::size_t combine_hash(const std::size_t left, const std::size_t right) noexcept
{
    return ((left << 5) + left) ^ right;
}

[[nodiscard]] inline std::size_t hash_rep(const memory_rep& r) noexcept
{
    if (r.owner == nullptr) {
        return 0u;
    }
    const std::size_t h_owner  = std::hash<const void*>{}(r.owner);
    const std::size_t h_index  = std::hash<i32>{}(r.index);
    const std::size_t h_length = std::hash<i32>{}(r.length);
    return combine_hash(combine_hash(h_owner, h_index), h_length);
}

} // namespace memview::detail

#endif /* MEMVIEW_MEMORY_REP_HPP_ */
