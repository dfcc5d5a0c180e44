/*
 * memory.hpp
 *
 * memory<T> / read_only_memory<T>: bounded, non-owning views over contiguous
 * storage held by one of four owner kinds:
 *
 *   owner kind        │ element types          │ construction
 * ────────────────────┼────────────────────────┼───────────────────────────────
 *  managed_array<T>   │ T (exact)              │ array [, start [, length]]
 *  array_base (erased)│ T, or T with other sign│ checked: type_mismatch_error
 *  text_buffer        │ char                   │ read_only_memory only
 *  utf8_buffer        │ char8_t, uchar, byte   │ read_only_memory only
 *  memory_manager<T>  │ T                      │ manager, [start,] length
 *
 * Notes:
 * - A view is three logical fields (owner, index, length) plus the owner kind
 *   tag. Copy is a flat struct copy. It never owns or frees the owner.
 * - slice() is arithmetic only. span() and pin() look at the owner and check
 *   the window against its current length on every call.
 * - memory<T> -> read_only_memory<T> is implicit and allocation-free.
 * - Equality is identity (same owner, index, length), never contents.
 * - Not safe to write a view variable on one thread while another reads it.
 */

#ifndef MEMVIEW_MEMORY_HPP_
#define MEMVIEW_MEMORY_HPP_

#include <cstddef>      // std::size_t
#include <functional>   // std::hash
#include <string>
#include <type_traits>

#include "basic_types.h"
#include "managed_array.hpp"
#include "memory_handle.hpp"
#include "memory_manager.hpp"
#include "memory_rep.hpp"
#include "text_buffer.hpp"
#include "base/memview_errors.hpp"
#include "base/memview_tools.hpp"
#include "base/memview_type_info.hpp"

namespace memview {

template<class T>
class memory;

class memory_marshal;

namespace detail {

template<class E>
[[nodiscard]] std::string render_view(const memory_rep& r, const char* view_name)
{
    if constexpr (is_text_element_v<E>) {
        if (r.kind == owner_kind::text) {
            const auto* t = static_cast<const text_buffer*>(r.owner);
            if (MV_UNLIKELY(out_of_window(r.index, r.length, t->length()))) {
                throw_helper::out_of_range();
            }
            return std::string(t->view().substr(static_cast<reg>(r.index), static_cast<reg>(r.length)));
        }
        const std::span<E> s = materialize<E>(r);
        return s.empty() ? std::string{} : std::string(s.data(), s.size());
    } else if constexpr (std::is_same_v<E, char8_t>) {
        // Textual bytes are always rendered from the span; plain bytes never are.
        const std::span<E> s = materialize<E>(r);
        return s.empty() ? std::string{} : std::string(reinterpret_cast<const char*>(s.data()), s.size());
    } else {
        std::string out = "memview::";
        out += view_name;
        out += '<';
        out += type_name<E>();
        out += ">[";
        out += std::to_string(r.length);
        out += ']';
        return out;
    }
}

} // namespace detail


/* =======================================================================
 * read_only_memory<T>
 * ======================================================================= */
template<class T>
class read_only_memory
{
public:
    using value_type = T;
    using size_type  = i32;
    using span_type  = std::span<const T>;

    static_assert(!std::is_const_v<T> && !std::is_reference_v<T>,
                  "[memview::read_only_memory]: use read_only_memory<T>, not read_only_memory<const T>.");

    // ------------------------------------------------------------------------------------------
    // Constructors
    // ------------------------------------------------------------------------------------------

    // Canonical empty view.
    read_only_memory() noexcept = default;

    // [Array] nullptr -> empty view.
    template<typename Alloc>
    explicit read_only_memory(const managed_array<T, Alloc>* array)
        : rep_(detail::array_rep<T, false>(array))
    {}

    template<typename Alloc>
    read_only_memory(const managed_array<T, Alloc>* array, const i32 start)
        : rep_(detail::array_rep<T, false>(array, start))
    {}

    template<typename Alloc>
    read_only_memory(const managed_array<T, Alloc>* array, const i32 start, const i32 length)
        : rep_(detail::array_rep<T, false>(array, start, length))
    {}

    template<typename Alloc>
    read_only_memory(const managed_array<T, Alloc>& array)
        : rep_(detail::array_rep<T, false>(&array))
    {}

    // A temporary owner would die before the view.
    template<typename Alloc>
    read_only_memory(const managed_array<T, Alloc>&&) = delete;

    // [Erased array] Element type checked at run time.
    explicit read_only_memory(const array_base* array)
        : rep_(detail::array_rep<T, true>(array))
    {}

    read_only_memory(const array_base* array, const i32 start)
        : rep_(detail::array_rep<T, true>(array, start))
    {}

    read_only_memory(const array_base* array, const i32 start, const i32 length)
        : rep_(detail::array_rep<T, true>(array, start, length))
    {}

    // [Text] char views only.
    template<typename U = T, typename = std::enable_if_t<detail::is_text_element_v<U>>>
    explicit read_only_memory(const text_buffer* text)
        : rep_(detail::text_rep(text))
    {}

    template<typename U = T, typename = std::enable_if_t<detail::is_text_element_v<U>>>
    read_only_memory(const text_buffer* text, const i32 start)
        : rep_(detail::text_rep(text, start))
    {}

    template<typename U = T, typename = std::enable_if_t<detail::is_text_element_v<U>>>
    read_only_memory(const text_buffer* text, const i32 start, const i32 length)
        : rep_(detail::text_rep(text, start, length))
    {}

    template<typename U = T, typename = std::enable_if_t<detail::is_text_element_v<U>>>
    read_only_memory(const text_buffer& text)
        : rep_(detail::text_rep(&text))
    {}

    read_only_memory(const text_buffer&&) = delete;

    // [UTF-8] byte-sized textual views only.
    template<typename U = T, typename = std::enable_if_t<detail::may_represent_utf8_v<U>>>
    explicit read_only_memory(const utf8_buffer* text)
        : rep_(detail::text_rep(text))
    {}

    template<typename U = T, typename = std::enable_if_t<detail::may_represent_utf8_v<U>>>
    read_only_memory(const utf8_buffer* text, const i32 start)
        : rep_(detail::text_rep(text, start))
    {}

    template<typename U = T, typename = std::enable_if_t<detail::may_represent_utf8_v<U>>>
    read_only_memory(const utf8_buffer* text, const i32 start, const i32 length)
        : rep_(detail::text_rep(text, start, length))
    {}

    template<typename U = T, typename = std::enable_if_t<detail::may_represent_utf8_v<U>>>
    read_only_memory(const utf8_buffer& text)
        : rep_(detail::text_rep(&text))
    {}

    read_only_memory(const utf8_buffer&&) = delete;

    // [Manager] Only negative values are rejected here.
    read_only_memory(memory_manager<T>* manager, const i32 length)
        : rep_(detail::manager_rep(manager, 0, length))
    {}

    read_only_memory(memory_manager<T>* manager, const i32 start, const i32 length)
        : rep_(detail::manager_rep(manager, start, length))
    {}

    // [Raw] No validation: the caller already established the window.
    read_only_memory(unsafe_t, const detail::memory_rep& rep) noexcept
        : rep_(rep)
    {}

    // ------------------------------------------------------------------------------------------
    // Observers
    // ------------------------------------------------------------------------------------------
    [[nodiscard]] MV_FORCEINLINE i32 length() const noexcept { return rep_.length; }
    [[nodiscard]] MV_FORCEINLINE bool empty() const noexcept { return rep_.length == 0; }

    // ------------------------------------------------------------------------------------------
    // Slicing
    // ------------------------------------------------------------------------------------------
    [[nodiscard]] read_only_memory slice(const i32 start) const {
        return read_only_memory(unsafe, detail::slice_rep(rep_, start));
    }

    [[nodiscard]] read_only_memory slice(const i32 start, const i32 length) const {
        return read_only_memory(unsafe, detail::slice_rep(rep_, start, length));
    }

    // ------------------------------------------------------------------------------------------
    // Access
    // ------------------------------------------------------------------------------------------
    [[nodiscard]] span_type span() const { return detail::materialize<T>(rep_); }

    [[nodiscard]] memory_handle pin() const { return detail::pin_rep<T>(rep_); }

    // Throws destination_too_short_error if destination.length() < length().
    void copy_to(memory<T> destination) const;

    // Returns false and leaves destination untouched if it is too short.
    [[nodiscard]] bool try_copy_to(memory<T> destination) const;

    // Allocates. Meant for handing data to array-based APIs.
    [[nodiscard]] managed_array<T> to_array() const { return managed_array<T>(span()); }

    [[nodiscard]] std::string to_string() const { return detail::render_view<T>(rep_, "read_only_memory"); }

    [[nodiscard]] std::size_t hash_code() const noexcept { return detail::hash_rep(rep_); }

    friend bool operator==(const read_only_memory& a, const read_only_memory& b) noexcept {
        return a.rep_ == b.rep_;
    }

private:
    template<class> friend class memory;
    friend class memory_marshal;

    detail::memory_rep rep_{};
};


/* =======================================================================
 * memory<T>
 * ======================================================================= */
template<class T>
class memory
{
public:
    using value_type = T;
    using size_type  = i32;
    using span_type  = std::span<T>;

    static_assert(!std::is_const_v<T> && !std::is_reference_v<T>,
                  "[memview::memory]: const T does not make sense for a writable view, use read_only_memory<T>.");

    // ------------------------------------------------------------------------------------------
    // Constructors
    // ------------------------------------------------------------------------------------------
    memory() noexcept = default;

    // [Array] nullptr -> empty view.
    template<typename Alloc>
    explicit memory(managed_array<T, Alloc>* array)
        : rep_(detail::array_rep<T, false>(array))
    {}

    template<typename Alloc>
    memory(managed_array<T, Alloc>* array, const i32 start)
        : rep_(detail::array_rep<T, false>(array, start))
    {}

    template<typename Alloc>
    memory(managed_array<T, Alloc>* array, const i32 start, const i32 length)
        : rep_(detail::array_rep<T, false>(array, start, length))
    {}

    template<typename Alloc>
    memory(managed_array<T, Alloc>& array)
        : rep_(detail::array_rep<T, false>(&array))
    {}

    // [Erased array] Element type checked at run time.
    explicit memory(array_base* array)
        : rep_(detail::array_rep<T, true>(array))
    {}

    memory(array_base* array, const i32 start)
        : rep_(detail::array_rep<T, true>(array, start))
    {}

    memory(array_base* array, const i32 start, const i32 length)
        : rep_(detail::array_rep<T, true>(array, start, length))
    {}

    // [Manager] Only negative values are rejected here.
    memory(memory_manager<T>* manager, const i32 length)
        : rep_(detail::manager_rep(manager, 0, length))
    {}

    memory(memory_manager<T>* manager, const i32 start, const i32 length)
        : rep_(detail::manager_rep(manager, start, length))
    {}

    // [Raw] No validation: the caller already established the window.
    memory(unsafe_t, const detail::memory_rep& rep) noexcept
        : rep_(rep)
    {}

    // Same representation, no allocation.
    operator read_only_memory<T>() const noexcept { return read_only_memory<T>(unsafe, rep_); }

    // ------------------------------------------------------------------------------------------
    // Observers
    // ------------------------------------------------------------------------------------------
    [[nodiscard]] MV_FORCEINLINE i32 length() const noexcept { return rep_.length; }
    [[nodiscard]] MV_FORCEINLINE bool empty() const noexcept { return rep_.length == 0; }

    // ------------------------------------------------------------------------------------------
    // Slicing
    // ------------------------------------------------------------------------------------------
    [[nodiscard]] memory slice(const i32 start) const {
        return memory(unsafe, detail::slice_rep(rep_, start));
    }

    [[nodiscard]] memory slice(const i32 start, const i32 length) const {
        return memory(unsafe, detail::slice_rep(rep_, start, length));
    }

    // ------------------------------------------------------------------------------------------
    // Access
    // ------------------------------------------------------------------------------------------

    // A char view created from a text owner (memory_marshal::as_memory) yields
    // a writable span over immutable text. Writing through it is the caller's
    // responsibility, as is the cast that produced the view.
    [[nodiscard]] span_type span() const { return detail::materialize<T>(rep_); }

    [[nodiscard]] memory_handle pin() const { return detail::pin_rep<T>(rep_); }

    void copy_to(const memory destination) const {
        read_only_memory<T>(unsafe, rep_).copy_to(destination);
    }

    [[nodiscard]] bool try_copy_to(const memory destination) const {
        return read_only_memory<T>(unsafe, rep_).try_copy_to(destination);
    }

    [[nodiscard]] managed_array<T> to_array() const { return managed_array<T>(std::span<const T>(span())); }

    [[nodiscard]] std::string to_string() const { return detail::render_view<T>(rep_, "memory"); }

    [[nodiscard]] std::size_t hash_code() const noexcept { return detail::hash_rep(rep_); }

    friend bool operator==(const memory& a, const memory& b) noexcept {
        return a.rep_ == b.rep_;
    }

private:
    template<class> friend class read_only_memory;
    friend class memory_marshal;

    detail::memory_rep rep_{};
};

template<class T>
void read_only_memory<T>::copy_to(const memory<T> destination) const
{
    const span_type src = span();
    const std::span<T> dst = destination.span();
    if (MV_UNLIKELY(dst.size() < src.size())) {
        detail::throw_helper::destination_too_short();
    }
    detail::copy_elements<T>(src, dst);
}

template<class T>
bool read_only_memory<T>::try_copy_to(const memory<T> destination) const
{
    const span_type src = span();
    const std::span<T> dst = destination.span();
    if (dst.size() < src.size()) {
        return false;
    }
    detail::copy_elements<T>(src, dst);
    return true;
}

// CTAD
template<class T, typename Alloc> memory(managed_array<T, Alloc>&) -> memory<T>;
template<class T, typename Alloc> memory(managed_array<T, Alloc>*) -> memory<T>;
template<class T, typename Alloc> memory(managed_array<T, Alloc>*, i32) -> memory<T>;
template<class T, typename Alloc> memory(managed_array<T, Alloc>*, i32, i32) -> memory<T>;

template<class T, typename Alloc> read_only_memory(const managed_array<T, Alloc>&) -> read_only_memory<T>;
template<class T, typename Alloc> read_only_memory(const managed_array<T, Alloc>*) -> read_only_memory<T>;
read_only_memory(const text_buffer&) -> read_only_memory<char>;
read_only_memory(const utf8_buffer&) -> read_only_memory<char8_t>;


/* =======================================================================
 * memory_marshal
 *
 * Low-level escapes around the view types. Everything here either breaks
 * read-only guarantees or trusts the caller about pinning.
 * ======================================================================= */
template<class Owner>
struct owner_slice {
    Owner* owner{nullptr};
    i32    start{0};
    i32    length{0};
};

class memory_marshal
{
public:
    memory_marshal() = delete;

    // Writable view over the same window. Writing into a text owner through
    // it breaks that owner's immutability.
    template<class T>
    [[nodiscard]] static memory<T> as_memory(const read_only_memory<T>& m) noexcept {
        return memory<T>(unsafe, m.rep_);
    }

    // The caller guarantees the array does not move while the view is in use
    // (pre-pinned allocation, or a pin held for the view's whole lifetime).
    template<class T, typename Alloc>
    [[nodiscard]] static memory<T> create_from_pinned_array(managed_array<T, Alloc>* array, const i32 start, const i32 length)
    {
        detail::memory_rep r = detail::array_rep<T, false>(array, start, length);
        r.pre_pinned = (r.owner != nullptr);
        return memory<T>(unsafe, r);
    }

    template<class T>
    [[nodiscard]] static bool try_get_array(const read_only_memory<T>& m, owner_slice<const array_base>& out) noexcept
    {
        if (m.rep_.kind != detail::owner_kind::array) {
            return false;
        }
        out = owner_slice<const array_base>{ static_cast<const array_base*>(m.rep_.owner), m.rep_.index, m.rep_.length };
        return true;
    }

    template<class T>
    [[nodiscard]] static bool try_get_text(const read_only_memory<T>& m, owner_slice<const text_buffer>& out) noexcept
    {
        if (m.rep_.kind != detail::owner_kind::text) {
            return false;
        }
        out = owner_slice<const text_buffer>{ static_cast<const text_buffer*>(m.rep_.owner), m.rep_.index, m.rep_.length };
        return true;
    }

    template<class T>
    [[nodiscard]] static bool try_get_utf8(const read_only_memory<T>& m, owner_slice<const utf8_buffer>& out) noexcept
    {
        if (m.rep_.kind != detail::owner_kind::utf8) {
            return false;
        }
        out = owner_slice<const utf8_buffer>{ static_cast<const utf8_buffer*>(m.rep_.owner), m.rep_.index, m.rep_.length };
        return true;
    }

    template<class T>
    [[nodiscard]] static bool try_get_manager(const read_only_memory<T>& m, owner_slice<memory_manager<T>>& out) noexcept
    {
        if (m.rep_.kind != detail::owner_kind::manager) {
            return false;
        }
        out = owner_slice<memory_manager<T>>{ detail::manager_of<T>(m.rep_), m.rep_.index, m.rep_.length };
        return true;
    }

    template<class T>
    [[nodiscard]] static const detail::memory_rep& get_rep(const read_only_memory<T>& m) noexcept { return m.rep_; }

    template<class T>
    [[nodiscard]] static const detail::memory_rep& get_rep(const memory<T>& m) noexcept { return m.rep_; }
};

} // namespace memview

template<class T>
struct std::hash<memview::memory<T>> {
    std::size_t operator()(const memview::memory<T>& m) const noexcept { return m.hash_code(); }
};

template<class T>
struct std::hash<memview::read_only_memory<T>> {
    std::size_t operator()(const memview::read_only_memory<T>& m) const noexcept { return m.hash_code(); }
};

#endif /* MEMVIEW_MEMORY_HPP_ */
