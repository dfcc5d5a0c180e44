/*
 * memview_alloc.hpp
 *
 * Stateless allocators backing the owner storage (managed_array, text
 * buffers, native_memory_manager).
 *
 * - basic_allocator<T, Mode>      : ::operator new, switches to the aligned path
 *                                   only for over-aligned T.
 * - aligned_allocator<T, A, Mode> : at least A-byte aligned blocks.
 * - fail_mode decides whether exhaustion throws std::bad_alloc or returns nullptr.
 */

#ifndef MEMVIEW_ALLOC_HPP_
#define MEMVIEW_ALLOC_HPP_

#include <cstddef>     // std::size_t, std::byte, std::max_align_t
#include <cstdint>     // std::uintptr_t
#include <cstring>     // std::memcpy
#include <limits>
#include <new>         // std::nothrow, std::align_val_t, std::bad_alloc
#include <type_traits>

#include "basic_types.h"
#include "memview_tools.hpp"

namespace memview::alloc {

enum class fail_mode : unsigned {
    throws,        // allocate() throws std::bad_alloc (requires MEMVIEW_ENABLE_EXCEPTIONS != 0)
    returns_null   // allocate() returns nullptr
};

namespace detail {

#if defined(__STDCPP_DEFAULT_NEW_ALIGNMENT__)
inline constexpr std::size_t kDefaultNewAlign = __STDCPP_DEFAULT_NEW_ALIGNMENT__;
#else
inline constexpr std::size_t kDefaultNewAlign = alignof(std::max_align_t);
#endif

// The raw ::operator new pointer is stored right before the aligned payload.
inline constexpr std::size_t kRawHeaderSize = sizeof(void*);

inline constexpr bool kUseNativeAlignedNew = (MEMVIEW_ALLOC_PREFER_ALIGNED_NEW != 0);

constexpr bool is_pow2(const std::size_t x) noexcept {
    return (x != 0u) && ((x & (x - 1u)) == 0u);
}

constexpr std::size_t max_sz(const std::size_t a, const std::size_t b) noexcept {
    return (a > b) ? a : b;
}

template<fail_mode Mode>
[[nodiscard]] inline void* on_failure() noexcept(Mode == fail_mode::returns_null)
{
    static_assert((Mode != fail_mode::throws) || (MEMVIEW_ENABLE_EXCEPTIONS != 0),
                  "fail_mode::throws requires MEMVIEW_ENABLE_EXCEPTIONS != 0");
#if (MEMVIEW_ENABLE_EXCEPTIONS != 0)
    if constexpr (Mode == fail_mode::throws) {
        throw std::bad_alloc{};
    }
#endif
    return nullptr;
}

template<fail_mode Mode>
[[nodiscard]] inline void* raw_new(const std::size_t bytes) noexcept(Mode == fail_mode::returns_null)
{
    if constexpr (Mode == fail_mode::throws) {
        return ::operator new(bytes);
    } else {
        return ::operator new(bytes, std::nothrow);
    }
}

/*
 * Over-aligned allocation on top of plain ::operator new:
 *   [raw ... pad][header: raw ptr][payload (aligned) ...]
 */
template<fail_mode Mode>
[[nodiscard]] inline void* aligned_alloc_raw(std::size_t alignment, const std::size_t size)
    noexcept(Mode == fail_mode::returns_null)
{
    if (MV_UNLIKELY(size == 0u)) {
        return nullptr;
    }
    if (alignment < alignof(void*)) {
        alignment = alignof(void*);
    }
    if (MV_UNLIKELY(!is_pow2(alignment))) {
        return on_failure<Mode>();
    }

    constexpr std::size_t kMax = std::numeric_limits<std::size_t>::max();
    const std::size_t slack = (alignment - 1u) + kRawHeaderSize;
    if (MV_UNLIKELY(size > kMax - slack)) {
        return on_failure<Mode>();
    }

    void* raw = raw_new<Mode>(size + slack);
    if (MV_UNLIKELY(raw == nullptr)) {
        return nullptr;
    }

    const auto rawUp     = reinterpret_cast<std::uintptr_t>(raw);
    const auto mask      = static_cast<std::uintptr_t>(alignment - 1u);
    const auto alignedUp = (rawUp + kRawHeaderSize + mask) & ~mask;

    auto* const payload = static_cast<std::byte*>(raw) + (alignedUp - rawUp);
    std::memcpy(payload - kRawHeaderSize, &raw, kRawHeaderSize);
    return payload;
}

inline void aligned_free_raw(void* ptr) noexcept
{
    if (MV_UNLIKELY(ptr == nullptr)) {
        return;
    }
    void* raw = nullptr;
    std::memcpy(&raw, static_cast<std::byte*>(ptr) - kRawHeaderSize, kRawHeaderSize);
    ::operator delete(raw);
}

template<std::size_t Align, fail_mode Mode>
[[nodiscard]] inline void* allocate_bytes(const std::size_t bytes) noexcept(Mode == fail_mode::returns_null)
{
    if constexpr (Align <= kDefaultNewAlign) {
        return raw_new<Mode>(bytes);
    } else if constexpr (kUseNativeAlignedNew) {
        if constexpr (Mode == fail_mode::throws) {
            return ::operator new(bytes, std::align_val_t(Align));
        } else {
            return ::operator new(bytes, std::align_val_t(Align), std::nothrow);
        }
    } else {
        return aligned_alloc_raw<Mode>(Align, bytes);
    }
}

template<std::size_t Align>
inline void deallocate_bytes(void* p) noexcept
{
    if constexpr (Align <= kDefaultNewAlign) {
        ::operator delete(p);
    } else if constexpr (kUseNativeAlignedNew) {
        ::operator delete(p, std::align_val_t(Align));
    } else {
        aligned_free_raw(p);
    }
}

} // namespace detail

// ============================================================================
// aligned_allocator<T, Alignment, Mode>
// ============================================================================

template<class T, std::size_t Alignment, fail_mode Mode>
class aligned_allocator
{
public:
    using value_type      = T;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;

    using propagate_on_container_move_assignment = std::true_type;
    using is_always_equal                        = std::true_type;

    static_assert(detail::is_pow2(Alignment), "aligned_allocator: Alignment must be pow2");

    static constexpr std::size_t kAlign = detail::max_sz(Alignment, alignof(T));

    aligned_allocator() noexcept = default;

    template<class U>
    aligned_allocator(const aligned_allocator<U, Alignment, Mode>&) noexcept {}

    [[nodiscard]] T* allocate(const size_type n) noexcept(Mode == fail_mode::returns_null)
    {
        if (MV_UNLIKELY(n == 0u)) {
            return nullptr;
        }
        if (MV_UNLIKELY(n > (std::numeric_limits<size_type>::max() / sizeof(T)))) {
            return static_cast<T*>(detail::on_failure<Mode>());
        }
        return static_cast<T*>(detail::allocate_bytes<kAlign, Mode>(n * sizeof(T)));
    }

    void deallocate(T* p, size_type /*n*/) noexcept
    {
        if (p != nullptr) {
            detail::deallocate_bytes<kAlign>(p);
        }
    }

    template<class U>
    struct rebind {
        using other = aligned_allocator<U, Alignment, Mode>;
    };
};

template<class T1, std::size_t A1, fail_mode M1, class T2, std::size_t A2, fail_mode M2>
inline bool operator==(const aligned_allocator<T1, A1, M1>&,
                       const aligned_allocator<T2, A2, M2>&) noexcept
{
    return (A1 == A2) && (M1 == M2);
}

// ============================================================================
// basic_allocator<T, Mode>
// ============================================================================

template<class T, fail_mode Mode>
class basic_allocator
{
public:
    using value_type      = T;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;

    using propagate_on_container_move_assignment = std::true_type;
    using is_always_equal                        = std::true_type;

    basic_allocator() noexcept = default;

    template<class U>
    basic_allocator(const basic_allocator<U, Mode>&) noexcept {}

    [[nodiscard]] T* allocate(const size_type n) noexcept(Mode == fail_mode::returns_null)
    {
        if (MV_UNLIKELY(n == 0u)) {
            return nullptr;
        }
        if (MV_UNLIKELY(n > (std::numeric_limits<size_type>::max() / sizeof(T)))) {
            return static_cast<T*>(detail::on_failure<Mode>());
        }
        return static_cast<T*>(detail::allocate_bytes<alignof(T), Mode>(n * sizeof(T)));
    }

    void deallocate(T* p, size_type /*n*/) noexcept
    {
        if (p != nullptr) {
            detail::deallocate_bytes<alignof(T)>(p);
        }
    }

    template<class U>
    struct rebind {
        using other = basic_allocator<U, Mode>;
    };
};

template<class T1, fail_mode M1, class T2, fail_mode M2>
inline bool operator==(const basic_allocator<T1, M1>&,
                       const basic_allocator<T2, M2>&) noexcept
{
    return M1 == M2;
}

// ============================================================================
// Default allocator aliases
// ============================================================================

static_assert(MEMVIEW_ENABLE_EXCEPTIONS == 0 || MEMVIEW_ENABLE_EXCEPTIONS == 1,
              "MEMVIEW_ENABLE_EXCEPTIONS must be 0 or 1");

inline constexpr fail_mode kDefaultFailMode =
    (MEMVIEW_ENABLE_EXCEPTIONS != 0) ? fail_mode::throws : fail_mode::returns_null;

using default_alloc = basic_allocator<std::byte, kDefaultFailMode>;

template<std::size_t Alignment>
using align_alloc = aligned_allocator<std::byte, Alignment, kDefaultFailMode>;

} // namespace memview::alloc

#endif /* MEMVIEW_ALLOC_HPP_ */
