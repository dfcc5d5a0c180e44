/*
 * memview_storage.hpp
 *
 * owned_buffer<E, Alloc>: fixed-size, allocator-managed element block used by
 * every owner kind.
 *
 * - "Eager" construction model: all [0..size) elements are constructed on creation.
 * - Size never changes after construction.
 * - relocate() moves the elements into a fresh block and releases the old one.
 *   Owners call it to emulate a compacting allocator; callers must make sure
 *   nothing holds the old address (that is what pinning is for).
 */

#ifndef MEMVIEW_STORAGE_HPP_
#define MEMVIEW_STORAGE_HPP_

#include <cstring>      // std::memcpy
#include <memory>       // std::allocator_traits, std::destroy_n
#include <type_traits>
#include <utility>      // std::move

#include "basic_types.h"
#include "memview_alloc.hpp"
#include "memview_errors.hpp"
#include "memview_tools.hpp"

namespace memview::detail {

template<class E, typename Alloc = ::memview::alloc::default_alloc>
class owned_buffer
{
public:
    using value_type     = E;
    using pointer        = E*;
    using size_type      = reg;
    using allocator_type = typename std::allocator_traits<Alloc>::template rebind_alloc<E>;
    using alloc_traits   = std::allocator_traits<allocator_type>;

    static_assert(alloc_traits::is_always_equal::value,
                  "[memview::owned_buffer]: requires a stateless allocator.");
    static_assert(std::is_same_v<typename alloc_traits::pointer, pointer>,
                  "[memview::owned_buffer]: allocator must return raw pointers (E*).");
    static_assert(std::is_nothrow_destructible_v<E>,
                  "[memview::owned_buffer]: E must have a noexcept destructor.");

    owned_buffer() noexcept = default;

    // n value-initialized elements.
    explicit owned_buffer(const size_type n)
    {
        pointer p = allocate_or_fail(n);
        size_type built = 0;
        MEMVIEW_TRY {
            for (; built < n; ++built) {
                ::new (static_cast<void*>(p + built)) E();
            }
        } MEMVIEW_CATCH_ALL {
            std::destroy_n(p, built);
            release_block(p, n);
            MEMVIEW_RETHROW;
        }
        data_ = p;
        size_ = n;
    }

    // Copy of [src, src + n).
    owned_buffer(const E* src, const size_type n)
    {
        pointer p = allocate_or_fail(n);
        if constexpr (std::is_trivially_copyable_v<E>) {
            if (n != 0u) {
                std::memcpy(p, src, n * sizeof(E));
            }
        } else {
            size_type built = 0;
            MEMVIEW_TRY {
                for (; built < n; ++built) {
                    ::new (static_cast<void*>(p + built)) E(src[built]);
                }
            } MEMVIEW_CATCH_ALL {
                std::destroy_n(p, built);
                release_block(p, n);
                MEMVIEW_RETHROW;
            }
        }
        data_ = p;
        size_ = n;
    }

    ~owned_buffer() noexcept {
        std::destroy_n(data_, size_);
        release_block(data_, size_);
    }

    owned_buffer(const owned_buffer&)            = delete;
    owned_buffer& operator=(const owned_buffer&) = delete;
    owned_buffer(owned_buffer&&)                 = delete;
    owned_buffer& operator=(owned_buffer&&)      = delete;

    [[nodiscard]] MV_FORCEINLINE pointer data() const noexcept { return data_; }
    [[nodiscard]] MV_FORCEINLINE size_type size() const noexcept { return size_; }

    // Returns false (storage untouched) when empty or when a returns_null
    // allocator yields nullptr. A throwing allocator propagates std::bad_alloc,
    // storage untouched as well.
    [[nodiscard]] bool relocate()
    {
        if (size_ == 0u) {
            return false;
        }

        allocator_type alloc{};
        pointer fresh = alloc_traits::allocate(alloc, size_);
        if (MV_UNLIKELY(fresh == nullptr)) {
            return false;
        }

        if constexpr (std::is_trivially_copyable_v<E>) {
            std::memcpy(fresh, data_, size_ * sizeof(E));
        } else {
            static_assert(std::is_nothrow_move_constructible_v<E> || std::is_copy_constructible_v<E>,
                          "[memview::owned_buffer]: relocation needs a move or copy constructor.");
            size_type built = 0;
            MEMVIEW_TRY {
                for (; built < size_; ++built) {
                    ::new (static_cast<void*>(fresh + built)) E(std::move_if_noexcept(data_[built]));
                }
            } MEMVIEW_CATCH_ALL {
                std::destroy_n(fresh, built);
                alloc_traits::deallocate(alloc, fresh, size_);
                MEMVIEW_RETHROW;
            }
            std::destroy_n(data_, size_);
        }

        alloc_traits::deallocate(alloc, data_, size_);
        data_ = fresh;
        return true;
    }

private:
    static pointer allocate_or_fail(const size_type n)
    {
        if (n == 0u) {
            return nullptr;
        }
        allocator_type alloc{};
        pointer p = alloc_traits::allocate(alloc, n);
        if (MV_UNLIKELY(p == nullptr)) {
            throw_helper::out_of_memory();
        }
        return p;
    }

    static void release_block(pointer p, const size_type n) noexcept
    {
        if (p != nullptr) {
            allocator_type alloc{};
            alloc_traits::deallocate(alloc, p, n);
        }
    }

    pointer   data_ = nullptr;
    size_type size_ = 0;
};

} // namespace memview::detail

#endif /* MEMVIEW_STORAGE_HPP_ */
