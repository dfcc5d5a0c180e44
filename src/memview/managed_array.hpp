/*
 * managed_array.hpp
 *
 * Array owner: fixed-length contiguous element buffer whose storage may be
 * relocated by its allocator unless pinned.
 *
 * Variants:
 * 1. RELOCATABLE (default): relocate() moves the storage when no pin is held.
 * 2. PRE-PINNED (memview::pinned tag): storage never moves, pinning a view over
 *    it costs nothing.
 *
 * array_base is the erased face used by views (element identity, length,
 * raw address of an element). managed_array<E, Alloc> is the concrete owner.
 *
 * Concurrency:
 * - Not thread-safe. relocate() must not race with users of the old address.
 */

#ifndef MEMVIEW_MANAGED_ARRAY_HPP_
#define MEMVIEW_MANAGED_ARRAY_HPP_

#include <cstddef>      // std::byte
#include <initializer_list>
#include <iterator>     // std::reverse_iterator
#include <limits>
#include <type_traits>

#include "basic_types.h"
#include "base/memview_alloc.hpp"
#include "base/memview_errors.hpp"
#include "base/memview_storage.hpp"
#include "base/memview_tools.hpp"
#include "base/memview_type_info.hpp"
#include "base/pin_registry.hpp"

namespace memview {

// Tag requesting a pre-pinned (never relocated) array.
struct pinned_t { explicit constexpr pinned_t() = default; };
inline constexpr pinned_t pinned{};

/* =======================================================================
 * array_base
 * ======================================================================= */
class array_base : public heap_object
{
public:
    [[nodiscard]] MV_FORCEINLINE i32 length() const noexcept { return length_; }
    [[nodiscard]] MV_FORCEINLINE bool empty() const noexcept { return length_ == 0; }
    [[nodiscard]] MV_FORCEINLINE bool is_pre_pinned() const noexcept { return pre_pinned_; }
    [[nodiscard]] MV_FORCEINLINE const detail::element_info& element() const noexcept { return *element_; }

    // Address of element `index` (index == length() yields the end address).
    [[nodiscard]] MV_FORCEINLINE void* borrow_raw(const i32 index) const noexcept
    {
        MEMVIEW_ASSERT(static_cast<u32>(index) <= static_cast<u32>(length_));
        return static_cast<std::byte*>(data_) + static_cast<reg>(index) * element_->size;
    }

    // Moves the element storage unless pinned or pre-pinned. Returns true if it moved.
    [[nodiscard]] bool relocate()
    {
        if (pre_pinned_ || is_pinned()) {
            return false;
        }
        return do_relocate();
    }

protected:
    array_base(pin_registry& registry, const detail::element_info& element, const bool pre_pinned) noexcept
        : heap_object(registry), element_(&element), pre_pinned_(pre_pinned)
    {}

    ~array_base() = default;

    void bind_storage(void* data, const i32 length) noexcept {
        data_   = data;
        length_ = length;
    }

    [[nodiscard]] virtual bool do_relocate() = 0;

private:
    void*                       data_{nullptr};
    i32                         length_{0};
    const detail::element_info* element_;
    bool                        pre_pinned_;
};

/* =======================================================================
 * managed_array<E, Alloc>
 * ======================================================================= */
template<
    class E,
    typename Alloc = ::memview::alloc::default_alloc
    >
class managed_array final : public array_base
{
    using storage_type = detail::owned_buffer<E, Alloc>;

public:
    using value_type             = E;
    using size_type              = i32;
    using reference              = value_type&;
    using const_reference        = const value_type&;
    using pointer                = value_type*;
    using const_pointer          = const value_type*;
    using iterator               = pointer;
    using const_iterator         = const_pointer;
    using reverse_iterator       = std::reverse_iterator<iterator>;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

    static_assert(!std::is_const_v<E> && !std::is_reference_v<E>,
                  "[memview::managed_array]: element type must be a non-const object type.");
    static_assert(std::is_default_constructible_v<E>,
                  "[memview::managed_array]: element type must be default-constructible.");

    explicit managed_array(const i32 length, pin_registry& registry = pin_registry::shared())
        : array_base(registry, detail::element_info_of<E>, false)
        , storage_(checked_length(length))
    {
        bind();
    }

    managed_array(pinned_t, const i32 length, pin_registry& registry = pin_registry::shared())
        : array_base(registry, detail::element_info_of<E>, true)
        , storage_(checked_length(length))
    {
        bind();
    }

    managed_array(std::initializer_list<E> init, pin_registry& registry = pin_registry::shared())
        : array_base(registry, detail::element_info_of<E>, false)
        , storage_(init.begin(), checked_length(init.size()))
    {
        bind();
    }

    managed_array(pinned_t, std::initializer_list<E> init, pin_registry& registry = pin_registry::shared())
        : array_base(registry, detail::element_info_of<E>, true)
        , storage_(init.begin(), checked_length(init.size()))
    {
        bind();
    }

    explicit managed_array(std::span<const E> src, pin_registry& registry = pin_registry::shared())
        : array_base(registry, detail::element_info_of<E>, false)
        , storage_(src.data(), checked_length(src.size()))
    {
        bind();
    }

    ~managed_array() = default;

    // --------------------------------------------------------------------------
    // Data Access
    // --------------------------------------------------------------------------
    [[nodiscard]] MV_FORCEINLINE pointer data() noexcept { return storage_.data(); }
    [[nodiscard]] MV_FORCEINLINE const_pointer data() const noexcept { return storage_.data(); }
    [[nodiscard]] MV_FORCEINLINE size_type size() const noexcept { return length(); }

    [[nodiscard]] std::span<value_type> span() noexcept { return { data(), storage_.size() }; }
    [[nodiscard]] std::span<const value_type> span() const noexcept { return { data(), storage_.size() }; }

    [[nodiscard]] MV_FORCEINLINE reference operator[](const size_type i) noexcept {
        MEMVIEW_ASSERT(static_cast<u32>(i) < static_cast<u32>(length()));
        return data()[i];
    }
    [[nodiscard]] MV_FORCEINLINE const_reference operator[](const size_type i) const noexcept {
        MEMVIEW_ASSERT(static_cast<u32>(i) < static_cast<u32>(length()));
        return data()[i];
    }

    [[nodiscard]] iterator begin() noexcept { return data(); }
    [[nodiscard]] iterator end()   noexcept { return data() + storage_.size(); }
    [[nodiscard]] const_iterator begin() const noexcept { return data(); }
    [[nodiscard]] const_iterator end()   const noexcept { return data() + storage_.size(); }
    [[nodiscard]] const_iterator cbegin() const noexcept { return begin(); }
    [[nodiscard]] const_iterator cend()   const noexcept { return end(); }

    [[nodiscard]] reverse_iterator rbegin() noexcept { return reverse_iterator(end()); }
    [[nodiscard]] reverse_iterator rend()   noexcept { return reverse_iterator(begin()); }
    [[nodiscard]] const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator(end()); }
    [[nodiscard]] const_reverse_iterator rend()   const noexcept { return const_reverse_iterator(begin()); }

private:
    template<class N>
    static reg checked_length(const N n)
    {
        if constexpr (std::is_signed_v<N>) {
            if (n < 0) {
                detail::throw_helper::out_of_range(argument::length);
            }
        }
        if (static_cast<u64>(n) > static_cast<u64>(std::numeric_limits<i32>::max())) {
            detail::throw_helper::out_of_range(argument::length);
        }
        return static_cast<reg>(n);
    }

    void bind() noexcept {
        bind_storage(storage_.data(), static_cast<i32>(storage_.size()));
    }

    [[nodiscard]] bool do_relocate() override
    {
        if (!storage_.relocate()) {
            return false;
        }
        bind();
        return true;
    }

    storage_type storage_;
};

} // namespace memview

#endif /* MEMVIEW_MANAGED_ARRAY_HPP_ */
