/*
 * memory_manager.hpp
 *
 * Manager owner: pluggable custom storage behind a memory<T>.
 *
 * Contract (the view relies on nothing else):
 *   - get_span()      : current (address, length) of the managed block;
 *   - pin(index)      : address of element `index`, stable until the returned
 *                       handle is released, release calls unpin() once;
 *   - length()        : get_span().size().
 * The reported length may change between calls; views re-validate their
 * window on every access instead of trusting the length seen at construction.
 */

#ifndef MEMVIEW_MEMORY_MANAGER_HPP_
#define MEMVIEW_MEMORY_MANAGER_HPP_

#include <limits>
#include <type_traits>

#include "basic_types.h"
#include "memory_handle.hpp"
#include "base/memview_alloc.hpp"
#include "base/memview_errors.hpp"
#include "base/memview_storage.hpp"
#include "base/memview_tools.hpp"

namespace memview {

template<class T>
class memory;

template<class T>
class memory_manager : public pinnable
{
public:
    using value_type = T;

    static_assert(!std::is_const_v<T>,
                  "[memview::memory_manager]: manages writable storage, T must not be const.");

    memory_manager() = default;
    virtual ~memory_manager() = default;

    memory_manager(const memory_manager&)            = delete;
    memory_manager& operator=(const memory_manager&) = delete;

    [[nodiscard]] virtual std::span<T> get_span() = 0;

    [[nodiscard]] memory_handle pin(i32 element_index) override = 0;
    void unpin() noexcept override = 0;

    [[nodiscard]] i32 length() { return static_cast<i32>(get_span().size()); }

    // View over the whole managed block.
    [[nodiscard]] memory<T> get_memory() { return create_memory(length()); }

protected:
    [[nodiscard]] memory<T> create_memory(const i32 length) { return memory<T>(this, length); }
    [[nodiscard]] memory<T> create_memory(const i32 start, const i32 length) { return memory<T>(this, start, length); }
};

/* =======================================================================
 * native_memory_manager<T, Alloc>
 *
 * Manager over allocator-owned storage that is never relocated, so pin()
 * only counts outstanding pins. The reported length can be changed within
 * the capacity with resize().
 *
 * Not thread-safe.
 * ======================================================================= */
template<
    class T,
    typename Alloc = ::memview::alloc::default_alloc
    >
class native_memory_manager final : public memory_manager<T>
{
public:
    explicit native_memory_manager(const i32 capacity)
        : storage_(checked_capacity(capacity))
        , length_(capacity)
    {}

    ~native_memory_manager() override
    {
        MEMVIEW_ASSERT(pins_ == 0u);
    }

    [[nodiscard]] std::span<T> get_span() override
    {
        return { storage_.data(), static_cast<reg>(length_) };
    }

    [[nodiscard]] memory_handle pin(const i32 element_index) override
    {
        if (MV_UNLIKELY(static_cast<u32>(element_index) > static_cast<u32>(length_))) {
            detail::throw_helper::out_of_range(argument::element_index);
        }
        ++pins_;
        return memory_handle(static_cast<void*>(storage_.data() + element_index), this);
    }

    void unpin() noexcept override
    {
        MEMVIEW_ASSERT(pins_ != 0u);
        if (pins_ != 0u) {
            --pins_;
        }
    }

    // Changes the reported length. Returns false if n is outside [0, capacity()].
    [[nodiscard]] bool resize(const i32 n) noexcept
    {
        if (static_cast<u32>(n) > static_cast<u32>(capacity())) {
            return false;
        }
        length_ = n;
        return true;
    }

    [[nodiscard]] i32 capacity() const noexcept { return static_cast<i32>(storage_.size()); }
    [[nodiscard]] reg pin_count() const noexcept { return pins_; }

private:
    static reg checked_capacity(const i32 n)
    {
        if (n < 0) {
            detail::throw_helper::out_of_range(argument::length);
        }
        return static_cast<reg>(n);
    }

    detail::owned_buffer<T, Alloc> storage_;
    i32                            length_;
    reg                            pins_{0u};
};

} // namespace memview

#endif /* MEMVIEW_MEMORY_MANAGER_HPP_ */
