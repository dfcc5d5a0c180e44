/*
 * memory_handle.hpp
 *
 * memory_handle: result of pin(). Holds a raw address that stays valid until
 * the handle is released, and whatever is needed to end the pin:
 *   - a pin_cookie (text/utf8 owners, relocatable arrays), or
 *   - a pinnable (memory managers), or
 *   - nothing (pre-pinned arrays, empty views).
 *
 * Notes:
 * - Move-only: two handles releasing the same registration would unpin twice.
 * - release() is idempotent; the destructor releases.
 */

#ifndef MEMVIEW_MEMORY_HANDLE_HPP_
#define MEMVIEW_MEMORY_HANDLE_HPP_

#include <utility>      // std::exchange

#include "basic_types.h"
#include "base/memview_tools.hpp"
#include "base/pin_registry.hpp"

namespace memview {

class memory_handle;

/*
 * Something that can pin itself (memory managers). pin() must return a handle
 * whose release calls unpin() exactly once.
 */
class pinnable
{
public:
    [[nodiscard]] virtual memory_handle pin(i32 element_index) = 0;
    virtual void unpin() noexcept = 0;

protected:
    ~pinnable() = default;
};

class memory_handle
{
public:
    memory_handle() noexcept = default;

    // Address that needs no release (already non-relocatable storage).
    explicit memory_handle(void* pointer) noexcept
        : pointer_(pointer)
    {}

    memory_handle(void* pointer, const pin_cookie& cookie) noexcept
        : pointer_(pointer), cookie_(cookie)
    {}

    memory_handle(void* pointer, pinnable* owner) noexcept
        : pointer_(pointer), pinnable_(owner)
    {}

    ~memory_handle() noexcept { release(); }

    memory_handle(const memory_handle&)            = delete;
    memory_handle& operator=(const memory_handle&) = delete;

    memory_handle(memory_handle&& other) noexcept
        : pointer_(std::exchange(other.pointer_, nullptr))
        , cookie_(std::exchange(other.cookie_, pin_cookie{}))
        , pinnable_(std::exchange(other.pinnable_, nullptr))
    {}

    memory_handle& operator=(memory_handle&& other) noexcept {
        if (this != &other) {
            release();
            pointer_  = std::exchange(other.pointer_, nullptr);
            cookie_   = std::exchange(other.cookie_, pin_cookie{});
            pinnable_ = std::exchange(other.pinnable_, nullptr);
        }
        return *this;
    }

    [[nodiscard]] void* pointer() const noexcept { return pointer_; }

    template<class U>
    [[nodiscard]] U* as() const noexcept { return static_cast<U*>(pointer_); }

    // True while a registry pin or a manager pin is held.
    [[nodiscard]] bool holds_pin() const noexcept { return cookie_.valid() || pinnable_ != nullptr; }

    [[nodiscard]] const pin_cookie& cookie() const noexcept { return cookie_; }

    void release() noexcept
    {
        if (cookie_.valid()) {
            const pin_cookie c = std::exchange(cookie_, pin_cookie{});
            c.registry->unpin(c);
        }
        if (pinnable_ != nullptr) {
            std::exchange(pinnable_, nullptr)->unpin();
        }
        pointer_ = nullptr;
    }

private:
    void*      pointer_{nullptr};
    pin_cookie cookie_{};
    pinnable*  pinnable_{nullptr};
};

} // namespace memview

#endif /* MEMVIEW_MEMORY_HANDLE_HPP_ */
