/*
 * pin_registry.hpp
 *
 * Boundary with the relocating allocator.
 *
 * Every owner (managed_array, text buffers) is a heap_object bound to one
 * pin_registry. The registry is the allocator side of the contract:
 *   - pin(obj)       : obj must not be relocated until the cookie is released;
 *   - unpin(cookie)  : ends one pin registration;
 *   - is_pinned(obj) : the owner asks this before relocating its storage.
 *
 * pin_registry::shared() is a process-wide default_pin_registry. Tests bind
 * owners to their own registry (e.g. a call-counting double).
 */

#ifndef MEMVIEW_PIN_REGISTRY_HPP_
#define MEMVIEW_PIN_REGISTRY_HPP_

#include <atomic>
#include <mutex>
#include <unordered_map>

#include "basic_types.h"
#include "memview_tools.hpp"

namespace memview {

class heap_object;
class pin_registry;

// Token for one pin registration. Default-constructed cookie pins nothing.
struct pin_cookie {
    pin_registry*      registry{nullptr};
    const heap_object* target{nullptr};
    u64                serial{0u};

    [[nodiscard]] constexpr bool valid() const noexcept { return registry != nullptr && target != nullptr; }
};

class pin_registry
{
public:
    virtual ~pin_registry() = default;

    [[nodiscard]] virtual pin_cookie pin(const heap_object& obj) = 0;
    virtual void unpin(const pin_cookie& cookie) noexcept = 0;
    [[nodiscard]] virtual bool is_pinned(const heap_object& obj) const noexcept = 0;

    // Called once by an owner's destructor. Leaked pins die with the owner.
    virtual void forget(const heap_object& /*obj*/) noexcept {}

    [[nodiscard]] static pin_registry& shared() noexcept;
};

/*
 * Identity of an owner for the pin protocol. Owners are neither copyable nor
 * movable: views refer to them by address.
 */
class heap_object
{
public:
    heap_object(const heap_object&)            = delete;
    heap_object& operator=(const heap_object&) = delete;
    heap_object(heap_object&&)                 = delete;
    heap_object& operator=(heap_object&&)      = delete;

    [[nodiscard]] pin_registry& registry() const noexcept { return *registry_; }
    [[nodiscard]] bool is_pinned() const noexcept { return registry_->is_pinned(*this); }

protected:
    explicit heap_object(pin_registry& registry) noexcept : registry_(&registry) {}
    ~heap_object() { registry_->forget(*this); }

private:
    pin_registry* registry_;
};

/* =======================================================================
 * default_pin_registry
 *
 * Per-object pin counts behind a mutex. Cookies carry a serial number so a
 * registration can be traced, but release only decrements the count.
 * ======================================================================= */
class default_pin_registry final : public pin_registry
{
public:
    default_pin_registry() = default;

    [[nodiscard]] pin_cookie pin(const heap_object& obj) override
    {
        const u64 serial = next_serial_.fetch_add(1u, std::memory_order_relaxed) + 1u;
        std::lock_guard<std::mutex> lock(mutex_);
        ++pins_[&obj];
        return pin_cookie{this, &obj, serial};
    }

    void unpin(const pin_cookie& cookie) noexcept override
    {
        MEMVIEW_ASSERT(cookie.registry == this);
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = pins_.find(cookie.target);
        MEMVIEW_ASSERT(it != pins_.end());
        if (it == pins_.end()) {
            return;
        }
        if (--it->second == 0u) {
            pins_.erase(it);
        }
    }

    [[nodiscard]] bool is_pinned(const heap_object& obj) const noexcept override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return pins_.find(&obj) != pins_.end();
    }

    void forget(const heap_object& obj) noexcept override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pins_.erase(&obj);
    }

    [[nodiscard]] reg pinned_objects() const noexcept
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<reg>(pins_.size());
    }

private:
    mutable std::mutex                          mutex_;
    std::unordered_map<const heap_object*, reg> pins_;
    std::atomic<u64>                            next_serial_{0u};
};

inline pin_registry& pin_registry::shared() noexcept
{
    static default_pin_registry instance;
    return instance;
}

} // namespace memview

#endif /* MEMVIEW_PIN_REGISTRY_HPP_ */
