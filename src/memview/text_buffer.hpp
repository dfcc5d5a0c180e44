/*
 * text_buffer.hpp
 *
 * Immutable text owners.
 *
 * - text_buffer : char data. Viewable by views of char only.
 * - utf8_buffer : char8_t data. Viewable by byte-sized views that may carry
 *                 text (char8_t, unsigned char, std::byte) when
 *                 MEMVIEW_ENABLE_UTF8_OWNER is on.
 *
 * Both keep a trailing NUL after length() elements so a pinned address can be
 * handed to C APIs. The contents never change; the storage may be relocated
 * like any other owner unless pinned.
 */

#ifndef MEMVIEW_TEXT_BUFFER_HPP_
#define MEMVIEW_TEXT_BUFFER_HPP_

#include <cstddef>      // std::byte
#include <limits>
#include <string>       // std::char_traits
#include <string_view>
#include <type_traits>

#include "basic_types.h"
#include "base/memview_errors.hpp"
#include "base/memview_storage.hpp"
#include "base/memview_tools.hpp"
#include "base/pin_registry.hpp"

namespace memview {

template<class C>
class basic_text_buffer final : public heap_object
{
public:
    using value_type     = C;
    using const_pointer  = const C*;
    using view_type      = std::basic_string_view<C>;
    using size_type      = i32;

    explicit basic_text_buffer(const view_type text, pin_registry& registry = pin_registry::shared())
        : heap_object(registry)
        , storage_(checked_capacity(text.size()))
        , length_(static_cast<i32>(text.size()))
    {
        if (!text.empty()) {
            std::char_traits<C>::copy(storage_.data(), text.data(), text.size());
        }
    }

    ~basic_text_buffer() = default;

    [[nodiscard]] MV_FORCEINLINE i32 length() const noexcept { return length_; }
    [[nodiscard]] MV_FORCEINLINE size_type size() const noexcept { return length_; }
    [[nodiscard]] MV_FORCEINLINE bool empty() const noexcept { return length_ == 0; }

    // NUL-terminated.
    [[nodiscard]] MV_FORCEINLINE const_pointer c_str() const noexcept { return storage_.data(); }
    [[nodiscard]] MV_FORCEINLINE view_type view() const noexcept {
        return view_type(storage_.data(), static_cast<reg>(length_));
    }

    // Address of character `index` (index == length() yields the terminator).
    [[nodiscard]] MV_FORCEINLINE const_pointer borrow_raw(const i32 index) const noexcept
    {
        MEMVIEW_ASSERT(static_cast<u32>(index) <= static_cast<u32>(length_));
        return storage_.data() + index;
    }

    [[nodiscard]] bool relocate()
    {
        if (is_pinned()) {
            return false;
        }
        return storage_.relocate();
    }

private:
    static reg checked_capacity(const reg n)
    {
        if (n >= static_cast<reg>(std::numeric_limits<i32>::max())) {
            detail::throw_helper::out_of_range(argument::text);
        }
        return n + 1u;   // value-initialized, so the terminator is already in place
    }

    detail::owned_buffer<C> storage_;
    i32                     length_;
};

using text_buffer = basic_text_buffer<char>;
using utf8_buffer = basic_text_buffer<char8_t>;

namespace detail {

template<class T>
inline constexpr bool is_text_element_v = std::is_same_v<std::remove_cv_t<T>, char>;

// Byte-sized element types that may carry UTF-8 text.
template<class T>
inline constexpr bool may_represent_utf8_v =
    (MEMVIEW_ENABLE_UTF8_OWNER != 0) &&
    (std::is_same_v<std::remove_cv_t<T>, char8_t> ||
     std::is_same_v<std::remove_cv_t<T>, unsigned char> ||
     std::is_same_v<std::remove_cv_t<T>, std::byte>);

} // namespace detail
} // namespace memview

#endif /* MEMVIEW_TEXT_BUFFER_HPP_ */
