/*
 * basic_types.h — fixed-width aliases shared by the memview headers
 *
 *  Alias  │ Meaning
 * ────────┼──────────────────────────────────────────────────────
 *  u8..u64│ exact-width unsigned integers
 *  i8..i64│ exact-width signed integers
 *  reg    │ unsigned native word (sizes, allocation counts)
 *  sreg   │ signed native word (pointer differences)
 *  usize  │ std::size_t
 *
 * Element indices and lengths of memview views are i32: a view never spans
 * more than INT32_MAX elements, and negative inputs are rejected with a single
 * unsigned comparison.
 */

#ifndef BASIC_TYPES_H_
#define BASIC_TYPES_H_

#ifndef __cplusplus
#  error "basic_types.h: memview is a C++20 header library"
#endif /* __cplusplus */

#include <cstddef>
#include <cstdint>

using u8  = std::uint8_t;   using i8  = std::int8_t;
using u16 = std::uint16_t;  using i16 = std::int16_t;
using u32 = std::uint32_t;  using i32 = std::int32_t;
using u64 = std::uint64_t;  using i64 = std::int64_t;

using reg   = std::size_t;
using sreg  = std::ptrdiff_t;
using usize = std::size_t;

static_assert(sizeof(u32) == 4 && sizeof(i32) == 4, "i32/u32 must be 4 bytes");
static_assert(sizeof(u64) == 8 && sizeof(i64) == 8, "i64/u64 must be 8 bytes");
static_assert(sizeof(reg) == sizeof(void*), "reg must match pointer size");
static_assert(sizeof(reg) >= sizeof(u32), "reg must hold any u32 length");

#endif /* BASIC_TYPES_H_ */
