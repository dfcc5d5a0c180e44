/*
 * memview_config.hpp
 *
 * Build toggles of the memview headers.
 */

#ifndef MEMVIEW_CONFIG_HPP_
#define MEMVIEW_CONFIG_HPP_

/*
 * memview settings
 * Build toggles:
 *   - MEMVIEW_ENABLE_EXCEPTIONS (default: 1)
 *       0 -> range/type violations assert and abort (fail fast)
 *       1 -> range/type violations throw memview::memory_error subclasses
 *
 *   - MEMVIEW_ENABLE_UTF8_OWNER (default: 1)
 *       0 -> utf8_buffer owners are rejected at compile time
 *       1 -> byte-sized textual element types (char8_t, unsigned char, std::byte)
 *            may view a memview::utf8_buffer
 *
 *   - MEMVIEW_ALLOC_PREFER_ALIGNED_NEW (default: 0)
 *       0 -> over-aligned owner storage uses the portable header-based path
 *       1 -> use ::operator new(size, align_val_t) when the toolchain has it
 */

// ============================================================================
// Exceptions configuration
// ============================================================================
//
// Single switch:
//   - MEMVIEW_ENABLE_EXCEPTIONS == 0 : library assumes "no exceptions" mode.
//   - MEMVIEW_ENABLE_EXCEPTIONS == 1 : range/type errors throw at the detecting call.
//
// Default: 1.
//
#ifndef MEMVIEW_ENABLE_EXCEPTIONS
#  define MEMVIEW_ENABLE_EXCEPTIONS 1
#endif /* MEMVIEW_ENABLE_EXCEPTIONS */

#ifndef MEMVIEW_ENABLE_UTF8_OWNER
#  define MEMVIEW_ENABLE_UTF8_OWNER 1
#endif /* MEMVIEW_ENABLE_UTF8_OWNER */

#ifndef MEMVIEW_ALLOC_PREFER_ALIGNED_NEW
#  define MEMVIEW_ALLOC_PREFER_ALIGNED_NEW 0
#endif /* MEMVIEW_ALLOC_PREFER_ALIGNED_NEW */


// assert ------------------------
#ifndef MEMVIEW_ASSERT
#  define MEMVIEW_ASSERT(x)
#endif /* MEMVIEW_ASSERT */


#endif /* MEMVIEW_CONFIG_HPP_ */
