/*
 * memview.hpp
 *
 * Everything a user of the views needs: owners, pinning, memory<T>,
 * read_only_memory<T> and memory_marshal.
 */

#ifndef MEMVIEW_MEMVIEW_HPP_
#define MEMVIEW_MEMVIEW_HPP_

#include "base/memview_config.hpp"
#include "base/memview_errors.hpp"
#include "base/pin_registry.hpp"

#include "managed_array.hpp"
#include "text_buffer.hpp"
#include "memory_handle.hpp"
#include "memory_manager.hpp"
#include "memory.hpp"

#endif /* MEMVIEW_MEMVIEW_HPP_ */
