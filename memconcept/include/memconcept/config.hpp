#pragma once

#include <cstddef>

/// Addressing strategies for Ref<T>
///
/// DIRECT keeps a borrowed T* (platforms with cheap by-reference fields).
/// OWNER_OFFSET keeps the owning storage block plus a byte offset into it
/// and recomputes the address on every access.
///
/// Select with -DMEMCONCEPT_REF_STRATEGY=MEMCONCEPT_REF_STRATEGY_OWNER_OFFSET,
/// or through the MEMCONCEPT_REF_STRATEGY CMake option.
#define MEMCONCEPT_REF_STRATEGY_DIRECT 1
#define MEMCONCEPT_REF_STRATEGY_OWNER_OFFSET 2

#ifndef MEMCONCEPT_REF_STRATEGY
#define MEMCONCEPT_REF_STRATEGY MEMCONCEPT_REF_STRATEGY_DIRECT
#endif

#if MEMCONCEPT_REF_STRATEGY != MEMCONCEPT_REF_STRATEGY_DIRECT && \
    MEMCONCEPT_REF_STRATEGY != MEMCONCEPT_REF_STRATEGY_OWNER_OFFSET
#error "MEMCONCEPT_REF_STRATEGY must be MEMCONCEPT_REF_STRATEGY_DIRECT or MEMCONCEPT_REF_STRATEGY_OWNER_OFFSET"
#endif

namespace memconcept {
namespace config {

/// Name of the reference strategy compiled in
inline constexpr const char* ref_strategy_name =
#if MEMCONCEPT_REF_STRATEGY == MEMCONCEPT_REF_STRATEGY_OWNER_OFFSET
    "owner_offset";
#else
    "direct";
#endif

/// Initial capacity of an ArrayPoolBufferWriter created without a size
inline constexpr std::size_t default_buffer_writer_capacity = 256;

/// Smallest array handed out by ArrayPool::rent
inline constexpr std::size_t min_pooled_array_length = 16;

/// Arrays larger than this are allocated exactly and never retained by the pool
inline constexpr std::size_t default_pool_max_array_length = 1024 * 1024;

/// Retained arrays per power-of-two bucket
inline constexpr std::size_t default_pool_max_arrays_per_bucket = 50;

} // namespace config
} // namespace memconcept
