#pragma once

/// Main header for the memconcept library
///
/// Header-only memory-access primitives:
/// - Buffer owners (fixed byte ranges, pooled growable buffers) and one
///   seekable MemoryStream template built over any of them
/// - Strided 2-D views (Memory2D, Span2D) with zero-copy slicing, pinning
///   and contiguity detection
/// - Ref<T>, a single-element handle whose addressing strategy is chosen
///   at build time
/// - No exceptions: fallible operations return Result<T>
///
/// Example usage:
/// ```cpp
/// #include <memconcept/memconcept.hpp>
///
/// using namespace memconcept;
///
/// SharedArray<int> pixels{1, 2, 3, 4, 5, 6};
/// auto view = Memory2D<int>::create(pixels, 1, 2, 2, 1);
/// if (view) {
///     auto span = view.value().span();
///     int corner = span(1, 1);  // 6
/// }
///
/// auto writer = ArrayPoolBufferWriter<std::byte>::create().value();
/// auto stream = as_stream(writer);
/// if (auto written = stream.write(bytes); !written) {
///     // Handle error
/// }
/// ```

#include "types/result.hpp"
#include "config.hpp"
#include "storage.hpp"
#include "memory_handle.hpp"
#include "memory.hpp"
#include "reference.hpp"
#include "span2d.hpp"
#include "memory2d.hpp"
#include "buffer_owner.hpp"
#include "buffers/array_pool.hpp"
#include "buffers/array_pool_buffer_writer.hpp"
#include "owners/array_owner.hpp"
#include "owners/pool_owner.hpp"
#include "memory_stream.hpp"
#include "extensions.hpp"
