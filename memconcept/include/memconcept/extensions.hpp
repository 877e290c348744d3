#pragma once

#include <cstddef>
#include <span>
#include "buffers/array_pool_buffer_writer.hpp"
#include "memory.hpp"
#include "memory2d.hpp"
#include "memory_stream.hpp"
#include "owners/array_owner.hpp"
#include "owners/pool_owner.hpp"
#include "span2d.hpp"
#include "types/result.hpp"

namespace memconcept {

static_assert(SeekableByteStream<MemoryStream<ArrayOwner>>, "MemoryStream<ArrayOwner> must satisfy SeekableByteStream concept");
static_assert(SeekableByteStream<MemoryStream<PoolOwner>>, "MemoryStream<PoolOwner> must satisfy SeekableByteStream concept");

/// Read-write stream over a byte memory region
[[nodiscard]] inline MemoryStream<ArrayOwner> as_stream(const Memory<std::byte>& memory) noexcept {
    return MemoryStream<ArrayOwner>(ArrayOwner::from_memory(memory), false);
}

/// Read-only stream over a byte memory region
[[nodiscard]] inline MemoryStream<ArrayOwner> as_stream(const Memory<const std::byte>& memory) noexcept {
    return MemoryStream<ArrayOwner>(ArrayOwner::from_memory(memory), true);
}

/// Read-write stream over borrowed bytes; the caller keeps buffer alive
/// @retval OutOfRange offset + length exceeds buffer.size()
[[nodiscard]] inline Result<MemoryStream<ArrayOwner>> as_stream(std::span<std::byte> buffer,
                                                                std::size_t offset, std::size_t length) {
    auto owner = ArrayOwner::create(buffer, offset, length);
    if (!owner) {
        return owner.error();
    }
    return Ok(MemoryStream<ArrayOwner>(std::move(owner.value()), false));
}

/// Growable stream appending to writer; the writer must outlive the stream
[[nodiscard]] inline MemoryStream<PoolOwner> as_stream(ArrayPoolBufferWriter<std::byte>& writer) noexcept {
    return MemoryStream<PoolOwner>(PoolOwner(writer), false);
}

/// Strided 2-D view over flat memory
template <typename T>
[[nodiscard]] Result<Memory2D<T>> as_memory2d(const Memory<T>& memory, int width, int height) {
    return Memory2D<T>::create(memory, 0, width, height, 0);
}

template <typename T>
[[nodiscard]] Result<Memory2D<T>> as_memory2d(const Memory<T>& memory, int offset, int width, int height, int pitch) {
    return Memory2D<T>::create(memory, offset, width, height, pitch);
}

/// Borrowed 2-D view over a contiguous span
template <typename T>
[[nodiscard]] Result<Span2D<T>> as_span2d(std::span<T> data, int width, int height) {
    return Span2D<T>::create(data, width, height);
}

} // namespace memconcept
