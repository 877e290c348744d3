#pragma once

#include <cstddef>
#include <span>
#include "../buffer_owner.hpp"
#include "../buffers/array_pool_buffer_writer.hpp"
#include "../types/result.hpp"

namespace memconcept {

/// Buffer owner facade over an externally owned ArrayPoolBufferWriter
///
/// current_length() is the writer capacity and position() its written count.
/// The writer grows on demand, so write windows always satisfy the size hint.
/// The writer must outlive the owner; a default-constructed owner has no
/// writer and rejects every mutating call.
class PoolOwner {
private:
    ArrayPoolBufferWriter<std::byte>* writer_{nullptr};

public:
    PoolOwner() noexcept = default;

    explicit PoolOwner(ArrayPoolBufferWriter<std::byte>& writer) noexcept
        : writer_(&writer) {}

    [[nodiscard]] std::size_t current_length() const noexcept {
        return writer_ ? writer_->capacity() : 0;
    }

    [[nodiscard]] std::size_t readable_length() const noexcept {
        return writer_ ? writer_->free_capacity() : 0;
    }

    [[nodiscard]] std::size_t position() const noexcept {
        return writer_ ? writer_->written_count() : 0;
    }

    /// Re-anchor the written count
    /// @retval OutOfRange position exceeds the writer capacity
    [[nodiscard]] Result<void> set_position(std::size_t position) {
        if (!writer_) [[unlikely]] {
            return Err(Error::Code::InvalidArgument, "PoolOwner has no buffer writer");
        }
        return writer_->advance_to(position);
    }

    [[nodiscard]] Result<void> advance(std::size_t count) {
        if (!writer_) [[unlikely]] {
            return Err(Error::Code::InvalidArgument, "PoolOwner has no buffer writer");
        }
        return writer_->advance(count);
    }

    [[nodiscard]] Result<std::span<std::byte>> get_span(std::size_t size_hint = 0) {
        if (!writer_) [[unlikely]] {
            return Err(Error::Code::InvalidArgument, "PoolOwner has no buffer writer");
        }
        return writer_->get_span(size_hint);
    }

    [[nodiscard]] ArrayPoolBufferWriter<std::byte>* writer() const noexcept { return writer_; }
};

static_assert(BufferOwner<PoolOwner>, "PoolOwner must satisfy BufferOwner concept");

} // namespace memconcept
