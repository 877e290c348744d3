#pragma once

#include <cstddef>
#include <span>
#include "../buffer_owner.hpp"
#include "../memory.hpp"
#include "../storage.hpp"
#include "../types/result.hpp"

namespace memconcept {

/// Buffer owner over a fixed contiguous byte range (zero-copy, no allocation)
///
/// The range is { base + offset, length }. Only the position changes after
/// construction; reads and writes see the remaining [position, length) slice.
/// When built from Memory the owning storage block is kept alive; when built
/// from a raw span the caller keeps the bytes alive.
class ArrayOwner {
private:
    Storage keep_alive_;
    std::byte* base_{nullptr};
    std::size_t offset_{0};
    std::size_t length_{0};
    std::size_t position_{0};

    ArrayOwner(Storage keep_alive, std::byte* base, std::size_t offset, std::size_t length) noexcept
        : keep_alive_(std::move(keep_alive))
        , base_(base)
        , offset_(offset)
        , length_(length) {}

public:
    /// Empty owner: zero length, nothing to read or write
    ArrayOwner() noexcept = default;

    ArrayOwner(ArrayOwner&&) noexcept = default;
    ArrayOwner& operator=(ArrayOwner&&) noexcept = default;
    ArrayOwner(const ArrayOwner&) = default;
    ArrayOwner& operator=(const ArrayOwner&) = default;

    /// Borrow length bytes of buffer starting at offset
    /// @retval OutOfRange offset + length exceeds buffer.size()
    [[nodiscard]] static Result<ArrayOwner> create(std::span<std::byte> buffer,
                                                   std::size_t offset, std::size_t length) {
        if (offset > buffer.size() || length > buffer.size() - offset) [[unlikely]] {
            return Err(Error::Code::OutOfRange, "Range [{}, +{}) exceeds buffer size {}",
                       offset, length, buffer.size());
        }
        return Ok(ArrayOwner(nullptr, buffer.data(), offset, length));
    }

    /// Window over a Memory region, sharing its storage
    [[nodiscard]] static ArrayOwner from_memory(const Memory<std::byte>& memory) noexcept {
        return ArrayOwner(memory.owner(), memory.data(), 0, memory.size());
    }

    /// Window over a read-only Memory region
    /// @note The owner itself is writable; callers wrap it in a read-only stream
    [[nodiscard]] static ArrayOwner from_memory(const Memory<const std::byte>& memory) noexcept {
        return ArrayOwner(memory.owner(), const_cast<std::byte*>(memory.data()), 0, memory.size());
    }

    [[nodiscard]] std::size_t current_length() const noexcept { return length_; }

    [[nodiscard]] std::size_t readable_length() const noexcept { return length_ - position_; }

    [[nodiscard]] std::size_t position() const noexcept { return position_; }

    /// @retval OutOfRange position > current_length()
    [[nodiscard]] Result<void> set_position(std::size_t position) {
        if (position > length_) [[unlikely]] {
            return Err(Error::Code::OutOfRange, "Position {} exceeds length {}", position, length_);
        }
        position_ = position;
        return Ok();
    }

    /// @retval InvalidArgument count exceeds the remaining window
    [[nodiscard]] Result<void> advance(std::size_t count) {
        if (count > readable_length()) [[unlikely]] {
            return Err(Error::Code::InvalidArgument, "Cannot advance {} bytes, {} remain",
                       count, readable_length());
        }
        position_ += count;
        return Ok();
    }

    /// Remaining [position, length) slice; the size hint is ignored
    [[nodiscard]] Result<std::span<std::byte>> get_span(std::size_t /*size_hint*/ = 0) {
        if (readable_length() == 0) {
            return Ok(std::span<std::byte>{});
        }
        return Ok(std::span<std::byte>(base_ + offset_ + position_, readable_length()));
    }
};

static_assert(BufferOwner<ArrayOwner>, "ArrayOwner must satisfy BufferOwner concept");

} // namespace memconcept
