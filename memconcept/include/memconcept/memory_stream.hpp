#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <future>
#include <span>
#include <stop_token>
#include "buffer_owner.hpp"
#include "types/result.hpp"

namespace memconcept {

/// Reference point for MemoryStream::seek
enum class SeekOrigin {
    Begin,
    Current,
    End
};

/// Concept for a sequential byte reader
template <typename T>
concept ByteSource = requires(T source, const T csource, std::span<std::byte> buffer) {
    // Reads up to buffer.size() bytes, 0 at end of data
    { source.read(buffer) } -> std::same_as<Result<std::size_t>>;

    // Next byte as 0..255, or -1 at end of data
    { source.read_byte() } -> std::same_as<Result<int>>;

    { csource.can_read() } -> std::same_as<bool>;
};

/// Concept for a sequential byte writer
template <typename T>
concept ByteSink = requires(T sink, const T csink, std::span<const std::byte> data, std::byte value) {
    // Writes all of data or fails without writing anything
    { sink.write(data) } -> std::same_as<Result<void>>;
    { sink.write_byte(value) } -> std::same_as<Result<void>>;
    { sink.flush() } -> std::same_as<Result<void>>;
    { csink.can_write() } -> std::same_as<bool>;
};

/// Concept for a stream with a random-access cursor
template <typename T>
concept SeekableByteStream = ByteSource<T> && ByteSink<T> &&
    requires(T stream, const T cstream, std::int64_t offset, SeekOrigin origin) {
    { stream.seek(offset, origin) } -> std::same_as<Result<std::int64_t>>;
    { stream.set_position(offset) } -> std::same_as<Result<void>>;
    { cstream.length() } -> std::same_as<Result<std::int64_t>>;
    { cstream.position() } -> std::same_as<Result<std::int64_t>>;
    { cstream.can_seek() } -> std::same_as<bool>;
};

/// Seekable in-memory stream over any buffer owner
///
/// The read, write and seek logic is written once and specialized per owner
/// at compile time. Position and length always come from the owner.
/// Reads copy min(readable, requested) bytes; writes either fit entirely in
/// the owner's window or fail with EndOfStream before touching the owner.
/// After dispose() every operation fails with ObjectDisposed.
///
/// The *_async variants complete synchronously: they report Cancelled when
/// stop was already requested and otherwise return a ready future holding the
/// result of the synchronous call.
///
/// Only one thread at a time should use a stream.
///
/// Example:
/// @code
///   std::array<std::byte, 64> storage{};
///   auto owner = ArrayOwner::create(storage, 0, storage.size()).value();
///   MemoryStream<ArrayOwner> stream(std::move(owner));
///   if (auto written = stream.write(payload); !written) {
///       // written.error().code == Error::Code::EndOfStream when payload is too large
///   }
/// @endcode
template <BufferOwner Owner>
class MemoryStream {
private:
    Owner source_;
    bool read_only_{false};
    bool disposed_{false};

    [[nodiscard]] Result<void> check_open() const;
    [[nodiscard]] Result<void> check_writable() const;
    [[nodiscard]] Result<void> check_position(std::int64_t position) const;

public:
    using owner_type = Owner;

    explicit MemoryStream(Owner source, bool read_only = false) noexcept;

    MemoryStream(MemoryStream&&) noexcept = default;
    MemoryStream& operator=(MemoryStream&&) noexcept = default;
    MemoryStream(const MemoryStream&) = delete;
    MemoryStream& operator=(const MemoryStream&) = delete;

    [[nodiscard]] bool can_read() const noexcept { return !disposed_; }
    [[nodiscard]] bool can_seek() const noexcept { return !disposed_; }
    [[nodiscard]] bool can_write() const noexcept { return !disposed_ && !read_only_; }
    [[nodiscard]] bool is_read_only() const noexcept { return read_only_; }
    [[nodiscard]] bool is_disposed() const noexcept { return disposed_; }

    [[nodiscard]] Result<std::int64_t> length() const;
    [[nodiscard]] Result<std::int64_t> position() const;

    /// @retval OutOfRange position outside [0, length()]
    [[nodiscard]] Result<void> set_position(std::int64_t position);

    /// Copy up to buffer.size() bytes from the current position
    /// @return Bytes copied; 0 at end of data
    [[nodiscard]] Result<std::size_t> read(std::span<std::byte> buffer);

    /// Read into buffer[offset, offset + count)
    /// @retval InvalidArgument offset/count outside buffer
    [[nodiscard]] Result<std::size_t> read(std::span<std::byte> buffer, std::size_t offset, std::size_t count);

    /// Next byte as 0..255, or -1 at end of data
    [[nodiscard]] Result<int> read_byte();

    /// @retval NotSupported stream is read-only
    /// @retval EndOfStream the owner's window is shorter than data
    [[nodiscard]] Result<void> write(std::span<const std::byte> data);

    /// Write buffer[offset, offset + count)
    [[nodiscard]] Result<void> write(std::span<const std::byte> buffer, std::size_t offset, std::size_t count);

    /// @retval EndOfStream no space remains
    [[nodiscard]] Result<void> write_byte(std::byte value);

    /// Move the position relative to origin
    /// @return The new absolute position
    /// @retval OutOfRange resulting position outside [0, length()]
    /// @retval InvalidArgument origin is not a SeekOrigin value
    [[nodiscard]] Result<std::int64_t> seek(std::int64_t offset, SeekOrigin origin);

    /// Always NotSupported: owners are fixed-size or grown by their writer
    [[nodiscard]] Result<void> set_length(std::int64_t length);

    [[nodiscard]] Result<void> flush();

    /// Write the owner's whole remaining window to destination in one call
    /// @note The position advances only when the destination accepted the bytes
    template <ByteSink Sink>
    [[nodiscard]] Result<void> copy_to(Sink& destination);

    [[nodiscard]] std::future<Result<std::size_t>> read_async(std::span<std::byte> buffer,
                                                              std::stop_token token = {});
    [[nodiscard]] std::future<Result<void>> write_async(std::span<const std::byte> data,
                                                        std::stop_token token = {});
    [[nodiscard]] std::future<Result<void>> flush_async(std::stop_token token = {});

    template <ByteSink Sink>
    [[nodiscard]] std::future<Result<void>> copy_to_async(Sink& destination, std::stop_token token = {});

    /// Mark the stream disposed and reset the owner; later calls are no-ops
    void dispose() noexcept;

    [[nodiscard]] const Owner& owner() const noexcept { return source_; }
};

} // namespace memconcept

#define MEMCONCEPT_MEMORY_STREAM_HEADER
#include "impl/memory_stream_impl.hpp"
