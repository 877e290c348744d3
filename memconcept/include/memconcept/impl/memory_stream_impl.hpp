#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <future>
#include <span>
#include <stop_token>
#include <utility>
#include "../buffer_owner.hpp"
#include "../types/result.hpp"

#ifndef MEMCONCEPT_MEMORY_STREAM_HEADER
#include "../memory_stream.hpp" // for linters
#endif

namespace memconcept {

namespace stream_impl {

template <typename R>
[[nodiscard]] std::future<R> ready_future(R value) {
    std::promise<R> promise;
    promise.set_value(std::move(value));
    return promise.get_future();
}

[[nodiscard]] inline Error cancelled_error() {
    return Err(Error::Code::Cancelled, "Operation cancelled before start");
}

[[nodiscard]] inline Result<void> validate_buffer_range(std::size_t buffer_size, std::size_t offset, std::size_t count) {
    if (offset > buffer_size) [[unlikely]] {
        return Err(Error::Code::InvalidArgument, "Offset {} exceeds buffer size {}", offset, buffer_size);
    }
    if (count > buffer_size - offset) [[unlikely]] {
        return Err(Error::Code::InvalidArgument, "Count {} exceeds the {} bytes after offset {}",
                   count, buffer_size - offset, offset);
    }
    return Ok();
}

} // namespace stream_impl

template <BufferOwner Owner>
inline MemoryStream<Owner>::MemoryStream(Owner source, bool read_only) noexcept
    : source_(std::move(source))
    , read_only_(read_only) {}

template <BufferOwner Owner>
inline Result<void> MemoryStream<Owner>::check_open() const {
    if (disposed_) [[unlikely]] {
        return Err(Error::Code::ObjectDisposed, "The stream has been disposed");
    }
    return Ok();
}

template <BufferOwner Owner>
inline Result<void> MemoryStream<Owner>::check_writable() const {
    if (auto open = check_open(); !open) {
        return open;
    }
    if (read_only_) [[unlikely]] {
        return Err(Error::Code::NotSupported, "The stream is read-only");
    }
    return Ok();
}

template <BufferOwner Owner>
inline Result<void> MemoryStream<Owner>::check_position(std::int64_t position) const {
    const auto length = static_cast<std::int64_t>(source_.current_length());
    if (position < 0 || position > length) [[unlikely]] {
        return Err(Error::Code::OutOfRange, "Position {} outside [0, {}]", position, length);
    }
    return Ok();
}

template <BufferOwner Owner>
inline Result<std::int64_t> MemoryStream<Owner>::length() const {
    if (auto open = check_open(); !open) {
        return open.error();
    }
    return Ok(static_cast<std::int64_t>(source_.current_length()));
}

template <BufferOwner Owner>
inline Result<std::int64_t> MemoryStream<Owner>::position() const {
    if (auto open = check_open(); !open) {
        return open.error();
    }
    return Ok(static_cast<std::int64_t>(source_.position()));
}

template <BufferOwner Owner>
inline Result<void> MemoryStream<Owner>::set_position(std::int64_t position) {
    if (auto open = check_open(); !open) {
        return open;
    }
    if (auto valid = check_position(position); !valid) {
        return valid;
    }
    return source_.set_position(static_cast<std::size_t>(position));
}

template <BufferOwner Owner>
inline Result<std::size_t> MemoryStream<Owner>::read(std::span<std::byte> buffer) {
    if (auto open = check_open(); !open) {
        return open.error();
    }

    std::size_t count = std::min(source_.readable_length(), buffer.size());
    if (count == 0) {
        return Ok(std::size_t{0});
    }

    auto window = source_.get_span(count);
    if (!window) {
        return window.error();
    }
    count = std::min(count, window.value().size());
    std::copy_n(window.value().data(), count, buffer.data());

    if (auto advanced = source_.advance(count); !advanced) {
        return advanced.error();
    }
    return Ok(count);
}

template <BufferOwner Owner>
inline Result<std::size_t> MemoryStream<Owner>::read(std::span<std::byte> buffer, std::size_t offset, std::size_t count) {
    if (auto open = check_open(); !open) {
        return open.error();
    }
    if (auto valid = stream_impl::validate_buffer_range(buffer.size(), offset, count); !valid) {
        return valid.error();
    }
    return read(buffer.subspan(offset, count));
}

template <BufferOwner Owner>
inline Result<int> MemoryStream<Owner>::read_byte() {
    if (auto open = check_open(); !open) {
        return open.error();
    }
    if (source_.readable_length() == 0) {
        return Ok(-1);
    }

    auto window = source_.get_span(1);
    if (!window) {
        return window.error();
    }
    if (window.value().empty()) {
        return Ok(-1);
    }
    const int value = std::to_integer<int>(window.value()[0]);

    if (auto advanced = source_.advance(1); !advanced) {
        return advanced.error();
    }
    return Ok(value);
}

template <BufferOwner Owner>
inline Result<void> MemoryStream<Owner>::write(std::span<const std::byte> data) {
    if (auto writable = check_writable(); !writable) {
        return writable;
    }
    if (data.empty()) {
        return Ok();
    }

    auto window = source_.get_span(data.size());
    if (!window) {
        return window.error();
    }
    if (window.value().size() < data.size()) [[unlikely]] {
        return Err(Error::Code::EndOfStream, "Cannot write {} bytes, only {} remain",
                   data.size(), window.value().size());
    }
    std::copy(data.begin(), data.end(), window.value().begin());
    return source_.advance(data.size());
}

template <BufferOwner Owner>
inline Result<void> MemoryStream<Owner>::write(std::span<const std::byte> buffer, std::size_t offset, std::size_t count) {
    if (auto writable = check_writable(); !writable) {
        return writable;
    }
    if (auto valid = stream_impl::validate_buffer_range(buffer.size(), offset, count); !valid) {
        return valid;
    }
    return write(buffer.subspan(offset, count));
}

template <BufferOwner Owner>
inline Result<void> MemoryStream<Owner>::write_byte(std::byte value) {
    if (auto writable = check_writable(); !writable) {
        return writable;
    }

    auto window = source_.get_span(1);
    if (!window) {
        return window.error();
    }
    if (window.value().empty()) [[unlikely]] {
        return Err(Error::Code::EndOfStream, "Cannot write a byte at position {}, no space remains",
                   source_.position());
    }
    window.value()[0] = value;
    return source_.advance(1);
}

template <BufferOwner Owner>
inline Result<std::int64_t> MemoryStream<Owner>::seek(std::int64_t offset, SeekOrigin origin) {
    if (auto open = check_open(); !open) {
        return open.error();
    }

    std::int64_t base = 0;
    switch (origin) {
        case SeekOrigin::Begin:
            break;
        case SeekOrigin::Current:
            base = static_cast<std::int64_t>(source_.position());
            break;
        case SeekOrigin::End:
            base = static_cast<std::int64_t>(source_.current_length());
            break;
        default:
            return Err(Error::Code::InvalidArgument, "Unknown seek origin {}", static_cast<int>(origin));
    }

    // Both bounds are in [0, length], so neither subtraction overflows
    const auto length = static_cast<std::int64_t>(source_.current_length());
    if (offset > length - base || offset < -base) [[unlikely]] {
        return Err(Error::Code::OutOfRange, "Seek by {} from {} leaves [0, {}]", offset, base, length);
    }

    const std::int64_t index = base + offset;
    if (auto valid = check_position(index); !valid) {
        return valid.error();
    }
    if (auto moved = source_.set_position(static_cast<std::size_t>(index)); !moved) {
        return moved.error();
    }
    return Ok(index);
}

template <BufferOwner Owner>
inline Result<void> MemoryStream<Owner>::set_length(std::int64_t length) {
    return Err(Error::Code::NotSupported, "Cannot set the length of a memory stream to {}", length);
}

template <BufferOwner Owner>
inline Result<void> MemoryStream<Owner>::flush() {
    return check_open();
}

template <BufferOwner Owner>
template <ByteSink Sink>
inline Result<void> MemoryStream<Owner>::copy_to(Sink& destination) {
    if (auto open = check_open(); !open) {
        return open;
    }

    const std::size_t count = source_.readable_length();
    if (count == 0) {
        return Ok();
    }

    auto window = source_.get_span(count);
    if (!window) {
        return window.error();
    }
    auto pending = std::span<const std::byte>(window.value().data(), std::min(count, window.value().size()));
    if (auto written = destination.write(pending); !written) {
        return written;
    }
    return source_.advance(pending.size());
}

template <BufferOwner Owner>
inline std::future<Result<std::size_t>> MemoryStream<Owner>::read_async(std::span<std::byte> buffer,
                                                                         std::stop_token token) {
    if (token.stop_requested()) {
        return stream_impl::ready_future(Result<std::size_t>{stream_impl::cancelled_error()});
    }
    return stream_impl::ready_future(read(buffer));
}

template <BufferOwner Owner>
inline std::future<Result<void>> MemoryStream<Owner>::write_async(std::span<const std::byte> data,
                                                                   std::stop_token token) {
    if (token.stop_requested()) {
        return stream_impl::ready_future(Result<void>{stream_impl::cancelled_error()});
    }
    return stream_impl::ready_future(write(data));
}

template <BufferOwner Owner>
inline std::future<Result<void>> MemoryStream<Owner>::flush_async(std::stop_token token) {
    if (token.stop_requested()) {
        return stream_impl::ready_future(Result<void>{stream_impl::cancelled_error()});
    }
    return stream_impl::ready_future(flush());
}

template <BufferOwner Owner>
template <ByteSink Sink>
inline std::future<Result<void>> MemoryStream<Owner>::copy_to_async(Sink& destination, std::stop_token token) {
    if (token.stop_requested()) {
        return stream_impl::ready_future(Result<void>{stream_impl::cancelled_error()});
    }
    return stream_impl::ready_future(copy_to(destination));
}

template <BufferOwner Owner>
inline void MemoryStream<Owner>::dispose() noexcept {
    if (disposed_) {
        return;
    }
    disposed_ = true;
    source_ = Owner{};
}

} // namespace memconcept
