#pragma once

#include <algorithm>
#include <cstddef>
#include <limits>
#include <span>
#include <utility>
#include "../config.hpp"
#include "../memory.hpp"
#include "../types/result.hpp"
#include "array_pool.hpp"

namespace memconcept {

/// Append-only growable buffer backed by arrays rented from an ArrayPool
///
/// Written data occupies [0, written_count()); get_span() exposes the free
/// tail and grows the buffer when the tail is smaller than the hint. Growth
/// rents a larger array, copies the written data and returns the old array.
/// Spans and memories obtained before a growth must not be used after it.
///
/// Not thread-safe.
///
/// Example:
/// @code
///   auto writer = ArrayPoolBufferWriter<std::byte>::create().value();
///   auto span = writer.get_span(4).value();
///   std::fill_n(span.begin(), 4, std::byte{0x2A});
///   if (!writer.advance(4)) {
///       // Handle error
///   }
/// @endcode
template <typename T>
class ArrayPoolBufferWriter {
private:
    ArrayPool<T>* pool_;
    RentedArray<T> array_;
    std::size_t index_{0};

    [[nodiscard]] Result<void> ensure_free_capacity(std::size_t size_hint) {
        if (size_hint == 0) {
            size_hint = 1;
        }
        if (size_hint <= free_capacity()) {
            return Ok();
        }
        if (size_hint > std::numeric_limits<std::size_t>::max() / 2 - index_) [[unlikely]] {
            return Err(Error::Code::OutOfMemory, "Cannot grow buffer of {} elements by {}", index_, size_hint);
        }
        const std::size_t required = index_ + size_hint;
        const std::size_t target = std::max({required, capacity() * 2, config::default_buffer_writer_capacity});

        auto rented = pool_->rent(target);
        if (!rented) {
            return rented.error();
        }
        RentedArray<T> grown = std::move(rented.value());
        std::copy_n(array_.data(), index_, grown.data());
        pool_->give_back(std::move(array_));
        array_ = std::move(grown);
        return Ok();
    }

    ArrayPoolBufferWriter(ArrayPool<T>& pool, RentedArray<T> array) noexcept
        : pool_(&pool)
        , array_(std::move(array)) {}

public:
    /// Writer with no array yet; the first get_span() rents one
    explicit ArrayPoolBufferWriter(ArrayPool<T>& pool = ArrayPool<T>::shared()) noexcept
        : pool_(&pool) {}

    /// Writer with an array of at least initial_capacity elements rented upfront
    /// @retval OutOfMemory allocation failed
    [[nodiscard]] static Result<ArrayPoolBufferWriter> create(
        std::size_t initial_capacity = config::default_buffer_writer_capacity,
        ArrayPool<T>& pool = ArrayPool<T>::shared()) {
        auto rented = pool.rent(initial_capacity);
        if (!rented) {
            return rented.error();
        }
        return Ok(ArrayPoolBufferWriter(pool, std::move(rented.value())));
    }

    ~ArrayPoolBufferWriter() {
        pool_->give_back(std::move(array_));
    }

    ArrayPoolBufferWriter(ArrayPoolBufferWriter&& other) noexcept
        : pool_(other.pool_)
        , array_(std::move(other.array_))
        , index_(std::exchange(other.index_, 0)) {}

    ArrayPoolBufferWriter& operator=(ArrayPoolBufferWriter&& other) noexcept {
        if (this != &other) {
            pool_->give_back(std::move(array_));
            pool_ = other.pool_;
            array_ = std::move(other.array_);
            index_ = std::exchange(other.index_, 0);
        }
        return *this;
    }

    ArrayPoolBufferWriter(const ArrayPoolBufferWriter&) = delete;
    ArrayPoolBufferWriter& operator=(const ArrayPoolBufferWriter&) = delete;

    [[nodiscard]] std::size_t written_count() const noexcept { return index_; }
    [[nodiscard]] std::size_t capacity() const noexcept { return array_.size(); }
    [[nodiscard]] std::size_t free_capacity() const noexcept { return capacity() - index_; }

    [[nodiscard]] std::span<const T> written_span() const noexcept {
        return {array_.data(), index_};
    }

    /// Commit count elements of the free tail
    /// @retval InvalidArgument count exceeds free_capacity()
    [[nodiscard]] Result<void> advance(std::size_t count) {
        if (count > free_capacity()) [[unlikely]] {
            return Err(Error::Code::InvalidArgument, "Cannot advance {} elements, {} free",
                       count, free_capacity());
        }
        index_ += count;
        return Ok();
    }

    /// Move the written count to index, exposing or discarding already written data
    /// @retval OutOfRange index exceeds capacity()
    [[nodiscard]] Result<void> advance_to(std::size_t index) {
        if (index > capacity()) [[unlikely]] {
            return Err(Error::Code::OutOfRange, "Index {} exceeds capacity {}", index, capacity());
        }
        index_ = index;
        return Ok();
    }

    /// Free tail holding at least max(size_hint, 1) elements
    /// @retval OutOfMemory growth failed; the buffer is unchanged
    [[nodiscard]] Result<std::span<T>> get_span(std::size_t size_hint = 0) {
        if (auto grown = ensure_free_capacity(size_hint); !grown) {
            return grown.error();
        }
        return Ok(std::span<T>(array_.data() + index_, free_capacity()));
    }

    /// Free tail as a Memory window sharing the rented storage
    [[nodiscard]] Result<Memory<T>> get_memory(std::size_t size_hint = 0) {
        if (auto grown = ensure_free_capacity(size_hint); !grown) {
            return grown.error();
        }
        return Memory<T>::create(array_.storage(), index_, free_capacity());
    }

    /// Reset the written count, clearing the written elements
    void clear() noexcept {
        std::fill_n(array_.data(), index_, T{});
        index_ = 0;
    }
};

} // namespace memconcept
