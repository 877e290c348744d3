#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <span>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include "types/result.hpp"

namespace memconcept {

class MemoryHandle;

/// Reference-counted, type-tagged block of elements
///
/// This is the backing identity shared by SharedArray, Memory and Memory2D.
/// The block never relocates its elements; pin_count() tracks outstanding
/// MemoryHandle instances so callers can tell when raw addresses are in use.
class StorageBlock {
private:
    std::type_index element_type_;
    std::size_t element_size_;
    std::size_t length_;
    std::byte* data_;
    std::atomic<std::size_t> pin_count_{0};

    friend class MemoryHandle;

    void add_pin() noexcept { pin_count_.fetch_add(1, std::memory_order_relaxed); }
    void remove_pin() noexcept { pin_count_.fetch_sub(1, std::memory_order_relaxed); }

protected:
    StorageBlock(std::type_index element_type, std::size_t element_size,
                 std::size_t length, std::byte* data) noexcept
        : element_type_(element_type)
        , element_size_(element_size)
        , length_(length)
        , data_(data) {}

public:
    virtual ~StorageBlock() = default;

    StorageBlock(const StorageBlock&) = delete;
    StorageBlock& operator=(const StorageBlock&) = delete;

    [[nodiscard]] std::type_index element_type() const noexcept { return element_type_; }
    [[nodiscard]] std::size_t element_size() const noexcept { return element_size_; }

    /// Number of elements
    [[nodiscard]] std::size_t length() const noexcept { return length_; }
    [[nodiscard]] std::size_t byte_length() const noexcept { return length_ * element_size_; }

    [[nodiscard]] std::byte* data() noexcept { return data_; }
    [[nodiscard]] const std::byte* data() const noexcept { return data_; }

    [[nodiscard]] std::size_t pin_count() const noexcept {
        return pin_count_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] bool is_pinned() const noexcept { return pin_count() != 0; }

    /// True if the block stores elements of type T (cv-qualifiers ignored)
    template <typename T>
    [[nodiscard]] bool holds() const noexcept {
        return element_type_ == std::type_index(typeid(std::remove_cv_t<T>));
    }
};

namespace storage_impl {

template <typename T>
class TypedStorageBlock final : public StorageBlock {
private:
    std::unique_ptr<T[]> elements_;

    TypedStorageBlock(std::unique_ptr<T[]> elements, std::size_t length) noexcept
        : StorageBlock(std::type_index(typeid(T)), sizeof(T), length,
                       reinterpret_cast<std::byte*>(elements.get()))
        , elements_(std::move(elements)) {}

public:
    /// Allocate a block of value-initialized elements
    static std::shared_ptr<StorageBlock> allocate(std::size_t length) {
        std::unique_ptr<T[]> elements(length == 0 ? nullptr : new T[length]());
        return std::shared_ptr<StorageBlock>(new TypedStorageBlock(std::move(elements), length));
    }
};

} // namespace storage_impl

/// Shared handle to a storage block (null for "no backing")
using Storage = std::shared_ptr<StorageBlock>;

/// Allocate storage for length value-initialized elements of T
/// @throws std::bad_alloc on allocation failure
template <typename T>
[[nodiscard]] Storage make_storage(std::size_t length) {
    static_assert(!std::is_const_v<T> && !std::is_volatile_v<T>, "Storage element type must be unqualified");
    return storage_impl::TypedStorageBlock<T>::allocate(length);
}

/// One-dimensional array with reference semantics
///
/// Copies share the same storage block, as array references do.
template <typename T>
class SharedArray {
private:
    Storage storage_;

public:
    using value_type = T;

    SharedArray() noexcept = default;

    explicit SharedArray(std::size_t length)
        : storage_(make_storage<T>(length)) {}

    SharedArray(std::initializer_list<T> values)
        : storage_(make_storage<T>(values.size())) {
        std::copy(values.begin(), values.end(), data());
    }

    [[nodiscard]] std::size_t size() const noexcept { return storage_ ? storage_->length() : 0; }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    [[nodiscard]] T* data() const noexcept {
        return storage_ ? reinterpret_cast<T*>(storage_->data()) : nullptr;
    }

    [[nodiscard]] T& operator[](std::size_t index) const noexcept { return data()[index]; }

    [[nodiscard]] std::span<T> span() const noexcept { return {data(), size()}; }

    [[nodiscard]] T* begin() const noexcept { return data(); }
    [[nodiscard]] T* end() const noexcept { return data() + size(); }

    [[nodiscard]] const Storage& storage() const noexcept { return storage_; }
};

/// Rectangular rows x columns array, row-major, with reference semantics
template <typename T>
class SharedArray2D {
private:
    Storage storage_;
    std::size_t rows_{0};
    std::size_t columns_{0};

public:
    using value_type = T;

    SharedArray2D() noexcept = default;

    SharedArray2D(std::size_t rows, std::size_t columns)
        : storage_(make_storage<T>(rows * columns))
        , rows_(rows)
        , columns_(columns) {}

    /// Build from nested row lists; all rows must have the same length
    [[nodiscard]] static Result<SharedArray2D> from_rows(
        std::initializer_list<std::initializer_list<T>> rows) {
        const std::size_t columns = rows.size() == 0 ? 0 : rows.begin()->size();
        for (const auto& row : rows) {
            if (row.size() != columns) [[unlikely]] {
                return Err(Error::Code::InvalidArgument,
                           "Jagged rows: expected {} columns, got {}", columns, row.size());
            }
        }
        SharedArray2D array(rows.size(), columns);
        T* out = array.data();
        for (const auto& row : rows) {
            out = std::copy(row.begin(), row.end(), out);
        }
        return Ok(std::move(array));
    }

    [[nodiscard]] std::size_t rows() const noexcept { return rows_; }
    [[nodiscard]] std::size_t columns() const noexcept { return columns_; }
    [[nodiscard]] std::size_t size() const noexcept { return rows_ * columns_; }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    [[nodiscard]] T* data() const noexcept {
        return storage_ ? reinterpret_cast<T*>(storage_->data()) : nullptr;
    }

    [[nodiscard]] T& operator()(std::size_t row, std::size_t column) const noexcept {
        return data()[row * columns_ + column];
    }

    [[nodiscard]] std::span<T> span() const noexcept { return {data(), size()}; }

    [[nodiscard]] const Storage& storage() const noexcept { return storage_; }
};

/// depth x rows x columns array, layer-major then row-major, with reference semantics
template <typename T>
class SharedArray3D {
private:
    Storage storage_;
    std::size_t depth_{0};
    std::size_t rows_{0};
    std::size_t columns_{0};

public:
    using value_type = T;

    SharedArray3D() noexcept = default;

    SharedArray3D(std::size_t depth, std::size_t rows, std::size_t columns)
        : storage_(make_storage<T>(depth * rows * columns))
        , depth_(depth)
        , rows_(rows)
        , columns_(columns) {}

    [[nodiscard]] std::size_t depth() const noexcept { return depth_; }
    [[nodiscard]] std::size_t rows() const noexcept { return rows_; }
    [[nodiscard]] std::size_t columns() const noexcept { return columns_; }
    [[nodiscard]] std::size_t size() const noexcept { return depth_ * rows_ * columns_; }

    [[nodiscard]] T* data() const noexcept {
        return storage_ ? reinterpret_cast<T*>(storage_->data()) : nullptr;
    }

    [[nodiscard]] T& operator()(std::size_t layer, std::size_t row, std::size_t column) const noexcept {
        return data()[(layer * rows_ + row) * columns_ + column];
    }

    [[nodiscard]] std::span<T> span() const noexcept { return {data(), size()}; }

    [[nodiscard]] const Storage& storage() const noexcept { return storage_; }
};

} // namespace memconcept
