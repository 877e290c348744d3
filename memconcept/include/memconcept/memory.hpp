#pragma once

#include <cstddef>
#include <span>
#include <type_traits>
#include "memory_handle.hpp"
#include "storage.hpp"
#include "types/result.hpp"

namespace memconcept {

template <typename T>
class Memory2D;

/// Flat, zero-copy window of elements inside a storage block
///
/// Memory<T> shares ownership of the block; Memory<const T> is the read-only
/// form and can be obtained implicitly from Memory<T>.
template <typename T>
class Memory {
private:
    Storage owner_;
    std::size_t start_{0};
    std::size_t length_{0};

    template <typename U>
    friend class Memory;
    template <typename U>
    friend class Memory2D;

    Memory(Storage owner, std::size_t start, std::size_t length) noexcept
        : owner_(std::move(owner))
        , start_(start)
        , length_(length) {}

public:
    using element_type = T;
    using value_type = std::remove_cv_t<T>;

    Memory() noexcept = default;

    /// Whole-array window
    Memory(const SharedArray<value_type>& array) noexcept
        : owner_(array.storage())
        , start_(0)
        , length_(array.size()) {}

    /// Window [start, start + length) of a type-erased block
    [[nodiscard]] static Result<Memory> create(const Storage& storage, std::size_t start, std::size_t length) {
        if (!storage) [[unlikely]] {
            if (start != 0 || length != 0) {
                return Err(Error::Code::OutOfRange, "Window [{}, +{}) over null storage", start, length);
            }
            return Ok(Memory{});
        }
        if (!storage->template holds<T>()) [[unlikely]] {
            return Err(Error::Code::TypeMismatch, "Storage element type {} is not compatible with {}",
                       storage->element_type().name(), typeid(value_type).name());
        }
        if (start > storage->length() || length > storage->length() - start) [[unlikely]] {
            return Err(Error::Code::OutOfRange, "Window [{}, +{}) exceeds storage length {}",
                       start, length, storage->length());
        }
        return Ok(Memory(storage, start, length));
    }

    [[nodiscard]] static Result<Memory> create(const SharedArray<value_type>& array,
                                               std::size_t start, std::size_t length) {
        return create(array.storage(), start, length);
    }

    operator Memory<const T>() const noexcept
        requires (!std::is_const_v<T>) {
        return Memory<const T>(owner_, start_, length_);
    }

    [[nodiscard]] std::size_t size() const noexcept { return length_; }
    [[nodiscard]] bool empty() const noexcept { return length_ == 0; }

    [[nodiscard]] T* data() const noexcept {
        if (!owner_) {
            return nullptr;
        }
        return reinterpret_cast<T*>(owner_->data()) + start_;
    }

    [[nodiscard]] std::span<T> span() const noexcept { return {data(), length_}; }

    /// Element index of the first element inside the owning block
    [[nodiscard]] std::size_t start() const noexcept { return start_; }

    [[nodiscard]] const Storage& owner() const noexcept { return owner_; }

    [[nodiscard]] Result<Memory> slice(std::size_t start) const {
        if (start > length_) [[unlikely]] {
            return Err(Error::Code::OutOfRange, "Slice start {} exceeds length {}", start, length_);
        }
        return Ok(Memory(owner_, start_ + start, length_ - start));
    }

    [[nodiscard]] Result<Memory> slice(std::size_t start, std::size_t length) const {
        if (start > length_ || length > length_ - start) [[unlikely]] {
            return Err(Error::Code::OutOfRange, "Slice [{}, +{}) exceeds length {}", start, length, length_);
        }
        return Ok(Memory(owner_, start_ + start, length));
    }

    /// Pin the block and return the address of the first element
    [[nodiscard]] MemoryHandle pin() const noexcept {
        if (!owner_) {
            return MemoryHandle{};
        }
        return MemoryHandle(const_cast<value_type*>(data()), owner_);
    }

    [[nodiscard]] bool operator==(const Memory&) const noexcept = default;
};

template <typename T>
using ReadOnlyMemory = Memory<const T>;

} // namespace memconcept
