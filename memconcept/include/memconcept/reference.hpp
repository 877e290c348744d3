#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include "config.hpp"
#include "storage.hpp"

namespace memconcept {

/// Byte distance from the first byte of a storage block
struct ByteOffset {
    std::ptrdiff_t value{0};
};

/// Concept for a non-owning handle to one element supporting offset access
///
/// at(delta) must behave exactly like pointer arithmetic on T*, with the
/// delta widened to std::ptrdiff_t before scaling. No bounds are checked.
template <typename R>
concept ElementReference = std::copyable<R> && requires(const R ref, int small, std::ptrdiff_t wide) {
    typename R::element_type;
    { ref.value() } -> std::same_as<typename R::element_type&>;
    { ref.at(small) } -> std::same_as<typename R::element_type&>;
    { ref.at(wide) } -> std::same_as<typename R::element_type&>;
    { ref.get() } -> std::same_as<typename R::element_type*>;
    { ref.offset_by(wide) } -> std::same_as<R>;
};

/// Reference strategy holding a borrowed pointer
template <typename T>
class DirectRef {
private:
    T* pointer_{nullptr};

public:
    using element_type = T;

    DirectRef() noexcept = default;

    explicit DirectRef(T& value) noexcept
        : pointer_(&value) {}

    /// Address the element byte_offset bytes into owner
    DirectRef(const StorageBlock& owner, ByteOffset offset) noexcept
        : pointer_(reinterpret_cast<T*>(const_cast<std::byte*>(owner.data()) + offset.value)) {}

    /// Address an element given only by its raw location
    explicit DirectRef(T* pointer) noexcept
        : pointer_(pointer) {}

    [[nodiscard]] T& value() const noexcept { return *pointer_; }

    [[nodiscard]] T& at(int offset) const noexcept {
        return pointer_[static_cast<std::ptrdiff_t>(offset)];
    }

    [[nodiscard]] T& at(std::ptrdiff_t offset) const noexcept { return pointer_[offset]; }

    [[nodiscard]] T* get() const noexcept { return pointer_; }

    /// Reference to the element delta positions away
    [[nodiscard]] DirectRef offset_by(std::ptrdiff_t delta) const noexcept {
        return DirectRef(pointer_ + delta);
    }

    operator std::remove_cv_t<T>() const noexcept { return *pointer_; }

    operator DirectRef<const T>() const noexcept
        requires (!std::is_const_v<T>) {
        return DirectRef<const T>(pointer_);
    }

    [[nodiscard]] bool operator==(const DirectRef&) const noexcept = default;
};

/// Reference strategy holding the owning block and a byte offset into it
///
/// All arithmetic stays in std::ptrdiff_t. The address is formed only when
/// an element is accessed. With a null owner the byte offset is an absolute
/// address, which lets borrowed memory (no owning block) use this strategy too.
template <typename T>
class OwnerOffsetRef {
private:
    const StorageBlock* owner_{nullptr};
    std::ptrdiff_t byte_offset_{0};

    [[nodiscard]] std::uintptr_t base() const noexcept {
        return owner_ ? reinterpret_cast<std::uintptr_t>(owner_->data()) : std::uintptr_t{0};
    }

    [[nodiscard]] T* address(std::ptrdiff_t byte_offset) const noexcept {
        return reinterpret_cast<T*>(base() + static_cast<std::uintptr_t>(byte_offset));
    }

public:
    using element_type = T;

    OwnerOffsetRef() noexcept = default;

    /// Capture value as an offset relative to owner's first byte
    OwnerOffsetRef(const StorageBlock& owner, T& value) noexcept
        : owner_(&owner)
        , byte_offset_(static_cast<std::ptrdiff_t>(
              reinterpret_cast<std::uintptr_t>(&value) - reinterpret_cast<std::uintptr_t>(owner.data()))) {}

    OwnerOffsetRef(const StorageBlock& owner, ByteOffset offset) noexcept
        : owner_(&owner)
        , byte_offset_(offset.value) {}

    explicit OwnerOffsetRef(T* pointer) noexcept
        : owner_(nullptr)
        , byte_offset_(static_cast<std::ptrdiff_t>(reinterpret_cast<std::uintptr_t>(pointer))) {}

    explicit OwnerOffsetRef(T& value) noexcept
        : OwnerOffsetRef(&value) {}

    [[nodiscard]] T& value() const noexcept { return *address(byte_offset_); }

    [[nodiscard]] T& at(int offset) const noexcept {
        return *address(byte_offset_at(static_cast<std::ptrdiff_t>(offset)));
    }

    [[nodiscard]] T& at(std::ptrdiff_t offset) const noexcept {
        return *address(byte_offset_at(offset));
    }

    [[nodiscard]] T* get() const noexcept { return address(byte_offset_); }

    /// Byte offset of the element delta positions away, without forming an address
    [[nodiscard]] std::ptrdiff_t byte_offset_at(std::ptrdiff_t delta) const noexcept {
        return byte_offset_ + delta * static_cast<std::ptrdiff_t>(sizeof(T));
    }

    /// Reference to the element delta positions away, in the same owner
    [[nodiscard]] OwnerOffsetRef offset_by(std::ptrdiff_t delta) const noexcept {
        OwnerOffsetRef shifted = *this;
        shifted.byte_offset_ = byte_offset_at(delta);
        return shifted;
    }

    [[nodiscard]] const StorageBlock* owner() const noexcept { return owner_; }
    [[nodiscard]] std::ptrdiff_t byte_offset() const noexcept { return byte_offset_; }

    operator std::remove_cv_t<T>() const noexcept { return value(); }

    operator OwnerOffsetRef<const T>() const noexcept
        requires (!std::is_const_v<T>) {
        if (owner_) {
            return OwnerOffsetRef<const T>(*owner_, ByteOffset{byte_offset_});
        }
        return OwnerOffsetRef<const T>(static_cast<const T*>(get()));
    }

    [[nodiscard]] bool operator==(const OwnerOffsetRef&) const noexcept = default;
};

static_assert(ElementReference<DirectRef<int>>, "DirectRef must satisfy ElementReference concept");
static_assert(ElementReference<DirectRef<const int>>, "DirectRef must satisfy ElementReference concept");
static_assert(ElementReference<OwnerOffsetRef<int>>, "OwnerOffsetRef must satisfy ElementReference concept");
static_assert(ElementReference<OwnerOffsetRef<const int>>, "OwnerOffsetRef must satisfy ElementReference concept");

#if MEMCONCEPT_REF_STRATEGY == MEMCONCEPT_REF_STRATEGY_OWNER_OFFSET
template <typename T>
using Ref = OwnerOffsetRef<T>;
#else
template <typename T>
using Ref = DirectRef<T>;
#endif

template <typename T>
using ReadOnlyRef = Ref<const T>;

} // namespace memconcept
