#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <typeinfo>
#include <fmt/format.h>
#include "../memory.hpp"
#include "../memory_handle.hpp"
#include "../reference.hpp"
#include "../span2d.hpp"
#include "../storage.hpp"
#include "../types/result.hpp"
#include "layout_checks.hpp"

#ifndef MEMCONCEPT_MEMORY2D_HEADER
#include "../memory2d.hpp" // for linters
#endif

namespace memconcept {

namespace memory2d_impl {

inline void hash_combine(std::size_t& seed, std::size_t value) noexcept {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

} // namespace memory2d_impl

template <typename T>
inline Memory2D<T>::Memory2D(Storage owner, std::ptrdiff_t byte_offset, int height, int width, int pitch) noexcept
    : owner_(std::move(owner))
    , byte_offset_(byte_offset)
    , height_(height)
    , width_(width)
    , pitch_(pitch) {}

template <typename T>
inline Memory2D<T>::Memory2D(const SharedArray2D<value_type>& array) noexcept
    : owner_(array.storage())
    , byte_offset_(0)
    , height_(static_cast<int>(array.rows()))
    , width_(static_cast<int>(array.columns()))
    , pitch_(0) {}

template <typename T>
inline Result<Memory2D<T>> Memory2D<T>::create(const Storage& storage, int offset, int width, int height, int pitch) {
    if (!storage) [[unlikely]] {
        if (offset != 0 || width != 0 || height != 0 || pitch != 0) {
            return Err(Error::Code::InvalidArgument, "Non-empty layout over null storage");
        }
        return Ok(Memory2D{});
    }
    if (!storage->template holds<T>()) [[unlikely]] {
        return Err(Error::Code::TypeMismatch, "Storage element type {} is not compatible with {}",
                   storage->element_type().name(), typeid(value_type).name());
    }
    if (auto check = layout::validate_strided_layout(storage->length(), offset, width, height, pitch); !check) {
        return check.error();
    }
    const std::ptrdiff_t byte_offset = static_cast<std::ptrdiff_t>(offset) * static_cast<std::ptrdiff_t>(sizeof(T));
    return Ok(Memory2D(storage, byte_offset, height, width, pitch));
}

template <typename T>
inline Result<Memory2D<T>> Memory2D<T>::create(const SharedArray<value_type>& array,
                                               int offset, int width, int height, int pitch) {
    return create(array.storage(), offset, width, height, pitch);
}

template <typename T>
inline Result<Memory2D<T>> Memory2D<T>::create(const Memory<T>& memory,
                                               int offset, int width, int height, int pitch) {
    if (auto check = layout::validate_strided_layout(memory.size(), offset, width, height, pitch); !check) {
        return check.error();
    }
    const std::ptrdiff_t first = static_cast<std::ptrdiff_t>(memory.start()) + offset;
    return Ok(Memory2D(memory.owner(), first * static_cast<std::ptrdiff_t>(sizeof(T)), height, width, pitch));
}

template <typename T>
inline Result<Memory2D<T>> Memory2D<T>::create(const SharedArray2D<value_type>& array,
                                               int row, int column, int width, int height) {
    if (auto dimensions = layout::validate_array_dimensions(array.rows(), array.columns()); !dimensions) {
        return dimensions.error();
    }
    const int rows = static_cast<int>(array.rows());
    const int columns = static_cast<int>(array.columns());
    if (auto check = layout::validate_sub_rectangle(rows, columns, row, column, width, height); !check) {
        return check.error();
    }
    const std::ptrdiff_t first = static_cast<std::ptrdiff_t>(row) * columns + column;
    return Ok(Memory2D(array.storage(), first * static_cast<std::ptrdiff_t>(sizeof(T)),
                       height, width, columns - width));
}

template <typename T>
inline Result<Memory2D<T>> Memory2D<T>::create(const SharedArray3D<value_type>& array, int depth) {
    if (depth < 0 || static_cast<std::size_t>(depth) >= array.depth()) [[unlikely]] {
        return Err(Error::Code::OutOfRange, "Depth {} outside [0, {})", depth, array.depth());
    }
    if (auto dimensions = layout::validate_array_dimensions(array.rows(), array.columns()); !dimensions) {
        return dimensions.error();
    }
    const std::ptrdiff_t layer = static_cast<std::ptrdiff_t>(array.rows() * array.columns());
    return Ok(Memory2D(array.storage(), depth * layer * static_cast<std::ptrdiff_t>(sizeof(T)),
                       static_cast<int>(array.rows()), static_cast<int>(array.columns()), 0));
}

template <typename T>
inline Result<Memory2D<T>> Memory2D<T>::create(const SharedArray3D<value_type>& array,
                                               int depth, int row, int column, int width, int height) {
    if (depth < 0 || static_cast<std::size_t>(depth) >= array.depth()) [[unlikely]] {
        return Err(Error::Code::OutOfRange, "Depth {} outside [0, {})", depth, array.depth());
    }
    if (auto dimensions = layout::validate_array_dimensions(array.rows(), array.columns()); !dimensions) {
        return dimensions.error();
    }
    const int rows = static_cast<int>(array.rows());
    const int columns = static_cast<int>(array.columns());
    if (auto check = layout::validate_sub_rectangle(rows, columns, row, column, width, height); !check) {
        return check.error();
    }
    const std::ptrdiff_t first =
        (static_cast<std::ptrdiff_t>(depth) * rows + row) * columns + column;
    return Ok(Memory2D(array.storage(), first * static_cast<std::ptrdiff_t>(sizeof(T)),
                       height, width, columns - width));
}

template <typename T>
inline std::size_t Memory2D<T>::size() const noexcept {
    return static_cast<std::size_t>(height_) * static_cast<std::size_t>(width_);
}

template <typename T>
inline Span2D<T> Memory2D<T>::span() const noexcept {
    if (!owner_) {
        return Span2D<T>{};
    }
    return Span2D<T>(Ref<T>(*owner_, ByteOffset{byte_offset_}), height_, width_, pitch_);
}

template <typename T>
inline Result<Memory2D<T>> Memory2D<T>::slice(int row, int column, int width, int height) const {
    if (auto check = layout::validate_sub_rectangle(height_, width_, row, column, width, height); !check) {
        return check.error();
    }
    const std::ptrdiff_t shift = static_cast<std::ptrdiff_t>(row) * layout::row_stride(width_, pitch_) + column;
    return Ok(Memory2D(owner_, byte_offset_ + shift * static_cast<std::ptrdiff_t>(sizeof(T)),
                       height, width, width_ + pitch_ - width));
}

template <typename T>
inline Result<void> Memory2D<T>::copy_to(const Memory<value_type>& destination) const {
    return span().copy_to(destination.span());
}

template <typename T>
inline bool Memory2D<T>::try_copy_to(const Memory<value_type>& destination) const {
    return copy_to(destination).is_ok();
}

template <typename T>
inline Result<void> Memory2D<T>::copy_to(const Memory2D<value_type>& destination) const {
    return span().copy_to(destination.span());
}

template <typename T>
inline bool Memory2D<T>::try_copy_to(const Memory2D<value_type>& destination) const {
    return copy_to(destination).is_ok();
}

template <typename T>
inline MemoryHandle Memory2D<T>::pin() const noexcept {
    if (!owner_) {
        return MemoryHandle{};
    }
    return MemoryHandle(owner_->data() + byte_offset_, owner_);
}

template <typename T>
inline std::optional<Memory<T>> Memory2D<T>::try_get_memory() const {
    if (pitch_ != 0) {
        return std::nullopt;
    }
    if (!owner_) {
        return Memory<T>{};
    }
    const auto start = static_cast<std::size_t>(byte_offset_) / sizeof(T);
    return Memory<T>(owner_, start, size());
}

template <typename T>
inline SharedArray2D<typename Memory2D<T>::value_type> Memory2D<T>::to_array() const {
    return span().to_array();
}

template <typename T>
inline Memory2D<T>::operator Memory2D<const T>() const noexcept
    requires (!std::is_const_v<T>) {
    return Memory2D<const T>(owner_, byte_offset_, height_, width_, pitch_);
}

template <typename T>
inline bool Memory2D<T>::operator==(const Memory2D& other) const noexcept {
    return owner_ == other.owner_ &&
           byte_offset_ == other.byte_offset_ &&
           height_ == other.height_ &&
           width_ == other.width_ &&
           pitch_ == other.pitch_;
}

template <typename T>
inline std::size_t Memory2D<T>::hash() const noexcept {
    if (!owner_) {
        return 0;
    }
    std::size_t seed = std::hash<const void*>{}(owner_.get());
    memory2d_impl::hash_combine(seed, std::hash<std::ptrdiff_t>{}(byte_offset_));
    memory2d_impl::hash_combine(seed, std::hash<int>{}(height_));
    memory2d_impl::hash_combine(seed, std::hash<int>{}(width_));
    memory2d_impl::hash_combine(seed, std::hash<int>{}(pitch_));
    return seed;
}

template <typename T>
inline std::string Memory2D<T>::to_string() const {
    return fmt::format("memconcept::Memory2D<{}>[{}, {}]", typeid(value_type).name(), height_, width_);
}

} // namespace memconcept
