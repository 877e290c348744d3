#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include "../reference.hpp"
#include "../storage.hpp"
#include "../types/result.hpp"
#include "layout_checks.hpp"

#ifndef MEMCONCEPT_SPAN2D_HEADER
#include "../span2d.hpp" // for linters
#endif

namespace memconcept {

template <typename T>
inline Span2D<T>::Span2D(Ref<T> origin, int height, int width, int pitch) noexcept
    : origin_(origin)
    , height_(height)
    , width_(width)
    , pitch_(pitch) {}

template <typename T>
inline Result<Span2D<T>> Span2D<T>::create(std::span<T> data, int width, int height) {
    if (width < 0) [[unlikely]] {
        return Err(Error::Code::OutOfRange, "Negative width {}", width);
    }
    if (height < 0) [[unlikely]] {
        return Err(Error::Code::OutOfRange, "Negative height {}", height);
    }
    const std::uint64_t required = static_cast<std::uint64_t>(width) * static_cast<std::uint64_t>(height);
    if (required > data.size()) [[unlikely]] {
        return Err(Error::Code::InvalidArgument, "{} x {} view needs {} elements, span has {}",
                   height, width, required, data.size());
    }
    return Ok(Span2D(Ref<T>(data.data()), height, width, 0));
}

template <typename T>
inline Result<Span2D<T>> Span2D<T>::create(std::span<T> data, int offset, int width, int height, int pitch) {
    if (auto check = layout::validate_strided_layout(data.size(), offset, width, height, pitch); !check) {
        return check.error();
    }
    return Ok(Span2D(Ref<T>(data.data() + offset), height, width, pitch));
}

template <typename T>
inline void Span2D<T>::copy_rows(value_type* out) const noexcept {
    if (empty()) {
        return;
    }
    if (pitch_ == 0) {
        std::copy_n(data(), size(), out);
        return;
    }
    for (int row = 0; row < height_; ++row) {
        out = std::copy_n(&(*this)(row, 0), width_, out);
    }
}

template <typename T>
inline std::size_t Span2D<T>::size() const noexcept {
    return static_cast<std::size_t>(height_) * static_cast<std::size_t>(width_);
}

template <typename T>
inline T& Span2D<T>::operator()(int row, int column) const noexcept {
    return origin_.at(static_cast<std::ptrdiff_t>(row) * layout::row_stride(width_, pitch_) + column);
}

template <typename T>
inline Result<T*> Span2D<T>::at(int row, int column) const {
    if (row < 0 || row >= height_) [[unlikely]] {
        return Err(Error::Code::OutOfRange, "Row {} outside [0, {})", row, height_);
    }
    if (column < 0 || column >= width_) [[unlikely]] {
        return Err(Error::Code::OutOfRange, "Column {} outside [0, {})", column, width_);
    }
    return Ok(&(*this)(row, column));
}

template <typename T>
inline Result<std::span<T>> Span2D<T>::get_row_span(int row) const {
    if (row < 0 || row >= height_) [[unlikely]] {
        return Err(Error::Code::OutOfRange, "Row {} outside [0, {})", row, height_);
    }
    if (width_ == 0) {
        return Ok(std::span<T>{});
    }
    return Ok(std::span<T>(&(*this)(row, 0), static_cast<std::size_t>(width_)));
}

template <typename T>
inline Result<Span2D<T>> Span2D<T>::slice(int row, int column, int width, int height) const {
    if (auto check = layout::validate_sub_rectangle(height_, width_, row, column, width, height); !check) {
        return check.error();
    }
    const std::ptrdiff_t shift = static_cast<std::ptrdiff_t>(row) * layout::row_stride(width_, pitch_) + column;
    const int pitch = width_ + pitch_ - width;
    return Ok(Span2D(origin_.offset_by(shift), height, width, pitch));
}

template <typename T>
inline Result<void> Span2D<T>::copy_to(std::span<value_type> destination) const {
    if (destination.size() < size()) [[unlikely]] {
        return Err(Error::Code::InvalidArgument, "Destination holds {} elements, view has {}",
                   destination.size(), size());
    }
    copy_rows(destination.data());
    return Ok();
}

template <typename T>
inline bool Span2D<T>::try_copy_to(std::span<value_type> destination) const {
    return copy_to(destination).is_ok();
}

template <typename T>
inline Result<void> Span2D<T>::copy_to(const Span2D<value_type>& destination) const {
    if (destination.height() != height_ || destination.width() != width_) [[unlikely]] {
        return Err(Error::Code::InvalidArgument, "Destination is {} x {}, view is {} x {}",
                   destination.height(), destination.width(), height_, width_);
    }
    for (int row = 0; row < height_; ++row) {
        std::copy_n(&(*this)(row, 0), width_, &destination(row, 0));
    }
    return Ok();
}

template <typename T>
inline bool Span2D<T>::try_copy_to(const Span2D<value_type>& destination) const {
    return copy_to(destination).is_ok();
}

template <typename T>
inline void Span2D<T>::fill(const value_type& value) const
    requires (!std::is_const_v<T>) {
    for (int row = 0; row < height_; ++row) {
        std::fill_n(&(*this)(row, 0), width_, value);
    }
}

template <typename T>
inline void Span2D<T>::clear() const
    requires (!std::is_const_v<T>) {
    fill(value_type{});
}

template <typename T>
inline std::optional<std::span<T>> Span2D<T>::try_get_span() const noexcept {
    if (pitch_ != 0) {
        return std::nullopt;
    }
    if (empty()) {
        return std::span<T>{};
    }
    return std::span<T>(data(), size());
}

template <typename T>
inline SharedArray2D<typename Span2D<T>::value_type> Span2D<T>::to_array() const {
    SharedArray2D<value_type> array(static_cast<std::size_t>(height_), static_cast<std::size_t>(width_));
    copy_rows(array.data());
    return array;
}

template <typename T>
inline Span2D<T>::operator Span2D<const T>() const noexcept
    requires (!std::is_const_v<T>) {
    return Span2D<const T>(static_cast<Ref<const T>>(origin_), height_, width_, pitch_);
}

template <typename T>
inline bool Span2D<T>::operator==(const Span2D& other) const noexcept {
    return data() == other.data() &&
           height_ == other.height_ &&
           width_ == other.width_ &&
           pitch_ == other.pitch_;
}

} // namespace memconcept
