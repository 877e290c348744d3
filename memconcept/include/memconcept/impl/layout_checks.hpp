#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include "../types/result.hpp"

namespace memconcept {
namespace layout {

/// Elements spanned from (0, 0) to the last visible element
/// The pitch after the last row is not part of the extent.
[[nodiscard]] constexpr std::uint64_t required_elements(int width, int height, int pitch) noexcept {
    if (height == 0 || width == 0) {
        return 0;
    }
    return (static_cast<std::uint64_t>(width) + static_cast<std::uint64_t>(pitch)) *
               (static_cast<std::uint64_t>(height) - 1) +
           static_cast<std::uint64_t>(width);
}

/// Validate that a strided layout fits after offset in length elements
/// Checks run in the order offset, dimensions, extent; all arithmetic is 64-bit.
[[nodiscard]] inline Result<void> validate_strided_layout(
    std::size_t length, int offset, int width, int height, int pitch) {
    if (offset < 0 || static_cast<std::size_t>(offset) >= length) [[unlikely]] {
        return Err(Error::Code::OutOfRange, "Offset {} outside [0, {})", offset, length);
    }
    if (width < 0) [[unlikely]] {
        return Err(Error::Code::OutOfRange, "Negative width {}", width);
    }
    if (height < 0) [[unlikely]] {
        return Err(Error::Code::OutOfRange, "Negative height {}", height);
    }
    if (pitch < 0) [[unlikely]] {
        return Err(Error::Code::OutOfRange, "Negative pitch {}", pitch);
    }

    const std::uint64_t remaining = length - static_cast<std::size_t>(offset);
    const std::uint64_t required = required_elements(width, height, pitch);
    if (required > remaining) [[unlikely]] {
        return Err(Error::Code::InvalidArgument,
                   "Layout {} x {} with pitch {} needs {} elements but only {} remain after offset {}",
                   height, width, pitch, required, remaining, offset);
    }
    return Ok();
}

/// Validate that array dimensions fit the int coordinates of a view
[[nodiscard]] inline Result<void> validate_array_dimensions(std::size_t rows, std::size_t columns) {
    constexpr auto limit = static_cast<std::size_t>(std::numeric_limits<int>::max());
    if (rows > limit || columns > limit) [[unlikely]] {
        return Err(Error::Code::OutOfRange, "Array of {} x {} exceeds the {} rows or columns a view addresses",
                   rows, columns, limit);
    }
    return Ok();
}

/// Validate a sub-rectangle request against a height x width view
[[nodiscard]] inline Result<void> validate_sub_rectangle(
    int total_height, int total_width, int row, int column, int width, int height) {
    if (row < 0 || row >= total_height) [[unlikely]] {
        return Err(Error::Code::OutOfRange, "Row {} outside [0, {})", row, total_height);
    }
    if (column < 0 || column >= total_width) [[unlikely]] {
        return Err(Error::Code::OutOfRange, "Column {} outside [0, {})", column, total_width);
    }
    if (width < 0 || width > total_width - column) [[unlikely]] {
        return Err(Error::Code::OutOfRange, "Width {} exceeds the {} columns left from column {}",
                   width, total_width - column, column);
    }
    if (height < 0 || height > total_height - row) [[unlikely]] {
        return Err(Error::Code::OutOfRange, "Height {} exceeds the {} rows left from row {}",
                   height, total_height - row, row);
    }
    return Ok();
}

/// Element distance between the starts of two consecutive rows
[[nodiscard]] constexpr std::ptrdiff_t row_stride(int width, int pitch) noexcept {
    return static_cast<std::ptrdiff_t>(width) + static_cast<std::ptrdiff_t>(pitch);
}

} // namespace layout
} // namespace memconcept
