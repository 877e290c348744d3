#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <type_traits>
#include "reference.hpp"
#include "storage.hpp"
#include "types/result.hpp"

namespace memconcept {

/// @brief Borrowed strided 2-D view
/// @note Element (row, column) is at linear index row * (width + pitch) + column
///       from the origin element
/// @note Does not own or keep alive the memory it views
/// @note Element addressing goes through Ref<T>, so the configured reference
///       strategy applies
template <typename T>
class Span2D {
private:
    Ref<T> origin_;
    int height_{0};
    int width_{0};
    int pitch_{0};

    template <typename U>
    friend class Span2D;

public:
    using element_type = T;
    using value_type = std::remove_cv_t<T>;

    /// @brief Empty view (0 x 0)
    Span2D() noexcept = default;

    /// @brief Unchecked construction from an origin reference and a layout
    /// @note Callers guarantee that (width + pitch) * height elements are addressable
    Span2D(Ref<T> origin, int height, int width, int pitch) noexcept;

    /// @brief View contiguous data as height rows of width elements
    /// @retval OutOfRange width or height is negative
    /// @retval InvalidArgument width * height exceeds data.size()
    [[nodiscard]] static Result<Span2D> create(std::span<T> data, int width, int height);

    /// @brief View data starting at offset with an extra pitch after each row
    /// @retval OutOfRange offset outside data, or negative width/height/pitch
    /// @retval InvalidArgument (width + pitch) * (height - 1) + width exceeds the elements after offset
    [[nodiscard]] static Result<Span2D> create(std::span<T> data, int offset, int width, int height, int pitch);

    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int pitch() const noexcept { return pitch_; }

    /// @brief Number of visible elements (height * width)
    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] bool empty() const noexcept { return height_ == 0 || width_ == 0; }

    /// @brief Address of element (0, 0)
    [[nodiscard]] T* data() const noexcept { return origin_.get(); }

    [[nodiscard]] const Ref<T>& origin() const noexcept { return origin_; }

    /// @brief Unchecked element access
    [[nodiscard]] T& operator()(int row, int column) const noexcept;

    /// @brief Checked element access
    /// @retval OutOfRange row or column outside the view
    [[nodiscard]] Result<T*> at(int row, int column) const;

    /// @brief Contiguous span over one row
    /// @retval OutOfRange row outside the view
    [[nodiscard]] Result<std::span<T>> get_row_span(int row) const;

    /// @brief Zero-copy sub-rectangle
    /// @retval OutOfRange row/column outside the view, or width/height exceed the remaining extent
    [[nodiscard]] Result<Span2D> slice(int row, int column, int width, int height) const;

    /// @brief Copy the visible elements in row-major order
    /// @retval InvalidArgument destination is smaller than size()
    [[nodiscard]] Result<void> copy_to(std::span<value_type> destination) const;

    [[nodiscard]] bool try_copy_to(std::span<value_type> destination) const;

    /// @brief Copy into a view of identical dimensions
    /// @retval InvalidArgument height or width differ
    [[nodiscard]] Result<void> copy_to(const Span2D<value_type>& destination) const;

    [[nodiscard]] bool try_copy_to(const Span2D<value_type>& destination) const;

    void fill(const value_type& value) const
        requires (!std::is_const_v<T>);

    void clear() const
        requires (!std::is_const_v<T>);

    /// @brief Flat span over the view when rows are adjacent (pitch == 0)
    [[nodiscard]] std::optional<std::span<T>> try_get_span() const noexcept;

    /// @brief Row-by-row copy into a new array
    [[nodiscard]] SharedArray2D<value_type> to_array() const;

    operator Span2D<const T>() const noexcept
        requires (!std::is_const_v<T>);

    /// @brief Structural equality: same origin address and layout
    [[nodiscard]] bool operator==(const Span2D& other) const noexcept;

private:
    /// Row-major copy of the visible elements; out must hold size() elements
    void copy_rows(value_type* out) const noexcept;
};

template <typename T>
using ReadOnlySpan2D = Span2D<const T>;

} // namespace memconcept

#define MEMCONCEPT_SPAN2D_HEADER
#include "impl/span2d_impl.hpp"
