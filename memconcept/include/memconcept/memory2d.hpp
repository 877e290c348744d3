#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include "memory.hpp"
#include "memory_handle.hpp"
#include "span2d.hpp"
#include "storage.hpp"
#include "types/result.hpp"

namespace memconcept {

/// @brief Owning strided 2-D view over a storage block
///
/// A Memory2D is an immutable value { owner, byte offset, height, width, pitch }.
/// Element (row, column) lives at linear index row * (width + pitch) + column
/// counted from the byte offset. Slicing produces a new value sharing the same
/// owner; element data is never copied except by to_array() and copy_to().
///
/// Two views compare equal when they share the same owner block, byte offset
/// and layout, regardless of the element values.
///
/// Example:
/// @code
///   SharedArray<int> values{1, 2, 3, 4, 5, 6};
///   auto view = Memory2D<int>::create(values, 1, 2, 2, 1).value();
///   // view.span()(0, 0) == 2, view.span()(1, 1) == 6
/// @endcode
template <typename T>
class Memory2D {
private:
    Storage owner_;
    std::ptrdiff_t byte_offset_{0};
    int height_{0};
    int width_{0};
    int pitch_{0};

    template <typename U>
    friend class Memory2D;

    Memory2D(Storage owner, std::ptrdiff_t byte_offset, int height, int width, int pitch) noexcept;

public:
    using element_type = T;
    using value_type = std::remove_cv_t<T>;

    /// @brief Empty view: no owner, 0 x 0
    Memory2D() noexcept = default;

    /// @brief Whole 2-D array, offset 0, pitch 0
    /// @pre rows() and columns() are at most INT_MAX; the create overloads reject larger arrays
    Memory2D(const SharedArray2D<value_type>& array) noexcept;

    /// @brief View a type-erased block as a strided rectangle
    /// @param storage Block whose element type must be T
    /// @param offset Element index of (0, 0)
    /// @param width Visible elements per row
    /// @param height Number of rows
    /// @param pitch Elements skipped after each row
    /// @retval TypeMismatch The block holds a different element type (checked first)
    /// @retval OutOfRange offset outside the block, or negative width/height/pitch
    /// @retval InvalidArgument (width + pitch) * (height - 1) + width exceeds the elements after offset
    /// @retval InvalidArgument Null storage with a non-empty layout
    [[nodiscard]] static Result<Memory2D> create(const Storage& storage, int offset, int width, int height, int pitch = 0);

    /// @brief View a 1-D array as a strided rectangle
    [[nodiscard]] static Result<Memory2D> create(const SharedArray<value_type>& array,
                                                 int offset, int width, int height, int pitch = 0);

    /// @brief View flat memory as a strided rectangle
    [[nodiscard]] static Result<Memory2D> create(const Memory<T>& memory,
                                                 int offset, int width, int height, int pitch = 0);

    /// @brief View a sub-rectangle of a 2-D array
    /// @note pitch becomes columns - width
    /// @retval OutOfRange rows or columns above INT_MAX
    /// @retval OutOfRange row/column outside the array, or width/height exceed the remaining extent
    [[nodiscard]] static Result<Memory2D> create(const SharedArray2D<value_type>& array,
                                                 int row, int column, int width, int height);

    /// @brief View one layer of a 3-D array
    /// @retval OutOfRange depth outside [0, array.depth()), or rows/columns above INT_MAX
    [[nodiscard]] static Result<Memory2D> create(const SharedArray3D<value_type>& array, int depth);

    /// @brief View a sub-rectangle of one layer of a 3-D array
    [[nodiscard]] static Result<Memory2D> create(const SharedArray3D<value_type>& array,
                                                 int depth, int row, int column, int width, int height);

    [[nodiscard]] bool is_empty() const noexcept { return height_ == 0 || width_ == 0; }

    /// @brief Number of visible elements (height * width)
    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int pitch() const noexcept { return pitch_; }
    [[nodiscard]] std::ptrdiff_t byte_offset() const noexcept { return byte_offset_; }
    [[nodiscard]] const Storage& owner() const noexcept { return owner_; }

    /// @brief Borrowed element-access view; valid while this view's owner lives
    [[nodiscard]] Span2D<T> span() const noexcept;

    /// @brief Zero-copy sub-rectangle sharing this view's owner
    /// @note new pitch = width + pitch - new width, so the row stride is preserved
    [[nodiscard]] Result<Memory2D> slice(int row, int column, int width, int height) const;

    /// @brief Copy the visible elements in row-major order into flat memory
    [[nodiscard]] Result<void> copy_to(const Memory<value_type>& destination) const;
    [[nodiscard]] bool try_copy_to(const Memory<value_type>& destination) const;

    /// @brief Copy into a view of identical dimensions
    [[nodiscard]] Result<void> copy_to(const Memory2D<value_type>& destination) const;
    [[nodiscard]] bool try_copy_to(const Memory2D<value_type>& destination) const;

    /// @brief Pin the owner block and expose the address of element (0, 0)
    /// @note An empty-owner view returns the null handle
    [[nodiscard]] MemoryHandle pin() const noexcept;

    /// @brief Flat memory covering the view, only when pitch == 0
    [[nodiscard]] std::optional<Memory<T>> try_get_memory() const;

    /// @brief Row-by-row copy into a new 2-D array
    [[nodiscard]] SharedArray2D<value_type> to_array() const;

    operator Memory2D<const T>() const noexcept
        requires (!std::is_const_v<T>);

    [[nodiscard]] bool operator==(const Memory2D& other) const noexcept;

    /// @brief Hash of owner identity, byte offset, height, width and pitch (0 when empty-owner)
    [[nodiscard]] std::size_t hash() const noexcept;

    [[nodiscard]] std::string to_string() const;
};

template <typename T>
using ReadOnlyMemory2D = Memory2D<const T>;

} // namespace memconcept

template <typename T>
struct std::hash<memconcept::Memory2D<T>> {
    std::size_t operator()(const memconcept::Memory2D<T>& view) const noexcept {
        return view.hash();
    }
};

#define MEMCONCEPT_MEMORY2D_HEADER
#include "impl/memory2d_impl.hpp"
