#include <gtest/gtest.h>
#include <cstddef>
#include <functional>
#include <limits>
#include <numeric>
#include <unordered_set>
#include <vector>

#include "../memconcept/include/memconcept/extensions.hpp"
#include "../memconcept/include/memconcept/impl/layout_checks.hpp"
#include "../memconcept/include/memconcept/memory.hpp"
#include "../memconcept/include/memconcept/memory2d.hpp"
#include "../memconcept/include/memconcept/storage.hpp"

using namespace memconcept;

namespace {

SharedArray<int> iota_array(std::size_t length) {
    SharedArray<int> array(length);
    std::iota(array.begin(), array.end(), 0);
    return array;
}

/// Element (row, column) of a strided layout read straight from the backing array
int expected_at(const SharedArray<int>& array, int offset, int width, int pitch, int row, int column) {
    return array[static_cast<std::size_t>(offset + row * (width + pitch) + column)];
}

} // namespace

// ============================================================================
// Construction from 1-D storage
// ============================================================================

TEST(Memory2DTest, OffsetPitchScenario) {
    SharedArray<int> array{1, 2, 3, 4, 5, 6};
    auto view = Memory2D<int>::create(array, 1, 2, 2, 1);
    ASSERT_TRUE(view);

    auto span = view.value().span();
    EXPECT_EQ(span(0, 0), 2);
    EXPECT_EQ(span(1, 1), 6);
    EXPECT_EQ(view.value().size(), 4u);
    EXPECT_FALSE(view.value().is_empty());
}

TEST(Memory2DTest, ValidLayoutsHaveWidthTimesHeightElements) {
    SharedArray<int> array = iota_array(64);
    for (int offset : {0, 3, 17}) {
        for (int width : {1, 2, 5}) {
            for (int height : {1, 3, 4}) {
                for (int pitch : {0, 1, 4}) {
                    if ((width + pitch) * height > 64 - offset) {
                        continue;
                    }
                    auto view = Memory2D<int>::create(array, offset, width, height, pitch);
                    ASSERT_TRUE(view) << to_string(view.error());
                    EXPECT_EQ(view.value().size(), static_cast<std::size_t>(width * height));

                    auto span = view.value().span();
                    EXPECT_EQ(span(height - 1, width - 1),
                              expected_at(array, offset, width, pitch, height - 1, width - 1));
                }
            }
        }
    }
}

TEST(Memory2DTest, RejectsOffsetOutsideArray) {
    SharedArray<int> array = iota_array(6);
    auto negative = Memory2D<int>::create(array, -1, 1, 1);
    ASSERT_FALSE(negative);
    EXPECT_EQ(negative.error().code, Error::Code::OutOfRange);

    auto past_end = Memory2D<int>::create(array, 6, 1, 1);
    ASSERT_FALSE(past_end);
    EXPECT_EQ(past_end.error().code, Error::Code::OutOfRange);
}

TEST(Memory2DTest, RejectsNegativeDimensions) {
    SharedArray<int> array = iota_array(6);
    EXPECT_EQ(Memory2D<int>::create(array, 0, -1, 1).error().code, Error::Code::OutOfRange);
    EXPECT_EQ(Memory2D<int>::create(array, 0, 1, -1).error().code, Error::Code::OutOfRange);
    EXPECT_EQ(Memory2D<int>::create(array, 0, 1, 1, -1).error().code, Error::Code::OutOfRange);
}

TEST(Memory2DTest, RejectsLayoutLargerThanArray) {
    SharedArray<int> array = iota_array(6);
    auto view = Memory2D<int>::create(array, 0, 4, 2);
    ASSERT_FALSE(view);
    EXPECT_EQ(view.error().code, Error::Code::InvalidArgument);
}

TEST(Memory2DTest, RejectsOtherElementTypeBeforeOffsetChecks) {
    Storage storage = make_storage<float>(4);
    // The offset is invalid too; the type check must win
    auto view = Memory2D<int>::create(storage, 100, 1, 1);
    ASSERT_FALSE(view);
    EXPECT_EQ(view.error().code, Error::Code::TypeMismatch);
}

TEST(Memory2DTest, NullStorage) {
    auto empty = Memory2D<int>::create(Storage{}, 0, 0, 0);
    ASSERT_TRUE(empty);
    EXPECT_TRUE(empty.value().is_empty());

    auto invalid = Memory2D<int>::create(Storage{}, 0, 2, 2);
    ASSERT_FALSE(invalid);
    EXPECT_EQ(invalid.error().code, Error::Code::InvalidArgument);
}

TEST(Memory2DTest, FromFlatMemory) {
    SharedArray<int> array = iota_array(12);
    auto memory = Memory<int>::create(array, 2, 10);
    ASSERT_TRUE(memory);

    auto view = Memory2D<int>::create(memory.value(), 1, 3, 2, 2);
    ASSERT_TRUE(view);
    auto span = view.value().span();
    EXPECT_EQ(span(0, 0), 3);
    EXPECT_EQ(span(1, 2), 3 + 5 + 2);
    EXPECT_EQ(view.value().owner(), array.storage());
}

// ============================================================================
// Construction from 2-D and 3-D arrays
// ============================================================================

TEST(Memory2DTest, WholeArray2D) {
    auto array = SharedArray2D<int>::from_rows({{1, 2, 3}, {4, 5, 6}}).value();
    Memory2D<int> view = array;
    EXPECT_EQ(view.height(), 2);
    EXPECT_EQ(view.width(), 3);
    EXPECT_EQ(view.pitch(), 0);
    EXPECT_EQ(view.span()(1, 2), 6);
}

TEST(Memory2DTest, SubRectangleOfArray2D) {
    auto array = SharedArray2D<int>::from_rows({
        {1, 2, 3, 4},
        {5, 6, 7, 8},
        {9, 10, 11, 12},
    }).value();

    auto view = Memory2D<int>::create(array, 1, 1, 2, 2);
    ASSERT_TRUE(view);
    EXPECT_EQ(view.value().pitch(), 2);
    auto span = view.value().span();
    EXPECT_EQ(span(0, 0), 6);
    EXPECT_EQ(span(0, 1), 7);
    EXPECT_EQ(span(1, 0), 10);
    EXPECT_EQ(span(1, 1), 11);
}

TEST(Memory2DTest, SubRectangleRejectsOutOfBounds) {
    SharedArray2D<int> array(3, 4);
    EXPECT_EQ(Memory2D<int>::create(array, 3, 0, 1, 1).error().code, Error::Code::OutOfRange);
    EXPECT_EQ(Memory2D<int>::create(array, 0, 4, 1, 1).error().code, Error::Code::OutOfRange);
    EXPECT_EQ(Memory2D<int>::create(array, 0, 2, 3, 1).error().code, Error::Code::OutOfRange);
    EXPECT_EQ(Memory2D<int>::create(array, 1, 0, 1, 3).error().code, Error::Code::OutOfRange);
}

TEST(Memory2DTest, LayerOfArray3D) {
    SharedArray3D<int> cube(3, 2, 4);
    std::iota(cube.span().begin(), cube.span().end(), 0);

    auto layer = Memory2D<int>::create(cube, 2);
    ASSERT_TRUE(layer);
    EXPECT_EQ(layer.value().height(), 2);
    EXPECT_EQ(layer.value().width(), 4);
    EXPECT_EQ(layer.value().pitch(), 0);
    EXPECT_EQ(layer.value().span()(0, 0), 16);
    EXPECT_EQ(layer.value().span()(1, 3), 23);

    auto missing = Memory2D<int>::create(cube, 3);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, Error::Code::OutOfRange);
}

TEST(Memory2DTest, SubRectangleOfArray3DLayer) {
    SharedArray3D<int> cube(2, 3, 3);
    std::iota(cube.span().begin(), cube.span().end(), 0);

    auto view = Memory2D<int>::create(cube, 1, 1, 1, 2, 2);
    ASSERT_TRUE(view);
    EXPECT_EQ(view.value().pitch(), 1);
    EXPECT_EQ(view.value().span()(0, 0), cube(1, 1, 1));
    EXPECT_EQ(view.value().span()(1, 1), cube(1, 2, 2));
}

// ============================================================================
// Slicing
// ============================================================================

TEST(Memory2DTest, SliceMatchesManualRead) {
    SharedArray<int> array = iota_array(48);
    const int offset = 2, width = 6, height = 5, pitch = 2;
    auto view = Memory2D<int>::create(array, offset, width, height, pitch).value();

    auto slice = view.slice(1, 2, 3, 4);
    ASSERT_TRUE(slice);
    EXPECT_EQ(slice.value().pitch(), width + pitch - 3);
    EXPECT_EQ(slice.value().owner(), view.owner());

    SharedArray2D<int> copy = slice.value().to_array();
    for (int r = 0; r < 4; ++r) {
        for (int c = 0; c < 3; ++c) {
            EXPECT_EQ(copy(r, c), expected_at(array, offset, width, pitch, r + 1, c + 2));
        }
    }
}

TEST(Memory2DTest, SliceOfSliceKeepsStride) {
    SharedArray<int> array = iota_array(100);
    auto view = Memory2D<int>::create(array, 0, 10, 10).value();
    auto inner = view.slice(2, 2, 6, 6).value().slice(1, 1, 2, 2).value();

    EXPECT_EQ(inner.pitch(), 8);
    EXPECT_EQ(inner.span()(0, 0), 33);
    EXPECT_EQ(inner.span()(1, 1), 44);
}

TEST(Memory2DTest, SliceRejectsOutOfBounds) {
    SharedArray<int> array = iota_array(16);
    auto view = Memory2D<int>::create(array, 0, 4, 4).value();
    EXPECT_EQ(view.slice(4, 0, 1, 1).error().code, Error::Code::OutOfRange);
    EXPECT_EQ(view.slice(0, 4, 1, 1).error().code, Error::Code::OutOfRange);
    EXPECT_EQ(view.slice(0, 1, 4, 1).error().code, Error::Code::OutOfRange);
    EXPECT_EQ(view.slice(1, 0, 1, 4).error().code, Error::Code::OutOfRange);
    EXPECT_EQ(view.slice(-1, 0, 1, 1).error().code, Error::Code::OutOfRange);
}

// ============================================================================
// Contiguity and copies
// ============================================================================

TEST(Memory2DTest, TryGetMemoryWhenContiguous) {
    SharedArray<int> array = iota_array(12);
    auto view = Memory2D<int>::create(array, 2, 3, 3).value();

    auto flat = view.try_get_memory();
    ASSERT_TRUE(flat.has_value());
    ASSERT_EQ(flat->size(), 9u);
    for (std::size_t i = 0; i < flat->size(); ++i) {
        EXPECT_EQ(flat->span()[i], static_cast<int>(i + 2));
    }
}

TEST(Memory2DTest, TryGetMemoryFailsWithPitch) {
    SharedArray<int> array = iota_array(12);
    auto view = Memory2D<int>::create(array, 0, 3, 3, 1).value();
    EXPECT_FALSE(view.try_get_memory().has_value());
}

TEST(Memory2DTest, TryGetMemoryOfFullWidthSlice) {
    SharedArray2D<int> array(4, 5);
    Memory2D<int> view = array;
    auto rows = view.slice(1, 0, 5, 2).value();
    EXPECT_EQ(rows.pitch(), 0);
    auto flat = rows.try_get_memory();
    ASSERT_TRUE(flat.has_value());
    EXPECT_EQ(flat->start(), 5u);
    EXPECT_EQ(flat->size(), 10u);
}

TEST(Memory2DTest, CopyToFlatMemory) {
    SharedArray<int> array{1, 2, 3, 4, 5, 6};
    auto view = Memory2D<int>::create(array, 1, 2, 2, 1).value();

    SharedArray<int> out(4);
    ASSERT_TRUE(view.copy_to(Memory<int>(out)));
    EXPECT_EQ(out[0], 2);
    EXPECT_EQ(out[1], 3);
    EXPECT_EQ(out[2], 5);
    EXPECT_EQ(out[3], 6);

    SharedArray<int> small(3);
    EXPECT_FALSE(view.try_copy_to(Memory<int>(small)));
}

TEST(Memory2DTest, CopyToMemory2D) {
    SharedArray<int> array = iota_array(9);
    auto source = Memory2D<int>::create(array, 0, 3, 3).value().slice(1, 1, 2, 2).value();

    SharedArray2D<int> target(2, 2);
    ASSERT_TRUE(source.copy_to(Memory2D<int>(target)));
    EXPECT_EQ(target(0, 0), 4);
    EXPECT_EQ(target(1, 1), 8);

    SharedArray2D<int> wrong(3, 2);
    EXPECT_FALSE(source.try_copy_to(Memory2D<int>(wrong)));
}

TEST(Memory2DTest, ToArrayIsIndependentCopy) {
    SharedArray<int> array{1, 2, 3, 4};
    Memory2D<int> view = Memory2D<int>::create(array, 0, 2, 2).value();
    SharedArray2D<int> copy = view.to_array();
    array[0] = 100;
    EXPECT_EQ(copy(0, 0), 1);
    EXPECT_NE(copy.storage(), array.storage());
}

// ============================================================================
// Pinning
// ============================================================================

TEST(Memory2DTest, PinAddressesFirstElement) {
    SharedArray<int> array = iota_array(10);
    auto view = Memory2D<int>::create(array, 3, 2, 2, 1).value();
    {
        MemoryHandle handle = view.pin();
        EXPECT_EQ(handle.pointer(), array.data() + 3);
        EXPECT_EQ(array.storage()->pin_count(), 1u);
    }
    EXPECT_EQ(array.storage()->pin_count(), 0u);
}

TEST(Memory2DTest, EmptyViewPinsNothing) {
    Memory2D<int> view;
    MemoryHandle handle = view.pin();
    EXPECT_FALSE(handle.has_owner());
    EXPECT_EQ(handle.pointer(), nullptr);
}

// ============================================================================
// Empty view, equality and hashing
// ============================================================================

TEST(Memory2DTest, EmptyView) {
    Memory2D<int> view;
    EXPECT_TRUE(view.is_empty());
    EXPECT_EQ(view.size(), 0u);
    EXPECT_EQ(view.hash(), 0u);
    EXPECT_EQ(std::hash<Memory2D<int>>{}(view), 0u);
    EXPECT_TRUE(view.span().empty());

    auto flat = view.try_get_memory();
    ASSERT_TRUE(flat.has_value());
    EXPECT_TRUE(flat->empty());
}

TEST(Memory2DTest, ZeroWidthViewIsEmpty) {
    SharedArray<int> array = iota_array(4);
    auto view = Memory2D<int>::create(array, 0, 0, 3).value();
    EXPECT_TRUE(view.is_empty());
    EXPECT_EQ(view.size(), 0u);
}

TEST(Memory2DTest, EqualityIsStructural) {
    SharedArray<int> array = iota_array(32);
    auto a = Memory2D<int>::create(array, 1, 3, 3, 2).value();
    auto b = Memory2D<int>::create(array, 1, 3, 3, 2).value();
    auto c = Memory2D<int>::create(array, 1, 3, 3, 2).value();

    EXPECT_TRUE(a == a);
    EXPECT_TRUE(a == b);
    EXPECT_TRUE(b == a);
    EXPECT_TRUE(b == c);
    EXPECT_TRUE(a == c);
    EXPECT_EQ(a.hash(), b.hash());

    EXPECT_FALSE(a == Memory2D<int>::create(array, 2, 3, 3, 2).value());
    EXPECT_FALSE(a == Memory2D<int>::create(array, 1, 3, 2, 2).value());
    EXPECT_FALSE(a == Memory2D<int>::create(array, 1, 2, 3, 2).value());
    EXPECT_FALSE(a == Memory2D<int>::create(array, 1, 3, 3, 1).value());

    SharedArray<int> other = iota_array(32);
    EXPECT_FALSE(a == Memory2D<int>::create(other, 1, 3, 3, 2).value());
}

TEST(Memory2DTest, UsableAsHashKey) {
    SharedArray<int> array = iota_array(16);
    std::unordered_set<Memory2D<int>> views;
    views.insert(Memory2D<int>::create(array, 0, 2, 2).value());
    views.insert(Memory2D<int>::create(array, 0, 2, 2).value());
    views.insert(Memory2D<int>::create(array, 1, 2, 2).value());
    EXPECT_EQ(views.size(), 2u);
}

// ============================================================================
// Read-only views and diagnostics
// ============================================================================

TEST(Memory2DTest, ReadOnlyConversion) {
    SharedArray<int> array{1, 2, 3, 4, 5, 6};
    auto view = Memory2D<int>::create(array, 1, 2, 2, 1).value();
    ReadOnlyMemory2D<int> read_only = view;

    EXPECT_EQ(read_only.owner(), view.owner());
    EXPECT_EQ(read_only.byte_offset(), view.byte_offset());
    EXPECT_EQ(read_only.span()(1, 1), 6);

    SharedArray2D<int> copy = read_only.to_array();
    EXPECT_EQ(copy(1, 0), 5);
}

TEST(Memory2DTest, ReadOnlyFromConstStorage) {
    SharedArray<int> array{1, 2, 3, 4};
    auto view = ReadOnlyMemory2D<int>::create(array, 0, 2, 2);
    ASSERT_TRUE(view);
    EXPECT_EQ(view.value().span()(1, 0), 3);
}

TEST(Memory2DTest, ToStringShowsDimensions) {
    SharedArray<int> array = iota_array(12);
    auto view = Memory2D<int>::create(array, 0, 4, 3).value();
    const std::string text = view.to_string();
    EXPECT_NE(text.find("memconcept::Memory2D<"), std::string::npos);
    EXPECT_NE(text.find("[3, 4]"), std::string::npos);
}

// ============================================================================
// Extension entry points
// ============================================================================

TEST(Memory2DTest, AsMemory2DOverFlatMemory) {
    SharedArray<int> array = iota_array(12);
    Memory<int> memory = array;

    auto dense = as_memory2d(memory, 4, 3);
    ASSERT_TRUE(dense);
    EXPECT_EQ(dense.value().span()(2, 3), 11);

    auto strided = as_memory2d(memory, 1, 2, 3, 2);
    ASSERT_TRUE(strided);
    EXPECT_EQ(strided.value().span()(1, 0), 5);
    EXPECT_EQ(strided.value().span()(2, 1), 10);

    EXPECT_FALSE(as_memory2d(memory, 5, 3));
}

TEST(Memory2DTest, SpanSliceKeepsOwningBlock) {
    SharedArray<int> array = iota_array(24);
    auto view = Memory2D<int>::create(array, 2, 4, 4, 2).value();
    auto slice = view.span().slice(1, 1, 2, 3);
    ASSERT_TRUE(slice);
    EXPECT_EQ(slice.value()(0, 0), expected_at(array, 2, 4, 2, 1, 1));
    EXPECT_EQ(slice.value()(2, 1), expected_at(array, 2, 4, 2, 3, 2));
#if MEMCONCEPT_REF_STRATEGY == MEMCONCEPT_REF_STRATEGY_OWNER_OFFSET
    EXPECT_EQ(slice.value().origin().owner(), array.storage().get());
    EXPECT_EQ(slice.value().origin().byte_offset(),
              static_cast<std::ptrdiff_t>((2 + 6 + 1) * sizeof(int)));
#else
    EXPECT_EQ(slice.value().origin().get(), array.data() + 9);
#endif
}

TEST(Memory2DTest, ArrayDimensionsAboveIntRangeAreRejected) {
    constexpr auto limit = static_cast<std::size_t>(std::numeric_limits<int>::max());
    EXPECT_TRUE(layout::validate_array_dimensions(limit, limit));

    auto tall = layout::validate_array_dimensions(limit + 1, 1);
    ASSERT_FALSE(tall);
    EXPECT_EQ(tall.error().code, Error::Code::OutOfRange);

    auto wide = layout::validate_array_dimensions(1, limit + 1);
    ASSERT_FALSE(wide);
    EXPECT_EQ(wide.error().code, Error::Code::OutOfRange);
}
