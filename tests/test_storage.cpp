#include <gtest/gtest.h>
#include <cstddef>
#include <utility>

#include "../memconcept/include/memconcept/memory.hpp"
#include "../memconcept/include/memconcept/memory_handle.hpp"
#include "../memconcept/include/memconcept/storage.hpp"

using namespace memconcept;

// ============================================================================
// StorageBlock / SharedArray
// ============================================================================

TEST(StorageTest, MakeStorageIsValueInitialized) {
    Storage storage = make_storage<int>(8);
    ASSERT_NE(storage, nullptr);
    EXPECT_EQ(storage->length(), 8u);
    EXPECT_EQ(storage->element_size(), sizeof(int));
    EXPECT_EQ(storage->byte_length(), 8u * sizeof(int));
    EXPECT_TRUE(storage->holds<int>());
    EXPECT_TRUE(storage->holds<const int>());
    EXPECT_FALSE(storage->holds<float>());

    const int* values = reinterpret_cast<const int*>(storage->data());
    for (std::size_t i = 0; i < 8; ++i) {
        EXPECT_EQ(values[i], 0);
    }
}

TEST(StorageTest, SharedArrayCopiesShareStorage) {
    SharedArray<int> first{1, 2, 3};
    SharedArray<int> second = first;
    second[1] = 20;
    EXPECT_EQ(first[1], 20);
    EXPECT_EQ(first.storage(), second.storage());
}

TEST(StorageTest, DefaultSharedArrayIsEmpty) {
    SharedArray<int> array;
    EXPECT_TRUE(array.empty());
    EXPECT_EQ(array.data(), nullptr);
    EXPECT_EQ(array.storage(), nullptr);
}

TEST(StorageTest, SharedArray2DFromRows) {
    auto result = SharedArray2D<int>::from_rows({{1, 2, 3}, {4, 5, 6}});
    ASSERT_TRUE(result);
    const auto& array = result.value();
    EXPECT_EQ(array.rows(), 2u);
    EXPECT_EQ(array.columns(), 3u);
    EXPECT_EQ(array(0, 2), 3);
    EXPECT_EQ(array(1, 0), 4);
}

TEST(StorageTest, SharedArray2DRejectsJaggedRows) {
    auto result = SharedArray2D<int>::from_rows({{1, 2, 3}, {4, 5}});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Error::Code::InvalidArgument);
}

TEST(StorageTest, SharedArray3DLayout) {
    SharedArray3D<int> cube(2, 3, 4);
    EXPECT_EQ(cube.size(), 24u);
    cube(1, 2, 3) = 99;
    EXPECT_EQ(cube.data()[(1 * 3 + 2) * 4 + 3], 99);
}

// ============================================================================
// Memory<T>
// ============================================================================

TEST(MemoryTest, WholeArray) {
    SharedArray<int> array{1, 2, 3, 4};
    Memory<int> memory = array;
    EXPECT_EQ(memory.size(), 4u);
    EXPECT_EQ(memory.start(), 0u);
    EXPECT_EQ(memory.data(), array.data());
    EXPECT_EQ(memory.span()[3], 4);
}

TEST(MemoryTest, CreateWindow) {
    SharedArray<int> array{1, 2, 3, 4, 5};
    auto memory = Memory<int>::create(array, 1, 3);
    ASSERT_TRUE(memory);
    EXPECT_EQ(memory.value().size(), 3u);
    EXPECT_EQ(memory.value().span()[0], 2);
    EXPECT_EQ(memory.value().span()[2], 4);
}

TEST(MemoryTest, CreateRejectsWindowPastEnd) {
    SharedArray<int> array{1, 2, 3};
    auto memory = Memory<int>::create(array, 2, 2);
    ASSERT_FALSE(memory);
    EXPECT_EQ(memory.error().code, Error::Code::OutOfRange);
}

TEST(MemoryTest, CreateRejectsOtherElementType) {
    Storage storage = make_storage<float>(4);
    auto memory = Memory<int>::create(storage, 0, 4);
    ASSERT_FALSE(memory);
    EXPECT_EQ(memory.error().code, Error::Code::TypeMismatch);
}

TEST(MemoryTest, Slice) {
    SharedArray<int> array{1, 2, 3, 4, 5};
    Memory<int> memory = array;

    auto tail = memory.slice(3);
    ASSERT_TRUE(tail);
    EXPECT_EQ(tail.value().size(), 2u);
    EXPECT_EQ(tail.value().span()[0], 4);

    auto middle = memory.slice(1, 2);
    ASSERT_TRUE(middle);
    EXPECT_EQ(middle.value().start(), 1u);
    EXPECT_EQ(middle.value().span()[1], 3);

    EXPECT_FALSE(memory.slice(6));
    EXPECT_FALSE(memory.slice(4, 2));
}

TEST(MemoryTest, ReadOnlyConversion) {
    SharedArray<int> array{7, 8};
    Memory<int> memory = array;
    ReadOnlyMemory<int> read_only = memory;
    EXPECT_EQ(read_only.size(), 2u);
    EXPECT_EQ(read_only.span()[1], 8);
    EXPECT_EQ(read_only.owner(), memory.owner());
}

// ============================================================================
// MemoryHandle
// ============================================================================

TEST(MemoryHandleTest, PinCountFollowsHandles) {
    SharedArray<int> array{1, 2, 3};
    Memory<int> memory = array;
    const StorageBlock& block = *array.storage();

    EXPECT_FALSE(block.is_pinned());
    {
        MemoryHandle first = memory.pin();
        EXPECT_EQ(first.pointer(), array.data());
        EXPECT_EQ(block.pin_count(), 1u);

        MemoryHandle second = memory.pin();
        EXPECT_EQ(block.pin_count(), 2u);

        MemoryHandle moved = std::move(second);
        EXPECT_EQ(block.pin_count(), 2u);
        EXPECT_FALSE(second.has_owner());
        EXPECT_TRUE(moved.has_owner());
    }
    EXPECT_EQ(block.pin_count(), 0u);
}

TEST(MemoryHandleTest, ReleaseIsIdempotent) {
    SharedArray<int> array{1, 2, 3};
    Memory<int> memory = array;
    const StorageBlock& block = *array.storage();

    MemoryHandle handle = memory.pin();
    EXPECT_EQ(block.pin_count(), 1u);
    handle.release();
    EXPECT_EQ(block.pin_count(), 0u);
    EXPECT_EQ(handle.pointer(), nullptr);
    handle.release();
    EXPECT_EQ(block.pin_count(), 0u);
}

TEST(MemoryHandleTest, PinKeepsStorageAlive) {
    MemoryHandle handle;
    {
        SharedArray<int> array{42};
        Memory<int> memory = array;
        handle = memory.pin();
    }
    ASSERT_TRUE(handle.has_owner());
    EXPECT_EQ(*static_cast<int*>(handle.pointer()), 42);
}

TEST(MemoryHandleTest, EmptyMemoryPinsNothing) {
    Memory<int> memory;
    MemoryHandle handle = memory.pin();
    EXPECT_FALSE(handle.has_owner());
    EXPECT_EQ(handle.pointer(), nullptr);
}
