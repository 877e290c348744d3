#include <benchmark/benchmark.h>
#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

#include "benchmark_helpers.hpp"

#include "../memconcept/include/memconcept/buffers/array_pool.hpp"
#include "../memconcept/include/memconcept/buffers/array_pool_buffer_writer.hpp"
#include "../memconcept/include/memconcept/extensions.hpp"
#include "../memconcept/include/memconcept/memory.hpp"
#include "../memconcept/include/memconcept/memory2d.hpp"
#include "../memconcept/include/memconcept/memory_stream.hpp"
#include "../memconcept/include/memconcept/reference.hpp"
#include "../memconcept/include/memconcept/span2d.hpp"
#include "../memconcept/include/memconcept/storage.hpp"

using namespace memconcept;
using namespace memconcept_bench;

// ============================================================================
// Stream Benchmarks - Fixed-size owner
// ============================================================================

static void BM_Stream_Write_ArrayOwner(benchmark::State& state) {
    // Parameters: total bytes, chunk size
    const auto total = static_cast<std::size_t>(state.range(0));
    const auto chunk = static_cast<std::size_t>(state.range(1));

    SharedArray<std::byte> target(total);
    DataGenerator<std::byte> gen;
    auto source = gen.generate(chunk, DataPattern::Random);

    for (auto _ : state) {
        auto stream = as_stream(Memory<std::byte>(target));
        for (std::size_t written = 0; written + chunk <= total; written += chunk) {
            auto result = stream.write(source.span());
            if (!result) {
                state.SkipWithError(("Failed to write chunk " + result.error().message).c_str());
                return;
            }
        }
        benchmark::DoNotOptimize(target.data());
        benchmark::ClobberMemory();
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(total));
}

static void BM_Stream_Read_ArrayOwner(benchmark::State& state) {
    // Parameters: total bytes, chunk size
    const auto total = static_cast<std::size_t>(state.range(0));
    const auto chunk = static_cast<std::size_t>(state.range(1));

    DataGenerator<std::byte> gen;
    auto source = gen.generate(total, DataPattern::Random);
    std::vector<std::byte> buffer(chunk);

    for (auto _ : state) {
        auto stream = as_stream(ReadOnlyMemory<std::byte>(source));
        while (true) {
            auto read = stream.read(buffer);
            if (!read) {
                state.SkipWithError(("Failed to read chunk " + read.error().message).c_str());
                return;
            }
            if (read.value() == 0) break;
            benchmark::DoNotOptimize(buffer.data());
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(total));
}

static void BM_Stream_ReadByte_ArrayOwner(benchmark::State& state) {
    const auto total = static_cast<std::size_t>(state.range(0));

    DataGenerator<std::byte> gen;
    auto source = gen.generate(total, DataPattern::Gradient);

    for (auto _ : state) {
        auto stream = as_stream(ReadOnlyMemory<std::byte>(source));
        int sum = 0;
        while (true) {
            auto value = stream.read_byte();
            if (!value) {
                state.SkipWithError(("Failed to read byte " + value.error().message).c_str());
                return;
            }
            if (value.value() < 0) break;
            sum += value.value();
        }
        benchmark::DoNotOptimize(sum);
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(total));
}

// ============================================================================
// Stream Benchmarks - Growable owner
// ============================================================================

static void BM_Stream_Write_PoolOwner(benchmark::State& state) {
    // Parameters: total bytes, chunk size
    const auto total = static_cast<std::size_t>(state.range(0));
    const auto chunk = static_cast<std::size_t>(state.range(1));

    DataGenerator<std::byte> gen;
    auto source = gen.generate(chunk, DataPattern::Random);

    for (auto _ : state) {
        ArrayPoolBufferWriter<std::byte> writer;
        auto stream = as_stream(writer);
        for (std::size_t written = 0; written + chunk <= total; written += chunk) {
            auto result = stream.write(source.span());
            if (!result) {
                state.SkipWithError(("Failed to write chunk " + result.error().message).c_str());
                return;
            }
        }
        benchmark::DoNotOptimize(writer.written_span().data());
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(total));
}

static void BM_Stream_CopyTo(benchmark::State& state) {
    const auto total = static_cast<std::size_t>(state.range(0));

    DataGenerator<std::byte> gen;
    auto source = gen.generate(total, DataPattern::Random);
    SharedArray<std::byte> target(total);

    for (auto _ : state) {
        auto input = as_stream(ReadOnlyMemory<std::byte>(source));
        auto output = as_stream(Memory<std::byte>(target));
        auto result = input.copy_to(output);
        if (!result) {
            state.SkipWithError(("Failed to copy stream " + result.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(target.data());
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(total));
}

// ============================================================================
// Pool Benchmarks
// ============================================================================

static void BM_ArrayPool_RentReturn(benchmark::State& state) {
    const auto length = static_cast<std::size_t>(state.range(0));
    ArrayPool<std::byte> pool;

    for (auto _ : state) {
        auto array = pool.rent(length);
        if (!array) {
            state.SkipWithError(("Failed to rent array " + array.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(array.value().data());
        pool.give_back(std::move(array.value()));
    }

    state.SetItemsProcessed(state.iterations());
}

// ============================================================================
// 2-D View Benchmarks
// ============================================================================

template <typename T>
static void BM_Memory2D_ToArray(benchmark::State& state) {
    // Parameters: width, height, pitch
    ViewConfig config{static_cast<int>(state.range(0)), static_cast<int>(state.range(1)),
                      static_cast<int>(state.range(2))};

    DataGenerator<T> gen;
    auto backing = gen.generate(config.backing_elements());
    auto view = Memory2D<T>::create(backing, 0, config.width, config.height, config.pitch);
    if (!view) {
        state.SkipWithError(("Failed to create view " + view.error().message).c_str());
        return;
    }

    for (auto _ : state) {
        auto copy = view.value().to_array();
        benchmark::DoNotOptimize(copy.data());
    }

    state.SetLabel(config.name());
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(config.num_elements() * sizeof(T)));
}

template <typename T>
static void BM_Memory2D_SliceCopy(benchmark::State& state) {
    // Parameters: source width (square), slice size (square)
    const int width = static_cast<int>(state.range(0));
    const int slice_size = static_cast<int>(state.range(1));

    DataGenerator<T> gen;
    auto backing = gen.generate(static_cast<std::size_t>(width) * static_cast<std::size_t>(width));
    auto view = Memory2D<T>::create(backing, 0, width, width);
    if (!view) {
        state.SkipWithError(("Failed to create view " + view.error().message).c_str());
        return;
    }
    SharedArray2D<T> target(static_cast<std::size_t>(slice_size), static_cast<std::size_t>(slice_size));
    const int origin = (width - slice_size) / 2;

    for (auto _ : state) {
        auto slice = view.value().slice(origin, origin, slice_size, slice_size);
        if (!slice) {
            state.SkipWithError(("Failed to slice view " + slice.error().message).c_str());
            return;
        }
        auto copied = slice.value().copy_to(Memory2D<T>(target));
        if (!copied) {
            state.SkipWithError(("Failed to copy slice " + copied.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(target.data());
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(slice_size) * slice_size * static_cast<int64_t>(sizeof(T)));
}

template <typename T>
static void BM_Span2D_ElementSum(benchmark::State& state) {
    // Parameters: width, height, pitch
    ViewConfig config{static_cast<int>(state.range(0)), static_cast<int>(state.range(1)),
                      static_cast<int>(state.range(2))};

    DataGenerator<T> gen;
    auto backing = gen.generate(config.backing_elements());
    auto view = Memory2D<T>::create(backing, 0, config.width, config.height, config.pitch);
    if (!view) {
        state.SkipWithError(("Failed to create view " + view.error().message).c_str());
        return;
    }
    const Span2D<T> span = view.value().span();

    for (auto _ : state) {
        double sum = 0.0;
        for (int row = 0; row < span.height(); ++row) {
            for (int column = 0; column < span.width(); ++column) {
                sum += static_cast<double>(span(row, column));
            }
        }
        benchmark::DoNotOptimize(sum);
    }

    state.SetLabel(config.name());
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(config.num_elements()));
}

// ============================================================================
// Reference Strategy Benchmarks
// ============================================================================

template <typename RefT>
static void BM_Ref_OffsetAccess(benchmark::State& state) {
    using T = std::remove_cv_t<typename RefT::element_type>;
    const auto length = static_cast<std::size_t>(state.range(0));

    DataGenerator<T> gen;
    auto backing = gen.generate(length);
    const RefT ref(*backing.storage(), ByteOffset{0});

    for (auto _ : state) {
        double sum = 0.0;
        for (std::ptrdiff_t i = 0; i < static_cast<std::ptrdiff_t>(length); ++i) {
            sum += static_cast<double>(ref.at(i));
        }
        benchmark::DoNotOptimize(sum);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(length));
}

// ============================================================================
// Benchmark Registration
// ============================================================================

// Params: total bytes, chunk size
BENCHMARK(BM_Stream_Write_ArrayOwner)
    ->Args({1 << 20, 64})
    ->Args({1 << 20, 4096})
    ->Args({1 << 20, 65536})
    ->Name("MemConcept/Stream/Write/ArrayOwner")
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_Stream_Read_ArrayOwner)
    ->Args({1 << 20, 64})
    ->Args({1 << 20, 4096})
    ->Args({1 << 20, 65536})
    ->Name("MemConcept/Stream/Read/ArrayOwner")
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_Stream_ReadByte_ArrayOwner)
    ->Arg(1 << 16)
    ->Name("MemConcept/Stream/ReadByte/ArrayOwner")
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_Stream_Write_PoolOwner)
    ->Args({1 << 20, 64})
    ->Args({1 << 20, 4096})
    ->Args({1 << 20, 65536})
    ->Name("MemConcept/Stream/Write/PoolOwner")
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_Stream_CopyTo)
    ->Arg(1 << 16)
    ->Arg(1 << 20)
    ->Name("MemConcept/Stream/CopyTo")
    ->Unit(benchmark::kMicrosecond);

// Params: requested length
BENCHMARK(BM_ArrayPool_RentReturn)
    ->Arg(16)
    ->Arg(4096)
    ->Arg(1 << 20)
    ->Name("MemConcept/ArrayPool/RentReturn");

// Params: width, height, pitch
BENCHMARK(BM_Memory2D_ToArray<uint8_t>)
    ->Args({configs::small_dense.width, configs::small_dense.height, configs::small_dense.pitch})
    ->Args({configs::small_strided.width, configs::small_strided.height, configs::small_strided.pitch})
    ->Args({configs::medium_dense.width, configs::medium_dense.height, configs::medium_dense.pitch})
    ->Args({configs::medium_strided.width, configs::medium_strided.height, configs::medium_strided.pitch})
    ->Args({configs::large_dense.width, configs::large_dense.height, configs::large_dense.pitch})
    ->Name("MemConcept/Memory2D/ToArray/uint8")
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_Memory2D_ToArray<float>)
    ->Args({configs::medium_dense.width, configs::medium_dense.height, configs::medium_dense.pitch})
    ->Args({configs::medium_strided.width, configs::medium_strided.height, configs::medium_strided.pitch})
    ->Name("MemConcept/Memory2D/ToArray/float")
    ->Unit(benchmark::kMicrosecond);

// Params: source width, slice size
BENCHMARK(BM_Memory2D_SliceCopy<uint16_t>)
    ->Args({512, 64})
    ->Args({2048, 256})
    ->Args({2048, 1024})
    ->Name("MemConcept/Memory2D/SliceCopy/uint16")
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_Span2D_ElementSum<float>)
    ->Args({configs::medium_dense.width, configs::medium_dense.height, configs::medium_dense.pitch})
    ->Args({configs::medium_strided.width, configs::medium_strided.height, configs::medium_strided.pitch})
    ->Name("MemConcept/Span2D/ElementSum/float")
    ->Unit(benchmark::kMicrosecond);

// Params: element count
BENCHMARK(BM_Ref_OffsetAccess<DirectRef<float>>)
    ->Arg(1 << 16)
    ->Name("MemConcept/Ref/Direct/float")
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_Ref_OffsetAccess<OwnerOffsetRef<float>>)
    ->Arg(1 << 16)
    ->Name("MemConcept/Ref/OwnerOffset/float")
    ->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
