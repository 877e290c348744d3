#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>

#include <benchmark/benchmark.h>

#include "../memconcept/include/memconcept/storage.hpp"

namespace memconcept_bench {

/// Strided view configuration
struct ViewConfig {
    int width;
    int height;
    int pitch = 0;

    std::string name() const;
    std::size_t num_elements() const {
        return static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    }
    /// Elements the backing array needs, including the trailing pitch
    std::size_t backing_elements() const {
        return static_cast<std::size_t>(width + pitch) * static_cast<std::size_t>(height);
    }
};

/// Predefined view configurations for benchmarking
namespace configs {
    constexpr ViewConfig small_dense{64, 64, 0};
    constexpr ViewConfig small_strided{64, 64, 64};
    constexpr ViewConfig medium_dense{512, 512, 0};
    constexpr ViewConfig medium_strided{512, 512, 512};
    constexpr ViewConfig large_dense{2048, 2048, 0};
}

enum DataPattern {
    Gradient,
    Random
};

/// Element data generator
template <typename T>
class DataGenerator {
public:
    explicit DataGenerator(std::uint64_t seed = 42) : rng_(seed) {}

    /// Fill a new array of length elements with the given pattern
    memconcept::SharedArray<T> generate(std::size_t length, DataPattern pattern = DataPattern::Gradient);

private:
    std::mt19937_64 rng_;
};

/// Helper to compute throughput in MB/s
inline double compute_throughput(std::size_t bytes, double time_ns) {
    if (time_ns <= 0.0) return 0.0;
    double seconds = time_ns / 1e9;
    double mb = static_cast<double>(bytes) / (1024.0 * 1024.0);
    return mb / seconds;
}

} // namespace memconcept_bench
