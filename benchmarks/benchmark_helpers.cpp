#include "benchmark_helpers.hpp"
#include <cstddef>
#include <sstream>
#include <type_traits>

namespace memconcept_bench {

// ============================================================================
// ViewConfig
// ============================================================================

std::string ViewConfig::name() const {
    std::ostringstream oss;
    oss << width << "x" << height;
    if (pitch > 0) {
        oss << "_pitch" << pitch;
    }
    return oss.str();
}

// ============================================================================
// DataGenerator
// ============================================================================

template <typename T>
memconcept::SharedArray<T> DataGenerator<T>::generate(std::size_t length, DataPattern pattern) {
    memconcept::SharedArray<T> array(length);

    switch (pattern) {
        case DataPattern::Gradient:
            for (std::size_t i = 0; i < length; ++i) {
                array[i] = static_cast<T>(i % 256);
            }
            break;
        case DataPattern::Random:
            if constexpr (std::is_floating_point_v<T>) {
                std::uniform_real_distribution<T> dist(T(0), T(1));
                for (std::size_t i = 0; i < length; ++i) {
                    array[i] = dist(rng_);
                }
            } else {
                std::uniform_int_distribution<int> dist(0, 255);
                for (std::size_t i = 0; i < length; ++i) {
                    array[i] = static_cast<T>(dist(rng_));
                }
            }
            break;
    }
    return array;
}

// Explicit template instantiations
template class DataGenerator<std::byte>;
template class DataGenerator<std::uint8_t>;
template class DataGenerator<std::uint16_t>;
template class DataGenerator<float>;

} // namespace memconcept_bench
