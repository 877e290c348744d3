#pragma once

#include <algorithm>
#include <bit>
#include <cstddef>
#include <limits>
#include <mutex>
#include <new>
#include <span>
#include <utility>
#include <vector>
#include "../config.hpp"
#include "../storage.hpp"
#include "../types/result.hpp"

namespace memconcept {

/// Pool configuration
struct ArrayPoolConfig {
    std::size_t max_array_length = config::default_pool_max_array_length;         ///< Larger arrays are not retained
    std::size_t max_arrays_per_bucket = config::default_pool_max_arrays_per_bucket; ///< Retained arrays per size class
};

/// Pool counters
struct ArrayPoolStats {
    std::size_t rent_count = 0;        ///< Successful rent() calls
    std::size_t return_count = 0;      ///< give_back() calls with a non-empty array
    std::size_t allocation_count = 0;  ///< Rents served by a fresh allocation
    std::size_t retained_count = 0;    ///< Arrays currently held by the pool
};

/// Array handed out by ArrayPool
///
/// Backed by a storage block so that Memory windows can be taken over it.
/// Contents of a reused array are whatever the previous renter left.
template <typename T>
class RentedArray {
private:
    Storage storage_;

    template <typename U>
    friend class ArrayPool;

    explicit RentedArray(Storage storage) noexcept
        : storage_(std::move(storage)) {}

public:
    RentedArray() noexcept = default;

    RentedArray(RentedArray&& other) noexcept
        : storage_(std::move(other.storage_)) {}

    RentedArray& operator=(RentedArray&& other) noexcept {
        storage_ = std::move(other.storage_);
        return *this;
    }

    RentedArray(const RentedArray&) = delete;
    RentedArray& operator=(const RentedArray&) = delete;

    [[nodiscard]] std::size_t size() const noexcept { return storage_ ? storage_->length() : 0; }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    [[nodiscard]] T* data() const noexcept {
        return storage_ ? reinterpret_cast<T*>(storage_->data()) : nullptr;
    }

    [[nodiscard]] std::span<T> span() const noexcept { return {data(), size()}; }

    [[nodiscard]] const Storage& storage() const noexcept { return storage_; }
};

/// Thread-safe pool of arrays bucketed by power-of-two length
///
/// rent(n) returns an array of at least n elements: n rounded up to a power of
/// two, never below config::min_pooled_array_length. Requests whose rounded
/// length has no bucket (above max_array_length) are allocated with the exact
/// length and dropped when given back.
template <typename T>
class ArrayPool {
public:
    using Config = ArrayPoolConfig;

private:
    Config config_;
    mutable std::mutex mutex_;
    std::vector<std::vector<Storage>> buckets_;
    ArrayPoolStats stats_;

    [[nodiscard]] static std::size_t bucket_index(std::size_t length) noexcept {
        return static_cast<std::size_t>(std::countr_zero(length) -
                                        std::countr_zero(config::min_pooled_array_length));
    }

    [[nodiscard]] bool is_poolable(std::size_t length) const noexcept {
        return length >= config::min_pooled_array_length &&
               length <= config_.max_array_length &&
               std::has_single_bit(length);
    }

    [[nodiscard]] static Result<Storage> allocate(std::size_t length) {
        try {
            return Ok(make_storage<T>(length));
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::OutOfMemory, "Failed to allocate {} elements of {} bytes",
                       length, sizeof(T));
        }
    }

public:
    explicit ArrayPool(Config config = {})
        : config_(config) {
        std::size_t bucket_count = 0;
        for (std::size_t length = config::min_pooled_array_length;
             length <= config_.max_array_length && length != 0; length <<= 1) {
            ++bucket_count;
        }
        buckets_.resize(bucket_count);
    }

    ArrayPool(const ArrayPool&) = delete;
    ArrayPool& operator=(const ArrayPool&) = delete;

    /// Process-wide pool with the default configuration
    [[nodiscard]] static ArrayPool& shared() {
        static ArrayPool pool;
        return pool;
    }

    /// Rent an array of at least minimum_length elements
    /// @note rent(0) returns an empty array without touching the pool
    /// @retval OutOfMemory allocation failed
    [[nodiscard]] Result<RentedArray<T>> rent(std::size_t minimum_length) {
        if (minimum_length == 0) {
            return Ok(RentedArray<T>{});
        }

        // bit_ceil is undefined past the highest power of two
        constexpr std::size_t largest_power = std::numeric_limits<std::size_t>::max() / 2 + 1;
        const std::size_t rounded = minimum_length > largest_power
                                        ? minimum_length
                                        : std::bit_ceil(std::max(minimum_length, config::min_pooled_array_length));
        const bool pooled = is_poolable(rounded);
        const std::size_t length = pooled ? rounded : minimum_length;

        if (pooled) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& bucket = buckets_[bucket_index(length)];
            if (!bucket.empty()) {
                Storage storage = std::move(bucket.back());
                bucket.pop_back();
                ++stats_.rent_count;
                --stats_.retained_count;
                return Ok(RentedArray<T>(std::move(storage)));
            }
        }

        auto storage = allocate(length);
        if (!storage) {
            return storage.error();
        }
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.rent_count;
        ++stats_.allocation_count;
        return Ok(RentedArray<T>(std::move(storage.value())));
    }

    /// Return an array; it is kept for reuse while its bucket has room
    void give_back(RentedArray<T>&& array) {
        Storage storage = std::move(array.storage_);
        if (!storage) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.return_count;
        if (!is_poolable(storage->length())) {
            return;
        }
        auto& bucket = buckets_[bucket_index(storage->length())];
        if (bucket.size() < config_.max_arrays_per_bucket) {
            bucket.push_back(std::move(storage));
            ++stats_.retained_count;
        }
    }

    [[nodiscard]] ArrayPoolStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

    [[nodiscard]] const Config& config() const noexcept { return config_; }
};

} // namespace memconcept
