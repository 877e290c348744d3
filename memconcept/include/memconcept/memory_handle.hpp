#pragma once

#include <utility>
#include "storage.hpp"

namespace memconcept {

/// Scoped pin over a storage block
///
/// Holds a stable address inside the block and keeps the block alive.
/// The pin is released exactly once, by release() or by the destructor.
/// A default-constructed handle is the null handle and pins nothing.
class MemoryHandle {
private:
    void* pointer_{nullptr};
    Storage owner_;

public:
    MemoryHandle() noexcept = default;

    MemoryHandle(void* pointer, Storage owner) noexcept
        : pointer_(pointer)
        , owner_(std::move(owner)) {
        if (owner_) {
            owner_->add_pin();
        }
    }

    ~MemoryHandle() noexcept {
        release();
    }

    MemoryHandle(MemoryHandle&& other) noexcept
        : pointer_(std::exchange(other.pointer_, nullptr))
        , owner_(std::move(other.owner_)) {}

    MemoryHandle& operator=(MemoryHandle&& other) noexcept {
        if (this != &other) {
            release();
            pointer_ = std::exchange(other.pointer_, nullptr);
            owner_ = std::move(other.owner_);
        }
        return *this;
    }

    MemoryHandle(const MemoryHandle&) = delete;
    MemoryHandle& operator=(const MemoryHandle&) = delete;

    [[nodiscard]] void* pointer() const noexcept { return pointer_; }

    /// True if this handle currently pins a block
    [[nodiscard]] bool has_owner() const noexcept { return owner_ != nullptr; }

    void release() noexcept {
        if (owner_) {
            owner_->remove_pin();
            owner_.reset();
        }
        pointer_ = nullptr;
    }
};

} // namespace memconcept
