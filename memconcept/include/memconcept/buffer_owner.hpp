#pragma once

#include <concepts>
#include <cstddef>
#include <span>
#include <type_traits>
#include "types/result.hpp"

namespace memconcept {

/// Concept for a byte-addressable backing store with a cursor
///
/// The window returned by get_span() starts at the unconsumed region:
/// the remaining [position, length) slice for fixed arrays, the unwritten
/// tail for append-style buffers. advance(count) commits count bytes of the
/// window just obtained and must fail, leaving the owner unchanged, when
/// count exceeds it.
///
/// Only one caller at a time should use an owner.
template <typename T>
concept BufferOwner = requires(T owner, const T cowner, std::size_t count) {
    // Total length of the backing (capacity for append-style buffers)
    { cowner.current_length() } -> std::same_as<std::size_t>;

    // Bytes available from the cursor
    { cowner.readable_length() } -> std::same_as<std::size_t>;

    // Cursor; always in [0, current_length()]
    { cowner.position() } -> std::same_as<std::size_t>;
    { owner.set_position(count) } -> std::same_as<Result<void>>;

    { owner.advance(count) } -> std::same_as<Result<void>>;

    // Window of at least size_hint bytes where the backing can provide it
    { owner.get_span(count) } -> std::same_as<Result<std::span<std::byte>>>;

    // The stream adapter holds owners by value and resets them on dispose
    requires std::default_initializable<T>;
    requires std::is_nothrow_move_constructible_v<T>;
    requires std::is_nothrow_move_assignable_v<T>;
};

} // namespace memconcept
