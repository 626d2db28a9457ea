/// @file types.hpp
/// @brief Core identity types: Uuid and its aliases, Timestamp.

#pragma once

#include <algorithm>
#include <array>
#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace collab_cpp {

/// A 16-byte random identifier (RFC 4122 version 4 layout).
///
/// Every entity in the library (users, sessions, documents, annotations,
/// conversations) is identified by a Uuid. Identity is supplied by the
/// caller for users; the library generates the rest with Uuid::random().
/// Lexicographic ordering on raw bytes.
struct Uuid {
    static constexpr std::size_t size = 16;  ///< Fixed size in bytes.
    std::array<std::byte, size> bytes{};     ///< Raw identifier bytes.

    constexpr Uuid() = default;

    /// Construct from a byte array.
    explicit constexpr Uuid(std::array<std::byte, size> b) : bytes{b} {}

    /// Construct from a raw uint8_t array (convenience for tests).
    explicit Uuid(const std::uint8_t (&raw)[size]) {
        std::ranges::transform(raw, bytes.begin(),
            [](std::uint8_t b) { return std::byte{b}; });
    }

    /// Generate a fresh random (version 4) identifier.
    static auto random() -> Uuid;

    /// Parse the canonical 8-4-4-4-12 hex form. Case-insensitive.
    /// @return The parsed id, or nullopt if the text is malformed.
    static auto parse(std::string_view text) -> std::optional<Uuid>;

    /// Format as canonical lowercase 8-4-4-4-12 hex.
    auto to_string() const -> std::string;

    auto operator<=>(const Uuid&) const = default;
    auto operator==(const Uuid&) const -> bool = default;

    /// Check if all bytes are zero.
    auto is_nil() const -> bool {
        return std::ranges::all_of(bytes, [](std::byte b) {
            return b == std::byte{0};
        });
    }
};

using UserId = Uuid;
using SessionId = Uuid;
using DocumentId = Uuid;
using AnnotationId = Uuid;
using ConversationId = Uuid;
using MessageId = Uuid;

/// A millisecond-precision wall-clock timestamp.
struct Timestamp {
    std::int64_t millis_since_epoch{0};  ///< Milliseconds since Unix epoch.

    /// Read the system clock.
    static auto now() -> Timestamp {
        const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
        return Timestamp{
            std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count()};
    }

    auto operator<=>(const Timestamp&) const = default;
    auto operator==(const Timestamp&) const -> bool = default;
};

}  // namespace collab_cpp

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<collab_cpp::Uuid> {
    auto operator()(const collab_cpp::Uuid& id) const noexcept -> std::size_t {
        // FNV-1a over the 16 bytes
        auto h = std::size_t{14695981039346656037ULL};
        for (auto b : id.bytes) {
            h ^= static_cast<std::size_t>(b);
            h *= std::size_t{1099511628211ULL};
        }
        return h;
    }
};

/// @endcond
