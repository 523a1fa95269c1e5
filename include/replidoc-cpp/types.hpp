/// @file types.hpp
/// @brief Core identity types: ActorId, ObjectId, Key, WriterId.

#pragma once

#include <algorithm>
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <variant>

namespace replidoc_cpp {

/// A 16-byte unique identifier for a replica/writer.
///
/// Every operation and every conflicting value is attributed to the
/// actor that produced it. Lexicographic ordering on raw bytes.
struct ActorId {
    static constexpr std::size_t size = 16;  ///< Fixed size in bytes.
    std::array<std::byte, size> bytes{};     ///< Raw identifier bytes.

    constexpr ActorId() = default;

    /// Construct from a byte array.
    explicit constexpr ActorId(std::array<std::byte, size> b) : bytes{b} {}

    /// Construct from a raw uint8_t array (convenience for tests).
    explicit ActorId(const std::uint8_t (&raw)[size]) {
        std::ranges::transform(raw, bytes.begin(),
            [](std::uint8_t b) { return std::byte{b}; });
    }

    auto operator<=>(const ActorId&) const = default;
    auto operator==(const ActorId&) const -> bool = default;

    /// Check if all bytes are zero.
    auto is_zero() const -> bool {
        return std::ranges::all_of(bytes, [](std::byte b) {
            return b == std::byte{0};
        });
    }
};

/// A 16-byte globally unique, replica-independent object identifier.
///
/// The all-zero identifier is reserved for the document root, which
/// always exists, is always a map, and is never explicitly created.
struct ObjectId {
    static constexpr std::size_t size = 16;  ///< Fixed size in bytes.
    std::array<std::byte, size> bytes{};     ///< Raw identifier bytes.

    /// Default-constructs to the root object.
    constexpr ObjectId() = default;

    /// Construct from a byte array.
    explicit constexpr ObjectId(std::array<std::byte, size> b) : bytes{b} {}

    /// Construct from a raw uint8_t array (convenience for tests).
    explicit ObjectId(const std::uint8_t (&raw)[size]) {
        std::ranges::transform(raw, bytes.begin(),
            [](std::uint8_t b) { return std::byte{b}; });
    }

    auto operator<=>(const ObjectId&) const = default;
    auto operator==(const ObjectId&) const -> bool = default;

    /// Check if this is the root object.
    auto is_root() const -> bool {
        return std::ranges::all_of(bytes, [](std::byte b) {
            return b == std::byte{0};
        });
    }
};

/// The root object -- always a map, always exists.
inline constexpr auto root_id = ObjectId{};

/// A key into a map (non-empty string) or an index into a list/text.
using Key = std::variant<std::string, std::size_t>;

/// Create a map key from a string.
inline auto map_key(std::string key) -> Key { return Key{std::move(key)}; }

/// Create a list index key from an index.
inline auto list_index(std::size_t idx) -> Key { return Key{idx}; }

/// The token that keys one entry of a conflict set.
///
/// Local writes are attributed to the hex form of the local ActorId;
/// remote writers may use any non-empty token (e.g. an operation id).
/// Table rows are keyed by their row identifier.
using WriterId = std::string;

/// Produces fresh object identifiers. Must never repeat a value.
using ObjectIdGenerator = std::function<ObjectId()>;

/// Lowercase hex rendering of an actor (32 characters).
auto to_string(const ActorId& id) -> std::string;

/// Canonical 8-4-4-4-12 rendering of an object identifier.
auto to_string(const ObjectId& id) -> std::string;

/// Render a key the way it appears in patch props: map keys verbatim,
/// list indexes in decimal.
auto to_string(const Key& key) -> std::string;

/// The writer identifier under which `actor` records its own writes.
inline auto writer_id(const ActorId& actor) -> WriterId { return to_string(actor); }

/// Generate a random (version 4 layout) object identifier.
auto random_object_id() -> ObjectId;

/// Generate a random, non-zero actor identifier.
auto random_actor_id() -> ActorId;

}  // namespace replidoc_cpp

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<replidoc_cpp::ActorId> {
    auto operator()(const replidoc_cpp::ActorId& id) const noexcept -> std::size_t {
        // FNV-1a over the 16 bytes
        auto h = std::size_t{14695981039346656037ULL};
        for (auto b : id.bytes) {
            h ^= static_cast<std::size_t>(b);
            h *= std::size_t{1099511628211ULL};
        }
        return h;
    }
};

template <>
struct std::hash<replidoc_cpp::ObjectId> {
    auto operator()(const replidoc_cpp::ObjectId& id) const noexcept -> std::size_t {
        auto h = std::size_t{14695981039346656037ULL};
        for (auto b : id.bytes) {
            h ^= static_cast<std::size_t>(b);
            h *= std::size_t{1099511628211ULL};
        }
        return h;
    }
};

/// @endcond
