/// @file value.hpp
/// @brief Value types: ScalarValue, ObjType, Datatype, and the InputValue variant.

#pragma once

#include <replidoc-cpp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace replidoc_cpp {

/// Represents a JSON null value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// A CRDT counter. Must be changed by increment, never overwritten.
struct Counter {
    std::int64_t value{0};  ///< The current counter value.

    auto operator<=>(const Counter&) const = default;
    auto operator==(const Counter&) const -> bool = default;
};

/// A millisecond-precision timestamp.
struct Timestamp {
    std::int64_t millis_since_epoch{0};  ///< Milliseconds since Unix epoch.

    auto operator<=>(const Timestamp&) const = default;
    auto operator==(const Timestamp&) const -> bool = default;
};

/// The four kinds of container objects.
enum class ObjType : std::uint8_t {
    map,    ///< An unordered key-value map.
    list,   ///< An ordered sequence.
    text,   ///< A character sequence.
    table,  ///< Rows keyed by their own object identifier.
};

/// Convert an ObjType to its string representation.
constexpr auto to_string_view(ObjType type) noexcept -> std::string_view {
    switch (type) {
        case ObjType::map:   return "map";
        case ObjType::list:  return "list";
        case ObjType::text:  return "text";
        case ObjType::table: return "table";
    }
    return "unknown";
}

/// Scalars that need special interpretation carry a datatype.
enum class Datatype : std::uint8_t {
    timestamp,  ///< Milliseconds since epoch.
    counter,    ///< A counter's current value.
};

/// Convert a Datatype to its string representation.
constexpr auto to_string_view(Datatype type) noexcept -> std::string_view {
    switch (type) {
        case Datatype::timestamp: return "timestamp";
        case Datatype::counter:   return "counter";
    }
    return "unknown";
}

/// A closed set of primitive values.
///
/// Alternatives: Null, bool, int64_t, uint64_t, double, string.
/// Timestamps and counters travel as an int64_t plus a Datatype.
using ScalarValue = std::variant<
    Null,
    bool,
    std::int64_t,
    std::uint64_t,
    double,
    std::string
>;

// -- Input values -------------------------------------------------------------

struct InputValue;

/// A brand-new map to be created, with its initial entries.
struct NestedMap {
    std::vector<std::pair<std::string, InputValue>> entries;

    NestedMap() = default;
    NestedMap(std::initializer_list<std::pair<std::string_view, InputValue>> e);
};

/// A brand-new list to be created, with its initial elements.
struct NestedList {
    std::vector<InputValue> values;

    NestedList() = default;
    NestedList(std::initializer_list<InputValue> v);
};

/// A brand-new text object to be created from a UTF-8 string.
struct NestedText {
    std::string text;
};

/// A brand-new table. Only empty tables can be assigned.
struct NestedTable {
    std::vector<NestedMap> rows;
};

/// A reference to an object that already exists in the document.
struct ExistingRef {
    ObjectId object_id;
};

/// A value the caller wants to write.
///
/// The alternatives are exhaustive: the mutation context matches on
/// them instead of testing runtime shapes. A default-constructed
/// InputValue holds no value (`std::monostate`) and is rejected.
struct InputValue {
    using variant_type = std::variant<
        std::monostate,
        ScalarValue,
        Timestamp,
        Counter,
        NestedMap,
        NestedList,
        NestedText,
        NestedTable,
        ExistingRef
    >;

    variant_type inner;

    InputValue() = default;
    InputValue(ScalarValue v) : inner{std::move(v)} {}
    InputValue(Null v) : inner{ScalarValue{v}} {}
    InputValue(bool v) : inner{ScalarValue{v}} {}
    InputValue(int v) : inner{ScalarValue{static_cast<std::int64_t>(v)}} {}
    InputValue(std::int64_t v) : inner{ScalarValue{v}} {}
    InputValue(std::uint64_t v) : inner{ScalarValue{v}} {}
    InputValue(double v) : inner{ScalarValue{v}} {}
    InputValue(std::string v) : inner{ScalarValue{std::move(v)}} {}
    InputValue(std::string_view v) : inner{ScalarValue{std::string{v}}} {}
    InputValue(const char* v) : inner{ScalarValue{std::string{v}}} {}
    InputValue(Timestamp v) : inner{v} {}
    InputValue(Counter v) : inner{v} {}
    InputValue(NestedMap v) : inner{std::move(v)} {}
    InputValue(NestedList v) : inner{std::move(v)} {}
    InputValue(NestedText v) : inner{std::move(v)} {}
    InputValue(NestedTable v) : inner{std::move(v)} {}
    InputValue(ExistingRef v) : inner{v} {}

    /// True if this value creates a new container object.
    auto is_nested_object() const -> bool {
        return std::holds_alternative<NestedMap>(inner)
            || std::holds_alternative<NestedList>(inner)
            || std::holds_alternative<NestedText>(inner)
            || std::holds_alternative<NestedTable>(inner);
    }
};

inline NestedMap::NestedMap(std::initializer_list<std::pair<std::string_view, InputValue>> e) {
    entries.reserve(e.size());
    for (const auto& [k, v] : e) entries.emplace_back(std::string{k}, v);
}

inline NestedList::NestedList(std::initializer_list<InputValue> v) : values(v) {}

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& s) { ... },
///     [](std::int64_t i) { ... },
///     [](const auto&) { ... },
/// }, some_variant);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace replidoc_cpp
