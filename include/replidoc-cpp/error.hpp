/// @file error.hpp
/// @brief Error types for the replidoc-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace replidoc_cpp {

/// Categories of faults a mutation can raise.
///
/// All of them abort the current mutation call; none are retried.
enum class ErrorKind : std::uint8_t {
    missing_object,              ///< Object id found in neither overlay nor base cache.
    invalid_key,                 ///< Empty string key for a map entry.
    invalid_index,               ///< List insertion index outside [0, length].
    aliased_object,              ///< A new nested value refers to an existing object.
    non_empty_table_assignment,  ///< Assigning a pre-populated table.
    counter_overwrite,           ///< Assigning to a key that holds a counter.
    unsupported_value_shape,     ///< A value matches none of the recognized shapes.
    stale_path,                  ///< A path step's object id is not live at its key.
    untracked_conflict_set,      ///< A key has no conflict-tracking entries.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::missing_object:             return "missing_object";
        case ErrorKind::invalid_key:                return "invalid_key";
        case ErrorKind::invalid_index:              return "invalid_index";
        case ErrorKind::aliased_object:             return "aliased_object";
        case ErrorKind::non_empty_table_assignment: return "non_empty_table_assignment";
        case ErrorKind::counter_overwrite:          return "counter_overwrite";
        case ErrorKind::unsupported_value_shape:    return "unsupported_value_shape";
        case ErrorKind::stale_path:                 return "stale_path";
        case ErrorKind::untracked_conflict_set:     return "untracked_conflict_set";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// The exception thrown for every mutation fault.
class MutationError : public std::runtime_error {
public:
    explicit MutationError(Error error)
        : std::runtime_error{error.message}, error_{std::move(error)} {}

    MutationError(ErrorKind kind, std::string message)
        : MutationError{Error{kind, std::move(message)}} {}

    /// The category of this fault.
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

    /// The structured error value.
    auto error() const noexcept -> const Error& { return error_; }

private:
    Error error_;
};

}  // namespace replidoc_cpp
