/// @file change.hpp
/// @brief Change type: the operations of one committed mutation batch.

#pragma once

#include <replidoc-cpp/op.hpp>
#include <replidoc-cpp/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace replidoc_cpp {

/// The ordered operations one actor committed in one mutation batch.
///
/// Changes are what the operation log sink receives: they are appended
/// to the replica's log and later exchanged with other replicas.
struct Change {
    ActorId actor;                       ///< The actor that authored this change.
    std::uint64_t seq{0};                ///< Sequence number (per-actor, 1-based).
    std::uint64_t start_op{0};           ///< Log position of the first operation.
    std::optional<std::string> message;  ///< Optional human-readable commit message.
    std::vector<Op> operations;          ///< The operations, in emission order.

    auto operator==(const Change&) const -> bool = default;
};

}  // namespace replidoc_cpp
