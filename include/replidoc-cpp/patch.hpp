/// @file patch.hpp
/// @brief Diff and patch types describing the state touched by a mutation.

#pragma once

#include <replidoc-cpp/types.hpp>
#include <replidoc-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace replidoc_cpp {

/// Positional edit kinds for list and text objects.
enum class EditAction : std::uint8_t {
    insert,  ///< A new slot exists at the index; the paired props entry fills it.
    remove,  ///< The slot at the index is gone.
};

/// Convert an EditAction to its string representation.
constexpr auto to_string_view(EditAction action) noexcept -> std::string_view {
    switch (action) {
        case EditAction::insert: return "insert";
        case EditAction::remove: return "remove";
    }
    return "unknown";
}

/// One positional edit of a sequence. Edits apply in order.
struct Edit {
    EditAction action;
    std::size_t index;
    auto operator==(const Edit&) const -> bool = default;
};

/// A primitive value as it appears in a patch.
struct ValueDiff {
    ScalarValue value;                  ///< The primitive.
    std::optional<Datatype> datatype{}; ///< Set for timestamps and counters.
    auto operator==(const ValueDiff&) const -> bool = default;
};

struct ObjectDiff;

/// Either a primitive value or a (shared, mutable) nested object node.
///
/// Object nodes are shared so that path resolution can hand out a node
/// and have later writes land in the enclosing patch tree.
using Diff = std::variant<ValueDiff, std::shared_ptr<ObjectDiff>>;

/// All live values at one key, by writer. More than one entry is a conflict.
using ConflictDiffs = std::map<WriterId, Diff>;

/// Per-key conflict sets of an object node.
using Props = std::map<std::string, ConflictDiffs>;

/// Describes the touched part of one container object.
///
/// `edits` is present for sequence types whose slots changed. `props`
/// maps each touched key (list indexes in decimal) to its conflict set.
struct ObjectDiff {
    ObjectId object_id;
    ObjType type;
    std::optional<std::vector<Edit>> edits{};
    std::optional<Props> props{};
};

/// Create a shared object node.
inline auto make_object_diff(ObjectId id, ObjType type,
                             std::optional<std::vector<Edit>> edits = std::nullopt,
                             std::optional<Props> props = std::nullopt)
    -> std::shared_ptr<ObjectDiff> {
    return std::make_shared<ObjectDiff>(ObjectDiff{
        .object_id = id,
        .type = type,
        .edits = std::move(edits),
        .props = std::move(props),
    });
}

/// Return the object node of a Diff, or nullptr for a primitive.
inline auto as_object(const Diff& diff) -> ObjectDiff* {
    if (const auto* p = std::get_if<std::shared_ptr<ObjectDiff>>(&diff)) {
        return p->get();
    }
    return nullptr;
}

/// Return the primitive of a Diff, or nullptr for an object node.
inline auto as_value(const Diff& diff) -> const ValueDiff* {
    return std::get_if<ValueDiff>(&diff);
}

/// Structural (deep) equality of two diffs.
auto equivalent(const Diff& a, const Diff& b) -> bool;

/// Structural (deep) equality of two object nodes.
auto equivalent(const ObjectDiff& a, const ObjectDiff& b) -> bool;

/// A patch: the diff tree produced by one top-level mutation call.
struct Patch {
    std::map<ActorId, std::uint64_t> clock;  ///< Operation counts per actor.
    std::uint64_t version{0};                ///< Document version the patch leads to.
    std::shared_ptr<ObjectDiff> diffs;       ///< Rooted at root_id, type map.
};

}  // namespace replidoc_cpp
