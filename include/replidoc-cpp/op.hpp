/// @file op.hpp
/// @brief Operation types for the replicated log.

#pragma once

#include <replidoc-cpp/types.hpp>
#include <replidoc-cpp/value.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace replidoc_cpp {

/// The kind of mutation an operation represents.
enum class OpAction : std::uint8_t {
    set,         ///< Assign a primitive value at a key or index.
    make_map,    ///< Create a nested map.
    make_list,   ///< Create a nested list.
    make_text,   ///< Create a nested text object.
    make_table,  ///< Create a nested table.
};

/// Convert an OpAction to its string representation.
constexpr auto to_string_view(OpAction action) noexcept -> std::string_view {
    switch (action) {
        case OpAction::set:        return "set";
        case OpAction::make_map:   return "makeMap";
        case OpAction::make_list:  return "makeList";
        case OpAction::make_text:  return "makeText";
        case OpAction::make_table: return "makeTable";
    }
    return "unknown";
}

/// The container-creating action for an object type.
constexpr auto make_action(ObjType type) noexcept -> OpAction {
    switch (type) {
        case ObjType::map:   return OpAction::make_map;
        case ObjType::list:  return OpAction::make_list;
        case ObjType::text:  return OpAction::make_text;
        case ObjType::table: return OpAction::make_table;
    }
    return OpAction::make_map;
}

/// A single operation destined for the replicated log.
///
/// Targets object `obj` at `key`. `insert` means a new slot is created
/// at index `key` before it is assigned. `value` and `datatype` are set
/// only for OpAction::set; `child` only for container-creating actions,
/// and then names an object id that never appeared before.
struct Op {
    OpAction action;                    ///< The type of mutation.
    ObjectId obj;                       ///< The object this operation targets.
    Key key;                            ///< The map key or list index.
    bool insert{false};                 ///< Create a new list slot at `key`.
    std::optional<ScalarValue> value{}; ///< The primitive being set.
    std::optional<Datatype> datatype{}; ///< Interpretation of `value`, if special.
    std::optional<ObjectId> child{};    ///< The newly created object.

    auto operator==(const Op&) const -> bool = default;
};

}  // namespace replidoc_cpp
