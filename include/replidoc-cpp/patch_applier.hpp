/// @file patch_applier.hpp
/// @brief Reference patch-application callback.

#pragma once

#include <replidoc-cpp/object_store.hpp>
#include <replidoc-cpp/patch.hpp>

namespace replidoc_cpp {

/// Apply a root patch diff to the overlay of `store`.
///
/// Matches the ApplyPatchFn signature and is the callback a Context uses
/// when none is given. Every object node is created in the overlay if it
/// does not exist yet (with the node's type) or copied on write; its
/// edits are applied in order; each props key's conflict set is replaced
/// by the writer -> value mapping of the patch. Nested object nodes are
/// applied recursively and stored as references.
///
/// @throws MutationError invalid_index for an edit or list key outside
///   the sequence.
void apply_patch(const ObjectDiff& diff, const ObjectState& root, ObjectStore& store);

/// Apply one object node and its subtree.
void apply_object_diff(const ObjectDiff& diff, ObjectStore& store);

/// The stored form of a patch value.
auto to_stored_value(const Diff& diff) -> StoredValue;

}  // namespace replidoc_cpp
