/// @file json.hpp
/// @brief nlohmann/json descriptions of ops, diffs, patches and objects.
///
/// These are human-readable descriptions used by logging, tests and
/// tooling. They are not a persistence format.

#pragma once

#include <replidoc-cpp/change.hpp>
#include <replidoc-cpp/object_store.hpp>
#include <replidoc-cpp/op.hpp>
#include <replidoc-cpp/patch.hpp>
#include <replidoc-cpp/types.hpp>
#include <replidoc-cpp/value.hpp>

#include <nlohmann/json.hpp>

namespace replidoc_cpp {

class Document;

// -- Identity and scalar types ------------------------------------------------

void to_json(nlohmann::json& j, const ActorId& id);
void to_json(nlohmann::json& j, const ObjectId& id);
void to_json(nlohmann::json& j, Null);

/// Keys render as a JSON string (map key) or number (list index).
auto key_to_json(const Key& key) -> nlohmann::json;

/// Scalars render as the natural JSON value.
auto scalar_to_json(const ScalarValue& value) -> nlohmann::json;

// -- Log and patch types ------------------------------------------------------

void to_json(nlohmann::json& j, const Op& op);
void to_json(nlohmann::json& j, const Change& change);
void to_json(nlohmann::json& j, const Edit& edit);
void to_json(nlohmann::json& j, const ValueDiff& diff);
void to_json(nlohmann::json& j, const ObjectDiff& diff);
void to_json(nlohmann::json& j, const Patch& patch);

/// A Diff renders as its ValueDiff or ObjectDiff description.
auto diff_to_json(const Diff& diff) -> nlohmann::json;

// -- Materialized state -------------------------------------------------------

/// A stored value: scalars as-is, timestamps and counters tagged with
/// their datatype, references as `{"objectId": ...}`.
auto stored_to_json(const StoredValue& value) -> nlohmann::json;

/// An object with every conflict set spelled out.
void to_json(nlohmann::json& j, const ObjectState& object);

/// Export the materialized subtree at `obj` using winning values only.
///
/// Maps and tables become JSON objects, lists become arrays, text
/// becomes a string. Timestamps and counters become plain numbers.
/// @throws MutationError (missing_object) for a dangling reference.
auto export_json(const ObjectCache& cache, const ObjectId& obj = root_id) -> nlohmann::json;

/// Export a document's committed state.
auto export_json(const Document& doc, const ObjectId& obj = root_id) -> nlohmann::json;

}  // namespace replidoc_cpp
