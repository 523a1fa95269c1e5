/// @file object_store.hpp
/// @brief Materialized objects and the layered (base cache + overlay) store.

#pragma once

#include <replidoc-cpp/types.hpp>
#include <replidoc-cpp/value.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace replidoc_cpp {

/// A reference from a property to a nested container object.
struct ObjectRef {
    ObjectId id;
    auto operator==(const ObjectRef&) const -> bool = default;
};

/// A materialized property value.
///
/// `std::monostate` marks a slot that holds no value yet (a freshly
/// inserted list slot whose value has not been applied).
using StoredValue = std::variant<
    std::monostate,
    ScalarValue,
    Timestamp,
    Counter,
    ObjectRef
>;

/// All live values at one key, by writer.
using ConflictSet = std::map<WriterId, StoredValue>;

/// The materialized state of one container object.
///
/// The type tag is stored explicitly; it is never inferred from the
/// shape of the contents.
struct ObjectState {
    ObjectId id;
    ObjType type{ObjType::map};
    std::map<std::string, ConflictSet> map_entries;  // map
    std::vector<ConflictSet> list_elements;          // list/text
    std::map<std::string, StoredValue> table_rows;   // table, keyed by row id

    /// Number of keys (map), elements (list/text) or rows (table).
    auto length() const -> std::size_t;

    /// The conflict set at `key`, or nullptr if the key holds nothing.
    ///
    /// List and text objects are addressed by decimal index. Tables
    /// carry no conflict sets and always return nullptr.
    auto conflicts_at(const std::string& key) const -> const ConflictSet*;
    auto conflicts_at(const std::string& key) -> ConflictSet*;

    auto operator==(const ObjectState&) const -> bool = default;
};

/// The winning value of a conflict set: the entry of the highest writer.
auto winner(const ConflictSet& conflicts) -> const StoredValue*;

/// An immutable snapshot of materialized objects, shared by readers.
using ObjectCache = std::map<ObjectId, ObjectState>;

/// Create a cache holding only the (empty) root map.
auto make_cache() -> std::shared_ptr<const ObjectCache>;

/// Layered lookup of materialized objects.
///
/// Reads consult the mutable overlay first and fall back to the shared,
/// immutable base cache. Writes always land in the overlay: an object
/// is copied from the base the first time it is touched. This lets a
/// mutation batch see its own uncommitted writes (e.g. a list created
/// earlier in the same batch) without touching committed state.
///
/// A store belongs to exactly one mutation batch.
class ObjectStore {
public:
    /// Construct over `base`. A null base is treated as an empty document.
    explicit ObjectStore(std::shared_ptr<const ObjectCache> base = nullptr);

    /// Look up an object, overlay first. Returns nullptr if absent.
    auto find(const ObjectId& id) const -> const ObjectState*;

    /// Check whether either layer holds `id`.
    auto contains(const ObjectId& id) const -> bool { return find(id) != nullptr; }

    /// Look up an object, overlay first.
    /// @throws MutationError (missing_object) if neither layer has it.
    auto get_object(const ObjectId& id) const -> const ObjectState&;

    /// Get a writable copy of an object in the overlay.
    /// @throws MutationError (missing_object) if neither layer has it.
    auto mutable_object(const ObjectId& id) -> ObjectState&;

    /// Create an empty object of `type` in the overlay.
    auto create_object(const ObjectId& id, ObjType type) -> ObjectState&;

    /// The objects touched in this batch.
    auto overlay() const -> const ObjectCache& { return overlay_; }

    /// The committed snapshot this batch started from.
    auto base() const -> const std::shared_ptr<const ObjectCache>& { return base_; }

    /// Produce a new immutable snapshot with the overlay merged in.
    /// The store itself is left unchanged.
    auto commit() const -> std::shared_ptr<const ObjectCache>;

private:
    std::shared_ptr<const ObjectCache> base_;
    ObjectCache overlay_;
};

}  // namespace replidoc_cpp
