/// @file context.hpp
/// @brief The mutation context: turns local edits into ops and patches.

#pragma once

#include <replidoc-cpp/error.hpp>
#include <replidoc-cpp/object_store.hpp>
#include <replidoc-cpp/op.hpp>
#include <replidoc-cpp/patch.hpp>
#include <replidoc-cpp/types.hpp>
#include <replidoc-cpp/value.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace replidoc_cpp {

/// One step of a path from the root: the key followed, and the object
/// expected to be found there. The object id disambiguates between
/// conflicting container values at the same key.
struct PathElement {
    Key key;
    ObjectId object_id;
    auto operator==(const PathElement&) const -> bool = default;
};

/// A path from the document root to a nested object.
using Path = std::vector<PathElement>;

/// The patch-application callback.
///
/// Receives the root diff of a completed patch, the root object as the
/// batch currently sees it, and the batch's store, whose overlay it
/// must update to reflect the new state. Invoked exactly once per
/// top-level mutation call; exceptions it throws propagate.
using ApplyPatchFn = std::function<void(const ObjectDiff&, const ObjectState&, ObjectStore&)>;

/// Construction options for a Context.
struct ContextOptions {
    ActorId actor{};                   ///< The local writer.
    ObjectIdGenerator id_generator{};  ///< Fresh object ids; random if empty.
};

/// Records local mutations of one batch.
///
/// A Context owns the operation list of one mutation batch and works
/// against the batch's ObjectStore. Each top-level call (set_map_key,
/// insert_list_items on a path) builds its ops and its patch privately,
/// invokes the patch-application callback once, and only then publishes
/// the ops. A call that throws leaves no ops behind and never invokes
/// the callback with a partial patch.
///
/// @code
/// auto store = ObjectStore{cache};
/// auto ctx = Context{{.actor = me}, store, apply_patch};
/// ctx.set_map_key({}, "todo", NestedList{"a", "b"});
/// auto ops = ctx.take_ops();
/// @endcode
class Context {
public:
    /// Construct over `store`, which must outlive the context.
    Context(ContextOptions options, ObjectStore& store, ApplyPatchFn apply_patch);

    Context(const Context&) = delete;
    auto operator=(const Context&) -> Context& = delete;

    // -- Top-level mutations --------------------------------------------------

    /// Set `key` of the map at `path` (root if empty) to `value`.
    ///
    /// Does nothing if `value` equals the single value currently at
    /// `key` and no conflict exists there.
    /// @throws MutationError invalid_key, counter_overwrite, or any
    ///   fault raised while writing the value or resolving the path.
    void set_map_key(const Path& path, std::string_view key, const InputValue& value);

    /// Insert `values` into the list or text object at `path`, starting
    /// at `index`.
    /// @throws MutationError invalid_index if `index` exceeds the length.
    void insert_list_items(const Path& path, std::size_t index,
                           const std::vector<InputValue>& values);

    // -- Building blocks ------------------------------------------------------
    //
    // Each building block is all-or-nothing: if it throws, none of the ops
    // it recorded are published and the subpatch it was given is unchanged.

    /// Record an assignment of `value` to `key` of object `obj`, inserting a
    /// new list slot first if `insert` is set. Returns the value's diff.
    auto set_value(const ObjectId& obj, const Key& key, const InputValue& value,
                   bool insert = false) -> Diff;

    /// Create `value` (a nested map, list, text or table) as a new object
    /// assigned to `key` of `obj`. Without a key, the new object's own id
    /// is used as key (table rows).
    auto create_nested_objects(const ObjectId& obj, std::optional<Key> key,
                               const InputValue& value, bool insert = false)
        -> std::shared_ptr<ObjectDiff>;

    /// Insert `values` into the sequence described by `subpatch` at
    /// `index`. `new_object` is set when the sequence is being created
    /// in this call and has no materialized state yet.
    void insert_list_items(ObjectDiff& subpatch, std::size_t index,
                           const std::vector<InputValue>& values, bool new_object);

    /// Describe an existing materialized value the way patches do.
    auto get_value_description(const StoredValue& value) const -> Diff;

    /// The type of an object. The root is always a map.
    auto get_object_type(const ObjectId& id) const -> ObjType;

    /// Look up an object in the batch's store.
    auto get_object(const ObjectId& id) const -> const ObjectState&;

    // -- Path resolution ------------------------------------------------------

    /// Build a patch, pass the subpatch at `path` to `fn`, then apply the
    /// patch through the callback.
    void apply_at(const Path& path, const std::function<void(ObjectDiff&)>& fn);

    /// Walk `path` inside `patch`, creating nodes as needed, and return the
    /// node for the last path element (or the root node).
    auto get_subpatch(Patch& patch, const Path& path) const -> ObjectDiff&;

    /// The value at `key` of `object` written by `writer`.
    auto get_property_value(const ObjectState& object, const std::string& key,
                            const WriterId& writer) const -> const StoredValue&;

    /// Descriptions of all values at `key` of `object`, by writer.
    auto get_values_descriptions(const Path& path, const ObjectState& object,
                                 const std::string& key) const -> ConflictDiffs;

    // -- Accessors ------------------------------------------------------------

    /// The ops recorded so far in this batch, in order. Ops of a top-level
    /// call appear only after the call completed.
    auto ops() const -> const std::vector<Op>& { return ops_; }

    /// Hand the published ops to the log sink, leaving none behind.
    auto take_ops() -> std::vector<Op>;

    /// True once any op has been published.
    auto updated() const -> bool { return !ops_.empty(); }

    auto actor() const -> const ActorId& { return actor_; }

    /// The writer id local writes are attributed to.
    auto local_writer() const -> const WriterId& { return writer_; }

    auto store() const -> const ObjectStore& { return store_; }

private:
    class CallScope;

    void add_op(Op op);
    void check_key(const Key& key) const;
    auto next_object_id() -> ObjectId;
    auto emit_set(const ObjectId& obj, const Key& key, bool insert, ValueDiff description)
        -> Diff;
    [[noreturn]] void fail(ErrorKind kind, std::string message) const;

    ActorId actor_;
    WriterId writer_;
    ObjectIdGenerator id_generator_;
    ObjectStore& store_;
    ApplyPatchFn apply_patch_;
    std::vector<Op> ops_;
    std::vector<Op> pending_;
    std::set<ObjectId> issued_ids_;
    bool in_call_{false};
};

}  // namespace replidoc_cpp
