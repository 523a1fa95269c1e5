/// @file document.hpp
/// @brief The Document class: a single replica driving mutation batches.

#pragma once

#include <replidoc-cpp/change.hpp>
#include <replidoc-cpp/context.hpp>
#include <replidoc-cpp/object_store.hpp>
#include <replidoc-cpp/patch.hpp>
#include <replidoc-cpp/types.hpp>
#include <replidoc-cpp/value.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace replidoc_cpp {

/// A replica of a document: committed state, op log and clock.
///
/// Document owns an immutable snapshot of the materialized objects. Every
/// mutation runs as a batch through transact(): the batch function gets a
/// Context over a fresh overlay of the current snapshot, and the overlay
/// is committed (and the batch's ops appended to the log as one Change)
/// only when the function returns. If the function throws, the snapshot
/// and the log are left exactly as they were.
///
/// @code
/// auto doc = Document{};
/// doc.transact([](Context& ctx) {
///     ctx.set_map_key({}, "greeting", "hello");
/// });
/// auto val = doc.get(root_id, "greeting");
/// @endcode
class Document {
public:
    /// Construct an empty document with a random actor ID.
    Document();

    /// Construct an empty document for `actor`.
    explicit Document(ActorId actor);

    /// Construct over an existing snapshot. A null snapshot is treated
    /// as an empty document.
    Document(ActorId actor, std::shared_ptr<const ObjectCache> snapshot);

    /// Copy a document. Snapshots are immutable and shared; the log is copied.
    Document(const Document& other);
    auto operator=(const Document&) -> Document& = delete;

    // -- Identity and configuration -------------------------------------------

    auto actor_id() const -> ActorId;

    /// Set the actor ID used by subsequent batches.
    void set_actor_id(ActorId id);

    /// Set the generator for ids of objects created by subsequent batches.
    /// An empty generator restores random ids.
    void set_id_generator(ObjectIdGenerator generator);

    // -- Mutation -------------------------------------------------------------

    /// Run `fn` as one mutation batch.
    ///
    /// @param fn Receives the batch's Context.
    /// @param message Optional commit message stored with the change.
    void transact(const std::function<void(Context&)>& fn,
                  std::optional<std::string> message = std::nullopt);

    /// Run a batch and return the function's result.
    ///
    /// @code
    /// auto n = doc.transact([](Context& ctx) {
    ///     ctx.set_map_key({}, "a", 1);
    ///     return ctx.ops().size();
    /// });
    /// @endcode
    template <typename Fn>
        requires std::invocable<Fn, Context&> &&
                 (!std::is_void_v<std::invoke_result_t<Fn, Context&>>)
    auto transact(Fn&& fn) -> std::invoke_result_t<Fn, Context&> {
        auto result = std::optional<std::invoke_result_t<Fn, Context&>>{};
        transact([&](Context& ctx) { result.emplace(fn(ctx)); });
        return std::move(*result);
    }

    /// Run a batch and return the patches it applied, one per top-level
    /// mutation call, in order.
    auto transact_with_patches(const std::function<void(Context&)>& fn) -> std::vector<Patch>;

    // -- Reading --------------------------------------------------------------

    /// The winning value at a map key or table row, or nullopt.
    auto get(const ObjectId& obj, std::string_view key) const -> std::optional<StoredValue>;

    /// The winning value at a list or text index, or nullopt.
    auto get(const ObjectId& obj, std::size_t index) const -> std::optional<StoredValue>;

    /// Every value at a map key or list index, by writer.
    auto get_all(const ObjectId& obj, const Key& key) const -> ConflictSet;

    /// Map keys or table row ids, sorted.
    auto keys(const ObjectId& obj) const -> std::vector<std::string>;

    /// Number of entries, elements or rows; 0 for an unknown object.
    auto length(const ObjectId& obj) const -> std::size_t;

    /// The concatenated winning characters of a text object.
    auto text(const ObjectId& obj) const -> std::string;

    /// The type of an object, or nullopt if it doesn't exist.
    auto object_type(const ObjectId& obj) const -> std::optional<ObjType>;

    /// The current committed snapshot.
    auto snapshot() const -> std::shared_ptr<const ObjectCache>;

    // -- History --------------------------------------------------------------

    /// Every committed change, oldest first.
    auto op_log() const -> std::vector<Change>;

    /// The highest sequence number committed per actor.
    auto clock() const -> std::map<ActorId, std::uint64_t>;

    /// Copy this document under a new random actor ID.
    auto fork() const -> Document;

private:
    void run_batch(const std::function<void(Context&)>& fn, const ApplyPatchFn& apply,
                   std::optional<std::string> message);
    auto find_object(const ObjectId& obj) const -> const ObjectState*;

    mutable std::shared_mutex mutex_;
    ActorId actor_;
    ObjectIdGenerator id_generator_;
    std::shared_ptr<const ObjectCache> snapshot_;
    std::vector<Change> log_;
    std::map<ActorId, std::uint64_t> clock_;
    std::uint64_t next_op_{1};
};

}  // namespace replidoc_cpp
