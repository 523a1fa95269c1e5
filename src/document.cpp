#include <replidoc-cpp/document.hpp>
#include <replidoc-cpp/logger.hpp>
#include <replidoc-cpp/patch_applier.hpp>

#include <mutex>

namespace replidoc_cpp {

Document::Document()
    : Document{random_actor_id()} {}

Document::Document(ActorId actor)
    : Document{actor, nullptr} {}

Document::Document(ActorId actor, std::shared_ptr<const ObjectCache> snapshot)
    : actor_{actor},
      snapshot_{snapshot ? std::move(snapshot) : make_cache()} {}

Document::Document(const Document& other) {
    auto lock = std::shared_lock{other.mutex_};
    actor_ = other.actor_;
    id_generator_ = other.id_generator_;
    snapshot_ = other.snapshot_;
    log_ = other.log_;
    clock_ = other.clock_;
    next_op_ = other.next_op_;
}

auto Document::actor_id() const -> ActorId {
    auto lock = std::shared_lock{mutex_};
    return actor_;
}

void Document::set_actor_id(ActorId id) {
    auto lock = std::unique_lock{mutex_};
    actor_ = id;
}

void Document::set_id_generator(ObjectIdGenerator generator) {
    auto lock = std::unique_lock{mutex_};
    id_generator_ = std::move(generator);
}

// -- Mutation -----------------------------------------------------------------

void Document::run_batch(const std::function<void(Context&)>& fn, const ApplyPatchFn& apply,
                         std::optional<std::string> message) {
    auto store = ObjectStore{snapshot_};
    auto ctx = Context{ContextOptions{.actor = actor_, .id_generator = id_generator_},
                       store, apply};
    fn(ctx);

    auto ops = ctx.take_ops();
    if (ops.empty()) {
        REPLIDOC_DEBUG("batch by {} recorded no ops", to_string(actor_));
        return;
    }

    auto next = store.commit();
    const auto seq = clock_[actor_] + 1;
    const auto count = ops.size();
    log_.push_back(Change{
        .actor = actor_,
        .seq = seq,
        .start_op = next_op_,
        .message = std::move(message),
        .operations = std::move(ops),
    });
    clock_[actor_] = seq;
    next_op_ += count;
    snapshot_ = std::move(next);
    REPLIDOC_DEBUG("committed change {} by {} with {} ops", seq, to_string(actor_), count);
}

void Document::transact(const std::function<void(Context&)>& fn,
                        std::optional<std::string> message) {
    auto lock = std::unique_lock{mutex_};
    run_batch(fn, apply_patch, std::move(message));
}

auto Document::transact_with_patches(const std::function<void(Context&)>& fn)
    -> std::vector<Patch> {
    auto lock = std::unique_lock{mutex_};
    auto patches = std::vector<Patch>{};
    auto recording = [&patches](const ObjectDiff& diff, const ObjectState& root,
                                ObjectStore& store) {
        apply_patch(diff, root, store);
        patches.push_back(Patch{.diffs = std::make_shared<ObjectDiff>(diff)});
    };
    run_batch(fn, recording, std::nullopt);
    for (auto& patch : patches) {
        patch.clock = clock_;
        patch.version = log_.size();
    }
    return patches;
}

// -- Reading ------------------------------------------------------------------

auto Document::find_object(const ObjectId& obj) const -> const ObjectState* {
    auto it = snapshot_->find(obj);
    return it == snapshot_->end() ? nullptr : &it->second;
}

auto Document::get(const ObjectId& obj, std::string_view key) const
    -> std::optional<StoredValue> {
    auto lock = std::shared_lock{mutex_};
    const auto* object = find_object(obj);
    if (!object) return std::nullopt;
    const auto k = std::string{key};
    if (object->type == ObjType::table) {
        auto it = object->table_rows.find(k);
        if (it == object->table_rows.end()) return std::nullopt;
        return it->second;
    }
    const auto* conflicts = object->conflicts_at(k);
    if (!conflicts) return std::nullopt;
    const auto* win = winner(*conflicts);
    if (!win) return std::nullopt;
    return *win;
}

auto Document::get(const ObjectId& obj, std::size_t index) const -> std::optional<StoredValue> {
    auto lock = std::shared_lock{mutex_};
    const auto* object = find_object(obj);
    if (!object || index >= object->list_elements.size()) return std::nullopt;
    const auto* win = winner(object->list_elements[index]);
    if (!win) return std::nullopt;
    return *win;
}

auto Document::get_all(const ObjectId& obj, const Key& key) const -> ConflictSet {
    auto lock = std::shared_lock{mutex_};
    const auto* object = find_object(obj);
    if (!object) return {};
    const auto k = to_string(key);
    if (object->type == ObjType::table) {
        auto it = object->table_rows.find(k);
        if (it == object->table_rows.end()) return {};
        return ConflictSet{{k, it->second}};
    }
    const auto* conflicts = object->conflicts_at(k);
    return conflicts ? *conflicts : ConflictSet{};
}

auto Document::keys(const ObjectId& obj) const -> std::vector<std::string> {
    auto lock = std::shared_lock{mutex_};
    const auto* object = find_object(obj);
    auto result = std::vector<std::string>{};
    if (!object) return result;
    for (const auto& [key, conflicts] : object->map_entries) result.push_back(key);
    for (const auto& [row_id, row] : object->table_rows) result.push_back(row_id);
    return result;
}

auto Document::length(const ObjectId& obj) const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    const auto* object = find_object(obj);
    return object ? object->length() : 0;
}

auto Document::text(const ObjectId& obj) const -> std::string {
    auto lock = std::shared_lock{mutex_};
    const auto* object = find_object(obj);
    auto result = std::string{};
    if (!object || object->type != ObjType::text) return result;
    for (const auto& conflicts : object->list_elements) {
        const auto* win = winner(conflicts);
        if (!win) continue;
        if (const auto* scalar = std::get_if<ScalarValue>(win)) {
            if (const auto* s = std::get_if<std::string>(scalar)) result += *s;
        }
    }
    return result;
}

auto Document::object_type(const ObjectId& obj) const -> std::optional<ObjType> {
    auto lock = std::shared_lock{mutex_};
    const auto* object = find_object(obj);
    if (!object) return std::nullopt;
    return object->type;
}

auto Document::snapshot() const -> std::shared_ptr<const ObjectCache> {
    auto lock = std::shared_lock{mutex_};
    return snapshot_;
}

// -- History ------------------------------------------------------------------

auto Document::op_log() const -> std::vector<Change> {
    auto lock = std::shared_lock{mutex_};
    return log_;
}

auto Document::clock() const -> std::map<ActorId, std::uint64_t> {
    auto lock = std::shared_lock{mutex_};
    return clock_;
}

auto Document::fork() const -> Document {
    auto copy = Document{*this};
    copy.set_actor_id(random_actor_id());
    return copy;
}

}  // namespace replidoc_cpp
