#include <replidoc-cpp/context.hpp>
#include <replidoc-cpp/json.hpp>
#include <replidoc-cpp/logger.hpp>
#include <replidoc-cpp/patch_applier.hpp>

#include <algorithm>
#include <iterator>
#include <utility>
#include <variant>

namespace replidoc_cpp {

namespace {

// Timestamps, counters and plain scalars are described identically
// whether they are being written or re-described from the store.

auto describe(const ScalarValue& value) -> ValueDiff {
    return ValueDiff{.value = value, .datatype = std::nullopt};
}

auto describe(Timestamp value) -> ValueDiff {
    return ValueDiff{.value = ScalarValue{value.millis_since_epoch},
                     .datatype = Datatype::timestamp};
}

auto describe(Counter value) -> ValueDiff {
    return ValueDiff{.value = ScalarValue{value.value}, .datatype = Datatype::counter};
}

auto describe(const Path& path) -> std::string {
    if (path.empty()) return "/";
    auto result = std::string{};
    for (const auto& elem : path) {
        result += '/';
        result += to_string(elem.key);
    }
    return result;
}

// True if assigning `value` over `current` would not change anything.
auto same_value(const StoredValue& current, const InputValue& value) -> bool {
    if (const auto* a = std::get_if<ScalarValue>(&current)) {
        const auto* b = std::get_if<ScalarValue>(&value.inner);
        return b && *a == *b;
    }
    if (const auto* a = std::get_if<Timestamp>(&current)) {
        const auto* b = std::get_if<Timestamp>(&value.inner);
        return b && *a == *b;
    }
    return false;
}

// One element per UTF-8 code point. Malformed lead bytes stand alone.
auto split_code_points(const std::string& text) -> std::vector<InputValue> {
    auto result = std::vector<InputValue>{};
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        auto len = std::size_t{1};
        if ((lead & 0xE0) == 0xC0) len = 2;
        else if ((lead & 0xF0) == 0xE0) len = 3;
        else if ((lead & 0xF8) == 0xF0) len = 4;
        len = std::min(len, text.size() - i);
        result.emplace_back(text.substr(i, len));
        i += len;
    }
    return result;
}

auto trace_enabled() -> bool {
    return logger()->should_log(spdlog::level::trace);
}

}  // namespace

// Collects the ops of one call and publishes them only when the outermost
// call completes; a call that unwinds drops them. Calls made while a scope
// is open record into that scope.
class Context::CallScope {
public:
    explicit CallScope(Context& ctx) : ctx_{ctx}, outermost_{!ctx.in_call_} {
        if (!outermost_) return;
        ctx_.pending_.clear();
        ctx_.in_call_ = true;
    }

    ~CallScope() {
        if (!outermost_) return;
        ctx_.pending_.clear();
        ctx_.in_call_ = false;
    }

    CallScope(const CallScope&) = delete;
    auto operator=(const CallScope&) -> CallScope& = delete;

    void publish() {
        if (!outermost_) return;
        ctx_.ops_.insert(ctx_.ops_.end(),
                         std::make_move_iterator(ctx_.pending_.begin()),
                         std::make_move_iterator(ctx_.pending_.end()));
        ctx_.pending_.clear();
    }

private:
    Context& ctx_;
    bool outermost_;
};

Context::Context(ContextOptions options, ObjectStore& store, ApplyPatchFn apply_patch)
    : actor_{options.actor},
      writer_{writer_id(options.actor)},
      id_generator_{options.id_generator ? std::move(options.id_generator)
                                         : ObjectIdGenerator{random_object_id}},
      store_{store},
      apply_patch_{apply_patch ? std::move(apply_patch) : ApplyPatchFn{replidoc_cpp::apply_patch}} {}

// -- Top-level mutations ------------------------------------------------------

void Context::set_map_key(const Path& path, std::string_view key, const InputValue& value) {
    check_key(map_key(std::string{key}));
    const auto object_id = path.empty() ? root_id : path.back().object_id;
    const auto& object = get_object(object_id);
    if (object.type != ObjType::map) {
        fail(ErrorKind::invalid_key,
             "Cannot set map key '" + std::string{key} + "' on a "
                 + std::string{to_string_view(object.type)} + " object");
    }

    // If the assigned value is the same as the existing value, and the
    // assignment does not resolve a conflict, do nothing.
    if (const auto* conflicts = object.conflicts_at(std::string{key})) {
        const auto holds_counter = std::ranges::any_of(*conflicts, [](const auto& entry) {
            return std::holds_alternative<Counter>(entry.second);
        });
        if (holds_counter) {
            fail(ErrorKind::counter_overwrite,
                 "Cannot overwrite the Counter at key '" + std::string{key} + "'");
        }
        if (conflicts->size() == 1 && same_value(conflicts->begin()->second, value)) {
            REPLIDOC_DEBUG("set_map_key {} key '{}': value unchanged, skipped",
                           describe(path), std::string{key});
            return;
        }
    }

    REPLIDOC_DEBUG("set_map_key {} key '{}'", describe(path), std::string{key});
    auto scope = CallScope{*this};
    apply_at(path, [&](ObjectDiff& subpatch) {
        auto value_patch = set_value(object_id, map_key(std::string{key}), value);
        (*subpatch.props)[std::string{key}] = ConflictDiffs{{writer_, std::move(value_patch)}};
    });
    scope.publish();
}

void Context::insert_list_items(const Path& path, std::size_t index,
                                const std::vector<InputValue>& values) {
    if (path.empty()) {
        fail(ErrorKind::invalid_index, "The document root is a map, not a list");
    }
    REPLIDOC_DEBUG("insert_list_items {} at {} ({} values)", describe(path), index,
                   values.size());
    auto scope = CallScope{*this};
    apply_at(path, [&](ObjectDiff& subpatch) {
        insert_list_items(subpatch, index, values, false);
    });
    scope.publish();
}

// -- Building blocks ----------------------------------------------------------

auto Context::set_value(const ObjectId& obj, const Key& key, const InputValue& value,
                        bool insert) -> Diff {
    check_key(key);
    auto scope = CallScope{*this};
    auto diff = std::visit(overload{
        [&](std::monostate) -> Diff {
            fail(ErrorKind::unsupported_value_shape, "Unsupported type of value: undefined");
        },
        [&](const ScalarValue& v) -> Diff { return emit_set(obj, key, insert, describe(v)); },
        [&](Timestamp v) -> Diff { return emit_set(obj, key, insert, describe(v)); },
        [&](Counter v) -> Diff { return emit_set(obj, key, insert, describe(v)); },
        [&](const ExistingRef& ref) -> Diff {
            fail(ErrorKind::aliased_object,
                 "Cannot create a reference to an existing document object: "
                     + to_string(ref.object_id));
        },
        [&](const NestedMap&) -> Diff { return create_nested_objects(obj, key, value, insert); },
        [&](const NestedList&) -> Diff { return create_nested_objects(obj, key, value, insert); },
        [&](const NestedText&) -> Diff { return create_nested_objects(obj, key, value, insert); },
        [&](const NestedTable&) -> Diff { return create_nested_objects(obj, key, value, insert); },
    }, value.inner);
    scope.publish();
    return diff;
}

auto Context::create_nested_objects(const ObjectId& obj, std::optional<Key> key,
                                    const InputValue& value, bool insert)
    -> std::shared_ptr<ObjectDiff> {
    if (const auto* ref = std::get_if<ExistingRef>(&value.inner)) {
        fail(ErrorKind::aliased_object,
             "Cannot create a reference to an existing document object: "
                 + to_string(ref->object_id));
    }
    if (!value.is_nested_object()) {
        fail(ErrorKind::unsupported_value_shape,
             "Only maps, lists, text and tables can be created as nested objects");
    }
    if (const auto* table = std::get_if<NestedTable>(&value.inner); table && !table->rows.empty()) {
        fail(ErrorKind::non_empty_table_assignment,
             "Assigning a non-empty Table object is not supported");
    }
    if (key) check_key(*key);

    auto scope = CallScope{*this};
    const auto child = next_object_id();
    auto op_key = key ? std::move(*key) : map_key(to_string(child));
    auto make_op = [&](ObjType type) {
        add_op(Op{
            .action = make_action(type),
            .obj = obj,
            .key = op_key,
            .insert = insert,
            .child = child,
        });
    };

    if (const auto* map = std::get_if<NestedMap>(&value.inner)) {
        make_op(ObjType::map);
        auto props = Props{};
        for (const auto& [nested, nested_value] : map->entries) {
            if (props.contains(nested)) {
                fail(ErrorKind::invalid_key, "Duplicate key '" + nested + "' in nested map");
            }
            auto value_patch = set_value(child, map_key(nested), nested_value);
            props[nested] = ConflictDiffs{{writer_, std::move(value_patch)}};
        }
        scope.publish();
        return make_object_diff(child, ObjType::map, std::nullopt, std::move(props));
    }
    if (const auto* list = std::get_if<NestedList>(&value.inner)) {
        make_op(ObjType::list);
        auto subpatch = make_object_diff(child, ObjType::list, std::vector<Edit>{}, Props{});
        insert_list_items(*subpatch, 0, list->values, true);
        scope.publish();
        return subpatch;
    }
    if (const auto* text = std::get_if<NestedText>(&value.inner)) {
        make_op(ObjType::text);
        auto subpatch = make_object_diff(child, ObjType::text, std::vector<Edit>{}, Props{});
        insert_list_items(*subpatch, 0, split_code_points(text->text), true);
        scope.publish();
        return subpatch;
    }
    make_op(ObjType::table);
    scope.publish();
    return make_object_diff(child, ObjType::table, std::nullopt, Props{});
}

void Context::insert_list_items(ObjectDiff& subpatch, std::size_t index,
                                const std::vector<InputValue>& values, bool new_object) {
    auto length = std::size_t{0};
    if (!new_object) {
        const auto& list = get_object(subpatch.object_id);
        if (list.type != ObjType::list && list.type != ObjType::text) {
            fail(ErrorKind::invalid_index,
                 "Cannot insert list items into a " + std::string{to_string_view(list.type)}
                     + " object");
        }
        length = list.length();
    }
    if (index > length) {
        fail(ErrorKind::invalid_index,
             fmt::format("List index {} is out of bounds for list of length {}", index, length));
    }

    // Edits and props are staged and written to the subpatch only once
    // every value has been recorded.
    auto scope = CallScope{*this};
    auto edits = std::vector<Edit>{};
    auto props = Props{};
    for (std::size_t offset = 0; offset < values.size(); ++offset) {
        const auto position = index + offset;
        auto value_patch = set_value(subpatch.object_id, list_index(position), values[offset], true);
        edits.push_back(Edit{.action = EditAction::insert, .index = position});
        props[std::to_string(position)] = ConflictDiffs{{writer_, std::move(value_patch)}};
    }

    if (!subpatch.edits) subpatch.edits.emplace();
    if (!subpatch.props) subpatch.props.emplace();
    subpatch.edits->insert(subpatch.edits->end(), edits.begin(), edits.end());
    for (auto& [position, conflicts] : props) {
        (*subpatch.props)[position] = std::move(conflicts);
    }
    scope.publish();
}

auto Context::get_value_description(const StoredValue& value) const -> Diff {
    return std::visit(overload{
        [&](std::monostate) -> Diff {
            fail(ErrorKind::unsupported_value_shape, "Unsupported type of value: undefined");
        },
        [](const ScalarValue& v) -> Diff { return describe(v); },
        [](Timestamp v) -> Diff { return describe(v); },
        [](Counter v) -> Diff { return describe(v); },
        [&](const ObjectRef& ref) -> Diff {
            return make_object_diff(ref.id, get_object_type(ref.id));
        },
    }, value);
}

auto Context::get_object_type(const ObjectId& id) const -> ObjType {
    if (id.is_root()) return ObjType::map;
    return get_object(id).type;
}

auto Context::get_object(const ObjectId& id) const -> const ObjectState& {
    const auto* object = store_.find(id);
    if (!object) {
        fail(ErrorKind::missing_object, "Target object does not exist: " + to_string(id));
    }
    return *object;
}

// -- Path resolution ----------------------------------------------------------

void Context::apply_at(const Path& path, const std::function<void(ObjectDiff&)>& fn) {
    auto patch = Patch{
        .clock = {},
        .version = 0,
        .diffs = make_object_diff(root_id, ObjType::map),
    };
    fn(get_subpatch(patch, path));
    if (trace_enabled()) {
        REPLIDOC_TRACE("applying patch {}", nlohmann::json(patch).dump());
    }
    apply_patch_(*patch.diffs, get_object(root_id), store_);
}

auto Context::get_subpatch(Patch& patch, const Path& path) const -> ObjectDiff& {
    auto* subpatch = patch.diffs.get();
    const auto* object = &get_object(root_id);

    for (const auto& elem : path) {
        const auto key = to_string(elem.key);
        if (!subpatch->props) subpatch->props.emplace();
        auto it = subpatch->props->find(key);
        if (it == subpatch->props->end()) {
            it = subpatch->props->emplace(key, get_values_descriptions(path, *object, key)).first;
        }

        // Several containers may live at the key (a conflict); follow the
        // one the path names.
        const WriterId* next_writer = nullptr;
        ObjectDiff* next = nullptr;
        for (const auto& [writer, diff] : it->second) {
            if (auto* candidate = as_object(diff); candidate && candidate->object_id == elem.object_id) {
                next_writer = &writer;
                next = candidate;
                break;
            }
        }
        if (!next) {
            fail(ErrorKind::stale_path,
                 "Cannot find path object with objectId " + to_string(elem.object_id)
                     + " at key '" + key + "'");
        }

        const auto& value = get_property_value(*object, key, *next_writer);
        const auto* ref = std::get_if<ObjectRef>(&value);
        if (!ref || ref->id != elem.object_id) {
            fail(ErrorKind::stale_path,
                 "Path object " + to_string(elem.object_id) + " is no longer at key '" + key + "'");
        }
        subpatch = next;
        object = &get_object(ref->id);
    }

    if (!subpatch->props) subpatch->props.emplace();
    return *subpatch;
}

auto Context::get_property_value(const ObjectState& object, const std::string& key,
                                 const WriterId& writer) const -> const StoredValue& {
    if (object.type == ObjType::table) {
        auto it = object.table_rows.find(key);
        if (it == object.table_rows.end()) {
            fail(ErrorKind::untracked_conflict_set,
                 "No row " + key + " in table " + to_string(object.id));
        }
        return it->second;
    }
    const auto* conflicts = object.conflicts_at(key);
    if (!conflicts) {
        fail(ErrorKind::untracked_conflict_set,
             "No conflict set at key '" + key + "' of object " + to_string(object.id));
    }
    auto it = conflicts->find(writer);
    if (it == conflicts->end()) {
        fail(ErrorKind::untracked_conflict_set,
             "No value by writer " + writer + " at key '" + key + "' of object "
                 + to_string(object.id));
    }
    return it->second;
}

auto Context::get_values_descriptions(const Path& path, const ObjectState& object,
                                      const std::string& key) const -> ConflictDiffs {
    auto values = ConflictDiffs{};
    if (object.type == ObjType::table) {
        // Rows are identified by their unique id, so tables have no conflicts.
        if (auto it = object.table_rows.find(key); it != object.table_rows.end()) {
            values.emplace(key, get_value_description(it->second));
        }
        return values;
    }
    const auto* conflicts = object.conflicts_at(key);
    if (!conflicts || conflicts->empty()) {
        fail(ErrorKind::untracked_conflict_set,
             "No children at key '" + key + "' of path " + describe(path));
    }
    for (const auto& [writer, value] : *conflicts) {
        values.emplace(writer, get_value_description(value));
    }
    return values;
}

// -- Accessors ----------------------------------------------------------------

auto Context::take_ops() -> std::vector<Op> {
    return std::exchange(ops_, {});
}

// -- Internals ----------------------------------------------------------------

void Context::add_op(Op op) {
    if (trace_enabled()) {
        REPLIDOC_TRACE("op {}", nlohmann::json(op).dump());
    }
    (in_call_ ? pending_ : ops_).push_back(std::move(op));
}

void Context::check_key(const Key& key) const {
    if (const auto* name = std::get_if<std::string>(&key); name && name->empty()) {
        fail(ErrorKind::invalid_key, "The key of a map entry must not be an empty string");
    }
}

// Every created object needs an id that never appeared in the document or
// earlier in this batch.
auto Context::next_object_id() -> ObjectId {
    auto child = id_generator_();
    if (child.is_root() || store_.contains(child) || issued_ids_.contains(child)) {
        fail(ErrorKind::aliased_object,
             "Generated object id is already in use: " + to_string(child));
    }
    issued_ids_.insert(child);
    return child;
}

auto Context::emit_set(const ObjectId& obj, const Key& key, bool insert, ValueDiff description)
    -> Diff {
    add_op(Op{
        .action = OpAction::set,
        .obj = obj,
        .key = key,
        .insert = insert,
        .value = description.value,
        .datatype = description.datatype,
    });
    return description;
}

void Context::fail(ErrorKind kind, std::string message) const {
    REPLIDOC_WARN("{}: {}", to_string_view(kind), message);
    throw MutationError{kind, std::move(message)};
}

}  // namespace replidoc_cpp
