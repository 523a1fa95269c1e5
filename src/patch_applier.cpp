#include <replidoc-cpp/patch_applier.hpp>
#include <replidoc-cpp/error.hpp>
#include <replidoc-cpp/logger.hpp>

#include <charconv>
#include <cstdint>
#include <string>
#include <variant>

namespace replidoc_cpp {

namespace {

auto as_int64(const ScalarValue& value) -> std::int64_t {
    return std::visit(overload{
        [](std::int64_t v) { return v; },
        [](std::uint64_t v) { return static_cast<std::int64_t>(v); },
        [](double v) { return static_cast<std::int64_t>(v); },
        [](bool v) { return static_cast<std::int64_t>(v); },
        [](const auto&) { return std::int64_t{0}; },
    }, value);
}

auto element_index(const std::string& key, std::size_t length) -> std::size_t {
    auto idx = std::size_t{0};
    const auto* end = key.data() + key.size();
    auto [ptr, ec] = std::from_chars(key.data(), end, idx);
    if (ec != std::errc{} || ptr != end || idx >= length) {
        throw MutationError{ErrorKind::invalid_index,
                            "Patch key '" + key + "' is not an index of a sequence of length "
                                + std::to_string(length)};
    }
    return idx;
}

void apply_edits(ObjectState& object, const std::vector<Edit>& edits) {
    if (object.type != ObjType::list && object.type != ObjType::text) {
        if (!edits.empty()) {
            throw MutationError{ErrorKind::invalid_index,
                                "Edits apply only to list and text objects"};
        }
        return;
    }
    auto& elements = object.list_elements;
    for (const auto& edit : edits) {
        const auto offset = static_cast<std::ptrdiff_t>(edit.index);
        switch (edit.action) {
            case EditAction::insert:
                if (edit.index > elements.size()) {
                    throw MutationError{ErrorKind::invalid_index,
                                        "Insert edit at " + std::to_string(edit.index)
                                            + " beyond length " + std::to_string(elements.size())};
                }
                elements.insert(elements.begin() + offset, ConflictSet{});
                break;
            case EditAction::remove:
                if (edit.index >= elements.size()) {
                    throw MutationError{ErrorKind::invalid_index,
                                        "Remove edit at " + std::to_string(edit.index)
                                            + " beyond length " + std::to_string(elements.size())};
                }
                elements.erase(elements.begin() + offset);
                break;
        }
    }
}

}  // namespace

auto to_stored_value(const Diff& diff) -> StoredValue {
    if (const auto* object = as_object(diff)) return ObjectRef{object->object_id};
    const auto& value = *as_value(diff);
    if (!value.datatype) return value.value;
    switch (*value.datatype) {
        case Datatype::timestamp: return Timestamp{as_int64(value.value)};
        case Datatype::counter:   return Counter{as_int64(value.value)};
    }
    return value.value;
}

void apply_object_diff(const ObjectDiff& diff, ObjectStore& store) {
    auto& object = store.contains(diff.object_id) ? store.mutable_object(diff.object_id)
                                                  : store.create_object(diff.object_id, diff.type);
    if (diff.edits) apply_edits(object, *diff.edits);
    if (!diff.props) return;

    for (const auto& [key, values] : *diff.props) {
        auto conflicts = ConflictSet{};
        for (const auto& [writer, value] : values) {
            if (const auto* nested = as_object(value)) apply_object_diff(*nested, store);
            conflicts.emplace(writer, to_stored_value(value));
        }

        switch (object.type) {
            case ObjType::map:
                if (conflicts.empty()) {
                    object.map_entries.erase(key);
                } else {
                    object.map_entries[key] = std::move(conflicts);
                }
                break;
            case ObjType::list:
            case ObjType::text:
                object.list_elements[element_index(key, object.list_elements.size())] =
                    std::move(conflicts);
                break;
            case ObjType::table:
                if (conflicts.empty()) {
                    object.table_rows.erase(key);
                } else {
                    object.table_rows[key] = std::move(conflicts.begin()->second);
                }
                break;
        }
    }
}

void apply_patch(const ObjectDiff& diff, const ObjectState& /*root*/, ObjectStore& store) {
    REPLIDOC_TRACE("apply_patch {}", to_string(diff.object_id));
    apply_object_diff(diff, store);
}

}  // namespace replidoc_cpp
