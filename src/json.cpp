#include <replidoc-cpp/json.hpp>
#include <replidoc-cpp/document.hpp>
#include <replidoc-cpp/error.hpp>

#include <string>
#include <utility>
#include <variant>

namespace replidoc_cpp {

// =============================================================================
// Identity and scalar types
// =============================================================================

void to_json(nlohmann::json& j, const ActorId& id) {
    j = to_string(id);
}

void to_json(nlohmann::json& j, const ObjectId& id) {
    j = to_string(id);
}

void to_json(nlohmann::json& j, Null) {
    j = nullptr;
}

auto key_to_json(const Key& key) -> nlohmann::json {
    return std::visit([](const auto& k) { return nlohmann::json(k); }, key);
}

auto scalar_to_json(const ScalarValue& value) -> nlohmann::json {
    return std::visit(overload{
        [](Null) { return nlohmann::json(nullptr); },
        [](const auto& v) { return nlohmann::json(v); },
    }, value);
}

// =============================================================================
// Log and patch types
// =============================================================================

void to_json(nlohmann::json& j, const Op& op) {
    j = nlohmann::json{
        {"action", to_string_view(op.action)},
        {"obj", op.obj},
        {"key", key_to_json(op.key)},
    };
    if (op.insert) j["insert"] = true;
    if (op.value) j["value"] = scalar_to_json(*op.value);
    if (op.datatype) j["datatype"] = to_string_view(*op.datatype);
    if (op.child) j["child"] = *op.child;
}

void to_json(nlohmann::json& j, const Change& change) {
    j = nlohmann::json{
        {"actor", change.actor},
        {"seq", change.seq},
        {"startOp", change.start_op},
        {"ops", change.operations},
    };
    if (change.message) j["message"] = *change.message;
}

void to_json(nlohmann::json& j, const Edit& edit) {
    j = nlohmann::json{
        {"action", to_string_view(edit.action)},
        {"index", edit.index},
    };
}

void to_json(nlohmann::json& j, const ValueDiff& diff) {
    j = nlohmann::json{{"value", scalar_to_json(diff.value)}};
    if (diff.datatype) j["datatype"] = to_string_view(*diff.datatype);
}

void to_json(nlohmann::json& j, const ObjectDiff& diff) {
    j = nlohmann::json{
        {"objectId", diff.object_id},
        {"type", to_string_view(diff.type)},
    };
    if (diff.edits) j["edits"] = *diff.edits;
    if (diff.props) {
        auto props = nlohmann::json::object();
        for (const auto& [key, values] : *diff.props) {
            auto entry = nlohmann::json::object();
            for (const auto& [writer, value] : values) {
                entry[writer] = diff_to_json(value);
            }
            props[key] = std::move(entry);
        }
        j["props"] = std::move(props);
    }
}

void to_json(nlohmann::json& j, const Patch& patch) {
    auto clock = nlohmann::json::object();
    for (const auto& [actor, count] : patch.clock) {
        clock[to_string(actor)] = count;
    }
    j = nlohmann::json{
        {"clock", std::move(clock)},
        {"version", patch.version},
        {"diffs", patch.diffs ? nlohmann::json(*patch.diffs) : nlohmann::json(nullptr)},
    };
}

auto diff_to_json(const Diff& diff) -> nlohmann::json {
    if (const auto* value = as_value(diff)) return nlohmann::json(*value);
    const auto* object = as_object(diff);
    return object ? nlohmann::json(*object) : nlohmann::json(nullptr);
}

// =============================================================================
// Materialized state
// =============================================================================

auto stored_to_json(const StoredValue& value) -> nlohmann::json {
    return std::visit(overload{
        [](std::monostate) { return nlohmann::json(nullptr); },
        [](const ScalarValue& v) { return scalar_to_json(v); },
        [](Timestamp t) {
            return nlohmann::json{{"value", t.millis_since_epoch}, {"datatype", "timestamp"}};
        },
        [](Counter c) {
            return nlohmann::json{{"value", c.value}, {"datatype", "counter"}};
        },
        [](ObjectRef ref) { return nlohmann::json{{"objectId", ref.id}}; },
    }, value);
}

namespace {

auto conflicts_to_json(const ConflictSet& conflicts) -> nlohmann::json {
    auto result = nlohmann::json::object();
    for (const auto& [writer, value] : conflicts) {
        result[writer] = stored_to_json(value);
    }
    return result;
}

auto export_value(const ObjectCache& cache, const StoredValue& value) -> nlohmann::json;

auto export_object(const ObjectCache& cache, const ObjectId& id) -> nlohmann::json {
    auto it = cache.find(id);
    if (it == cache.end()) {
        throw MutationError{ErrorKind::missing_object,
                            "Target object does not exist: " + to_string(id)};
    }
    const auto& object = it->second;
    switch (object.type) {
        case ObjType::map: {
            auto result = nlohmann::json::object();
            for (const auto& [key, conflicts] : object.map_entries) {
                if (const auto* win = winner(conflicts)) {
                    result[key] = export_value(cache, *win);
                }
            }
            return result;
        }
        case ObjType::list: {
            auto result = nlohmann::json::array();
            for (const auto& conflicts : object.list_elements) {
                const auto* win = winner(conflicts);
                result.push_back(win ? export_value(cache, *win) : nlohmann::json(nullptr));
            }
            return result;
        }
        case ObjType::text: {
            auto result = std::string{};
            for (const auto& conflicts : object.list_elements) {
                const auto* win = winner(conflicts);
                if (!win) continue;
                if (const auto* sv = std::get_if<ScalarValue>(win)) {
                    if (const auto* s = std::get_if<std::string>(sv)) result += *s;
                }
            }
            return result;
        }
        case ObjType::table: {
            auto result = nlohmann::json::object();
            for (const auto& [row_id, row] : object.table_rows) {
                result[row_id] = export_value(cache, row);
            }
            return result;
        }
    }
    return nullptr;
}

auto export_value(const ObjectCache& cache, const StoredValue& value) -> nlohmann::json {
    return std::visit(overload{
        [](std::monostate) { return nlohmann::json(nullptr); },
        [](const ScalarValue& v) { return scalar_to_json(v); },
        [](Timestamp t) { return nlohmann::json(t.millis_since_epoch); },
        [](Counter c) { return nlohmann::json(c.value); },
        [&](ObjectRef ref) { return export_object(cache, ref.id); },
    }, value);
}

}  // namespace

void to_json(nlohmann::json& j, const ObjectState& object) {
    j = nlohmann::json{
        {"objectId", object.id},
        {"type", to_string_view(object.type)},
    };
    switch (object.type) {
        case ObjType::map: {
            auto entries = nlohmann::json::object();
            for (const auto& [key, conflicts] : object.map_entries) {
                entries[key] = conflicts_to_json(conflicts);
            }
            j["entries"] = std::move(entries);
            break;
        }
        case ObjType::list:
        case ObjType::text: {
            auto elements = nlohmann::json::array();
            for (const auto& conflicts : object.list_elements) {
                elements.push_back(conflicts_to_json(conflicts));
            }
            j["elements"] = std::move(elements);
            break;
        }
        case ObjType::table: {
            auto rows = nlohmann::json::object();
            for (const auto& [row_id, row] : object.table_rows) {
                rows[row_id] = stored_to_json(row);
            }
            j["rows"] = std::move(rows);
            break;
        }
    }
}

auto export_json(const ObjectCache& cache, const ObjectId& obj) -> nlohmann::json {
    return export_object(cache, obj);
}

auto export_json(const Document& doc, const ObjectId& obj) -> nlohmann::json {
    return export_object(*doc.snapshot(), obj);
}

}  // namespace replidoc_cpp
