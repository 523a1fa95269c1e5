#include <replidoc-cpp/object_store.hpp>
#include <replidoc-cpp/error.hpp>

#include <algorithm>
#include <charconv>
#include <iterator>
#include <utility>

namespace replidoc_cpp {

namespace {

auto parse_index(const std::string& key) -> std::optional<std::size_t> {
    auto idx = std::size_t{0};
    const auto* end = key.data() + key.size();
    auto [ptr, ec] = std::from_chars(key.data(), end, idx);
    if (ec != std::errc{} || ptr != end || key.empty()) return std::nullopt;
    return idx;
}

}  // namespace

auto ObjectState::length() const -> std::size_t {
    switch (type) {
        case ObjType::map:   return map_entries.size();
        case ObjType::list:
        case ObjType::text:  return list_elements.size();
        case ObjType::table: return table_rows.size();
    }
    return 0;
}

auto ObjectState::conflicts_at(const std::string& key) const -> const ConflictSet* {
    switch (type) {
        case ObjType::map: {
            auto it = map_entries.find(key);
            return it != map_entries.end() ? &it->second : nullptr;
        }
        case ObjType::list:
        case ObjType::text: {
            auto idx = parse_index(key);
            if (!idx || *idx >= list_elements.size()) return nullptr;
            return &list_elements[*idx];
        }
        case ObjType::table:
            return nullptr;
    }
    return nullptr;
}

auto ObjectState::conflicts_at(const std::string& key) -> ConflictSet* {
    return const_cast<ConflictSet*>(std::as_const(*this).conflicts_at(key));
}

auto winner(const ConflictSet& conflicts) -> const StoredValue* {
    if (conflicts.empty()) return nullptr;
    // std::map is ordered by writer: the last entry is the highest.
    return &std::prev(conflicts.end())->second;
}

auto make_cache() -> std::shared_ptr<const ObjectCache> {
    auto cache = std::make_shared<ObjectCache>();
    (*cache)[root_id] = ObjectState{.id = root_id, .type = ObjType::map};
    return cache;
}

ObjectStore::ObjectStore(std::shared_ptr<const ObjectCache> base)
    : base_{base ? std::move(base) : make_cache()} {}

auto ObjectStore::find(const ObjectId& id) const -> const ObjectState* {
    if (auto it = overlay_.find(id); it != overlay_.end()) return &it->second;
    if (auto it = base_->find(id); it != base_->end()) return &it->second;
    return nullptr;
}

auto ObjectStore::get_object(const ObjectId& id) const -> const ObjectState& {
    const auto* object = find(id);
    if (!object) {
        throw MutationError{ErrorKind::missing_object,
                            "Target object does not exist: " + to_string(id)};
    }
    return *object;
}

auto ObjectStore::mutable_object(const ObjectId& id) -> ObjectState& {
    if (auto it = overlay_.find(id); it != overlay_.end()) return it->second;
    auto it = base_->find(id);
    if (it == base_->end()) {
        throw MutationError{ErrorKind::missing_object,
                            "Target object does not exist: " + to_string(id)};
    }
    return overlay_.emplace(id, it->second).first->second;
}

auto ObjectStore::create_object(const ObjectId& id, ObjType type) -> ObjectState& {
    auto& object = overlay_[id];
    object = ObjectState{.id = id, .type = type};
    return object;
}

auto ObjectStore::commit() const -> std::shared_ptr<const ObjectCache> {
    if (overlay_.empty()) return base_;
    auto merged = std::make_shared<ObjectCache>(*base_);
    for (const auto& [id, object] : overlay_) {
        (*merged)[id] = object;
    }
    return merged;
}

}  // namespace replidoc_cpp
