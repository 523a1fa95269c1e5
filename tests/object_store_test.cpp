#include <replidoc-cpp/error.hpp>
#include <replidoc-cpp/object_store.hpp>

#include <gtest/gtest.h>

using namespace replidoc_cpp;

namespace {

auto id(std::uint8_t n) -> ObjectId {
    const std::uint8_t raw[16] = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,n};
    return ObjectId{raw};
}

auto scalar(std::int64_t v) -> StoredValue {
    return ScalarValue{v};
}

}  // namespace

// -- ObjectState --------------------------------------------------------------

TEST(ObjectState, length_per_type) {
    auto map = ObjectState{.id = id(1), .type = ObjType::map};
    map.map_entries["a"] = ConflictSet{{"w", scalar(1)}};
    EXPECT_EQ(map.length(), 1u);

    auto list = ObjectState{.id = id(2), .type = ObjType::list};
    list.list_elements.resize(3);
    EXPECT_EQ(list.length(), 3u);

    auto table = ObjectState{.id = id(3), .type = ObjType::table};
    table.table_rows["r"] = ObjectRef{id(4)};
    EXPECT_EQ(table.length(), 1u);
}

TEST(ObjectState, conflicts_at_parses_list_indexes) {
    auto list = ObjectState{.id = id(2), .type = ObjType::list};
    list.list_elements = {ConflictSet{{"w", scalar(10)}}, ConflictSet{{"w", scalar(20)}}};

    ASSERT_NE(list.conflicts_at("1"), nullptr);
    EXPECT_EQ(list.conflicts_at("1")->at("w"), scalar(20));
    EXPECT_EQ(list.conflicts_at("2"), nullptr);
    EXPECT_EQ(list.conflicts_at("x"), nullptr);
    EXPECT_EQ(list.conflicts_at(""), nullptr);
    EXPECT_EQ(list.conflicts_at("1a"), nullptr);
}

TEST(ObjectState, tables_have_no_conflict_sets) {
    auto table = ObjectState{.id = id(3), .type = ObjType::table};
    table.table_rows["r"] = ObjectRef{id(4)};
    EXPECT_EQ(table.conflicts_at("r"), nullptr);
}

TEST(ConflictSet, winner_is_highest_writer) {
    const auto conflicts = ConflictSet{{"aaaa", scalar(1)}, {"ffff", scalar(2)}, {"bbbb", scalar(3)}};
    ASSERT_NE(winner(conflicts), nullptr);
    EXPECT_EQ(*winner(conflicts), scalar(2));
    EXPECT_EQ(winner(ConflictSet{}), nullptr);
}

// -- ObjectStore --------------------------------------------------------------

TEST(ObjectStore, fresh_cache_holds_root_map) {
    const auto store = ObjectStore{make_cache()};
    const auto& root = store.get_object(root_id);
    EXPECT_EQ(root.type, ObjType::map);
    EXPECT_EQ(root.length(), 0u);
}

TEST(ObjectStore, null_base_is_an_empty_document) {
    const auto store = ObjectStore{};
    EXPECT_TRUE(store.contains(root_id));
    EXPECT_FALSE(store.contains(id(1)));
}

TEST(ObjectStore, missing_object_raises) {
    auto store = ObjectStore{};
    try {
        store.get_object(id(9));
        FAIL() << "expected MutationError";
    } catch (const MutationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::missing_object);
    }
    EXPECT_THROW(store.mutable_object(id(9)), MutationError);
}

TEST(ObjectStore, overlay_shadows_base) {
    auto base = std::make_shared<ObjectCache>(*make_cache());
    (*base)[id(1)] = ObjectState{.id = id(1), .type = ObjType::list};
    auto store = ObjectStore{base};

    store.mutable_object(id(1)).list_elements.emplace_back(ConflictSet{{"w", scalar(1)}});

    EXPECT_EQ(store.get_object(id(1)).length(), 1u);
    EXPECT_EQ(base->at(id(1)).length(), 0u);
    EXPECT_EQ(store.overlay().size(), 1u);
}

TEST(ObjectStore, mutable_object_copies_once) {
    auto store = ObjectStore{};
    auto& first = store.mutable_object(root_id);
    first.map_entries["a"] = ConflictSet{{"w", scalar(1)}};
    auto& second = store.mutable_object(root_id);

    EXPECT_EQ(&first, &second);
    EXPECT_EQ(second.map_entries.size(), 1u);
}

TEST(ObjectStore, created_objects_are_visible_before_commit) {
    auto store = ObjectStore{};
    store.create_object(id(5), ObjType::text);

    ASSERT_NE(store.find(id(5)), nullptr);
    EXPECT_EQ(store.find(id(5))->type, ObjType::text);
    EXPECT_EQ(store.base()->count(id(5)), 0u);
}

TEST(ObjectStore, commit_merges_without_touching_base) {
    const auto base = make_cache();
    auto store = ObjectStore{base};
    store.create_object(id(5), ObjType::list);
    store.mutable_object(root_id).map_entries["l"] = ConflictSet{{"w", ObjectRef{id(5)}}};

    const auto committed = store.commit();

    EXPECT_EQ(committed->size(), 2u);
    EXPECT_EQ(committed->at(root_id).map_entries.size(), 1u);
    EXPECT_EQ(base->size(), 1u);
    EXPECT_TRUE(base->at(root_id).map_entries.empty());
}

TEST(ObjectStore, commit_of_untouched_store_returns_base) {
    const auto base = make_cache();
    const auto store = ObjectStore{base};
    EXPECT_EQ(store.commit(), base);
}
