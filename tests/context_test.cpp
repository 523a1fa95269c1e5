#include <replidoc-cpp/context.hpp>
#include <replidoc-cpp/patch_applier.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace replidoc_cpp;

namespace {

auto id(std::uint8_t n) -> ObjectId {
    const std::uint8_t raw[16] = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,n};
    return ObjectId{raw};
}

auto test_actor() -> ActorId {
    const std::uint8_t raw[16] = {0xaa,0,0,0,0,0,0,0,0,0,0,0,0,0,0,1};
    return ActorId{raw};
}

auto value_of(const Diff& diff) -> ScalarValue {
    const auto* value = as_value(diff);
    return value ? value->value : ScalarValue{std::string{"<object>"}};
}

auto count_action(const std::vector<Op>& ops, OpAction action) -> std::size_t {
    return static_cast<std::size_t>(std::ranges::count_if(ops, [&](const Op& op) {
        return op.action == action;
    }));
}

// A base cache whose root holds `key` written concurrently by two writers.
auto conflicted_cache(const std::string& key, StoredValue first, StoredValue second)
    -> std::shared_ptr<ObjectCache> {
    auto cache = std::make_shared<ObjectCache>(*make_cache());
    cache->at(root_id).map_entries[key] = ConflictSet{
        {"1111", std::move(first)},
        {"2222", std::move(second)},
    };
    return cache;
}

}  // namespace

class ContextTest : public ::testing::Test {
protected:
    auto local() const -> WriterId { return writer_id(test_actor()); }

    auto root_props() const -> const Props& { return *patches.back().props; }

    auto path_to(const std::string& key) const -> Path {
        const auto& root = store.get_object(root_id);
        const auto& ref = std::get<ObjectRef>(root.map_entries.at(key).at(local()));
        return Path{{map_key(key), ref.id}};
    }

    void reset(std::shared_ptr<const ObjectCache> cache) {
        store = ObjectStore{std::move(cache)};
    }

    std::uint8_t next_id{0};
    bool fail_callback{false};
    std::vector<ObjectDiff> patches;
    ObjectStore store{make_cache()};
    Context ctx{
        ContextOptions{.actor = test_actor(), .id_generator = [this] { return id(++next_id); }},
        store,
        [this](const ObjectDiff& diff, const ObjectState& root, ObjectStore& s) {
            patches.push_back(diff);
            if (fail_callback) throw std::runtime_error{"view rejected patch"};
            apply_patch(diff, root, s);
        },
    };
};

// -- Scalars ------------------------------------------------------------------

TEST_F(ContextTest, scalar_yields_one_set_op_and_value_diff) {
    const auto inputs = std::vector<InputValue>{
        Null{}, true, 42, std::uint64_t{7}, 2.5, "text",
    };
    for (const auto& input : inputs) {
        auto local_ctx = Context{{.actor = test_actor()}, store, nullptr};
        const auto diff = local_ctx.set_value(root_id, map_key("k"), input);

        ASSERT_EQ(local_ctx.ops().size(), 1u);
        const auto& op = local_ctx.ops()[0];
        EXPECT_EQ(op.action, OpAction::set);
        EXPECT_EQ(op.obj, root_id);
        EXPECT_EQ(op.key, map_key("k"));
        EXPECT_FALSE(op.insert);
        EXPECT_EQ(op.value, std::get<ScalarValue>(input.inner));
        EXPECT_FALSE(op.datatype.has_value());

        ASSERT_NE(as_value(diff), nullptr);
        EXPECT_EQ(as_value(diff)->value, std::get<ScalarValue>(input.inner));
        EXPECT_FALSE(as_value(diff)->datatype.has_value());
    }
}

TEST_F(ContextTest, timestamp_is_normalized_to_millis) {
    const auto diff = ctx.set_value(root_id, map_key("at"), Timestamp{1'600'000'000'123});

    ASSERT_EQ(ctx.ops().size(), 1u);
    EXPECT_EQ(ctx.ops()[0].datatype, Datatype::timestamp);
    EXPECT_EQ(ctx.ops()[0].value, ScalarValue{std::int64_t{1'600'000'000'123}});
    EXPECT_EQ(*as_value(diff), (ValueDiff{.value = ScalarValue{std::int64_t{1'600'000'000'123}},
                                          .datatype = Datatype::timestamp}));
}

TEST_F(ContextTest, counter_is_normalized_to_its_value) {
    const auto diff = ctx.set_value(root_id, map_key("n"), Counter{3});

    ASSERT_EQ(ctx.ops().size(), 1u);
    EXPECT_EQ(ctx.ops()[0].datatype, Datatype::counter);
    EXPECT_EQ(*as_value(diff), (ValueDiff{.value = ScalarValue{std::int64_t{3}},
                                          .datatype = Datatype::counter}));
}

TEST_F(ContextTest, written_and_described_values_have_identical_diffs) {
    EXPECT_TRUE(equivalent(ctx.set_value(root_id, map_key("t"), Timestamp{99}),
                           ctx.get_value_description(Timestamp{99})));
    EXPECT_TRUE(equivalent(ctx.set_value(root_id, map_key("c"), Counter{-4}),
                           ctx.get_value_description(Counter{-4})));
    EXPECT_TRUE(equivalent(ctx.set_value(root_id, map_key("s"), "x"),
                           ctx.get_value_description(ScalarValue{std::string{"x"}})));
}

TEST_F(ContextTest, list_position_set_carries_insert_flag) {
    ctx.set_value(id(40), list_index(3), "v", true);
    ASSERT_EQ(ctx.ops().size(), 1u);
    EXPECT_TRUE(ctx.ops()[0].insert);
    EXPECT_EQ(ctx.ops()[0].key, list_index(3));
}

// -- Nested objects -----------------------------------------------------------

TEST_F(ContextTest, nested_map_emits_make_map_and_one_set_per_entry) {
    ctx.set_map_key({}, "k", NestedMap{{"a", 1}, {"b", "x"}});

    const auto& ops = ctx.ops();
    ASSERT_EQ(ops.size(), 3u);
    EXPECT_EQ(ops[0].action, OpAction::make_map);
    EXPECT_EQ(ops[0].obj, root_id);
    EXPECT_EQ(ops[0].key, map_key("k"));
    EXPECT_EQ(ops[0].child, id(1));
    EXPECT_EQ(count_action(ops, OpAction::set), 2u);

    auto keys = std::set<Key>{};
    for (const auto& op : ops) {
        if (op.action == OpAction::set) {
            EXPECT_EQ(op.obj, id(1));
            keys.insert(op.key);
        }
    }
    EXPECT_EQ(keys, (std::set<Key>{map_key("a"), map_key("b")}));

    ASSERT_EQ(patches.size(), 1u);
    const auto* node = as_object(root_props().at("k").at(local()));
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->object_id, id(1));
    EXPECT_EQ(node->type, ObjType::map);
    ASSERT_TRUE(node->props.has_value());
    ASSERT_EQ(node->props->size(), 2u);
    EXPECT_EQ(node->props->at("a").size(), 1u);
    EXPECT_EQ(value_of(node->props->at("a").at(local())), ScalarValue{std::int64_t{1}});
    EXPECT_EQ(value_of(node->props->at("b").at(local())), ScalarValue{std::string{"x"}});
}

TEST_F(ContextTest, nested_map_with_duplicate_key_is_rejected) {
    try {
        ctx.set_map_key({}, "k", NestedMap{{"a", 1}, {"a", 2}});
        FAIL() << "expected MutationError";
    } catch (const MutationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_key);
    }
    EXPECT_TRUE(ctx.ops().empty());
    EXPECT_TRUE(patches.empty());
}

TEST_F(ContextTest, nested_objects_recurse) {
    ctx.set_map_key({}, "doc", NestedMap{{"tags", NestedList{"a", NestedMap{{"x", 1}}}}});

    const auto& ops = ctx.ops();
    EXPECT_EQ(count_action(ops, OpAction::make_map), 2u);
    EXPECT_EQ(count_action(ops, OpAction::make_list), 1u);
    EXPECT_EQ(count_action(ops, OpAction::set), 2u);

    const auto& doc = store.get_object(id(1));
    const auto& tags_ref = std::get<ObjectRef>(doc.map_entries.at("tags").at(local()));
    EXPECT_EQ(store.get_object(tags_ref.id).type, ObjType::list);
    EXPECT_EQ(store.get_object(tags_ref.id).length(), 2u);
}

TEST_F(ContextTest, text_is_split_per_code_point) {
    ctx.set_map_key({}, "t", NestedText{"h\xc3\xa9\xf0\x9f\x98\x80"});

    ASSERT_EQ(ctx.ops().size(), 4u);
    EXPECT_EQ(ctx.ops()[0].action, OpAction::make_text);
    EXPECT_EQ(ctx.ops()[1].value, ScalarValue{std::string{"h"}});
    EXPECT_EQ(ctx.ops()[2].value, ScalarValue{std::string{"\xc3\xa9"}});
    EXPECT_EQ(ctx.ops()[3].value, ScalarValue{std::string{"\xf0\x9f\x98\x80"}});

    const auto* node = as_object(root_props().at("t").at(local()));
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->type, ObjType::text);
    EXPECT_EQ(node->edits->size(), 3u);
}

TEST_F(ContextTest, empty_table_emits_make_table_only) {
    ctx.set_map_key({}, "rows", NestedTable{});

    ASSERT_EQ(ctx.ops().size(), 1u);
    EXPECT_EQ(ctx.ops()[0].action, OpAction::make_table);
    EXPECT_EQ(store.get_object(id(1)).type, ObjType::table);
}

TEST_F(ContextTest, non_empty_table_is_rejected_without_ops) {
    try {
        ctx.set_map_key({}, "rows", NestedTable{{NestedMap{{"title", "x"}}}});
        FAIL() << "expected MutationError";
    } catch (const MutationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::non_empty_table_assignment);
    }
    EXPECT_TRUE(ctx.ops().empty());
    EXPECT_TRUE(patches.empty());
}

TEST_F(ContextTest, table_row_uses_its_own_id_as_key) {
    ctx.set_map_key({}, "rows", NestedTable{});
    ctx.take_ops();

    const auto row = ctx.create_nested_objects(id(1), std::nullopt, NestedMap{{"title", "x"}});

    ASSERT_EQ(ctx.ops().size(), 2u);
    EXPECT_EQ(ctx.ops()[0].action, OpAction::make_map);
    EXPECT_EQ(ctx.ops()[0].obj, id(1));
    EXPECT_EQ(ctx.ops()[0].key, map_key(to_string(id(2))));
    EXPECT_EQ(row->object_id, id(2));
}

TEST_F(ContextTest, existing_reference_is_rejected) {
    try {
        ctx.set_map_key({}, "alias", ExistingRef{id(9)});
        FAIL() << "expected MutationError";
    } catch (const MutationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::aliased_object);
    }
    EXPECT_THROW(ctx.create_nested_objects(root_id, map_key("x"), ExistingRef{id(9)}),
                 MutationError);
    EXPECT_TRUE(ctx.ops().empty());
}

TEST_F(ContextTest, empty_value_is_rejected) {
    try {
        ctx.set_map_key({}, "k", InputValue{});
        FAIL() << "expected MutationError";
    } catch (const MutationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::unsupported_value_shape);
    }
    EXPECT_TRUE(ctx.ops().empty());
    EXPECT_TRUE(patches.empty());
}

TEST_F(ContextTest, fault_deep_inside_a_nested_value_publishes_nothing) {
    EXPECT_THROW(ctx.set_map_key({}, "k", NestedList{1, 2, ExistingRef{id(9)}}), MutationError);
    EXPECT_TRUE(ctx.ops().empty());
    EXPECT_TRUE(patches.empty());
    EXPECT_FALSE(store.get_object(root_id).map_entries.contains("k"));
}

// -- set_map_key --------------------------------------------------------------

TEST_F(ContextTest, empty_key_is_rejected) {
    try {
        ctx.set_map_key({}, "", 1);
        FAIL() << "expected MutationError";
    } catch (const MutationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_key);
    }
    EXPECT_THROW(ctx.set_value(root_id, map_key(""), 1), MutationError);
    EXPECT_TRUE(ctx.ops().empty());
}

TEST_F(ContextTest, set_map_key_updates_the_store) {
    ctx.set_map_key({}, "greeting", "hello");

    const auto& root = store.get_object(root_id);
    ASSERT_TRUE(root.map_entries.contains("greeting"));
    EXPECT_EQ(root.map_entries.at("greeting").at(local()),
              StoredValue{ScalarValue{std::string{"hello"}}});
    EXPECT_TRUE(ctx.updated());
}

TEST_F(ContextTest, equal_value_is_elided) {
    ctx.set_map_key({}, "a", 1);
    ctx.take_ops();
    patches.clear();

    ctx.set_map_key({}, "a", 1);

    EXPECT_TRUE(ctx.ops().empty());
    EXPECT_TRUE(patches.empty());
}

TEST_F(ContextTest, equal_timestamp_is_elided) {
    ctx.set_map_key({}, "at", Timestamp{5});
    ctx.take_ops();
    patches.clear();

    ctx.set_map_key({}, "at", Timestamp{5});

    EXPECT_TRUE(ctx.ops().empty());
    EXPECT_TRUE(patches.empty());
}

TEST_F(ContextTest, same_number_of_a_different_kind_is_written) {
    ctx.set_map_key({}, "a", 1);
    ctx.take_ops();

    ctx.set_map_key({}, "a", 1.0);

    EXPECT_EQ(ctx.ops().size(), 1u);
}

TEST_F(ContextTest, equal_value_over_a_conflict_is_written) {
    reset(conflicted_cache("a", ScalarValue{std::int64_t{1}}, ScalarValue{std::int64_t{1}}));

    ctx.set_map_key({}, "a", 1);

    ASSERT_EQ(ctx.ops().size(), 1u);
    ASSERT_EQ(patches.size(), 1u);
    EXPECT_EQ(root_props().at("a").size(), 1u);
    // The patch resolves the conflict in favour of the local writer.
    EXPECT_EQ(store.get_object(root_id).map_entries.at("a").size(), 1u);
}

TEST_F(ContextTest, counter_cannot_be_overwritten) {
    ctx.set_map_key({}, "n", Counter{1});
    ctx.take_ops();
    patches.clear();

    try {
        ctx.set_map_key({}, "n", 5);
        FAIL() << "expected MutationError";
    } catch (const MutationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::counter_overwrite);
    }
    EXPECT_THROW(ctx.set_map_key({}, "n", Counter{1}), MutationError);
    EXPECT_TRUE(ctx.ops().empty());
    EXPECT_TRUE(patches.empty());
}

TEST_F(ContextTest, counter_in_any_conflicting_value_blocks_overwrite) {
    reset(conflicted_cache("n", ScalarValue{std::int64_t{1}}, Counter{2}));
    EXPECT_THROW(ctx.set_map_key({}, "n", 3), MutationError);
    EXPECT_TRUE(ctx.ops().empty());
}

TEST_F(ContextTest, set_map_key_on_a_list_is_rejected) {
    ctx.set_map_key({}, "list", NestedList{});
    try {
        ctx.set_map_key(path_to("list"), "x", 1);
        FAIL() << "expected MutationError";
    } catch (const MutationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_key);
    }
}

TEST_F(ContextTest, nested_set_map_key_builds_the_path_in_the_patch) {
    ctx.set_map_key({}, "config", NestedMap{{"port", 80}});
    ctx.take_ops();
    patches.clear();

    ctx.set_map_key(path_to("config"), "port", 8080);

    ASSERT_EQ(ctx.ops().size(), 1u);
    EXPECT_EQ(ctx.ops()[0].obj, id(1));
    ASSERT_EQ(patches.size(), 1u);
    const auto* node = as_object(root_props().at("config").at(local()));
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->object_id, id(1));
    EXPECT_EQ(value_of(node->props->at("port").at(local())), ScalarValue{std::int64_t{8080}});
    EXPECT_EQ(store.get_object(id(1)).map_entries.at("port").at(local()),
              StoredValue{ScalarValue{std::int64_t{8080}}});
}

// -- List insertion -----------------------------------------------------------

TEST_F(ContextTest, end_to_end_todo_list) {
    ctx.set_map_key({}, "todo", NestedList{"a", "b"});

    const auto& ops = ctx.ops();
    ASSERT_EQ(ops.size(), 3u);
    EXPECT_EQ(ops[0], (Op{.action = OpAction::make_list, .obj = root_id,
                          .key = map_key("todo"), .child = id(1)}));
    EXPECT_EQ(ops[1], (Op{.action = OpAction::set, .obj = id(1), .key = list_index(0),
                          .insert = true, .value = ScalarValue{std::string{"a"}}}));
    EXPECT_EQ(ops[2], (Op{.action = OpAction::set, .obj = id(1), .key = list_index(1),
                          .insert = true, .value = ScalarValue{std::string{"b"}}}));

    const auto expected = make_object_diff(
        root_id, ObjType::map, std::nullopt,
        Props{{"todo", ConflictDiffs{{local(), Diff{make_object_diff(
            id(1), ObjType::list,
            std::vector<Edit>{{EditAction::insert, 0}, {EditAction::insert, 1}},
            Props{
                {"0", ConflictDiffs{{local(), Diff{ValueDiff{.value = ScalarValue{std::string{"a"}}}}}}},
                {"1", ConflictDiffs{{local(), Diff{ValueDiff{.value = ScalarValue{std::string{"b"}}}}}}},
            })}}}}});
    ASSERT_EQ(patches.size(), 1u);
    EXPECT_TRUE(equivalent(patches[0], *expected));
}

TEST_F(ContextTest, insertion_edits_are_consecutive_and_ordered) {
    ctx.set_map_key({}, "list", NestedList{"a", "b"});
    ctx.take_ops();
    patches.clear();

    ctx.insert_list_items(path_to("list"), 1, {"x", "y", "z"});

    const auto& ops = ctx.ops();
    ASSERT_EQ(ops.size(), 3u);
    for (std::size_t i = 0; i < ops.size(); ++i) {
        EXPECT_EQ(ops[i].action, OpAction::set);
        EXPECT_TRUE(ops[i].insert);
        EXPECT_EQ(ops[i].key, list_index(1 + i));
    }

    const auto* node = as_object(root_props().at("list").at(local()));
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(*node->edits, (std::vector<Edit>{{EditAction::insert, 1},
                                               {EditAction::insert, 2},
                                               {EditAction::insert, 3}}));
    EXPECT_EQ(node->props->size(), 3u);

    const auto& list = store.get_object(id(1));
    ASSERT_EQ(list.length(), 5u);
    EXPECT_EQ(list.list_elements[1].at(local()), StoredValue{ScalarValue{std::string{"x"}}});
    EXPECT_EQ(list.list_elements[4].at(local()), StoredValue{ScalarValue{std::string{"b"}}});
}

TEST_F(ContextTest, insert_at_length_appends) {
    ctx.set_map_key({}, "list", NestedList{"a"});
    ctx.insert_list_items(path_to("list"), 1, {"b"});
    EXPECT_EQ(store.get_object(id(1)).length(), 2u);
}

TEST_F(ContextTest, insert_past_length_is_rejected_without_ops) {
    ctx.set_map_key({}, "list", NestedList{"a", "b"});
    ctx.take_ops();
    patches.clear();

    try {
        ctx.insert_list_items(path_to("list"), 3, {"x"});
        FAIL() << "expected MutationError";
    } catch (const MutationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_index);
    }
    EXPECT_TRUE(ctx.ops().empty());
    EXPECT_TRUE(patches.empty());
    EXPECT_EQ(store.get_object(id(1)).length(), 2u);
}

TEST_F(ContextTest, insert_into_root_is_rejected) {
    EXPECT_THROW(ctx.insert_list_items({}, 0, {"x"}), MutationError);
}

TEST_F(ContextTest, inserting_nested_containers_into_a_list) {
    ctx.set_map_key({}, "list", NestedList{});
    ctx.take_ops();

    ctx.insert_list_items(path_to("list"), 0, {NestedMap{{"done", false}}});

    const auto& ops = ctx.ops();
    ASSERT_EQ(ops.size(), 2u);
    EXPECT_EQ(ops[0].action, OpAction::make_map);
    EXPECT_TRUE(ops[0].insert);
    EXPECT_EQ(ops[0].key, list_index(0));
    EXPECT_EQ(ops[1].obj, ops[0].child);
}

// -- Path resolution ----------------------------------------------------------

TEST_F(ContextTest, conflicting_containers_keep_the_other_branch) {
    auto cache = conflicted_cache("conf", ObjectRef{id(50)}, ObjectRef{id(51)});
    (*cache)[id(50)] = ObjectState{.id = id(50), .type = ObjType::list};
    (*cache)[id(51)] = ObjectState{.id = id(51), .type = ObjType::list};
    reset(cache);

    ctx.insert_list_items(Path{{map_key("conf"), id(50)}}, 0, {"x"});

    ASSERT_EQ(patches.size(), 1u);
    const auto& conflicts = root_props().at("conf");
    ASSERT_EQ(conflicts.size(), 2u);
    const auto* chosen = as_object(conflicts.at("1111"));
    const auto* other = as_object(conflicts.at("2222"));
    ASSERT_NE(chosen, nullptr);
    ASSERT_NE(other, nullptr);
    EXPECT_EQ(chosen->object_id, id(50));
    EXPECT_EQ(chosen->edits->size(), 1u);
    EXPECT_TRUE(equivalent(*other, *make_object_diff(id(51), ObjType::list)));

    EXPECT_EQ(store.get_object(root_id).map_entries.at("conf").size(), 2u);
    EXPECT_EQ(store.get_object(id(50)).length(), 1u);
    EXPECT_EQ(store.get_object(id(51)).length(), 0u);
}

TEST_F(ContextTest, path_to_a_replaced_object_is_stale) {
    ctx.set_map_key({}, "list", NestedList{});
    ctx.take_ops();
    patches.clear();

    try {
        ctx.insert_list_items(Path{{map_key("list"), id(77)}}, 0, {"x"});
        FAIL() << "expected MutationError";
    } catch (const MutationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::stale_path);
    }
    EXPECT_TRUE(ctx.ops().empty());
    EXPECT_TRUE(patches.empty());
}

TEST_F(ContextTest, path_through_a_scalar_is_stale) {
    ctx.set_map_key({}, "m", NestedMap{});
    ctx.set_map_key({}, "n", 1);
    try {
        ctx.set_map_key(Path{{map_key("n"), id(1)}}, "x", 1);
        FAIL() << "expected MutationError";
    } catch (const MutationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::stale_path);
    }
}

TEST_F(ContextTest, path_through_an_absent_key_is_untracked) {
    auto cache = std::make_shared<ObjectCache>(*make_cache());
    (*cache)[id(5)] = ObjectState{.id = id(5), .type = ObjType::map};
    reset(cache);

    auto patch = Patch{.diffs = make_object_diff(root_id, ObjType::map)};
    try {
        ctx.get_subpatch(patch, Path{{map_key("nothing"), id(5)}});
        FAIL() << "expected MutationError";
    } catch (const MutationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::untracked_conflict_set);
    }
}

TEST_F(ContextTest, empty_path_resolves_to_the_root_node) {
    auto patch = Patch{.diffs = make_object_diff(root_id, ObjType::map)};
    auto& node = ctx.get_subpatch(patch, {});
    EXPECT_EQ(&node, patch.diffs.get());
    EXPECT_TRUE(node.props.has_value());
}

TEST_F(ContextTest, get_property_value_requires_a_tracked_writer) {
    ctx.set_map_key({}, "a", 1);
    const auto& root = store.get_object(root_id);

    EXPECT_EQ(ctx.get_property_value(root, "a", local()), StoredValue{ScalarValue{std::int64_t{1}}});
    EXPECT_THROW(ctx.get_property_value(root, "a", "ffff"), MutationError);
    EXPECT_THROW(ctx.get_property_value(root, "b", local()), MutationError);
}

TEST_F(ContextTest, table_rows_describe_without_conflicts) {
    auto cache = std::make_shared<ObjectCache>(*make_cache());
    auto table = ObjectState{.id = id(60), .type = ObjType::table};
    table.table_rows[to_string(id(61))] = ObjectRef{id(61)};
    (*cache)[id(60)] = table;
    (*cache)[id(61)] = ObjectState{.id = id(61), .type = ObjType::map};
    reset(cache);

    const auto& state = store.get_object(id(60));
    const auto found = ctx.get_values_descriptions({}, state, to_string(id(61)));
    ASSERT_EQ(found.size(), 1u);
    const auto* row = as_object(found.at(to_string(id(61))));
    ASSERT_NE(row, nullptr);
    EXPECT_EQ(row->type, ObjType::map);

    EXPECT_TRUE(ctx.get_values_descriptions({}, state, "nope").empty());
}

TEST_F(ContextTest, object_types_come_from_the_stored_tag) {
    ctx.set_map_key({}, "l", NestedList{});
    ctx.set_map_key({}, "t", NestedText{""});
    EXPECT_EQ(ctx.get_object_type(root_id), ObjType::map);
    EXPECT_EQ(ctx.get_object_type(id(1)), ObjType::list);
    EXPECT_EQ(ctx.get_object_type(id(2)), ObjType::text);
}

TEST_F(ContextTest, unknown_object_is_missing) {
    try {
        ctx.get_object(id(99));
        FAIL() << "expected MutationError";
    } catch (const MutationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::missing_object);
    }
    EXPECT_THROW(ctx.get_value_description(ObjectRef{id(99)}), MutationError);
}

// -- Atomicity ----------------------------------------------------------------

TEST_F(ContextTest, rejected_patch_publishes_no_ops) {
    fail_callback = true;
    EXPECT_THROW(ctx.set_map_key({}, "a", NestedList{1, 2}), std::runtime_error);
    EXPECT_TRUE(ctx.ops().empty());
    EXPECT_FALSE(ctx.updated());
    EXPECT_EQ(patches.size(), 1u);
}

TEST_F(ContextTest, failed_set_value_publishes_no_ops) {
    const auto value = NestedMap{
        {"a", 1},
        {"b", NestedTable{{NestedMap{{"t", "x"}}}}},
    };
    try {
        ctx.set_value(root_id, map_key("k"), value);
        FAIL() << "expected MutationError";
    } catch (const MutationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::non_empty_table_assignment);
    }
    EXPECT_TRUE(ctx.ops().empty());
    EXPECT_TRUE(ctx.take_ops().empty());
}

TEST_F(ContextTest, failed_insert_leaves_the_subpatch_untouched) {
    auto subpatch = make_object_diff(id(90), ObjType::list, std::vector<Edit>{}, Props{});
    try {
        ctx.insert_list_items(*subpatch, 0, {1, 2, InputValue{}}, true);
        FAIL() << "expected MutationError";
    } catch (const MutationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::unsupported_value_shape);
    }
    EXPECT_TRUE(ctx.ops().empty());
    EXPECT_TRUE(subpatch->edits->empty());
    EXPECT_TRUE(subpatch->props->empty());

    ctx.insert_list_items(*subpatch, 0, {1, 2}, true);
    EXPECT_EQ(ctx.ops().size(), 2u);
    EXPECT_EQ(subpatch->edits->size(), 2u);
    EXPECT_EQ(subpatch->props->size(), 2u);
}

TEST_F(ContextTest, building_blocks_recover_after_a_caught_fault) {
    EXPECT_THROW(ctx.set_value(root_id, map_key("bad"), NestedList{1, InputValue{}}),
                 MutationError);
    ctx.set_value(root_id, map_key("good"), NestedList{1});

    ASSERT_EQ(ctx.ops().size(), 2u);
    EXPECT_EQ(ctx.ops()[0].action, OpAction::make_list);
    EXPECT_EQ(ctx.ops()[0].key, map_key("good"));
    EXPECT_EQ(ctx.ops()[1].obj, *ctx.ops()[0].child);
}

TEST_F(ContextTest, nested_object_with_empty_key_is_rejected) {
    try {
        ctx.create_nested_objects(root_id, map_key(""), NestedMap{{"a", 1}});
        FAIL() << "expected MutationError";
    } catch (const MutationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_key);
    }
    EXPECT_TRUE(ctx.ops().empty());
}

TEST_F(ContextTest, reused_object_id_is_rejected) {
    auto same_store = ObjectStore{};
    auto same = Context{{.actor = test_actor(), .id_generator = [] { return id(7); }},
                        same_store, nullptr};
    same.set_map_key({}, "a", NestedMap{});

    try {
        same.set_map_key({}, "b", NestedList{});
        FAIL() << "expected MutationError";
    } catch (const MutationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::aliased_object);
    }
    EXPECT_EQ(same.ops().size(), 1u);
    EXPECT_FALSE(same_store.get_object(root_id).map_entries.contains("b"));
    EXPECT_EQ(same_store.get_object(id(7)).type, ObjType::map);
}

TEST_F(ContextTest, object_id_reused_within_one_call_is_rejected) {
    auto same_store = ObjectStore{};
    auto same = Context{{.actor = test_actor(), .id_generator = [] { return id(8); }},
                        same_store, nullptr};

    EXPECT_THROW(same.set_map_key({}, "a", NestedList{NestedMap{}}), MutationError);
    EXPECT_TRUE(same.ops().empty());
    EXPECT_FALSE(same_store.contains(id(8)));
}

TEST_F(ContextTest, ops_accumulate_across_calls_until_taken) {
    ctx.set_map_key({}, "a", 1);
    ctx.set_map_key({}, "b", 2);
    EXPECT_EQ(ctx.ops().size(), 2u);

    const auto taken = ctx.take_ops();
    EXPECT_EQ(taken.size(), 2u);
    EXPECT_TRUE(ctx.ops().empty());
}

TEST_F(ContextTest, default_callback_is_the_reference_applier) {
    auto plain_store = ObjectStore{};
    auto plain = Context{{.actor = test_actor()}, plain_store, nullptr};
    plain.set_map_key({}, "k", NestedList{"a"});
    EXPECT_EQ(plain_store.get_object(root_id).length(), 1u);
    EXPECT_EQ(plain.ops().size(), 2u);
}
