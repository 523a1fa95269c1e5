#include <replidoc-cpp/op.hpp>

#include <gtest/gtest.h>

using namespace replidoc_cpp;

TEST(OpAction, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(OpAction::set),        "set");
    EXPECT_EQ(to_string_view(OpAction::make_map),   "makeMap");
    EXPECT_EQ(to_string_view(OpAction::make_list),  "makeList");
    EXPECT_EQ(to_string_view(OpAction::make_text),  "makeText");
    EXPECT_EQ(to_string_view(OpAction::make_table), "makeTable");
}

TEST(OpAction, make_action_per_object_type) {
    EXPECT_EQ(make_action(ObjType::map),   OpAction::make_map);
    EXPECT_EQ(make_action(ObjType::list),  OpAction::make_list);
    EXPECT_EQ(make_action(ObjType::text),  OpAction::make_text);
    EXPECT_EQ(make_action(ObjType::table), OpAction::make_table);
}

TEST(Op, construction_defaults) {
    const auto op = Op{
        .action = OpAction::set,
        .obj = root_id,
        .key = map_key("name"),
        .value = ScalarValue{std::string{"Alice"}},
    };

    EXPECT_FALSE(op.insert);
    EXPECT_FALSE(op.datatype.has_value());
    EXPECT_FALSE(op.child.has_value());
    EXPECT_TRUE(op.obj.is_root());
}

TEST(Op, equality_detects_different_actions) {
    const auto base = Op{
        .action = OpAction::make_map,
        .obj = root_id,
        .key = map_key("x"),
        .child = random_object_id(),
    };

    auto different = base;
    different.action = OpAction::make_list;

    EXPECT_NE(base, different);
}

TEST(Op, equality_detects_insert_flag) {
    const auto base = Op{
        .action = OpAction::set,
        .obj = root_id,
        .key = list_index(0),
        .value = ScalarValue{std::int64_t{1}},
    };

    auto inserting = base;
    inserting.insert = true;

    EXPECT_NE(base, inserting);
}
