// collaborative_todo: two actors edit copies of a shared todo list
//
// Demonstrates: nested list and map creation, path-based insertion,
//               fork, the op log, and JSON export

#include <replidoc-cpp/json.hpp>
#include <replidoc-cpp/replidoc.hpp>

#include <cstdint>
#include <cstdio>
#include <string>
#include <variant>

namespace rd = replidoc_cpp;

static auto list_id(const rd::Document& doc, std::string_view key) -> rd::ObjectId {
    return std::get<rd::ObjectRef>(*doc.get(rd::root_id, key)).id;
}

static void print_todos(const rd::Document& doc, const char* label) {
    const auto todos = list_id(doc, "todos");
    std::printf("\n=== %s (%zu items) ===\n", label, doc.length(todos));
    for (std::size_t i = 0; i < doc.length(todos); ++i) {
        const auto value = doc.get(todos, i);
        if (!value) continue;
        if (const auto* scalar = std::get_if<rd::ScalarValue>(&*value)) {
            if (const auto* s = std::get_if<std::string>(scalar)) {
                std::printf("  %zu. %s\n", i + 1, s->c_str());
            }
        }
    }
}

int main() {
    const std::uint8_t alice_id[16] = {1};
    auto alice = rd::Document{rd::ActorId{alice_id}};

    // One batch: a title, a list of todos, and a nested metadata map
    alice.transact([](rd::Context& ctx) {
        ctx.set_map_key({}, "title", "Team Tasks");
        ctx.set_map_key({}, "todos", rd::NestedList{"Set up CI pipeline", "Write unit tests"});
        ctx.set_map_key({}, "meta", rd::NestedMap{{"owner", "Alice"}, {"priority", "high"}});
    }, "create board");
    print_todos(alice, "Alice (initial)");

    // Bob works on his own copy of the document
    auto bob = alice.fork();
    const auto todos = list_id(alice, "todos");
    const auto path = rd::Path{{rd::map_key("todos"), todos}};

    alice.transact([&](rd::Context& ctx) { ctx.insert_list_items(path, 2, {"Review PRs"}); });
    bob.transact([&](rd::Context& ctx) { ctx.insert_list_items(path, 0, {"Update docs"}); });

    print_todos(alice, "Alice (after her edit)");
    print_todos(bob, "Bob (after his edit)");

    // Counters must not be overwritten
    alice.transact([](rd::Context& ctx) { ctx.set_map_key({}, "done", rd::Counter{0}); });
    try {
        alice.transact([](rd::Context& ctx) { ctx.set_map_key({}, "done", 1); });
    } catch (const rd::MutationError& e) {
        std::printf("\nRejected: %s (%s)\n", e.what(),
                    std::string{rd::to_string_view(e.kind())}.c_str());
    }

    std::printf("\nAlice's log:\n");
    for (const auto& change : alice.op_log()) {
        std::printf("  %s\n", nlohmann::json(change).dump().c_str());
    }

    std::printf("\nAlice's document:\n%s\n", rd::export_json(alice).dump(2).c_str());
    return 0;
}
