// text_editor: build a text object and inspect the patches it produces
//
// Demonstrates: text objects split per code point, insertion into text,
//               transact_with_patches, patch JSON

#include <replidoc-cpp/json.hpp>
#include <replidoc-cpp/logger.hpp>
#include <replidoc-cpp/replidoc.hpp>

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace rd = replidoc_cpp;

int main() {
    const std::uint8_t actor[16] = {1};
    auto doc = rd::Document{rd::ActorId{actor}};
    rd::set_log_level(rd::LogLevel::info);

    // Create a text object. transact returns the new object's id directly.
    const auto text_id = doc.transact([](rd::Context& ctx) {
        ctx.set_map_key({}, "content", rd::NestedText{"Hello World"});
        return *ctx.ops().front().child;
    });
    std::printf("Initial: \"%s\" (%zu characters)\n", doc.text(text_id).c_str(),
                doc.length(text_id));

    // Insert a word and look at the patch that was applied
    const auto path = rd::Path{{rd::map_key("content"), text_id}};
    const auto patches = doc.transact_with_patches([&](rd::Context& ctx) {
        auto chars = std::vector<rd::InputValue>{};
        for (const char c : std::string{", dear"}) chars.emplace_back(std::string(1, c));
        ctx.insert_list_items(path, 5, chars);
    });

    std::printf("After edit: \"%s\"\n", doc.text(text_id).c_str());
    std::printf("Patches generated: %zu\n", patches.size());
    for (const auto& patch : patches) {
        std::printf("%s\n", nlohmann::json(patch).dump(2).c_str());
    }

    // Multi-byte characters stay whole
    doc.transact([](rd::Context& ctx) {
        ctx.set_map_key({}, "greeting", rd::NestedText{"caf\xc3\xa9 \xe2\x98\x95"});
    });
    const auto greeting = std::get<rd::ObjectRef>(*doc.get(rd::root_id, "greeting")).id;
    std::printf("Greeting \"%s\" has %zu characters\n", doc.text(greeting).c_str(),
                doc.length(greeting));
    return 0;
}
