#include <replidoc-cpp/types.hpp>

#include <random>

namespace replidoc_cpp {

namespace {

auto bytes_to_hex(const std::byte* data, std::size_t len) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto result = std::string{};
    result.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        auto b = static_cast<unsigned char>(data[i]);
        result.push_back(hex_chars[b >> 4]);
        result.push_back(hex_chars[b & 0x0F]);
    }
    return result;
}

}  // namespace

auto to_string(const ActorId& id) -> std::string {
    return bytes_to_hex(id.bytes.data(), id.bytes.size());
}

auto to_string(const ObjectId& id) -> std::string {
    auto hex = bytes_to_hex(id.bytes.data(), id.bytes.size());
    // 8-4-4-4-12
    for (auto pos : {20u, 16u, 12u, 8u}) {
        hex.insert(pos, 1, '-');
    }
    return hex;
}

auto to_string(const Key& key) -> std::string {
    if (const auto* s = std::get_if<std::string>(&key)) return *s;
    return std::to_string(std::get<std::size_t>(key));
}

namespace {

auto engine() -> std::mt19937_64& {
    thread_local auto e = std::mt19937_64{std::random_device{}()};
    return e;
}

}  // namespace

auto random_object_id() -> ObjectId {
    auto id = ObjectId{};
    auto dist = std::uniform_int_distribution<unsigned int>{0, 255};
    for (auto& b : id.bytes) {
        b = static_cast<std::byte>(dist(engine()));
    }
    // Version 4, RFC 4122 variant. Also guarantees the result is never root.
    id.bytes[6] = (id.bytes[6] & std::byte{0x0F}) | std::byte{0x40};
    id.bytes[8] = (id.bytes[8] & std::byte{0x3F}) | std::byte{0x80};
    return id;
}

auto random_actor_id() -> ActorId {
    auto id = ActorId{};
    auto dist = std::uniform_int_distribution<unsigned int>{0, 255};
    do {
        for (auto& b : id.bytes) {
            b = static_cast<std::byte>(dist(engine()));
        }
    } while (id.is_zero());
    return id;
}

}  // namespace replidoc_cpp
