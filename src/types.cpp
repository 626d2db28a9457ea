#include <collab-cpp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <random>

namespace collab_cpp {

namespace {

constexpr char hex_chars[] = "0123456789abcdef";

auto hex_char_to_nibble(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Byte offsets at which the canonical form inserts a dash.
constexpr bool dash_before(std::size_t byte_index) {
    return byte_index == 4 || byte_index == 6 || byte_index == 8 || byte_index == 10;
}

}  // anonymous namespace

auto Uuid::random() -> Uuid {
    thread_local auto engine = [] {
        auto seed = std::random_device{};
        return std::mt19937_64{(static_cast<std::uint64_t>(seed()) << 32) | seed()};
    }();
    auto dist = std::uniform_int_distribution<std::uint64_t>{};

    auto id = Uuid{};
    for (std::size_t half = 0; half < 2; ++half) {
        auto word = dist(engine);
        for (std::size_t i = 0; i < 8; ++i) {
            id.bytes[half * 8 + i] = static_cast<std::byte>(word >> (i * 8));
        }
    }
    // Version 4, RFC 4122 variant
    id.bytes[6] = (id.bytes[6] & std::byte{0x0F}) | std::byte{0x40};
    id.bytes[8] = (id.bytes[8] & std::byte{0x3F}) | std::byte{0x80};
    return id;
}

auto Uuid::parse(std::string_view text) -> std::optional<Uuid> {
    if (text.size() != size * 2 + 4) return std::nullopt;

    auto id = Uuid{};
    auto pos = std::size_t{0};
    for (std::size_t i = 0; i < size; ++i) {
        if (dash_before(i)) {
            if (text[pos] != '-') return std::nullopt;
            ++pos;
        }
        auto hi = hex_char_to_nibble(text[pos]);
        auto lo = hex_char_to_nibble(text[pos + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        id.bytes[i] = static_cast<std::byte>((hi << 4) | lo);
        pos += 2;
    }
    return id;
}

auto Uuid::to_string() const -> std::string {
    auto result = std::string{};
    result.reserve(size * 2 + 4);
    for (std::size_t i = 0; i < size; ++i) {
        if (dash_before(i)) result.push_back('-');
        auto b = static_cast<unsigned char>(bytes[i]);
        result.push_back(hex_chars[b >> 4]);
        result.push_back(hex_chars[b & 0x0F]);
    }
    return result;
}

}  // namespace collab_cpp
