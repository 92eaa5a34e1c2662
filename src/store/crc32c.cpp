#include "tessera/store/crc32c.hpp"

#include <array>

namespace tessera::store {

// Reflected CRC-32C table using reversed polynomial 0x82F63B78
static constexpr std::array<std::uint32_t, 256> CRC32C_TABLE = []{
    std::array<std::uint32_t, 256> t{};
    const std::uint32_t poly = 0x82F63B78u;
    for (std::uint32_t i = 0; i < 256; ++i) {
        std::uint32_t c = i;
        for (int k = 0; k < 8; ++k) {
            c = (c & 1u) ? (poly ^ (c >> 1)) : (c >> 1);
        }
        t[i] = c;
    }
    return t;
}();

auto Crc32c::update(std::span<const std::uint8_t> bytes) -> void {
    std::uint32_t c = state_;
    for (auto b : bytes) {
        c = CRC32C_TABLE[(c ^ b) & 0xFFu] ^ (c >> 8);
    }
    state_ = c;
}

auto crc32c(std::span<const std::uint8_t> bytes) -> std::uint32_t {
    Crc32c c;
    c.update(bytes);
    return c.value();
}

auto to_hex(std::uint32_t v) -> std::string {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out(8, '0');
    for (int i = 7; i >= 0; --i) {
        out[static_cast<std::size_t>(i)] = digits[v & 0xFu];
        v >>= 4;
    }
    return out;
}

} // namespace tessera::store
