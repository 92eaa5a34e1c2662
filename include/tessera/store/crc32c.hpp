#pragma once

/** \file crc32c.hpp
 *  \brief CRC-32C (Castagnoli), used by the local store as its entity tag.
 */

#include <cstdint>
#include <span>
#include <string>

namespace tessera::store {

/** \brief One-shot CRC-32C of a byte range. */
auto crc32c(std::span<const std::uint8_t> bytes) -> std::uint32_t;

/** \brief Incremental CRC-32C over several ranges. */
class Crc32c {
public:
    auto update(std::span<const std::uint8_t> bytes) -> void;
    [[nodiscard]] auto value() const noexcept -> std::uint32_t { return ~state_; }

private:
    std::uint32_t state_{~0u};
};

/** \brief Eight lowercase hex digits. */
auto to_hex(std::uint32_t v) -> std::string;

} // namespace tessera::store
