#pragma once

/** \file part_body.hpp
 *  \brief Read part payloads fully into memory from files, file ranges or streams.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <istream>
#include <vector>

#include "tessera/error.hpp"

namespace tessera::upload {

/** \brief Size of a regular file; invalid_argument if missing or not a regular file. */
auto regular_file_size(const std::filesystem::path& path)
    -> std::expected<std::uint64_t, core::error>;

/** \brief Read exactly `length` bytes starting at `offset`.
 *  io_failed when the file cannot be opened, io_eof when it is shorter than requested.
 */
auto read_file_range(const std::filesystem::path& path, std::uint64_t offset, std::uint64_t length)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

/** \brief Read exactly `length` bytes from the stream's current position; io_eof on short read. */
auto read_stream(std::istream& in, std::uint64_t length)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

} // namespace tessera::upload
