#include "tessera/upload/part_body.hpp"

#include <fstream>
#include <limits>
#include <string>
#include <system_error>

namespace tessera::upload {

auto regular_file_size(const std::filesystem::path& path)
    -> std::expected<std::uint64_t, core::error> {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return core::make_error(core::error_code::invalid_argument,
                            "not a regular file: " + path.string(), "upload.part_body");
  }
  const auto n = std::filesystem::file_size(path, ec);
  if (ec) {
    return core::make_error(core::error_code::io_failed,
                            "stat failed: " + path.string() + ": " + ec.message(), "upload.part_body");
  }
  return static_cast<std::uint64_t>(n);
}

static auto checked_length(std::uint64_t length) -> std::expected<std::size_t, core::error> {
  if (length > static_cast<std::uint64_t>(std::numeric_limits<std::streamsize>::max())) {
    return core::make_error(core::error_code::invalid_argument,
                            "part length too large", "upload.part_body");
  }
  return static_cast<std::size_t>(length);
}

auto read_file_range(const std::filesystem::path& path, std::uint64_t offset, std::uint64_t length)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
  auto n = checked_length(length);
  if (!n) return std::unexpected(n.error());

  std::ifstream in(path, std::ios::binary);
  if (!in.good()) {
    return core::make_error(core::error_code::io_failed,
                            "open failed: " + path.string(), "upload.part_body");
  }
  in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  if (!in.good()) {
    return core::make_error(core::error_code::io_eof,
                            "seek past end: " + path.string(), "upload.part_body");
  }
  return read_stream(in, length);
}

auto read_stream(std::istream& in, std::uint64_t length)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
  auto n = checked_length(length);
  if (!n) return std::unexpected(n.error());

  std::vector<std::uint8_t> buf(*n);
  if (*n == 0) return buf;
  in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(*n));
  const auto got = static_cast<std::size_t>(in.gcount());
  if (got != *n) {
    return core::make_error(core::error_code::io_eof,
                            "short read: expected " + std::to_string(*n) + " bytes, got " + std::to_string(got),
                            "upload.part_body");
  }
  return buf;
}

} // namespace tessera::upload
