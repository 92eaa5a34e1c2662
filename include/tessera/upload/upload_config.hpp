#pragma once

/** \file upload_config.hpp
 *  \brief Tunables for file uploads driven by UploadManager.
 *
 * Environment overrides (applied by apply_env_overrides):
 *   TESSERA_UPLOAD_PART_SIZE        bytes per part
 *   TESSERA_UPLOAD_PARALLELISM      worker threads
 *   TESSERA_UPLOAD_MAX_PARTS        upper bound on parts per object
 *   TESSERA_UPLOAD_ALLOW_OVERWRITE  0 or 1
 */

#include <cstddef>
#include <cstdint>
#include <expected>

#include "tessera/error.hpp"

namespace tessera::upload {

/** Largest part count accepted by the service for one upload. */
inline constexpr std::size_t kMaxPartsLimit = 10000;

struct UploadConfiguration {
  std::uint64_t part_size{128ull * 1024 * 1024};
  std::uint64_t min_part_size{1ull * 1024 * 1024};
  std::size_t max_parts{kMaxPartsLimit};
  std::size_t parallelism{3};
  bool allow_overwrite{true};
  bool abort_on_failure{true};  /**< UploadManager aborts the server-side upload when parts fail */
};

auto validate_configuration(const UploadConfiguration& cfg) -> std::expected<void, core::error>;

/** \brief Copy of cfg with environment overrides applied, then validated. */
auto apply_env_overrides(UploadConfiguration cfg) -> std::expected<UploadConfiguration, core::error>;

/** \brief Part size for an object: cfg.part_size, grown so the object fits in cfg.max_parts parts. */
[[nodiscard]] auto effective_part_size(const UploadConfiguration& cfg, std::uint64_t object_size) -> std::uint64_t;

} // namespace tessera::upload
