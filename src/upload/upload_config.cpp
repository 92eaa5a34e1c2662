#include "tessera/upload/upload_config.hpp"

#include <charconv>
#include <string>

#include "tessera/core/platform_utils.hpp"

namespace tessera::upload {

namespace {

constexpr const char* kComponent = "upload.config";

auto parse_u64(const std::string& s, std::uint64_t& out) -> bool {
  const char* beg = s.data(); const char* end = beg + s.size();
  unsigned long long tmp = 0;
  auto [ptr, ec] = std::from_chars(beg, end, tmp, 10);
  if (ec != std::errc() || ptr != end) return false;
  out = static_cast<std::uint64_t>(tmp);
  return true;
}

auto env_u64(const char* name, std::uint64_t& out) -> std::expected<void, core::error> {
  auto v = core::safe_getenv(name);
  if (!v || v->empty()) return {};
  if (!parse_u64(*v, out)) {
    return core::make_error(core::error_code::config_invalid,
                            std::string(name) + "=\"" + *v + "\" is not an unsigned integer", kComponent);
  }
  return {};
}

} // namespace

auto validate_configuration(const UploadConfiguration& cfg) -> std::expected<void, core::error> {
  if (cfg.min_part_size == 0) {
    return core::make_error(core::error_code::config_invalid, "min_part_size must be positive", kComponent);
  }
  if (cfg.part_size < cfg.min_part_size) {
    return core::make_error(core::error_code::config_invalid,
                            "part_size " + std::to_string(cfg.part_size) + " below min_part_size " +
                                std::to_string(cfg.min_part_size),
                            kComponent);
  }
  if (cfg.max_parts == 0 || cfg.max_parts > kMaxPartsLimit) {
    return core::make_error(core::error_code::config_invalid,
                            "max_parts must be in [1, " + std::to_string(kMaxPartsLimit) + "]", kComponent);
  }
  if (cfg.parallelism == 0) {
    return core::make_error(core::error_code::config_invalid, "parallelism must be positive", kComponent);
  }
  return {};
}

auto apply_env_overrides(UploadConfiguration cfg) -> std::expected<UploadConfiguration, core::error> {
  if (auto r = env_u64("TESSERA_UPLOAD_PART_SIZE", cfg.part_size); !r) return std::unexpected(r.error());

  std::uint64_t tmp = cfg.parallelism;
  if (auto r = env_u64("TESSERA_UPLOAD_PARALLELISM", tmp); !r) return std::unexpected(r.error());
  cfg.parallelism = static_cast<std::size_t>(tmp);

  tmp = cfg.max_parts;
  if (auto r = env_u64("TESSERA_UPLOAD_MAX_PARTS", tmp); !r) return std::unexpected(r.error());
  cfg.max_parts = static_cast<std::size_t>(tmp);

  if (auto v = core::safe_getenv("TESSERA_UPLOAD_ALLOW_OVERWRITE"); v && !v->empty()) {
    if (*v == "1") cfg.allow_overwrite = true;
    else if (*v == "0") cfg.allow_overwrite = false;
    else {
      return core::make_error(core::error_code::config_invalid,
                              "TESSERA_UPLOAD_ALLOW_OVERWRITE must be 0 or 1", kComponent);
    }
  }

  if (auto ok = validate_configuration(cfg); !ok) return std::unexpected(ok.error());
  return cfg;
}

auto effective_part_size(const UploadConfiguration& cfg, std::uint64_t object_size) -> std::uint64_t {
  const std::uint64_t max_parts = cfg.max_parts == 0 ? 1 : cfg.max_parts;
  const std::uint64_t needed = (object_size + max_parts - 1) / max_parts;
  return needed > cfg.part_size ? needed : cfg.part_size;
}

} // namespace tessera::upload
