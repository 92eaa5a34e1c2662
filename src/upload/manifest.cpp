#include "tessera/upload/manifest.hpp"

#include <algorithm>
#include <limits>
#include <mutex>

namespace tessera::upload {

MultipartManifest::MultipartManifest(std::string upload_id)
    : upload_id_(std::move(upload_id)) {}

MultipartManifest::MultipartManifest(std::string upload_id, const std::vector<PartSummary>& existing)
    : upload_id_(std::move(upload_id)), resumed_(existing) {
  std::sort(resumed_.begin(), resumed_.end(),
            [](const PartSummary& a, const PartSummary& b) { return a.part_number < b.part_number; });
  for (const auto& p : existing) {
    parts_[p.part_number] = PartRecord{PartState::Succeeded, p.etag};
    next_part_ = std::max<std::uint64_t>(next_part_, std::uint64_t{p.part_number} + 1);
  }
}

auto MultipartManifest::next_part_number() -> std::expected<std::uint32_t, core::error> {
  std::unique_lock lock(mutex_);
  if (next_part_ > std::numeric_limits<std::uint32_t>::max()) {
    return core::make_error(core::error_code::internal, "part numbers exhausted", "upload.manifest");
  }
  const auto n = static_cast<std::uint32_t>(next_part_);
  if (!parts_.emplace(n, PartRecord{}).second) {
    return core::make_error(core::error_code::internal,
                            "part " + std::to_string(n) + " already recorded", "upload.manifest");
  }
  ++next_part_;
  ++pending_;
  return n;
}

auto MultipartManifest::resolve(std::uint32_t part_number, PartState outcome, std::string etag)
    -> std::expected<void, core::error> {
  std::unique_lock lock(mutex_);
  if (aborted_) {
    return core::make_error(core::error_code::cancelled,
                            "upload aborted; part " + std::to_string(part_number) + " outcome discarded",
                            "upload.manifest");
  }
  auto it = parts_.find(part_number);
  if (it == parts_.end()) {
    return core::make_error(core::error_code::precondition_failed,
                            "unknown part " + std::to_string(part_number), "upload.manifest");
  }
  if (it->second.state != PartState::Pending) {
    return core::make_error(core::error_code::precondition_failed,
                            "part " + std::to_string(part_number) + " already resolved",
                            "upload.manifest");
  }
  it->second.state = outcome;
  it->second.etag = std::move(etag);
  --pending_;
  if (outcome == PartState::Failed) ++failed_;
  return {};
}

auto MultipartManifest::record_success(std::uint32_t part_number, std::string etag)
    -> std::expected<void, core::error> {
  return resolve(part_number, PartState::Succeeded, std::move(etag));
}

auto MultipartManifest::record_failure(std::uint32_t part_number)
    -> std::expected<void, core::error> {
  return resolve(part_number, PartState::Failed, {});
}

auto MultipartManifest::list_completed_parts() const -> std::vector<CommitPart> {
  std::shared_lock lock(mutex_);
  std::vector<CommitPart> out;
  out.reserve(parts_.size());
  for (const auto& [n, rec] : parts_) {
    if (rec.state == PartState::Succeeded) out.push_back(CommitPart{n, rec.etag});
  }
  return out;
}

auto MultipartManifest::list_failed_parts() const -> std::vector<std::uint32_t> {
  std::shared_lock lock(mutex_);
  std::vector<std::uint32_t> out;
  out.reserve(failed_);
  for (const auto& [n, rec] : parts_) {
    if (rec.state == PartState::Failed) out.push_back(n);
  }
  return out;
}

auto MultipartManifest::is_upload_complete() const -> bool {
  std::shared_lock lock(mutex_);
  return pending_ == 0;
}

auto MultipartManifest::is_upload_successful() const -> bool {
  std::shared_lock lock(mutex_);
  return pending_ == 0 && failed_ == 0 && !aborted_;
}

auto MultipartManifest::is_upload_aborted() const -> bool {
  std::shared_lock lock(mutex_);
  return aborted_;
}

auto MultipartManifest::mark_aborted() -> void {
  std::unique_lock lock(mutex_);
  aborted_ = true;
}

auto MultipartManifest::part_count() const -> std::size_t {
  std::shared_lock lock(mutex_);
  return parts_.size();
}

auto MultipartManifest::pending_count() const -> std::size_t {
  std::shared_lock lock(mutex_);
  return pending_;
}

} // namespace tessera::upload
