#pragma once

/** \file manifest.hpp
 *  \brief Thread-safe ledger of part outcomes for one multipart upload session.
 *
 * Part numbers are handed out by next_part_number() in call order and the
 * pending record is inserted under the same lock, so two submitters never see
 * the same number and readers never see a number without its record.
 * Completion order has no effect on numbering or on list ordering.
 */

#include <cstdint>
#include <expected>
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

#include "tessera/error.hpp"
#include "tessera/upload/object_storage.hpp"

namespace tessera::upload {

enum class PartState : std::uint8_t { Pending, Succeeded, Failed };

struct PartRecord {
  PartState state{PartState::Pending};
  std::string etag;  /**< set when Succeeded */
};

class MultipartManifest {
public:
  /** \brief Fresh session; part numbering starts at 1. */
  explicit MultipartManifest(std::string upload_id);

  /** \brief Resumed session seeded with parts already stored by the service.
   *  Numbering continues at max(part_number) + 1.
   */
  MultipartManifest(std::string upload_id, const std::vector<PartSummary>& existing);

  MultipartManifest(const MultipartManifest&) = delete;
  MultipartManifest& operator=(const MultipartManifest&) = delete;

  [[nodiscard]] auto upload_id() const noexcept -> const std::string& { return upload_id_; }

  /** \brief Reserve the next part number and register it as Pending.
   *  internal when the numbering is exhausted or the number is already recorded.
   */
  auto next_part_number() -> std::expected<std::uint32_t, core::error>;

  /** \brief Pending -> Succeeded.
   *  precondition_failed for an unknown or already resolved part; cancelled once aborted.
   */
  auto record_success(std::uint32_t part_number, std::string etag)
      -> std::expected<void, core::error>;

  /** \brief Pending -> Failed. Same error rules as record_success. */
  auto record_failure(std::uint32_t part_number) -> std::expected<void, core::error>;

  /** \brief Succeeded parts ordered by part number. */
  [[nodiscard]] auto list_completed_parts() const -> std::vector<CommitPart>;

  /** \brief Failed part numbers, ascending. */
  [[nodiscard]] auto list_failed_parts() const -> std::vector<std::uint32_t>;

  [[nodiscard]] auto is_upload_complete() const -> bool;
  [[nodiscard]] auto is_upload_successful() const -> bool;
  [[nodiscard]] auto is_upload_aborted() const -> bool;

  /** \brief Irreversibly mark the session aborted. */
  auto mark_aborted() -> void;

  /** \brief Parts the session was seeded with on resume, ascending; empty for a fresh session. */
  [[nodiscard]] auto resumed_parts() const noexcept -> const std::vector<PartSummary>& { return resumed_; }

  [[nodiscard]] auto part_count() const -> std::size_t;
  [[nodiscard]] auto pending_count() const -> std::size_t;

private:
  auto resolve(std::uint32_t part_number, PartState outcome, std::string etag)
      -> std::expected<void, core::error>;

  const std::string upload_id_;
  std::vector<PartSummary> resumed_;  // immutable after construction
  mutable std::shared_mutex mutex_;
  std::map<std::uint32_t, PartRecord> parts_;
  std::uint64_t next_part_{1};  // wider than part numbers so seeding never wraps
  std::size_t pending_{0};
  std::size_t failed_{0};
  bool aborted_{false};
};

} // namespace tessera::upload
