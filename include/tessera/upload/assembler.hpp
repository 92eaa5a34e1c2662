#pragma once

/** \file assembler.hpp
 *  \brief Multipart upload session controller.
 *
 * Lifecycle: Uninitialized -> Active (new_request or resume_request, once)
 *            Active -> Finalized (commit or abort, once).
 *
 * One thread drives the lifecycle calls. Part uploads run on the caller's
 * Executor; their failures are recorded in the manifest and never returned
 * from add_part. commit() is the only call that waits for part tasks.
 *
 * Thread-safety: lifecycle methods are not thread-safe with respect to each
 * other. The returned manifest may be queried from any thread.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <future>
#include <istream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tessera/error.hpp"
#include "tessera/upload/executor.hpp"
#include "tessera/upload/manifest.hpp"
#include "tessera/upload/object_storage.hpp"

namespace tessera::upload {

enum class SessionState : std::uint8_t { Uninitialized, Active, Finalized };

/** Page size used when enumerating uploads and parts on resume. */
inline constexpr std::uint32_t kResumeListLimit = 100;

/** \brief Immutable target of an assembler. */
struct ObjectTarget {
  std::string namespace_name;
  std::string bucket;
  std::string object;
  bool allow_overwrite{true};  /**< false: commit is create-only */
};

class MultipartAssembler {
public:
  /**
   * \param service  storage port; shared with in-flight part tasks
   * \param target   namespace/bucket/object this assembler uploads to
   * \param executor runs part uploads; must outlive every submitted task
   */
  MultipartAssembler(std::shared_ptr<ObjectStorage> service, ObjectTarget target, Executor& executor);
  ~MultipartAssembler();

  MultipartAssembler(const MultipartAssembler&) = delete;
  MultipartAssembler& operator=(const MultipartAssembler&) = delete;

  /** \brief Create a new multipart upload and activate the session. */
  auto new_request(const std::string& content_type,
                   const std::string& content_language,
                   const std::string& content_encoding,
                   const std::map<std::string, std::string>& metadata)
      -> std::expected<std::shared_ptr<const MultipartManifest>, core::error>;

  /** \brief Resume an in-progress upload of the bound bucket.
   *  invalid_argument when no page of list_multipart_uploads contains upload_id.
   */
  auto resume_request(const std::string& upload_id)
      -> std::expected<std::shared_ptr<const MultipartManifest>, core::error>;

  /** \brief Upload a whole file as the next part. Returns the reserved part number. */
  auto add_part(const std::filesystem::path& file,
                std::optional<std::string> content_digest = std::nullopt)
      -> std::expected<std::uint32_t, core::error>;

  /** \brief Upload `length` bytes of `file` starting at `offset` as the next part. */
  auto add_part(const std::filesystem::path& file, std::uint64_t offset, std::uint64_t length,
                std::optional<std::string> content_digest = std::nullopt)
      -> std::expected<std::uint32_t, core::error>;

  /** \brief Upload `length` bytes read now from `in`. A stream without a length is rejected. */
  auto add_part(std::istream& in, std::optional<std::uint64_t> length,
                std::optional<std::string> content_digest = std::nullopt)
      -> std::expected<std::uint32_t, core::error>;

  /** \brief Upload an in-memory buffer as the next part. */
  auto add_part(std::vector<std::uint8_t> bytes,
                std::optional<std::string> content_digest = std::nullopt)
      -> std::expected<std::uint32_t, core::error>;

  /** \brief Wait for all parts, then commit them in part-number order.
   *  precondition_failed (commit endpoint not called) when any part failed;
   *  the server-side upload is left open for the caller to abort.
   */
  auto commit() -> std::expected<CommitMultipartUploadResult, core::error>;

  /** \brief Abort the server-side upload without waiting for in-flight parts. */
  auto abort() -> std::expected<AbortMultipartUploadResult, core::error>;

  [[nodiscard]] auto state() const noexcept -> SessionState { return state_; }
  [[nodiscard]] auto target() const noexcept -> const ObjectTarget& { return target_; }
  /** \brief Manifest of the current session; null before new/resume. */
  [[nodiscard]] auto manifest() const noexcept -> std::shared_ptr<const MultipartManifest> { return manifest_; }

private:
  struct PartPayload;

  auto require_state(SessionState expected, const char* op) const -> std::expected<void, core::error>;
  auto find_upload(const std::string& upload_id) -> std::expected<bool, core::error>;
  auto list_existing_parts(const std::string& upload_id) -> std::expected<std::vector<PartSummary>, core::error>;
  auto submit(std::shared_ptr<PartPayload> payload, std::optional<std::string> content_digest)
      -> std::expected<std::uint32_t, core::error>;

  std::shared_ptr<ObjectStorage> service_;
  const ObjectTarget target_;
  Executor& executor_;
  SessionState state_{SessionState::Uninitialized};
  std::shared_ptr<MultipartManifest> manifest_;
  std::vector<std::future<void>> in_flight_;
};

} // namespace tessera::upload
