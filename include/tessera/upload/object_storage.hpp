#pragma once

/** \file object_storage.hpp
 *  \brief Object-storage service port: the multipart RPCs the assembler depends on.
 *
 * Implementations are expected to be safe for concurrent calls; the assembler
 * issues upload_part from executor threads while the controlling thread may be
 * inside abort_multipart_upload. Retry policy, if any, belongs to the
 * implementation.
 */

#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "tessera/error.hpp"

namespace tessera::upload {

/** Value of the conditional header that makes a write create-only. */
inline constexpr const char* kIfNoneMatchAny = "*";

/** Highest part number the service accepts. */
inline constexpr std::uint32_t kMaxPartNumber = 10000;

struct CreateMultipartUploadRequest {
  std::string namespace_name;
  std::string bucket;
  std::string object;
  std::string content_type;
  std::string content_language;
  std::string content_encoding;
  std::map<std::string, std::string> metadata;  /**< user metadata (opc-meta-*) */
};

struct MultipartUploadSummary {
  std::string upload_id;
  std::string object;
};

struct ListMultipartUploadsRequest {
  std::string namespace_name;
  std::string bucket;
  std::optional<std::string> page;  /**< continuation token; nullopt for the first page */
  std::uint32_t limit{100};
};

struct MultipartUploadPage {
  std::vector<MultipartUploadSummary> items;
  std::optional<std::string> next_page;
};

struct PartSummary {
  std::uint32_t part_number{};
  std::string etag;
  std::uint64_t size{};
};

struct ListMultipartUploadPartsRequest {
  std::string namespace_name;
  std::string bucket;
  std::string object;
  std::string upload_id;
  std::optional<std::string> page;
  std::uint32_t limit{100};
};

struct PartPage {
  std::vector<PartSummary> items;
  std::optional<std::string> next_page;
};

struct UploadPartRequest {
  std::string namespace_name;
  std::string bucket;
  std::string object;
  std::string upload_id;
  std::uint32_t part_number{};
  std::optional<std::string> content_digest;  /**< caller-supplied integrity digest, passed through */
  std::optional<std::string> if_none_match;   /**< "*" makes the part write create-only */
  std::vector<std::uint8_t> body;
};

struct UploadPartResult {
  std::string etag;
};

/** \brief One entry of the commit part list. */
struct CommitPart {
  std::uint32_t part_number{};
  std::string etag;

  friend bool operator==(const CommitPart&, const CommitPart&) = default;
};

struct CommitMultipartUploadRequest {
  std::string namespace_name;
  std::string bucket;
  std::string object;
  std::string upload_id;
  std::vector<CommitPart> parts;             /**< ordered by part number; defines assembly order */
  std::optional<std::string> if_none_match;  /**< "*" refuses to replace an existing object */
};

struct CommitMultipartUploadResult {
  std::string etag;
};

struct AbortMultipartUploadRequest {
  std::string namespace_name;
  std::string bucket;
  std::string object;
  std::string upload_id;
};

struct AbortMultipartUploadResult {
  std::string upload_id;
};

/** \brief Abstract object-storage service (multipart subset). */
class ObjectStorage {
public:
  virtual ~ObjectStorage() = default;

  /** \brief Start a multipart upload; returns the service-assigned upload id. */
  virtual auto create_multipart_upload(const CreateMultipartUploadRequest& req)
      -> std::expected<std::string, core::error> = 0;

  virtual auto list_multipart_uploads(const ListMultipartUploadsRequest& req)
      -> std::expected<MultipartUploadPage, core::error> = 0;

  virtual auto list_multipart_upload_parts(const ListMultipartUploadPartsRequest& req)
      -> std::expected<PartPage, core::error> = 0;

  /** \brief Store one part. Fails on digest mismatch or, with if_none_match, on an existing part. */
  virtual auto upload_part(const UploadPartRequest& req)
      -> std::expected<UploadPartResult, core::error> = 0;

  virtual auto commit_multipart_upload(const CommitMultipartUploadRequest& req)
      -> std::expected<CommitMultipartUploadResult, core::error> = 0;

  virtual auto abort_multipart_upload(const AbortMultipartUploadRequest& req)
      -> std::expected<AbortMultipartUploadResult, core::error> = 0;
};

} // namespace tessera::upload
