#pragma once

/** \file upload_manager.hpp
 *  \brief Upload a file as a multipart object: split, submit, commit.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "tessera/error.hpp"
#include "tessera/upload/object_storage.hpp"
#include "tessera/upload/thread_pool.hpp"
#include "tessera/upload/upload_config.hpp"

namespace tessera::upload {

struct UploadRequest {
  std::string namespace_name;
  std::string bucket;
  std::string object;
  std::filesystem::path file;
  std::string content_type;
  std::string content_language;
  std::string content_encoding;
  std::map<std::string, std::string> metadata;
  std::optional<std::string> resume_upload_id;  /**< continue this upload instead of creating one */
};

struct UploadResponse {
  std::string upload_id;
  std::string etag;
  std::size_t part_count{};      /**< parts in the committed object */
  std::size_t parts_uploaded{};  /**< parts sent by this call (excludes resumed ones) */
};

class UploadManager {
public:
  /** \throws nothing; an invalid configuration is reported by upload_file. */
  UploadManager(std::shared_ptr<ObjectStorage> service, UploadConfiguration config);

  UploadManager(const UploadManager&) = delete;
  UploadManager& operator=(const UploadManager&) = delete;

  auto upload_file(const UploadRequest& req) -> std::expected<UploadResponse, core::error>;

  [[nodiscard]] auto config() const noexcept -> const UploadConfiguration& { return config_; }

private:
  std::shared_ptr<ObjectStorage> service_;
  UploadConfiguration config_;
  ThreadPool pool_;
};

} // namespace tessera::upload
