/** \file local_object_store.hpp
 *  \brief Filesystem-backed ObjectStorage for local runs and integration tests.
 *
 * Layout under the root directory:
 *   <ns>/<bucket>/uploads/<upload-id>/upload.meta
 *   <ns>/<bucket>/uploads/<upload-id>/part-NNNNN       part bytes
 *   <ns>/<bucket>/uploads/<upload-id>/part-NNNNN.etag  entity tag of the part
 *   <ns>/<bucket>/objects/<percent-encoded object name>
 *
 * Entity tags are the lowercase hex CRC-32C of the stored bytes. A supplied
 * content digest must equal that tag. Page tokens are decimal offsets.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <mutex>
#include <random>
#include <string>

#include "tessera/error.hpp"
#include "tessera/upload/object_storage.hpp"

namespace tessera::store {

class LocalObjectStore final : public upload::ObjectStorage {
public:
    explicit LocalObjectStore(std::filesystem::path root);

    auto create_multipart_upload(const upload::CreateMultipartUploadRequest& req)
        -> std::expected<std::string, core::error> override;

    auto list_multipart_uploads(const upload::ListMultipartUploadsRequest& req)
        -> std::expected<upload::MultipartUploadPage, core::error> override;

    auto list_multipart_upload_parts(const upload::ListMultipartUploadPartsRequest& req)
        -> std::expected<upload::PartPage, core::error> override;

    auto upload_part(const upload::UploadPartRequest& req)
        -> std::expected<upload::UploadPartResult, core::error> override;

    auto commit_multipart_upload(const upload::CommitMultipartUploadRequest& req)
        -> std::expected<upload::CommitMultipartUploadResult, core::error> override;

    auto abort_multipart_upload(const upload::AbortMultipartUploadRequest& req)
        -> std::expected<upload::AbortMultipartUploadResult, core::error> override;

    /** \brief Path a committed object is stored at (exists only after commit). */
    [[nodiscard]] auto object_path(const std::string& namespace_name, const std::string& bucket,
                                   const std::string& object) const -> std::filesystem::path;

    [[nodiscard]] auto root() const noexcept -> const std::filesystem::path& { return root_; }

private:
    auto bucket_dir(const std::string& namespace_name, const std::string& bucket) const
        -> std::expected<std::filesystem::path, core::error>;
    auto upload_dir(const std::string& namespace_name, const std::string& bucket,
                    const std::string& upload_id) const
        -> std::expected<std::filesystem::path, core::error>;
    auto new_upload_id() -> std::string;

    std::filesystem::path root_;
    std::mutex mutex_;          // guards directory-level state changes and rng_
    std::mt19937_64 rng_;
    std::atomic<std::uint64_t> tmp_seq_{0};
};

/** \brief Percent-encode everything outside [A-Za-z0-9._-]. */
auto encode_object_name(const std::string& name) -> std::string;

/** \brief Inverse of encode_object_name; invalid_argument on malformed escapes. */
auto decode_object_name(const std::string& encoded) -> std::expected<std::string, core::error>;

} // namespace tessera::store
