#include "tessera/upload/upload_manager.hpp"

#include <algorithm>
#include <iostream>
#include <string>

#include "tessera/core/platform_utils.hpp"
#include "tessera/upload/assembler.hpp"
#include "tessera/upload/part_body.hpp"

namespace tessera::upload {

namespace {
constexpr const char* kComponent = "upload.manager";
}

UploadManager::UploadManager(std::shared_ptr<ObjectStorage> service, UploadConfiguration config)
    : service_(std::move(service)), config_(config), pool_(config.parallelism == 0 ? 1 : config.parallelism) {}

auto UploadManager::upload_file(const UploadRequest& req) -> std::expected<UploadResponse, core::error> {
  if (auto ok = validate_configuration(config_); !ok) return std::unexpected(ok.error());

  auto size = regular_file_size(req.file);
  if (!size) return std::unexpected(size.error());

  const std::uint64_t part_size = effective_part_size(config_, *size);
  const std::uint64_t total_parts = *size == 0 ? 1 : (*size + part_size - 1) / part_size;
  const bool dbg = core::upload_debug_enabled();

  MultipartAssembler assembler(service_, ObjectTarget{req.namespace_name, req.bucket, req.object,
                                                      config_.allow_overwrite},
                               pool_);

  std::uint64_t first_part = 0;
  std::shared_ptr<const MultipartManifest> manifest;
  if (req.resume_upload_id) {
    auto m = assembler.resume_request(*req.resume_upload_id);
    if (!m) return std::unexpected(m.error());
    manifest = *m;
    // Resumed parts must be exactly the leading ranges 1..k of this file at
    // the current part size.
    const auto& existing = manifest->resumed_parts();
    if (existing.size() > total_parts) {
      return core::make_error(core::error_code::invalid_argument,
                              "resumed upload " + *req.resume_upload_id + " has more parts than the file",
                              kComponent);
    }
    for (std::size_t i = 0; i < existing.size(); ++i) {
      if (existing[i].part_number != i + 1) {
        return core::make_error(core::error_code::invalid_argument,
                                "resumed upload " + *req.resume_upload_id + " has non-contiguous parts",
                                kComponent);
      }
      const std::uint64_t expected_len = std::min(part_size, *size - i * part_size);
      if (existing[i].size != expected_len) {
        return core::make_error(core::error_code::invalid_argument,
                                "resumed upload " + *req.resume_upload_id + " part " +
                                    std::to_string(existing[i].part_number) + " holds " +
                                    std::to_string(existing[i].size) + " bytes, expected " +
                                    std::to_string(expected_len) + " at part size " + std::to_string(part_size),
                                kComponent);
      }
    }
    first_part = existing.size();
  } else {
    auto m = assembler.new_request(req.content_type, req.content_language, req.content_encoding, req.metadata);
    if (!m) return std::unexpected(m.error());
    manifest = *m;
  }

  if (dbg) {
    std::cerr << "[UPLOAD][manager] file=" << req.file.string() << " size=" << *size
              << " part_size=" << part_size << " parts=" << total_parts << " resume_from=" << first_part << std::endl;
  }

  std::size_t sent = 0;
  for (std::uint64_t i = first_part; i < total_parts; ++i) {
    const std::uint64_t offset = i * part_size;
    const std::uint64_t length = std::min(part_size, *size - offset);
    auto n = assembler.add_part(req.file, offset, length);
    if (!n) {
      // Parts already queued keep running; abort stops the server-side upload.
      if (config_.abort_on_failure) {
        if (auto aborted = assembler.abort(); !aborted && dbg) {
          std::cerr << "[UPLOAD][manager] abort after submit failure failed: " << aborted.error().message << std::endl;
        }
      }
      return std::unexpected(n.error());
    }
    ++sent;
  }

  auto committed = assembler.commit();
  if (!committed) {
    if (config_.abort_on_failure && !manifest->list_failed_parts().empty()) {
      AbortMultipartUploadRequest abort_req{req.namespace_name, req.bucket, req.object, manifest->upload_id()};
      if (auto aborted = service_->abort_multipart_upload(abort_req); !aborted && dbg) {
        std::cerr << "[UPLOAD][manager] abort after failed parts failed: " << aborted.error().message << std::endl;
      }
    }
    return std::unexpected(committed.error());
  }

  return UploadResponse{manifest->upload_id(), committed->etag,
                        manifest->list_completed_parts().size(), sent};
}

} // namespace tessera::upload
