#include "tessera/upload/assembler.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>

#include "tessera/core/platform_utils.hpp"
#include "tessera/upload/part_body.hpp"

namespace tessera::upload {

namespace {

constexpr const char* kComponent = "upload.assembler";

auto state_name(SessionState s) -> const char* {
  switch (s) {
    case SessionState::Uninitialized: return "uninitialized";
    case SessionState::Active: return "active";
    case SessionState::Finalized: return "finalized";
  }
  return "unknown";
}

} // namespace

// Bytes captured at submission, or a file range read by the worker.
struct MultipartAssembler::PartPayload {
  std::vector<std::uint8_t> bytes;
  std::optional<std::filesystem::path> file;
  std::uint64_t offset{};
  std::uint64_t length{};

  auto take() -> std::expected<std::vector<std::uint8_t>, core::error> {
    if (file) return read_file_range(*file, offset, length);
    return std::move(bytes);
  }
};

MultipartAssembler::MultipartAssembler(std::shared_ptr<ObjectStorage> service, ObjectTarget target,
                                       Executor& executor)
    : service_(std::move(service)), target_(std::move(target)), executor_(executor) {}

// In-flight tasks own shared references to the service and manifest, so
// destroying the assembler does not wait for them.
MultipartAssembler::~MultipartAssembler() = default;

auto MultipartAssembler::require_state(SessionState expected, const char* op) const
    -> std::expected<void, core::error> {
  if (state_ != expected) {
    return core::make_error(core::error_code::precondition_failed,
                            std::string(op) + " requires " + state_name(expected) +
                                " session, current state is " + state_name(state_),
                            kComponent);
  }
  return {};
}

auto MultipartAssembler::new_request(const std::string& content_type,
                                     const std::string& content_language,
                                     const std::string& content_encoding,
                                     const std::map<std::string, std::string>& metadata)
    -> std::expected<std::shared_ptr<const MultipartManifest>, core::error> {
  if (auto ok = require_state(SessionState::Uninitialized, "new_request"); !ok) {
    return std::unexpected(ok.error());
  }

  CreateMultipartUploadRequest req{target_.namespace_name, target_.bucket, target_.object,
                                   content_type, content_language, content_encoding, metadata};
  auto upload_id = service_->create_multipart_upload(req);
  if (!upload_id) return std::unexpected(upload_id.error());

  manifest_ = std::make_shared<MultipartManifest>(std::move(*upload_id));
  state_ = SessionState::Active;
  if (core::upload_debug_enabled()) {
    std::cerr << "[UPLOAD][new] object=" << target_.object << " upload_id=" << manifest_->upload_id() << std::endl;
  }
  return std::shared_ptr<const MultipartManifest>(manifest_);
}

auto MultipartAssembler::find_upload(const std::string& upload_id) -> std::expected<bool, core::error> {
  ListMultipartUploadsRequest req{target_.namespace_name, target_.bucket, std::nullopt, kResumeListLimit};
  while (true) {
    auto page = service_->list_multipart_uploads(req);
    if (!page) return std::unexpected(page.error());

    auto it = std::find_if(page->items.begin(), page->items.end(),
                           [&](const MultipartUploadSummary& u) { return u.upload_id == upload_id; });
    if (it != page->items.end()) {
      if (!it->object.empty() && it->object != target_.object) {
        return core::make_error(core::error_code::invalid_argument,
                                "upload " + upload_id + " targets object " + it->object +
                                    ", not " + target_.object,
                                kComponent);
      }
      return true;
    }
    if (!page->next_page) return false;
    req.page = std::move(page->next_page);
  }
}

auto MultipartAssembler::list_existing_parts(const std::string& upload_id)
    -> std::expected<std::vector<PartSummary>, core::error> {
  ListMultipartUploadPartsRequest req{target_.namespace_name, target_.bucket, target_.object,
                                      upload_id, std::nullopt, kResumeListLimit};
  std::vector<PartSummary> parts;
  while (true) {
    auto page = service_->list_multipart_upload_parts(req);
    if (!page) return std::unexpected(page.error());
    for (auto& p : page->items) {
      if (p.part_number == 0 || p.part_number > kMaxPartNumber) {
        return core::make_error(core::error_code::data_integrity,
                                "service listed part number " + std::to_string(p.part_number) +
                                    " for upload " + upload_id,
                                kComponent);
      }
      parts.push_back(std::move(p));
    }
    if (!page->next_page) break;
    req.page = std::move(page->next_page);
  }
  std::sort(parts.begin(), parts.end(),
            [](const PartSummary& a, const PartSummary& b) { return a.part_number < b.part_number; });
  return parts;
}

auto MultipartAssembler::resume_request(const std::string& upload_id)
    -> std::expected<std::shared_ptr<const MultipartManifest>, core::error> {
  if (auto ok = require_state(SessionState::Uninitialized, "resume_request"); !ok) {
    return std::unexpected(ok.error());
  }

  auto found = find_upload(upload_id);
  if (!found) return std::unexpected(found.error());
  if (!*found) {
    return core::make_error(core::error_code::invalid_argument,
                            "no in-progress multipart upload " + upload_id + " in bucket " + target_.bucket,
                            kComponent);
  }

  auto parts = list_existing_parts(upload_id);
  if (!parts) return std::unexpected(parts.error());

  manifest_ = std::make_shared<MultipartManifest>(upload_id, *parts);
  state_ = SessionState::Active;
  if (core::upload_debug_enabled()) {
    std::cerr << "[UPLOAD][resume] upload_id=" << upload_id << " existing_parts=" << parts->size() << std::endl;
  }
  return std::shared_ptr<const MultipartManifest>(manifest_);
}

auto MultipartAssembler::add_part(const std::filesystem::path& file,
                                  std::optional<std::string> content_digest)
    -> std::expected<std::uint32_t, core::error> {
  if (auto ok = require_state(SessionState::Active, "add_part"); !ok) {
    return std::unexpected(ok.error());
  }
  auto size = regular_file_size(file);
  if (!size) return std::unexpected(size.error());
  return add_part(file, 0, *size, std::move(content_digest));
}

auto MultipartAssembler::add_part(const std::filesystem::path& file, std::uint64_t offset,
                                  std::uint64_t length, std::optional<std::string> content_digest)
    -> std::expected<std::uint32_t, core::error> {
  if (auto ok = require_state(SessionState::Active, "add_part"); !ok) {
    return std::unexpected(ok.error());
  }
  auto size = regular_file_size(file);
  if (!size) return std::unexpected(size.error());
  if (offset > *size || length > *size - offset) {
    return core::make_error(core::error_code::invalid_argument,
                            "range [" + std::to_string(offset) + ", +" + std::to_string(length) +
                                ") exceeds size of " + file.string(),
                            kComponent);
  }

  auto payload = std::make_shared<PartPayload>();
  payload->file = file;
  payload->offset = offset;
  payload->length = length;
  return submit(std::move(payload), std::move(content_digest));
}

auto MultipartAssembler::add_part(std::istream& in, std::optional<std::uint64_t> length,
                                  std::optional<std::string> content_digest)
    -> std::expected<std::uint32_t, core::error> {
  if (auto ok = require_state(SessionState::Active, "add_part"); !ok) {
    return std::unexpected(ok.error());
  }
  if (!length) {
    return core::make_error(core::error_code::invalid_argument,
                            "stream part requires an explicit length", kComponent);
  }
  auto bytes = read_stream(in, *length);
  if (!bytes) return std::unexpected(bytes.error());

  auto payload = std::make_shared<PartPayload>();
  payload->bytes = std::move(*bytes);
  return submit(std::move(payload), std::move(content_digest));
}

auto MultipartAssembler::add_part(std::vector<std::uint8_t> bytes,
                                  std::optional<std::string> content_digest)
    -> std::expected<std::uint32_t, core::error> {
  if (auto ok = require_state(SessionState::Active, "add_part"); !ok) {
    return std::unexpected(ok.error());
  }
  auto payload = std::make_shared<PartPayload>();
  payload->bytes = std::move(bytes);
  return submit(std::move(payload), std::move(content_digest));
}

auto MultipartAssembler::submit(std::shared_ptr<PartPayload> payload,
                                std::optional<std::string> content_digest)
    -> std::expected<std::uint32_t, core::error> {
  auto reserved = manifest_->next_part_number();
  if (!reserved) return std::unexpected(reserved.error());
  const std::uint32_t part_number = *reserved;

  UploadPartRequest req;
  req.namespace_name = target_.namespace_name;
  req.bucket = target_.bucket;
  req.object = target_.object;
  req.upload_id = manifest_->upload_id();
  req.part_number = part_number;
  req.content_digest = std::move(content_digest);
  req.if_none_match = kIfNoneMatchAny;

  auto task = std::make_shared<std::packaged_task<void()>>(
      [service = service_, manifest = manifest_, payload = std::move(payload), req = std::move(req)]() mutable {
        const bool dbg = core::upload_debug_enabled();
        const auto n = req.part_number;

        std::expected<UploadPartResult, core::error> result;
        if (auto body = payload->take(); body) {
          req.body = std::move(*body);
          try {
            result = service->upload_part(req);
          } catch (const std::exception& e) {
            result = core::make_error(core::error_code::internal,
                                      std::string("upload_part threw: ") + e.what(), kComponent);
          }
        } else {
          result = std::unexpected(body.error());
        }

        std::expected<void, core::error> recorded;
        if (result) {
          recorded = manifest->record_success(n, std::move(result->etag));
        } else {
          if (dbg) {
            std::cerr << "[UPLOAD][part] part=" << n << " failed: " << core::to_string(result.error().code)
                      << " " << result.error().message << std::endl;
          }
          recorded = manifest->record_failure(n);
        }
        if (!recorded && dbg) {
          std::cerr << "[UPLOAD][part] part=" << n << " outcome not recorded: " << recorded.error().message << std::endl;
        }
      });

  auto future = task->get_future();
  if (auto accepted = executor_.execute([task] { (*task)(); }); !accepted) {
    if (auto r = manifest_->record_failure(part_number); !r && core::upload_debug_enabled()) {
      std::cerr << "[UPLOAD][part] part=" << part_number << " rejected and not recorded: " << r.error().message << std::endl;
    }
    return std::unexpected(accepted.error());
  }
  in_flight_.push_back(std::move(future));
  return part_number;
}

auto MultipartAssembler::commit() -> std::expected<CommitMultipartUploadResult, core::error> {
  if (auto ok = require_state(SessionState::Active, "commit"); !ok) {
    return std::unexpected(ok.error());
  }

  for (auto& f : in_flight_) f.wait();
  auto futures = std::move(in_flight_);
  in_flight_.clear();
  state_ = SessionState::Finalized;
  for (auto& f : futures) f.get();  // rethrows only non-std exceptions escaping a part task

  const bool dbg = core::upload_debug_enabled();
  if (!manifest_->is_upload_successful()) {
    const auto failed = manifest_->list_failed_parts();
    std::string msg = "cannot commit upload " + manifest_->upload_id() + ": failed parts [";
    for (std::size_t i = 0; i < failed.size(); ++i) {
      if (i) msg += ",";
      msg += std::to_string(failed[i]);
    }
    msg += "]";
    if (dbg) std::cerr << "[UPLOAD][commit] " << msg << std::endl;
    return core::make_error(core::error_code::precondition_failed, std::move(msg), kComponent);
  }

  CommitMultipartUploadRequest req;
  req.namespace_name = target_.namespace_name;
  req.bucket = target_.bucket;
  req.object = target_.object;
  req.upload_id = manifest_->upload_id();
  req.parts = manifest_->list_completed_parts();
  if (!target_.allow_overwrite) req.if_none_match = kIfNoneMatchAny;

  if (dbg) {
    std::cerr << "[UPLOAD][commit] upload_id=" << req.upload_id << " parts=" << req.parts.size() << std::endl;
  }
  return service_->commit_multipart_upload(req);
}

auto MultipartAssembler::abort() -> std::expected<AbortMultipartUploadResult, core::error> {
  if (auto ok = require_state(SessionState::Active, "abort"); !ok) {
    return std::unexpected(ok.error());
  }

  AbortMultipartUploadRequest req{target_.namespace_name, target_.bucket, target_.object,
                                  manifest_->upload_id()};
  auto result = service_->abort_multipart_upload(req);
  manifest_->mark_aborted();
  state_ = SessionState::Finalized;
  // Futures are dropped; tasks still running finish on the executor and their
  // outcomes are rejected by the aborted manifest.
  in_flight_.clear();
  if (core::upload_debug_enabled()) {
    std::cerr << "[UPLOAD][abort] upload_id=" << req.upload_id
              << (result ? " ok" : " service error: " + result.error().message) << std::endl;
  }
  return result;
}

} // namespace tessera::upload
