#include "tests/support/fake_object_storage.hpp"

#include <algorithm>

namespace test_support {

using namespace tessera::upload;

auto FakeObjectStorage::create_multipart_upload(const CreateMultipartUploadRequest& req)
    -> std::expected<std::string, error> {
  std::lock_guard lk(mu_);
  creates_.push_back(req);
  return create_result;
}

auto FakeObjectStorage::list_multipart_uploads(const ListMultipartUploadsRequest& req)
    -> std::expected<MultipartUploadPage, error> {
  std::lock_guard lk(mu_);
  upload_lists_.push_back(req);
  if (upload_pages.empty()) return MultipartUploadPage{};
  auto r = std::move(upload_pages.front());
  upload_pages.pop_front();
  return r;
}

auto FakeObjectStorage::list_multipart_upload_parts(const ListMultipartUploadPartsRequest& req)
    -> std::expected<PartPage, error> {
  std::lock_guard lk(mu_);
  part_lists_.push_back(req);
  if (part_pages.empty()) return PartPage{};
  auto r = std::move(part_pages.front());
  part_pages.pop_front();
  return r;
}

auto FakeObjectStorage::upload_part(const UploadPartRequest& req)
    -> std::expected<UploadPartResult, error> {
  UploadPartFn fn;
  {
    std::lock_guard lk(mu_);
    part_uploads_.push_back(req);
    if (!on_upload_part) {
      if (part_results.empty()) return UploadPartResult{"etag" + std::to_string(req.part_number)};
      auto r = std::move(part_results.front());
      part_results.pop_front();
      return r;
    }
    fn = on_upload_part;
  }
  return fn(req);  // called unlocked so scripts may block
}

auto FakeObjectStorage::commit_multipart_upload(const CommitMultipartUploadRequest& req)
    -> std::expected<CommitMultipartUploadResult, error> {
  std::lock_guard lk(mu_);
  commits_.push_back(req);
  return commit_result;
}

auto FakeObjectStorage::abort_multipart_upload(const AbortMultipartUploadRequest& req)
    -> std::expected<AbortMultipartUploadResult, error> {
  std::lock_guard lk(mu_);
  aborts_.push_back(req);
  return abort_result;
}

std::vector<CreateMultipartUploadRequest> FakeObjectStorage::creates() const {
  std::lock_guard lk(mu_); return creates_;
}
std::vector<ListMultipartUploadsRequest> FakeObjectStorage::upload_lists() const {
  std::lock_guard lk(mu_); return upload_lists_;
}
std::vector<ListMultipartUploadPartsRequest> FakeObjectStorage::part_lists() const {
  std::lock_guard lk(mu_); return part_lists_;
}
std::vector<UploadPartRequest> FakeObjectStorage::part_uploads() const {
  std::vector<UploadPartRequest> out;
  { std::lock_guard lk(mu_); out = part_uploads_; }
  std::sort(out.begin(), out.end(),
            [](const UploadPartRequest& a, const UploadPartRequest& b) { return a.part_number < b.part_number; });
  return out;
}
std::vector<CommitMultipartUploadRequest> FakeObjectStorage::commits() const {
  std::lock_guard lk(mu_); return commits_;
}
std::vector<AbortMultipartUploadRequest> FakeObjectStorage::aborts() const {
  std::lock_guard lk(mu_); return aborts_;
}

MultipartUploadPage uploads_page(std::vector<std::string> ids, std::optional<std::string> next) {
  MultipartUploadPage p;
  for (auto& id : ids) p.items.push_back(MultipartUploadSummary{std::move(id), {}});
  p.next_page = std::move(next);
  return p;
}

PartPage parts_page(std::vector<std::pair<std::uint32_t, std::string>> parts, std::optional<std::string> next) {
  PartPage p;
  for (auto& [n, etag] : parts) p.items.push_back(PartSummary{n, std::move(etag), 0});
  p.next_page = std::move(next);
  return p;
}

std::unexpected<error> service_error(const std::string& message) {
  return std::unexpected<error>(error{error_code::unavailable, message, "test.fake_storage"});
}

} // namespace test_support
