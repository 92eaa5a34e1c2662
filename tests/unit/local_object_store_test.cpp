#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <set>
#include <string>
#include <vector>

#include "tessera/store/crc32c.hpp"
#include "tessera/store/local_object_store.hpp"

using namespace tessera::upload;
using tessera::core::error_code;
using tessera::store::LocalObjectStore;

namespace fs = std::filesystem;

static fs::path make_test_dir(const std::string& name) {
  auto base = fs::temp_directory_path() / "tessera_local_store";
  fs::create_directories(base);
  auto dir = base / name;
  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir);
  return dir;
}

static std::vector<std::uint8_t> bytes_of(const std::string& s) { return {s.begin(), s.end()}; }

static std::string slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

static std::string etag_of(const std::string& s) {
  return tessera::store::to_hex(tessera::store::crc32c(
      {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()}));
}

static UploadPartRequest part_req(const std::string& id, std::uint32_t n, const std::string& body) {
  UploadPartRequest r;
  r.namespace_name = "ns";
  r.bucket = "bucket";
  r.object = "dir/obj name.txt";
  r.upload_id = id;
  r.part_number = n;
  r.if_none_match = std::string(kIfNoneMatchAny);
  r.body = bytes_of(body);
  return r;
}

static std::string create(LocalObjectStore& store, const std::string& object = "dir/obj name.txt") {
  CreateMultipartUploadRequest req;
  req.namespace_name = "ns";
  req.bucket = "bucket";
  req.object = object;
  req.content_type = "text/plain";
  req.metadata = {{"k", "v=1"}};
  auto id = store.create_multipart_upload(req);
  REQUIRE(id.has_value());
  return *id;
}

TEST_CASE("object names are percent-encoded reversibly", "[store][local]") {
  using tessera::store::decode_object_name;
  using tessera::store::encode_object_name;
  REQUIRE(encode_object_name("plain-name_1.txt") == "plain-name_1.txt");
  REQUIRE(encode_object_name("a/b c") == "a%2Fb%20c");
  REQUIRE(encode_object_name("..") == "%2E%2E");
  for (const std::string s : {"a/b c", "..", "%%", "caf\xc3\xa9"}) {
    auto d = decode_object_name(encode_object_name(s));
    REQUIRE(d.has_value());
    REQUIRE(*d == s);
  }
  REQUIRE_FALSE(decode_object_name("abc%2").has_value());
  REQUIRE_FALSE(decode_object_name("abc%zz").has_value());
}

TEST_CASE("local store uploads, lists and commits parts", "[store][local]") {
  auto root = make_test_dir("commit");
  LocalObjectStore store(root);
  const auto id = create(store);
  REQUIRE(id.size() == 16);

  auto p2 = store.upload_part(part_req(id, 2, "world"));
  auto p1 = store.upload_part(part_req(id, 1, "hello "));
  REQUIRE(p1.has_value());
  REQUIRE(p2.has_value());
  REQUIRE(p1->etag == etag_of("hello "));

  auto uploads = store.list_multipart_uploads({"ns", "bucket", std::nullopt, 100});
  REQUIRE(uploads.has_value());
  REQUIRE(uploads->items.size() == 1);
  REQUIRE(uploads->items[0].upload_id == id);
  REQUIRE(uploads->items[0].object == "dir/obj name.txt");
  REQUIRE_FALSE(uploads->next_page.has_value());

  auto parts = store.list_multipart_upload_parts({"ns", "bucket", "dir/obj name.txt", id, std::nullopt, 100});
  REQUIRE(parts.has_value());
  REQUIRE(parts->items.size() == 2);
  REQUIRE(parts->items[0].part_number == 1);
  REQUIRE(parts->items[0].size == 6);
  REQUIRE(parts->items[1].part_number == 2);
  REQUIRE(parts->items[1].etag == p2->etag);

  CommitMultipartUploadRequest c;
  c.namespace_name = "ns";
  c.bucket = "bucket";
  c.object = "dir/obj name.txt";
  c.upload_id = id;
  c.parts = {{1, p1->etag}, {2, p2->etag}};
  auto committed = store.commit_multipart_upload(c);
  REQUIRE(committed.has_value());
  REQUIRE(committed->etag == etag_of("hello world"));

  const auto obj = store.object_path("ns", "bucket", "dir/obj name.txt");
  REQUIRE(slurp(obj) == "hello world");
  REQUIRE_FALSE(fs::exists(root / "ns" / "bucket" / "uploads" / id));

  // the upload is gone after commit
  auto late = store.upload_part(part_req(id, 3, "!"));
  REQUIRE_FALSE(late.has_value());
  REQUIRE(late.error().code == error_code::not_found);
}

TEST_CASE("local store lists uploads in pages", "[store][local]") {
  auto root = make_test_dir("pages");
  LocalObjectStore store(root);
  std::set<std::string> created;
  for (int i = 0; i < 5; ++i) created.insert(create(store, "obj" + std::to_string(i)));

  std::set<std::string> seen;
  ListMultipartUploadsRequest req{"ns", "bucket", std::nullopt, 2};
  int pages = 0;
  while (true) {
    auto page = store.list_multipart_uploads(req);
    REQUIRE(page.has_value());
    REQUIRE(page->items.size() <= 2);
    for (const auto& u : page->items) seen.insert(u.upload_id);
    ++pages;
    if (!page->next_page) break;
    req.page = page->next_page;
  }
  REQUIRE(pages == 3);
  REQUIRE(seen == created);

  req.page = std::string("not-a-number");
  auto bad = store.list_multipart_uploads(req);
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.error().code == error_code::invalid_argument);
}

TEST_CASE("local store enforces conditional writes", "[store][local]") {
  auto root = make_test_dir("conditional");
  LocalObjectStore store(root);
  const auto id = create(store);

  REQUIRE(store.upload_part(part_req(id, 1, "a")).has_value());
  auto dup = store.upload_part(part_req(id, 1, "b"));
  REQUIRE_FALSE(dup.has_value());
  REQUIRE(dup.error().code == error_code::already_exists);

  auto unconditional = part_req(id, 1, "b");
  unconditional.if_none_match.reset();
  auto replaced = store.upload_part(unconditional);
  REQUIRE(replaced.has_value());
  REQUIRE(replaced->etag == etag_of("b"));

  CommitMultipartUploadRequest c{"ns", "bucket", "dir/obj name.txt", id, {{1, replaced->etag}}, std::nullopt};
  REQUIRE(store.commit_multipart_upload(c).has_value());

  // create-only commit over an existing object
  const auto id2 = create(store);
  auto p = store.upload_part(part_req(id2, 1, "c"));
  REQUIRE(p.has_value());
  CommitMultipartUploadRequest c2{"ns", "bucket", "dir/obj name.txt", id2, {{1, p->etag}},
                                  std::string(kIfNoneMatchAny)};
  auto refused = store.commit_multipart_upload(c2);
  REQUIRE_FALSE(refused.has_value());
  REQUIRE(refused.error().code == error_code::already_exists);
  REQUIRE(slurp(store.object_path("ns", "bucket", "dir/obj name.txt")) == "b");
}

TEST_CASE("local store verifies digests and commit manifests", "[store][local]") {
  auto root = make_test_dir("integrity");
  LocalObjectStore store(root);
  const auto id = create(store);

  auto wrong = part_req(id, 1, "abc");
  wrong.content_digest = "00000000";
  auto r = store.upload_part(wrong);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == error_code::data_integrity);

  auto right = part_req(id, 1, "abc");
  right.content_digest = etag_of("abc");
  REQUIRE(store.upload_part(right).has_value());

  auto out_of_range = store.upload_part(part_req(id, 10001, "x"));
  REQUIRE_FALSE(out_of_range.has_value());
  REQUIRE(out_of_range.error().code == error_code::invalid_argument);

  CommitMultipartUploadRequest c{"ns", "bucket", "dir/obj name.txt", id, {{1, "deadbeef"}}, std::nullopt};
  auto mismatch = store.commit_multipart_upload(c);
  REQUIRE_FALSE(mismatch.has_value());
  REQUIRE(mismatch.error().code == error_code::data_integrity);

  c.parts = {{1, etag_of("abc")}, {2, "x"}};
  auto missing = store.commit_multipart_upload(c);
  REQUIRE_FALSE(missing.has_value());
  REQUIRE(missing.error().code == error_code::invalid_argument);

  c.parts = {{2, "x"}, {1, etag_of("abc")}};
  auto unordered = store.commit_multipart_upload(c);
  REQUIRE_FALSE(unordered.has_value());
  REQUIRE(unordered.error().code == error_code::invalid_argument);

  c.parts.clear();
  auto empty = store.commit_multipart_upload(c);
  REQUIRE_FALSE(empty.has_value());
  REQUIRE(empty.error().code == error_code::invalid_argument);
}

TEST_CASE("local store abort removes the upload", "[store][local]") {
  auto root = make_test_dir("abort");
  LocalObjectStore store(root);
  const auto id = create(store);
  REQUIRE(store.upload_part(part_req(id, 1, "a")).has_value());

  auto a = store.abort_multipart_upload({"ns", "bucket", "dir/obj name.txt", id});
  REQUIRE(a.has_value());
  REQUIRE(a->upload_id == id);
  REQUIRE_FALSE(fs::exists(root / "ns" / "bucket" / "uploads" / id));

  auto again = store.abort_multipart_upload({"ns", "bucket", "dir/obj name.txt", id});
  REQUIRE_FALSE(again.has_value());
  REQUIRE(again.error().code == error_code::not_found);

  auto parts = store.list_multipart_upload_parts({"ns", "bucket", "dir/obj name.txt", id, std::nullopt, 100});
  REQUIRE_FALSE(parts.has_value());
  REQUIRE(parts.error().code == error_code::not_found);
}

TEST_CASE("local store rejects unsafe path segments", "[store][local]") {
  auto root = make_test_dir("segments");
  LocalObjectStore store(root);
  CreateMultipartUploadRequest req;
  req.namespace_name = "..";
  req.bucket = "bucket";
  req.object = "o";
  auto r = store.create_multipart_upload(req);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == error_code::invalid_argument);

  req.namespace_name = "ns";
  req.bucket = "a/b";
  REQUIRE_FALSE(store.create_multipart_upload(req).has_value());

  req.bucket = "bucket";
  req.object.clear();
  REQUIRE_FALSE(store.create_multipart_upload(req).has_value());

  auto part = part_req("../escape", 1, "x");
  auto p = store.upload_part(part);
  REQUIRE_FALSE(p.has_value());
  REQUIRE(p.error().code == error_code::invalid_argument);
}
