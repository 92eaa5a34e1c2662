/** \file local_object_store.cpp
 *  \brief Filesystem-backed multipart object storage
 */

#include "tessera/store/local_object_store.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <string_view>
#include <system_error>
#include <vector>

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#endif

#include "tessera/core/platform_utils.hpp"
#include "tessera/store/crc32c.hpp"

namespace tessera::store {

namespace fs = std::filesystem;
using core::error_code;

namespace {

constexpr const char* kComponent = "store.local";
constexpr const char* kMetaHeader = "tessera-upload v1";
constexpr std::size_t kCopyChunk = 1u << 20;

auto is_valid_segment(const std::string& v) -> bool {
    if (v.empty() || v == "." || v == "..") return false;
    for (unsigned char c : v) {
        if (c < 0x20 || c == 0x7F || c == '/' || c == '\\') return false;
    }
    return true;
}

auto part_file_name(std::uint32_t n) -> std::string {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "part-%05u", n);
    return buf;
}

// Parses "part-NNNNN" exactly; the .etag sidecar and tmp files do not match.
auto parse_part_file_name(const std::string& name, std::uint32_t& out) -> bool {
    constexpr std::string_view prefix = "part-";
    if (name.size() != prefix.size() + 5 || name.compare(0, prefix.size(), prefix) != 0) return false;
    const char* beg = name.data() + prefix.size();
    const char* end = name.data() + name.size();
    auto [ptr, ec] = std::from_chars(beg, end, out, 10);
    return ec == std::errc() && ptr == end && out > 0;
}

auto parse_page_token(const std::optional<std::string>& page, std::size_t& out)
    -> std::expected<void, core::error> {
    out = 0;
    if (!page) return {};
    const char* beg = page->data(); const char* end = beg + page->size();
    auto [ptr, ec] = std::from_chars(beg, end, out, 10);
    if (page->empty() || ec != std::errc() || ptr != end) {
        return core::make_error(error_code::invalid_argument, "invalid page token \"" + *page + "\"", kComponent);
    }
    return {};
}

// Write bytes to path and sync them; the file is created or truncated.
auto write_file_synced(const fs::path& path, std::span<const std::uint8_t> data)
    -> std::expected<void, core::error> {
#if defined(__linux__) || defined(__APPLE__)
    int fd = ::open(path.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
    if (fd < 0) {
        return core::make_error(error_code::io_failed, "open failed: " + path.string(), kComponent);
    }
    std::size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            ::close(fd);
            std::error_code rm; fs::remove(path, rm);
            return core::make_error(error_code::io_failed, "write failed: " + path.string(), kComponent);
        }
        written += static_cast<std::size_t>(n);
    }
    (void)::fsync(fd);
    (void)::close(fd);
#else
    // Fallback: ofstream (no fsync)
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.good()) return core::make_error(error_code::io_failed, "open failed: " + path.string(), kComponent);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out.good()) return core::make_error(error_code::io_failed, "write failed: " + path.string(), kComponent);
#endif
    return {};
}

// Write through a temporary sibling and replace path with an atomic rename.
auto write_file_atomic(const fs::path& path, const fs::path& tmp, std::span<const std::uint8_t> data)
    -> std::expected<void, core::error> {
    if (auto w = write_file_synced(tmp, data); !w) return w;
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code rm; fs::remove(tmp, rm);
        return core::make_error(error_code::io_failed, "rename failed: " + path.string() + ": " + ec.message(), kComponent);
    }
    return {};
}

auto as_bytes(const std::string& s) -> std::span<const std::uint8_t> {
    return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

auto read_text_file(const fs::path& path) -> std::expected<std::string, core::error> {
    std::ifstream in(path, std::ios::binary);
    if (!in.good()) {
        return core::make_error(error_code::io_failed, "open failed: " + path.string(), kComponent);
    }
    std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return s;
}

// Object name recorded in upload.meta.
auto read_upload_object(const fs::path& dir) -> std::expected<std::string, core::error> {
    auto text = read_text_file(dir / "upload.meta");
    if (!text) return std::unexpected(text.error());
    std::size_t pos = 0;
    bool header_ok = false;
    while (pos < text->size()) {
        auto eol = text->find('\n', pos);
        if (eol == std::string::npos) eol = text->size();
        std::string line = text->substr(pos, eol - pos);
        pos = eol + 1;
        if (!header_ok) {
            if (line != kMetaHeader) break;
            header_ok = true;
            continue;
        }
        if (line.rfind("object=", 0) == 0) return decode_object_name(line.substr(7));
    }
    return core::make_error(error_code::data_integrity, "malformed upload.meta in " + dir.string(), kComponent);
}

} // namespace

auto encode_object_name(const std::string& name) -> std::string {
    static constexpr char digits[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        const bool plain = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                           c == '.' || c == '_' || c == '-';
        if (plain) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(digits[c >> 4]);
            out.push_back(digits[c & 0xF]);
        }
    }
    // "." and ".." are not usable as file names
    if (out == "." || out == "..") {
        std::string esc;
        for (std::size_t i = 0; i < out.size(); ++i) esc += "%2E";
        return esc;
    }
    return out;
}

auto decode_object_name(const std::string& encoded) -> std::expected<std::string, core::error> {
    auto hex = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return -1;
    };
    std::string out;
    out.reserve(encoded.size());
    for (std::size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] != '%') { out.push_back(encoded[i]); continue; }
        if (i + 2 >= encoded.size()) {
            return core::make_error(error_code::invalid_argument, "truncated escape in \"" + encoded + "\"", kComponent);
        }
        const int hi = hex(encoded[i + 1]);
        const int lo = hex(encoded[i + 2]);
        if (hi < 0 || lo < 0) {
            return core::make_error(error_code::invalid_argument, "bad escape in \"" + encoded + "\"", kComponent);
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return out;
}

LocalObjectStore::LocalObjectStore(fs::path root)
    : root_(std::move(root)), rng_(std::random_device{}()) {}

auto LocalObjectStore::bucket_dir(const std::string& namespace_name, const std::string& bucket) const
    -> std::expected<fs::path, core::error> {
    if (!is_valid_segment(namespace_name)) {
        return core::make_error(error_code::invalid_argument, "invalid namespace \"" + namespace_name + "\"", kComponent);
    }
    if (!is_valid_segment(bucket)) {
        return core::make_error(error_code::invalid_argument, "invalid bucket \"" + bucket + "\"", kComponent);
    }
    return root_ / namespace_name / bucket;
}

auto LocalObjectStore::upload_dir(const std::string& namespace_name, const std::string& bucket,
                                  const std::string& upload_id) const
    -> std::expected<fs::path, core::error> {
    auto b = bucket_dir(namespace_name, bucket);
    if (!b) return std::unexpected(b.error());
    if (!is_valid_segment(upload_id)) {
        return core::make_error(error_code::invalid_argument, "invalid upload id \"" + upload_id + "\"", kComponent);
    }
    auto dir = *b / "uploads" / upload_id;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return core::make_error(error_code::not_found, "no multipart upload " + upload_id, kComponent);
    }
    return dir;
}

auto LocalObjectStore::object_path(const std::string& namespace_name, const std::string& bucket,
                                   const std::string& object) const -> fs::path {
    return root_ / namespace_name / bucket / "objects" / encode_object_name(object);
}

auto LocalObjectStore::new_upload_id() -> std::string {
    // caller holds mutex_
    const auto hi = static_cast<std::uint32_t>(rng_() >> 32);
    const auto lo = static_cast<std::uint32_t>(rng_());
    return to_hex(hi) + to_hex(lo);
}

auto LocalObjectStore::create_multipart_upload(const upload::CreateMultipartUploadRequest& req)
    -> std::expected<std::string, core::error> {
    auto b = bucket_dir(req.namespace_name, req.bucket);
    if (!b) return std::unexpected(b.error());
    if (req.object.empty()) {
        return core::make_error(error_code::invalid_argument, "object name is empty", kComponent);
    }

    std::string meta = std::string(kMetaHeader) + "\n";
    meta += "object=" + encode_object_name(req.object) + "\n";
    meta += "content_type=" + encode_object_name(req.content_type) + "\n";
    meta += "content_language=" + encode_object_name(req.content_language) + "\n";
    meta += "content_encoding=" + encode_object_name(req.content_encoding) + "\n";
    for (const auto& [k, v] : req.metadata) {
        meta += "meta." + encode_object_name(k) + "=" + encode_object_name(v) + "\n";
    }

    std::lock_guard lock(mutex_);
    std::string upload_id;
    fs::path dir;
    std::error_code ec;
    do {
        upload_id = new_upload_id();
        dir = *b / "uploads" / upload_id;
    } while (fs::exists(dir, ec));

    fs::create_directories(dir, ec);
    if (ec) {
        return core::make_error(error_code::io_failed, "mkdir failed: " + dir.string() + ": " + ec.message(), kComponent);
    }
    if (auto w = write_file_atomic(dir / "upload.meta", dir / "upload.meta.tmp", as_bytes(meta)); !w) {
        fs::remove_all(dir, ec);
        return std::unexpected(w.error());
    }
    if (core::upload_debug_enabled()) {
        std::cerr << "[STORE][create] " << req.bucket << "/" << req.object << " upload_id=" << upload_id << std::endl;
    }
    return upload_id;
}

auto LocalObjectStore::list_multipart_uploads(const upload::ListMultipartUploadsRequest& req)
    -> std::expected<upload::MultipartUploadPage, core::error> {
    auto b = bucket_dir(req.namespace_name, req.bucket);
    if (!b) return std::unexpected(b.error());
    std::size_t offset = 0;
    if (auto t = parse_page_token(req.page, offset); !t) return std::unexpected(t.error());

    std::lock_guard lock(mutex_);
    std::vector<std::string> ids;
    std::error_code ec;
    const auto uploads = *b / "uploads";
    if (fs::is_directory(uploads, ec)) {
        for (const auto& de : fs::directory_iterator(uploads, ec)) {
            if (de.is_directory()) ids.push_back(de.path().filename().string());
        }
        if (ec) {
            return core::make_error(error_code::io_failed, "list failed: " + uploads.string(), kComponent);
        }
    }
    std::sort(ids.begin(), ids.end());

    upload::MultipartUploadPage page;
    const std::size_t limit = req.limit == 0 ? ids.size() : req.limit;
    for (std::size_t i = offset; i < ids.size() && page.items.size() < limit; ++i) {
        auto object = read_upload_object(uploads / ids[i]);
        if (!object) return std::unexpected(object.error());
        page.items.push_back(upload::MultipartUploadSummary{ids[i], std::move(*object)});
    }
    if (offset + page.items.size() < ids.size()) {
        page.next_page = std::to_string(offset + page.items.size());
    }
    return page;
}

auto LocalObjectStore::list_multipart_upload_parts(const upload::ListMultipartUploadPartsRequest& req)
    -> std::expected<upload::PartPage, core::error> {
    std::size_t offset = 0;
    if (auto t = parse_page_token(req.page, offset); !t) return std::unexpected(t.error());

    std::lock_guard lock(mutex_);
    auto dir = upload_dir(req.namespace_name, req.bucket, req.upload_id);
    if (!dir) return std::unexpected(dir.error());

    std::vector<std::uint32_t> numbers;
    std::error_code ec;
    for (const auto& de : fs::directory_iterator(*dir, ec)) {
        std::uint32_t n = 0;
        if (de.is_regular_file() && parse_part_file_name(de.path().filename().string(), n)) numbers.push_back(n);
    }
    if (ec) {
        return core::make_error(error_code::io_failed, "list failed: " + dir->string(), kComponent);
    }
    std::sort(numbers.begin(), numbers.end());

    upload::PartPage page;
    const std::size_t limit = req.limit == 0 ? numbers.size() : req.limit;
    for (std::size_t i = offset; i < numbers.size() && page.items.size() < limit; ++i) {
        const auto part = *dir / part_file_name(numbers[i]);
        auto etag = read_text_file(fs::path(part.string() + ".etag"));
        if (!etag) return std::unexpected(etag.error());
        const auto size = fs::file_size(part, ec);
        if (ec) {
            return core::make_error(error_code::io_failed, "stat failed: " + part.string(), kComponent);
        }
        page.items.push_back(upload::PartSummary{numbers[i], std::move(*etag), static_cast<std::uint64_t>(size)});
    }
    if (offset + page.items.size() < numbers.size()) {
        page.next_page = std::to_string(offset + page.items.size());
    }
    return page;
}

auto LocalObjectStore::upload_part(const upload::UploadPartRequest& req)
    -> std::expected<upload::UploadPartResult, core::error> {
    if (req.part_number == 0 || req.part_number > upload::kMaxPartNumber) {
        return core::make_error(error_code::invalid_argument,
                                "part number " + std::to_string(req.part_number) + " out of range", kComponent);
    }
    auto dir = upload_dir(req.namespace_name, req.bucket, req.upload_id);
    if (!dir) return std::unexpected(dir.error());

    const std::string etag = to_hex(crc32c(req.body));
    if (req.content_digest && *req.content_digest != etag) {
        return core::make_error(error_code::data_integrity,
                                "digest mismatch for part " + std::to_string(req.part_number) + ": expected " +
                                    *req.content_digest + ", computed " + etag,
                                kComponent);
    }

    // Bytes are staged outside the lock; only the existence check and the renames are serialized.
    const auto part = *dir / part_file_name(req.part_number);
    const auto seq = std::to_string(tmp_seq_.fetch_add(1, std::memory_order_relaxed));
    const fs::path staged(part.string() + ".tmp-" + seq);
    const fs::path staged_etag(part.string() + ".etag.tmp-" + seq);
    if (auto w = write_file_synced(staged, req.body); !w) return std::unexpected(w.error());
    if (auto w = write_file_synced(staged_etag, as_bytes(etag)); !w) {
        std::error_code rm; fs::remove(staged, rm);
        return std::unexpected(w.error());
    }

    std::lock_guard lock(mutex_);
    std::error_code ec;
    auto discard = [&] { std::error_code rm; fs::remove(staged, rm); fs::remove(staged_etag, rm); };
    if (!fs::is_directory(*dir, ec)) {
        discard();
        return core::make_error(error_code::not_found, "multipart upload " + req.upload_id + " was aborted", kComponent);
    }
    if (req.if_none_match && *req.if_none_match == upload::kIfNoneMatchAny && fs::exists(part, ec)) {
        discard();
        return core::make_error(error_code::already_exists,
                                "part " + std::to_string(req.part_number) + " already exists", kComponent);
    }
    fs::rename(staged_etag, fs::path(part.string() + ".etag"), ec);
    if (!ec) fs::rename(staged, part, ec);
    if (ec) {
        discard();
        return core::make_error(error_code::io_failed, "rename failed: " + part.string() + ": " + ec.message(), kComponent);
    }
    return upload::UploadPartResult{etag};
}

auto LocalObjectStore::commit_multipart_upload(const upload::CommitMultipartUploadRequest& req)
    -> std::expected<upload::CommitMultipartUploadResult, core::error> {
    if (req.parts.empty()) {
        return core::make_error(error_code::invalid_argument, "commit requires at least one part", kComponent);
    }
    for (std::size_t i = 1; i < req.parts.size(); ++i) {
        if (req.parts[i].part_number <= req.parts[i - 1].part_number) {
            return core::make_error(error_code::invalid_argument, "commit parts must be in ascending order", kComponent);
        }
    }

    std::lock_guard lock(mutex_);
    auto dir = upload_dir(req.namespace_name, req.bucket, req.upload_id);
    if (!dir) return std::unexpected(dir.error());

    for (const auto& p : req.parts) {
        const auto part = *dir / part_file_name(p.part_number);
        auto etag = read_text_file(fs::path(part.string() + ".etag"));
        if (!etag) {
            return core::make_error(error_code::invalid_argument,
                                    "part " + std::to_string(p.part_number) + " was not uploaded", kComponent);
        }
        if (*etag != p.etag) {
            return core::make_error(error_code::data_integrity,
                                    "etag mismatch for part " + std::to_string(p.part_number), kComponent);
        }
    }

    auto object = req.object;
    if (object.empty()) {
        auto recorded = read_upload_object(*dir);
        if (!recorded) return std::unexpected(recorded.error());
        object = std::move(*recorded);
    }
    const auto dst = object_path(req.namespace_name, req.bucket, object);
    std::error_code ec;
    if (req.if_none_match && *req.if_none_match == upload::kIfNoneMatchAny && fs::exists(dst, ec)) {
        return core::make_error(error_code::already_exists, "object " + object + " already exists", kComponent);
    }
    fs::create_directories(dst.parent_path(), ec);
    if (ec) {
        return core::make_error(error_code::io_failed, "mkdir failed: " + dst.parent_path().string(), kComponent);
    }

    const fs::path tmp = dst.parent_path() / (".commit-" + req.upload_id);
    Crc32c crc;
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.good()) {
            return core::make_error(error_code::io_failed, "open failed: " + tmp.string(), kComponent);
        }
        std::vector<char> buf(kCopyChunk);
        for (const auto& p : req.parts) {
            std::ifstream in(*dir / part_file_name(p.part_number), std::ios::binary);
            if (!in.good()) {
                out.close(); fs::remove(tmp, ec);
                return core::make_error(error_code::io_failed, "open failed for part " + std::to_string(p.part_number), kComponent);
            }
            while (in) {
                in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
                const auto got = static_cast<std::size_t>(in.gcount());
                if (got == 0) break;
                crc.update({reinterpret_cast<const std::uint8_t*>(buf.data()), got});
                out.write(buf.data(), static_cast<std::streamsize>(got));
            }
        }
        out.flush();
        if (!out.good()) {
            out.close(); fs::remove(tmp, ec);
            return core::make_error(error_code::io_failed, "write failed: " + tmp.string(), kComponent);
        }
    }
    fs::rename(tmp, dst, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return core::make_error(error_code::io_failed, "rename failed: " + dst.string(), kComponent);
    }
    fs::remove_all(*dir, ec);
    if (ec && core::upload_debug_enabled()) {
        std::cerr << "[STORE][commit] leftover upload dir " << dir->string() << ": " << ec.message() << std::endl;
    }
    if (core::upload_debug_enabled()) {
        std::cerr << "[STORE][commit] " << req.bucket << "/" << object << " parts=" << req.parts.size() << std::endl;
    }
    return upload::CommitMultipartUploadResult{to_hex(crc.value())};
}

auto LocalObjectStore::abort_multipart_upload(const upload::AbortMultipartUploadRequest& req)
    -> std::expected<upload::AbortMultipartUploadResult, core::error> {
    std::lock_guard lock(mutex_);
    auto dir = upload_dir(req.namespace_name, req.bucket, req.upload_id);
    if (!dir) return std::unexpected(dir.error());
    std::error_code ec;
    fs::remove_all(*dir, ec);
    if (ec) {
        return core::make_error(error_code::io_failed, "remove failed: " + dir->string() + ": " + ec.message(), kComponent);
    }
    if (core::upload_debug_enabled()) {
        std::cerr << "[STORE][abort] upload_id=" << req.upload_id << std::endl;
    }
    return upload::AbortMultipartUploadResult{req.upload_id};
}

} // namespace tessera::store
