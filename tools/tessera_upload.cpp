#include <charconv>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "tessera/store/local_object_store.hpp"
#include "tessera/upload/upload_config.hpp"
#include "tessera/upload/upload_manager.hpp"

namespace {

struct Args {
    std::string store;
    std::string namespace_name;
    std::string bucket;
    std::string object;
    std::string file;
    std::string content_type;
    std::optional<std::uint64_t> part_size;
    std::optional<std::uint64_t> parallelism;
    std::optional<std::string> resume;
    std::map<std::string, std::string> metadata;
    bool no_overwrite{false};
    bool keep_on_failure{false};
};

std::optional<std::string> eat(std::string_view a, std::string_view key) {
    if (a.rfind(key, 0) == 0) return std::string(a.substr(key.size()));
    return std::nullopt;
}

bool parse_u64(const std::string& s, std::uint64_t& out) {
    const char* beg = s.data(); const char* end = beg + s.size();
    auto [ptr, ec] = std::from_chars(beg, end, out, 10);
    return !s.empty() && ec == std::errc() && ptr == end;
}

void print_usage() {
    std::cout << "Tessera multipart upload\n"
              << "Usage: tessera_upload --store=DIR --namespace=NS --bucket=B --object=O --file=F\n"
              << "  [--part-size=BYTES] [--parallelism=N] [--resume=UPLOAD_ID]\n"
              << "  [--content-type=T] [--meta=KEY=VALUE]... [--no-overwrite] [--keep-on-failure]\n"
              << "Environment: TESSERA_UPLOAD_PART_SIZE, TESSERA_UPLOAD_PARALLELISM,\n"
              << "  TESSERA_UPLOAD_MAX_PARTS, TESSERA_UPLOAD_ALLOW_OVERWRITE, TESSERA_UPLOAD_DEBUG\n";
}

int usage_error(const std::string& msg) {
    std::cerr << "tessera_upload: " << msg << "\n";
    print_usage();
    return 2;
}

} // namespace

int main(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--help" || a == "-h") { print_usage(); return 0; }
        else if (auto v = eat(a, "--store=")) args.store = *v;
        else if (auto v = eat(a, "--namespace=")) args.namespace_name = *v;
        else if (auto v = eat(a, "--bucket=")) args.bucket = *v;
        else if (auto v = eat(a, "--object=")) args.object = *v;
        else if (auto v = eat(a, "--file=")) args.file = *v;
        else if (auto v = eat(a, "--content-type=")) args.content_type = *v;
        else if (auto v = eat(a, "--resume=")) args.resume = *v;
        else if (auto v = eat(a, "--part-size=")) {
            std::uint64_t n = 0;
            if (!parse_u64(*v, n)) return usage_error("invalid --part-size \"" + *v + "\"");
            args.part_size = n;
        }
        else if (auto v = eat(a, "--parallelism=")) {
            std::uint64_t n = 0;
            if (!parse_u64(*v, n)) return usage_error("invalid --parallelism \"" + *v + "\"");
            args.parallelism = n;
        }
        else if (auto v = eat(a, "--meta=")) {
            const auto eq = v->find('=');
            if (eq == std::string::npos || eq == 0) return usage_error("--meta expects KEY=VALUE");
            args.metadata[v->substr(0, eq)] = v->substr(eq + 1);
        }
        else if (a == "--no-overwrite") args.no_overwrite = true;
        else if (a == "--keep-on-failure") args.keep_on_failure = true;
        else return usage_error("unknown argument \"" + a + "\"");
    }

    if (args.store.empty() || args.namespace_name.empty() || args.bucket.empty() ||
        args.object.empty() || args.file.empty()) {
        return usage_error("--store, --namespace, --bucket, --object and --file are required");
    }

    auto cfg = tessera::upload::apply_env_overrides(tessera::upload::UploadConfiguration{});
    if (!cfg) {
        std::cerr << "configuration error: " << cfg.error().message << "\n";
        return 2;
    }
    if (args.part_size) {
        cfg->part_size = *args.part_size;
        if (cfg->min_part_size > cfg->part_size) cfg->min_part_size = cfg->part_size;
    }
    if (args.parallelism) cfg->parallelism = static_cast<std::size_t>(*args.parallelism);
    if (args.no_overwrite) cfg->allow_overwrite = false;
    if (args.keep_on_failure) cfg->abort_on_failure = false;
    if (auto ok = tessera::upload::validate_configuration(*cfg); !ok) {
        std::cerr << "configuration error: " << ok.error().message << "\n";
        return 2;
    }

    auto store = std::make_shared<tessera::store::LocalObjectStore>(args.store);
    tessera::upload::UploadManager manager(store, *cfg);

    tessera::upload::UploadRequest req;
    req.namespace_name = args.namespace_name;
    req.bucket = args.bucket;
    req.object = args.object;
    req.file = args.file;
    req.content_type = args.content_type;
    req.metadata = args.metadata;
    req.resume_upload_id = args.resume;

    auto resp = manager.upload_file(req);
    if (!resp) {
        std::cerr << "upload failed: code=" << tessera::core::to_string(resp.error().code)
                  << " (" << static_cast<unsigned>(resp.error().code) << ") component="
                  << resp.error().component << ": " << resp.error().message << "\n";
        return 1;
    }

    std::cout << "upload_id=" << resp->upload_id << "\n"
              << "parts=" << resp->part_count << " uploaded=" << resp->parts_uploaded << "\n"
              << "etag=" << resp->etag << "\n"
              << "object=" << store->object_path(args.namespace_name, args.bucket, args.object).string() << "\n";
    return 0;
}
