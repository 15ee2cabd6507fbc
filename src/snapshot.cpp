#include "warden/snapshot.hpp"

#include <ctime>
#include <filesystem>

#if defined(WARDEN_WITH_ZSTD)
#include <zstd.h>
#endif

#include "warden/fsutil.hpp"
#include "warden/hash.hpp"
#include "warden/jsonlite.hpp"

namespace fs = std::filesystem;

namespace warden {

namespace {

#if defined(WARDEN_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::string decompress_zstd(const std::string& data, std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}
#endif

// Validate digest is a 64-char hex string.
bool valid_digest(const std::string& d) {
  if (d.size() != 64) return false;
  for (char c : d) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  return true;
}

}  // namespace

SnapshotStore::SnapshotStore(std::string root) : root_(std::move(root)) {
  std::error_code ec;
  fs::create_directories(fs::path(root_) / "objects", ec);
}

std::string SnapshotStore::object_path(const std::string& digest) const {
  return (fs::path(root_) / "objects" / digest.substr(0, 2) / digest.substr(2, 2) / digest).string();
}

std::string SnapshotStore::meta_path(const std::string& digest) const {
  return object_path(digest) + ".meta";
}

std::string SnapshotStore::put(const std::string& data, const std::string& compression) {
  const std::string digest = snapshot_content_hash(data);
  if (!valid_digest(digest)) return {};

  std::error_code ec;
  if (fs::exists(object_path(digest), ec) && fs::exists(meta_path(digest), ec)) {
    // Dedup, but only onto an object that still verifies.
    auto existing = get(digest);
    if (!existing || *existing != data) return {};
    return digest;
  }

  std::string stored = data;
  std::string encoding = "identity";
#if defined(WARDEN_WITH_ZSTD)
  if (compression == "zstd") {
    auto c = compress_zstd(data);
    if (!c.empty()) {
      stored = std::move(c);
      encoding = "zstd";
    }
  }
#else
  (void)compression;
#endif

  if (!atomic_write(object_path(digest), stored)) return {};

  using jsonlite::Value;
  jsonlite::Object meta;
  meta["digest"] = Value{digest};
  meta["encoding"] = Value{encoding};
  meta["original_size"] = Value{static_cast<std::uint64_t>(data.size())};
  meta["stored_size"] = Value{static_cast<std::uint64_t>(stored.size())};
  meta["stored_blob_hash"] = Value{blake3_hex(stored)};
  meta["created_at"] = Value{static_cast<std::uint64_t>(std::time(nullptr))};
  if (!atomic_write(meta_path(digest), jsonlite::to_json(Value{meta}))) {
    // Rollback blob on meta write failure.
    fs::remove(object_path(digest), ec);
    return {};
  }
  return digest;
}

std::optional<SnapshotInfo> SnapshotStore::info(const std::string& digest) const {
  if (!valid_digest(digest)) return std::nullopt;
  std::string text;
  if (!read_file(meta_path(digest), &text)) return std::nullopt;
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(text, &err);
  if (err) return std::nullopt;
  SnapshotInfo info;
  info.digest = jsonlite::get_string(obj, "digest", "");
  info.encoding = jsonlite::get_string(obj, "encoding", "identity");
  info.original_size = static_cast<std::size_t>(jsonlite::get_u64(obj, "original_size", 0));
  info.stored_size = static_cast<std::size_t>(jsonlite::get_u64(obj, "stored_size", 0));
  info.stored_blob_hash = jsonlite::get_string(obj, "stored_blob_hash", "");
  info.created_at_unix_ts = jsonlite::get_u64(obj, "created_at", 0);
  if (info.digest != digest) return std::nullopt;
  return info;
}

std::optional<std::string> SnapshotStore::get(const std::string& digest) const {
  if (!valid_digest(digest)) return std::nullopt;
  std::string data;
  if (!read_file(object_path(digest), &data)) return std::nullopt;

  auto meta = info(digest);
  if (!meta) return std::nullopt;
  if (blake3_hex(data) != meta->stored_blob_hash) return std::nullopt;

  if (meta->encoding == "zstd") {
#if defined(WARDEN_WITH_ZSTD)
    data = decompress_zstd(data, meta->original_size);
#else
    return std::nullopt;  // built without zstd: cannot decode
#endif
  }
  if (snapshot_content_hash(data) != digest) return std::nullopt;
  return data;
}

bool SnapshotStore::contains(const std::string& digest) const {
  if (!valid_digest(digest)) return false;
  std::error_code ec;
  return fs::exists(object_path(digest), ec);
}

}  // namespace warden
