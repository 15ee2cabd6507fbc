#pragma once

// warden/snapshot.hpp - Content-addressed store for apply pre-images.
//
// DESIGN INVARIANTS:
//   1. Key = hash_domain("snap:", original_bytes). Content-addressed, never
//      location-addressed: two files with equal pre-images share one object.
//   2. Writes are atomic (fsutil atomic_write).
//   3. Reads verify integrity twice: the stored blob against the sidecar's
//      stored_blob_hash, then the decoded bytes against the key.
//   4. Fail-closed: any integrity failure returns nullopt, never corrupt data.
//   5. put() of content already stored returns the same key immediately.
//
// Layout:
//   <root>/objects/AB/CD/<64-hex key>
//   <root>/objects/AB/CD/<64-hex key>.meta   (jsonlite object)
//
// Compression: "zstd" when built with WARDEN_WITH_ZSTD, otherwise objects are
// stored as identity regardless of the requested mode.

#include <cstdint>
#include <optional>
#include <string>

namespace warden {

struct SnapshotInfo {
  std::string digest;
  std::string encoding{"identity"};
  std::size_t original_size{0};
  std::size_t stored_size{0};
  std::string stored_blob_hash;
  std::uint64_t created_at_unix_ts{0};
};

class SnapshotStore {
 public:
  explicit SnapshotStore(std::string root);

  // Returns the key, "" on failure. compression: "off" or "zstd".
  std::string put(const std::string& data, const std::string& compression = "off");
  std::optional<std::string> get(const std::string& digest) const;
  std::optional<SnapshotInfo> info(const std::string& digest) const;
  bool contains(const std::string& digest) const;

  const std::string& root() const { return root_; }

 private:
  std::string object_path(const std::string& digest) const;
  std::string meta_path(const std::string& digest) const;

  std::string root_;
};

}  // namespace warden
