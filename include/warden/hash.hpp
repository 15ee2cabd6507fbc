#pragma once

#include <string>
#include <string_view>

namespace warden {

struct HashRuntimeInfo {
  std::string primitive;
  std::string backend;
  std::string version;
};

// Core BLAKE3 hashing
std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Domain-separated hashing for different contexts.
//   "src:"   raw file content (patch base digests, apply journal)
//   "find:"  finding identity (tf_id, file, span)
//   "patch:" patch identity
//   "snap:"  snapshot store keys
//   "tfset:" canonical TF definition set
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string content_digest(std::string_view raw_bytes);
std::string snapshot_content_hash(std::string_view raw_bytes);

}  // namespace warden
