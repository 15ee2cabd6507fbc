#pragma once

// warden/version.hpp - Format and contract versions.
//
// Every artifact warden writes to disk or hands to an external collaborator
// carries one of these numbers. Bump the matching constant before any
// structural change to the artifact; readers reject versions newer than the
// one they were built with.

#include <cstdint>
#include <string>

#ifndef WARDEN_VERSION
#define WARDEN_VERSION "0.4.0"
#endif

namespace warden {
namespace version {

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3-256 with the domain prefixes listed in hash.hpp.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// ---------------------------------------------------------------------------
// TF_SCHEMA_VERSION
// Shape of TF definition documents accepted by the registry validator.
// ---------------------------------------------------------------------------
constexpr uint32_t TF_SCHEMA_VERSION = 1;

// ---------------------------------------------------------------------------
// FINDINGS_STREAM_VERSION
// One JSON object per line, field "v" carries this number.
// ---------------------------------------------------------------------------
constexpr uint32_t FINDINGS_STREAM_VERSION = 1;

// Patch stream metadata line ("# warden-patch v=1 ...").
constexpr uint32_t PATCH_STREAM_VERSION = 1;

// Agent Bridge task packet documents.
constexpr uint32_t TASK_PACKET_VERSION = 1;

// ---------------------------------------------------------------------------
// LEDGER_FORMAT_VERSION
// Waiver ledger NDJSON entries, chained via BLAKE3 of the previous line.
// ---------------------------------------------------------------------------
constexpr uint32_t LEDGER_FORMAT_VERSION = 1;

// Snapshot store object layout (objects/AB/CDEF..., sidecar .meta).
constexpr uint32_t SNAPSHOT_FORMAT_VERSION = 1;

struct VersionManifest {
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t tf_schema{TF_SCHEMA_VERSION};
  uint32_t findings_stream{FINDINGS_STREAM_VERSION};
  uint32_t patch_stream{PATCH_STREAM_VERSION};
  uint32_t task_packet{TASK_PACKET_VERSION};
  uint32_t ledger_format{LEDGER_FORMAT_VERSION};
  uint32_t snapshot_format{SNAPSHOT_FORMAT_VERSION};
  std::string engine_semver;
  std::string hash_primitive;
  std::string build_timestamp;
};

VersionManifest current_manifest(const std::string& engine_semver = "");

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace warden
