#include "warden/version.hpp"

#include <sstream>

namespace warden {
namespace version {

VersionManifest current_manifest(const std::string& engine_semver) {
  VersionManifest m;
  m.engine_semver   = engine_semver.empty() ? WARDEN_VERSION : engine_semver;
  m.hash_primitive  = "blake3";
  // Deterministic within a single build.
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"tf_schema\":" << m.tf_schema
    << ",\"findings_stream\":" << m.findings_stream
    << ",\"patch_stream\":" << m.patch_stream
    << ",\"task_packet\":" << m.task_packet
    << ",\"ledger_format\":" << m.ledger_format
    << ",\"snapshot_format\":" << m.snapshot_format
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace warden
