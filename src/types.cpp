#include "warden/types.hpp"

namespace warden {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::schema_violation: return "schema_violation";
    case ErrorCode::registry_fatal: return "registry_fatal";
    case ErrorCode::detector_failure: return "detector_failure";
    case ErrorCode::apply_conflict: return "apply_conflict";
    case ErrorCode::verify_fail: return "verify_fail";
    case ErrorCode::verify_timeout: return "verify_timeout";
    case ErrorCode::gate_fail: return "gate_fail";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::io_error: return "io_error";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::snapshot_integrity_failed: return "snapshot_integrity_failed";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::diff_parse_error: return "diff_parse_error";
    case ErrorCode::waiver_unparseable: return "waiver_unparseable";
  }
  return "";
}

std::string to_string(Disposition d) {
  return d == Disposition::ambiguous ? "ambiguous" : "resolved";
}

}  // namespace warden
