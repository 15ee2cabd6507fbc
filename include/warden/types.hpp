#pragma once

// warden/types.hpp - Core records shared by every pipeline stage.
//
// DETERMINISM GUARANTEES:
//   - Finding, Patch and Waiver are value types. No stage mutates a record it
//     did not create; a re-scan produces a fresh set of findings.
//   - Finding ordering is total: (file, line, col, tf_id, end_line, end_col).
//     Parallel detectors never leak into output order because every stage
//     re-sorts through sort_and_dedupe() before handing results on.
//
// MEMORY OWNERSHIP:
//   - All string members are value-owned. No borrowed references cross a
//     stage boundary.
//
// EXTENSION_POINT: multi_language_outline
//   Span positions are line/column pairs over the raw file bytes. A second
//   outline front-end only has to produce the same coordinates.

#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace warden {

enum class ErrorCode {
  none,
  schema_violation,
  registry_fatal,
  detector_failure,
  apply_conflict,
  verify_fail,
  verify_timeout,
  gate_fail,
  json_parse_error,
  io_error,
  spawn_failed,
  snapshot_integrity_failed,
  config_invalid,
  diff_parse_error,
  waiver_unparseable,
};

std::string to_string(ErrorCode code);

// Precedence tiers. Tier 1 outranks tier 4 in every ordering decision.
constexpr int kMinTier = 1;
constexpr int kMaxTier = 4;

// 1-based lines, 0-based columns. end_col is exclusive.
struct Span {
  std::uint32_t line{0};
  std::uint32_t col{0};
  std::uint32_t end_line{0};
  std::uint32_t end_col{0};

  bool operator==(const Span& o) const {
    return line == o.line && col == o.col && end_line == o.end_line && end_col == o.end_col;
  }
  bool operator<(const Span& o) const {
    return std::tie(line, col, end_line, end_col) < std::tie(o.line, o.col, o.end_line, o.end_col);
  }
};

enum class Disposition { resolved, ambiguous };

std::string to_string(Disposition d);

// ---------------------------------------------------------------------------
// Finding - one detected instance of a TF's target pattern.
// ---------------------------------------------------------------------------
struct Finding {
  std::string id;                   // finding_id(tf_id, file, span)
  std::string tf_id;
  std::string file;                 // relative to the tree root, '/' separated
  Span span;
  int tier{kMinTier};
  double confidence{1.0};
  Disposition disposition{Disposition::resolved};
  std::string message;
  std::string frame;                // "def name()", "class Name" or "<module>"
  std::string context;              // code frame: span lines +/- 2
  std::vector<std::string> hints;   // detector hints, deterministic order
};

// ---------------------------------------------------------------------------
// Patch - an ordered sequence of line hunks against one file revision.
// ---------------------------------------------------------------------------
// A hunk replaces old_lines starting at 1-based line `start` with new_lines.
// old_lines doubles as the validation context: the hunk applies only where
// the current content still carries exactly those lines.
struct Hunk {
  std::uint32_t start{1};
  std::vector<std::string> old_lines;
  std::vector<std::string> new_lines;
};

struct Patch {
  std::string tf_id;
  std::string finding_id;
  std::string file;
  std::string base_digest;          // content_digest() of the file it was computed from
  bool creates_file{false};
  std::vector<Hunk> hunks;          // sorted by start, non-overlapping
};

// ---------------------------------------------------------------------------
// Waiver - scoped, time-bound exception. Additive only.
// ---------------------------------------------------------------------------
struct Waiver {
  std::string tf_id;
  std::string scope{"*"};           // glob over file paths, "*" = repo-wide
  std::string context{"*"};         // change context (e.g. PR id), "*" = any
  std::string rationale;
  std::string source;               // where the waiver came from (doc path, verifier, agent)
  std::int64_t expires_unix{0};     // 0 = no expiry
  std::int64_t recorded_unix{0};
};

}  // namespace warden
