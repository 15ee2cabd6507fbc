#pragma once

// warden/waivers.hpp - Append-only waiver ledger and waiver documents.
//
// DESIGN INVARIANTS (must not be broken):
//   1. APPEND-ONLY: records are never modified or deleted. Expired waivers
//      stay in the ledger and are filtered out at query time.
//   2. SEQUENTIAL: each record carries a sequence number one above the last
//      record in the file, including records written by earlier runs.
//   3. CHAINED: each record carries the BLAKE3 of the previous raw line
//      ("prev"), 64 zeros for the first. verify_chain() recomputes it.
//   4. STRUCTURED: one compact jsonlite object per line (NDJSON), keys sorted.
//
// Record format (LEDGER_FORMAT_VERSION 1):
//   {"context","expires_unix","prev","rationale","recorded_unix","scope",
//    "seq","source","tf_id","v"}
//
// Waiver documents are Markdown files checked in with a change:
//
//   ## Waivers
//   tf_id: BEX-001
//   scope: src/legacy/**
//   expires: 2026-12-31
//   rationale: vendored module, fixed upstream
//   continues the rationale on free lines
//
// An expiry date is inclusive: the waiver lapses at the end of that UTC day.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "warden/types.hpp"

namespace warden {

// The change under evaluation: an identifier (PR number, branch) and the
// files it touches.
struct ChangeContext {
  std::string id;
  std::vector<std::string> changed_files;
};

// A waiver applies when it has not expired at `now`, its context is "*" or
// equals ctx.id, and its scope is repo-wide or matches one changed file.
bool waiver_is_active(const Waiver& w, const ChangeContext& ctx, std::int64_t now);
std::vector<Waiver> active_waivers(const std::vector<Waiver>& all, const ChangeContext& ctx,
                                   std::int64_t now);

bool scope_matches(const std::string& scope, const std::string& file);

class WaiverLedger {
 public:
  // Loads existing records from `path`. An empty path keeps the ledger in
  // memory only.
  explicit WaiverLedger(std::string path);
  ~WaiverLedger();

  WaiverLedger(const WaiverLedger&) = delete;
  WaiverLedger& operator=(const WaiverLedger&) = delete;

  // Appends one record. Stamps recorded_unix when unset. Returns false (and
  // writes nothing) on I/O failure.
  bool record(Waiver waiver);

  std::vector<Waiver> all() const;
  std::vector<Waiver> active(const ChangeContext& ctx, std::int64_t now) const;

  // Re-reads the file and checks sequence numbers and digest links.
  bool verify_chain(std::string* error) const;

  std::uint64_t entry_count() const;
  // Non-empty when existing records could not be read at construction.
  std::string load_error() const;
  const std::string& path() const { return path_; }

 private:
  struct Impl;
  std::string path_;
  std::unique_ptr<Impl> impl_;
};

struct WaiverDocument {
  std::vector<Waiver> waivers;
  std::vector<std::string> warnings;        // "line N: reason"
};

WaiverDocument parse_waiver_document(const std::string& text, const std::string& context,
                                     const std::string& source);

// "YYYY-MM-DD" to unix seconds at 00:00 UTC.
std::optional<std::int64_t> parse_iso_date(const std::string& text);

// Substitutes {context} in the configured document pattern.
std::string waiver_document_path(const std::string& pattern, const std::string& context);

}  // namespace warden
