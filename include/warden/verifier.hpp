#pragma once

// warden/verifier.hpp - Post-apply verification.
//
// Two independent verdicts:
//   suite  - the configured external checks (style, types, tests), each a
//            bounded child process via run_process();
//   per-TF - the acceptance predicates of every applied TF, evaluated over
//            the touched files (or the TF footprint when none are given).
//
// A timeout is reported as CheckStatus::timeout / ErrorCode::verify_timeout,
// never folded into an ordinary failure.
//
// EXTENSION_POINT: check_sandboxing
//   Checks run with a scrubbed environment (PATH, HOME, PYTHONHASHSEED=0) in
//   their own session. Network isolation or rlimits belong in run_process().

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "warden/config.hpp"
#include "warden/registry.hpp"
#include "warden/run_context.hpp"
#include "warden/types.hpp"
#include "warden/waivers.hpp"

namespace warden {

enum class CheckStatus { pass, fail, timeout, error };
std::string to_string(CheckStatus s);

struct CheckOutcome {
  std::string name;
  CheckStatus status{CheckStatus::pass};
  int exit_code{0};
  std::uint64_t duration_ms{0};
  std::string output;                       // stderr, else stdout (capped)
  std::string reason;
};

struct TfVerdict {
  std::string tf_id;
  bool passed{true};
  std::size_t files_checked{0};
  std::vector<std::string> failures;        // "<predicate>: <detail>"
  std::vector<std::string> failed_files;    // sorted, unique
};

struct VerifyOptions {
  std::vector<CheckSpec> checks;
  bool run_checks{true};
  std::uint64_t default_timeout_ms{600000};
  // Non-empty: no_findings fails only while one of these findings persists,
  // so findings the run did not touch are not counted as regressions.
  std::set<std::string> applied_finding_ids;
  bool waive_failures{false};               // waivers are scoped to the failing files
  WaiverLedger* ledger{nullptr};
  std::string context{"*"};
  std::int64_t now{0};
  std::int64_t waiver_ttl_days{14};
};

struct VerifyReport {
  std::vector<CheckOutcome> checks;
  std::vector<TfVerdict> tfs;
  std::vector<Waiver> waivers_recorded;

  bool suite_ok() const;
  bool tfs_ok() const;
  bool ok() const { return suite_ok() && tfs_ok(); }
  bool any_timeout() const;
};

VerifyReport verify(const RunContext& ctx, const Registry& registry, const std::set<std::string>& applied_tfs,
                    const std::vector<std::string>& touched_files, const VerifyOptions& opts);

CheckOutcome run_check(const CheckSpec& check, const std::string& cwd, std::uint64_t default_timeout_ms);

std::string verify_report_to_json(const VerifyReport& report);

}  // namespace warden
