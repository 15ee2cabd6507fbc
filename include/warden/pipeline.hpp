#pragma once

// warden/pipeline.hpp - The end-to-end run: registry, scan, propose, apply,
// verify, emit, gate.
//
// Stages run in strict sequence. Each emits one StageEvent (duration from
// ScopeTimer, counts, error_code when it failed). After an apply that changed
// files the tree is re-scanned and re-proposed, so emit and gate see the
// post-apply state.
//
// EXIT CODES (PipelineReport::exit_code):
//   3  registry fatal (nothing else ran)
//   2  a stage could not execute (unwritable output, emit failure)
//   4  the verification suite failed or timed out
//   1  gate failure
//   0  otherwise
//
// Per-TF verification failures are waived into the ledger during a run; the
// gate then decides.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "warden/agent_bridge.hpp"
#include "warden/apply.hpp"
#include "warden/config.hpp"
#include "warden/gate.hpp"
#include "warden/observability.hpp"
#include "warden/proposer.hpp"
#include "warden/registry.hpp"
#include "warden/run_context.hpp"
#include "warden/scanner.hpp"
#include "warden/verifier.hpp"

namespace warden {

struct PipelineOptions {
  std::string context{"*"};
  std::vector<std::string> changed_files;
  bool gate_all_files{false};               // changed set = every tree file
  bool apply{true};
  bool dry_run{false};
  bool verify{true};
  bool waive_verify_failures{false};        // record file-scoped waivers for TFs failing verification
  bool emit{true};
  std::int64_t now{0};
};

struct PipelineReport {
  bool registry_fatal{false};
  std::string fatal_reason;
  std::vector<SchemaViolation> violations;
  ScanResult initial_scan;
  ProposeResult proposals;
  ApplyResult applied;
  std::optional<VerifyReport> verification;
  ScanResult final_scan;
  std::vector<AmbiguousFinding> ambiguous;
  EmitResult emitted;
  GateDecision gate;
  std::vector<StageEvent> stages;
  bool stage_error{false};

  int exit_code() const;
};

PipelineReport run_pipeline(RunContext& ctx, const PipelineOptions& opts);

std::string pipeline_report_to_json(const PipelineReport& report);

// Waivers from the ledger plus the change's waiver document, if present.
// Document warnings are reported as waiver_unparseable issues.
std::vector<Waiver> collect_waivers(const RunContext& ctx, const std::string& context);

PrecedenceConfig precedence_from(const EngineConfig& config);

}  // namespace warden
