#pragma once

// warden/agent_bridge.hpp - Hand-off of ambiguous findings to an external
// agent, and intake of the diffs it returns.
//
// emit:
//   One JSON task packet per ambiguous finding, written to
//   <out_dir>/task_NNN_<TF>.json (NNN from 001 in finding order). Stale
//   task_*.json files in out_dir are removed first so the directory always
//   mirrors the current ambiguous set.
//
// ingest:
//   Each returned diff is parsed, applied to an isolated copy of the tree and
//   verified there. Only a diff that applies cleanly and verifies is applied
//   to the real tree, through the same apply engine as proposed patches.
//   Anything else records a waiver naming the failure, so an unfixable
//   finding stops blocking the gate until the waiver expires.
//
// INVARIANT: the real tree is written only after isolated verification
// passed. Re-ingesting an applied diff is a no-op (counted `unchanged`).

#include <cstdint>
#include <string>
#include <vector>

#include "warden/apply.hpp"
#include "warden/proposer.hpp"
#include "warden/registry.hpp"
#include "warden/run_context.hpp"
#include "warden/verifier.hpp"
#include "warden/waivers.hpp"

namespace warden {

struct TaskPacket {
  std::string tf_id;
  std::string finding_id;
  std::string file;
  Span span;
  std::string base_digest;
  std::string frame;                        // enclosing def/class
  std::string code_frame;                   // span lines +/- 2
  std::string message;
  std::string reason;                       // why the proposer deferred
  std::string decision_rule;
  std::vector<std::string> allowed_transforms;
  std::vector<std::string> hints;
  std::string patch_header;                 // metadata line the reply diff should carry
};

std::string task_packet_to_json(const TaskPacket& packet);

struct EmitResult {
  std::vector<TaskPacket> packets;
  std::vector<std::string> paths;           // parallel to packets
  std::string error;
  bool ok() const { return error.empty(); }
};

EmitResult emit_tasks(const RunContext& ctx, const Registry& registry, const std::vector<AmbiguousFinding>& ambiguous,
                      const std::string& out_dir);

struct IngestDiff {
  std::string name;                         // file name or label; a TF id in it is the fallback owner
  std::string text;
};

struct IngestOptions {
  VerifyOptions verify;                     // waive_failures is ignored here
  ApplyOptions apply;
  WaiverLedger* ledger{nullptr};
  std::string context{"*"};
  std::int64_t now{0};
  std::int64_t waiver_ttl_days{14};
};

enum class IngestStatus { accepted, waived, unchanged, rejected };
std::string to_string(IngestStatus s);

struct IngestItem {
  std::string name;
  IngestStatus status{IngestStatus::rejected};
  std::vector<std::string> tf_ids;
  std::vector<std::string> files;
  std::string reason;
};

struct IngestResult {
  std::size_t accepted{0};
  std::size_t waived{0};
  std::size_t unchanged{0};
  std::size_t rejected{0};                  // failed and no TF to waive
  std::vector<IngestItem> items;
};

IngestResult ingest(RunContext& ctx, const Registry& registry, const std::vector<IngestDiff>& diffs,
                    const IngestOptions& opts);

std::string ingest_result_to_json(const IngestResult& result);

}  // namespace warden
