#pragma once

// warden/config.hpp - Engine configuration.
//
// Resolution order (later wins):
//   1. compiled-in defaults (EngineConfig{});
//   2. <root>/warden.config.json, parsed with jsonlite;
//   3. WARDEN_* environment overrides (apply_env()).
//
// Relative paths in the config are relative to the tree root.
//
// EXTENSION_POINT: per_directory_config
//   Nested warden.config.json files could narrow footprints per subtree.
//   Invariant: the effective config must stay a pure function of the files
//   and environment read at startup; nothing is re-read mid-run.

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace warden {

// One external check of the verification suite (style, type, tests).
struct CheckSpec {
  std::string name;
  std::vector<std::string> argv;   // argv[0] resolved through PATH when it has no '/'
  std::uint64_t timeout_ms{0};     // 0 = EngineConfig::check_timeout_ms
};

struct EngineConfig {
  std::string tf_dir{"tf"};
  std::string state_dir{".warden"};
  std::string findings_path{".warden/findings.jsonl"};
  std::string patch_path{".warden/patches.diff"};
  std::string tasks_dir{".warden/tasks"};
  std::string ledger_path{".warden/waivers.ndjson"};
  std::string snapshot_dir{".warden/snapshots"};
  std::string journal_path{".warden/last-apply.json"};
  std::string waiver_doc_pattern{"docs/agents/waivers/PR-{context}.md"};
  std::string snapshot_compression{"zstd"};
  std::vector<std::string> skip_dirs{".git", ".warden", "__pycache__", ".venv", "node_modules"};
  std::set<int> gating_tiers{1};
  std::set<std::string> gate_tf_ids;   // non-empty: gate on exactly these TFs instead of tiers
  std::size_t workers{0};              // 0 = hardware_concurrency, clamped to [1, 16]
  std::vector<CheckSpec> checks;
  std::uint64_t check_timeout_ms{600000};
  bool skip_checks{false};
  std::int64_t agent_waiver_ttl_days{14};

  // WARDEN_TF_DIR, WARDEN_WORKERS, WARDEN_LEDGER, WARDEN_CHECK_TIMEOUT_MS,
  // WARDEN_SKIP_CHECKS=1. (WARDEN_EVENT_LOG is read by observability.)
  void apply_env();
};

struct ConfigLoad {
  EngineConfig config;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
  bool ok() const { return errors.empty(); }
};

// Parse a config document. Unknown keys are warnings, mistyped keys errors.
ConfigLoad parse_config(const std::string& json_text);

// Load <root>/warden.config.json (defaults when absent) and apply env.
ConfigLoad load_config(const std::string& root);

std::string config_to_json(const EngineConfig& config);

// Effective worker count for a job list of the given size.
std::size_t effective_workers(const EngineConfig& config, std::size_t jobs);

}  // namespace warden
