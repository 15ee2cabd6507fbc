#pragma once

// warden/gate.hpp - Pass/fail decision over a finding set.
//
// evaluate() is a pure function of its arguments: no filesystem, no clock
// (the caller passes `now`), no global state. The same inputs always yield
// the same GateDecision, which is what lets CI re-run a gate offline from a
// saved findings stream.
//
// Pipeline:
//   findings
//     -> gating filter   (tier in gating_tiers, or tf_id in gate_tf_ids)
//     -> footprint       (file in changed_files)
//     -> waivers         (active waiver with the same tf_id whose scope
//                         matches the finding's file)
//     -> remaining       (> 0 fails)
//
// Monotonicity: adding a waiver can only remove findings from `remaining`.

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "warden/types.hpp"
#include "warden/waivers.hpp"

namespace warden {

struct PrecedenceConfig {
  std::set<int> gating_tiers{1};
  std::set<std::string> gate_tf_ids;        // non-empty overrides gating_tiers
};

struct GateDecision {
  bool pass{true};
  std::size_t total_findings{0};
  std::size_t gated_tier{0};                // findings passing the gating filter
  std::size_t in_footprint{0};              // ... and inside changed_files
  std::size_t waivers_active{0};
  std::size_t waived{0};
  std::size_t remaining{0};
  std::string context;
  std::vector<std::string> changed_files;
  PrecedenceConfig precedence;
  std::vector<Finding> remaining_findings;
};

GateDecision evaluate(const std::vector<Finding>& findings, const std::vector<std::string>& changed_files,
                      const std::vector<Waiver>& waivers, const PrecedenceConfig& precedence,
                      const std::string& context, std::int64_t now);

std::string gate_report_json(const GateDecision& decision);

// One path per line. Blank lines and '#' comments are skipped; paths are
// normalized, sorted and deduplicated.
std::vector<std::string> parse_changed_files(const std::string& text);

}  // namespace warden
