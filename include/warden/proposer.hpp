#pragma once

// warden/proposer.hpp - Decision rules and patch synthesis.
//
// DESIGN:
//   propose() returns an explicit three-valued Proposal. Callers must handle
//   every alternative (std::visit or holds_alternative chains); there is no
//   sentinel patch and no exception path.
//
//     Resolved   the decision rule resolved and the one compatible allowed
//                transform produced a patch.
//     Ambiguous  the rule asks for outside input. Routed to the Agent Bridge.
//     Rejected   nothing may be done: unknown TF, no compatible transform in
//                the allowed set, stale finding, or a transform with no effect.
//
// INVARIANT: propose() never writes to the working tree. It reads through the
// RunContext cache only.

#include <string>
#include <variant>
#include <vector>

#include "warden/registry.hpp"
#include "warden/run_context.hpp"
#include "warden/types.hpp"

namespace warden {

struct Resolved {
  Patch patch;
};

struct Ambiguous {
  std::string reason;
};

struct Rejected {
  std::string reason;
};

using Proposal = std::variant<Resolved, Ambiguous, Rejected>;

struct DecisionOutcome {
  Disposition disposition{Disposition::resolved};
  std::string reason;                       // set when ambiguous
};

DecisionOutcome evaluate_decision_rule(const DecisionRule& rule, const Finding& finding);

Proposal propose(const RunContext& ctx, const Registry& registry, const Finding& finding);

struct AmbiguousFinding {
  Finding finding;
  std::string reason;
};

struct RejectedFinding {
  Finding finding;
  std::string reason;
};

struct ProposeResult {
  std::vector<Patch> patches;               // sorted by (file, first hunk, tf_id, finding_id)
  std::vector<AmbiguousFinding> ambiguous;  // in finding order
  std::vector<RejectedFinding> rejected;
};

ProposeResult propose_all(const RunContext& ctx, const Registry& registry,
                          const std::vector<Finding>& findings);

}  // namespace warden
