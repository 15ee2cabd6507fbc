#include "warden/proposer.hpp"

#include <algorithm>
#include <tuple>

#include "warden/config.hpp"
#include "warden/observability.hpp"
#include "warden/transforms.hpp"
#include "warden/worker_pool.hpp"

namespace warden {

DecisionOutcome evaluate_decision_rule(const DecisionRule& rule, const Finding& finding) {
  DecisionOutcome out;
  switch (rule.kind) {
    case DecisionKind::auto_fix:
      return out;
    case DecisionKind::ask:
      out.disposition = Disposition::ambiguous;
      out.reason = "decision rule asks for review: " + rule.text;
      return out;
    case DecisionKind::require_hints:
      if (finding.hints.empty()) {
        out.disposition = Disposition::ambiguous;
        out.reason = "no detector hints to resolve: " + rule.text;
      }
      return out;
    case DecisionKind::ask_if_hint:
      for (const auto& token : rule.tokens) {
        if (std::find(finding.hints.begin(), finding.hints.end(), token) != finding.hints.end()) {
          out.disposition = Disposition::ambiguous;
          out.reason = "hint '" + token + "' requires review: " + rule.text;
          return out;
        }
      }
      return out;
  }
  return out;
}

Proposal propose(const RunContext& ctx, const Registry& registry, const Finding& finding) {
  const TfDefinition* tf = registry.find(finding.tf_id);
  if (!tf) return Rejected{"unknown TF " + finding.tf_id};
  if (tf->status != TfStatus::active) return Rejected{"TF " + tf->id + " is " + to_string(tf->status)};

  DecisionOutcome decision = evaluate_decision_rule(tf->decision, finding);
  if (decision.disposition == Disposition::ambiguous) return Ambiguous{std::move(decision.reason)};

  const auto kind = compatible_transform(tf->strategy());
  if (!kind || !tf->allows(*kind)) {
    return Rejected{"no allowed transform for strategy " + to_string(tf->strategy())};
  }

  auto file = ctx.load(finding.file);
  if (!file) return Rejected{"file unreadable"};
  TransformResult tr = apply_transform(*kind, *tf, *file, finding);
  if (!tr.ok()) return Rejected{std::move(tr.rejection)};

  Patch patch;
  patch.tf_id = tf->id;
  patch.finding_id = finding.id;
  patch.file = finding.file;
  patch.base_digest = file->digest;
  patch.hunks = std::move(tr.hunks);
  std::sort(patch.hunks.begin(), patch.hunks.end(),
            [](const Hunk& a, const Hunk& b) { return a.start < b.start; });
  return Resolved{std::move(patch)};
}

ProposeResult propose_all(const RunContext& ctx, const Registry& registry,
                          const std::vector<Finding>& findings) {
  std::vector<std::optional<Proposal>> slots(findings.size());
  parallel_for(findings.size(), effective_workers(ctx.config(), findings.size()),
               [&](std::size_t i) { slots[i] = propose(ctx, registry, findings[i]); });

  ProposeResult result;
  for (std::size_t i = 0; i < findings.size(); ++i) {
    Proposal& p = *slots[i];
    if (auto* r = std::get_if<Resolved>(&p)) {
      result.patches.push_back(std::move(r->patch));
    } else if (auto* a = std::get_if<Ambiguous>(&p)) {
      result.ambiguous.push_back(AmbiguousFinding{findings[i], std::move(a->reason)});
    } else {
      result.rejected.push_back(RejectedFinding{findings[i], std::get<Rejected>(p).reason});
    }
  }

  std::sort(result.patches.begin(), result.patches.end(), [](const Patch& a, const Patch& b) {
    const std::uint32_t sa = a.hunks.empty() ? 0 : a.hunks.front().start;
    const std::uint32_t sb = b.hunks.empty() ? 0 : b.hunks.front().start;
    return std::tie(a.file, sa, a.tf_id, a.finding_id) < std::tie(b.file, sb, b.tf_id, b.finding_id);
  });

  auto& stats = global_engine_stats();
  stats.patches_proposed.fetch_add(result.patches.size(), std::memory_order_relaxed);
  stats.ambiguous_findings.fetch_add(result.ambiguous.size(), std::memory_order_relaxed);
  stats.rejected_findings.fetch_add(result.rejected.size(), std::memory_order_relaxed);
  return result;
}

}  // namespace warden
