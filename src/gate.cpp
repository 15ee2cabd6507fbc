#include "warden/gate.hpp"

#include <algorithm>

#include "warden/finding.hpp"
#include "warden/fsutil.hpp"
#include "warden/jsonlite.hpp"
#include "warden/outline.hpp"

namespace warden {

namespace {

bool gated(const Finding& f, const PrecedenceConfig& precedence) {
  if (!precedence.gate_tf_ids.empty()) return precedence.gate_tf_ids.count(f.tf_id) > 0;
  return precedence.gating_tiers.count(f.tier) > 0;
}

bool waived_by(const Finding& f, const std::vector<Waiver>& active) {
  for (const auto& w : active) {
    if (w.tf_id == f.tf_id && scope_matches(w.scope, f.file)) return true;
  }
  return false;
}

}  // namespace

GateDecision evaluate(const std::vector<Finding>& findings, const std::vector<std::string>& changed_files,
                      const std::vector<Waiver>& waivers, const PrecedenceConfig& precedence,
                      const std::string& context, std::int64_t now) {
  GateDecision d;
  d.context = context;
  d.precedence = precedence;
  for (const auto& f : changed_files) d.changed_files.push_back(normalize_rel_path(f));
  std::sort(d.changed_files.begin(), d.changed_files.end());
  d.changed_files.erase(std::unique(d.changed_files.begin(), d.changed_files.end()), d.changed_files.end());

  const ChangeContext change{context, d.changed_files};
  const auto active = active_waivers(waivers, change, now);
  d.waivers_active = active.size();
  d.total_findings = findings.size();

  for (const auto& f : findings) {
    if (!gated(f, precedence)) continue;
    ++d.gated_tier;
    if (!std::binary_search(d.changed_files.begin(), d.changed_files.end(), f.file)) continue;
    ++d.in_footprint;
    if (waived_by(f, active)) {
      ++d.waived;
      continue;
    }
    d.remaining_findings.push_back(f);
  }
  sort_and_dedupe(d.remaining_findings);
  d.remaining = d.remaining_findings.size();
  d.pass = d.remaining == 0;
  return d;
}

std::string gate_report_json(const GateDecision& d) {
  using jsonlite::Value;
  auto count = [](std::size_t n) { return Value{static_cast<std::uint64_t>(n)}; };
  jsonlite::Object o;
  o["decision"] = Value{std::string(d.pass ? "pass" : "fail")};
  o["total_findings"] = count(d.total_findings);
  o["gated_tier"] = count(d.gated_tier);
  o["in_footprint"] = count(d.in_footprint);
  o["waivers_active"] = count(d.waivers_active);
  o["waived"] = count(d.waived);
  o["remaining"] = count(d.remaining);
  o["context"] = Value{d.context};

  jsonlite::Array files;
  for (const auto& f : d.changed_files) files.push_back(Value{f});
  o["changed_files"] = Value{files};

  jsonlite::Array tiers;
  for (int t : d.precedence.gating_tiers) tiers.push_back(Value{static_cast<std::uint64_t>(t)});
  o["gating_tiers"] = Value{tiers};
  if (!d.precedence.gate_tf_ids.empty()) {
    jsonlite::Array ids;
    for (const auto& id : d.precedence.gate_tf_ids) ids.push_back(Value{id});
    o["gate_tf_ids"] = Value{ids};
  }

  jsonlite::Array remaining;
  for (const auto& f : d.remaining_findings) {
    jsonlite::Object r;
    r["id"] = Value{f.id};
    r["tf_id"] = Value{f.tf_id};
    r["file"] = Value{f.file};
    r["line"] = Value{static_cast<std::uint64_t>(f.span.line)};
    r["col"] = Value{static_cast<std::uint64_t>(f.span.col)};
    r["tier"] = Value{static_cast<std::uint64_t>(f.tier)};
    r["message"] = Value{f.message};
    remaining.push_back(Value{r});
  }
  o["remaining_findings"] = Value{remaining};
  return jsonlite::to_json(Value{o});
}

std::vector<std::string> parse_changed_files(const std::string& text) {
  std::vector<std::string> out;
  for (const auto& raw : split_lines(text, nullptr)) {
    const std::string line = trim(raw);
    if (line.empty() || line[0] == '#') continue;
    out.push_back(normalize_rel_path(line));
  }
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

}  // namespace warden
