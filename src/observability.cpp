#include "warden/observability.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>

#include "warden/jsonlite.hpp"

namespace warden {

std::string stage_event_to_json(const StageEvent& ev) {
  std::string line;
  line.reserve(192);
  line += "{\"stage\":\"";
  line += jsonlite::escape(ev.stage);
  line += "\",\"ok\":";
  line += ev.ok ? "true" : "false";
  line += ",\"duration_ns\":";
  line += std::to_string(ev.duration_ns);
  line += ",\"error_code\":\"";
  line += ev.error_code;
  line += "\",\"counts\":{";
  bool first = true;
  for (const auto& [k, v] : ev.counts) {
    if (!first) line += ',';
    first = false;
    line += "\"" + jsonlite::escape(k) + "\":" + std::to_string(v);
  }
  line += "}}";
  return line;
}

std::string issue_to_json(const Issue& issue) {
  return "{\"error_code\":\"" + to_string(issue.code) + "\",\"tf_id\":\"" +
         jsonlite::escape(issue.tf_id) + "\",\"file\":\"" + jsonlite::escape(issue.file) +
         "\",\"reason\":\"" + jsonlite::escape(issue.reason) + "\"}";
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record_stage(const StageEvent& ev) {
  stage_runs.fetch_add(1, std::memory_order_relaxed);
  if (!ev.ok) failed_stages.fetch_add(1, std::memory_order_relaxed);
}

void EngineStats::record_issue(ErrorCode code) {
  std::lock_guard<std::mutex> lk(issue_mu_);
  ++issues_by_code_[to_string(code)];
}

std::uint64_t EngineStats::issue_count(ErrorCode code) const {
  std::lock_guard<std::mutex> lk(issue_mu_);
  auto it = issues_by_code_.find(to_string(code));
  return it == issues_by_code_.end() ? 0 : it->second;
}

void EngineStats::reset() {
  for (auto* c : {&files_scanned, &findings_emitted, &detector_failures, &patches_proposed,
                  &ambiguous_findings, &rejected_findings, &patches_applied, &apply_conflicts,
                  &files_written, &verify_failures, &verify_timeouts, &gate_failures,
                  &waivers_recorded, &stage_runs, &failed_stages}) {
    c->store(0, std::memory_order_relaxed);
  }
  std::lock_guard<std::mutex> lk(issue_mu_);
  issues_by_code_.clear();
}

std::string EngineStats::to_json() const {
  // MICRO_OPT: pre-reserved string avoids repeated reallocation.
  std::string out;
  out.reserve(640);
  auto field = [&out](const char* name, const std::atomic<std::uint64_t>& v, bool first = false) {
    if (!first) out += ',';
    out += '"';
    out += name;
    out += "\":";
    out += std::to_string(v.load(std::memory_order_relaxed));
  };
  out += "{\"scan\":{";
  field("files_scanned", files_scanned, true);
  field("findings_emitted", findings_emitted);
  field("detector_failures", detector_failures);
  out += "},\"propose\":{";
  field("patches_proposed", patches_proposed, true);
  field("ambiguous_findings", ambiguous_findings);
  field("rejected_findings", rejected_findings);
  out += "},\"apply\":{";
  field("patches_applied", patches_applied, true);
  field("apply_conflicts", apply_conflicts);
  field("files_written", files_written);
  out += "},\"verify\":{";
  field("verify_failures", verify_failures, true);
  field("verify_timeouts", verify_timeouts);
  out += "},\"gate\":{";
  field("gate_failures", gate_failures, true);
  field("waivers_recorded", waivers_recorded);
  out += "},\"stages\":{";
  field("stage_runs", stage_runs, true);
  field("failed_stages", failed_stages);
  out += "},\"issues\":{";
  {
    std::lock_guard<std::mutex> lk(issue_mu_);
    bool first = true;
    for (const auto& [code, n] : issues_by_code_) {
      if (!first) out += ',';
      first = false;
      out += "\"" + code + "\":" + std::to_string(n);
    }
  }
  out += "}}";
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + emission
// ---------------------------------------------------------------------------

EngineStats& global_engine_stats() {
  static EngineStats inst;
  return inst;
}

namespace {
std::atomic<StageEventHook> g_event_hook{nullptr};
std::atomic<IssueHook> g_issue_hook{nullptr};
std::mutex g_stderr_mu;
}  // namespace

void set_stage_event_hook(StageEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void set_issue_hook(IssueHook hook) {
  g_issue_hook.store(hook, std::memory_order_release);
}

void emit_stage_event(const StageEvent& ev) {
  global_engine_stats().record_stage(ev);

  StageEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  // Activation: WARDEN_EVENT_LOG=/path/to/events.jsonl
  const char* log_path = std::getenv("WARDEN_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  const std::string line = stage_event_to_json(ev) + "\n";
  // O_APPEND writes below PIPE_BUF are atomic on POSIX.
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

void report_issue(ErrorCode code, const std::string& tf_id, const std::string& file,
                  const std::string& reason) {
  global_engine_stats().record_issue(code);
  const Issue issue{code, tf_id, file, reason};
  IssueHook hook = g_issue_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(issue);
    return;
  }
  std::lock_guard<std::mutex> lk(g_stderr_mu);
  std::cerr << issue_to_json(issue) << "\n";
}

}  // namespace warden
