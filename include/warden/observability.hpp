#pragma once

// warden/observability.hpp - Structured stage events, issue reporting and
// process-wide counters.
//
// DESIGN:
//   StageEvent is the canonical observable unit. Every pipeline stage emits
//   one StageEvent, which is:
//     - recorded in EngineStats (always);
//     - forwarded to a registered hook if one is set, otherwise
//     - JSONL-appended to the file named by WARDEN_EVENT_LOG (if set).
//
//   Issue is the user-visible failure unit: error code, TF id, file and a
//   one-line reason. report_issue() prints exactly one JSON line to stderr,
//   never a stack trace.
//
// INVARIANT: event and issue emission never throws and never blocks a stage
// on a slow sink for longer than one fwrite.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "warden/types.hpp"

namespace warden {

struct StageEvent {
  std::string stage;                          // registry|scan|propose|apply|emit|ingest|verify|gate
  bool ok{true};
  std::uint64_t duration_ns{0};
  std::map<std::string, std::uint64_t> counts;
  std::string error_code;
};

std::string stage_event_to_json(const StageEvent& ev);

struct Issue {
  ErrorCode code{ErrorCode::none};
  std::string tf_id;
  std::string file;
  std::string reason;
};

std::string issue_to_json(const Issue& issue);

// ---------------------------------------------------------------------------
// EngineStats - global aggregated counters
// ---------------------------------------------------------------------------
// Thread-safe. Scalar counters are atomic; per-code issue counts use a mutex.
class EngineStats {
 public:
  void record_stage(const StageEvent& ev);
  void record_issue(ErrorCode code);
  std::uint64_t issue_count(ErrorCode code) const;
  std::string to_json() const;
  void reset();

  // MICRO_DOCUMENTED: counters touched from scanner/apply worker threads are
  // aligned to separate cache lines.
  alignas(64) std::atomic<std::uint64_t> files_scanned{0};
  alignas(64) std::atomic<std::uint64_t> findings_emitted{0};
  alignas(64) std::atomic<std::uint64_t> detector_failures{0};
  alignas(64) std::atomic<std::uint64_t> patches_proposed{0};
  std::atomic<std::uint64_t> ambiguous_findings{0};
  std::atomic<std::uint64_t> rejected_findings{0};
  alignas(64) std::atomic<std::uint64_t> patches_applied{0};
  alignas(64) std::atomic<std::uint64_t> apply_conflicts{0};
  std::atomic<std::uint64_t> files_written{0};
  std::atomic<std::uint64_t> verify_failures{0};
  std::atomic<std::uint64_t> verify_timeouts{0};
  std::atomic<std::uint64_t> gate_failures{0};
  std::atomic<std::uint64_t> waivers_recorded{0};
  std::atomic<std::uint64_t> stage_runs{0};
  std::atomic<std::uint64_t> failed_stages{0};

 private:
  mutable std::mutex issue_mu_;
  std::map<std::string, std::uint64_t> issues_by_code_;
};

EngineStats& global_engine_stats();

// Fire-and-forget stage event emission.
void emit_stage_event(const StageEvent& ev);

using StageEventHook = void (*)(const StageEvent&);
void set_stage_event_hook(StageEventHook hook);

// Report a user-visible failure. Counted in EngineStats; printed as one JSON
// line on stderr unless an issue hook is installed (tests capture issues that
// way instead of scraping stderr).
void report_issue(ErrorCode code, const std::string& tf_id, const std::string& file,
                  const std::string& reason);

using IssueHook = void (*)(const Issue&);
void set_issue_hook(IssueHook hook);

// ---------------------------------------------------------------------------
// ScopeTimer - RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  std::uint64_t& out_ns;
  explicit ScopeTimer(std::uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace warden
