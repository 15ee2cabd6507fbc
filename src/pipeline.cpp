#include "warden/pipeline.hpp"

#include <filesystem>

#include "warden/finding.hpp"
#include "warden/fsutil.hpp"
#include "warden/jsonlite.hpp"
#include "warden/patch.hpp"
#include "warden/snapshot.hpp"
#include "warden/waivers.hpp"

namespace fs = std::filesystem;

namespace warden {

int PipelineReport::exit_code() const {
  if (registry_fatal) return 3;
  if (stage_error) return 2;
  if (verification && !verification->suite_ok()) return 4;
  if (!gate.pass) return 1;
  return 0;
}

namespace {

template <typename Fn>
void run_stage(PipelineReport& report, const std::string& name, Fn&& fn) {
  StageEvent ev;
  ev.stage = name;
  {
    ScopeTimer timer(ev.duration_ns);
    fn(ev);
  }
  emit_stage_event(ev);
  report.stages.push_back(std::move(ev));
}

bool write_output(const RunContext& ctx, const std::string& rel, const std::string& data, StageEvent& ev) {
  if (rel.empty()) return true;
  const std::string path = ctx.absolute(rel);
  if (atomic_write(path, data)) return true;
  report_issue(ErrorCode::io_error, "", rel, "cannot write " + path);
  ev.ok = false;
  ev.error_code = to_string(ErrorCode::io_error);
  return false;
}

}  // namespace

PrecedenceConfig precedence_from(const EngineConfig& config) {
  PrecedenceConfig p;
  p.gating_tiers = config.gating_tiers;
  p.gate_tf_ids = config.gate_tf_ids;
  return p;
}

std::vector<Waiver> collect_waivers(const RunContext& ctx, const std::string& context) {
  WaiverLedger ledger(ctx.absolute(ctx.config().ledger_path));
  std::vector<Waiver> out = ledger.all();

  const std::string rel = waiver_document_path(ctx.config().waiver_doc_pattern, context);
  std::string text;
  std::error_code ec;
  if (!context.empty() && context != "*" && fs::exists(ctx.absolute(rel), ec) &&
      read_file(ctx.absolute(rel), &text)) {
    WaiverDocument doc = parse_waiver_document(text, context, rel);
    for (const auto& w : doc.warnings) report_issue(ErrorCode::waiver_unparseable, "", rel, w);
    out.insert(out.end(), doc.waivers.begin(), doc.waivers.end());
  }
  return out;
}

PipelineReport run_pipeline(RunContext& ctx, const PipelineOptions& opts) {
  PipelineReport report;
  const EngineConfig& config = ctx.config();

  RegistryBuild build;
  run_stage(report, "registry", [&](StageEvent& ev) {
    build = load_registry(ctx.absolute(config.tf_dir));
    ev.counts["documents"] = build.documents;
    ev.counts["active"] = build.registry.active().size();
    ev.counts["violations"] = build.violations.size();
    if (build.fatal) {
      ev.ok = false;
      ev.error_code = to_string(ErrorCode::registry_fatal);
    }
  });
  report.violations = build.violations;
  if (build.fatal) {
    report.registry_fatal = true;
    report.fatal_reason = build.fatal_reason;
    return report;
  }
  const Registry& registry = build.registry;

  run_stage(report, "scan", [&](StageEvent& ev) {
    report.initial_scan = scan(ctx, registry);
    ev.counts["files"] = report.initial_scan.files_scanned;
    ev.counts["findings"] = report.initial_scan.findings.size();
    ev.counts["detector_failures"] = report.initial_scan.failures.size();
  });

  run_stage(report, "propose", [&](StageEvent& ev) {
    report.proposals = propose_all(ctx, registry, report.initial_scan.findings);
    ev.counts["patches"] = report.proposals.patches.size();
    ev.counts["ambiguous"] = report.proposals.ambiguous.size();
    ev.counts["rejected"] = report.proposals.rejected.size();
    if (!write_output(ctx, config.patch_path, render_patch_stream(ctx, report.proposals.patches), ev)) {
      report.stage_error = true;
    }
  });

  if (opts.apply && !report.proposals.patches.empty()) {
    run_stage(report, "apply", [&](StageEvent& ev) {
      SnapshotStore store(ctx.absolute(config.snapshot_dir));
      ApplyOptions aopts;
      aopts.dry_run = opts.dry_run;
      aopts.snapshots = opts.dry_run ? nullptr : &store;
      aopts.compression = config.snapshot_compression;
      report.applied = apply_patches(ctx, report.proposals.patches, aopts);
      ev.counts["applied"] = report.applied.patches_applied;
      ev.counts["unchanged"] = report.applied.patches_unchanged;
      ev.counts["conflicts"] = report.applied.conflicts.size();
      ev.counts["files"] = report.applied.files.size();
      if (!opts.dry_run && !report.applied.files.empty() &&
          !write_output(ctx, config.journal_path, apply_journal_to_json(report.applied), ev)) {
        report.stage_error = true;
      }
    });
  }

  const bool changed = !opts.dry_run && !report.applied.files.empty();
  if (opts.verify && changed) {
    run_stage(report, "verify", [&](StageEvent& ev) {
      WaiverLedger ledger(ctx.absolute(config.ledger_path));
      VerifyOptions vopts;
      vopts.checks = config.checks;
      vopts.run_checks = !config.skip_checks;
      vopts.default_timeout_ms = config.check_timeout_ms;
      vopts.waive_failures = opts.waive_verify_failures;
      for (const auto& f : report.applied.files) {
        vopts.applied_finding_ids.insert(f.finding_ids.begin(), f.finding_ids.end());
      }
      vopts.ledger = &ledger;
      vopts.context = opts.context;
      vopts.now = opts.now;
      vopts.waiver_ttl_days = config.agent_waiver_ttl_days;
      report.verification =
          verify(ctx, registry, report.applied.applied_tfs(), report.applied.touched_files(), vopts);
      ev.counts["checks"] = report.verification->checks.size();
      ev.counts["tfs"] = report.verification->tfs.size();
      ev.counts["waivers_recorded"] = report.verification->waivers_recorded.size();
      if (!report.verification->suite_ok()) {
        ev.ok = false;
        ev.error_code = to_string(report.verification->any_timeout() ? ErrorCode::verify_timeout
                                                                     : ErrorCode::verify_fail);
      }
    });
  }

  if (changed) {
    run_stage(report, "rescan", [&](StageEvent& ev) {
      report.final_scan = scan(ctx, registry);
      ProposeResult again = propose_all(ctx, registry, report.final_scan.findings);
      report.ambiguous = std::move(again.ambiguous);
      ev.counts["findings"] = report.final_scan.findings.size();
      ev.counts["ambiguous"] = report.ambiguous.size();
    });
  } else {
    report.final_scan = report.initial_scan;
    report.ambiguous = report.proposals.ambiguous;
  }

  run_stage(report, "findings", [&](StageEvent& ev) {
    ev.counts["findings"] = report.final_scan.findings.size();
    if (!write_output(ctx, config.findings_path, findings_to_jsonl(report.final_scan.findings), ev)) {
      report.stage_error = true;
    }
  });

  if (opts.emit) {
    run_stage(report, "emit", [&](StageEvent& ev) {
      report.emitted = emit_tasks(ctx, registry, report.ambiguous, ctx.absolute(config.tasks_dir));
      ev.counts["packets"] = report.emitted.packets.size();
      if (!report.emitted.ok()) {
        ev.ok = false;
        ev.error_code = to_string(ErrorCode::io_error);
        report.stage_error = true;
      }
    });
  }

  run_stage(report, "gate", [&](StageEvent& ev) {
    std::vector<std::string> changed_files = opts.gate_all_files ? ctx.list_files() : opts.changed_files;
    const auto waivers = collect_waivers(ctx, opts.context);
    report.gate = evaluate(report.final_scan.findings, changed_files, waivers, precedence_from(config),
                           opts.context, opts.now);
    ev.counts["in_footprint"] = report.gate.in_footprint;
    ev.counts["waived"] = report.gate.waived;
    ev.counts["remaining"] = report.gate.remaining;
    if (!report.gate.pass) {
      ev.ok = false;
      ev.error_code = to_string(ErrorCode::gate_fail);
      global_engine_stats().gate_failures.fetch_add(1, std::memory_order_relaxed);
    }
  });
  return report;
}

std::string pipeline_report_to_json(const PipelineReport& report) {
  using jsonlite::Value;
  auto u = [](std::size_t n) { return Value{static_cast<std::uint64_t>(n)}; };
  jsonlite::Object o;
  o["exit_code"] = u(static_cast<std::size_t>(report.exit_code()));
  if (report.registry_fatal) {
    o["registry_fatal"] = Value{report.fatal_reason};
  }
  o["schema_violations"] = u(report.violations.size());
  o["findings_initial"] = u(report.initial_scan.findings.size());
  o["findings_final"] = u(report.final_scan.findings.size());
  o["detector_failures"] = u(report.initial_scan.failures.size());
  o["patches"] = u(report.proposals.patches.size());
  o["rejected"] = u(report.proposals.rejected.size());
  o["applied"] = u(report.applied.patches_applied);
  o["apply_conflicts"] = u(report.applied.conflicts.size());
  o["files_written"] = u(report.applied.files.size());
  o["ambiguous"] = u(report.ambiguous.size());
  o["task_packets"] = u(report.emitted.packets.size());
  if (report.verification) {
    std::optional<jsonlite::JsonError> err;
    o["verify"] = jsonlite::parse_value(verify_report_to_json(*report.verification), &err);
    o["verify_timeout"] = Value{report.verification->any_timeout()};
  }
  if (!report.registry_fatal) {
    std::optional<jsonlite::JsonError> err;
    o["gate"] = jsonlite::parse_value(gate_report_json(report.gate), &err);
  }
  jsonlite::Array stages;
  for (const auto& ev : report.stages) {
    std::optional<jsonlite::JsonError> err;
    stages.push_back(jsonlite::parse_value(stage_event_to_json(ev), &err));
  }
  o["stages"] = Value{stages};
  return jsonlite::to_json(Value{o});
}

}  // namespace warden
