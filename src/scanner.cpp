#include "warden/scanner.hpp"

#include "warden/config.hpp"
#include "warden/detectors.hpp"
#include "warden/finding.hpp"
#include "warden/observability.hpp"
#include "warden/proposer.hpp"
#include "warden/worker_pool.hpp"

namespace warden {

namespace {

struct FileSlot {
  std::vector<Finding> findings;
  std::vector<DetectorFailure> failures;
  bool scanned{false};
};

void scan_one(const RunContext& ctx, const std::vector<const TfDefinition*>& tfs,
              const std::string& rel, FileSlot& slot) {
  std::vector<const TfDefinition*> applicable;
  for (const auto* tf : tfs) {
    if (tf->in_footprint(rel)) applicable.push_back(tf);
  }
  if (applicable.empty()) return;
  slot.scanned = true;

  auto file = ctx.load(rel);
  if (!file) {
    for (const auto* tf : applicable) {
      slot.failures.push_back(DetectorFailure{tf->id, rel, "file unreadable"});
    }
    return;
  }

  for (const auto* tf : applicable) {
    DetectorOutput out = run_detector(*tf, *file);
    if (out.failure) {
      slot.failures.push_back(DetectorFailure{tf->id, rel, *out.failure});
      continue;
    }
    for (auto& f : out.findings) {
      f.disposition = evaluate_decision_rule(tf->decision, f).disposition;
      slot.findings.push_back(std::move(f));
    }
  }
}

}  // namespace

ScanResult scan_files(const RunContext& ctx, const std::vector<const TfDefinition*>& tfs,
                      const std::vector<std::string>& files) {
  std::vector<FileSlot> slots(files.size());
  parallel_for(files.size(), effective_workers(ctx.config(), files.size()),
               [&](std::size_t i) { scan_one(ctx, tfs, files[i], slots[i]); });

  ScanResult result;
  for (auto& slot : slots) {
    if (slot.scanned) ++result.files_scanned;
    for (auto& f : slot.findings) result.findings.push_back(std::move(f));
    for (auto& fail : slot.failures) result.failures.push_back(std::move(fail));
  }
  sort_and_dedupe(result.findings);

  auto& stats = global_engine_stats();
  stats.files_scanned.fetch_add(result.files_scanned, std::memory_order_relaxed);
  stats.findings_emitted.fetch_add(result.findings.size(), std::memory_order_relaxed);
  stats.detector_failures.fetch_add(result.failures.size(), std::memory_order_relaxed);
  for (const auto& fail : result.failures) {
    report_issue(ErrorCode::detector_failure, fail.tf_id, fail.file, fail.reason);
  }
  return result;
}

ScanResult scan(const RunContext& ctx, const Registry& registry) {
  return scan_files(ctx, registry.active(), ctx.list_files());
}

}  // namespace warden
