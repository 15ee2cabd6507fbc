#pragma once

// warden/scanner.hpp - Runs active TF detectors over the tree.
//
// DETERMINISM GUARANTEES:
//   - Files come from RunContext::list_files() (sorted) and TFs from
//     Registry::active() (sorted by id).
//   - Each file is one job with its own result slot. Slots are concatenated in
//     file order and the result goes through sort_and_dedupe(), so worker
//     count and scheduling never change the output.
//
// FAILURE ISOLATION:
//   A file that cannot be read or parsed yields a DetectorFailure per TF that
//   needed its outline. The failure is reported through report_issue() and the
//   scan continues with the next file.

#include <string>
#include <vector>

#include "warden/registry.hpp"
#include "warden/run_context.hpp"
#include "warden/types.hpp"

namespace warden {

struct DetectorFailure {
  std::string tf_id;
  std::string file;
  std::string reason;
};

struct ScanResult {
  std::vector<Finding> findings;
  std::vector<DetectorFailure> failures;
  std::size_t files_scanned{0};
};

ScanResult scan(const RunContext& ctx, const Registry& registry);

// Scan a given file list with a given TF subset. Used by the verifier to
// re-check touched files.
ScanResult scan_files(const RunContext& ctx, const std::vector<const TfDefinition*>& tfs,
                      const std::vector<std::string>& files);

}  // namespace warden
