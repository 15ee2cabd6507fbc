#pragma once

// warden/apply.hpp - Applies patches to the working tree.
//
// DESIGN:
//   Patches are grouped by file. Each file is one job: read, resolve through
//   apply_patches_to_text(), snapshot the pre-image, write atomically,
//   invalidate the RunContext cache entry. Distinct files run on worker
//   threads; one file is always handled by exactly one job, so writes to a
//   file are strictly sequential.
//
// INVARIANTS:
//   1. A conflict (drift, overlap, mismatch) skips that patch only. The batch
//      always runs to completion.
//   2. Output content depends only on the input content and the patch set.
//      Results are reported sorted by file regardless of scheduling.
//   3. dry_run computes everything and writes nothing.
//
// The result doubles as an apply journal: revert_apply() restores pre-images
// from the snapshot store for every file whose digest still equals the one
// recorded after the apply.

#include <set>
#include <string>
#include <vector>

#include "warden/run_context.hpp"
#include "warden/snapshot.hpp"
#include "warden/types.hpp"

namespace warden {

struct ApplyOptions {
  bool dry_run{false};
  SnapshotStore* snapshots{nullptr};        // pre-images kept when set
  std::string compression{"off"};
};

struct ApplyConflict {
  std::string tf_id;
  std::string file;
  std::string finding_id;
  std::string reason;
};

struct AppliedFile {
  std::string file;
  std::string before_digest;                // "" for a created file
  std::string after_digest;
  std::string pre_image;                    // snapshot key, "" when none kept
  bool created{false};
  std::vector<std::string> finding_ids;
  std::vector<std::string> tf_ids;
};

struct ApplyResult {
  std::vector<AppliedFile> files;           // sorted by file
  std::vector<ApplyConflict> conflicts;     // sorted by (file, tf_id, finding_id)
  std::size_t patches_applied{0};
  std::size_t patches_unchanged{0};         // already applied

  std::set<std::string> applied_tfs() const;
  std::vector<std::string> touched_files() const;
};

ApplyResult apply_patches(RunContext& ctx, const std::vector<Patch>& patches, const ApplyOptions& opts);

std::string apply_journal_to_json(const ApplyResult& result);

struct JournalParse {
  std::vector<AppliedFile> files;
  std::string error;
  bool ok() const { return error.empty(); }
};

JournalParse parse_apply_journal(const std::string& text);

struct RevertResult {
  std::vector<std::string> restored;
  std::vector<ApplyConflict> skipped;
};

RevertResult revert_apply(RunContext& ctx, const std::vector<AppliedFile>& journal,
                          const SnapshotStore& store);

}  // namespace warden
