#pragma once

// warden/patch.hpp - Patch identity, unified-diff codec and the pure apply
// core.
//
// PATCH STREAM FORMAT (version::PATCH_STREAM_VERSION):
//   # warden-patch v=1 tf_id=BEX-001 finding=<finding id> base=<src digest>
//   --- a/pkg/mod.py
//   +++ b/pkg/mod.py
//   @@ -10,7 +10,7 @@
//    context
//   -old
//   +new
//
//   One block per finding. Metadata lines are optional on input: a diff
//   produced elsewhere (an agent, a human) parses into patches with empty
//   tf_id / base. "--- /dev/null" creates a file. Deletion is not supported.
//
// APPLY CORE INVARIANTS (apply_patches_to_text):
//   1. Overlapping patches: the one with the lowest (tf_id, finding_id) wins,
//      the rest are conflicts. Never silently merged.
//   2. A patch whose base digest differs from the current content is a
//      conflict (drift), unless its result is already present, in which case
//      it is reported already_applied.
//   3. Survivors apply in position order; each hunk is re-validated against
//      the content as mutated by the patches applied before it.
//   4. A patch applies entirely or not at all.

#include <string>
#include <vector>

#include "warden/run_context.hpp"
#include "warden/types.hpp"

namespace warden {

std::string patch_id(const Patch& patch);

// Unified diff of one patch against the lines it was computed from.
std::string render_unified_diff(const Patch& patch, const std::vector<std::string>& before_lines);

// Metadata line + diff per patch, in input order.
std::string render_patch_stream(const RunContext& ctx, const std::vector<Patch>& patches);

struct DiffParse {
  std::vector<Patch> patches;
  std::string error;                        // "line N: reason"; empty on success
  bool ok() const { return error.empty(); }
};

DiffParse parse_unified_diff(const std::string& text);

enum class PatchOutcome { applied, already_applied, conflict };

std::string to_string(PatchOutcome o);

struct PatchResult {
  PatchOutcome outcome{PatchOutcome::conflict};
  std::string reason;                       // conflicts only
};

struct TextApplyResult {
  std::string content;
  std::vector<PatchResult> results;         // parallel to the input patches
  bool changed{false};
};

// `exists` distinguishes an empty file from a missing one (creation patches).
TextApplyResult apply_patches_to_text(const std::string& content, bool exists,
                                      const std::vector<const Patch*>& patches);

}  // namespace warden
