#pragma once

// warden/transforms.hpp - The closed set of source transforms.
//
// Each strategy has exactly one compatible transform:
//   pattern          -> regex_replace   (first match at the finding, params.replacement)
//   broad_handler    -> narrow_handler  (except: -> except (Inferred, Errors):)
//   silent_handler   -> reraise         (pass / continue -> raise)
//   call_keywords    -> add_keywords    (append the missing name=value items)
//   mutable_default  -> none_default    (default -> None, guard at body start)
//   raise_without_cause -> chain_cause  (raise X(...) -> raise X(...) from exc)
//   long_block, syntax, unguarded_call, duplicate_block: none (suggest-only)
//
// INVARIANTS:
//   1. A transform only edits the lines its finding covers, plus the guard
//      insertion point of none_default. Hunks never overlap each other.
//   2. Output is a pure function of (TF, file content, finding).
//   3. The transformed construct no longer matches its detector, so a second
//      scan over the result finds nothing for that location (fixed point).

#include <optional>
#include <string>
#include <vector>

#include "warden/registry.hpp"
#include "warden/run_context.hpp"
#include "warden/types.hpp"

namespace warden {

std::optional<TransformKind> compatible_transform(Strategy strategy);

struct TransformResult {
  std::vector<Hunk> hunks;
  std::string rejection;                    // non-empty: no patch
  bool ok() const { return rejection.empty(); }
};

TransformResult apply_transform(TransformKind kind, const TfDefinition& tf, const SourceFile& file,
                                const Finding& finding);

}  // namespace warden
