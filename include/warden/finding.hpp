#pragma once

// warden/finding.hpp - Finding identity, ordering and the JSONL stream codec.
//
// DETERMINISM GUARANTEES:
//   - finding_id() is a pure function of (tf_id, file, span).
//   - sort_and_dedupe() imposes the total order
//     (file, line, col, tf_id, end_line, end_col) and keeps the first of any
//     group sharing (tf_id, file, span).
//   - findings_to_jsonl() of a sorted vector is byte-identical across runs:
//     jsonlite emits keys sorted and doubles through format_double().

#include <optional>
#include <string>
#include <vector>

#include "warden/types.hpp"

namespace warden {

std::string finding_id(const std::string& tf_id, const std::string& file, const Span& span);

void sort_and_dedupe(std::vector<Finding>& findings);

std::string finding_to_json(const Finding& f);
std::string findings_to_jsonl(const std::vector<Finding>& findings);

struct FindingsParse {
  std::vector<Finding> findings;
  std::vector<std::string> errors;   // "line N: reason"
};

// Tolerates blank lines. Malformed lines are reported and skipped.
FindingsParse parse_findings_jsonl(const std::string& text);

}  // namespace warden
