#include "warden/finding.hpp"

#include <algorithm>
#include <set>
#include <tuple>

#include "warden/hash.hpp"
#include "warden/jsonlite.hpp"
#include "warden/version.hpp"

namespace warden {

std::string finding_id(const std::string& tf_id, const std::string& file, const Span& span) {
  // '\0' separators: no tf_id/file split can alias another.
  std::string payload;
  payload.reserve(tf_id.size() + file.size() + 48);
  payload += tf_id;
  payload += '\0';
  payload += file;
  payload += '\0';
  payload += std::to_string(span.line) + ":" + std::to_string(span.col) + "-" +
             std::to_string(span.end_line) + ":" + std::to_string(span.end_col);
  return hash_domain("find:", payload);
}

void sort_and_dedupe(std::vector<Finding>& findings) {
  std::sort(findings.begin(), findings.end(), [](const Finding& a, const Finding& b) {
    return std::tie(a.file, a.span.line, a.span.col, a.tf_id, a.span.end_line, a.span.end_col) <
           std::tie(b.file, b.span.line, b.span.col, b.tf_id, b.span.end_line, b.span.end_col);
  });
  // Duplicates sort adjacent: equal (tf_id, file, span) implies equal keys.
  auto last = std::unique(findings.begin(), findings.end(), [](const Finding& a, const Finding& b) {
    return a.tf_id == b.tf_id && a.file == b.file && a.span == b.span;
  });
  findings.erase(last, findings.end());
}

std::string finding_to_json(const Finding& f) {
  using jsonlite::Value;
  jsonlite::Object o;
  o["v"] = Value{static_cast<std::uint64_t>(version::FINDINGS_STREAM_VERSION)};
  o["id"] = Value{f.id};
  o["tf_id"] = Value{f.tf_id};
  o["file"] = Value{f.file};
  o["line"] = Value{static_cast<std::uint64_t>(f.span.line)};
  o["col"] = Value{static_cast<std::uint64_t>(f.span.col)};
  o["end_line"] = Value{static_cast<std::uint64_t>(f.span.end_line)};
  o["end_col"] = Value{static_cast<std::uint64_t>(f.span.end_col)};
  o["tier"] = Value{static_cast<std::uint64_t>(f.tier)};
  o["confidence"] = Value{f.confidence};
  o["disposition"] = Value{to_string(f.disposition)};
  o["message"] = Value{f.message};
  o["frame"] = Value{f.frame};
  o["context"] = Value{f.context};
  jsonlite::Array hints;
  for (const auto& h : f.hints) hints.push_back(Value{h});
  o["hints"] = Value{hints};
  return jsonlite::to_json(Value{o});
}

std::string findings_to_jsonl(const std::vector<Finding>& findings) {
  std::string out;
  for (const auto& f : findings) {
    out += finding_to_json(f);
    out += '\n';
  }
  return out;
}

FindingsParse parse_findings_jsonl(const std::string& text) {
  FindingsParse result;
  std::size_t line_no = 0;
  std::size_t start = 0;
  while (start <= text.size()) {
    std::size_t nl = text.find('\n', start);
    if (nl == std::string::npos) nl = text.size();
    const std::string line = text.substr(start, nl - start);
    start = nl + 1;
    ++line_no;
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      if (nl == text.size()) break;
      continue;
    }

    auto fail = [&result, line_no](const std::string& reason) {
      result.errors.push_back("line " + std::to_string(line_no) + ": " + reason);
    };

    std::optional<jsonlite::JsonError> err;
    const jsonlite::Object o = jsonlite::parse(line, &err);
    if (err) {
      fail(err->code + ": " + err->message);
      continue;
    }
    const auto v = jsonlite::get_u64(o, "v", 0);
    if (v == 0 || v > version::FINDINGS_STREAM_VERSION) {
      fail("unsupported findings stream version " + std::to_string(v));
      continue;
    }
    Finding f;
    f.tf_id = jsonlite::get_string(o, "tf_id", "");
    f.file = jsonlite::get_string(o, "file", "");
    if (f.tf_id.empty() || f.file.empty() || !o.contains("line")) {
      fail("missing tf_id, file or line");
      continue;
    }
    f.span.line = static_cast<std::uint32_t>(jsonlite::get_u64(o, "line", 0));
    f.span.col = static_cast<std::uint32_t>(jsonlite::get_u64(o, "col", 0));
    f.span.end_line = static_cast<std::uint32_t>(jsonlite::get_u64(o, "end_line", f.span.line));
    f.span.end_col = static_cast<std::uint32_t>(jsonlite::get_u64(o, "end_col", f.span.col));
    f.tier = static_cast<int>(jsonlite::get_u64(o, "tier", kMaxTier));
    f.confidence = jsonlite::get_double(o, "confidence", 1.0);
    f.disposition = jsonlite::get_string(o, "disposition", "resolved") == "ambiguous"
                        ? Disposition::ambiguous
                        : Disposition::resolved;
    f.message = jsonlite::get_string(o, "message", "");
    f.frame = jsonlite::get_string(o, "frame", "<module>");
    f.context = jsonlite::get_string(o, "context", "");
    f.hints = jsonlite::get_string_array(o, "hints");
    f.id = jsonlite::get_string(o, "id", "");
    if (f.id.empty()) f.id = finding_id(f.tf_id, f.file, f.span);
    result.findings.push_back(std::move(f));
    if (nl == text.size()) break;
  }
  return result;
}

}  // namespace warden
