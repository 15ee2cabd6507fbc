#include "warden/agent_bridge.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <random>
#include <regex>
#include <set>

#include "warden/detectors.hpp"
#include "warden/fsutil.hpp"
#include "warden/jsonlite.hpp"
#include "warden/observability.hpp"
#include "warden/patch.hpp"
#include "warden/version.hpp"

namespace fs = std::filesystem;

namespace warden {

std::string to_string(IngestStatus s) {
  switch (s) {
    case IngestStatus::accepted:
      return "accepted";
    case IngestStatus::waived:
      return "waived";
    case IngestStatus::unchanged:
      return "unchanged";
    case IngestStatus::rejected:
      return "rejected";
  }
  return "rejected";
}

// ---------------------------------------------------------------------------
// Emit
// ---------------------------------------------------------------------------

std::string task_packet_to_json(const TaskPacket& p) {
  using jsonlite::Value;
  auto strings = [](const std::vector<std::string>& v) {
    jsonlite::Array a;
    for (const auto& s : v) a.push_back(Value{s});
    return Value{a};
  };
  auto u = [](std::uint64_t n) { return Value{n}; };
  jsonlite::Object span;
  span["line"] = u(p.span.line);
  span["col"] = u(p.span.col);
  span["end_line"] = u(p.span.end_line);
  span["end_col"] = u(p.span.end_col);

  jsonlite::Object o;
  o["v"] = u(version::TASK_PACKET_VERSION);
  o["tf_id"] = Value{p.tf_id};
  o["finding_id"] = Value{p.finding_id};
  o["file"] = Value{p.file};
  o["line"] = u(p.span.line);
  o["span"] = Value{span};
  o["base_digest"] = Value{p.base_digest};
  o["frame"] = Value{p.frame};
  o["code_frame"] = Value{p.code_frame};
  o["message"] = Value{p.message};
  o["reason"] = Value{p.reason};
  o["decision_rule"] = Value{p.decision_rule};
  o["allowed_transforms"] = strings(p.allowed_transforms);
  o["hints"] = strings(p.hints);
  o["patch_header"] = Value{p.patch_header};
  return jsonlite::to_json(Value{o});
}

EmitResult emit_tasks(const RunContext& ctx, const Registry& registry, const std::vector<AmbiguousFinding>& ambiguous,
                      const std::string& out_dir) {
  EmitResult result;
  std::error_code ec;
  fs::create_directories(out_dir, ec);
  if (ec) {
    result.error = "cannot create " + out_dir + ": " + ec.message();
    report_issue(ErrorCode::io_error, "", out_dir, result.error);
    return result;
  }
  // Stale packets from an earlier emit.
  std::vector<fs::path> stale;
  for (const auto& entry : fs::directory_iterator(out_dir, ec)) {
    const std::string name = entry.path().filename().string();
    if (name.rfind("task_", 0) == 0 && entry.path().extension() == ".json") stale.push_back(entry.path());
  }
  for (const auto& path : stale) fs::remove(path, ec);

  for (const auto& a : ambiguous) {
    const Finding& f = a.finding;
    TaskPacket p;
    p.tf_id = f.tf_id;
    p.finding_id = f.id;
    p.file = f.file;
    p.span = f.span;
    p.frame = f.frame;
    p.message = f.message;
    p.reason = a.reason;
    p.hints = f.hints;
    if (const TfDefinition* tf = registry.find(f.tf_id)) {
      p.decision_rule = to_string(tf->decision.kind);
      if (!tf->decision.text.empty()) p.decision_rule += ": " + tf->decision.text;
      for (auto k : tf->allowed_transforms) p.allowed_transforms.push_back(to_string(k));
    }
    if (auto src = ctx.load(f.file)) {
      p.base_digest = src->digest;
      p.code_frame = code_frame(*src, f.span);
    }
    p.patch_header = "# warden-patch v=" + std::to_string(version::PATCH_STREAM_VERSION) + " tf_id=" + p.tf_id +
                     " finding=" + p.finding_id + " base=" + p.base_digest;

    char seq[16];
    std::snprintf(seq, sizeof(seq), "%03zu", result.packets.size() + 1);
    const std::string path = (fs::path(out_dir) / ("task_" + std::string(seq) + "_" + p.tf_id + ".json")).string();
    if (!atomic_write(path, task_packet_to_json(p) + "\n")) {
      result.error = "cannot write " + path;
      report_issue(ErrorCode::io_error, p.tf_id, path, result.error);
      return result;
    }
    result.paths.push_back(path);
    result.packets.push_back(std::move(p));
  }
  return result;
}

// ---------------------------------------------------------------------------
// Ingest
// ---------------------------------------------------------------------------

namespace {

// Isolated copy of the tree, removed on scope exit.
class IsolatedTree {
 public:
  IsolatedTree() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    char suffix[24];
    std::snprintf(suffix, sizeof(suffix), "%016llx", static_cast<unsigned long long>(rng()));
    std::error_code ec;
    path_ = (fs::temp_directory_path(ec) / ("warden-isolate-" + std::string(suffix))).string();
  }
  ~IsolatedTree() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  IsolatedTree(const IsolatedTree&) = delete;
  IsolatedTree& operator=(const IsolatedTree&) = delete;

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

std::string tf_from_name(const std::string& name) {
  static const std::regex re(R"(([A-Z]+-[0-9]{3}))");
  std::smatch m;
  if (std::regex_search(name, m, re)) return m[1].str();
  return {};
}

std::string first_verify_failure(const VerifyReport& r) {
  for (const auto& c : r.checks) {
    if (c.status != CheckStatus::pass) return "check " + c.name + " " + to_string(c.status) + ": " + c.reason;
  }
  for (const auto& t : r.tfs) {
    if (!t.passed) return t.tf_id + " " + t.failures.front();
  }
  return "verification failed";
}

// Returns "" when the diff may proceed to isolated apply.
std::string screen_patches(const Registry& registry, const std::vector<Patch>& patches) {
  for (const auto& p : patches) {
    if (!is_tree_relative(p.file)) return "path escapes the tree: " + p.file;
    const TfDefinition* tf = registry.find(p.tf_id);
    if (!tf) return "diff names unknown TF '" + p.tf_id + "'";
    if (!tf->in_footprint(p.file)) return p.file + " is outside the footprint of " + p.tf_id;
  }
  return {};
}

}  // namespace

IngestResult ingest(RunContext& ctx, const Registry& registry, const std::vector<IngestDiff>& diffs,
                    const IngestOptions& opts) {
  IngestResult result;
  for (const auto& diff : diffs) {
    IngestItem item;
    item.name = diff.name;
    const std::string fallback_tf = tf_from_name(diff.name);
    std::string failure;
    ErrorCode failure_code = ErrorCode::verify_fail;

    DiffParse parsed = parse_unified_diff(diff.text);
    std::vector<Patch> patches;
    if (!parsed.ok()) {
      failure = "diff does not parse: " + parsed.error;
      failure_code = ErrorCode::diff_parse_error;
    } else {
      patches = std::move(parsed.patches);
      for (auto& p : patches) {
        if (p.tf_id.empty()) p.tf_id = fallback_tf;
      }
      failure = screen_patches(registry, patches);
      if (!failure.empty()) failure_code = ErrorCode::diff_parse_error;
    }

    std::set<std::string> tfs;
    std::set<std::string> files;
    for (const auto& p : patches) {
      if (!p.tf_id.empty()) tfs.insert(p.tf_id);
      files.insert(p.file);
    }
    if (tfs.empty() && !fallback_tf.empty()) tfs.insert(fallback_tf);
    item.tf_ids.assign(tfs.begin(), tfs.end());
    item.files.assign(files.begin(), files.end());

    if (failure.empty()) {
      IsolatedTree iso;
      std::string copy_error;
      if (!copy_tree(ctx.root(), iso.path(), ctx.config().skip_dirs, &copy_error)) {
        failure = "isolation failed: " + copy_error;
        failure_code = ErrorCode::io_error;
      } else {
        RunContext iso_ctx(iso.path(), ctx.config());
        ApplyOptions iso_apply;
        ApplyResult trial = apply_patches(iso_ctx, patches, iso_apply);
        if (!trial.conflicts.empty()) {
          failure = "does not apply: " + trial.conflicts.front().reason;
          failure_code = ErrorCode::apply_conflict;
        } else if (trial.patches_applied == 0) {
          item.status = IngestStatus::unchanged;
        } else {
          VerifyOptions vopts = opts.verify;
          vopts.waive_failures = false;
          vopts.ledger = nullptr;
          VerifyReport report = verify(iso_ctx, registry, trial.applied_tfs(), trial.touched_files(), vopts);
          if (!report.ok()) {
            failure = "verification failed in isolation: " + first_verify_failure(report);
            failure_code = report.any_timeout() ? ErrorCode::verify_timeout : ErrorCode::verify_fail;
          }
        }
      }
    }

    if (failure.empty() && item.status != IngestStatus::unchanged) {
      ApplyResult real = apply_patches(ctx, patches, opts.apply);
      if (!real.conflicts.empty()) {
        failure = "apply to tree failed: " + real.conflicts.front().reason;
        failure_code = ErrorCode::apply_conflict;
      } else {
        item.status = IngestStatus::accepted;
      }
    }

    if (!failure.empty()) {
      item.reason = failure;
      report_issue(failure_code, item.tf_ids.empty() ? "" : item.tf_ids.front(),
                   item.files.empty() ? "" : item.files.front(), diff.name + ": " + failure);
      item.status = IngestStatus::rejected;
      if (opts.ledger && !item.tf_ids.empty()) {
        bool all_recorded = true;
        for (const auto& tf : item.tf_ids) {
          Waiver w;
          w.tf_id = tf;
          w.scope = item.files.size() == 1 ? item.files.front() : "*";
          w.context = opts.context.empty() ? "*" : opts.context;
          w.rationale = "agent patch rejected: " + failure;
          w.source = "agent:" + diff.name;
          w.recorded_unix = opts.now;
          if (opts.now > 0 && opts.waiver_ttl_days > 0) w.expires_unix = opts.now + opts.waiver_ttl_days * 86400;
          all_recorded = opts.ledger->record(w) && all_recorded;
        }
        if (all_recorded) item.status = IngestStatus::waived;
      }
    }

    switch (item.status) {
      case IngestStatus::accepted:
        ++result.accepted;
        break;
      case IngestStatus::waived:
        ++result.waived;
        break;
      case IngestStatus::unchanged:
        ++result.unchanged;
        break;
      case IngestStatus::rejected:
        ++result.rejected;
        break;
    }
    result.items.push_back(std::move(item));
  }
  return result;
}

std::string ingest_result_to_json(const IngestResult& result) {
  using jsonlite::Value;
  auto u = [](std::size_t n) { return Value{static_cast<std::uint64_t>(n)}; };
  jsonlite::Array items;
  for (const auto& it : result.items) {
    jsonlite::Object o;
    o["name"] = Value{it.name};
    o["status"] = Value{to_string(it.status)};
    o["reason"] = Value{it.reason};
    jsonlite::Array tfs;
    for (const auto& t : it.tf_ids) tfs.push_back(Value{t});
    o["tf_ids"] = Value{tfs};
    jsonlite::Array files;
    for (const auto& f : it.files) files.push_back(Value{f});
    o["files"] = Value{files};
    items.push_back(Value{o});
  }
  jsonlite::Object root;
  root["accepted"] = u(result.accepted);
  root["waived"] = u(result.waived);
  root["unchanged"] = u(result.unchanged);
  root["rejected"] = u(result.rejected);
  root["items"] = Value{items};
  return jsonlite::to_json(Value{root});
}

}  // namespace warden
