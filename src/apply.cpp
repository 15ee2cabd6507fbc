#include "warden/apply.hpp"

#include <algorithm>
#include <filesystem>
#include <map>
#include <tuple>

#include "warden/config.hpp"
#include "warden/fsutil.hpp"
#include "warden/hash.hpp"
#include "warden/jsonlite.hpp"
#include "warden/observability.hpp"
#include "warden/patch.hpp"
#include "warden/version.hpp"
#include "warden/worker_pool.hpp"

namespace fs = std::filesystem;

namespace warden {

std::set<std::string> ApplyResult::applied_tfs() const {
  std::set<std::string> out;
  for (const auto& f : files) out.insert(f.tf_ids.begin(), f.tf_ids.end());
  return out;
}

std::vector<std::string> ApplyResult::touched_files() const {
  std::vector<std::string> out;
  for (const auto& f : files) out.push_back(f.file);
  return out;
}

namespace {

struct FileJob {
  std::string file;
  std::vector<const Patch*> patches;
};

struct FileOutcome {
  std::optional<AppliedFile> applied;
  std::vector<ApplyConflict> conflicts;
  std::size_t applied_count{0};
  std::size_t unchanged_count{0};
};

void conflict_all(const FileJob& job, const std::vector<PatchResult>& results, const std::string& reason,
                  FileOutcome& out) {
  for (std::size_t i = 0; i < job.patches.size(); ++i) {
    if (results[i].outcome != PatchOutcome::applied) continue;
    out.conflicts.push_back(ApplyConflict{job.patches[i]->tf_id, job.file, job.patches[i]->finding_id, reason});
  }
  out.applied_count = 0;
}

void apply_file(RunContext& ctx, const FileJob& job, const ApplyOptions& opts, FileOutcome& out) {
  if (!path_within_root(ctx.root(), job.file)) {
    for (const auto* p : job.patches) {
      out.conflicts.push_back(ApplyConflict{p->tf_id, job.file, p->finding_id, "path escapes the tree"});
    }
    return;
  }
  const std::string path = ctx.absolute(job.file);
  std::error_code ec;
  const bool exists = fs::exists(path, ec);
  std::string content;
  if (exists && !read_file(path, &content)) {
    for (const auto* p : job.patches) {
      out.conflicts.push_back(ApplyConflict{p->tf_id, job.file, p->finding_id, "file unreadable"});
    }
    return;
  }

  TextApplyResult r = apply_patches_to_text(content, exists, job.patches);
  AppliedFile applied;
  applied.file = job.file;
  applied.created = !exists;
  applied.before_digest = exists ? content_digest(content) : "";
  applied.after_digest = content_digest(r.content);
  std::set<std::string> tfs;
  for (std::size_t i = 0; i < job.patches.size(); ++i) {
    const Patch& p = *job.patches[i];
    switch (r.results[i].outcome) {
      case PatchOutcome::applied:
        ++out.applied_count;
        applied.finding_ids.push_back(p.finding_id);
        if (!p.tf_id.empty()) tfs.insert(p.tf_id);
        break;
      case PatchOutcome::already_applied:
        ++out.unchanged_count;
        break;
      case PatchOutcome::conflict:
        out.conflicts.push_back(ApplyConflict{p.tf_id, job.file, p.finding_id, r.results[i].reason});
        break;
    }
  }
  if (!r.changed) return;
  applied.tf_ids.assign(tfs.begin(), tfs.end());
  std::sort(applied.finding_ids.begin(), applied.finding_ids.end());

  if (!opts.dry_run) {
    if (opts.snapshots && exists) {
      applied.pre_image = opts.snapshots->put(content, opts.compression);
      if (applied.pre_image.empty()) {
        conflict_all(job, r.results, "pre-image snapshot failed", out);
        return;
      }
    }
    if (!atomic_write(path, r.content)) {
      conflict_all(job, r.results, "atomic write failed", out);
      return;
    }
    ctx.invalidate(job.file);
  }
  out.applied = std::move(applied);
}

}  // namespace

ApplyResult apply_patches(RunContext& ctx, const std::vector<Patch>& patches, const ApplyOptions& opts) {
  std::map<std::string, FileJob> grouped;
  for (const auto& p : patches) {
    auto& job = grouped[p.file];
    job.file = p.file;
    job.patches.push_back(&p);
  }
  std::vector<FileJob> jobs;
  for (auto& [file, job] : grouped) jobs.push_back(std::move(job));

  std::vector<FileOutcome> outcomes(jobs.size());
  parallel_for(jobs.size(), effective_workers(ctx.config(), jobs.size()),
               [&](std::size_t i) { apply_file(ctx, jobs[i], opts, outcomes[i]); });

  ApplyResult result;
  for (auto& o : outcomes) {
    if (o.applied) result.files.push_back(std::move(*o.applied));
    for (auto& c : o.conflicts) result.conflicts.push_back(std::move(c));
    result.patches_applied += o.applied_count;
    result.patches_unchanged += o.unchanged_count;
  }
  std::sort(result.conflicts.begin(), result.conflicts.end(), [](const ApplyConflict& a, const ApplyConflict& b) {
    return std::tie(a.file, a.tf_id, a.finding_id) < std::tie(b.file, b.tf_id, b.finding_id);
  });

  auto& stats = global_engine_stats();
  stats.patches_applied.fetch_add(result.patches_applied, std::memory_order_relaxed);
  stats.apply_conflicts.fetch_add(result.conflicts.size(), std::memory_order_relaxed);
  if (!opts.dry_run) stats.files_written.fetch_add(result.files.size(), std::memory_order_relaxed);
  for (const auto& c : result.conflicts) {
    report_issue(ErrorCode::apply_conflict, c.tf_id, c.file, c.reason);
  }
  return result;
}

// ---------------------------------------------------------------------------
// Journal
// ---------------------------------------------------------------------------

std::string apply_journal_to_json(const ApplyResult& result) {
  using jsonlite::Value;
  auto strings = [](const std::vector<std::string>& v) {
    jsonlite::Array a;
    for (const auto& s : v) a.push_back(Value{s});
    return Value{a};
  };
  jsonlite::Array files;
  for (const auto& f : result.files) {
    jsonlite::Object o;
    o["file"] = Value{f.file};
    o["before_digest"] = Value{f.before_digest};
    o["after_digest"] = Value{f.after_digest};
    o["pre_image"] = Value{f.pre_image};
    o["created"] = Value{f.created};
    o["finding_ids"] = strings(f.finding_ids);
    o["tf_ids"] = strings(f.tf_ids);
    files.push_back(Value{o});
  }
  jsonlite::Array conflicts;
  for (const auto& c : result.conflicts) {
    jsonlite::Object o;
    o["tf_id"] = Value{c.tf_id};
    o["file"] = Value{c.file};
    o["finding_id"] = Value{c.finding_id};
    o["reason"] = Value{c.reason};
    conflicts.push_back(Value{o});
  }
  jsonlite::Object root;
  root["v"] = Value{static_cast<std::uint64_t>(version::SNAPSHOT_FORMAT_VERSION)};
  root["files"] = Value{files};
  root["conflicts"] = Value{conflicts};
  root["patches_applied"] = Value{static_cast<std::uint64_t>(result.patches_applied)};
  root["patches_unchanged"] = Value{static_cast<std::uint64_t>(result.patches_unchanged)};
  return jsonlite::to_json(Value{root});
}

JournalParse parse_apply_journal(const std::string& text) {
  JournalParse out;
  std::optional<jsonlite::JsonError> err;
  const auto root = jsonlite::parse(text, &err);
  if (err) {
    out.error = err->code + ": " + err->message;
    return out;
  }
  if (jsonlite::get_u64(root, "v", 0) > version::SNAPSHOT_FORMAT_VERSION) {
    out.error = "unsupported journal version";
    return out;
  }
  const auto* files = jsonlite::get_array(root, "files");
  if (!files) {
    out.error = "missing files array";
    return out;
  }
  for (const auto& item : *files) {
    if (!jsonlite::is_object(item)) {
      out.error = "journal entries must be objects";
      out.files.clear();
      return out;
    }
    const auto& o = std::get<jsonlite::Object>(item.v);
    AppliedFile f;
    f.file = jsonlite::get_string(o, "file", "");
    f.before_digest = jsonlite::get_string(o, "before_digest", "");
    f.after_digest = jsonlite::get_string(o, "after_digest", "");
    f.pre_image = jsonlite::get_string(o, "pre_image", "");
    f.created = jsonlite::get_bool(o, "created", false);
    f.finding_ids = jsonlite::get_string_array(o, "finding_ids");
    f.tf_ids = jsonlite::get_string_array(o, "tf_ids");
    if (f.file.empty() || f.after_digest.empty()) {
      out.error = "journal entry without file or after_digest";
      out.files.clear();
      return out;
    }
    out.files.push_back(std::move(f));
  }
  return out;
}

RevertResult revert_apply(RunContext& ctx, const std::vector<AppliedFile>& journal,
                          const SnapshotStore& store) {
  RevertResult result;
  for (const auto& entry : journal) {
    auto skip = [&](const std::string& reason) {
      result.skipped.push_back(ApplyConflict{"", entry.file, "", reason});
      report_issue(ErrorCode::apply_conflict, "", entry.file, "revert skipped: " + reason);
    };
    if (!path_within_root(ctx.root(), entry.file)) {
      skip("path escapes the tree");
      continue;
    }
    const std::string path = ctx.absolute(entry.file);
    std::string current;
    if (!read_file(path, &current)) {
      skip("file missing");
      continue;
    }
    if (content_digest(current) != entry.after_digest) {
      skip("file changed since apply");
      continue;
    }
    if (entry.created) {
      std::error_code ec;
      if (!fs::remove(path, ec)) {
        skip("cannot remove created file");
        continue;
      }
    } else {
      auto pre = store.get(entry.pre_image);
      if (!pre) {
        result.skipped.push_back(ApplyConflict{"", entry.file, "", "pre-image missing or corrupt"});
        report_issue(ErrorCode::snapshot_integrity_failed, "", entry.file, "pre-image missing or corrupt");
        continue;
      }
      if (!atomic_write(path, *pre)) {
        skip("atomic write failed");
        continue;
      }
    }
    ctx.invalidate(entry.file);
    result.restored.push_back(entry.file);
  }
  return result;
}

}  // namespace warden
