#include "warden/verifier.hpp"

#include <algorithm>
#include <cstdlib>

#include "warden/jsonlite.hpp"
#include "warden/observability.hpp"
#include "warden/sandbox.hpp"
#include "warden/scanner.hpp"

namespace warden {

std::string to_string(CheckStatus s) {
  switch (s) {
    case CheckStatus::pass:
      return "pass";
    case CheckStatus::fail:
      return "fail";
    case CheckStatus::timeout:
      return "timeout";
    case CheckStatus::error:
      return "error";
  }
  return "error";
}

bool VerifyReport::suite_ok() const {
  for (const auto& c : checks) {
    if (c.status != CheckStatus::pass) return false;
  }
  return true;
}

bool VerifyReport::tfs_ok() const {
  for (const auto& t : tfs) {
    if (!t.passed) return false;
  }
  return true;
}

bool VerifyReport::any_timeout() const {
  for (const auto& c : checks) {
    if (c.status == CheckStatus::timeout) return true;
  }
  return false;
}

namespace {

constexpr std::size_t kOutputTail = 2000;

std::string env_or(const char* name, const std::string& def) {
  const char* v = std::getenv(name);
  return (v && *v) ? std::string(v) : def;
}

std::string tail(const std::string& s) {
  return s.size() <= kOutputTail ? s : s.substr(s.size() - kOutputTail);
}

std::vector<std::string> files_for(const RunContext& ctx, const TfDefinition& tf,
                                   const std::vector<std::string>& touched) {
  std::vector<std::string> out;
  const auto& source = touched.empty() ? ctx.list_files() : touched;
  for (const auto& f : source) {
    if (tf.in_footprint(f)) out.push_back(f);
  }
  return out;
}

TfVerdict check_tf(const RunContext& ctx, const TfDefinition& tf, const std::vector<std::string>& touched,
                   const std::set<std::string>& targets) {
  TfVerdict v;
  v.tf_id = tf.id;
  const auto files = files_for(ctx, tf, touched);
  v.files_checked = files.size();
  for (VerifyPredicate p : tf.verify) {
    switch (p) {
      case VerifyPredicate::no_findings: {
        auto r = scan_files(ctx, {&tf}, files);
        for (const auto& f : r.findings) {
          if (!targets.empty() && targets.count(f.id) == 0) continue;
          v.failures.push_back(std::string("no_findings: ") + f.file + ":" + std::to_string(f.span.line) +
                               " still matches");
          v.failed_files.push_back(f.file);
        }
        for (const auto& fail : r.failures) {
          v.failures.push_back(std::string("no_findings: ") + fail.file + ": " + fail.reason);
          v.failed_files.push_back(fail.file);
        }
        break;
      }
      case VerifyPredicate::parses:
        for (const auto& file : files) {
          auto src = ctx.load(file);
          if (!src) {
            v.failures.push_back("parses: " + file + ": unreadable");
            v.failed_files.push_back(file);
          } else if (src->parse_error) {
            v.failures.push_back("parses: " + file + ":" + std::to_string(src->parse_error->line) + ": " +
                                 src->parse_error->reason);
            v.failed_files.push_back(file);
          }
        }
        break;
    }
  }
  std::sort(v.failed_files.begin(), v.failed_files.end());
  v.failed_files.erase(std::unique(v.failed_files.begin(), v.failed_files.end()), v.failed_files.end());
  v.passed = v.failures.empty();
  return v;
}

}  // namespace

CheckOutcome run_check(const CheckSpec& check, const std::string& cwd, std::uint64_t default_timeout_ms) {
  CheckOutcome out;
  out.name = check.name;
  if (check.argv.empty()) {
    out.status = CheckStatus::error;
    out.reason = "check has no argv";
    return out;
  }
  const std::string path_env = env_or("PATH", "/usr/local/bin:/usr/bin:/bin");
  const std::string exe = resolve_executable(check.argv[0], path_env);
  if (exe.empty()) {
    out.status = CheckStatus::error;
    out.reason = "executable not found: " + check.argv[0];
    return out;
  }

  ProcessSpec spec;
  spec.command = exe;
  spec.argv.assign(check.argv.begin() + 1, check.argv.end());
  spec.env["PATH"] = path_env;
  spec.env["HOME"] = env_or("HOME", "/tmp");
  spec.env["PYTHONHASHSEED"] = "0";
  spec.cwd = cwd;
  spec.timeout_ms = check.timeout_ms ? check.timeout_ms : default_timeout_ms;

  ProcessResult r = run_process(spec);
  out.exit_code = r.exit_code;
  out.duration_ms = r.duration_ms;
  out.output = tail(r.stderr_text.empty() ? r.stdout_text : r.stderr_text);
  if (!r.error_message.empty()) {
    out.status = CheckStatus::error;
    out.reason = r.error_message;
  } else if (r.timed_out) {
    out.status = CheckStatus::timeout;
    out.reason = "timed out after " + std::to_string(spec.timeout_ms) + " ms";
  } else if (r.exit_code != 0) {
    out.status = CheckStatus::fail;
    out.reason = "exit code " + std::to_string(r.exit_code);
  }
  return out;
}

VerifyReport verify(const RunContext& ctx, const Registry& registry, const std::set<std::string>& applied_tfs,
                    const std::vector<std::string>& touched_files, const VerifyOptions& opts) {
  VerifyReport report;
  auto& stats = global_engine_stats();

  if (opts.run_checks) {
    for (const auto& check : opts.checks) {
      CheckOutcome c = run_check(check, ctx.root(), opts.default_timeout_ms);
      switch (c.status) {
        case CheckStatus::pass:
          break;
        case CheckStatus::timeout:
          stats.verify_timeouts.fetch_add(1, std::memory_order_relaxed);
          report_issue(ErrorCode::verify_timeout, "", "", c.name + ": " + c.reason);
          break;
        case CheckStatus::fail:
          stats.verify_failures.fetch_add(1, std::memory_order_relaxed);
          report_issue(ErrorCode::verify_fail, "", "", c.name + ": " + c.reason);
          break;
        case CheckStatus::error:
          report_issue(ErrorCode::spawn_failed, "", "", c.name + ": " + c.reason);
          break;
      }
      report.checks.push_back(std::move(c));
    }
  }

  for (const auto& id : applied_tfs) {
    const TfDefinition* tf = registry.find(id);
    if (!tf) {
      TfVerdict v;
      v.tf_id = id;
      v.passed = false;
      v.failures.push_back("unknown TF");
      report.tfs.push_back(std::move(v));
      continue;
    }
    report.tfs.push_back(check_tf(ctx, *tf, touched_files, opts.applied_finding_ids));
  }

  for (const auto& v : report.tfs) {
    if (v.passed) continue;
    stats.verify_failures.fetch_add(1, std::memory_order_relaxed);
    report_issue(ErrorCode::verify_fail, v.tf_id, "", v.failures.front());
    if (!opts.waive_failures || !opts.ledger) continue;
    // INVARIANT: a verifier waiver never reaches past the files that failed.
    // No file to pin it to means no waiver.
    const std::vector<std::string>& scopes = v.failed_files.empty() ? touched_files : v.failed_files;
    for (const auto& file : scopes) {
      Waiver w;
      w.tf_id = v.tf_id;
      w.scope = file;
      w.context = opts.context.empty() ? "*" : opts.context;
      w.rationale = "verification failed: " + v.failures.front();
      if (v.failures.size() > 1) w.rationale += " (+" + std::to_string(v.failures.size() - 1) + " more)";
      w.source = "verifier";
      w.recorded_unix = opts.now;
      if (opts.now > 0 && opts.waiver_ttl_days > 0) w.expires_unix = opts.now + opts.waiver_ttl_days * 86400;
      if (opts.ledger->record(w)) report.waivers_recorded.push_back(std::move(w));
    }
  }
  return report;
}

std::string verify_report_to_json(const VerifyReport& report) {
  using jsonlite::Value;
  jsonlite::Array checks;
  for (const auto& c : report.checks) {
    jsonlite::Object o;
    o["name"] = Value{c.name};
    o["status"] = Value{to_string(c.status)};
    o["exit_code"] = Value{static_cast<std::uint64_t>(c.exit_code < 0 ? 0 : c.exit_code)};
    o["duration_ms"] = Value{c.duration_ms};
    o["reason"] = Value{c.reason};
    o["output"] = Value{c.output};
    checks.push_back(Value{o});
  }
  jsonlite::Array tfs;
  for (const auto& t : report.tfs) {
    jsonlite::Object o;
    o["tf_id"] = Value{t.tf_id};
    o["passed"] = Value{t.passed};
    o["files_checked"] = Value{static_cast<std::uint64_t>(t.files_checked)};
    jsonlite::Array failures;
    for (const auto& f : t.failures) failures.push_back(Value{f});
    o["failures"] = Value{failures};
    tfs.push_back(Value{o});
  }
  jsonlite::Array waivers;
  for (const auto& w : report.waivers_recorded) {
    jsonlite::Object o;
    o["tf_id"] = Value{w.tf_id};
    o["context"] = Value{w.context};
    o["rationale"] = Value{w.rationale};
    waivers.push_back(Value{o});
  }
  jsonlite::Object root;
  root["ok"] = Value{report.ok()};
  root["suite_ok"] = Value{report.suite_ok()};
  root["tfs_ok"] = Value{report.tfs_ok()};
  root["checks"] = Value{checks};
  root["tfs"] = Value{tfs};
  root["waivers_recorded"] = Value{waivers};
  return jsonlite::to_json(Value{root});
}

}  // namespace warden
