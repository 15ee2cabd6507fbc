#include <algorithm>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "warden/agent_bridge.hpp"
#include "warden/apply.hpp"
#include "warden/config.hpp"
#include "warden/finding.hpp"
#include "warden/fsutil.hpp"
#include "warden/gate.hpp"
#include "warden/hash.hpp"
#include "warden/jsonlite.hpp"
#include "warden/observability.hpp"
#include "warden/patch.hpp"
#include "warden/pipeline.hpp"
#include "warden/proposer.hpp"
#include "warden/registry.hpp"
#include "warden/run_context.hpp"
#include "warden/scanner.hpp"
#include "warden/snapshot.hpp"
#include "warden/verifier.hpp"
#include "warden/version.hpp"
#include "warden/waivers.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitGateFail = 1;
constexpr int kExitError = 2;
constexpr int kExitRegistryFatal = 3;
constexpr int kExitVerifyFail = 4;

// Options after the subcommand words. Values are taken from "--key value";
// repeated keys accumulate.
struct Args {
  std::vector<std::pair<std::string, std::string>> values;
  std::vector<std::string> flags;

  std::string get(const std::string& key, const std::string& def = "") const {
    for (auto it = values.rbegin(); it != values.rend(); ++it) {
      if (it->first == key) return it->second;
    }
    return def;
  }
  std::vector<std::string> all(const std::string& key) const {
    std::vector<std::string> out;
    for (const auto& [k, v] : values) {
      if (k == key) out.push_back(v);
    }
    return out;
  }
  bool has(const std::string& flag) const {
    return std::find(flags.begin(), flags.end(), flag) != flags.end() ||
           std::any_of(values.begin(), values.end(), [&](const auto& kv) { return kv.first == flag; });
  }
};

// Options that never take a value.
bool is_bare_flag(const std::string& a) {
  return a == "--stats" || a == "--dry-run" || a == "--all" || a == "--waive" || a == "--no-apply" ||
         a == "--no-verify" || a == "--no-emit" || a == "--no-checks";
}

Args parse_args(int argc, char** argv, int first) {
  Args args;
  for (int i = first; i < argc; ++i) {
    const std::string a = argv[i];
    if (a.rfind("--", 0) != 0) continue;
    if (!is_bare_flag(a) && i + 1 < argc) {
      args.values.emplace_back(a, argv[++i]);
    } else {
      args.flags.push_back(a);
    }
  }
  return args;
}

std::int64_t now_from(const Args& args) {
  const std::string s = args.get("--now");
  if (!s.empty()) return std::strtoll(s.c_str(), nullptr, 10);
  return static_cast<std::int64_t>(std::time(nullptr));
}

std::string read_or_empty(const std::string& path) {
  std::string data;
  if (!warden::read_file(path, &data)) return {};
  return data;
}

// Loads config for --root; prints problems and returns false when invalid.
bool load_engine_config(const Args& args, warden::EngineConfig* out) {
  auto loaded = warden::load_config(args.get("--root", "."));
  for (const auto& w : loaded.warnings) std::cerr << "{\"warning\":\"" << warden::jsonlite::escape(w) << "\"}\n";
  for (const auto& e : loaded.errors) warden::report_issue(warden::ErrorCode::config_invalid, "", "warden.config.json", e);
  if (!loaded.ok()) return false;
  *out = std::move(loaded.config);
  if (args.has("--workers")) out->workers = std::strtoul(args.get("--workers").c_str(), nullptr, 10);
  if (args.has("--no-checks")) out->skip_checks = true;
  return true;
}

// load_registry() reports each violation. False when the registry is unusable.
bool build_registry(const warden::RunContext& ctx, const Args& args, warden::RegistryBuild* out) {
  *out = warden::load_registry(ctx.absolute(args.get("--tf-dir", ctx.config().tf_dir)));
  return !out->fatal;
}

std::vector<warden::Finding> findings_for(const warden::RunContext& ctx, const warden::Registry& registry,
                                          const Args& args) {
  const std::string path = args.get("--findings");
  if (path.empty()) return warden::scan(ctx, registry).findings;
  auto parsed = warden::parse_findings_jsonl(read_or_empty(path));
  for (const auto& e : parsed.errors) warden::report_issue(warden::ErrorCode::json_parse_error, "", path, e);
  return parsed.findings;
}

std::vector<std::string> changed_files_for(const warden::RunContext& ctx, const Args& args) {
  if (args.has("--all")) return ctx.list_files();
  std::vector<std::string> files;
  for (const auto& path : args.all("--changed")) {
    auto part = warden::parse_changed_files(read_or_empty(path));
    files.insert(files.end(), part.begin(), part.end());
  }
  for (const auto& f : args.all("--file")) files.push_back(warden::normalize_rel_path(f));
  return files;
}

std::string string_array(const std::vector<std::string>& v) {
  std::string out = "[";
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (i > 0) out += ",";
    out += "\"" + warden::jsonlite::escape(v[i]) + "\"";
  }
  return out + "]";
}

void usage() {
  std::cerr << "usage: warden <command> [options]\n"
               "  health | version | config show\n"
               "  tf list | tf validate [--tf-dir D]\n"
               "  scan [--out F]\n"
               "  propose [--findings F] [--out F]\n"
               "  apply [--patch F] [--dry-run]\n"
               "  revert [--journal F]\n"
               "  verify --tf ID... [--file P...] [--context C] [--waive]\n"
               "  gate (--changed F | --file P... | --all) [--findings F] [--context C]\n"
               "  emit [--out DIR]\n"
               "  ingest --diff F... [--context C]\n"
               "  waiver record --tf ID [--scope G] [--expires YYYY-MM-DD] [--rationale T] [--context C]\n"
               "  waiver list [--context C] | waiver verify\n"
               "  run [--changed F | --all] [--context C] [--dry-run] [--no-apply] [--no-verify] [--waive] [--no-emit]\n"
               "common: --root DIR (default .) --workers N --no-checks --now UNIX --stats\n";
}

int dispatch(int argc, char** argv, const std::string& cmd, const std::string& sub) {
  if (cmd == "health") {
    const auto h = warden::hash_runtime_info();
    std::cout << "{\"hash_primitive\":\"" << h.primitive << "\",\"hash_backend\":\"" << h.backend
              << "\",\"hash_version\":\"" << h.version << "\"";
    std::cout << ",\"compression_capabilities\":[\"identity\"";
#if defined(WARDEN_WITH_ZSTD)
    std::cout << ",\"zstd\"";
#endif
    std::cout << "]}\n";
    return kExitOk;
  }

  if (cmd == "version") {
    std::cout << warden::version::manifest_to_json(warden::version::current_manifest(WARDEN_VERSION)) << "\n";
    return kExitOk;
  }

  const Args args = parse_args(argc, argv, 1);
  warden::EngineConfig config;
  if (!load_engine_config(args, &config)) return kExitError;

  if (cmd == "config" && sub == "show") {
    std::cout << warden::config_to_json(config) << "\n";
    return kExitOk;
  }

  warden::RunContext ctx(args.get("--root", "."), config);

  if (cmd == "run") {
    warden::PipelineOptions opts;
    opts.context = args.get("--context", "*");
    opts.changed_files = changed_files_for(ctx, args);
    opts.gate_all_files = args.has("--all");
    opts.apply = !args.has("--no-apply");
    opts.dry_run = args.has("--dry-run");
    opts.verify = !args.has("--no-verify");
    opts.waive_verify_failures = args.has("--waive");
    opts.emit = !args.has("--no-emit");
    opts.now = now_from(args);
    const auto report = warden::run_pipeline(ctx, opts);
    std::cout << warden::pipeline_report_to_json(report) << "\n";
    return report.exit_code();
  }

  if (cmd == "waiver" && sub == "record") {
    warden::Waiver w;
    w.tf_id = args.get("--tf");
    w.scope = args.get("--scope", "*");
    w.context = args.get("--context", "*");
    w.rationale = args.get("--rationale");
    w.source = "cli";
    w.recorded_unix = now_from(args);
    if (w.tf_id.empty()) {
      usage();
      return kExitError;
    }
    if (args.has("--expires")) {
      auto day = warden::parse_iso_date(args.get("--expires"));
      if (!day) {
        warden::report_issue(warden::ErrorCode::waiver_unparseable, w.tf_id, "", "malformed --expires date");
        return kExitError;
      }
      w.expires_unix = *day + 86400;
    }
    warden::WaiverLedger ledger(ctx.absolute(config.ledger_path));
    if (!ledger.record(w)) return kExitError;
    std::cout << "{\"recorded\":true,\"entries\":" << ledger.entry_count() << "}\n";
    return kExitOk;
  }

  if (cmd == "waiver" && sub == "list") {
    const std::string context = args.get("--context", "*");
    const auto all = warden::collect_waivers(ctx, context);
    const std::int64_t now = now_from(args);
    std::cout << "[";
    for (std::size_t i = 0; i < all.size(); ++i) {
      const auto& w = all[i];
      if (i > 0) std::cout << ",";
      std::cout << "{\"tf_id\":\"" << w.tf_id << "\",\"scope\":\"" << warden::jsonlite::escape(w.scope)
                << "\",\"context\":\"" << warden::jsonlite::escape(w.context) << "\",\"source\":\""
                << warden::jsonlite::escape(w.source) << "\",\"expires_unix\":" << w.expires_unix
                << ",\"expired\":" << ((w.expires_unix != 0 && w.expires_unix <= now) ? "true" : "false")
                << ",\"rationale\":\"" << warden::jsonlite::escape(w.rationale) << "\"}";
    }
    std::cout << "]\n";
    return kExitOk;
  }

  if (cmd == "waiver" && sub == "verify") {
    warden::WaiverLedger ledger(ctx.absolute(config.ledger_path));
    std::string error;
    const bool ok = ledger.verify_chain(&error);
    std::cout << "{\"ok\":" << (ok ? "true" : "false") << ",\"entries\":" << ledger.entry_count()
              << ",\"error\":\"" << warden::jsonlite::escape(error) << "\"}\n";
    return ok ? kExitOk : kExitError;
  }

  if (cmd == "revert") {
    const std::string journal_path = args.get("--journal", ctx.absolute(config.journal_path));
    std::string text;
    if (!warden::read_file(journal_path, &text)) {
      warden::report_issue(warden::ErrorCode::io_error, "", journal_path, "apply journal unreadable");
      return kExitError;
    }
    auto journal = warden::parse_apply_journal(text);
    if (!journal.ok()) {
      warden::report_issue(warden::ErrorCode::json_parse_error, "", journal_path, journal.error);
      return kExitError;
    }
    warden::SnapshotStore store(ctx.absolute(config.snapshot_dir));
    const auto r = warden::revert_apply(ctx, journal.files, store);
    std::cout << "{\"restored\":" << string_array(r.restored) << ",\"skipped\":" << r.skipped.size() << "}\n";
    return r.skipped.empty() ? kExitOk : kExitError;
  }

  // Everything below needs the registry.
  warden::RegistryBuild build;
  const bool usable = build_registry(ctx, args, &build);

  if (cmd == "tf" && sub == "validate") {
    std::cout << "{\"ok\":" << (build.violations.empty() && usable ? "true" : "false")
              << ",\"documents\":" << build.documents << ",\"active\":" << build.registry.active().size()
              << ",\"digest\":\"" << build.registry.digest() << "\",\"violations\":[";
    for (std::size_t i = 0; i < build.violations.size(); ++i) {
      if (i > 0) std::cout << ",";
      std::cout << warden::violation_to_json(build.violations[i]);
    }
    std::cout << "]";
    if (!usable) std::cout << ",\"fatal\":\"" << warden::jsonlite::escape(build.fatal_reason) << "\"";
    std::cout << "}\n";
    if (!usable) return kExitRegistryFatal;
    return build.violations.empty() ? kExitOk : kExitError;
  }

  if (!usable) return kExitRegistryFatal;
  const warden::Registry& registry = build.registry;

  if (cmd == "tf" && sub == "list") {
    std::cout << "[";
    bool first = true;
    for (const auto& tf : registry.all()) {
      if (!first) std::cout << ",";
      first = false;
      std::cout << "{\"id\":\"" << tf.id << "\",\"name\":\"" << warden::jsonlite::escape(tf.name)
                << "\",\"status\":\"" << warden::to_string(tf.status) << "\",\"tier\":" << tf.tier
                << ",\"strategy\":\"" << warden::to_string(tf.strategy()) << "\",\"decision\":\""
                << warden::to_string(tf.decision.kind) << "\"}";
    }
    std::cout << "]\n";
    return kExitOk;
  }

  if (cmd == "scan") {
    const auto r = warden::scan(ctx, registry);
    const std::string out = args.get("--out", ctx.absolute(config.findings_path));
    const std::string stream = warden::findings_to_jsonl(r.findings);
    if (out == "-") {
      std::cout << stream;
      return kExitOk;
    }
    if (!warden::atomic_write(out, stream)) {
      warden::report_issue(warden::ErrorCode::io_error, "", out, "cannot write findings");
      return kExitError;
    }
    std::cout << "{\"files\":" << r.files_scanned << ",\"findings\":" << r.findings.size()
              << ",\"detector_failures\":" << r.failures.size() << ",\"out\":\"" << warden::jsonlite::escape(out)
              << "\"}\n";
    return kExitOk;
  }

  if (cmd == "propose") {
    const auto findings = findings_for(ctx, registry, args);
    const auto r = warden::propose_all(ctx, registry, findings);
    const std::string out = args.get("--out", ctx.absolute(config.patch_path));
    const std::string stream = warden::render_patch_stream(ctx, r.patches);
    if (out == "-") {
      std::cout << stream;
      return kExitOk;
    }
    if (!warden::atomic_write(out, stream)) {
      warden::report_issue(warden::ErrorCode::io_error, "", out, "cannot write patch stream");
      return kExitError;
    }
    std::cout << "{\"findings\":" << findings.size() << ",\"patches\":" << r.patches.size()
              << ",\"ambiguous\":" << r.ambiguous.size() << ",\"rejected\":" << r.rejected.size()
              << ",\"out\":\"" << warden::jsonlite::escape(out) << "\"}\n";
    return kExitOk;
  }

  if (cmd == "apply") {
    const std::string patch_path = args.get("--patch", ctx.absolute(config.patch_path));
    std::string text;
    if (!warden::read_file(patch_path, &text)) {
      warden::report_issue(warden::ErrorCode::io_error, "", patch_path, "patch stream unreadable");
      return kExitError;
    }
    auto parsed = warden::parse_unified_diff(text);
    if (!parsed.ok()) {
      warden::report_issue(warden::ErrorCode::diff_parse_error, "", patch_path, parsed.error);
      return kExitError;
    }
    warden::SnapshotStore store(ctx.absolute(config.snapshot_dir));
    warden::ApplyOptions opts;
    opts.dry_run = args.has("--dry-run");
    opts.snapshots = opts.dry_run ? nullptr : &store;
    opts.compression = config.snapshot_compression;
    const auto r = warden::apply_patches(ctx, parsed.patches, opts);
    const std::string journal = warden::apply_journal_to_json(r);
    if (!opts.dry_run && !r.files.empty() && !warden::atomic_write(ctx.absolute(config.journal_path), journal)) {
      warden::report_issue(warden::ErrorCode::io_error, "", config.journal_path, "cannot write apply journal");
      return kExitError;
    }
    std::cout << journal << "\n";
    return kExitOk;
  }

  if (cmd == "verify") {
    std::set<std::string> tfs;
    for (const auto& id : args.all("--tf")) tfs.insert(id);
    warden::WaiverLedger ledger(ctx.absolute(config.ledger_path));
    warden::VerifyOptions opts;
    opts.checks = config.checks;
    opts.run_checks = !config.skip_checks;
    opts.default_timeout_ms = config.check_timeout_ms;
    opts.waive_failures = args.has("--waive");
    opts.ledger = &ledger;
    opts.context = args.get("--context", "*");
    opts.now = now_from(args);
    opts.waiver_ttl_days = config.agent_waiver_ttl_days;
    std::vector<std::string> files;
    for (const auto& f : args.all("--file")) files.push_back(warden::normalize_rel_path(f));
    const auto r = warden::verify(ctx, registry, tfs, files, opts);
    std::cout << warden::verify_report_to_json(r) << "\n";
    if (!r.suite_ok()) return kExitVerifyFail;
    if (!r.tfs_ok() && !opts.waive_failures) return kExitVerifyFail;
    return kExitOk;
  }

  if (cmd == "gate") {
    const auto findings = findings_for(ctx, registry, args);
    const std::string context = args.get("--context", "*");
    const auto waivers = warden::collect_waivers(ctx, context);
    const auto decision = warden::evaluate(findings, changed_files_for(ctx, args), waivers,
                                           warden::precedence_from(config), context, now_from(args));
    std::cout << warden::gate_report_json(decision) << "\n";
    if (!decision.pass) {
      warden::global_engine_stats().gate_failures.fetch_add(1, std::memory_order_relaxed);
      return kExitGateFail;
    }
    return kExitOk;
  }

  if (cmd == "emit") {
    const auto findings = findings_for(ctx, registry, args);
    const auto proposals = warden::propose_all(ctx, registry, findings);
    const auto r =
        warden::emit_tasks(ctx, registry, proposals.ambiguous, args.get("--out", ctx.absolute(config.tasks_dir)));
    if (!r.ok()) return kExitError;
    std::cout << "{\"packets\":" << r.packets.size() << ",\"paths\":" << string_array(r.paths) << "}\n";
    return kExitOk;
  }

  if (cmd == "ingest") {
    std::vector<warden::IngestDiff> diffs;
    for (const auto& path : args.all("--diff")) {
      warden::IngestDiff d;
      d.name = path;
      if (!warden::read_file(path, &d.text)) {
        warden::report_issue(warden::ErrorCode::io_error, "", path, "diff unreadable");
        return kExitError;
      }
      diffs.push_back(std::move(d));
    }
    if (diffs.empty()) {
      usage();
      return kExitError;
    }
    warden::WaiverLedger ledger(ctx.absolute(config.ledger_path));
    warden::SnapshotStore store(ctx.absolute(config.snapshot_dir));
    warden::IngestOptions opts;
    opts.verify.checks = config.checks;
    opts.verify.run_checks = !config.skip_checks;
    opts.verify.default_timeout_ms = config.check_timeout_ms;
    opts.apply.snapshots = &store;
    opts.apply.compression = config.snapshot_compression;
    opts.ledger = &ledger;
    opts.context = args.get("--context", "*");
    opts.now = now_from(args);
    opts.waiver_ttl_days = config.agent_waiver_ttl_days;
    const auto r = warden::ingest(ctx, registry, diffs, opts);
    std::cout << warden::ingest_result_to_json(r) << "\n";
    return r.rejected == 0 ? kExitOk : kExitError;
  }

  usage();
  return kExitError;
}

}  // namespace

int main(int argc, char** argv) {
  std::string cmd;
  std::string sub;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a.rfind("--", 0) == 0) {
      if (!is_bare_flag(a)) ++i;
      continue;
    }
    cmd = a;
    if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) sub = argv[i + 1];
    break;
  }
  if (cmd.empty()) {
    usage();
    return kExitError;
  }

  bool stats = false;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == "--stats") stats = true;
  }

  const int rc = dispatch(argc, argv, cmd, sub);
  if (stats) std::cerr << warden::global_engine_stats().to_json() << "\n";
  return rc;
}
