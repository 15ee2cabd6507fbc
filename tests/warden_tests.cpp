#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <set>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

#include "warden/agent_bridge.hpp"
#include "warden/apply.hpp"
#include "warden/config.hpp"
#include "warden/detectors.hpp"
#include "warden/finding.hpp"
#include "warden/fsutil.hpp"
#include "warden/gate.hpp"
#include "warden/hash.hpp"
#include "warden/jsonlite.hpp"
#include "warden/observability.hpp"
#include "warden/outline.hpp"
#include "warden/patch.hpp"
#include "warden/pipeline.hpp"
#include "warden/proposer.hpp"
#include "warden/registry.hpp"
#include "warden/run_context.hpp"
#include "warden/sandbox.hpp"
#include "warden/scanner.hpp"
#include "warden/snapshot.hpp"
#include "warden/verifier.hpp"
#include "warden/version.hpp"
#include "warden/waivers.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// Issues are captured instead of printed so test output stays readable.
std::mutex g_issue_mu;
std::vector<warden::Issue> g_issues;

void capture_issue(const warden::Issue& issue) {
  std::lock_guard<std::mutex> lk(g_issue_mu);
  g_issues.push_back(issue);
}

void clear_issues() {
  std::lock_guard<std::mutex> lk(g_issue_mu);
  g_issues.clear();
}

bool saw_issue(warden::ErrorCode code) {
  std::lock_guard<std::mutex> lk(g_issue_mu);
  return std::any_of(g_issues.begin(), g_issues.end(),
                     [code](const warden::Issue& i) { return i.code == code; });
}

std::vector<std::string> g_stages;

void capture_stage(const warden::StageEvent& ev) { g_stages.push_back(ev.stage); }

// ---------------------------------------------------------------------------
// Fixtures
// ---------------------------------------------------------------------------

fs::path fresh_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

void write_file(const fs::path& path, const std::string& content) {
  fs::create_directories(path.parent_path());
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs << content;
}

std::string read_text(const fs::path& path) {
  std::string out;
  warden::read_file(path.string(), &out);
  return out;
}

std::string tf_doc(const std::string& id, int tier, const std::string& strategy, const std::string& params,
                   const std::string& transforms, const std::string& decision,
                   const std::string& status = "active") {
  return "{\"id\": \"" + id + "\", \"name\": \"" + id + " rule\", \"status\": \"" + status +
         "\", \"tier\": " + std::to_string(tier) + ", \"detect\": {\"strategy\": \"" + strategy +
         "\", \"signals\": [], \"confidence\": 1.0}, \"ontology\": {\"entities\": [], \"relations\": []}, "
         "\"logic\": {\"constraints\": []}, \"params\": " + params + ", \"allowed_transforms\": " + transforms +
         ", \"decision_rule\": " + decision + ", \"footprint\": [\"**/*.py\"], "
         "\"verify\": [\"no_findings\", \"parses\"]}";
}

void write_x001(const fs::path& tf_dir) {
  write_file(tf_dir / "X-001.json",
             tf_doc("X-001", 1, "broad_handler",
                    R"({"message": "blanket exception handler", "exception_map": {"int(": "ValueError"}})",
                    R"(["narrow_handler"])", R"({"kind": "require_hints", "text": "narrow only with hints"})"));
}

void write_sil001(const fs::path& tf_dir) {
  write_file(tf_dir / "SIL-001.json",
             tf_doc("SIL-001", 1, "silent_handler", R"({"message": "swallowed exception"})", R"(["reraise"])",
                    R"({"kind": "auto", "text": "re-raise"})"));
}

void write_mda001(const fs::path& tf_dir) {
  write_file(tf_dir / "MDA-001.json",
             tf_doc("MDA-001", 2, "mutable_default", R"({"message": "mutable default"})", R"(["none_default"])",
                    R"({"kind": "auto", "text": "default to None"})"));
}

void write_syn001(const fs::path& tf_dir) {
  write_file(tf_dir / "SYN-001.json",
             tf_doc("SYN-001", 1, "syntax", R"({"message": "syntax error"})", "[]",
                    R"({"kind": "ask", "text": "fix by hand"})"));
}

warden::EngineConfig test_config(std::size_t workers = 2) {
  warden::EngineConfig cfg;
  cfg.snapshot_compression = "off";
  cfg.workers = workers;
  return cfg;
}

warden::RegistryBuild load_fixture_registry(const fs::path& root) {
  warden::RegistryBuild build = warden::load_registry((root / "tf").string());
  expect(!build.fatal, "fixture registry loads: " + build.fatal_reason);
  return build;
}

std::vector<warden::Finding> findings_for(const std::vector<warden::Finding>& all, const std::string& tf_id,
                                          const std::string& file) {
  std::vector<warden::Finding> out;
  for (const auto& f : all) {
    if (f.tf_id == tf_id && f.file == file) out.push_back(f);
  }
  return out;
}

// Two auto-fixable findings in one file: a mutable default and a silent handler.
const char* kTwoFixes =
    "def f(items=[]):\n"
    "    items.append(1)\n"
    "    return items\n"
    "\n"
    "\n"
    "def g():\n"
    "    try:\n"
    "        run()\n"
    "    except ValueError:\n"
    "        pass\n";

const char* kTwoFixesApplied =
    "def f(items=None):\n"
    "    if items is None:\n"
    "        items = []\n"
    "    items.append(1)\n"
    "    return items\n"
    "\n"
    "\n"
    "def g():\n"
    "    try:\n"
    "        run()\n"
    "    except ValueError:\n"
    "        raise\n";

// A bare handler whose try body names nothing in the exception map.
const char* kAmbiguousHandler =
    "try:\n"
    "    x = 1\n"
    "except:\n"
    "    x = 2\n";

// ============================================================================
// Hashing and JSON
// ============================================================================

void test_blake3_known_vectors() {
  expect(warden::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(warden::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string payload = "x = 1\n";
  expect(warden::content_digest(payload) != warden::snapshot_content_hash(payload),
         "src: and snap: domains differ");
  expect(warden::content_digest(payload) == warden::hash_domain("src:", payload), "content_digest is src:");
  expect(warden::content_digest(payload).size() == 64, "digest is 64 hex chars");
}

void test_version_manifest() {
  std::optional<warden::jsonlite::JsonError> err;
  const auto m = warden::jsonlite::parse(
      warden::version::manifest_to_json(warden::version::current_manifest(WARDEN_VERSION)), &err);
  expect(!err, "manifest is JSON");
  expect(warden::jsonlite::get_string(m, "engine_semver", "") == WARDEN_VERSION, "engine version");
  expect(warden::jsonlite::get_string(m, "hash_primitive", "") == "blake3", "hash primitive");
  expect(warden::jsonlite::get_u64(m, "tf_schema", 0) == warden::version::TF_SCHEMA_VERSION, "schema version");
}

void test_jsonlite_sorted_output() {
  std::optional<warden::jsonlite::JsonError> err;
  const auto v = warden::jsonlite::parse_value(R"({"b": 1, "a": [true, null, "x\n"]})", &err);
  expect(!err, "valid json parses");
  expect(warden::jsonlite::to_json(v) == R"({"a":[true,null,"x\n"],"b":1})", "keys sorted, compact output");
}

void test_jsonlite_rejects_duplicates() {
  std::optional<warden::jsonlite::JsonError> err;
  warden::jsonlite::parse(R"({"a": 1, "a": 2})", &err);
  expect(err.has_value() && err->code == "json_duplicate_key", "duplicate key rejected");
  warden::jsonlite::parse("[1, 2]", &err);
  expect(err.has_value(), "non-object root rejected");
}

// ============================================================================
// Outline
// ============================================================================

void test_outline_logical_lines() {
  const auto lines = warden::split_lines("x = foo(1,\n        2)\ny = 3\n", nullptr);
  auto r = warden::parse_outline(lines);
  expect(r.outline.has_value(), "bracket continuation parses");
  expect(r.outline->logical.size() == 2, "two logical lines");
  expect(r.outline->logical[0].first == 0 && r.outline->logical[0].last == 1, "first spans two physical lines");
}

void test_outline_masks_strings_and_comments() {
  auto r = warden::parse_outline(warden::split_lines("s = 'a#b'  # c\n", nullptr));
  expect(r.outline.has_value(), "string with hash parses");
  const auto& l = r.outline->logical[0];
  expect(l.masked.size() == l.text.size(), "masked keeps offsets");
  expect(l.masked.find('#') == std::string::npos, "comment and string body blanked");
}

void test_outline_errors() {
  auto unclosed = warden::parse_outline(warden::split_lines("def f(:\n", nullptr));
  expect(unclosed.error.has_value() && unclosed.error->line == 1, "unclosed bracket at line 1");

  auto indent = warden::parse_outline(warden::split_lines("x = 1\n    y = 2\n", nullptr));
  expect(indent.error.has_value() && indent.error->reason == "unexpected indent", "unexpected indent");

  auto block = warden::parse_outline(warden::split_lines("if x:\ny = 1\n", nullptr));
  expect(block.error.has_value() && block.error->line == 2, "missing block at line 2");
}

void test_split_join_round_trip() {
  bool trailing = false;
  const auto lines = warden::split_lines("a\nb", &trailing);
  expect(!trailing && lines.size() == 2, "no trailing newline");
  expect(warden::join_lines(lines, trailing) == "a\nb", "join restores content");
}

// ============================================================================
// Registry
// ============================================================================

void test_registry_missing_dir_fatal() {
  clear_issues();
  auto build = warden::load_registry((fs::temp_directory_path() / "warden_no_such_tf_dir").string());
  expect(build.fatal, "missing TF dir is fatal");
  expect(saw_issue(warden::ErrorCode::registry_fatal), "registry_fatal reported");
}

void test_registry_violation_names_tf_and_field() {
  const fs::path root = fresh_dir("warden_registry_test");
  write_sil001(root / "tf");
  // A stub without a footprint: reported, not fatal.
  std::string stub = tf_doc("STB-001", 3, "pattern", R"({"message": "m", "pattern": "x"})", "[]",
                            R"({"kind": "ask", "text": "t"})", "stub");
  stub.replace(stub.find("\"footprint\""), std::string("\"footprint\": [\"**/*.py\"], ").size(), "");
  write_file(root / "tf" / "STB-001.json", stub);

  auto build = warden::load_registry((root / "tf").string());
  expect(!build.fatal, "invalid stub is not fatal");
  expect(build.registry.find("SIL-001") != nullptr, "valid TF loaded");
  expect(build.registry.find("STB-001") == nullptr, "invalid TF not loaded");
  bool named = false;
  for (const auto& v : build.violations) {
    if (v.tf_id == "STB-001" && v.field == "footprint" && v.file == "STB-001.json") named = true;
  }
  expect(named, "violation names TF id, file and field");
  fs::remove_all(root);
}

void test_registry_invalid_active_fatal() {
  const fs::path root = fresh_dir("warden_registry_fatal_test");
  write_sil001(root / "tf");
  std::string bad = tf_doc("BAD-001", 9, "silent_handler", R"({"message": "m"})", R"(["reraise"])",
                           R"({"kind": "auto", "text": "t"})");
  write_file(root / "tf" / "BAD-001.json", bad);
  auto build = warden::load_registry((root / "tf").string());
  expect(build.fatal, "invalid active TF is fatal");
  bool tier = false;
  for (const auto& v : build.violations) {
    if (v.tf_id == "BAD-001" && v.field == "tier") tier = true;
  }
  expect(tier, "tier violation reported");
  fs::remove_all(root);
}

void test_registry_ask_if_hint_needs_tokens() {
  std::vector<warden::SchemaViolation> violations;
  auto parsed = warden::tf_from_json(
      tf_doc("ASK-001", 2, "silent_handler", R"({"message": "m"})", R"(["reraise"])",
             R"({"kind": "ask_if_hint", "text": "t"})"),
      "ASK-001.json", &violations);
  expect(!parsed.tf.has_value(), "ask_if_hint without tokens rejected");
  expect(!violations.empty() && violations.front().field == "decision_rule.tokens", "tokens field named");
}

void test_shipped_rules_validate() {
  auto build = warden::load_registry(std::string(WARDEN_SOURCE_DIR) + "/tf");
  expect(!build.fatal, "shipped rules load: " + build.fatal_reason);
  expect(build.violations.empty(), "shipped rules have no violations");
  expect(build.registry.all().size() == 13, "thirteen shipped documents");
  expect(build.registry.active().size() == 11, "eleven active rules");
  expect(build.registry.find("SQL-007")->status == warden::TfStatus::stub, "SQL-007 is a stub");
  expect(build.registry.find("IMP-019")->status == warden::TfStatus::disabled, "star imports off by default");
  expect(build.registry.find("DUP-018")->strategy() == warden::Strategy::duplicate_block,
         "DUP-018 reports duplicated functions");
  expect(build.registry.find("ERR-011")->allows(warden::TransformKind::chain_cause), "ERR-011 chains causes");
  expect(build.registry.digest().size() == 64, "registry digest");

  auto cfg = warden::load_config(WARDEN_SOURCE_DIR);
  expect(cfg.ok(), "shipped config parses");
  expect(cfg.config.gating_tiers == std::set<int>{1}, "tier 1 gates by default");
}

void test_config_validation() {
  auto r = warden::parse_config(R"({"snapshot_compression": "lz4", "colour": "blue", "gating_tiers": [1, 2]})");
  expect(!r.ok(), "bad compression is an error");
  expect(!r.warnings.empty(), "unknown key is a warning");
  expect(r.config.gating_tiers == std::set<int>{1, 2}, "gating tiers read");
}

// ============================================================================
// Detectors and scanner (shipped rules)
// ============================================================================

fs::path write_detector_tree() {
  const fs::path root = fresh_dir("warden_detector_test");
  write_file(root / "pkg" / "config_io.py",
             "import yaml\n"
             "\n"
             "\n"
             "def read(stream):\n"
             "    return yaml.load(stream)\n"
             "\n"
             "\n"
             "def read_safe(stream):\n"
             "    return yaml.load(stream, Loader=yaml.SafeLoader)\n");
  write_file(root / "pkg" / "runner.py",
             "import subprocess\n"
             "\n"
             "\n"
             "def run(cmd):\n"
             "    subprocess.run(cmd)\n"
             "\n"
             "\n"
             "def run_shell(cmd):\n"
             "    subprocess.run(cmd, shell=True)\n"
             "\n"
             "\n"
             "def run_checked(cmd):\n"
             "    subprocess.run(cmd, check=True, text=True)\n");
  write_file(root / "pkg" / "log.py",
             "def hello():\n"
             "    print(\"hi\")\n"
             "    print(\"debug\")  # noqa\n");
  write_file(root / "scripts" / "tool.py", "print(\"tool\")\n");
  write_file(root / "pkg" / "handlers.py",
             "import json\n"
             "\n"
             "\n"
             "def load(path, cache={}):\n"
             "    try:\n"
             "        with open(path) as fh:\n"
             "            return json.load(fh)\n"
             "    except Exception as exc:\n"
             "        raise RuntimeError(path) from exc\n"
             "\n"
             "\n"
             "def quiet():\n"
             "    try:\n"
             "        work()\n"
             "    except ValueError:\n"
             "        pass\n");
  write_file(root / "pkg" / "broken.py", "def f(:\n");
  std::string big = "def big():\n";
  for (int i = 0; i < 121; ++i) big += "    x = 1\n";
  write_file(root / "pkg" / "long.py", big);
  return root;
}

void test_detect_each_strategy() {
  const fs::path root = write_detector_tree();
  auto build = warden::load_registry(std::string(WARDEN_SOURCE_DIR) + "/tf");
  warden::RunContext ctx(root.string(), test_config());
  clear_issues();
  auto result = warden::scan(ctx, build.registry);

  expect(findings_for(result.findings, "YAML-015", "pkg/config_io.py").size() == 1, "yaml.load without loader");
  auto sub = findings_for(result.findings, "SUB-006", "pkg/runner.py");
  expect(sub.size() == 2, "two subprocess.run calls miss keywords");
  expect(sub[0].hints.empty() && sub[1].hints == std::vector<std::string>{"shell=True"}, "shell flag hint");
  expect(findings_for(result.findings, "LOG-010", "pkg/log.py").size() == 1, "noqa line exempt");
  expect(findings_for(result.findings, "LOG-010", "scripts/tool.py").empty(), "scripts outside footprint");

  auto bex = findings_for(result.findings, "BEX-001", "pkg/handlers.py");
  expect(bex.size() == 1 && bex[0].span.line == 8, "broad handler at line 8");
  expect(bex[0].hints == (std::vector<std::string>{"json.load", "open("}), "try body hints");
  expect(bex[0].frame == "def load()", "frame names the function");
  auto sil = findings_for(result.findings, "SIL-002", "pkg/handlers.py");
  expect(sil.size() == 1 && sil[0].span.line == 16 && sil[0].span.col == 8, "silent pass");
  auto mda = findings_for(result.findings, "MDA-003", "pkg/handlers.py");
  expect(mda.size() == 1 && mda[0].hints == std::vector<std::string>{"cache"}, "mutable default names param");

  expect(findings_for(result.findings, "CPL-017", "pkg/long.py").size() == 1, "long block");
  auto syn = findings_for(result.findings, "SYN-000", "pkg/broken.py");
  expect(syn.size() == 1 && syn[0].span.line == 1, "syntax finding for broken file");
  fs::remove_all(root);
}

void test_detector_failure_skips_file() {
  const fs::path root = fresh_dir("warden_failure_test");
  write_sil001(root / "tf");
  write_syn001(root / "tf");
  write_file(root / "bad.py", "def f(:\n");
  write_file(root / "good.py", "try:\n    go()\nexcept KeyError:\n    pass\n");
  auto build = load_fixture_registry(root);
  warden::RunContext ctx(root.string(), test_config());
  clear_issues();
  auto result = warden::scan(ctx, build.registry);

  expect(result.files_scanned == 2, "both files scanned");
  expect(result.failures.size() == 1 && result.failures[0].tf_id == "SIL-001" &&
             result.failures[0].file == "bad.py",
         "one detector failure for the unparseable file");
  expect(saw_issue(warden::ErrorCode::detector_failure), "detector_failure reported");
  expect(findings_for(result.findings, "SIL-001", "good.py").size() == 1, "scan continued past failure");
  expect(findings_for(result.findings, "SYN-001", "bad.py").size() == 1, "syntax TF still reports");
  fs::remove_all(root);
}

const char* kRaiseCases =
    "def case1():\n"
    "    try:\n"
    "        g()\n"
    "    except ValueError as e:\n"
    "        raise RuntimeError(\"bad\")\n"
    "\n"
    "\n"
    "def case2():\n"
    "    try:\n"
    "        g()\n"
    "    except ValueError as e:\n"
    "        raise\n"
    "\n"
    "\n"
    "def case3():\n"
    "    try:\n"
    "        g()\n"
    "    except ValueError:\n"
    "        raise RuntimeError(\"bad\")\n"
    "\n"
    "\n"
    "def case4():\n"
    "    try:\n"
    "        g()\n"
    "    except ValueError as e:\n"
    "        def inner():\n"
    "            raise RuntimeError(\"bad\")\n"
    "        inner()\n"
    "\n"
    "\n"
    "def case5():\n"
    "    try:\n"
    "        g()\n"
    "    except KeyError as e: raise LookupError(str(e))  # keep\n"
    "\n"
    "\n"
    "def case6():\n"
    "    try:\n"
    "        g()\n"
    "    except ValueError as e:\n"
    "        raise e\n";

void test_raise_without_cause_chained() {
  const fs::path root = fresh_dir("warden_raise_cause_test");
  write_file(root / "errs.py", kRaiseCases);
  auto build = warden::load_registry(std::string(WARDEN_SOURCE_DIR) + "/tf");
  warden::RunContext ctx(root.string(), test_config());
  clear_issues();
  auto err = findings_for(warden::scan(ctx, build.registry).findings, "ERR-011", "errs.py");
  expect(err.size() == 2, "only unchained raises inside a named handler");
  expect(err[0].span.line == 5 && err[0].span.col == 8 && err[0].hints == std::vector<std::string>{"e"},
         "raise in handler block");
  expect(err[1].span.line == 34 && err[1].frame == "def case5()", "raise on the handler line");

  auto proposals = warden::propose_all(ctx, build.registry, err);
  expect(proposals.patches.size() == 2, "both raises chained");
  expect(proposals.patches[0].hunks[0].new_lines ==
             std::vector<std::string>{"        raise RuntimeError(\"bad\") from e"},
         "cause appended");
  expect(proposals.patches[1].hunks[0].new_lines ==
             std::vector<std::string>{"    except KeyError as e: raise LookupError(str(e)) from e  # keep"},
         "cause goes before the trailing comment");

  auto applied = warden::apply_patches(ctx, proposals.patches, warden::ApplyOptions{});
  expect(applied.patches_applied == 2 && applied.conflicts.empty(), "chained raises applied");
  expect(findings_for(warden::scan(ctx, build.registry).findings, "ERR-011", "errs.py").empty(),
         "re-scan finds nothing");
  fs::remove_all(root);
}

void test_unguarded_json_loads() {
  const fs::path root = fresh_dir("warden_unguarded_call_test");
  write_file(root / "decode.py",
             "import json\n"
             "\n"
             "\n"
             "def raw(text):\n"
             "    return json.loads(text)\n"
             "\n"
             "\n"
             "def guarded(text):\n"
             "    try:\n"
             "        return json.loads(text)\n"
             "    except json.JSONDecodeError:\n"
             "        return None\n"
             "\n"
             "\n"
             "def wrong_handler(text):\n"
             "    try:\n"
             "        return json.loads(text)\n"
             "    except KeyError:\n"
             "        return None\n"
             "\n"
             "\n"
             "def in_handler(text):\n"
             "    try:\n"
             "        return int(text)\n"
             "    except ValueError:\n"
             "        return json.loads(text)\n"
             "\n"
             "\n"
             "def nested(text):\n"
             "    try:\n"
             "        if text:\n"
             "            return json.loads(text)\n"
             "    except KeyError:\n"
             "        pass\n"
             "    except ValueError:\n"
             "        return None\n");
  auto build = warden::load_registry(std::string(WARDEN_SOURCE_DIR) + "/tf");
  warden::RunContext ctx(root.string(), test_config());
  clear_issues();
  auto found = findings_for(warden::scan(ctx, build.registry).findings, "JSON-016", "decode.py");
  std::vector<std::uint32_t> lines;
  for (const auto& f : found) lines.push_back(f.span.line);
  expect(lines == (std::vector<std::uint32_t>{5, 17, 26}), "unguarded, wrongly guarded and handler-body calls");
  expect(found[0].hints == std::vector<std::string>{"json.loads"}, "callee is the hint");
  expect(std::holds_alternative<warden::Ambiguous>(warden::propose(ctx, build.registry, found[0])),
         "the fallback is left to a human");
  fs::remove_all(root);
}

void test_duplicate_function_bodies() {
  const fs::path root = fresh_dir("warden_duplicate_block_test");
  write_file(root / "totals.py",
             "def first(rows):\n"
             "    total = 0\n"
             "    for r in rows:\n"
             "        total += r  # sum\n"
             "    if total < 0:\n"
             "        total = 0\n"
             "    return total\n"
             "\n"
             "\n"
             "def second(rows):\n"
             "    total = 0\n"
             "    for r in rows:\n"
             "        total += r\n"
             "    if total < 0:\n"
             "        total = 0\n"
             "    return total\n"
             "\n"
             "\n"
             "def short(rows):\n"
             "    return rows\n"
             "\n"
             "\n"
             "def other_short(rows):\n"
             "    return rows\n");
  auto build = warden::load_registry(std::string(WARDEN_SOURCE_DIR) + "/tf");
  warden::RunContext ctx(root.string(), test_config());
  clear_issues();
  auto dup = findings_for(warden::scan(ctx, build.registry).findings, "DUP-018", "totals.py");
  expect(dup.size() == 1 && dup[0].span.line == 10, "later copy reported once");
  expect(dup[0].hints == std::vector<std::string>{"def first()"}, "original named in hints");
  expect(dup[0].message.find("at line 1") != std::string::npos, "original line in message");
  fs::remove_all(root);
}

void test_scan_determinism_across_workers() {
  const fs::path root = write_detector_tree();
  auto build = warden::load_registry(std::string(WARDEN_SOURCE_DIR) + "/tf");
  warden::RunContext serial(root.string(), test_config(1));
  warden::RunContext wide(root.string(), test_config(8));
  clear_issues();
  auto a = warden::scan(serial, build.registry);
  auto b = warden::scan(wide, build.registry);
  expect(warden::findings_to_jsonl(a.findings) == warden::findings_to_jsonl(b.findings),
         "findings byte-identical across worker counts");
  auto pa = warden::propose_all(serial, build.registry, a.findings);
  auto pb = warden::propose_all(wide, build.registry, b.findings);
  expect(warden::render_patch_stream(serial, pa.patches) == warden::render_patch_stream(wide, pb.patches),
         "patch stream byte-identical");
  expect(std::is_sorted(a.findings.begin(), a.findings.end(),
                        [](const warden::Finding& x, const warden::Finding& y) {
                          return std::tie(x.file, x.span.line, x.span.col, x.tf_id) <
                                 std::tie(y.file, y.span.line, y.span.col, y.tf_id);
                        }),
         "findings ordered by file, line, col, tf_id");
  fs::remove_all(root);
}

void test_findings_jsonl_round_trip() {
  warden::Finding f;
  f.tf_id = "SIL-001";
  f.file = "a.py";
  f.span = warden::Span{3, 4, 3, 8};
  f.id = warden::finding_id(f.tf_id, f.file, f.span);
  f.message = "swallowed \"quoted\"";
  f.hints = {"pass"};
  auto parsed = warden::parse_findings_jsonl(warden::findings_to_jsonl({f}) + "\nnot json\n");
  expect(parsed.findings.size() == 1 && parsed.findings[0].id == f.id, "finding read back");
  expect(parsed.findings[0].message == f.message, "message escaped and restored");
  expect(parsed.errors.size() == 1, "malformed line reported");
}

// ============================================================================
// Proposer and transforms
// ============================================================================

void test_decision_rules() {
  warden::Finding f;
  warden::DecisionRule rule;
  rule.kind = warden::DecisionKind::require_hints;
  expect(warden::evaluate_decision_rule(rule, f).disposition == warden::Disposition::ambiguous,
         "require_hints without hints is ambiguous");
  f.hints = {"int("};
  expect(warden::evaluate_decision_rule(rule, f).disposition == warden::Disposition::resolved,
         "require_hints with hints resolves");
  rule.kind = warden::DecisionKind::ask_if_hint;
  rule.tokens = {"shell=True"};
  expect(warden::evaluate_decision_rule(rule, f).disposition == warden::Disposition::resolved,
         "ask_if_hint without token resolves");
  f.hints.push_back("shell=True");
  expect(warden::evaluate_decision_rule(rule, f).disposition == warden::Disposition::ambiguous,
         "ask_if_hint with token is ambiguous");
}

void test_proposer_three_valued() {
  const fs::path root = write_detector_tree();
  auto build = warden::load_registry(std::string(WARDEN_SOURCE_DIR) + "/tf");
  warden::RunContext ctx(root.string(), test_config());
  clear_issues();
  auto result = warden::scan(ctx, build.registry);

  auto bex = findings_for(result.findings, "BEX-001", "pkg/handlers.py");
  auto p = warden::propose(ctx, build.registry, bex.at(0));
  const auto* resolved = std::get_if<warden::Resolved>(&p);
  expect(resolved != nullptr, "hinted broad handler resolves");
  expect(resolved->patch.hunks.size() == 1 &&
             resolved->patch.hunks[0].new_lines ==
                 std::vector<std::string>{"    except (OSError, json.JSONDecodeError) as exc:"},
         "handler narrowed to inferred exceptions");

  auto sub = findings_for(result.findings, "SUB-006", "pkg/runner.py");
  auto fixed = warden::propose(ctx, build.registry, sub.at(0));
  expect(std::holds_alternative<warden::Resolved>(fixed), "plain call resolves");
  expect(std::get<warden::Resolved>(fixed).patch.hunks[0].new_lines ==
             std::vector<std::string>{"    subprocess.run(cmd, check=True, text=True)"},
         "missing keywords appended");
  expect(std::holds_alternative<warden::Ambiguous>(warden::propose(ctx, build.registry, sub.at(1))),
         "shell=True call is ambiguous");

  auto yaml = findings_for(result.findings, "YAML-015", "pkg/config_io.py");
  auto y = warden::propose(ctx, build.registry, yaml.at(0));
  expect(std::holds_alternative<warden::Resolved>(y) &&
             std::get<warden::Resolved>(y).patch.hunks[0].new_lines ==
                 std::vector<std::string>{"    return yaml.safe_load(stream)"},
         "regex replacement at the finding");

  warden::Finding unknown = bex.at(0);
  unknown.tf_id = "NOPE-999";
  expect(std::holds_alternative<warden::Rejected>(warden::propose(ctx, build.registry, unknown)),
         "unknown TF rejected");
  auto cpl = findings_for(result.findings, "CPL-017", "pkg/long.py");
  expect(std::holds_alternative<warden::Ambiguous>(warden::propose(ctx, build.registry, cpl.at(0))),
         "suggest-only rule asks");
  fs::remove_all(root);
}

void test_stale_finding_rejected() {
  const fs::path root = fresh_dir("warden_stale_test");
  write_sil001(root / "tf");
  write_file(root / "a.py", "try:\n    go()\nexcept KeyError:\n    pass\n");
  auto build = load_fixture_registry(root);
  warden::RunContext ctx(root.string(), test_config());
  auto result = warden::scan(ctx, build.registry);
  expect(result.findings.size() == 1, "one silent handler");
  write_file(root / "a.py", "try:\n    go()\nexcept KeyError:\n    log()\n");
  ctx.invalidate("a.py");
  expect(std::holds_alternative<warden::Rejected>(warden::propose(ctx, build.registry, result.findings[0])),
         "finding on changed content rejected");
  fs::remove_all(root);
}

// ============================================================================
// Patch codec and apply
// ============================================================================

void test_patch_render_and_parse() {
  const fs::path root = write_detector_tree();
  auto build = warden::load_registry(std::string(WARDEN_SOURCE_DIR) + "/tf");
  warden::RunContext ctx(root.string(), test_config());
  clear_issues();
  auto result = warden::scan(ctx, build.registry);
  auto sub = findings_for(result.findings, "SUB-006", "pkg/runner.py");
  auto patch = std::get<warden::Resolved>(warden::propose(ctx, build.registry, sub.at(0))).patch;

  const std::string stream = warden::render_patch_stream(ctx, {patch});
  expect(stream.rfind("# warden-patch v=1 tf_id=SUB-006 finding=" + patch.finding_id, 0) == 0,
         "metadata line first");
  expect(stream.find("@@ -2,7 +2,7 @@") != std::string::npos, "three lines of context");
  expect(stream.find("-    subprocess.run(cmd)\n") != std::string::npos, "removed line");

  auto parsed = warden::parse_unified_diff(stream);
  expect(parsed.ok() && parsed.patches.size() == 1, "stream parses back");
  const auto& back = parsed.patches[0];
  expect(back.tf_id == "SUB-006" && back.file == "pkg/runner.py" && back.base_digest == patch.base_digest,
         "metadata preserved");

  const std::string before = read_text(root / "pkg" / "runner.py");
  auto direct = warden::apply_patches_to_text(before, true, {&patch});
  auto via_diff = warden::apply_patches_to_text(before, true, {&back});
  expect(direct.content == via_diff.content && direct.changed, "parsed diff applies like the original");
  fs::remove_all(root);
}

void test_diff_parse_errors() {
  auto deletion = warden::parse_unified_diff("--- a/x.py\n+++ /dev/null\n@@ -1,1 +0,0 @@\n-x\n");
  expect(!deletion.ok(), "deletion unsupported");
  auto counts = warden::parse_unified_diff("--- a/x.py\n+++ b/x.py\n@@ -1,2 +1,2 @@\n-x\n+y\n");
  expect(!counts.ok(), "line counts checked");
  auto creation = warden::parse_unified_diff("--- /dev/null\n+++ b/new.py\n@@ -0,0 +1,1 @@\n+x = 1\n");
  expect(creation.ok() && creation.patches[0].creates_file, "creation diff");
}

void test_apply_two_patches_one_file() {
  const fs::path root = fresh_dir("warden_apply_test");
  write_mda001(root / "tf");
  write_sil001(root / "tf");
  write_file(root / "mod.py", kTwoFixes);
  auto build = load_fixture_registry(root);
  warden::RunContext ctx(root.string(), test_config());
  auto scan = warden::scan(ctx, build.registry);
  expect(scan.findings.size() == 2, "two findings");
  auto proposals = warden::propose_all(ctx, build.registry, scan.findings);
  expect(proposals.patches.size() == 2, "two patches");

  warden::ApplyOptions opts;
  auto applied = warden::apply_patches(ctx, proposals.patches, opts);
  expect(applied.patches_applied == 2 && applied.conflicts.empty(), "both patches applied");
  expect(read_text(root / "mod.py") == kTwoFixesApplied, "applied content");
  expect(warden::scan(ctx, build.registry).findings.empty(), "re-scan finds nothing");

  // Same patch set again: a no-op.
  auto again = warden::apply_patches(ctx, proposals.patches, opts);
  expect(again.patches_applied == 0 && again.patches_unchanged == 2 && again.conflicts.empty(),
         "second apply is a no-op");
  expect(again.files.empty(), "nothing written");
  expect(read_text(root / "mod.py") == kTwoFixesApplied, "content unchanged");
  fs::remove_all(root);
}

void test_apply_overlap_lower_tf_wins() {
  warden::Patch a;
  a.tf_id = "AAA-001";
  a.finding_id = "f1";
  a.file = "x.py";
  a.hunks.push_back(warden::Hunk{2, {"b"}, {"B"}});
  warden::Patch b = a;
  b.tf_id = "BBB-002";
  b.hunks[0].new_lines = {"bb"};
  auto r = warden::apply_patches_to_text("a\nb\nc\n", true, {&b, &a});
  expect(r.results[1].outcome == warden::PatchOutcome::applied, "lower TF id applied");
  expect(r.results[0].outcome == warden::PatchOutcome::conflict, "higher TF id conflicts");
  expect(r.results[0].reason.find("overlaps") != std::string::npos, "overlap reason");
  expect(r.content == "a\nB\nc\n", "winner's content");
}

void test_apply_content_drift() {
  warden::Patch p;
  p.tf_id = "SIL-001";
  p.file = "x.py";
  p.base_digest = warden::content_digest("a\nb\n");
  p.hunks.push_back(warden::Hunk{2, {"b"}, {"B"}});
  auto r = warden::apply_patches_to_text("a\nc\n", true, {&p});
  expect(r.results[0].outcome == warden::PatchOutcome::conflict, "drift conflicts");
  expect(r.results[0].reason.find("drift") != std::string::npos, "drift reason");
  expect(!r.changed && r.content == "a\nc\n", "nothing changed");
}

void test_deletion_patch_under_drift() {
  warden::Patch p;
  p.tf_id = "SIL-001";
  p.file = "x.py";
  p.base_digest = warden::content_digest("a\nb\nc\n");
  p.hunks.push_back(warden::Hunk{2, {"b"}, {}});
  auto drifted = warden::apply_patches_to_text("a\nZ\nb\nc\n", true, {&p});
  expect(drifted.results[0].outcome == warden::PatchOutcome::conflict, "pure deletion under drift conflicts");
  expect(!drifted.changed && drifted.content.find("b\n") != std::string::npos, "line still present");
  auto gone = warden::apply_patches_to_text("a\nZ\nc\n", true, {&p});
  expect(gone.results[0].outcome == warden::PatchOutcome::conflict, "deletion is never reported as applied");

  // Keeps "b", drops the "c" after it.
  warden::Patch q = p;
  q.hunks = {warden::Hunk{2, {"b", "c"}, {"b"}}};
  auto pending = warden::apply_patches_to_text("x\na\nb\nc\n", true, {&q});
  expect(pending.results[0].outcome == warden::PatchOutcome::conflict, "old lines still in place");
  auto done = warden::apply_patches_to_text("x\na\nb\n", true, {&q});
  expect(done.results[0].outcome == warden::PatchOutcome::already_applied, "shifted result recognized");
}

void test_apply_refuses_paths_outside_root() {
  const fs::path root = fresh_dir("warden_apply_escape_test");
  const fs::path outside = fresh_dir("warden_apply_escape_outside");
  fs::create_directory_symlink(outside, root / "linked");
  warden::RunContext ctx(root.string(), test_config());
  warden::Patch p;
  p.tf_id = "SIL-001";
  p.file = "linked/planted.py";
  p.creates_file = true;
  p.hunks.push_back(warden::Hunk{1, {}, {"x = 1"}});
  clear_issues();
  auto r = warden::apply_patches(ctx, {p}, warden::ApplyOptions{});
  expect(r.conflicts.size() == 1 && r.conflicts[0].reason == "path escapes the tree", "symlinked escape refused");
  expect(r.files.empty() && !fs::exists(outside / "planted.py"), "nothing written outside the root");

  expect(warden::path_within_root(root.string(), "pkg/new.py"), "missing file under the root is inside");
  expect(!warden::is_tree_relative("pkg/../../etc/passwd"), "parent segments refused");
  expect(!warden::is_tree_relative("/etc/passwd") && !warden::is_tree_relative("C:/x.py"), "absolute refused");
  fs::remove_all(root);
  fs::remove_all(outside);
}

void test_apply_conflict_reported() {
  const fs::path root = fresh_dir("warden_apply_conflict_test");
  write_file(root / "x.py", "a\nc\n");
  warden::RunContext ctx(root.string(), test_config());
  warden::Patch p;
  p.tf_id = "SIL-001";
  p.file = "x.py";
  p.base_digest = warden::content_digest("a\nb\n");
  p.hunks.push_back(warden::Hunk{2, {"b"}, {"B"}});
  clear_issues();
  auto r = warden::apply_patches(ctx, {p}, warden::ApplyOptions{});
  expect(r.conflicts.size() == 1 && r.files.empty(), "conflict, no write");
  expect(saw_issue(warden::ErrorCode::apply_conflict), "apply_conflict reported");
  fs::remove_all(root);
}

void test_atomic_write_leaves_no_temp() {
  const fs::path dir = fresh_dir("warden_atomic_test");
  const fs::path target = dir / "out.py";
  expect(warden::atomic_write(target.string(), "one\n"), "first write");
  expect(warden::atomic_write(target.string(), "two\n"), "overwrite");
  expect(read_text(target) == "two\n", "latest content");
  std::size_t entries = 0;
  for (const auto& e : fs::directory_iterator(dir)) {
    (void)e;
    ++entries;
  }
  expect(entries == 1, "no temporary files left behind");
  fs::remove_all(dir);
}

void test_dry_run_writes_nothing() {
  const fs::path root = fresh_dir("warden_dry_run_test");
  write_sil001(root / "tf");
  write_file(root / "a.py", "try:\n    go()\nexcept KeyError:\n    pass\n");
  auto build = load_fixture_registry(root);
  warden::RunContext ctx(root.string(), test_config());
  auto proposals = warden::propose_all(ctx, build.registry, warden::scan(ctx, build.registry).findings);
  warden::ApplyOptions opts;
  opts.dry_run = true;
  auto r = warden::apply_patches(ctx, proposals.patches, opts);
  expect(r.patches_applied == 1 && r.files.size() == 1, "dry run reports the change");
  expect(read_text(root / "a.py") == "try:\n    go()\nexcept KeyError:\n    pass\n", "file untouched");
  fs::remove_all(root);
}

void test_revert_restores_pre_images() {
  const fs::path root = fresh_dir("warden_revert_test");
  write_mda001(root / "tf");
  write_sil001(root / "tf");
  write_file(root / "mod.py", kTwoFixes);
  write_file(root / "other.py", "def h(seen=set()):\n    return seen\n");
  auto build = load_fixture_registry(root);
  warden::RunContext ctx(root.string(), test_config());
  auto proposals = warden::propose_all(ctx, build.registry, warden::scan(ctx, build.registry).findings);

  warden::SnapshotStore store((root / ".warden" / "snapshots").string());
  warden::ApplyOptions opts;
  opts.snapshots = &store;
  auto applied = warden::apply_patches(ctx, proposals.patches, opts);
  expect(applied.files.size() == 2, "two files written");
  expect(!applied.files[0].pre_image.empty(), "pre-image kept");

  auto journal = warden::parse_apply_journal(warden::apply_journal_to_json(applied));
  expect(journal.ok() && journal.files.size() == 2, "journal round trip");

  write_file(root / "other.py", "edited by hand\n");
  ctx.invalidate("other.py");
  auto reverted = warden::revert_apply(ctx, journal.files, store);
  expect(reverted.restored == std::vector<std::string>{"mod.py"}, "unchanged file restored");
  expect(reverted.skipped.size() == 1 && reverted.skipped[0].file == "other.py", "edited file skipped");
  expect(read_text(root / "mod.py") == kTwoFixes, "original content back");
  expect(read_text(root / "other.py") == "edited by hand\n", "hand edit kept");
  fs::remove_all(root);
}

void test_snapshot_store_integrity() {
  const fs::path dir = fresh_dir("warden_snapshot_test");
  warden::SnapshotStore store(dir.string());
  const std::string key = store.put("payload\n", "zstd");
  expect(key.size() == 64, "put returns a key");
  expect(store.put("payload\n") == key, "content-addressed dedup");
  expect(store.get(key).value_or("") == "payload\n", "get returns the bytes");

  // Corrupt the object: reads fail closed.
  fs::path object;
  for (const auto& e : fs::recursive_directory_iterator(dir)) {
    if (e.is_regular_file() && e.path().filename().string() == key) object = e.path();
  }
  expect(!object.empty(), "object file present");
  write_file(object, "tampered");
  expect(!store.get(key).has_value(), "corrupt object rejected");
  fs::remove_all(dir);
}

// ============================================================================
// Sandbox and verifier
// ============================================================================

void test_process_exit_codes() {
  const char* path = std::getenv("PATH");
  const std::string sh = warden::resolve_executable("sh", path ? path : "/usr/bin:/bin");
  expect(!sh.empty(), "sh on PATH");
  warden::ProcessSpec spec;
  spec.command = sh;
  spec.argv = {"-c", "echo out; exit 3"};
  auto r = warden::run_process(spec);
  expect(r.exit_code == 3 && !r.timed_out, "exit code propagated");
  expect(r.stdout_text == "out\n", "stdout captured");
}

void test_check_timeout_distinct_from_failure() {
  const fs::path dir = fresh_dir("warden_check_test");
  auto timeout = warden::run_check(warden::CheckSpec{"slow", {"sleep", "5"}, 200}, dir.string(), 600000);
  expect(timeout.status == warden::CheckStatus::timeout, "slow check times out");
  expect(timeout.duration_ms < 5000, "killed before completion");
  auto fail = warden::run_check(warden::CheckSpec{"red", {"false"}, 0}, dir.string(), 5000);
  expect(fail.status == warden::CheckStatus::fail && fail.exit_code != 0, "failing check fails");
  auto pass = warden::run_check(warden::CheckSpec{"green", {"true"}, 0}, dir.string(), 5000);
  expect(pass.status == warden::CheckStatus::pass, "passing check passes");
  auto missing = warden::run_check(warden::CheckSpec{"gone", {"warden-no-such-tool"}, 0}, dir.string(), 5000);
  expect(missing.status == warden::CheckStatus::error, "missing executable is an error");
  fs::remove_all(dir);
}

void test_verify_waives_failing_tf() {
  const fs::path root = fresh_dir("warden_verify_test");
  write_sil001(root / "tf");
  write_file(root / "a.py", "try:\n    go()\nexcept KeyError:\n    pass\n");
  auto build = load_fixture_registry(root);
  warden::RunContext ctx(root.string(), test_config());
  warden::WaiverLedger ledger("");
  warden::VerifyOptions opts;
  opts.run_checks = false;
  opts.waive_failures = true;
  opts.ledger = &ledger;
  opts.context = "42";
  opts.now = 1000;
  clear_issues();
  // The finding is still present: no_findings fails for SIL-001.
  auto report = warden::verify(ctx, build.registry, {"SIL-001"}, {"a.py"}, opts);
  expect(report.suite_ok() && !report.tfs_ok(), "TF predicate fails, suite clean");
  expect(report.waivers_recorded.size() == 1 && report.waivers_recorded[0].tf_id == "SIL-001",
         "waiver recorded for failing TF");
  expect(report.waivers_recorded[0].expires_unix == 1000 + 14 * 86400, "waiver expires after ttl");
  expect(report.waivers_recorded[0].scope == "a.py", "waiver pinned to the failing file");
  expect(ledger.entry_count() == 1, "ledger appended");
  expect(saw_issue(warden::ErrorCode::verify_fail), "verify_fail reported");

  // Only findings the applied patches targeted count against the TF.
  opts.applied_finding_ids = {"finding-from-another-patch"};
  auto targeted = warden::verify(ctx, build.registry, {"SIL-001"}, {"a.py"}, opts);
  expect(targeted.ok() && targeted.waivers_recorded.empty(), "untargeted finding does not fail the TF");

  opts.applied_finding_ids.clear();
  opts.waive_failures = false;
  auto strict = warden::verify(ctx, build.registry, {"SIL-001"}, {"a.py"}, opts);
  expect(!strict.tfs_ok() && strict.waivers_recorded.empty(), "no waiver unless asked");
  expect(ledger.entry_count() == 1, "ledger unchanged");
  fs::remove_all(root);
}

// ============================================================================
// Waivers
// ============================================================================

void test_waiver_document_warnings() {
  const std::string doc =
      "# Waivers\n"
      "stray text\n"
      "- tf_id: LOG-010\n"
      "  scope: pkg/log.py\n"
      "  expires: 2030-01-31\n"
      "  rationale: CLI shim prints\n"
      "  until the logger lands\n"
      "  owner: someone\n"
      "- tf_id: bad id\n"
      "  scope: x\n"
      "- tf_id: SIL-002\n"
      "  expires: 2030-02-30\n";
  auto parsed = warden::parse_waiver_document(doc, "42", "docs/PR-42.md");
  expect(parsed.waivers.size() == 1, "one usable waiver");
  const auto& w = parsed.waivers[0];
  expect(w.tf_id == "LOG-010" && w.scope == "pkg/log.py" && w.context == "42", "waiver fields");
  expect(w.rationale == "CLI shim prints until the logger lands", "continuation joins rationale");
  expect(w.expires_unix == *warden::parse_iso_date("2030-01-31") + 86400, "expiry inclusive of the day");
  expect(parsed.warnings.size() == 4, "four warnings");
  expect(parsed.warnings[0].rfind("line 2:", 0) == 0 && parsed.warnings[1].rfind("line 8:", 0) == 0 &&
             parsed.warnings[2].rfind("line 9:", 0) == 0 && parsed.warnings[3].rfind("line 12:", 0) == 0,
         "warnings carry line numbers");
}

void test_waiver_activity() {
  warden::Waiver w;
  w.tf_id = "X-001";
  w.scope = "pkg/**";
  w.context = "42";
  w.expires_unix = 500;
  warden::ChangeContext ctx{"42", {}};
  expect(warden::waiver_is_active(w, ctx, 100), "active before expiry");
  expect(!warden::waiver_is_active(w, ctx, 600), "expired");
  expect(!warden::waiver_is_active(w, warden::ChangeContext{"7", {}}, 100), "other context");
  expect(warden::scope_matches("*", "any/file.py") && warden::scope_matches("pkg/**", "pkg/a/b.py"),
         "scope globs");
  expect(!warden::scope_matches("pkg/**", "lib/a.py"), "scope excludes");
}

void test_ledger_chain_integrity() {
  const fs::path dir = fresh_dir("warden_ledger_test");
  const std::string path = (dir / "waivers.ndjson").string();
  {
    warden::WaiverLedger ledger(path);
    warden::Waiver w;
    w.tf_id = "X-001";
    w.rationale = "first";
    w.recorded_unix = 10;
    expect(ledger.record(w), "first record");
    w.rationale = "second";
    expect(ledger.record(w), "second record");
  }
  warden::WaiverLedger reopened(path);
  expect(reopened.entry_count() == 2 && reopened.load_error().empty(), "records reload");
  std::string error;
  expect(reopened.verify_chain(&error), "chain verifies: " + error);

  std::string text = read_text(path);
  text.replace(text.find("first"), 5, "FIRST");
  write_file(path, text);
  warden::WaiverLedger tampered(path);
  expect(!tampered.verify_chain(&error), "tampering breaks the chain");
  fs::remove_all(dir);
}

// ============================================================================
// Gate
// ============================================================================

struct GateFixture {
  fs::path root;
  warden::RegistryBuild build;
  std::vector<warden::Finding> findings;
};

GateFixture x001_failing_tree(const std::string& name) {
  GateFixture fx;
  fx.root = fresh_dir(name);
  write_x001(fx.root / "tf");
  write_file(fx.root / "app.py",
             "def load(raw):\n"
             "    try:\n"
             "        return int(raw)\n"
             "    except Exception:\n"
             "        return 0\n");
  fx.build = load_fixture_registry(fx.root);
  warden::RunContext ctx(fx.root.string(), test_config());
  fx.findings = warden::scan(ctx, fx.build.registry).findings;
  return fx;
}

void test_gate_fails_on_remaining_finding() {
  auto fx = x001_failing_tree("warden_gate_fail_test");
  expect(fx.findings.size() == 1 && fx.findings[0].tf_id == "X-001", "one X-001 finding");
  auto d = warden::evaluate(fx.findings, {"app.py"}, {}, warden::PrecedenceConfig{}, "42", 0);
  expect(!d.pass && d.remaining == 1, "gate fails with one remaining");
  expect(warden::gate_report_json(d).find("\"pass\":false") != std::string::npos, "report says fail");
  fs::remove_all(fx.root);
}

void test_gate_passes_with_waiver() {
  auto fx = x001_failing_tree("warden_gate_waiver_test");
  warden::Waiver w;
  w.tf_id = "X-001";
  w.context = "42";
  w.rationale = "legacy loader";
  auto d = warden::evaluate(fx.findings, {"app.py"}, {w}, warden::PrecedenceConfig{}, "42", 0);
  expect(d.pass && d.remaining == 0 && d.waived == 1, "waiver clears the gate");

  warden::Waiver narrow = w;
  narrow.scope = "lib/**";
  auto miss = warden::evaluate(fx.findings, {"app.py"}, {narrow}, warden::PrecedenceConfig{}, "42", 0);
  expect(!miss.pass, "waiver scoped elsewhere does not apply");
  fs::remove_all(fx.root);
}

void test_gate_footprint_and_tiers() {
  auto fx = x001_failing_tree("warden_gate_footprint_test");
  auto outside = warden::evaluate(fx.findings, {"other.py"}, {}, warden::PrecedenceConfig{}, "42", 0);
  expect(outside.pass && outside.in_footprint == 0, "finding outside changed files ignored");
  auto none = warden::evaluate(fx.findings, {}, {}, warden::PrecedenceConfig{}, "42", 0);
  expect(none.pass, "empty change set gates nothing");

  warden::PrecedenceConfig tier2;
  tier2.gating_tiers = {2};
  expect(warden::evaluate(fx.findings, {"app.py"}, {}, tier2, "42", 0).pass, "tier 1 finding not gated by tier 2");
  warden::PrecedenceConfig by_id;
  by_id.gating_tiers = {};
  by_id.gate_tf_ids = {"X-001"};
  expect(!warden::evaluate(fx.findings, {"./app.py"}, {}, by_id, "42", 0).pass, "gate by TF id, path normalized");
  fs::remove_all(fx.root);
}

void test_gate_monotonic_in_waivers() {
  std::vector<warden::Finding> findings;
  for (int i = 0; i < 3; ++i) {
    warden::Finding f;
    f.tf_id = i == 2 ? "LOG-010" : "X-00" + std::to_string(i + 1);
    f.tier = i == 2 ? 3 : 1;
    f.file = "m" + std::to_string(i) + ".py";
    f.span = warden::Span{1, 0, 1, 4};
    f.id = warden::finding_id(f.tf_id, f.file, f.span);
    findings.push_back(f);
  }
  const std::vector<std::string> changed{"m0.py", "m1.py", "m2.py"};
  warden::Waiver w1;
  w1.tf_id = "X-001";
  warden::Waiver w2;
  w2.tf_id = "X-002";
  const std::vector<std::vector<warden::Waiver>> growing{{}, {w1}, {w1, w2}};
  std::size_t last = findings.size() + 1;
  for (const auto& set : growing) {
    auto d = warden::evaluate(findings, changed, set, warden::PrecedenceConfig{}, "*", 0);
    expect(d.remaining <= last, "adding waivers never adds remaining findings");
    last = d.remaining;
  }
  expect(last == 0, "all gated findings waived");

  // Removing findings never turns a pass into a fail.
  auto full = warden::evaluate(findings, changed, {w1, w2}, warden::PrecedenceConfig{}, "*", 0);
  std::vector<warden::Finding> fewer(findings.begin(), findings.begin() + 1);
  auto reduced = warden::evaluate(fewer, changed, {w1, w2}, warden::PrecedenceConfig{}, "*", 0);
  expect(full.pass && reduced.pass, "fewer findings still pass");
}

void test_changed_files_parse() {
  auto files = warden::parse_changed_files("b.py\n./a.py\n\n  b.py  \n");
  expect(files == (std::vector<std::string>{"a.py", "b.py"}), "normalized, sorted, unique");
}

// ============================================================================
// Agent bridge
// ============================================================================

void test_emit_one_packet() {
  const fs::path root = fresh_dir("warden_emit_test");
  write_x001(root / "tf");
  write_file(root / "svc.py", kAmbiguousHandler);
  auto build = load_fixture_registry(root);
  warden::RunContext ctx(root.string(), test_config());
  auto proposals = warden::propose_all(ctx, build.registry, warden::scan(ctx, build.registry).findings);
  expect(proposals.patches.empty() && proposals.ambiguous.size() == 1, "one ambiguous finding");

  const fs::path out = root / ".warden" / "tasks";
  write_file(out / "task_009_OLD-001.json", "{}\n");
  auto emitted = warden::emit_tasks(ctx, build.registry, proposals.ambiguous, out.string());
  expect(emitted.ok() && emitted.packets.size() == 1, "exactly one packet");
  expect(fs::exists(out / "task_001_X-001.json"), "packet file named by sequence and TF");
  expect(!fs::exists(out / "task_009_OLD-001.json"), "stale packet removed");

  std::optional<warden::jsonlite::JsonError> err;
  auto packet = warden::jsonlite::parse(read_text(out / "task_001_X-001.json"), &err);
  expect(!err, "packet is JSON");
  expect(warden::jsonlite::get_string(packet, "tf_id", "") == "X-001", "packet tf_id");
  expect(warden::jsonlite::get_u64(packet, "line", 0) == 3, "packet line");
  expect(warden::jsonlite::get_string(packet, "decision_rule", "").rfind("require_hints", 0) == 0,
         "packet carries the decision rule");
  expect(warden::jsonlite::get_string(packet, "base_digest", "") == warden::content_digest(kAmbiguousHandler),
         "packet base digest");
  fs::remove_all(root);
}

void test_ingest_accept_noop_waive() {
  const fs::path root = fresh_dir("warden_ingest_test");
  write_x001(root / "tf");
  write_file(root / "svc.py", kAmbiguousHandler);
  auto build = load_fixture_registry(root);
  warden::RunContext ctx(root.string(), test_config());
  warden::WaiverLedger ledger("");
  warden::IngestOptions opts;
  opts.verify.run_checks = false;
  opts.ledger = &ledger;
  opts.context = "42";

  const warden::IngestDiff fix{"X-001-fix.diff",
                               "--- a/svc.py\n"
                               "+++ b/svc.py\n"
                               "@@ -1,4 +1,4 @@\n"
                               " try:\n"
                               "     x = 1\n"
                               "-except:\n"
                               "+except ValueError:\n"
                               "     x = 2\n"};
  clear_issues();
  auto accepted = warden::ingest(ctx, build.registry, {fix}, opts);
  expect(accepted.accepted == 1 && accepted.items[0].status == warden::IngestStatus::accepted, "fix accepted");
  expect(read_text(root / "svc.py").find("except ValueError:") != std::string::npos, "fix applied to tree");

  auto repeat = warden::ingest(ctx, build.registry, {fix}, opts);
  expect(repeat.unchanged == 1, "same diff again is a no-op");

  const warden::IngestDiff breaks{"X-001-break.diff",
                                  "--- a/svc.py\n"
                                  "+++ b/svc.py\n"
                                  "@@ -3,2 +3,2 @@\n"
                                  " except ValueError:\n"
                                  "-    x = 2\n"
                                  "+    x = (\n"};
  auto waived = warden::ingest(ctx, build.registry, {breaks}, opts);
  expect(waived.waived == 1 && waived.items[0].status == warden::IngestStatus::waived, "failing diff waived");
  expect(waived.items[0].reason.find("isolation") != std::string::npos, "failure happened in isolation");
  expect(ledger.entry_count() == 1 && ledger.all()[0].tf_id == "X-001" && ledger.all()[0].scope == "svc.py",
         "waiver scoped to the file");
  expect(read_text(root / "svc.py").find("x = (") == std::string::npos, "tree untouched by failing diff");

  const warden::IngestDiff anonymous{"agent.diff", breaks.text};
  auto rejected = warden::ingest(ctx, build.registry, {anonymous}, opts);
  expect(rejected.rejected == 1, "diff without a TF is rejected");
  expect(saw_issue(warden::ErrorCode::diff_parse_error), "rejection reported");
  fs::remove_all(root);
}

void test_ingest_rejects_paths_outside_tree() {
  const fs::path root = fresh_dir("warden_ingest_escape_test");
  const fs::path outside = fresh_dir("warden_ingest_escape_outside");
  write_x001(root / "tf");
  write_file(root / "svc.py", kAmbiguousHandler);
  auto build = load_fixture_registry(root);
  warden::RunContext ctx(root.string(), test_config());
  warden::IngestOptions opts;
  opts.verify.run_checks = false;

  const warden::IngestDiff climb{"X-001-climb.diff",
                                 "--- /dev/null\n"
                                 "+++ b/../warden_ingest_escape_outside/escaped.py\n"
                                 "@@ -0,0 +1,1 @@\n"
                                 "+x = 1\n"};
  const warden::IngestDiff absolute{"X-001-absolute.diff",
                                    "--- /dev/null\n"
                                    "+++ " + (outside / "absolute.py").string() + "\n"
                                    "@@ -0,0 +1,1 @@\n"
                                    "+x = 1\n"};
  expect(!warden::parse_unified_diff(climb.text).ok(), "parent path refused by the parser");
  clear_issues();
  auto result = warden::ingest(ctx, build.registry, {climb, absolute}, opts);
  expect(result.accepted == 0 && result.rejected == 2, "both diffs rejected");
  expect(result.items[0].reason.find("escapes the tree") != std::string::npos &&
             result.items[1].reason.find("escapes the tree") != std::string::npos,
         "reason names the escape");
  expect(!fs::exists(outside / "escaped.py") && !fs::exists(outside / "absolute.py"),
         "nothing written outside the root");
  expect(saw_issue(warden::ErrorCode::diff_parse_error), "rejection reported");
  fs::remove_all(root);
  fs::remove_all(outside);
}

// ============================================================================
// Pipeline
// ============================================================================

void test_pipeline_gate_failure_exit_1() {
  const fs::path root = fresh_dir("warden_pipeline_gate_test");
  write_x001(root / "tf");
  write_file(root / "svc.py", kAmbiguousHandler);
  warden::RunContext ctx(root.string(), test_config());
  warden::PipelineOptions opts;
  opts.context = "42";
  opts.changed_files = {"svc.py"};
  clear_issues();
  auto report = warden::run_pipeline(ctx, opts);
  expect(report.exit_code() == 1, "remaining tier 1 finding fails the gate");
  expect(report.emitted.packets.size() == 1, "ambiguous finding emitted");
  expect(fs::exists(root / ".warden" / "findings.jsonl"), "findings written");
  expect(fs::exists(root / ".warden" / "tasks" / "task_001_X-001.json"), "task packet written");

  // A waiver document for the change context clears it.
  write_file(root / "docs" / "agents" / "waivers" / "PR-42.md",
             "# Waivers\n- tf_id: X-001\n  scope: svc.py\n  rationale: reviewed\n");
  ctx.clear();
  expect(warden::run_pipeline(ctx, opts).exit_code() == 0, "documented waiver passes the gate");
  fs::remove_all(root);
}

void test_pipeline_registry_fatal_exit_3() {
  const fs::path root = fresh_dir("warden_pipeline_fatal_test");
  write_file(root / "a.py", "x = 1\n");
  warden::EngineConfig cfg = test_config();
  cfg.tf_dir = "missing";
  warden::RunContext ctx(root.string(), cfg);
  clear_issues();
  auto report = warden::run_pipeline(ctx, warden::PipelineOptions{});
  expect(report.exit_code() == 3 && report.registry_fatal, "missing TF dir exits 3");
  expect(report.stages.size() == 1, "nothing runs after a fatal registry");
  fs::remove_all(root);
}

void test_pipeline_fix_and_verify() {
  const fs::path root = fresh_dir("warden_pipeline_fix_test");
  write_sil001(root / "tf");
  write_file(root / "quiet.py", "try:\n    go()\nexcept KeyError:\n    pass\n");
  warden::PipelineOptions opts;
  opts.changed_files = {"quiet.py"};
  {
    warden::RunContext ctx(root.string(), test_config());
    g_stages.clear();
    warden::set_stage_event_hook(capture_stage);
    auto report = warden::run_pipeline(ctx, opts);
    warden::set_stage_event_hook(nullptr);
    expect(report.exit_code() == 0, "auto fix passes the gate");
    expect(report.applied.patches_applied == 1 && report.final_scan.findings.empty(), "fixed and re-scanned");
    expect(report.verification.has_value() && report.verification->ok(), "verification ran clean");
    expect(read_text(root / "quiet.py") == "try:\n    go()\nexcept KeyError:\n    raise\n", "reraise applied");
    expect(fs::exists(root / ".warden" / "last-apply.json"), "apply journal written");
    const std::vector<std::string> want{"registry", "scan", "propose", "apply", "verify",
                                        "rescan", "findings", "emit", "gate"};
    expect(g_stages == want, "stage events in order");
  }

  // Second run: fixed point, nothing to do.
  warden::RunContext ctx(root.string(), test_config());
  auto second = warden::run_pipeline(ctx, opts);
  expect(second.proposals.patches.empty() && second.exit_code() == 0, "second run is a no-op");
  fs::remove_all(root);
}

void test_pipeline_suite_failure_exit_4() {
  const fs::path root = fresh_dir("warden_pipeline_suite_test");
  write_sil001(root / "tf");
  write_file(root / "quiet.py", "try:\n    go()\nexcept KeyError:\n    pass\n");
  warden::EngineConfig cfg = test_config();
  cfg.checks = {warden::CheckSpec{"always-red", {"false"}, 0}};
  warden::RunContext ctx(root.string(), cfg);
  warden::PipelineOptions opts;
  opts.changed_files = {"quiet.py"};
  clear_issues();
  auto report = warden::run_pipeline(ctx, opts);
  expect(report.exit_code() == 4, "failing check suite exits 4");
  expect(report.gate.pass, "gate itself passed");
  expect(saw_issue(warden::ErrorCode::verify_fail), "verify_fail reported");
  expect(warden::pipeline_report_to_json(report).find("\"verify_timeout\":false") != std::string::npos,
         "plain failure is not a timeout");
  fs::remove_all(root);
}

void test_pipeline_check_timeout_reported() {
  const fs::path root = fresh_dir("warden_pipeline_timeout_test");
  write_sil001(root / "tf");
  write_file(root / "quiet.py", "try:\n    go()\nexcept KeyError:\n    pass\n");
  warden::EngineConfig cfg = test_config();
  cfg.checks = {warden::CheckSpec{"slow", {"sleep", "5"}, 200}};
  warden::RunContext ctx(root.string(), cfg);
  warden::PipelineOptions opts;
  opts.changed_files = {"quiet.py"};
  clear_issues();
  auto report = warden::run_pipeline(ctx, opts);
  expect(report.exit_code() == 4, "timed out check exits 4");
  expect(report.verification.has_value() && report.verification->any_timeout(), "timeout recorded");
  expect(warden::pipeline_report_to_json(report).find("\"verify_timeout\":true") != std::string::npos,
         "report tells a timeout apart");
  fs::remove_all(root);
}

// One handler the exception map can narrow, one it cannot.
const char* kHintedAndBlanket =
    "def a(raw):\n"
    "    try:\n"
    "        return int(raw)\n"
    "    except Exception:\n"
    "        return 0\n"
    "\n"
    "\n"
    "def b():\n"
    "    try:\n"
    "        go()\n"
    "    except Exception:\n"
    "        return None\n";

void test_pipeline_partial_fix_keeps_gate() {
  const fs::path root = fresh_dir("warden_pipeline_partial_test");
  write_x001(root / "tf");
  write_file(root / "svc.py", kHintedAndBlanket);
  warden::RunContext ctx(root.string(), test_config());
  warden::PipelineOptions opts;
  opts.context = "42";
  opts.changed_files = {"svc.py"};
  clear_issues();
  auto report = warden::run_pipeline(ctx, opts);
  expect(report.applied.patches_applied == 1, "hinted handler narrowed");
  expect(read_text(root / "svc.py").find("    except ValueError:\n        return 0") != std::string::npos,
         "narrowed in place");
  expect(report.verification.has_value() && report.verification->ok(),
         "the untouched handler does not fail verification");
  expect(report.gate.remaining == 1 && report.exit_code() == 1, "blanket handler still fails the gate");
  const std::string ledger_path = ctx.absolute(ctx.config().ledger_path);
  expect(warden::WaiverLedger(ledger_path).entry_count() == 0, "no waiver recorded");

  // Opting in to waivers does not clear a gate that verification never failed.
  write_file(root / "svc.py", kHintedAndBlanket);
  ctx.clear();
  opts.waive_verify_failures = true;
  auto again = warden::run_pipeline(ctx, opts);
  expect(again.exit_code() == 1 && again.verification.has_value() && again.verification->waivers_recorded.empty(),
         "still exits 1 with waivers allowed");
  expect(warden::WaiverLedger(ledger_path).entry_count() == 0, "ledger still empty");
  fs::remove_all(root);
}

// ============================================================================
// Observability
// ============================================================================

void test_stats_and_events() {
  auto& stats = warden::global_engine_stats();
  const auto before = stats.issue_count(warden::ErrorCode::config_invalid);
  warden::report_issue(warden::ErrorCode::config_invalid, "", "warden.config.json", "test");
  expect(stats.issue_count(warden::ErrorCode::config_invalid) == before + 1, "issue counted by code");

  const auto runs = stats.stage_runs.load();
  warden::StageEvent ev;
  ev.stage = "scan";
  ev.ok = false;
  ev.error_code = "detector_failure";
  ev.counts["files"] = 3;
  warden::emit_stage_event(ev);
  expect(stats.stage_runs.load() == runs + 1, "stage run counted");

  std::optional<warden::jsonlite::JsonError> err;
  auto parsed = warden::jsonlite::parse(warden::stage_event_to_json(ev), &err);
  expect(!err && warden::jsonlite::get_string(parsed, "stage", "") == "scan", "event JSON");
  warden::jsonlite::parse(stats.to_json(), &err);
  expect(!err, "stats JSON parses");
}

void test_footprint_globs() {
  const std::vector<std::string> fp{"**/*.py", "!**/tests/fixtures/**"};
  expect(warden::footprint_match(fp, "a.py"), "root file matches **/");
  expect(warden::footprint_match(fp, "pkg/sub/a.py"), "nested file matches");
  expect(!warden::footprint_match(fp, "pkg/tests/fixtures/a.py"), "exclusion wins");
  expect(!warden::footprint_match(fp, "a.txt"), "other extension");
}

}  // namespace

int main() {
  warden::set_issue_hook(capture_issue);

  std::cout << "\n[Hashing and JSON]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("hash domain separation", test_domain_separation);
  run_test("version manifest", test_version_manifest);
  run_test("jsonlite sorted output", test_jsonlite_sorted_output);
  run_test("jsonlite rejects duplicates", test_jsonlite_rejects_duplicates);

  std::cout << "\n[Outline]\n";
  run_test("logical lines across brackets", test_outline_logical_lines);
  run_test("masking keeps offsets", test_outline_masks_strings_and_comments);
  run_test("structural errors", test_outline_errors);
  run_test("split/join round trip", test_split_join_round_trip);
  run_test("footprint globs", test_footprint_globs);

  std::cout << "\n[Registry and config]\n";
  run_test("missing TF dir is fatal", test_registry_missing_dir_fatal);
  run_test("violation names TF and field", test_registry_violation_names_tf_and_field);
  run_test("invalid active TF is fatal", test_registry_invalid_active_fatal);
  run_test("ask_if_hint needs tokens", test_registry_ask_if_hint_needs_tokens);
  run_test("shipped rules validate", test_shipped_rules_validate);
  run_test("config validation", test_config_validation);

  std::cout << "\n[Scanner]\n";
  run_test("every strategy detects", test_detect_each_strategy);
  run_test("detector failure skips the file", test_detector_failure_skips_file);
  run_test("raise chained from the handler", test_raise_without_cause_chained);
  run_test("unguarded json.loads", test_unguarded_json_loads);
  run_test("duplicated function bodies", test_duplicate_function_bodies);
  run_test("deterministic across worker counts", test_scan_determinism_across_workers);
  run_test("findings JSONL round trip", test_findings_jsonl_round_trip);

  std::cout << "\n[Proposer]\n";
  run_test("decision rules", test_decision_rules);
  run_test("resolved / ambiguous / rejected", test_proposer_three_valued);
  run_test("stale finding rejected", test_stale_finding_rejected);

  std::cout << "\n[Patches and apply]\n";
  run_test("patch stream render and parse", test_patch_render_and_parse);
  run_test("diff parse errors", test_diff_parse_errors);
  run_test("two patches on one file", test_apply_two_patches_one_file);
  run_test("overlap: lower TF id wins", test_apply_overlap_lower_tf_wins);
  run_test("content drift conflicts", test_apply_content_drift);
  run_test("deletion under drift", test_deletion_patch_under_drift);
  run_test("paths outside the root refused", test_apply_refuses_paths_outside_root);
  run_test("conflict reported, batch continues", test_apply_conflict_reported);
  run_test("atomic write", test_atomic_write_leaves_no_temp);
  run_test("dry run writes nothing", test_dry_run_writes_nothing);
  run_test("revert restores pre-images", test_revert_restores_pre_images);
  run_test("snapshot store integrity", test_snapshot_store_integrity);

  std::cout << "\n[Verifier]\n";
  run_test("process exit codes", test_process_exit_codes);
  run_test("timeout distinct from failure", test_check_timeout_distinct_from_failure);
  run_test("failing TF is waived", test_verify_waives_failing_tf);

  std::cout << "\n[Waivers]\n";
  run_test("waiver document warnings", test_waiver_document_warnings);
  run_test("waiver activity", test_waiver_activity);
  run_test("ledger chain integrity", test_ledger_chain_integrity);

  std::cout << "\n[Gate]\n";
  run_test("X-001 fails the gate", test_gate_fails_on_remaining_finding);
  run_test("X-001 waived passes", test_gate_passes_with_waiver);
  run_test("footprint and tiers", test_gate_footprint_and_tiers);
  run_test("monotonic in waivers", test_gate_monotonic_in_waivers);
  run_test("changed files list", test_changed_files_parse);

  std::cout << "\n[Agent bridge]\n";
  run_test("emit one packet", test_emit_one_packet);
  run_test("ingest accept / no-op / waive", test_ingest_accept_noop_waive);
  run_test("ingest refuses escaping paths", test_ingest_rejects_paths_outside_tree);

  std::cout << "\n[Pipeline]\n";
  run_test("gate failure exits 1", test_pipeline_gate_failure_exit_1);
  run_test("registry fatal exits 3", test_pipeline_registry_fatal_exit_3);
  run_test("fix, verify, fixed point", test_pipeline_fix_and_verify);
  run_test("suite failure exits 4", test_pipeline_suite_failure_exit_4);
  run_test("check timeout reported", test_pipeline_check_timeout_reported);
  run_test("partial fix keeps the gate", test_pipeline_partial_fix_keeps_gate);

  std::cout << "\n[Observability]\n";
  run_test("stats and events", test_stats_and_events);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
