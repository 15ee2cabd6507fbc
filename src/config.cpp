#include "warden/config.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <thread>

#include "warden/fsutil.hpp"
#include "warden/jsonlite.hpp"

namespace fs = std::filesystem;

namespace warden {

namespace {

const std::set<std::string>& known_keys() {
  static const std::set<std::string> keys = {
      "tf_dir", "state_dir", "findings_path", "patch_path", "tasks_dir", "ledger_path",
      "snapshot_dir", "journal_path", "waiver_doc_pattern", "snapshot_compression",
      "skip_dirs", "gating_tiers", "gate_tf_ids", "workers", "checks", "check_timeout_ms",
      "skip_checks", "agent_waiver_ttl_days", "version"};
  return keys;
}

void read_string(const jsonlite::Object& obj, const char* key, std::string& out,
                 std::vector<std::string>& errors) {
  auto it = obj.find(key);
  if (it == obj.end()) return;
  if (!jsonlite::is_string(it->second)) {
    errors.push_back(std::string(key) + ": expected string");
    return;
  }
  out = std::get<std::string>(it->second.v);
}

bool parse_u64(const char* text, std::uint64_t* out) {
  if (!text || !text[0]) return false;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(text, &end, 10);
  if (!end || *end != '\0') return false;
  *out = v;
  return true;
}

}  // namespace

void EngineConfig::apply_env() {
  if (const char* v = std::getenv("WARDEN_TF_DIR"); v && v[0]) tf_dir = v;
  if (const char* v = std::getenv("WARDEN_LEDGER"); v && v[0]) ledger_path = v;
  std::uint64_t n = 0;
  if (parse_u64(std::getenv("WARDEN_WORKERS"), &n)) workers = static_cast<std::size_t>(n);
  if (parse_u64(std::getenv("WARDEN_CHECK_TIMEOUT_MS"), &n)) check_timeout_ms = n;
  if (const char* v = std::getenv("WARDEN_SKIP_CHECKS"); v && std::string(v) == "1") skip_checks = true;
}

ConfigLoad parse_config(const std::string& json_text) {
  ConfigLoad r;
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(json_text, &err);
  if (err) {
    r.errors.push_back(err->code + ": " + err->message);
    return r;
  }

  for (const auto& [k, ignored] : obj) {
    if (!known_keys().contains(k)) r.warnings.push_back("unknown config key: " + k);
  }

  EngineConfig& c = r.config;
  read_string(obj, "tf_dir", c.tf_dir, r.errors);
  read_string(obj, "state_dir", c.state_dir, r.errors);
  read_string(obj, "findings_path", c.findings_path, r.errors);
  read_string(obj, "patch_path", c.patch_path, r.errors);
  read_string(obj, "tasks_dir", c.tasks_dir, r.errors);
  read_string(obj, "ledger_path", c.ledger_path, r.errors);
  read_string(obj, "snapshot_dir", c.snapshot_dir, r.errors);
  read_string(obj, "journal_path", c.journal_path, r.errors);
  read_string(obj, "waiver_doc_pattern", c.waiver_doc_pattern, r.errors);
  read_string(obj, "snapshot_compression", c.snapshot_compression, r.errors);

  if (c.snapshot_compression != "zstd" && c.snapshot_compression != "off") {
    r.errors.push_back("snapshot_compression: expected \"zstd\" or \"off\"");
  }
  if (c.waiver_doc_pattern.find("{context}") == std::string::npos) {
    r.warnings.push_back("waiver_doc_pattern has no {context} placeholder");
  }

  if (obj.contains("skip_dirs")) {
    if (!jsonlite::get_array(obj, "skip_dirs")) r.errors.push_back("skip_dirs: expected array of strings");
    else c.skip_dirs = jsonlite::get_string_array(obj, "skip_dirs");
  }
  if (obj.contains("gate_tf_ids")) {
    const auto ids = jsonlite::get_string_array(obj, "gate_tf_ids");
    c.gate_tf_ids = std::set<std::string>(ids.begin(), ids.end());
  }
  if (const auto* tiers = jsonlite::get_array(obj, "gating_tiers")) {
    c.gating_tiers.clear();
    for (const auto& t : *tiers) {
      if (!std::holds_alternative<std::uint64_t>(t.v) || std::get<std::uint64_t>(t.v) < 1 ||
          std::get<std::uint64_t>(t.v) > 4) {
        r.errors.push_back("gating_tiers: entries must be integers 1..4");
        continue;
      }
      c.gating_tiers.insert(static_cast<int>(std::get<std::uint64_t>(t.v)));
    }
    if (c.gating_tiers.empty()) r.warnings.push_back("gating_tiers is empty: the gate can never fail");
  } else if (obj.contains("gating_tiers")) {
    r.errors.push_back("gating_tiers: expected array");
  }

  c.workers = static_cast<std::size_t>(jsonlite::get_u64(obj, "workers", c.workers));
  c.check_timeout_ms = jsonlite::get_u64(obj, "check_timeout_ms", c.check_timeout_ms);
  c.skip_checks = jsonlite::get_bool(obj, "skip_checks", c.skip_checks);
  c.agent_waiver_ttl_days = static_cast<std::int64_t>(
      jsonlite::get_u64(obj, "agent_waiver_ttl_days", static_cast<unsigned long long>(c.agent_waiver_ttl_days)));

  if (const auto* checks = jsonlite::get_array(obj, "checks")) {
    for (const auto& item : *checks) {
      if (!jsonlite::is_object(item)) {
        r.errors.push_back("checks: entries must be objects");
        continue;
      }
      const auto& co = std::get<jsonlite::Object>(item.v);
      CheckSpec spec;
      spec.name = jsonlite::get_string(co, "name", "");
      spec.argv = jsonlite::get_string_array(co, "argv");
      spec.timeout_ms = jsonlite::get_u64(co, "timeout_ms", 0);
      if (spec.name.empty() || spec.argv.empty()) {
        r.errors.push_back("checks: each check needs a name and a non-empty argv");
        continue;
      }
      c.checks.push_back(std::move(spec));
    }
  } else if (obj.contains("checks")) {
    r.errors.push_back("checks: expected array");
  }
  return r;
}

ConfigLoad load_config(const std::string& root) {
  ConfigLoad r;
  const std::string path = (fs::path(root) / "warden.config.json").string();
  std::string text;
  if (read_file(path, &text)) {
    r = parse_config(text);
    for (auto& e : r.errors) e = "warden.config.json: " + e;
  }
  r.config.apply_env();
  return r;
}

std::string config_to_json(const EngineConfig& c) {
  jsonlite::Object o;
  o["tf_dir"] = jsonlite::Value{c.tf_dir};
  o["state_dir"] = jsonlite::Value{c.state_dir};
  o["findings_path"] = jsonlite::Value{c.findings_path};
  o["patch_path"] = jsonlite::Value{c.patch_path};
  o["tasks_dir"] = jsonlite::Value{c.tasks_dir};
  o["ledger_path"] = jsonlite::Value{c.ledger_path};
  o["snapshot_dir"] = jsonlite::Value{c.snapshot_dir};
  o["journal_path"] = jsonlite::Value{c.journal_path};
  o["waiver_doc_pattern"] = jsonlite::Value{c.waiver_doc_pattern};
  o["snapshot_compression"] = jsonlite::Value{c.snapshot_compression};
  jsonlite::Array skip;
  for (const auto& d : c.skip_dirs) skip.push_back(jsonlite::Value{d});
  o["skip_dirs"] = jsonlite::Value{skip};
  jsonlite::Array tiers;
  for (int t : c.gating_tiers) tiers.push_back(jsonlite::Value{static_cast<std::uint64_t>(t)});
  o["gating_tiers"] = jsonlite::Value{tiers};
  jsonlite::Array ids;
  for (const auto& id : c.gate_tf_ids) ids.push_back(jsonlite::Value{id});
  o["gate_tf_ids"] = jsonlite::Value{ids};
  o["workers"] = jsonlite::Value{static_cast<std::uint64_t>(c.workers)};
  o["check_timeout_ms"] = jsonlite::Value{c.check_timeout_ms};
  o["skip_checks"] = jsonlite::Value{c.skip_checks};
  o["agent_waiver_ttl_days"] = jsonlite::Value{static_cast<std::uint64_t>(c.agent_waiver_ttl_days)};
  jsonlite::Array checks;
  for (const auto& chk : c.checks) {
    jsonlite::Object co;
    co["name"] = jsonlite::Value{chk.name};
    jsonlite::Array argv;
    for (const auto& a : chk.argv) argv.push_back(jsonlite::Value{a});
    co["argv"] = jsonlite::Value{argv};
    co["timeout_ms"] = jsonlite::Value{chk.timeout_ms};
    checks.push_back(jsonlite::Value{co});
  }
  o["checks"] = jsonlite::Value{checks};
  return jsonlite::to_json(jsonlite::Value{o});
}

std::size_t effective_workers(const EngineConfig& config, std::size_t jobs) {
  std::size_t n = config.workers;
  if (n == 0) {
    n = std::max(1u, std::min(16u, std::thread::hardware_concurrency()));
  }
  return std::max<std::size_t>(1, std::min(n, jobs));
}

}  // namespace warden
