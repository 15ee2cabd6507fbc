#include "warden/registry.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>

#include "warden/fsutil.hpp"
#include "warden/hash.hpp"
#include "warden/jsonlite.hpp"
#include "warden/observability.hpp"

namespace fs = std::filesystem;

namespace warden {

std::string to_string(TfStatus s) {
  switch (s) {
    case TfStatus::active:   return "active";
    case TfStatus::stub:     return "stub";
    case TfStatus::disabled: return "disabled";
  }
  return "unknown";
}

std::string to_string(Strategy s) {
  switch (s) {
    case Strategy::pattern:         return "pattern";
    case Strategy::broad_handler:   return "broad_handler";
    case Strategy::silent_handler:  return "silent_handler";
    case Strategy::call_keywords:   return "call_keywords";
    case Strategy::mutable_default: return "mutable_default";
    case Strategy::long_block:      return "long_block";
    case Strategy::syntax:          return "syntax";
    case Strategy::raise_without_cause: return "raise_without_cause";
    case Strategy::unguarded_call:  return "unguarded_call";
    case Strategy::duplicate_block: return "duplicate_block";
  }
  return "unknown";
}

std::string to_string(TransformKind k) {
  switch (k) {
    case TransformKind::regex_replace:  return "regex_replace";
    case TransformKind::narrow_handler: return "narrow_handler";
    case TransformKind::reraise:        return "reraise";
    case TransformKind::add_keywords:   return "add_keywords";
    case TransformKind::none_default:   return "none_default";
    case TransformKind::chain_cause:    return "chain_cause";
  }
  return "unknown";
}

std::string to_string(DecisionKind k) {
  switch (k) {
    case DecisionKind::auto_fix:      return "auto";
    case DecisionKind::ask:           return "ask";
    case DecisionKind::require_hints: return "require_hints";
    case DecisionKind::ask_if_hint:   return "ask_if_hint";
  }
  return "unknown";
}

std::string to_string(VerifyPredicate p) {
  switch (p) {
    case VerifyPredicate::no_findings: return "no_findings";
    case VerifyPredicate::parses:      return "parses";
  }
  return "unknown";
}

std::optional<Strategy> parse_strategy(const std::string& s) {
  static const std::map<std::string, Strategy> m = {
      {"pattern", Strategy::pattern},
      {"broad_handler", Strategy::broad_handler},
      {"silent_handler", Strategy::silent_handler},
      {"call_keywords", Strategy::call_keywords},
      {"mutable_default", Strategy::mutable_default},
      {"long_block", Strategy::long_block},
      {"syntax", Strategy::syntax},
      {"raise_without_cause", Strategy::raise_without_cause},
      {"unguarded_call", Strategy::unguarded_call},
      {"duplicate_block", Strategy::duplicate_block},
  };
  auto it = m.find(s);
  if (it == m.end()) return std::nullopt;
  return it->second;
}

std::optional<TransformKind> parse_transform(const std::string& s) {
  static const std::map<std::string, TransformKind> m = {
      {"regex_replace", TransformKind::regex_replace},
      {"narrow_handler", TransformKind::narrow_handler},
      {"reraise", TransformKind::reraise},
      {"add_keywords", TransformKind::add_keywords},
      {"none_default", TransformKind::none_default},
      {"chain_cause", TransformKind::chain_cause},
  };
  auto it = m.find(s);
  if (it == m.end()) return std::nullopt;
  return it->second;
}

const std::map<std::string, std::string>& default_exception_map() {
  static const std::map<std::string, std::string> m = {
      {"json.load", "json.JSONDecodeError"},
      {"open(", "OSError"},
      {"Path(", "OSError"},
      {"os.", "OSError"},
      {"shutil.", "OSError"},
      {"int(", "ValueError"},
      {"float(", "ValueError"},
      {"datetime.", "ValueError"},
      {"<index>", "KeyError, IndexError"},
      {"subprocess.", "subprocess.CalledProcessError"},
  };
  return m;
}

bool TfDefinition::in_footprint(const std::string& rel_path) const {
  return footprint_match(footprint, rel_path);
}

bool TfDefinition::allows(TransformKind k) const {
  return std::find(allowed_transforms.begin(), allowed_transforms.end(), k) !=
         allowed_transforms.end();
}

// ---------------------------------------------------------------------------
// Document validation
// ---------------------------------------------------------------------------

namespace {

using jsonlite::Object;
using jsonlite::Value;

struct Checker {
  std::string tf_id{"<unknown>"};
  std::string file;
  std::vector<SchemaViolation>* out{nullptr};
  bool ok{true};

  void fail(const std::string& field, const std::string& reason) {
    ok = false;
    if (out) out->push_back(SchemaViolation{tf_id, file, field, reason});
  }
};

const Object* require_object(const Object& doc, const std::string& key, Checker& ck) {
  auto it = doc.find(key);
  if (it == doc.end()) {
    ck.fail(key, "missing required field");
    return nullptr;
  }
  if (!jsonlite::is_object(it->second)) {
    ck.fail(key, "expected object");
    return nullptr;
  }
  return &std::get<Object>(it->second.v);
}

// Reads an array of strings. Absent: required -> violation, else empty.
std::vector<std::string> string_array(const Object& obj, const std::string& key,
                                      const std::string& field, bool required, Checker& ck) {
  std::vector<std::string> out;
  auto it = obj.find(key);
  if (it == obj.end()) {
    if (required) ck.fail(field, "missing required field");
    return out;
  }
  if (!jsonlite::is_array(it->second)) {
    ck.fail(field, "expected array of strings");
    return out;
  }
  for (const auto& item : std::get<jsonlite::Array>(it->second.v)) {
    if (!jsonlite::is_string(item)) {
      ck.fail(field, "expected array of strings");
      return {};
    }
    out.push_back(std::get<std::string>(item.v));
  }
  return out;
}

std::string required_string(const Object& obj, const std::string& key, const std::string& field,
                            Checker& ck) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    ck.fail(field, "missing required field");
    return {};
  }
  if (!jsonlite::is_string(it->second)) {
    ck.fail(field, "expected string");
    return {};
  }
  return std::get<std::string>(it->second.v);
}

std::shared_ptr<const std::regex> compile_regex(const std::string& pattern, const std::string& field,
                                                Checker& ck) {
  try {
    return std::make_shared<const std::regex>(pattern, std::regex::ECMAScript);
  } catch (const std::regex_error& e) {
    ck.fail(field, std::string("invalid regex: ") + e.what());
    return nullptr;
  }
}

bool is_keyword_item(const std::string& item) {
  const auto eq = item.find('=');
  if (eq == 0 || eq == std::string::npos || eq + 1 >= item.size()) return false;
  for (std::size_t i = 0; i < eq; ++i) {
    const char c = item[i];
    if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) return false;
  }
  return true;
}

std::optional<std::uint64_t> positive_integer(const Object& p, const std::string& key, bool required,
                                             Checker& ck) {
  auto it = p.find(key);
  if (it == p.end()) {
    if (required) ck.fail("params." + key, "missing required field");
    return std::nullopt;
  }
  if (!std::holds_alternative<std::uint64_t>(it->second.v) || std::get<std::uint64_t>(it->second.v) == 0) {
    ck.fail("params." + key, "expected positive integer");
    return std::nullopt;
  }
  return std::get<std::uint64_t>(it->second.v);
}

std::optional<DetectorParams> parse_params(Strategy strategy, const Object* params, Checker& ck) {
  static const Object kEmpty;
  const Object& p = params ? *params : kEmpty;

  switch (strategy) {
    case Strategy::pattern: {
      PatternParams out;
      out.pattern = required_string(p, "pattern", "params.pattern", ck);
      if (!out.pattern.empty()) out.compiled = compile_regex(out.pattern, "params.pattern", ck);
      auto it = p.find("unless");
      if (it != p.end()) {
        if (!jsonlite::is_string(it->second)) {
          ck.fail("params.unless", "expected string");
        } else {
          out.unless = std::get<std::string>(it->second.v);
          if (!out.unless.empty()) out.unless_compiled = compile_regex(out.unless, "params.unless", ck);
        }
      }
      return DetectorParams{std::move(out)};
    }
    case Strategy::broad_handler: {
      BroadHandlerParams out;
      auto it = p.find("exception_map");
      if (it == p.end()) {
        out.exception_map = default_exception_map();
      } else if (!jsonlite::is_object(it->second)) {
        ck.fail("params.exception_map", "expected object of strings");
      } else {
        for (const auto& [token, exc] : std::get<Object>(it->second.v)) {
          if (!jsonlite::is_string(exc) || std::get<std::string>(exc.v).empty()) {
            ck.fail("params.exception_map." + token, "expected non-empty string");
            continue;
          }
          out.exception_map[token] = std::get<std::string>(exc.v);
        }
      }
      return DetectorParams{std::move(out)};
    }
    case Strategy::silent_handler:
      return DetectorParams{SilentHandlerParams{}};
    case Strategy::call_keywords: {
      CallKeywordsParams out;
      out.callees = string_array(p, "callees", "params.callees", true, ck);
      out.required_keywords = string_array(p, "required_keywords", "params.required_keywords", true, ck);
      out.flag_keywords = string_array(p, "flag_keywords", "params.flag_keywords", false, ck);
      if (params && out.callees.empty() && p.contains("callees")) {
        ck.fail("params.callees", "must not be empty");
      }
      for (const auto& kw : out.required_keywords) {
        if (!is_keyword_item(kw)) ck.fail("params.required_keywords", "expected name=value, got '" + kw + "'");
      }
      for (const auto& kw : out.flag_keywords) {
        if (!is_keyword_item(kw)) ck.fail("params.flag_keywords", "expected name=value, got '" + kw + "'");
      }
      return DetectorParams{std::move(out)};
    }
    case Strategy::mutable_default:
      return DetectorParams{MutableDefaultParams{}};
    case Strategy::long_block: {
      LongBlockParams out;
      if (auto n = positive_integer(p, "max_lines", true, ck)) out.max_lines = *n;
      return DetectorParams{out};
    }
    case Strategy::syntax:
      return DetectorParams{SyntaxParams{}};
    case Strategy::raise_without_cause:
      return DetectorParams{RaiseWithoutCauseParams{}};
    case Strategy::unguarded_call: {
      UnguardedCallParams out;
      out.callees = string_array(p, "callees", "params.callees", true, ck);
      out.handled_by = string_array(p, "handled_by", "params.handled_by", true, ck);
      if (p.contains("callees") && out.callees.empty()) ck.fail("params.callees", "must not be empty");
      if (p.contains("handled_by") && out.handled_by.empty()) {
        ck.fail("params.handled_by", "must not be empty");
      }
      return DetectorParams{std::move(out)};
    }
    case Strategy::duplicate_block: {
      DuplicateBlockParams out;
      if (auto n = positive_integer(p, "min_lines", false, ck)) out.min_lines = *n;
      return DetectorParams{out};
    }
  }
  return std::nullopt;
}

}  // namespace

TfParse tf_from_json(const std::string& text, const std::string& file,
                     std::vector<SchemaViolation>* violations) {
  TfParse result;
  Checker ck;
  ck.file = file;
  ck.out = violations;

  std::optional<jsonlite::JsonError> err;
  const Object doc = jsonlite::parse(text, &err);
  if (err) {
    ck.fail("<document>", err->code + ": " + err->message);
    result.id = ck.tf_id;
    return result;
  }

  TfDefinition tf;
  tf.source_file = file;

  // id first: every later violation names it.
  static const std::regex kIdPattern("^[A-Z]+-[0-9]{3}$");
  auto id_it = doc.find("id");
  if (id_it == doc.end()) {
    ck.fail("id", "missing required field");
  } else if (!jsonlite::is_string(id_it->second)) {
    ck.fail("id", "expected string");
  } else {
    const std::string& id = std::get<std::string>(id_it->second.v);
    if (!std::regex_match(id, kIdPattern)) {
      ck.tf_id = id.empty() ? "<unknown>" : id;
      ck.fail("id", "must match [A-Z]+-[0-9]{3}");
    } else {
      ck.tf_id = id;
      tf.id = id;
    }
  }
  result.id = ck.tf_id;

  auto status_it = doc.find("status");
  if (status_it == doc.end()) {
    ck.fail("status", "missing required field");
  } else if (!jsonlite::is_string(status_it->second)) {
    ck.fail("status", "expected string");
  } else {
    const std::string& s = std::get<std::string>(status_it->second.v);
    if (s == "active") result.status = TfStatus::active;
    else if (s == "stub") result.status = TfStatus::stub;
    else if (s == "disabled") result.status = TfStatus::disabled;
    else ck.fail("status", "expected active|stub|disabled, got '" + s + "'");
    if (result.status) tf.status = *result.status;
  }

  tf.name = required_string(doc, "name", "name", ck);
  if (doc.contains("name") && jsonlite::is_string(doc.at("name")) && tf.name.empty()) {
    ck.fail("name", "must not be empty");
  }

  auto tier_it = doc.find("tier");
  if (tier_it == doc.end()) {
    ck.fail("tier", "missing required field");
  } else if (!std::holds_alternative<std::uint64_t>(tier_it->second.v) ||
             std::get<std::uint64_t>(tier_it->second.v) < static_cast<std::uint64_t>(kMinTier) ||
             std::get<std::uint64_t>(tier_it->second.v) > static_cast<std::uint64_t>(kMaxTier)) {
    ck.fail("tier", "expected integer 1..4");
  } else {
    tf.tier = static_cast<int>(std::get<std::uint64_t>(tier_it->second.v));
  }

  if (auto sev = doc.find("severity"); sev != doc.end() && jsonlite::is_string(sev->second)) {
    tf.severity = std::get<std::string>(sev->second.v);
  }

  std::optional<Strategy> strategy;
  if (const Object* detect = require_object(doc, "detect", ck)) {
    const std::string s = required_string(*detect, "strategy", "detect.strategy", ck);
    if (!s.empty()) {
      strategy = parse_strategy(s);
      if (!strategy) ck.fail("detect.strategy", "unknown strategy '" + s + "'");
    }
    tf.signals = string_array(*detect, "signals", "detect.signals", true, ck);
    if (auto it = detect->find("confidence"); it != detect->end()) {
      double c = -1.0;
      if (std::holds_alternative<double>(it->second.v)) c = std::get<double>(it->second.v);
      else if (std::holds_alternative<std::uint64_t>(it->second.v)) {
        c = static_cast<double>(std::get<std::uint64_t>(it->second.v));
      }
      if (c < 0.0 || c > 1.0) ck.fail("detect.confidence", "expected number in [0, 1]");
      else tf.confidence = c;
    }
  }

  if (const Object* onto = require_object(doc, "ontology", ck)) {
    tf.entities = string_array(*onto, "entities", "ontology.entities", true, ck);
    tf.relations = string_array(*onto, "relations", "ontology.relations", true, ck);
  }
  if (const Object* logic = require_object(doc, "logic", ck)) {
    tf.constraints = string_array(*logic, "constraints", "logic.constraints", true, ck);
  }

  for (const auto& t : string_array(doc, "allowed_transforms", "allowed_transforms", true, ck)) {
    auto kind = parse_transform(t);
    if (!kind) {
      ck.fail("allowed_transforms", "unknown transform '" + t + "'");
      continue;
    }
    if (!tf.allows(*kind)) tf.allowed_transforms.push_back(*kind);
  }

  if (const Object* rule = require_object(doc, "decision_rule", ck)) {
    const std::string kind = required_string(*rule, "kind", "decision_rule.kind", ck);
    if (kind == "auto") tf.decision.kind = DecisionKind::auto_fix;
    else if (kind == "ask") tf.decision.kind = DecisionKind::ask;
    else if (kind == "require_hints") tf.decision.kind = DecisionKind::require_hints;
    else if (kind == "ask_if_hint") tf.decision.kind = DecisionKind::ask_if_hint;
    else if (!kind.empty()) ck.fail("decision_rule.kind", "expected auto|ask|require_hints|ask_if_hint");
    tf.decision.text = required_string(*rule, "text", "decision_rule.text", ck);
    tf.decision.tokens = string_array(*rule, "tokens", "decision_rule.tokens",
                                      tf.decision.kind == DecisionKind::ask_if_hint, ck);
    if (tf.decision.kind == DecisionKind::ask_if_hint && rule->contains("tokens") &&
        tf.decision.tokens.empty()) {
      ck.fail("decision_rule.tokens", "ask_if_hint needs at least one token");
    }
  }

  tf.footprint = string_array(doc, "footprint", "footprint", true, ck);
  if (doc.contains("footprint") && tf.footprint.empty()) ck.fail("footprint", "must not be empty");

  for (const auto& v : string_array(doc, "verify", "verify", true, ck)) {
    if (v == "no_findings") tf.verify.push_back(VerifyPredicate::no_findings);
    else if (v == "parses") tf.verify.push_back(VerifyPredicate::parses);
    else ck.fail("verify", "unknown predicate '" + v + "'");
  }

  const Object* params = nullptr;
  if (auto it = doc.find("params"); it != doc.end()) {
    if (!jsonlite::is_object(it->second)) ck.fail("params", "expected object");
    else params = &std::get<Object>(it->second.v);
  }
  if (strategy) {
    if (auto parsed = parse_params(*strategy, params, ck)) tf.detector = std::move(*parsed);
  }
  if (params) {
    tf.message = jsonlite::get_string(*params, "message", "");
    if (tf.allows(TransformKind::regex_replace)) {
      tf.replacement = required_string(*params, "replacement", "params.replacement", ck);
    }
  } else if (tf.allows(TransformKind::regex_replace)) {
    ck.fail("params.replacement", "missing required field");
  }
  if (tf.message.empty()) tf.message = tf.name;

  if (!ck.ok) return result;

  std::optional<jsonlite::JsonError> canon_err;
  tf.canonical = jsonlite::canonicalize_json(text, &canon_err);
  result.tf = std::move(tf);
  return result;
}

// ---------------------------------------------------------------------------
// Registry
// ---------------------------------------------------------------------------

Registry Registry::from_definitions(std::vector<TfDefinition> tfs) {
  Registry r;
  r.tfs_ = std::move(tfs);
  std::sort(r.tfs_.begin(), r.tfs_.end(),
            [](const TfDefinition& a, const TfDefinition& b) { return a.id < b.id; });
  return r;
}

std::vector<const TfDefinition*> Registry::active() const {
  std::vector<const TfDefinition*> out;
  for (const auto& tf : tfs_) {
    if (tf.status == TfStatus::active) out.push_back(&tf);
  }
  return out;
}

const TfDefinition* Registry::find(const std::string& id) const {
  auto it = std::lower_bound(tfs_.begin(), tfs_.end(), id,
                             [](const TfDefinition& tf, const std::string& v) { return tf.id < v; });
  if (it == tfs_.end() || it->id != id) return nullptr;
  return &*it;
}

std::string Registry::digest() const {
  std::string payload;
  for (const auto* tf : active()) {
    payload += tf->canonical;
    payload += '\n';
  }
  return hash_domain("tfset:", payload);
}

std::string violation_to_json(const SchemaViolation& v) {
  jsonlite::Object o;
  o["tf_id"] = Value{v.tf_id};
  o["file"] = Value{v.file};
  o["field"] = Value{v.field};
  o["reason"] = Value{v.reason};
  return jsonlite::to_json(Value{o});
}

RegistryBuild load_registry(const std::string& dir) {
  RegistryBuild build;
  auto make_fatal = [&build, &dir](std::string reason) {
    build.fatal = true;
    build.fatal_reason = std::move(reason);
    report_issue(ErrorCode::registry_fatal, "", dir, build.fatal_reason);
    return build;
  };

  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return make_fatal("TF directory not found: " + dir);

  std::vector<std::string> files;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (entry.is_regular_file() && entry.path().extension() == ".json") {
      files.push_back(entry.path().filename().string());
    }
  }
  if (ec) return make_fatal("cannot list TF directory: " + ec.message());
  std::sort(files.begin(), files.end());
  build.documents = files.size();
  if (files.empty()) return make_fatal("no TF documents in " + dir);

  std::vector<TfDefinition> valid;
  std::map<std::string, std::string> seen;  // id -> file
  bool invalid_active = false;

  for (const auto& name : files) {
    std::string text;
    if (!read_file((fs::path(dir) / name).string(), &text)) {
      build.violations.push_back(SchemaViolation{"<unknown>", name, "<document>", "unreadable"});
      invalid_active = true;
      continue;
    }
    TfParse parsed = tf_from_json(text, name, &build.violations);
    if (parsed.tf) {
      auto it = seen.find(parsed.tf->id);
      if (it != seen.end()) {
        build.violations.push_back(
            SchemaViolation{parsed.tf->id, name, "id", "duplicate id, first defined in " + it->second});
        if (parsed.tf->status == TfStatus::active) invalid_active = true;
        continue;
      }
      seen.emplace(parsed.tf->id, name);
      valid.push_back(std::move(*parsed.tf));
      continue;
    }
    if (!parsed.status || *parsed.status == TfStatus::active) invalid_active = true;
  }

  for (const auto& v : build.violations) {
    report_issue(ErrorCode::schema_violation, v.tf_id, v.file, v.field + ": " + v.reason);
  }

  build.registry = Registry::from_definitions(std::move(valid));
  if (build.registry.all().empty()) return make_fatal("every TF document is invalid");
  if (invalid_active) return make_fatal("an active TF failed validation");
  return build;
}

}  // namespace warden
