#pragma once

// warden/registry.hpp - Task Function definitions, schema validation and the
// per-run registry.
//
// DESIGN:
//   A TF is data. Its detector is one alternative of DetectorParams, a closed
//   std::variant over strategy parameter structs; its transforms are drawn
//   from the closed TransformKind enum. The scanner and proposer interpret
//   these with std::visit / switch. There is no per-rule code path.
//
// INVARIANTS:
//   1. A Registry is immutable once built. Stages hold it by const reference.
//   2. Validation never stops at the first error: every document is checked
//      and every SchemaViolation collected.
//   3. An invalid TF is never executed. The build is fatal only when nothing
//      usable remains or when a TF that claims to be active is invalid.
//   4. active() is sorted by id so detector iteration order is stable.
//
// EXTENSION_POINT: new_strategy
//   Adding a strategy = new params struct appended to DetectorParams, a
//   matching Strategy enumerator (same position), a parser branch in
//   registry.cpp and a detector in detectors.cpp. The schema version
//   (version::TF_SCHEMA_VERSION) must be bumped when existing documents would
//   be read differently.

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <variant>
#include <vector>

namespace warden {

enum class TfStatus { active, stub, disabled };

// Order matches the DetectorParams alternatives.
enum class Strategy {
  pattern,
  broad_handler,
  silent_handler,
  call_keywords,
  mutable_default,
  long_block,
  syntax,
  raise_without_cause,
  unguarded_call,
  duplicate_block,
};

enum class TransformKind { regex_replace, narrow_handler, reraise, add_keywords, none_default, chain_cause };

enum class DecisionKind { auto_fix, ask, require_hints, ask_if_hint };

enum class VerifyPredicate { no_findings, parses };

std::string to_string(TfStatus s);
std::string to_string(Strategy s);
std::string to_string(TransformKind k);
std::string to_string(DecisionKind k);
std::string to_string(VerifyPredicate p);

std::optional<Strategy> parse_strategy(const std::string& s);
std::optional<TransformKind> parse_transform(const std::string& s);

// ---------------------------------------------------------------------------
// Strategy parameters
// ---------------------------------------------------------------------------
struct PatternParams {
  std::string pattern;
  std::string unless;                                // matched on raw text; empty = no exemption
  std::shared_ptr<const std::regex> compiled;
  std::shared_ptr<const std::regex> unless_compiled;
};

// exception_map: hint token -> exception name(s), comma separated.
// The token "<index>" stands for subscript access in the guarded body.
struct BroadHandlerParams {
  std::map<std::string, std::string> exception_map;
};

struct SilentHandlerParams {};

// required_keywords / flag_keywords are "name=value" items. A required item
// is satisfied when the call passes the name at all; a flag item becomes a
// hint when the call passes exactly that name=value.
struct CallKeywordsParams {
  std::vector<std::string> callees;
  std::vector<std::string> required_keywords;
  std::vector<std::string> flag_keywords;
};

struct MutableDefaultParams {};

struct LongBlockParams {
  std::uint64_t max_lines{100};
};

struct SyntaxParams {};

struct RaiseWithoutCauseParams {};

// A call to one of `callees` is guarded when an enclosing try body has a
// handler naming one of `handled_by` exactly as written.
struct UnguardedCallParams {
  std::vector<std::string> callees;
  std::vector<std::string> handled_by;
};

// Bodies are compared on masked text, so literals and comments do not count.
struct DuplicateBlockParams {
  std::uint64_t min_lines{5};
};

using DetectorParams = std::variant<PatternParams, BroadHandlerParams, SilentHandlerParams,
                                    CallKeywordsParams, MutableDefaultParams, LongBlockParams,
                                    SyntaxParams, RaiseWithoutCauseParams, UnguardedCallParams,
                                    DuplicateBlockParams>;

const std::map<std::string, std::string>& default_exception_map();

// ---------------------------------------------------------------------------
// Decision rule
// ---------------------------------------------------------------------------
struct DecisionRule {
  DecisionKind kind{DecisionKind::auto_fix};
  std::string text;
  std::vector<std::string> tokens;  // ask_if_hint only
};

// ---------------------------------------------------------------------------
// TfDefinition
// ---------------------------------------------------------------------------
struct TfDefinition {
  std::string id;
  std::string name;
  std::string source_file;                  // document file name within the TF dir
  TfStatus status{TfStatus::active};
  int tier{4};
  std::string severity;
  double confidence{1.0};
  std::vector<std::string> signals;
  std::vector<std::string> entities;
  std::vector<std::string> relations;
  std::vector<std::string> constraints;
  DetectorParams detector;
  std::vector<TransformKind> allowed_transforms;
  DecisionRule decision;
  std::vector<std::string> footprint;
  std::vector<VerifyPredicate> verify;
  std::string replacement;                  // regex_replace transform
  std::string message;                      // finding message; defaults to name
  std::string canonical;                    // canonical JSON of the source document

  Strategy strategy() const { return static_cast<Strategy>(detector.index()); }
  bool in_footprint(const std::string& rel_path) const;
  bool allows(TransformKind k) const;
};

struct SchemaViolation {
  std::string tf_id;                        // "<unknown>" when the id itself is unusable
  std::string file;
  std::string field;
  std::string reason;
};

// Result of validating one document.
struct TfParse {
  std::optional<TfDefinition> tf;           // set only when the document is valid
  std::string id;
  std::optional<TfStatus> status;           // unset when unreadable
};

TfParse tf_from_json(const std::string& text, const std::string& file,
                     std::vector<SchemaViolation>* violations);

// ---------------------------------------------------------------------------
// Registry
// ---------------------------------------------------------------------------
class Registry {
 public:
  Registry() = default;
  static Registry from_definitions(std::vector<TfDefinition> tfs);

  const std::vector<TfDefinition>& all() const { return tfs_; }
  std::vector<const TfDefinition*> active() const;
  const TfDefinition* find(const std::string& id) const;

  // "tfset:" digest over the canonical documents of the active TFs.
  std::string digest() const;

 private:
  std::vector<TfDefinition> tfs_;           // sorted by id
};

struct RegistryBuild {
  Registry registry;
  std::vector<SchemaViolation> violations;
  std::size_t documents{0};
  bool fatal{false};
  std::string fatal_reason;
};

// Load every *.json document of `dir`, in file-name order.
RegistryBuild load_registry(const std::string& dir);

std::string violation_to_json(const SchemaViolation& v);

}  // namespace warden
