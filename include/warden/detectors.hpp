#pragma once

// warden/detectors.hpp - The closed set of detection strategies.
//
// Every detector is a pure function of (TfDefinition, SourceFile). It reads
// the file's outline, never the filesystem, and never mutates shared state,
// so the scanner may run detectors for different files on different threads.
//
// The structural helpers below are shared with transforms.cpp: a transform
// re-derives the construct a finding points at from the current content
// instead of trusting positions computed on an older revision.

#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "warden/registry.hpp"
#include "warden/run_context.hpp"
#include "warden/types.hpp"

namespace warden {

struct DetectorOutput {
  std::vector<Finding> findings;
  std::optional<std::string> failure;   // set when the file was skipped
};

DetectorOutput run_detector(const TfDefinition& tf, const SourceFile& file);

// Code frame: span lines +/- 2, each prefixed by its 1-based line number.
std::string code_frame(const SourceFile& file, const Span& span);

// Span covering [begin, end) offsets of a logical line.
Span span_of(const LogicalLine& l, std::size_t begin, std::size_t end);

// ---------------------------------------------------------------------------
// Structural helpers
// ---------------------------------------------------------------------------

// "except" header: caught types as written, optional "as" binding.
struct HandlerHeader {
  std::size_t keyword_pos{0};           // offset of "except" in text
  std::vector<std::string> types;       // empty for a bare except
  std::string as_name;
  bool broad{false};                    // bare, Exception or BaseException
};

std::optional<HandlerHeader> parse_handler_header(const LogicalLine& l);

// Hint tokens of `exception_map` found in the body of the try statement that
// owns the except clause at `except_index`. Sorted, unique.
std::vector<std::string> try_body_hints(const SourceOutline& outline, std::size_t except_index,
                                        const std::map<std::string, std::string>& exception_map);

// Exceptions for a set of hints, sorted and unique.
std::vector<std::string> exceptions_for_hints(const std::vector<std::string>& hints,
                                              const std::map<std::string, std::string>& exception_map);

// Index of the except clause whose block holds the statement at `index`
// directly (not through a nested block). An except header with an inline
// body holds its own statement.
std::optional<std::size_t> enclosing_handler(const SourceOutline& outline, std::size_t index);

// "raise <expr>" statement starting at `from` in a logical line.
struct RaiseStatement {
  std::size_t keyword_pos{0};
  std::size_t end{0};                   // one past the last code character
  bool bare{false};                     // plain "raise"
  bool has_cause{false};                // top-level "from" clause present
};

std::optional<RaiseStatement> parse_raise(const LogicalLine& l, std::size_t from);

struct CallSite {
  std::size_t callee_pos{0};
  std::size_t open{0};                  // '(' offset
  std::size_t close{0};                 // ')' offset
  std::vector<std::pair<std::size_t, std::size_t>> args;
  std::set<std::string> keyword_names;
  std::set<std::string> keyword_items;  // "name=value" with whitespace removed
  bool kwargs_splat{false};             // "**kwargs" makes keywords unknowable
};

std::vector<CallSite> find_calls(const LogicalLine& l, const std::string& callee);

// Keyword name of a "name=value" item.
std::string keyword_name(const std::string& item);

struct DefaultParam {
  std::string name;
  std::size_t default_begin{0};         // offsets of the default expression in text
  std::size_t default_end{0};
  std::string constructor;              // "[]", "{}", "set()", "list()" or "dict()"
};

// Parameter list of a def header, npos when the header is not a def.
bool def_signature(const LogicalLine& l, std::size_t* keyword_pos, std::size_t* open, std::size_t* close);

std::vector<DefaultParam> mutable_defaults(const LogicalLine& l);

}  // namespace warden
