#include "warden/transforms.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

#include "warden/detectors.hpp"

namespace warden {

namespace {

TransformResult reject(std::string reason) {
  TransformResult r;
  r.rejection = std::move(reason);
  return r;
}

const char* kStale = "finding no longer matches file content";

std::string join(const std::vector<std::string>& items, const char* sep) {
  std::string out;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i) out += sep;
    out += items[i];
  }
  return out;
}

const LogicalLine* logical_for(const SourceFile& file, const Finding& f, std::size_t* index) {
  if (!file.outline || f.span.line == 0) return nullptr;
  auto idx = file.outline->logical_at(f.span.line - 1);
  if (!idx) return nullptr;
  if (index) *index = *idx;
  return &file.outline->logical[*idx];
}

std::vector<std::string> physical_lines(const SourceFile& file, std::size_t first, std::size_t last) {
  return {file.lines.begin() + static_cast<std::ptrdiff_t>(first),
          file.lines.begin() + static_cast<std::ptrdiff_t>(last) + 1};
}

// ---------------------------------------------------------------------------

TransformResult regex_replace(const TfDefinition& tf, const SourceFile& file, const Finding& f) {
  const auto* p = std::get_if<PatternParams>(&tf.detector);
  if (!p || !p->compiled) return reject("regex_replace needs a pattern detector");
  if (f.span.line == 0 || f.span.line > file.lines.size()) return reject(kStale);
  const std::string& line = file.lines[f.span.line - 1];
  if (f.span.col > line.size()) return reject(kStale);

  const std::string head = line.substr(0, f.span.col);
  const std::string tail = line.substr(f.span.col);
  const std::string replaced =
      std::regex_replace(tail, *p->compiled, tf.replacement,
                         std::regex_constants::format_first_only | std::regex_constants::match_continuous);
  if (replaced == tail) return reject("replacement produced no change");

  TransformResult r;
  r.hunks.push_back(Hunk{f.span.line, {line}, {head + replaced}});
  return r;
}

TransformResult narrow_handler(const TfDefinition& tf, const SourceFile& file, const Finding& f) {
  const auto* p = std::get_if<BroadHandlerParams>(&tf.detector);
  if (!p) return reject("narrow_handler needs a broad_handler detector");
  const LogicalLine* l = logical_for(file, f, nullptr);
  if (!l) return reject(kStale);
  auto header = parse_handler_header(*l);
  if (!header || !header->broad) return reject(kStale);
  if (l->first != l->last) return reject("multi-line handler header");

  std::set<std::string> caught;
  for (const auto& t : header->types) {
    if (t != "Exception" && t != "BaseException") caught.insert(t);
  }
  for (const auto& e : exceptions_for_hints(f.hints, p->exception_map)) caught.insert(e);
  if (caught.empty()) return reject("no specific exception inferred from hints");

  const std::vector<std::string> types(caught.begin(), caught.end());
  const std::string& line = file.lines[l->first];
  std::string rewritten = leading_ws(line) + "except ";
  rewritten += types.size() == 1 ? types[0] : "(" + join(types, ", ") + ")";
  if (!header->as_name.empty()) rewritten += " as " + header->as_name;
  rewritten += line.substr(l->colon);

  TransformResult r;
  r.hunks.push_back(Hunk{static_cast<std::uint32_t>(l->first + 1), {line}, {rewritten}});
  return r;
}

TransformResult reraise(const SourceFile& file, const Finding& f) {
  if (f.span.line == 0 || f.span.line > file.lines.size() || f.span.line != f.span.end_line) {
    return reject(kStale);
  }
  const std::string& line = file.lines[f.span.line - 1];
  if (f.span.end_col > line.size() || f.span.col >= f.span.end_col) return reject(kStale);
  const std::string word = line.substr(f.span.col, f.span.end_col - f.span.col);
  if (word != "pass" && word != "continue") return reject(kStale);

  TransformResult r;
  r.hunks.push_back(Hunk{f.span.line, {line},
                         {line.substr(0, f.span.col) + "raise" + line.substr(f.span.end_col)}});
  return r;
}

TransformResult add_keywords(const TfDefinition& tf, const SourceFile& file, const Finding& f) {
  const auto* p = std::get_if<CallKeywordsParams>(&tf.detector);
  if (!p) return reject("add_keywords needs a call_keywords detector");
  const LogicalLine* l = logical_for(file, f, nullptr);
  if (!l) return reject(kStale);
  const std::size_t at = SourceOutline::offset_of(*l, f.span.line - 1, f.span.col);
  if (at == std::string::npos) return reject(kStale);

  std::optional<CallSite> call;
  for (const auto& callee : p->callees) {
    for (auto& c : find_calls(*l, callee)) {
      if (c.callee_pos == at) call = std::move(c);
    }
  }
  if (!call || call->kwargs_splat) return reject(kStale);

  std::vector<std::string> missing;
  for (const auto& req : p->required_keywords) {
    if (!call->keyword_names.contains(keyword_name(req))) missing.push_back(trim(req));
  }
  if (missing.empty()) return reject("call already passes every required keyword");

  // Insert after the last code character before ')'. Comments are blank in
  // the masked text, so a trailing comment stays after the insertion.
  std::size_t k = call->close;
  while (k > call->open + 1 && std::isspace(static_cast<unsigned char>(l->masked[k - 1]))) --k;
  const char prev = l->masked[k - 1];
  std::string insertion;
  if (prev == '(') insertion = join(missing, ", ");
  else if (prev == ',') insertion = " " + join(missing, ", ") + ",";
  else insertion = ", " + join(missing, ", ");

  const auto [physical, col] = SourceOutline::position(*l, k);
  const std::string& line = file.lines[physical];
  TransformResult r;
  r.hunks.push_back(Hunk{static_cast<std::uint32_t>(physical + 1), {line},
                         {line.substr(0, col) + insertion + line.substr(col)}});
  return r;
}

TransformResult none_default(const SourceFile& file, const Finding& f) {
  std::size_t index = 0;
  const LogicalLine* l = logical_for(file, f, &index);
  if (!l) return reject(kStale);
  auto params = mutable_defaults(*l);
  if (params.empty()) return reject(kStale);
  const SourceOutline& outline = *file.outline;
  if (outline.has_inline_body(*l)) return reject("function body on the header line");
  if (l->body_end <= index + 1) return reject(kStale);

  std::string text = l->text;
  for (auto it = params.rbegin(); it != params.rend(); ++it) {
    text.replace(it->default_begin, it->default_end - it->default_begin, "None");
  }
  bool unused = false;
  Hunk header{static_cast<std::uint32_t>(l->first + 1), physical_lines(file, l->first, l->last),
              split_lines(text, &unused)};

  // Guards go before the first statement after an optional docstring.
  const LogicalLine& first = outline.logical[index + 1];
  const std::string body_indent = leading_ws(file.lines[first.first]);
  const std::string unit = body_indent.find('\t') != std::string::npos ? "\t" : "    ";
  std::vector<std::string> guards;
  for (const auto& d : params) {
    std::string ctor = d.constructor;
    if (ctor == "list()") ctor = "[]";
    else if (ctor == "dict()") ctor = "{}";
    guards.push_back(body_indent + "if " + d.name + " is None:");
    guards.push_back(body_indent + unit + d.name + " = " + ctor);
  }

  const std::string lead = trim(first.masked);
  const bool docstring = !lead.empty() && (lead[0] == '"' || lead[0] == '\'') &&
                         lead.find_first_not_of("\"' ") == std::string::npos;
  Hunk guard;
  if (docstring && l->body_end > index + 2) {
    const LogicalLine& anchor = outline.logical[index + 2];
    guard.start = static_cast<std::uint32_t>(anchor.first + 1);
    guard.old_lines = {file.lines[anchor.first]};
    guard.new_lines = guards;
    guard.new_lines.push_back(file.lines[anchor.first]);
  } else if (docstring) {
    guard.start = static_cast<std::uint32_t>(first.last + 1);
    guard.old_lines = {file.lines[first.last]};
    guard.new_lines = {file.lines[first.last]};
    guard.new_lines.insert(guard.new_lines.end(), guards.begin(), guards.end());
  } else {
    guard.start = static_cast<std::uint32_t>(first.first + 1);
    guard.old_lines = {file.lines[first.first]};
    guard.new_lines = guards;
    guard.new_lines.push_back(file.lines[first.first]);
  }

  TransformResult r;
  r.hunks.push_back(std::move(header));
  r.hunks.push_back(std::move(guard));
  return r;
}

TransformResult chain_cause(const SourceFile& file, const Finding& f) {
  std::size_t index = 0;
  const LogicalLine* l = logical_for(file, f, &index);
  if (!l) return reject(kStale);
  auto owner = enclosing_handler(*file.outline, index);
  if (!owner) return reject(kStale);
  auto header = parse_handler_header(file.outline->logical[*owner]);
  if (!header || header->as_name.empty()) return reject("handler binds no name to chain from");
  const std::size_t at = SourceOutline::offset_of(*l, f.span.line - 1, f.span.col);
  if (at == std::string::npos) return reject(kStale);
  auto r = parse_raise(*l, at);
  if (!r || r->keyword_pos != at || r->bare || r->has_cause) return reject(kStale);

  const auto [physical, col] = SourceOutline::position(*l, r->end);
  const std::string& line = file.lines[physical];
  TransformResult out;
  out.hunks.push_back(Hunk{static_cast<std::uint32_t>(physical + 1), {line},
                           {line.substr(0, col) + " from " + header->as_name + line.substr(col)}});
  return out;
}

}  // namespace

std::optional<TransformKind> compatible_transform(Strategy strategy) {
  switch (strategy) {
    case Strategy::pattern:         return TransformKind::regex_replace;
    case Strategy::broad_handler:   return TransformKind::narrow_handler;
    case Strategy::silent_handler:  return TransformKind::reraise;
    case Strategy::call_keywords:   return TransformKind::add_keywords;
    case Strategy::mutable_default: return TransformKind::none_default;
    case Strategy::raise_without_cause: return TransformKind::chain_cause;
    case Strategy::long_block:
    case Strategy::syntax:
    case Strategy::unguarded_call:
    case Strategy::duplicate_block:
      return std::nullopt;
  }
  return std::nullopt;
}

TransformResult apply_transform(TransformKind kind, const TfDefinition& tf, const SourceFile& file,
                                const Finding& finding) {
  if (!file.outline) return reject("file does not parse");
  TransformResult r;
  switch (kind) {
    case TransformKind::regex_replace:  r = regex_replace(tf, file, finding); break;
    case TransformKind::narrow_handler: r = narrow_handler(tf, file, finding); break;
    case TransformKind::reraise:        r = reraise(file, finding); break;
    case TransformKind::add_keywords:   r = add_keywords(tf, file, finding); break;
    case TransformKind::none_default:   r = none_default(file, finding); break;
    case TransformKind::chain_cause:    r = chain_cause(file, finding); break;
  }
  if (!r.ok()) return r;
  for (const auto& h : r.hunks) {
    if (h.old_lines != h.new_lines) return r;
  }
  return reject("transform produced no change");
}

}  // namespace warden
