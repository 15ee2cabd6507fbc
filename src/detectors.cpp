#include "warden/detectors.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <regex>

#include "warden/finding.hpp"

namespace warden {

namespace {

bool ident_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::size_t first_non_ws(const std::string& s, std::size_t from = 0) {
  while (from < s.size() && std::isspace(static_cast<unsigned char>(s[from]))) ++from;
  return from;
}

std::string strip_ws(const std::string& s) {
  std::string out;
  for (char c : s) {
    if (!std::isspace(static_cast<unsigned char>(c))) out += c;
  }
  return out;
}

// Token occurrence in masked code. Identifier-led tokens must not be glued to
// a longer name on their left ("pos." is not "os.").
bool token_present(const std::string& body, const std::string& token) {
  if (token == "<index>") {
    static const std::regex kSubscript(R"([\w\)\]]\[)");
    return std::regex_search(body, kSubscript);
  }
  if (token.empty()) return false;
  const bool ident_led = ident_char(token[0]);
  for (std::size_t pos = body.find(token); pos != std::string::npos; pos = body.find(token, pos + 1)) {
    if (!ident_led || pos == 0) return true;
    const char prev = body[pos - 1];
    if (!ident_char(prev) && prev != '.') return true;
  }
  return false;
}

Finding make_finding(const TfDefinition& tf, const SourceFile& file, const Span& span,
                     std::string frame, std::vector<std::string> hints, std::string message) {
  Finding f;
  f.tf_id = tf.id;
  f.file = file.path;
  f.span = span;
  f.id = finding_id(tf.id, file.path, span);
  f.tier = tf.tier;
  f.confidence = tf.confidence;
  f.message = std::move(message);
  f.frame = std::move(frame);
  f.context = code_frame(file, span);
  f.hints = std::move(hints);
  return f;
}

std::string join(const std::vector<std::string>& items, const char* sep) {
  std::string out;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i) out += sep;
    out += items[i];
  }
  return out;
}

// ---------------------------------------------------------------------------
// Strategies
// ---------------------------------------------------------------------------

void detect_pattern(const TfDefinition& tf, const PatternParams& p, const SourceFile& file,
                    DetectorOutput& out) {
  if (!p.compiled) return;
  const SourceOutline& outline = *file.outline;
  for (std::size_t i = 0; i < outline.logical.size(); ++i) {
    const LogicalLine& l = outline.logical[i];
    if (p.unless_compiled && std::regex_search(l.text, *p.unless_compiled)) continue;
    auto begin = std::sregex_iterator(l.masked.begin(), l.masked.end(), *p.compiled);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
      const auto pos = static_cast<std::size_t>(it->position(0));
      const auto len = static_cast<std::size_t>(it->length(0));
      if (len == 0) continue;
      out.findings.push_back(make_finding(tf, file, span_of(l, pos, pos + len), outline.frame_for(i),
                                          {trim(it->str(0))}, tf.message));
    }
  }
}

void detect_broad_handler(const TfDefinition& tf, const BroadHandlerParams& p, const SourceFile& file,
                          DetectorOutput& out) {
  const SourceOutline& outline = *file.outline;
  for (std::size_t i = 0; i < outline.logical.size(); ++i) {
    const LogicalLine& l = outline.logical[i];
    auto header = parse_handler_header(l);
    if (!header || !header->broad) continue;
    auto hints = try_body_hints(outline, i, p.exception_map);
    std::string message = tf.message;
    if (header->types.empty()) message += " (bare except)";
    out.findings.push_back(make_finding(tf, file, span_of(l, header->keyword_pos, l.colon + 1),
                                        outline.frame_for(i), std::move(hints), std::move(message)));
  }
}

void detect_silent_handler(const TfDefinition& tf, const SourceFile& file, DetectorOutput& out) {
  const SourceOutline& outline = *file.outline;
  for (std::size_t i = 0; i < outline.logical.size(); ++i) {
    const LogicalLine& l = outline.logical[i];
    if (!parse_handler_header(l)) continue;

    const LogicalLine* stmt = &l;
    std::size_t from = l.colon + 1;
    if (!outline.has_inline_body(l)) {
      if (l.body_end != i + 2) continue;  // more than one statement
      stmt = &outline.logical[i + 1];
      from = 0;
    }
    const std::size_t begin = first_non_ws(stmt->masked, from);
    const std::string word = trim(stmt->masked.substr(begin));
    if (word != "pass" && word != "continue") continue;
    out.findings.push_back(make_finding(tf, file, span_of(*stmt, begin, begin + word.size()),
                                        outline.frame_for(i), {word}, tf.message));
  }
}

void detect_call_keywords(const TfDefinition& tf, const CallKeywordsParams& p, const SourceFile& file,
                          DetectorOutput& out) {
  const SourceOutline& outline = *file.outline;
  for (std::size_t i = 0; i < outline.logical.size(); ++i) {
    const LogicalLine& l = outline.logical[i];
    for (const auto& callee : p.callees) {
      for (const CallSite& call : find_calls(l, callee)) {
        if (call.kwargs_splat) continue;
        std::vector<std::string> missing;
        for (const auto& req : p.required_keywords) {
          const std::string name = keyword_name(req);
          if (!call.keyword_names.contains(name)) missing.push_back(name);
        }
        if (missing.empty()) continue;
        std::vector<std::string> hints;
        for (const auto& flag : p.flag_keywords) {
          if (call.keyword_items.contains(strip_ws(flag))) hints.push_back(strip_ws(flag));
        }
        std::sort(hints.begin(), hints.end());
        out.findings.push_back(make_finding(tf, file, span_of(l, call.callee_pos, call.close + 1),
                                            outline.frame_for(i), std::move(hints),
                                            tf.message + " (" + callee + " missing " + join(missing, ", ") + ")"));
      }
    }
  }
}

void detect_mutable_default(const TfDefinition& tf, const SourceFile& file, DetectorOutput& out) {
  const SourceOutline& outline = *file.outline;
  for (std::size_t i = 0; i < outline.logical.size(); ++i) {
    const LogicalLine& l = outline.logical[i];
    std::size_t kw = 0;
    std::size_t open = 0;
    std::size_t close = 0;
    if (!def_signature(l, &kw, &open, &close)) continue;
    auto params = mutable_defaults(l);
    if (params.empty()) continue;
    std::vector<std::string> names;
    for (const auto& d : params) names.push_back(d.name);
    const std::string message = tf.message + " (" + join(names, ", ") + ")";
    out.findings.push_back(make_finding(tf, file, span_of(l, kw, close + 1), outline.frame_for(i),
                                        std::move(names), message));
  }
}

void detect_long_block(const TfDefinition& tf, const LongBlockParams& p, const SourceFile& file,
                       DetectorOutput& out) {
  const SourceOutline& outline = *file.outline;
  for (std::size_t i = 0; i < outline.logical.size(); ++i) {
    const LogicalLine& l = outline.logical[i];
    std::size_t kw = 0;
    std::size_t open = 0;
    std::size_t close = 0;
    if (!def_signature(l, &kw, &open, &close) || outline.has_inline_body(l)) continue;
    const std::size_t body_lines = outline.block_last_physical(i) - l.last;
    if (body_lines <= p.max_lines) continue;
    out.findings.push_back(make_finding(
        tf, file, span_of(l, kw, l.colon + 1), outline.frame_for(i), {},
        tf.message + " (" + std::to_string(body_lines) + " lines > " + std::to_string(p.max_lines) + ")"));
  }
}

void detect_syntax(const TfDefinition& tf, const SourceFile& file, DetectorOutput& out) {
  if (!file.parse_error) return;
  const OutlineError& e = *file.parse_error;
  Span span;
  span.line = static_cast<std::uint32_t>(std::max<std::size_t>(1, std::min(e.line, file.lines.size())));
  span.col = 0;
  span.end_line = span.line;
  span.end_col = file.lines.empty() ? 0 : static_cast<std::uint32_t>(file.lines[span.line - 1].size());
  out.findings.push_back(make_finding(tf, file, span, "<module>", {}, tf.message + ": " + e.reason));
}

void detect_raise_without_cause(const TfDefinition& tf, const SourceFile& file, DetectorOutput& out) {
  const SourceOutline& outline = *file.outline;
  for (std::size_t i = 0; i < outline.logical.size(); ++i) {
    const LogicalLine& l = outline.logical[i];
    const bool inline_handler = l.keyword == "except" && outline.has_inline_body(l);
    if (l.keyword != "raise" && !inline_handler) continue;
    auto owner = enclosing_handler(outline, i);
    if (!owner) continue;
    auto header = parse_handler_header(outline.logical[*owner]);
    if (!header || header->as_name.empty()) continue;
    auto r = parse_raise(l, inline_handler ? l.colon + 1 : 0);
    if (!r || r->bare || r->has_cause) continue;
    // "raise exc" re-raises the bound exception itself.
    if (trim(l.masked.substr(r->keyword_pos + 5, r->end - r->keyword_pos - 5)) == header->as_name) continue;
    out.findings.push_back(make_finding(tf, file, span_of(l, r->keyword_pos, r->end), outline.frame_for(i),
                                        {header->as_name}, tf.message));
  }
}

// True when one of the except clauses of the try at `try_index` names a
// type from `handled_by`.
bool handlers_catch(const SourceOutline& outline, std::size_t try_index,
                    const std::vector<std::string>& handled_by) {
  const LogicalLine& t = outline.logical[try_index];
  for (std::size_t k = t.body_end; k < outline.logical.size(); k = outline.logical[k].body_end) {
    const LogicalLine& c = outline.logical[k];
    if (c.indent != t.indent || c.keyword != "except") break;
    auto header = parse_handler_header(c);
    if (!header) continue;
    for (const auto& type : header->types) {
      if (std::find(handled_by.begin(), handled_by.end(), type) != handled_by.end()) return true;
    }
  }
  return false;
}

// INVARIANT: only try bodies guard a call. A call inside an except, else or
// finally block of a try is not covered by that try's handlers.
bool call_guarded(const SourceOutline& outline, std::size_t index, std::size_t call_pos,
                  const std::vector<std::string>& handled_by) {
  const LogicalLine& l = outline.logical[index];
  if (l.keyword == "try" && outline.has_inline_body(l) && call_pos > l.colon &&
      handlers_catch(outline, index, handled_by)) {
    return true;
  }
  std::size_t indent = l.indent;
  for (std::size_t k = index; k-- > 0 && indent > 0;) {
    const LogicalLine& c = outline.logical[k];
    if (c.indent >= indent) continue;
    indent = c.indent;
    if (c.header && c.keyword == "try" && c.body_end > index && handlers_catch(outline, k, handled_by)) {
      return true;
    }
  }
  return false;
}

void detect_unguarded_call(const TfDefinition& tf, const UnguardedCallParams& p, const SourceFile& file,
                           DetectorOutput& out) {
  const SourceOutline& outline = *file.outline;
  for (std::size_t i = 0; i < outline.logical.size(); ++i) {
    const LogicalLine& l = outline.logical[i];
    for (const auto& callee : p.callees) {
      for (const CallSite& call : find_calls(l, callee)) {
        if (call_guarded(outline, i, call.callee_pos, p.handled_by)) continue;
        out.findings.push_back(make_finding(tf, file, span_of(l, call.callee_pos, call.close + 1),
                                            outline.frame_for(i), {callee},
                                            tf.message + " (" + callee + ")"));
      }
    }
  }
}

// The first def with a given body is the original; every later one in the
// same file is reported against it.
void detect_duplicate_block(const TfDefinition& tf, const DuplicateBlockParams& p, const SourceFile& file,
                            DetectorOutput& out) {
  const SourceOutline& outline = *file.outline;
  std::map<std::string, std::size_t> first_seen;
  for (std::size_t i = 0; i < outline.logical.size(); ++i) {
    const LogicalLine& l = outline.logical[i];
    std::size_t kw = 0;
    std::size_t open = 0;
    std::size_t close = 0;
    if (!def_signature(l, &kw, &open, &close) || outline.has_inline_body(l)) continue;
    if (l.body_end - i - 1 < p.min_lines) continue;

    const std::size_t base = outline.logical[i + 1].indent;
    std::string body;
    for (std::size_t k = i + 1; k < l.body_end; ++k) {
      const LogicalLine& b = outline.logical[k];
      body += std::to_string(b.indent - base) + ' ' + strip_ws(b.masked) + '\n';
    }
    auto [it, inserted] = first_seen.emplace(std::move(body), i);
    if (inserted) continue;

    const std::string original = outline.frame_for(it->second);
    const std::size_t original_line = outline.logical[it->second].first + 1;
    out.findings.push_back(make_finding(
        tf, file, span_of(l, kw, l.colon + 1), outline.frame_for(i), {original},
        tf.message + " (same body as " + original + " at line " + std::to_string(original_line) + ")"));
  }
}

}  // namespace

// ---------------------------------------------------------------------------
// Shared helpers
// ---------------------------------------------------------------------------

Span span_of(const LogicalLine& l, std::size_t begin, std::size_t end) {
  const auto a = SourceOutline::position(l, begin);
  const auto b = SourceOutline::position(l, end);
  Span s;
  s.line = static_cast<std::uint32_t>(a.first + 1);
  s.col = static_cast<std::uint32_t>(a.second);
  s.end_line = static_cast<std::uint32_t>(b.first + 1);
  s.end_col = static_cast<std::uint32_t>(b.second);
  return s;
}

std::string code_frame(const SourceFile& file, const Span& span) {
  if (file.lines.empty()) return "";
  const std::size_t first = span.line > 3 ? span.line - 2 : 1;
  const std::size_t last = std::min<std::size_t>(file.lines.size(), span.end_line + 2);
  std::string out;
  for (std::size_t n = first; n <= last; ++n) {
    out += std::to_string(n) + ": " + file.lines[n - 1];
    if (n != last) out += '\n';
  }
  return out;
}

std::optional<HandlerHeader> parse_handler_header(const LogicalLine& l) {
  if (!l.header || l.keyword != "except" || l.colon == std::string::npos) return std::nullopt;
  HandlerHeader h;
  h.keyword_pos = first_non_ws(l.masked);
  const std::size_t after = h.keyword_pos + 6;
  if (after > l.colon) return std::nullopt;
  std::string clause = l.masked.substr(after, l.colon - after);
  if (!clause.empty() && clause[0] == '*') return std::nullopt;  // except* groups

  static const std::regex kAs(R"(^([\s\S]*?)\s+as\s+([A-Za-z_]\w*)\s*$)");
  std::smatch m;
  if (std::regex_match(clause, m, kAs)) {
    h.as_name = m[2].str();
    clause = m[1].str();
  }
  std::string t = trim(clause);
  if (t.empty()) {
    h.broad = true;
    return h;
  }
  if (t.front() == '(' && match_bracket(t, 0) == t.size() - 1) t = t.substr(1, t.size() - 2);
  for (const auto& [b, e] : split_top_level(t, 0, t.size())) {
    const std::string type = strip_ws(t.substr(b, e - b));
    if (type.empty()) continue;
    if (type == "Exception" || type == "BaseException") h.broad = true;
    h.types.push_back(type);
  }
  return h;
}

std::vector<std::string> try_body_hints(const SourceOutline& outline, std::size_t except_index,
                                        const std::map<std::string, std::string>& exception_map) {
  const LogicalLine& handler = outline.logical[except_index];
  std::optional<std::size_t> try_index;
  for (std::size_t k = except_index; k-- > 0;) {
    const LogicalLine& c = outline.logical[k];
    if (c.indent > handler.indent) continue;
    if (c.indent < handler.indent) break;
    if (c.keyword == "except") continue;
    if (c.keyword == "try" && c.header) try_index = k;
    break;
  }
  if (!try_index) return {};

  const LogicalLine& t = outline.logical[*try_index];
  std::string body;
  if (outline.has_inline_body(t)) {
    body = t.masked.substr(t.colon + 1);
  } else {
    for (std::size_t k = *try_index + 1; k < t.body_end; ++k) {
      body += outline.logical[k].masked;
      body += '\n';
    }
  }
  std::vector<std::string> hints;
  for (const auto& [token, exc] : exception_map) {
    if (token_present(body, token)) hints.push_back(token);
  }
  return hints;
}

std::vector<std::string> exceptions_for_hints(const std::vector<std::string>& hints,
                                              const std::map<std::string, std::string>& exception_map) {
  std::set<std::string> out;
  for (const auto& hint : hints) {
    auto it = exception_map.find(hint);
    if (it == exception_map.end()) continue;
    for (const auto& [b, e] : split_top_level(it->second, 0, it->second.size())) {
      const std::string exc = strip_ws(it->second.substr(b, e - b));
      if (!exc.empty()) out.insert(exc);
    }
  }
  return {out.begin(), out.end()};
}

std::optional<std::size_t> enclosing_handler(const SourceOutline& outline, std::size_t index) {
  const LogicalLine& l = outline.logical[index];
  if (l.keyword == "except" && outline.has_inline_body(l)) return index;
  for (std::size_t k = index; k-- > 0;) {
    const LogicalLine& c = outline.logical[k];
    if (c.indent >= l.indent) continue;
    if (c.header && c.keyword == "except" && c.body_end > index) return k;
    return std::nullopt;
  }
  return std::nullopt;
}

std::optional<RaiseStatement> parse_raise(const LogicalLine& l, std::size_t from) {
  const std::string& m = l.masked;
  const std::size_t kw = first_non_ws(m, from);
  if (m.compare(kw, 5, "raise") != 0) return std::nullopt;
  if (kw + 5 < m.size() && ident_char(m[kw + 5])) return std::nullopt;

  // The statement ends at a top-level ';' or at the end of the line.
  std::size_t end = m.size();
  int depth = 0;
  for (std::size_t k = kw + 5; k < m.size(); ++k) {
    const char c = m[k];
    if (c == '(' || c == '[' || c == '{') ++depth;
    else if (c == ')' || c == ']' || c == '}') --depth;
    else if (c == ';' && depth == 0) {
      end = k;
      break;
    }
  }
  while (end > kw + 5 && std::isspace(static_cast<unsigned char>(m[end - 1]))) --end;

  RaiseStatement r;
  r.keyword_pos = kw;
  r.end = end;
  r.bare = end == kw + 5;
  depth = 0;
  for (std::size_t k = kw + 5; k < end; ++k) {
    const char c = m[k];
    if (c == '(' || c == '[' || c == '{') ++depth;
    else if (c == ')' || c == ']' || c == '}') --depth;
    else if (depth == 0 && m.compare(k, 4, "from") == 0 && !ident_char(m[k - 1]) &&
             (k + 4 >= end || !ident_char(m[k + 4]))) {
      r.has_cause = true;
      break;
    }
  }
  return r;
}

std::string keyword_name(const std::string& item) {
  return trim(item.substr(0, item.find('=')));
}

std::vector<CallSite> find_calls(const LogicalLine& l, const std::string& callee) {
  static const std::regex kKeyword(R"(^([A-Za-z_]\w*)\s*=(?!=))");
  std::vector<CallSite> calls;
  const std::string& m = l.masked;
  if (callee.empty()) return calls;
  for (std::size_t at = m.find(callee); at != std::string::npos; at = m.find(callee, at + 1)) {
    if (at > 0 && (ident_char(m[at - 1]) || m[at - 1] == '.')) continue;
    std::size_t j = at + callee.size();
    if (j < m.size() && ident_char(m[j])) continue;
    j = first_non_ws(m, j);
    if (j >= m.size() || m[j] != '(') continue;
    const std::size_t close = match_bracket(m, j);
    if (close == std::string::npos) continue;

    CallSite call;
    call.callee_pos = at;
    call.open = j;
    call.close = close;
    call.args = split_top_level(m, j + 1, close);
    for (const auto& [b, e] : call.args) {
      const std::string arg = trim(m.substr(b, e - b));
      if (arg.rfind("**", 0) == 0) {
        call.kwargs_splat = true;
        continue;
      }
      std::smatch km;
      if (std::regex_search(arg, km, kKeyword)) {
        call.keyword_names.insert(km[1].str());
        call.keyword_items.insert(strip_ws(l.text.substr(b, e - b)));
      }
    }
    calls.push_back(std::move(call));
  }
  return calls;
}

bool def_signature(const LogicalLine& l, std::size_t* keyword_pos, std::size_t* open, std::size_t* close) {
  if (!l.header || l.keyword != "def") return false;
  std::size_t kw = first_non_ws(l.masked);
  if (l.masked.compare(kw, 5, "async") == 0) kw = first_non_ws(l.masked, kw + 5);
  const std::size_t paren = l.masked.find('(', kw);
  if (paren == std::string::npos || paren > l.colon) return false;
  const std::size_t end = match_bracket(l.masked, paren);
  if (end == std::string::npos) return false;
  *keyword_pos = kw;
  *open = paren;
  *close = end;
  return true;
}

std::vector<DefaultParam> mutable_defaults(const LogicalLine& l) {
  static const std::set<std::string> kMutable = {"[]", "{}", "set()", "list()", "dict()"};
  std::vector<DefaultParam> out;
  std::size_t kw = 0;
  std::size_t open = 0;
  std::size_t close = 0;
  if (!def_signature(l, &kw, &open, &close)) return out;
  const std::string& m = l.masked;

  for (const auto& [b, e] : split_top_level(m, open + 1, close)) {
    std::size_t eq = std::string::npos;
    int depth = 0;
    for (std::size_t k = b; k < e; ++k) {
      const char c = m[k];
      if (c == '(' || c == '[' || c == '{') ++depth;
      else if (c == ')' || c == ']' || c == '}') --depth;
      else if (c == '=' && depth == 0 && (k + 1 >= e || m[k + 1] != '=') &&
               (k == b || std::string("=!<>").find(m[k - 1]) == std::string::npos)) {
        eq = k;
        break;
      }
    }
    if (eq == std::string::npos) continue;

    std::size_t db = first_non_ws(m, eq + 1);
    std::size_t de = e;
    while (de > db && std::isspace(static_cast<unsigned char>(m[de - 1]))) --de;
    const std::string ctor = strip_ws(m.substr(db, de - db));
    if (!kMutable.contains(ctor)) continue;

    std::string name = m.substr(b, eq - b);
    name = trim(name.substr(0, name.find(':')));
    while (!name.empty() && name.front() == '*') name.erase(0, 1);
    out.push_back(DefaultParam{name, db, de, ctor});
  }
  return out;
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

DetectorOutput run_detector(const TfDefinition& tf, const SourceFile& file) {
  DetectorOutput out;
  if (tf.strategy() == Strategy::syntax) {
    detect_syntax(tf, file, out);
    return out;
  }
  if (!file.outline) {
    const OutlineError& e = *file.parse_error;
    out.failure = "outline parse failed at line " + std::to_string(e.line) + ": " + e.reason;
    return out;
  }

  switch (tf.strategy()) {
    case Strategy::pattern:
      detect_pattern(tf, std::get<PatternParams>(tf.detector), file, out);
      break;
    case Strategy::broad_handler:
      detect_broad_handler(tf, std::get<BroadHandlerParams>(tf.detector), file, out);
      break;
    case Strategy::silent_handler:
      detect_silent_handler(tf, file, out);
      break;
    case Strategy::call_keywords:
      detect_call_keywords(tf, std::get<CallKeywordsParams>(tf.detector), file, out);
      break;
    case Strategy::mutable_default:
      detect_mutable_default(tf, file, out);
      break;
    case Strategy::long_block:
      detect_long_block(tf, std::get<LongBlockParams>(tf.detector), file, out);
      break;
    case Strategy::raise_without_cause:
      detect_raise_without_cause(tf, file, out);
      break;
    case Strategy::unguarded_call:
      detect_unguarded_call(tf, std::get<UnguardedCallParams>(tf.detector), file, out);
      break;
    case Strategy::duplicate_block:
      detect_duplicate_block(tf, std::get<DuplicateBlockParams>(tf.detector), file, out);
      break;
    case Strategy::syntax:
      break;
  }
  return out;
}

}  // namespace warden
