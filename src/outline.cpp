#include "warden/outline.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace warden {

namespace {

bool ident_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::size_t indent_width(const std::string& line) {
  std::size_t col = 0;
  for (char c : line) {
    if (c == ' ') ++col;
    else if (c == '\t') col = (col / 8 + 1) * 8;
    else if (c == '\f') col = 0;
    else break;
  }
  return col;
}

std::string first_word(const std::string& masked, std::size_t from, std::size_t* end) {
  std::size_t i = from;
  while (i < masked.size() && std::isspace(static_cast<unsigned char>(masked[i]))) ++i;
  std::size_t j = i;
  while (j < masked.size() && ident_char(masked[j])) ++j;
  if (end) *end = j;
  return masked.substr(i, j - i);
}

const std::set<std::string>& compound_keywords() {
  static const std::set<std::string> kws = {"if", "elif", "else", "for", "while", "try",
                                            "except", "finally", "with", "def", "class",
                                            "match", "case"};
  return kws;
}

// First top-level ':' that is not part of ":=".
std::size_t first_top_level_colon(const std::string& masked) {
  int depth = 0;
  for (std::size_t i = 0; i < masked.size(); ++i) {
    const char c = masked[i];
    if (c == '(' || c == '[' || c == '{') ++depth;
    else if (c == ')' || c == ']' || c == '}') --depth;
    else if (c == ':' && depth == 0 && (i + 1 >= masked.size() || masked[i + 1] != '=')) return i;
  }
  return std::string::npos;
}

void classify_header(LogicalLine& l) {
  std::size_t end = 0;
  std::string kw = first_word(l.masked, 0, &end);
  if (kw == "async") kw = first_word(l.masked, end, nullptr);
  l.keyword = kw;

  const std::string t = trim(l.masked);
  if (compound_keywords().contains(kw)) {
    const std::size_t c = first_top_level_colon(l.masked);
    if (c != std::string::npos) {
      l.header = true;
      l.colon = c;
      return;
    }
  }
  if (!t.empty() && t.back() == ':') {
    l.header = true;
    l.colon = l.masked.find_last_of(':');
  }
}

}  // namespace

std::string trim(const std::string& s) {
  std::size_t b = 0;
  while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  std::size_t e = s.size();
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

std::string leading_ws(const std::string& line) {
  std::size_t i = 0;
  while (i < line.size() && (line[i] == ' ' || line[i] == '\t' || line[i] == '\f')) ++i;
  return line.substr(0, i);
}

std::vector<std::string> split_lines(const std::string& content, bool* trailing_newline) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start < content.size()) {
    const std::size_t nl = content.find('\n', start);
    if (nl == std::string::npos) {
      out.push_back(content.substr(start));
      break;
    }
    out.push_back(content.substr(start, nl - start));
    start = nl + 1;
  }
  if (trailing_newline) *trailing_newline = !content.empty() && content.back() == '\n';
  return out;
}

std::string join_lines(const std::vector<std::string>& lines, bool trailing_newline) {
  std::string out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    out += lines[i];
    if (i + 1 < lines.size() || trailing_newline) out += '\n';
  }
  return out;
}

std::size_t match_bracket(const std::string& masked, std::size_t open) {
  int depth = 0;
  for (std::size_t i = open; i < masked.size(); ++i) {
    const char c = masked[i];
    if (c == '(' || c == '[' || c == '{') ++depth;
    else if (c == ')' || c == ']' || c == '}') {
      if (--depth == 0) return i;
    }
  }
  return std::string::npos;
}

std::vector<std::pair<std::size_t, std::size_t>> split_top_level(const std::string& masked,
                                                                 std::size_t begin,
                                                                 std::size_t end) {
  std::vector<std::pair<std::size_t, std::size_t>> parts;
  int depth = 0;
  std::size_t start = begin;
  for (std::size_t i = begin; i < end; ++i) {
    const char c = masked[i];
    if (c == '(' || c == '[' || c == '{') ++depth;
    else if (c == ')' || c == ']' || c == '}') --depth;
    else if (c == ',' && depth == 0) {
      parts.emplace_back(start, i);
      start = i + 1;
    }
  }
  parts.emplace_back(start, end);
  // A trailing comma leaves an empty last part; drop it.
  if (!parts.empty() && trim(masked.substr(parts.back().first, parts.back().second - parts.back().first)).empty()) {
    parts.pop_back();
  }
  return parts;
}

// ---------------------------------------------------------------------------
// SourceOutline
// ---------------------------------------------------------------------------

std::optional<std::size_t> SourceOutline::logical_at(std::size_t physical) const {
  auto it = std::upper_bound(logical.begin(), logical.end(), physical,
                             [](std::size_t p, const LogicalLine& l) { return p < l.first; });
  if (it == logical.begin()) return std::nullopt;
  --it;
  if (physical > it->last) return std::nullopt;
  return static_cast<std::size_t>(it - logical.begin());
}

std::string SourceOutline::frame_for(std::size_t logical_index) const {
  if (logical_index >= logical.size()) return "<module>";
  const std::size_t own_indent = logical[logical_index].indent;
  for (std::size_t k = logical_index + 1; k-- > 0;) {
    const LogicalLine& l = logical[k];
    if (!l.header || (l.keyword != "def" && l.keyword != "class")) continue;
    const bool encloses = (k == logical_index) || (l.body_end > logical_index && l.indent < own_indent);
    if (!encloses) continue;
    std::size_t pos = l.masked.find(l.keyword == "def" ? "def" : "class");
    std::size_t end = 0;
    const std::string name = first_word(l.masked, pos + l.keyword.size(), &end);
    return l.keyword == "def" ? "def " + name + "()" : "class " + name;
  }
  return "<module>";
}

bool SourceOutline::has_inline_body(const LogicalLine& l) const {
  if (!l.header || l.colon == std::string::npos) return false;
  return !trim(l.masked.substr(l.colon + 1)).empty();
}

std::size_t SourceOutline::block_last_physical(std::size_t logical_index) const {
  const LogicalLine& l = logical[logical_index];
  if (!l.header || l.body_end <= logical_index + 1) return l.last;
  return logical[l.body_end - 1].last;
}

std::pair<std::size_t, std::size_t> SourceOutline::position(const LogicalLine& l, std::size_t offset) {
  std::size_t physical = l.first;
  std::size_t line_start = 0;
  for (std::size_t i = 0; i < offset && i < l.text.size(); ++i) {
    if (l.text[i] == '\n') {
      ++physical;
      line_start = i + 1;
    }
  }
  return {physical, offset - line_start};
}

std::size_t SourceOutline::offset_of(const LogicalLine& l, std::size_t physical, std::size_t col) {
  if (physical < l.first || physical > l.last) return std::string::npos;
  std::size_t offset = 0;
  for (std::size_t p = l.first; p < physical; ++p) {
    const std::size_t nl = l.text.find('\n', offset);
    if (nl == std::string::npos) return std::string::npos;
    offset = nl + 1;
  }
  const std::size_t nl = l.text.find('\n', offset);
  const std::size_t line_len = (nl == std::string::npos ? l.text.size() : nl) - offset;
  if (col > line_len) return std::string::npos;
  return offset + col;
}

// ---------------------------------------------------------------------------
// parse_outline
// ---------------------------------------------------------------------------

OutlineResult parse_outline(const std::vector<std::string>& lines) {
  OutlineResult result;
  SourceOutline outline;

  bool in_string = false;
  bool triple = false;
  char quote = 0;
  std::size_t string_line = 0;
  std::vector<std::pair<char, std::size_t>> brackets;

  bool continuing = false;
  bool has_content = false;
  std::size_t cur_first = 0;
  std::string text;
  std::string masked;

  auto fail = [&result](std::size_t line, std::string reason) {
    result.error = OutlineError{line, std::move(reason)};
    return result;
  };

  for (std::size_t p = 0; p < lines.size(); ++p) {
    const std::string& line = lines[p];
    if (!continuing) {
      cur_first = p;
      text.clear();
      masked.clear();
      has_content = false;
    } else {
      text += '\n';
      masked += '\n';
    }

    // A trailing '\r' (CRLF files) is whitespace for structure purposes.
    std::size_t n = line.size();
    if (n > 0 && line[n - 1] == '\r') --n;

    bool backslash = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
      const char c = line[i];
      if (in_string) {
        if (c == '\\' && i + 1 < line.size()) {
          text += c;
          text += line[i + 1];
          masked += "  ";
          ++i;
          continue;
        }
        if (c == quote && (!triple || (i + 2 < line.size() && line[i + 1] == quote && line[i + 2] == quote))) {
          const std::size_t len = triple ? 3 : 1;
          text.append(len, quote);
          masked.append(len, quote);
          i += len - 1;
          in_string = false;
          continue;
        }
        text += c;
        masked += ' ';
        continue;
      }
      if (c == '#') {
        text += line.substr(i);
        masked.append(line.size() - i, ' ');
        break;
      }
      if (c == '\'' || c == '"') {
        triple = (i + 2 < line.size() && line[i + 1] == c && line[i + 2] == c);
        quote = c;
        in_string = true;
        string_line = p;
        has_content = true;
        const std::size_t len = triple ? 3 : 1;
        text.append(len, c);
        masked.append(len, c);
        i += len - 1;
        continue;
      }
      if (c == '(' || c == '[' || c == '{') {
        brackets.emplace_back(c, p);
      } else if (c == ')' || c == ']' || c == '}') {
        const char want = c == ')' ? '(' : (c == ']' ? '[' : '{');
        if (brackets.empty() || brackets.back().first != want) {
          return fail(p + 1, std::string("unmatched '") + c + "'");
        }
        brackets.pop_back();
      } else if (c == '\\' && i + 1 >= n) {
        backslash = true;
        text += c;
        masked += ' ';
        continue;
      }
      if (!std::isspace(static_cast<unsigned char>(c))) has_content = true;
      text += c;
      masked += c;
    }

    if (in_string && !triple) {
      return fail(p + 1, "unterminated string literal");
    }
    if (in_string || !brackets.empty() || backslash) {
      continuing = true;
      continue;
    }
    continuing = false;
    if (!has_content) continue;

    LogicalLine l;
    l.first = cur_first;
    l.last = p;
    l.indent = indent_width(lines[cur_first]);
    l.text = text;
    l.masked = masked;
    classify_header(l);
    outline.logical.push_back(std::move(l));
  }

  if (in_string) return fail(string_line + 1, "unterminated triple-quoted string");
  if (!brackets.empty()) {
    return fail(brackets.back().second + 1, std::string("'") + brackets.back().first + "' was never closed");
  }
  if (continuing) return fail(lines.size(), "unexpected end of file after line continuation");

  // Indentation structure.
  std::vector<std::size_t> stack{0};
  bool expect_indent = false;
  for (const LogicalLine& l : outline.logical) {
    if (expect_indent) {
      if (l.indent <= stack.back()) return fail(l.first + 1, "expected an indented block");
      stack.push_back(l.indent);
      expect_indent = false;
    } else if (l.indent > stack.back()) {
      return fail(l.first + 1, "unexpected indent");
    } else {
      while (l.indent < stack.back()) stack.pop_back();
      if (l.indent != stack.back()) {
        return fail(l.first + 1, "unindent does not match any outer indentation level");
      }
    }
    if (l.header && !outline.has_inline_body(l)) expect_indent = true;
  }
  if (expect_indent) {
    return fail(outline.logical.back().last + 1, "expected an indented block");
  }

  for (std::size_t i = 0; i < outline.logical.size(); ++i) {
    LogicalLine& l = outline.logical[i];
    std::size_t j = i + 1;
    if (l.header && !outline.has_inline_body(l)) {
      while (j < outline.logical.size() && outline.logical[j].indent > l.indent) ++j;
    }
    l.body_end = j;
  }

  result.outline = std::move(outline);
  return result;
}

}  // namespace warden
