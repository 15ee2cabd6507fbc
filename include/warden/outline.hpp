#pragma once

// warden/outline.hpp - Lightweight structural representation of indentation-
// structured (Python-style) source.
//
// An outline is NOT a syntax tree. It records what detectors and transforms
// need and nothing more:
//   - logical lines (physical lines joined across open brackets, triple-quoted
//     strings and backslash continuations);
//   - a masked copy of every logical line with string bodies and comments
//     blanked to spaces, same length as the raw text, so offsets line up;
//   - compound-statement headers, their colon and their block extent;
//   - the indentation block structure, validated the way the interpreter
//     would (unexpected indent, missing block, inconsistent dedent).
//
// parse_outline() fails on unbalanced brackets, unterminated strings and
// indentation errors. A failed parse is itself the finding for the syntax
// strategy; every other detector skips the file.

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace warden {

struct LogicalLine {
  std::size_t first{0};                    // 0-based physical line index
  std::size_t last{0};
  std::size_t indent{0};                   // columns; tabs advance to multiples of 8
  std::string text;                        // physical lines first..last joined by '\n'
  std::string masked;                      // text with string bodies / comments blanked
  std::string keyword;                     // leading keyword ("def", "except", ...), "async" skipped
  bool header{false};
  std::size_t colon{std::string::npos};    // offset of the header colon in text
  std::size_t body_end{0};                 // one past the last logical line of the block
};

struct OutlineError {
  std::size_t line{0};                     // 1-based
  std::string reason;
};

class SourceOutline {
 public:
  std::vector<LogicalLine> logical;

  // Index of the logical line containing a 0-based physical line.
  std::optional<std::size_t> logical_at(std::size_t physical) const;

  // Innermost enclosing "def name()" / "class Name", or "<module>".
  std::string frame_for(std::size_t logical_index) const;

  // True when the header's block is on the same line ("except: pass").
  bool has_inline_body(const LogicalLine& l) const;

  // Last physical line covered by a logical line's block.
  std::size_t block_last_physical(std::size_t logical_index) const;

  // Offset in `text` -> (0-based physical line, 0-based column).
  static std::pair<std::size_t, std::size_t> position(const LogicalLine& l, std::size_t offset);

  // (0-based physical line, column) -> offset in `text`, npos if outside.
  static std::size_t offset_of(const LogicalLine& l, std::size_t physical, std::size_t col);
};

struct OutlineResult {
  std::optional<SourceOutline> outline;
  std::optional<OutlineError> error;
};

OutlineResult parse_outline(const std::vector<std::string>& lines);

// Split content into lines without their '\n'. *trailing_newline reports
// whether the content ended with '\n' so join_lines() can restore it exactly.
std::vector<std::string> split_lines(const std::string& content, bool* trailing_newline);
std::string join_lines(const std::vector<std::string>& lines, bool trailing_newline);

// Leading whitespace of a line, verbatim.
std::string leading_ws(const std::string& line);

// Index of the bracket closing the one at `open` in masked text, npos if none.
std::size_t match_bracket(const std::string& masked, std::size_t open);

// Split masked text [begin, end) at top-level commas. Returns [start, end) pairs.
std::vector<std::pair<std::size_t, std::size_t>> split_top_level(const std::string& masked,
                                                                 std::size_t begin,
                                                                 std::size_t end);

std::string trim(const std::string& s);

}  // namespace warden
