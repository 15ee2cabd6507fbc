#include "warden/patch.hpp"

#include <algorithm>
#include <cstdlib>
#include <regex>
#include <tuple>

#include "warden/fsutil.hpp"
#include "warden/hash.hpp"
#include "warden/outline.hpp"
#include "warden/version.hpp"

namespace warden {

std::string to_string(PatchOutcome o) {
  switch (o) {
    case PatchOutcome::applied:         return "applied";
    case PatchOutcome::already_applied: return "already_applied";
    case PatchOutcome::conflict:        return "conflict";
  }
  return "unknown";
}

std::string patch_id(const Patch& patch) {
  std::string payload = patch.tf_id + '\0' + patch.finding_id + '\0' + patch.file + '\0' +
                        patch.base_digest + '\0' + (patch.creates_file ? "1" : "0");
  for (const auto& h : patch.hunks) {
    payload += "\n@" + std::to_string(h.start);
    for (const auto& l : h.old_lines) payload += "\n-" + l;
    for (const auto& l : h.new_lines) payload += "\n+" + l;
  }
  return hash_domain("patch:", payload);
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

namespace {

constexpr std::size_t kContext = 3;

// A hunk reduced to its changed core: common leading / trailing lines of
// old_lines and new_lines become ordinary context.
struct Region {
  std::size_t a_start{0};                   // 0-based, before coordinates
  std::size_t b_start{0};                   // 0-based, after coordinates
  std::vector<std::string> removed;
  std::vector<std::string> added;
};

std::vector<Region> regions_of(const Patch& patch) {
  std::vector<Region> out;
  long long delta = 0;
  for (const auto& h : patch.hunks) {
    const auto& o = h.old_lines;
    const auto& n = h.new_lines;
    std::size_t pre = 0;
    while (pre < o.size() && pre < n.size() && o[pre] == n[pre]) ++pre;
    std::size_t suf = 0;
    while (suf < o.size() - pre && suf < n.size() - pre && o[o.size() - 1 - suf] == n[n.size() - 1 - suf]) ++suf;

    const std::size_t a0 = h.start > 0 ? h.start - 1 : 0;
    Region r;
    r.a_start = a0 + pre;
    r.b_start = static_cast<std::size_t>(static_cast<long long>(a0) + delta) + pre;
    r.removed.assign(o.begin() + static_cast<std::ptrdiff_t>(pre), o.end() - static_cast<std::ptrdiff_t>(suf));
    r.added.assign(n.begin() + static_cast<std::ptrdiff_t>(pre), n.end() - static_cast<std::ptrdiff_t>(suf));
    delta += static_cast<long long>(n.size()) - static_cast<long long>(o.size());
    if (!r.removed.empty() || !r.added.empty()) out.push_back(std::move(r));
  }
  return out;
}

std::string range_header(std::size_t from, std::size_t count) {
  // Unified diff convention: an empty range names the line before it.
  const std::size_t start = count == 0 ? from : from + 1;
  return std::to_string(start) + "," + std::to_string(count);
}

}  // namespace

std::string render_unified_diff(const Patch& patch, const std::vector<std::string>& before_lines) {
  std::string out;
  out += patch.creates_file ? "--- /dev/null\n" : "--- a/" + patch.file + "\n";
  out += "+++ b/" + patch.file + "\n";

  const auto regions = regions_of(patch);
  std::size_t i = 0;
  while (i < regions.size()) {
    // Group regions whose context windows touch.
    std::size_t j = i;
    while (j + 1 < regions.size() &&
           regions[j + 1].a_start <= regions[j].a_start + regions[j].removed.size() + 2 * kContext) {
      ++j;
    }
    const Region& first = regions[i];
    const Region& last = regions[j];
    const std::size_t a_from = first.a_start > kContext ? first.a_start - kContext : 0;
    const std::size_t a_to = std::min(before_lines.size(), last.a_start + last.removed.size() + kContext);
    const std::size_t b_from = a_from + first.b_start - first.a_start;

    std::string body;
    std::size_t a_count = 0;
    std::size_t b_count = 0;
    std::size_t cursor = a_from;
    for (std::size_t k = i; k <= j; ++k) {
      const Region& r = regions[k];
      for (; cursor < r.a_start && cursor < before_lines.size(); ++cursor) {
        body += " " + before_lines[cursor] + "\n";
        ++a_count;
        ++b_count;
      }
      for (const auto& l : r.removed) {
        body += "-" + l + "\n";
        ++a_count;
      }
      for (const auto& l : r.added) {
        body += "+" + l + "\n";
        ++b_count;
      }
      cursor = r.a_start + r.removed.size();
    }
    for (; cursor < a_to; ++cursor) {
      body += " " + before_lines[cursor] + "\n";
      ++a_count;
      ++b_count;
    }
    out += "@@ -" + range_header(a_from, a_count) + " +" + range_header(b_from, b_count) + " @@\n";
    out += body;
    i = j + 1;
  }
  return out;
}

std::string render_patch_stream(const RunContext& ctx, const std::vector<Patch>& patches) {
  std::string out;
  for (const auto& p : patches) {
    std::vector<std::string> before;
    if (!p.creates_file) {
      if (auto file = ctx.load(p.file)) before = file->lines;
    }
    out += "# warden-patch v=" + std::to_string(version::PATCH_STREAM_VERSION) + " tf_id=" + p.tf_id +
           " finding=" + p.finding_id + " base=" + p.base_digest + "\n";
    out += render_unified_diff(p, before);
  }
  return out;
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

namespace {

std::string diff_path(const std::string& raw, const char* prefix) {
  std::string path = raw.substr(0, raw.find('\t'));
  path = trim(path);
  if (path.rfind(prefix, 0) == 0) path = path.substr(2);
  return normalize_rel_path(path);
}

}  // namespace

DiffParse parse_unified_diff(const std::string& text) {
  static const std::regex kHunk(R"(^@@ -(\d+)(?:,(\d+))? \+(\d+)(?:,(\d+))? @@.*$)");
  DiffParse result;
  bool trailing = false;
  const auto lines = split_lines(text, &trailing);

  std::string meta_tf;
  std::string meta_finding;
  std::string meta_base;

  auto fail = [&result](std::size_t line_index, const std::string& reason) {
    result.patches.clear();
    result.error = "line " + std::to_string(line_index + 1) + ": " + reason;
    return result;
  };

  std::size_t i = 0;
  while (i < lines.size()) {
    const std::string& line = lines[i];
    if (line.rfind("# ", 0) == 0) {
      std::size_t pos = 2;
      while (pos < line.size()) {
        std::size_t end = line.find(' ', pos);
        if (end == std::string::npos) end = line.size();
        const std::string tok = line.substr(pos, end - pos);
        const std::size_t eq = tok.find('=');
        if (eq != std::string::npos) {
          const std::string key = tok.substr(0, eq);
          const std::string value = tok.substr(eq + 1);
          if (key == "tf_id") meta_tf = value;
          else if (key == "finding") meta_finding = value;
          else if (key == "base") meta_base = value;
        }
        pos = end + 1;
      }
      ++i;
      continue;
    }
    if (line.rfind("--- ", 0) != 0) {
      ++i;  // "diff --git", "index", prose around the diff
      continue;
    }

    const std::string old_path = line.substr(4);
    if (i + 1 >= lines.size() || lines[i + 1].rfind("+++ ", 0) != 0) {
      return fail(i, "expected '+++' after '---'");
    }
    const std::string new_path = lines[i + 1].substr(4);
    if (trim(new_path.substr(0, new_path.find('\t'))) == "/dev/null") {
      return fail(i + 1, "file deletion is not supported");
    }

    Patch patch;
    patch.creates_file = trim(old_path.substr(0, old_path.find('\t'))) == "/dev/null";
    patch.file = diff_path(new_path, "b/");
    patch.tf_id = meta_tf;
    patch.finding_id = meta_finding;
    patch.base_digest = patch.creates_file ? "" : meta_base;
    meta_tf.clear();
    meta_finding.clear();
    meta_base.clear();
    if (patch.file.empty()) return fail(i + 1, "empty file path");
    if (!is_tree_relative(patch.file)) return fail(i + 1, "path escapes the tree: " + patch.file);
    i += 2;

    while (i < lines.size() && lines[i].rfind("@@", 0) == 0) {
      std::smatch m;
      if (!std::regex_match(lines[i], m, kHunk)) return fail(i, "malformed hunk header");
      for (std::size_t g = 1; g <= 4; ++g) {
        if (m[g].length() > 9) return fail(i, "hunk range out of bounds");
      }
      const std::size_t a = std::stoul(m[1].str());
      const std::size_t b = m[2].matched ? std::stoul(m[2].str()) : 1;
      const std::size_t d = m[4].matched ? std::stoul(m[4].str()) : 1;
      const std::size_t header_line = i;
      ++i;

      Hunk h;
      h.start = static_cast<std::uint32_t>(b == 0 ? a + 1 : a);
      while (i < lines.size() && (h.old_lines.size() < b || h.new_lines.size() < d)) {
        const std::string& body = lines[i];
        if (body.empty()) {
          h.old_lines.push_back("");
          h.new_lines.push_back("");
        } else if (body[0] == ' ') {
          h.old_lines.push_back(body.substr(1));
          h.new_lines.push_back(body.substr(1));
        } else if (body[0] == '-') {
          h.old_lines.push_back(body.substr(1));
        } else if (body[0] == '+') {
          h.new_lines.push_back(body.substr(1));
        } else if (body[0] != '\\') {
          return fail(i, "unexpected line in hunk");
        }
        ++i;
      }
      while (i < lines.size() && !lines[i].empty() && lines[i][0] == '\\') ++i;
      if (h.old_lines.size() != b || h.new_lines.size() != d) {
        return fail(header_line, "hunk line counts do not match header");
      }
      patch.hunks.push_back(std::move(h));
    }
    if (patch.hunks.empty()) return fail(i > 0 ? i - 1 : 0, "file diff without hunks");
    result.patches.push_back(std::move(patch));
  }
  return result;
}

// ---------------------------------------------------------------------------
// Apply core
// ---------------------------------------------------------------------------

namespace {

bool lines_match(const std::vector<std::string>& lines, long long at, const std::vector<std::string>& want) {
  if (at < 0 || static_cast<std::size_t>(at) + want.size() > lines.size()) return false;
  return std::equal(want.begin(), want.end(), lines.begin() + at);
}

bool applied_at_offset(const std::vector<std::string>& lines, const Patch& p, long long offset) {
  long long delta = offset;
  for (const auto& h : p.hunks) {
    const long long at = static_cast<long long>(h.start) - 1 + delta;
    if (!lines_match(lines, at, h.new_lines)) return false;
    // A hunk whose old lines still sit in place has not been applied.
    if (h.old_lines != h.new_lines && !h.old_lines.empty() && lines_match(lines, at, h.old_lines)) return false;
    delta += static_cast<long long>(h.new_lines.size()) - static_cast<long long>(h.old_lines.size());
  }
  return true;
}

// True when every hunk's new_lines already sit where the patch would put them,
// shifted uniformly by edits made elsewhere in the file. The nearest shift wins.
// INVARIANT: the search is anchored on a hunk that adds lines. A patch that only
// deletes leaves nothing to recognize, so it is never reported as applied.
bool already_applied(const std::vector<std::string>& lines, const Patch& p) {
  const bool changes = std::any_of(p.hunks.begin(), p.hunks.end(),
                                   [](const Hunk& h) { return h.old_lines != h.new_lines; });
  if (!changes) return false;
  const auto anchor = std::find_if(p.hunks.begin(), p.hunks.end(),
                                   [](const Hunk& h) { return !h.new_lines.empty(); });
  if (anchor == p.hunks.end()) return false;
  long long expected = static_cast<long long>(anchor->start) - 1;
  for (auto it = p.hunks.begin(); it != anchor; ++it) {
    expected += static_cast<long long>(it->new_lines.size()) - static_cast<long long>(it->old_lines.size());
  }
  std::vector<long long> offsets;
  for (long long at = 0; at + static_cast<long long>(anchor->new_lines.size()) <= static_cast<long long>(lines.size());
       ++at) {
    if (lines_match(lines, at, anchor->new_lines)) offsets.push_back(at - expected);
  }
  std::stable_sort(offsets.begin(), offsets.end(),
                   [](long long a, long long b) { return std::llabs(a) < std::llabs(b); });
  for (long long offset : offsets) {
    if (applied_at_offset(lines, p, offset)) return true;
  }
  return false;
}

std::pair<std::size_t, std::size_t> hunk_range(const Hunk& h) {
  const std::size_t s = h.start > 0 ? h.start - 1 : 0;
  return {s, s + std::max<std::size_t>(h.old_lines.size(), 1)};
}

bool overlaps(const Patch& a, const Patch& b) {
  for (const auto& ha : a.hunks) {
    const auto ra = hunk_range(ha);
    for (const auto& hb : b.hunks) {
      const auto rb = hunk_range(hb);
      if (ra.first < rb.second && rb.first < ra.second) return true;
    }
  }
  return false;
}

}  // namespace

TextApplyResult apply_patches_to_text(const std::string& content, bool exists,
                                      const std::vector<const Patch*>& patches) {
  TextApplyResult result;
  result.content = content;
  result.results.resize(patches.size());

  bool trailing = false;
  std::vector<std::string> lines = split_lines(content, &trailing);
  const std::string digest = content_digest(content);

  auto conflict = [&result](std::size_t i, std::string reason) {
    result.results[i].outcome = PatchOutcome::conflict;
    result.results[i].reason = std::move(reason);
  };

  // 1. Creation, existence and drift checks.
  std::vector<std::size_t> candidates;
  for (std::size_t i = 0; i < patches.size(); ++i) {
    const Patch& p = *patches[i];
    if (p.creates_file) {
      std::vector<std::string> created;
      for (const auto& h : p.hunks) created.insert(created.end(), h.new_lines.begin(), h.new_lines.end());
      if (!exists) {
        candidates.push_back(i);
      } else if (lines == created) {
        result.results[i].outcome = PatchOutcome::already_applied;
      } else {
        conflict(i, "file already exists");
      }
      continue;
    }
    if (!exists) {
      conflict(i, "file does not exist");
      continue;
    }
    if (!p.base_digest.empty() && p.base_digest != digest) {
      if (already_applied(lines, p)) result.results[i].outcome = PatchOutcome::already_applied;
      else conflict(i, "content drift: file changed since the patch was computed");
      continue;
    }
    candidates.push_back(i);
  }

  // 2. Overlaps: lowest (tf_id, finding_id) wins.
  std::sort(candidates.begin(), candidates.end(), [&patches](std::size_t a, std::size_t b) {
    return std::tie(patches[a]->tf_id, patches[a]->finding_id, a) <
           std::tie(patches[b]->tf_id, patches[b]->finding_id, b);
  });
  std::vector<std::size_t> accepted;
  for (std::size_t c : candidates) {
    const Patch& p = *patches[c];
    auto winner = std::find_if(accepted.begin(), accepted.end(),
                               [&](std::size_t a) { return overlaps(*patches[a], p); });
    if (winner != accepted.end()) {
      const Patch& w = *patches[*winner];
      conflict(c, "overlaps patch " + w.tf_id + " " + w.finding_id.substr(0, 12) + " which takes precedence");
      continue;
    }
    accepted.push_back(c);
  }

  // 3. Apply in position order, re-validating against the mutated content.
  std::sort(accepted.begin(), accepted.end(), [&patches](std::size_t a, std::size_t b) {
    const std::uint32_t sa = patches[a]->hunks.empty() ? 0 : patches[a]->hunks.front().start;
    const std::uint32_t sb = patches[b]->hunks.empty() ? 0 : patches[b]->hunks.front().start;
    return std::tie(sa, a) < std::tie(sb, b);
  });
  std::vector<std::pair<std::size_t, long long>> shifts;  // (original line index, delta)
  auto shift_before = [&shifts](std::size_t orig) {
    long long d = 0;
    for (const auto& [at, delta] : shifts) {
      if (at < orig) d += delta;
    }
    return d;
  };

  bool created = false;
  for (std::size_t idx : accepted) {
    const Patch& p = *patches[idx];
    std::vector<long long> positions;
    bool valid = true;
    for (const auto& h : p.hunks) {
      const std::size_t orig = h.start > 0 ? h.start - 1 : 0;
      const long long at = static_cast<long long>(orig) + shift_before(orig);
      if (h.old_lines.empty() ? (at < 0 || static_cast<std::size_t>(at) > lines.size())
                              : !lines_match(lines, at, h.old_lines)) {
        valid = false;
        break;
      }
      positions.push_back(at);
    }
    if (!valid) {
      if (already_applied(lines, p)) result.results[idx].outcome = PatchOutcome::already_applied;
      else conflict(idx, "hunk does not match current content");
      continue;
    }
    // Hunks of one patch are sorted and disjoint: apply back to front.
    for (std::size_t k = p.hunks.size(); k-- > 0;) {
      const Hunk& h = p.hunks[k];
      const auto at = static_cast<std::ptrdiff_t>(positions[k]);
      lines.erase(lines.begin() + at, lines.begin() + at + static_cast<std::ptrdiff_t>(h.old_lines.size()));
      lines.insert(lines.begin() + at, h.new_lines.begin(), h.new_lines.end());
    }
    for (const auto& h : p.hunks) {
      shifts.emplace_back(h.start > 0 ? h.start - 1 : 0,
                          static_cast<long long>(h.new_lines.size()) - static_cast<long long>(h.old_lines.size()));
    }
    if (p.creates_file) created = true;
    result.results[idx].outcome = PatchOutcome::applied;
  }

  if (created && !exists) trailing = true;
  result.content = join_lines(lines, trailing);
  result.changed = result.content != content || (created && !exists);
  return result;
}

}  // namespace warden
