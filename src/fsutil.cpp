#include "warden/fsutil.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <system_error>

namespace fs = std::filesystem;

namespace warden {

namespace {

// Unique temporary name next to the target so rename() stays on one filesystem.
std::string make_tmp_name(const fs::path& target) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (target.parent_path() / (".warden_tmp_" + target.filename().string() + "_" +
                                  std::to_string(dist(rng)))).string();
}

bool skipped(const std::vector<std::string>& skip_dirs, const std::string& name) {
  return std::find(skip_dirs.begin(), skip_dirs.end(), name) != skip_dirs.end();
}

bool glob_at(const std::string& p, size_t pi, const std::string& s, size_t si) {
  while (pi < p.size()) {
    if (p[pi] == '*' && pi + 1 < p.size() && p[pi + 1] == '*') {
      if (pi + 2 < p.size() && p[pi + 2] == '/') {
        for (size_t k = si; k <= s.size(); ++k) {
          if ((k == si || s[k - 1] == '/') && glob_at(p, pi + 3, s, k)) return true;
        }
        return false;
      }
      for (size_t k = si; k <= s.size(); ++k) {
        if (glob_at(p, pi + 2, s, k)) return true;
      }
      return false;
    }
    if (p[pi] == '*') {
      for (size_t k = si; k <= s.size(); ++k) {
        if (glob_at(p, pi + 1, s, k)) return true;
        if (k < s.size() && s[k] == '/') break;
      }
      return false;
    }
    if (si >= s.size()) return false;
    if (p[pi] == '?') {
      if (s[si] == '/') return false;
    } else if (p[pi] != s[si]) {
      return false;
    }
    ++pi;
    ++si;
  }
  return si == s.size();
}

}  // namespace

bool read_file(const std::string& path, std::string* out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  out->assign((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return !ifs.bad();
}

bool atomic_write(const std::string& path, const std::string& data) {
  const fs::path target(path);
  std::error_code ec;
  if (target.has_parent_path()) fs::create_directories(target.parent_path(), ec);
  const std::string tmp = make_tmp_name(target);
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  const auto st = fs::status(target, ec);
  if (!ec && fs::exists(st)) {
    fs::permissions(tmp, st.permissions(), fs::perm_options::replace, ec);
  }
  ec.clear();
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

std::string normalize_rel_path(const std::string& path) {
  std::string out;
  out.reserve(path.size());
  for (char c : path) {
    const char n = (c == '\\') ? '/' : c;
    if (n == '/' && !out.empty() && out.back() == '/') continue;
    out += n;
  }
  while (out.rfind("./", 0) == 0) out.erase(0, 2);
  while (!out.empty() && out.back() == '/') out.pop_back();
  return out;
}

bool is_tree_relative(const std::string& rel) {
  if (rel.empty() || rel[0] == '/' || rel[0] == '\\') return false;
  if (rel.size() >= 2 && rel[1] == ':') return false;  // drive-qualified
  std::size_t begin = 0;
  while (begin <= rel.size()) {
    std::size_t end = rel.find_first_of("/\\", begin);
    if (end == std::string::npos) end = rel.size();
    if (rel.compare(begin, end - begin, "..") == 0 && end - begin == 2) return false;
    begin = end + 1;
  }
  return true;
}

bool path_within_root(const std::string& root, const std::string& rel) {
  if (!is_tree_relative(rel)) return false;
  std::error_code ec;
  const fs::path base = fs::weakly_canonical(fs::path(root), ec);
  if (ec) return false;
  // Symlinks are followed, so a linked directory pointing elsewhere is caught.
  const fs::path target = fs::weakly_canonical(base / rel, ec);
  if (ec) return false;
  const fs::path inside = target.lexically_relative(base);
  return !inside.empty() && *inside.begin() != "..";
}

std::vector<std::string> list_tree_files(const std::string& root,
                                         const std::vector<std::string>& skip_dirs) {
  std::vector<std::string> out;
  std::error_code ec;
  const fs::path base(root);
  fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
  if (ec) return out;
  for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
    if (ec) break;
    const auto& entry = *it;
    const std::string name = entry.path().filename().string();
    if (entry.is_directory(ec)) {
      if (skipped(skip_dirs, name)) it.disable_recursion_pending();
      continue;
    }
    if (!entry.is_regular_file(ec)) continue;
    out.push_back(normalize_rel_path(fs::relative(entry.path(), base, ec).generic_string()));
  }
  // Directory iteration order is filesystem-dependent; output order is not.
  std::sort(out.begin(), out.end());
  return out;
}

bool copy_tree(const std::string& root, const std::string& dest,
               const std::vector<std::string>& skip_dirs, std::string* error) {
  std::error_code ec;
  fs::create_directories(dest, ec);
  if (ec) {
    if (error) *error = "cannot create " + dest + ": " + ec.message();
    return false;
  }
  for (const auto& rel : list_tree_files(root, skip_dirs)) {
    const fs::path to = fs::path(dest) / rel;
    fs::create_directories(to.parent_path(), ec);
    fs::copy_file(fs::path(root) / rel, to, fs::copy_options::overwrite_existing, ec);
    if (ec) {
      if (error) *error = "cannot copy " + rel + ": " + ec.message();
      return false;
    }
  }
  return true;
}

bool glob_match(const std::string& pattern, const std::string& path) {
  return glob_at(pattern, 0, path, 0);
}

bool footprint_match(const std::vector<std::string>& patterns, const std::string& path) {
  bool included = false;
  for (const auto& p : patterns) {
    if (!p.empty() && p[0] == '!') {
      if (glob_match(p.substr(1), path)) return false;
    } else if (!included && glob_match(p, path)) {
      included = true;
    }
  }
  return included;
}

}  // namespace warden
