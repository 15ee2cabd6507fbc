#include "warden/run_context.hpp"

#include <filesystem>

#include "warden/fsutil.hpp"
#include "warden/hash.hpp"

namespace fs = std::filesystem;

namespace warden {

std::shared_ptr<const SourceFile> make_source_file(const std::string& path, const std::string& content) {
  auto file = std::make_shared<SourceFile>();
  file->path = path;
  file->content = content;
  file->digest = content_digest(content);
  file->lines = split_lines(content, &file->trailing_newline);
  OutlineResult parsed = parse_outline(file->lines);
  if (parsed.outline) file->outline = std::move(parsed.outline);
  else file->parse_error = std::move(parsed.error);
  return file;
}

RunContext::RunContext(std::string root, EngineConfig config)
    : root_(std::move(root)), config_(std::move(config)) {}

std::vector<std::string> RunContext::list_files() const {
  return list_tree_files(root_, config_.skip_dirs);
}

std::string RunContext::absolute(const std::string& rel) const {
  return (fs::path(root_) / rel).string();
}

std::shared_ptr<const SourceFile> RunContext::load(const std::string& rel) const {
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = cache_.find(rel);
    if (it != cache_.end()) return it->second;
  }
  // Parse outside the lock. Two workers racing on one path both parse; the
  // first insert wins and both see identical content.
  std::string content;
  if (!read_file(absolute(rel), &content)) return nullptr;
  auto file = make_source_file(rel, content);
  std::lock_guard<std::mutex> lk(mu_);
  return cache_.emplace(rel, std::move(file)).first->second;
}

void RunContext::invalidate(const std::string& rel) {
  std::lock_guard<std::mutex> lk(mu_);
  cache_.erase(rel);
}

void RunContext::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  cache_.clear();
}

std::size_t RunContext::cache_size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return cache_.size();
}

}  // namespace warden
