#pragma once

// warden/run_context.hpp - Per-run state shared by every stage.
//
// DESIGN:
//   RunContext replaces any process-global cache. It owns the tree root, the
//   effective configuration and a cache of parsed files keyed by relative
//   path. It is created at run start and discarded at run end; nothing in it
//   survives across runs.
//
// THREAD SAFETY:
//   load() may be called concurrently from scanner / proposer workers. The
//   cache map is guarded by a mutex; the cached SourceFile objects are
//   immutable and handed out as shared_ptr<const SourceFile>, so readers
//   never hold the lock while working.
//
// INVARIANT: after the apply engine rewrites a file it calls invalidate(path)
// so the next load() observes the new content.

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "warden/config.hpp"
#include "warden/outline.hpp"

namespace warden {

struct SourceFile {
  std::string path;                         // relative, '/' separated
  std::string content;
  std::string digest;                       // content_digest(content)
  std::vector<std::string> lines;
  bool trailing_newline{false};
  std::optional<SourceOutline> outline;     // set when parse succeeded
  std::optional<OutlineError> parse_error;  // set when it did not
};

std::shared_ptr<const SourceFile> make_source_file(const std::string& path, const std::string& content);

class RunContext {
 public:
  RunContext(std::string root, EngineConfig config);

  const std::string& root() const { return root_; }
  const EngineConfig& config() const { return config_; }

  // Tree files (relative paths, sorted), honouring config().skip_dirs.
  std::vector<std::string> list_files() const;

  // Absolute path of a tree-relative path.
  std::string absolute(const std::string& rel) const;

  // Cached read + outline parse. nullptr when the file cannot be read.
  std::shared_ptr<const SourceFile> load(const std::string& rel) const;

  void invalidate(const std::string& rel);
  void clear();
  std::size_t cache_size() const;

 private:
  std::string root_;
  EngineConfig config_;
  mutable std::mutex mu_;
  mutable std::map<std::string, std::shared_ptr<const SourceFile>> cache_;
};

}  // namespace warden
