#pragma once

// warden/fsutil.hpp - Filesystem helpers shared by the scanner, apply engine,
// snapshot store and agent bridge.
//
// INVARIANT: atomic_write() either leaves the old content in place or the new
// content fully written. Readers never observe a partially written file.

#include <string>
#include <vector>

namespace warden {

// Read a whole file in binary mode. Returns false if it cannot be opened.
bool read_file(const std::string& path, std::string* out);

// Write to a temporary sibling, then rename into place. POSIX rename() is
// atomic within one filesystem. When the target already exists its permission
// bits are carried over to the replacement.
bool atomic_write(const std::string& path, const std::string& data);

// Normalise a tree-relative path: '\\' -> '/', strip leading "./", collapse "//".
std::string normalize_rel_path(const std::string& path);

// False for absolute paths and for any ".." segment.
bool is_tree_relative(const std::string& rel);

// True when root/rel, with symlinks resolved, stays under root.
bool path_within_root(const std::string& root, const std::string& rel);

// Regular files under root, relative and '/' separated, sorted byte-wise.
// Directories whose name is in skip_dirs are not descended into.
std::vector<std::string> list_tree_files(const std::string& root,
                                         const std::vector<std::string>& skip_dirs);

// Recursive copy of root into dest (created if absent), honouring skip_dirs.
bool copy_tree(const std::string& root, const std::string& dest,
               const std::vector<std::string>& skip_dirs, std::string* error);

// Glob match over '/' separated paths. '*' and '?' stay within a segment,
// "**" crosses segments and "**/" also matches zero segments.
bool glob_match(const std::string& pattern, const std::string& path);

// A path is in a footprint if some plain pattern matches and no "!" pattern does.
bool footprint_match(const std::vector<std::string>& patterns, const std::string& path);

}  // namespace warden
