#include "conflict_guard.hpp"

#include <system_error>

#include "errors.hpp"
#include "manifest.hpp"

namespace fs = std::filesystem;

namespace {

bool is_within(const fs::path& root, const fs::path& candidate) {
  auto rel = candidate.lexically_relative(root);
  if(rel.empty()) return false;
  auto first = rel.begin();
  return first == rel.end() || first->string() != "..";
}

} // namespace

ConflictGuard::ConflictGuard(fs::path target_root) {
  std::error_code ec;
  auto canonical_root = fs::weakly_canonical(fs::absolute(target_root, ec), ec);
  target_root_ = ec ? fs::absolute(target_root).lexically_normal() : canonical_root;
}

bool ConflictGuard::is_safe_relative(const std::string& relative_path, std::string* reason) {
  auto reject = [&](const char* why) {
    if(reason) *reason = why;
    return false;
  };
  if(relative_path.empty()) return reject("empty path");
  if(relative_path.front() == '/') return reject("absolute path");
  if(relative_path.find('\0') != std::string::npos) return reject("NUL byte in path");

  std::size_t start = 0;
  while(start <= relative_path.size()) {
    auto end = relative_path.find('/', start);
    if(end == std::string::npos) end = relative_path.size();
    auto segment = relative_path.substr(start, end - start);
    if(segment.empty()) return reject("empty path segment");
    if(segment == ".") return reject("'.' path segment");
    if(segment == "..") return reject("'..' path segment");
    start = end + 1;
  }
  return true;
}

fs::path ConflictGuard::resolve(const std::string& relative_path) const {
  std::string reason;
  if(!is_safe_relative(relative_path, &reason)) {
    throw PathTraversalError("Rejected path '" + relative_path + "': " + reason, relative_path);
  }
  auto candidate = (target_root_ / fs::path(relative_path)).lexically_normal();
  if(!is_within(target_root_, candidate)) {
    throw PathTraversalError("Path '" + relative_path + "' escapes " + target_root_.string(), relative_path);
  }
  // A symlinked parent may still point outside the root.
  std::error_code ec;
  auto parent = fs::weakly_canonical(candidate.parent_path(), ec);
  if(!ec && parent != target_root_ && !is_within(target_root_, parent)) {
    throw PathTraversalError("Path '" + relative_path + "' resolves outside " + target_root_.string(),
                             relative_path);
  }
  return candidate;
}

ConflictStatus ConflictGuard::check(const std::string& relative_path) const {
  auto target = resolve(relative_path);
  std::error_code ec;
  auto status = fs::symlink_status(target, ec);
  if(ec && ec != std::errc::no_such_file_or_directory) {
    // Unreadable parents, and parents that are files, count as present.
    return ConflictStatus::Exists;
  }
  return fs::exists(status) ? ConflictStatus::Exists : ConflictStatus::Ok;
}

void ConflictGuard::check_all(const Manifest& manifest) const {
  for(const auto& entry : manifest.entries) {
    if(check(entry.relative_path) == ConflictStatus::Exists) {
      throw ConflictError("File already exists: " + resolve(entry.relative_path).string(),
                          entry.relative_path);
    }
  }
}

ConflictStatus check_conflict(const fs::path& target_root, const std::string& relative_path) {
  return ConflictGuard(target_root).check(relative_path);
}
