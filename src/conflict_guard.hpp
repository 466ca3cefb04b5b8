#pragma once

#include <filesystem>
#include <string>

struct Manifest;

enum class ConflictStatus { Ok, Exists };

// Receiver-side gate in front of every write. Paths are manifest paths:
// relative, '/'-separated, without empty, "." or ".." segments.
class ConflictGuard {
public:
  explicit ConflictGuard(std::filesystem::path target_root);

  const std::filesystem::path& target_root() const { return target_root_; }

  // Throws PathTraversalError when `relative_path` is unsafe or resolves
  // outside the target root (including through a symlinked parent).
  std::filesystem::path resolve(const std::string& relative_path) const;

  // Exists covers files, directories and symlinks, dangling ones too.
  ConflictStatus check(const std::string& relative_path) const;

  // Pre-flight pass over every entry. Throws ConflictError naming the
  // first entry whose target already exists.
  void check_all(const Manifest& manifest) const;

  static bool is_safe_relative(const std::string& relative_path, std::string* reason = nullptr);

private:
  std::filesystem::path target_root_;
};

ConflictStatus check_conflict(const std::filesystem::path& target_root,
                              const std::string& relative_path);
