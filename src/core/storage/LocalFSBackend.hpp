#pragma once
#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace psm {

enum class CollisionPolicy {
  Overwrite,     // a later file with the same name replaces the earlier one
  Disambiguate,  // IMG.JPG, IMG_1.JPG, IMG_2.JPG, ...
};

// "overwrite" | "disambiguate"; throws ConfigError otherwise.
CollisionPolicy parse_collision_policy(const std::string& s);
const char* to_string(CollisionPolicy p);

// Flat local destination for fetched files.
class LocalFSBackend {
public:
  explicit LocalFSBackend(std::string root,
                          CollisionPolicy policy = CollisionPolicy::Overwrite)
    : root_(std::move(root)), policy_(policy) {}

  const std::string& root() const { return root_; }
  CollisionPolicy policy() const { return policy_; }

  // Creates the root directory if needed.
  void ensureRoot() const;

  // Writes bytes as <root>/<name> (or a disambiguated name); returns the path.
  std::string put(const std::string& name, std::string_view bytes);

private:
  std::string           root_;
  CollisionPolicy       policy_;
  std::set<std::string> written_;  // names handed out by this backend

  std::string chooseName(const std::string& name) const;
};

} // namespace psm
