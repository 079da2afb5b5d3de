// core/version.hpp - Fork-aware version keys
#pragma once

#include "family.hpp"
#include <ostream>
#include <string>

namespace protonlink {

/**
 * Ordered (prefix, major, minor, patch) tuple. Names that do not match the
 * family grammar become (name, 0, 0, 0) and still take part in ordering.
 */
struct VersionKey {
  std::string prefix;
  int major = 0;
  int minor = 0;
  int patch = 0;

  std::string to_string() const;
};

bool operator==(const VersionKey &a, const VersionKey &b);
bool operator!=(const VersionKey &a, const VersionKey &b);
bool operator<(const VersionKey &a, const VersionKey &b);
bool operator>(const VersionKey &a, const VersionKey &b);
std::ostream &operator<<(std::ostream &os, const VersionKey &key);

VersionKey parse_version(const std::string &name, ReleaseFamily family);

// -1, 0 or 1
int compare_versions(const VersionKey &a, const VersionKey &b);
int compare_tags(const std::string &a, const std::string &b,
                 ReleaseFamily family);

// True when the whole name is a well-formed tag of the family
bool matches_grammar(const std::string &name, ReleaseFamily family);

} // namespace protonlink
