// core/version.cpp - Version key parsing and ordering
#include "version.hpp"
#include <regex>
#include <stdexcept>
#include <tuple>

namespace protonlink {

std::string VersionKey::to_string() const {
  return "(" + prefix + ", " + std::to_string(major) + ", " +
         std::to_string(minor) + ", " + std::to_string(patch) + ")";
}

bool operator==(const VersionKey &a, const VersionKey &b) {
  return std::tie(a.prefix, a.major, a.minor, a.patch) ==
         std::tie(b.prefix, b.major, b.minor, b.patch);
}

bool operator!=(const VersionKey &a, const VersionKey &b) { return !(a == b); }

bool operator<(const VersionKey &a, const VersionKey &b) {
  return std::tie(a.prefix, a.major, a.minor, a.patch) <
         std::tie(b.prefix, b.major, b.minor, b.patch);
}

bool operator>(const VersionKey &a, const VersionKey &b) { return b < a; }

std::ostream &operator<<(std::ostream &os, const VersionKey &key) {
  return os << key.to_string();
}

static const std::regex &grammar(ReleaseFamily family) {
  static const std::regex ge(describe(ReleaseFamily::GEProton).pattern);
  static const std::regex em(describe(ReleaseFamily::ProtonEM).pattern);
  return family == ReleaseFamily::ProtonEM ? em : ge;
}

VersionKey parse_version(const std::string &name, ReleaseFamily family) {
  const auto &desc = describe(family);
  VersionKey degenerate{name, 0, 0, 0};

  std::smatch m;
  if (!std::regex_search(name, m, grammar(family))) {
    return degenerate;
  }

  try {
    if (desc.numeric_fields == 2) {
      // <prefix><major>-<patch>, minor is structurally unused
      return VersionKey{desc.key_prefix, std::stoi(m[1].str()), 0,
                        std::stoi(m[2].str())};
    }
    return VersionKey{desc.key_prefix, std::stoi(m[1].str()),
                      std::stoi(m[2].str()), std::stoi(m[3].str())};
  } catch (const std::out_of_range &) {
    return degenerate;
  }
}

int compare_versions(const VersionKey &a, const VersionKey &b) {
  if (a < b)
    return -1;
  if (b < a)
    return 1;
  return 0;
}

int compare_tags(const std::string &a, const std::string &b,
                 ReleaseFamily family) {
  return compare_versions(parse_version(a, family), parse_version(b, family));
}

bool matches_grammar(const std::string &name, ReleaseFamily family) {
  std::smatch m;
  return std::regex_search(name, m, grammar(family)) &&
         m.length(0) == static_cast<std::smatch::difference_type>(name.size());
}

} // namespace protonlink
