// core/family.hpp - Release families and their naming conventions
#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace protonlink {

enum class ReleaseFamily { GEProton, ProtonEM };

enum class LinkSlot { Primary = 0, Fallback = 1, Fallback2 = 2 };

constexpr std::array<LinkSlot, 3> ALL_SLOTS = {
    LinkSlot::Primary, LinkSlot::Fallback, LinkSlot::Fallback2};

struct FamilyDescriptor {
  ReleaseFamily family;
  const char *name;       // display name, also the Primary link name
  const char *key_prefix; // first element of a well-formed VersionKey
  const char *pattern;    // tag grammar, matched from the start of the name
  int numeric_fields;     // meaningful numbers in the grammar (2 or 3)
  const char *dir_prefix; // alternate on-disk prefix, "" when none
  const char *repo;
  const char *archive_format;
};

const FamilyDescriptor &describe(ReleaseFamily family);
const std::vector<ReleaseFamily> &all_families();

std::string family_to_string(ReleaseFamily family);
std::optional<ReleaseFamily> family_from_string(const std::string &name);

std::string slot_to_string(LinkSlot slot);
std::string link_name(ReleaseFamily family, LinkSlot slot);

// Archive file name the release host publishes for a tag
std::string asset_name(ReleaseFamily family, const std::string &tag);

} // namespace protonlink
