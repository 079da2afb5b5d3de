// core/family.cpp - Release family table
#include "family.hpp"
#include "../defs.hpp"

namespace protonlink {

static const FamilyDescriptor GE_PROTON = {
    ReleaseFamily::GEProton,
    "GE-Proton",
    "GE-Proton",
    "^GE-Proton([0-9]+)-([0-9]+)",
    2,
    "",
    "GloriousEggroll/proton-ge-custom",
    ".tar.gz",
};

static const FamilyDescriptor PROTON_EM = {
    ReleaseFamily::ProtonEM,
    "Proton-EM",
    "EM",
    "^EM-([0-9]+)\\.([0-9]+)-([0-9]+)",
    3,
    "proton-",
    "Etaash-mathamsetty/Proton",
    ".tar.xz",
};

const FamilyDescriptor &describe(ReleaseFamily family) {
  switch (family) {
  case ReleaseFamily::ProtonEM:
    return PROTON_EM;
  case ReleaseFamily::GEProton:
  default:
    return GE_PROTON;
  }
}

const std::vector<ReleaseFamily> &all_families() {
  static const std::vector<ReleaseFamily> families = {ReleaseFamily::GEProton,
                                                      ReleaseFamily::ProtonEM};
  return families;
}

std::string family_to_string(ReleaseFamily family) {
  return describe(family).name;
}

std::optional<ReleaseFamily> family_from_string(const std::string &name) {
  for (auto family : all_families()) {
    if (name == describe(family).name) {
      return family;
    }
  }
  return std::nullopt;
}

std::string slot_to_string(LinkSlot slot) {
  switch (slot) {
  case LinkSlot::Primary:
    return "Primary";
  case LinkSlot::Fallback:
    return "Fallback";
  case LinkSlot::Fallback2:
    return "Fallback2";
  }
  return "Unknown";
}

std::string link_name(ReleaseFamily family, LinkSlot slot) {
  std::string base = describe(family).name;
  switch (slot) {
  case LinkSlot::Fallback:
    return base + FALLBACK_SUFFIX;
  case LinkSlot::Fallback2:
    return base + FALLBACK2_SUFFIX;
  case LinkSlot::Primary:
  default:
    return base;
  }
}

std::string asset_name(ReleaseFamily family, const std::string &tag) {
  const auto &desc = describe(family);
  return std::string(desc.dir_prefix) + tag + desc.archive_format;
}

} // namespace protonlink
