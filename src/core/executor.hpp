// core/executor.hpp - Symlink reconciliation
#pragma once

#include "family.hpp"
#include "filesystem.hpp"
#include "planner.hpp"
#include <array>
#include <string>
#include <vector>

namespace protonlink {

enum class BindingKind {
  Absent,    // nothing at the link name
  Broken,    // symlink whose target does not resolve
  Directory, // real directory occupying the link name
  Other,     // some other file occupying the link name
  Bound      // symlink resolving to target
};

struct SymlinkBinding {
  BindingKind kind = BindingKind::Absent;
  fs::path target;
};

SymlinkBinding read_binding(FileSystem &fsys, const fs::path &link);
std::string binding_to_string(const SymlinkBinding &binding);

enum class SlotStatus { Ok, Removed, Failed };

struct SlotOutcome {
  LinkSlot slot = LinkSlot::Primary;
  fs::path link;
  SlotStatus status = SlotStatus::Removed;
  fs::path target; // desired target, empty for unassigned slots
  std::string reason;
  bool changed = false; // at least one mutation was made for this slot
};

struct ReconcileResult {
  std::vector<SlotOutcome> outcomes; // Primary, Fallback, Fallback2

  const SlotOutcome &outcome(LinkSlot slot) const;
  size_t failure_count() const;
  size_t change_count() const;
  bool ok() const { return failure_count() == 0; }
};

std::string status_to_string(SlotStatus status);

// Link text for target as seen from link: relative when target lives under
// the link's directory, absolute otherwise
fs::path link_text(const fs::path &link, const fs::path &target);

ReconcileResult reconcile(FileSystem &fsys, const fs::path &root,
                          ReleaseFamily family, const LinkPlan &plan);

} // namespace protonlink
