// core/executor.cpp - Symlink reconciliation implementation
#include "executor.hpp"
#include "../utils.hpp"
#include <algorithm>
#include <stdexcept>

namespace protonlink {

SymlinkBinding read_binding(FileSystem &fsys, const fs::path &link) {
  auto state = fsys.probe(link);
  switch (state.kind) {
  case EntryKind::Absent:
    return {BindingKind::Absent, {}};
  case EntryKind::Directory:
    return {BindingKind::Directory, {}};
  case EntryKind::Other:
    return {BindingKind::Other, {}};
  case EntryKind::Symlink:
    break;
  }
  if (!state.resolves) {
    return {BindingKind::Broken, {}};
  }
  return {BindingKind::Bound, state.target};
}

std::string binding_to_string(const SymlinkBinding &binding) {
  switch (binding.kind) {
  case BindingKind::Absent:
    return "absent";
  case BindingKind::Broken:
    return "broken";
  case BindingKind::Directory:
    return "directory";
  case BindingKind::Other:
    return "file";
  case BindingKind::Bound:
    return "-> " + binding.target.string();
  }
  return "unknown";
}

const SlotOutcome &ReconcileResult::outcome(LinkSlot slot) const {
  auto it = std::find_if(outcomes.begin(), outcomes.end(),
                         [slot](const SlotOutcome &o) { return o.slot == slot; });
  if (it == outcomes.end()) {
    throw std::out_of_range("No outcome for slot " + slot_to_string(slot));
  }
  return *it;
}

size_t ReconcileResult::failure_count() const {
  return static_cast<size_t>(
      std::count_if(outcomes.begin(), outcomes.end(), [](const SlotOutcome &o) {
        return o.status == SlotStatus::Failed;
      }));
}

size_t ReconcileResult::change_count() const {
  return static_cast<size_t>(
      std::count_if(outcomes.begin(), outcomes.end(),
                    [](const SlotOutcome &o) { return o.changed; }));
}

std::string status_to_string(SlotStatus status) {
  switch (status) {
  case SlotStatus::Ok:
    return "ok";
  case SlotStatus::Removed:
    return "removed";
  case SlotStatus::Failed:
    return "failed";
  }
  return "unknown";
}

fs::path link_text(const fs::path &link, const fs::path &target) {
  auto base = link.parent_path().lexically_normal();
  auto rel = target.lexically_normal().lexically_relative(base);
  if (!rel.empty() && *rel.begin() != ".." && rel != ".") {
    return rel;
  }
  return fs::absolute(target).lexically_normal();
}

namespace {

// Canonical paths of every planned target, for the never-delete check
std::vector<fs::path> canonical_targets(FileSystem &fsys, const LinkPlan &plan) {
  std::vector<fs::path> result;
  for (const auto &[slot, target] : plan.targets) {
    auto c = fsys.canonical(target);
    if (!c.empty()) {
      result.push_back(c);
    }
  }
  return result;
}

bool is_protected(FileSystem &fsys, const fs::path &occupant,
                  const std::vector<fs::path> &targets) {
  auto c = fsys.canonical(occupant);
  if (c.empty()) {
    return false;
  }
  return std::find(targets.begin(), targets.end(), c) != targets.end();
}

void fail(SlotOutcome &out, const std::string &reason) {
  out.status = SlotStatus::Failed;
  out.reason = reason;
  LOG_ERROR("Failed to reconcile " + out.link.filename().string() + ": " +
            reason);
}

void unassign_slot(FileSystem &fsys, SlotOutcome &out,
                   const std::vector<fs::path> &targets) {
  auto binding = read_binding(fsys, out.link);
  out.status = SlotStatus::Removed;

  try {
    switch (binding.kind) {
    case BindingKind::Absent:
      return;
    case BindingKind::Broken:
    case BindingKind::Bound:
      fsys.remove_symlink(out.link);
      out.changed = true;
      LOG_INFO("Removed symlink " + out.link.filename().string());
      return;
    case BindingKind::Directory:
    case BindingKind::Other:
      if (is_protected(fsys, out.link, targets)) {
        fail(out, "occupied by a directory that is a link target");
        return;
      }
      fsys.remove_all(out.link);
      out.changed = true;
      LOG_WARN("Removed " + binding_to_string(binding) + " occupying " +
               out.link.filename().string());
      return;
    }
  } catch (const std::exception &e) {
    fail(out, e.what());
  }
}

void assign_slot(FileSystem &fsys, SlotOutcome &out,
                 const std::vector<fs::path> &targets) {
  auto binding = read_binding(fsys, out.link);
  auto wanted = fsys.canonical(out.target);

  if (!wanted.empty() && wanted == fsys.canonical(out.link.parent_path())) {
    fail(out, "target is the link directory itself");
    return;
  }

  try {
    switch (binding.kind) {
    case BindingKind::Absent:
      break;
    case BindingKind::Bound:
      if (!wanted.empty() && binding.target == wanted) {
        out.status = SlotStatus::Ok;
        LOG_DEBUG(out.link.filename().string() + " already points to " +
                  out.target.filename().string());
        return;
      }
      [[fallthrough]];
    case BindingKind::Broken:
      fsys.remove_symlink(out.link);
      out.changed = true;
      break;
    case BindingKind::Directory:
    case BindingKind::Other:
      if (!wanted.empty() && fsys.canonical(out.link) == wanted) {
        // The slot name is its own target and already resolves to it
        out.status = SlotStatus::Ok;
        return;
      }
      if (is_protected(fsys, out.link, targets)) {
        fail(out, "occupied by a directory that is a link target");
        return;
      }
      fsys.remove_all(out.link);
      out.changed = true;
      LOG_WARN("Removed " + binding_to_string(binding) + " occupying " +
               out.link.filename().string());
      break;
    }

    auto text = link_text(out.link, out.target);
    fsys.create_directory_symlink(text, out.link);
    out.changed = true;
    out.status = SlotStatus::Ok;
    LOG_INFO("Created symlink " + out.link.filename().string() + " -> " +
             text.string());
  } catch (const std::exception &e) {
    fail(out, e.what());
  }
}

} // namespace

ReconcileResult reconcile(FileSystem &fsys, const fs::path &root,
                          ReleaseFamily family, const LinkPlan &plan) {
  ReconcileResult result;
  for (auto slot : ALL_SLOTS) {
    SlotOutcome out;
    out.slot = slot;
    out.link = root / link_name(family, slot);
    if (auto target = plan.target_of(slot)) {
      out.target = *target;
    }
    result.outcomes.push_back(out);
  }

  auto targets = canonical_targets(fsys, plan);

  // Free stale names first so desired names are clear before use
  for (auto &out : result.outcomes) {
    if (!plan.assigns(out.slot)) {
      unassign_slot(fsys, out, targets);
    }
  }

  for (auto &out : result.outcomes) {
    if (plan.assigns(out.slot)) {
      assign_slot(fsys, out, targets);
    }
  }

  return result;
}

} // namespace protonlink
