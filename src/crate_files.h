// Discovery of the .crate files below a crate root.
#pragma once

#include <filesystem>
#include <vector>

#include "seratorekordbox.h"

const char kCrateExtension[] = ".crate";

struct CrateEntry {
  HierarchyKey key;
  std::filesystem::path file;
};

// Finds every .crate file below root, recursively. Entries are sorted by their path relative to
// root, compared component by component. Throws ReadException if root cannot be listed.
std::vector<CrateEntry> enumerateCrates(const std::filesystem::path& root);

// Records the last write time of every crate enumerateCrates would return. Throws ReadException
// if root cannot be listed or a crate cannot be stat'ed.
CrateSnapshot snapshotCrates(const std::filesystem::path& root);
