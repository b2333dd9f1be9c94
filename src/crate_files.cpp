#include "crate_files.h"

#include <algorithm>
#include <string>
#include <system_error>
#include <utility>

namespace {

struct FoundCrate {
  std::vector<std::string> relative_parts;
  std::filesystem::path file;
};

std::vector<FoundCrate> findCrateFiles(const std::filesystem::path& root) {
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    throw ReadException("Crate root is not a directory: " + root.string());
  }

  std::vector<FoundCrate> ret;
  std::filesystem::recursive_directory_iterator itr(root, ec);
  for (; !ec && itr != std::filesystem::recursive_directory_iterator(); itr.increment(ec)) {
    const std::filesystem::directory_entry& entry = *itr;
    if (entry.path().extension() != kCrateExtension) {
      continue;
    }
    std::error_code type_ec;
    if (!entry.is_regular_file(type_ec)) {
      continue;
    }

    FoundCrate found;
    found.file = entry.path();
    for (const std::filesystem::path& part : entry.path().lexically_relative(root)) {
      found.relative_parts.push_back(part.string());
    }
    ret.push_back(std::move(found));
  }
  if (ec) {
    throw ReadException("Could not list crate root " + root.string() + ": " + ec.message());
  }

  std::sort(ret.begin(), ret.end(), [](const FoundCrate& a, const FoundCrate& b) {
    return a.relative_parts < b.relative_parts;
  });
  return ret;
}

}  // namespace

std::vector<CrateEntry> enumerateCrates(const std::filesystem::path& root) {
  std::vector<CrateEntry> ret;
  for (FoundCrate& found : findCrateFiles(root)) {
    CrateEntry entry;
    entry.key = std::move(found.relative_parts);
    // The crate's name is not stored in the .crate file itself; it's only in the filename.
    entry.key.back() = std::filesystem::path(entry.key.back()).stem().string();
    entry.file = std::move(found.file);
    ret.push_back(std::move(entry));
  }
  return ret;
}

CrateSnapshot snapshotCrates(const std::filesystem::path& root) {
  CrateSnapshot ret;
  for (const FoundCrate& found : findCrateFiles(root)) {
    std::error_code ec;
    std::filesystem::file_time_type mtime = std::filesystem::last_write_time(found.file, ec);
    if (ec) {
      throw ReadException("Could not stat crate " + found.file.string() + ": " + ec.message());
    }
    ret[found.file] = mtime;
  }
  return ret;
}
