#include "hierarchy.h"

#include <algorithm>
#include <system_error>

namespace {

bool isProperPrefix(const HierarchyKey& prefix, const HierarchyKey& key) {
  return prefix.size() < key.size() && std::equal(prefix.begin(), prefix.end(), key.begin());
}

}  // namespace

Hierarchy buildHierarchy(std::vector<CrateTracks>&& crates) {
  Hierarchy ret;

  std::set<HierarchyKey> all_keys;
  for (const CrateTracks& crate : crates) {
    all_keys.insert(crate.key);
    for (size_t depth = 1; depth < crate.key.size(); depth++) {
      ret.folders.emplace(crate.key.begin(), crate.key.begin() + depth);
    }
  }

  for (CrateTracks& crate : crates) {
    if (crate.key.empty()) {
      continue;
    }

    // Keys nested under crate.key sort directly after it, so only the next key needs checking.
    auto next = all_keys.upper_bound(crate.key);
    bool has_children = next != all_keys.end() && isProperPrefix(crate.key, *next);

    if (has_children) {
      ret.folders.insert(crate.key);
      if (crate.tracks.empty()) {
        // Represent this crate purely as a folder so Rekordbox mirrors the Serato hierarchy.
        continue;
      }
    }

    Playlist playlist;
    playlist.name = crate.key.back();
    playlist.tracks = std::move(crate.tracks);
    if (has_children) {
      playlist.parent_path = crate.key;
    } else {
      playlist.parent_path.assign(crate.key.begin(), crate.key.end() - 1);
    }
    ret.playlists.emplace_back(std::move(crate.key), std::move(playlist));
  }

  return ret;
}

std::filesystem::path resolveTrackPath(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::path absolute = std::filesystem::absolute(path, ec);
  if (ec) {
    return path.lexically_normal();
  }
  std::filesystem::path resolved = std::filesystem::weakly_canonical(absolute, ec);
  if (ec) {
    return absolute.lexically_normal();
  }
  return resolved;
}

TrackCollection::TrackCollection(const Hierarchy& hierarchy) {
  for (const auto& [key, playlist] : hierarchy.playlists) {
    for (const Track& track : playlist.tracks) {
      auto [itr, inserted] = path_to_id_.emplace(resolveTrackPath(track.path), tracks_.size() + 1);
      if (inserted) {
        tracks_.push_back(track);
      }
    }
  }
}

std::optional<size_t> TrackCollection::idForPath(const std::filesystem::path& path) const {
  auto itr = path_to_id_.find(resolveTrackPath(path));
  if (itr == path_to_id_.end()) {
    return std::nullopt;
  }
  return itr->second;
}
