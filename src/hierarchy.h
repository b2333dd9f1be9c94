// Reconciliation of individually decoded crates into Rekordbox's folder/playlist tree.
#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

#include "seratorekordbox.h"

struct CrateTracks {
  HierarchyKey key;
  std::vector<Track> tracks;
};

struct Hierarchy {
  // In the order the crates were passed to buildHierarchy.
  std::vector<std::pair<HierarchyKey, Playlist>> playlists;
  std::set<HierarchyKey> folders;
};

// Take flat list of crates and decide which become folders and which become playlists.
//
// Every proper prefix of a crate's key is a folder ("Main" for Main/Sub/Peak). A crate that other
// crates are nested under is a folder as well; if it has no tracks of its own it is only a
// folder, otherwise it also becomes a playlist placed inside the folder of the same name. All
// other crates become playlists in the folder given by their key minus the last element.
//
// Destroys input.
Hierarchy buildHierarchy(std::vector<CrateTracks>&& crates);

// Absolute, symlink-free version of path, used to decide whether two crate entries refer to the
// same file. Parts of the path that don't exist are normalized lexically.
std::filesystem::path resolveTrackPath(const std::filesystem::path& path);

// The distinct tracks of a Hierarchy. TrackIDs are 1-based and assigned in the order tracks are
// first met when walking the playlists in order.
class TrackCollection {
public:
  explicit TrackCollection(const Hierarchy& hierarchy);

  size_t size() const { return tracks_.size(); }
  // Track with the given TrackID.
  const Track& track(size_t track_id) const { return tracks_.at(track_id - 1); }
  std::optional<size_t> idForPath(const std::filesystem::path& path) const;

private:
  std::vector<Track> tracks_;
  std::map<std::filesystem::path, size_t> path_to_id_;
};
