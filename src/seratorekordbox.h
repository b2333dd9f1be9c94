#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

struct CuePoint {
  uint32_t index = 0;
  // Seconds from the start of the track.
  float position = 0.0f;
  std::optional<std::string> name;
};

struct Track {
  std::filesystem::path path;
  std::optional<std::string> title;
  std::vector<CuePoint> cue_points;
};

// Location of a crate inside the crate root: the directory names followed by the crate's file
// name without its extension, e.g. {"Main", "Sub", "Peak"} for Main/Sub/Peak.crate.
using HierarchyKey = std::vector<std::string>;

struct Playlist {
  std::string name;
  std::vector<Track> tracks;
  // Folder the playlist is placed in. Empty means the top level.
  HierarchyKey parent_path;
};

// Last write time of every crate file, keyed by the crate file's location. Two snapshots compare
// equal iff no crate was added, removed or modified in between.
using CrateSnapshot = std::map<std::filesystem::path, std::filesystem::file_time_type>;

struct ConversionSummary {
  std::filesystem::path output;
  // "Main / Sub / Peak" -> number of tracks, in the order the playlists were read.
  std::vector<std::pair<std::string, size_t>> playlist_counts;
  size_t track_count = 0;

  size_t playlistCount() const { return playlist_counts.size(); }
};

class ReadException : public std::runtime_error {
public:
  using runtime_error::runtime_error;
};

class WriteException : public std::runtime_error {
public:
  using runtime_error::runtime_error;
};

class ConfigException : public std::runtime_error {
public:
  using runtime_error::runtime_error;
};

struct ConverterConfig {
  // Directory holding the .crate files, usually <music>/_Serato_/Subcrates.
  std::filesystem::path crate_root;
  // Rekordbox XML file to write.
  std::filesystem::path output;
  std::string product_name = "serato-rekordbox-sync";
  std::string product_version = "0.2.0";
  std::string company = "serato-rekordbox-sync";
};

// $HOME/Music/_Serato_/Subcrates
std::filesystem::path defaultCrateRoot();
// $HOME/Music/_Serato_/rekordbox-export.xml
std::filesystem::path defaultOutputPath();

// Cooperative stop flag for Converter::watch. stop() may be called from any thread and wakes up a
// watch loop that is waiting for its next poll.
class StopSignal {
public:
  void stop();
  bool stopped() const;
  // Waits until stop() is called or timeout elapses. Returns true if stop was requested.
  bool waitFor(std::chrono::milliseconds timeout);

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool stopped_ = false;
};

class Converter {
public:
  using SummaryCallback = std::function<void(const ConversionSummary&)>;

  // Throws ConfigException if the crate root is not an existing directory or no output path is
  // given.
  explicit Converter(ConverterConfig config);

  // Reads every crate under the crate root and converts the result into a Rekordbox XML document.
  // The document is always built but only written to the output path if write is true, so
  // write=false gives a preview of what would be exported.
  //
  // Throws ReadException if the crates cannot be read and WriteException if the output cannot be
  // written.
  ConversionSummary runOnce(bool write = true) const;

  CrateSnapshot snapshot() const;

  // Polls the crate root every interval and reconverts whenever the snapshot changed (the first
  // iteration always converts). on_summary, if set, is called after every conversion. Returns
  // once stop is signalled; with no StopSignal it runs forever. Failed runs are logged and
  // retried on the next poll.
  void watch(std::chrono::milliseconds interval, StopSignal* stop = nullptr,
             const SummaryCallback& on_summary = {}) const;

  const ConverterConfig& config() const { return config_; }

private:
  ConverterConfig config_;
};

// Human-readable lines describing a conversion:
//   Playlists exported: 2
//   Total tracks: 3
//   Breakdown:
//     • Main / Peak (2 tracks)
std::vector<std::string> summaryLines(const ConversionSummary& summary);

// Logs summaryLines(summary) at info level.
void logSummary(const ConversionSummary& summary);
