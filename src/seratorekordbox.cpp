#include <cstdlib>
#include <memory>
#include <optional>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "seratorekordbox.h"
#include "crate_files.h"
#include "hierarchy.h"
#include "read_crate_file.h"
#include "rekordbox_xml.h"


namespace {

std::filesystem::path seratoDirPath() {
  const char* home = std::getenv("HOME");
  std::filesystem::path home_path = home != nullptr ? home : ".";
  return home_path / "Music" / "_Serato_";
}

std::string joinKey(const HierarchyKey& key) {
  std::string ret;
  for (const std::string& piece : key) {
    if (!ret.empty()) {
      ret += " / ";
    }
    ret += piece;
  }
  return ret;
}

// Reads every crate and reconciles them into the folder/playlist hierarchy.
Hierarchy loadHierarchy(const std::filesystem::path& crate_root) {
  std::vector<CrateTracks> crates;
  for (CrateEntry& entry : enumerateCrates(crate_root)) {
    CrateTracks crate;
    crate.tracks = loadCrate(entry.file);
    spdlog::debug("Read {} tracks from {}", crate.tracks.size(), entry.file.string());
    crate.key = std::move(entry.key);
    crates.push_back(std::move(crate));
  }
  return buildHierarchy(std::move(crates));
}

ConversionSummary summarize(const Hierarchy& hierarchy, const std::filesystem::path& output) {
  ConversionSummary ret;
  ret.output = output;
  for (const auto& [key, playlist] : hierarchy.playlists) {
    ret.playlist_counts.emplace_back(joinKey(key), playlist.tracks.size());
    ret.track_count += playlist.tracks.size();
  }
  return ret;
}

}  // namespace


std::filesystem::path defaultCrateRoot() {
  return seratoDirPath() / "Subcrates";
}

std::filesystem::path defaultOutputPath() {
  return seratoDirPath() / "rekordbox-export.xml";
}

void StopSignal::stop() {
  // Notified under the lock, so a waiter never sees stopped_ before notify_all() has returned.
  std::lock_guard<std::mutex> lock(mutex_);
  stopped_ = true;
  cv_.notify_all();
}

bool StopSignal::stopped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stopped_;
}

bool StopSignal::waitFor(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this] { return stopped_; });
}

Converter::Converter(ConverterConfig config) : config_(std::move(config)) {
  if (config_.output.empty()) {
    throw ConfigException("No output path given");
  }
  std::error_code ec;
  if (!std::filesystem::exists(config_.crate_root, ec)) {
    throw ConfigException("Crate root does not exist: " + config_.crate_root.string());
  }
  if (!std::filesystem::is_directory(config_.crate_root, ec)) {
    throw ConfigException("Crate root is not a directory: " + config_.crate_root.string());
  }
}

ConversionSummary Converter::runOnce(bool write) const {
  Hierarchy hierarchy = loadHierarchy(config_.crate_root);

  RekordboxXmlBuilder builder(config_.product_name, config_.product_version, config_.company);
  std::unique_ptr<XmlElement> document = builder.build(hierarchy);
  if (write) {
    RekordboxXmlBuilder::serialize(*document, config_.output);
  } else {
    spdlog::debug("Dry run, not writing {}", config_.output.string());
  }

  return summarize(hierarchy, config_.output);
}

CrateSnapshot Converter::snapshot() const {
  return snapshotCrates(config_.crate_root);
}

void Converter::watch(std::chrono::milliseconds interval, StopSignal* stop,
                      const SummaryCallback& on_summary) const {
  std::optional<CrateSnapshot> last_snapshot;
  while (stop == nullptr || !stop->stopped()) {
    try {
      CrateSnapshot current = snapshot();
      if (current != last_snapshot) {
        ConversionSummary summary = runOnce();
        spdlog::info("Wrote {}", summary.output.string());
        logSummary(summary);
        if (on_summary) {
          on_summary(summary);
        }
        last_snapshot = std::move(current);
      }
    } catch (const ReadException& e) {
      spdlog::error("Conversion failed, retrying in {} ms: {}", interval.count(), e.what());
    } catch (const WriteException& e) {
      spdlog::error("Conversion failed, retrying in {} ms: {}", interval.count(), e.what());
    }

    if (stop != nullptr) {
      if (stop->waitFor(interval)) {
        break;
      }
    } else {
      std::this_thread::sleep_for(interval);
    }
  }
}

std::vector<std::string> summaryLines(const ConversionSummary& summary) {
  std::vector<std::string> ret;
  ret.push_back("Playlists exported: " + std::to_string(summary.playlistCount()));
  ret.push_back("Total tracks: " + std::to_string(summary.track_count));
  if (!summary.playlist_counts.empty()) {
    ret.push_back("Breakdown:");
    for (const auto& [name, count] : summary.playlist_counts) {
      ret.push_back("  \xE2\x80\xA2 " + name + " (" + std::to_string(count) + " tracks)");
    }
  }
  return ret;
}

void logSummary(const ConversionSummary& summary) {
  for (const std::string& line : summaryLines(summary)) {
    spdlog::info(line);
  }
}
