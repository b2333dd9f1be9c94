#include "rekordbox_xml.h"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <system_error>

#include <spdlog/fmt/fmt.h>

namespace {

// NODE@Type values.
const char kFolderNodeType[] = "0";
const char kPlaylistNodeType[] = "1";
// POSITION_MARK@Type for a cue.
const char kCueMarkType[] = "0";
// NODE@KeyType: TRACK@Key refers to COLLECTION/TRACK@TrackID.
const char kKeyTypeTrackId[] = "0";
const char kCueColorComponent[] = "255";

void writeElement(std::ostream& out, const XmlElement& element, size_t depth) {
  std::string indent(depth * 2, ' ');
  out << indent << '<' << element.name;
  for (const auto& [key, value] : element.attributes) {
    out << ' ' << key << "=\"" << escapeXml(value) << '"';
  }
  if (element.children.empty()) {
    out << "/>\n";
    return;
  }
  out << ">\n";
  for (const std::unique_ptr<XmlElement>& child : element.children) {
    writeElement(out, *child, depth + 1);
  }
  out << indent << "</" << element.name << ">\n";
}

bool isUnreservedUrlByte(unsigned char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_'
      || c == '.' || c == '-' || c == '~' || c == '/';
}

std::string displayName(const Track& track) {
  if (track.title && !track.title->empty()) {
    return *track.title;
  }
  return track.path.stem().string();
}

void appendCues(XmlElement* track_node, std::vector<CuePoint> cues) {
  std::stable_sort(cues.begin(), cues.end(), [](const CuePoint& a, const CuePoint& b) {
    if (a.index != b.index) {
      return a.index < b.index;
    }
    return a.position < b.position;
  });

  for (const CuePoint& cue : cues) {
    XmlElement* mark = track_node->addChild("POSITION_MARK");
    if (cue.name && !cue.name->empty()) {
      mark->setAttribute("Name", *cue.name);
    } else {
      mark->setAttribute("Name", "Hot Cue " + std::to_string(static_cast<uint64_t>(cue.index) + 1));
    }
    mark->setAttribute("Type", kCueMarkType);
    mark->setAttribute("Start", formatCuePosition(cue.position));
    mark->setAttribute("Num", std::to_string(cue.index));
    mark->setAttribute("Red", kCueColorComponent);
    mark->setAttribute("Green", kCueColorComponent);
    mark->setAttribute("Blue", kCueColorComponent);
  }
}

XmlElement* addNode(XmlElement* parent, const char* type, const std::string& name) {
  XmlElement* node = parent->addChild("NODE");
  node->setAttribute("Type", type);
  node->setAttribute("Name", name);
  return node;
}

// Returns the folder node for path, creating it and any missing ancestors first.
XmlElement* ensureFolder(const HierarchyKey& path, XmlElement* root_node,
                         std::map<HierarchyKey, XmlElement*>* folder_nodes) {
  if (path.empty()) {
    return root_node;
  }
  auto itr = folder_nodes->find(path);
  if (itr != folder_nodes->end()) {
    return itr->second;
  }
  HierarchyKey parent_path(path.begin(), path.end() - 1);
  XmlElement* parent = ensureFolder(parent_path, root_node, folder_nodes);
  XmlElement* folder = addNode(parent, kFolderNodeType, path.back());
  (*folder_nodes)[path] = folder;
  return folder;
}

}  // namespace

XmlElement* XmlElement::addChild(const std::string& child_name) {
  children.push_back(std::make_unique<XmlElement>(child_name));
  return children.back().get();
}

void XmlElement::setAttribute(const std::string& key, const std::string& value) {
  for (auto& attribute : attributes) {
    if (attribute.first == key) {
      attribute.second = value;
      return;
    }
  }
  attributes.emplace_back(key, value);
}

const std::string* XmlElement::attribute(const std::string& key) const {
  for (const auto& attribute : attributes) {
    if (attribute.first == key) {
      return &attribute.second;
    }
  }
  return nullptr;
}

std::vector<const XmlElement*> XmlElement::childrenNamed(const std::string& child_name) const {
  std::vector<const XmlElement*> ret;
  for (const std::unique_ptr<XmlElement>& child : children) {
    if (child->name == child_name) {
      ret.push_back(child.get());
    }
  }
  return ret;
}

std::string escapeXml(const std::string& text) {
  std::string ret;
  ret.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&': ret += "&amp;"; break;
      case '<': ret += "&lt;"; break;
      case '>': ret += "&gt;"; break;
      case '"': ret += "&quot;"; break;
      case '\'': ret += "&apos;"; break;
      case '\n': ret += "&#10;"; break;
      case '\r': ret += "&#13;"; break;
      case '\t': ret += "&#9;"; break;
      default:
        // Other control characters are not allowed in XML 1.0 at all.
        if (static_cast<unsigned char>(c) >= 0x20) {
          ret += c;
        }
    }
  }
  return ret;
}

void writeXml(std::ostream& out, const XmlElement& root) {
  out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
  writeElement(out, root, 0);
}

std::string toXmlString(const XmlElement& root) {
  std::ostringstream out;
  writeXml(out, root);
  return out.str();
}

std::string percentEncodePath(const std::string& path) {
  static const char kHexDigits[] = "0123456789ABCDEF";
  std::string ret;
  ret.reserve(path.size());
  for (char c : path) {
    unsigned char byte = static_cast<unsigned char>(c);
    if (isUnreservedUrlByte(byte)) {
      ret += c;
    } else {
      ret += '%';
      ret += kHexDigits[byte >> 4];
      ret += kHexDigits[byte & 0x0f];
    }
  }
  return ret;
}

std::string toFileUrl(const std::filesystem::path& path) {
  std::string absolute = resolveTrackPath(path).string();
  std::replace(absolute.begin(), absolute.end(), '\\', '/');
  std::string quoted = percentEncodePath(absolute);
  if (quoted.empty() || quoted.front() != '/') {
    quoted.insert(quoted.begin(), '/');
  }
  return "file://localhost" + quoted;
}

std::string formatCuePosition(float seconds) {
  return fmt::format("{:.6f}", seconds);
}

RekordboxXmlBuilder::RekordboxXmlBuilder(std::string product_name, std::string product_version,
                                         std::string company)
    : product_name_(std::move(product_name)),
      product_version_(std::move(product_version)),
      company_(std::move(company)) {}

std::unique_ptr<XmlElement> RekordboxXmlBuilder::build(const Hierarchy& hierarchy) const {
  auto root = std::make_unique<XmlElement>("DJ_PLAYLISTS");
  root->setAttribute("Version", "1.0.0");

  XmlElement* product = root->addChild("PRODUCT");
  product->setAttribute("Name", product_name_);
  product->setAttribute("Version", product_version_);
  product->setAttribute("Company", company_);

  TrackCollection collection(hierarchy);
  XmlElement* collection_node = root->addChild("COLLECTION");
  collection_node->setAttribute("Entries", std::to_string(collection.size()));
  for (size_t track_id = 1; track_id <= collection.size(); track_id++) {
    const Track& track = collection.track(track_id);
    XmlElement* track_node = collection_node->addChild("TRACK");
    track_node->setAttribute("TrackID", std::to_string(track_id));
    track_node->setAttribute("Name", displayName(track));
    track_node->setAttribute("Location", toFileUrl(track.path));
    appendCues(track_node, track.cue_points);
  }

  XmlElement* playlists_node = root->addChild("PLAYLISTS");
  XmlElement* root_node = addNode(playlists_node, kFolderNodeType, "ROOT");

  std::set<HierarchyKey> folder_paths = hierarchy.folders;
  for (const auto& [key, playlist] : hierarchy.playlists) {
    for (size_t depth = 1; depth <= playlist.parent_path.size(); depth++) {
      folder_paths.emplace(playlist.parent_path.begin(), playlist.parent_path.begin() + depth);
    }
  }

  std::map<HierarchyKey, XmlElement*> folder_nodes;
  for (const HierarchyKey& folder_path : folder_paths) {
    ensureFolder(folder_path, root_node, &folder_nodes);
  }

  std::vector<const std::pair<HierarchyKey, Playlist>*> sorted_playlists;
  for (const auto& entry : hierarchy.playlists) {
    sorted_playlists.push_back(&entry);
  }
  std::sort(sorted_playlists.begin(), sorted_playlists.end(),
            [](const auto* a, const auto* b) { return a->first < b->first; });

  for (const auto* entry : sorted_playlists) {
    const Playlist& playlist = entry->second;
    XmlElement* parent = ensureFolder(playlist.parent_path, root_node, &folder_nodes);
    XmlElement* playlist_node = addNode(parent, kPlaylistNodeType, playlist.name);
    playlist_node->setAttribute("KeyType", kKeyTypeTrackId);
    playlist_node->setAttribute("Entries", std::to_string(playlist.tracks.size()));
    playlist_node->setAttribute("Count", std::to_string(playlist.tracks.size()));
    for (const Track& track : playlist.tracks) {
      std::optional<size_t> track_id = collection.idForPath(track.path);
      if (!track_id) {
        continue;
      }
      playlist_node->addChild("TRACK")->setAttribute("Key", std::to_string(*track_id));
    }
  }

  // Folder nodes count their direct children.
  root_node->setAttribute("Count", std::to_string(root_node->children.size()));
  for (auto& [path, folder] : folder_nodes) {
    folder->setAttribute("Count", std::to_string(folder->children.size()));
  }

  return root;
}

void RekordboxXmlBuilder::serialize(const XmlElement& document,
                                    const std::filesystem::path& output) {
  std::filesystem::path parent = output.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw WriteException("Could not create directory " + parent.string() + ": " + ec.message());
    }
  }

  std::ofstream out(output, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw WriteException("Could not open " + output.string() + " for writing");
  }
  writeXml(out, document);
  out.flush();
  if (!out) {
    throw WriteException("Error while writing " + output.string());
  }
}
