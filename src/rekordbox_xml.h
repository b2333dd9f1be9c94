// Construction and serialization of Rekordbox XML documents.
#pragma once

#include <filesystem>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "hierarchy.h"
#include "seratorekordbox.h"

// Minimal element tree. Attributes keep their insertion order so the written document is stable.
struct XmlElement {
  std::string name;
  std::vector<std::pair<std::string, std::string>> attributes;
  std::vector<std::unique_ptr<XmlElement>> children;

  explicit XmlElement(std::string name) : name(std::move(name)) {}

  // Appends a new child element and returns it. The pointer stays valid for the lifetime of this
  // element.
  XmlElement* addChild(const std::string& child_name);
  // Replaces the value if the attribute already exists.
  void setAttribute(const std::string& key, const std::string& value);
  // nullptr if the attribute isn't set.
  const std::string* attribute(const std::string& key) const;

  // Direct children with the given element name.
  std::vector<const XmlElement*> childrenNamed(const std::string& child_name) const;
};

std::string escapeXml(const std::string& text);

// Writes an XML declaration followed by root and its subtree, two spaces of indentation per level.
void writeXml(std::ostream& out, const XmlElement& root);
std::string toXmlString(const XmlElement& root);

// Percent-encodes everything but unreserved characters and '/'. Multi-byte UTF-8 characters are
// encoded byte by byte.
std::string percentEncodePath(const std::string& path);

// file://localhost/... URL for a track, as Rekordbox expects in TRACK@Location.
std::string toFileUrl(const std::filesystem::path& path);

// Formats a cue position in seconds as Rekordbox's POSITION_MARK@Start ("1.250000").
std::string formatCuePosition(float seconds);

class RekordboxXmlBuilder {
public:
  RekordboxXmlBuilder(std::string product_name, std::string product_version, std::string company);

  // Builds the DJ_PLAYLISTS document: a COLLECTION with every distinct track, then a PLAYLISTS
  // tree rooted at the ROOT folder node. Folders are created parent first and exactly once;
  // playlists follow in key order.
  std::unique_ptr<XmlElement> build(const Hierarchy& hierarchy) const;

  // Writes document to output, creating missing parent directories. Throws WriteException.
  static void serialize(const XmlElement& document, const std::filesystem::path& output);

private:
  std::string product_name_;
  std::string product_version_;
  std::string company_;
};
