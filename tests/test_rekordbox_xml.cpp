#include "rekordbox_xml.h"

#include <gtest/gtest.h>

#include "crate_builder.h"

namespace {

Track makeTrack(const std::filesystem::path& path, std::optional<std::string> title = std::nullopt,
                std::vector<CuePoint> cues = {}) {
  Track track;
  track.path = path;
  track.title = std::move(title);
  track.cue_points = std::move(cues);
  return track;
}

std::string attr(const XmlElement* element, const std::string& key) {
  const std::string* value = element->attribute(key);
  return value != nullptr ? *value : "<unset>";
}

// Direct child NODE with the given Type and Name, or nullptr.
const XmlElement* childNode(const XmlElement* parent, const std::string& type,
                            const std::string& name) {
  for (const XmlElement* node : parent->childrenNamed("NODE")) {
    if (attr(node, "Type") == type && attr(node, "Name") == name) {
      return node;
    }
  }
  return nullptr;
}

const XmlElement* rootNode(const XmlElement& document) {
  return document.childrenNamed("PLAYLISTS").at(0)->childrenNamed("NODE").at(0);
}

std::unique_ptr<XmlElement> buildDocument(std::vector<CrateTracks> crates) {
  Hierarchy hierarchy = buildHierarchy(std::move(crates));
  RekordboxXmlBuilder builder("serato-rekordbox-sync", "0.2.0", "serato-rekordbox-sync");
  return builder.build(hierarchy);
}

}  // namespace

TEST(EscapeXmlTest, EscapesMarkupAndWhitespace) {
  EXPECT_EQ(escapeXml("Tom & \"Jerry\" <live>"), "Tom &amp; &quot;Jerry&quot; &lt;live&gt;");
  EXPECT_EQ(escapeXml("a\tb\nc\x01"), "a&#9;b&#10;c");
  EXPECT_EQ(escapeXml("Caf\xC3\xA9"), "Caf\xC3\xA9");
}

TEST(FileUrlTest, PercentEncodesPath) {
  EXPECT_EQ(percentEncodePath("/Users/dj/My Music/Caf\xC3\xA9 #1.mp3"),
            "/Users/dj/My%20Music/Caf%C3%A9%20%231.mp3");
  EXPECT_EQ(percentEncodePath("/a-b_c.d~e/"), "/a-b_c.d~e/");
}

TEST(FileUrlTest, PrefixesLocalhost) {
  EXPECT_EQ(toFileUrl("/music/a b.mp3"), "file://localhost/music/a%20b.mp3");
}

TEST(FileUrlTest, ResolvesRelativePaths) {
  std::string url = toFileUrl("relative/track.mp3");
  std::string cwd = percentEncodePath(
      std::filesystem::weakly_canonical(std::filesystem::current_path()).string());
  EXPECT_EQ(url, "file://localhost" + cwd + "/relative/track.mp3");
}

TEST(FormatCuePositionTest, UsesSixDecimals) {
  EXPECT_EQ(formatCuePosition(1.25f), "1.250000");
  EXPECT_EQ(formatCuePosition(5.5f), "5.500000");
  EXPECT_EQ(formatCuePosition(0.0f), "0.000000");
}

TEST(RekordboxXmlBuilderTest, WritesProductAndCollection) {
  std::vector<CrateTracks> crates(2);
  crates[0].key = {"Evening"};
  crates[0].tracks = {makeTrack("/music/one.mp3", "Song One"), makeTrack("/music/two.mp3")};
  crates[1].key = {"WarmUp"};
  crates[1].tracks = {makeTrack("/music/one.mp3", "Song One")};

  std::unique_ptr<XmlElement> document = buildDocument(std::move(crates));
  EXPECT_EQ(document->name, "DJ_PLAYLISTS");
  EXPECT_EQ(attr(document.get(), "Version"), "1.0.0");

  const XmlElement* product = document->childrenNamed("PRODUCT").at(0);
  EXPECT_EQ(attr(product, "Name"), "serato-rekordbox-sync");
  EXPECT_EQ(attr(product, "Version"), "0.2.0");

  const XmlElement* collection = document->childrenNamed("COLLECTION").at(0);
  EXPECT_EQ(attr(collection, "Entries"), "2");
  std::vector<const XmlElement*> tracks = collection->childrenNamed("TRACK");
  ASSERT_EQ(tracks.size(), 2u);
  EXPECT_EQ(attr(tracks[0], "TrackID"), "1");
  EXPECT_EQ(attr(tracks[0], "Name"), "Song One");
  EXPECT_EQ(attr(tracks[0], "Location"), "file://localhost/music/one.mp3");
  EXPECT_EQ(attr(tracks[1], "TrackID"), "2");
  // Without a title the file name is shown.
  EXPECT_EQ(attr(tracks[1], "Name"), "two");
}

TEST(RekordboxXmlBuilderTest, SharedTrackHasOneIdInBothPlaylists) {
  std::vector<CrateTracks> crates(2);
  crates[0].key = {"A"};
  crates[0].tracks = {makeTrack("/music/shared.mp3"), makeTrack("/music/a.mp3")};
  crates[1].key = {"B"};
  crates[1].tracks = {makeTrack("/music/b.mp3"), makeTrack("/music/./shared.mp3")};

  std::unique_ptr<XmlElement> document = buildDocument(std::move(crates));
  EXPECT_EQ(document->childrenNamed("COLLECTION").at(0)->childrenNamed("TRACK").size(), 3u);

  const XmlElement* root = rootNode(*document);
  std::vector<const XmlElement*> a = childNode(root, "1", "A")->childrenNamed("TRACK");
  std::vector<const XmlElement*> b = childNode(root, "1", "B")->childrenNamed("TRACK");
  ASSERT_EQ(a.size(), 2u);
  ASSERT_EQ(b.size(), 2u);
  EXPECT_EQ(attr(a[0], "Key"), "1");
  EXPECT_EQ(attr(a[1], "Key"), "2");
  EXPECT_EQ(attr(b[0], "Key"), "3");
  EXPECT_EQ(attr(b[1], "Key"), "1");
}

TEST(RekordboxXmlBuilderTest, NestedCrateCreatesFolderChain) {
  std::vector<CrateTracks> crates(1);
  crates[0].key = {"Main", "Sub", "Deep"};
  crates[0].tracks = {makeTrack("/music/a.mp3")};

  std::unique_ptr<XmlElement> document = buildDocument(std::move(crates));
  const XmlElement* root = rootNode(*document);
  EXPECT_EQ(attr(root, "Name"), "ROOT");
  EXPECT_EQ(attr(root, "Type"), "0");
  EXPECT_EQ(attr(root, "Count"), "1");

  const XmlElement* main = childNode(root, "0", "Main");
  ASSERT_NE(main, nullptr);
  const XmlElement* sub = childNode(main, "0", "Sub");
  ASSERT_NE(sub, nullptr);
  EXPECT_EQ(main->children.size(), 1u);
  const XmlElement* deep = childNode(sub, "1", "Deep");
  ASSERT_NE(deep, nullptr);
  EXPECT_EQ(attr(deep, "Entries"), "1");
  EXPECT_EQ(attr(deep, "Count"), "1");
  EXPECT_EQ(attr(deep, "KeyType"), "0");
}

TEST(RekordboxXmlBuilderTest, MixedFolderAndPlaylist) {
  std::vector<CrateTracks> crates(2);
  crates[0].key = {"Main", "Sub", "Peak"};
  crates[0].tracks = {makeTrack("/music/hit.mp3")};
  crates[1].key = {"Main"};
  crates[1].tracks = {makeTrack("/music/song.mp3"), makeTrack("/music/other.mp3")};

  std::unique_ptr<XmlElement> document = buildDocument(std::move(crates));
  const XmlElement* root = rootNode(*document);
  ASSERT_EQ(root->children.size(), 1u);

  const XmlElement* main = childNode(root, "0", "Main");
  ASSERT_NE(main, nullptr);
  EXPECT_EQ(attr(main, "Count"), "2");
  const XmlElement* main_playlist = childNode(main, "1", "Main");
  ASSERT_NE(main_playlist, nullptr);
  EXPECT_EQ(attr(main_playlist, "Count"), "2");
  const XmlElement* sub = childNode(main, "0", "Sub");
  ASSERT_NE(sub, nullptr);
  const XmlElement* peak = childNode(sub, "1", "Peak");
  ASSERT_NE(peak, nullptr);
  EXPECT_EQ(attr(peak, "Count"), "1");

  // All folders exist before the first playlist is placed.
  EXPECT_EQ(main->children[0].get(), sub);
}

TEST(RekordboxXmlBuilderTest, PlaylistsFollowKeyOrder) {
  std::vector<CrateTracks> crates(3);
  crates[0].key = {"Zulu"};
  crates[1].key = {"Alpha"};
  crates[2].key = {"Mike"};

  std::unique_ptr<XmlElement> document = buildDocument(std::move(crates));
  const XmlElement* root = rootNode(*document);
  ASSERT_EQ(root->children.size(), 3u);
  EXPECT_EQ(attr(root->children[0].get(), "Name"), "Alpha");
  EXPECT_EQ(attr(root->children[1].get(), "Name"), "Mike");
  EXPECT_EQ(attr(root->children[2].get(), "Name"), "Zulu");
  EXPECT_EQ(attr(root->children[0].get(), "Entries"), "0");
}

TEST(RekordboxXmlBuilderTest, CueMarkersSortedAndFormatted) {
  CuePoint late{1, 5.5f, std::nullopt};
  CuePoint early{0, 1.25f, std::nullopt};
  CuePoint named{3, 0.5f, std::string("Drop")};
  std::vector<CrateTracks> crates(1);
  crates[0].key = {"Cue"};
  crates[0].tracks = {makeTrack("/music/song.mp3", "Song", {named, late, early})};

  std::unique_ptr<XmlElement> document = buildDocument(std::move(crates));
  const XmlElement* collection = document->childrenNamed("COLLECTION").at(0);
  const XmlElement* track = collection->childrenNamed("TRACK").at(0);
  std::vector<const XmlElement*> marks = track->childrenNamed("POSITION_MARK");
  ASSERT_EQ(marks.size(), 3u);
  EXPECT_EQ(attr(marks[0], "Start"), "1.250000");
  EXPECT_EQ(attr(marks[0], "Num"), "0");
  EXPECT_EQ(attr(marks[0], "Name"), "Hot Cue 1");
  EXPECT_EQ(attr(marks[0], "Type"), "0");
  EXPECT_EQ(attr(marks[0], "Red"), "255");
  EXPECT_EQ(attr(marks[0], "Green"), "255");
  EXPECT_EQ(attr(marks[0], "Blue"), "255");
  EXPECT_EQ(attr(marks[1], "Start"), "5.500000");
  EXPECT_EQ(attr(marks[1], "Name"), "Hot Cue 2");
  EXPECT_EQ(attr(marks[2], "Name"), "Drop");
  EXPECT_EQ(attr(marks[2], "Num"), "3");
}

TEST(RekordboxXmlBuilderTest, SerializesIndentedDocument) {
  XmlElement root("DJ_PLAYLISTS");
  root.setAttribute("Version", "1.0.0");
  root.addChild("PRODUCT")->setAttribute("Name", "a&b");
  root.addChild("PLAYLISTS");

  EXPECT_EQ(toXmlString(root),
            "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
            "<DJ_PLAYLISTS Version=\"1.0.0\">\n"
            "  <PRODUCT Name=\"a&amp;b\"/>\n"
            "  <PLAYLISTS/>\n"
            "</DJ_PLAYLISTS>\n");
}

class SerializeTest : public TempDirTest {};

TEST_F(SerializeTest, CreatesParentDirectories) {
  XmlElement root("DJ_PLAYLISTS");
  std::filesystem::path output = dir_ / "nested" / "deeper" / "rekordbox.xml";

  RekordboxXmlBuilder::serialize(root, output);
  EXPECT_EQ(readText(output), toXmlString(root));
}

TEST_F(SerializeTest, UnwritableOutputThrows) {
  writeBytes(dir_ / "file", Bytes{'x'});
  XmlElement root("DJ_PLAYLISTS");
  EXPECT_THROW(RekordboxXmlBuilder::serialize(root, dir_ / "file" / "out.xml"), WriteException);
}
