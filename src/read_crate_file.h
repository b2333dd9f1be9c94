// This file contains code to read and parse the raw *.crate files from disk.
#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "chunk_reader.h"
#include "seratorekordbox.h"

// A .crate file is a flat sequence of chunks (see chunk_reader.h). Each track in the crate is an
// "otrk" chunk whose payload is itself a chunk sequence holding the track's fields. We read:
//
//   pfil  path of the audio file (required; entries without it are dropped)
//   pnam  track title
//   pcue  cue points
//
// Strings are stored as a 4-byte big-endian byte count followed by that many bytes of UTF-8.
// Cue lists are a 4-byte big-endian count followed by (uint32 index, float32 position) pairs,
// all big-endian. Unknown chunks are skipped, so newer Serato versions that add fields still
// load.
//
// For more information on the on-disk format, see
// https://www.mixxx.org/wiki/doku.php/serato_database_format

const char kTrackTag[] = "otrk";
const char kTitleTag[] = "pnam";
const char kPathTag[] = "pfil";
const char kCueListTag[] = "pcue";

typedef void (*FieldReader)(ByteView payload, Track* track);

// Readers for the fields of a track chunk, keyed by tag.
extern const std::map<std::string, FieldReader> kTrackFields;

// Decodes a string field. Never fails: invalid UTF-8 is dropped, a trailing NUL is stripped and
// payloads too short to carry a length prefix are taken as the text itself.
std::string decodeSeratoString(ByteView payload);

// Decodes a pcue payload. Entries cut off by the end of the payload are ignored.
std::vector<CuePoint> decodeCuePoints(ByteView payload);

// Decodes the fields of one otrk chunk. Returns false if the entry has no file path.
bool decodeTrack(ByteView payload, Track* track);

// Decodes all tracks of a crate file's contents, in file order.
std::vector<Track> decodeCrate(ByteView contents);

// Reads the whole file at path. Throws ReadException if it cannot be read.
std::vector<uint8_t> readFileBytes(const std::filesystem::path& path);

// Reads and decodes the crate file at path. Throws ReadException if it cannot be read.
std::vector<Track> loadCrate(const std::filesystem::path& path);
