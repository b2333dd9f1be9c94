#include "read_crate_file.h"

#include <cctype>
#include <cstdio>
#include <cstring>
#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

const size_t kCueEntrySize = 8;

// Length of the valid UTF-8 sequence starting at bytes[0], or 0 if it isn't one.
size_t utf8SequenceLength(const uint8_t* bytes, size_t available) {
  uint8_t lead = bytes[0];
  if (lead < 0x80) {
    return 1;
  }

  size_t len = 0;
  uint8_t min_second = 0x80;
  uint8_t max_second = 0xbf;
  if (lead >= 0xc2 && lead <= 0xdf) {
    len = 2;
  } else if (lead >= 0xe0 && lead <= 0xef) {
    len = 3;
    if (lead == 0xe0) {
      min_second = 0xa0;  // overlong
    } else if (lead == 0xed) {
      max_second = 0x9f;  // surrogates
    }
  } else if (lead >= 0xf0 && lead <= 0xf4) {
    len = 4;
    if (lead == 0xf0) {
      min_second = 0x90;  // overlong
    } else if (lead == 0xf4) {
      max_second = 0x8f;  // above U+10FFFF
    }
  } else {
    return 0;
  }

  if (len > available) {
    return 0;
  }
  if (bytes[1] < min_second || bytes[1] > max_second) {
    return 0;
  }
  for (size_t i = 2; i < len; i++) {
    if (bytes[i] < 0x80 || bytes[i] > 0xbf) {
      return 0;
    }
  }
  return len;
}

// Copies the valid UTF-8 sequences of bytes and drops everything else.
std::string decodeUtf8Lossy(ByteView bytes) {
  std::string ret;
  ret.reserve(bytes.size);
  size_t i = 0;
  while (i < bytes.size) {
    size_t len = utf8SequenceLength(bytes.data + i, bytes.size - i);
    if (len == 0) {
      i++;
      continue;
    }
    ret.append(reinterpret_cast<const char*>(bytes.data + i), len);
    i += len;
  }
  return ret;
}

bool isTrackTag(const std::string& tag) {
  if (tag.size() != kTagSize) {
    return false;
  }
  for (size_t i = 0; i < kTagSize; i++) {
    if (std::tolower(static_cast<unsigned char>(tag[i])) != kTrackTag[i]) {
      return false;
    }
  }
  return true;
}

void readTitle(ByteView payload, Track* track) {
  track->title = decodeSeratoString(payload);
}

void readPath(ByteView payload, Track* track) {
  track->path = decodeSeratoString(payload);
}

void readCuePoints(ByteView payload, Track* track) {
  // A later pcue chunk replaces an earlier one.
  track->cue_points = decodeCuePoints(payload);
}

}  // namespace

const std::map<std::string, FieldReader> kTrackFields = {
  {kTitleTag, readTitle},
  {kPathTag, readPath},
  {kCueListTag, readCuePoints},
};

std::string decodeSeratoString(ByteView payload) {
  if (payload.empty()) {
    return "";
  }

  ByteView text = payload;
  if (payload.size >= kRecordSizeSize) {
    size_t declared_size = readUint32BE(payload.data);
    text = payload.subview(kRecordSizeSize, declared_size);
  }

  std::string ret = decodeUtf8Lossy(text);
  if (!ret.empty() && ret.back() == '\0') {
    ret.pop_back();
  }
  return ret;
}

std::vector<CuePoint> decodeCuePoints(ByteView payload) {
  std::vector<CuePoint> ret;
  if (payload.size < kRecordSizeSize) {
    return ret;
  }

  uint32_t count = readUint32BE(payload.data);
  size_t offset = kRecordSizeSize;
  for (uint32_t i = 0; i < count; i++) {
    if (payload.size - offset < kCueEntrySize) {
      spdlog::debug("Cue list declares {} entries but only holds {}", count, i);
      break;
    }
    CuePoint cue;
    cue.index = readUint32BE(payload.data + offset);
    uint32_t position_bits = readUint32BE(payload.data + offset + 4);
    std::memcpy(&cue.position, &position_bits, sizeof(cue.position));
    ret.push_back(std::move(cue));
    offset += kCueEntrySize;
  }
  return ret;
}

bool decodeTrack(ByteView payload, Track* track) {
  for (const Chunk& chunk : ChunkReader(payload)) {
    auto itr = kTrackFields.find(chunk.tag);
    if (itr == kTrackFields.end()) {
      // Field is not supported, silently ignore it.
      continue;
    }
    itr->second(chunk.payload, track);
  }
  return !track->path.empty();
}

std::vector<Track> decodeCrate(ByteView contents) {
  std::vector<Track> ret;
  for (const Chunk& chunk : ChunkReader(contents)) {
    if (!isTrackTag(chunk.tag)) {
      continue;
    }
    Track track;
    if (!decodeTrack(chunk.payload, &track)) {
      spdlog::debug("Skipping crate entry without a file path");
      continue;
    }
    ret.push_back(std::move(track));
  }
  return ret;
}

std::vector<uint8_t> readFileBytes(const std::filesystem::path& path) {
  std::unique_ptr<FILE, decltype(&fclose)> file(fopen(path.c_str(), "rb"), &fclose);
  if (file == nullptr) {
    throw ReadException("Could not open file at path " + path.string());
  }

  std::vector<uint8_t> ret;
  uint8_t buffer[8192];
  size_t n = 0;
  while ((n = fread(buffer, 1, sizeof(buffer), file.get())) > 0) {
    ret.insert(ret.end(), buffer, buffer + n);
  }
  if (ferror(file.get())) {
    throw ReadException("Error while reading file at path " + path.string());
  }
  return ret;
}

std::vector<Track> loadCrate(const std::filesystem::path& path) {
  std::vector<uint8_t> contents = readFileBytes(path);
  return decodeCrate(contents);
}
