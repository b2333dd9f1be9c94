#include "chunk_reader.h"

#include <utility>

#include <spdlog/spdlog.h>

ByteView ByteView::subview(size_t offset, size_t count) const {
  if (offset >= size) {
    return ByteView(data + size, 0);
  }
  if (count > size - offset) {
    count = size - offset;
  }
  return ByteView(data + offset, count);
}

uint32_t readUint32BE(const uint8_t* bytes) {
  return (static_cast<uint32_t>(bytes[0]) << 24) | (static_cast<uint32_t>(bytes[1]) << 16)
      | (static_cast<uint32_t>(bytes[2]) << 8) | static_cast<uint32_t>(bytes[3]);
}

std::string decodeTag(const uint8_t* bytes) {
  std::string tag(kTagSize, '?');
  for (size_t i = 0; i < kTagSize; i++) {
    if (bytes[i] >= 0x20 && bytes[i] < 0x7f) {
      tag[i] = static_cast<char>(bytes[i]);
    }
  }
  return tag;
}

ChunkReader::Iterator::Iterator(ByteView buffer) : buffer_(buffer), done_(false) {
  readChunk();
}

ChunkReader::Iterator& ChunkReader::Iterator::operator++() {
  offset_ = next_offset_;
  readChunk();
  return *this;
}

ChunkReader::Iterator ChunkReader::Iterator::operator++(int) {
  Iterator ret = *this;
  ++*this;
  return ret;
}

bool ChunkReader::Iterator::operator==(const Iterator& other) const {
  if (done_ || other.done_) {
    return done_ == other.done_;
  }
  return buffer_.data == other.buffer_.data && offset_ == other.offset_;
}

void ChunkReader::Iterator::readChunk() {
  if (done_ || offset_ > buffer_.size || buffer_.size - offset_ < kChunkHeaderSize) {
    done_ = true;
    return;
  }

  const uint8_t* header = buffer_.data + offset_;
  std::string tag = decodeTag(header);
  size_t record_size = readUint32BE(header + kTagSize);
  size_t payload_offset = offset_ + kChunkHeaderSize;

  if (record_size > buffer_.size - payload_offset) {
    spdlog::warn("Chunk {} extends beyond end of buffer (len={}, offset={})", tag, record_size,
                 offset_);
    done_ = true;
    return;
  }

  current_.tag = std::move(tag);
  current_.payload = ByteView(buffer_.data + payload_offset, record_size);
  next_offset_ = payload_offset + record_size;
}
