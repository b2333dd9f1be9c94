// Iteration over the chunk structure shared by Serato's .crate and database files.
#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include <vector>

// Every chunk is a 4-byte tag, a 4-byte big-endian payload size and then the payload itself.
// Payloads of container chunks (such as a track entry) are chunk sequences themselves.
const size_t kTagSize = 4;
const size_t kRecordSizeSize = 4;
const size_t kChunkHeaderSize = kTagSize + kRecordSizeSize;

// Non-owning view of a byte range.
struct ByteView {
  const uint8_t* data = nullptr;
  size_t size = 0;

  ByteView() = default;
  ByteView(const uint8_t* data, size_t size) : data(data), size(size) {}
  ByteView(const std::vector<uint8_t>& bytes) : data(bytes.data()), size(bytes.size()) {}

  bool empty() const { return size == 0; }
  ByteView subview(size_t offset, size_t count) const;
};

struct Chunk {
  std::string tag;
  ByteView payload;
};

uint32_t readUint32BE(const uint8_t* bytes);

// Turns the raw tag bytes into a 4-character string. Bytes outside printable ASCII are replaced
// with '?', so corrupt tags never match a known tag and never produce invalid text.
std::string decodeTag(const uint8_t* bytes);

// Lazily walks the chunks of a buffer. Iteration stops at the first chunk whose declared size
// runs past the end of the buffer; that chunk and any trailing bytes shorter than a chunk header
// are not yielded. The reader does not own the buffer, which must outlive it. Every call to
// begin() starts again from the first chunk.
class ChunkReader {
public:
  class Iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Chunk;
    using difference_type = std::ptrdiff_t;
    using pointer = const Chunk*;
    using reference = const Chunk&;

    // End iterator.
    Iterator() = default;
    explicit Iterator(ByteView buffer);

    reference operator*() const { return current_; }
    pointer operator->() const { return &current_; }
    Iterator& operator++();
    Iterator operator++(int);

    bool operator==(const Iterator& other) const;
    bool operator!=(const Iterator& other) const { return !(*this == other); }

  private:
    void readChunk();

    ByteView buffer_;
    size_t offset_ = 0;
    size_t next_offset_ = 0;
    bool done_ = true;
    Chunk current_;
  };

  explicit ChunkReader(ByteView buffer) : buffer_(buffer) {}

  Iterator begin() const { return Iterator(buffer_); }
  Iterator end() const { return Iterator(); }

private:
  ByteView buffer_;
};
