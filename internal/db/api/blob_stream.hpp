#pragma once

#include <cstddef>
#include <cstdint>

namespace ducksql::db {

/*
  Seekable read-only view over a BLOB held by the engine.

  The bytes belong to the cursor's current row: a stream is only valid until
  the cursor advances.
*/
class BlobStream {
 public:
  virtual ~BlobStream() = default;

  // Declared size in bytes.
  virtual std::size_t Length() const   = 0;
  virtual std::size_t Position() const = 0;

  virtual void Seek(std::size_t position) = 0;

  // Copies up to `count` bytes from the current position; returns bytes copied, 0 at end.
  virtual std::size_t Read(std::uint8_t* buffer, std::size_t count) = 0;
};

class MemoryBlobStream final : public BlobStream {
 public:
  MemoryBlobStream(const std::uint8_t* data, std::size_t length) : data_(data), length_(length) {
  }

  std::size_t Length() const override {
    return length_;
  }
  std::size_t Position() const override {
    return position_;
  }

  void Seek(std::size_t position) override {
    position_ = position > length_ ? length_ : position;
  }

  std::size_t Read(std::uint8_t* buffer, std::size_t count) override;

 private:
  const std::uint8_t* data_;
  std::size_t         length_;
  std::size_t         position_ = 0;
};

} // namespace ducksql::db
