#ifndef SLICE_H
#define SLICE_H

#include <cstddef>
#include <cstring>
#include <string>

// lightweight non-owning, read-only view into a byte buffer.
// A Slice over a store-enumerated field is only valid until the next
// enumeration call on that store.
struct Slice {
 public:
  static constexpr size_t npos = static_cast<size_t>(-1);

  Slice();
  Slice(const void* data, size_t size);
  Slice(const char* cstr);

  Slice(const Slice& other) = default;
  Slice& operator=(const Slice& other) = default;

  const char* data() const;
  bool empty() const;
  size_t size() const;

  // Index of the first occurrence of c, or npos.
  size_t find(char c) const;

  // First n bytes (clamped to size()).
  Slice prefix(size_t n) const;

  // Everything from pos to the end; empty if pos >= size().
  Slice suffix_from(size_t pos) const;

  // Copies the viewed bytes. Embedded NULs are kept.
  std::string ToString() const {
    if (empty()) {
      return "";
    }
    return std::string(ptr_, size_);
  }

 private:
  const char* ptr_ = nullptr;
  std::size_t size_ = 0;
};
#endif //SLICE_H
