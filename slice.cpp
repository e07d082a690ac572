#include "slice.hpp"
#include <cstddef>
#include <algorithm>
#include <cstring>


Slice::Slice() {};

Slice::Slice(const void* data, size_t size)
    : ptr_(static_cast<const char*>(data)), size_(data == nullptr ? 0 : size) {};

Slice::Slice(const char* cstr) : ptr_(cstr), size_(cstr == nullptr ? 0 : std::strlen(cstr)) {};

const char* Slice::data() const {
  return ptr_;
}

bool Slice::empty() const {
  return (size_ == 0);
}

size_t Slice::size() const {
  return size_;
}

size_t Slice::find(char c) const {
  if (empty()) {
    return npos;
  }
  const void* hit = std::memchr(ptr_, c, size_);
  if (hit == nullptr) {
    return npos;
  }
  return static_cast<size_t>(static_cast<const char*>(hit) - ptr_);
}

Slice Slice::prefix(size_t n) const {
  return Slice(ptr_, std::min(n, size_));
}

Slice Slice::suffix_from(size_t pos) const {
  if (pos >= size_) {
    return Slice();
  }
  return Slice(ptr_ + pos, size_ - pos);
}
