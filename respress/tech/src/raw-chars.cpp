#include "respress/raw-chars.hpp"

#include <cassert>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <new>
#include <string_view>
#include <utility>

namespace respress {

RawChars::RawChars(size_type capacity) : _buf(static_cast<pointer>(std::malloc(capacity))), _capacity(capacity) {
  if (capacity != 0 && _buf == nullptr) {
    throw std::bad_alloc();
  }
}

RawChars::RawChars(std::string_view data) : RawChars(data.size()) {
  if (!data.empty()) {
    std::memcpy(_buf, data.data(), data.size());
    _size = data.size();
  }
}

RawChars::RawChars(const RawChars &rhs) : RawChars(rhs.size()) {
  if (!rhs.empty()) {
    std::memcpy(_buf, rhs.data(), rhs.size());
    _size = rhs.size();
  }
}

RawChars::RawChars(RawChars &&rhs) noexcept
    : _buf(std::exchange(rhs._buf, nullptr)),
      _size(std::exchange(rhs._size, 0)),
      _capacity(std::exchange(rhs._capacity, 0)) {}

RawChars &RawChars::operator=(const RawChars &rhs) {
  if (this != &rhs) {
    _size = 0;
    reserve(rhs.size());
    if (!rhs.empty()) {
      std::memcpy(_buf, rhs.data(), rhs.size());
    }
    _size = rhs.size();
  }
  return *this;
}

RawChars &RawChars::operator=(RawChars &&rhs) noexcept {
  if (this != &rhs) {
    std::free(_buf);
    _buf = std::exchange(rhs._buf, nullptr);
    _size = std::exchange(rhs._size, 0);
    _capacity = std::exchange(rhs._capacity, 0);
  }
  return *this;
}

RawChars::~RawChars() { std::free(_buf); }

void RawChars::unchecked_append(std::string_view data) {
  assert(data.size() <= availableCapacity());
  if (!data.empty()) {
    std::memcpy(_buf + _size, data.data(), data.size());
    _size += data.size();
  }
}

void RawChars::append(std::string_view data) {
  ensureAvailableCapacityExponential(data.size());
  unchecked_append(data);
}

void RawChars::setSize(size_type newSize) {
  assert(newSize <= _capacity);
  _size = newSize;
}

void RawChars::addSize(size_type delta) {
  assert(_size + delta <= _capacity);
  _size += delta;
}

void RawChars::reserve(size_type newCapacity) {
  if (_capacity < newCapacity) {
    reallocUp(newCapacity);
  }
}

void RawChars::ensureAvailableCapacity(size_type availableCapacity) {
  if (std::numeric_limits<size_type>::max() - _size < availableCapacity) {
    throw std::bad_alloc();
  }
  reserve(_size + availableCapacity);
}

void RawChars::ensureAvailableCapacityExponential(size_type availableCapacity) {
  if (std::numeric_limits<size_type>::max() - _size < availableCapacity) {
    throw std::bad_alloc();
  }
  const size_type required = _size + availableCapacity;
  if (_capacity < required) {
    size_type newCapacity = _capacity <= std::numeric_limits<size_type>::max() / 2U ? _capacity * 2U : required;
    if (newCapacity < required) {
      newCapacity = required;
    }
    reallocUp(newCapacity);
  }
}

void RawChars::release() noexcept {
  std::free(_buf);
  _buf = nullptr;
  _size = 0;
  _capacity = 0;
}

void RawChars::swap(RawChars &rhs) noexcept {
  using std::swap;
  swap(_buf, rhs._buf);
  swap(_size, rhs._size);
  swap(_capacity, rhs._capacity);
}

void RawChars::reallocUp(size_type newCapacity) {
  auto *newBuf = static_cast<pointer>(std::realloc(_buf, newCapacity));
  if (newBuf == nullptr) {
    throw std::bad_alloc();
  }
  _buf = newBuf;
  _capacity = newCapacity;
}

}  // namespace respress
