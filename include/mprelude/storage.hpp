// In-object payload buffers for Maybe and Either. The owner decides which
// type is alive, builds it with placement new and runs its destructor; the
// buffers themselves never construct or destroy anything.

#pragma once

#include <cstddef>

namespace mprelude {
namespace detail {

// Size bytes, aligned for the strictest scalar a payload is likely to hold.
template <std::size_t Size>
union AlignedBytes {
  char data[Size];
  void* pointerAlign;
  long double scalarAlign;
};

template <typename T>
struct RawStorage {
  AlignedBytes<sizeof(T)> bytes;

  void* Ptr() { return bytes.data; }
  const void* Ptr() const { return bytes.data; }
  T* Obj() { return static_cast<T*>(Ptr()); }
  const T* Obj() const { return static_cast<const T*>(Ptr()); }
};

// Room for an A or a B, one at a time.
template <typename A, typename B>
struct DualStorage {
  AlignedBytes<(sizeof(A) > sizeof(B)) ? sizeof(A) : sizeof(B)> bytes;

  void* Ptr() { return bytes.data; }
  const void* Ptr() const { return bytes.data; }
  A* First() { return static_cast<A*>(Ptr()); }
  const A* First() const { return static_cast<const A*>(Ptr()); }
  B* Second() { return static_cast<B*>(Ptr()); }
  const B* Second() const { return static_cast<const B*>(Ptr()); }
};

}  // namespace detail
}  // namespace mprelude
