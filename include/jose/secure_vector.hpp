/**
 * @file secure_vector.hpp
 * @brief Locked, zero-on-release storage for secret key material
 */

#pragma once

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <new>
#include <span>
#include <vector>

#include <sys/mman.h>
#include <unistd.h>

namespace jose {

/**
 * @brief Allocator for symmetric keys and private key components.
 *
 * Pages are locked so they are not swapped out and are zeroed before they
 * are returned to the system.
 */
template <typename T>
class SecureAllocator {
 public:
  using value_type = T;
  using size_type = std::size_t;

  template <typename U>
  struct rebind {
    using other = SecureAllocator<U>;
  };

  SecureAllocator() = default;

  template <typename U>
  SecureAllocator(const SecureAllocator<U>&) noexcept {}

  T* allocate(size_t n) {
    if (n == 0) return nullptr;

    size_t page_size = pageSize();
    size_t aligned_size = alignedSize(n, page_size);

    T* ptr = static_cast<T*>(std::aligned_alloc(page_size, aligned_size));
    if (!ptr) throw std::bad_alloc();

    // Locking is best effort, RLIMIT_MEMLOCK may be small
    mlock(ptr, aligned_size);
    return ptr;
  }

  void deallocate(T* ptr, size_t n) noexcept {
    if (!ptr) return;
    size_t aligned_size = alignedSize(n, pageSize());
    secureZero(ptr, n * sizeof(T));
    munlock(ptr, aligned_size);
    std::free(ptr);
  }

  template <typename U>
  bool operator==(const SecureAllocator<U>&) const noexcept {
    return true;
  }

 private:
  static size_t pageSize() noexcept {
    return static_cast<size_t>(sysconf(_SC_PAGESIZE));
  }

  static size_t alignedSize(size_t n, size_t page_size) noexcept {
    size_t size = n * sizeof(T);
    return ((size + page_size - 1) / page_size) * page_size;
  }

  static void secureZero(void* ptr, size_t size) noexcept {
    volatile unsigned char* p = static_cast<volatile unsigned char*>(ptr);
    for (size_t i = 0; i < size; ++i) {
      p[i] = 0;
    }
  }
};

template <typename T>
using SecureVector = std::vector<T, SecureAllocator<T>>;

/// Secret key bytes
using SecureBytes = SecureVector<uint8_t>;

namespace secure_utils {

/**
 * @brief Constant-time comparison, the running time depends only on the
 * lengths
 */
inline bool constantTimeEqual(std::span<const uint8_t> a,
                              std::span<const uint8_t> b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  const volatile uint8_t* va = a.data();
  const volatile uint8_t* vb = b.data();
  uint8_t result = 0;
  for (size_t i = 0; i < a.size(); ++i) {
    result |= va[i] ^ vb[i];
  }
  return result == 0;
}

template <typename T>
std::vector<T> to_regular_vector(const SecureVector<T>& secure_vec) {
  return std::vector<T>(secure_vec.begin(), secure_vec.end());
}

template <typename T>
SecureVector<T> to_secure_vector(const std::vector<T>& regular_vec) {
  return SecureVector<T>(regular_vec.begin(), regular_vec.end());
}

}  // namespace secure_utils
}  // namespace jose
