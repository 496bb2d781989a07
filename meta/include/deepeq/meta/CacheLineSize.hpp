#ifndef DEEPEQ_CACHE_LINE_SIZE_HPP
#define DEEPEQ_CACHE_LINE_SIZE_HPP

#include <cstddef>
#include <new>

namespace deepeq {

/**
 * Cache line size constant for `alignas` on contended atomics (false sharing padding).
 *
 * `std::hardware_destructive_interference_size` reports a wrong value on Apple ARM64 with Clang 19+
 * (https://github.com/llvm/llvm-project/issues/182951), hence the explicit override chain:
 *  1. `-DDEEPEQ_CACHE_LINE_SIZE=<N>`
 *  2. Apple ARM64: 128 bytes
 *  3. the standard constant if available
 *  4. 64 bytes
 */
#if defined(DEEPEQ_CACHE_LINE_SIZE)
inline constexpr std::size_t kCacheLine = DEEPEQ_CACHE_LINE_SIZE;
#elif defined(__APPLE__) && defined(__aarch64__)
inline constexpr std::size_t kCacheLine = 128UZ;
#elif defined(__cpp_lib_hardware_interference_size)
inline constexpr std::size_t kCacheLine = std::hardware_destructive_interference_size;
#else
inline constexpr std::size_t kCacheLine = 64UZ;
#endif

} // namespace deepeq

#endif // DEEPEQ_CACHE_LINE_SIZE_HPP
