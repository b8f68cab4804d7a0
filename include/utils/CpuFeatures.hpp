/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CPU_FEATURES_HPP
#define CPU_FEATURES_HPP

/**
 * @file CpuFeatures.hpp
 * @brief Compile-time SIMD capability detection
 *
 * The level is fixed by the compiler flags the library was built with:
 * - x86-64: SSE2, SSE4.1, AVX2
 * - ARM64: NEON
 *
 * PerformanceCore resolves it once at init and reports Scalar when SIMD is
 * switched off in configuration.
 */

#include <cstdint>

#if defined(__SSE2__) || \
    (defined(_MSC_VER) && \
     (defined(_M_X64) || (defined(_M_IX86_FP) && _M_IX86_FP >= 2)))
#define TICKGUARD_SIMD_SSE2 1
#endif

#if defined(__SSE4_1__) || (defined(_MSC_VER) && defined(__AVX__))
#define TICKGUARD_SIMD_SSE4 1
#endif

#if defined(__AVX2__)
#define TICKGUARD_SIMD_AVX2 1
#endif

#if defined(__ARM_NEON) || defined(__ARM_NEON__)
#define TICKGUARD_SIMD_NEON 1
#endif

namespace TickGuard {

enum class SimdLevel : uint8_t { Scalar = 0, SSE2, SSE4, AVX2, NEON };

constexpr SimdLevel compiledSimdLevel() {
#if defined(TICKGUARD_SIMD_AVX2)
  return SimdLevel::AVX2;
#elif defined(TICKGUARD_SIMD_SSE4)
  return SimdLevel::SSE4;
#elif defined(TICKGUARD_SIMD_SSE2)
  return SimdLevel::SSE2;
#elif defined(TICKGUARD_SIMD_NEON)
  return SimdLevel::NEON;
#else
  return SimdLevel::Scalar;
#endif
}

constexpr const char *simdLevelName(SimdLevel level) {
  switch (level) {
  case SimdLevel::SSE2:
    return "SSE2";
  case SimdLevel::SSE4:
    return "SSE4.1";
  case SimdLevel::AVX2:
    return "AVX2";
  case SimdLevel::NEON:
    return "NEON";
  case SimdLevel::Scalar:
  default:
    return "scalar";
  }
}

} // namespace TickGuard

#endif // CPU_FEATURES_HPP
