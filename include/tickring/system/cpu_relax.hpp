#pragma once

#include <thread>  // std::this_thread::yield fallback


// -----------------------------------------------------------------------------
// Portable spin-wait hint
// _mm_pause() is an x86/x86-64 intrinsic.
// On ARM the "yield" instruction is issued via inline assembly.
// Elsewhere we fall back to std::this_thread::yield().
// -----------------------------------------------------------------------------
#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__)
    #include <immintrin.h> // _mm_pause
#endif


namespace tickring {
namespace system {

inline void cpu_relax() noexcept {
#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__)
    _mm_pause();
#elif defined(__aarch64__) || defined(__arm__)
    asm volatile("yield" ::: "memory");
#else
    std::this_thread::yield();
#endif
}

} // namespace system
} // namespace tickring
