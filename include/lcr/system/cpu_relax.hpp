#pragma once

#include <cstdint>
#include <thread>

#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__)
    #include <immintrin.h>
#endif


namespace lcr {
namespace system {

// Spin-wait hint for the current core.
// x86: pause. ARM: yield instruction. Elsewhere the scheduler is asked instead.
inline void cpu_relax() noexcept {
#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__)
    _mm_pause();
#elif defined(__aarch64__) || defined(__arm__)
    asm volatile("yield" ::: "memory");
#else
    std::this_thread::yield();
#endif
}

// `count` consecutive hints. Used by producers stepping back from a full ring.
inline void cpu_relax(std::uint32_t count) noexcept {
    for (std::uint32_t i = 0; i < count; ++i) {
        cpu_relax();
    }
}

} // namespace system
} // namespace lcr
