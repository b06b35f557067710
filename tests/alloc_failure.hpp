#pragma once

// Replaces the global allocator for one test executable so a test can make
// exactly one upcoming allocation throw std::bad_alloc. Include from a single
// translation unit only.

#include <cstdlib>
#include <new>

namespace test {

inline bool& alloc_failure_flag() {
    static bool pending = false;
    return pending;
}

inline void fail_next_allocation() { alloc_failure_flag() = true; }
inline bool allocation_failure_pending() { return alloc_failure_flag(); }

} // namespace test

void* operator new(std::size_t n) {
    if (test::alloc_failure_flag()) {
        test::alloc_failure_flag() = false;
        throw std::bad_alloc();
    }
    if (n == 0) n = 1;
    if (void* p = std::malloc(n)) return p;
    throw std::bad_alloc();
}

void operator delete(void* p) noexcept { std::free(p); }
void operator delete(void* p, std::size_t) noexcept { std::free(p); }
