// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_UTIL_MEMORY_H
#define LUMEN_UTIL_MEMORY_H

#include <lumen/lumen.h>

#include <lumen/util/check.h>

#include <algorithm>
#include <cstddef>
#include <new>
#include <type_traits>
#include <utility>
#include <vector>

namespace lumen {

// Allocates and constructs a _T_ from _alloc_'s memory resource; the object lives
// until the resource releases its memory and its destructor is never called.
template <typename T, typename... Args>
T *NewObject(Allocator alloc, Args &&...args) {
    T *p = static_cast<T *>(alloc.resource()->allocate(sizeof(T), alignof(T)));
    return new (p) T(std::forward<Args>(args)...);
}

// ScratchBuffer Definition
// Bump allocator for per-sample temporaries. Everything handed out is released
// together by Reset() and destructors are never run, so only trivially
// destructible types may be allocated.
class alignas(LUMEN_L1_CACHE_LINE_SIZE) ScratchBuffer {
  public:
    // ScratchBuffer Public Methods
    explicit ScratchBuffer(size_t size = 256) : ptr(AllocateBytes(size)), allocSize(size) {}
    ~ScratchBuffer() {
        Reset();
        FreeBytes(ptr);
    }

    ScratchBuffer(const ScratchBuffer &) = delete;
    ScratchBuffer &operator=(const ScratchBuffer &) = delete;

    ScratchBuffer(ScratchBuffer &&b)
        : ptr(std::exchange(b.ptr, nullptr)),
          allocSize(std::exchange(b.allocSize, 0)),
          offset(std::exchange(b.offset, 0)),
          retired(std::move(b.retired)) {}
    ScratchBuffer &operator=(ScratchBuffer &&b) {
        std::swap(ptr, b.ptr);
        std::swap(allocSize, b.allocSize);
        std::swap(offset, b.offset);
        std::swap(retired, b.retired);
        return *this;
    }

    void *Alloc(size_t size, size_t alignment) {
        offset = (offset + alignment - 1) / alignment * alignment;
        if (offset + size > allocSize)
            Grow(size);
        void *p = ptr + offset;
        offset += size;
        return p;
    }

    template <typename T, typename... Args>
    T *Alloc(Args &&...args) {
        static_assert(std::is_trivially_destructible_v<T>,
                      "ScratchBuffer never runs destructors");
        return new (Alloc(sizeof(T), alignof(T))) T(std::forward<Args>(args)...);
    }

    // Keeps the current block, which is the largest one so far
    void Reset() {
        for (char *block : retired)
            FreeBytes(block);
        retired.clear();
        offset = 0;
    }

  private:
    // ScratchBuffer Private Methods
    static char *AllocateBytes(size_t size) {
        return static_cast<char *>(::operator new(size, std::align_val_t(blockAlign)));
    }
    static void FreeBytes(char *p) {
        if (p)
            ::operator delete(p, std::align_val_t(blockAlign));
    }

    // Blocks handed out earlier stay valid until Reset()
    void Grow(size_t minSize) {
        retired.push_back(ptr);
        allocSize = std::max(2 * minSize, allocSize + minSize);
        ptr = AllocateBytes(allocSize);
        offset = 0;
    }

    // ScratchBuffer Private Members
    static constexpr size_t blockAlign = LUMEN_L1_CACHE_LINE_SIZE;
    char *ptr = nullptr;
    size_t allocSize = 0, offset = 0;
    std::vector<char *> retired;
};

}  // namespace lumen

#endif  // LUMEN_UTIL_MEMORY_H
