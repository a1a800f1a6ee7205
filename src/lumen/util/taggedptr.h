// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_UTIL_TAGGEDPTR_H
#define LUMEN_UTIL_TAGGEDPTR_H

#include <lumen/lumen.h>

#include <lumen/util/check.h>
#include <lumen/util/containers.h>
#include <lumen/util/print.h>

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>

namespace lumen {

namespace detail {

// Pointer to _T_ with the constness of _P_
template <typename P, typename T>
using MatchConst = std::conditional_t<std::is_const_v<P>, const T, T> *;

// Result of calling _F_ on a pointer to any of _Ts_; every alternative must agree
template <typename P, typename F, typename T0, typename... Ts>
struct DispatchResult {
    using type = std::invoke_result_t<F, MatchConst<P, T0>>;
    static_assert((std::is_same_v<type, std::invoke_result_t<F, MatchConst<P, Ts>>> && ...),
                  "Dispatch callbacks must return the same type for every alternative");
};

// Calls _func_ with _ptr_ cast to the _index_th of _Ts_
template <typename R, typename P, typename F, typename T, typename... Ts>
R DispatchIndex(F &&func, P *ptr, int index) {
    if constexpr (sizeof...(Ts) == 0) {
        DCHECK_EQ(0, index);
        return func(static_cast<MatchConst<P, T>>(ptr));
    } else {
        if (index == 0)
            return func(static_cast<MatchConst<P, T>>(ptr));
        return DispatchIndex<R, P, F, Ts...>(std::forward<F>(func), ptr, index - 1);
    }
}

}  // namespace detail

// TaggedPointer Definition
// A pointer to one of a closed set of types, with the type index packed into the
// unused high bits; Dispatch() switches on it instead of going through a vtable.
template <typename... Ts>
class TaggedPointer {
  public:
    // TaggedPointer Public Types
    using Types = TypePack<Ts...>;

    // TaggedPointer Public Methods
    TaggedPointer() = default;
    template <typename T>
    TaggedPointer(T *ptr) : bits(reinterpret_cast<uintptr_t>(ptr)) {
        DCHECK_EQ(bits & ptrMask, bits);
        bits |= uintptr_t(TypeIndex<T>()) << tagShift;
    }
    TaggedPointer(std::nullptr_t np) {}

    // Tag 0 is reserved for nullptr
    template <typename T>
    static constexpr unsigned int TypeIndex() {
        if constexpr (std::is_same_v<std::remove_cv_t<T>, std::nullptr_t>)
            return 0;
        else
            return 1 + IndexOf<std::remove_cv_t<T>, Types>::count;
    }

    unsigned int Tag() const { return unsigned(bits >> tagShift); }
    template <typename T>
    bool Is() const {
        return Tag() == TypeIndex<T>();
    }

    explicit operator bool() const { return (bits & ptrMask) != 0; }

    std::string ToString() const {
        return StringPrintf("[ TaggedPointer ptr: 0x%p tag: %d ]", ptr(), Tag());
    }

    bool operator==(const TaggedPointer &tp) const { return bits == tp.bits; }
    bool operator!=(const TaggedPointer &tp) const { return bits != tp.bits; }

    void *ptr() { return reinterpret_cast<void *>(bits & ptrMask); }
    const void *ptr() const { return reinterpret_cast<const void *>(bits & ptrMask); }

    // Calls _func_ with the pointer cast back to its concrete type
    template <typename F>
    decltype(auto) Dispatch(F &&func) {
        DCHECK(ptr());
        using R = typename detail::DispatchResult<void, F, Ts...>::type;
        return detail::DispatchIndex<R, void, F, Ts...>(std::forward<F>(func), ptr(),
                                                        Tag() - 1);
    }

    template <typename F>
    decltype(auto) Dispatch(F &&func) const {
        DCHECK(ptr());
        using R = typename detail::DispatchResult<const void, F, Ts...>::type;
        return detail::DispatchIndex<R, const void, F, Ts...>(std::forward<F>(func), ptr(),
                                                              Tag() - 1);
    }

  private:
    static_assert(sizeof(uintptr_t) == 8, "Expected uintptr_t to be 64 bits");
    // TaggedPointer Private Members
    // User-space addresses fit in the low 57 bits; the tag takes the rest
    static constexpr int tagShift = 57;
    static constexpr uint64_t ptrMask = (uint64_t(1) << tagShift) - 1;
    uintptr_t bits = 0;
};

}  // namespace lumen

#endif  // LUMEN_UTIL_TAGGEDPTR_H
