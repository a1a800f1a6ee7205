// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/filters.h>

#include <lumen/util/error.h>
#include <lumen/util/memory.h>
#include <lumen/util/print.h>

namespace lumen {

// Box Filter Method Definitions
std::string BoxFilter::ToString() const {
    return StringPrintf("[ BoxFilter radius: %s ]", radius);
}

// Triangle Filter Method Definitions
std::string TriangleFilter::ToString() const {
    return StringPrintf("[ TriangleFilter radius: %s ]", radius);
}

std::string Filter::ToString() const {
    if (!ptr())
        return "(nullptr)";

    auto toStr = [](auto ptr) { return ptr->ToString(); };
    return Dispatch(toStr);
}

Filter Filter::Create(const std::string &name, Vector2f radius, Allocator alloc) {
    if (!(radius.x > 0 && radius.y > 0))
        ErrorExit("%s: filter radius must be positive.", radius);

    Filter filter = nullptr;
    if (name == "box")
        filter = NewObject<BoxFilter>(alloc, radius);
    else if (name == "triangle" || name == "tent")
        filter = NewObject<TriangleFilter>(alloc, radius);
    else
        ErrorExit("%s: filter type unknown.", name);

    return filter;
}

}  // namespace lumen
