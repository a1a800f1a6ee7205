// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_BASE_FILTER_H
#define LUMEN_BASE_FILTER_H

#include <lumen/lumen.h>

#include <lumen/util/taggedptr.h>
#include <lumen/util/vecmath.h>

#include <string>

namespace lumen {

// Filter Declarations
struct FilterSample;
class BoxFilter;
class TriangleFilter;

// Filter Definition
class Filter : public TaggedPointer<BoxFilter, TriangleFilter> {
  public:
    // Filter Interface
    using TaggedPointer::TaggedPointer;

    static Filter Create(const std::string &name, Vector2f radius, Allocator alloc);

    Vector2f Radius() const;

    Float Evaluate(Point2f p) const;

    Float Integral() const;

    FilterSample Sample(Point2f u) const;

    std::string ToString() const;
};

}  // namespace lumen

#endif  // LUMEN_BASE_FILTER_H
