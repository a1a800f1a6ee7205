// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_CPU_AGGREGATES_H
#define LUMEN_CPU_AGGREGATES_H

#include <lumen/lumen.h>

#include <lumen/cpu/primitive.h>
#include <lumen/util/vecmath.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lumen {

struct BVHBuildNode;
struct BVHBuildState;
struct BVHPrimitive;

// LinearBVHNode Definition
struct alignas(32) LinearBVHNode {
    Bounds3f bounds;
    union {
        int primitivesOffset;   // leaf
        int secondChildOffset;  // interior
    };
    uint16_t nPrimitives;  // 0 -> interior node
    uint8_t axis;          // interior node: xyz
};

// BVHAggregate Definition
// Bounding volume hierarchy stored as a flat array of nodes in depth-first
// order: the first child of an interior node immediately follows it and the
// second is addressed by index. The tree is immutable after construction, so
// any number of threads may traverse it concurrently.
class BVHAggregate {
  public:
    // BVHAggregate Public Types
    enum class SplitMethod { SAH, Middle, EqualCounts };

    // BVHAggregate Public Methods
    BVHAggregate(std::vector<Primitive> p, int maxPrimsInNode = 1,
                 SplitMethod splitMethod = SplitMethod::SAH);

    static BVHAggregate *Create(std::vector<Primitive> prims,
                                const std::string &splitMethodName, int maxPrimsInNode,
                                Allocator alloc);

    Bounds3f Bounds() const;
    std::optional<ShapeIntersection> Intersect(const Ray &ray, Float tMax) const;
    bool IntersectP(const Ray &ray, Float tMax) const;

    int NodeCount() const { return int(nodes.size()); }
    int PrimitiveCount() const { return int(primitives.size()); }

    // Verifies that every node's bounds enclose its contents; returns false
    // and logs the first offending node otherwise.
    bool CheckBounds() const;

    std::string ToString() const;

  private:
    // BVHAggregate Private Methods
    BVHBuildNode *buildRecursive(BVHBuildState &state, BVHPrimitive *bvhPrimitives,
                                 size_t nPrimitives) const;
    int flattenBVH(const BVHBuildNode *node, int *offset);
    // Calls _visitLeaf_ for each leaf whose bounds the ray enters before
    // _tMax_, nearest subtrees first, until it returns true
    template <typename F>
    void traverse(const Ray &ray, const Float &tMax, F visitLeaf) const;

    // BVHAggregate Private Members
    int maxPrimsInNode;
    std::vector<Primitive> primitives;
    SplitMethod splitMethod;
    std::vector<LinearBVHNode> nodes;
};

std::string ToString(BVHAggregate::SplitMethod splitMethod);

}  // namespace lumen

#endif  // LUMEN_CPU_AGGREGATES_H
