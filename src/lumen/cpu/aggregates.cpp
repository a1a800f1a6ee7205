// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/cpu/aggregates.h>

#include <lumen/interaction.h>
#include <lumen/shapes.h>
#include <lumen/util/check.h>
#include <lumen/util/error.h>
#include <lumen/util/log.h>
#include <lumen/util/math.h>
#include <lumen/util/memory.h>
#include <lumen/util/print.h>

#include <algorithm>
#include <memory_resource>

namespace lumen {

// Relative costs of stepping through an interior node and of intersecting one
// primitive, as used by the surface area heuristic
static constexpr Float TraversalCost = 0.5f;
static constexpr Float PrimitiveCost = 1;

// BVHPrimitive Definition
struct BVHPrimitive {
    size_t primitiveIndex;
    Bounds3f bounds;

    Point3f Centroid() const { return .5f * bounds.pMin + .5f * bounds.pMax; }
};

// BVHBuildNode Definition
// Leaves have no children and own _nPrimitives_ entries of the ordered
// primitive array starting at _firstPrimOffset_.
struct BVHBuildNode {
    Bounds3f bounds;
    BVHBuildNode *children[2] = {nullptr, nullptr};
    int splitAxis = 0, firstPrimOffset = 0, nPrimitives = 0;
};

// BVHBuildState Definition
struct BVHBuildState {
    explicit BVHBuildState(Allocator alloc) : alloc(alloc) {}

    Allocator alloc;
    int totalNodes = 0;
    // Primitives in leaf order
    std::vector<Primitive> orderedPrims;
};

std::string ToString(BVHAggregate::SplitMethod splitMethod) {
    switch (splitMethod) {
    case BVHAggregate::SplitMethod::SAH:
        return "SAH";
    case BVHAggregate::SplitMethod::Middle:
        return "Middle";
    case BVHAggregate::SplitMethod::EqualCounts:
        return "EqualCounts";
    default:
        LOG_FATAL("Unhandled split method");
        return {};
    }
}

// BVHAggregate Method Definitions
BVHAggregate::BVHAggregate(std::vector<Primitive> prims, int maxPrimsInNode,
                           SplitMethod splitMethod)
    : maxPrimsInNode(Clamp(maxPrimsInNode, 1, 255)),
      primitives(std::move(prims)),
      splitMethod(splitMethod) {
    if (primitives.empty()) {
        LOG_VERBOSE("BVH created with no primitives");
        return;
    }

    std::vector<BVHPrimitive> bvhPrimitives;
    bvhPrimitives.reserve(primitives.size());
    for (size_t i = 0; i < primitives.size(); ++i)
        bvhPrimitives.push_back(BVHPrimitive{i, primitives[i].Bounds()});

    // Build nodes live only until the tree is flattened
    std::pmr::monotonic_buffer_resource resource;
    BVHBuildState state{Allocator(&resource)};
    state.orderedPrims.reserve(primitives.size());
    BVHBuildNode *root =
        buildRecursive(state, bvhPrimitives.data(), bvhPrimitives.size());
    CHECK_EQ(state.orderedPrims.size(), primitives.size());
    primitives = std::move(state.orderedPrims);

    LOG_VERBOSE("BVH created with %d nodes for %d primitives (%.2f MB)", state.totalNodes,
                primitives.size(),
                float(state.totalNodes * sizeof(LinearBVHNode)) / (1024.f * 1024.f));
    nodes.resize(state.totalNodes);
    int offset = 0;
    flattenBVH(root, &offset);
    CHECK_EQ(state.totalNodes, offset);
}

BVHAggregate *BVHAggregate::Create(std::vector<Primitive> prims,
                                   const std::string &splitMethodName,
                                   int maxPrimsInNode, Allocator alloc) {
    SplitMethod splitMethod = SplitMethod::SAH;
    if (splitMethodName == "middle")
        splitMethod = SplitMethod::Middle;
    else if (splitMethodName == "equal")
        splitMethod = SplitMethod::EqualCounts;
    else if (splitMethodName != "sah")
        Warning(R"(BVH split method "%s" unknown.  Using "sah".)", splitMethodName);

    return NewObject<BVHAggregate>(alloc, std::move(prims), maxPrimsInNode, splitMethod);
}

BVHBuildNode *BVHAggregate::buildRecursive(BVHBuildState &state,
                                           BVHPrimitive *bvhPrimitives,
                                           size_t nPrimitives) const {
    DCHECK_NE(nPrimitives, 0);
    BVHBuildNode *node = NewObject<BVHBuildNode>(state.alloc);
    ++state.totalNodes;
    for (size_t i = 0; i < nPrimitives; ++i)
        node->bounds = Union(node->bounds, bvhPrimitives[i].bounds);

    auto makeLeaf = [&]() {
        node->firstPrimOffset = int(state.orderedPrims.size());
        node->nPrimitives = int(nPrimitives);
        for (size_t i = 0; i < nPrimitives; ++i)
            state.orderedPrims.push_back(primitives[bvhPrimitives[i].primitiveIndex]);
        return node;
    };
    if (nPrimitives == 1 || node->bounds.SurfaceArea() == 0)
        return makeLeaf();

    // Split along the axis where the centroids are most spread out
    Bounds3f centroidBounds;
    for (size_t i = 0; i < nPrimitives; ++i)
        centroidBounds = Union(centroidBounds, bvhPrimitives[i].Centroid());
    int dim = centroidBounds.MaxDimension();
    if (centroidBounds.pMax[dim] == centroidBounds.pMin[dim])
        return makeLeaf();

    BVHPrimitive *begin = bvhPrimitives, *end = bvhPrimitives + nPrimitives;
    auto splitInHalf = [&]() {
        std::nth_element(begin, begin + nPrimitives / 2, end,
                         [dim](const BVHPrimitive &a, const BVHPrimitive &b) {
                             return a.Centroid()[dim] < b.Centroid()[dim];
                         });
        return nPrimitives / 2;
    };

    size_t mid;
    if (splitMethod == SplitMethod::EqualCounts || nPrimitives <= 2)
        mid = splitInHalf();
    else if (splitMethod == SplitMethod::Middle) {
        Float center = (centroidBounds.pMin[dim] + centroidBounds.pMax[dim]) / 2;
        BVHPrimitive *midIter = std::partition(begin, end, [=](const BVHPrimitive &bp) {
            return bp.Centroid()[dim] < center;
        });
        // Heavily overlapping primitives can all land on one side
        if (midIter == begin || midIter == end)
            mid = splitInHalf();
        else
            mid = midIter - begin;
    } else {
        // Bin centroids into buckets and evaluate the SAH at each bucket boundary
        constexpr int nBuckets = 12, nSplits = nBuckets - 1;
        struct Bucket {
            int count = 0;
            Bounds3f bounds;
        } buckets[nBuckets];
        auto bucketIndex = [&](const BVHPrimitive &bp) {
            int b = int(nBuckets * centroidBounds.Offset(bp.Centroid())[dim]);
            return std::min(b, nBuckets - 1);
        };
        for (size_t i = 0; i < nPrimitives; ++i) {
            Bucket &bucket = buckets[bucketIndex(bvhPrimitives[i])];
            ++bucket.count;
            bucket.bounds = Union(bucket.bounds, bvhPrimitives[i].bounds);
        }

        // Everything in buckets [0, split] goes below the split
        int countBelow[nSplits];
        Bounds3f boundsBelow[nSplits];
        countBelow[0] = buckets[0].count;
        boundsBelow[0] = buckets[0].bounds;
        for (int split = 1; split < nSplits; ++split) {
            countBelow[split] = countBelow[split - 1] + buckets[split].count;
            boundsBelow[split] = Union(boundsBelow[split - 1], buckets[split].bounds);
        }
        int bestSplit = -1, countAbove = 0;
        Float bestCost = Infinity;
        Bounds3f boundsAbove;
        for (int split = nSplits - 1; split >= 0; --split) {
            countAbove += buckets[split + 1].count;
            boundsAbove = Union(boundsAbove, buckets[split + 1].bounds);
            if (countBelow[split] == 0 || countAbove == 0)
                continue;
            Float cost = countBelow[split] * boundsBelow[split].SurfaceArea() +
                         countAbove * boundsAbove.SurfaceArea();
            if (cost < bestCost) {
                bestCost = cost;
                bestSplit = split;
            }
        }

        // Keep small nodes whole when splitting would not pay off
        Float splitCost =
            TraversalCost + PrimitiveCost * bestCost / node->bounds.SurfaceArea();
        Float leafCost = PrimitiveCost * nPrimitives;
        if (nPrimitives <= size_t(maxPrimsInNode) && leafCost <= splitCost)
            return makeLeaf();
        DCHECK_GE(bestSplit, 0);
        BVHPrimitive *midIter = std::partition(begin, end, [&](const BVHPrimitive &bp) {
            return bucketIndex(bp) <= bestSplit;
        });
        mid = midIter - begin;
    }

    node->splitAxis = dim;
    node->children[0] = buildRecursive(state, begin, mid);
    node->children[1] = buildRecursive(state, begin + mid, nPrimitives - mid);
    return node;
}

int BVHAggregate::flattenBVH(const BVHBuildNode *node, int *offset) {
    int nodeOffset = (*offset)++;
    LinearBVHNode &linearNode = nodes[nodeOffset];
    linearNode.bounds = node->bounds;
    if (node->nPrimitives > 0) {
        CHECK(!node->children[0] && !node->children[1]);
        CHECK_LT(node->nPrimitives, 65536);
        linearNode.primitivesOffset = node->firstPrimOffset;
        linearNode.nPrimitives = uint16_t(node->nPrimitives);
        return nodeOffset;
    }
    // The first child lands right after its parent
    linearNode.axis = uint8_t(node->splitAxis);
    linearNode.nPrimitives = 0;
    flattenBVH(node->children[0], offset);
    int second = flattenBVH(node->children[1], offset);
    nodes[nodeOffset].secondChildOffset = second;
    return nodeOffset;
}

template <typename F>
void BVHAggregate::traverse(const Ray &ray, const Float &tMax, F visitLeaf) const {
    Vector3f invDir(1 / ray.d.x, 1 / ray.d.y, 1 / ray.d.z);
    int dirIsNeg[3] = {int(invDir.x < 0), int(invDir.y < 0), int(invDir.z < 0)};
    int toVisit[64];
    int nToVisit = 0, current = 0;
    while (true) {
        const LinearBVHNode &node = nodes[current];
        if (node.bounds.IntersectP(ray.o, ray.d, tMax, invDir, dirIsNeg)) {
            if (node.nPrimitives == 0) {
                // Descend into the child nearer the ray origin first
                int nearChild = current + 1, farChild = node.secondChildOffset;
                if (dirIsNeg[node.axis])
                    std::swap(nearChild, farChild);
                DCHECK_LT(nToVisit, 64);
                toVisit[nToVisit++] = farChild;
                current = nearChild;
                continue;
            }
            if (visitLeaf(node))
                return;
        }
        if (nToVisit == 0)
            return;
        current = toVisit[--nToVisit];
    }
}

Bounds3f BVHAggregate::Bounds() const {
    return nodes.empty() ? Bounds3f() : nodes[0].bounds;
}

std::optional<ShapeIntersection> BVHAggregate::Intersect(const Ray &ray,
                                                         Float tMax) const {
    std::optional<ShapeIntersection> si;
    if (nodes.empty())
        return si;
    // Each hit shrinks _tMax_, which prunes the nodes visited afterward
    traverse(ray, tMax, [&](const LinearBVHNode &leaf) {
        for (int i = 0; i < leaf.nPrimitives; ++i)
            if (std::optional<ShapeIntersection> primSi =
                    primitives[leaf.primitivesOffset + i].Intersect(ray, tMax)) {
                tMax = primSi->tHit;
                si = std::move(primSi);
            }
        return false;
    });
    return si;
}

bool BVHAggregate::IntersectP(const Ray &ray, Float tMax) const {
    bool hit = false;
    if (nodes.empty())
        return hit;
    traverse(ray, tMax, [&](const LinearBVHNode &leaf) {
        for (int i = 0; i < leaf.nPrimitives && !hit; ++i)
            hit = primitives[leaf.primitivesOffset + i].IntersectP(ray, tMax);
        return hit;
    });
    return hit;
}

bool BVHAggregate::CheckBounds() const {
    for (size_t i = 0; i < nodes.size(); ++i) {
        const LinearBVHNode &node = nodes[i];
        if (node.nPrimitives == 0) {
            Bounds3f b = Union(nodes[i + 1].bounds, nodes[node.secondChildOffset].bounds);
            if (b != node.bounds) {
                LOG_ERROR("BVH interior node %d bounds differ from its children", i);
                return false;
            }
            continue;
        }
        for (int j = 0; j < node.nPrimitives; ++j) {
            int index = node.primitivesOffset + j;
            if (Union(node.bounds, primitives[index].Bounds()) != node.bounds) {
                LOG_ERROR("BVH leaf %d does not bound primitive %d", i, index);
                return false;
            }
        }
    }
    return true;
}

std::string BVHAggregate::ToString() const {
    return StringPrintf("[ BVHAggregate splitMethod: %s maxPrimsInNode: %d "
                        "primitives: %d nodes: %d bounds: %s ]",
                        lumen::ToString(splitMethod), maxPrimsInNode, primitives.size(),
                        nodes.size(), Bounds());
}

}  // namespace lumen
