// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <gtest/gtest.h>

#include <lumen/lumen.h>

#include <lumen/cpu/aggregates.h>
#include <lumen/cpu/primitive.h>
#include <lumen/interaction.h>
#include <lumen/materials.h>
#include <lumen/shapes.h>
#include <lumen/util/memory.h>
#include <lumen/util/mesh.h>
#include <lumen/util/rng.h>
#include <lumen/util/sampling.h>
#include <lumen/util/transform.h>

#include <memory>
#include <memory_resource>
#include <vector>

using namespace lumen;

namespace {

// Random triangle soup plus a few spheres, with one GeometricPrimitive per shape
class RandomScene {
  public:
    RandomScene(int nTriangles, int nSpheres, uint64_t seed) : alloc(&resource) {
        RNG rng(seed);
        std::vector<int> indices;
        std::vector<Point3f> p;
        auto randomPoint = [&](Float scale) {
            return Point3f(scale * (2 * rng.Uniform<Float>() - 1),
                           scale * (2 * rng.Uniform<Float>() - 1),
                           scale * (2 * rng.Uniform<Float>() - 1));
        };
        for (int i = 0; i < nTriangles; ++i) {
            // Small triangles scattered through the volume
            Point3f c = randomPoint(10);
            for (int j = 0; j < 3; ++j) {
                indices.push_back(p.size());
                p.push_back(c + Vector3f(randomPoint(1)));
            }
        }
        mesh = std::make_unique<TriangleMesh>(Transform(), false, indices, p,
                                              std::vector<Normal3f>(),
                                              std::vector<Point2f>(), alloc);
        std::vector<Shape> shapes = Triangle::CreateTriangles(mesh.get(), alloc);
        for (int i = 0; i < nSpheres; ++i)
            shapes.push_back(NewObject<Sphere>(alloc, randomPoint(10),
                                               0.2f + rng.Uniform<Float>()));

        // A material of its own identifies the primitive a ray hit
        for (Shape s : shapes) {
            Material tag = NewObject<DiffuseMaterial>(alloc, RGB(0.5f));
            prims.push_back(NewObject<GeometricPrimitive>(alloc, s, tag, nullptr));
        }
    }

    std::optional<ShapeIntersection> BruteForceIntersect(const Ray &ray, Float tMax) const {
        std::optional<ShapeIntersection> si;
        for (Primitive prim : prims)
            if (std::optional<ShapeIntersection> s = prim.Intersect(ray, tMax)) {
                si = s;
                tMax = s->tHit;
            }
        return si;
    }

    bool BruteForceIntersectP(const Ray &ray, Float tMax) const {
        for (Primitive prim : prims)
            if (prim.IntersectP(ray, tMax))
                return true;
        return false;
    }

    std::pmr::monotonic_buffer_resource resource;
    Allocator alloc;
    std::unique_ptr<TriangleMesh> mesh;
    std::vector<Primitive> prims;
};

Ray RandomRay(RNG &rng) {
    Point3f o(15 * (2 * rng.Uniform<Float>() - 1), 15 * (2 * rng.Uniform<Float>() - 1),
              15 * (2 * rng.Uniform<Float>() - 1));
    Vector3f d =
        SampleUniformSphere(Point2f(rng.Uniform<Float>(), rng.Uniform<Float>()));
    return Ray(o, d);
}

}  // namespace

class BVHTest : public testing::TestWithParam<std::tuple<BVHAggregate::SplitMethod, int>> {
};

TEST_P(BVHTest, MatchesBruteForce) {
    RandomScene scene(500, 20, 1);
    BVHAggregate bvh(scene.prims, std::get<1>(GetParam()), std::get<0>(GetParam()));
    EXPECT_EQ((int)scene.prims.size(), bvh.PrimitiveCount());
    EXPECT_TRUE(bvh.CheckBounds());

    RNG rng(7);
    int nHits = 0;
    for (int i = 0; i < 5000; ++i) {
        Ray ray = RandomRay(rng);
        Float tMax = (i & 1) ? Infinity : 30 * rng.Uniform<Float>();

        std::optional<ShapeIntersection> ref = scene.BruteForceIntersect(ray, tMax);
        std::optional<ShapeIntersection> si = bvh.Intersect(ray, tMax);
        ASSERT_EQ(ref.has_value(), si.has_value()) << i;
        if (ref) {
            ++nHits;
            EXPECT_NEAR(ref->tHit, si->tHit, 1e-5f * std::max<Float>(1, ref->tHit));
            EXPECT_NEAR(ref->intr.p.x, si->intr.p.x, 1e-4f);
            EXPECT_NEAR(ref->intr.p.y, si->intr.p.y, 1e-4f);
            EXPECT_NEAR(ref->intr.p.z, si->intr.p.z, 1e-4f);
            EXPECT_EQ(ref->intr.material, si->intr.material) << i;
        }
        EXPECT_EQ(scene.BruteForceIntersectP(ray, tMax), bvh.IntersectP(ray, tMax));
    }
    // Sanity check that the test exercises hits
    EXPECT_GT(nHits, 100);
}

INSTANTIATE_TEST_SUITE_P(
    SplitMethods, BVHTest,
    testing::Combine(testing::Values(BVHAggregate::SplitMethod::SAH,
                                     BVHAggregate::SplitMethod::Middle,
                                     BVHAggregate::SplitMethod::EqualCounts),
                     testing::Values(1, 4)));

TEST(BVH, Empty) {
    BVHAggregate bvh({});
    EXPECT_EQ(0, bvh.NodeCount());
    EXPECT_TRUE(bvh.Bounds().IsEmpty());
    RNG rng;
    for (int i = 0; i < 100; ++i) {
        Ray ray = RandomRay(rng);
        EXPECT_FALSE(bvh.Intersect(ray, Infinity).has_value());
        EXPECT_FALSE(bvh.IntersectP(ray, Infinity));
    }
}

TEST(BVH, CoincidentCentroids) {
    // Identical primitives cannot be split and end up together in one leaf
    std::pmr::monotonic_buffer_resource resource;
    Allocator alloc(&resource);
    std::vector<Primitive> prims;
    for (int i = 0; i < 8; ++i) {
        Shape s = NewObject<Sphere>(alloc, Point3f(0, 0, 0), Float(1 + i));
        prims.push_back(NewObject<GeometricPrimitive>(alloc, s, nullptr, nullptr));
    }
    BVHAggregate bvh(prims, 1, BVHAggregate::SplitMethod::SAH);
    EXPECT_EQ(1, bvh.NodeCount());

    std::optional<ShapeIntersection> si =
        bvh.Intersect(Ray(Point3f(0, 0, -20), Vector3f(0, 0, 1)), Infinity);
    ASSERT_TRUE(si.has_value());
    EXPECT_NEAR(12, si->tHit, 1e-4);
}

TEST(BVH, SinglePrimitiveLeaves) {
    // Distinct centroids can always be separated, so with one primitive per
    // leaf the tree is a full binary tree over the primitives
    RandomScene scene(0, 40, 5);
    for (auto method : {BVHAggregate::SplitMethod::SAH, BVHAggregate::SplitMethod::Middle,
                        BVHAggregate::SplitMethod::EqualCounts}) {
        BVHAggregate bvh(scene.prims, 1, method);
        EXPECT_EQ(2 * 40 - 1, bvh.NodeCount()) << ToString(method);
        EXPECT_TRUE(bvh.CheckBounds());
    }
}

TEST(BVH, Deterministic) {
    RandomScene scene(200, 0, 3);
    BVHAggregate a(scene.prims, 4), b(scene.prims, 4);
    ASSERT_EQ(a.NodeCount(), b.NodeCount());
    EXPECT_EQ(a.Bounds(), b.Bounds());
    RNG rng(2);
    for (int i = 0; i < 500; ++i) {
        Ray ray = RandomRay(rng);
        std::optional<ShapeIntersection> sa = a.Intersect(ray, Infinity);
        std::optional<ShapeIntersection> sb = b.Intersect(ray, Infinity);
        ASSERT_EQ(sa.has_value(), sb.has_value());
        if (sa)
            EXPECT_EQ(sa->tHit, sb->tHit);
    }
}

TEST(BVH, CreateFallsBackToSAH) {
    RandomScene scene(50, 0, 5);
    BVHAggregate *bvh =
        BVHAggregate::Create(scene.prims, "no-such-method", 4, scene.alloc);
    ASSERT_NE(nullptr, bvh);
    EXPECT_EQ(50, bvh->PrimitiveCount());
    EXPECT_TRUE(bvh->CheckBounds());
}
