// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <gtest/gtest.h>

#include <lumen/lumen.h>
#include <lumen/util/containers.h>
#include <lumen/util/memory.h>
#include <lumen/util/taggedptr.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace lumen;

TEST(Array2D, OffsetExtent) {
    Bounds2i extent(Point2i(-2, 3), Point2i(2, 5));
    Array2D<int> a(extent);
    EXPECT_EQ(8u, a.size());

    for (Point2i p : extent)
        a[p] = 10 * p.x + p.y;
    for (Point2i p : extent)
        EXPECT_EQ(10 * p.x + p.y, a[p]);

    // Storage runs along x first, starting at pMin
    std::vector<int> stored(a.begin(), a.end());
    EXPECT_EQ(-20 + 3, stored[0]);
    EXPECT_EQ(-10 + 3, stored[1]);
    EXPECT_EQ(-20 + 4, stored[4]);
}

TEST(TypePack, IndexOf) {
    using Pack = TypePack<int, float, std::string>;
    EXPECT_EQ(3u, Pack::count);
    EXPECT_EQ(0, (IndexOf<int, Pack>::count));
    EXPECT_EQ(2, (IndexOf<std::string, Pack>::count));
}

namespace {

struct Small {
    int Size() const { return 1; }
};
struct Large {
    int Size() const { return 100; }
};

}  // namespace

TEST(TaggedPointer, Dispatch) {
    using Ptr = TaggedPointer<Small, Large>;
    Small small;
    Large large;

    Ptr empty;
    EXPECT_FALSE(bool(empty));
    EXPECT_EQ(0, empty.Tag());

    Ptr ps(&small), pl(&large);
    EXPECT_TRUE(ps.Is<Small>());
    EXPECT_FALSE(ps.Is<Large>());
    EXPECT_TRUE(pl.Is<Large>());
    EXPECT_EQ(&large, pl.ptr());
    EXPECT_NE(ps, pl);

    auto size = [](auto p) { return p->Size(); };
    EXPECT_EQ(1, ps.Dispatch(size));
    EXPECT_EQ(100, pl.Dispatch(size));
    const Ptr cpl = pl;
    EXPECT_EQ(100, cpl.Dispatch(size));
}

TEST(ScratchBuffer, GrowKeepsEarlierAllocations) {
    ScratchBuffer buf(32);
    int *first = buf.Alloc<int>(7);
    // Larger than the initial block, so a new one must be allocated
    double *block = static_cast<double *>(buf.Alloc(1024, alignof(double)));
    block[127] = 3.5;
    double *d = buf.Alloc<double>(2.5);

    EXPECT_EQ(7, *first);
    EXPECT_EQ(3.5, block[127]);
    EXPECT_EQ(2.5, *d);
    EXPECT_EQ(0u, reinterpret_cast<uintptr_t>(d) % alignof(double));

    buf.Reset();
    int *again = buf.Alloc<int>(9);
    EXPECT_EQ(9, *again);

    ScratchBuffer moved(std::move(buf));
    EXPECT_EQ(9, *again);
    EXPECT_EQ(4, *moved.Alloc<int>(4));
}
