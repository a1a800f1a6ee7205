// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/util/sampling.h>

#include <lumen/util/print.h>

#include <numeric>

namespace lumen {

// AliasTable Method Definitions
AliasTable::AliasTable(const std::vector<Float> &weights, Allocator alloc)
    : bins(weights.size(), alloc) {
    double sum = std::accumulate(weights.begin(), weights.end(), 0.);
    CHECK_GT(sum, 0);

    // Scale so that a full bin holds exactly 1
    size_t n = bins.size();
    std::vector<double> scaled(n);
    std::vector<int> underfull, overfull;
    for (size_t i = 0; i < n; ++i) {
        bins[i].p = weights[i] / sum;
        scaled[i] = weights[i] / sum * n;
        if (scaled[i] < 1)
            underfull.push_back(int(i));
        else
            overfull.push_back(int(i));
    }

    // Top up each underfull bin from an overfull one; the donor may end up
    // underfull itself
    while (!underfull.empty() && !overfull.empty()) {
        int small = underfull.back(), large = overfull.back();
        underfull.pop_back();
        bins[small].q = scaled[small];
        bins[small].alias = large;

        scaled[large] -= 1 - scaled[small];
        if (scaled[large] < 1) {
            overfull.pop_back();
            underfull.push_back(large);
        }
    }
    // Bins left on either list are full up to round-off and keep q = 1
}

int AliasTable::Sample(Float u, Float *pmf) const {
    Float scaled = u * bins.size();
    int index = std::min<int>(scaled, bins.size() - 1);
    Float up = std::min<Float>(scaled - index, OneMinusEpsilon);
    if (up >= bins[index].q) {
        index = bins[index].alias;
        DCHECK_GE(index, 0);
    }
    DCHECK_GT(bins[index].p, 0);
    if (pmf)
        *pmf = bins[index].p;
    return index;
}

std::string AliasTable::ToString() const {
    std::string s = "[ AliasTable bins: [";
    for (size_t i = 0; i < bins.size(); ++i)
        s += StringPrintf(" (%d q: %f p: %f alias: %d)", i, bins[i].q, bins[i].p,
                          bins[i].alias);
    return s + " ] ]";
}

}  // namespace lumen
