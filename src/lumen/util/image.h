// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_UTIL_IMAGE_H
#define LUMEN_UTIL_IMAGE_H

#include <lumen/lumen.h>
#include <lumen/util/check.h>
#include <lumen/util/color.h>
#include <lumen/util/vecmath.h>

#include <string>
#include <vector>

namespace lumen {

// Image Definition
// Linear RGB float image stored in scanline order with (0,0) at the upper left.
class Image {
  public:
    // Image Public Methods
    Image() = default;
    explicit Image(Point2i resolution)
        : resolution(resolution), p32(3 * size_t(std::max(0, resolution.x)) *
                                      size_t(std::max(0, resolution.y))) {}

    Point2i Resolution() const { return resolution; }
    bool Empty() const { return resolution.x <= 0 || resolution.y <= 0; }

    size_t PixelOffset(Point2i p) const {
        DCHECK(InsideExclusive(p, Bounds2i({0, 0}, resolution)));
        return 3 * (p.y * resolution.x + p.x);
    }

    Float GetChannel(Point2i p, int c) const { return p32[PixelOffset(p) + c]; }

    RGB GetPixel(Point2i p) const {
        size_t offset = PixelOffset(p);
        return RGB(p32[offset], p32[offset + 1], p32[offset + 2]);
    }
    void SetPixel(Point2i p, const RGB &rgb) {
        size_t offset = PixelOffset(p);
        p32[offset] = rgb.r;
        p32[offset + 1] = rgb.g;
        p32[offset + 2] = rgb.b;
    }

    RGB Average() const;
    bool HasAnyNaNPixels() const;

    const float *RawPointer(Point2i p) const { return &p32[PixelOffset(p)]; }

    bool Write(const std::string &name) const;

    std::string ToString() const;

  private:
    // Image Private Methods
    bool WritePFM(const std::string &filename) const;

    // Image Private Members
    Point2i resolution;
    std::vector<float> p32;
};

}  // namespace lumen

#endif  // LUMEN_UTIL_IMAGE_H
