// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_FILM_H
#define LUMEN_FILM_H

#include <lumen/lumen.h>

#include <lumen/base/filter.h>
#include <lumen/util/color.h>
#include <lumen/util/containers.h>
#include <lumen/util/image.h>
#include <lumen/util/parallel.h>
#include <lumen/util/vecmath.h>

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace lumen {

// RGBFilm Definition
// Accumulates filter-weighted radiance per pixel. Every accumulator is atomic,
// so AddSample() may be called concurrently for the same pixel and the image
// may be read back while rendering is still under way.
class RGBFilm {
  public:
    // RGBFilm Public Methods
    RGBFilm(Point2i fullResolution, const Bounds2i &pixelBounds, Filter filter,
            std::string filename, Float maxComponentValue = Infinity);

    static RGBFilm *Create(Point2i fullResolution, std::optional<Bounds2i> pixelBounds,
                           Filter filter, const std::string &filename,
                           Float maxComponentValue, Allocator alloc);

    Point2i FullResolution() const { return fullResolution; }
    const Bounds2i &PixelBounds() const { return pixelBounds; }
    Filter GetFilter() const { return filter; }
    const std::string &GetFilename() const { return filename; }

    Bounds2f SampleBounds() const;

    void AddSample(Point2i pFilm, RGB L, Float weight);

    // Mean radiance of the pixel, or black if it has no samples yet.
    RGB GetPixelRGB(Point2i p) const;
    int64_t SampleCount(Point2i p) const;
    int64_t TotalSampleCount() const;

    void ResetPixel(Point2i p);

    // Returns the image covering _pixelBounds_; safe to call mid-render.
    Image GetImage() const;
    bool WriteImage() const;

    std::string ToString() const;

  private:
    // RGBFilm::Pixel Definition
    struct Pixel {
        Pixel() = default;
        AtomicDouble rgbSum[3];
        AtomicDouble weightSum;
        std::atomic<int64_t> nSamples{0};
    };

    // RGBFilm Private Members
    Point2i fullResolution;
    Bounds2i pixelBounds;
    Filter filter;
    std::string filename;
    Float maxComponentValue;
    Array2D<Pixel> pixels;
};

}  // namespace lumen

#endif  // LUMEN_FILM_H
