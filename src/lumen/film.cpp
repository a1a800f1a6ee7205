// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/film.h>

#include <lumen/filters.h>
#include <lumen/util/check.h>
#include <lumen/util/error.h>
#include <lumen/util/file.h>
#include <lumen/util/log.h>
#include <lumen/util/memory.h>
#include <lumen/util/print.h>

#include <algorithm>
#include <utility>

namespace lumen {

// RGBFilm Method Definitions
RGBFilm::RGBFilm(Point2i fullResolution, const Bounds2i &pixelBounds, Filter filter,
                 std::string filename, Float maxComponentValue)
    : fullResolution(fullResolution),
      pixelBounds(pixelBounds),
      filter(filter),
      filename(std::move(filename)),
      maxComponentValue(maxComponentValue),
      pixels(pixelBounds) {
    CHECK(filter);
    CHECK(!pixelBounds.IsEmpty());
    CHECK_GE(pixelBounds.pMin.x, 0);
    CHECK_LE(pixelBounds.pMax.x, fullResolution.x);
    CHECK_GE(pixelBounds.pMin.y, 0);
    CHECK_LE(pixelBounds.pMax.y, fullResolution.y);
    LOG_VERBOSE("Created film with full resolution %s, pixelBounds %s", fullResolution,
                pixelBounds);
}

RGBFilm *RGBFilm::Create(Point2i fullResolution, std::optional<Bounds2i> pixelBounds,
                         Filter filter, const std::string &filename,
                         Float maxComponentValue, Allocator alloc) {
    if (fullResolution.x <= 0 || fullResolution.y <= 0)
        ErrorExit("%s: film resolution must be positive.", fullResolution);
    if (!filename.empty() && !HasExtension(filename, "pfm"))
        Warning("%s: output filename does not end in \".pfm\".", filename);

    Bounds2i bounds(Point2i(0, 0), fullResolution);
    if (pixelBounds) {
        bounds = Intersect(*pixelBounds, bounds);
        if (bounds.IsEmpty())
            ErrorExit("%s: pixel bounds do not overlap the image.", *pixelBounds);
    }
    if (maxComponentValue <= 0)
        ErrorExit("%f: maximum component value must be positive.", maxComponentValue);

    return NewObject<RGBFilm>(alloc, fullResolution, bounds, filter, filename,
                              maxComponentValue);
}

Bounds2f RGBFilm::SampleBounds() const {
    Vector2f radius = filter.Radius();
    return Bounds2f(Point2f(pixelBounds.pMin) - radius + Vector2f(0.5f, 0.5f),
                    Point2f(pixelBounds.pMax) + radius - Vector2f(0.5f, 0.5f));
}

void RGBFilm::AddSample(Point2i pFilm, RGB L, Float weight) {
    // Discard non-finite radiance so one sample cannot poison the pixel mean
    if (!L.IsFinite() || IsNaN(weight) || IsInf(weight)) {
        LOG_ERROR("Non-finite radiance %s (weight %f) for pixel %s; ignoring it.", L,
                  weight, pFilm);
        L = RGB(0.f);
        if (IsNaN(weight) || IsInf(weight))
            weight = 0;
    }

    // Optionally clamp to the maximum component value
    Float m = L.MaxComponentValue();
    if (m > maxComponentValue)
        L *= maxComponentValue / m;

    DCHECK(InsideExclusive(pFilm, pixelBounds));
    // Update pixel values with filtered sample contribution
    Pixel &pixel = pixels[pFilm];
    for (int c = 0; c < 3; ++c)
        pixel.rgbSum[c].Add(weight * L[c]);
    pixel.weightSum.Add(weight);
    pixel.nSamples.fetch_add(1, std::memory_order_relaxed);
}

RGB RGBFilm::GetPixelRGB(Point2i p) const {
    const Pixel &pixel = pixels[p];
    RGB rgb(pixel.rgbSum[0], pixel.rgbSum[1], pixel.rgbSum[2]);
    // Normalize _rgb_ with weight sum
    Float weightSum = pixel.weightSum;
    if (weightSum != 0)
        rgb /= weightSum;
    return rgb;
}

int64_t RGBFilm::SampleCount(Point2i p) const {
    return pixels[p].nSamples.load(std::memory_order_relaxed);
}

int64_t RGBFilm::TotalSampleCount() const {
    int64_t total = 0;
    for (const Pixel &pixel : pixels)
        total += pixel.nSamples.load(std::memory_order_relaxed);
    return total;
}

void RGBFilm::ResetPixel(Point2i p) {
    Pixel &pixel = pixels[p];
    for (int c = 0; c < 3; ++c)
        pixel.rgbSum[c] = 0;
    pixel.weightSum = 0;
    pixel.nSamples = 0;
}

Image RGBFilm::GetImage() const {
    Image image(Point2i(pixelBounds.pMax - pixelBounds.pMin));
    ParallelFor2D(pixelBounds, [&](Point2i p) {
        RGB rgb = GetPixelRGB(p);
        Point2i pOffset(p.x - pixelBounds.pMin.x, p.y - pixelBounds.pMin.y);
        image.SetPixel(pOffset, rgb);
    });
    return image;
}

bool RGBFilm::WriteImage() const {
    if (filename.empty()) {
        Error("No output filename given for film.");
        return false;
    }
    Image image = GetImage();
    LOG_VERBOSE("Writing image %s with bounds %s", filename, pixelBounds);
    return image.Write(filename);
}

std::string RGBFilm::ToString() const {
    return StringPrintf("[ RGBFilm fullResolution: %s pixelBounds: %s filter: %s "
                        "filename: %s maxComponentValue: %f ]",
                        fullResolution, pixelBounds, filter, filename,
                        maxComponentValue);
}

}  // namespace lumen
