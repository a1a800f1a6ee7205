// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/util/image.h>

#include <lumen/util/error.h>
#include <lumen/util/file.h>
#include <lumen/util/print.h>

#include <cstdio>
#include <cstring>
#include <memory>

namespace lumen {

static bool IsHostLittleEndian() {
    uint32_t v = 1;
    uint8_t b;
    std::memcpy(&b, &v, 1);
    return b == 1;
}

RGB Image::Average() const {
    if (Empty())
        return RGB(0.f);
    double sum[3] = {0, 0, 0};
    for (size_t i = 0; i < p32.size(); ++i)
        sum[i % 3] += p32[i];
    double n = double(resolution.x) * double(resolution.y);
    return RGB(sum[0] / n, sum[1] / n, sum[2] / n);
}

bool Image::HasAnyNaNPixels() const {
    for (float v : p32)
        if (IsNaN(v))
            return true;
    return false;
}

bool Image::Write(const std::string &name) const {
    if (Empty()) {
        Error("%s: refusing to write an empty image", name);
        return false;
    }
    if (HasExtension(name, "pfm"))
        return WritePFM(name);
    Error("%s: no support for writing images with this extension", name);
    return false;
}

bool Image::WritePFM(const std::string &filename) const {
    FILE *fp = fopen(filename.c_str(), "wb");
    if (fp == nullptr) {
        Error("Unable to open output PFM file \"%s\"", filename);
        return false;
    }

    std::unique_ptr<float[]> scanline = std::make_unique<float[]>(3 * resolution.x);
    float scale;

    if (fprintf(fp, "PF\n") < 0)
        goto fail;

    if (fprintf(fp, "%d %d\n", resolution.x, resolution.y) < 0)
        goto fail;

    // A negative scale marks little-endian data
    scale = IsHostLittleEndian() ? -1.f : 1.f;
    if (fprintf(fp, "%f\n", scale) < 0)
        goto fail;

    // Rows are stored bottom to top, pixels left to right
    for (int y = resolution.y - 1; y >= 0; y--) {
        std::memcpy(scanline.get(), RawPointer({0, y}), 3 * resolution.x * sizeof(float));
        if (fwrite(&scanline[0], sizeof(float), 3 * resolution.x, fp) <
            (size_t)(3 * resolution.x))
            goto fail;
    }

    if (fclose(fp) != 0) {
        Error("Error closing PFM file \"%s\"", filename);
        return false;
    }
    return true;

fail:
    Error("Error writing PFM file \"%s\"", filename);
    fclose(fp);
    return false;
}

std::string Image::ToString() const {
    return StringPrintf("[ Image resolution: %s average: %s ]", resolution, Average());
}

}  // namespace lumen
