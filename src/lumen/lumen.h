// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_LUMEN_H
#define LUMEN_LUMEN_H

#include <stdint.h>
#include <cstddef>
#include <memory_resource>

// Define Cache Line Size Constant
#define LUMEN_L1_CACHE_LINE_SIZE 64

// From ABSL_ARRAYSIZE
#define LUMEN_ARRAYSIZE(array) (sizeof(::lumen::detail::ArraySizeHelper(array)))

namespace lumen {
namespace detail {

template <typename T, uint64_t N>
auto ArraySizeHelper(const T (&array)[N]) -> char (&)[N];

}  // namespace detail

// Float Type Definitions
#ifdef LUMEN_FLOAT_AS_DOUBLE
using Float = double;
#else
using Float = float;
#endif

#ifdef LUMEN_FLOAT_AS_DOUBLE
using FloatBits = uint64_t;
#else
using FloatBits = uint32_t;
#endif  // LUMEN_FLOAT_AS_DOUBLE
static_assert(sizeof(Float) == sizeof(FloatBits),
              "Float and FloatBits must have the same size");

template <typename T>
class Vector2;
template <typename T>
class Vector3;
template <typename T>
class Point3;
template <typename T>
class Point2;
template <typename T>
class Normal3;
using Point2f = Point2<Float>;
using Point2i = Point2<int>;
using Point3f = Point3<Float>;
using Vector2f = Vector2<Float>;
using Vector2i = Vector2<int>;
using Vector3f = Vector3<Float>;

template <typename T>
class Bounds2;
using Bounds2f = Bounds2<Float>;
using Bounds2i = Bounds2<int>;
template <typename T>
class Bounds3;
using Bounds3f = Bounds3<Float>;

class Interaction;
class Ray;
class SurfaceInteraction;
class Transform;
class TriangleMesh;

class RGB;
class BSDF;
class Image;
struct LumenOptions;

class ProgressReporter;
class RNG;
struct FileLoc;
template <typename T>
class Array2D;

class ScratchBuffer;

// Scene objects are placement-allocated from a memory resource that outlives
// the render and are never destroyed individually.
using Allocator = std::pmr::polymorphic_allocator<std::byte>;

// Initialization and Cleanup Function Declarations
void InitLumen(const LumenOptions &opt);
void CleanupLumen();

}  // namespace lumen

#endif  // LUMEN_LUMEN_H
