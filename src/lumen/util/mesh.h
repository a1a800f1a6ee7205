// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_UTIL_MESH_H
#define LUMEN_UTIL_MESH_H

#include <lumen/lumen.h>

#include <lumen/util/transform.h>
#include <lumen/util/vecmath.h>

#include <memory_resource>
#include <string>
#include <vector>

namespace lumen {

// TriangleMesh Definition
// Vertex data is transformed to render space at construction and immutable
// afterward. Triangles with zero area are removed from _vertexIndices_ and
// counted in _nDegenerateTriangles_.
class TriangleMesh {
  public:
    // TriangleMesh Public Methods
    TriangleMesh(const Transform &renderFromObject, bool reverseOrientation,
                 std::vector<int> vertexIndices, std::vector<Point3f> p,
                 std::vector<Normal3f> n, std::vector<Point2f> uv, Allocator alloc = {});

    std::string ToString() const;

    // TriangleMesh Public Members
    int nTriangles, nVertices;
    std::pmr::vector<int> vertexIndices;
    std::pmr::vector<Point3f> p;
    // Empty if the mesh has no per-vertex normals or texture coordinates
    std::pmr::vector<Normal3f> n;
    std::pmr::vector<Point2f> uv;
    bool reverseOrientation, transformSwapsHandedness;
    int nDegenerateTriangles = 0, nZeroLengthNormals = 0;
};

}  // namespace lumen

#endif  // LUMEN_UTIL_MESH_H
