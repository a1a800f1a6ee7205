// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/util/mesh.h>

#include <lumen/util/check.h>
#include <lumen/util/error.h>
#include <lumen/util/log.h>
#include <lumen/util/print.h>

#include <limits>

namespace lumen {

// TriangleMesh Method Definitions
TriangleMesh::TriangleMesh(const Transform &renderFromObject, bool reverseOrientation,
                           std::vector<int> indices, std::vector<Point3f> pts,
                           std::vector<Normal3f> normals, std::vector<Point2f> uvs,
                           Allocator alloc)
    : nVertices(pts.size()),
      vertexIndices(alloc),
      p(alloc),
      n(alloc),
      uv(alloc),
      reverseOrientation(reverseOrientation),
      transformSwapsHandedness(renderFromObject.SwapsHandedness()) {
    if (indices.size() % 3 != 0)
        ErrorExit("Number of vertex indices %d not a multiple of 3.", int(indices.size()));
    if (pts.size() > size_t(std::numeric_limits<int>::max()) ||
        indices.size() > size_t(std::numeric_limits<int>::max()))
        ErrorExit("Triangle mesh has too many vertices or indices.");
    for (int index : indices)
        if (index < 0 || index >= nVertices)
            ErrorExit("Vertex index %d is out of range [0, %d).", index, nVertices);
    if (!normals.empty() && normals.size() != pts.size())
        ErrorExit("Triangle mesh has %d vertices but %d normals.", nVertices,
                  int(normals.size()));
    if (!uvs.empty() && uvs.size() != pts.size())
        ErrorExit("Triangle mesh has %d vertices but %d texture coordinates.", nVertices,
                  int(uvs.size()));

    // Transform mesh vertices to render space and initialize mesh _p_
    for (Point3f &pt : pts)
        pt = renderFromObject(pt);
    p.assign(pts.begin(), pts.end());

    // Drop triangles with zero area
    vertexIndices.reserve(indices.size());
    for (size_t i = 0; i < indices.size(); i += 3) {
        Point3f p0 = p[indices[i]], p1 = p[indices[i + 1]], p2 = p[indices[i + 2]];
        if (LengthSquared(Cross(p1 - p0, p2 - p0)) == 0) {
            ++nDegenerateTriangles;
            continue;
        }
        vertexIndices.insert(vertexIndices.end(), &indices[i], &indices[i] + 3);
    }
    nTriangles = vertexIndices.size() / 3;
    if (nDegenerateTriangles > 0)
        Warning("Dropped %d degenerate triangles of %d.", nDegenerateTriangles,
                int(indices.size() / 3));

    if (!uvs.empty())
        uv.assign(uvs.begin(), uvs.end());

    if (!normals.empty()) {
        // Replace zero-length normals with the area-weighted average of the
        // normals of the faces that share the vertex
        std::vector<Vector3f> faceSum;
        for (const Normal3f &nn : normals)
            if (LengthSquared(nn) == 0)
                ++nZeroLengthNormals;
        if (nZeroLengthNormals > 0) {
            faceSum.resize(nVertices, Vector3f(0, 0, 0));
            for (size_t i = 0; i < vertexIndices.size(); i += 3) {
                const int *v = &vertexIndices[i];
                Vector3f ng = Cross(p[v[1]] - p[v[0]], p[v[2]] - p[v[0]]);
                for (int j = 0; j < 3; ++j)
                    faceSum[v[j]] += ng;
            }
            Warning("Replaced %d zero-length vertex normals.", nZeroLengthNormals);
        }

        n.reserve(nVertices);
        for (int i = 0; i < nVertices; ++i) {
            Normal3f nn = normals[i];
            if (LengthSquared(nn) == 0) {
                // Unreferenced vertices are left with a zero normal
                if (LengthSquared(faceSum[i]) == 0) {
                    n.push_back(Normal3f(0, 0, 0));
                    continue;
                }
                nn = Normal3f(faceSum[i]);
                if (reverseOrientation ^ transformSwapsHandedness)
                    nn = -nn;
            } else {
                nn = renderFromObject(nn);
                if (reverseOrientation)
                    nn = -nn;
            }
            n.push_back(Normalize(nn));
        }
    }
    LOG_VERBOSE("Created triangle mesh with %d triangles and %d vertices", nTriangles,
                nVertices);
}

std::string TriangleMesh::ToString() const {
    return StringPrintf("[ TriangleMesh reverseOrientation: %s transformSwapsHandedness: %s "
                        "nTriangles: %d nVertices: %d nDegenerateTriangles: %d "
                        "nZeroLengthNormals: %d hasNormals: %s hasUV: %s ]",
                        reverseOrientation, transformSwapsHandedness, nTriangles,
                        nVertices, nDegenerateTriangles, nZeroLengthNormals, !n.empty(),
                        !uv.empty());
}

}  // namespace lumen
