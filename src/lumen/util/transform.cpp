// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/util/transform.h>

#include <lumen/util/error.h>
#include <lumen/util/log.h>
#include <lumen/util/print.h>

#include <cmath>

namespace lumen {

// Transform Function Definitions
// clang-format off
Transform Translate(Vector3f delta) {
    SquareMatrix<4> m(1, 0, 0, delta.x,
                      0, 1, 0, delta.y,
                      0, 0, 1, delta.z,
                      0, 0, 0, 1);
    SquareMatrix<4> minv(1, 0, 0, -delta.x,
                         0, 1, 0, -delta.y,
                         0, 0, 1, -delta.z,
                         0, 0, 0, 1);
    return Transform(m, minv);
}

Transform Scale(Float x, Float y, Float z) {
    SquareMatrix<4> m(x, 0, 0, 0,
                      0, y, 0, 0,
                      0, 0, z, 0,
                      0, 0, 0, 1);
    SquareMatrix<4> minv(1 / x,     0,     0, 0,
                             0, 1 / y,     0, 0,
                             0,     0, 1 / z, 0,
                             0,     0,     0, 1);
    return Transform(m, minv);
}
// clang-format on

Transform LookAt(Point3f pos, Point3f look, Vector3f up) {
    SquareMatrix<4> worldFromCamera;
    // Fourth column: camera position
    worldFromCamera[0][3] = pos.x;
    worldFromCamera[1][3] = pos.y;
    worldFromCamera[2][3] = pos.z;
    worldFromCamera[3][3] = 1;

    Vector3f dir = Normalize(look - pos);
    if (Length(Cross(Normalize(up), dir)) == 0)
        ErrorExit("LookAt: \"up\" vector %s and viewing direction %s are pointing in "
                  "the same direction.",
                  up, dir);
    Vector3f right = Normalize(Cross(Normalize(up), dir));
    Vector3f newUp = Cross(dir, right);
    for (int i = 0; i < 3; ++i) {
        worldFromCamera[i][0] = right[i];
        worldFromCamera[i][1] = newUp[i];
        worldFromCamera[i][2] = dir[i];
    }
    worldFromCamera[3][0] = worldFromCamera[3][1] = worldFromCamera[3][2] = 0;

    std::optional<SquareMatrix<4>> cameraFromWorld = Inverse(worldFromCamera);
    CHECK(cameraFromWorld.has_value());
    return Transform(*cameraFromWorld, worldFromCamera);
}

Transform Orthographic(Float zNear, Float zFar) {
    return Scale(1, 1, 1 / (zFar - zNear)) * Translate(Vector3f(0, 0, -zNear));
}

Transform Perspective(Float fov, Float n, Float f) {
    // clang-format off
    SquareMatrix<4> persp(1, 0,           0,              0,
                          0, 1,           0,              0,
                          0, 0, f / (f - n), -f*n / (f - n),
                          0, 0,           1,              0);
    // clang-format on
    // Scale the canonical projection to the requested field of view
    Float invTanAng = 1 / std::tan(Radians(fov) / 2);
    return Scale(invTanAng, invTanAng, 1) * Transform(persp);
}

// Transform Method Definitions
Bounds3f Transform::operator()(const Bounds3f &b) const {
    Bounds3f bt;
    for (int i = 0; i < 8; ++i)
        bt = Union(bt, (*this)(b.Corner(i)));
    return bt;
}

Transform Transform::operator*(const Transform &t2) const {
    return Transform(m * t2.m, t2.mInv * mInv);
}

bool Transform::SwapsHandedness() const {
    Float minor12 = DifferenceOfProducts(m[1][1], m[2][2], m[1][2], m[2][1]);
    Float minor02 = DifferenceOfProducts(m[1][0], m[2][2], m[1][2], m[2][0]);
    Float minor01 = DifferenceOfProducts(m[1][0], m[2][1], m[1][1], m[2][0]);
    Float det =
        m[0][2] * minor01 + DifferenceOfProducts(m[0][0], minor12, m[0][1], minor02);
    return det < 0;
}

std::string Transform::ToString() const {
    return StringPrintf("[ m: %s mInv: %s ]", m, mInv);
}

}  // namespace lumen
