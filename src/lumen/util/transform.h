// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#ifndef LUMEN_UTIL_TRANSFORM_H
#define LUMEN_UTIL_TRANSFORM_H

#include <lumen/lumen.h>

#include <lumen/ray.h>
#include <lumen/util/float.h>
#include <lumen/util/math.h>
#include <lumen/util/vecmath.h>

#include <cmath>
#include <limits>
#include <optional>
#include <string>

namespace lumen {

// Transform Definition
class Transform {
  public:
    // Transform Public Methods
    Transform() = default;
    Transform(const SquareMatrix<4> &m) : m(m) {
        std::optional<SquareMatrix<4>> inv = Inverse(m);
        if (inv)
            mInv = *inv;
        else {
            // Singular matrices get a NaN inverse so misuse shows up downstream
            Float NaN = std::numeric_limits<Float>::quiet_NaN();
            for (int i = 0; i < 4; ++i)
                for (int j = 0; j < 4; ++j)
                    mInv[i][j] = NaN;
        }
    }
    Transform(const SquareMatrix<4> &m, const SquareMatrix<4> &mInv) : m(m), mInv(mInv) {}

    const SquareMatrix<4> &GetMatrix() const { return m; }
    const SquareMatrix<4> &GetInverseMatrix() const { return mInv; }

    bool operator==(const Transform &t) const { return t.m == m; }
    bool operator!=(const Transform &t) const { return t.m != m; }
    bool IsIdentity() const { return m.IsIdentity(); }

    template <typename T>
    Point3<T> operator()(Point3<T> p) const;
    template <typename T>
    Vector3<T> operator()(Vector3<T> v) const;
    template <typename T>
    Normal3<T> operator()(Normal3<T>) const;
    Ray operator()(const Ray &r) const;
    Bounds3f operator()(const Bounds3f &b) const;

    Transform operator*(const Transform &t2) const;

    bool SwapsHandedness() const;

    std::string ToString() const;

  private:
    // Transform Private Members
    SquareMatrix<4> m, mInv;
};

// Transform Function Declarations
Transform Translate(Vector3f delta);
Transform Scale(Float x, Float y, Float z);
Transform LookAt(Point3f pos, Point3f look, Vector3f up);
Transform Orthographic(Float znear, Float zfar);
Transform Perspective(Float fov, Float znear, Float zfar);

// Transform Inline Functions
inline Transform Inverse(const Transform &t) {
    return Transform(t.GetInverseMatrix(), t.GetMatrix());
}

// Transform Inline Methods
template <typename T>
inline Point3<T> Transform::operator()(Point3<T> p) const {
    T xp = m[0][0] * p.x + m[0][1] * p.y + m[0][2] * p.z + m[0][3];
    T yp = m[1][0] * p.x + m[1][1] * p.y + m[1][2] * p.z + m[1][3];
    T zp = m[2][0] * p.x + m[2][1] * p.y + m[2][2] * p.z + m[2][3];
    T wp = m[3][0] * p.x + m[3][1] * p.y + m[3][2] * p.z + m[3][3];
    if (wp == 1)
        return Point3<T>(xp, yp, zp);
    else
        return Point3<T>(xp, yp, zp) / wp;
}

template <typename T>
inline Vector3<T> Transform::operator()(Vector3<T> v) const {
    return Vector3<T>(m[0][0] * v.x + m[0][1] * v.y + m[0][2] * v.z,
                      m[1][0] * v.x + m[1][1] * v.y + m[1][2] * v.z,
                      m[2][0] * v.x + m[2][1] * v.y + m[2][2] * v.z);
}

// Normals transform by the inverse transpose
template <typename T>
inline Normal3<T> Transform::operator()(Normal3<T> n) const {
    T x = n.x, y = n.y, z = n.z;
    return Normal3<T>(mInv[0][0] * x + mInv[1][0] * y + mInv[2][0] * z,
                      mInv[0][1] * x + mInv[1][1] * y + mInv[2][1] * z,
                      mInv[0][2] * x + mInv[1][2] * y + mInv[2][2] * z);
}

inline Ray Transform::operator()(const Ray &r) const {
    return Ray((*this)(r.o), (*this)(r.d));
}

}  // namespace lumen

#endif  // LUMEN_UTIL_TRANSFORM_H
