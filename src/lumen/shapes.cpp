// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/shapes.h>

#include <lumen/util/check.h>
#include <lumen/util/print.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <new>

namespace lumen {

std::string ShapeSample::ToString() const {
    return StringPrintf("[ ShapeSample intr: %s pdf: %f ]", intr, pdf);
}

std::string ShapeSampleContext::ToString() const {
    return StringPrintf("[ ShapeSampleContext p: %s pError: %s n: %s ns: %s ]", p, pError,
                        n, ns);
}

std::string ShapeIntersection::ToString() const {
    return StringPrintf("[ ShapeIntersection intr: %s tHit: %f ]", intr, tHit);
}

// Sphere Method Definitions
std::string Sphere::ToString() const {
    return StringPrintf("[ Sphere center: %s radius: %f reverseOrientation: %s ]", center,
                        radius, reverseOrientation);
}

std::optional<Sphere::QuadricIntersection> Sphere::BasicIntersect(const Ray &r,
                                                                  Float tMax) const {
    // Express ray origin relative to the sphere center
    Vector3f oi = r.o - center;
    Vector3f di = r.d;

    // Solve quadratic equation to compute sphere _t0_ and _t1_
    Float a = LengthSquared(di);
    Float b = 2 * Dot(di, oi);
    Float c = LengthSquared(oi) - Sqr(radius);
    if (a == 0)
        return {};

    // Compute sphere quadratic discriminant _discrim_
    Vector3f v = oi - b / (2 * a) * di;
    Float length = Length(v);
    Float discrim = 4 * a * (radius + length) * (radius - length);
    if (discrim < 0)
        return {};

    // Compute quadratic $t$ values
    Float rootDiscrim = std::sqrt(discrim);
    Float q = (b < 0) ? -.5f * (b - rootDiscrim) : -.5f * (b + rootDiscrim);
    if (q == 0)
        return {};
    Float t0 = q / a, t1 = c / q;
    if (t0 > t1)
        std::swap(t0, t1);

    // Conservative bound on the rounding error in _t0_ and _t1_
    Float tError = gamma(7) * std::max(std::abs(t0), std::abs(t1)) +
                   gamma(3) * (LengthSquared(oi) + Sqr(radius)) / std::abs(q);

    // Check quadric shape _t0_ and _t1_ for nearest intersection
    if (t0 + tError > tMax || t1 - tError <= 0)
        return {};
    Float tShapeHit = t0;
    if (tShapeHit - tError <= 0) {
        tShapeHit = t1;
        if (tShapeHit + tError > tMax)
            return {};
    }

    // Compute sphere hit position and refine it onto the surface
    Vector3f pObj = oi + tShapeHit * di;
    pObj *= radius / Length(pObj);
    if (pObj.x == 0 && pObj.y == 0)
        pObj.x = 1e-5f * radius;

    return QuadricIntersection{tShapeHit, pObj};
}

Point2f Sphere::UV(Vector3f pObj) const {
    Float phi = std::atan2(pObj.y, pObj.x);
    if (phi < 0)
        phi += 2 * Pi;
    Float theta = SafeACos(pObj.z / radius);
    return Point2f(phi / (2 * Pi), 1 - theta / Pi);
}

SurfaceInteraction Sphere::InteractionFromIntersection(const QuadricIntersection &isect,
                                                       Vector3f wo) const {
    Vector3f pObj = isect.pObj;
    // Find parametric representation of sphere hit
    Point2f uv = UV(pObj);
    Float cosTheta = pObj.z / radius;

    // Compute sphere $\dpdu$ and $\dpdv$
    Float zRadius = std::sqrt(Sqr(pObj.x) + Sqr(pObj.y));
    Float cosPhi = pObj.x / zRadius, sinPhi = pObj.y / zRadius;
    Vector3f dpdu(-2 * Pi * pObj.y, 2 * Pi * pObj.x, 0);
    Float sinTheta = SafeSqrt(1 - Sqr(cosTheta));
    Vector3f dpdv = -Pi * Vector3f(pObj.z * cosPhi, pObj.z * sinPhi, -radius * sinTheta);

    // Compute error bounds for sphere intersection
    Point3f pHit = center + pObj;
    Vector3f pError = gamma(5) * Abs(pObj) + gamma(2) * Vector3f(Abs(pHit));

    return SurfaceInteraction(pHit, pError, uv, wo, dpdu, dpdv, reverseOrientation);
}

std::optional<ShapeIntersection> Sphere::Intersect(const Ray &ray, Float tMax) const {
    std::optional<QuadricIntersection> isect = BasicIntersect(ray, tMax);
    if (!isect)
        return {};
    SurfaceInteraction intr = InteractionFromIntersection(*isect, -ray.d);
    return ShapeIntersection{intr, isect->tHit};
}

std::optional<ShapeSample> Sphere::Sample(Point2f u) const {
    Vector3f pObj = radius * SampleUniformSphere(u);
    // Reproject onto the surface so the error bound below holds
    pObj *= radius / Length(pObj);
    Point3f p = center + pObj;
    Vector3f pError = gamma(5) * Abs(pObj) + gamma(2) * Vector3f(Abs(p));
    Normal3f n(Normalize(pObj));
    if (reverseOrientation)
        n *= -1;
    return ShapeSample{Interaction(p, pError, n, UV(pObj)), 1 / Area()};
}

// Below sin^2(1.5 deg), 1 - cos(theta) is computed from its series expansion
// to avoid cancellation
static constexpr Float SmallConeSin2 = 0.00068523f;

// Returns 1 - cos(thetaMax) for a cone with the given sin^2(thetaMax)
static Float ConeOneMinusCos(Float sin2ThetaMax) {
    if (sin2ThetaMax < SmallConeSin2)
        return sin2ThetaMax / 2;
    return 1 - SafeSqrt(1 - sin2ThetaMax);
}

std::optional<ShapeSample> Sphere::Sample(const ShapeSampleContext &ctx, Point2f u) const {
    // From inside the sphere every direction sees it; fall back to area sampling
    if (DistanceSquared(ctx.OffsetRayOrigin(center), center) <= Sqr(radius))
        return SampleAreaAsSolidAngle(*this, ctx, u);

    // Otherwise sample uniformly within the cone of directions the sphere subtends
    Float sin2ThetaMax = Sqr(radius) / DistanceSquared(ctx.p, center);
    Float sinThetaMax = std::sqrt(sin2ThetaMax);
    Float oneMinusCosThetaMax = ConeOneMinusCos(sin2ThetaMax);
    Float cosTheta, sin2Theta;
    if (sin2ThetaMax < SmallConeSin2) {
        sin2Theta = sin2ThetaMax * u[0];
        cosTheta = std::sqrt(1 - sin2Theta);
    } else {
        cosTheta = 1 - u[0] * oneMinusCosThetaMax;
        sin2Theta = 1 - Sqr(cosTheta);
    }

    // Find the point on the sphere seen along the sampled direction, as an angle
    // _alpha_ at the center measured from the axis toward the reference point
    Float cosAlpha = sin2Theta / sinThetaMax +
                     cosTheta * SafeSqrt(1 - sin2Theta / Sqr(sinThetaMax));
    Float sinAlpha = SafeSqrt(1 - Sqr(cosAlpha));
    Vector3f w = SphericalDirection(sinAlpha, cosAlpha, 2 * Pi * u[1]);
    Frame frame = Frame::FromZ(Normalize(center - ctx.p));
    Vector3f pObj = radius * frame.FromLocal(-w);

    Point3f p = center + pObj;
    Vector3f pError = gamma(5) * Abs(pObj) + gamma(2) * Vector3f(Abs(p));
    Normal3f n(Normalize(pObj));
    if (reverseOrientation)
        n *= -1;
    DCHECK_NE(oneMinusCosThetaMax, 0);
    return ShapeSample{Interaction(p, pError, n, UV(pObj)),
                       1 / (2 * Pi * oneMinusCosThetaMax)};
}

Float Sphere::PDF(const ShapeSampleContext &ctx, Vector3f wi) const {
    if (DistanceSquared(ctx.OffsetRayOrigin(center), center) <= Sqr(radius))
        return AreaPDFAsSolidAngle(*this, ctx, wi);
    // The cone density does not depend on _wi_ inside the cone
    Float sin2ThetaMax = Sqr(radius) / DistanceSquared(ctx.p, center);
    return 1 / (2 * Pi * ConeOneMinusCos(sin2ThetaMax));
}

// Triangle Method Definitions
std::string TriangleIntersection::ToString() const {
    return StringPrintf("[ TriangleIntersection b0: %f b1: %f b2: %f t: %f ]", b0, b1, b2,
                        t);
}

// Watertight ray-triangle test: the vertices are moved into a space where the
// ray starts at the origin and runs along +z, where the hit reduces to 2D edge
// function signs.
std::optional<TriangleIntersection> IntersectTriangle(const Ray &ray, Float tMax,
                                                      Point3f p0, Point3f p1, Point3f p2) {
    if (LengthSquared(Cross(p2 - p0, p1 - p0)) == 0)
        return {};

    int kz = MaxComponentIndex(Abs(ray.d));
    int kx = (kz + 1) % 3, ky = (kx + 1) % 3;
    Vector3f d = Permute(ray.d, {kx, ky, kz});
    Float Sx = -d.x / d.z, Sy = -d.y / d.z, Sz = 1 / d.z;
    Point3f pt[3] = {p0, p1, p2};
    for (Point3f &p : pt) {
        p = Permute(p - Vector3f(ray.o), {kx, ky, kz});
        p.x += Sx * p.z;
        p.y += Sy * p.z;
    }

    // _e[i]_ is the edge function of the edge opposite vertex _i_
    Float e[3];
    for (int i = 0; i < 3; ++i) {
        const Point3f &a = pt[(i + 1) % 3], &b = pt[(i + 2) % 3];
        e[i] = DifferenceOfProducts(a.x, b.y, a.y, b.x);
        // A float zero may hide the sign; settle it in double precision
        if (sizeof(Float) == sizeof(float) && e[i] == 0)
            e[i] = Float(double(a.x) * double(b.y) - double(a.y) * double(b.x));
    }
    if ((e[0] < 0 || e[1] < 0 || e[2] < 0) && (e[0] > 0 || e[1] > 0 || e[2] > 0))
        return {};
    Float det = e[0] + e[1] + e[2];
    if (det == 0)
        return {};

    // Compare the hit distance, still scaled by _det_, against the ray extent
    Float tScaled = 0;
    for (int i = 0; i < 3; ++i) {
        pt[i].z *= Sz;
        tScaled += e[i] * pt[i].z;
    }
    if (det < 0 && (tScaled >= 0 || tScaled < tMax * det))
        return {};
    if (det > 0 && (tScaled <= 0 || tScaled > tMax * det))
        return {};
    Float invDet = 1 / det;
    Float t = tScaled * invDet;
    DCHECK(!IsNaN(t));

    // Reject hits whose _t_ is within the rounding error bound of zero
    Float maxXt = 0, maxYt = 0, maxZt = 0;
    for (const Point3f &p : pt) {
        maxXt = std::max(maxXt, std::abs(p.x));
        maxYt = std::max(maxYt, std::abs(p.y));
        maxZt = std::max(maxZt, std::abs(p.z));
    }
    Float maxE = MaxComponentValue(Abs(Vector3f(e[0], e[1], e[2])));
    Float deltaX = gamma(5) * (maxXt + maxZt), deltaY = gamma(5) * (maxYt + maxZt);
    Float deltaZ = gamma(3) * maxZt;
    Float deltaE = 2 * (gamma(2) * maxXt * maxYt + deltaY * maxXt + deltaX * maxYt);
    Float deltaT =
        3 * (gamma(3) * maxE * maxZt + deltaE * maxZt + deltaZ * maxE) * std::abs(invDet);
    if (t <= deltaT)
        return {};

    return TriangleIntersection{e[0] * invDet, e[1] * invDet, e[2] * invDet, t};
}

std::vector<Shape> Triangle::CreateTriangles(const TriangleMesh *mesh, Allocator alloc) {
    std::vector<Shape> tris;
    if (mesh->nTriangles == 0)
        return tris;
    // One allocation for the whole mesh
    Triangle *t = static_cast<Triangle *>(alloc.resource()->allocate(
        mesh->nTriangles * sizeof(Triangle), alignof(Triangle)));
    tris.reserve(mesh->nTriangles);
    for (int i = 0; i < mesh->nTriangles; ++i)
        tris.push_back(new (&t[i]) Triangle(mesh, i));
    return tris;
}

Bounds3f Triangle::Bounds() const {
    std::array<Point3f, 3> p = Vertices();
    return Union(Bounds3f(p[0], p[1]), p[2]);
}

std::optional<ShapeIntersection> Triangle::Intersect(const Ray &ray, Float tMax) const {
    std::array<Point3f, 3> p = Vertices();
    std::optional<TriangleIntersection> ti = IntersectTriangle(ray, tMax, p[0], p[1], p[2]);
    if (!ti)
        return {};
    return ShapeIntersection{InteractionFromIntersection(*ti, -ray.d), ti->t};
}

bool Triangle::IntersectP(const Ray &ray, Float tMax) const {
    std::array<Point3f, 3> p = Vertices();
    return IntersectTriangle(ray, tMax, p[0], p[1], p[2]).has_value();
}

SurfaceInteraction Triangle::InteractionFromIntersection(const TriangleIntersection &ti,
                                                         Vector3f wo) const {
    std::array<Point3f, 3> p = Vertices();
    std::array<Point2f, 3> uv = UVs();
    const int *v = Indices();

    // Solve for the partial derivatives of position with respect to (u, v)
    Vector2f duv02 = uv[0] - uv[2], duv12 = uv[1] - uv[2];
    Vector3f dp02 = p[0] - p[2], dp12 = p[1] - p[2];
    Float determinant = DifferenceOfProducts(duv02[0], duv12[1], duv02[1], duv12[0]);
    Vector3f dpdu, dpdv;
    bool degenerateUV = std::abs(determinant) < 1e-9f;
    if (!degenerateUV) {
        Float invdet = 1 / determinant;
        dpdu = DifferenceOfProducts(duv12[1], dp02, duv02[1], dp12) * invdet;
        dpdv = DifferenceOfProducts(duv02[0], dp12, duv12[0], dp02) * invdet;
    }
    if (degenerateUV || LengthSquared(Cross(dpdu, dpdv)) == 0) {
        // Any frame around the geometric normal will do
        Vector3f ng = Cross(p[2] - p[0], p[1] - p[0]);
        CHECK_NE(LengthSquared(ng), 0);
        CoordinateSystem(Normalize(ng), &dpdu, &dpdv);
    }

    Point3f pHit = ti.b0 * p[0] + ti.b1 * p[1] + ti.b2 * p[2];
    Point2f uvHit = ti.b0 * uv[0] + ti.b1 * uv[1] + ti.b2 * uv[2];
    Point3f pAbsSum = Abs(ti.b0 * p[0]) + Abs(ti.b1 * p[1]) + Abs(ti.b2 * p[2]);
    Vector3f pError = gamma(7) * Vector3f(pAbsSum);

    // The geometric normal follows the winding order, not the uv parameterization
    bool flipNormal = mesh->reverseOrientation ^ mesh->transformSwapsHandedness;
    SurfaceInteraction isect(pHit, pError, uvHit, wo, dpdu, dpdv, flipNormal);
    isect.n = isect.shading.n = Normal3f(Normalize(Cross(dp02, dp12)));
    if (flipNormal)
        isect.n = isect.shading.n = -isect.n;

    if (!mesh->n.empty()) {
        Normal3f ns = ti.b0 * mesh->n[v[0]] + ti.b1 * mesh->n[v[1]] + ti.b2 * mesh->n[v[2]];
        ns = LengthSquared(ns) > 0 ? Normalize(ns) : isect.n;
        // Shading tangents orthogonal to _ns_, as close to _dpdu_ as possible
        Vector3f ss = isect.dpdu;
        Vector3f ts = Cross(ns, ss);
        if (LengthSquared(ts) > 0)
            ss = Cross(ts, ns);
        else
            CoordinateSystem(ns, &ss, &ts);
        isect.SetShadingGeometry(ns, ss, ts, true);
    }
    return isect;
}

std::optional<ShapeSample> Triangle::Sample(Point2f u) const {
    std::array<Point3f, 3> p = Vertices();
    std::array<Float, 3> b = SampleUniformTriangle(u);
    Point3f pSample = b[0] * p[0] + b[1] * p[1] + b[2] * p[2];

    // Orient the normal like the interpolated shading normal if there is one
    Normal3f n = Normalize(Normal3f(Cross(p[1] - p[0], p[2] - p[0])));
    const int *v = Indices();
    if (!mesh->n.empty()) {
        Normal3f ns(b[0] * mesh->n[v[0]] + b[1] * mesh->n[v[1]] + b[2] * mesh->n[v[2]]);
        n = FaceForward(n, ns);
    } else if (mesh->reverseOrientation ^ mesh->transformSwapsHandedness)
        n *= -1;

    std::array<Point2f, 3> uv = UVs();
    Point2f uvSample = b[0] * uv[0] + b[1] * uv[1] + b[2] * uv[2];
    Point3f pAbsSum = Abs(b[0] * p[0]) + Abs(b[1] * p[1]) + Abs(b[2] * p[2]);
    Vector3f pError = Vector3f(gamma(6) * pAbsSum);
    return ShapeSample{Interaction(pSample, pError, n, uvSample), 1 / Area()};
}

std::string Triangle::ToString() const {
    std::array<Point3f, 3> p = Vertices();
    return StringPrintf("[ Triangle triIndex: %d -> p [ %s, %s, %s ] ]", triIndex, p[0],
                        p[1], p[2]);
}

std::string Shape::ToString() const {
    if (!ptr())
        return "(nullptr)";
    auto toStr = [](auto ptr) { return ptr->ToString(); };
    return Dispatch(toStr);
}

}  // namespace lumen
