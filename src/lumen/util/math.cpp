// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/util/math.h>

#include <lumen/util/print.h>

#include <cmath>

namespace lumen {

template <int N>
std::string SquareMatrix<N>::ToString() const {
    std::string s = "[";
    for (int row = 0; row < N; ++row) {
        s += row == 0 ? " [" : ", [";
        for (int col = 0; col < N; ++col)
            s += StringPrintf(col == 0 ? " %f" : ", %f", m[row][col]);
        s += " ]";
    }
    return s + " ]";
}

// Gauss-Jordan elimination with partial pivoting. The left half of each row
// of _a_ starts as _m_ and the right half as the identity; once the left half
// is reduced to the identity, the right half holds the inverse.
template <int N>
std::optional<SquareMatrix<N>> Inverse(const SquareMatrix<N> &m) {
    double a[N][2 * N];
    for (int row = 0; row < N; ++row)
        for (int col = 0; col < N; ++col) {
            a[row][col] = m[row][col];
            a[row][N + col] = (row == col) ? 1 : 0;
        }

    for (int col = 0; col < N; ++col) {
        // Bring the row with the largest entry in this column up to the diagonal
        int pivot = col;
        for (int row = col + 1; row < N; ++row)
            if (std::abs(a[row][col]) > std::abs(a[pivot][col]))
                pivot = row;
        if (a[pivot][col] == 0)
            return {};
        if (pivot != col)
            for (int k = 0; k < 2 * N; ++k)
                std::swap(a[pivot][k], a[col][k]);

        double scale = 1 / a[col][col];
        for (int k = 0; k < 2 * N; ++k)
            a[col][k] *= scale;

        for (int row = 0; row < N; ++row) {
            if (row == col || a[row][col] == 0)
                continue;
            double f = a[row][col];
            for (int k = 0; k < 2 * N; ++k)
                a[row][k] = FMA(-f, a[col][k], a[row][k]);
        }
    }

    SquareMatrix<N> inv;
    for (int row = 0; row < N; ++row)
        for (int col = 0; col < N; ++col)
            inv[row][col] = Float(a[row][N + col]);
    return inv;
}

template class SquareMatrix<4>;
template std::optional<SquareMatrix<4>> Inverse(const SquareMatrix<4> &);

}  // namespace lumen
