#include "core/vector_math.hpp"

#include <algorithm>
#include <cmath>

#include <vtkMath.h>
#include <vtkMatrix4x4.h>

namespace screw_planner::core::math {

namespace {

/// |det| below this fraction of the Hadamard bound counts as singular
constexpr double SingularRelativeTolerance = 1e-12;

}  // namespace

double dot(const Vector3& a, const Vector3& b) {
    return vtkMath::Dot(a.data(), b.data());
}

Vector3 cross(const Vector3& a, const Vector3& b) {
    Vector3 c{};
    vtkMath::Cross(a.data(), b.data(), c.data());
    return c;
}

double norm(const Vector3& v) {
    return vtkMath::Norm(v.data());
}

std::optional<Vector3> normalized(const Vector3& v) {
    Vector3 unit = v;
    double length = vtkMath::Normalize(unit.data());
    if (!std::isfinite(length) || length < DegenerateLength) {
        return std::nullopt;
    }
    return unit;
}

Vector3 add(const Vector3& a, const Vector3& b) {
    Vector3 c{};
    vtkMath::Add(a.data(), b.data(), c.data());
    return c;
}

Vector3 subtract(const Vector3& a, const Vector3& b) {
    Vector3 c{};
    vtkMath::Subtract(a.data(), b.data(), c.data());
    return c;
}

Vector3 scale(const Vector3& v, double s) {
    Vector3 c = v;
    vtkMath::MultiplyScalar(c.data(), s);
    return c;
}

Matrix3 identity3() {
    return {{{1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, {0.0, 0.0, 1.0}}};
}

Matrix3 transpose(const Matrix3& m) {
    Matrix3 t{};
    for (size_t i = 0; i < 3; ++i) {
        for (size_t j = 0; j < 3; ++j) {
            t[j][i] = m[i][j];
        }
    }
    return t;
}

Matrix3 multiply(const Matrix3& a, const Matrix3& b) {
    Matrix3 c{};
    for (size_t i = 0; i < 3; ++i) {
        for (size_t j = 0; j < 3; ++j) {
            double sum = 0.0;
            for (size_t k = 0; k < 3; ++k) {
                sum += a[i][k] * b[k][j];
            }
            c[i][j] = sum;
        }
    }
    return c;
}

Vector3 multiply(const Matrix3& m, const Vector3& v) {
    return {
        m[0][0] * v[0] + m[0][1] * v[1] + m[0][2] * v[2],
        m[1][0] * v[0] + m[1][1] * v[1] + m[1][2] * v[2],
        m[2][0] * v[0] + m[2][1] * v[1] + m[2][2] * v[2]
    };
}

double determinant(const Matrix3& m) {
    double a[3][3];
    for (size_t i = 0; i < 3; ++i) {
        for (size_t j = 0; j < 3; ++j) {
            a[i][j] = m[i][j];
        }
    }
    return vtkMath::Determinant3x3(a);
}

Vector3 column(const Matrix3& m, int col) {
    auto c = static_cast<size_t>(col);
    return {m[0][c], m[1][c], m[2][c]};
}

Matrix4 multiply(const Matrix4& a, const Matrix4& b) {
    Matrix4 c{};
    vtkMatrix4x4::Multiply4x4(a.data(), b.data(), c.data());
    return c;
}

Vector3 transformPoint(const Matrix4& m, const Vector3& p) {
    const double in[4] = {p[0], p[1], p[2], 1.0};
    double out[4] = {0.0, 0.0, 0.0, 0.0};
    vtkMatrix4x4::MultiplyPoint(m.data(), in, out);
    return {out[0], out[1], out[2]};
}

std::optional<std::array<double, 4>> solve4x4(
    const Matrix4& a, const std::array<double, 4>& b) {

    // Reject (near-)singular systems relative to the column magnitudes. For
    // an affine the translation column is left out; it never affects rank.
    auto at = [&a](int r, int c) { return a[static_cast<size_t>(r * 4 + c)]; };
    const bool affine = at(3, 0) == 0.0 && at(3, 1) == 0.0 && at(3, 2) == 0.0 && at(3, 3) == 1.0;

    double det = 0.0;
    double hadamard = 1.0;
    if (affine) {
        double linear[3][3];
        for (int r = 0; r < 3; ++r) {
            for (int c = 0; c < 3; ++c) {
                linear[r][c] = at(r, c);
            }
        }
        det = vtkMath::Determinant3x3(linear);
        for (int c = 0; c < 3; ++c) {
            hadamard *= std::sqrt(at(0, c) * at(0, c) + at(1, c) * at(1, c) + at(2, c) * at(2, c));
        }
    } else {
        det = vtkMatrix4x4::Determinant(a.data());
        for (int c = 0; c < 4; ++c) {
            double columnNorm = 0.0;
            for (int r = 0; r < 4; ++r) {
                columnNorm += at(r, c) * at(r, c);
            }
            hadamard *= std::sqrt(columnNorm);
        }
    }
    if (!std::isfinite(det) || hadamard == 0.0 ||
        std::abs(det) <= SingularRelativeTolerance * hadamard) {
        return std::nullopt;
    }

    double rows[4][4];
    double* rowPointers[4];
    for (int r = 0; r < 4; ++r) {
        for (int c = 0; c < 4; ++c) {
            rows[r][c] = a[static_cast<size_t>(r * 4 + c)];
        }
        rowPointers[r] = rows[r];
    }

    std::array<double, 4> x = b;
    if (vtkMath::SolveLinearSystem(rowPointers, x.data(), 4) == 0) {
        return std::nullopt;
    }
    if (!std::all_of(x.begin(), x.end(), [](double v) { return std::isfinite(v); })) {
        return std::nullopt;
    }
    return x;
}

double maxAbsDifference(const Matrix4& a, const Matrix4& b) {
    double worst = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        worst = std::max(worst, std::abs(a[i] - b[i]));
    }
    return worst;
}

}  // namespace screw_planner::core::math
