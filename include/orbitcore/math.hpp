#pragma once

#include "orbitcore/types.hpp"

#include <algorithm>
#include <cmath>

namespace orbitcore
{

    inline constexpr double kGravitationalConstant_SI = 6.67430e-11; // m^3 / (kg s^2)
    inline constexpr double kAstronomicalUnit_m = 1.495978707e11;
    inline constexpr double kPi = 3.14159265358979323846;
    inline constexpr double kTwoPi = 2.0 * kPi;

    inline double wrap_angle_0_2pi(const double rad)
    {
        if (!std::isfinite(rad))
        {
            return 0.0;
        }
        double x = std::fmod(rad, kTwoPi);
        if (x < 0.0)
        {
            x += kTwoPi;
        }
        // fmod of a value just below a multiple of 2pi can round up to exactly 2pi.
        if (x >= kTwoPi)
        {
            x -= kTwoPi;
        }
        return x;
    }

    inline double wrap_angle_pm_pi(const double rad)
    {
        return wrap_angle_0_2pi(rad + kPi) - kPi;
    }

    // -------------------------------------------------------------------------
    // Vectors
    // -------------------------------------------------------------------------

    /**
     * @brief Dot product with compensated summation.
     *
     * Each product is split into its rounded value and exact rounding error (fma),
     * and the six terms are accumulated with Neumaier summation. Orbit geometry
     * mixes large and small magnitudes whose naive sum cancels badly.
     */
    inline double dot(const Vec3 &u, const Vec3 &v)
    {
        double sum = 0.0;
        double compensation = 0.0;
        const auto accumulate = [&sum, &compensation](const double x) {
            const double t = sum + x;
            if (std::abs(sum) >= std::abs(x))
            {
                compensation += (sum - t) + x;
            }
            else
            {
                compensation += (x - t) + sum;
            }
            sum = t;
        };

        for (int i = 0; i < 3; ++i)
        {
            const double p = u[i] * v[i];
            accumulate(p);
            accumulate(std::fma(u[i], v[i], -p));
        }
        return sum + compensation;
    }

    inline Vec3 cross(const Vec3 &u, const Vec3 &v) { return glm::cross(u, v); }

    inline double norm(const Vec3 &u) { return std::sqrt(dot(u, u)); }

    /// @brief Unsigned angle between two vectors, in [0, pi].
    inline Outcome<double> angle(const Vec3 &u, const Vec3 &v)
    {
        const double nu = norm(u);
        const double nv = norm(v);
        if (!(nu > 0.0) || !(nv > 0.0) || !std::isfinite(nu) || !std::isfinite(nv))
        {
            return make_error<double>(ErrorKind::Domain, "angle with a zero-length vector");
        }
        // Rounding may push the cosine slightly outside [-1, 1].
        const double c = std::clamp(dot(u, v) / nu / nv, -1.0, 1.0);
        return make_ok(std::acos(c));
    }

    /**
     * @brief Signed angle from u to v.
     *
     * Negative when (u x v) points against `normal`.
     */
    inline Outcome<double> oriented_angle(const Vec3 &u, const Vec3 &v, const Vec3 &normal = Vec3{0.0, 0.0, 1.0})
    {
        Outcome<double> out = angle(u, v);
        if (!out.valid())
        {
            return out;
        }
        if (dot(normal, cross(u, v)) < 0.0)
        {
            out.value = -out.value;
        }
        return out;
    }

    /// @brief Largest absolute component (Chebyshev norm).
    inline double max_abs(const Vec3 &u) { return std::max({std::abs(u.x), std::abs(u.y), std::abs(u.z)}); }

    // -------------------------------------------------------------------------
    // Matrices
    //
    // Mat3 is glm's column-major dmat3 (m[col][row]); the helpers below take and
    // return rows so callers can write matrices the way they read on paper.
    // -------------------------------------------------------------------------

    inline Mat3 mat3_from_rows(const Vec3 &r0, const Vec3 &r1, const Vec3 &r2)
    {
        return glm::transpose(Mat3(r0, r1, r2));
    }

    inline double element(const Mat3 &m, const int row, const int col) { return m[col][row]; }

    inline Vec3 row(const Mat3 &m, const int r) { return Vec3{m[0][r], m[1][r], m[2][r]}; }

    inline Mat3 identity3() { return Mat3(1.0); }

    inline Mat3 transpose(const Mat3 &m) { return glm::transpose(m); }

    /// @brief Largest absolute element difference between two matrices.
    inline double max_abs_diff(const Mat3 &a, const Mat3 &b)
    {
        double out = 0.0;
        for (int c = 0; c < 3; ++c)
        {
            out = std::max(out, max_abs(a[c] - b[c]));
        }
        return out;
    }

    /**
     * @brief Rotation of `angle_rad` around `axis` (Rodrigues' formula).
     *
     * The axis need not be unit length but must be nonzero.
     */
    inline Outcome<Mat3> rotation(const double angle_rad, const Vec3 &axis)
    {
        const double d = norm(axis);
        if (!(d > 0.0) || !std::isfinite(d))
        {
            return make_error<Mat3>(ErrorKind::Domain, "rotation around a zero-length axis");
        }
        const double x = axis.x / d;
        const double y = axis.y / d;
        const double z = axis.z / d;
        const double s = std::sin(angle_rad);
        const double c = std::cos(angle_rad);
        const double k = 1.0 - c;

        return make_ok(mat3_from_rows(Vec3{x * x * k + c, x * y * k - z * s, x * z * k + y * s},
                                      Vec3{y * x * k + z * s, y * y * k + c, y * z * k - x * s},
                                      Vec3{z * x * k - y * s, z * y * k + x * s, z * z * k + c}));
    }

    /// @brief rotation() with the angle in degrees.
    inline Outcome<Mat3> rotation_deg(const double angle_deg, const Vec3 &axis)
    {
        return rotation(glm::radians(angle_deg), axis);
    }

    /**
     * @brief Rotation matrix from Z1-X2-Z3 intrinsic Euler angles.
     *
     * With (alpha, beta, gamma) = (longitude of ascending node, inclination,
     * argument of periapsis) the result maps the perifocal frame to the world frame.
     */
    inline Mat3 from_euler_angles(const double alpha, const double beta, const double gamma)
    {
        const double c1 = std::cos(alpha);
        const double s1 = std::sin(alpha);
        const double c2 = std::cos(beta);
        const double s2 = std::sin(beta);
        const double c3 = std::cos(gamma);
        const double s3 = std::sin(gamma);

        return mat3_from_rows(Vec3{c1 * c3 - c2 * s1 * s3, -c1 * s3 - c2 * c3 * s1, s1 * s2},
                              Vec3{c3 * s1 + c1 * c2 * s3, c1 * c2 * c3 - s1 * s3, -c1 * s2},
                              Vec3{s2 * s3, c3 * s2, c2});
    }

} // namespace orbitcore
