#pragma once

#include "orbitcore/math.hpp"
#include "orbitcore/types.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace orbitcore
{
    /** @brief Options for the Kepler equation Newton iteration. */
    struct KeplerOptions
    {
        int max_iterations{100};      ///< Hard iteration cap
        double abs_tolerance{1e-12};  ///< Convergence tolerance on the Newton step (scaled by max(1, |x|))
    };

    /** @brief Result of solving Kepler's equation. */
    struct KeplerSolveResult
    {
        double anomaly_rad{std::numeric_limits<double>::quiet_NaN()};
        bool converged{false};  ///< True if Newton iteration converged
        int iterations{0};      ///< Number of iterations used
    };

    namespace detail
    {
        inline bool newton_step_done_(const double delta, const double x, const KeplerOptions &opt)
        {
            return std::abs(delta) <= opt.abs_tolerance * std::max(1.0, std::abs(x));
        }
    } // namespace detail

    /**
     * @brief Solve the elliptic Kepler equation M = E - e sin(E) for E.
     *
     * M is reduced to [0, 2pi) for the iteration and the removed whole turns are
     * added back to the result. The seed is E0 = M, except for e >= 0.8 where
     * Newton from M can cycle near periapsis and E0 = pi converges for every M.
     * A circular orbit returns M without iterating.
     *
     * @param mean_anomaly_rad Mean anomaly M
     * @param e Eccentricity in [0, 1)
     * @param opt Solver options
     */
    inline KeplerSolveResult solve_kepler_elliptic(const double mean_anomaly_rad, const double e,
                                                   const KeplerOptions &opt = {})
    {
        KeplerSolveResult out;
        if (!std::isfinite(mean_anomaly_rad) || !(e >= 0.0) || !(e < 1.0))
        {
            return out;
        }
        if (e == 0.0)
        {
            out.anomaly_rad = mean_anomaly_rad;
            out.converged = true;
            return out;
        }

        const double M = wrap_angle_0_2pi(mean_anomaly_rad);
        const double turns = mean_anomaly_rad - M;

        double E = (e < 0.8 || M == 0.0) ? M : kPi;
        const int max_iter = std::max(1, opt.max_iterations);
        for (int it = 0; it < max_iter; ++it)
        {
            ++out.iterations;
            const double F = E - e * std::sin(E) - M;
            const double dF = 1.0 - e * std::cos(E);
            if (!(dF > 0.0) || !std::isfinite(dF))
            {
                break;
            }

            const double delta = F / dF;
            E -= delta;
            if (!std::isfinite(E))
            {
                break;
            }
            if (detail::newton_step_done_(delta, E, opt))
            {
                out.converged = true;
                break;
            }
        }

        out.anomaly_rad = E + turns;
        return out;
    }

    /**
     * @brief Solve the hyperbolic Kepler equation M = e sinh(H) - H for H.
     *
     * Seeded with H0 = sign(M) ln(2|M|/e + 1.8), which stays in the basin of
     * convergence for large eccentricities and large |M|.
     *
     * @param mean_anomaly_rad Hyperbolic mean anomaly M (unwrapped)
     * @param e Eccentricity > 1
     * @param opt Solver options
     */
    inline KeplerSolveResult solve_kepler_hyperbolic(const double mean_anomaly_rad, const double e,
                                                     const KeplerOptions &opt = {})
    {
        KeplerSolveResult out;
        if (!std::isfinite(mean_anomaly_rad) || !(e > 1.0) || !std::isfinite(e))
        {
            return out;
        }

        const double M = mean_anomaly_rad;
        const double sign = static_cast<double>((M > 0.0) - (M < 0.0));
        double H = sign * std::log(2.0 * std::abs(M) / e + 1.8);

        const int max_iter = std::max(1, opt.max_iterations);
        for (int it = 0; it < max_iter; ++it)
        {
            ++out.iterations;
            const double F = e * std::sinh(H) - H - M;
            const double dF = e * std::cosh(H) - 1.0;
            if (!(dF > 0.0) || !std::isfinite(dF))
            {
                break;
            }

            const double delta = F / dF;
            H -= delta;
            if (!std::isfinite(H))
            {
                break;
            }
            if (detail::newton_step_done_(delta, H, opt))
            {
                out.converged = true;
                break;
            }
        }

        out.anomaly_rad = H;
        return out;
    }

    /**
     * @brief True anomaly of a parabolic orbit from Barker's equation.
     *
     * Solves D + D^3/3 = M for D = tan(nu/2) in closed form. The odd symmetry of
     * the equation is used so the cube root never sees a cancelling sum.
     */
    inline double true_anomaly_from_parabolic_mean_anomaly(const double mean_anomaly)
    {
        const double w = 1.5 * std::abs(mean_anomaly);
        const double y = std::cbrt(w + std::sqrt(w * w + 1.0));
        const double d = y - 1.0 / y;
        return std::copysign(2.0 * std::atan(d), mean_anomaly);
    }

    /// @brief tan(nu/2) = sqrt((1+e)/(1-e)) tan(E/2), in atan2 form so E = pi maps to nu = pi.
    inline double true_anomaly_from_eccentric(const double eccentric_anomaly_rad, const double e)
    {
        const double half = 0.5 * eccentric_anomaly_rad;
        return 2.0 * std::atan2(std::sqrt(1.0 + e) * std::sin(half), std::sqrt(1.0 - e) * std::cos(half));
    }

    /// @brief tan(nu/2) = sqrt((e+1)/(e-1)) tanh(H/2).
    inline double true_anomaly_from_hyperbolic(const double hyperbolic_anomaly_rad, const double e)
    {
        return 2.0 * std::atan(std::sqrt((e + 1.0) / (e - 1.0)) * std::tanh(0.5 * hyperbolic_anomaly_rad));
    }

    struct KeplerAnomalyResult
    {
        double mean_anomaly_rad{std::numeric_limits<double>::quiet_NaN()};
        double eccentric_anomaly_rad{std::numeric_limits<double>::quiet_NaN()}; // Elliptic only
        double hyperbolic_anomaly_rad{std::numeric_limits<double>::quiet_NaN()}; // Hyperbolic only
        bool elliptic{false};
        bool parabolic{false};
        bool hyperbolic{false};
        bool valid{false};
    };

    /**
     * @brief Convert true anomaly to eccentric/hyperbolic and mean anomaly.
     *
     * Exact inverse of the forward conversions above. For e == 1 the mean
     * anomaly is Barker's D + D^3/3. On hyperbolic orbits a true anomaly beyond
     * the asymptotes is invalid.
     *
     * @param e Eccentricity (must be >= 0)
     * @param true_anomaly_rad True anomaly in radians
     */
    inline KeplerAnomalyResult kepler_anomalies_from_true_anomaly(const double e, const double true_anomaly_rad)
    {
        KeplerAnomalyResult out;
        if (!(e >= 0.0) || !std::isfinite(e) || !std::isfinite(true_anomaly_rad))
        {
            return out;
        }

        const double nu = true_anomaly_rad;
        const double half_nu = 0.5 * nu;
        const double s = std::sin(half_nu);
        const double c = std::cos(half_nu);

        if (e < 1.0)
        {
            const double k = std::sqrt((1.0 - e) / (1.0 + e));
            const double E = 2.0 * std::atan2(k * s, c);
            const double M = E - e * std::sin(E);
            out.eccentric_anomaly_rad = E;
            out.mean_anomaly_rad = M;
            out.elliptic = true;
            out.valid = std::isfinite(M);
            return out;
        }

        if (e == 1.0)
        {
            if (!(std::abs(c) > 0.0))
            {
                return out;
            }
            const double d = s / c;
            out.mean_anomaly_rad = d + d * d * d / 3.0;
            out.parabolic = true;
            out.valid = std::isfinite(out.mean_anomaly_rad);
            return out;
        }

        const double x = std::sqrt((e - 1.0) / (e + 1.0)) * std::tan(half_nu);
        if (!(std::abs(x) < 1.0))
        {
            return out;
        }
        const double H = 2.0 * std::atanh(x);
        const double M = e * std::sinh(H) - H;
        out.hyperbolic_anomaly_rad = H;
        out.mean_anomaly_rad = M;
        out.hyperbolic = true;
        out.valid = std::isfinite(M);
        return out;
    }
} // namespace orbitcore
