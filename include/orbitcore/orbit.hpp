#pragma once

#include "orbitcore/kepler.hpp"
#include "orbitcore/math.hpp"
#include "orbitcore/types.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <type_traits>
#include <variant>

namespace orbitcore
{

    enum class ConicKind
    {
        Elliptic,   ///< e < 1, bounded and periodic
        Parabolic,  ///< e == 1
        Hyperbolic, ///< e > 1
    };

    /// @brief What an orbit keeps of the body it orbits: the body id and its (immutable) mu.
    struct OrbitPrimary
    {
        BodyId body_id{kInvalidBodyId};
        double gravitational_parameter_m3_s2{0.0};
    };

    /// @brief Orientation of the orbital plane and of the periapsis within it.
    struct OrbitOrientation
    {
        double inclination_rad{0.0};
        double longitude_of_ascending_node_rad{0.0};
        double argument_of_periapsis_rad{0.0};
    };

    /// @brief Time origin of an orbit.
    struct OrbitEpoch
    {
        double epoch_s{0.0};
        double mean_anomaly_at_epoch_rad{0.0};
    };

    struct OrbitState
    {
        Vec3 position_m{0.0, 0.0, 0.0};
        Vec3 velocity_mps{0.0, 0.0, 0.0};
    };

    // -------------------------------------------------------------------------
    // Orbit parameterizations accepted by make_orbit()
    // -------------------------------------------------------------------------

    struct ByPeriapsisEccentricity
    {
        double periapsis_m{0.0};
        double eccentricity{0.0};
        OrbitOrientation orientation{};
        OrbitEpoch epoch{};
    };

    struct BySemiMajorAxisEccentricity
    {
        double semi_major_axis_m{0.0}; ///< Negative for hyperbolic orbits
        double eccentricity{0.0};
        OrbitOrientation orientation{};
        OrbitEpoch epoch{};
    };

    /// @brief Two apsides in either order. An infinite apsis describes an open orbit of `open_eccentricity`.
    struct ByApsides
    {
        double apsis1_m{0.0};
        double apsis2_m{0.0};
        double open_eccentricity{1.0};
        OrbitOrientation orientation{};
        OrbitEpoch epoch{};
    };

    struct ByPeriodEccentricity
    {
        double period_s{0.0};
        double eccentricity{0.0};
        OrbitOrientation orientation{};
        OrbitEpoch epoch{};
    };

    /// @brief Period plus one apsis; `branch` picks between the elliptic and hyperbolic solutions.
    struct ByPeriodApsis
    {
        double period_s{0.0};
        double apsis_m{0.0};
        ConicKind branch{ConicKind::Elliptic};
        OrbitOrientation orientation{};
        OrbitEpoch epoch{};
    };

    struct ByStateVector
    {
        Vec3 position_m{0.0, 0.0, 0.0};
        Vec3 velocity_mps{0.0, 0.0, 0.0};
        double instant_s{0.0};
    };

    using OrbitSpec = std::variant<ByPeriapsisEccentricity, BySemiMajorAxisEccentricity, ByApsides,
                                   ByPeriodEccentricity, ByPeriodApsis, ByStateVector>;

    /**
     * @brief Keplerian conic around a primary body.
     *
     * Stores the canonical element set (periapsis, eccentricity, inclination,
     * longitude of ascending node, argument of periapsis, epoch, mean anomaly at
     * epoch) and derives everything else on demand. Immutable: every
     * parameterization goes through one of the static constructors, which
     * validate the input and return a fresh instance.
     *
     * Degenerate orientations are canonicalized without moving the orbit: with
     * zero (or pi) inclination the ascending node is folded into the argument of
     * periapsis, and with zero eccentricity the argument of periapsis is folded
     * into the mean anomaly at epoch.
     */
    class Orbit
    {
    public:
        /// Degenerate-geometry threshold used when deriving elements from state vectors.
        static constexpr double kDegenerateTolerance = 1e-11;

        Orbit() = default;

        // ---------------------------------------------------------------------
        // Constructors
        // ---------------------------------------------------------------------

        static Outcome<Orbit> from_periapsis(const OrbitPrimary &primary, const double periapsis_m,
                                             const double eccentricity = 0.0, const OrbitOrientation &orientation = {},
                                             const OrbitEpoch &epoch = {})
        {
            return build_(primary, periapsis_m, eccentricity, orientation, epoch);
        }

        static Outcome<Orbit> from_semi_major_axis(const OrbitPrimary &primary, const double semi_major_axis_m,
                                                   const double eccentricity, const OrbitOrientation &orientation = {},
                                                   const OrbitEpoch &epoch = {})
        {
            if (eccentricity == 1.0 || !std::isfinite(semi_major_axis_m))
            {
                return make_error<Orbit>(ErrorKind::Validation, "semi-major axis does not determine a parabolic orbit");
            }
            const double periapsis_m = semi_major_axis_m * (1.0 - eccentricity);
            if (!(periapsis_m > 0.0))
            {
                return make_error<Orbit>(ErrorKind::Validation,
                                         "semi-major axis sign does not match eccentricity (a > 0 iff e < 1)");
            }
            return build_(primary, periapsis_m, eccentricity, orientation, epoch);
        }

        /**
         * @brief Orbit through two apsides given in any order.
         *
         * The smaller one is the periapsis. When one apsis is infinite the orbit is
         * open and `open_eccentricity` (>= 1) gives its shape.
         */
        static Outcome<Orbit> from_apses(const OrbitPrimary &primary, const double apsis1_m, const double apsis2_m,
                                         const double open_eccentricity = 1.0, const OrbitOrientation &orientation = {},
                                         const OrbitEpoch &epoch = {})
        {
            if (!(apsis1_m > 0.0) || !(apsis2_m > 0.0))
            {
                return make_error<Orbit>(ErrorKind::Validation, "apsides must be positive");
            }
            const double periapsis_m = std::min(apsis1_m, apsis2_m);
            const double apoapsis_m = std::max(apsis1_m, apsis2_m);
            if (!std::isfinite(periapsis_m))
            {
                return make_error<Orbit>(ErrorKind::Validation, "at least one apsis must be finite");
            }

            if (!std::isfinite(apoapsis_m))
            {
                if (!(open_eccentricity >= 1.0))
                {
                    return make_error<Orbit>(ErrorKind::Validation, "open orbit needs an eccentricity >= 1");
                }
                return build_(primary, periapsis_m, open_eccentricity, orientation, epoch);
            }

            const double eccentricity = (apoapsis_m - periapsis_m) / (apoapsis_m + periapsis_m);
            return build_(primary, periapsis_m, eccentricity, orientation, epoch);
        }

        /**
         * @brief Orbit of given period and eccentricity.
         *
         * For hyperbolic orbits the period is the formal 2 pi / n.
         */
        static Outcome<Orbit> from_period(const OrbitPrimary &primary, const double period_s, const double eccentricity,
                                          const OrbitOrientation &orientation = {}, const OrbitEpoch &epoch = {})
        {
            if (eccentricity == 1.0)
            {
                return make_error<Orbit>(ErrorKind::Domain, "a parabolic orbit has no period");
            }
            const Outcome<double> a = semi_major_axis_from_period_(primary, period_s);
            if (!a.valid())
            {
                return forward_error<Orbit>(a);
            }
            const double semi_major_axis_m = (eccentricity > 1.0) ? -a.value : a.value;
            return build_(primary, semi_major_axis_m * (1.0 - eccentricity), eccentricity, orientation, epoch);
        }

        /**
         * @brief Orbit of given period passing through one apsis.
         *
         * The period fixes |a|. On the elliptic branch the apsis is either the
         * periapsis (e = 1 - r/a, needs r <= a) or the apoapsis (e = r/a - 1,
         * needs r >= a); the root whose condition holds is taken, and r >= 2a is
         * unreachable. On the hyperbolic branch the only apsis is the periapsis.
         */
        static Outcome<Orbit> from_period_apsis(const OrbitPrimary &primary, const double period_s,
                                                const double apsis_m, const ConicKind branch = ConicKind::Elliptic,
                                                const OrbitOrientation &orientation = {}, const OrbitEpoch &epoch = {})
        {
            if (branch == ConicKind::Parabolic)
            {
                return make_error<Orbit>(ErrorKind::Domain, "a parabolic orbit has no period");
            }
            if (!(apsis_m > 0.0) || !std::isfinite(apsis_m))
            {
                return make_error<Orbit>(ErrorKind::Validation, "apsis must be positive and finite");
            }
            const Outcome<double> a = semi_major_axis_from_period_(primary, period_s);
            if (!a.valid())
            {
                return forward_error<Orbit>(a);
            }

            if (branch == ConicKind::Hyperbolic)
            {
                return build_(primary, apsis_m, 1.0 + apsis_m / a.value, orientation, epoch);
            }

            if (!(apsis_m < 2.0 * a.value))
            {
                return make_error<Orbit>(ErrorKind::Validation, "apsis beyond twice the semi-major axis");
            }
            const double eccentricity = (apsis_m <= a.value) ? (1.0 - apsis_m / a.value) : (apsis_m / a.value - 1.0);
            return build_(primary, a.value * (1.0 - eccentricity), eccentricity, orientation, epoch);
        }

        /**
         * @brief Orbit through a state vector relative to the primary.
         *
         * h = r x v, e_vec = (v x h)/mu - r/|r|, n = z x h. Near-equatorial orbits
         * get a zero ascending node (angles measured from +X); near-circular orbits
         * get a zero argument of periapsis (anomaly measured from the node).
         * The returned orbit's epoch is `instant_s`.
         */
        static Outcome<Orbit> from_state(const OrbitPrimary &primary, const Vec3 &position_m, const Vec3 &velocity_mps,
                                         const double instant_s)
        {
            const double mu = primary.gravitational_parameter_m3_s2;
            if (!(mu > 0.0) || !std::isfinite(mu))
            {
                return make_error<Orbit>(ErrorKind::Validation, "primary gravitational parameter must be positive");
            }
            const double r = norm(position_m);
            if (!(r > 0.0) || !std::isfinite(r) || !std::isfinite(norm(velocity_mps)) || !std::isfinite(instant_s))
            {
                return make_error<Orbit>(ErrorKind::Validation, "state vector must be finite with nonzero position");
            }

            const Vec3 h = cross(position_m, velocity_mps);
            const double hmag = norm(h);
            if (!(hmag > 0.0))
            {
                return make_error<Orbit>(ErrorKind::Validation, "radial trajectory has no orbital plane");
            }

            const Vec3 evec = (cross(velocity_mps, h) / mu) - (position_m / r);
            const double e = norm(evec);
            const double periapsis_m = (hmag * hmag / mu) / (1.0 + e);

            const double h_xy = std::hypot(h.x, h.y);
            OrbitOrientation orientation{};
            orientation.inclination_rad = std::atan2(h_xy, h.z);

            const Vec3 x_axis{1.0, 0.0, 0.0};
            Vec3 node_dir = x_axis;
            if (h_xy > kDegenerateTolerance * hmag)
            {
                node_dir = cross(Vec3{0.0, 0.0, 1.0}, h);
                orientation.longitude_of_ascending_node_rad = oriented_angle(x_axis, node_dir).value;
            }

            Vec3 periapsis_dir = node_dir;
            if (e > kDegenerateTolerance)
            {
                periapsis_dir = evec;
                orientation.argument_of_periapsis_rad = oriented_angle(node_dir, evec, h).value;
            }

            const double true_anomaly_rad = oriented_angle(periapsis_dir, position_m, h).value;
            const KeplerAnomalyResult anom = kepler_anomalies_from_true_anomaly(e, true_anomaly_rad);
            if (!anom.valid)
            {
                return make_error<Orbit>(ErrorKind::Domain, "true anomaly beyond the hyperbolic asymptotes");
            }

            return build_(primary, periapsis_m, e, orientation,
                          OrbitEpoch{.epoch_s = instant_s, .mean_anomaly_at_epoch_rad = anom.mean_anomaly_rad});
        }

        // ---------------------------------------------------------------------
        // Canonical elements
        // ---------------------------------------------------------------------

        const OrbitPrimary &primary() const { return primary_; }
        double periapsis_m() const { return periapsis_m_; }
        double eccentricity() const { return eccentricity_; }
        double inclination_rad() const { return orientation_.inclination_rad; }
        double longitude_of_ascending_node_rad() const { return orientation_.longitude_of_ascending_node_rad; }
        double argument_of_periapsis_rad() const { return orientation_.argument_of_periapsis_rad; }
        double epoch_s() const { return epoch_.epoch_s; }
        double mean_anomaly_at_epoch_rad() const { return epoch_.mean_anomaly_at_epoch_rad; }
        const OrbitOrientation &orientation() const { return orientation_; }
        const OrbitEpoch &epoch() const { return epoch_; }

        /// @brief False only for a default-constructed orbit.
        bool valid() const { return primary_.gravitational_parameter_m3_s2 > 0.0; }

        // ---------------------------------------------------------------------
        // Derived quantities
        // ---------------------------------------------------------------------

        ConicKind conic() const
        {
            if (eccentricity_ < 1.0)
            {
                return ConicKind::Elliptic;
            }
            return (eccentricity_ == 1.0) ? ConicKind::Parabolic : ConicKind::Hyperbolic;
        }

        /// @brief Semi-major axis; negative for hyperbolic orbits, +inf for parabolic ones.
        double semi_major_axis_m() const
        {
            if (eccentricity_ == 1.0)
            {
                return std::numeric_limits<double>::infinity();
            }
            return periapsis_m_ / (1.0 - eccentricity_);
        }

        /// @brief Apoapsis distance; +inf for open orbits.
        double apoapsis_m() const
        {
            if (eccentricity_ >= 1.0)
            {
                return std::numeric_limits<double>::infinity();
            }
            return semi_major_axis_m() * (1.0 + eccentricity_);
        }

        double semi_latus_rectum_m() const { return periapsis_m_ * (1.0 + eccentricity_); }

        Outcome<double> mean_motion_radps() const
        {
            if (conic() == ConicKind::Parabolic)
            {
                return make_error<double>(ErrorKind::Domain, "mean motion undefined for a parabolic orbit");
            }
            const double a = std::abs(semi_major_axis_m());
            return make_ok(std::sqrt(primary_.gravitational_parameter_m3_s2 / (a * a * a)));
        }

        Outcome<double> period_s() const
        {
            const Outcome<double> n = mean_motion_radps();
            if (!n.valid())
            {
                return make_error<double>(ErrorKind::Domain, "period undefined for a parabolic orbit");
            }
            return make_ok(kTwoPi / n.value);
        }

        /// @brief Rotation from the perifocal frame (periapsis along +X) to the world frame.
        const Mat3 &transform() const { return transform_; }

        // ---------------------------------------------------------------------
        // Anomalies
        // ---------------------------------------------------------------------

        /**
         * @brief Mean anomaly at time t.
         *
         * Wrapped to [0, 2pi) on elliptic orbits, unwrapped on hyperbolic ones.
         * Domain error on parabolic orbits, which have no mean motion.
         */
        Outcome<double> mean_anomaly(const double t_s) const
        {
            const Outcome<double> n = mean_motion_radps();
            if (!n.valid())
            {
                return n;
            }
            const double M = epoch_.mean_anomaly_at_epoch_rad + n.value * (t_s - epoch_.epoch_s);
            if (conic() == ConicKind::Elliptic)
            {
                return make_ok(wrap_angle_0_2pi(M));
            }
            return make_ok(M);
        }

        /// @brief Eccentric anomaly E (elliptic) or hyperbolic anomaly H (hyperbolic) at time t.
        Outcome<double> eccentric_anomaly(const double t_s, const KeplerOptions &opt = {}) const
        {
            const Outcome<double> M = mean_anomaly(t_s);
            if (!M.valid())
            {
                return M;
            }
            const KeplerSolveResult sol = (conic() == ConicKind::Elliptic)
                                                  ? solve_kepler_elliptic(M.value, eccentricity_, opt)
                                                  : solve_kepler_hyperbolic(M.value, eccentricity_, opt);
            if (!sol.converged)
            {
                return make_error<double>(ErrorKind::Convergence, "Kepler equation did not converge");
            }
            return make_ok(sol.anomaly_rad);
        }

        Outcome<double> true_anomaly(const double t_s, const KeplerOptions &opt = {}) const
        {
            switch (conic())
            {
                case ConicKind::Parabolic:
                    return make_ok(true_anomaly_from_parabolic_mean_anomaly(parabolic_mean_anomaly_(t_s)));
                case ConicKind::Elliptic:
                {
                    if (eccentricity_ == 0.0)
                    {
                        return mean_anomaly(t_s);
                    }
                    const Outcome<double> E = eccentric_anomaly(t_s, opt);
                    if (!E.valid())
                    {
                        return E;
                    }
                    return make_ok(true_anomaly_from_eccentric(E.value, eccentricity_));
                }
                case ConicKind::Hyperbolic:
                {
                    const Outcome<double> H = eccentric_anomaly(t_s, opt);
                    if (!H.valid())
                    {
                        return H;
                    }
                    return make_ok(true_anomaly_from_hyperbolic(H.value, eccentricity_));
                }
            }
            return make_error<double>(ErrorKind::Domain, "unknown conic");
        }

        // ---------------------------------------------------------------------
        // State vectors
        // ---------------------------------------------------------------------

        /// @brief Distance from the focus, r = p / (1 + e cos(nu)).
        double distance_at_true_anomaly(const double true_anomaly_rad) const
        {
            return semi_latus_rectum_m() / (1.0 + eccentricity_ * std::cos(true_anomaly_rad));
        }

        Vec3 position_at_true_anomaly(const double true_anomaly_rad) const
        {
            const double r = distance_at_true_anomaly(true_anomaly_rad);
            const Vec3 r_pf{r * std::cos(true_anomaly_rad), r * std::sin(true_anomaly_rad), 0.0};
            return transform_ * r_pf;
        }

        Vec3 velocity_at_true_anomaly(const double true_anomaly_rad) const
        {
            const double sqrt_mu_over_p = std::sqrt(primary_.gravitational_parameter_m3_s2 / semi_latus_rectum_m());
            const Vec3 v_pf{-sqrt_mu_over_p * std::sin(true_anomaly_rad),
                            sqrt_mu_over_p * (eccentricity_ + std::cos(true_anomaly_rad)), 0.0};
            return transform_ * v_pf;
        }

        /// @brief Position relative to the primary at time t, in the world frame.
        Outcome<Vec3> position_t(const double t_s, const KeplerOptions &opt = {}) const
        {
            const Outcome<double> nu = true_anomaly(t_s, opt);
            if (!nu.valid())
            {
                return forward_error<Vec3>(nu);
            }
            return make_ok(position_at_true_anomaly(nu.value));
        }

        /// @brief Velocity relative to the primary at time t, in the world frame.
        Outcome<Vec3> velocity_t(const double t_s, const KeplerOptions &opt = {}) const
        {
            const Outcome<double> nu = true_anomaly(t_s, opt);
            if (!nu.valid())
            {
                return forward_error<Vec3>(nu);
            }
            return make_ok(velocity_at_true_anomaly(nu.value));
        }

        Outcome<OrbitState> state_t(const double t_s, const KeplerOptions &opt = {}) const
        {
            const Outcome<double> nu = true_anomaly(t_s, opt);
            if (!nu.valid())
            {
                return forward_error<OrbitState>(nu);
            }
            return make_ok(OrbitState{.position_m = position_at_true_anomaly(nu.value),
                                      .velocity_mps = velocity_at_true_anomaly(nu.value)});
        }

    private:
        static Outcome<double> semi_major_axis_from_period_(const OrbitPrimary &primary, const double period_s)
        {
            const double mu = primary.gravitational_parameter_m3_s2;
            if (!(mu > 0.0) || !std::isfinite(mu))
            {
                return make_error<double>(ErrorKind::Validation, "primary gravitational parameter must be positive");
            }
            if (!(period_s > 0.0) || !std::isfinite(period_s))
            {
                return make_error<double>(ErrorKind::Validation, "period must be positive and finite");
            }
            const double k = period_s / kTwoPi;
            return make_ok(std::cbrt(mu * k * k));
        }

        static Outcome<Orbit> build_(const OrbitPrimary &primary, const double periapsis_m, const double eccentricity,
                                     OrbitOrientation orientation, OrbitEpoch epoch)
        {
            const double mu = primary.gravitational_parameter_m3_s2;
            if (!(mu > 0.0) || !std::isfinite(mu))
            {
                return make_error<Orbit>(ErrorKind::Validation, "primary gravitational parameter must be positive");
            }
            if (!(periapsis_m > 0.0) || !std::isfinite(periapsis_m))
            {
                return make_error<Orbit>(ErrorKind::Validation, "periapsis must be positive and finite");
            }
            if (!(eccentricity >= 0.0) || !std::isfinite(eccentricity))
            {
                return make_error<Orbit>(ErrorKind::Validation, "eccentricity must be non-negative and finite");
            }
            if (!(orientation.inclination_rad >= 0.0) || !(orientation.inclination_rad <= kPi))
            {
                return make_error<Orbit>(ErrorKind::Validation, "inclination must lie in [0, pi]");
            }
            if (!std::isfinite(orientation.longitude_of_ascending_node_rad) ||
                !std::isfinite(orientation.argument_of_periapsis_rad) || !std::isfinite(epoch.epoch_s) ||
                !std::isfinite(epoch.mean_anomaly_at_epoch_rad))
            {
                return make_error<Orbit>(ErrorKind::Validation, "angles and epoch must be finite");
            }

            // Equatorial: only Omega + w (prograde) or w - Omega (retrograde) is observable.
            if (orientation.inclination_rad == 0.0)
            {
                orientation.argument_of_periapsis_rad = wrap_angle_pm_pi(orientation.argument_of_periapsis_rad +
                                                                         orientation.longitude_of_ascending_node_rad);
                orientation.longitude_of_ascending_node_rad = 0.0;
            }
            else if (orientation.inclination_rad == kPi)
            {
                orientation.argument_of_periapsis_rad = wrap_angle_pm_pi(orientation.argument_of_periapsis_rad -
                                                                         orientation.longitude_of_ascending_node_rad);
                orientation.longitude_of_ascending_node_rad = 0.0;
            }

            // Circular: periapsis direction is arbitrary, keep the position by moving w into M0.
            if (eccentricity == 0.0)
            {
                epoch.mean_anomaly_at_epoch_rad += orientation.argument_of_periapsis_rad;
                orientation.argument_of_periapsis_rad = 0.0;
            }

            Orbit o;
            o.primary_ = primary;
            o.periapsis_m_ = periapsis_m;
            o.eccentricity_ = eccentricity;
            o.orientation_ = orientation;
            o.epoch_ = epoch;
            o.transform_ = from_euler_angles(orientation.longitude_of_ascending_node_rad, orientation.inclination_rad,
                                             orientation.argument_of_periapsis_rad);
            return make_ok(o);
        }

        /// Barker's mean anomaly D + D^3/3, advancing at sqrt(mu / (2 q^3)).
        double parabolic_mean_anomaly_(const double t_s) const
        {
            const double q = periapsis_m_;
            const double rate = std::sqrt(primary_.gravitational_parameter_m3_s2 / (2.0 * q * q * q));
            return epoch_.mean_anomaly_at_epoch_rad + rate * (t_s - epoch_.epoch_s);
        }

        OrbitPrimary primary_{};
        double periapsis_m_{0.0};
        double eccentricity_{0.0};
        OrbitOrientation orientation_{};
        OrbitEpoch epoch_{};
        Mat3 transform_{1.0};
    };

    /// @brief Normalize any supported parameterization into a canonical Orbit.
    inline Outcome<Orbit> make_orbit(const OrbitPrimary &primary, const OrbitSpec &spec)
    {
        return std::visit(
                [&primary](const auto &s) -> Outcome<Orbit> {
                    using T = std::decay_t<decltype(s)>;
                    if constexpr (std::is_same_v<T, ByPeriapsisEccentricity>)
                    {
                        return Orbit::from_periapsis(primary, s.periapsis_m, s.eccentricity, s.orientation, s.epoch);
                    }
                    else if constexpr (std::is_same_v<T, BySemiMajorAxisEccentricity>)
                    {
                        return Orbit::from_semi_major_axis(primary, s.semi_major_axis_m, s.eccentricity,
                                                           s.orientation, s.epoch);
                    }
                    else if constexpr (std::is_same_v<T, ByApsides>)
                    {
                        return Orbit::from_apses(primary, s.apsis1_m, s.apsis2_m, s.open_eccentricity, s.orientation,
                                                 s.epoch);
                    }
                    else if constexpr (std::is_same_v<T, ByPeriodEccentricity>)
                    {
                        return Orbit::from_period(primary, s.period_s, s.eccentricity, s.orientation, s.epoch);
                    }
                    else if constexpr (std::is_same_v<T, ByPeriodApsis>)
                    {
                        return Orbit::from_period_apsis(primary, s.period_s, s.apsis_m, s.branch, s.orientation,
                                                        s.epoch);
                    }
                    else
                    {
                        return Orbit::from_state(primary, s.position_m, s.velocity_mps, s.instant_s);
                    }
                },
                spec);
    }

} // namespace orbitcore
