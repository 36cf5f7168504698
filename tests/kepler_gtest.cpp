#include <gtest/gtest.h>
#include "test_helpers.hpp"

#include <random>

TEST(Kepler, EllipticSolutionSatisfiesEquation)
{
    std::mt19937_64 rng(2024);
    std::uniform_real_distribution<double> ecc(0.0, 0.999);
    std::uniform_real_distribution<double> mean(-20.0, 20.0);

    for (int i = 0; i < 500; ++i)
    {
        const double e = ecc(rng);
        const double M = mean(rng);
        const orbitcore::KeplerSolveResult r = orbitcore::solve_kepler_elliptic(M, e);
        ASSERT_TRUE(r.converged) << "e=" << e << " M=" << M;
        EXPECT_LE(r.iterations, 100);
        EXPECT_NEAR(r.anomaly_rad - e * std::sin(r.anomaly_rad), M, 1e-10);
    }
}

TEST(Kepler, EllipticCircularShortCircuits)
{
    const orbitcore::KeplerSolveResult r = orbitcore::solve_kepler_elliptic(1.234, 0.0);
    EXPECT_TRUE(r.converged);
    EXPECT_EQ(r.iterations, 0);
    EXPECT_EQ(r.anomaly_rad, 1.234);
}

TEST(Kepler, EllipticPeriapsisAndApoapsis)
{
    const orbitcore::KeplerSolveResult peri = orbitcore::solve_kepler_elliptic(0.0, 0.95);
    ASSERT_TRUE(peri.converged);
    EXPECT_EQ(peri.anomaly_rad, 0.0);

    const orbitcore::KeplerSolveResult apo = orbitcore::solve_kepler_elliptic(orbitcore::kPi, 0.95);
    ASSERT_TRUE(apo.converged);
    EXPECT_NEAR(apo.anomaly_rad, orbitcore::kPi, 1e-14);
}

TEST(Kepler, IterationCapReportsNonConvergence)
{
    orbitcore::KeplerOptions opt{};
    opt.max_iterations = 1;
    opt.abs_tolerance = 0.0;

    const orbitcore::KeplerSolveResult r = orbitcore::solve_kepler_elliptic(0.3, 0.9, opt);
    EXPECT_FALSE(r.converged);
    EXPECT_EQ(r.iterations, 1);

    const orbitcore::KeplerSolveResult h = orbitcore::solve_kepler_hyperbolic(50.0, 1.5, opt);
    EXPECT_FALSE(h.converged);
    EXPECT_EQ(h.iterations, 1);
}

TEST(Kepler, RejectsOutOfRangeEccentricity)
{
    EXPECT_FALSE(orbitcore::solve_kepler_elliptic(1.0, 1.0).converged);
    EXPECT_FALSE(orbitcore::solve_kepler_elliptic(1.0, -0.1).converged);
    EXPECT_FALSE(orbitcore::solve_kepler_hyperbolic(1.0, 1.0).converged);
}

TEST(Kepler, HyperbolicSolutionSatisfiesEquation)
{
    std::mt19937_64 rng(99);
    std::uniform_real_distribution<double> ecc(1.0001, 20.0);
    std::uniform_real_distribution<double> mean(-1e3, 1e3);

    for (int i = 0; i < 500; ++i)
    {
        const double e = ecc(rng);
        const double M = mean(rng);
        const orbitcore::KeplerSolveResult r = orbitcore::solve_kepler_hyperbolic(M, e);
        ASSERT_TRUE(r.converged) << "e=" << e << " M=" << M;
        const double H = r.anomaly_rad;
        EXPECT_TRUE(near_rel(e * std::sinh(H) - H, M, 1e-10, 1.0));
    }

    const orbitcore::KeplerSolveResult zero = orbitcore::solve_kepler_hyperbolic(0.0, 2.0);
    ASSERT_TRUE(zero.converged);
    EXPECT_EQ(zero.anomaly_rad, 0.0);
}

TEST(Kepler, BarkerInvertsParabolicMeanAnomaly)
{
    for (const double nu : {-3.0, -1.5, -0.2, 0.0, 0.7, 2.0, 3.1})
    {
        const double d = std::tan(0.5 * nu);
        const double M = d + d * d * d / 3.0;
        EXPECT_NEAR(orbitcore::true_anomaly_from_parabolic_mean_anomaly(M), nu, 1e-12) << "nu=" << nu;
    }
    EXPECT_EQ(orbitcore::true_anomaly_from_parabolic_mean_anomaly(0.0), 0.0);
}

TEST(Kepler, AnomalyConversionsAreInverse)
{
    std::mt19937_64 rng(31337);
    std::uniform_real_distribution<double> nu_dist(-3.0, 3.0);

    for (const double e : {0.0, 0.1, 0.6, 0.97})
    {
        for (int i = 0; i < 50; ++i)
        {
            const double nu = nu_dist(rng);
            const orbitcore::KeplerAnomalyResult a = orbitcore::kepler_anomalies_from_true_anomaly(e, nu);
            ASSERT_TRUE(a.valid);
            EXPECT_TRUE(a.elliptic);
            const orbitcore::KeplerSolveResult E = orbitcore::solve_kepler_elliptic(a.mean_anomaly_rad, e);
            ASSERT_TRUE(E.converged);
            EXPECT_NEAR(orbitcore::true_anomaly_from_eccentric(E.anomaly_rad, e), nu, 1e-9);
        }
    }

    const double e = 1.8;
    for (int i = 0; i < 50; ++i)
    {
        // Stay inside the asymptotes at acos(-1/e).
        const double nu = 0.9 * std::acos(-1.0 / e) * nu_dist(rng) / 3.0;
        const orbitcore::KeplerAnomalyResult a = orbitcore::kepler_anomalies_from_true_anomaly(e, nu);
        ASSERT_TRUE(a.valid);
        EXPECT_TRUE(a.hyperbolic);
        const orbitcore::KeplerSolveResult H = orbitcore::solve_kepler_hyperbolic(a.mean_anomaly_rad, e);
        ASSERT_TRUE(H.converged);
        EXPECT_NEAR(orbitcore::true_anomaly_from_hyperbolic(H.anomaly_rad, e), nu, 1e-9);
    }
}

TEST(Kepler, HyperbolicTrueAnomalyBeyondAsymptoteIsInvalid)
{
    const double e = 1.5;
    const double asymptote = std::acos(-1.0 / e);
    EXPECT_FALSE(orbitcore::kepler_anomalies_from_true_anomaly(e, asymptote + 0.01).valid);
    EXPECT_TRUE(orbitcore::kepler_anomalies_from_true_anomaly(e, asymptote - 0.01).valid);
}

TEST(Kepler, ParabolicAnomalyIsBarkerMean)
{
    const orbitcore::KeplerAnomalyResult a = orbitcore::kepler_anomalies_from_true_anomaly(1.0, orbitcore::kPi / 2.0);
    ASSERT_TRUE(a.valid);
    EXPECT_TRUE(a.parabolic);
    EXPECT_NEAR(a.mean_anomaly_rad, 1.0 + 1.0 / 3.0, 1e-14);
}
