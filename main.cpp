#include <orbitcore/orbitcore.hpp>

#include <cstdio>
#include <string>

namespace
{
    void print_tree(const orbitcore::CelestialSystem &sys, const orbitcore::CelestialBody &body, const int depth)
    {
        std::printf("%*s%s", 2 * depth, "", body.name.c_str());
        if (body.orbit)
        {
            const orbitcore::Outcome<double> period = body.orbit->period_s();
            std::printf(",a=%.6e,e=%.4f,period_s=%.3f", body.orbit->semi_major_axis_m(), body.orbit->eccentricity(),
                        period.valid() ? period.value : 0.0);
        }
        std::printf("\n");
        for (const orbitcore::CelestialBody *sat : sys.satellites_of(body.id))
        {
            print_tree(sys, *sat, depth + 1);
        }
    }
} // namespace

int main()
{
    using namespace orbitcore;

    const Outcome<CelestialSystem> built = build_system(kerbol_system_records());
    if (!built.valid())
    {
        std::printf("build_system failed (%s): %s\n", to_string(built.error), built.detail);
        return 1;
    }
    const CelestialSystem &sys = *built;

    std::printf("--- tree ---\n");
    print_tree(sys, *sys.root(), 0);

    // Absolute positions over one Mun orbit (t_s,x_m,y_m,z_m).
    const CelestialBody *kerbin = sys.body_by_name("Kerbin");
    const CelestialBody *mun = sys.body_by_name("Mun");
    const double mun_period_s = mun->orbit->period_s().value;
    std::printf("\n--- positions (t_s,x_m,y_m,z_m) ---\n");
    for (const CelestialBody *body : {kerbin, mun})
    {
        std::printf("%s\n", body->name.c_str());
        for (int i = 0; i <= 8; ++i)
        {
            const double t_s = mun_period_s * static_cast<double>(i) / 8.0;
            const Outcome<Vec3> p = sys.position_t(body->id, t_s);
            if (!p.valid())
            {
                std::printf("%.0f,error,%s\n", t_s, p.detail);
                continue;
            }
            std::printf("%.0f,%.6e,%.6e,%.6e\n", t_s, p->x, p->y, p->z);
        }
    }

    // Local calendar of Kerbin.
    std::printf("\n--- kerbin time ---\n");
    for (const double t_s : {0.0, hours(6.0), days(100.0), 3.0e7})
    {
        const std::string s = kerbin->time2str(t_s);
        const Outcome<double> back = kerbin->str2time(s);
        std::printf("%.3f,%s,%.3f\n", t_s, s.c_str(), back.valid() ? back.value : -1.0);
    }

    // Re-derive Minmus' elements from its state vector relative to Kerbin.
    const CelestialBody *minmus = sys.body_by_name("Minmus");
    const double t_s = days(12.5);
    const Outcome<OrbitState> st = minmus->orbit->state_t(t_s);
    if (st.valid())
    {
        const Outcome<Orbit> fit = Orbit::from_state(kerbin->as_primary(), st->position_m, st->velocity_mps, t_s);
        std::printf("\n--- minmus elements (given,from_state) ---\n");
        if (fit.valid())
        {
            const Orbit &o = *minmus->orbit;
            std::printf("periapsis_m,%.6e,%.6e\n", o.periapsis_m(), fit->periapsis_m());
            std::printf("eccentricity,%.6e,%.6e\n", o.eccentricity(), fit->eccentricity());
            std::printf("inclination_rad,%.9f,%.9f\n", o.inclination_rad(), fit->inclination_rad());
            std::printf("lan_rad,%.9f,%.9f\n", o.longitude_of_ascending_node_rad(),
                        fit->longitude_of_ascending_node_rad());
            std::printf("mean_anomaly_rad,%.9f,%.9f\n", o.mean_anomaly(t_s).value, fit->mean_anomaly(t_s).value);
        }
        else
        {
            std::printf("from_state failed (%s): %s\n", to_string(fit.error), fit.detail);
        }
    }

    return 0;
}
