#pragma once

#include "orbitcore/body.hpp"
#include "orbitcore/orbit.hpp"
#include "orbitcore/system.hpp"
#include "orbitcore/types.hpp"

#include <glm/glm.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace orbitcore
{

    /**
     * @brief One row of a name -> parameters body table.
     *
     * This is what an external data reader hands over after parsing. The root
     * record has an empty `primary_name` and no orbit.
     */
    struct BodyRecord
    {
        std::string name{};
        GravitySource gravity{GravitationalParameter{}};
        double radius_m{0.0};
        double rotational_period_s{0.0};
        std::string primary_name{};
        std::optional<OrbitSpec> orbit{};
    };

    /**
     * @brief Build a CelestialSystem from records given in any order.
     *
     * Records are added once their primary is present. Duplicate names, a root
     * count other than one, unknown primaries and primary cycles are Validation
     * errors; invalid orbital elements surface with the orbit's own error.
     */
    inline Outcome<CelestialSystem> build_system(const std::vector<BodyRecord> &records)
    {
        std::unordered_set<std::string> names;
        std::size_t roots = 0;
        for (const BodyRecord &r : records)
        {
            if (!names.insert(r.name).second)
            {
                return make_error<CelestialSystem>(ErrorKind::Validation, "duplicate body name in records");
            }
            if (r.primary_name.empty() != !r.orbit.has_value())
            {
                return make_error<CelestialSystem>(ErrorKind::Validation,
                                                   "a record needs both a primary and an orbit, or neither");
            }
            if (!r.orbit)
            {
                ++roots;
            }
        }
        if (roots != 1)
        {
            return make_error<CelestialSystem>(ErrorKind::Validation, "records must contain exactly one root body");
        }

        CelestialSystem system;
        std::vector<bool> added(records.size(), false);
        std::size_t remaining = records.size();
        while (remaining > 0)
        {
            bool progress = false;
            for (std::size_t i = 0; i < records.size(); ++i)
            {
                if (added[i])
                {
                    continue;
                }
                const BodyRecord &r = records[i];
                BodyId primary_id = kInvalidBodyId;
                if (r.orbit)
                {
                    const CelestialBody *primary = system.body_by_name(r.primary_name);
                    if (primary == nullptr)
                    {
                        continue;
                    }
                    primary_id = primary->id;
                }

                const Outcome<CelestialSystem::BodyHandle> h = system.add_body(BodyDefinition{
                        .name = r.name,
                        .gravity = r.gravity,
                        .radius_m = r.radius_m,
                        .rotational_period_s = r.rotational_period_s,
                        .primary_id = primary_id,
                        .orbit = r.orbit,
                });
                if (!h.valid())
                {
                    return forward_error<CelestialSystem>(h);
                }
                added[i] = true;
                --remaining;
                progress = true;
            }
            if (!progress)
            {
                return make_error<CelestialSystem>(ErrorKind::Validation, "unknown primary or primary cycle in records");
            }
        }
        return make_ok(std::move(system));
    }

    namespace detail
    {
        /// Elements as usually tabulated: a [m], e, angles [deg], mean anomaly at epoch [rad].
        inline OrbitSpec tabulated_elements_(const double semi_major_axis_m, const double eccentricity,
                                             const double inclination_deg, const double lan_deg, const double aop_deg,
                                             const double mean_anomaly_rad)
        {
            return BySemiMajorAxisEccentricity{
                    .semi_major_axis_m = semi_major_axis_m,
                    .eccentricity = eccentricity,
                    .orientation = {.inclination_rad = glm::radians(inclination_deg),
                                    .longitude_of_ascending_node_rad = glm::radians(lan_deg),
                                    .argument_of_periapsis_rad = glm::radians(aop_deg)},
                    .epoch = {.epoch_s = 0.0, .mean_anomaly_at_epoch_rad = mean_anomaly_rad},
            };
        }

        inline BodyRecord satellite_(std::string name, const GravitySource gravity, const double radius_m,
                                     const double rotational_period_s, std::string primary, OrbitSpec orbit)
        {
            return BodyRecord{.name = std::move(name),
                              .gravity = gravity,
                              .radius_m = radius_m,
                              .rotational_period_s = rotational_period_s,
                              .primary_name = std::move(primary),
                              .orbit = std::move(orbit)};
        }
    } // namespace detail

    /// @brief The Kerbol system: Kerbol, its seven planets and their moons (mu in m^3/s^2).
    inline std::vector<BodyRecord> kerbol_system_records()
    {
        using detail::satellite_;
        using detail::tabulated_elements_;
        using GM = GravitationalParameter;

        std::vector<BodyRecord> out;
        out.push_back(BodyRecord{.name = "Kerbol",
                                 .gravity = GM{1.1723328e18},
                                 .radius_m = 261'600'000.0,
                                 .rotational_period_s = 432'000.0});

        out.push_back(satellite_("Moho", GM{1.6860938e11}, 250'000.0, 1'210'000.0, "Kerbol",
                                 tabulated_elements_(5'263'138'304.0, 0.2, 7.0, 70.0, 15.0, 3.14)));
        out.push_back(satellite_("Eve", GM{8.1717302e12}, 700'000.0, 80'500.0, "Kerbol",
                                 tabulated_elements_(9'832'684'544.0, 0.01, 2.1, 15.0, 0.0, 3.14)));
        out.push_back(satellite_("Gilly", GM{8'289'449.8}, 13'000.0, 28'255.0, "Eve",
                                 tabulated_elements_(31'500'000.0, 0.55, 12.0, 80.0, 10.0, 0.9)));
        out.push_back(satellite_("Kerbin", GM{3.5316e12}, 600'000.0, 21'549.425, "Kerbol",
                                 tabulated_elements_(13'599'840'256.0, 0.0, 0.0, 0.0, 0.0, 3.14)));
        out.push_back(satellite_("Mun", GM{6.5138398e10}, 200'000.0, 138'984.38, "Kerbin",
                                 tabulated_elements_(12'000'000.0, 0.0, 0.0, 0.0, 0.0, 1.7)));
        out.push_back(satellite_("Minmus", GM{1.7658e9}, 60'000.0, 40'400.0, "Kerbin",
                                 tabulated_elements_(47'000'000.0, 0.0, 6.0, 78.0, 38.0, 0.9)));
        out.push_back(satellite_("Duna", GM{3.0136321e11}, 320'000.0, 65'517.859, "Kerbol",
                                 tabulated_elements_(20'726'155'264.0, 0.051, 0.06, 135.5, 0.0, 3.14)));
        out.push_back(satellite_("Ike", GM{1.8568369e10}, 130'000.0, 65'517.862, "Duna",
                                 tabulated_elements_(3'200'000.0, 0.03, 0.2, 0.0, 0.0, 1.7)));
        out.push_back(satellite_("Dres", GM{2.1484489e10}, 138'000.0, 34'800.0, "Kerbol",
                                 tabulated_elements_(40'839'348'203.0, 0.145, 5.0, 280.0, 90.0, 3.14)));
        out.push_back(satellite_("Jool", GM{2.82528e14}, 6'000'000.0, 36'000.0, "Kerbol",
                                 tabulated_elements_(68'773'560'320.0, 0.05, 1.304, 52.0, 0.0, 0.1)));
        out.push_back(satellite_("Laythe", GM{1.962e12}, 500'000.0, 52'980.879, "Jool",
                                 tabulated_elements_(27'184'000.0, 0.0, 0.0, 0.0, 0.0, 3.14)));
        out.push_back(satellite_("Vall", GM{2.074815e11}, 300'000.0, 105'962.09, "Jool",
                                 tabulated_elements_(43'152'000.0, 0.0, 0.0, 0.0, 0.0, 0.9)));
        out.push_back(satellite_("Tylo", GM{2.82528e12}, 600'000.0, 211'926.36, "Jool",
                                 tabulated_elements_(68'500'000.0, 0.0, 0.025, 0.0, 0.0, 3.14)));
        out.push_back(satellite_("Bop", GM{2.4868349e9}, 65'000.0, 544'507.43, "Jool",
                                 tabulated_elements_(128'500'000.0, 0.235, 15.0, 10.0, 25.0, 0.9)));
        out.push_back(satellite_("Pol", GM{7.2170208e8}, 44'000.0, 901'902.62, "Jool",
                                 tabulated_elements_(179'890'000.0, 0.171, 4.25, 2.0, 15.0, 0.9)));
        out.push_back(satellite_("Eeloo", GM{7.4410815e10}, 210'000.0, 19'460.0, "Kerbol",
                                 tabulated_elements_(90'118'820'000.0, 0.26, 6.15, 50.0, 260.0, 3.14)));
        return out;
    }

    /// @brief The Sun, the eight planets, Pluto, Ceres and the Moon (masses in kg, J2000 elements).
    inline std::vector<BodyRecord> solar_system_records()
    {
        using detail::satellite_;
        using detail::tabulated_elements_;

        std::vector<BodyRecord> out;
        out.push_back(BodyRecord{.name = "Sun",
                                 .gravity = Mass{1.98847e30},
                                 .radius_m = 6.957e8,
                                 .rotational_period_s = 2'192'832.0});

        out.push_back(satellite_("Mercury", Mass{3.3011e23}, 2.4397e6, 5'067'032.0, "Sun",
                                 tabulated_elements_(5.7909e10, 0.2056, 7.005, 48.331, 29.124,
                                                     glm::radians(174.796))));
        out.push_back(satellite_("Venus", Mass{4.8675e24}, 6.0518e6, 20'997'360.0, "Sun",
                                 tabulated_elements_(1.08209e11, 0.006772, 3.39458, 76.680, 54.884,
                                                     glm::radians(50.115))));
        out.push_back(satellite_("Earth", Mass{5.97237e24}, 6.371e6, 86'164.1, "Sun",
                                 tabulated_elements_(1.49598e11, 0.0167086, 0.00005, -11.26064, 114.20783,
                                                     glm::radians(358.617))));
        out.push_back(satellite_("Moon", Mass{7.342e22}, 1.7374e6, 2'360'591.5, "Earth",
                                 tabulated_elements_(3.844e8, 0.0549, 5.145, 125.08, 318.15, glm::radians(135.27))));
        out.push_back(satellite_("Mars", Mass{6.4171e23}, 3.3895e6, 88'642.66, "Sun",
                                 tabulated_elements_(2.27939e11, 0.0934, 1.850, 49.558, 286.502,
                                                     glm::radians(19.412))));
        out.push_back(satellite_("Ceres", Mass{9.3835e20}, 4.73e5, 32'667.0, "Sun",
                                 tabulated_elements_(4.14e11, 0.0758, 10.59, 80.33, 73.51, glm::radians(77.37))));
        out.push_back(satellite_("Jupiter", Mass{1.8982e27}, 6.9911e7, 35'730.0, "Sun",
                                 tabulated_elements_(7.78479e11, 0.0489, 1.303, 100.464, 273.867,
                                                     glm::radians(20.020))));
        out.push_back(satellite_("Saturn", Mass{5.6834e26}, 5.8232e7, 38'018.0, "Sun",
                                 tabulated_elements_(1.43353e12, 0.0565, 2.485, 113.665, 339.392,
                                                     glm::radians(317.020))));
        out.push_back(satellite_("Uranus", Mass{8.6810e25}, 2.5362e7, 62'064.0, "Sun",
                                 tabulated_elements_(2.87097e12, 0.04717, 0.773, 74.006, 96.998857,
                                                     glm::radians(142.2386))));
        out.push_back(satellite_("Neptune", Mass{1.02413e26}, 2.4622e7, 57'996.0, "Sun",
                                 tabulated_elements_(4.49841e12, 0.008678, 1.770, 131.784, 276.336,
                                                     glm::radians(256.228))));
        out.push_back(satellite_("Pluto", Mass{1.303e22}, 1.1883e6, 551'856.7, "Sun",
                                 tabulated_elements_(5.90638e12, 0.2488, 17.16, 110.299, 113.834,
                                                     glm::radians(14.53))));
        return out;
    }

} // namespace orbitcore
