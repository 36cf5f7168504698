#pragma once

#include "orbitcore/math.hpp"
#include "orbitcore/orbit.hpp"
#include "orbitcore/time_utils.hpp"
#include "orbitcore/types.hpp"

#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace orbitcore
{

    /// @brief mu = G * M, supplied directly [m^3/s^2].
    struct GravitationalParameter
    {
        double m3_s2{0.0};
    };

    /// @brief Bare mass [kg]; multiplied by the gravitational constant on use.
    struct Mass
    {
        double kg{0.0};
    };

    using GravitySource = std::variant<GravitationalParameter, Mass>;

    inline double gravitational_parameter_of(const GravitySource &gravity)
    {
        if (const Mass *m = std::get_if<Mass>(&gravity))
        {
            return kGravitationalConstant_SI * m->kg;
        }
        return std::get<GravitationalParameter>(gravity).m3_s2;
    }

    /**
     * @brief Node of a body tree: physical properties plus the orbit around its primary.
     *
     * Bodies live in a CelestialSystem, which assigns `id`, resolves `primary_id`
     * and appends to the primary's `satellites`. The root has no orbit.
     */
    struct CelestialBody
    {
        std::string name{};
        double gravitational_parameter_m3_s2{0.0};
        double radius_m{0.0};            ///< 0 if unknown
        double rotational_period_s{0.0}; ///< 0 if not rotating
        std::optional<Orbit> orbit{};
        BodyId id{kInvalidBodyId};
        BodyId primary_id{kInvalidBodyId};
        std::vector<BodyId> satellites{}; ///< In registration order

        inline bool is_root() const { return !orbit.has_value(); }

        inline double mass_kg() const { return gravitational_parameter_m3_s2 / kGravitationalConstant_SI; }

        inline OrbitPrimary as_primary() const
        {
            return OrbitPrimary{.body_id = id, .gravitational_parameter_m3_s2 = gravitational_parameter_m3_s2};
        }

        /**
         * @brief Format an absolute time as local years, days and time of day.
         *
         * `Year Y, day D, HH:MM:SS.sss`, where a year is one orbital period and a
         * day one rotational period, both counted from 1. Without a closed orbit
         * the year is dropped (`Day D, ...`) and D may be 0 or negative before
         * t = 0; without rotation the day is dropped. With neither, the clock
         * carries a leading `-` for negative times.
         */
        inline std::string time2str(const double t_s) const
        {
            std::string out;
            char buf[64];
            double rest = t_s;

            const std::optional<double> year_s = year_length_s_();
            if (year_s)
            {
                const double years = std::floor(rest / *year_s);
                rest -= years * *year_s;
                std::snprintf(buf, sizeof(buf), "Year %.0f, ", years + 1.0);
                out += buf;
            }

            const std::optional<double> day_s = day_length_s_();
            if (day_s)
            {
                const double day_count = std::floor(rest / *day_s);
                rest -= day_count * *day_s;
                std::snprintf(buf, sizeof(buf), year_s ? "day %.0f, " : "Day %.0f, ", day_count + 1.0);
                out += buf;
            }

            const bool negative = !year_s && !day_s && rest < 0.0;
            const ClockTime clock = split_clock(negative ? -rest : rest);
            if (negative && (clock.hours | clock.minutes | clock.seconds | clock.milliseconds) != 0)
            {
                out += '-';
            }
            std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld.%03lld", clock.hours, clock.minutes, clock.seconds,
                          clock.milliseconds);
            out += buf;
            return out;
        }

        /// @brief Inverse of time2str(); Validation error when `text` is not in this body's format.
        inline Outcome<double> str2time(const std::string_view text) const
        {
            const std::string s(text);
            const std::optional<double> year_s = year_length_s_();
            const std::optional<double> day_s = day_length_s_();

            double year = 1.0;
            double day = 1.0;
            long long h = 0;
            long long m = 0;
            double sec = 0.0;
            double sign = 1.0;
            int consumed = -1;
            bool matched = false;
            if (year_s && day_s)
            {
                matched = std::sscanf(s.c_str(), "Year %lf, day %lf, %lld:%lld:%lf%n", &year, &day, &h, &m, &sec,
                                      &consumed) == 5;
            }
            else if (year_s)
            {
                matched = std::sscanf(s.c_str(), "Year %lf, %lld:%lld:%lf%n", &year, &h, &m, &sec, &consumed) == 4;
            }
            else if (day_s)
            {
                matched = std::sscanf(s.c_str(), "Day %lf, %lld:%lld:%lf%n", &day, &h, &m, &sec, &consumed) == 4;
            }
            else
            {
                sign = s.starts_with('-') ? -1.0 : 1.0;
                const std::size_t skip = sign < 0.0 ? 1 : 0;
                matched = s.size() > skip && std::isdigit(static_cast<unsigned char>(s[skip])) &&
                          std::sscanf(s.c_str() + skip, "%lld:%lld:%lf%n", &h, &m, &sec, &consumed) == 3;
                consumed += static_cast<int>(skip);
            }

            if (!matched || consumed != static_cast<int>(s.size()))
            {
                return make_error<double>(ErrorKind::Validation, "time string does not match the body's format");
            }
            // Only the leading field may count back past t = 0.
            const bool day_leads = day_s && !year_s;
            if (year != std::floor(year) || day != std::floor(day) || (!day_leads && !(day >= 1.0)) || h < 0 ||
                m < 0 || m >= 60 || !(sec >= 0.0) || !(sec < 60.0) || !std::isfinite(year) || !std::isfinite(day))
            {
                return make_error<double>(ErrorKind::Validation, "time string field out of range");
            }

            double t_s = sign * clock_seconds(h, m, sec);
            if (day_s)
            {
                t_s += (day - 1.0) * *day_s;
            }
            if (year_s)
            {
                t_s += (year - 1.0) * *year_s;
            }
            return make_ok(t_s);
        }

    private:
        inline std::optional<double> year_length_s_() const
        {
            if (!orbit || orbit->conic() != ConicKind::Elliptic)
            {
                return std::nullopt;
            }
            const Outcome<double> period = orbit->period_s();
            if (!period.valid())
            {
                return std::nullopt;
            }
            return period.value;
        }

        inline std::optional<double> day_length_s_() const
        {
            const double day_s = std::abs(rotational_period_s);
            if (!(day_s > 0.0) || !std::isfinite(day_s))
            {
                return std::nullopt;
            }
            return day_s;
        }
    };

} // namespace orbitcore
