#pragma once

#include <cmath>

namespace orbitcore
{

    inline constexpr double kSecondsPerMinute = 60.0;
    inline constexpr double kSecondsPerHour = 3600.0;
    inline constexpr double kSecondsPerEarthDay = 86400.0;

    inline constexpr double seconds(const double s) { return s; }
    inline constexpr double minutes(const double m) { return m * kSecondsPerMinute; }
    inline constexpr double hours(const double h) { return h * kSecondsPerHour; }

    /// @brief Convert Earth days (86400 s) to seconds. Body-local days use the rotational period instead.
    inline constexpr double days(const double d) { return d * kSecondsPerEarthDay; }

    /// @brief Time of day split into clock fields; `hours` is not reduced modulo 24.
    struct ClockTime
    {
        long long hours{0};
        long long minutes{0};
        long long seconds{0};
        long long milliseconds{0};
    };

    /// @brief Round a non-negative duration to the millisecond and split it into clock fields.
    inline ClockTime split_clock(const double duration_s)
    {
        const long long ms = std::llround((duration_s > 0.0 ? duration_s : 0.0) * 1000.0);
        return ClockTime{.hours = ms / 3'600'000,
                         .minutes = (ms / 60'000) % 60,
                         .seconds = (ms / 1'000) % 60,
                         .milliseconds = ms % 1'000};
    }

    /// @brief Duration of `h:m:s` with fractional seconds.
    inline constexpr double clock_seconds(const long long h, const long long m, const double s)
    {
        return hours(static_cast<double>(h)) + minutes(static_cast<double>(m)) + seconds(s);
    }

} // namespace orbitcore
