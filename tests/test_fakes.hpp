#pragma once

/// @file test_fakes.hpp
/// @brief Deterministic stand-ins for the astronomy kit and environment providers.
///
/// FakeKit uses the real coordinate transforms and healpix indexing but a
/// synthetic Sun: it sets every day at MJD N + kSunsetPhase and stays below
/// the horizon for kNightLength days.

#include "astro/astronomy_kit.hpp"
#include "astro/healpix.hpp"
#include "astro/time_system.hpp"
#include "core/config.hpp"
#include "environment/providers.hpp"

#include <cmath>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace meridian::testing
{
    // -----------------------------------------------------------------
    // Astronomy
    // -----------------------------------------------------------------
    class FakeKit final : public astro::AstronomyKit
    {
    public:
        static constexpr f64 kSunsetPhase = 0.95;
        static constexpr f64 kNightLength = 0.40;
        static constexpr f64 kDarkSunAlt = -0.5;
        static constexpr f64 kDaySunAlt = 0.5;

        explicit FakeKit(i32 nside = 8)
            : m_site{core::ObservatoryConfig{}.site}
            , m_nside{nside}
        {
        }

        [[nodiscard]] const astro::ObserverLocation& site() const override { return m_site; }
        [[nodiscard]] i32 nside() const override { return m_nside; }

        [[nodiscard]] astro::HorizontalCoord radec_to_altaz(const astro::EquatorialCoord& eq,
                                                            f64 mjd) const override
        {
            return astro::Coordinates::radec_to_altaz(eq, m_site, mjd);
        }

        [[nodiscard]] f64 lmst(f64 mjd) const override
        {
            return astro::TimeSystem::lmst(astro::TimeSystem::mjd_to_jd(mjd), m_site.longitude_rad);
        }

        [[nodiscard]] f64 solar_altitude(f64 mjd) const override
        {
            return (mjd - sunset_before(mjd) < kNightLength) ? kDarkSunAlt : kDaySunAlt;
        }

        [[nodiscard]] std::optional<f64> previous_sunset(f64 mjd) const override
        {
            if (fail_sunsets)
            {
                return std::nullopt;
            }
            return sunset_before(mjd);
        }

        [[nodiscard]] astro::TwilightBoundaries twilight_boundaries(f64 mjd, f64) const override
        {
            const f64 last = sunset_before(mjd);
            return astro::TwilightBoundaries{
                .next_start = last + kNightLength,
                .next_end   = last + 1.0,
                .last_end   = last,
            };
        }

        [[nodiscard]] i64 healpix_index(const astro::EquatorialCoord& eq) const override
        {
            return astro::Healpix::ang2pix(m_nside, eq);
        }

        /// @brief Sunset strictly before @p mjd.
        [[nodiscard]] static f64 sunset_before(f64 mjd)
        {
            f64 sunset = std::floor(mjd - kSunsetPhase) + kSunsetPhase;
            if (sunset >= mjd)
            {
                sunset -= 1.0;
            }
            return sunset;
        }

        bool fail_sunsets = false;

    private:
        astro::ObserverLocation m_site;
        i32 m_nside;
    };

    // -----------------------------------------------------------------
    // Sky: constant brightness, geometric airmass, timeline from the kit
    // -----------------------------------------------------------------
    class FakeSky final : public environment::SkyBrightnessProvider
    {
    public:
        static constexpr f64 kSkyMag = 20.0;
        static constexpr f64 kPixelMag = 20.5;

        FakeSky(const astro::AstronomyKit& kit, f64 start_mjd, f64 span_days, f64 step_days)
            : m_kit{kit}
        {
            const auto steps = static_cast<std::size_t>(std::floor(span_days / step_days)) + 1;
            for (std::size_t i = 0; i < steps; ++i)
            {
                const f64 mjd = start_mjd + static_cast<f64>(i) * step_days;
                m_timeline.mjds.push_back(mjd);
                m_timeline.sun_alts.push_back(kit.solar_altitude(mjd));
            }
        }

        [[nodiscard]] PerFilter<environment::PixelMap> magnitudes(f64 mjd) const override
        {
            const auto air = airmass(mjd);
            PerFilter<environment::PixelMap> maps;
            for (auto& map : maps)
            {
                map.assign(air.size(), kUnseen);
                for (std::size_t i = 0; i < air.size(); ++i)
                {
                    if (air[i] != kUnseen)
                    {
                        map[i] = kSkyMag;
                    }
                }
            }
            return maps;
        }

        [[nodiscard]] f64 pixel_magnitude(f64, i64, Filter) const override { return kPixelMag; }

        [[nodiscard]] environment::PixelMap airmass(f64 mjd) const override
        {
            const i64 npix = astro::Healpix::npix(m_kit.nside());
            environment::PixelMap map(static_cast<std::size_t>(npix), kUnseen);
            for (i64 pix = 0; pix < npix; ++pix)
            {
                const auto hz = m_kit.radec_to_altaz(astro::Healpix::pix2ang(m_kit.nside(), pix), mjd);
                map[static_cast<std::size_t>(pix)] = astro::Coordinates::airmass(hz.alt);
            }
            return map;
        }

        [[nodiscard]] astro::SunMoonGeometry sun_moon_geometry(f64 mjd) const override
        {
            return astro::SunMoonGeometry{
                .sun_alt      = m_kit.solar_altitude(mjd),
                .sun_az       = 0.0,
                .moon_alt     = -0.2,
                .moon_az      = 1.0,
                .moon_ra      = 2.0,
                .moon_dec     = -0.1,
                .moon_sun_sep = astro_constants::kHalfPi,
            };
        }

        [[nodiscard]] const environment::SkyTimeline& timeline() const override { return m_timeline; }

    private:
        const astro::AstronomyKit& m_kit;
        environment::SkyTimeline m_timeline;
    };

    // -----------------------------------------------------------------
    // Slew: fixed time, counts model queries
    // -----------------------------------------------------------------
    class CountingSlew final : public environment::SlewTimeModel
    {
    public:
        static constexpr f64 kSlewSeconds = 10.0;

        [[nodiscard]] f64 estimate(const astro::HorizontalCoord&,
                                   const astro::HorizontalCoord&) const override
        {
            ++calls;
            return kSlewSeconds;
        }

        mutable i32 calls = 0;
    };

    // -----------------------------------------------------------------
    // Downtime: fixed list, or a malformed calendar
    // -----------------------------------------------------------------
    class FixedDowntime final : public environment::DowntimeProvider
    {
    public:
        explicit FixedDowntime(std::optional<std::vector<i32>> nights = std::vector<i32>{})
            : m_nights{std::move(nights)}
        {
        }

        [[nodiscard]] std::optional<std::vector<i32>> closed_nights() override { return m_nights; }

    private:
        std::optional<std::vector<i32>> m_nights;
    };

    // -----------------------------------------------------------------
    // Seeing: 1" effective, 0.9" geometric wherever airmass is defined
    // -----------------------------------------------------------------
    class FlatSeeing final : public environment::SeeingProvider
    {
    public:
        [[nodiscard]] environment::SeeingMaps seeing(f64, Filter,
                                                     const environment::PixelMap& airmass) const override
        {
            environment::SeeingMaps maps{
                .fwhm_500       = 0.7,
                .fwhm_geometric = environment::PixelMap(airmass.size(), kUnseen),
                .fwhm_effective = environment::PixelMap(airmass.size(), kUnseen),
            };
            for (std::size_t i = 0; i < airmass.size(); ++i)
            {
                if (airmass[i] != kUnseen)
                {
                    maps.fwhm_effective[i] = 1.0;
                    maps.fwhm_geometric[i] = 0.9;
                }
            }
            return maps;
        }
    };

    // -----------------------------------------------------------------
    // Clouds: arbitrary function of elapsed seconds
    // -----------------------------------------------------------------
    class ScriptedClouds final : public environment::CloudProvider
    {
    public:
        explicit ScriptedClouds(std::function<f64(f64)> fraction = [](f64) { return 0.0; })
            : fraction{std::move(fraction)}
        {
        }

        [[nodiscard]] f64 cloud_fraction(f64 elapsed_s) const override { return fraction(elapsed_s); }

        std::function<f64(f64)> fraction;
    };

} // namespace meridian::testing
