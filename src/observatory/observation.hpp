#pragma once

/// @file observation.hpp
/// @brief Observation requests, committed observation records and attempt outcomes.

#include "astro/coordinates.hpp"
#include "core/filter.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace meridian::observatory
{
    /// @brief A pointing the driver asks the observatory to observe.
    ///
    /// The passthrough fields (rot_sky_pos, note, ids) are never read by the
    /// simulator; they are copied into the record unchanged.
    struct ObservationRequest
    {
        astro::EquatorialCoord target{};    ///< Field centre (radians)
        std::optional<Filter> filter;       ///< Requested bandpass
        f64 exptime_s = 30.0;               ///< Total open-shutter time [s]
        i32 nexp = 2;                       ///< Number of exposures in the visit

        f64 rot_sky_pos = 0.0;              ///< Sky rotation angle (radians)
        std::string note;
        i64 field_id = -1;
        i64 survey_id = -1;
        i64 block_id = -1;
    };

    /// @brief A committed visit, annotated with the conditions it was taken in.
    struct ObservationRecord
    {
        ObservationRequest request;

        f64 mjd;                ///< Exposure start [MJD]
        i32 night;              ///< Night index at exposure start
        f64 slewtime_s;         ///< Slew or filter change time charged [s]

        f64 sky_brightness;     ///< Sky surface brightness at the target [mag/arcsec²]
        f64 fwhm_eff;           ///< Effective seeing FWHM [arcsec]
        f64 fwhm_geometric;     ///< Geometric seeing FWHM [arcsec]
        f64 airmass;
        f64 five_sigma_depth;   ///< Point-source m5 [mag]

        f64 alt;                ///< Target altitude before the slew (radians)
        f64 az;                 ///< Target azimuth before the slew (radians)

        f64 clouds;             ///< Cloud fraction
        f64 sun_alt;            ///< Solar altitude (radians)
        f64 moon_alt;           ///< Lunar altitude (radians)
    };

    /// @brief Outcome of one observation attempt.
    enum class AttemptStatus
    {
        Observed,           ///< Visit committed; a record is returned
        Unobservable,       ///< Conditions rejected the visit; clock jumped, telescope parked
        InvalidRequest,     ///< Request rejected before any state change
    };

    [[nodiscard]] constexpr std::string_view attempt_status_name(AttemptStatus status)
    {
        switch (status)
        {
            case AttemptStatus::Observed:       return "observed";
            case AttemptStatus::Unobservable:   return "unobservable";
            case AttemptStatus::InvalidRequest: return "invalid request";
        }
        return "unknown";
    }

    struct AttemptResult
    {
        AttemptStatus status;
        std::optional<ObservationRecord> record;   ///< Present only when Observed

        [[nodiscard]] bool observed() const { return status == AttemptStatus::Observed; }
    };

} // namespace meridian::observatory
