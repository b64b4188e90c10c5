#pragma once

/// @file observatory_state.hpp
/// @brief Mutable observatory state: clock, pointing, filter, night, cached status.

#include "astro/coordinates.hpp"
#include "core/filter.hpp"
#include "observatory/night_boundary_index.hpp"
#include "observatory/status_snapshot.hpp"

#include <optional>

namespace meridian::observatory
{
    /// @brief The simulation's single mutable record of "where and when".
    ///
    /// The night index always agrees with the clock. The cached status is
    /// dropped whenever the telescope parks or leaves the parked state; it is
    /// never recomputed here.
    class ObservatoryState
    {
    public:
        /// @brief Start parked at @p mjd.
        ObservatoryState(f64 mjd, const NightBoundaryIndex& nights);

        /// @brief Set the clock and recompute the night index.
        void advance_to(f64 mjd);

        /// @brief Clear pointing, filter and cached status.
        void park();

        /// @brief Point at @p target through @p filter.
        void point_at(const astro::EquatorialCoord& target, Filter filter);

        void set_snapshot(StatusSnapshot snapshot);

        [[nodiscard]] f64 mjd() const { return m_mjd; }
        [[nodiscard]] i32 night() const { return m_night; }
        [[nodiscard]] bool is_parked() const { return !m_pointing.has_value(); }
        [[nodiscard]] const std::optional<astro::EquatorialCoord>& pointing() const { return m_pointing; }
        [[nodiscard]] std::optional<Filter> filter() const { return m_filter; }
        [[nodiscard]] const std::optional<StatusSnapshot>& snapshot() const { return m_snapshot; }

        /// @brief True once any visit has been committed.
        [[nodiscard]] bool has_ever_pointed() const { return m_has_ever_pointed; }

    private:
        const NightBoundaryIndex& m_nights;

        f64 m_mjd;
        i32 m_night;
        std::optional<astro::EquatorialCoord> m_pointing;
        std::optional<Filter> m_filter;
        std::optional<StatusSnapshot> m_snapshot;
        bool m_has_ever_pointed = false;
    };

} // namespace meridian::observatory
