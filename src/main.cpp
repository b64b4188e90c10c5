// src/main.cpp - Meridian survey simulator entry point
//
// Demonstrates the core simulation loop:
//  1. Load configuration (file argument or built-in defaults)
//  2. Build the built-in environment providers
//  3. Create the simulated observatory
//  4. Run a greedy survey over a fixed field grid
//  5. Print a summary of the run and the final observatory status

#include "astro/time_system.hpp"
#include "core/config.hpp"
#include "core/config_loader.hpp"
#include "core/filter.hpp"
#include "core/logger.hpp"
#include "observatory/simulated_observatory.hpp"

#include <iomanip>
#include <iostream>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

using namespace meridian;

namespace {

struct Field {
    i64 id;
    astro::EquatorialCoord position;
    f64 last_visit_mjd{-std::numeric_limits<f64>::infinity()};
};

// Dec -80..+10 in 10 degree rows, RA every 15 degrees
std::vector<Field> makeFieldGrid() {
    std::vector<Field> fields;
    i64 id = 0;
    for (i32 dec_deg = -80; dec_deg <= 10; dec_deg += 10) {
        for (i32 ra_deg = 0; ra_deg < 360; ra_deg += 15) {
            fields.push_back(Field{
                .id = id++,
                .position = {ra_deg * astro_constants::kDegToRad,
                             dec_deg * astro_constants::kDegToRad},
            });
        }
    }
    return fields;
}

// Highest field not revisited within the revisit gap, or nullptr
Field* pickField(std::vector<Field>& fields, const astro::AstronomyKit& kit, f64 mjd) {
    constexpr f64 kRevisitGapDays = 30.0 / time_constants::kMinutesPerDay;
    Field* best = nullptr;
    f64 best_alt = -astro_constants::kHalfPi;
    for (auto& f : fields) {
        if (mjd - f.last_visit_mjd < kRevisitGapDays) continue;
        const f64 alt = kit.radec_to_altaz(f.position, mjd).alt;
        if (alt > best_alt) {
            best_alt = alt;
            best = &f;
        }
    }
    return best;
}

// One filter per night, cycling g r i z y
Filter filterForNight(i32 night) {
    constexpr Filter kCycle[] = {Filter::G, Filter::R, Filter::I, Filter::Z, Filter::Y};
    return kCycle[night % 5];
}

} // namespace

int main(int argc, char** argv) {
    // -----------------------------------------------------------------------
    // 1. Configuration
    // -----------------------------------------------------------------------
    core::SimulationConfig config;
    if (argc > 1) {
        auto loaded = core::ConfigLoader::load(argv[1]);
        if (!loaded) {
            std::cerr << "Failed to load configuration from " << argv[1] << "\n";
            return 1;
        }
        config = std::move(*loaded);
    }
    core::Logger::init(config.log);

    std::cout << "================================================================\n"
              << "  MERIDIAN - Survey Telescope Simulator\n"
              << "================================================================\n\n";

    // -----------------------------------------------------------------------
    // 2-3. Providers and observatory
    // -----------------------------------------------------------------------
    auto providers = observatory::make_default_providers(config.observatory, config.environment);
    if (!providers) {
        MRD_CORE_CRITICAL("Could not build the environment providers");
        core::Logger::shutdown();
        return 1;
    }

    auto sim = observatory::SimulatedObservatory::create(config.observatory, std::move(*providers));
    if (!sim) {
        core::Logger::shutdown();
        return 1;
    }

    std::cout << "Start: " << astro::TimeSystem::format_mjd(sim->mjd())
              << " (MJD " << std::fixed << std::setprecision(5) << sim->mjd()
              << ", night " << sim->night() << ")\n"
              << "Sunset table: " << sim->boundaries().size() << " nights\n\n";

    // -----------------------------------------------------------------------
    // 4. Greedy survey
    // -----------------------------------------------------------------------
    auto fields = makeFieldGrid();
    i32 observed = 0;
    i32 unobservable = 0;
    f64 depth_sum = 0.0;
    i32 depth_count = 0;
    f64 slew_sum = 0.0;

    for (i32 attempt = 0; attempt < config.attempts; ++attempt) {
        Field* field = pickField(fields, sim->kit(), sim->mjd());
        if (!field) {
            MRD_WARN("No field available at MJD {:.5f}", sim->mjd());
            break;
        }

        observatory::ObservationRequest request;
        request.target = field->position;
        request.filter = filterForNight(sim->night());
        request.exptime_s = 30.0;
        request.nexp = 2;
        request.field_id = field->id;
        request.note = "greedy";

        const auto result = sim->attempt_observe(request);
        if (!result.observed()) {
            ++unobservable;
            continue;
        }

        ++observed;
        field->last_visit_mjd = result.record->mjd;
        slew_sum += result.record->slewtime_s;
        if (result.record->five_sigma_depth != kUnseen) {
            depth_sum += result.record->five_sigma_depth;
            ++depth_count;
        }
    }

    // -----------------------------------------------------------------------
    // 5. Summary
    // -----------------------------------------------------------------------
    const auto& status = sim->status();

    std::cout << "Attempts:      " << config.attempts << "\n"
              << "  Observed:      " << observed << "\n"
              << "  Unobservable:  " << unobservable << "\n"
              << "  Fallback jumps: " << sim->fallback_jumps() << "\n";
    if (observed > 0) {
        std::cout << "  Mean slew:     " << std::setprecision(1)
                  << slew_sum / observed << " s\n";
    }
    if (depth_count > 0) {
        std::cout << "  Mean m5:       " << std::setprecision(2)
                  << depth_sum / depth_count << " mag\n";
    }

    std::cout << "\nEnd: " << astro::TimeSystem::format_mjd(status.mjd)
              << " (night " << status.night << ")\n"
              << "  Sun alt:  " << std::setprecision(1)
              << status.sun_alt * astro_constants::kRadToDeg << " deg\n"
              << "  Moon alt: " << status.moon_alt * astro_constants::kRadToDeg
              << " deg, phase " << status.moon_phase << "\n"
              << "  Clouds:   " << std::setprecision(2) << status.clouds << "\n";
    if (status.next_twilight_start) {
        std::cout << "  Next twilight start: "
                  << astro::TimeSystem::format_mjd(*status.next_twilight_start) << "\n";
    }

    std::cout << "\n================================================================\n"
              << "  Simulation complete. Clear skies.\n"
              << "================================================================\n";

    core::Logger::shutdown();
    return 0;
}
