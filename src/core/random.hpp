#pragma once
// core/random.hpp - Deterministic pseudorandom number generation
//
// Every stochastic input of a simulation (unscheduled downtime, synthetic
// weather) is drawn from a seeded stream so runs are reproducible.

#include "core/types.hpp"

namespace meridian::core {

// -----------------------------------------------------------------------
// Fast PCG-based pseudorandom number generator (PCG-XSH-RR 32/64)
// -----------------------------------------------------------------------
class PcgRng {
public:
    explicit PcgRng(u64 seed, u64 stream = 1)
        : m_state(seed + (stream | 1)), m_inc((stream << 1) | 1) {
        next_u32();
    }

    u32 next_u32() {
        u64 old = m_state;
        m_state = old * 6364136223846793005ULL + m_inc;
        u32 xorshifted = static_cast<u32>(((old >> 18u) ^ old) >> 27u);
        u32 rot = static_cast<u32>(old >> 59u);
        return (xorshifted >> rot) | (xorshifted << ((-rot) & 31));
    }

    /// Uniform double in [0,1)
    f64 next_double() {
        return static_cast<f64>(next_u32()) / 4294967296.0;
    }

private:
    u64 m_state;
    u64 m_inc;
};

} // namespace meridian::core
