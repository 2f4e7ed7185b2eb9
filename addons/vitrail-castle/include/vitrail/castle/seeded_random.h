#pragma once

#include <cstdint>

namespace vitrail::castle {

/// Park-Miller minimal standard generator (multiplier 16807, modulus 2^31-1)
///
/// Used wherever castle layout needs variation that must come back identical
/// for the same seed.
class SeededRandom {
public:
    static constexpr int64_t kModulus = 2147483647;
    static constexpr int64_t kMultiplier = 16807;

    explicit SeededRandom(int64_t seed = 12345);

    /// Next value in [0, 1)
    double next();

    /// Uniform value in [min, max)
    double range(double min, double max);

    /// Uniform integer in [min, max], both inclusive
    int intRange(int min, int max);

    /// Current internal state (never 0)
    int64_t state() const { return m_state; }

private:
    int64_t m_state;
};

} // namespace vitrail::castle
