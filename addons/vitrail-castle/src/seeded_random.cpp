#include <vitrail/castle/seeded_random.h>
#include <cmath>

namespace vitrail::castle {

SeededRandom::SeededRandom(int64_t seed)
    : m_state(seed % kModulus)
{
    // 0 is a fixed point of the recurrence and negatives would leave [0, 1)
    if (m_state <= 0) {
        m_state += kModulus - 1;
    }
}

double SeededRandom::next() {
    m_state = (m_state * kMultiplier) % kModulus;
    return static_cast<double>(m_state - 1) / static_cast<double>(kModulus - 1);
}

double SeededRandom::range(double min, double max) {
    return min + next() * (max - min);
}

int SeededRandom::intRange(int min, int max) {
    int value = static_cast<int>(std::floor(range(min, static_cast<double>(max) + 1.0)));
    // floating-point rounding can land exactly on max + 1
    return value > max ? max : value;
}

} // namespace vitrail::castle
