#include "Rng.h"

#include <algorithm>
#include <cmath>

namespace scout {

namespace {

static std::uint32_t xorshift32(std::uint32_t& s) {
    s ^= (s << 13);
    s ^= (s >> 17);
    s ^= (s << 5);
    return s;
}

// xorshift has a fixed point at zero.
constexpr std::uint32_t kZeroSeedReplacement = 0x9E3779B9u;

} // namespace

int RandomSource::uniformInt(int lo, int hi) {
    if (hi < lo) std::swap(lo, hi);
    const double u = nextUnit();
    const double span = static_cast<double>(hi) - static_cast<double>(lo) + 1.0;
    const int v = lo + static_cast<int>(std::floor(u * span));
    return std::clamp(v, lo, hi);
}

double RandomSource::uniformReal(double lo, double hi) {
    const double u = nextUnit();
    return lo + u * (hi - lo);
}

bool RandomSource::saveState(std::uint32_t& out) const {
    out = 0u;
    return false;
}

bool RandomSource::loadState(std::uint32_t) {
    return false;
}

XorShiftRandom::XorShiftRandom(std::uint32_t seed) {
    setState(seed);
}

void XorShiftRandom::setState(std::uint32_t s) {
    s_ = (s == 0u) ? kZeroSeedReplacement : s;
}

bool XorShiftRandom::saveState(std::uint32_t& out) const {
    out = s_;
    return true;
}

bool XorShiftRandom::loadState(std::uint32_t state) {
    if (state == 0u) return false;
    s_ = state;
    return true;
}

double XorShiftRandom::nextUnit() {
    return (double)xorshift32(s_) / 4294967296.0; // 2^32
}

Mt19937Random::Mt19937Random(std::uint32_t seed) : gen_(seed) {}

double Mt19937Random::nextUnit() {
    double u = unit_(gen_);
    // Some standard libraries can return exactly 1.0 from generate_canonical.
    if (u >= 1.0) u = std::nextafter(1.0, 0.0);
    return u;
}

} // namespace scout
