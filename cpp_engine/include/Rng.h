#pragma once

#include <cstdint>
#include <random>

namespace scout {

// Abstract uniform source. Every draw made by the resolver and the gate goes
// through nextUnit(), so reproducing a run only requires matching the draw
// count and order.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // [0,1)
    virtual double nextUnit() = 0;

    // Inclusive integer range; consumes exactly one draw.
    int uniformInt(int lo, int hi);
    // [lo,hi); consumes exactly one draw.
    double uniformReal(double lo, double hi);

    // Stream position for persistence. Sources that cannot be resumed
    // return false from both.
    virtual bool saveState(std::uint32_t& out) const;
    virtual bool loadState(std::uint32_t state);
};

// Runtime source. Deterministic, fast, portable.
class XorShiftRandom final : public RandomSource {
public:
    explicit XorShiftRandom(std::uint32_t seed = 0x9E3779B9u);

    double nextUnit() override;

    std::uint32_t state() const { return s_; }
    void setState(std::uint32_t s);

    bool saveState(std::uint32_t& out) const override;
    bool loadState(std::uint32_t state) override;

private:
    std::uint32_t s_ = 0x9E3779B9u;
};

// Offline analysis source (Monte Carlo, sweeps).
class Mt19937Random final : public RandomSource {
public:
    explicit Mt19937Random(std::uint32_t seed = 1337u);

    double nextUnit() override;

private:
    std::mt19937 gen_;
    std::uniform_real_distribution<double> unit_{0.0, 1.0};
};

} // namespace scout
