/**
 * SimRNG — Seeded PRNG for deterministic Monte Carlo lifetimes.
 *
 * Every draw and every customer decision pulls from a RandomSource passed
 * in by the caller; nothing in the engine touches a process-global
 * generator. SimRNG is the production source (mulberry32). Tests can
 * derive their own RandomSource to script exact sequences.
 *
 * Header-only.
 */

#ifndef GACHA_MC_SIM_RNG_HPP
#define GACHA_MC_SIM_RNG_HPP

#include <cstddef>
#include <cstdint>

namespace gacha::mc {

class RandomSource {
public:
    virtual ~RandomSource() = default;

    /** Next double in [0, 1). */
    virtual double random() = 0;

    /**
     * Uniform index in [0, n). Requires n > 0.
     * Clamped so a source returning values arbitrarily close to 1.0 never
     * yields n.
     */
    std::size_t index_below(std::size_t n) {
        auto idx = static_cast<std::size_t>(random() * static_cast<double>(n));
        return idx < n ? idx : n - 1;
    }
};

class SimRNG : public RandomSource {
public:
    explicit SimRNG(int32_t seed = 42)
        : state_(seed ? seed : 1) {}

    /** mulberry32 core. */
    double random() override {
        state_ = static_cast<int32_t>(static_cast<uint32_t>(state_) + 0x6D2B79F5u);
        uint32_t t = static_cast<uint32_t>(state_);

        t = imul(t ^ (t >> 15), t | 1u);
        t ^= t + imul(t ^ (t >> 7), t | 61u);

        return static_cast<double>((t ^ (t >> 14))) / 4294967296.0;
    }

    void setSeed(int32_t seed) {
        state_ = seed ? seed : 1;
    }

private:
    int32_t state_;

    // Low 32 bits of the full product.
    static uint32_t imul(uint32_t a, uint32_t b) {
        return static_cast<uint32_t>(
            static_cast<uint64_t>(a) * static_cast<uint64_t>(b)
        );
    }
};

} // namespace gacha::mc

#endif // GACHA_MC_SIM_RNG_HPP
