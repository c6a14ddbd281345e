#ifndef DUALATTN_ML_RANDOM_H
#define DUALATTN_ML_RANDOM_H

#include <cstdint>
#include <random>

namespace dualattn {
namespace ml {

// Seeded random stream handed explicitly to the operators that need one
// (dropout, random tensor factories). Two sources built from the same seed
// yield the same sequence. Not internally synchronized: share one across
// threads only under an external lock, or give each thread its own.
class RandomSource {
public:
    explicit RandomSource(uint64_t seed = 42);

    // Uniform draw in [0, 1)
    float uniform();

    // Normal draw
    float normal(float mean = 0.0f, float stddev = 1.0f);

    void reseed(uint64_t seed);
    uint64_t seed() const { return seed_; }

    // Number of values drawn since construction or the last reseed
    uint64_t draws() const { return draws_; }

private:
    uint64_t seed_;
    uint64_t draws_;
    std::mt19937 gen_;
};

} // namespace ml
} // namespace dualattn

#endif // DUALATTN_ML_RANDOM_H
