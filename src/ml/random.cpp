#include "random.h"

#include <cmath>

namespace dualattn {
namespace ml {

RandomSource::RandomSource(uint64_t seed)
    : seed_(seed), draws_(0), gen_(static_cast<std::mt19937::result_type>(seed)) {}

float RandomSource::uniform() {
  // generate_canonical can round up to exactly 1.0 for float; keep [0, 1)
  ++draws_;
  float u = std::generate_canonical<float, 24>(gen_);
  return u < 1.0f ? u : std::nextafter(1.0f, 0.0f);
}

float RandomSource::normal(float mean, float stddev) {
  ++draws_;
  std::normal_distribution<float> dis(mean, stddev);
  return dis(gen_);
}

void RandomSource::reseed(uint64_t seed) {
  seed_ = seed;
  draws_ = 0;
  gen_.seed(static_cast<std::mt19937::result_type>(seed));
}

} // namespace ml
} // namespace dualattn
