#ifndef DUALATTN_ML_NN_ATTENTION_CONFIG_H
#define DUALATTN_ML_NN_ATTENTION_CONFIG_H

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../tensor.h"

namespace dualattn {
namespace ml {

class RandomSource;

namespace nn {

// Per-call attention settings. The mask and random source are borrowed
// from the caller and must outlive the call.
struct AttentionConfig {
    float dropoutP = 0.0f;            // probability of zeroing a weight, in [0, 1)
    bool training = false;            // dropout is applied only in training
    const Tensor* mask = nullptr;     // additive float32 mask, broadcast to [B, H, T, S]
    std::optional<float> scale;       // defaults to 1/sqrt(head_dim)
    RandomSource* rng = nullptr;      // required when dropout is active

    bool dropoutActive() const { return training && dropoutP > 0.0f; }
};

// Axis sizes of one attention call:
//   Q [batch, heads, tgtLen, headDim]
//   K [batch, heads, srcLen, headDim]
//   V [batch, heads, srcLen, valueDim]
struct AttentionShape {
    int64_t batch = 0;
    int64_t heads = 0;
    int64_t tgtLen = 0;
    int64_t srcLen = 0;
    int64_t headDim = 0;
    int64_t valueDim = 0;

    std::vector<int64_t> scoreShape() const { return {batch, heads, tgtLen, srcLen}; }
    std::vector<int64_t> outputShape() const { return {batch, heads, tgtLen, valueDim}; }
    std::string toString() const;
};

// Malformed attention input: axis mismatches, wrong rank or dtype, a mask
// that does not broadcast, or an out of range dropout/scale setting.
class InvalidShapeError : public std::invalid_argument {
public:
    explicit InvalidShapeError(const std::string& message)
        : std::invalid_argument("InvalidShape: " + message) {}
};

// Checks every AttentionInput/AttentionConfig invariant and returns the
// resolved axis sizes. Throws InvalidShapeError on the first violation.
AttentionShape validateAttentionInputs(const Tensor& query, const Tensor& key,
                                       const Tensor& value,
                                       const AttentionConfig& config);

// config.scale when set, 1/sqrt(headDim) otherwise
float resolveScale(const AttentionConfig& config, int64_t headDim);

// Element strides that map a [B, H, T, S] index onto a mask of rank 1..4
// aligned from the right. Broadcast axes get stride 0.
std::array<int64_t, 4> maskBroadcastStrides(const Tensor& mask);

} // namespace nn
} // namespace ml
} // namespace dualattn

#endif // DUALATTN_ML_NN_ATTENTION_CONFIG_H
