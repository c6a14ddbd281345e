#ifndef DUALATTN_ML_NN_ATTENTION_H
#define DUALATTN_ML_NN_ATTENTION_H

#include <cstdint>
#include <memory>
#include <string>

#include "../context.h"
#include "../tensor.h"
#include "attention_config.h"
#include "fast_attention.h"

namespace dualattn {
namespace ml {
namespace nn {

// Scaled dot-product attention over [batch, heads, seq, dim] tensors.
// compute() is const and keeps no state between calls.
class AttentionOperator {
public:
    virtual ~AttentionOperator() = default;

    // Returns softmax(scale * Q K^T + mask) V with shape [B, H, T, Dv].
    // Throws InvalidShapeError for malformed input.
    virtual Tensor compute(Context& ctx, const Tensor& query, const Tensor& key,
                           const Tensor& value,
                           const AttentionConfig& config = {}) const = 0;

    virtual std::string getName() const = 0;
};

// Reference implementation that needs no fused kernel. Deterministic for
// fixed inputs, and for a fixed RandomSource state when dropout is active.
//
// A row whose scores are all -inf after masking has no defined result.
class AttentionCore : public AttentionOperator {
public:
    AttentionCore() = default;

    Tensor compute(Context& ctx, const Tensor& query, const Tensor& key,
                   const Tensor& value,
                   const AttentionConfig& config = {}) const override;

    // Post-softmax (and post-dropout) weights, shape [B, H, T, S]
    Tensor computeWeights(Context& ctx, const Tensor& query, const Tensor& key,
                          const Tensor& value,
                          const AttentionConfig& config = {}) const;

    std::string getName() const override { return "manual"; }
};

// Tries the bound fast path once and falls back to AttentionCore when it
// reports UNSUPPORTED. A FATAL result is raised as FastPathFatalError.
// The fast path is fixed at construction, so concurrent compute() calls
// only read it.
class AttentionDispatcher : public AttentionOperator {
public:
    explicit AttentionDispatcher(std::shared_ptr<const FastAttention> fastPath = nullptr);

    Tensor compute(Context& ctx, const Tensor& query, const Tensor& key,
                   const Tensor& value,
                   const AttentionConfig& config = {}) const override;

    std::string getName() const override;

    bool hasFastPath() const { return fastPath_ != nullptr; }
    const std::shared_ptr<const FastAttention>& fastPath() const { return fastPath_; }

private:
    std::shared_ptr<const FastAttention> fastPath_;
    AttentionCore core_;
};

// Additive [T, S] mask hiding key j from query i when j > i + (S - T),
// i.e. queries aligned to the end of the key sequence. Throws
// std::invalid_argument when tgtLen > srcLen, since the leading rows would
// then hide every key.
Tensor makeCausalMask(int64_t tgtLen, int64_t srcLen);

} // namespace nn
} // namespace ml
} // namespace dualattn

#endif // DUALATTN_ML_NN_ATTENTION_H
