#ifndef DUALATTN_ML_NN_GGML_FAST_ATTENTION_H
#define DUALATTN_ML_NN_GGML_FAST_ATTENTION_H

#include <cstddef>
#include <string>

#include "fast_attention.h"

namespace dualattn {
namespace ml {
namespace nn {

// Fused attention through ggml_flash_attn_ext on the ggml CPU backend.
//
// Serves float32 host tensors with head_dim == value_dim, no dropout and a
// mask (if any) shared by every batch and head. K, V and the mask are
// rounded to F16 on the way in, so results agree with AttentionCore to
// roughly 1e-2 for unit scale inputs.
//
// Each call allocates one ggml arena sized for its tensors. A call whose
// arena would exceed maxArenaBytes, or whose arena cannot be allocated,
// fails with FATAL / RESOURCE. Zero means no limit.
class GGMLFastAttention : public FastAttention {
public:
    explicit GGMLFastAttention(size_t maxArenaBytes = 0)
        : maxArenaBytes_(maxArenaBytes) {}

    FastPathResult run(Context& ctx, const Tensor& query, const Tensor& key,
                       const Tensor& value,
                       const AttentionConfig& config) const override;

    std::string getName() const override { return "ggml_flash_attn"; }

    // Reason the kernel would decline this input, or NONE
    FastPathFailure precheck(const Tensor& query, const Tensor& key,
                          const Tensor& value, const AttentionConfig& config,
                          std::string* message = nullptr) const;

    size_t maxArenaBytes() const { return maxArenaBytes_; }

private:
    size_t maxArenaBytes_;
};

} // namespace nn
} // namespace ml
} // namespace dualattn

#endif // DUALATTN_ML_NN_GGML_FAST_ATTENTION_H
