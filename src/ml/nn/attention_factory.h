#ifndef DUALATTN_ML_NN_ATTENTION_FACTORY_H
#define DUALATTN_ML_NN_ATTENTION_FACTORY_H

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "attention.h"
#include "fast_attention.h"

namespace dualattn {
namespace core {
class ConfigManager;
}

namespace ml {
namespace nn {

// Which attention operator a deployment runs. Chosen once at construction.
enum class AttentionVariant {
    MANUAL,   // AttentionCore only
    DISPATCH  // fast path first, AttentionCore on UNSUPPORTED
};

std::string variantToString(AttentionVariant variant);
// Case-insensitive; throws std::invalid_argument for unknown names
AttentionVariant stringToVariant(const std::string& name);

using FastAttentionCreator = std::function<std::shared_ptr<const FastAttention>()>;

// Register a fast path under a name (e.g. "ggml"). Replaces an existing entry.
void registerFastPath(const std::string& name, FastAttentionCreator creator);

// Builds the named fast path. "none" and "" yield nullptr; unknown names
// throw std::invalid_argument.
std::shared_ptr<const FastAttention> createFastPath(const std::string& name);

// Registered fast path names, sorted
std::vector<std::string> availableFastPaths();

// MANUAL ignores fastPath
std::unique_ptr<AttentionOperator>
createAttention(AttentionVariant variant,
                std::shared_ptr<const FastAttention> fastPath = nullptr);

// Reads attention.variant and attention.fast_path
std::unique_ptr<AttentionOperator>
createAttentionFromConfig(const core::ConfigManager& config);

} // namespace nn
} // namespace ml
} // namespace dualattn

#endif // DUALATTN_ML_NN_ATTENTION_FACTORY_H
