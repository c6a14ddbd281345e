#include "attention_factory.h"
#include "ggml_fast_attention.h"
#include "../../core/config_manager.h"
#include "../../core/logger.h"

#include <algorithm>
#include <cctype>
#include <map>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace dualattn {
namespace ml {
namespace nn {

namespace {

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

using Registry = std::map<std::string, FastAttentionCreator>;

struct RegistryState {
  std::mutex mutex;
  Registry entries;
};

RegistryState &registry() {
  static RegistryState state;
  static std::once_flag defaults;
  std::call_once(defaults, [] {
    state.entries["ggml"] = []() -> std::shared_ptr<const FastAttention> {
      return std::make_shared<GGMLFastAttention>();
    };
  });
  return state;
}

} // namespace

std::string variantToString(AttentionVariant variant) {
  switch (variant) {
  case AttentionVariant::MANUAL:
    return "manual";
  case AttentionVariant::DISPATCH:
    return "dispatch";
  default:
    return "unknown";
  }
}

AttentionVariant stringToVariant(const std::string &name) {
  const std::string lower = toLower(name);
  if (lower == "manual") {
    return AttentionVariant::MANUAL;
  }
  if (lower == "dispatch") {
    return AttentionVariant::DISPATCH;
  }
  throw std::invalid_argument("Unknown attention variant: " + name);
}

void registerFastPath(const std::string &name, FastAttentionCreator creator) {
  if (!creator) {
    throw std::invalid_argument("registerFastPath: empty creator for " + name);
  }
  RegistryState &state = registry();
  std::lock_guard<std::mutex> lock(state.mutex);
  state.entries[toLower(name)] = std::move(creator);
}

std::shared_ptr<const FastAttention> createFastPath(const std::string &name) {
  const std::string key = toLower(name);
  if (key.empty() || key == "none") {
    return nullptr;
  }
  FastAttentionCreator creator;
  {
    RegistryState &state = registry();
    std::lock_guard<std::mutex> lock(state.mutex);
    auto it = state.entries.find(key);
    if (it == state.entries.end()) {
      throw std::invalid_argument("Unknown fast path: " + name);
    }
    creator = it->second;
  }
  return creator();
}

std::vector<std::string> availableFastPaths() {
  RegistryState &state = registry();
  std::lock_guard<std::mutex> lock(state.mutex);
  std::vector<std::string> names;
  names.reserve(state.entries.size());
  for (const auto &entry : state.entries) {
    names.push_back(entry.first);
  }
  return names;
}

std::unique_ptr<AttentionOperator>
createAttention(AttentionVariant variant,
                std::shared_ptr<const FastAttention> fastPath) {
  switch (variant) {
  case AttentionVariant::MANUAL:
    return std::make_unique<AttentionCore>();
  case AttentionVariant::DISPATCH:
    return std::make_unique<AttentionDispatcher>(std::move(fastPath));
  default:
    throw std::invalid_argument("createAttention: unhandled variant");
  }
}

std::unique_ptr<AttentionOperator>
createAttentionFromConfig(const core::ConfigManager &config) {
  const AttentionVariant variant =
      stringToVariant(config.getString("attention.variant", "dispatch"));
  std::shared_ptr<const FastAttention> fastPath;
  if (variant == AttentionVariant::DISPATCH) {
    fastPath = createFastPath(config.getString("attention.fast_path", "ggml"));
  }
  auto op = createAttention(variant, std::move(fastPath));
  core::Logger::getInstance().info("[Attention] using " + op->getName());
  return op;
}

} // namespace nn
} // namespace ml
} // namespace dualattn
