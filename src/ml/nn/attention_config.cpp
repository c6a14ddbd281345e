#include "attention_config.h"

#include <cmath>
#include <sstream>

namespace dualattn {
namespace ml {
namespace nn {

std::string AttentionShape::toString() const {
  std::ostringstream oss;
  oss << "batch=" << batch << ", heads=" << heads << ", tgt=" << tgtLen
      << ", src=" << srcLen << ", head_dim=" << headDim
      << ", value_dim=" << valueDim;
  return oss.str();
}

namespace {

void checkOperand(const Tensor &t, const char *name) {
  if (t.ndim() != 4) {
    throw InvalidShapeError(std::string(name) +
                            " must be 4-D [batch, heads, seq, dim], got " +
                            shapeToString(t.shape()));
  }
  if (t.dtype() != DataType::FLOAT32) {
    throw InvalidShapeError(std::string(name) + " must be float32, got " +
                            dataTypeToString(t.dtype()));
  }
  if (t.numel() > 0 && !t.isAllocated()) {
    throw InvalidShapeError(std::string(name) + " has no data");
  }
}

void checkMask(const Tensor &mask, const AttentionShape &shape) {
  if (mask.dtype() != DataType::FLOAT32) {
    throw InvalidShapeError("mask must be float32, got " +
                            dataTypeToString(mask.dtype()));
  }
  const int nd = mask.ndim();
  if (nd < 1 || nd > 4) {
    throw InvalidShapeError("mask rank must be 1..4, got " +
                            shapeToString(mask.shape()));
  }
  const std::vector<int64_t> target = shape.scoreShape();
  for (int i = 0; i < nd; ++i) {
    const int64_t m = mask.shape()[nd - 1 - i];
    const int64_t t = target[3 - i];
    if (m != t && m != 1) {
      throw InvalidShapeError("mask " + shapeToString(mask.shape()) +
                              " does not broadcast to scores " +
                              shapeToString(target));
    }
  }
  if (mask.numel() > 0 && !mask.isAllocated()) {
    throw InvalidShapeError("mask has no data");
  }
}

} // namespace

AttentionShape validateAttentionInputs(const Tensor &query, const Tensor &key,
                                       const Tensor &value,
                                       const AttentionConfig &config) {
  checkOperand(query, "query");
  checkOperand(key, "key");
  checkOperand(value, "value");

  AttentionShape shape;
  shape.batch = query.dim(0);
  shape.heads = query.dim(1);
  shape.tgtLen = query.dim(2);
  shape.headDim = query.dim(3);
  shape.srcLen = key.dim(2);
  shape.valueDim = value.dim(3);

  if (key.dim(0) != shape.batch || value.dim(0) != shape.batch) {
    throw InvalidShapeError("batch mismatch: query " + shapeToString(query.shape()) +
                            ", key " + shapeToString(key.shape()) + ", value " +
                            shapeToString(value.shape()));
  }
  if (key.dim(1) != shape.heads || value.dim(1) != shape.heads) {
    throw InvalidShapeError("head count mismatch: query " +
                            shapeToString(query.shape()) + ", key " +
                            shapeToString(key.shape()) + ", value " +
                            shapeToString(value.shape()));
  }
  if (value.dim(2) != shape.srcLen) {
    throw InvalidShapeError("key and value sequence lengths differ: " +
                            std::to_string(shape.srcLen) + " vs " +
                            std::to_string(value.dim(2)));
  }
  if (key.dim(3) != shape.headDim) {
    throw InvalidShapeError("query and key head_dim differ: " +
                            std::to_string(shape.headDim) + " vs " +
                            std::to_string(key.dim(3)));
  }

  if (config.mask) {
    checkMask(*config.mask, shape);
  }
  if (!std::isfinite(config.dropoutP) || config.dropoutP < 0.0f ||
      config.dropoutP >= 1.0f) {
    throw InvalidShapeError("dropout probability must be in [0, 1), got " +
                            std::to_string(config.dropoutP));
  }
  if (config.scale && (!std::isfinite(*config.scale) || *config.scale <= 0.0f)) {
    throw InvalidShapeError("scale override must be finite and positive, got " +
                            std::to_string(*config.scale));
  }
  return shape;
}

float resolveScale(const AttentionConfig &config, int64_t headDim) {
  if (config.scale) {
    return *config.scale;
  }
  if (headDim <= 0) {
    return 1.0f;
  }
  return 1.0f / std::sqrt(static_cast<float>(headDim));
}

std::array<int64_t, 4> maskBroadcastStrides(const Tensor &mask) {
  std::array<int64_t, 4> strides{0, 0, 0, 0};
  const std::vector<int64_t> own = computeStrides(mask.shape());
  const int nd = mask.ndim();
  for (int i = 0; i < nd && i < 4; ++i) {
    const int src = nd - 1 - i;
    strides[3 - i] = mask.shape()[src] == 1 ? 0 : own[src];
  }
  return strides;
}

} // namespace nn
} // namespace ml
} // namespace dualattn
