#include "attention.h"
#include "../backend/backend.h"
#include "../random.h"
#include "../../core/logger.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

namespace dualattn {
namespace ml {
namespace nn {

namespace {

using Clock = std::chrono::steady_clock;

double elapsedMs(Clock::time_point start) {
  return std::chrono::duration<double, std::milli>(Clock::now() - start)
      .count();
}

void requireHost(const Tensor &t, const char *name) {
  if (!t.isHostAccessible()) {
    throw std::invalid_argument(
        std::string("AttentionCore: ") + name + " lives on " +
        deviceTypeToString(t.deviceType()) +
        " memory that is not host accessible");
  }
}

// Zero-filled float32 tensor on the context backend when the host can
// write to it, on the host heap otherwise.
Tensor makeOutput(Context &ctx, const std::vector<int64_t> &shape) {
  Tensor out(shape, DataType::FLOAT32);
  Backend *backend = ctx.getBackend();
  if (backend && backend->isHostMemory()) {
    out.allocate(backend);
  } else {
    out.allocate();
  }
  if (out.nbytes() > 0) {
    std::memset(out.data(), 0, out.nbytes());
  }
  return out;
}

// scores -> weights for one [T, S] slab. Rows are softmaxed in place.
void softmaxRows(float *w, int64_t T, int64_t S) {
  for (int64_t i = 0; i < T; ++i) {
    float *row = w + i * S;
    float maxScore = -std::numeric_limits<float>::infinity();
    for (int64_t j = 0; j < S; ++j) {
      maxScore = std::max(maxScore, row[j]);
    }
    float sumExp = 0.0f;
    for (int64_t j = 0; j < S; ++j) {
      row[j] = std::exp(row[j] - maxScore);
      sumExp += row[j];
    }
    const float inv = 1.0f / sumExp;
    for (int64_t j = 0; j < S; ++j) {
      row[j] *= inv;
    }
  }
}

} // namespace

Tensor AttentionCore::computeWeights(Context &ctx, const Tensor &query,
                                     const Tensor &key, const Tensor &value,
                                     const AttentionConfig &config) const {
  const AttentionShape shape =
      validateAttentionInputs(query, key, value, config);
  requireHost(query, "query");
  requireHost(key, "key");
  if (config.mask) {
    requireHost(*config.mask, "mask");
  }
  if (config.dropoutActive() && !config.rng) {
    throw std::invalid_argument(
        "AttentionCore: dropout is active but no RandomSource was given");
  }

  const int64_t B = shape.batch;
  const int64_t H = shape.heads;
  const int64_t T = shape.tgtLen;
  const int64_t S = shape.srcLen;
  const int64_t D = shape.headDim;

  Tensor weights = makeOutput(ctx, shape.scoreShape());
  if (weights.numel() == 0) {
    return weights;
  }

  const float scale = resolveScale(config, D);
  const float *q = query.data<float>();
  const float *k = key.data<float>();
  float *w = weights.data<float>();

  const float *m = config.mask ? config.mask->data<float>() : nullptr;
  std::array<int64_t, 4> ms{0, 0, 0, 0};
  if (m) {
    ms = maskBroadcastStrides(*config.mask);
  }

  for (int64_t b = 0; b < B; ++b) {
    for (int64_t h = 0; h < H; ++h) {
      const int64_t bh = b * H + h;
      const float *qs = q + bh * T * D;
      const float *ks = k + bh * S * D;
      float *ws = w + bh * T * S;

      // 1) scaled scores plus the broadcast mask
      for (int64_t i = 0; i < T; ++i) {
        for (int64_t j = 0; j < S; ++j) {
          float dot = 0.0f;
          for (int64_t d = 0; d < D; ++d) {
            dot += qs[i * D + d] * ks[j * D + d];
          }
          dot *= scale;
          if (m) {
            dot += m[b * ms[0] + h * ms[1] + i * ms[2] + j * ms[3]];
          }
          ws[i * S + j] = dot;
        }
      }

      // 2) stable softmax over the source axis
      softmaxRows(ws, T, S);
    }
  }

  // 3) inverted dropout, one draw per weight in (b, h, i, j) order
  if (config.dropoutActive()) {
    const float p = config.dropoutP;
    const float keepScale = 1.0f / (1.0f - p);
    const int64_t n = weights.numel();
    for (int64_t idx = 0; idx < n; ++idx) {
      if (config.rng->uniform() < p) {
        w[idx] = 0.0f;
      } else {
        w[idx] *= keepScale;
      }
    }
  }

  return weights;
}

Tensor AttentionCore::compute(Context &ctx, const Tensor &query,
                              const Tensor &key, const Tensor &value,
                              const AttentionConfig &config) const {
  const auto start = Clock::now();

  Tensor weights = computeWeights(ctx, query, key, value, config);
  requireHost(value, "value");

  const int64_t B = query.dim(0);
  const int64_t H = query.dim(1);
  const int64_t T = query.dim(2);
  const int64_t S = key.dim(2);
  const int64_t Dv = value.dim(3);

  Tensor out = makeOutput(ctx, {B, H, T, Dv});
  if (out.numel() > 0 && S > 0) {
    const float *w = weights.data<float>();
    const float *v = value.data<float>();
    float *o = out.data<float>();

    // out[b,h,i,:] = sum_j w[b,h,i,j] * v[b,h,j,:]
    for (int64_t bh = 0; bh < B * H; ++bh) {
      const float *ws = w + bh * T * S;
      const float *vs = v + bh * S * Dv;
      float *os = o + bh * T * Dv;
      for (int64_t i = 0; i < T; ++i) {
        for (int64_t j = 0; j < S; ++j) {
          const float wij = ws[i * S + j];
          if (wij == 0.0f) {
            continue;
          }
          for (int64_t d = 0; d < Dv; ++d) {
            os[i * Dv + d] += wij * vs[j * Dv + d];
          }
        }
      }
    }
  }

  ctx.recordTiming("attention.manual", elapsedMs(start));
  return out;
}

AttentionDispatcher::AttentionDispatcher(
    std::shared_ptr<const FastAttention> fastPath)
    : fastPath_(std::move(fastPath)) {}

std::string AttentionDispatcher::getName() const {
  if (!fastPath_) {
    return "dispatch(none)";
  }
  return "dispatch(" + fastPath_->getName() + ")";
}

Tensor AttentionDispatcher::compute(Context &ctx, const Tensor &query,
                                    const Tensor &key, const Tensor &value,
                                    const AttentionConfig &config) const {
  if (!fastPath_) {
    return core_.compute(ctx, query, key, value, config);
  }

  // Malformed input is reported the same way with or without a fast path
  const AttentionShape shape =
      validateAttentionInputs(query, key, value, config);

  const auto start = Clock::now();
  FastPathResult result = fastPath_->run(ctx, query, key, value, config);

  switch (result.status) {
  case FastPathStatus::SUCCESS: {
    const Tensor &out = result.output;
    if (out.dtype() != DataType::FLOAT32 ||
        out.shape() != shape.outputShape() ||
        (out.numel() > 0 && !out.isAllocated())) {
      const std::string msg = "returned " + shapeToString(out.shape()) + " " +
                              dataTypeToString(out.dtype()) + ", expected " +
                              shapeToString(shape.outputShape()) + " float32";
      core::Logger::getInstance().error("[Attention] " + fastPath_->getName() +
                                        " " + msg);
      throw FastPathFatalError(fastPath_->getName(), FastPathFailure::RUNTIME,
                               msg);
    }
    ctx.recordTiming("attention.fast", elapsedMs(start));
    return std::move(result.output);
  }
  case FastPathStatus::UNSUPPORTED: {
    core::Logger &logger = core::Logger::getInstance();
    if (logger.isEnabled(core::LogLevel::DEBUG)) {
      logger.debug("[Attention] " + fastPath_->getName() + " declined (" +
                   fastPathFailureToString(result.reason) + "): " +
                   result.message + "; using manual path for " +
                   shape.toString());
    }
    Tensor out = core_.compute(ctx, query, key, value, config);
    ctx.recordTiming("attention.fallback", elapsedMs(start));
    return out;
  }
  case FastPathStatus::FATAL:
  default:
    core::Logger::getInstance().error(
        "[Attention] " + fastPath_->getName() + " returned " +
        fastPathStatusToString(result.status) + " (" +
        fastPathFailureToString(result.reason) + "): " + result.message);
    throw FastPathFatalError(fastPath_->getName(), result.reason,
                             result.message);
  }
}

Tensor makeCausalMask(int64_t tgtLen, int64_t srcLen) {
  if (tgtLen < 0 || srcLen < 0) {
    throw std::invalid_argument("makeCausalMask: negative length");
  }
  // Rows before the first key would have every entry masked
  if (tgtLen > srcLen) {
    throw std::invalid_argument(
        "makeCausalMask: target length " + std::to_string(tgtLen) +
        " exceeds source length " + std::to_string(srcLen));
  }
  Tensor mask = Tensor::zeros({tgtLen, srcLen});
  if (mask.numel() == 0) {
    return mask;
  }
  float *m = mask.data<float>();
  const int64_t offset = srcLen - tgtLen;
  for (int64_t i = 0; i < tgtLen; ++i) {
    for (int64_t j = 0; j < srcLen; ++j) {
      if (j > i + offset) {
        m[i * srcLen + j] = -std::numeric_limits<float>::infinity();
      }
    }
  }
  return mask;
}

} // namespace nn
} // namespace ml
} // namespace dualattn
