#include "ggml_fast_attention.h"
#include "../backend/backend.h"
#include "../../core/logger.h"

#include <ggml.h>
#include <ggml-cpu.h>

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <memory>
#include <new>
#include <utility>
#include <vector>

namespace dualattn {
namespace ml {
namespace nn {

namespace {

struct GGMLContextDeleter {
  void operator()(ggml_context *ctx) const { ggml_free(ctx); }
};
using GGMLContextPtr = std::unique_ptr<ggml_context, GGMLContextDeleter>;

struct FreeDeleter {
  void operator()(void *p) const { std::free(p); }
};

int64_t paddedRows(int64_t tgtLen) {
#ifdef GGML_KQ_MASK_PAD
  return GGML_PAD(tgtLen, GGML_KQ_MASK_PAD);
#else
  return tgtLen;
#endif
}

void setMessage(std::string *out, const std::string &msg) {
  if (out) {
    *out = msg;
  }
}

// Copies a float32 host buffer into an F16 ggml tensor
void fillF16(ggml_tensor *dst, const float *src, int64_t n) {
  ggml_fp32_to_fp16_row(src, static_cast<ggml_fp16_t *>(dst->data), n);
}

} // namespace

FastPathFailure GGMLFastAttention::precheck(const Tensor &query, const Tensor &key,
                                         const Tensor &value,
                                         const AttentionConfig &config,
                                         std::string *message) const {
  const Tensor *mask = config.mask;

  if (query.dtype() != DataType::FLOAT32 || key.dtype() != DataType::FLOAT32 ||
      value.dtype() != DataType::FLOAT32 ||
      (mask && mask->dtype() != DataType::FLOAT32)) {
    setMessage(message, "only float32 tensors are supported");
    return FastPathFailure::DTYPE;
  }

  if (!query.isHostAccessible() || !key.isHostAccessible() ||
      !value.isHostAccessible() || (mask && !mask->isHostAccessible())) {
    setMessage(message, "tensors must be host resident");
    return FastPathFailure::DEVICE;
  }

  AttentionShape shape;
  try {
    shape = validateAttentionInputs(query, key, value, config);
  } catch (const InvalidShapeError &e) {
    setMessage(message, e.what());
    return FastPathFailure::SHAPE;
  }

  if (shape.batch == 0 || shape.heads == 0 || shape.tgtLen == 0 ||
      shape.srcLen == 0) {
    setMessage(message, "empty axis: " + shape.toString());
    return FastPathFailure::SHAPE;
  }
  if (shape.valueDim != shape.headDim) {
    setMessage(message, "value_dim must equal head_dim: " + shape.toString());
    return FastPathFailure::SHAPE;
  }

  if (mask) {
    const std::array<int64_t, 4> ms = maskBroadcastStrides(*mask);
    if (ms[0] != 0 || ms[1] != 0) {
      setMessage(message, "mask " + shapeToString(mask->shape()) +
                              " varies over batch or heads");
      return FastPathFailure::MASK;
    }
  }

  if (config.dropoutActive()) {
    setMessage(message, "dropout is not implemented by the fused kernel");
    return FastPathFailure::CONFIG;
  }

  setMessage(message, "");
  return FastPathFailure::NONE;
}

FastPathResult GGMLFastAttention::run(Context &ctx, const Tensor &query,
                                      const Tensor &key, const Tensor &value,
                                      const AttentionConfig &config) const {
  std::string reason;
  const FastPathFailure failure = precheck(query, key, value, config, &reason);
  if (failure != FastPathFailure::NONE) {
    return FastPathResult::unsupported(failure, reason);
  }

  const int64_t B = query.dim(0);
  const int64_t H = query.dim(1);
  const int64_t T = query.dim(2);
  const int64_t S = key.dim(2);
  const int64_t D = query.dim(3);
  const int64_t Tp = paddedRows(T);

  // Q F32 + K/V F16 + mask F16 + kernel output + contiguous copy
  size_t memSize = 0;
  memSize += static_cast<size_t>(B * H * T * D) * sizeof(float);
  memSize += 2 * static_cast<size_t>(B * H * S * D) * sizeof(ggml_fp16_t);
  memSize += static_cast<size_t>(S * Tp) * sizeof(ggml_fp16_t);
  memSize += 2 * static_cast<size_t>(B * H * T * D) * sizeof(float);
  memSize += 16 * ggml_tensor_overhead() + ggml_graph_overhead();
  memSize += 16 * GGML_MEM_ALIGN;

  if (maxArenaBytes_ > 0 && memSize > maxArenaBytes_) {
    return FastPathResult::fatal(
        FastPathFailure::RESOURCE,
        "ggml arena of " + std::to_string(memSize) + " bytes exceeds limit of " +
            std::to_string(maxArenaBytes_));
  }

  // Caller-owned arena: ggml_init aborts if its own allocation fails
  std::unique_ptr<void, FreeDeleter> arena(std::malloc(memSize));
  if (!arena) {
    return FastPathResult::fatal(FastPathFailure::RESOURCE,
                                 "cannot allocate " + std::to_string(memSize) +
                                     " byte ggml arena");
  }

  ggml_init_params params = {
      /*.mem_size   =*/memSize,
      /*.mem_buffer =*/arena.get(),
      /*.no_alloc   =*/false,
  };
  GGMLContextPtr gctx(ggml_init(params));
  if (!gctx) {
    return FastPathResult::fatal(FastPathFailure::RESOURCE,
                                 "ggml_init failed for " +
                                     std::to_string(memSize) + " bytes");
  }
  ggml_context *g = gctx.get();

  // Row-major [B, H, T, D] is ggml ne = [D, T, H, B]
  ggml_tensor *q = ggml_new_tensor_4d(g, GGML_TYPE_F32, D, T, H, B);
  ggml_tensor *k = ggml_new_tensor_4d(g, GGML_TYPE_F16, D, S, H, B);
  ggml_tensor *v = ggml_new_tensor_4d(g, GGML_TYPE_F16, D, S, H, B);
  std::memcpy(q->data, query.data(), query.nbytes());
  fillF16(k, key.data<float>(), key.numel());
  fillF16(v, value.data<float>(), value.numel());

  ggml_tensor *m = nullptr;
  if (config.mask) {
    const std::array<int64_t, 4> ms = maskBroadcastStrides(*config.mask);
    const float *src = config.mask->data<float>();
    std::vector<float> expanded(static_cast<size_t>(S * Tp), 0.0f);
    for (int64_t i = 0; i < T; ++i) {
      for (int64_t j = 0; j < S; ++j) {
        expanded[static_cast<size_t>(i * S + j)] = src[i * ms[2] + j * ms[3]];
      }
    }
    m = ggml_new_tensor_4d(g, GGML_TYPE_F16, S, Tp, 1, 1);
    fillF16(m, expanded.data(), S * Tp);
  }

  const float scale = resolveScale(config, D);

  // Result ne = [D, H, T, B]; permute back to [D, T, H, B]
  ggml_tensor *r = ggml_flash_attn_ext(g, q, k, v, m, scale, 0.0f, 0.0f);
  ggml_tensor *out = ggml_cont(g, ggml_permute(g, r, 0, 2, 1, 3));

  ggml_cgraph *gf = ggml_new_graph(g);
  ggml_build_forward_expand(gf, out);

  const int threads = ctx.numThreads();
  ggml_cplan plan = ggml_graph_plan(gf, threads, nullptr);
  std::unique_ptr<void, FreeDeleter> work;
  if (plan.work_size > 0) {
    work.reset(std::malloc(plan.work_size));
    if (!work) {
      return FastPathResult::fatal(
          FastPathFailure::RESOURCE,
          "cannot allocate " + std::to_string(plan.work_size) +
              " byte work buffer");
    }
    plan.work_data = static_cast<uint8_t *>(work.get());
  }

  const ggml_status status = ggml_graph_compute(gf, &plan);
  if (status != GGML_STATUS_SUCCESS) {
    return FastPathResult::fatal(FastPathFailure::RUNTIME,
                                 "ggml_graph_compute returned status " +
                                     std::to_string(static_cast<int>(status)));
  }

  Tensor result({B, H, T, D}, DataType::FLOAT32);
  try {
    Backend *backend = ctx.getBackend();
    if (backend && backend->isHostMemory()) {
      result.allocate(backend);
    } else {
      result.allocate();
    }
  } catch (const std::bad_alloc &) {
    return FastPathResult::fatal(FastPathFailure::RESOURCE,
                                 "cannot allocate output tensor");
  }
  std::memcpy(result.data(), out->data, result.nbytes());

  core::Logger::getInstance().debug(
      "[Attention] ggml_flash_attn served [" + std::to_string(B) + "," +
      std::to_string(H) + "," + std::to_string(T) + "," + std::to_string(D) +
      "] with " + std::to_string(threads) + " thread(s)");
  return FastPathResult::success(std::move(result));
}

} // namespace nn
} // namespace ml
} // namespace dualattn
