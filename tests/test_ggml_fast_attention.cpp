#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "../src/ml/context.h"
#include "../src/ml/random.h"
#include "../src/ml/tensor.h"
#include "../src/ml/nn/attention.h"
#include "../src/ml/nn/fast_attention.h"
#include "../src/ml/nn/ggml_fast_attention.h"

using namespace dualattn::ml;
using namespace dualattn::ml::nn;

#define TEST_ASSERT(condition, message) \
    if (!(condition)) { \
        std::cerr << "FAILED: " << message << std::endl; \
        return false; \
    } else { \
        std::cout << "PASSED: " << message << std::endl; \
    }

namespace {

float maxAbsDiff(const Tensor& a, const Tensor& b) {
    std::vector<float> x = a.toVector();
    std::vector<float> y = b.toVector();
    if (x.size() != y.size()) {
        return INFINITY;
    }
    float diff = 0.0f;
    for (size_t i = 0; i < x.size(); ++i) {
        diff = std::max(diff, std::fabs(x[i] - y[i]));
    }
    return diff;
}

} // namespace

bool testMatchesManual() {
    std::cout << "\n=== Testing ggml Flash Attention Accuracy ===" << std::endl;

    Context ctx;
    ctx.setNumThreads(2);
    RandomSource rng(21);
    Tensor q = Tensor::randn({2, 3, 5, 16}, rng);
    Tensor k = Tensor::randn({2, 3, 9, 16}, rng);
    Tensor v = Tensor::randn({2, 3, 9, 16}, rng);

    GGMLFastAttention fast;
    AttentionCore core;

    FastPathResult result = fast.run(ctx, q, k, v, AttentionConfig{});
    TEST_ASSERT(result.ok(), "kernel serves float32 host tensors");
    TEST_ASSERT(result.output.shape() == std::vector<int64_t>({2, 3, 5, 16}),
                "output is [batch, heads, tgt, dim]");

    Tensor reference = core.compute(ctx, q, k, v);
    TEST_ASSERT(maxAbsDiff(result.output, reference) < 1e-2f,
                "matches AttentionCore within F16 tolerance");

    Tensor mask = makeCausalMask(5, 9);
    AttentionConfig masked;
    masked.mask = &mask;
    masked.scale = 0.5f;
    FastPathResult maskedResult = fast.run(ctx, q, k, v, masked);
    TEST_ASSERT(maskedResult.ok(), "kernel serves a shared [T, S] mask");
    TEST_ASSERT(maskedResult.output.sameShape(reference), "masked output shape");
    Tensor maskedRef = core.compute(ctx, q, k, v, masked);
    TEST_ASSERT(maxAbsDiff(maskedResult.output, maskedRef) < 1e-2f,
                "masked result matches AttentionCore");
    return true;
}

bool testDeclines() {
    std::cout << "\n=== Testing ggml Flash Attention Declines ===" << std::endl;

    Context ctx;
    RandomSource rng(22);
    Tensor q = Tensor::randn({1, 2, 4, 8}, rng);
    Tensor k = Tensor::randn({1, 2, 6, 8}, rng);
    Tensor v = Tensor::randn({1, 2, 6, 8}, rng);
    GGMLFastAttention fast;

    RandomSource dropRng(1);
    AttentionConfig dropout;
    dropout.training = true;
    dropout.dropoutP = 0.1f;
    dropout.rng = &dropRng;
    FastPathResult r = fast.run(ctx, q, k, v, dropout);
    TEST_ASSERT(r.status == FastPathStatus::UNSUPPORTED && r.reason == FastPathFailure::CONFIG,
                "dropout declined as CONFIG");
    TEST_ASSERT(dropRng.draws() == 0, "declined call draws nothing");

    Tensor perHead = Tensor::zeros({1, 2, 4, 6});
    AttentionConfig headMask;
    headMask.mask = &perHead;
    r = fast.run(ctx, q, k, v, headMask);
    TEST_ASSERT(r.status == FastPathStatus::UNSUPPORTED && r.reason == FastPathFailure::MASK,
                "per-head mask declined as MASK");

    Tensor half({1, 2, 4, 8}, DataType::FLOAT16);
    half.allocate();
    r = fast.run(ctx, half, k, v, AttentionConfig{});
    TEST_ASSERT(r.status == FastPathStatus::UNSUPPORTED && r.reason == FastPathFailure::DTYPE,
                "float16 input declined as DTYPE");

    Tensor narrowV = Tensor::randn({1, 2, 6, 4}, rng);
    r = fast.run(ctx, q, k, narrowV, AttentionConfig{});
    TEST_ASSERT(r.status == FastPathStatus::UNSUPPORTED && r.reason == FastPathFailure::SHAPE,
                "value_dim != head_dim declined as SHAPE");

    Tensor k0({1, 2, 0, 8});
    Tensor v0({1, 2, 0, 8});
    r = fast.run(ctx, q, k0, v0, AttentionConfig{});
    TEST_ASSERT(r.status == FastPathStatus::UNSUPPORTED && r.reason == FastPathFailure::SHAPE,
                "empty source declined as SHAPE");
    return true;
}

bool testThroughDispatcher() {
    std::cout << "\n=== Testing ggml Fast Path Through Dispatcher ===" << std::endl;

    Context ctx;
    ctx.enableProfiling(true);
    RandomSource rng(23);
    Tensor q = Tensor::randn({1, 4, 6, 32}, rng);
    Tensor k = Tensor::randn({1, 4, 6, 32}, rng);
    Tensor v = Tensor::randn({1, 4, 6, 32}, rng);

    AttentionDispatcher dispatcher(std::make_shared<GGMLFastAttention>());
    AttentionCore core;

    Tensor fast = dispatcher.compute(ctx, q, k, v);
    TEST_ASSERT(ctx.getCallCount("attention.fast") == 1, "served by the fused kernel");
    TEST_ASSERT(maxAbsDiff(fast, core.compute(ctx, q, k, v)) < 1e-2f,
                "dispatcher result close to manual");

    RandomSource dropRng(8);
    AttentionConfig dropout;
    dropout.training = true;
    dropout.dropoutP = 0.2f;
    dropout.rng = &dropRng;
    Tensor dropped = dispatcher.compute(ctx, q, k, v, dropout);
    TEST_ASSERT(ctx.getCallCount("attention.fallback") == 1, "dropout falls back to manual");

    RandomSource sameRng(8);
    dropout.rng = &sameRng;
    Tensor manualDropped = core.compute(ctx, q, k, v, dropout);
    TEST_ASSERT(dropped.toVector() == manualDropped.toVector(),
                "fallback output equals AttentionCore with the same seed");
    return true;
}

bool testArenaLimit() {
    std::cout << "\n=== Testing ggml Arena Limit ===" << std::endl;

    Context ctx;
    ctx.enableProfiling(true);
    RandomSource rng(29);
    Tensor q = Tensor::randn({1, 2, 4, 16}, rng);
    Tensor k = Tensor::randn({1, 2, 4, 16}, rng);
    Tensor v = Tensor::randn({1, 2, 4, 16}, rng);

    GGMLFastAttention unlimited;
    TEST_ASSERT(unlimited.maxArenaBytes() == 0, "no arena limit by default");

    auto tight = std::make_shared<GGMLFastAttention>(1024);
    FastPathResult result = tight->run(ctx, q, k, v, AttentionConfig{});
    TEST_ASSERT(result.status == FastPathStatus::FATAL, "oversized arena is fatal");
    TEST_ASSERT(result.reason == FastPathFailure::RESOURCE, "reason is RESOURCE");
    TEST_ASSERT(result.message.find("exceeds limit") != std::string::npos,
                "message names the limit");

    AttentionDispatcher dispatcher(tight);
    bool threw = false;
    try {
        dispatcher.compute(ctx, q, k, v);
    } catch (const FastPathFatalError& e) {
        threw = e.reason() == FastPathFailure::RESOURCE &&
                e.fastPathName() == "ggml_flash_attn";
    }
    TEST_ASSERT(threw, "dispatcher raises FastPathFatalError for RESOURCE");
    TEST_ASSERT(ctx.getCallCount("attention.manual") == 0, "resource failure never falls back");
    return true;
}

int main() {
    std::cout << "Starting GGMLFastAttention Tests..." << std::endl;

    bool all_passed = true;

    all_passed &= testMatchesManual();
    all_passed &= testDeclines();
    all_passed &= testThroughDispatcher();
    all_passed &= testArenaLimit();

    if (all_passed) {
        std::cout << "\n=== ALL TESTS PASSED ===" << std::endl;
        return 0;
    } else {
        std::cout << "\n=== SOME TESTS FAILED ===" << std::endl;
        return 1;
    }
}
