#include <atomic>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../src/core/logger.h"
#include "../src/ml/backend/backend.h"
#include "../src/ml/context.h"
#include "../src/ml/random.h"
#include "../src/ml/tensor.h"
#include "../src/ml/nn/attention.h"
#include "../src/ml/nn/fast_attention.h"

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

// Fast path with a fixed answer that counts how often it is asked
class ScriptedFastPath : public FastAttention {
public:
    enum class Mode { DECLINE, SUCCEED, FAIL, WRONG_SHAPE, THROW };

    explicit ScriptedFastPath(Mode mode) : mode_(mode) {}

    FastPathResult run(Context&, const Tensor& query, const Tensor&,
                       const Tensor& value, const AttentionConfig&) const override {
        calls_.fetch_add(1);
        switch (mode_) {
        case Mode::DECLINE:
            return FastPathResult::unsupported(FastPathFailure::DTYPE, "scripted decline");
        case Mode::SUCCEED:
            return FastPathResult::success(
                Tensor::full({query.dim(0), query.dim(1), query.dim(2), value.dim(3)}, 7.0f));
        case Mode::FAIL:
            return FastPathResult::fatal(FastPathFailure::RESOURCE, "scripted out of memory");
        case Mode::WRONG_SHAPE:
            return FastPathResult::success(Tensor::full({1, 1, 1, 1}, 0.0f));
        case Mode::THROW:
        default:
            throw std::logic_error("scripted kernel bug");
        }
    }

    std::string getName() const override { return "scripted"; }

    int calls() const { return calls_.load(); }

private:
    Mode mode_;
    mutable std::atomic<int> calls_{0};
};

// Host memory that reports itself as an accelerator
class FakeDeviceBackend : public Backend {
public:
    bool initialize() override { return true; }
    void* allocate(size_t bytes) override { return std::malloc(bytes); }
    void deallocate(void* ptr) override { std::free(ptr); }
    void copyToDevice(void* dst, const void* src, size_t bytes) override {
        std::memcpy(dst, src, bytes);
    }
    void copyFromDevice(void* dst, const void* src, size_t bytes) override {
        std::memcpy(dst, src, bytes);
    }
    void copyDeviceToDevice(void* dst, const void* src, size_t bytes) override {
        std::memcpy(dst, src, bytes);
    }
    void synchronize() override {}
    DeviceType getType() const override { return DeviceType::CUDA; }
    std::string getName() const override { return "fake device"; }
    bool isHostMemory() const override { return true; }
};

struct Inputs {
    Tensor q;
    Tensor k;
    Tensor v;
};

Inputs makeInputs(uint64_t seed) {
    RandomSource rng(seed);
    Inputs in;
    in.q = Tensor::randn({2, 2, 3, 4}, rng);
    in.k = Tensor::randn({2, 2, 5, 4}, rng);
    in.v = Tensor::randn({2, 2, 5, 4}, rng);
    return in;
}

} // namespace

bool testFallbackMatchesCore() {
    std::cout << "\n=== Testing Fallback on UNSUPPORTED ===" << std::endl;

    Context ctx;
    ctx.enableProfiling(true);
    Inputs in = makeInputs(1);
    auto fast = std::make_shared<ScriptedFastPath>(ScriptedFastPath::Mode::DECLINE);
    AttentionDispatcher dispatcher(fast);
    AttentionCore core;

    Tensor viaDispatch = dispatcher.compute(ctx, in.q, in.k, in.v);
    Tensor direct = core.compute(ctx, in.q, in.k, in.v);
    TEST_ASSERT(viaDispatch.toVector() == direct.toVector(),
                "fallback result equals AttentionCore");
    TEST_ASSERT(fast->calls() == 1, "fast path consulted exactly once");
    TEST_ASSERT(ctx.getCallCount("attention.fallback") == 1, "fallback timing recorded");
    TEST_ASSERT(ctx.getCallCount("attention.fast") == 0, "no fast timing on fallback");
    TEST_ASSERT(ctx.getTiming("attention.fallback") >= 0.0, "fallback time accumulated");
    ctx.resetProfiling();
    TEST_ASSERT(ctx.getCallCount("attention.manual") == 0, "resetProfiling clears counters");

    dualattn::core::Logger& logger = dualattn::core::Logger::getInstance();
    const dualattn::core::LogLevel previous = logger.getLogLevel();
    std::vector<std::string> lines;
    logger.setLogLevel(dualattn::core::LogLevel::DEBUG);
    logger.setSink([&lines](dualattn::core::LogLevel, const std::string& line) {
        lines.push_back(line);
    });
    dispatcher.compute(ctx, in.q, in.k, in.v);
    logger.setSink(nullptr);
    logger.setLogLevel(previous);
    TEST_ASSERT(fast->calls() == 2, "failures are not cached across calls");

    bool logged = false;
    for (const std::string& line : lines) {
        if (line.find("scripted declined (dtype): scripted decline") != std::string::npos) {
            logged = true;
        }
    }
    TEST_ASSERT(logged, "fallback reason logged at debug");
    return true;
}

bool testSuccessIsReturnedUnchanged() {
    std::cout << "\n=== Testing SUCCESS Passthrough ===" << std::endl;

    Context ctx;
    ctx.enableProfiling(true);
    Inputs in = makeInputs(2);
    auto fast = std::make_shared<ScriptedFastPath>(ScriptedFastPath::Mode::SUCCEED);
    AttentionDispatcher dispatcher(fast);

    Tensor out = dispatcher.compute(ctx, in.q, in.k, in.v);
    TEST_ASSERT(out.toVector() == std::vector<float>(2 * 2 * 3 * 4, 7.0f),
                "fast path output returned as is");
    TEST_ASSERT(fast->calls() == 1, "fast path called once");
    TEST_ASSERT(ctx.getCallCount("attention.fast") == 1, "fast timing recorded");
    TEST_ASSERT(ctx.getCallCount("attention.manual") == 0, "manual path not run");
    TEST_ASSERT(dispatcher.getName() == "dispatch(scripted)", "dispatcher name");
    return true;
}

bool testFatalPropagates() {
    std::cout << "\n=== Testing FATAL Propagation ===" << std::endl;

    Context ctx;
    ctx.enableProfiling(true);
    Inputs in = makeInputs(3);

    auto failing = std::make_shared<ScriptedFastPath>(ScriptedFastPath::Mode::FAIL);
    AttentionDispatcher dispatcher(failing);
    dualattn::core::Logger& logger = dualattn::core::Logger::getInstance();
    std::vector<std::string> lines;
    logger.setSink([&lines](dualattn::core::LogLevel level, const std::string& line) {
        if (level == dualattn::core::LogLevel::LOAD_ERROR) {
            lines.push_back(line);
        }
    });
    bool threw = false;
    try {
        dispatcher.compute(ctx, in.q, in.k, in.v);
    } catch (const FastPathFatalError& e) {
        threw = e.reason() == FastPathFailure::RESOURCE && e.fastPathName() == "scripted";
    }
    logger.setSink(nullptr);
    TEST_ASSERT(threw, "FATAL result raised as FastPathFatalError");
    TEST_ASSERT(fastPathStatusToString(FastPathStatus::FATAL) == "fatal", "status name");
    TEST_ASSERT(lines.size() == 1 &&
                    lines[0].find("scripted returned fatal (resource): scripted out of memory") !=
                        std::string::npos,
                "fatal result logged once at error level");
    TEST_ASSERT(ctx.getCallCount("attention.manual") == 0, "no fallback after FATAL");

    auto wrong = std::make_shared<ScriptedFastPath>(ScriptedFastPath::Mode::WRONG_SHAPE);
    AttentionDispatcher wrongDispatcher(wrong);
    threw = false;
    try {
        wrongDispatcher.compute(ctx, in.q, in.k, in.v);
    } catch (const FastPathFatalError& e) {
        threw = e.reason() == FastPathFailure::RUNTIME;
    }
    TEST_ASSERT(threw, "mis-shaped SUCCESS output is treated as fatal");

    auto throwing = std::make_shared<ScriptedFastPath>(ScriptedFastPath::Mode::THROW);
    AttentionDispatcher throwingDispatcher(throwing);
    threw = false;
    try {
        throwingDispatcher.compute(ctx, in.q, in.k, in.v);
    } catch (const std::logic_error&) {
        threw = true;
    }
    TEST_ASSERT(threw, "exceptions from the fast path propagate unchanged");
    TEST_ASSERT(ctx.getCallCount("attention.manual") == 0, "exceptions never fall back");
    return true;
}

bool testNoFastPath() {
    std::cout << "\n=== Testing Dispatcher Without Fast Path ===" << std::endl;

    Context ctx;
    ctx.enableProfiling(true);
    Inputs in = makeInputs(4);
    AttentionDispatcher dispatcher;
    AttentionCore core;

    TEST_ASSERT(!dispatcher.hasFastPath(), "no fast path bound");
    Tensor a = dispatcher.compute(ctx, in.q, in.k, in.v);
    Tensor b = core.compute(ctx, in.q, in.k, in.v);
    TEST_ASSERT(a.toVector() == b.toVector(), "delegates to AttentionCore");
    TEST_ASSERT(ctx.getCallCount("attention.manual") == 2, "manual timing recorded");
    return true;
}

bool testInvalidShapeBeforeFastPath() {
    std::cout << "\n=== Testing Validation Order ===" << std::endl;

    Context ctx;
    RandomSource rng(5);
    Tensor q = Tensor::randn({1, 2, 3, 4}, rng);
    Tensor k = Tensor::randn({1, 2, 5, 8}, rng);
    Tensor v = Tensor::randn({1, 2, 5, 4}, rng);

    auto fast = std::make_shared<ScriptedFastPath>(ScriptedFastPath::Mode::SUCCEED);
    AttentionDispatcher dispatcher(fast);
    bool threw = false;
    try {
        dispatcher.compute(ctx, q, k, v);
    } catch (const InvalidShapeError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "InvalidShapeError raised by the dispatcher");
    TEST_ASSERT(fast->calls() == 0, "fast path not consulted for malformed input");
    return true;
}

bool testDeviceOutputs() {
    std::cout << "\n=== Testing Output Placement ===" << std::endl;

    FakeDeviceBackend device;
    Context ctx(&device);
    Inputs in = makeInputs(6);
    AttentionCore core;

    Tensor out = core.compute(ctx, in.q, in.k, in.v);
    TEST_ASSERT(out.backend() == &device, "output allocated on context backend");
    TEST_ASSERT(out.deviceType() == DeviceType::CUDA, "output reports backend device");
    return true;
}

bool testConcurrentCalls() {
    std::cout << "\n=== Testing Concurrent Dispatch ===" << std::endl;

    auto fast = std::make_shared<ScriptedFastPath>(ScriptedFastPath::Mode::DECLINE);
    const AttentionDispatcher dispatcher(fast);
    Inputs in = makeInputs(7);

    Context reference;
    const std::vector<float> expected = AttentionCore().compute(reference, in.q, in.k, in.v).toVector();

    std::atomic<int> mismatches{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&] {
            Context ctx;
            for (int i = 0; i < 10; ++i) {
                if (dispatcher.compute(ctx, in.q, in.k, in.v).toVector() != expected) {
                    mismatches.fetch_add(1);
                }
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    TEST_ASSERT(mismatches.load() == 0, "concurrent calls agree with the reference");
    TEST_ASSERT(fast->calls() == 40, "one fast path attempt per call");
    return true;
}

int main() {
    std::cout << "Starting AttentionDispatcher Tests..." << std::endl;

    bool all_passed = true;

    all_passed &= testFallbackMatchesCore();
    all_passed &= testSuccessIsReturnedUnchanged();
    all_passed &= testFatalPropagates();
    all_passed &= testNoFastPath();
    all_passed &= testInvalidShapeBeforeFastPath();
    all_passed &= testDeviceOutputs();
    all_passed &= testConcurrentCalls();

    if (all_passed) {
        std::cout << "\n=== ALL TESTS PASSED ===" << std::endl;
        return 0;
    } else {
        std::cout << "\n=== SOME TESTS FAILED ===" << std::endl;
        return 1;
    }
}
