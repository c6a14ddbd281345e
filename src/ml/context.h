#ifndef DUALATTN_ML_CONTEXT_H
#define DUALATTN_ML_CONTEXT_H

#include <map>
#include <string>

namespace dualattn {
namespace ml {

class Backend;

// Per-caller computation context: the backend outputs are allocated on, the
// worker thread budget for fused kernels and optional timing statistics.
// A Context is not shared between threads.
class Context {
public:
  explicit Context(Backend *backend = nullptr);
  ~Context() = default;

  Backend *getBackend() const { return backend_; }

  // Thread budget for fused kernels. Defaults to DUALATTN_NUM_THREADS when
  // set, otherwise the hardware concurrency.
  int numThreads() const { return numThreads_; }
  void setNumThreads(int numThreads);

  // Waits for outstanding work on the backend
  void synchronize();

  // Timing statistics keyed by operation name; recordTiming is a no-op
  // while profiling is disabled
  void enableProfiling(bool enable = true) { profilingEnabled_ = enable; }
  void recordTiming(const std::string &operation, double ms);
  double getTiming(const std::string &operation) const;
  int getCallCount(const std::string &operation) const;
  void resetProfiling();
  void printProfilingInfo() const;

private:
  Backend *backend_{nullptr};
  int numThreads_;
  bool profilingEnabled_;

  struct TimingStat {
    double totalMs = 0.0;
    int calls = 0;
  };
  std::map<std::string, TimingStat> timingStats_;
};

} // namespace ml
} // namespace dualattn

#endif // DUALATTN_ML_CONTEXT_H
