#include "context.h"
#include "backend/backend.h"
#include "../core/logger.h"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

namespace dualattn {
namespace ml {

namespace {

int defaultThreadCount() {
  if (const char *env = std::getenv("DUALATTN_NUM_THREADS")) {
    try {
      int v = std::stoi(std::string(env));
      if (v > 0) {
        return v;
      }
    } catch (const std::exception &) {
    }
    core::Logger::getInstance().warning(
        std::string("Ignoring invalid DUALATTN_NUM_THREADS value: ") + env);
  }
  unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<int>(hw) : 4;
}

} // namespace

Context::Context(Backend *backend)
    : backend_(backend), numThreads_(defaultThreadCount()),
      profilingEnabled_(false) {}

void Context::setNumThreads(int numThreads) {
  if (numThreads > 0) {
    numThreads_ = numThreads;
  } else {
    numThreads_ = defaultThreadCount();
  }
}

void Context::synchronize() {
  if (backend_) {
    backend_->synchronize();
  }
}

void Context::recordTiming(const std::string &operation, double ms) {
  if (!profilingEnabled_) {
    return;
  }
  TimingStat &stat = timingStats_[operation];
  stat.totalMs += ms;
  stat.calls += 1;
}

double Context::getTiming(const std::string &operation) const {
  auto it = timingStats_.find(operation);
  return it != timingStats_.end() ? it->second.totalMs : 0.0;
}

int Context::getCallCount(const std::string &operation) const {
  auto it = timingStats_.find(operation);
  return it != timingStats_.end() ? it->second.calls : 0;
}

void Context::resetProfiling() { timingStats_.clear(); }

void Context::printProfilingInfo() const {
  if (!profilingEnabled_) {
    std::cout << "Profiling is not enabled" << std::endl;
    return;
  }

  std::cout << "=== Profiling Information ===" << std::endl;
  for (const auto &[operation, stat] : timingStats_) {
    std::cout << operation << ": " << stat.totalMs << " ms over " << stat.calls
              << " call(s)" << std::endl;
  }
  std::cout << "=============================" << std::endl;
}

} // namespace ml
} // namespace dualattn
