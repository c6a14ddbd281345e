#include "fast_attention.h"

#include <utility>

namespace dualattn {
namespace ml {
namespace nn {

std::string fastPathStatusToString(FastPathStatus status) {
  switch (status) {
  case FastPathStatus::SUCCESS:
    return "success";
  case FastPathStatus::UNSUPPORTED:
    return "unsupported";
  case FastPathStatus::FATAL:
    return "fatal";
  default:
    return "unknown";
  }
}

std::string fastPathFailureToString(FastPathFailure reason) {
  switch (reason) {
  case FastPathFailure::NONE:
    return "none";
  case FastPathFailure::DTYPE:
    return "dtype";
  case FastPathFailure::DEVICE:
    return "device";
  case FastPathFailure::SHAPE:
    return "shape";
  case FastPathFailure::MASK:
    return "mask";
  case FastPathFailure::CONFIG:
    return "config";
  case FastPathFailure::RESOURCE:
    return "resource";
  case FastPathFailure::RUNTIME:
    return "runtime";
  default:
    return "unknown";
  }
}

FastPathResult FastPathResult::success(Tensor output) {
  FastPathResult result;
  result.status = FastPathStatus::SUCCESS;
  result.reason = FastPathFailure::NONE;
  result.output = std::move(output);
  return result;
}

FastPathResult FastPathResult::unsupported(FastPathFailure reason,
                                           std::string message) {
  FastPathResult result;
  result.status = FastPathStatus::UNSUPPORTED;
  result.reason = reason;
  result.message = std::move(message);
  return result;
}

FastPathResult FastPathResult::fatal(FastPathFailure reason,
                                     std::string message) {
  FastPathResult result;
  result.status = FastPathStatus::FATAL;
  result.reason = reason;
  result.message = std::move(message);
  return result;
}

FastPathFatalError::FastPathFatalError(const std::string &fastPath,
                                       FastPathFailure reason,
                                       const std::string &message)
    : std::runtime_error(fastPath + " failed (" +
                         fastPathFailureToString(reason) + "): " + message),
      fastPath_(fastPath), reason_(reason) {}

} // namespace nn
} // namespace ml
} // namespace dualattn
