#ifndef DUALATTN_ML_NN_FAST_ATTENTION_H
#define DUALATTN_ML_NN_FAST_ATTENTION_H

#include <stdexcept>
#include <string>

#include "../context.h"
#include "../tensor.h"
#include "attention_config.h"

namespace dualattn {
namespace ml {
namespace nn {

// Outcome class of one fast-path attempt
enum class FastPathStatus {
    SUCCESS,      // output is valid and returned as is
    UNSUPPORTED,  // the kernel cannot serve this input; fall back to manual
    FATAL         // the kernel failed for reasons unrelated to the input
};

enum class FastPathFailure {
    NONE,
    DTYPE,     // numeric precision not handled by the kernel
    DEVICE,    // tensors live somewhere the kernel cannot read
    SHAPE,     // axis sizes outside the kernel's envelope
    MASK,      // mask layout the kernel cannot consume
    CONFIG,    // option the kernel does not implement (e.g. dropout)
    RESOURCE,  // allocation or workspace failure
    RUNTIME    // kernel or graph execution fault
};

std::string fastPathStatusToString(FastPathStatus status);
std::string fastPathFailureToString(FastPathFailure reason);

// Classified result returned by a fast path instead of throwing
struct FastPathResult {
    FastPathStatus status = FastPathStatus::UNSUPPORTED;
    FastPathFailure reason = FastPathFailure::NONE;
    std::string message;
    Tensor output;

    static FastPathResult success(Tensor output);
    static FastPathResult unsupported(FastPathFailure reason, std::string message);
    static FastPathResult fatal(FastPathFailure reason, std::string message);

    bool ok() const { return status == FastPathStatus::SUCCESS; }
};

// Hardware or runtime specific attention kernel. Implementations must not
// throw for inputs they cannot serve; they return UNSUPPORTED instead, and
// FATAL for resource or execution faults. run() may be called concurrently
// and must not mutate shared state.
class FastAttention {
public:
    virtual ~FastAttention() = default;

    virtual FastPathResult run(Context& ctx, const Tensor& query, const Tensor& key,
                               const Tensor& value,
                               const AttentionConfig& config) const = 0;

    virtual std::string getName() const = 0;
};

// Raised by the dispatcher when its fast path reports a FATAL result
class FastPathFatalError : public std::runtime_error {
public:
    FastPathFatalError(const std::string& fastPath, FastPathFailure reason,
                       const std::string& message);

    const std::string& fastPathName() const { return fastPath_; }
    FastPathFailure reason() const { return reason_; }

private:
    std::string fastPath_;
    FastPathFailure reason_;
};

} // namespace nn
} // namespace ml
} // namespace dualattn

#endif // DUALATTN_ML_NN_FAST_ATTENTION_H
