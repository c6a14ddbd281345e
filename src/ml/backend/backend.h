#ifndef DUALATTN_ML_BACKEND_H
#define DUALATTN_ML_BACKEND_H

#include <cstddef>
#include <string>

namespace dualattn {
namespace ml {

// Where a backend's memory lives
enum class DeviceType {
    CPU,
    CUDA,
    METAL,
    OPENCL,
    VULKAN,
    GGML
};

// Memory provider for tensors. A tensor allocated through a backend keeps a
// pointer to it, so the backend must outlive every such tensor.
//
// Attention operators only read tensor memory directly when isHostMemory()
// is true; otherwise the fast path declines with DEVICE and the manual path
// rejects the input.
class Backend {
public:
    virtual ~Backend() = default;

    virtual bool initialize() = 0;

    // Memory management
    virtual void* allocate(size_t bytes) = 0;
    virtual void deallocate(void* ptr) = 0;
    virtual void copyToDevice(void* dst, const void* src, size_t bytes) = 0;
    virtual void copyFromDevice(void* dst, const void* src, size_t bytes) = 0;
    virtual void copyDeviceToDevice(void* dst, const void* src, size_t bytes) = 0;

    // Wait for queued work; a no-op for synchronous backends
    virtual void synchronize() = 0;

    virtual DeviceType getType() const = 0;
    virtual std::string getName() const = 0;

    // True when tensor memory is directly addressable from the host
    virtual bool isHostMemory() const { return getType() == DeviceType::CPU; }
};

std::string deviceTypeToString(DeviceType type);
// Case-insensitive; throws std::invalid_argument for unknown names
DeviceType stringToDeviceType(const std::string& typeStr);

} // namespace ml
} // namespace dualattn

#endif // DUALATTN_ML_BACKEND_H
