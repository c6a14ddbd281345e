#ifndef DUALATTN_ML_CPU_BACKEND_H
#define DUALATTN_ML_CPU_BACKEND_H

#include "backend.h"

#include <mutex>
#include <unordered_map>

namespace dualattn {
namespace ml {

// Host backend handing out aligned blocks and keeping a live-byte count,
// which makes per-call buffer ownership observable.
class CPUBackend : public Backend {
public:
    explicit CPUBackend(size_t alignment = 64);
    ~CPUBackend() override;

    CPUBackend(const CPUBackend&) = delete;
    CPUBackend& operator=(const CPUBackend&) = delete;

    bool initialize() override;

    void* allocate(size_t bytes) override;
    void deallocate(void* ptr) override;
    void copyToDevice(void* dst, const void* src, size_t bytes) override;
    void copyFromDevice(void* dst, const void* src, size_t bytes) override;
    void copyDeviceToDevice(void* dst, const void* src, size_t bytes) override;

    void synchronize() override {}

    DeviceType getType() const override { return DeviceType::CPU; }
    std::string getName() const override { return "CPU Backend"; }

    size_t alignment() const { return alignment_; }

    // Allocation accounting
    size_t bytesInUse() const;
    size_t peakBytes() const;
    size_t liveBlocks() const;

private:
    size_t alignment_;
    bool initialized_;

    mutable std::mutex allocMutex_;
    std::unordered_map<void*, size_t> blocks_;
    size_t bytesInUse_;
    size_t peakBytes_;

    void* alignedAlloc(size_t bytes);
    void alignedFree(void* ptr);
};

} // namespace ml
} // namespace dualattn

#endif // DUALATTN_ML_CPU_BACKEND_H
