#include "cpu_backend.h"
#include "../../core/logger.h"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <new>
#include <stdexcept>
#include <string>

#ifdef _WIN32
#include <malloc.h>
#endif

namespace dualattn {
namespace ml {

CPUBackend::CPUBackend(size_t alignment)
    : alignment_(alignment), initialized_(false), bytesInUse_(0),
      peakBytes_(0) {
    // posix_memalign needs a power of two that is a multiple of sizeof(void*)
    if (alignment_ < sizeof(void*) || (alignment_ & (alignment_ - 1)) != 0) {
        throw std::invalid_argument("CPUBackend: alignment must be a power of two >= " +
                                    std::to_string(sizeof(void*)));
    }
}

CPUBackend::~CPUBackend() {
    std::lock_guard<std::mutex> lock(allocMutex_);
    if (!blocks_.empty()) {
        core::Logger::getInstance().warning(
            "CPU Backend destroyed with " + std::to_string(blocks_.size()) +
            " live block(s), " + std::to_string(bytesInUse_) + " bytes");
    }
    for (auto& block : blocks_) {
        alignedFree(block.first);
    }
}

bool CPUBackend::initialize() {
    if (!initialized_) {
        initialized_ = true;
        core::Logger::getInstance().debug("CPU Backend initialized, alignment " +
                                          std::to_string(alignment_));
    }
    return true;
}

void* CPUBackend::allocate(size_t bytes) {
    if (bytes == 0) {
        return nullptr;
    }
    void* ptr = alignedAlloc(bytes);
    if (!ptr) {
        throw std::bad_alloc();
    }
    std::lock_guard<std::mutex> lock(allocMutex_);
    blocks_[ptr] = bytes;
    bytesInUse_ += bytes;
    peakBytes_ = std::max(peakBytes_, bytesInUse_);
    return ptr;
}

void CPUBackend::deallocate(void* ptr) {
    if (!ptr) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(allocMutex_);
        auto it = blocks_.find(ptr);
        if (it == blocks_.end()) {
            core::Logger::getInstance().error(
                "CPUBackend::deallocate: pointer not owned by this backend");
            return;
        }
        bytesInUse_ -= it->second;
        blocks_.erase(it);
    }
    alignedFree(ptr);
}

void CPUBackend::copyToDevice(void* dst, const void* src, size_t bytes) {
    std::memcpy(dst, src, bytes);
}

void CPUBackend::copyFromDevice(void* dst, const void* src, size_t bytes) {
    std::memcpy(dst, src, bytes);
}

void CPUBackend::copyDeviceToDevice(void* dst, const void* src, size_t bytes) {
    std::memcpy(dst, src, bytes);
}

size_t CPUBackend::bytesInUse() const {
    std::lock_guard<std::mutex> lock(allocMutex_);
    return bytesInUse_;
}

size_t CPUBackend::peakBytes() const {
    std::lock_guard<std::mutex> lock(allocMutex_);
    return peakBytes_;
}

size_t CPUBackend::liveBlocks() const {
    std::lock_guard<std::mutex> lock(allocMutex_);
    return blocks_.size();
}

void* CPUBackend::alignedAlloc(size_t bytes) {
#ifdef _WIN32
    return _aligned_malloc(bytes, alignment_);
#else
    void* ptr = nullptr;
    if (posix_memalign(&ptr, alignment_, bytes) != 0) {
        return nullptr;
    }
    return ptr;
#endif
}

void CPUBackend::alignedFree(void* ptr) {
#ifdef _WIN32
    _aligned_free(ptr);
#else
    std::free(ptr);
#endif
}

} // namespace ml
} // namespace dualattn
