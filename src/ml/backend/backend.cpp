#include "backend.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace dualattn {
namespace ml {

std::string deviceTypeToString(DeviceType type) {
    switch (type) {
        case DeviceType::CPU: return "CPU";
        case DeviceType::CUDA: return "CUDA";
        case DeviceType::METAL: return "METAL";
        case DeviceType::OPENCL: return "OPENCL";
        case DeviceType::VULKAN: return "VULKAN";
        case DeviceType::GGML: return "GGML";
        default: return "UNKNOWN";
    }
}

DeviceType stringToDeviceType(const std::string& typeStr) {
    std::string upper(typeStr);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    static const std::pair<const char*, DeviceType> kNames[] = {
        {"CPU", DeviceType::CPU},       {"CUDA", DeviceType::CUDA},
        {"METAL", DeviceType::METAL},   {"OPENCL", DeviceType::OPENCL},
        {"VULKAN", DeviceType::VULKAN}, {"GGML", DeviceType::GGML},
    };
    for (const auto& entry : kNames) {
        if (upper == entry.first) {
            return entry.second;
        }
    }
    throw std::invalid_argument("Unknown device type: " + typeStr);
}

} // namespace ml
} // namespace dualattn
