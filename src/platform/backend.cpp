/**
 * Compute Backend - shared helpers and factory
 */

#include "backend.hpp"

#include <algorithm>
#include <cctype>

namespace tritpow {
namespace platform {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:         return "Success";
        case ErrorCode::OutOfMemory:     return "OutOfMemory";
        case ErrorCode::InvalidDevice:   return "InvalidDevice";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::NotSupported:    return "NotSupported";
        case ErrorCode::NotInitialized:  return "NotInitialized";
        case ErrorCode::DeviceLost:      return "DeviceLost";
        case ErrorCode::KernelFailed:    return "KernelFailed";
        case ErrorCode::SyncFailed:      return "SyncFailed";
        case ErrorCode::Cancelled:       return "Cancelled";
        default: return "Unknown";
    }
}

bool parse_backend_kind(const std::string& name, BackendKind& kind) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "cpu") {
        kind = BackendKind::CPU;
        return true;
    }
    if (lower == "cuda") {
        kind = BackendKind::CUDA;
        return true;
    }
    return false;
}

std::unique_ptr<IComputeBackend> create_backend(BackendKind kind, size_t cpu_threads,
                                                int cuda_device) {
    switch (kind) {
        case BackendKind::CPU:
            return create_cpu_backend(cpu_threads);
        case BackendKind::CUDA:
#ifdef TRITPOW_USE_CUDA
            return create_cuda_backend(cuda_device);
#else
            (void)cuda_device;
            return nullptr;
#endif
    }
    return nullptr;
}

}  // namespace platform
}  // namespace tritpow
