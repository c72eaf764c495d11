/**
 * tritpow Compute Backend Abstraction
 *
 * Provides a unified interface for running the search grid on:
 * - NVIDIA CUDA (Linux/Windows)
 * - CPU emulation (testing/development, hosts without a GPU)
 *
 * Architecture:
 *   PowEngine -> IComputeBackend -> Backend Implementation
 *
 * A backend owns one 2-D grid of 4-channel int32 texels, held twice. Each
 * dispatch of a pass reads the front grid and writes the back grid, then the
 * two swap, so repeated passes never read a cell they are writing.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "../core/types.hpp"
#include "../gpu/kernels.hpp"

namespace tritpow {
namespace platform {

/**
 * Backend error codes
 */
enum class ErrorCode {
    Success = 0,
    OutOfMemory,
    InvalidDevice,
    InvalidArgument,
    NotSupported,
    NotInitialized,
    DeviceLost,
    KernelFailed,
    SyncFailed,
    Cancelled,
    Unknown
};

const char* error_code_name(ErrorCode code);

/**
 * Backend result wrapper
 */
struct Result {
    ErrorCode code;
    std::string message;

    bool ok() const { return code == ErrorCode::Success; }
    operator bool() const { return ok(); }
};

/**
 * Grid allocation request
 */
struct GridSpec {
    int width = GRID_WIDTH;
    int height = 1;
    int texel_size = TEXEL_SIZE;
};

/**
 * Scalar uniform bound to a named kernel parameter
 */
struct Uniform {
    std::string name;
    int64_t value;
};

/**
 * Compute Backend Interface
 *
 * Pure virtual interface implemented by each backend. Not thread-safe: a
 * backend is driven by exactly one engine.
 */
class IComputeBackend {
public:
    virtual ~IComputeBackend() = default;

    // Lifecycle
    virtual Result initialize(const GridSpec& spec) = 0;
    virtual void shutdown() = 0;
    virtual bool is_initialized() const = 0;

    // Programs
    virtual Result add_program(const std::string& name, gpu::KernelId kernel,
                               const std::vector<std::string>& uniform_names) = 0;
    virtual Result run_program(const std::string& name, int repeat,
                               const std::vector<Uniform>& uniforms = {}) = 0;

    // Transfers (flat int32, TEXEL_SIZE per cell, row-major)
    virtual Result write_data(const std::vector<int32_t>& data) = 0;
    virtual Result read_data(int x, int y, int width, int height, std::vector<int32_t>& out) = 0;

    // Info
    virtual GridDims get_dimensions() const = 0;
    virtual std::string get_backend_name() const = 0;
};

/**
 * Available backend implementations
 */
enum class BackendKind {
    CPU,
    CUDA
};

/**
 * Parse "cpu" / "cuda". Returns false on an unknown name.
 */
bool parse_backend_kind(const std::string& name, BackendKind& kind);

/**
 * CPU emulation backend. `num_threads == 0` uses hardware concurrency.
 */
std::unique_ptr<IComputeBackend> create_cpu_backend(size_t num_threads = 0);

#ifdef TRITPOW_USE_CUDA
/**
 * CUDA backend on the given device.
 */
std::unique_ptr<IComputeBackend> create_cuda_backend(int device_id = 0);
#endif

/**
 * Create a backend by kind. Returns nullptr if the kind was not compiled in.
 */
std::unique_ptr<IComputeBackend> create_backend(BackendKind kind, size_t cpu_threads = 0,
                                                int cuda_device = 0);

}  // namespace platform
}  // namespace tritpow
