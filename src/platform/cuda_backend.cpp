/**
 * CUDA Backend Implementation
 *
 * Holds the front/back grids in device memory and launches the passes from
 * search_kernels.cu. Swapping is a pointer swap; nothing is copied between
 * dispatches.
 */

#include "backend.hpp"

#ifdef TRITPOW_USE_CUDA

#include <algorithm>
#include <unordered_map>

#include <cuda_runtime.h>

#include "../gpu/search_kernels.hpp"

namespace tritpow {
namespace platform {

namespace {

Result cuda_result(cudaError_t err, ErrorCode code, const std::string& what) {
    if (err == cudaSuccess) {
        return {ErrorCode::Success, ""};
    }
    return {code, what + ": " + cudaGetErrorString(err)};
}

}  // namespace

struct CUDAProgram {
    gpu::KernelId kernel;
    std::vector<std::string> uniform_names;
    int64_t uniform_value = 0;
};

class CUDABackend : public IComputeBackend {
public:
    explicit CUDABackend(int device_id) : device_id_(device_id) {}
    ~CUDABackend() override { shutdown(); }

    Result initialize(const GridSpec& spec) override {
        if (initialized_) {
            return {ErrorCode::Success, "Already initialized"};
        }
        if (spec.width < GRID_WIDTH || spec.height < 1) {
            return {ErrorCode::InvalidArgument,
                    "Grid must be at least " + std::to_string(GRID_WIDTH) + "x1"};
        }
        if (spec.texel_size != TEXEL_SIZE) {
            return {ErrorCode::NotSupported, "Only 4-channel texels are supported"};
        }

        int device_count = 0;
        cudaError_t err = cudaGetDeviceCount(&device_count);
        if (err != cudaSuccess || device_id_ < 0 || device_id_ >= device_count) {
            return {ErrorCode::InvalidDevice, "CUDA device " + std::to_string(device_id_) + " not available"};
        }

        err = cudaSetDevice(device_id_);
        if (err != cudaSuccess) {
            return cuda_result(err, ErrorCode::InvalidDevice, "Failed to set CUDA device");
        }

        err = cudaStreamCreate(&stream_);
        if (err != cudaSuccess) {
            return cuda_result(err, ErrorCode::Unknown, "Failed to create CUDA stream");
        }

        dims_.x = spec.width;
        dims_.y = spec.height;
        size_t bytes = static_cast<size_t>(dims_.x) * dims_.y * sizeof(Texel);

        err = cudaMalloc(&d_front_, bytes);
        if (err == cudaSuccess) err = cudaMalloc(&d_back_, bytes);
        if (err == cudaSuccess) err = cudaMemset(d_front_, 0, bytes);
        if (err == cudaSuccess) err = cudaMemset(d_back_, 0, bytes);
        if (err != cudaSuccess) {
            release();
            return cuda_result(err, ErrorCode::OutOfMemory, "Failed to allocate search grid");
        }

        initialized_ = true;
        return {ErrorCode::Success, ""};
    }

    void shutdown() override {
        if (!initialized_) return;
        release();
        programs_.clear();
        dims_ = GridDims{};
        initialized_ = false;
    }

    bool is_initialized() const override { return initialized_; }

    Result add_program(const std::string& name, gpu::KernelId kernel,
                       const std::vector<std::string>& uniform_names) override {
        if (!initialized_) {
            return {ErrorCode::NotInitialized, "Backend not initialized"};
        }
        if (name.empty()) {
            return {ErrorCode::InvalidArgument, "Program name is empty"};
        }
        if (uniform_names.size() > 1) {
            return {ErrorCode::NotSupported, "Program '" + name + "' declares more than one uniform"};
        }
        programs_[name] = CUDAProgram{kernel, uniform_names, 0};
        return {ErrorCode::Success, ""};
    }

    Result run_program(const std::string& name, int repeat,
                       const std::vector<Uniform>& uniforms) override {
        if (!initialized_) {
            return {ErrorCode::NotInitialized, "Backend not initialized"};
        }

        auto it = programs_.find(name);
        if (it == programs_.end()) {
            return {ErrorCode::InvalidArgument, "Unknown program: " + name};
        }
        if (repeat < 0) {
            return {ErrorCode::InvalidArgument, "Negative repeat count"};
        }

        CUDAProgram& program = it->second;
        for (const auto& uniform : uniforms) {
            if (std::find(program.uniform_names.begin(), program.uniform_names.end(),
                          uniform.name) == program.uniform_names.end()) {
                return {ErrorCode::InvalidArgument,
                        "Program '" + name + "' has no uniform '" + uniform.name + "'"};
            }
            program.uniform_value = uniform.value;
        }

        for (int pass = 0; pass < repeat; pass++) {
            cudaError_t err = gpu::search_pass_launch(static_cast<int>(program.kernel), d_front_, d_back_,
                                                      dims_.x, dims_.y, program.uniform_value, stream_);
            if (err != cudaSuccess) {
                return cuda_result(err, ErrorCode::KernelFailed, "Pass '" + name + "' failed");
            }
            std::swap(d_front_, d_back_);
        }
        return {ErrorCode::Success, ""};
    }

    Result write_data(const std::vector<int32_t>& data) override {
        if (!initialized_) {
            return {ErrorCode::NotInitialized, "Backend not initialized"};
        }
        if (data.size() % TEXEL_SIZE != 0) {
            return {ErrorCode::InvalidArgument, "Data is not a whole number of texels"};
        }
        if (data.size() > static_cast<size_t>(dims_.x) * dims_.y * TEXEL_SIZE) {
            return {ErrorCode::InvalidArgument, "Size exceeds grid capacity"};
        }

        cudaError_t err = cudaMemcpyAsync(d_front_, data.data(), data.size() * sizeof(int32_t),
                                          cudaMemcpyHostToDevice, stream_);
        if (err == cudaSuccess) err = cudaStreamSynchronize(stream_);
        return cuda_result(err, ErrorCode::DeviceLost, "Grid upload failed");
    }

    Result read_data(int x, int y, int width, int height, std::vector<int32_t>& out) override {
        if (!initialized_) {
            return {ErrorCode::NotInitialized, "Backend not initialized"};
        }
        if (x < 0 || y < 0 || width <= 0 || height <= 0 ||
            x + width > dims_.x || y + height > dims_.y) {
            return {ErrorCode::InvalidArgument, "Read region outside the grid"};
        }

        out.resize(static_cast<size_t>(width) * height * TEXEL_SIZE);
        const Texel* src = d_front_ + static_cast<size_t>(y) * dims_.x + x;
        cudaError_t err = cudaMemcpy2DAsync(out.data(), width * sizeof(Texel),
                                            src, dims_.x * sizeof(Texel),
                                            width * sizeof(Texel), height,
                                            cudaMemcpyDeviceToHost, stream_);
        if (err == cudaSuccess) err = cudaStreamSynchronize(stream_);
        return cuda_result(err, ErrorCode::SyncFailed, "Grid readback failed");
    }

    GridDims get_dimensions() const override { return dims_; }

    std::string get_backend_name() const override { return "CUDA"; }

private:
    void release() {
        if (d_front_) cudaFree(d_front_);
        if (d_back_) cudaFree(d_back_);
        if (stream_) cudaStreamDestroy(stream_);
        d_front_ = nullptr;
        d_back_ = nullptr;
        stream_ = nullptr;
    }

    bool initialized_ = false;
    int device_id_;
    GridDims dims_;

    cudaStream_t stream_ = nullptr;
    Texel* d_front_ = nullptr;
    Texel* d_back_ = nullptr;

    std::unordered_map<std::string, CUDAProgram> programs_;
};

std::unique_ptr<IComputeBackend> create_cuda_backend(int device_id) {
    return std::make_unique<CUDABackend>(device_id);
}

}  // namespace platform
}  // namespace tritpow

#endif  // TRITPOW_USE_CUDA
