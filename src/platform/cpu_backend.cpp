/**
 * CPU Backend Implementation
 *
 * Emulation backend for testing and development.
 * Provides the same interface as the GPU backend but evaluates the kernels
 * on the host.
 *
 * Features:
 * - Thread pool splitting each dispatch across grid rows
 * - Front/back grid swap after every dispatch
 * - Compatible with all platforms
 */

#include "backend.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstring>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <unordered_map>

#include "../gpu/kernel_math.hpp"

namespace tritpow {
namespace platform {

/**
 * Simple thread pool for row-parallel kernel evaluation.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads) : stop_(false), pending_(0) {
        for (size_t i = 0; i < num_threads; i++) {
            workers_.emplace_back([this] {
                while (true) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(mutex_);
                        cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                        if (stop_ && tasks_.empty()) return;
                        task = std::move(tasks_.front());
                        tasks_.pop();
                    }
                    task();
                    {
                        std::lock_guard<std::mutex> lock(mutex_);
                        pending_--;
                    }
                    done_cv_.notify_all();
                }
            });
        }
    }

    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    size_t size() const { return workers_.size(); }

    template<typename F>
    void enqueue(F&& f) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            tasks_.emplace(std::forward<F>(f));
            pending_++;
        }
        cv_.notify_one();
    }

    /**
     * Block until every enqueued task has finished running.
     */
    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        done_cv_.wait(lock, [this] { return pending_ == 0; });
    }

private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable done_cv_;
    bool stop_;
    size_t pending_;
};

/**
 * Registered program
 */
struct CPUProgram {
    gpu::KernelId kernel;
    std::vector<std::string> uniform_names;
    int64_t uniform_value = 0;   // uniforms keep their last bound value
};

/**
 * CPU Backend Implementation
 */
class CPUBackend : public IComputeBackend {
public:
    explicit CPUBackend(size_t num_threads) : requested_threads_(num_threads) {}
    ~CPUBackend() override { shutdown(); }

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

        num_threads_ = requested_threads_;
        if (num_threads_ == 0) num_threads_ = std::thread::hardware_concurrency();
        if (num_threads_ == 0) num_threads_ = 4;  // Fallback
        num_threads_ = std::min<size_t>(num_threads_, static_cast<size_t>(spec.height));

        dims_.x = spec.width;
        dims_.y = spec.height;

        size_t cells = static_cast<size_t>(dims_.x) * dims_.y;
        try {
            front_.assign(cells, Texel{0, 0, 0, 0});
            back_.assign(cells, Texel{0, 0, 0, 0});
        } catch (const std::bad_alloc&) {
            front_.clear();
            back_.clear();
            return {ErrorCode::OutOfMemory, "Failed to allocate search grid"};
        }

        if (num_threads_ > 1) {
            thread_pool_ = std::make_unique<ThreadPool>(num_threads_);
        }

        initialized_ = true;
        return {ErrorCode::Success, ""};
    }

    void shutdown() override {
        if (!initialized_) return;

        thread_pool_.reset();
        programs_.clear();
        front_.clear();
        back_.clear();
        front_.shrink_to_fit();
        back_.shrink_to_fit();
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

        programs_[name] = CPUProgram{kernel, uniform_names, 0};
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

        CPUProgram& program = it->second;
        for (const auto& uniform : uniforms) {
            if (std::find(program.uniform_names.begin(), program.uniform_names.end(),
                          uniform.name) == program.uniform_names.end()) {
                return {ErrorCode::InvalidArgument,
                        "Program '" + name + "' has no uniform '" + uniform.name + "'"};
            }
            program.uniform_value = uniform.value;
        }

        for (int pass = 0; pass < repeat; pass++) {
            dispatch(program.kernel, program.uniform_value);
            front_.swap(back_);
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
        if (data.size() > front_.size() * TEXEL_SIZE) {
            return {ErrorCode::InvalidArgument, "Size exceeds grid capacity"};
        }
        std::memcpy(front_.data(), data.data(), data.size() * sizeof(int32_t));
        return {ErrorCode::Success, ""};
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
        for (int row = 0; row < height; row++) {
            const Texel* src = front_.data() + static_cast<size_t>(y + row) * dims_.x + x;
            std::memcpy(out.data() + static_cast<size_t>(row) * width * TEXEL_SIZE, src,
                        static_cast<size_t>(width) * sizeof(Texel));
        }
        return {ErrorCode::Success, ""};
    }

    GridDims get_dimensions() const override { return dims_; }

    std::string get_backend_name() const override { return "CPU"; }

private:
    void dispatch(gpu::KernelId kernel, int64_t uniform) {
        const gpu::GridView in{front_.data(), dims_.x, dims_.y};
        Texel* out = back_.data();

        auto run_rows = [&in, out, kernel, uniform](int row_begin, int row_end) {
            for (int y = row_begin; y < row_end; y++) {
                Texel* row = out + static_cast<size_t>(y) * in.width;
                for (int x = 0; x < in.width; x++) {
                    row[x] = evaluate(kernel, in, x, y, uniform);
                }
            }
        };

        if (!thread_pool_) {
            run_rows(0, dims_.y);
            return;
        }

        int chunks = static_cast<int>(thread_pool_->size());
        int rows_per_chunk = (dims_.y + chunks - 1) / chunks;
        for (int begin = 0; begin < dims_.y; begin += rows_per_chunk) {
            int end = std::min(dims_.y, begin + rows_per_chunk);
            thread_pool_->enqueue([run_rows, begin, end] { run_rows(begin, end); });
        }
        thread_pool_->wait();
    }

    static Texel evaluate(gpu::KernelId kernel, const gpu::GridView& in, int x, int y,
                          int64_t uniform) {
        switch (kernel) {
            case gpu::KernelId::Initialize:  return gpu::init_cell(in, x, y, uniform);
            case gpu::KernelId::Increment:   return gpu::increment_cell(in, x, y);
            case gpu::KernelId::Twist:       return gpu::twist_cell(in, x, y);
            case gpu::KernelId::Check:       return gpu::check_cell(in, x, y, uniform);
            case gpu::KernelId::ColumnCheck: return gpu::column_check_cell(in, x, y);
            case gpu::KernelId::Finalize:    return gpu::finalize_cell(in, x, y);
        }
        return in.at(x, y);
    }

    bool initialized_ = false;
    size_t requested_threads_ = 0;
    size_t num_threads_ = 0;
    GridDims dims_;

    std::vector<Texel> front_;
    std::vector<Texel> back_;

    std::unordered_map<std::string, CPUProgram> programs_;
    std::unique_ptr<ThreadPool> thread_pool_;
};

// Factory function
std::unique_ptr<IComputeBackend> create_cpu_backend(size_t num_threads) {
    return std::make_unique<CPUBackend>(num_threads);
}

}  // namespace platform
}  // namespace tritpow
