/**
 * Search Grid CUDA Interface
 *
 * Declares the device launchers for the search passes.
 * Implemented in search_kernels.cu.
 */

#pragma once

#include <cstdint>

#include "../core/types.hpp"

#include <cuda_runtime.h>

namespace tritpow {
namespace gpu {

extern "C" {

/**
 * Run one pass over the whole grid.
 *
 * @param kernel   KernelId value of the pass
 * @param d_in     Device: front grid (read)
 * @param d_out    Device: back grid (written)
 * @param width    Grid width in cells
 * @param height   Grid height in cells
 * @param uniform  Offset for init, minimum weight magnitude for check
 * @param stream   CUDA stream
 *
 * @return cudaSuccess or error
 */
cudaError_t search_pass_launch(
    int kernel,
    const Texel* d_in,
    Texel* d_out,
    int width,
    int height,
    int64_t uniform,
    cudaStream_t stream
);

}  // extern "C"

}  // namespace gpu
}  // namespace tritpow
