/**
 * Search Grid Kernel Set
 *
 * Names, identifiers and uniforms of the passes that make up one search
 * round:
 *
 *   init (once per job) -> [increment -> twist x81 -> check -> col_check]*
 *                       -> finalize (once, on success)
 */

#pragma once

#include <string>
#include <vector>

namespace tritpow {

namespace platform {
class IComputeBackend;
struct Result;
}

namespace gpu {

enum class KernelId : int {
    Initialize = 0,
    Increment,
    Twist,
    Check,
    ColumnCheck,
    Finalize
};

/**
 * Registration record for one pass.
 */
struct KernelProgram {
    const char* name;
    KernelId id;
    std::vector<std::string> uniforms;
};

// Program names
constexpr const char* PROGRAM_INIT = "init";
constexpr const char* PROGRAM_INCREMENT = "increment";
constexpr const char* PROGRAM_TWIST = "twist";
constexpr const char* PROGRAM_CHECK = "check";
constexpr const char* PROGRAM_COL_CHECK = "col_check";
constexpr const char* PROGRAM_FINALIZE = "finalize";

// Uniform names
constexpr const char* UNIFORM_OFFSET = "gr_offset";
constexpr const char* UNIFORM_MIN_WEIGHT = "min_weight_magnitude";

/**
 * All passes, in registration order.
 */
const std::vector<KernelProgram>& kernel_programs();

/**
 * Register every pass with a backend. Stops at the first failure.
 */
platform::Result register_kernels(platform::IComputeBackend& backend);

}  // namespace gpu
}  // namespace tritpow
