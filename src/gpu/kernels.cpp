/**
 * Search Grid Kernel Set - registration
 */

#include "kernels.hpp"

#include "../platform/backend.hpp"

namespace tritpow {
namespace gpu {

const std::vector<KernelProgram>& kernel_programs() {
    static const std::vector<KernelProgram> programs = {
        {PROGRAM_INIT, KernelId::Initialize, {UNIFORM_OFFSET}},
        {PROGRAM_INCREMENT, KernelId::Increment, {}},
        {PROGRAM_TWIST, KernelId::Twist, {}},
        {PROGRAM_CHECK, KernelId::Check, {UNIFORM_MIN_WEIGHT}},
        {PROGRAM_COL_CHECK, KernelId::ColumnCheck, {}},
        {PROGRAM_FINALIZE, KernelId::Finalize, {}},
    };
    return programs;
}

platform::Result register_kernels(platform::IComputeBackend& backend) {
    for (const auto& program : kernel_programs()) {
        platform::Result result = backend.add_program(program.name, program.id, program.uniforms);
        if (!result) {
            return result;
        }
    }
    return {platform::ErrorCode::Success, ""};
}

}  // namespace gpu
}  // namespace tritpow
