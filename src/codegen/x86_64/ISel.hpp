//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/ISel.hpp
// Purpose: Frame-slot instruction selection from the IR to x86-64 machine code.
// Key invariants: Every virtual slot and frame local lives at a fixed
//                 [rbp - off]; instructions load operands into scratch
//                 registers, compute, and store the result back.  Locals come
//                 first (array elements at increasing addresses), then slots.
//                 The frame size is a multiple of 16.
// Ownership/Lifetime: Pure functions; the IR module is only read.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "codegen/x86_64/MachineCode.hpp"
#include "codegen/x86_64/TargetAbi.hpp"
#include "ir/Module.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <vector>

namespace perc::codegen::x64
{

/// \brief Largest frame, in bytes, the selector accepts.
inline constexpr int64_t kMaxFrameBytes = 0x7FFF0000;

/// \brief rbp-relative placement of a function's locals and slots.
struct FrameLayout
{
    std::vector<int32_t> localDisp;
    std::vector<int32_t> slotDisp;

    /// \brief Bytes reserved below rbp; a multiple of 16.
    uint32_t frameSize = 0;
};

/// \brief Compute the frame of @p fn.
/// \return CodegenError when the frame exceeds kMaxFrameBytes.
perc::support::Expected<FrameLayout> layoutFrame(const perc::ir::Function &fn);

/// \brief Select code for every function of @p module plus the entry stub
///        and the stdio helper routines.
perc::support::Expected<MachineCode> selectModule(const perc::ir::Module &module,
                                                  const TargetAbi &abi);

} // namespace perc::codegen::x64
