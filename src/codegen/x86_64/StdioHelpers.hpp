//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/x86_64/StdioHelpers.hpp
// Purpose: Machine-code routines implementing the stdio intrinsics.
// Key invariants: Helpers take their argument in rdi, return in rax, keep
//                 rsp 16-byte aligned around every ABI hook and clobber only
//                 the scratch registers.  ReadLine returns the address of a
//                 single static string record in the zero-filled data area.
// Ownership/Lifetime: Stateless.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "codegen/x86_64/Encoder.hpp"
#include "codegen/x86_64/TargetAbi.hpp"

#include <cstdint>

namespace perc::codegen::x64
{

/// \brief Entry labels of the helper routines.
struct StdioHelpers
{
    Label printI64;  ///< rdi = value; decimal, no newline
    Label printStr;  ///< rdi = string record
    Label printChar; ///< rdi = value; writes the low byte
    Label readInt;   ///< rax = integer or 0 at end of input
    Label readChar;  ///< rax = byte or -1 at end of input
    Label readLine;  ///< rax = string record of the line read
};

/// \brief Bytes of zero-filled storage the helpers need (the line record).
uint32_t stdioHelpersBssSize();

/// \brief Allocate the helper labels so calls can refer forward.
StdioHelpers declareStdioHelpers(X64Encoder &enc);

/// \brief Emit the helper bodies.
/// \param lineRecordOffset Data offset of the ReadLine record.
void emitStdioHelpers(X64Encoder &enc,
                      const TargetAbi &abi,
                      const StdioHelpers &helpers,
                      uint32_t lineRecordOffset);

} // namespace perc::codegen::x64
