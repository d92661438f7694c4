//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/perc/driver.hpp
// Purpose: Compile one Per source file and write the requested artefacts.
// Key invariants: Either every requested artefact is written or none is.
// Ownership/Lifetime: Back ends share the lowered module read-only.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Module.hpp"
#include "support/diag_expected.hpp"
#include "tools/perc/cli.hpp"

#include <cstdint>
#include <ostream>
#include <vector>

namespace perc::tools
{

/// @brief Run the back end for @p target over @p module.
perc::support::Expected<std::vector<uint8_t>> buildArtifact(Target target,
                                                            const perc::ir::Module &module);

/// @brief Run the whole pipeline described by @p opts.
/// @return Process exit status: 0 on success, 1 on any error.
int runDriver(const DriverOptions &opts, std::ostream &out, std::ostream &err);

} // namespace perc::tools
