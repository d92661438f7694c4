//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/perc/version.hpp
// Purpose: Version constants of the perc toolchain and its output formats.
// Key invariants: PERC_NVM_VERSION matches the version field written into
//                 NVM bytecode headers.
// Ownership/Lifetime: N/A.
//
//===----------------------------------------------------------------------===//

#pragma once

#define PERC_VERSION_MAJOR 0
#define PERC_VERSION_MINOR 1
#define PERC_VERSION_PATCH 0
#define PERC_VERSION_STR "0.1.0"

#define PERC_NVM_VERSION 1
