//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/sentinel/version.hpp
// Purpose: Expose the project and IL version numbers.
// Key invariants: The IL version string matches the header printed by the
//                 serializer.
// Ownership/Lifetime: Header-only constants.
//
//===----------------------------------------------------------------------===//

#pragma once

#define SENTINEL_VERSION_MAJOR 0
#define SENTINEL_VERSION_MINOR 1
#define SENTINEL_VERSION_PATCH 0
#define SENTINEL_VERSION_STR "0.1.0"

#define SENTINEL_IL_VERSION_STR "0.1"
