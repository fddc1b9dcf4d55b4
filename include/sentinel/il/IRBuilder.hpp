//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/sentinel/il/IRBuilder.hpp
// Purpose: Public entry point for the IL builder.
// Key invariants: None.
// Ownership/Lifetime: Header-only forwarding.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/build/IRBuilder.hpp"
