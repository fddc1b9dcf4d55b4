//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/sentinel/il/Verify.hpp
// Purpose: Public entry point for the IL verifier.
// Key invariants: None.
// Ownership/Lifetime: Header-only forwarding.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/verify/Verifier.hpp"
