//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/sentinel/pass/OverflowGuard.hpp
// Purpose: Public entry point for the signed overflow guard pass.
// Key invariants: None.
// Ownership/Lifetime: Header-only forwarding.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/transform/overflow/OverflowGuard.hpp"
