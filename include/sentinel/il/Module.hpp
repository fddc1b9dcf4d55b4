//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/sentinel/il/Module.hpp
// Purpose: Public entry point for IL module types.
// Key invariants: None.
// Ownership/Lifetime: Header-only forwarding.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Module.hpp"
