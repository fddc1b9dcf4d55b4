//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/sentinel/il/IO.hpp
// Purpose: Public entry point for IL serialization.
// Key invariants: None.
// Ownership/Lifetime: Header-only forwarding.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/io/Serializer.hpp"
