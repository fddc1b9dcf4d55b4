//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/fwd.hpp
// Purpose: Forward declarations for IL core types.
//
//===----------------------------------------------------------------------===//

#pragma once

namespace sentinel::il::core
{
struct Module;
struct Function;
struct BasicBlock;
struct Instr;
struct Value;
} // namespace sentinel::il::core
