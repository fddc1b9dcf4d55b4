//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/common/VmFixture.hpp
// Purpose: Shared VM execution helpers for tests.
// Key invariants: runMainInChild() isolates the VM in a forked process so a
//                 trapping program cannot affect the test runner.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Module.hpp"
#include "vm/VM.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>

namespace sentinel::tests
{

/// @brief Observed outcome of a program run in a child process.
struct VmTrapResult
{
    bool exited = false;
    int exitCode = 0;
    std::string stderrText;
};

class VmFixture
{
  public:
    /// @brief Call @p function with integer arguments in this process.
    [[nodiscard]] vm::RunResult call(const il::core::Module &module,
                                     const std::string &function,
                                     std::initializer_list<int64_t> args) const;

    /// @brief Run @c main in a child process, capturing its stderr and exit code.
    [[nodiscard]] VmTrapResult runMainInChild(const il::core::Module &module) const;
};

} // namespace sentinel::tests
